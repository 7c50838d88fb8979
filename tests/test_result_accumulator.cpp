#include "result_accumulator.h"
#include "mocks/scripted_gateway.h"

#include <catch2/catch.hpp>

TEST_CASE("Accumulator appends pages in arrival order", "[accumulator]") {
    ResultAccumulator acc;
    CHECK(acc.count() == 0);

    acc.append(makeRecords("a", 2));
    ObjectRecords second = makeRecords("b", 3);
    acc.append(second);

    REQUIRE(acc.count() == 5);
    CHECK(acc.all()[0].key == "a0");
    CHECK(acc.all()[1].key == "a1");
    CHECK(acc.all()[2].key == "b0");
    CHECK(acc.all()[4].key == "b2");
    CHECK(acc.revision() == 0);
}

TEST_CASE("Accumulator keeps duplicate keys", "[accumulator]") {
    ResultAccumulator acc;
    acc.append(makeKeys({"x", "y"}));
    acc.append(makeKeys({"x"}));
    CHECK(acc.count() == 3);
}

TEST_CASE("replaceAll swaps the whole set and bumps the revision", "[accumulator]") {
    ResultAccumulator acc;
    acc.append(makeRecords("a", 4));
    uint64_t before = acc.revision();

    acc.replaceAll(makeRecords("z", 2));
    CHECK(acc.count() == 2);
    CHECK(acc.all()[0].key == "z0");
    CHECK(acc.revision() == before + 1);

    acc.clear();
    CHECK(acc.count() == 0);
    CHECK(acc.revision() == before + 2);
}
