#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include "loguru.hpp"

#include <curl/curl.h>

int main(int argc, char* argv[]) {
    // Keep test output readable; failures are reported by Catch
    loguru::g_stderr_verbosity = loguru::Verbosity_OFF;
    curl_global_init(CURL_GLOBAL_DEFAULT);

    int result = Catch::Session().run(argc, argv);

    curl_global_cleanup();
    return result;
}
