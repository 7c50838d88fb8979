#pragma once

#include <string>
#include <vector>
#include <cstdint>

// One object as returned by a bucket listing. Immutable once produced.
struct ObjectRecord {
    std::string key;            // '/' delimits virtual path segments
    int64_t size = 0;
    std::string last_modified;  // ISO 8601, as returned by the store
    std::string etag;           // quotes stripped
    std::string storage_class = "STANDARD";
};

using ObjectRecords = std::vector<ObjectRecord>;
