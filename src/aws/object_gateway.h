#pragma once

#include "../object_record.h"
#include <string>
#include <memory>
#include <atomic>
#include <functional>

// Everything needed to reach one bucket. Passed by value on every call.
struct ConnectionConfig {
    std::string endpoint_url;   // Custom S3 endpoint (e.g. http://localhost:9000), empty for AWS
    std::string region = "us-east-1";
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;
    std::string bucket;
    std::string prefix;         // Optional, narrows the listing
    int page_capacity = 1000;   // max-keys per request
};

enum class StoreErrorKind {
    None,
    Connectivity,
    Auth,
    NotFound,
    Permission,
    Unknown,
};

const char* storeErrorKindName(StoreErrorKind kind);

struct StoreError {
    StoreErrorKind kind = StoreErrorKind::None;
    std::string message;        // user-facing text

    explicit operator bool() const { return kind != StoreErrorKind::None; }
};

// Outcome of a single list call. Exactly one of: records, error, cancelled.
struct PageResult {
    ObjectRecords records;
    std::string next_continuation_token;
    bool has_more = false;
    bool cancelled = false;
    StoreError error;

    bool ok() const { return !cancelled && !error; }

    static PageResult failure(StoreErrorKind kind, std::string message) {
        PageResult r;
        r.error.kind = kind;
        r.error.message = std::move(message);
        return r;
    }
};

// A single paginated "list objects" call against the remote store.
// No retry logic; one call, one outcome.
class IObjectGateway {
public:
    virtual ~IObjectGateway() = default;

    // continuation_token is empty for the first page.
    // If cancel_flag is set while the request is in flight, the result is
    // marked cancelled.
    virtual PageResult fetchPage(
        const std::string& continuation_token,
        const std::atomic<bool>* cancel_flag = nullptr
    ) = 0;
};

// Acquires a gateway handle for a connection ("Connecting" state).
// Returns a failed StoreError in out_error when the handle cannot be created.
using GatewayFactory = std::function<std::unique_ptr<IObjectGateway>(
    const ConnectionConfig& config, StoreError& out_error)>;
