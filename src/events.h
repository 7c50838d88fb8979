#pragma once

#include "object_record.h"
#include <string>
#include <vector>
#include <variant>
#include <cstdint>

// Identifies one listing connection. A handle stays valid across "load more"
// runs; each run of the same handle gets a new generation.
using SessionHandle = uint64_t;
constexpr SessionHandle kInvalidSession = 0;

// Event types that listing sessions emit
enum class EventType {
    PageReady,
    RetryAttempt,
    MaxRetriesExceeded,
    Completed,
    ProgressMessage,
};

// Event payload types
struct PageReadyPayload {
    ObjectRecords records;
    int page_number;            // 1-based, gap-free within a run
    size_t records_in_page;
    size_t total_so_far;
    bool is_last_page;
};

struct RetryAttemptPayload {
    int attempt;                // the attempt that just failed
    int max_attempts;
    std::string error_message;
};

struct MaxRetriesExceededPayload {
    int total_attempts;
    std::string final_error;
};

struct CompletedPayload {
    ObjectRecords all_records;
    int pages_processed;
    size_t total_found;
    bool stopped_at_limit;
};

struct ProgressMessagePayload {
    std::string text;
};

// A state change event from a listing session
struct StateEvent {
    EventType type;
    SessionHandle session = kInvalidSession;
    int generation = 0;         // 0 = initial run, +1 per load-more run
    std::variant<
        PageReadyPayload,
        RetryAttemptPayload,
        MaxRetriesExceededPayload,
        CompletedPayload,
        ProgressMessagePayload
    > payload;

    // Helper constructors
    static StateEvent pageReady(
        ObjectRecords records,
        int page_number,
        size_t total_so_far,
        bool is_last_page
    ) {
        StateEvent e;
        e.type = EventType::PageReady;
        size_t count = records.size();
        e.payload = PageReadyPayload{
            std::move(records), page_number, count, total_so_far, is_last_page
        };
        return e;
    }

    static StateEvent retryAttempt(int attempt, int max_attempts, const std::string& error) {
        StateEvent e;
        e.type = EventType::RetryAttempt;
        e.payload = RetryAttemptPayload{attempt, max_attempts, error};
        return e;
    }

    static StateEvent maxRetriesExceeded(int total_attempts, const std::string& error) {
        StateEvent e;
        e.type = EventType::MaxRetriesExceeded;
        e.payload = MaxRetriesExceededPayload{total_attempts, error};
        return e;
    }

    static StateEvent completed(
        ObjectRecords all_records,
        int pages_processed,
        bool stopped_at_limit
    ) {
        StateEvent e;
        e.type = EventType::Completed;
        size_t total = all_records.size();
        e.payload = CompletedPayload{
            std::move(all_records), pages_processed, total, stopped_at_limit
        };
        return e;
    }

    static StateEvent progress(const std::string& text) {
        StateEvent e;
        e.type = EventType::ProgressMessage;
        e.payload = ProgressMessagePayload{text};
        return e;
    }
};

const char* eventTypeName(EventType type);
