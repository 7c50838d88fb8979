#include "events.h"

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::PageReady: return "PageReady";
        case EventType::RetryAttempt: return "RetryAttempt";
        case EventType::MaxRetriesExceeded: return "MaxRetriesExceeded";
        case EventType::Completed: return "Completed";
        case EventType::ProgressMessage: return "ProgressMessage";
    }
    return "Unknown";
}
