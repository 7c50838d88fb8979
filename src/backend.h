#pragma once

#include "events.h"
#include "aws/object_gateway.h"
#include <string>
#include <vector>
#include <memory>

// Abstract listing backend interface
// Implementations run sessions in the background and queue events for the
// model to poll
class IBackend {
public:
    virtual ~IBackend() = default;

    // Take all pending events (called by model each frame)
    // Returns events in arrival order and clears the internal queue
    virtual std::vector<StateEvent> takeEvents() = 0;

    // Start a bounded listing of config.bucket. Returns the connection handle.
    virtual SessionHandle startListing(
        const ConnectionConfig& config,
        int max_pages,
        int max_retries
    ) = 0;

    // Request cancellation of the active run of a handle (non-blocking)
    virtual void cancel(SessionHandle handle) = 0;

    // Supersede the current run of a handle with a new run that re-enumerates
    // from the beginning with additional_pages more pages.
    // Returns false if the handle is unknown.
    virtual bool loadMore(SessionHandle handle, int additional_pages) = 0;

    // Generation of the newest run of a handle, -1 if unknown
    virtual int generation(SessionHandle handle) const = 0;

    // True while the newest run of a handle has not reached a terminal state
    virtual bool isActive(SessionHandle handle) const = 0;

    // Forget a handle: cancel its run and free its resources without
    // blocking the caller. The handle is unknown afterwards.
    virtual void release(SessionHandle handle) { cancel(handle); }

    // Cancel every run (optional, for cleanup)
    virtual void cancelAll() {}
};
