#pragma once

#include "backend.h"
#include "listing_session.h"
#include <map>
#include <mutex>
#include <memory>
#include <vector>

// Backend implementation: one session thread per active run, at most one
// active run per connection handle.
class ListingBackend : public IBackend {
public:
    explicit ListingBackend(GatewayFactory factory, ListingOptions defaults = ListingOptions());
    ~ListingBackend() override;

    std::vector<StateEvent> takeEvents() override;
    SessionHandle startListing(
        const ConnectionConfig& config,
        int max_pages,
        int max_retries
    ) override;
    void cancel(SessionHandle handle) override;
    bool loadMore(SessionHandle handle, int additional_pages) override;
    int generation(SessionHandle handle) const override;
    bool isActive(SessionHandle handle) const override;
    void release(SessionHandle handle) override;
    void cancelAll() override;

    // Block until the newest run of a handle reaches a terminal state
    void wait(SessionHandle handle);

    // Stats of the newest run of a handle
    ListingRun runStats(SessionHandle handle) const;

    // Registered handles, and released runs whose threads are not yet joined
    size_t connectionCount() const;
    size_t retiredCount() const;

private:
    struct Connection {
        ConnectionConfig config;
        ListingOptions options;
        int generation = 0;
        std::unique_ptr<ListingSession> session;
    };

    void launch(SessionHandle handle, Connection& conn,
                std::unique_ptr<ListingSession> predecessor = nullptr);
    std::vector<std::unique_ptr<ListingSession>> takeFinishedRetired();
    void pushEvent(StateEvent event);

    GatewayFactory m_factory;
    ListingOptions m_defaults;

    mutable std::mutex m_connectionsMutex;
    std::map<SessionHandle, Connection> m_connections;
    SessionHandle m_nextHandle = 1;

    // Released sessions, joined once they reach a terminal state
    std::vector<std::unique_ptr<ListingSession>> m_retired;

    // Event queue (results from session threads)
    std::mutex m_eventMutex;
    std::vector<StateEvent> m_events;
    bool m_shutdown = false;
};
