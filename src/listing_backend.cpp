#include "listing_backend.h"
#include "loguru.hpp"
#include <thread>

ListingBackend::ListingBackend(GatewayFactory factory, ListingOptions defaults)
    : m_factory(std::move(factory)), m_defaults(defaults)
{
    LOG_F(INFO, "ListingBackend: initializing (backoff=%ldms poll=%ldms)",
          static_cast<long>(m_defaults.retry_backoff.count()),
          static_cast<long>(m_defaults.cancel_poll_interval.count()));
}

ListingBackend::~ListingBackend() {
    LOG_F(INFO, "ListingBackend: shutting down");
    {
        std::lock_guard<std::mutex> lock(m_eventMutex);
        m_shutdown = true;
    }
    cancelAll();

    std::map<SessionHandle, Connection> connections;
    std::vector<std::unique_ptr<ListingSession>> retired;
    {
        std::lock_guard<std::mutex> lock(m_connectionsMutex);
        connections.swap(m_connections);
        retired.swap(m_retired);
    }
    // Session destructors join their threads
    connections.clear();
    retired.clear();
}

std::vector<StateEvent> ListingBackend::takeEvents() {
    std::lock_guard<std::mutex> lock(m_eventMutex);
    std::vector<StateEvent> events = std::move(m_events);
    m_events.clear();
    return events;
}

void ListingBackend::pushEvent(StateEvent event) {
    std::lock_guard<std::mutex> lock(m_eventMutex);
    if (m_shutdown) return;  // Don't push events during shutdown
    m_events.push_back(std::move(event));
}

void ListingBackend::launch(SessionHandle handle, Connection& conn,
                            std::unique_ptr<ListingSession> predecessor) {
    conn.session = std::make_unique<ListingSession>(
        handle, conn.generation, conn.config, conn.options, m_factory,
        [this](StateEvent event) { pushEvent(std::move(event)); });
    conn.session->start(std::move(predecessor));
}

// Caller holds m_connectionsMutex. Joining a finished session only waits for
// its thread to return, so the result is destroyed outside the lock.
std::vector<std::unique_ptr<ListingSession>> ListingBackend::takeFinishedRetired() {
    std::vector<std::unique_ptr<ListingSession>> finished;
    auto it = m_retired.begin();
    while (it != m_retired.end()) {
        if ((*it)->isFinished()) {
            finished.push_back(std::move(*it));
            it = m_retired.erase(it);
        } else {
            ++it;
        }
    }
    return finished;
}

SessionHandle ListingBackend::startListing(const ConnectionConfig& config, int max_pages, int max_retries) {
    std::vector<std::unique_ptr<ListingSession>> finished;
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    finished = takeFinishedRetired();
    SessionHandle handle = m_nextHandle++;

    LOG_F(INFO, "ListingBackend: starting listing handle=%llu bucket=%s maxPages=%d maxRetries=%d",
          static_cast<unsigned long long>(handle), config.bucket.c_str(), max_pages, max_retries);

    Connection& conn = m_connections[handle];
    conn.config = config;
    conn.options = m_defaults;
    conn.options.max_pages = max_pages;
    conn.options.max_retries = max_retries;
    conn.generation = 0;
    launch(handle, conn);
    return handle;
}

void ListingBackend::cancel(SessionHandle handle) {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    auto it = m_connections.find(handle);
    if (it == m_connections.end() || !it->second.session) {
        LOG_F(WARNING, "ListingBackend: cancel for unknown handle=%llu",
              static_cast<unsigned long long>(handle));
        return;
    }
    it->second.session->cancel();
}

bool ListingBackend::loadMore(SessionHandle handle, int additional_pages) {
    if (additional_pages <= 0) {
        LOG_F(WARNING, "ListingBackend: ignoring loadMore with %d pages", additional_pages);
        return false;
    }

    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    auto it = m_connections.find(handle);
    if (it == m_connections.end()) {
        LOG_F(WARNING, "ListingBackend: loadMore for unknown handle=%llu",
              static_cast<unsigned long long>(handle));
        return false;
    }
    Connection& conn = it->second;

    if (conn.session && !conn.session->isFinished()) {
        LOG_F(INFO, "ListingBackend: superseding running generation %d of handle=%llu",
              conn.generation, static_cast<unsigned long long>(handle));
    }
    std::unique_ptr<ListingSession> previous = std::move(conn.session);
    if (previous) {
        previous->cancel();
    }

    conn.options.max_pages += additional_pages;
    conn.generation += 1;
    LOG_F(INFO, "ListingBackend: load more handle=%llu generation=%d maxPages=%d",
          static_cast<unsigned long long>(handle), conn.generation, conn.options.max_pages);

    // The new run joins the superseded one on its own thread
    launch(handle, conn, std::move(previous));
    return true;
}

int ListingBackend::generation(SessionHandle handle) const {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    auto it = m_connections.find(handle);
    return it == m_connections.end() ? -1 : it->second.generation;
}

bool ListingBackend::isActive(SessionHandle handle) const {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    auto it = m_connections.find(handle);
    if (it == m_connections.end()) return false;
    return it->second.session && !it->second.session->isFinished();
}

void ListingBackend::wait(SessionHandle handle) {
    while (isActive(handle)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

ListingRun ListingBackend::runStats(SessionHandle handle) const {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    auto it = m_connections.find(handle);
    if (it == m_connections.end() || !it->second.session) return ListingRun();
    return it->second.session->runStats();
}

void ListingBackend::release(SessionHandle handle) {
    std::vector<std::unique_ptr<ListingSession>> finished;
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    auto it = m_connections.find(handle);
    if (it == m_connections.end()) {
        LOG_F(WARNING, "ListingBackend: release for unknown handle=%llu",
              static_cast<unsigned long long>(handle));
        return;
    }
    if (it->second.session) {
        it->second.session->cancel();
        m_retired.push_back(std::move(it->second.session));
    }
    m_connections.erase(it);
    finished = takeFinishedRetired();
    LOG_F(INFO, "ListingBackend: released handle=%llu (%zu connections, %zu retired)",
          static_cast<unsigned long long>(handle), m_connections.size(), m_retired.size());
}

size_t ListingBackend::connectionCount() const {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    return m_connections.size();
}

size_t ListingBackend::retiredCount() const {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    return m_retired.size();
}

void ListingBackend::cancelAll() {
    std::lock_guard<std::mutex> lock(m_connectionsMutex);
    for (auto& [handle, conn] : m_connections) {
        if (conn.session) {
            conn.session->cancel();
        }
    }
    for (auto& session : m_retired) {
        session->cancel();
    }
}
