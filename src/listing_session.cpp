#include "listing_session.h"
#include "loguru.hpp"
#include <algorithm>
#include <cstdio>

const char* sessionStateName(SessionState state) {
    switch (state) {
        case SessionState::Idle: return "Idle";
        case SessionState::Connecting: return "Connecting";
        case SessionState::ListingPage: return "ListingPage";
        case SessionState::Retrying: return "Retrying";
        case SessionState::Completed: return "Completed";
        case SessionState::Cancelled: return "Cancelled";
        case SessionState::Failed: return "Failed";
    }
    return "Unknown";
}

ListingSession::ListingSession(SessionHandle handle,
                               int generation,
                               ConnectionConfig config,
                               ListingOptions options,
                               GatewayFactory factory,
                               EventSink sink)
    : m_handle(handle),
      m_generation(generation),
      m_config(std::move(config)),
      m_options(options),
      m_factory(std::move(factory)),
      m_sink(std::move(sink))
{
    m_stats.max_pages = std::max(1, m_options.max_pages);
    m_stats.max_attempts = std::max(1, m_options.max_retries);
}

ListingSession::~ListingSession() {
    cancel();
    join();
}

void ListingSession::start(std::unique_ptr<ListingSession> predecessor) {
    m_thread = std::thread([this, previous = std::move(predecessor)]() mutable {
        char threadName[32];
        snprintf(threadName, sizeof(threadName), "List%llu.%d",
                 static_cast<unsigned long long>(m_handle), m_generation);
        loguru::set_thread_name(threadName);
        if (previous) {
            previous->cancel();
            previous.reset();   // joins the superseded run
            LOG_F(1, "ListingSession %llu.%d: superseded run joined",
                  static_cast<unsigned long long>(m_handle), m_generation);
        }
        run();
    });
}

void ListingSession::cancel() {
    std::lock_guard<std::mutex> lock(m_emitMutex);
    if (!m_cancelled.exchange(true)) {
        LOG_F(INFO, "ListingSession %llu.%d: cancel requested",
              static_cast<unsigned long long>(m_handle), m_generation);
    }
}

void ListingSession::join() {
    if (m_thread.joinable() && m_thread.get_id() != std::this_thread::get_id()) {
        m_thread.join();
    }
}

bool ListingSession::isFinished() const {
    SessionState s = m_state.load();
    return s == SessionState::Completed || s == SessionState::Cancelled || s == SessionState::Failed;
}

ListingRun ListingSession::runStats() const {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    return m_stats;
}

void ListingSession::updateStats(const std::function<void(ListingRun&)>& fn) {
    std::lock_guard<std::mutex> lock(m_statsMutex);
    fn(m_stats);
}

void ListingSession::setState(SessionState state) {
    SessionState old = m_state.exchange(state);
    if (old != state) {
        LOG_F(1, "ListingSession %llu.%d: %s -> %s",
              static_cast<unsigned long long>(m_handle), m_generation,
              sessionStateName(old), sessionStateName(state));
    }
}

void ListingSession::emit(StateEvent event) {
    // Nothing is reported once cancellation has been requested
    std::lock_guard<std::mutex> lock(m_emitMutex);
    if (m_cancelled.load()) return;
    event.session = m_handle;
    event.generation = m_generation;
    if (m_sink) {
        m_sink(std::move(event));
    }
}

bool ListingSession::waitBackoff() {
    auto deadline = std::chrono::steady_clock::now() + m_options.retry_backoff;
    auto tick = std::max(m_options.cancel_poll_interval, std::chrono::milliseconds(1));
    while (true) {
        if (m_cancelled.load()) return false;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) break;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(tick, remaining + std::chrono::milliseconds(1)));
    }
    return !m_cancelled.load();
}

void ListingSession::run() {
    const int maxAttempts = std::max(1, m_options.max_retries);
    LOG_F(INFO, "ListingSession %llu.%d: starting bucket=%s prefix=%s maxPages=%d maxAttempts=%d",
          static_cast<unsigned long long>(m_handle), m_generation,
          m_config.bucket.c_str(), m_config.prefix.c_str(),
          std::max(1, m_options.max_pages), maxAttempts);

    RetryState retry;
    retry.max_attempts = maxAttempts;

    ObjectRecords all;
    std::string token;
    int emittedPages = 0;
    auto started = std::chrono::steady_clock::now();

    while (true) {
        updateStats([&](ListingRun& r) { r.attempt_number = retry.attempt; });

        AttemptOutcome outcome = runAttempt(retry, all, token, emittedPages);

        if (outcome == AttemptOutcome::Completed) {
            auto total_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count();
            ListingRun stats = runStats();
            LOG_F(INFO, "ListingSession %llu.%d: completed pages=%d objects=%zu stoppedAtLimit=%d attempts=%d (total=%ldms)",
                  static_cast<unsigned long long>(m_handle), m_generation,
                  stats.pages_processed, all.size(), stats.stopped_at_limit,
                  retry.attempt, static_cast<long>(total_ms));
            emit(StateEvent::progress("Found " + std::to_string(all.size()) + " objects"));
            emit(StateEvent::completed(std::move(all), stats.pages_processed, stats.stopped_at_limit));
            setState(SessionState::Completed);
            return;
        }

        if (outcome == AttemptOutcome::Cancelled || m_cancelled.load()) {
            retry.cancelled = true;
            LOG_F(INFO, "ListingSession %llu.%d: cancelled after %d pages",
                  static_cast<unsigned long long>(m_handle), m_generation, emittedPages);
            setState(SessionState::Cancelled);
            return;
        }

        if (retry.attempt < retry.max_attempts) {
            LOG_F(WARNING, "ListingSession %llu.%d: attempt %d/%d failed: %s, retrying in %ldms",
                  static_cast<unsigned long long>(m_handle), m_generation,
                  retry.attempt, retry.max_attempts, retry.last_error.c_str(),
                  static_cast<long>(m_options.retry_backoff.count()));
            emit(StateEvent::retryAttempt(retry.attempt, retry.max_attempts, retry.last_error));
            setState(SessionState::Retrying);
            if (!waitBackoff()) {
                retry.cancelled = true;
                LOG_F(INFO, "ListingSession %llu.%d: cancelled during backoff",
                      static_cast<unsigned long long>(m_handle), m_generation);
                setState(SessionState::Cancelled);
                return;
            }
            retry.attempt += 1;
            continue;
        }

        LOG_F(ERROR, "ListingSession %llu.%d: giving up after %d attempts: %s",
              static_cast<unsigned long long>(m_handle), m_generation,
              retry.attempt, retry.last_error.c_str());
        emit(StateEvent::maxRetriesExceeded(retry.attempt, retry.last_error));
        setState(SessionState::Failed);
        return;
    }
}

ListingSession::AttemptOutcome ListingSession::runAttempt(RetryState& retry, ObjectRecords& all,
                                                          std::string& token, int& emittedPages) {
    const int maxPages = std::max(1, m_options.max_pages);

    if (m_cancelled.load()) return AttemptOutcome::Cancelled;

    setState(SessionState::Connecting);
    emit(StateEvent::progress(retry.attempt == 1
        ? "Connecting to S3..."
        : "Reconnecting to S3 (attempt " + std::to_string(retry.attempt) + "/" +
              std::to_string(retry.max_attempts) + ")..."));

    StoreError connectError;
    std::unique_ptr<IObjectGateway> gateway = m_factory ? m_factory(m_config, connectError) : nullptr;
    if (!gateway) {
        retry.last_error = connectError ? connectError.message : "No object store gateway available";
        return AttemptOutcome::Failed;
    }

    setState(SessionState::ListingPage);
    emit(StateEvent::progress("Listing bucket contents..."));

    while (true) {
        if (m_cancelled.load()) return AttemptOutcome::Cancelled;

        PageResult page = gateway->fetchPage(token, &m_cancelled);

        if (page.cancelled || m_cancelled.load()) return AttemptOutcome::Cancelled;
        if (!page.ok()) {
            retry.last_error = page.error.message;
            return AttemptOutcome::Failed;
        }

        int pagesProcessed = 0;
        updateStats([&](ListingRun& r) {
            r.pages_processed += 1;
            pagesProcessed = r.pages_processed;
        });
        token = page.next_continuation_token;

        bool atLimit = pagesProcessed >= maxPages;
        bool isLast = !page.has_more || atLimit;

        if (!page.records.empty()) {
            emittedPages += 1;
            all.insert(all.end(), page.records.begin(), page.records.end());
            size_t totalSoFar = all.size();
            updateStats([&](ListingRun& r) { r.total_objects_found = totalSoFar; });

            LOG_F(1, "ListingSession %llu.%d: page %d ready count=%zu total=%zu last=%d",
                  static_cast<unsigned long long>(m_handle), m_generation,
                  emittedPages, page.records.size(), totalSoFar, isLast);
            emit(StateEvent::pageReady(std::move(page.records), emittedPages, totalSoFar, isLast));
            emit(StateEvent::progress("Loaded page " + std::to_string(emittedPages) + " (" +
                                      std::to_string(totalSoFar) + " objects so far)"));
        } else if (isLast && emittedPages > 0) {
            // The store ended on an empty page; close the page sequence with
            // an empty marker so the last PageReady always says so
            emittedPages += 1;
            LOG_F(1, "ListingSession %llu.%d: empty final page, emitting last-page marker %d",
                  static_cast<unsigned long long>(m_handle), m_generation, emittedPages);
            emit(StateEvent::pageReady(ObjectRecords(), emittedPages, all.size(), true));
        }

        if (!page.has_more) {
            return AttemptOutcome::Completed;
        }
        if (atLimit) {
            updateStats([](ListingRun& r) { r.stopped_at_limit = true; });
            LOG_F(INFO, "ListingSession %llu.%d: reached page limit %d with more data available",
                  static_cast<unsigned long long>(m_handle), m_generation, maxPages);
            return AttemptOutcome::Completed;
        }
    }
}
