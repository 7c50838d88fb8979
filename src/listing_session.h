#pragma once

#include "events.h"
#include "aws/object_gateway.h"
#include <string>
#include <thread>
#include <atomic>
#include <mutex>
#include <chrono>
#include <functional>
#include <memory>

struct ListingOptions {
    int max_pages = 10;
    int max_retries = 3;    // total attempts, including the first
    std::chrono::milliseconds retry_backoff{2000};
    std::chrono::milliseconds cancel_poll_interval{100};
};

enum class SessionState {
    Idle,
    Connecting,
    ListingPage,
    Retrying,
    Completed,
    Cancelled,
    Failed,
};

const char* sessionStateName(SessionState state);

// Statistics of one bounded enumeration attempt
struct ListingRun {
    int max_pages = 0;
    int pages_processed = 0;
    size_t total_objects_found = 0;
    bool stopped_at_limit = false;
    int attempt_number = 1;
    int max_attempts = 1;
};

struct RetryState {
    int attempt = 1;
    int max_attempts = 1;
    std::string last_error;
    bool cancelled = false;
};

using EventSink = std::function<void(StateEvent)>;

// Runs one bounded listing on a dedicated thread and reports through a sink.
//
// Pages are emitted as soon as they arrive. Failures consume one attempt of
// the session's retry budget; the next attempt resumes from the last
// successful continuation token. Cancellation is cooperative and silent.
class ListingSession {
public:
    ListingSession(SessionHandle handle,
                   int generation,
                   ConnectionConfig config,
                   ListingOptions options,
                   GatewayFactory factory,
                   EventSink sink);
    ~ListingSession();

    ListingSession(const ListingSession&) = delete;
    ListingSession& operator=(const ListingSession&) = delete;

    // Spawn the session thread. Call at most once. A superseded predecessor
    // is joined on the new thread before the run begins, so the caller
    // never waits for it.
    void start(std::unique_ptr<ListingSession> predecessor = nullptr);

    // Run to a terminal state on the calling thread
    void run();

    // Request cancellation. Returns immediately. No event reaches the sink
    // once this has returned.
    void cancel();

    // Wait for the session thread, if any
    void join();

    SessionState state() const { return m_state.load(); }
    bool isFinished() const;
    bool isCancelled() const { return m_cancelled.load(); }

    SessionHandle handle() const { return m_handle; }
    int generation() const { return m_generation; }
    const ConnectionConfig& config() const { return m_config; }
    const ListingOptions& options() const { return m_options; }

    ListingRun runStats() const;

private:
    enum class AttemptOutcome { Completed, Failed, Cancelled };

    AttemptOutcome runAttempt(RetryState& retry, ObjectRecords& all,
                              std::string& token, int& emittedPages);
    bool waitBackoff();
    void setState(SessionState state);
    void emit(StateEvent event);
    void updateStats(const std::function<void(ListingRun&)>& fn);

    const SessionHandle m_handle;
    const int m_generation;
    const ConnectionConfig m_config;
    const ListingOptions m_options;
    GatewayFactory m_factory;
    EventSink m_sink;

    std::thread m_thread;
    std::atomic<bool> m_cancelled{false};
    std::mutex m_emitMutex;     // orders emit() against cancel()
    std::atomic<SessionState> m_state{SessionState::Idle};

    mutable std::mutex m_statsMutex;
    ListingRun m_stats;
};
