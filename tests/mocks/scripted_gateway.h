#pragma once

#include "aws/object_gateway.h"
#include "events.h"
#include "listing_session.h"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// Gateway driven by a script shared between every handle the factory creates.
// Each fetchPage consumes the next step. When the script runs dry the store
// is exhausted (empty last page) or, with repeat_last, the final step repeats.
struct GatewayScript {
    struct Step {
        enum class Kind { Page, Failure, Hang };
        Kind kind = Kind::Page;
        ObjectRecords records;
        bool has_more = false;
        StoreErrorKind error_kind = StoreErrorKind::Unknown;
        std::string error_message;
        std::chrono::milliseconds delay{0};
    };

    std::mutex mutex;
    std::deque<Step> steps;
    bool repeat_last = false;
    Step last;
    std::vector<std::string> tokens_seen;
    std::atomic<int> calls{0};
    std::atomic<int> connects{0};
    std::atomic<int> connect_failures_left{0};

    void addPage(ObjectRecords records, bool has_more) {
        Step s;
        s.kind = Step::Kind::Page;
        s.records = std::move(records);
        s.has_more = has_more;
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back(std::move(s));
    }

    void addFailure(StoreErrorKind kind, const std::string& message) {
        Step s;
        s.kind = Step::Kind::Failure;
        s.error_kind = kind;
        s.error_message = message;
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back(std::move(s));
    }

    // A page that takes `delay` to arrive and ignores cancellation meanwhile
    void addSlowPage(ObjectRecords records, bool has_more, std::chrono::milliseconds delay) {
        Step s;
        s.kind = Step::Kind::Page;
        s.records = std::move(records);
        s.has_more = has_more;
        s.delay = delay;
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back(std::move(s));
    }

    // Blocks until the cancel flag is raised
    void addHang() {
        Step s;
        s.kind = Step::Kind::Hang;
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back(std::move(s));
    }

    void alwaysFail(StoreErrorKind kind, const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex);
        repeat_last = true;
        last.kind = Step::Kind::Failure;
        last.error_kind = kind;
        last.error_message = message;
    }

    Step next(const std::string& token) {
        std::lock_guard<std::mutex> lock(mutex);
        tokens_seen.push_back(token);
        if (!steps.empty()) {
            Step s = std::move(steps.front());
            steps.pop_front();
            return s;
        }
        if (repeat_last) return last;
        return Step();  // empty final page
    }
};

// Records named prefix0..prefixN-1 with a fixed size
inline ObjectRecords makeRecords(const std::string& prefix, size_t count, int64_t size = 100) {
    ObjectRecords records;
    for (size_t i = 0; i < count; ++i) {
        ObjectRecord r;
        r.key = prefix + std::to_string(i);
        r.size = size;
        r.last_modified = "2024-01-01T00:00:00.000Z";
        r.etag = "etag" + std::to_string(i);
        records.push_back(std::move(r));
    }
    return records;
}

inline ObjectRecords makeKeys(const std::vector<std::string>& keys) {
    ObjectRecords records;
    for (const auto& key : keys) {
        ObjectRecord r;
        r.key = key;
        r.size = 1;
        records.push_back(std::move(r));
    }
    return records;
}

class ScriptedGateway : public IObjectGateway {
public:
    explicit ScriptedGateway(std::shared_ptr<GatewayScript> script) : m_script(std::move(script)) {}

    PageResult fetchPage(const std::string& continuation_token,
                         const std::atomic<bool>* cancel_flag) override {
        int call = ++m_script->calls;
        GatewayScript::Step step = m_script->next(continuation_token);

        if (step.delay.count() > 0) {
            std::this_thread::sleep_for(step.delay);
        }

        PageResult result;
        switch (step.kind) {
            case GatewayScript::Step::Kind::Hang:
                while (!(cancel_flag && cancel_flag->load())) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(5));
                }
                result.cancelled = true;
                return result;
            case GatewayScript::Step::Kind::Failure:
                return PageResult::failure(step.error_kind, step.error_message);
            case GatewayScript::Step::Kind::Page:
                break;
        }

        result.records = std::move(step.records);
        result.has_more = step.has_more;
        if (step.has_more) {
            result.next_continuation_token = "after-call-" + std::to_string(call);
        }
        return result;
    }

private:
    std::shared_ptr<GatewayScript> m_script;
};

inline GatewayFactory scriptedFactory(std::shared_ptr<GatewayScript> script) {
    return [script](const ConnectionConfig& /*config*/, StoreError& out_error) -> std::unique_ptr<IObjectGateway> {
        script->connects++;
        if (script->connect_failures_left.load() > 0) {
            script->connect_failures_left--;
            out_error.kind = StoreErrorKind::Connectivity;
            out_error.message = "Cannot connect to the endpoint. Please check the URL.";
            return nullptr;
        }
        return std::make_unique<ScriptedGateway>(script);
    };
}

// Thread-safe event recorder usable as an EventSink
struct EventRecorder {
    std::mutex mutex;
    std::vector<StateEvent> events;
    std::vector<std::chrono::steady_clock::time_point> times;

    EventSink sink() {
        return [this](StateEvent e) {
            std::lock_guard<std::mutex> lock(mutex);
            events.push_back(std::move(e));
            times.push_back(std::chrono::steady_clock::now());
        };
    }

    std::vector<StateEvent> snapshot() {
        std::lock_guard<std::mutex> lock(mutex);
        return events;
    }

    std::vector<StateEvent> ofType(EventType type) {
        std::vector<StateEvent> out;
        for (auto& e : snapshot()) {
            if (e.type == type) out.push_back(e);
        }
        return out;
    }

    size_t count(EventType type) { return ofType(type).size(); }
};
