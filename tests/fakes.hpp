#pragma once
#include <algorithm>
#include <atomic>
#include <memory>
#include <set>
#include <stdexcept>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "ai.hpp"
#include "commands/commands_flights.hpp"
#include "reminders/reminders.hpp"
#include "scheduler/time_utils.hpp"
#include "scheduler/timer_queue.hpp"
#include "voice/voice.hpp"
#include "voice/voice_speak.hpp"

namespace test {

// 2026-10-20T06:00:00Z
inline UtcTime fixedNow() {
    return civilToUtc(CivilTime{2026, 10, 20, 6, 0, 0});
}

// ------------------------------------------------------------
// Pinned clock; copies of fn() observe later advance() calls
// ------------------------------------------------------------
class FakeClock {
public:
    explicit FakeClock(UtcTime start = fixedNow()) : now_(std::make_shared<UtcTime>(start)) {}

    ClockFn fn() const {
        auto now = now_;
        return [now]() { return *now; };
    }

    UtcTime now() const { return *now_; }
    void set(UtcTime t) { *now_ = t; }
    void advance(std::chrono::seconds d) { *now_ += d; }

private:
    std::shared_ptr<UtcTime> now_;
};

// ------------------------------------------------------------
// Timer service that only fires when the test says so
// ------------------------------------------------------------
class ManualTimer : public TimerService {
public:
    TimerHandle scheduleAt(UtcTime when, TimerCallback callback) override {
        std::lock_guard<std::mutex> lock(mtx_);
        TimerHandle h = next_++;
        pending_[h] = {when, std::move(callback)};
        return h;
    }

    void cancel(TimerHandle handle) override {
        std::lock_guard<std::mutex> lock(mtx_);
        pending_.erase(handle);
        cancelled_.push_back(handle);
    }

    // Fire every timer due at or before `now`, earliest first
    std::size_t fireDue(UtcTime now) {
        std::vector<std::pair<UtcTime, TimerCallback>> due;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            for (auto it = pending_.begin(); it != pending_.end();) {
                if (it->second.first <= now) {
                    due.push_back(std::move(it->second));
                    it = pending_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        std::stable_sort(due.begin(), due.end(),
                         [](const auto& a, const auto& b) { return a.first < b.first; });
        for (auto& [when, cb] : due) cb();
        return due.size();
    }

    std::size_t fireAll() { return fireDue(UtcTime::max()); }

    std::size_t pendingCount() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return pending_.size();
    }

    std::size_t cancelCount() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return cancelled_.size();
    }

private:
    mutable std::mutex mtx_;
    TimerHandle next_ = 1;
    std::map<TimerHandle, std::pair<UtcTime, TimerCallback>> pending_;
    std::vector<TimerHandle> cancelled_;
};

// ------------------------------------------------------------
// Scripted completion backend
// ------------------------------------------------------------
class FakeCompletion : public CompletionClient {
public:
    explicit FakeCompletion(std::string reply = "", bool success = true)
        : reply_(std::move(reply)), success_(success) {}

    CompletionResult complete(const std::string& systemPrompt,
                              const std::string& userPrompt,
                              double /*temperature*/,
                              int /*maxTokens*/,
                              const CompletionOptions& options) override {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(mtx_);
            lastSystem = systemPrompt;
            lastPrompt = userPrompt;
            lastJson = options.jsonResponse;
        }
        if (delay.count() > 0) std::this_thread::sleep_for(delay);
        if (throwOnCall) throw std::runtime_error("backend exploded");

        CompletionResult r;
        r.success = success_;
        r.text = reply_;
        if (!success_) r.error = "backend down";
        return r;
    }

    std::string prompt() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return lastPrompt;
    }

    std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};
    bool throwOnCall = false;
    bool lastJson = false;

private:
    mutable std::mutex mtx_;
    std::string reply_;
    bool success_;
    std::string lastSystem;
    std::string lastPrompt;
};

// ------------------------------------------------------------
// Records every push; fails on request
// ------------------------------------------------------------
class FakePush : public PushSender {
public:
    PushResult deliver(const PushMessage& message) override {
        std::lock_guard<std::mutex> lock(mtx_);
        sent.push_back(message);

        PushResult r;
        if (failTokens.count(message.token)) {
            r.error = "token rejected";
            return r;
        }
        r.success = true;
        r.messageId = "msg-" + std::to_string(sent.size());
        return r;
    }

    std::vector<PushMessage> messages() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return sent;
    }

    std::set<std::string> failTokens;

private:
    mutable std::mutex mtx_;
    std::vector<PushMessage> sent;
};

// ------------------------------------------------------------
// Voice seams
// ------------------------------------------------------------
class FakeStt : public Voice::SpeechToText {
public:
    explicit FakeStt(std::string transcript, bool fail = false)
        : transcript_(std::move(transcript)), fail_(fail) {}

    std::string transcribe(const std::vector<std::uint8_t>& /*audio*/) override {
        ++calls;
        if (fail_) throw Voice::TranscriptionError("garbled audio");
        return transcript_;
    }

    int calls = 0;

private:
    std::string transcript_;
    bool fail_;
};

class FakeTts : public Voice::TextToSpeech {
public:
    std::vector<std::uint8_t> synthesizeSpeech(const std::string& text) override {
        spoken.push_back(text);
        return {'R', 'I', 'F', 'F'};
    }

    std::vector<std::string> spoken;
};

// ------------------------------------------------------------
// Flight search that records its query
// ------------------------------------------------------------
class FakeFlightSearch : public FlightSearch {
public:
    explicit FakeFlightSearch(std::vector<FlightOption> offers, bool fail = false)
        : offers_(std::move(offers)), fail_(fail) {}

    std::vector<FlightOption> search(const FlightQuery& query) override {
        lastQuery = query;
        if (fail_) throw std::runtime_error("fare service unreachable");
        return offers_;
    }

    FlightQuery lastQuery;

private:
    std::vector<FlightOption> offers_;
    bool fail_;
};

} // namespace test
