#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <unordered_map>
#include <utility>
#include <mutex>
#include <condition_variable>
#include <thread>
#include "time_utils.hpp"

using TimerHandle = std::uint64_t;
using TimerCallback = std::function<void()>;

// ------------------------------------------------------------
// TimerService: minimal seam between the engine and a timer implementation
// ------------------------------------------------------------
class TimerService {
public:
    virtual ~TimerService() = default;

    // Run `callback` once at (or after) `when`. Handles are never reused.
    virtual TimerHandle scheduleAt(UtcTime when, TimerCallback callback) = 0;

    // Drop a pending timer. Unknown or already-fired handles are ignored.
    virtual void cancel(TimerHandle handle) = 0;
};

// ------------------------------------------------------------
// TimerQueue: time-ordered wait queue served by one worker thread.
// Due entries fire in trigger-time order, ties in submission order.
// ------------------------------------------------------------
class TimerQueue : public TimerService {
public:
    TimerQueue();
    ~TimerQueue() override;

    TimerQueue(const TimerQueue&) = delete;
    TimerQueue& operator=(const TimerQueue&) = delete;

    TimerHandle scheduleAt(UtcTime when, TimerCallback callback) override;
    void cancel(TimerHandle handle) override;

    // Stops the worker; pending timers are discarded. Idempotent.
    void shutdown();

    std::size_t pendingCount() const;

private:
    using Key = std::pair<UtcTime, TimerHandle>;

    void run();

    mutable std::mutex mtx_;
    std::condition_variable cv_;
    std::map<Key, TimerCallback> queue_;
    std::unordered_map<TimerHandle, UtcTime> index_;
    TimerHandle nextHandle_ = 1;
    bool stopping_ = false;
    std::thread worker_;
};
