#include "timer_queue.hpp"
#include "logger.hpp"

TimerQueue::TimerQueue() {
    worker_ = std::thread([this]() { run(); });
}

TimerQueue::~TimerQueue() {
    shutdown();
}

// ------------------------------------------------------------
// Public API
// ------------------------------------------------------------
TimerHandle TimerQueue::scheduleAt(UtcTime when, TimerCallback callback) {
    TimerHandle handle = 0;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        handle = nextHandle_++;
        if (stopping_) {
            LOG_WARN("Timer", "scheduleAt after shutdown, dropping handle " + std::to_string(handle));
            return handle;
        }
        queue_.emplace(Key{when, handle}, std::move(callback));
        index_[handle] = when;
    }
    cv_.notify_all();
    return handle;
}

void TimerQueue::cancel(TimerHandle handle) {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = index_.find(handle);
        if (it == index_.end()) return;
        queue_.erase(Key{it->second, handle});
        index_.erase(it);
    }
    cv_.notify_all();
}

void TimerQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mtx_);
        if (stopping_ && !worker_.joinable()) return;
        stopping_ = true;
        queue_.clear();
        index_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

std::size_t TimerQueue::pendingCount() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
}

// ------------------------------------------------------------
// Worker loop
// ------------------------------------------------------------
void TimerQueue::run() {
    std::unique_lock<std::mutex> lock(mtx_);
    while (!stopping_) {
        if (queue_.empty()) {
            cv_.wait(lock);
            continue;
        }

        auto first = queue_.begin();
        UtcTime due = first->first.first;
        if (systemNow() < due) {
            cv_.wait_until(lock, due);
            continue;
        }

        TimerHandle handle = first->first.second;
        TimerCallback callback = std::move(first->second);
        queue_.erase(first);
        index_.erase(handle);

        // Callbacks run without the queue lock held
        lock.unlock();
        try {
            if (callback) callback();
        } catch (const std::exception& e) {
            LOG_ERROR("Timer", "Callback for handle " + std::to_string(handle) + " threw: " + e.what());
        }
        lock.lock();
    }
}
