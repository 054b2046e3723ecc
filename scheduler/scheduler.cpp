#include "scheduler.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <algorithm>
#include <stdexcept>

SchedulingEngine::SchedulingEngine(std::shared_ptr<TimerService> timers,
                                   std::shared_ptr<JobStore> store,
                                   ClockFn clock,
                                   std::chrono::seconds retention)
    : timers_(std::move(timers)),
      store_(std::move(store)),
      clock_(clock ? std::move(clock) : ClockFn(systemNow)),
      retention_(retention),
      guard_(std::make_shared<LifeGuard>()) {
    if (!timers_) {
        throw std::invalid_argument("SchedulingEngine requires a TimerService");
    }
    if (!store_) {
        store_ = std::make_shared<InMemoryJobStore>();
    }
}

SchedulingEngine::~SchedulingEngine() {
    shutdown();
}

void SchedulingEngine::setDeliveryCallback(DeliveryCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    callback_ = std::move(callback);
}

// ------------------------------------------------------------
// Slot table
// ------------------------------------------------------------
std::shared_ptr<SchedulingEngine::JobSlot> SchedulingEngine::findSlot(const std::string& jobId) const {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto it = slots_.find(jobId);
    return it == slots_.end() ? nullptr : it->second;
}

std::shared_ptr<SchedulingEngine::JobSlot> SchedulingEngine::findOrCreateSlot(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(tableMutex_);
    auto& slot = slots_[jobId];
    if (!slot) slot = std::make_shared<JobSlot>();
    return slot;
}

std::shared_ptr<SchedulingEngine::JobSlot> SchedulingEngine::lockLiveSlot(const std::string& jobId,
                                                                          std::unique_lock<std::mutex>& lock) {
    for (;;) {
        auto slot = findOrCreateSlot(jobId);
        std::unique_lock<std::mutex> candidate(slot->mtx);
        if (!slot->removed) {
            lock = std::move(candidate);
            return slot;
        }
    }
}

std::string SchedulingEngine::generateJobId(const std::string& userId) {
    return "job_" + userId + "_" + std::to_string(toEpochMillis(clock_())) +
           "_" + std::to_string(++idCounter_);
}

void SchedulingEngine::arm(JobSlot& slot) {
    const std::string jobId = slot.job.jobId;
    const std::uint64_t revision = slot.job.revision;
    std::shared_ptr<LifeGuard> guard = guard_;

    slot.timer = timers_->scheduleAt(slot.job.triggerTimeUtc, [this, guard, jobId, revision]() {
        std::optional<Dispatch> dispatch;
        {
            std::shared_lock<std::shared_mutex> lock(guard->mtx);
            if (!guard->alive) return;
            dispatch = claim(jobId, revision);
        }
        // The engine may be gone from here on
        if (dispatch) deliver(std::move(*dispatch));
    });
    slot.armed = true;
}

void SchedulingEngine::persist(JobStore& store, const ScheduledJob& snapshot) {
    try {
        store.put(snapshot);
    } catch (const std::exception& e) {
        LOG_ERROR("Scheduler", "Job store write failed for " + snapshot.jobId + ": " + e.what());
    }
}

// ------------------------------------------------------------
// schedule
// ------------------------------------------------------------
ScheduleResult SchedulingEngine::schedule(const std::optional<std::string>& jobId,
                                          const std::string& userId,
                                          const std::string& triggerTime,
                                          nlohmann::json payload) {
    auto parsed = parseIsoTimestamp(triggerTime);
    if (!parsed) {
        LOG_WARN("Scheduler", "Unreadable trigger time \"" + triggerTime + "\"");
        ScheduleResult result;
        result.errorCode = "ERR_SCHED_BAD_TIMESTAMP";
        result.message = ErrorManager::getUserMessage(result.errorCode);
        return result;
    }
    return schedule(jobId, userId, *parsed, std::move(payload));
}

ScheduleResult SchedulingEngine::schedule(const std::optional<std::string>& jobId,
                                          const std::string& userId,
                                          UtcTime triggerTimeUtc,
                                          nlohmann::json payload) {
    ScheduleResult result;
    const UtcTime now = clock_();

    if (triggerTimeUtc <= now) {
        result.errorCode = "ERR_SCHED_INVALID_TIME";
        result.message = ErrorManager::getUserMessage(result.errorCode);
        LOG_WARN("Scheduler", "Rejected trigger " + formatIsoUtc(triggerTimeUtc) +
                              " (now " + formatIsoUtc(now) + ")");
        return result;
    }

    const std::string id = (jobId && !jobId->empty()) ? *jobId : generateJobId(userId);

    ScheduledJob snapshot;
    {
        std::unique_lock<std::mutex> lock;
        auto slot = lockLiveSlot(id, lock);

        if (slot->armed) {
            timers_->cancel(slot->timer);
            slot->armed = false;
        }
        if (!slot->job.jobId.empty() && slot->job.status == JobStatus::Scheduled) {
            result.replaced = true;
            if (slot->firing) {
                LOG_WARN("Scheduler", "Job " + id + " replaced while its delivery was in progress");
            }
        }

        ScheduledJob job;
        job.jobId          = id;
        job.userId         = userId;
        job.triggerTimeUtc = triggerTimeUtc;
        job.payload        = payload.is_null() ? nlohmann::json::object() : std::move(payload);
        job.status         = JobStatus::Scheduled;
        job.createdAt      = now;
        job.revision       = slot->job.revision + 1;

        slot->job = std::move(job);
        slot->firing = false;
        arm(*slot);

        snapshot = slot->job;
    }

    persist(*store_, snapshot);

    LOG_INFO("Scheduler", std::string(result.replaced ? "Rescheduled " : "Scheduled ") + id +
                          " for " + userId + " at " + formatIsoUtc(triggerTimeUtc));

    prune();

    result.success = true;
    result.job = std::move(snapshot);
    return result;
}

// ------------------------------------------------------------
// cancel
// ------------------------------------------------------------
CancelResult SchedulingEngine::cancel(const std::string& jobId) {
    CancelResult result;

    auto slot = findSlot(jobId);
    if (!slot) {
        LOG_DEBUG("Scheduler", "cancel(" + jobId + "): no such job, nothing to do");
        return result;
    }

    ScheduledJob snapshot;
    {
        std::lock_guard<std::mutex> lock(slot->mtx);

        if (slot->job.status != JobStatus::Scheduled || slot->firing) {
            LOG_DEBUG("Scheduler", "cancel(" + jobId + "): already " +
                                   (slot->firing ? std::string("firing") : jobStatusName(slot->job.status)));
            return result;
        }

        if (slot->armed) {
            timers_->cancel(slot->timer);
            slot->armed = false;
        }
        slot->job.status = JobStatus::Cancelled;
        slot->job.terminalAt = clock_();
        slot->job.revision += 1;
        snapshot = slot->job;
    }

    persist(*store_, snapshot);
    LOG_INFO("Scheduler", "Cancelled " + jobId);

    result.cancelledPending = true;
    return result;
}

// ------------------------------------------------------------
// Dispatch (timer thread)
// ------------------------------------------------------------
std::optional<SchedulingEngine::Dispatch> SchedulingEngine::claim(const std::string& jobId,
                                                                   std::uint64_t revision) {
    auto slot = findSlot(jobId);
    if (!slot) return std::nullopt;

    Dispatch dispatch;
    {
        std::lock_guard<std::mutex> lock(slot->mtx);
        if (slot->removed ||
            slot->job.revision != revision ||
            slot->job.status != JobStatus::Scheduled ||
            slot->firing) {
            return std::nullopt;
        }
        slot->firing = true;
        slot->armed = false;
        dispatch.job = slot->job;
    }

    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        dispatch.callback = callback_;
    }
    dispatch.slot = std::move(slot);
    dispatch.clock = clock_;
    dispatch.store = store_;
    return dispatch;
}

void SchedulingEngine::deliver(Dispatch dispatch) {
    const ScheduledJob& claimed = dispatch.job;
    LOG_INFO("Scheduler", "Firing " + claimed.jobId + " for " + claimed.userId);

    DeliveryResult outcome;
    if (!dispatch.callback) {
        outcome.error = "no delivery callback registered";
    } else {
        try {
            outcome = dispatch.callback(claimed);
        } catch (const std::exception& e) {
            outcome.success = false;
            outcome.error = e.what();
        }
    }

    JobSlot& slot = *dispatch.slot;
    ScheduledJob snapshot;
    {
        std::lock_guard<std::mutex> lock(slot.mtx);
        if (slot.job.revision != claimed.revision) {
            // Replaced during delivery; the new job owns the record now.
            LOG_WARN("Scheduler", "Delivery of replaced job " + claimed.jobId + " finished: " +
                                  (outcome.success ? "sent" : "failed (" + outcome.error + ")"));
            return;
        }

        slot.firing = false;
        slot.job.terminalAt = dispatch.clock();
        slot.job.revision += 1;
        if (outcome.success) {
            slot.job.status = JobStatus::Sent;
            slot.job.deliveryId = outcome.deliveryId;
        } else {
            slot.job.status = JobStatus::Failed;
            slot.job.failureReason = outcome.error.empty() ? "delivery failed" : outcome.error;
        }
        snapshot = slot.job;
    }

    persist(*dispatch.store, snapshot);

    if (snapshot.status == JobStatus::Sent) {
        LOG_INFO("Scheduler", "Job " + snapshot.jobId + " sent (delivery " + snapshot.deliveryId + ")");
    } else {
        LOG_ERROR("Scheduler", "Job " + snapshot.jobId + " failed: " + snapshot.failureReason);
    }
}

// ------------------------------------------------------------
// Queries
// ------------------------------------------------------------
std::vector<ScheduledJob> SchedulingEngine::listForUser(const std::string& userId) const {
    std::vector<std::shared_ptr<JobSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        slots.reserve(slots_.size());
        for (const auto& [id, slot] : slots_) slots.push_back(slot);
    }

    std::vector<ScheduledJob> jobs;
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mtx);
        if (!slot->job.jobId.empty() && slot->job.userId == userId) {
            jobs.push_back(slot->job);
        }
    }

    std::sort(jobs.begin(), jobs.end(), [](const ScheduledJob& a, const ScheduledJob& b) {
        if (a.triggerTimeUtc != b.triggerTimeUtc) return a.triggerTimeUtc < b.triggerTimeUtc;
        return a.jobId < b.jobId;
    });
    return jobs;
}

std::optional<ScheduledJob> SchedulingEngine::getJob(const std::string& jobId) const {
    auto slot = findSlot(jobId);
    if (!slot) return std::nullopt;

    std::lock_guard<std::mutex> lock(slot->mtx);
    if (slot->job.jobId.empty()) return std::nullopt;
    return slot->job;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------
std::size_t SchedulingEngine::restore() {
    std::vector<ScheduledJob> records;
    try {
        records = store_->list();
    } catch (const std::exception& e) {
        LOG_ERROR("Scheduler", std::string("Job store list failed: ") + e.what());
        LOG_PHASE("Scheduler restore", false);
        return 0;
    }

    const UtcTime now = clock_();
    std::size_t rearmed = 0;
    std::vector<ScheduledJob> missed;

    for (auto& record : records) {
        std::unique_lock<std::mutex> lock;
        auto slot = lockLiveSlot(record.jobId, lock);

        // A live record is never overwritten by an older stored copy
        if (!slot->job.jobId.empty() && slot->job.revision >= record.revision) continue;

        slot->job = record;
        if (record.status != JobStatus::Scheduled) continue;

        if (record.triggerTimeUtc <= now) {
            slot->job.status = JobStatus::Failed;
            slot->job.failureReason = "missed trigger while offline";
            slot->job.terminalAt = now;
            slot->job.revision += 1;
            missed.push_back(slot->job);
        } else {
            arm(*slot);
            ++rearmed;
        }
    }

    for (const auto& job : missed) {
        persist(*store_, job);
        LOG_WARN("Scheduler", "Job " + job.jobId + " missed its trigger while offline");
    }

    prune();

    LOG_PHASE("Scheduler restore (" + std::to_string(rearmed) + " re-armed)", true);
    return rearmed;
}

std::size_t SchedulingEngine::prune() {
    const UtcTime now = clock_();
    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> tableLock(tableMutex_);
        for (auto it = slots_.begin(); it != slots_.end();) {
            std::shared_ptr<JobSlot> slot = it->second;
            std::lock_guard<std::mutex> lock(slot->mtx);

            const ScheduledJob& job = slot->job;
            const bool expired = !slot->firing && !job.jobId.empty() && isTerminal(job.status) &&
                                 job.terminalAt.value_or(job.triggerTimeUtc) + retention_ <= now;
            if (!expired) {
                ++it;
                continue;
            }
            slot->removed = true;
            dropped.push_back(it->first);
            it = slots_.erase(it);
        }
    }

    for (const auto& id : dropped) {
        try {
            store_->remove(id);
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler", "Job store remove failed for " + id + ": " + e.what());
            continue;
        }

        // The id may have been scheduled again while the old record was removed
        if (auto slot = findSlot(id)) {
            ScheduledJob snapshot;
            {
                std::lock_guard<std::mutex> lock(slot->mtx);
                snapshot = slot->job;
            }
            if (!snapshot.jobId.empty()) persist(*store_, snapshot);
        }
    }

    if (!dropped.empty()) {
        LOG_DEBUG("Scheduler", "Pruned " + std::to_string(dropped.size()) + " finished job(s)");
    }
    return dropped.size();
}

void SchedulingEngine::shutdown() {
    {
        std::unique_lock<std::shared_mutex> lock(guard_->mtx);
        if (!guard_->alive) return;
        guard_->alive = false;
    }

    std::vector<std::shared_ptr<JobSlot>> slots;
    {
        std::lock_guard<std::mutex> lock(tableMutex_);
        for (const auto& [id, slot] : slots_) slots.push_back(slot);
    }
    for (const auto& slot : slots) {
        std::lock_guard<std::mutex> lock(slot->mtx);
        if (slot->armed) {
            timers_->cancel(slot->timer);
            slot->armed = false;
        }
    }
    LOG_PHASE("Scheduler shutdown", true);
}
