#pragma once
#include <string>
#include <chrono>
#include <vector>
#include <optional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <functional>
#include <unordered_map>
#include <nlohmann/json.hpp>

#include "time_utils.hpp"
#include "timer_queue.hpp"
#include "job_store.hpp"

// ------------------------------------------------------------
// Delivery callback: invoked on the timer thread when a job is due
// ------------------------------------------------------------
struct DeliveryResult {
    bool success = false;
    std::string deliveryId;   // collaborator-assigned id on success
    std::string error;        // reason on failure
};

using DeliveryCallback = std::function<DeliveryResult(const ScheduledJob& job)>;

// ------------------------------------------------------------
// Call results
// ------------------------------------------------------------
struct ScheduleResult {
    bool success = false;
    std::string errorCode;   // ERR_SCHED_INVALID_TIME / ERR_SCHED_BAD_TIMESTAMP
    std::string message;
    ScheduledJob job;        // valid when success
    bool replaced = false;   // an earlier pending job with this id was cancelled
};

struct CancelResult {
    bool success = true;        // cancellation never fails
    bool cancelledPending = false;
};

// ------------------------------------------------------------
// SchedulingEngine
//
// Owns every ScheduledJob and is the only writer of its status.
//   Scheduled --fire, callback ok-----> Sent
//   Scheduled --fire, callback failed-> Failed
//   Scheduled --cancel----------------> Cancelled
// Operations on one jobId are serialised by that job's own mutex. A fire
// holds the lifetime guard only while it claims its job; the delivery
// callback, the commit and the job store write run on copies and shared
// slots, so shutdown() and the destructor never wait on a delivery.
// Terminal jobs are kept for `retention` after they finish, then pruned
// from memory and from the job store.
// ------------------------------------------------------------
class SchedulingEngine {
public:
    static constexpr std::chrono::hours kDefaultRetention{24};

    SchedulingEngine(std::shared_ptr<TimerService> timers,
                     std::shared_ptr<JobStore> store,
                     ClockFn clock = systemNow,
                     std::chrono::seconds retention = kDefaultRetention);
    ~SchedulingEngine();

    SchedulingEngine(const SchedulingEngine&) = delete;
    SchedulingEngine& operator=(const SchedulingEngine&) = delete;

    void setDeliveryCallback(DeliveryCallback callback);

    // Trigger must be strictly after now (UTC). An existing jobId is replaced.
    ScheduleResult schedule(const std::optional<std::string>& jobId,
                            const std::string& userId,
                            UtcTime triggerTimeUtc,
                            nlohmann::json payload);

    // ISO-8601 overload: naive times are UTC, offsets are converted to UTC.
    ScheduleResult schedule(const std::optional<std::string>& jobId,
                            const std::string& userId,
                            const std::string& triggerTime,
                            nlohmann::json payload);

    // Idempotent; unknown, fired or cancelled ids are a successful no-op.
    CancelResult cancel(const std::string& jobId);

    // Snapshot ordered by triggerTimeUtc ascending.
    std::vector<ScheduledJob> listForUser(const std::string& userId) const;

    std::optional<ScheduledJob> getJob(const std::string& jobId) const;

    // Loads records from the job store and re-arms pending ones. Pending
    // jobs whose trigger passed while offline become Failed.
    // Returns the number of timers re-armed.
    std::size_t restore();

    // Drops terminal jobs that finished at least `retention` ago.
    // Also runs from schedule() and restore(). Returns the number dropped.
    std::size_t prune();

    // Disarms every timer; later fires are ignored. Idempotent.
    void shutdown();

private:
    struct JobSlot {
        std::mutex mtx;
        ScheduledJob job;
        TimerHandle timer = 0;
        bool armed = false;
        bool firing = false;    // claimed by the timer, delivery in progress
        bool removed = false;   // pruned from the table; callers must look up again
    };

    // Keeps timer callbacks from touching a destroyed engine.
    struct LifeGuard {
        std::shared_mutex mtx;
        bool alive = true;
    };

    // Everything a claimed fire needs once it lets go of the engine.
    struct Dispatch {
        std::shared_ptr<JobSlot> slot;
        ScheduledJob job;
        DeliveryCallback callback;
        ClockFn clock;
        std::shared_ptr<JobStore> store;
    };

    std::shared_ptr<JobSlot> findSlot(const std::string& jobId) const;
    std::shared_ptr<JobSlot> findOrCreateSlot(const std::string& jobId);
    // Slot still present in the table, returned locked.
    std::shared_ptr<JobSlot> lockLiveSlot(const std::string& jobId, std::unique_lock<std::mutex>& lock);
    void arm(JobSlot& slot);   // caller holds slot.mtx
    std::optional<Dispatch> claim(const std::string& jobId, std::uint64_t revision);
    static void deliver(Dispatch dispatch);
    static void persist(JobStore& store, const ScheduledJob& snapshot);
    std::string generateJobId(const std::string& userId);

    std::shared_ptr<TimerService> timers_;
    std::shared_ptr<JobStore> store_;
    ClockFn clock_;
    std::chrono::seconds retention_;

    mutable std::mutex tableMutex_;
    std::unordered_map<std::string, std::shared_ptr<JobSlot>> slots_;

    mutable std::mutex callbackMutex_;
    DeliveryCallback callback_;

    std::atomic<std::uint64_t> idCounter_{0};
    std::shared_ptr<LifeGuard> guard_;
};
