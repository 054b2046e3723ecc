#pragma once
#include <string>
#include <vector>
#include <optional>
#include <map>
#include <mutex>
#include <filesystem>
#include <cstdint>
#include <nlohmann/json.hpp>
#include "time_utils.hpp"

// ------------------------------------------------------------
// ScheduledJob
// ------------------------------------------------------------
enum class JobStatus {
    Scheduled,
    Sent,
    Cancelled,
    Failed
};

const char* jobStatusName(JobStatus status);
std::optional<JobStatus> parseJobStatus(const std::string& name);

inline bool isTerminal(JobStatus status) {
    return status != JobStatus::Scheduled;
}

struct ScheduledJob {
    std::string jobId;
    std::string userId;
    UtcTime triggerTimeUtc{};
    nlohmann::json payload = nlohmann::json::object(); // opaque to the engine
    JobStatus status = JobStatus::Scheduled;
    UtcTime createdAt{};
    std::optional<UtcTime> terminalAt;
    std::string failureReason;
    std::string deliveryId;
    std::uint64_t revision = 0;   // bumped on every engine write
};

nlohmann::json jobToJson(const ScheduledJob& job);
std::optional<ScheduledJob> jobFromJson(const nlohmann::json& j);

// ------------------------------------------------------------
// JobStore: durable home of job records.
// put() keeps the record with the highest revision per jobId, so writes
// that arrive out of order never roll a job back.
// ------------------------------------------------------------
class JobStore {
public:
    virtual ~JobStore() = default;

    virtual std::optional<ScheduledJob> get(const std::string& jobId) = 0;
    virtual void put(const ScheduledJob& job) = 0;
    virtual void remove(const std::string& jobId) = 0;
    virtual std::vector<ScheduledJob> list() = 0;
};

class InMemoryJobStore : public JobStore {
public:
    std::optional<ScheduledJob> get(const std::string& jobId) override;
    void put(const ScheduledJob& job) override;
    void remove(const std::string& jobId) override;
    std::vector<ScheduledJob> list() override;

protected:
    // Caller holds mtx_. Returns false when the write was stale.
    bool putLocked(const ScheduledJob& job);

    std::mutex mtx_;
    std::map<std::string, ScheduledJob> jobs_;
};

// Same semantics, mirrored to a JSON file (jobs.json) after every change.
class JsonFileJobStore : public InMemoryJobStore {
public:
    explicit JsonFileJobStore(std::filesystem::path path);

    void put(const ScheduledJob& job) override;
    void remove(const std::string& jobId) override;

private:
    void load();
    void saveLocked();

    std::filesystem::path path_;
};
