#include "job_store.hpp"
#include "logger.hpp"

#include <fstream>

// ------------------------------------------------------------
// Status names
// ------------------------------------------------------------
const char* jobStatusName(JobStatus status) {
    switch (status) {
        case JobStatus::Scheduled: return "scheduled";
        case JobStatus::Sent:      return "sent";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Failed:    return "failed";
    }
    return "failed";
}

std::optional<JobStatus> parseJobStatus(const std::string& name) {
    if (name == "scheduled") return JobStatus::Scheduled;
    if (name == "sent")      return JobStatus::Sent;
    if (name == "cancelled") return JobStatus::Cancelled;
    if (name == "failed")    return JobStatus::Failed;
    return std::nullopt;
}

// ------------------------------------------------------------
// JSON mapping
// ------------------------------------------------------------
nlohmann::json jobToJson(const ScheduledJob& job) {
    nlohmann::json j = {
        {"job_id", job.jobId},
        {"user_id", job.userId},
        {"trigger_time", formatIsoUtc(job.triggerTimeUtc)},
        {"trigger_time_ms", toEpochMillis(job.triggerTimeUtc)},
        {"payload", job.payload},
        {"status", jobStatusName(job.status)},
        {"created_at", formatIsoUtc(job.createdAt)},
        {"revision", job.revision}
    };
    if (job.terminalAt) j["terminal_at"] = formatIsoUtc(*job.terminalAt);
    if (!job.failureReason.empty()) j["failure_reason"] = job.failureReason;
    if (!job.deliveryId.empty()) j["delivery_id"] = job.deliveryId;
    return j;
}

std::optional<ScheduledJob> jobFromJson(const nlohmann::json& j) {
    if (!j.is_object() || !j.contains("job_id") || !j.contains("trigger_time_ms")) {
        return std::nullopt;
    }

    try {
        ScheduledJob job;
        job.jobId          = j.at("job_id").get<std::string>();
        job.userId         = j.value("user_id", "");
        job.triggerTimeUtc = fromEpochMillis(j.at("trigger_time_ms").get<long long>());
        job.payload        = j.value("payload", nlohmann::json::object());
        job.status         = parseJobStatus(j.value("status", "scheduled")).value_or(JobStatus::Failed);
        job.failureReason  = j.value("failure_reason", "");
        job.deliveryId     = j.value("delivery_id", "");
        job.revision       = j.value("revision", std::uint64_t{0});

        if (auto created = parseIsoTimestamp(j.value("created_at", ""))) job.createdAt = *created;
        if (j.contains("terminal_at")) {
            job.terminalAt = parseIsoTimestamp(j["terminal_at"].get<std::string>());
        }
        return job;
    } catch (const std::exception& e) {
        LOG_ERROR("JobStore", std::string("Skipping malformed job record: ") + e.what());
        return std::nullopt;
    }
}

// ------------------------------------------------------------
// InMemoryJobStore
// ------------------------------------------------------------
bool InMemoryJobStore::putLocked(const ScheduledJob& job) {
    auto it = jobs_.find(job.jobId);
    if (it != jobs_.end() && it->second.revision > job.revision) {
        LOG_TRACE("JobStore", "Dropping stale write for " + job.jobId);
        return false;
    }
    jobs_[job.jobId] = job;
    return true;
}

std::optional<ScheduledJob> InMemoryJobStore::get(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = jobs_.find(jobId);
    if (it == jobs_.end()) return std::nullopt;
    return it->second;
}

void InMemoryJobStore::put(const ScheduledJob& job) {
    std::lock_guard<std::mutex> lock(mtx_);
    putLocked(job);
}

void InMemoryJobStore::remove(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mtx_);
    jobs_.erase(jobId);
}

std::vector<ScheduledJob> InMemoryJobStore::list() {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ScheduledJob> out;
    out.reserve(jobs_.size());
    for (const auto& [id, job] : jobs_) out.push_back(job);
    return out;
}

// ------------------------------------------------------------
// JsonFileJobStore
// ------------------------------------------------------------
JsonFileJobStore::JsonFileJobStore(std::filesystem::path path)
    : path_(std::move(path)) {
    load();
}

void JsonFileJobStore::load() {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ifstream f(path_);
    if (!f) {
        LOG_DEBUG("JobStore", "No " + path_.string() + " found. Starting empty.");
        return;
    }

    try {
        nlohmann::json j;
        f >> j;
        if (!j.is_array()) {
            LOG_ERROR("JobStore", path_.string() + " is not a JSON array, ignoring");
            return;
        }
        for (const auto& item : j) {
            if (auto job = jobFromJson(item)) jobs_[job->jobId] = *job;
        }
        LOG_PHASE("Job store loaded (" + std::to_string(jobs_.size()) + " jobs)", true);
    } catch (const std::exception& e) {
        LOG_ERROR("JobStore", "Failed to parse " + path_.string() + ": " + e.what());
        LOG_PHASE("Job store load", false);
    }
}

void JsonFileJobStore::saveLocked() {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& [id, job] : jobs_) j.push_back(jobToJson(job));

    std::ofstream f(path_, std::ios::trunc);
    if (!f) {
        LOG_ERROR("JobStore", "Could not write " + path_.string());
        return;
    }
    f << j.dump(2);
}

void JsonFileJobStore::put(const ScheduledJob& job) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (putLocked(job)) saveLocked();
}

void JsonFileJobStore::remove(const std::string& jobId) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (jobs_.erase(jobId) > 0) saveLocked();
}
