#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>

#include "scheduler/job_store.hpp"
#include "fakes.hpp"

namespace {
    ScheduledJob makeJob(const std::string& id, std::uint64_t revision, JobStatus status = JobStatus::Scheduled) {
        ScheduledJob job;
        job.jobId = id;
        job.userId = "alice";
        job.triggerTimeUtc = test::fixedNow() + std::chrono::hours(1);
        job.createdAt = test::fixedNow();
        job.payload = {{"type", "reminder"}, {"text", "water the plants"}};
        job.status = status;
        job.revision = revision;
        return job;
    }
}

TEST(JobStore, StaleWriteNeverRollsBack) {
    InMemoryJobStore store;
    store.put(makeJob("j1", 2, JobStatus::Sent));
    store.put(makeJob("j1", 1, JobStatus::Scheduled));

    auto job = store.get("j1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Sent);
    EXPECT_EQ(job->revision, 2u);
}

TEST(JobStore, RemoveAndList) {
    InMemoryJobStore store;
    store.put(makeJob("a", 1));
    store.put(makeJob("b", 1));
    EXPECT_EQ(store.list().size(), 2u);

    store.remove("a");
    EXPECT_FALSE(store.get("a").has_value());
    EXPECT_EQ(store.list().size(), 1u);
}

TEST(JobStore, JsonMappingKeepsTerminalFields) {
    ScheduledJob job = makeJob("j9", 4, JobStatus::Failed);
    job.failureReason = "push failed: token rejected";
    job.terminalAt = test::fixedNow() + std::chrono::hours(1);

    nlohmann::json j = jobToJson(job);
    EXPECT_EQ(j["status"], "failed");
    EXPECT_EQ(j["failure_reason"], "push failed: token rejected");

    auto back = jobFromJson(j);
    ASSERT_TRUE(back.has_value());
    EXPECT_EQ(back->jobId, "j9");
    EXPECT_EQ(back->status, JobStatus::Failed);
    EXPECT_EQ(back->triggerTimeUtc, job.triggerTimeUtc);
    EXPECT_EQ(back->revision, 4u);
    ASSERT_TRUE(back->terminalAt.has_value());
    EXPECT_EQ(back->payload["text"], "water the plants");
}

TEST(JobStore, MalformedRecordIsRejected) {
    EXPECT_FALSE(jobFromJson(nlohmann::json::array()).has_value());
    EXPECT_FALSE(jobFromJson({{"job_id", "x"}}).has_value());
    EXPECT_FALSE(jobFromJson({{"job_id", "x"}, {"trigger_time_ms", "soon"}}).has_value());
}

class JsonFileJobStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = std::filesystem::temp_directory_path() / "jarvis_jobs_test.json";
        std::filesystem::remove(path_);
    }

    void TearDown() override {
        std::filesystem::remove(path_);
    }

    std::filesystem::path path_;
};

TEST_F(JsonFileJobStoreTest, SurvivesReload) {
    {
        JsonFileJobStore store(path_);
        store.put(makeJob("persisted", 1));
        store.put(makeJob("gone", 1));
        store.remove("gone");
    }

    JsonFileJobStore reloaded(path_);
    auto jobs = reloaded.list();
    ASSERT_EQ(jobs.size(), 1u);
    EXPECT_EQ(jobs[0].jobId, "persisted");
    EXPECT_EQ(jobs[0].payload["type"], "reminder");
}

TEST_F(JsonFileJobStoreTest, CorruptFileStartsEmpty) {
    {
        std::ofstream out(path_);
        out << "{ not json";
    }
    JsonFileJobStore store(path_);
    EXPECT_TRUE(store.list().empty());
}
