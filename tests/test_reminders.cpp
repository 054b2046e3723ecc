#include <gtest/gtest.h>

#include "reminders/reminders.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

class ReminderServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        timers_ = std::make_shared<test::ManualTimer>();
        engine_ = std::make_shared<SchedulingEngine>(timers_, nullptr, clock_.fn());
        push_ = std::make_shared<test::FakePush>();
        devices_ = std::make_shared<DeviceRegistry>(clock_.fn());
        reminders_ = std::make_unique<ReminderService>(engine_, push_, devices_);
        reminders_->attach();
    }

    void TearDown() override {
        engine_->shutdown();
    }

    void advanceAndFire(std::chrono::seconds d) {
        clock_.advance(d);
        timers_->fireDue(clock_.now());
    }

    test::FakeClock clock_;
    std::shared_ptr<test::ManualTimer> timers_;
    std::shared_ptr<SchedulingEngine> engine_;
    std::shared_ptr<test::FakePush> push_;
    std::shared_ptr<DeviceRegistry> devices_;
    std::unique_ptr<ReminderService> reminders_;
};

TEST_F(ReminderServiceTest, ReminderIsPushedToItsToken) {
    auto r = reminders_->scheduleReminder("alice", "token-abcdef-123", "Call mom",
                                          clock_.now() + 30min, std::string("rem-1"),
                                          {{"source", "console"}});
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.job.jobId, "rem-1");

    advanceAndFire(30min);

    auto sent = push_->messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].token, "token-abcdef-123");
    EXPECT_EQ(sent[0].title, "🔔 JARVIS Reminder");
    EXPECT_EQ(sent[0].body, "Call mom");
    EXPECT_EQ(sent[0].data["job_id"], "rem-1");
    EXPECT_EQ(sent[0].data["type"], "reminder");

    auto job = engine_->getJob("rem-1");
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Sent);
    EXPECT_EQ(job->deliveryId, "msg-1");
}

TEST_F(ReminderServiceTest, MissingTokenFallsBackToRegisteredDevices) {
    ASSERT_TRUE(devices_->registerDevice("alice", "phone-token-0001", "phone").success);
    ASSERT_TRUE(devices_->registerDevice("alice", "tablet-token-002", "tablet").success);

    auto r = reminders_->scheduleReminder("alice", "", "Stand up", clock_.now() + 1min);
    ASSERT_TRUE(r.success);
    advanceAndFire(1min);

    EXPECT_EQ(push_->messages().size(), 2u);
    EXPECT_EQ(engine_->getJob(r.job.jobId)->status, JobStatus::Sent);
}

TEST_F(ReminderServiceTest, NoDeviceFailsTheJob) {
    auto r = reminders_->scheduleReminder("alice", "", "Nobody hears this", clock_.now() + 1min);
    ASSERT_TRUE(r.success);
    advanceAndFire(1min);

    auto job = engine_->getJob(r.job.jobId);
    ASSERT_TRUE(job.has_value());
    EXPECT_EQ(job->status, JobStatus::Failed);
    EXPECT_FALSE(job->failureReason.empty());
    EXPECT_TRUE(push_->messages().empty());
}

TEST_F(ReminderServiceTest, RejectedPushFailsTheJob) {
    push_->failTokens.insert("token-abcdef-123");
    auto r = reminders_->scheduleReminder("alice", "token-abcdef-123", "Call mom", clock_.now() + 1min);
    advanceAndFire(1min);

    auto job = engine_->getJob(r.job.jobId);
    EXPECT_EQ(job->status, JobStatus::Failed);
    EXPECT_EQ(job->failureReason, "push failed: token rejected");
}

TEST_F(ReminderServiceTest, PartialDeviceSuccessCountsAsSent) {
    devices_->registerDevice("alice", "good-token-00001", "phone");
    devices_->registerDevice("alice", "bad-token-000001", "watch");
    push_->failTokens.insert("bad-token-000001");

    auto r = reminders_->scheduleReminder("alice", "", "Meeting", clock_.now() + 1min);
    advanceAndFire(1min);
    EXPECT_EQ(engine_->getJob(r.job.jobId)->status, JobStatus::Sent);
}

TEST_F(ReminderServiceTest, AlarmJobsUseAlarmTitle) {
    engine_->schedule(std::string("alarm-1"), "alice", clock_.now() + 1h,
                      {{"type", "alarm"}, {"label", ""}, {"local_time", "07:00 AM"}});
    devices_->registerDevice("alice", "phone-token-0001", "phone");
    advanceAndFire(1h);

    auto sent = push_->messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].title, "⏰ JARVIS Alarm");
    EXPECT_EQ(sent[0].body, "Alarm for 07:00 AM");
}

TEST_F(ReminderServiceTest, UnsupportedJobTypeFails) {
    engine_->schedule(std::string("odd"), "alice", clock_.now() + 1min, {{"type", "carrier_pigeon"}});
    devices_->registerDevice("alice", "phone-token-0001", "phone");
    advanceAndFire(1min);

    EXPECT_EQ(engine_->getJob("odd")->status, JobStatus::Failed);
    EXPECT_TRUE(push_->messages().empty());
}

TEST_F(ReminderServiceTest, ShortTokenIsRejected) {
    auto r = reminders_->scheduleReminder("alice", "short", "x", clock_.now() + 1min);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.errorCode, "ERR_PUSH_INVALID_TOKEN");
    EXPECT_TRUE(reminders_->listReminders("alice").empty());
}

TEST_F(ReminderServiceTest, TimestampValidation) {
    auto bad = reminders_->scheduleReminder("alice", "", "x", std::string("half past never"));
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.errorCode, "ERR_SCHED_BAD_TIMESTAMP");

    auto past = reminders_->scheduleReminder("alice", "", "x", std::string("2020-01-01T00:00:00Z"));
    EXPECT_FALSE(past.success);
    EXPECT_EQ(past.errorCode, "ERR_SCHED_INVALID_TIME");

    auto ok = reminders_->scheduleReminder("alice", "", "x", std::string("2026-10-20T12:30:00+05:30"));
    ASSERT_TRUE(ok.success);
    EXPECT_EQ(formatIsoUtc(ok.job.triggerTimeUtc), "2026-10-20T07:00:00Z");
}

TEST_F(ReminderServiceTest, CancelAndList) {
    reminders_->scheduleReminder("alice", "", "b", clock_.now() + 2h, std::string("b"));
    reminders_->scheduleReminder("alice", "", "a", clock_.now() + 1h, std::string("a"));
    engine_->schedule(std::string("alarm"), "alice", clock_.now() + 30min, {{"type", "alarm"}});

    auto list = reminders_->listReminders("alice");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].jobId, "a");
    EXPECT_EQ(list[1].jobId, "b");

    EXPECT_TRUE(reminders_->cancelReminder("a").cancelledPending);
    EXPECT_FALSE(reminders_->cancelReminder("a").cancelledPending);

    list = reminders_->listReminders("alice");
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].status, JobStatus::Cancelled);

    advanceAndFire(3h);
    EXPECT_EQ(engine_->getJob("a")->status, JobStatus::Cancelled);
}

TEST_F(ReminderServiceTest, DeliveryOutlivesTheService) {
    auto r = reminders_->scheduleReminder("alice", "token-abcdef-123", "Water plants", clock_.now() + 1min);
    ASSERT_TRUE(r.success);
    reminders_.reset();

    advanceAndFire(1min);

    auto sent = push_->messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].body, "Water plants");
    EXPECT_EQ(engine_->getJob(r.job.jobId)->status, JobStatus::Sent);
}

TEST_F(ReminderServiceTest, TestNotification) {
    PushResult r = reminders_->sendTestNotification("token-abcdef-123", "alice");
    EXPECT_TRUE(r.success);
    auto sent = push_->messages();
    ASSERT_EQ(sent.size(), 1u);
    EXPECT_EQ(sent[0].data["type"], "test");
}

TEST(DeviceRegistry, RegistrationDetails) {
    test::FakeClock clock;
    DeviceRegistry registry(clock.fn());

    auto bad = registry.registerDevice("alice", "tiny", "phone");
    EXPECT_FALSE(bad.success);
    EXPECT_EQ(bad.errorCode, "ERR_PUSH_INVALID_TOKEN");

    auto ok = registry.registerDevice("alice", "phone-token-0001", "phone", "android", "1.2.0");
    ASSERT_TRUE(ok.success);
    EXPECT_EQ(ok.registrationId, "alice_phone");
    EXPECT_EQ(ok.expiresAt, clock.now() + std::chrono::hours(24 * 30));

    // Re-registering replaces the token
    registry.registerDevice("alice", "phone-token-0002", "phone");
    auto tokens = registry.activeTokens("alice");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], "phone-token-0002");

    auto devices = registry.devices("alice");
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].toJson()["fcm_token"], "phone-token-0002");
    EXPECT_TRUE(registry.devices("bob").empty());
}

TEST(HttpPushSender, UnconfiguredEndpointFails) {
    HttpPushSender sender(nlohmann::json::object());
    PushMessage msg;
    msg.token = "phone-token-0001";
    PushResult r = sender.deliver(msg);
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, "push endpoint not configured");
}
