#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <chrono>
#include <nlohmann/json.hpp>

#include "scheduler/scheduler.hpp"

// ------------------------------------------------------------
// Push transport seam
// ------------------------------------------------------------
struct PushMessage {
    std::string token;
    std::string title;
    std::string body;
    nlohmann::json data = nlohmann::json::object();   // flat string map
};

struct PushResult {
    bool success = false;
    std::string messageId;
    std::string error;
};

class PushSender {
public:
    virtual ~PushSender() = default;
    virtual PushResult deliver(const PushMessage& message) = 0;
};

// JSON webhook via cpr. `pushConfig` is the "push" config section:
// { "endpoint": url, "server_key": str, "timeout_ms": int }
class HttpPushSender : public PushSender {
public:
    explicit HttpPushSender(nlohmann::json pushConfig);
    PushResult deliver(const PushMessage& message) override;

private:
    std::string endpoint_;
    std::string serverKey_;
    std::chrono::milliseconds timeout_;
};

// ------------------------------------------------------------
// Device registry
// ------------------------------------------------------------
struct DeviceInfo {
    std::string userId;
    std::string token;
    std::string deviceId;
    std::string platform = "mobile";
    std::string appVersion;
    UtcTime registeredAt{};
    UtcTime lastSeen{};
    bool active = true;

    nlohmann::json toJson() const;
};

struct RegistrationResult {
    bool success = false;
    std::string errorCode;        // ERR_PUSH_INVALID_TOKEN
    std::string registrationId;   // "<userId>_<deviceId>"
    UtcTime expiresAt{};          // 30 days after registration
};

class DeviceRegistry {
public:
    static constexpr std::size_t kMinTokenLength = 10;

    explicit DeviceRegistry(ClockFn clock = systemNow);

    // Re-registering a deviceId replaces its token.
    RegistrationResult registerDevice(const std::string& userId,
                                      const std::string& token,
                                      const std::string& deviceId,
                                      const std::string& platform = "mobile",
                                      const std::string& appVersion = "");

    std::vector<DeviceInfo> devices(const std::string& userId) const;
    std::vector<std::string> activeTokens(const std::string& userId) const;

private:
    ClockFn clock_;
    mutable std::mutex mtx_;
    std::map<std::string, std::map<std::string, DeviceInfo>> devices_;   // user -> device -> info
};

// ------------------------------------------------------------
// ReminderService
// ------------------------------------------------------------
struct ReminderOptions {
    std::string alarmTitle = "⏰ JARVIS Alarm";
    std::string reminderTitle = "🔔 JARVIS Reminder";
    std::string testTitle = "🚀 JARVIS Test Notification";
};

class ReminderService {
public:
    ReminderService(std::shared_ptr<SchedulingEngine> engine,
                    std::shared_ptr<PushSender> sender,
                    std::shared_ptr<DeviceRegistry> devices,
                    ReminderOptions options = {});

    // Installs deliver() as the engine's delivery callback. The callback
    // keeps working after this service is destroyed.
    void attach();

    // `token` may be empty: delivery then goes to the user's devices.
    ScheduleResult scheduleReminder(const std::string& userId,
                                    const std::string& token,
                                    const std::string& text,
                                    UtcTime scheduledTime,
                                    const std::optional<std::string>& reminderId = std::nullopt,
                                    const nlohmann::json& metadata = nlohmann::json::object());

    // ISO-8601 overload; naive times are UTC.
    ScheduleResult scheduleReminder(const std::string& userId,
                                    const std::string& token,
                                    const std::string& text,
                                    const std::string& scheduledTime,
                                    const std::optional<std::string>& reminderId = std::nullopt,
                                    const nlohmann::json& metadata = nlohmann::json::object());

    CancelResult cancelReminder(const std::string& reminderId);

    // Reminder jobs of every status, ordered by trigger time
    std::vector<ScheduledJob> listReminders(const std::string& userId) const;

    // Engine callback: pushes an "alarm" or "reminder" job to the job's
    // token, or to every active device of the user.
    DeliveryResult deliver(const ScheduledJob& job);

    PushResult sendTestNotification(const std::string& token, const std::string& userId);

private:
    // Shared with the engine callback, which may outlive this service
    struct Dispatcher {
        std::shared_ptr<PushSender> sender;
        std::shared_ptr<DeviceRegistry> devices;
        ReminderOptions options;

        PushMessage buildMessage(const ScheduledJob& job) const;
        DeliveryResult deliver(const ScheduledJob& job) const;
    };

    std::shared_ptr<SchedulingEngine> engine_;
    std::shared_ptr<const Dispatcher> dispatcher_;
};
