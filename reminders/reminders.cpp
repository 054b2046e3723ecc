#include "reminders.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <cpr/cpr.h>
#include <stdexcept>

// =========================================================
// HttpPushSender
// =========================================================
HttpPushSender::HttpPushSender(nlohmann::json pushConfig)
    : endpoint_(pushConfig.value("endpoint", "")),
      serverKey_(pushConfig.value("server_key", "")),
      timeout_(pushConfig.value("timeout_ms", 5000)) {}

PushResult HttpPushSender::deliver(const PushMessage& message) {
    PushResult result;
    if (endpoint_.empty()) {
        result.error = "push endpoint not configured";
        LOG_ERROR("Push", result.error);
        return result;
    }

    nlohmann::json body = {
        {"to", message.token},
        {"notification", {{"title", message.title}, {"body", message.body}}},
        {"data", message.data}
    };

    cpr::Header headers = {{"Content-Type", "application/json"}};
    if (!serverKey_.empty()) headers["Authorization"] = "key=" + serverKey_;

    auto resp = cpr::Post(cpr::Url{endpoint_}, headers, cpr::Body{body.dump()}, cpr::Timeout{timeout_});

    if (resp.status_code < 200 || resp.status_code >= 300) {
        result.error = "push HTTP " + std::to_string(resp.status_code) + " " + resp.error.message;
        LOG_ERROR("Push", result.error);
        return result;
    }

    result.success = true;
    auto j = nlohmann::json::parse(resp.text, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("message_id")) result.messageId = j["message_id"].is_string()
                                                             ? j["message_id"].get<std::string>()
                                                             : j["message_id"].dump();
        else if (j.contains("name") && j["name"].is_string()) result.messageId = j["name"].get<std::string>();
    }
    if (result.messageId.empty()) result.messageId = "http-" + std::to_string(resp.status_code);
    return result;
}

// =========================================================
// DeviceRegistry
// =========================================================
nlohmann::json DeviceInfo::toJson() const {
    return {
        {"user_id", userId},
        {"fcm_token", token},
        {"device_id", deviceId},
        {"platform", platform},
        {"app_version", appVersion},
        {"registered_at", formatIsoUtc(registeredAt)},
        {"last_seen", formatIsoUtc(lastSeen)},
        {"active", active}
    };
}

DeviceRegistry::DeviceRegistry(ClockFn clock) : clock_(std::move(clock)) {
    if (!clock_) clock_ = systemNow;
}

RegistrationResult DeviceRegistry::registerDevice(const std::string& userId,
                                                  const std::string& token,
                                                  const std::string& deviceId,
                                                  const std::string& platform,
                                                  const std::string& appVersion) {
    RegistrationResult result;
    if (token.size() < kMinTokenLength) {
        LOG_WARN("Push", "Rejected device token for " + userId + " (too short)");
        result.errorCode = "ERR_PUSH_INVALID_TOKEN";
        return result;
    }

    const UtcTime now = clock_();
    DeviceInfo info;
    info.userId = userId;
    info.token = token;
    info.deviceId = deviceId;
    info.platform = platform.empty() ? "mobile" : platform;
    info.appVersion = appVersion;
    info.registeredAt = now;
    info.lastSeen = now;

    {
        std::lock_guard<std::mutex> lock(mtx_);
        devices_[userId][deviceId] = info;
    }

    LOG_INFO("Push", "Device registered: " + deviceId + " for user " + userId);

    result.success = true;
    result.registrationId = userId + "_" + deviceId;
    result.expiresAt = now + std::chrono::hours(24 * 30);
    return result;
}

std::vector<DeviceInfo> DeviceRegistry::devices(const std::string& userId) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<DeviceInfo> out;
    auto it = devices_.find(userId);
    if (it == devices_.end()) return out;
    for (const auto& [id, info] : it->second) out.push_back(info);
    return out;
}

std::vector<std::string> DeviceRegistry::activeTokens(const std::string& userId) const {
    std::vector<std::string> tokens;
    for (const auto& d : devices(userId)) {
        if (d.active) tokens.push_back(d.token);
    }
    return tokens;
}

// =========================================================
// ReminderService
// =========================================================
ReminderService::ReminderService(std::shared_ptr<SchedulingEngine> engine,
                                 std::shared_ptr<PushSender> sender,
                                 std::shared_ptr<DeviceRegistry> devices,
                                 ReminderOptions options)
    : engine_(std::move(engine)) {
    if (!engine_ || !sender) throw std::invalid_argument("ReminderService requires an engine and a push sender");
    if (!devices) devices = std::make_shared<DeviceRegistry>();

    auto dispatcher = std::make_shared<Dispatcher>();
    dispatcher->sender = std::move(sender);
    dispatcher->devices = std::move(devices);
    dispatcher->options = std::move(options);
    dispatcher_ = std::move(dispatcher);
}

void ReminderService::attach() {
    std::shared_ptr<const Dispatcher> dispatcher = dispatcher_;
    engine_->setDeliveryCallback([dispatcher](const ScheduledJob& job) { return dispatcher->deliver(job); });
}

ScheduleResult ReminderService::scheduleReminder(const std::string& userId,
                                                 const std::string& token,
                                                 const std::string& text,
                                                 UtcTime scheduledTime,
                                                 const std::optional<std::string>& reminderId,
                                                 const nlohmann::json& metadata) {
    if (!token.empty() && token.size() < DeviceRegistry::kMinTokenLength) {
        ScheduleResult rejected;
        rejected.errorCode = "ERR_PUSH_INVALID_TOKEN";
        rejected.message = ErrorManager::getUserMessage(rejected.errorCode);
        LOG_WARN("Push", "Reminder rejected for " + userId + ": invalid token");
        return rejected;
    }

    nlohmann::json payload = {
        {"type", "reminder"},
        {"text", text},
        {"token", token},
        {"metadata", metadata.is_object() ? metadata : nlohmann::json::object()}
    };

    ScheduleResult result = engine_->schedule(reminderId, userId, scheduledTime, std::move(payload));
    if (result.success) {
        LOG_INFO("Push", "Reminder scheduled: " + result.job.jobId + " for " +
                         formatIsoUtc(result.job.triggerTimeUtc));
    }
    return result;
}

ScheduleResult ReminderService::scheduleReminder(const std::string& userId,
                                                 const std::string& token,
                                                 const std::string& text,
                                                 const std::string& scheduledTime,
                                                 const std::optional<std::string>& reminderId,
                                                 const nlohmann::json& metadata) {
    auto when = parseIsoTimestamp(scheduledTime);
    if (!when) {
        ScheduleResult rejected;
        rejected.errorCode = "ERR_SCHED_BAD_TIMESTAMP";
        rejected.message = ErrorManager::getUserMessage(rejected.errorCode);
        LOG_WARN("Push", "Unparseable reminder time: " + scheduledTime);
        return rejected;
    }
    return scheduleReminder(userId, token, text, *when, reminderId, metadata);
}

CancelResult ReminderService::cancelReminder(const std::string& reminderId) {
    CancelResult result = engine_->cancel(reminderId);
    LOG_INFO("Push", "Reminder cancel " + reminderId +
                     (result.cancelledPending ? " (was pending)" : " (no-op)"));
    return result;
}

std::vector<ScheduledJob> ReminderService::listReminders(const std::string& userId) const {
    std::vector<ScheduledJob> out;
    for (auto& job : engine_->listForUser(userId)) {
        if (job.payload.value("type", "") == "reminder") out.push_back(std::move(job));
    }
    return out;
}

PushMessage ReminderService::Dispatcher::buildMessage(const ScheduledJob& job) const {
    PushMessage msg;
    const std::string type = job.payload.value("type", "reminder");

    if (type == "alarm") {
        msg.title = options.alarmTitle;
        std::string label = job.payload.value("label", "");
        msg.body = label.empty() ? "Alarm for " + job.payload.value("local_time", formatIsoUtc(job.triggerTimeUtc))
                                 : label;
    } else {
        msg.title = options.reminderTitle;
        msg.body = job.payload.value("text", "");
    }

    msg.data = {
        {"type", type},
        {"job_id", job.jobId},
        {"user_id", job.userId},
        {"scheduled_time", formatIsoUtc(job.triggerTimeUtc)},
        {"metadata", job.payload.value("metadata", nlohmann::json::object()).dump()}
    };
    return msg;
}

DeliveryResult ReminderService::deliver(const ScheduledJob& job) {
    return dispatcher_->deliver(job);
}

DeliveryResult ReminderService::Dispatcher::deliver(const ScheduledJob& job) const {
    DeliveryResult result;
    const std::string type = job.payload.value("type", "");
    if (type != "alarm" && type != "reminder") {
        result.error = "unsupported job type '" + type + "'";
        LOG_ERROR("Push", "Job " + job.jobId + ": " + result.error);
        return result;
    }

    std::vector<std::string> tokens;
    std::string jobToken = job.payload.value("token", "");
    if (!jobToken.empty()) tokens.push_back(jobToken);
    else tokens = devices->activeTokens(job.userId);

    if (tokens.empty()) {
        result.error = ErrorManager::getDebugMessage("ERR_PUSH_NO_DEVICE");
        LOG_WARN("Push", "Job " + job.jobId + ": no device for " + job.userId);
        return result;
    }

    PushMessage msg = buildMessage(job);
    std::string lastError;
    for (const auto& token : tokens) {
        msg.token = token;
        PushResult sent;
        try {
            sent = sender->deliver(msg);
        } catch (const std::exception& e) {
            sent.error = e.what();
        }

        if (sent.success) {
            if (result.deliveryId.empty()) result.deliveryId = sent.messageId;
            result.success = true;
        } else {
            lastError = sent.error;
        }
    }

    if (result.success) {
        LOG_INFO("Push", "Notification sent: " + job.jobId + " -> " + result.deliveryId);
    } else {
        result.error = "push failed: " + lastError;
        LOG_ERROR("Push", "Job " + job.jobId + ": " + result.error);
    }
    return result;
}

PushResult ReminderService::sendTestNotification(const std::string& token, const std::string& userId) {
    PushMessage msg;
    msg.token = token;
    msg.title = dispatcher_->options.testTitle;
    msg.body = "Push notifications are working!";
    msg.data = {{"type", "test"}, {"user_id", userId}, {"sent_at", formatIsoUtc(systemNow())}};

    try {
        return dispatcher_->sender->deliver(msg);
    } catch (const std::exception& e) {
        PushResult failed;
        failed.error = e.what();
        LOG_ERROR("Push", "Test notification failed: " + failed.error);
        return failed;
    }
}
