#include "commands_alarms.hpp"
#include "commands_helpers.hpp"
#include "context.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "nlp.hpp"

#include <regex>
#include <algorithm>
#include <cstdio>
#include <stdexcept>

// ------------------------------------------------------------
// Time parsing
// ------------------------------------------------------------
std::optional<AlarmTime> parseAlarmTime(const std::string& text) {
    static const std::regex timeRe(R"(^(\d{1,2})(?::(\d{2}))?\s*(am|pm|a\.m\.|p\.m\.)?$)");

    std::string lowered = toLowerAscii(trimCopy(text));
    std::smatch m;
    if (!std::regex_match(lowered, m, timeRe)) return std::nullopt;

    int hour = std::stoi(m[1].str());
    int minute = m[2].matched ? std::stoi(m[2].str()) : 0;
    if (minute > 59) return std::nullopt;

    if (m[3].matched) {
        // 12-hour clock
        if (hour < 1 || hour > 12) return std::nullopt;
        bool pm = m[3].str()[0] == 'p';
        hour = hour % 12 + (pm ? 12 : 0);
    } else if (hour > 23) {
        return std::nullopt;
    }

    return AlarmTime{hour, minute};
}

std::string formatAlarmTime(int hour, int minute) {
    int h12 = hour % 12 == 0 ? 12 : hour % 12;
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%02d:%02d %s", h12, minute, hour < 12 ? "AM" : "PM");
    return buf;
}

// ------------------------------------------------------------
// AlarmService
// ------------------------------------------------------------
AlarmService::AlarmService(std::shared_ptr<SchedulingEngine> engine, ClockFn clock)
    : engine_(std::move(engine)), clock_(std::move(clock)) {
    if (!engine_) throw std::invalid_argument("AlarmService requires a scheduling engine");
    if (!clock_) clock_ = systemNow;
}

ActionResult AlarmService::setAlarm(const std::string& userId,
                                    const std::string& timeText,
                                    const std::string& timezone,
                                    const std::string& tone,
                                    const std::string& label) {
    auto parsed = parseAlarmTime(timeText);
    if (!parsed) {
        LOG_WARN("Alarm", "Unparseable alarm time: " + timeText);
        ActionResult result = ErrorManager::report("ERR_ALARM_BAD_TIME");
        result.data["time"] = timeText;
        return result;
    }

    int offset = 0;
    if (auto zoneOffset = parseUtcOffsetMinutes(timezone)) {
        offset = *zoneOffset;
    } else {
        LOG_WARN("Alarm", "Unknown timezone '" + timezone + "', using UTC");
    }

    // Combine with today's date in the user's zone; roll over when past
    const UtcTime now = clock_();
    CivilTime local = civilFromUtc(now, offset);
    local.hour = parsed->hour;
    local.minute = parsed->minute;
    local.second = 0;

    UtcTime trigger = civilToUtc(local, offset);
    if (trigger <= now) trigger += std::chrono::hours(24);

    nlohmann::json payload = {
        {"type", "alarm"},
        {"label", label},
        {"tone", tone},
        {"timezone", timezone},
        {"local_time", formatAlarmTime(parsed->hour, parsed->minute)}
    };

    ScheduleResult scheduled = engine_->schedule(std::nullopt, userId, trigger, payload);
    if (!scheduled.success) {
        LOG_ERROR("Alarm", "Scheduling failed for " + userId + ": " + scheduled.message);
        ActionResult result = ErrorManager::report("ERR_ALARM_SET_FAILED");
        result.data["error"] = scheduled.message;
        return result;
    }

    LOG_INFO("Alarm", "Alarm set for " + userId + " at " + formatIsoUtc(trigger));

    ActionResult result;
    result.status = ActionStatus::Success;
    result.message = "Alarm set for " + formatAlarmTime(parsed->hour, parsed->minute);
    result.data = {
        {"alarm_id", scheduled.job.jobId},
        {"alarm_time", formatIsoUtc(trigger)},
        {"local_time", payload["local_time"]},
        {"timezone", timezone}
    };
    return result;
}

std::vector<ScheduledJob> AlarmService::activeAlarms(const std::string& userId) const {
    std::vector<ScheduledJob> alarms;
    for (auto& job : engine_->listForUser(userId)) {
        if (job.status == JobStatus::Scheduled && job.payload.value("type", "") == "alarm") {
            alarms.push_back(std::move(job));
        }
    }
    return alarms;
}

ActionResult AlarmService::deleteRecentAlarm(const std::string& userId) {
    auto alarms = activeAlarms(userId);
    if (alarms.empty()) {
        ActionResult result;
        result.status = ActionStatus::NotFound;
        result.message = "You don't have any active alarms.";
        return result;
    }

    auto newest = std::max_element(alarms.begin(), alarms.end(),
        [](const ScheduledJob& a, const ScheduledJob& b) {
            if (a.createdAt != b.createdAt) return a.createdAt < b.createdAt;
            return a.jobId < b.jobId;
        });

    engine_->cancel(newest->jobId);
    LOG_INFO("Alarm", "Deleted alarm " + newest->jobId + " for " + userId);

    ActionResult result;
    result.status = ActionStatus::Success;
    result.message = "Alarm deleted successfully.";
    result.data["alarm_id"] = newest->jobId;
    return result;
}

// ------------------------------------------------------------
// Handlers
// ------------------------------------------------------------
ActionResult handleSetAlarm(AlarmService& alarms, const Intent& intent,
                            const std::string& userId, const UserContext& context) {
    if (auto missing = checkRequiredSlots(intent, {{"time", "alarm time"}})) {
        return *missing;
    }

    return alarms.setAlarm(userId,
                           getSlot(intent, "time"),
                           context.preference("timezone", "UTC"),
                           context.preference("alarm_tone", "default"),
                           getSlot(intent, "label"));
}

ActionResult handleDeleteAlarm(AlarmService& alarms, const std::string& userId) {
    return alarms.deleteRecentAlarm(userId);
}
