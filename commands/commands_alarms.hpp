#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>

#include "commands_core.hpp"
#include "scheduler/scheduler.hpp"

// Wall-clock alarm time (24h)
struct AlarmTime {
    int hour = 0;
    int minute = 0;
};

// "7 AM", "6:30 pm", "6:30 a.m.", "18:30", "7". nullopt when unparseable.
std::optional<AlarmTime> parseAlarmTime(const std::string& text);

// "07:00 AM"
std::string formatAlarmTime(int hour, int minute);

// ------------------------------------------------------------
// AlarmService: alarms are "alarm" jobs on the scheduling engine
// ------------------------------------------------------------
class AlarmService {
public:
    AlarmService(std::shared_ptr<SchedulingEngine> engine, ClockFn clock = systemNow);

    // Next occurrence of `timeText` in the user's timezone (today, or
    // tomorrow when already past), scheduled in UTC.
    ActionResult setAlarm(const std::string& userId,
                          const std::string& timeText,
                          const std::string& timezone,
                          const std::string& tone = "default",
                          const std::string& label = "");

    // Cancels the most recently created pending alarm.
    ActionResult deleteRecentAlarm(const std::string& userId);

    // Pending alarms ordered by trigger time
    std::vector<ScheduledJob> activeAlarms(const std::string& userId) const;

private:
    std::shared_ptr<SchedulingEngine> engine_;
    ClockFn clock_;
};

// Router handlers
ActionResult handleSetAlarm(AlarmService& alarms, const Intent& intent,
                            const std::string& userId, const UserContext& context);
ActionResult handleDeleteAlarm(AlarmService& alarms, const std::string& userId);
