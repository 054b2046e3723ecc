#pragma once
#include <string>
#include <chrono>
#include <optional>
#include <functional>

// All engine-side times are UTC instants on the system clock.
using UtcTime = std::chrono::system_clock::time_point;

// Source of "now"; injectable so tests can pin the clock.
using ClockFn = std::function<UtcTime()>;
UtcTime systemNow();

// Broken-down wall-clock time (no zone attached)
struct CivilTime {
    int year = 1970;
    int month = 1;   // 1-12
    int day = 1;     // 1-31
    int hour = 0;
    int minute = 0;
    int second = 0;
};

// Days since 1970-01-01 for a proleptic Gregorian date.
long long daysFromCivil(int year, int month, int day);

// Wall-clock time at `offsetMinutes` east of UTC -> UTC instant.
UtcTime civilToUtc(const CivilTime& local, int offsetMinutes = 0);

// UTC instant -> wall-clock time at `offsetMinutes` east of UTC.
CivilTime civilFromUtc(UtcTime t, int offsetMinutes = 0);

// Parse an ISO-8601 timestamp and normalise it to UTC.
//   "2026-10-20T07:00:00"        naive -> treated as UTC
//   "2026-10-20T07:00:00Z"       UTC
//   "2026-10-20 12:30+05:30"     converted to UTC
// Returns nullopt for anything else.
std::optional<UtcTime> parseIsoTimestamp(const std::string& text);

// "2026-10-20T07:00:00Z"
std::string formatIsoUtc(UtcTime t);

// Timezone preference -> minutes east of UTC.
// Accepts "UTC", "Z", "GMT", "+05:30", "-0800", "UTC+5", "GMT-03:00"
// and a few fixed-offset zone names ("Asia/Kolkata", ...).
std::optional<int> parseUtcOffsetMinutes(const std::string& zone);

// Milliseconds since the Unix epoch
long long toEpochMillis(UtcTime t);
UtcTime fromEpochMillis(long long ms);
