#include "time_utils.hpp"

#include <regex>
#include <map>
#include <cstdio>
#include <algorithm>
#include <cctype>

UtcTime systemNow() {
    return std::chrono::system_clock::now();
}

// ------------------------------------------------------------
// Calendar arithmetic (proleptic Gregorian, no timegm dependency)
// ------------------------------------------------------------
long long daysFromCivil(int year, int month, int day) {
    long long y = year;
    y -= month <= 2 ? 1 : 0;
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp  = (month + 9) % 12;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

static void civilFromDays(long long z, int& year, int& month, int& day) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp  = (5 * doy + 2) / 153;
    day   = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    month = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    year  = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

static bool isLeap(int y) {
    return (y % 4 == 0 && y % 100 != 0) || (y % 400 == 0);
}

static int daysInMonth(int y, int m) {
    static const int mdays[12] = {31,28,31,30,31,30,31,31,30,31,30,31};
    if (m == 2 && isLeap(y)) return 29;
    return mdays[m - 1];
}

UtcTime civilToUtc(const CivilTime& local, int offsetMinutes) {
    long long secs = daysFromCivil(local.year, local.month, local.day) * 86400LL
                   + local.hour * 3600LL + local.minute * 60LL + local.second
                   - offsetMinutes * 60LL;
    return UtcTime(std::chrono::seconds(secs));
}

CivilTime civilFromUtc(UtcTime t, int offsetMinutes) {
    long long secs = std::chrono::duration_cast<std::chrono::seconds>(t.time_since_epoch()).count()
                   + offsetMinutes * 60LL;
    long long days = secs / 86400;
    long long rem  = secs % 86400;
    if (rem < 0) {
        rem += 86400;
        --days;
    }

    CivilTime c;
    civilFromDays(days, c.year, c.month, c.day);
    c.hour   = static_cast<int>(rem / 3600);
    c.minute = static_cast<int>((rem % 3600) / 60);
    c.second = static_cast<int>(rem % 60);
    return c;
}

// ------------------------------------------------------------
// Offsets
// ------------------------------------------------------------
static std::optional<int> parseSignedOffset(const std::string& s) {
    static const std::regex re(R"(^([+-])(\d{1,2})(?::?(\d{2}))?$)");
    std::smatch m;
    if (!std::regex_match(s, m, re)) return std::nullopt;

    int hours = std::stoi(m[2].str());
    int minutes = m[3].matched ? std::stoi(m[3].str()) : 0;
    if (hours > 14 || minutes > 59) return std::nullopt;

    int total = hours * 60 + minutes;
    return m[1].str() == "-" ? -total : total;
}

std::optional<int> parseUtcOffsetMinutes(const std::string& zone) {
    // Zones without daylight saving only; anything else needs a tz database.
    static const std::map<std::string, int> fixedZones = {
        {"asia/kolkata", 330},
        {"asia/calcutta", 330},
        {"asia/dubai", 240},
        {"asia/singapore", 480},
        {"asia/shanghai", 480},
        {"asia/tokyo", 540},
        {"asia/kathmandu", 345},
        {"africa/nairobi", 180},
        {"america/phoenix", -420},
        {"pacific/honolulu", -600},
        {"etc/utc", 0}
    };

    std::string z = zone;
    z.erase(std::remove_if(z.begin(), z.end(),
                           [](unsigned char c) { return std::isspace(c); }),
            z.end());
    std::string lowered = z;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered.empty() || lowered == "utc" || lowered == "z" || lowered == "gmt") return 0;

    auto it = fixedZones.find(lowered);
    if (it != fixedZones.end()) return it->second;

    if (lowered.rfind("utc", 0) == 0 || lowered.rfind("gmt", 0) == 0) {
        return parseSignedOffset(z.substr(3));
    }
    return parseSignedOffset(z);
}

// ------------------------------------------------------------
// ISO-8601
// ------------------------------------------------------------
std::optional<UtcTime> parseIsoTimestamp(const std::string& text) {
    static const std::regex re(
        R"(^\s*(\d{4})-(\d{2})-(\d{2})(?:[Tt ](\d{2}):(\d{2})(?::(\d{2})(?:\.(\d{1,9}))?)?)?\s*(Z|z|[+-]\d{2}(?::?\d{2})?)?\s*$)");

    std::smatch m;
    if (!std::regex_match(text, m, re)) return std::nullopt;

    CivilTime c;
    c.year   = std::stoi(m[1].str());
    c.month  = std::stoi(m[2].str());
    c.day    = std::stoi(m[3].str());
    c.hour   = m[4].matched ? std::stoi(m[4].str()) : 0;
    c.minute = m[5].matched ? std::stoi(m[5].str()) : 0;
    c.second = m[6].matched ? std::stoi(m[6].str()) : 0;

    if (c.month < 1 || c.month > 12) return std::nullopt;
    if (c.day < 1 || c.day > daysInMonth(c.year, c.month)) return std::nullopt;
    if (c.hour > 23 || c.minute > 59 || c.second > 60) return std::nullopt;

    // No designator: naive, treated as UTC
    int offset = 0;
    if (m[8].matched) {
        std::string designator = m[8].str();
        if (designator != "Z" && designator != "z") {
            auto parsed = parseSignedOffset(designator);
            if (!parsed) return std::nullopt;
            offset = *parsed;
        }
    }

    UtcTime t = civilToUtc(c, offset);

    if (m[7].matched) {
        std::string frac = m[7].str();
        frac.resize(9, '0');
        t += std::chrono::duration_cast<UtcTime::duration>(std::chrono::nanoseconds(std::stoll(frac)));
    }
    return t;
}

std::string formatIsoUtc(UtcTime t) {
    CivilTime c = civilFromUtc(t, 0);
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02dZ",
                  c.year, c.month, c.day, c.hour, c.minute, c.second);
    return buf;
}

long long toEpochMillis(UtcTime t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

UtcTime fromEpochMillis(long long ms) {
    return UtcTime(std::chrono::duration_cast<UtcTime::duration>(std::chrono::milliseconds(ms)));
}
