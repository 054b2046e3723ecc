#pragma once
#include <string>
#include <map>
#include <optional>

// 🔹 Closed set of things a user can ask for
enum class IntentKind {
    SetAlarm,
    DeleteAlarm,
    SearchFlights,
    BookFlight,
    GetWeather,
    SendMessage,
    Unknown
};

// Wire name, e.g. "set_alarm"
const char* intentKindName(IntentKind kind);

// Reverse of intentKindName(); nullopt for labels the system does not know
std::optional<IntentKind> parseIntentKind(const std::string& name);

// 🔹 Result of intent resolution (immutable once returned by the resolver)
struct Intent {
    IntentKind kind = IntentKind::Unknown;
    std::map<std::string, std::string> slots;   // Named slot captures
    double confidence = 0.0;                    // In [0, 1]
    std::string sourceText;                     // Text the intent was resolved from

    bool hasSlot(const std::string& name) const {
        auto it = slots.find(name);
        return it != slots.end() && !it->second.empty();
    }
};

inline const char* intentKindName(IntentKind kind) {
    switch (kind) {
        case IntentKind::SetAlarm:      return "set_alarm";
        case IntentKind::DeleteAlarm:   return "delete_alarm";
        case IntentKind::SearchFlights: return "search_flights";
        case IntentKind::BookFlight:    return "book_flight";
        case IntentKind::GetWeather:    return "get_weather";
        case IntentKind::SendMessage:   return "send_message";
        case IntentKind::Unknown:       return "unknown";
    }
    return "unknown";
}

inline std::optional<IntentKind> parseIntentKind(const std::string& name) {
    static const std::map<std::string, IntentKind> kinds = {
        {"set_alarm",      IntentKind::SetAlarm},
        {"delete_alarm",   IntentKind::DeleteAlarm},
        {"search_flights", IntentKind::SearchFlights},
        {"book_flight",    IntentKind::BookFlight},
        {"get_weather",    IntentKind::GetWeather},
        {"send_message",   IntentKind::SendMessage},
        {"unknown",        IntentKind::Unknown}
    };

    auto it = kinds.find(name);
    if (it == kinds.end()) return std::nullopt;
    return it->second;
}
