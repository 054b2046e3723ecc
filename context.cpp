#include "context.hpp"
#include "logger.hpp"

// ------------------------------------------------------------
// UserContext
// ------------------------------------------------------------
std::string UserContext::preference(const std::string& key, const std::string& fallback) const {
    if (!preferences.is_object() || !preferences.contains(key)) return fallback;
    const auto& v = preferences[key];
    if (v.is_null()) return fallback;
    if (v.is_string()) return v.get<std::string>();
    return v.dump();
}

nlohmann::json defaultPreferences() {
    return {
        {"timezone", "UTC"},
        {"alarm_tone", "default"},
        {"usual_wakeup", nullptr},
        {"airline_pref", nullptr},
        {"max_price", nullptr},
        {"seat_pref", nullptr},
        {"flight_type", "any"}
    };
}

// ------------------------------------------------------------
// ContextProvider
// ------------------------------------------------------------
ContextProvider::ContextProvider(std::shared_ptr<ContextStore> store, ContextOptions options)
    : store_(std::move(store)), options_(std::move(options)) {
    if (!store_) store_ = std::make_shared<InMemoryContextStore>();
    if (!options_.defaultPreferences.is_object() || options_.defaultPreferences.empty()) {
        options_.defaultPreferences = defaultPreferences();
    }
}

nlohmann::json ContextProvider::getPreferences(const std::string& userId) {
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        auto it = cache_.find(userId);
        if (it != cache_.end()) return it->second;
    }

    nlohmann::json prefs;
    if (auto stored = store_->getPreferences(userId)) {
        prefs = *stored;
    } else {
        prefs = options_.defaultPreferences;
        prefs["user_id"] = userId;
        prefs["created_at"] = formatIsoUtc(systemNow());
        store_->putPreferences(userId, prefs);
        LOG_INFO("Memory", "Created default preferences for " + userId);
    }

    std::lock_guard<std::mutex> lock(cacheMutex_);
    return cache_.emplace(userId, prefs).first->second;
}

bool ContextProvider::updatePreference(const std::string& userId,
                                       const std::string& key,
                                       const nlohmann::json& value) {
    try {
        nlohmann::json prefs = getPreferences(userId);
        prefs[key] = value;
        store_->putPreferences(userId, prefs);

        std::lock_guard<std::mutex> lock(cacheMutex_);
        cache_[userId] = prefs;
    } catch (const std::exception& e) {
        LOG_ERROR("Memory", "Preference update failed for " + userId + ": " + e.what());
        return false;
    }

    LOG_INFO("Memory", "Updated preference " + key + " for user " + userId);
    return true;
}

bool ContextProvider::storeTurn(const ConversationTurn& turn) {
    try {
        store_->appendTurn(turn);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Memory", "Conversation storage failed for " + turn.userId + ": " + e.what());
        return false;
    }
}

std::vector<ConversationTurn> ContextProvider::recentTurns(const std::string& userId) {
    return store_->recentTurns(userId, options_.recentTurnLimit);
}

nlohmann::json ContextProvider::intentSpecificContext(IntentKind kind, const nlohmann::json& prefs) const {
    auto pick = [&prefs](const char* key, const nlohmann::json& fallback) {
        return (prefs.contains(key) && !prefs[key].is_null()) ? prefs[key] : fallback;
    };

    switch (kind) {
        case IntentKind::SetAlarm:
        case IntentKind::DeleteAlarm:
            return {
                {"timezone", pick("timezone", "UTC")},
                {"alarm_tone", pick("alarm_tone", "default")},
                {"usual_wakeup", pick("usual_wakeup", nullptr)}
            };
        case IntentKind::SearchFlights:
        case IntentKind::BookFlight:
            return {
                {"airline_pref", pick("airline_pref", nullptr)},
                {"max_price", pick("max_price", nullptr)},
                {"seat_pref", pick("seat_pref", nullptr)},
                {"flight_type", pick("flight_type", "any")}
            };
        case IntentKind::GetWeather:
        case IntentKind::SendMessage:
        case IntentKind::Unknown:
            break;
    }
    return nlohmann::json::object();
}

UserContext ContextProvider::getUserContext(const std::string& userId, IntentKind kind) {
    UserContext ctx;
    ctx.userId = userId;

    try {
        ctx.preferences    = getPreferences(userId);
        ctx.recentTurns    = recentTurns(userId);
        ctx.intentSpecific = intentSpecificContext(kind, ctx.preferences);
    } catch (const std::exception& e) {
        LOG_ERROR("Memory", "Context retrieval failed for " + userId + ": " + e.what());
        ctx.preferences    = nlohmann::json::object();
        ctx.recentTurns.clear();
        ctx.intentSpecific = nlohmann::json::object();
    }
    return ctx;
}
