#include "context_store.hpp"
#include "logger.hpp"

#include <fstream>
#include <stdexcept>

// ------------------------------------------------------------
// JSON mapping
// ------------------------------------------------------------
nlohmann::json turnToJson(const ConversationTurn& turn) {
    return {
        {"user_id", turn.userId},
        {"text", turn.text},
        {"intent", turn.intentKind},
        {"response", turn.response},
        {"timestamp", formatIsoUtc(turn.timestamp)},
        {"timestamp_ms", toEpochMillis(turn.timestamp)}
    };
}

ConversationTurn turnFromJson(const nlohmann::json& j) {
    ConversationTurn turn;
    turn.userId     = j.value("user_id", "");
    turn.text       = j.value("text", "");
    turn.intentKind = j.value("intent", "unknown");
    turn.response   = j.value("response", "");
    turn.timestamp  = fromEpochMillis(j.value("timestamp_ms", 0LL));
    return turn;
}

// ------------------------------------------------------------
// InMemoryContextStore
// ------------------------------------------------------------
InMemoryContextStore::InMemoryContextStore(std::size_t maxTurnsPerUser)
    : maxTurns_(maxTurnsPerUser == 0 ? 1 : maxTurnsPerUser) {}

std::optional<nlohmann::json> InMemoryContextStore::getPreferences(const std::string& userId) {
    std::lock_guard<std::mutex> lock(mtx_);
    auto it = preferences_.find(userId);
    if (it == preferences_.end()) return std::nullopt;
    return it->second;
}

void InMemoryContextStore::putPreferences(const std::string& userId, const nlohmann::json& prefs) {
    std::lock_guard<std::mutex> lock(mtx_);
    preferences_[userId] = prefs;
}

void InMemoryContextStore::appendLocked(const ConversationTurn& turn) {
    auto& history = turns_[turn.userId];
    if (history.size() >= maxTurns_) {
        history.pop_front(); // cap history size
    }
    history.push_back(turn);
}

void InMemoryContextStore::appendTurn(const ConversationTurn& turn) {
    std::lock_guard<std::mutex> lock(mtx_);
    appendLocked(turn);
}

std::vector<ConversationTurn> InMemoryContextStore::recentTurns(const std::string& userId,
                                                                std::size_t limit) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<ConversationTurn> out;

    auto it = turns_.find(userId);
    if (it == turns_.end()) return out;

    for (auto rit = it->second.rbegin(); rit != it->second.rend() && out.size() < limit; ++rit) {
        out.push_back(*rit);
    }
    return out;
}

// ------------------------------------------------------------
// JsonFileContextStore
// ------------------------------------------------------------
JsonFileContextStore::JsonFileContextStore(std::filesystem::path path, std::size_t maxTurnsPerUser)
    : InMemoryContextStore(maxTurnsPerUser), path_(std::move(path)) {
    load();
}

void JsonFileContextStore::load() {
    std::lock_guard<std::mutex> lock(mtx_);

    std::ifstream f(path_);
    if (!f) {
        LOG_DEBUG("Memory", "No " + path_.string() + " found. Creating new file.");
        return;
    }

    try {
        nlohmann::json j;
        f >> j;

        if (j.contains("preferences") && j["preferences"].is_object()) {
            for (auto& [userId, prefs] : j["preferences"].items()) {
                preferences_[userId] = prefs;
            }
        }
        if (j.contains("conversations") && j["conversations"].is_array()) {
            for (const auto& item : j["conversations"]) {
                appendLocked(turnFromJson(item));
            }
        }
        LOG_PHASE("Memory loaded", true);
    } catch (const std::exception& e) {
        LOG_ERROR("Memory", std::string("Failed to parse ") + path_.string() + ": " + e.what());
        LOG_PHASE("Memory load", false);
    }
}

void JsonFileContextStore::saveLocked() {
    nlohmann::json j = {
        {"preferences", nlohmann::json::object()},
        {"conversations", nlohmann::json::array()}
    };
    for (const auto& [userId, prefs] : preferences_) {
        j["preferences"][userId] = prefs;
    }
    for (const auto& [userId, history] : turns_) {
        for (const auto& turn : history) j["conversations"].push_back(turnToJson(turn));
    }

    std::ofstream f(path_, std::ios::trunc);
    if (!f) {
        throw std::runtime_error("could not write " + path_.string());
    }
    f << j.dump(2);
}

void JsonFileContextStore::putPreferences(const std::string& userId, const nlohmann::json& prefs) {
    std::lock_guard<std::mutex> lock(mtx_);
    preferences_[userId] = prefs;
    saveLocked();
}

void JsonFileContextStore::appendTurn(const ConversationTurn& turn) {
    std::lock_guard<std::mutex> lock(mtx_);
    appendLocked(turn);
    saveLocked();
}
