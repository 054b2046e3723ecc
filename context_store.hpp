#pragma once
#include <string>
#include <vector>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <filesystem>
#include <nlohmann/json.hpp>

#include "scheduler/time_utils.hpp"

// ------------------------------------------------------------
// ConversationTurn: append-only record of one exchange
// ------------------------------------------------------------
struct ConversationTurn {
    std::string userId;
    std::string text;
    std::string intentKind;   // wire name, e.g. "set_alarm"
    std::string response;
    UtcTime timestamp{};
};

nlohmann::json turnToJson(const ConversationTurn& turn);
ConversationTurn turnFromJson(const nlohmann::json& j);

// ------------------------------------------------------------
// ContextStore: durable home of preferences and history
// ------------------------------------------------------------
class ContextStore {
public:
    virtual ~ContextStore() = default;

    virtual std::optional<nlohmann::json> getPreferences(const std::string& userId) = 0;
    virtual void putPreferences(const std::string& userId, const nlohmann::json& prefs) = 0;

    virtual void appendTurn(const ConversationTurn& turn) = 0;

    // Most recent first, at most `limit` entries
    virtual std::vector<ConversationTurn> recentTurns(const std::string& userId, std::size_t limit) = 0;
};

/// InMemoryContextStore
/// Keeps at most `maxTurnsPerUser` turns per user; oldest are dropped first.
class InMemoryContextStore : public ContextStore {
public:
    explicit InMemoryContextStore(std::size_t maxTurnsPerUser = 200);

    std::optional<nlohmann::json> getPreferences(const std::string& userId) override;
    void putPreferences(const std::string& userId, const nlohmann::json& prefs) override;
    void appendTurn(const ConversationTurn& turn) override;
    std::vector<ConversationTurn> recentTurns(const std::string& userId, std::size_t limit) override;

protected:
    void appendLocked(const ConversationTurn& turn);

    std::mutex mtx_;
    std::size_t maxTurns_;
    std::map<std::string, nlohmann::json> preferences_;
    std::map<std::string, std::deque<ConversationTurn>> turns_;
};

/// JsonFileContextStore
/// Same semantics, persisted to a JSON file (memory.json) after each write.
class JsonFileContextStore : public InMemoryContextStore {
public:
    explicit JsonFileContextStore(std::filesystem::path path, std::size_t maxTurnsPerUser = 200);

    void putPreferences(const std::string& userId, const nlohmann::json& prefs) override;
    void appendTurn(const ConversationTurn& turn) override;

private:
    void load();
    void saveLocked();

    std::filesystem::path path_;
};
