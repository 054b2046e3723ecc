#pragma once
#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <map>
#include <nlohmann/json.hpp>

#include "intent.hpp"
#include "context_store.hpp"

// ------------------------------------------------------------
// UserContext: what downstream stages know about the caller
// ------------------------------------------------------------
struct UserContext {
    std::string userId;
    nlohmann::json preferences = nlohmann::json::object();
    std::vector<ConversationTurn> recentTurns;                 // most recent first
    nlohmann::json intentSpecific = nlohmann::json::object();  // slice for the current intent

    // preferences[key] as a string, or `fallback` when absent/null
    std::string preference(const std::string& key, const std::string& fallback = "") const;
};

struct ContextOptions {
    std::size_t recentTurnLimit = 5;
    nlohmann::json defaultPreferences = nlohmann::json::object();
};

// Canonical defaults for a new user
nlohmann::json defaultPreferences();

// ------------------------------------------------------------
// ContextProvider
// Owns preference defaults and is the only path that mutates them.
// ------------------------------------------------------------
class ContextProvider {
public:
    explicit ContextProvider(std::shared_ptr<ContextStore> store,
                             ContextOptions options = {});

    // Never throws; on store failure returns a context with empty
    // preferences and history.
    UserContext getUserContext(const std::string& userId, IntentKind kind);

    // Creates and persists defaults on first access.
    nlohmann::json getPreferences(const std::string& userId);

    // Returns false (and logs) when the store rejects the write.
    bool updatePreference(const std::string& userId,
                          const std::string& key,
                          const nlohmann::json& value);

    // Returns false (and logs) when the store rejects the write.
    bool storeTurn(const ConversationTurn& turn);

    std::vector<ConversationTurn> recentTurns(const std::string& userId);

private:
    nlohmann::json intentSpecificContext(IntentKind kind, const nlohmann::json& prefs) const;

    std::shared_ptr<ContextStore> store_;
    ContextOptions options_;

    std::mutex cacheMutex_;
    std::map<std::string, nlohmann::json> cache_;
};
