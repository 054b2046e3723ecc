#include "bootstrap_config.hpp"
#include "error_manager.hpp"
#include "context.hpp"
#include "commands/commands_flights.hpp"
#include "logger.hpp"

#include <fstream>

namespace fs = std::filesystem;

namespace bootstrap_config {

// ----------------- helpers -----------------
static bool sameKind(const nlohmann::json& a, const nlohmann::json& b) {
    if (a.is_number() && b.is_number()) return true;
    return a.type() == b.type();
}

bool mergeDefaults(nlohmann::json& cfg,
                   const nlohmann::json& defs,
                   const std::string& prefix,
                   int* patchedCount) {
    bool patched = false;
    for (auto& [key, defVal] : defs.items()) {
        const std::string path = prefix.empty() ? key : prefix + "." + key;

        if (!cfg.contains(key)) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_null()) {
            continue; // optional value, anything goes
        } else if (cfg[key].is_null()) {
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        } else if (defVal.is_object() && cfg[key].is_object()) {
            if (mergeDefaults(cfg[key], defVal, path, patchedCount))
                patched = true;
        } else if (!sameKind(cfg[key], defVal)) {
            LOG_WARN("Config", "Wrong type for " + path + ", reset to default");
            cfg[key] = defVal;
            patched = true;
            if (patchedCount) (*patchedCount)++;
        }
    }
    return patched;
}

// ----------------- defaults -----------------
nlohmann::json defaultAssistant() {
    nlohmann::json airports = nlohmann::json::object();
    for (const auto& [city, code] : defaultAirportCodes()) airports[city] = code;

    return {
        {"log_file", "jarvis.log"},
        {"log_level", "info"},
        {"errors_file", "errors.json"},

        {"ai", {
            {"backend", "auto"},
            {"ollama_url", "http://127.0.0.1:11434"},
            {"localai_url", "http://127.0.0.1:8080/v1"},
            {"openai_url", "https://api.openai.com/v1"},
            {"default_model", "mistral"},
            {"api_keys", {
                {"openai", ""}
            }},
            {"intent_timeout_ms", 10000},
            {"intent_temperature", 0.3},
            {"intent_max_tokens", 200},
            {"response_timeout_ms", 10000},
            {"response_temperature", 0.7},
            {"response_max_tokens", 150}
        }},

        {"nlp", {
            {"rules_file", ""},
            {"accept_threshold", 0.8},
            {"fallback_confidence", 0.7}
        }},

        {"context", {
            {"store_file", "memory.json"},
            {"recent_turns", 5},
            {"max_turns_per_user", 200},
            {"default_preferences", defaultPreferences()}
        }},

        {"scheduler", {
            {"store_file", "jobs.json"}
        }},

        {"push", {
            {"endpoint", ""},
            {"server_key", ""},
            {"timeout_ms", 5000},
            {"alarm_title", "⏰ JARVIS Alarm"},
            {"reminder_title", "🔔 JARVIS Reminder"}
        }},

        {"voice", {
            {"whisper_model", "models/ggml-base.en.bin"},
            {"whisper_language", "en"},
            {"whisper_threads", 4},
            {"tts_command", ""},
            {"tts_output_dir", "tts_out"}
        }},

        {"flights", {
            {"airports", airports}
        }}
    };
}

// ----------------- loader -----------------
static void saveConfig(const fs::path& path, const nlohmann::json& cfg, const std::string& name) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        LOG_ERROR("Config", "Could not write " + name + " to " + path.string());
        return;
    }
    out << cfg.dump(2);
}

bool loadConfig(const fs::path& path,
                const nlohmann::json& defaults,
                nlohmann::json& outConfig,
                const std::string& name,
                const std::string& errorCode) {
    if (!fs::exists(path)) {
        outConfig = defaults;
        saveConfig(path, outConfig, name);

        LOG_PHASE(name + " created", true);
        return true;
    }

    try {
        std::ifstream f(path);
        f >> outConfig;
        if (!outConfig.is_object()) throw std::runtime_error("top level is not an object");

        int patchedCount = 0;
        if (mergeDefaults(outConfig, defaults, "", &patchedCount)) {
            saveConfig(path, outConfig, name);
            LOG_PHASE(name + " patched", true);
            LOG_DEBUG("Config", name + " patched (" + std::to_string(patchedCount) + " keys)");
        } else {
            LOG_PHASE(name + " load", true);
        }
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Config", name + " invalid (" + e.what() + ") → reset to defaults");
        LOG_PHASE(name + " load", false);

        if (!errorCode.empty())
            ErrorManager::report(errorCode);

        outConfig = defaults;
        saveConfig(path, outConfig, name);
        return false;
    }
}

} // namespace bootstrap_config
