#include "error_manager.hpp"
#include "logger.hpp"

#include <fstream>
#include <filesystem>
#include <mutex>

// ------------------------------------------------------------
// Internal storage
// ------------------------------------------------------------
static std::mutex g_errorsMutex;
static nlohmann::json g_root = ErrorManager::defaults();

namespace ErrorManager {

nlohmann::json defaults() {
    return {
        {"ERR_ROUTER_UNKNOWN_INTENT", {
            {"user", "I'm not sure how to help with that yet."},
            {"debug", "No action handler registered for the resolved intent."}
        }},
        {"ERR_ROUTER_EXCEPTION", {
            {"user", "Something went wrong while handling that request."},
            {"debug", "Action handler threw; normalised at the router boundary."}
        }},
        {"ERR_SCHED_INVALID_TIME", {
            {"user", "That time has already passed. Please pick a time in the future."},
            {"debug", "schedule() trigger time is not strictly after current UTC time."}
        }},
        {"ERR_SCHED_BAD_TIMESTAMP", {
            {"user", "I couldn't read that date and time."},
            {"debug", "Trigger timestamp is not ISO-8601 (YYYY-MM-DDTHH:MM[:SS][Z|+hh:mm])."}
        }},
        {"ERR_ALARM_BAD_TIME", {
            {"user", "I couldn't understand that time format. Please try again."},
            {"debug", "Alarm time expression did not parse as h[:mm] [am|pm] or HH:MM."}
        }},
        {"ERR_ALARM_SET_FAILED", {
            {"user", "Failed to set alarm. Please try again."},
            {"debug", "Scheduling engine rejected the alarm job."}
        }},
        {"ERR_FLIGHT_BAD_DATE", {
            {"user", "I couldn't understand that date format."},
            {"debug", "Travel date did not parse as 'd mon yyyy' or YYYY-MM-DD."}
        }},
        {"ERR_FLIGHT_SEARCH_FAILED", {
            {"user", "Failed to search flights. Please try again."},
            {"debug", "Flight search collaborator failed."}
        }},
        {"ERR_STT_FAILED", {
            {"user", "I couldn't make out that audio."},
            {"debug", "Speech-to-text collaborator raised a transcription error."}
        }},
        {"ERR_AI_BACKEND_UNAVAILABLE", {
            {"user", "The language model is unavailable right now."},
            {"debug", "Completion backend returned an error or timed out."}
        }},
        {"ERR_PIPELINE_FAILURE", {
            {"user", "I apologize, but I encountered an error processing your request. Please try again."},
            {"debug", "Unhandled exception in the conversation pipeline."}
        }},
        {"ERR_PUSH_NO_DEVICE", {
            {"user", "No device is registered for notifications."},
            {"debug", "Dispatch found neither a job token nor registered devices."}
        }},
        {"ERR_PUSH_INVALID_TOKEN", {
            {"user", "That device token is not valid."},
            {"debug", "Device token shorter than 10 characters."}
        }},
        {"ERR_PUSH_SEND_FAILED", {
            {"user", "The notification could not be delivered."},
            {"debug", "Push collaborator reported a delivery failure."}
        }},
        {"ERR_CONFIG_INVALID", {
            {"user", "Configuration file invalid, reset to defaults."},
            {"debug", "assistant_config.json failed parsing."}
        }}
    };
}

void install(const nlohmann::json& overrides) {
    nlohmann::json table = defaults();
    const nlohmann::json& src =
        (overrides.contains("errors") && overrides["errors"].is_object()) ? overrides["errors"] : overrides;

    if (src.is_object()) {
        for (auto& [code, val] : src.items()) {
            if (val.is_object()) table[code] = val;
        }
    }

    std::lock_guard<std::mutex> lock(g_errorsMutex);
    g_root = std::move(table);
}

bool load(const std::string& path) {
    namespace fs = std::filesystem;

    std::ifstream in(path);
    if (!in) {
        LOG_WARN("ErrorManager", "Could not open " + path + ", using built-in codes");
        return false;
    }

    try {
        nlohmann::json errors;
        in >> errors;
        install(errors);
        LOG_DEBUG("ErrorManager", "Loaded errors from: " + fs::absolute(path).string());
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("ErrorManager", "Failed to parse " + path + " -> " + e.what());
        return false;
    }
}

std::string getUserMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("user")) {
        return g_root[code]["user"].get<std::string>();
    }
    return "Unknown error: " + code;
}

std::string getDebugMessage(const std::string& code) {
    std::lock_guard<std::mutex> lock(g_errorsMutex);
    if (g_root.contains(code) && g_root[code].contains("debug")) {
        return g_root[code]["debug"].get<std::string>();
    }
    return "No debug message for code: " + code;
}

ActionResult report(const std::string& code) {
    ActionResult result;
    result.status    = ActionStatus::Error;
    result.message   = getUserMessage(code);
    result.errorCode = code;

    LOG_ERROR("ErrorManager", code + " -> " + getDebugMessage(code));
    return result;
}

} // namespace ErrorManager
