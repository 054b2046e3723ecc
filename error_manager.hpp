#pragma once

#include <string>
#include <nlohmann/json.hpp>

// Undefine Windows ERROR macro if it leaks in
#ifdef ERROR
#undef ERROR
#endif

#include "commands/commands_core.hpp"

// ------------------------------------------------------------
// ErrorManager
// ------------------------------------------------------------
namespace ErrorManager {
    // Built-in error table ({code: {user, debug}})
    nlohmann::json defaults();

    // Replace the table with defaults() overlaid by `overrides`
    void install(const nlohmann::json& overrides);

    // Load error codes from JSON (errors.json); keeps defaults on failure
    bool load(const std::string& path);

    // Get messages
    std::string getUserMessage(const std::string& code);
    std::string getDebugMessage(const std::string& code);

    // Report an error: logs the debug text, returns an Error ActionResult
    ActionResult report(const std::string& code);
}
