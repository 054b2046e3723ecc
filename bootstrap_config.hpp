#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <filesystem>

// Centralized config bootstrap for the assistant
namespace bootstrap_config {

    inline constexpr const char* kConfigFile = "assistant_config.json";

    // Generic loader → ensures defaults, patches missing keys, saves back.
    // On a parse failure the file is reset to `defaults` and false is returned.
    bool loadConfig(const std::filesystem::path& path,
                    const nlohmann::json& defaults,
                    nlohmann::json& outConfig,
                    const std::string& name,
                    const std::string& errorCode = "");

    // Deep-merge `defs` into `cfg`: missing keys are added and keys of the
    // wrong type replaced. A null default accepts any value.
    // Returns true when something was patched.
    bool mergeDefaults(nlohmann::json& cfg,
                       const nlohmann::json& defs,
                       const std::string& prefix = "",
                       int* patchedCount = nullptr);

    // Canonical defaults for assistant_config.json
    nlohmann::json defaultAssistant();
}
