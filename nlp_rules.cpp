#include "nlp_rules.hpp"
#include "nlp.hpp"
#include "logger.hpp"

#include <fstream>

namespace {
    const char* kTimeExpr = R"((\d{1,2}(?::\d{2})?\s*(?:am|pm)?))";

    nlohmann::json rule(const std::string& intent,
                        const std::string& description,
                        const std::string& pattern,
                        std::vector<std::string> slots = {}) {
        return {
            {"intent", intent},
            {"description", description},
            {"pattern", pattern},
            {"slot_names", slots},
            {"confidence", 0.9},
            {"case_insensitive", true}
        };
    }
}

nlohmann::json defaultNlpRules() {
    const std::string t = kTimeExpr;
    return nlohmann::json::array({
        rule("set_alarm", "Set an alarm", "set (?:an? )?alarm (?:for|at) " + t, {"time"}),
        rule("set_alarm", "Wake-up call", "wake me (?:up )?(?:at|by) " + t, {"time"}),
        rule("set_alarm", "Timed reminder", "remind me (?:at|by) " + t, {"time"}),

        rule("delete_alarm", "Delete the latest alarm", "(?:delete|cancel|remove) (?:the )?alarm"),

        rule("search_flights", "Search flights", "(?:find|search|show|get).{0,30}flights?"),
        rule("search_flights", "Flights between cities", "flights?.{0,30}(?:from|to)"),
        rule("search_flights", "Need a flight", "(?:book|need).{0,30}(?:flight|ticket)"),

        rule("get_weather", "Weather question", "(?:what'?s|how'?s) (?:the )?weather"),
        rule("get_weather", "Weather in a place", "weather (?:in|for|at)"),
        rule("get_weather", "Temperature in a place", "temperature (?:in|for|at)")
    });
}

// ------------------------------------------------------------
// Load NLP rules from a JSON file
// ------------------------------------------------------------
bool loadNlpRules(NLP& nlp, const std::string& path) {
    auto useDefaults = [&nlp]() {
        std::string err;
        if (!nlp.load_rules(defaultNlpRules(), &err)) {
            LOG_ERROR("NLP", "Built-in rules failed to load: " + err);
        }
    };

    if (path.empty()) {
        useDefaults();
        return false;
    }

    std::ifstream in(path);
    if (!in.is_open()) {
        LOG_WARN("NLP", "Could not open NLP rules file: " + path + " (using built-in rules)");
        useDefaults();
        return false;
    }

    nlohmann::json j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        LOG_ERROR("NLP", "Failed to parse NLP rules: " + path);
        useDefaults();
        return false;
    }

    std::string err;
    if (!nlp.load_rules(j, &err)) {
        LOG_ERROR("NLP", "Failed to load NLP rules: " + err);
        useDefaults();
        return false;
    }

    LOG_INFO("NLP", "Loaded " + std::to_string(nlp.rule_count()) + " rules from " + path);
    return true;
}
