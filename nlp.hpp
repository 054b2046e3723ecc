#pragma once
#include <string>
#include <vector>
#include <set>
#include <regex>
#include <optional>
#include <nlohmann/json.hpp>
#include "intent.hpp"

// ------------------------------------------------------------
// NLP: ordered regex rule tier of the intent resolver
// ------------------------------------------------------------
class NLP {
public:
    struct Rule {
        IntentKind intent = IntentKind::Unknown;
        std::string description;      // human-readable ("Set an alarm")
        std::string pattern_str;      // raw regex string
        std::regex pattern;           // compiled regex
        double confidence = 0.9;      // reported when this rule wins
        bool case_insensitive = true; // regex flag

        std::vector<std::string> slot_names; // slot names for regex groups
    };

    // First matching rule wins (search, not full match). `text` is the
    // user's original input; matching runs on its lower-cased form and
    // captures are cut from the original so "7 AM" keeps its case.
    std::optional<Intent> parse(const std::string& text) const;

    // Replace rules from a JSON array. Invalid regexes are skipped and
    // logged; returns false when nothing usable was loaded.
    bool load_rules(const nlohmann::json& rulesJson, std::string* err = nullptr);
    bool load_rules_from_string(const std::string& rulesText, std::string* err = nullptr);

    // City names recognised as flight source / destination (lower-case)
    void setKnownCities(std::set<std::string> cities);

    size_t rule_count() const { return rules.size(); }

private:
    void extractFlightSlots(const std::string& lowered, Intent& intent) const;
    std::optional<std::string> knownCity(const std::string& candidate) const;

    std::vector<Rule> rules;
    std::set<std::string> knownCities;
};

// Lower-case ASCII copy; byte length is preserved
std::string toLowerAscii(const std::string& s);

// Trim surrounding whitespace
std::string trimCopy(const std::string& s);
