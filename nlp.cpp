#include "nlp.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cctype>

// ------------------------------------------------------------
// String helpers
// ------------------------------------------------------------
std::string toLowerAscii(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string trimCopy(const std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    auto end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

// ------------------------------------------------------------
// Parse text against loaded NLP rules
// ------------------------------------------------------------
std::optional<Intent> NLP::parse(const std::string& text) const {
    const std::string original = trimCopy(text);
    const std::string lowered  = toLowerAscii(original);

    for (const auto& rule : rules) {
        std::smatch match;
        if (!std::regex_search(lowered, match, rule.pattern)) continue;

        Intent intent;
        intent.kind       = rule.intent;
        intent.confidence = rule.confidence;
        intent.sourceText = text;

        // Map regex captures to slots, cut from the original-case text
        for (size_t i = 1; i < match.size() && i <= rule.slot_names.size(); i++) {
            if (!match[i].matched) continue;
            auto pos = static_cast<size_t>(match.position(i));
            auto len = static_cast<size_t>(match.length(i));
            std::string value = trimCopy(original.substr(pos, len));
            if (!value.empty()) intent.slots[rule.slot_names[i - 1]] = value;
        }

        if (intent.kind == IntentKind::SearchFlights) {
            extractFlightSlots(lowered, intent);
        }

        LOG_DEBUG("NLP", std::string("Rule matched: ") + intentKindName(intent.kind) +
                         " (" + rule.description + ")");
        return intent;
    }

    // No rule matched
    return std::nullopt;
}

// ------------------------------------------------------------
// Flight slots: source, destination, date, time window
// ------------------------------------------------------------
std::optional<std::string> NLP::knownCity(const std::string& candidate) const {
    std::string city = trimCopy(candidate);
    if (city.empty()) return std::nullopt;

    // Longest known prefix wins so "new york tomorrow" still finds "new york"
    std::optional<std::string> best;
    for (const auto& known : knownCities) {
        if (city.compare(0, known.size(), known) != 0) continue;
        bool boundary = city.size() == known.size() || city[known.size()] == ' ';
        if (boundary && (!best || known.size() > best->size())) best = known;
    }
    return best;
}

void NLP::extractFlightSlots(const std::string& lowered, Intent& intent) const {
    static const std::regex fromRe(R"(\bfrom\s+([a-z\s]+?)(?=\s+to\b|\s+for\b|\s+on\b|$))");
    static const std::regex toRe(R"(\bto\s+([a-z\s]+?)(?=\s+on\b|\s+for\b|\s+from\b|\s+to\b|$))");
    static const std::regex dateRe(
        R"((\d{1,2}(?:st|nd|rd|th)?\s+(?:jan|feb|mar|apr|may|jun|jul|aug|sep|oct|nov|dec)[a-z]*\s+\d{4}))");
    static const std::regex isoDateRe(R"((\d{4}-\d{2}-\d{2}))");

    // "i want to fly to goa": keep scanning until a known city follows
    auto firstCity = [this, &lowered](const std::regex& re) -> std::optional<std::string> {
        for (std::sregex_iterator it(lowered.begin(), lowered.end(), re), end; it != end; ++it) {
            if (auto city = knownCity((*it)[1].str())) return city;
        }
        return std::nullopt;
    };

    if (auto city = firstCity(fromRe)) intent.slots["source"] = *city;
    if (auto city = firstCity(toRe)) intent.slots["destination"] = *city;

    std::smatch m;
    if (std::regex_search(lowered, m, dateRe)) {
        intent.slots["date"] = m[1].str();
    } else if (std::regex_search(lowered, m, isoDateRe)) {
        intent.slots["date"] = m[1].str();
    }

    // Day-part: first in priority order wins, the rest are reported
    static const char* dayParts[] = {"morning", "afternoon", "evening", "night"};
    std::vector<std::string> found;
    for (const char* part : dayParts) {
        if (lowered.find(part) != std::string::npos) found.emplace_back(part);
    }
    if (!found.empty()) {
        intent.slots["time_window"] = found.front();
    }
    if (found.size() > 1) {
        std::string all;
        for (const auto& f : found) {
            if (!all.empty()) all += ",";
            all += f;
        }
        intent.slots["time_window_ambiguous"] = all;
        LOG_DEBUG("NLP", "Ambiguous time window: " + all);
    }
}

void NLP::setKnownCities(std::set<std::string> cities) {
    knownCities.clear();
    for (const auto& c : cities) knownCities.insert(toLowerAscii(trimCopy(c)));
}

// ------------------------------------------------------------
// Load rules from JSON
// ------------------------------------------------------------
bool NLP::load_rules(const nlohmann::json& rulesJson, std::string* err) {
    if (!rulesJson.is_array()) {
        if (err) *err = "Invalid NLP rules JSON (expected array)";
        return false;
    }

    std::vector<Rule> loaded;
    for (const auto& r : rulesJson) {
        if (!r.is_object()) continue;

        Rule rule;
        std::string label = r.value("intent", "");
        auto kind = parseIntentKind(label);
        if (!kind || *kind == IntentKind::Unknown) {
            LOG_WARN("NLP", "Skipping rule with unknown intent: " + label);
            continue;
        }
        rule.intent           = *kind;
        rule.description      = r.value("description", "");
        rule.pattern_str      = r.value("pattern", "");
        rule.slot_names       = r.value("slot_names", std::vector<std::string>{});
        rule.confidence       = std::clamp(r.value("confidence", 0.9), 0.0, 1.0);
        rule.case_insensitive = r.value("case_insensitive", true);

        try {
            std::regex::flag_type flags = std::regex::ECMAScript;
            if (rule.case_insensitive) {
                flags |= std::regex::icase;
            }
            rule.pattern = std::regex(rule.pattern_str, flags);
        } catch (const std::regex_error& e) {
            LOG_ERROR("NLP", "Invalid regex for intent " + label + ": " + e.what());
            continue;
        }

        loaded.push_back(std::move(rule));
    }

    if (loaded.empty()) {
        if (err) *err = "no usable rules";
        return false;
    }

    rules = std::move(loaded);
    LOG_INFO("NLP", "Loaded " + std::to_string(rules.size()) + " rules");
    return true;
}

bool NLP::load_rules_from_string(const std::string& rulesText, std::string* err) {
    auto j = nlohmann::json::parse(rulesText, nullptr, false);
    if (j.is_discarded()) {
        if (err) *err = "rules text is not valid JSON";
        return false;
    }
    return load_rules(j, err);
}
