#pragma once
#include <string>
#include <nlohmann/json.hpp>

class NLP;

// Compiled-in rule set, in match order:
// set_alarm, delete_alarm, search_flights, get_weather
nlohmann::json defaultNlpRules();

// Load rules from a JSON file into `nlp`.
// - Never throws; returns true if the file's rules were loaded.
// - On any failure the built-in rules are installed instead.
bool loadNlpRules(NLP& nlp, const std::string& path);
