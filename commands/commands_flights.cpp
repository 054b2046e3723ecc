#include "commands_flights.hpp"
#include "commands_helpers.hpp"
#include "context.hpp"
#include "error_manager.hpp"
#include "logger.hpp"
#include "nlp.hpp"

#include <algorithm>
#include <regex>
#include <cstdio>
#include <cctype>
#include <stdexcept>

nlohmann::json FlightOption::toJson() const {
    return {
        {"airline", airline},
        {"flight_number", flightNumber},
        {"departure_time", departureTime},
        {"arrival_time", arrivalTime},
        {"duration", duration},
        {"price", price},
        {"currency", currency},
        {"direct", direct},
        {"stops", stops}
    };
}

// ------------------------------------------------------------
// Catalogue
// ------------------------------------------------------------
std::vector<FlightOption> defaultFlightCatalogue() {
    return {
        {"IndiGo",    "6E-2045", "17:25", "19:55", "2h 30m", 7200, "INR", true, 0},
        {"Air India", "AI-512",  "18:15", "20:50", "2h 35m", 8500, "INR", true, 0},
        {"SpiceJet",  "SG-134",  "19:00", "21:35", "2h 35m", 6800, "INR", true, 0}
    };
}

std::map<std::string, std::string> defaultAirportCodes() {
    return {
        {"delhi", "DEL"},
        {"bangalore", "BLR"},
        {"bengaluru", "BLR"},
        {"mumbai", "BOM"},
        {"chennai", "MAA"},
        {"kolkata", "CCU"},
        {"hyderabad", "HYD"},
        {"pune", "PNQ"},
        {"goa", "GOI"},
        {"jaipur", "JAI"},
        {"new york", "JFK"},
        {"london", "LHR"},
        {"dubai", "DXB"},
        {"singapore", "SIN"}
    };
}

CatalogueFlightSearch::CatalogueFlightSearch(std::vector<FlightOption> catalogue)
    : catalogue_(std::move(catalogue)) {}

std::vector<FlightOption> CatalogueFlightSearch::search(const FlightQuery& query) {
    LOG_DEBUG("Flights", "Catalogue search " + query.sourceCode + " -> " +
                         query.destinationCode + " on " + query.date);
    return catalogue_;
}

// ------------------------------------------------------------
// Date and time-window helpers
// ------------------------------------------------------------
namespace {
    bool isLeap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

    int daysInMonth(int y, int m) {
        static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        return (m == 2 && isLeap(y)) ? 29 : days[m - 1];
    }

    std::optional<std::string> formatDate(int y, int m, int d) {
        if (m < 1 || m > 12 || d < 1 || d > daysInMonth(y, m)) return std::nullopt;
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", y, m, d);
        return std::string(buf);
    }
}

std::optional<std::string> normalizeTravelDate(const std::string& text) {
    static const std::regex isoRe(R"(^(\d{4})-(\d{2})-(\d{2})$)");
    static const std::regex dayMonthRe(R"(^(\d{1,2})(?:st|nd|rd|th)?\s+([a-z]{3})[a-z]*,?\s+(\d{4})$)");
    static const std::regex monthDayRe(R"(^([a-z]{3})[a-z]*\s+(\d{1,2})(?:st|nd|rd|th)?,?\s+(\d{4})$)");
    static const std::map<std::string, int> months = {
        {"jan", 1}, {"feb", 2}, {"mar", 3}, {"apr", 4}, {"may", 5}, {"jun", 6},
        {"jul", 7}, {"aug", 8}, {"sep", 9}, {"oct", 10}, {"nov", 11}, {"dec", 12}
    };

    std::string s = toLowerAscii(trimCopy(text));
    std::smatch m;

    if (std::regex_match(s, m, isoRe)) {
        return formatDate(std::stoi(m[1].str()), std::stoi(m[2].str()), std::stoi(m[3].str()));
    }
    if (std::regex_match(s, m, dayMonthRe)) {
        auto it = months.find(m[2].str());
        if (it == months.end()) return std::nullopt;
        return formatDate(std::stoi(m[3].str()), it->second, std::stoi(m[1].str()));
    }
    if (std::regex_match(s, m, monthDayRe)) {
        auto it = months.find(m[1].str());
        if (it == months.end()) return std::nullopt;
        return formatDate(std::stoi(m[3].str()), it->second, std::stoi(m[2].str()));
    }
    return std::nullopt;
}

bool departsInWindow(const std::string& departureTime, const std::string& window) {
    int hour = 0;
    if (std::sscanf(departureTime.c_str(), "%d", &hour) != 1) return false;

    const std::string w = toLowerAscii(window);
    if (w == "morning")   return hour >= 6 && hour < 12;
    if (w == "afternoon") return hour >= 12 && hour < 16;
    if (w == "evening")   return hour >= 16 && hour < 22;
    if (w == "night")     return hour >= 22 || hour < 6;
    return true; // unknown window: no filtering
}

// ------------------------------------------------------------
// FlightsService
// ------------------------------------------------------------
FlightsService::FlightsService(std::shared_ptr<FlightSearch> search,
                               std::map<std::string, std::string> airportCodes)
    : search_(std::move(search)), airportCodes_(std::move(airportCodes)) {
    if (!search_) throw std::invalid_argument("FlightsService requires a flight search backend");
}

std::string FlightsService::airportCode(const std::string& city) const {
    std::string key = toLowerAscii(trimCopy(city));
    auto it = airportCodes_.find(key);
    if (it != airportCodes_.end()) return it->second;

    std::string code = trimCopy(city).substr(0, 3);
    std::transform(code.begin(), code.end(), code.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return code;
}

ActionResult FlightsService::searchFlights(const std::string& source,
                                           const std::string& destination,
                                           const std::string& date,
                                           const std::string& timeWindow,
                                           const nlohmann::json& preferences) {
    auto parsedDate = normalizeTravelDate(date);
    if (!parsedDate) {
        ActionResult result = ErrorManager::report("ERR_FLIGHT_BAD_DATE");
        result.data["date"] = date;
        return result;
    }

    FlightQuery query{airportCode(source), airportCode(destination), *parsedDate};

    std::vector<FlightOption> flights;
    try {
        flights = search_->search(query);
    } catch (const std::exception& e) {
        ActionResult result = ErrorManager::report("ERR_FLIGHT_SEARCH_FAILED");
        result.data["error"] = e.what();
        return result;
    }

    // 🔹 Time window, then preferences
    if (!timeWindow.empty()) {
        flights.erase(std::remove_if(flights.begin(), flights.end(),
                          [&](const FlightOption& f) { return !departsInWindow(f.departureTime, timeWindow); }),
                      flights.end());
    }

    const nlohmann::json prefs = preferences.is_object() ? preferences : nlohmann::json::object();

    if (prefs.contains("airline_pref") && prefs["airline_pref"].is_string() &&
        !prefs["airline_pref"].get<std::string>().empty()) {
        const auto airline = prefs["airline_pref"].get<std::string>();
        flights.erase(std::remove_if(flights.begin(), flights.end(),
                          [&](const FlightOption& f) { return f.airline != airline; }),
                      flights.end());
    }

    if (prefs.contains("max_price") && prefs["max_price"].is_number() &&
        prefs["max_price"].get<double>() > 0) {
        const double maxPrice = prefs["max_price"].get<double>();
        flights.erase(std::remove_if(flights.begin(), flights.end(),
                          [&](const FlightOption& f) { return f.price > maxPrice; }),
                      flights.end());
    }

    if (prefs.value("flight_type", nlohmann::json("any")) == "direct") {
        flights.erase(std::remove_if(flights.begin(), flights.end(),
                          [](const FlightOption& f) { return !f.direct; }),
                      flights.end());
    }

    std::stable_sort(flights.begin(), flights.end(),
                     [](const FlightOption& a, const FlightOption& b) { return a.price < b.price; });
    if (flights.size() > kMaxResults) flights.resize(kMaxResults);

    nlohmann::json list = nlohmann::json::array();
    for (const auto& f : flights) list.push_back(f.toJson());

    LOG_INFO("Flights", std::to_string(flights.size()) + " flights " + query.sourceCode + " -> " +
                        query.destinationCode + " on " + *parsedDate);

    ActionResult result;
    result.status = ActionStatus::Success;
    result.message = "Found " + std::to_string(flights.size()) + " flights";
    result.data = {
        {"flights", list},
        {"count", flights.size()},
        {"source", source},
        {"destination", destination},
        {"date", *parsedDate}
    };
    if (!timeWindow.empty()) result.data["time_window"] = timeWindow;
    return result;
}

// ------------------------------------------------------------
// Handler
// ------------------------------------------------------------
ActionResult handleSearchFlights(FlightsService& flights, const Intent& intent, const UserContext& context) {
    if (auto missing = checkRequiredSlots(intent, {
            {"source", "source city"},
            {"destination", "destination city"},
            {"date", "travel date"}})) {
        return *missing;
    }

    return flights.searchFlights(getSlot(intent, "source"),
                                 getSlot(intent, "destination"),
                                 getSlot(intent, "date"),
                                 getSlot(intent, "time_window"),
                                 context.intentSpecific);
}
