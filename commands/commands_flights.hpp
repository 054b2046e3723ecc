#pragma once
#include <string>
#include <vector>
#include <map>
#include <memory>
#include <optional>
#include <nlohmann/json.hpp>

#include "commands_core.hpp"

// ------------------------------------------------------------
// Flight data
// ------------------------------------------------------------
struct FlightOption {
    std::string airline;
    std::string flightNumber;
    std::string departureTime;   // "HH:MM" local to the departure airport
    std::string arrivalTime;
    std::string duration;        // "2h 30m"
    int price = 0;
    std::string currency = "INR";
    bool direct = true;
    int stops = 0;

    nlohmann::json toJson() const;
};

struct FlightQuery {
    std::string sourceCode;        // IATA
    std::string destinationCode;   // IATA
    std::string date;              // YYYY-MM-DD
};

// Offer source (external fare API in a full deployment)
class FlightSearch {
public:
    virtual ~FlightSearch() = default;
    virtual std::vector<FlightOption> search(const FlightQuery& query) = 0;
};

// Fixed catalogue served for every route and date
class CatalogueFlightSearch : public FlightSearch {
public:
    explicit CatalogueFlightSearch(std::vector<FlightOption> catalogue);
    std::vector<FlightOption> search(const FlightQuery& query) override;

private:
    std::vector<FlightOption> catalogue_;
};

std::vector<FlightOption> defaultFlightCatalogue();

// city (lower-case) -> IATA code
std::map<std::string, std::string> defaultAirportCodes();

// "25 Dec 2025", "25th december 2025", "2025-12-25" -> "2025-12-25"
std::optional<std::string> normalizeTravelDate(const std::string& text);

// morning [6,12) afternoon [12,16) evening [16,22) night [22,6)
bool departsInWindow(const std::string& departureTime, const std::string& window);

// ------------------------------------------------------------
// FlightsService
// ------------------------------------------------------------
class FlightsService {
public:
    static constexpr std::size_t kMaxResults = 5;

    FlightsService(std::shared_ptr<FlightSearch> search,
                   std::map<std::string, std::string> airportCodes = defaultAirportCodes());

    // Known city -> its code; otherwise the first three letters upper-cased
    std::string airportCode(const std::string& city) const;

    // Filters by time window and preferences (airline_pref, max_price,
    // flight_type == "direct"), cheapest first, at most kMaxResults.
    ActionResult searchFlights(const std::string& source,
                               const std::string& destination,
                               const std::string& date,
                               const std::string& timeWindow,
                               const nlohmann::json& preferences);

private:
    std::shared_ptr<FlightSearch> search_;
    std::map<std::string, std::string> airportCodes_;
};

ActionResult handleSearchFlights(FlightsService& flights, const Intent& intent, const UserContext& context);
