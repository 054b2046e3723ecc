#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <nlohmann/json.hpp>

#include "intent.hpp"
#include "ai.hpp"
#include "commands/commands_core.hpp"

struct UserContext;

struct SynthesizerOptions {
    double temperature = 0.7;
    int maxTokens = 150;
    std::chrono::milliseconds timeout{10000};
};

// ------------------------------------------------------------
// ResponseSynthesizer: ActionResult -> reply text
//   Error / MissingSlots      message passed through
//   SetAlarm / DeleteAlarm    canned message
//   SearchFlights (>= 1)      generative phrasing, template on failure
//   anything else             generic acknowledgement
// ------------------------------------------------------------
class ResponseSynthesizer {
public:
    // `generator` may be null; flight replies then use the template.
    explicit ResponseSynthesizer(std::shared_ptr<CompletionClient> generator,
                                 SynthesizerOptions options = {});

    // Never throws.
    std::string synthesize(const Intent& intent,
                           const ActionResult& result,
                           const UserContext& context) const;

    // "I found 3 flights. The best option is SpiceJet at 19:00 for ₹6,800, 2h 35m duration."
    static std::string flightTemplate(const nlohmann::json& flights);

private:
    std::string flightResponse(const ActionResult& result) const;

    std::shared_ptr<CompletionClient> generator_;
    SynthesizerOptions options_;
};

// 7200 -> "7,200"
std::string formatThousands(long long value);
