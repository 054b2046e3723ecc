#include "response_manager.hpp"
#include "context.hpp"
#include "logger.hpp"
#include "nlp.hpp"

namespace {
    const char* kGenericAck    = "I've processed your request.";
    const char* kFallbackAck   = "I've completed that task for you.";
    const char* kGeneratorRole = "You are Jarvis, a helpful and concise AI assistant.";

    std::string formatFlightsForPrompt(const nlohmann::json& flights) {
        std::string lines;
        int index = 1;
        for (const auto& f : flights) {
            if (index > 3) break;
            bool direct = f.value("direct", true);
            std::string stops = direct ? "non-stop" : std::to_string(f.value("stops", 0)) + " stop(s)";
            lines += std::to_string(index++) + ". " +
                     f.value("airline", "") + " " + f.value("flight_number", "") +
                     ": Departs " + f.value("departure_time", "") +
                     ", arrives " + f.value("arrival_time", "") +
                     ", ₹" + formatThousands(f.value("price", 0LL)) +
                     ", " + f.value("duration", "") +
                     ", " + stops + "\n";
        }
        return lines;
    }
}

std::string formatThousands(long long value) {
    std::string digits = std::to_string(value < 0 ? -value : value);
    std::string out;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) out.insert(out.begin(), ',');
        out.insert(out.begin(), *it);
        ++count;
    }
    return value < 0 ? "-" + out : out;
}

ResponseSynthesizer::ResponseSynthesizer(std::shared_ptr<CompletionClient> generator,
                                         SynthesizerOptions options)
    : generator_(std::move(generator)), options_(options) {}

std::string ResponseSynthesizer::synthesize(const Intent& intent,
                                            const ActionResult& result,
                                            const UserContext& /*context*/) const {
    try {
        switch (result.status) {
            case ActionStatus::Error:
                return result.message.empty() ? "I encountered an error. Please try again." : result.message;
            case ActionStatus::MissingSlots:
                return result.message.empty() ? "I need more information." : result.message;
            case ActionStatus::Success:
            case ActionStatus::NotFound:
            case ActionStatus::Unimplemented:
                break;
        }

        switch (intent.kind) {
            case IntentKind::SetAlarm:
                if (result.ok()) return result.message.empty() ? "Your alarm has been set." : result.message;
                return "I couldn't set the alarm. Please try again.";
            case IntentKind::DeleteAlarm:
                return result.message.empty() ? "Alarm deleted." : result.message;
            case IntentKind::SearchFlights:
                if (result.ok()) return flightResponse(result);
                return kGenericAck;
            case IntentKind::BookFlight:
            case IntentKind::GetWeather:
            case IntentKind::SendMessage:
            case IntentKind::Unknown:
                break;
        }
        return kGenericAck;
    } catch (const std::exception& e) {
        LOG_ERROR("Response", std::string("Response building error: ") + e.what());
        return kFallbackAck;
    }
}

std::string ResponseSynthesizer::flightTemplate(const nlohmann::json& flights) {
    const auto& best = flights.at(0);
    return "I found " + std::to_string(flights.size()) + " flights. The best option is " +
           best.value("airline", "") + " at " + best.value("departure_time", "") +
           " for ₹" + formatThousands(best.value("price", 0LL)) + ", " +
           best.value("duration", "") + " duration.";
}

std::string ResponseSynthesizer::flightResponse(const ActionResult& result) const {
    const nlohmann::json flights = result.data.value("flights", nlohmann::json::array());
    const std::string source      = result.data.value("source", "");
    const std::string destination = result.data.value("destination", "");
    const std::string date        = result.data.value("date", "");

    if (!flights.is_array() || flights.empty()) {
        return "I couldn't find any flights from " + source + " to " + destination + " on " + date + ".";
    }

    if (generator_) {
        std::string prompt =
            "You are Jarvis, an AI assistant. Present these flight options in a natural, conversational way.\n\n"
            "Flight search: " + source + " to " + destination + " on " + date + "\n\n"
            "Available flights:\n" + formatFlightsForPrompt(flights) + "\n"
            "Create a brief, helpful response (2-3 sentences) highlighting the best option.";

        CompletionOptions opts;
        opts.timeout = options_.timeout;

        CompletionResult reply = completeWithTimeout(generator_, kGeneratorRole, prompt,
                                                     options_.temperature, options_.maxTokens, opts);
        std::string text = trimCopy(reply.text);
        if (reply.success && !text.empty()) return text;

        LOG_WARN("Response", "Generative flight reply failed (" + reply.error + "), using template");
    }

    return flightTemplate(flights);
}
