#include "intent_resolver.hpp"
#include "logger.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace {
    const char* kClassifierSystem =
        "You are an expert intent parser. Always respond with valid JSON.";

    std::string classifierPrompt(const std::string& text) {
        return
            "You are an intent parser for a voice assistant. Analyze the user's request and extract:\n"
            "1. Intent (one of: set_alarm, delete_alarm, search_flights, book_flight, get_weather, send_message, unknown)\n"
            "2. Slots (key-value pairs of entities)\n\n"
            "User request: \"" + text + "\"\n\n"
            "Respond in JSON format:\n"
            "{\n"
            "    \"intent\": \"intent_name\",\n"
            "    \"slots\": {\"key\": \"value\"},\n"
            "    \"confidence\": 0.95\n"
            "}";
    }

    Intent unknownIntent(const std::string& text) {
        Intent intent;
        intent.kind = IntentKind::Unknown;
        intent.confidence = 0.0;
        intent.sourceText = text;
        return intent;
    }
}

IntentResolver::IntentResolver(NLP rules,
                               std::shared_ptr<CompletionClient> fallback,
                               ResolverOptions options)
    : rules_(std::move(rules)), fallback_(std::move(fallback)), options_(options) {}

Intent IntentResolver::resolve(const std::string& text) const {
    try {
        auto ruled = rules_.parse(text);
        if (ruled && ruled->confidence > options_.acceptThreshold) {
            LOG_INFO("Intent", std::string("Rule-based match: ") + intentKindName(ruled->kind));
            return *ruled;
        }

        LOG_INFO("Intent", "Using generative classifier for intent parsing");
        return fallbackResolve(text);
    } catch (const std::exception& e) {
        LOG_ERROR("Intent", std::string("Intent resolution failed: ") + e.what());
        return unknownIntent(text);
    }
}

Intent IntentResolver::fallbackResolve(const std::string& text) const {
    if (!fallback_) {
        LOG_DEBUG("Intent", "No classifier configured");
        return unknownIntent(text);
    }

    CompletionOptions opts;
    opts.jsonResponse = true;
    opts.timeout = options_.fallbackTimeout;

    CompletionResult reply = completeWithTimeout(fallback_, kClassifierSystem, classifierPrompt(text),
                                                 options_.fallbackTemperature,
                                                 options_.fallbackMaxTokens, opts);
    if (!reply.success) {
        LOG_ERROR("Intent", "Classifier call failed: " + reply.error);
        return unknownIntent(text);
    }

    return parseClassifierReply(reply.text, text, options_.fallbackDefaultConfidence);
}

Intent IntentResolver::parseClassifierReply(const std::string& reply,
                                            const std::string& sourceText,
                                            double defaultConfidence) {
    auto j = nlohmann::json::parse(stripCodeFences(reply), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        LOG_ERROR("Intent", "Classifier reply was not a JSON object");
        return unknownIntent(sourceText);
    }

    Intent intent;
    intent.sourceText = sourceText;

    const auto label = j.contains("intent") && j["intent"].is_string()
                           ? j["intent"].get<std::string>()
                           : std::string("unknown");
    intent.kind = parseIntentKind(label).value_or(IntentKind::Unknown);

    if (j.contains("slots") && j["slots"].is_object()) {
        for (auto& [key, value] : j["slots"].items()) {
            if (value.is_null()) continue;
            intent.slots[key] = value.is_string() ? value.get<std::string>() : value.dump();
        }
    }

    double confidence = defaultConfidence;
    if (j.contains("confidence") && j["confidence"].is_number()) {
        confidence = j["confidence"].get<double>();
    }
    intent.confidence = std::clamp(confidence, 0.0, 1.0);

    LOG_DEBUG("Intent", "Classifier intent=" + label + " confidence=" + std::to_string(intent.confidence));
    return intent;
}
