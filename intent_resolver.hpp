#pragma once
#include <string>
#include <memory>
#include <chrono>

#include "intent.hpp"
#include "nlp.hpp"
#include "ai.hpp"

struct ResolverOptions {
    double acceptThreshold = 0.8;                     // rule hits must exceed this
    double fallbackTemperature = 0.3;
    int fallbackMaxTokens = 200;
    double fallbackDefaultConfidence = 0.7;           // when the reply omits it
    std::chrono::milliseconds fallbackTimeout{10000};
};

// ------------------------------------------------------------
// IntentResolver: regex rule tier, then a generative classifier
// ------------------------------------------------------------
class IntentResolver {
public:
    // `fallback` may be null; unmatched text then resolves to Unknown/0.0.
    IntentResolver(NLP rules,
                   std::shared_ptr<CompletionClient> fallback,
                   ResolverOptions options = {});

    // Never throws.
    Intent resolve(const std::string& text) const;

    // Interpret a classifier reply ({intent, slots, confidence}).
    // Malformed replies give Unknown with confidence 0.0.
    static Intent parseClassifierReply(const std::string& reply,
                                       const std::string& sourceText,
                                       double defaultConfidence);

private:
    Intent fallbackResolve(const std::string& text) const;

    NLP rules_;
    std::shared_ptr<CompletionClient> fallback_;
    ResolverOptions options_;
};
