#include "orchestrator.hpp"
#include "error_manager.hpp"
#include "logger.hpp"

#include <stdexcept>

// ------------------------------------------------------------
// ConversationResponse
// ------------------------------------------------------------
std::string base64Encode(const std::vector<std::uint8_t>& bytes) {
    static const char table[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
    std::string out;
    out.reserve((bytes.size() + 2) / 3 * 4);

    std::size_t i = 0;
    for (; i + 2 < bytes.size(); i += 3) {
        std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8) | bytes[i + 2];
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += table[n & 63];
    }
    if (i + 1 == bytes.size()) {
        std::uint32_t n = bytes[i] << 16;
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += "==";
    } else if (i + 2 == bytes.size()) {
        std::uint32_t n = (bytes[i] << 16) | (bytes[i + 1] << 8);
        out += table[(n >> 18) & 63];
        out += table[(n >> 12) & 63];
        out += table[(n >> 6) & 63];
        out += '=';
    }
    return out;
}

nlohmann::json ConversationResponse::toJson() const {
    return {
        {"success", success},
        {"text_response", textResponse},
        {"audio_response", audioResponse.empty() ? nlohmann::json(nullptr)
                                                 : nlohmann::json(base64Encode(audioResponse))},
        {"intent", intentKind},
        {"confidence", confidence},
        {"data", data}
    };
}

// ------------------------------------------------------------
// Orchestrator
// ------------------------------------------------------------
Orchestrator::Orchestrator(std::shared_ptr<IntentResolver> resolver,
                           std::shared_ptr<ContextProvider> context,
                           std::shared_ptr<CommandRouter> router,
                           std::shared_ptr<ResponseSynthesizer> synthesizer,
                           std::shared_ptr<Voice::SpeechToText> stt,
                           std::shared_ptr<Voice::TextToSpeech> tts)
    : resolver_(std::move(resolver)),
      context_(std::move(context)),
      router_(std::move(router)),
      synthesizer_(std::move(synthesizer)),
      stt_(std::move(stt)),
      tts_(std::move(tts)) {
    if (!resolver_ || !context_ || !router_ || !synthesizer_) {
        throw std::invalid_argument("Orchestrator requires resolver, context, router and synthesizer");
    }
}

std::string Orchestrator::textInput(const ConversationRequest& request) {
    if (request.text && !request.text->empty()) return *request.text;

    if (request.audio && !request.audio->empty()) {
        if (!stt_) throw std::runtime_error("audio input received but no speech-to-text is configured");
        return stt_->transcribe(*request.audio);
    }

    throw std::invalid_argument("Either 'text' or 'audio' must be provided");
}

std::vector<std::uint8_t> Orchestrator::speak(const std::string& text) {
    if (!tts_) return {};
    try {
        return tts_->synthesizeSpeech(text);
    } catch (const std::exception& e) {
        LOG_ERROR("Orchestrator", std::string("TTS failed: ") + e.what());
        return {};
    }
}

ConversationResponse Orchestrator::processConversation(const ConversationRequest& request) {
    ConversationResponse response;

    try {
        // 1. Input text
        const std::string text = textInput(request);
        LOG_INFO("Orchestrator", "User input [" + request.userId + "]: " + text);

        // 2. Intent
        const Intent intent = resolver_->resolve(text);
        LOG_INFO("Orchestrator", std::string("Detected intent: ") + intentKindName(intent.kind) +
                                 " (confidence: " + std::to_string(intent.confidence) + ")");

        // 3. Context
        const UserContext context = context_->getUserContext(request.userId, intent.kind);

        // 4. Action
        const ActionResult result = router_->route(intent, request.userId, context);
        LOG_INFO("Orchestrator", std::string("Action executed: ") + actionStatusName(result.status));

        // 5. Reply
        const std::string reply = synthesizer_->synthesize(intent, result, context);
        LOG_INFO("Orchestrator", "Response: " + reply);

        // 6. History; a storage failure is logged by the provider, not surfaced
        ConversationTurn turn;
        turn.userId = request.userId;
        turn.text = text;
        turn.intentKind = intentKindName(intent.kind);
        turn.response = reply;
        turn.timestamp = systemNow();
        context_->storeTurn(turn);

        // 7. Speech
        response.success = true;
        response.textResponse = reply;
        response.audioResponse = speak(reply);
        response.intentKind = intentKindName(intent.kind);
        response.confidence = intent.confidence;
        response.data = result.toJson();
        return response;
    } catch (const Voice::TranscriptionError& e) {
        LOG_ERROR("Orchestrator", std::string("Transcription failed: ") + e.what());
        response.data = {{"error", e.what()}, {"error_code", "ERR_STT_FAILED"}};
    } catch (const std::exception& e) {
        LOG_ERROR("Orchestrator", std::string("Orchestrator error: ") + e.what());
        response.data = {{"error", e.what()}};
    }

    const std::string apology = ErrorManager::getUserMessage("ERR_PIPELINE_FAILURE");
    response.success = false;
    response.textResponse = apology;
    response.audioResponse = speak(apology);
    response.intentKind = "error";
    response.confidence = 0.0;
    return response;
}
