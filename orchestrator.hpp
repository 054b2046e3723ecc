#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

#include "intent_resolver.hpp"
#include "context.hpp"
#include "response_manager.hpp"
#include "commands/commands_core.hpp"
#include "voice/voice.hpp"
#include "voice/voice_speak.hpp"

struct ConversationRequest {
    std::string userId;
    std::optional<std::string> text;                 // wins over audio
    std::optional<std::vector<std::uint8_t>> audio;  // 16 kHz mono PCM16 WAV
};

struct ConversationResponse {
    bool success = false;
    std::string textResponse;
    std::vector<std::uint8_t> audioResponse;   // empty when TTS failed
    std::string intentKind;                    // wire name, or "error"
    double confidence = 0.0;
    nlohmann::json data = nlohmann::json::object();

    // audio is base64-encoded under "audio_response" (null when empty)
    nlohmann::json toJson() const;
};

std::string base64Encode(const std::vector<std::uint8_t>& bytes);

// ------------------------------------------------------------
// Orchestrator
// text/audio -> intent -> context -> action -> reply -> speech
// ------------------------------------------------------------
class Orchestrator {
public:
    // `stt` and `tts` may be null (text-only deployments).
    Orchestrator(std::shared_ptr<IntentResolver> resolver,
                 std::shared_ptr<ContextProvider> context,
                 std::shared_ptr<CommandRouter> router,
                 std::shared_ptr<ResponseSynthesizer> synthesizer,
                 std::shared_ptr<Voice::SpeechToText> stt = nullptr,
                 std::shared_ptr<Voice::TextToSpeech> tts = nullptr);

    // Never throws. Stage failures degrade to an apology with
    // success=false and intentKind "error".
    ConversationResponse processConversation(const ConversationRequest& request);

private:
    std::string textInput(const ConversationRequest& request);
    std::vector<std::uint8_t> speak(const std::string& text);

    std::shared_ptr<IntentResolver> resolver_;
    std::shared_ptr<ContextProvider> context_;
    std::shared_ptr<CommandRouter> router_;
    std::shared_ptr<ResponseSynthesizer> synthesizer_;
    std::shared_ptr<Voice::SpeechToText> stt_;
    std::shared_ptr<Voice::TextToSpeech> tts_;
};
