#pragma once
#include <string>
#include <vector>
#include <mutex>
#include <cstdint>
#include <stdexcept>
#include <nlohmann/json.hpp>

// Forward declare
struct whisper_context;

namespace Voice {

    // Malformed or unsupported audio, or a failed decode
    class TranscriptionError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    // ------------------------------------------------------------
    // Speech-to-text seam
    // ------------------------------------------------------------
    class SpeechToText {
    public:
        virtual ~SpeechToText() = default;

        // Throws TranscriptionError
        virtual std::string transcribe(const std::vector<std::uint8_t>& audio) = 0;
    };

    // RIFF/WAVE, PCM16, 16 kHz -> float samples in [-1, 1].
    // Stereo is down-mixed. Throws TranscriptionError otherwise.
    std::vector<float> decodeWavPcm16(const std::vector<std::uint8_t>& bytes);

    // ------------------------------------------------------------
    // whisper.cpp transcriber
    // `voiceConfig` is the "voice" config section:
    //   whisper_model, whisper_language, whisper_threads
    // The model is loaded on first use.
    // ------------------------------------------------------------
    class WhisperTranscriber : public SpeechToText {
    public:
        explicit WhisperTranscriber(const nlohmann::json& voiceConfig);
        ~WhisperTranscriber() override;

        WhisperTranscriber(const WhisperTranscriber&) = delete;
        WhisperTranscriber& operator=(const WhisperTranscriber&) = delete;

        std::string transcribe(const std::vector<std::uint8_t>& audio) override;

    private:
        bool ensureLoaded();   // caller holds mtx_

        std::mutex mtx_;
        whisper_context* ctx_ = nullptr;
        std::string modelPath_;
        std::string language_;
        int threads_ = 4;
    };
}
