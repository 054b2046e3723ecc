#pragma once
#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace Voice {

    // ------------------------------------------------------------
    // Text-to-speech seam: empty result on failure, never throws
    // ------------------------------------------------------------
    class TextToSpeech {
    public:
        virtual ~TextToSpeech() = default;
        virtual std::vector<std::uint8_t> synthesizeSpeech(const std::string& text) = 0;
    };

    // Runs an external synthesizer (piper style). The text goes to the
    // command's stdin and "{out}" in the command is replaced by a
    // temporary WAV path whose bytes are returned.
    // `voiceConfig` keys: tts_command, tts_output_dir
    class CommandTextToSpeech : public TextToSpeech {
    public:
        explicit CommandTextToSpeech(const nlohmann::json& voiceConfig);

        std::vector<std::uint8_t> synthesizeSpeech(const std::string& text) override;

        bool enabled() const { return !command_.empty(); }

    private:
        std::string command_;
        std::filesystem::path outputDir_;
    };
}
