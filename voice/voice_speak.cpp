#include "voice_speak.hpp"
#include "logger.hpp"

#include <cstdio>
#include <fstream>
#include <iterator>
#include <random>
#include <system_error>

#ifdef _WIN32
    #define popen _popen
    #define pclose _pclose
#endif

namespace fs = std::filesystem;

namespace Voice {

    // =========================================================
    // Helpers
    // =========================================================
    static std::string randomString(size_t length) {
        static const char charset[] =
            "0123456789"
            "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
            "abcdefghijklmnopqrstuvwxyz";
        static thread_local std::mt19937 rg{std::random_device{}()};
        static thread_local std::uniform_int_distribution<size_t> dist(0, sizeof(charset) - 2);

        std::string result;
        result.reserve(length);
        for (size_t i = 0; i < length; i++) {
            result.push_back(charset[dist(rg)]);
        }
        return result;
    }

    static std::string replaceAll(std::string s, const std::string& from, const std::string& to) {
        for (auto pos = s.find(from); pos != std::string::npos; pos = s.find(from, pos + to.size())) {
            s.replace(pos, from.size(), to);
        }
        return s;
    }

    // =========================================================
    // CommandTextToSpeech
    // =========================================================
    CommandTextToSpeech::CommandTextToSpeech(const nlohmann::json& voiceConfig)
        : command_(voiceConfig.value("tts_command", "")),
          outputDir_(voiceConfig.value("tts_output_dir", "tts_out")) {}

    std::vector<std::uint8_t> CommandTextToSpeech::synthesizeSpeech(const std::string& text) {
        if (command_.empty() || text.empty()) return {};

        std::error_code ec;
        fs::create_directories(outputDir_, ec);
        if (ec) {
            LOG_ERROR("Voice/TTS", "Cannot create " + outputDir_.string() + ": " + ec.message());
            return {};
        }

        const fs::path outFile = outputDir_ / (randomString(32) + ".wav");
        const std::string cmd = replaceAll(command_, "{out}", "\"" + outFile.string() + "\"");
        LOG_DEBUG("Voice/TTS", "Running: " + cmd);

        FILE* pipe = popen(cmd.c_str(), "w");
        if (!pipe) {
            LOG_ERROR("Voice/TTS", "Could not start TTS command");
            return {};
        }
        std::fwrite(text.c_str(), 1, text.size(), pipe);
        int status = pclose(pipe);
        if (status != 0) {
            LOG_ERROR("Voice/TTS", "TTS command exited with status " + std::to_string(status));
            fs::remove(outFile, ec);
            return {};
        }

        std::ifstream in(outFile, std::ios::binary);
        if (!in) {
            LOG_ERROR("Voice/TTS", "TTS produced no file: " + outFile.string());
            return {};
        }
        std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        in.close();
        fs::remove(outFile, ec);

        LOG_DEBUG("Voice/TTS", "Synthesized " + std::to_string(bytes.size()) + " bytes");
        return bytes;
    }
}
