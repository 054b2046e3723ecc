#include "voice.hpp"
#include "logger.hpp"

#include <whisper.h>
#include <filesystem>
#include <cstring>

namespace fs = std::filesystem;

namespace Voice {

// ============================================================
// WAV decoding
// ============================================================
namespace {
    std::uint32_t readLE32(const std::uint8_t* p) {
        return static_cast<std::uint32_t>(p[0]) | (static_cast<std::uint32_t>(p[1]) << 8) |
               (static_cast<std::uint32_t>(p[2]) << 16) | (static_cast<std::uint32_t>(p[3]) << 24);
    }

    std::uint16_t readLE16(const std::uint8_t* p) {
        return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
    }
}

std::vector<float> decodeWavPcm16(const std::vector<std::uint8_t>& bytes) {
    if (bytes.size() < 12 || std::memcmp(bytes.data(), "RIFF", 4) != 0 ||
        std::memcmp(bytes.data() + 8, "WAVE", 4) != 0) {
        throw TranscriptionError("audio is not a RIFF/WAVE file");
    }

    std::uint16_t format = 0, channels = 0, bits = 0;
    std::uint32_t sampleRate = 0;
    const std::uint8_t* data = nullptr;
    std::size_t dataSize = 0;

    std::size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const std::uint8_t* chunk = bytes.data() + pos;
        std::size_t size = readLE32(chunk + 4);
        std::size_t body = pos + 8;
        if (body + size > bytes.size()) size = bytes.size() - body; // truncated tail

        if (std::memcmp(chunk, "fmt ", 4) == 0 && size >= 16) {
            format     = readLE16(bytes.data() + body);
            channels   = readLE16(bytes.data() + body + 2);
            sampleRate = readLE32(bytes.data() + body + 4);
            bits       = readLE16(bytes.data() + body + 14);
        } else if (std::memcmp(chunk, "data", 4) == 0) {
            data = bytes.data() + body;
            dataSize = size;
        }
        pos = body + size + (size & 1); // chunks are word aligned
    }

    if (format != 1 || bits != 16) throw TranscriptionError("only PCM16 WAV is supported");
    if (sampleRate != 16000)        throw TranscriptionError("expected 16 kHz audio, got " + std::to_string(sampleRate));
    if (channels != 1 && channels != 2) throw TranscriptionError("unsupported channel count");
    if (!data || dataSize < 2u * channels) throw TranscriptionError("WAV file has no samples");

    const std::size_t frames = dataSize / (2u * channels);
    std::vector<float> pcm(frames);
    for (std::size_t i = 0; i < frames; i++) {
        float sum = 0.0f;
        for (std::uint16_t c = 0; c < channels; c++) {
            auto sample = static_cast<std::int16_t>(readLE16(data + (i * channels + c) * 2));
            sum += static_cast<float>(sample) / 32768.0f;
        }
        pcm[i] = sum / channels;
    }
    return pcm;
}

// ============================================================
// WhisperTranscriber
// ============================================================
WhisperTranscriber::WhisperTranscriber(const nlohmann::json& voiceConfig)
    : modelPath_(voiceConfig.value("whisper_model", "models/ggml-base.en.bin")),
      language_(voiceConfig.value("whisper_language", "en")),
      threads_(voiceConfig.value("whisper_threads", 4)) {}

WhisperTranscriber::~WhisperTranscriber() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

bool WhisperTranscriber::ensureLoaded() {
    if (ctx_) return true;

    LOG_DEBUG("Voice", "Looking for Whisper model at: " + modelPath_);
    if (!fs::exists(modelPath_)) {
        LOG_ERROR("Voice", "Whisper model missing: " + modelPath_);
        return false;
    }

    whisper_context_params cparams = whisper_context_default_params();
    ctx_ = whisper_init_from_file_with_params(modelPath_.c_str(), cparams);
    if (!ctx_) {
        LOG_ERROR("Voice", "Failed to load Whisper model: " + modelPath_);
        return false;
    }

    LOG_PHASE("Whisper model load", true);
    return true;
}

std::string WhisperTranscriber::transcribe(const std::vector<std::uint8_t>& audio) {
    std::vector<float> pcm = decodeWavPcm16(audio);

    std::lock_guard<std::mutex> lock(mtx_);
    if (!ensureLoaded()) throw TranscriptionError("speech model unavailable");

    whisper_full_params wparams = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    wparams.no_timestamps = true;
    wparams.print_progress = false;
    wparams.language = language_.c_str();
    wparams.n_threads = threads_;

    if (whisper_full(ctx_, wparams, pcm.data(), static_cast<int>(pcm.size())) != 0) {
        throw TranscriptionError("whisper_full() failed");
    }

    std::string transcript;
    int n = whisper_full_n_segments(ctx_);
    for (int i = 0; i < n; i++) {
        transcript += whisper_full_get_segment_text(ctx_, i);
        transcript += " ";
    }

    auto start = transcript.find_first_not_of(" \t\n");
    if (start == std::string::npos) throw TranscriptionError("no speech detected");
    transcript = transcript.substr(start, transcript.find_last_not_of(" \t\n") - start + 1);

    LOG_DEBUG("Voice", "Heard: \"" + transcript + "\"");
    return transcript;
}

} // namespace Voice
