#pragma once

#include "asr/http_client.hpp"
#include "asr/plugin.hpp"

#include <string>

// Self-hosted Whisper-style transcription service reached over HTTP.
class WhisperHttpPlugin : public AsrPlugin {
public:
    static constexpr const char* NAME = "faster-whisper";

    // api_format: "openai" (/v1/audio/transcriptions) or "whisper.cpp" (/inference)
    explicit WhisperHttpPlugin(std::string api_format = "openai");

    std::string name() const override { return NAME; }
    std::string description() const override;

    std::expected<void, Error> validate(const PluginOptions& opts) const override;
    TranscribeResult transcribe(const AudioClip& clip, const PluginOptions& opts) const override;

    // Accepts {"text": ...}, {"segments": [...]}, {"error": ...} or plain text lines.
    static TranscribeResult parse_response(const std::string& body);

    std::vector<FormField> build_form(const std::vector<uint8_t>& wav_data,
                                      const PluginOptions& opts) const;

private:
    std::string api_format_;
    HttpClient http_;
};
