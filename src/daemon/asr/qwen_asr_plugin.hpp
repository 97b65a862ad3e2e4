#pragma once

#include "asr/http_client.hpp"
#include "asr/plugin.hpp"

#include <array>
#include <nlohmann/json.hpp>
#include <string>

// Alibaba DashScope Qwen ASR. The endpoint is fixed; a credential is mandatory.
class QwenAsrPlugin : public AsrPlugin {
public:
    static constexpr const char* NAME = "qwen-asr";
    static constexpr const char* ENDPOINT =
        "https://dashscope.aliyuncs.com/api/v1/services/aigc/multimodal-generation/generation";
    static constexpr std::array<const char*, 1> MODELS = {"qwen3-asr-flash"};

    std::string name() const override { return NAME; }
    std::string description() const override { return "Qwen ASR cloud service (DashScope)"; }

    std::expected<void, Error> validate(const PluginOptions& opts) const override;
    TranscribeResult transcribe(const AudioClip& clip, const PluginOptions& opts) const override;

    static nlohmann::json build_request(const std::vector<uint8_t>& wav_data, const PluginOptions& opts);
    static TranscribeResult parse_response(const std::string& body);

private:
    HttpClient http_;
};
