#include "asr/qwen_asr_plugin.hpp"

#include "base64.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <format>

using json = nlohmann::json;

std::expected<void, Error> QwenAsrPlugin::validate(const PluginOptions& opts) const {
    if (opts.api_key.empty()) {
        return make_error(ErrorKind::Configuration, std::string(NAME) + ": api_key is required");
    }
    bool known = std::ranges::any_of(MODELS, [&opts](const char* m) { return opts.model == m; });
    if (!known) {
        std::string allowed;
        for (const char* m : MODELS) {
            if (!allowed.empty()) allowed += ", ";
            allowed += m;
        }
        return make_error(ErrorKind::Configuration,
                          std::format("{}: unknown model '{}' (available: {})", NAME, opts.model, allowed));
    }
    if (opts.timeout_s <= 0) {
        return make_error(ErrorKind::Configuration, std::string(NAME) + ": timeout must be positive");
    }
    return {};
}

json QwenAsrPlugin::build_request(const std::vector<uint8_t>& wav_data, const PluginOptions& opts) {
    std::string audio_uri = "data:audio/wav;base64," + base64::encode(wav_data);

    json asr_options = {{"enable_itn", false}};
    if (opts.language.empty() || opts.language == "auto") {
        asr_options["enable_lid"] = true;
    } else {
        asr_options["language"] = opts.language;
        asr_options["enable_lid"] = false;
    }

    return {
        {"model", opts.model},
        {"input", {
            {"messages", json::array({
                {{"role", "system"}, {"content", json::array({{{"text", opts.prompt}}})}},
                {{"role", "user"}, {"content", json::array({{{"audio", audio_uri}}})}},
            })},
        }},
        {"parameters", {
            {"result_format", "message"},
            {"asr_options", asr_options},
        }},
    };
}

TranscribeResult QwenAsrPlugin::transcribe(const AudioClip& clip, const PluginOptions& opts) const {
    if (clip.samples.empty()) {
        return std::unexpected("empty audio");
    }

    auto wav_data = wav::encode(clip.samples, clip.sample_rate);
    auto body = build_request(wav_data, opts).dump();

    auto response = http_.post_json(ENDPOINT, body, {"Authorization: Bearer " + opts.api_key},
                                    opts.timeout_s);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status < 200 || response->status >= 300) {
        // DashScope reports {"code": ..., "message": ...} on failure.
        try {
            auto j = json::parse(response->body);
            return std::unexpected(std::format("HTTP {}: {} - {}", response->status,
                                               j.value("code", ""), j.value("message", "")));
        } catch (const json::exception&) {
            return std::unexpected(std::format("HTTP {}: {}", response->status,
                                               text::truncate(response->body, 200)));
        }
    }
    return parse_response(response->body);
}

TranscribeResult QwenAsrPlugin::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.contains("code") && j["code"].is_string() && !j["code"].get<std::string>().empty()) {
            return std::unexpected("server error: " + j["code"].get<std::string>() + " - " +
                                   j.value("message", ""));
        }

        const auto& choices = j.at("output").at("choices");
        if (!choices.is_array() || choices.empty()) {
            return std::string{};
        }

        std::vector<std::string> parts;
        const auto& content = choices[0].at("message").at("content");
        for (const auto& item : content) {
            if (item.contains("text") && item["text"].is_string()) {
                parts.push_back(item["text"].get<std::string>());
            }
        }
        return text::join_lines(parts);
    } catch (const json::exception& e) {
        return std::unexpected(std::string("unexpected response: ") + e.what());
    }
}
