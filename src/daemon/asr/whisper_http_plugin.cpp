#include "asr/whisper_http_plugin.hpp"

#include "text_util.hpp"

#include <format>
#include <nlohmann/json.hpp>
#include <print>
#include <sstream>

using json = nlohmann::json;

WhisperHttpPlugin::WhisperHttpPlugin(std::string api_format)
    : api_format_(std::move(api_format)) {}

std::string WhisperHttpPlugin::description() const {
    return "Self-hosted Whisper HTTP service (" + api_format_ + " API)";
}

std::expected<void, Error> WhisperHttpPlugin::validate(const PluginOptions& opts) const {
    if (opts.endpoint.empty()) {
        return make_error(ErrorKind::Configuration, std::string(NAME) + ": api_url is required");
    }
    if (!opts.endpoint.starts_with("http://") && !opts.endpoint.starts_with("https://")) {
        return make_error(ErrorKind::Configuration,
                          std::string(NAME) + ": api_url must be an http(s) URL, got " + opts.endpoint);
    }
    if (api_format_ != "openai" && api_format_ != "whisper.cpp") {
        return make_error(ErrorKind::Configuration,
                          std::string(NAME) + ": unknown api_format " + api_format_);
    }
    if (opts.timeout_s <= 0) {
        return make_error(ErrorKind::Configuration, std::string(NAME) + ": timeout must be positive");
    }
    return {};
}

std::vector<FormField> WhisperHttpPlugin::build_form(const std::vector<uint8_t>& wav_data,
                                                     const PluginOptions& opts) const {
    std::vector<FormField> fields;
    fields.push_back({
        .name = "file",
        .data = std::string(reinterpret_cast<const char*>(wav_data.data()), wav_data.size()),
        .filename = "audio.wav",
        .content_type = "audio/wav",
    });

    bool auto_language = opts.language.empty() || opts.language == "auto";

    if (api_format_ == "openai") {
        if (!opts.model.empty()) fields.push_back({.name = "model", .data = opts.model});
        if (!auto_language) fields.push_back({.name = "language", .data = opts.language});
        if (!opts.prompt.empty()) fields.push_back({.name = "prompt", .data = opts.prompt});
        fields.push_back({.name = "temperature", .data = "0"});
        fields.push_back({.name = "response_format", .data = "json"});
    } else {
        fields.push_back({.name = "temperature", .data = "0.0"});
        fields.push_back({.name = "response_format", .data = "json"});
        if (!auto_language) fields.push_back({.name = "language", .data = opts.language});
        if (!opts.prompt.empty()) fields.push_back({.name = "prompt", .data = opts.prompt});
    }
    return fields;
}

TranscribeResult WhisperHttpPlugin::transcribe(const AudioClip& clip, const PluginOptions& opts) const {
    if (clip.samples.empty()) {
        return std::unexpected("empty audio");
    }

    auto wav_data = wav::encode(clip.samples, clip.sample_rate);

    std::string url = opts.endpoint;
    if (api_format_ == "whisper.cpp" && !url.ends_with("/inference")) {
        url += "/inference";
    }

    std::vector<std::string> headers;
    if (!opts.api_key.empty()) {
        headers.push_back("Authorization: Bearer " + opts.api_key);
    }

    auto response = http_.post_form(url, build_form(wav_data, opts), headers, opts.timeout_s);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status < 200 || response->status >= 300) {
        return std::unexpected(std::format("HTTP {}: {}", response->status,
                                           text::truncate(response->body, 200)));
    }
    return parse_response(response->body);
}

TranscribeResult WhisperHttpPlugin::parse_response(const std::string& body) {
    auto trimmed = text::trim(body);
    if (trimmed.empty()) {
        return std::string{};
    }

    if (trimmed.front() == '{') {
        try {
            auto j = json::parse(trimmed);
            if (j.contains("text") && j["text"].is_string()) {
                return text::trim(j["text"].get<std::string>());
            }
            if (j.contains("segments") && j["segments"].is_array()) {
                std::vector<std::string> parts;
                for (const auto& seg : j["segments"]) {
                    if (seg.contains("text") && seg["text"].is_string()) {
                        parts.push_back(seg["text"].get<std::string>());
                    }
                }
                return text::join_lines(parts);
            }
            if (j.contains("error")) {
                const auto& e = j["error"];
                if (e.is_string()) return std::unexpected("server error: " + e.get<std::string>());
                if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                    return std::unexpected("server error: " + e["message"].get<std::string>());
                }
                return std::unexpected("server error: " + e.dump());
            }
            return std::unexpected("unexpected response: " + text::truncate(trimmed, 200));
        } catch (const json::exception& e) {
            return std::unexpected(std::string("JSON parse error: ") + e.what());
        }
    }

    // response_format=text streams one line per recognized segment.
    std::vector<std::string> lines;
    std::istringstream in{std::string(trimmed)};
    for (std::string line; std::getline(in, line);) {
        lines.push_back(std::move(line));
    }
    return text::to_valid_utf8(text::join_lines(lines));
}
