#include "config.hpp"

#include "platform/platform_paths.hpp"

#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <print>
#include <sstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

template <typename T>
void read_key(const json& obj, const char* key, T& out) {
    if (obj.contains(key) && !obj[key].is_null()) out = obj[key].get<T>();
}

void apply(Config& cfg, const json& j) {
    if (j.contains("asr")) {
        auto& a = j["asr"];
        read_key(a, "default_method", cfg.asr.default_method);
        read_key(a, "language", cfg.asr.language);
        read_key(a, "timeout_s", cfg.asr.timeout_s);

        if (a.contains("faster_whisper")) {
            auto& fw = a["faster_whisper"];
            read_key(fw, "url", cfg.asr.faster_whisper.url);
            read_key(fw, "api_key", cfg.asr.faster_whisper.api_key);
            read_key(fw, "model", cfg.asr.faster_whisper.model);
            read_key(fw, "api_format", cfg.asr.faster_whisper.api_format);
            read_key(fw, "prompt", cfg.asr.faster_whisper.prompt);
        }
        if (a.contains("qwen")) {
            auto& q = a["qwen"];
            read_key(q, "api_key", cfg.asr.qwen.api_key);
            read_key(q, "model", cfg.asr.qwen.model);
            read_key(q, "language", cfg.asr.qwen.language);
        }
    }

    if (j.contains("vad")) {
        auto& v = j["vad"];
        read_key(v, "min_speech_duration_ms", cfg.vad.min_speech_duration_ms);
        read_key(v, "min_silence_duration_ms", cfg.vad.min_silence_duration_ms);
        read_key(v, "max_speech_duration_ms", cfg.vad.max_speech_duration_ms);
        read_key(v, "frame_ms", cfg.vad.frame_ms);
        read_key(v, "energy_threshold", cfg.vad.energy_threshold);
    }

    if (j.contains("dispatch")) {
        read_key(j["dispatch"], "max_concurrent_segments", cfg.dispatch.max_concurrent_segments);
    }

    if (j.contains("batch")) {
        read_key(j["batch"], "max_files", cfg.batch.max_files);
        read_key(j["batch"], "max_parallel_files", cfg.batch.max_parallel_files);
    }

    if (j.contains("progress")) {
        read_key(j["progress"], "subscriber_backlog", cfg.progress.subscriber_backlog);
    }

    if (j.contains("storage")) {
        auto& s = j["storage"];
        read_key(s, "upload_dir", cfg.storage.upload_dir);
        read_key(s, "output_dir", cfg.storage.output_dir);
        read_key(s, "keep_segments", cfg.storage.keep_segments);
        read_key(s, "bundle", cfg.storage.bundle);
    }

    if (j.contains("daemon")) {
        read_key(j["daemon"], "cancel_on_disconnect", cfg.daemon.cancel_on_disconnect);
    }

    // Zero would stall the worker pools.
    if (cfg.dispatch.max_concurrent_segments == 0) cfg.dispatch.max_concurrent_segments = 1;
    if (cfg.batch.max_parallel_files == 0) cfg.batch.max_parallel_files = 1;
    if (cfg.progress.subscriber_backlog == 0) cfg.progress.subscriber_backlog = 1;
}

} // namespace

Config Config::from_json_text(const std::string& text) {
    Config cfg;
    try {
        apply(cfg, json::parse(text));
    } catch (const json::exception& e) {
        std::println(stderr, "config: parse error: {}", e.what());
        return Config{};
    }
    return cfg;
}

Config Config::load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        std::println(stderr, "config: could not open {}, using defaults", path);
        return Config{};
    }

    std::stringstream ss;
    ss << f.rdbuf();
    return from_json_text(ss.str());
}

Config Config::load_default() {
    auto dir = platform::config_dir();
    if (dir.empty()) return Config{};

    auto config_path = fs::path(dir) / "config.json";
    if (fs::exists(config_path)) {
        return load(config_path.string());
    }
    return Config{};
}
