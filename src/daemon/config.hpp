#pragma once

#include <cstdint>
#include <string>

struct Config {
    struct Asr {
        std::string default_method = "faster-whisper";
        std::string language = "auto";
        long timeout_s = 60;

        struct FasterWhisper {
            std::string url = "http://localhost:8000/v1/audio/transcriptions";
            std::string api_key;
            std::string model = "Systran/faster-whisper-large-v2";
            std::string api_format = "openai"; // "openai" or "whisper.cpp"
            std::string prompt;
        } faster_whisper;

        struct Qwen {
            std::string api_key;
            std::string model = "qwen3-asr-flash";
            std::string language = "auto";
        } qwen;
    } asr;

    struct Vad {
        int64_t min_speech_duration_ms = 500;
        int64_t min_silence_duration_ms = 500;
        int64_t max_speech_duration_ms = 60000;
        int64_t frame_ms = 10;
        float energy_threshold = 0.02f;
    } vad;

    struct Dispatch {
        uint32_t max_concurrent_segments = 4;
    } dispatch;

    struct Batch {
        uint32_t max_files = 10;
        uint32_t max_parallel_files = 2;
    } batch;

    struct Progress {
        uint32_t subscriber_backlog = 256;
    } progress;

    struct Storage {
        std::string upload_dir;  // empty: <data dir>/uploads
        std::string output_dir;  // empty: <data dir>/outputs
        bool keep_segments = false;
        bool bundle = true;
    } storage;

    struct Daemon {
        bool cancel_on_disconnect = false;
    } daemon;

    static Config load(const std::string& path);
    static Config load_default();
    static Config from_json_text(const std::string& text);
};
