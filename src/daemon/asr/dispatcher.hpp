#pragma once

#include "asr/plugin.hpp"
#include "audio/segmenter.hpp"

#include <cstddef>
#include <functional>
#include <nlohmann/json.hpp>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

enum class SegmentStatus { Success, Empty, Failed };

std::string_view to_string(SegmentStatus status);

struct SegmentResult {
    Segment segment;
    SegmentStatus status = SegmentStatus::Failed;
    std::string text;   // trimmed, Success only
    std::string error;  // Failed only
};

struct TaskStats {
    size_t total_segments = 0;
    size_t successful_transcriptions = 0;
    size_t empty_segments = 0;
    size_t failed_segments = 0;
    size_t total_subtitles = 0;

    bool operator==(const TaskStats&) const = default;
};

nlohmann::json to_json(const TaskStats& stats);
TaskStats stats_from_json(const nlohmann::json& j);

struct DispatchOptions {
    size_t max_concurrency = 4;
};

struct DispatchOutcome {
    std::vector<SegmentResult> results; // one per clip, in clip order
    TaskStats stats;
    bool cancelled = false;
};

// Turns a raw plugin reply into a classified result.
SegmentResult classify(const Segment& segment, const TranscribeResult& raw);

// Fans clips out to a plugin with bounded concurrency and collects the
// results back in clip order. A failing clip never aborts the others.
class Dispatcher {
public:
    // Called once per clip as results arrive. Calls are serialized.
    using ResultCallback =
        std::function<void(size_t index, const SegmentResult& result, size_t completed, size_t total)>;

    explicit Dispatcher(DispatchOptions opts = {});

    DispatchOutcome run(std::span<const AudioClip> clips, const AsrPlugin& plugin,
                        const PluginOptions& options, std::stop_token stop = {},
                        const ResultCallback& on_result = {}) const;

private:
    DispatchOutcome run_batched(std::span<const AudioClip> clips, const AsrPlugin& plugin,
                                const PluginOptions& options, std::stop_token stop,
                                const ResultCallback& on_result) const;
    DispatchOutcome run_parallel(std::span<const AudioClip> clips, const AsrPlugin& plugin,
                                 const PluginOptions& options, std::stop_token stop,
                                 const ResultCallback& on_result) const;

    DispatchOptions opts_;
};
