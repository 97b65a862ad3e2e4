#pragma once

#include "asr/dispatcher.hpp"
#include "asr/plugin_registry.hpp"
#include "audio/segmenter.hpp"
#include "errors.hpp"
#include "pipeline/task.hpp"
#include "progress/progress_channels.hpp"
#include "storage/workspace.hpp"
#include "subtitle/assembler.hpp"

#include <cstdint>
#include <expected>
#include <functional>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

// What a client asks for. Unset fields fall back to the process configuration.
struct TaskRequest {
    std::string source;
    std::string method;
    PluginOverrides overrides;
    std::vector<std::string> output_formats;
    std::optional<int64_t> min_speech_duration_ms;
    std::optional<int64_t> min_silence_duration_ms;

    // Reads the per-submission "config" object of the IPC protocol.
    static std::expected<TaskRequest, Error> from_json(const nlohmann::json& config);
};

// A request whose plugin, options and formats have all been checked.
struct ValidatedRequest {
    std::string source;
    std::string method;
    PluginBinding plugin;
    VadOptions vad;
    std::vector<SubtitleFormat> formats;
};

struct OrchestratorOptions {
    VadOptions vad;
    size_t max_concurrent_segments = 4;
    bool keep_segments = false;
    bool bundle = true;
};

// Drives one task through segmenting, exporting, transcribing and
// assembling, publishing progress on the task's channel. Stateless between
// runs, so one instance serves every task thread.
class TaskOrchestrator {
public:
    // Receives the task snapshot at every transition, before the matching event is published.
    using SnapshotFn = std::function<void(const Task&)>;

    TaskOrchestrator(const PluginRegistry& registry, ProgressChannels& channels,
                     Workspace workspace, OrchestratorOptions opts, bool verbose = false);

    // Everything except the source file. Used once per batch.
    std::expected<ValidatedRequest, Error> validate_config(const TaskRequest& request) const;

    // Synchronous check before a task is created; nothing is processed.
    std::expected<ValidatedRequest, Error> validate(const TaskRequest& request) const;

    // Runs to a terminal state and returns the final snapshot. Never throws.
    Task run(const std::string& task_id, const ValidatedRequest& request,
             std::stop_token stop = {}, const SnapshotFn& on_update = {}) const;

    const Workspace& workspace() const { return workspace_; }

private:
    struct Run;

    void advance(Run& r, TaskStep step, int percent, const std::string& message,
                 nlohmann::json details = nlohmann::json::object()) const;
    void log_event(Run& r, const std::string& level, const std::string& message,
                   nlohmann::json details = nlohmann::json::object()) const;
    Task fail(Run& r, const std::string& reason) const;
    Task complete(Run& r, const std::string& message) const;

    void log(const std::string& msg) const;

    const PluginRegistry& registry_;
    ProgressChannels& channels_;
    Workspace workspace_;
    OrchestratorOptions opts_;
    bool verbose_;
};
