#include "pipeline/task_orchestrator.hpp"

#include "audio/segment_exporter.hpp"
#include "audio/wav_codec.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <print>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr const char* CANCELLED = "cancelled";

// Transcription owns the 35-85 band.
constexpr int TRANSCRIBE_START = 35;
constexpr int TRANSCRIBE_END = 85;

std::expected<std::string, Error> string_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::string{};
    if (!j[key].is_string()) {
        return make_error(ErrorKind::Configuration, std::format("config.{} must be a string", key));
    }
    return j[key].get<std::string>();
}

std::expected<std::optional<int64_t>, Error> int_field(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return std::optional<int64_t>{};
    if (!j[key].is_number_integer()) {
        return make_error(ErrorKind::Configuration, std::format("config.{} must be an integer", key));
    }
    return std::optional<int64_t>{j[key].get<int64_t>()};
}

} // namespace

std::expected<TaskRequest, Error> TaskRequest::from_json(const json& config) {
    TaskRequest req;
    if (config.is_null()) return req;
    if (!config.is_object()) {
        return make_error(ErrorKind::Configuration, "config must be an object");
    }

    struct StringKey {
        const char* key;
        std::string* out;
    };
    for (auto [key, out] : {StringKey{"method", &req.method},
                            StringKey{"api_url", &req.overrides.endpoint},
                            StringKey{"api_key", &req.overrides.api_key},
                            StringKey{"model", &req.overrides.model},
                            StringKey{"language", &req.overrides.language}}) {
        auto v = string_field(config, key);
        if (!v) return std::unexpected(v.error());
        *out = std::move(*v);
    }

    auto speech = int_field(config, "min_speech_duration_ms");
    if (!speech) return std::unexpected(speech.error());
    req.min_speech_duration_ms = *speech;

    auto silence = int_field(config, "min_silence_duration_ms");
    if (!silence) return std::unexpected(silence.error());
    req.min_silence_duration_ms = *silence;

    if (config.contains("output_formats") && !config["output_formats"].is_null()) {
        const auto& f = config["output_formats"];
        if (f.is_string()) {
            auto list = f.get<std::string>();
            size_t pos = 0;
            for (size_t comma; (comma = list.find(',', pos)) != std::string::npos; pos = comma + 1) {
                req.output_formats.push_back(list.substr(pos, comma - pos));
            }
            req.output_formats.push_back(list.substr(pos));
        } else if (f.is_array() && std::ranges::all_of(f, [](const json& x) { return x.is_string(); })) {
            req.output_formats = f.get<std::vector<std::string>>();
        } else {
            return make_error(ErrorKind::Configuration,
                              "config.output_formats must be a string or a list of strings");
        }
    }
    return req;
}

struct TaskOrchestrator::Run {
    Task task;
    const ValidatedRequest& request;
    std::stop_token stop;
    const SnapshotFn& on_update;
};

TaskOrchestrator::TaskOrchestrator(const PluginRegistry& registry, ProgressChannels& channels,
                                   Workspace workspace, OrchestratorOptions opts, bool verbose)
    : registry_(registry), channels_(channels), workspace_(std::move(workspace)),
      opts_(opts), verbose_(verbose) {}

std::expected<ValidatedRequest, Error> TaskOrchestrator::validate_config(const TaskRequest& request) const {
    auto binding = registry_.resolve_configured(request.method, request.overrides);
    if (!binding) return std::unexpected(binding.error());

    VadOptions vad = opts_.vad;
    if (request.min_speech_duration_ms) vad.min_speech_duration_ms = *request.min_speech_duration_ms;
    if (request.min_silence_duration_ms) vad.min_silence_duration_ms = *request.min_silence_duration_ms;
    auto vad_ok = ::validate(vad);
    if (!vad_ok) return std::unexpected(vad_ok.error());

    std::expected<std::vector<SubtitleFormat>, Error> formats =
        request.output_formats.empty() ? parse_formats(std::string_view("srt"))
                                       : parse_formats(request.output_formats);
    if (!formats) return std::unexpected(formats.error());

    return ValidatedRequest{
        .source = request.source,
        .method = binding->plugin->name(),
        .plugin = *binding,
        .vad = vad,
        .formats = std::move(*formats),
    };
}

std::expected<ValidatedRequest, Error> TaskOrchestrator::validate(const TaskRequest& request) const {
    if (request.source.empty()) {
        return make_error(ErrorKind::Configuration, "no source file given");
    }
    std::error_code ec;
    if (!fs::is_regular_file(request.source, ec)) {
        return make_error(ErrorKind::Configuration, "source file not found: " + request.source);
    }
    return validate_config(request);
}

void TaskOrchestrator::advance(Run& r, TaskStep step, int percent, const std::string& message,
                               json details) const {
    r.task.step = step;
    r.task.progress = std::max(r.task.progress, percent);
    r.task.message = message;
    if (r.on_update) r.on_update(r.task);

    channels_.publish(r.task.id, ProgressUpdate{
        .step = std::string(to_string(step)),
        .percent = r.task.progress,
        .message = message,
        .details = std::move(details),
    });
}

void TaskOrchestrator::log_event(Run& r, const std::string& level, const std::string& message,
                                 json details) const {
    log(std::format("{}: {}", r.task.id, message));
    channels_.publish(r.task.id, LogLine{.level = level, .message = message, .details = std::move(details)});
}

Task TaskOrchestrator::fail(Run& r, const std::string& reason) const {
    log(std::format("{}: failed: {}", r.task.id, reason));

    // A failed task leaves no artifacts behind.
    std::error_code ec;
    fs::remove_all(workspace_.task_dir(r.task.id), ec);

    r.task.status = TaskStatus::Failed;
    r.task.step = TaskStep::Failed;
    r.task.error = reason;
    r.task.message = reason;
    r.task.outputs.clear();
    r.task.bundle.clear();
    r.task.finished_at = utc_timestamp();
    if (r.on_update) r.on_update(r.task);

    channels_.publish(r.task.id, ErrorReport{
        .message = reason,
        .details = {{"step", "failed"}, {"stats", to_json(r.task.stats)}},
    });
    channels_.close(r.task.id);
    return r.task;
}

Task TaskOrchestrator::complete(Run& r, const std::string& message) const {
    r.task.status = TaskStatus::Completed;
    r.task.step = TaskStep::Completed;
    r.task.progress = 100;
    r.task.message = message;
    r.task.finished_at = utc_timestamp();
    if (r.on_update) r.on_update(r.task);

    channels_.publish(r.task.id, ProgressUpdate{
        .step = "completed",
        .percent = 100,
        .message = message,
    });
    channels_.publish(r.task.id, Completion{.result = r.task.to_json()});
    channels_.close(r.task.id);

    log(std::format("{}: completed ({} subtitles)", r.task.id, r.task.stats.total_subtitles));
    return r.task;
}

Task TaskOrchestrator::run(const std::string& task_id, const ValidatedRequest& request,
                           std::stop_token stop, const SnapshotFn& on_update) const {
    Run r{
        .task = Task{
            .id = task_id,
            .source = request.source,
            .method = request.method,
            .status = TaskStatus::Running,
            .created_at = utc_timestamp(),
        },
        .request = request,
        .stop = stop,
        .on_update = on_update,
    };

    try {
        advance(r, TaskStep::Created, 0, "task created",
                {{"source", request.source}, {"method", request.method}});
        if (stop.stop_requested()) return fail(r, CANCELLED);

        // Segmenting
        advance(r, TaskStep::Segmenting, 5, "detecting speech");
        auto audio = wav::read_file(request.source);
        if (!audio) {
            return fail(r, "cannot read audio: " + audio.error());
        }
        Segmenter segmenter(request.vad);
        auto segments = segmenter.segment(*audio);
        r.task.stats.total_segments = segments.size();
        advance(r, TaskStep::Segmenting, 20, std::format("{} speech segments detected", segments.size()),
                {{"segments", segments.size()}, {"audio_duration_ms", audio->duration_ms()}});
        if (stop.stop_requested()) return fail(r, CANCELLED);

        DispatchOutcome outcome;
        if (!segments.empty()) {
            // Exporting
            advance(r, TaskStep::Exporting, 25, "exporting segments");
            SegmentExporter exporter(workspace_.segments_dir(task_id));
            auto clips = exporter.export_segments(*audio, segments);
            for (const auto& clip : clips) {
                if (!clip.ok()) {
                    log_event(r, "warning",
                              std::format("segment {} export failed: {}", clip.segment.index + 1, clip.error),
                              {{"segment", clip.segment.index}});
                }
            }
            advance(r, TaskStep::Exporting, TRANSCRIBE_START, std::format("{} clips exported", clips.size()));
            if (stop.stop_requested()) {
                if (!opts_.keep_segments) workspace_.cleanup_temp(task_id);
                return fail(r, CANCELLED);
            }

            // Transcribing
            advance(r, TaskStep::Transcribing, TRANSCRIBE_START,
                    std::format("transcribing {} segments with {}", clips.size(), request.method));

            Dispatcher dispatcher({.max_concurrency = opts_.max_concurrent_segments});
            outcome = dispatcher.run(clips, *request.plugin.plugin, request.plugin.options, stop,
                [this, &r](size_t index, const SegmentResult& res, size_t completed, size_t total) {
                    json details = {
                        {"segment", index},
                        {"start_ms", res.segment.start_ms},
                        {"end_ms", res.segment.end_ms},
                        {"status", to_string(res.status)},
                    };
                    switch (res.status) {
                        case SegmentStatus::Success:
                            details["text"] = res.text;
                            log_event(r, "info", std::format("segment {}/{} transcribed", index + 1, total), details);
                            break;
                        case SegmentStatus::Empty:
                            log_event(r, "info", std::format("segment {}/{} has no speech", index + 1, total), details);
                            break;
                        case SegmentStatus::Failed:
                            details["error"] = res.error;
                            log_event(r, "warning",
                                      std::format("segment {}/{} failed: {}", index + 1, total, res.error), details);
                            break;
                    }
                    int span = TRANSCRIBE_END - TRANSCRIBE_START;
                    int percent = TRANSCRIBE_START + static_cast<int>(span * completed / total);
                    advance(r, TaskStep::Transcribing, percent,
                            std::format("{}/{} segments transcribed", completed, total),
                            {{"completed", completed}, {"total", total}});
                });

            if (!opts_.keep_segments) workspace_.cleanup_temp(task_id);

            r.task.stats = outcome.stats;
            if (outcome.cancelled || stop.stop_requested()) return fail(r, CANCELLED);
        }

        // Assembling
        advance(r, TaskStep::Assembling, 90, "assembling subtitles");
        auto entries = subtitle::build_entries(outcome.results);
        r.task.stats.total_subtitles = entries.size();

        auto base = fs::path(request.source).stem().string();
        if (base.empty()) base = "subtitles";

        auto rendered = subtitle::assemble(entries, request.formats);
        auto written = subtitle::write_outputs(workspace_.task_dir(task_id), base, rendered, opts_.bundle);
        if (!written) {
            return fail(r, written.error().message);
        }
        r.task.outputs = written->files;
        r.task.bundle = written->bundle;
        if (!written->bundle_error.empty()) {
            log_event(r, "warning", written->bundle_error);
        }

        if (segments.empty()) {
            return complete(r, "no speech detected");
        }
        return complete(r, std::format("{} subtitles from {} segments ({} empty, {} failed)",
                                       r.task.stats.total_subtitles, r.task.stats.total_segments,
                                       r.task.stats.empty_segments, r.task.stats.failed_segments));
    } catch (const std::exception& e) {
        return fail(r, std::string("internal error: ") + e.what());
    }
}

void TaskOrchestrator::log(const std::string& msg) const {
    if (verbose_) {
        std::println(stderr, "[subflow] {}", msg);
    }
}
