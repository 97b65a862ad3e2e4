#include "asr/dispatcher.hpp"

#include "text_util.hpp"

#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>

namespace {

constexpr const char* CANCELLED = "cancelled";

TaskStats count(const std::vector<SegmentResult>& results) {
    TaskStats s;
    s.total_segments = results.size();
    for (const auto& r : results) {
        switch (r.status) {
            case SegmentStatus::Success: s.successful_transcriptions++; break;
            case SegmentStatus::Empty: s.empty_segments++; break;
            case SegmentStatus::Failed: s.failed_segments++; break;
        }
    }
    s.total_subtitles = s.successful_transcriptions;
    return s;
}

} // namespace

std::string_view to_string(SegmentStatus status) {
    switch (status) {
        case SegmentStatus::Success: return "success";
        case SegmentStatus::Empty: return "empty";
        case SegmentStatus::Failed: return "failed";
    }
    return "failed";
}

nlohmann::json to_json(const TaskStats& stats) {
    return {
        {"total_segments", stats.total_segments},
        {"successful_transcriptions", stats.successful_transcriptions},
        {"empty_segments", stats.empty_segments},
        {"failed_segments", stats.failed_segments},
        {"total_subtitles", stats.total_subtitles},
    };
}

TaskStats stats_from_json(const nlohmann::json& j) {
    TaskStats s;
    if (!j.is_object()) return s;
    s.total_segments = j.value("total_segments", size_t{0});
    s.successful_transcriptions = j.value("successful_transcriptions", size_t{0});
    s.empty_segments = j.value("empty_segments", size_t{0});
    s.failed_segments = j.value("failed_segments", size_t{0});
    s.total_subtitles = j.value("total_subtitles", size_t{0});
    return s;
}

SegmentResult classify(const Segment& segment, const TranscribeResult& raw) {
    SegmentResult r{.segment = segment};
    if (!raw) {
        r.status = SegmentStatus::Failed;
        r.error = raw.error().empty() ? "transcription failed" : text::to_valid_utf8(raw.error());
        return r;
    }
    auto text = text::trim(text::to_valid_utf8(*raw));
    if (text.empty()) {
        r.status = SegmentStatus::Empty;
        return r;
    }
    r.status = SegmentStatus::Success;
    r.text = std::move(text);
    return r;
}

Dispatcher::Dispatcher(DispatchOptions opts) : opts_(opts) {
    if (opts_.max_concurrency == 0) opts_.max_concurrency = 1;
}

DispatchOutcome Dispatcher::run(std::span<const AudioClip> clips, const AsrPlugin& plugin,
                                const PluginOptions& options, std::stop_token stop,
                                const ResultCallback& on_result) const {
    if (clips.empty()) return {};
    if (opts_.max_concurrency == 1) {
        return run_batched(clips, plugin, options, stop, on_result);
    }
    return run_parallel(clips, plugin, options, stop, on_result);
}

DispatchOutcome Dispatcher::run_batched(std::span<const AudioClip> clips, const AsrPlugin& plugin,
                                        const PluginOptions& options, std::stop_token stop,
                                        const ResultCallback& on_result) const {
    DispatchOutcome out;
    out.results.reserve(clips.size());

    auto accept = [&](size_t i, const TranscribeResult& r) {
        // Results past the end or out of order are dropped.
        if (i != out.results.size() || i >= clips.size()) return;
        if (!r && r.error() == CANCELLED) out.cancelled = true;
        out.results.push_back(classify(clips[i].segment, r));
        if (on_result) on_result(i, out.results.back(), i + 1, clips.size());
    };

    auto raw = plugin.transcribe_many(clips, options, stop, accept);

    // A back-end that reports nothing per clip is read from its return value.
    for (size_t i = out.results.size(); i < clips.size(); i++) {
        accept(i, i < raw.size() ? raw[i] : TranscribeResult(std::unexpected("no result from plugin")));
    }
    out.stats = count(out.results);
    return out;
}

DispatchOutcome Dispatcher::run_parallel(std::span<const AudioClip> clips, const AsrPlugin& plugin,
                                         const PluginOptions& options, std::stop_token stop,
                                         const ResultCallback& on_result) const {
    const size_t total = clips.size();
    std::vector<SegmentResult> results(total);
    std::vector<bool> done(total, false);

    std::atomic<size_t> next{0};
    std::mutex mu;
    size_t completed = 0;

    auto worker = [&]() {
        for (;;) {
            if (stop.stop_requested()) return;
            size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= total) return;

            const auto& clip = clips[i];
            TranscribeResult raw = clip.ok() ? plugin.transcribe(clip, options)
                                             : TranscribeResult(std::unexpected(clip.error));
            auto result = classify(clip.segment, raw);

            std::lock_guard lock(mu);
            results[i] = std::move(result);
            done[i] = true;
            completed++;
            if (on_result) on_result(i, results[i], completed, total);
        }
    };

    {
        size_t n = std::min(opts_.max_concurrency, total);
        std::vector<std::jthread> pool;
        pool.reserve(n);
        for (size_t t = 0; t < n; t++) {
            pool.emplace_back(worker);
        }
    } // joined here; in-flight calls drain before we look at the slots

    DispatchOutcome out;
    for (size_t i = 0; i < total; i++) {
        if (!done[i]) {
            results[i] = SegmentResult{
                .segment = clips[i].segment,
                .status = SegmentStatus::Failed,
                .error = CANCELLED,
            };
            out.cancelled = true;
        }
    }
    out.results = std::move(results);
    out.stats = count(out.results);
    return out;
}
