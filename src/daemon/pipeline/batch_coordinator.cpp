#include "pipeline/batch_coordinator.hpp"

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <thread>

using json = nlohmann::json;

json BatchReport::to_json() const {
    json files_json = json::array();
    for (const auto& f : files) {
        json entry = {
            {"file", f.file},
            {"task_id", f.task_id},
            {"success", f.success},
            {"stats", ::to_json(f.stats)},
            {"outputs", f.outputs},
        };
        if (!f.error.empty()) entry["error"] = f.error;
        if (!f.bundle.empty()) entry["bundle"] = f.bundle;
        files_json.push_back(std::move(entry));
    }
    return {
        {"batch_id", batch_id},
        {"files", files_json},
        {"total_files", total_files},
        {"successful_files", successful_files},
        {"failed_files", failed_files},
        {"total_segments", total_segments},
        {"total_subtitles", total_subtitles},
    };
}

BatchCoordinator::BatchCoordinator(const TaskOrchestrator& orchestrator, ProgressChannels& channels,
                                   BatchOptions opts)
    : orchestrator_(orchestrator), channels_(channels), opts_(opts) {
    if (opts_.max_parallel_files == 0) opts_.max_parallel_files = 1;
}

std::expected<BatchPlan, Error> BatchCoordinator::prepare(const std::vector<std::string>& files,
                                                          const TaskRequest& shared) const {
    if (files.empty()) {
        return make_error(ErrorKind::Configuration, "batch contains no files");
    }
    if (files.size() > opts_.max_files) {
        return make_error(ErrorKind::Configuration,
                          std::format("batch of {} files exceeds the limit of {}", files.size(), opts_.max_files));
    }

    auto validated = orchestrator_.validate_config(shared);
    if (!validated) return std::unexpected(validated.error());

    BatchPlan plan{.batch_id = make_task_id()};
    plan.items.reserve(files.size());
    for (const auto& file : files) {
        ValidatedRequest req = *validated;
        req.source = file;
        plan.items.push_back({.file = file, .task_id = make_task_id(), .request = std::move(req)});
    }
    return plan;
}

BatchReport BatchCoordinator::run(const BatchPlan& plan, std::stop_token stop,
                                  const TaskOrchestrator::SnapshotFn& on_update) const {
    const size_t total = plan.items.size();

    BatchReport report{.batch_id = plan.batch_id, .files = std::vector<FileOutcome>(total), .total_files = total};

    std::atomic<size_t> next{0};
    std::mutex mu;
    size_t finished = 0;

    channels_.publish(plan.batch_id, ProgressUpdate{
        .step = "batch",
        .percent = 0,
        .message = std::format("processing {} files", total),
        .details = {{"total_files", total}},
    });

    auto worker = [&]() {
        for (;;) {
            size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= total) return;
            const auto& item = plan.items[i];

            // Stopping the batch stops every file that has not finished yet.
            std::stop_source file_stop = item.stop;
            std::stop_callback forward(stop, [file_stop]() mutable { file_stop.request_stop(); });

            Task task = orchestrator_.run(item.task_id, item.request, file_stop.get_token(), on_update);

            FileOutcome outcome{
                .file = item.file,
                .task_id = item.task_id,
                .success = task.status == TaskStatus::Completed,
                .error = task.error,
                .stats = task.stats,
                .outputs = task.outputs,
                .bundle = task.bundle,
            };

            std::lock_guard lock(mu);
            report.files[i] = std::move(outcome);
            finished++;
            const auto& done = report.files[i];
            channels_.publish(plan.batch_id, ProgressUpdate{
                .step = "batch",
                .percent = static_cast<int>(finished * 100 / total),
                .message = std::format("{}/{} files processed", finished, total),
                .details = {
                    {"file", done.file},
                    {"task_id", done.task_id},
                    {"success", done.success},
                    {"error", done.error},
                },
            });
        }
    };

    {
        size_t n = std::min(opts_.max_parallel_files, total);
        std::vector<std::jthread> pool;
        pool.reserve(n);
        for (size_t t = 0; t < n; t++) {
            pool.emplace_back(worker);
        }
    }

    for (const auto& f : report.files) {
        if (f.success) report.successful_files++;
        else report.failed_files++;
        report.total_segments += f.stats.total_segments;
        report.total_subtitles += f.stats.total_subtitles;
    }

    channels_.publish(plan.batch_id, Completion{.result = report.to_json()});
    channels_.close(plan.batch_id);
    return report;
}
