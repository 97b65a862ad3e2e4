#pragma once

#include "pipeline/task_orchestrator.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <map>
#include <nlohmann/json.hpp>
#include <stop_token>
#include <string>
#include <vector>

struct BatchOptions {
    size_t max_files = 10;
    size_t max_parallel_files = 2;
};

struct BatchPlan {
    struct Item {
        std::string file;
        std::string task_id;
        ValidatedRequest request;
        std::stop_source stop; // cancels this file only
    };

    std::string batch_id;
    std::vector<Item> items;
};

struct FileOutcome {
    std::string file;
    std::string task_id;
    bool success = false;
    std::string error;
    TaskStats stats;
    std::map<std::string, std::string> outputs;
    std::string bundle;
};

struct BatchReport {
    std::string batch_id;
    std::vector<FileOutcome> files; // in submission order
    size_t total_files = 0;
    size_t successful_files = 0;
    size_t failed_files = 0;
    size_t total_segments = 0;
    size_t total_subtitles = 0;

    nlohmann::json to_json() const;
};

// Runs several files through the orchestrator with bounded parallelism.
// One file failing never stops the others.
class BatchCoordinator {
public:
    BatchCoordinator(const TaskOrchestrator& orchestrator, ProgressChannels& channels, BatchOptions opts);

    // Rejects an empty list or one above max_files, validates the shared
    // configuration once and assigns every file its task id up front.
    std::expected<BatchPlan, Error> prepare(const std::vector<std::string>& files,
                                            const TaskRequest& shared) const;

    BatchReport run(const BatchPlan& plan, std::stop_token stop = {},
                    const TaskOrchestrator::SnapshotFn& on_update = {}) const;

    const BatchOptions& options() const { return opts_; }

private:
    const TaskOrchestrator& orchestrator_;
    ProgressChannels& channels_;
    BatchOptions opts_;
};
