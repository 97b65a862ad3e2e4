#pragma once

#include "pipeline/task.hpp"

#include <cstddef>
#include <deque>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// Latest snapshot of every live task and recent batch in this process.
// Finished tasks are erased once archived; only the newest
// max_finished_batches completed batch reports are kept.
class TaskStore {
public:
    explicit TaskStore(size_t max_finished_batches = 256);

    void put(const Task& task);
    std::optional<Task> get(const std::string& task_id) const;
    std::vector<Task> all() const;
    void erase(const std::string& task_id);
    size_t size() const;

    // A report whose "status" is "completed" counts towards the cap.
    void put_batch(const std::string& batch_id, nlohmann::json report);
    std::optional<nlohmann::json> get_batch(const std::string& batch_id) const;

private:
    size_t max_finished_batches_;
    mutable std::mutex mu_;
    std::unordered_map<std::string, Task> tasks_;
    std::unordered_map<std::string, nlohmann::json> batches_;
    std::deque<std::string> finished_batches_; // oldest first
};
