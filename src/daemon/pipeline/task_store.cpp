#include "pipeline/task_store.hpp"

#include <algorithm>

TaskStore::TaskStore(size_t max_finished_batches)
    : max_finished_batches_(std::max<size_t>(max_finished_batches, 1)) {}

void TaskStore::put(const Task& task) {
    std::lock_guard lock(mu_);
    tasks_[task.id] = task;
}

std::optional<Task> TaskStore::get(const std::string& task_id) const {
    std::lock_guard lock(mu_);
    auto it = tasks_.find(task_id);
    if (it == tasks_.end()) return std::nullopt;
    return it->second;
}

std::vector<Task> TaskStore::all() const {
    std::lock_guard lock(mu_);
    std::vector<Task> out;
    out.reserve(tasks_.size());
    for (const auto& [id, task] : tasks_) out.push_back(task);
    return out;
}

void TaskStore::erase(const std::string& task_id) {
    std::lock_guard lock(mu_);
    tasks_.erase(task_id);
}

size_t TaskStore::size() const {
    std::lock_guard lock(mu_);
    return tasks_.size();
}

void TaskStore::put_batch(const std::string& batch_id, nlohmann::json report) {
    bool finished = report.is_object() && report.value("status", "") == "completed";

    std::lock_guard lock(mu_);
    batches_.insert_or_assign(batch_id, std::move(report));
    if (!finished || std::ranges::find(finished_batches_, batch_id) != finished_batches_.end()) return;

    finished_batches_.push_back(batch_id);
    if (finished_batches_.size() > max_finished_batches_) {
        batches_.erase(finished_batches_.front());
        finished_batches_.pop_front();
    }
}

std::optional<nlohmann::json> TaskStore::get_batch(const std::string& batch_id) const {
    std::lock_guard lock(mu_);
    auto it = batches_.find(batch_id);
    if (it == batches_.end()) return std::nullopt;
    return it->second;
}
