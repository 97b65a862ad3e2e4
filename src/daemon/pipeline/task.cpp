#include "pipeline/task.hpp"

#include <format>
#include <mutex>
#include <random>

std::string_view to_string(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Failed: return "failed";
    }
    return "failed";
}

std::string_view to_string(TaskStep step) {
    switch (step) {
        case TaskStep::Created: return "created";
        case TaskStep::Segmenting: return "segmenting";
        case TaskStep::Exporting: return "exporting";
        case TaskStep::Transcribing: return "transcribing";
        case TaskStep::Assembling: return "assembling";
        case TaskStep::Completed: return "completed";
        case TaskStep::Failed: return "failed";
    }
    return "failed";
}

std::optional<TaskStatus> parse_task_status(std::string_view s) {
    if (s == "pending") return TaskStatus::Pending;
    if (s == "running") return TaskStatus::Running;
    if (s == "completed") return TaskStatus::Completed;
    if (s == "failed") return TaskStatus::Failed;
    return std::nullopt;
}

nlohmann::json Task::to_json() const {
    nlohmann::json j = {
        {"task_id", id},
        {"source", source},
        {"method", method},
        {"status", to_string(status)},
        {"step", to_string(step)},
        {"progress", progress},
        {"message", message},
        {"stats", ::to_json(stats)},
        {"outputs", outputs},
        {"created_at", created_at},
    };
    if (!bundle.empty()) j["bundle"] = bundle;
    if (!error.empty()) j["error"] = error;
    if (!finished_at.empty()) j["finished_at"] = finished_at;
    return j;
}

std::string make_task_id() {
    static std::mutex mu;
    static std::mt19937_64 rng{std::random_device{}()};

    uint64_t hi, lo;
    {
        std::lock_guard lock(mu);
        hi = rng();
        lo = rng();
    }
    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // variant 10

    return std::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                       hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF,
                       lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}
