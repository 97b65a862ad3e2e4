#pragma once

#include "asr/dispatcher.hpp"

#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

enum class TaskStatus { Pending, Running, Completed, Failed };

// Orchestrator states. Percent bands: created 0, segmenting 5-20,
// exporting 25-35, transcribing 35-85, assembling 90, completed 100.
enum class TaskStep { Created, Segmenting, Exporting, Transcribing, Assembling, Completed, Failed };

std::string_view to_string(TaskStatus status);
std::string_view to_string(TaskStep step);
std::optional<TaskStatus> parse_task_status(std::string_view s);

struct Task {
    std::string id;
    std::string source;
    std::string method;
    TaskStatus status = TaskStatus::Pending;
    TaskStep step = TaskStep::Created;
    int progress = 0;
    std::string message;
    TaskStats stats;
    std::map<std::string, std::string> outputs; // format -> path
    std::string bundle;
    std::string error;
    std::string created_at;
    std::string finished_at;

    bool is_terminal() const {
        return status == TaskStatus::Completed || status == TaskStatus::Failed;
    }

    nlohmann::json to_json() const;
};

// Random RFC 4122 version 4 identifier.
std::string make_task_id();
