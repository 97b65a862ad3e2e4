#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>
#include <variant>

struct ProgressUpdate {
    std::string step;
    int percent = 0;
    std::string message;
    nlohmann::json details = nlohmann::json::object();
};

struct LogLine {
    std::string level = "info";
    std::string message;
    nlohmann::json details = nlohmann::json::object();
};

struct ErrorReport {
    std::string message;
    nlohmann::json details = nlohmann::json::object();
};

struct Completion {
    nlohmann::json result;
};

using EventPayload = std::variant<ProgressUpdate, LogLine, ErrorReport, Completion>;

struct ProgressEvent {
    std::string task_id;
    uint64_t seq = 0;         // assigned by the channel registry
    std::string timestamp;    // ISO-8601 UTC, assigned by the channel registry
    EventPayload payload;

    // completion and error end a task's stream
    bool is_terminal() const {
        return std::holds_alternative<Completion>(payload) ||
               std::holds_alternative<ErrorReport>(payload);
    }

    std::string_view type() const;
    nlohmann::json to_json() const;
};

std::string utc_timestamp();
