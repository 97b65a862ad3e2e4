#include "progress/progress_event.hpp"

#include <chrono>
#include <format>

namespace {

template <class... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

} // namespace

std::string_view ProgressEvent::type() const {
    return std::visit(overloaded{
        [](const ProgressUpdate&) { return std::string_view("progress"); },
        [](const LogLine&) { return std::string_view("log"); },
        [](const ErrorReport&) { return std::string_view("error"); },
        [](const Completion&) { return std::string_view("completion"); },
    }, payload);
}

nlohmann::json ProgressEvent::to_json() const {
    nlohmann::json j = {
        {"type", type()},
        {"task_id", task_id},
        {"seq", seq},
        {"timestamp", timestamp},
    };

    std::visit(overloaded{
        [&j](const ProgressUpdate& p) {
            j["step"] = p.step;
            j["progress"] = p.percent;
            j["message"] = p.message;
            j["details"] = p.details;
        },
        [&j](const LogLine& l) {
            j["level"] = l.level;
            j["message"] = l.message;
            j["details"] = l.details;
        },
        [&j](const ErrorReport& e) {
            j["message"] = e.message;
            j["details"] = e.details;
        },
        [&j](const Completion& c) {
            j["result"] = c.result;
        },
    }, payload);
    return j;
}

std::string utc_timestamp() {
    auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
    return std::format("{:%FT%T}Z", now);
}
