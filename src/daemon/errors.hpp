#pragma once

#include <expected>
#include <string>
#include <string_view>

enum class ErrorKind {
    Configuration, // rejected before any processing starts
    NotFound,
    Segment,       // one segment failed, recorded in statistics
    Task,          // aborts the owning task only
    Channel,       // subscriber delivery problem
    Cancelled,
};

struct Error {
    ErrorKind kind = ErrorKind::Task;
    std::string message;
};

inline std::unexpected<Error> make_error(ErrorKind kind, std::string message) {
    return std::unexpected<Error>(Error{kind, std::move(message)});
}

inline std::string_view to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Configuration: return "configuration";
        case ErrorKind::NotFound: return "not_found";
        case ErrorKind::Segment: return "segment";
        case ErrorKind::Task: return "task";
        case ErrorKind::Channel: return "channel";
        case ErrorKind::Cancelled: return "cancelled";
    }
    return "unknown";
}
