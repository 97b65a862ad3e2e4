#include "storage/workspace.hpp"

#include <print>

namespace fs = std::filesystem;

Workspace::Workspace(fs::path upload_dir, fs::path output_dir)
    : upload_dir_(std::move(upload_dir)), output_dir_(std::move(output_dir)) {}

std::expected<fs::path, Error> Workspace::stage_upload(const std::string& task_id,
                                                       const fs::path& source) const {
    std::error_code ec;
    if (!fs::is_regular_file(source, ec)) {
        return make_error(ErrorKind::Configuration, "source file not found: " + source.string());
    }

    auto dir = upload_dir_ / task_id;
    fs::create_directories(dir, ec);
    if (ec) {
        return make_error(ErrorKind::Task, "cannot create " + dir.string() + ": " + ec.message());
    }

    auto dest = dir / source.filename();
    fs::copy_file(source, dest, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        return make_error(ErrorKind::Task, "cannot stage " + source.string() + ": " + ec.message());
    }
    return dest;
}

fs::path Workspace::task_dir(const std::string& task_id) const {
    return output_dir_ / task_id;
}

fs::path Workspace::segments_dir(const std::string& task_id) const {
    return task_dir(task_id) / "segments";
}

bool Workspace::cleanup_temp(const std::string& task_id) const {
    std::error_code ec;
    fs::remove_all(segments_dir(task_id), ec);
    if (ec) {
        std::println(stderr, "workspace: cleanup of {} failed: {}", task_id, ec.message());
        return false;
    }
    return true;
}

bool Workspace::remove_upload(const std::string& task_id) const {
    std::error_code ec;
    fs::remove_all(upload_dir_ / task_id, ec);
    if (ec) {
        std::println(stderr, "workspace: removing upload of {} failed: {}", task_id, ec.message());
        return false;
    }
    return true;
}
