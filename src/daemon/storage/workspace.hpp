#pragma once

#include "errors.hpp"

#include <expected>
#include <filesystem>
#include <string>

// On-disk layout for tasks:
//   <upload_dir>/<task_id>/<file>        staged copy of the submitted audio
//   <output_dir>/<task_id>/segments/     exported clips (temporary)
//   <output_dir>/<task_id>/<base>.<fmt>  subtitle files and bundle
class Workspace {
public:
    Workspace(std::filesystem::path upload_dir, std::filesystem::path output_dir);

    // Copies source into the task's upload directory and returns the new path.
    std::expected<std::filesystem::path, Error> stage_upload(const std::string& task_id,
                                                             const std::filesystem::path& source) const;

    std::filesystem::path task_dir(const std::string& task_id) const;
    std::filesystem::path segments_dir(const std::string& task_id) const;

    // Removes exported clips, keeps subtitle outputs.
    bool cleanup_temp(const std::string& task_id) const;
    bool remove_upload(const std::string& task_id) const;

    const std::filesystem::path& upload_dir() const { return upload_dir_; }
    const std::filesystem::path& output_dir() const { return output_dir_; }

private:
    std::filesystem::path upload_dir_;
    std::filesystem::path output_dir_;
};
