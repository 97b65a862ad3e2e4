#pragma once

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

// Uncompressed POSIX ustar archive of the rendered subtitle files.
namespace bundle {

inline constexpr size_t MAX_NAME = 100;

struct Member {
    std::string name; // at most MAX_NAME bytes
    std::string data;
};

// Entries get mode 0644 and mtime 0, so identical input gives identical bytes.
std::vector<char> build_tar(const std::vector<Member>& members);

std::expected<void, std::string> write_tar(const std::string& path, const std::vector<Member>& members);

} // namespace bundle
