#include "subtitle/bundle.hpp"

#include <algorithm>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <fstream>

namespace bundle {

namespace {

constexpr size_t BLOCK = 512;

void put_octal(char* field, size_t width, uint64_t value) {
    // width includes the trailing NUL
    std::snprintf(field, width, "%0*llo", static_cast<int>(width - 1),
                  static_cast<unsigned long long>(value));
}

void append_header(std::vector<char>& out, const Member& m) {
    char h[BLOCK] = {};
    std::memcpy(h, m.name.data(), std::min<size_t>(m.name.size(), 100));
    put_octal(h + 100, 8, 0644);          // mode
    put_octal(h + 108, 8, 0);             // uid
    put_octal(h + 116, 8, 0);             // gid
    put_octal(h + 124, 12, m.data.size());
    put_octal(h + 136, 12, 0);            // mtime
    std::memset(h + 148, ' ', 8);         // checksum placeholder
    h[156] = '0';                          // regular file
    std::memcpy(h + 257, "ustar", 6);
    std::memcpy(h + 263, "00", 2);

    unsigned sum = 0;
    for (unsigned char c : h) sum += c;
    std::snprintf(h + 148, 7, "%06o", sum);
    h[154] = '\0';
    h[155] = ' ';

    out.insert(out.end(), h, h + BLOCK);
}

} // namespace

std::vector<char> build_tar(const std::vector<Member>& members) {
    std::vector<char> out;
    for (const auto& m : members) {
        append_header(out, m);
        out.insert(out.end(), m.data.begin(), m.data.end());
        size_t pad = (BLOCK - m.data.size() % BLOCK) % BLOCK;
        out.insert(out.end(), pad, '\0');
    }
    // Two zero blocks mark the end of the archive.
    out.insert(out.end(), 2 * BLOCK, '\0');
    return out;
}

std::expected<void, std::string> write_tar(const std::string& path, const std::vector<Member>& members) {
    for (const auto& m : members) {
        if (m.name.empty() || m.name.size() > MAX_NAME) {
            return std::unexpected("member name must be 1-100 bytes: " + m.name);
        }
    }

    auto bytes = build_tar(members);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path);
    }
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        return std::unexpected("short write to " + path);
    }
    return {};
}

} // namespace bundle
