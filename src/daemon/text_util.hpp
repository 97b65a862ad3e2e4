#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace text {

inline constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

inline std::string trim(std::string_view s) {
    auto start = s.find_first_not_of(WHITESPACE);
    if (start == std::string_view::npos) return {};
    auto end = s.find_last_not_of(WHITESPACE);
    return std::string(s.substr(start, end - start + 1));
}

inline bool is_blank(std::string_view s) {
    return s.find_first_not_of(WHITESPACE) == std::string_view::npos;
}

inline std::string truncate(std::string_view s, size_t max_len) {
    if (s.size() <= max_len) return std::string(s);
    return std::string(s.substr(0, max_len)) + "...";
}

// Replaces every byte that is not part of a well-formed UTF-8 sequence
// with U+FFFD. Back-ends are free to answer in any encoding.
inline std::string to_valid_utf8(std::string_view s) {
    static constexpr std::string_view REPLACEMENT = "\xEF\xBF\xBD";

    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        auto b = static_cast<unsigned char>(s[i]);
        size_t len = 0;
        unsigned char lo = 0x80, hi = 0xBF;
        if (b < 0x80) len = 1;
        else if (b >= 0xC2 && b <= 0xDF) len = 2;
        else if (b >= 0xE0 && b <= 0xEF) {
            len = 3;
            if (b == 0xE0) lo = 0xA0;      // overlong
            else if (b == 0xED) hi = 0x9F; // surrogates
        } else if (b >= 0xF0 && b <= 0xF4) {
            len = 4;
            if (b == 0xF0) lo = 0x90;
            else if (b == 0xF4) hi = 0x8F;
        }

        bool ok = len > 0 && i + len <= s.size();
        for (size_t k = 1; ok && k < len; ++k) {
            auto c = static_cast<unsigned char>(s[i + k]);
            ok = k == 1 ? (c >= lo && c <= hi) : (c >= 0x80 && c <= 0xBF);
        }

        if (ok) {
            out.append(s.substr(i, len));
            i += len;
        } else {
            out.append(REPLACEMENT);
            ++i;
        }
    }
    return out;
}

// Splits on '\n', dropping any '\r' before it.
inline std::vector<std::string> split_lines(std::string_view s) {
    std::vector<std::string> lines;
    size_t pos = 0;
    while (pos <= s.size()) {
        auto nl = s.find('\n', pos);
        auto line = s.substr(pos, nl == std::string_view::npos ? std::string_view::npos : nl - pos);
        if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
        lines.emplace_back(line);
        if (nl == std::string_view::npos) break;
        pos = nl + 1;
    }
    return lines;
}

// Trims each part, skips blank ones, joins with single spaces.
inline std::string join_lines(const std::vector<std::string>& parts) {
    std::string out;
    for (const auto& p : parts) {
        auto t = trim(p);
        if (t.empty()) continue;
        if (!out.empty()) out += ' ';
        out += t;
    }
    return out;
}

} // namespace text
