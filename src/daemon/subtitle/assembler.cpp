#include "subtitle/assembler.hpp"

#include "subtitle/bundle.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <fstream>

namespace fs = std::filesystem;

std::optional<SubtitleFormat> parse_format(std::string_view name) {
    auto n = text::trim(name);
    std::ranges::transform(n, n.begin(), [](unsigned char c) { return std::tolower(c); });
    if (n == "srt") return SubtitleFormat::Srt;
    if (n == "vtt") return SubtitleFormat::Vtt;
    if (n == "lrc") return SubtitleFormat::Lrc;
    if (n == "txt") return SubtitleFormat::Txt;
    return std::nullopt;
}

std::string_view format_name(SubtitleFormat fmt) {
    switch (fmt) {
        case SubtitleFormat::Srt: return "srt";
        case SubtitleFormat::Vtt: return "vtt";
        case SubtitleFormat::Lrc: return "lrc";
        case SubtitleFormat::Txt: return "txt";
    }
    return "txt";
}

std::expected<std::vector<SubtitleFormat>, Error> parse_formats(const std::vector<std::string>& names) {
    std::vector<SubtitleFormat> out;
    for (const auto& name : names) {
        if (text::is_blank(name)) continue;
        auto fmt = parse_format(name);
        if (!fmt) {
            return make_error(ErrorKind::Configuration,
                              "unsupported output format: " + text::trim(name));
        }
        if (std::ranges::find(out, *fmt) == out.end()) out.push_back(*fmt);
    }
    if (out.empty()) {
        return make_error(ErrorKind::Configuration, "no output formats requested");
    }
    return out;
}

std::expected<std::vector<SubtitleFormat>, Error> parse_formats(std::string_view list) {
    std::vector<std::string> names;
    size_t pos = 0;
    while (pos <= list.size()) {
        auto comma = list.find(',', pos);
        names.emplace_back(list.substr(pos, comma == std::string_view::npos ? std::string_view::npos
                                                                            : comma - pos));
        if (comma == std::string_view::npos) break;
        pos = comma + 1;
    }
    return parse_formats(names);
}

namespace subtitle {

namespace {

struct Clock {
    int64_t h, m, s, ms;
};

Clock split(int64_t ms) {
    if (ms < 0) ms = 0;
    return {ms / 3'600'000, (ms / 60'000) % 60, (ms / 1000) % 60, ms % 1000};
}

// CRLF -> LF, trim every line, drop blank ones.
std::vector<std::string> clean_lines(const std::string& s) {
    std::vector<std::string> out;
    for (auto& line : text::split_lines(s)) {
        auto t = text::trim(line);
        if (!t.empty()) out.push_back(std::move(t));
    }
    return out;
}

std::string block_text(const std::string& s) {
    std::string out;
    for (const auto& line : clean_lines(s)) {
        if (!out.empty()) out += '\n';
        out += line;
    }
    return out;
}

std::string srt(const std::vector<SubtitleEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += std::format("{}\n{} --> {}\n{}\n\n", e.sequence, srt_timestamp(e.start_ms),
                           srt_timestamp(e.end_ms), block_text(e.text));
    }
    return out;
}

std::string vtt(const std::vector<SubtitleEntry>& entries) {
    std::string out = "WEBVTT\n\n";
    for (const auto& e : entries) {
        out += std::format("{}\n{} --> {}\n{}\n\n", e.sequence, vtt_timestamp(e.start_ms),
                           vtt_timestamp(e.end_ms), block_text(e.text));
    }
    return out;
}

std::string lrc(const std::vector<SubtitleEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += std::format("[{}]{}\n", lrc_timestamp(e.start_ms), text::join_lines(clean_lines(e.text)));
    }
    return out;
}

std::string txt(const std::vector<SubtitleEntry>& entries) {
    std::string out;
    for (const auto& e : entries) {
        out += text::join_lines(clean_lines(e.text));
        out += '\n';
    }
    return out;
}

} // namespace

std::string srt_timestamp(int64_t ms) {
    auto c = split(ms);
    return std::format("{:02}:{:02}:{:02},{:03}", c.h, c.m, c.s, c.ms);
}

std::string vtt_timestamp(int64_t ms) {
    auto c = split(ms);
    return std::format("{:02}:{:02}:{:02}.{:03}", c.h, c.m, c.s, c.ms);
}

std::string lrc_timestamp(int64_t ms) {
    if (ms < 0) ms = 0;
    return std::format("{:02}:{:02}.{:02}", ms / 60'000, (ms / 1000) % 60, (ms % 1000) / 10);
}

std::vector<SubtitleEntry> build_entries(const std::vector<SegmentResult>& results) {
    std::vector<SubtitleEntry> entries;
    for (const auto& r : results) {
        if (r.status != SegmentStatus::Success || text::is_blank(r.text)) continue;
        entries.push_back({
            .start_ms = r.segment.start_ms,
            .end_ms = r.segment.end_ms,
            .text = r.text,
            .sequence = entries.size() + 1,
        });
    }
    return entries;
}

std::string render(const std::vector<SubtitleEntry>& entries, SubtitleFormat fmt) {
    switch (fmt) {
        case SubtitleFormat::Srt: return srt(entries);
        case SubtitleFormat::Vtt: return vtt(entries);
        case SubtitleFormat::Lrc: return lrc(entries);
        case SubtitleFormat::Txt: return txt(entries);
    }
    return {};
}

std::map<SubtitleFormat, std::string> assemble(const std::vector<SubtitleEntry>& entries,
                                               const std::vector<SubtitleFormat>& formats) {
    std::map<SubtitleFormat, std::string> out;
    for (auto fmt : formats) {
        out.emplace(fmt, render(entries, fmt));
    }
    return out;
}

std::expected<WrittenOutputs, Error> write_outputs(const fs::path& dir, const std::string& base,
                                                   const std::map<SubtitleFormat, std::string>& rendered,
                                                   bool make_bundle) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return make_error(ErrorKind::Task,
                          std::format("cannot create output dir {}: {}", dir.string(), ec.message()));
    }

    WrittenOutputs out;
    std::vector<bundle::Member> members;

    for (const auto& [fmt, content] : rendered) {
        auto name = base + "." + std::string(format_name(fmt));
        auto path = dir / name;

        std::ofstream f(path, std::ios::binary | std::ios::trunc);
        if (!f.is_open()) {
            return make_error(ErrorKind::Task, "cannot write " + path.string());
        }
        f.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!f) {
            return make_error(ErrorKind::Task, "short write to " + path.string());
        }

        out.files.emplace(std::string(format_name(fmt)), path.string());
        if (name.size() > bundle::MAX_NAME) name = "subtitles." + std::string(format_name(fmt));
        members.push_back({.name = name, .data = content});
    }

    if (make_bundle && !members.empty()) {
        auto tar_path = dir / (base + ".subtitles.tar");
        auto res = bundle::write_tar(tar_path.string(), members);
        if (res) {
            out.bundle = tar_path.string();
        } else {
            // Drop a partial archive.
            std::error_code ec;
            if (std::filesystem::is_regular_file(tar_path, ec)) std::filesystem::remove(tar_path, ec);
            out.bundle_error = "bundle: " + res.error();
        }
    }
    return out;
}

} // namespace subtitle
