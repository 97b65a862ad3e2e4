#pragma once

#include "asr/dispatcher.hpp"
#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

enum class SubtitleFormat { Srt, Vtt, Lrc, Txt };

std::optional<SubtitleFormat> parse_format(std::string_view name);
std::string_view format_name(SubtitleFormat fmt);

// Accepts "srt,vtt" style lists. Duplicates collapse; unknown names are rejected.
std::expected<std::vector<SubtitleFormat>, Error> parse_formats(std::string_view list);
std::expected<std::vector<SubtitleFormat>, Error> parse_formats(const std::vector<std::string>& names);

struct SubtitleEntry {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    std::string text;
    size_t sequence = 0; // 1-based

    bool operator==(const SubtitleEntry&) const = default;
};

namespace subtitle {

// HH:MM:SS,mmm (SRT) / HH:MM:SS.mmm (VTT) / MM:SS.cc (LRC)
std::string srt_timestamp(int64_t ms);
std::string vtt_timestamp(int64_t ms);
std::string lrc_timestamp(int64_t ms);

// Only successful results become entries; empty and failed segments are
// left out of every format and the remaining entries are renumbered 1..n.
std::vector<SubtitleEntry> build_entries(const std::vector<SegmentResult>& results);

std::string render(const std::vector<SubtitleEntry>& entries, SubtitleFormat fmt);

// Pure: the same entries always produce byte-identical output.
std::map<SubtitleFormat, std::string> assemble(const std::vector<SubtitleEntry>& entries,
                                               const std::vector<SubtitleFormat>& formats);

struct WrittenOutputs {
    std::map<std::string, std::string> files; // format name -> path
    std::string bundle;                        // empty when not bundled
    std::string bundle_error;                  // why a requested bundle is missing
};

// Writes <dir>/<base>.<fmt> for each rendering, plus <base>.subtitles.tar when make_bundle is set.
// Members are named <base>.<fmt>, or subtitles.<fmt> when that does not fit a tar header.
// A bundle that cannot be written leaves the subtitle files in place.
std::expected<WrittenOutputs, Error> write_outputs(const std::filesystem::path& dir,
                                                   const std::string& base,
                                                   const std::map<SubtitleFormat, std::string>& rendered,
                                                   bool make_bundle);

} // namespace subtitle
