#include "audio/segment_exporter.hpp"

#include <algorithm>
#include <format>

namespace fs = std::filesystem;

SegmentExporter::SegmentExporter(fs::path dir) : dir_(std::move(dir)) {}

std::string SegmentExporter::clip_filename(size_t index) {
    return std::format("segment_{:04d}.wav", index + 1);
}

std::vector<AudioClip> SegmentExporter::export_segments(const wav::Audio& audio,
                                                        const std::vector<Segment>& segments) const {
    std::vector<AudioClip> clips;
    clips.reserve(segments.size());

    if (!dir_.empty() && !segments.empty()) {
        std::error_code ec;
        fs::create_directories(dir_, ec);
        if (ec) {
            // Every clip fails individually; the task itself carries on.
            for (const auto& seg : segments) {
                AudioClip clip;
                clip.segment = seg;
                clip.sample_rate = audio.sample_rate;
                clip.error = "cannot create " + dir_.string() + ": " + ec.message();
                clips.push_back(std::move(clip));
            }
            return clips;
        }
    }

    for (const auto& seg : segments) {
        clips.push_back(export_one(audio, seg));
    }
    return clips;
}

AudioClip SegmentExporter::export_one(const wav::Audio& audio, const Segment& seg) const {
    AudioClip clip;
    clip.segment = seg;
    clip.sample_rate = audio.sample_rate;

    auto to_sample = [&audio](int64_t ms) {
        auto pos = ms * static_cast<int64_t>(audio.sample_rate) / 1000;
        return static_cast<size_t>(std::clamp<int64_t>(pos, 0, static_cast<int64_t>(audio.samples.size())));
    };

    size_t first = to_sample(seg.start_ms);
    size_t last = to_sample(seg.end_ms);
    if (last <= first) {
        clip.error = std::format("segment {} [{}ms, {}ms] lies outside the audio",
                                 seg.index + 1, seg.start_ms, seg.end_ms);
        return clip;
    }

    clip.samples.assign(audio.samples.begin() + static_cast<std::ptrdiff_t>(first),
                        audio.samples.begin() + static_cast<std::ptrdiff_t>(last));

    if (!dir_.empty()) {
        auto path = dir_ / clip_filename(seg.index);
        auto res = wav::write_file(path.string(), clip.samples, clip.sample_rate);
        if (!res) {
            clip.error = res.error();
            return clip;
        }
        clip.path = path.string();
    }
    return clip;
}
