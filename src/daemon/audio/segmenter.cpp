#include "audio/segmenter.hpp"

#include <algorithm>
#include <cmath>
#include <format>

std::expected<void, Error> validate(const VadOptions& opts) {
    auto in_range = [](int64_t v) {
        return v >= VadOptions::MIN_DURATION_MS && v <= VadOptions::MAX_DURATION_MS;
    };

    if (!in_range(opts.min_speech_duration_ms)) {
        return make_error(ErrorKind::Configuration,
                          std::format("min_speech_duration_ms must be within [{}, {}], got {}",
                                      VadOptions::MIN_DURATION_MS, VadOptions::MAX_DURATION_MS,
                                      opts.min_speech_duration_ms));
    }
    if (!in_range(opts.min_silence_duration_ms)) {
        return make_error(ErrorKind::Configuration,
                          std::format("min_silence_duration_ms must be within [{}, {}], got {}",
                                      VadOptions::MIN_DURATION_MS, VadOptions::MAX_DURATION_MS,
                                      opts.min_silence_duration_ms));
    }
    if (opts.max_speech_duration_ms < std::max<int64_t>(opts.min_speech_duration_ms, 1000)) {
        return make_error(ErrorKind::Configuration,
                          std::format("max_speech_duration_ms must be at least 1000 and at least "
                                      "min_speech_duration_ms, got {}",
                                      opts.max_speech_duration_ms));
    }
    if (opts.frame_ms < 5 || opts.frame_ms > 100) {
        return make_error(ErrorKind::Configuration,
                          std::format("vad frame_ms must be within [5, 100], got {}", opts.frame_ms));
    }
    if (!(opts.energy_threshold > 0.0f && opts.energy_threshold < 1.0f)) {
        return make_error(ErrorKind::Configuration,
                          std::format("vad energy_threshold must be within (0, 1), got {}",
                                      opts.energy_threshold));
    }
    return {};
}

Segmenter::Segmenter(VadOptions opts) : opts_(opts) {}

std::vector<bool> Segmenter::classify_frames(std::span<const float> samples,
                                             size_t frame_len) const {
    size_t frame_count = (samples.size() + frame_len - 1) / frame_len;
    std::vector<bool> speech(frame_count, false);

    for (size_t f = 0; f < frame_count; ++f) {
        auto frame = samples.subspan(f * frame_len,
                                     std::min(frame_len, samples.size() - f * frame_len));
        double energy = 0.0;
        bool finite = true;
        for (float s : frame) {
            if (!std::isfinite(s)) {
                finite = false;
                break;
            }
            energy += static_cast<double>(s) * s;
        }
        if (!finite) continue;

        double rms = std::sqrt(energy / static_cast<double>(frame.size()));
        speech[f] = rms >= opts_.energy_threshold;
    }
    return speech;
}

std::vector<Segment> Segmenter::segment(std::span<const float> samples,
                                        uint32_t sample_rate) const {
    if (samples.empty() || sample_rate == 0) return {};

    size_t frame_len = static_cast<size_t>(sample_rate) * opts_.frame_ms / 1000;
    if (frame_len == 0) return {};

    int64_t total_ms = static_cast<int64_t>(samples.size()) * 1000 / sample_rate;
    auto speech = classify_frames(samples, frame_len);

    // Frame lengths are whole samples, so edges come from sample positions
    // rather than multiples of frame_ms.
    auto edge = [&](size_t f) {
        auto pos = static_cast<int64_t>(f * frame_len);
        return std::min(pos * 1000 / static_cast<int64_t>(sample_rate), total_ms);
    };

    // Raw runs of speech frames, as [first, last) frame indices.
    struct Run { size_t first; size_t last; };
    std::vector<Run> runs;
    for (size_t f = 0; f < speech.size(); ++f) {
        if (!speech[f]) continue;
        if (!runs.empty() && runs.back().last == f) {
            runs.back().last = f + 1;
        } else {
            runs.push_back({f, f + 1});
        }
    }

    // Bridge short pauses.
    std::vector<Run> merged;
    for (const auto& r : runs) {
        if (!merged.empty() && edge(r.first) - edge(merged.back().last) < opts_.min_silence_duration_ms) {
            merged.back().last = r.last;
        } else {
            merged.push_back(r);
        }
    }

    std::vector<Segment> segments;
    for (auto r : merged) {
        if (edge(r.last) - edge(r.first) < opts_.min_speech_duration_ms) continue;

        // Split at the last frame edge that keeps each piece within the limit.
        while (edge(r.last) - edge(r.first) > opts_.max_speech_duration_ms) {
            size_t cut = r.first + 1;
            while (cut + 1 < r.last && edge(cut + 1) - edge(r.first) <= opts_.max_speech_duration_ms) {
                ++cut;
            }
            segments.push_back({edge(r.first), edge(cut), segments.size()});
            r.first = cut;
        }
        if (edge(r.last) > edge(r.first)) {
            segments.push_back({edge(r.first), edge(r.last), segments.size()});
        }
    }
    return segments;
}
