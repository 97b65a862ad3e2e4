#pragma once

#include "audio/wav_codec.hpp"
#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

struct Segment {
    int64_t start_ms = 0;
    int64_t end_ms = 0;
    size_t index = 0;

    int64_t duration_ms() const { return end_ms - start_ms; }
    bool operator==(const Segment&) const = default;
};

struct VadOptions {
    static constexpr int64_t MIN_DURATION_MS = 100;
    static constexpr int64_t MAX_DURATION_MS = 5000;

    int64_t min_speech_duration_ms = 500;
    int64_t min_silence_duration_ms = 500;
    // Longer speech is cut into consecutive pieces no longer than this.
    int64_t max_speech_duration_ms = 60000;
    int64_t frame_ms = 10;
    float energy_threshold = 0.02f;
};

// Out-of-range values are rejected, never clamped.
std::expected<void, Error> validate(const VadOptions& opts);

// Energy-based voice activity detection over a mono waveform.
class Segmenter {
public:
    // Options must have passed validate().
    explicit Segmenter(VadOptions opts);

    // Ordered, non-overlapping intervals, each at most max_speech long.
    // Every region of speech at least min_speech long is covered.
    // Silence or garbage input yields an empty list.
    std::vector<Segment> segment(std::span<const float> samples, uint32_t sample_rate) const;
    std::vector<Segment> segment(const wav::Audio& audio) const {
        return segment(audio.samples, audio.sample_rate);
    }

    const VadOptions& options() const { return opts_; }

private:
    // One flag per frame: true when the frame's RMS reaches the threshold.
    std::vector<bool> classify_frames(std::span<const float> samples, size_t frame_len) const;

    VadOptions opts_;
};
