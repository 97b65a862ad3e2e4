#pragma once

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <vector>

// RIFF/WAVE PCM reading and writing.
namespace wav {

// Mono float samples in [-1, 1].
struct Audio {
    std::vector<float> samples;
    uint32_t sample_rate = 0;

    int64_t duration_ms() const {
        if (sample_rate == 0) return 0;
        return static_cast<int64_t>(samples.size()) * 1000 / sample_rate;
    }
};

// Encodes samples as 16-bit mono PCM. Out-of-range values are clipped.
std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate);

// Accepts 16-bit integer and 32-bit float PCM with any channel count;
// channels are averaged down to mono.
std::expected<Audio, std::string> decode(std::span<const uint8_t> bytes);

std::expected<Audio, std::string> read_file(const std::string& path);
std::expected<void, std::string> write_file(const std::string& path,
                                            std::span<const float> samples,
                                            uint32_t sample_rate);

} // namespace wav
