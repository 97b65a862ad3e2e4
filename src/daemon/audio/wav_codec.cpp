#include "wav_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t read_u32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

} // namespace

std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate) {
    constexpr uint16_t channels = 1;
    constexpr uint16_t bits_per_sample = 16;
    uint32_t byte_rate = sample_rate * channels * bits_per_sample / 8;
    uint16_t block_align = channels * bits_per_sample / 8;
    uint32_t data_size = static_cast<uint32_t>(samples.size() * sizeof(int16_t));
    uint32_t file_size = 36 + data_size;

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(file_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(FORMAT_PCM);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);

    uint8_t* dst = out.data() + 44;
    for (float s : samples) {
        float clipped = std::isfinite(s) ? std::clamp(s, -1.0f, 1.0f) : 0.0f;
        auto v = static_cast<int16_t>(std::lround(clipped * 32767.0f));
        std::memcpy(dst, &v, sizeof(v));
        dst += sizeof(v);
    }

    return out;
}

std::expected<Audio, std::string> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    const uint8_t* data = nullptr;
    size_t data_size = 0;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        size_t chunk_size = read_u32(chunk + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (tag_is(chunk, "fmt ")) {
            if (chunk_size < 16 || avail < 16) {
                return std::unexpected("truncated fmt chunk");
            }
            format = read_u16(chunk + 8);
            channels = read_u16(chunk + 10);
            sample_rate = read_u32(chunk + 12);
            bits = read_u16(chunk + 22);
            if (format == FORMAT_EXTENSIBLE && chunk_size >= 40 && avail >= 40) {
                // First two bytes of the sub-format GUID carry the real format tag.
                format = read_u16(chunk + 32);
            }
        } else if (tag_is(chunk, "data")) {
            data = chunk + 8;
            // Streaming writers leave the size at 0 or 0xFFFFFFFF; take what is there.
            data_size = (chunk_size == 0 || chunk_size > avail) ? avail : chunk_size;
            break;
        }

        // Chunks are padded to even sizes.
        pos = body + chunk_size + (chunk_size & 1);
    }

    if (channels == 0 || sample_rate == 0) {
        return std::unexpected("missing or invalid fmt chunk");
    }
    if (!data) {
        return std::unexpected("missing data chunk");
    }

    bool pcm16 = format == FORMAT_PCM && bits == 16;
    bool float32 = format == FORMAT_FLOAT && bits == 32;
    if (!pcm16 && !float32) {
        return std::unexpected("unsupported sample format (need 16-bit PCM or 32-bit float)");
    }

    size_t frame_bytes = static_cast<size_t>(channels) * (bits / 8);
    size_t frames = data_size / frame_bytes;

    Audio audio;
    audio.sample_rate = sample_rate;
    audio.samples.resize(frames);

    for (size_t f = 0; f < frames; ++f) {
        const uint8_t* frame = data + f * frame_bytes;
        float sum = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            if (pcm16) {
                int16_t v;
                std::memcpy(&v, frame + c * 2, 2);
                sum += static_cast<float>(v) / 32768.0f;
            } else {
                float v;
                std::memcpy(&v, frame + c * 4, 4);
                sum += v;
            }
        }
        audio.samples[f] = sum / channels;
    }

    return audio;
}

std::expected<Audio, std::string> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected("cannot open " + path);
    }
    std::vector<uint8_t> bytes{std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>()};
    auto audio = decode(bytes);
    if (!audio) {
        return std::unexpected(path + ": " + audio.error());
    }
    return audio;
}

std::expected<void, std::string> write_file(const std::string& path,
                                            std::span<const float> samples,
                                            uint32_t sample_rate) {
    auto bytes = encode(samples, sample_rate);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected("cannot create " + path);
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        return std::unexpected("write failed: " + path);
    }
    return {};
}

} // namespace wav
