#pragma once

#include "audio/segmenter.hpp"
#include "audio/wav_codec.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// One exported speech interval, ready for transcription.
struct AudioClip {
    Segment segment;
    std::vector<float> samples;
    uint32_t sample_rate = 0;
    std::string path;   // empty when clips are kept in memory only
    std::string error;  // set when the export of this clip failed

    bool ok() const { return error.empty(); }
    double duration_s() const {
        return sample_rate ? static_cast<double>(samples.size()) / sample_rate : 0.0;
    }
};

class SegmentExporter {
public:
    // With an empty directory clips stay in memory and nothing touches disk.
    explicit SegmentExporter(std::filesystem::path dir = {});

    // Returns exactly one clip per segment, in segment order. A clip that
    // cannot be produced carries an error instead of aborting the export.
    std::vector<AudioClip> export_segments(const wav::Audio& audio,
                                           const std::vector<Segment>& segments) const;

    const std::filesystem::path& dir() const { return dir_; }

    static std::string clip_filename(size_t index);

private:
    AudioClip export_one(const wav::Audio& audio, const Segment& seg) const;

    std::filesystem::path dir_;
};
