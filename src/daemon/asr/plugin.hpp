#pragma once

#include "audio/segment_exporter.hpp"
#include "errors.hpp"

#include <cstddef>
#include <expected>
#include <functional>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

// Per-task settings handed to a plugin. Which fields matter depends on the plugin.
struct PluginOptions {
    std::string endpoint;
    std::string api_key;
    std::string model;
    std::string language = "auto";
    std::string prompt;
    long timeout_s = 60;
};

using TranscribeResult = std::expected<std::string, std::string>;

// Reports one finished clip by its position in the batch.
using ClipDoneFn = std::function<void(size_t index, const TranscribeResult& result)>;

// A transcription back-end. Implementations must be safe to call from
// several threads at once; per-call state lives on the stack.
class AsrPlugin {
public:
    virtual ~AsrPlugin() = default;

    virtual std::string name() const = 0;
    virtual std::string description() const = 0;

    // Checks that the fields this back-end needs are present and sane.
    virtual std::expected<void, Error> validate(const PluginOptions& opts) const = 0;

    // Returns the raw transcription of one clip; blank text means no speech.
    virtual TranscribeResult transcribe(const AudioClip& clip, const PluginOptions& opts) const = 0;

    // Transcribes clips in order. Stops starting new clips once stop is
    // requested; the remaining slots are filled with "cancelled".
    // on_done runs once per clip, in order, as soon as its result is known.
    virtual std::vector<TranscribeResult> transcribe_many(std::span<const AudioClip> clips,
                                                          const PluginOptions& opts,
                                                          std::stop_token stop = {},
                                                          const ClipDoneFn& on_done = {}) const;
};
