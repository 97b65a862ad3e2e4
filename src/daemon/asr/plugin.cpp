#include "asr/plugin.hpp"

std::vector<TranscribeResult> AsrPlugin::transcribe_many(std::span<const AudioClip> clips,
                                                         const PluginOptions& opts,
                                                         std::stop_token stop,
                                                         const ClipDoneFn& on_done) const {
    std::vector<TranscribeResult> results;
    results.reserve(clips.size());

    for (size_t i = 0; i < clips.size(); ++i) {
        const auto& clip = clips[i];
        if (stop.stop_requested()) {
            results.push_back(std::unexpected("cancelled"));
        } else if (!clip.ok()) {
            results.push_back(std::unexpected(clip.error));
        } else {
            results.push_back(transcribe(clip, opts));
        }
        if (on_done) on_done(i, results.back());
    }
    return results;
}
