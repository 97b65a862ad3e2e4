#include <catch2/catch_test_macros.hpp>

#include "asr/dispatcher.hpp"
#include "test_helpers.hpp"
#include "text_util.hpp"

#include <algorithm>
#include <chrono>
#include <mutex>
#include <random>
#include <span>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace {

std::vector<AudioClip> make_clips(size_t n) {
    std::vector<AudioClip> clips;
    for (size_t i = 0; i < n; ++i) {
        clips.push_back({
            .segment = {static_cast<int64_t>(i) * 2000, static_cast<int64_t>(i) * 2000 + 1000, i},
            .samples = std::vector<float>(1600, 0.1f),
            .sample_rate = 16000,
        });
    }
    return clips;
}

// Sleeps a random 0-20 ms so results arrive out of order.
TranscribeResult jittered(const AudioClip& clip) {
    thread_local std::mt19937 rng(std::random_device{}());
    std::uniform_int_distribution<int> ms(0, 20);
    std::this_thread::sleep_for(std::chrono::milliseconds(ms(rng)));
    return test::numbered(clip);
}

} // namespace

TEST_CASE("classify", "[dispatch]") {
    Segment seg{0, 1000, 0};

    SECTION("Text") {
        auto r = classify(seg, TranscribeResult("  hi there \n"));
        REQUIRE(r.status == SegmentStatus::Success);
        REQUIRE(r.text == "hi there");
    }

    SECTION("BlankIsEmpty") {
        auto r = classify(seg, TranscribeResult(" \n\t"));
        REQUIRE(r.status == SegmentStatus::Empty);
        REQUIRE(r.text.empty());
    }

    SECTION("ErrorIsFailed") {
        auto r = classify(seg, TranscribeResult(std::unexpected("timeout")));
        REQUIRE(r.status == SegmentStatus::Failed);
        REQUIRE(r.error == "timeout");
    }

    SECTION("IllFormedUtf8IsReplaced") {
        auto r = classify(seg, TranscribeResult("caf\xe9"));
        REQUIRE(r.status == SegmentStatus::Success);
        REQUIRE(r.text == "caf\xEF\xBF\xBD");

        auto failed = classify(seg, TranscribeResult(std::unexpected("HTTP 500: \xc3")));
        REQUIRE(failed.error == "HTTP 500: \xEF\xBF\xBD");
    }
}

TEST_CASE("to_valid_utf8", "[dispatch]") {
    REQUIRE(text::to_valid_utf8("plain") == "plain");
    REQUIRE(text::to_valid_utf8("\xE4\xBD\xA0\xE5\xA5\xBD") == "\xE4\xBD\xA0\xE5\xA5\xBD");
    REQUIRE(text::to_valid_utf8("\xF0\x9F\x8E\xA4") == "\xF0\x9F\x8E\xA4");
    // Overlong slash, a surrogate and a truncated sequence.
    REQUIRE(text::to_valid_utf8("\xC0\xAF") == "\xEF\xBF\xBD\xEF\xBF\xBD");
    REQUIRE(text::to_valid_utf8("\xED\xA0\x80") == "\xEF\xBF\xBD\xEF\xBF\xBD\xEF\xBF\xBD");
    REQUIRE(text::to_valid_utf8("ab\xE4\xBD") == "ab\xEF\xBF\xBD\xEF\xBF\xBD");
}

TEST_CASE("Dispatcher", "[dispatch]") {

    SECTION("ResultsKeepClipOrder") {
        auto clips = make_clips(12);
        test::MockPlugin plugin(jittered);
        Dispatcher dispatcher({.max_concurrency = 4});

        auto out = dispatcher.run(clips, plugin, {});
        REQUIRE(out.results.size() == 12);
        for (size_t i = 0; i < out.results.size(); ++i) {
            REQUIRE(out.results[i].segment == clips[i].segment);
            REQUIRE(out.results[i].text == "segment " + std::to_string(i + 1));
        }
        REQUIRE_FALSE(out.cancelled);
        REQUIRE(out.stats.total_segments == 12);
        REQUIRE(out.stats.successful_transcriptions == 12);
        REQUIRE(out.stats.total_subtitles == 12);
    }

    SECTION("ConcurrencyIsBounded") {
        auto clips = make_clips(10);
        test::MockPlugin plugin([](const AudioClip& clip) {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
            return test::numbered(clip);
        });
        Dispatcher dispatcher({.max_concurrency = 3});

        dispatcher.run(clips, plugin, {});
        REQUIRE(plugin.calls() == 10);
        REQUIRE(plugin.peak_in_flight() <= 3);
    }

    SECTION("OneFailureDoesNotAbortOthers") {
        auto clips = make_clips(5);
        test::MockPlugin plugin([](const AudioClip& clip) -> TranscribeResult {
            if (clip.segment.index == 2) return std::unexpected("HTTP 500: boom");
            if (clip.segment.index == 4) return std::string("   ");
            return test::numbered(clip);
        });
        Dispatcher dispatcher({.max_concurrency = 2});

        auto out = dispatcher.run(clips, plugin, {});
        REQUIRE(plugin.calls() == 5);
        REQUIRE(out.results[2].status == SegmentStatus::Failed);
        REQUIRE(out.results[2].error == "HTTP 500: boom");
        REQUIRE(out.results[4].status == SegmentStatus::Empty);
        REQUIRE(out.stats == TaskStats{
            .total_segments = 5,
            .successful_transcriptions = 3,
            .empty_segments = 1,
            .failed_segments = 1,
            .total_subtitles = 3,
        });
    }

    SECTION("BrokenClipSkipsThePlugin") {
        auto clips = make_clips(3);
        clips[1].error = "cannot write segment";
        test::MockPlugin plugin(test::numbered);
        Dispatcher dispatcher({.max_concurrency = 2});

        auto out = dispatcher.run(clips, plugin, {});
        REQUIRE(plugin.calls() == 2);
        REQUIRE(out.results[1].status == SegmentStatus::Failed);
        REQUIRE(out.results[1].error == "cannot write segment");
    }

    SECTION("ProgressCallback") {
        auto clips = make_clips(6);
        test::MockPlugin plugin(jittered);
        Dispatcher dispatcher({.max_concurrency = 3});

        // Callbacks run on worker threads; check the record afterwards.
        struct Call { size_t index; size_t segment; size_t done; size_t total; };
        std::vector<Call> calls;
        dispatcher.run(clips, plugin, {}, {},
                       [&](size_t index, const SegmentResult& r, size_t done, size_t total) {
                           calls.push_back({index, r.segment.index, done, total});
                       });

        REQUIRE(calls.size() == 6);
        std::vector<bool> seen(6, false);
        for (size_t i = 0; i < calls.size(); ++i) {
            REQUIRE(calls[i].done == i + 1);
            REQUIRE(calls[i].total == 6);
            REQUIRE(calls[i].segment == calls[i].index);
            seen[calls[i].index] = true;
        }
        REQUIRE(std::ranges::all_of(seen, [](bool b) { return b; }));
    }

    SECTION("CancellationMarksRemainder") {
        auto clips = make_clips(8);
        std::stop_source stop;
        test::MockPlugin plugin([&stop](const AudioClip& clip) {
            if (clip.segment.index == 1) {
                stop.request_stop();
            } else {
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
            return test::numbered(clip);
        });
        Dispatcher dispatcher({.max_concurrency = 2});

        auto out = dispatcher.run(clips, plugin, {}, stop.get_token());
        REQUIRE(out.cancelled);
        REQUIRE(out.results.size() == 8);
        REQUIRE(plugin.calls() < 8);
        REQUIRE(out.results[7].status == SegmentStatus::Failed);
        REQUIRE(out.results[7].error == "cancelled");
    }

    SECTION("SequentialPath") {
        auto clips = make_clips(4);
        test::MockPlugin plugin([](const AudioClip& clip) -> TranscribeResult {
            if (clip.segment.index == 0) return std::unexpected("refused");
            return test::numbered(clip);
        });
        Dispatcher dispatcher({.max_concurrency = 1});

        std::vector<size_t> order;
        auto out = dispatcher.run(clips, plugin, {}, {},
                                  [&](size_t index, const SegmentResult&, size_t, size_t) { order.push_back(index); });
        REQUIRE(order == std::vector<size_t>{0, 1, 2, 3});
        REQUIRE(plugin.peak_in_flight() == 1);
        REQUIRE(out.stats.failed_segments == 1);
        REQUIRE(out.stats.successful_transcriptions == 3);
        REQUIRE(out.results[3].text == "segment 4");
    }

    SECTION("SequentialResultsArriveAsClipsFinish") {
        auto clips = make_clips(4);
        test::MockPlugin plugin(test::numbered);
        Dispatcher dispatcher({.max_concurrency = 1});

        std::vector<int> calls_seen;
        std::vector<size_t> completed_seen;
        dispatcher.run(clips, plugin, {}, {},
                       [&](size_t, const SegmentResult&, size_t completed, size_t) {
                           calls_seen.push_back(plugin.calls());
                           completed_seen.push_back(completed);
                       });
        REQUIRE(calls_seen == std::vector<int>{1, 2, 3, 4});
        REQUIRE(completed_seen == std::vector<size_t>{1, 2, 3, 4});
    }

    SECTION("WholeBatchBackEnd") {
        // Answers only once every clip is done and reports nothing per clip.
        class WholeBatch : public test::MockPlugin {
        public:
            WholeBatch() : test::MockPlugin(test::numbered) {}
            std::vector<TranscribeResult> transcribe_many(std::span<const AudioClip> clips, const PluginOptions&,
                                                          std::stop_token, const ClipDoneFn&) const override {
                return {TranscribeResult("first"), TranscribeResult(std::string(clips.size(), 'x'))};
            }
        };
        auto clips = make_clips(3);
        WholeBatch plugin;
        Dispatcher dispatcher({.max_concurrency = 1});

        std::vector<size_t> order;
        auto out = dispatcher.run(clips, plugin, {}, {},
                                  [&](size_t index, const SegmentResult&, size_t, size_t) { order.push_back(index); });
        REQUIRE(order == std::vector<size_t>{0, 1, 2});
        REQUIRE(out.results[0].text == "first");
        REQUIRE(out.results[1].text == "xxx");
        REQUIRE(out.results[2].status == SegmentStatus::Failed);
        REQUIRE(out.results[2].error == "no result from plugin");
    }

    SECTION("SequentialCancellation") {
        auto clips = make_clips(4);
        std::stop_source stop;
        test::MockPlugin plugin([&stop](const AudioClip& clip) {
            stop.request_stop();
            return test::numbered(clip);
        });
        Dispatcher dispatcher({.max_concurrency = 1});

        auto out = dispatcher.run(clips, plugin, {}, stop.get_token());
        REQUIRE(out.cancelled);
        REQUIRE(plugin.calls() == 1);
        REQUIRE(out.results[0].status == SegmentStatus::Success);
        REQUIRE(out.stats.failed_segments == 3);
    }

    SECTION("NoClips") {
        test::MockPlugin plugin(test::numbered);
        auto out = Dispatcher{}.run({}, plugin, {});
        REQUIRE(out.results.empty());
        REQUIRE(out.stats == TaskStats{});
        REQUIRE(plugin.calls() == 0);
    }
}

TEST_CASE("TaskStats json", "[dispatch]") {
    TaskStats stats{.total_segments = 4, .successful_transcriptions = 2, .empty_segments = 1,
                    .failed_segments = 1, .total_subtitles = 2};
    auto j = to_json(stats);
    REQUIRE(j["failed_segments"] == 1);
    REQUIRE(stats_from_json(j) == stats);
    REQUIRE(stats_from_json(nlohmann::json("nonsense")) == TaskStats{});
}
