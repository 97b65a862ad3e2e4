#include <catch2/catch_test_macros.hpp>

#include "audio/segment_exporter.hpp"
#include "audio/segmenter.hpp"
#include "test_helpers.hpp"

#include <cstdlib>
#include <filesystem>
#include <limits>
#include <vector>

TEST_CASE("Segmenter", "[vad]") {
    constexpr uint32_t rate = 16000;
    Segmenter segmenter(VadOptions{});

    SECTION("SingleUtterance") {
        auto samples = test::speech_like(rate, 10'000, {{2000, 5000}});
        auto segments = segmenter.segment(samples, rate);
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].start_ms == 2000);
        REQUIRE(segments[0].end_ms == 5000);
        REQUIRE(segments[0].index == 0);
    }

    SECTION("OrderedAndDisjoint") {
        auto samples = test::speech_like(rate, 9000, {{500, 1500}, {3000, 4000}, {6000, 8500}});
        auto segments = segmenter.segment(samples, rate);
        REQUIRE(segments.size() == 3);
        for (size_t i = 0; i < segments.size(); ++i) {
            REQUIRE(segments[i].index == i);
            REQUIRE(segments[i].start_ms < segments[i].end_ms);
            if (i > 0) REQUIRE(segments[i - 1].end_ms <= segments[i].start_ms);
        }
    }

    SECTION("ShortPausesAreBridged") {
        // 200 ms gap is below the 500 ms minimum silence.
        auto samples = test::speech_like(rate, 4000, {{1000, 1800}, {2000, 3000}});
        auto segments = segmenter.segment(samples, rate);
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].start_ms == 1000);
        REQUIRE(segments[0].end_ms == 3000);
    }

    SECTION("ShortBurstsAreDropped") {
        // 200 ms of sound is below the 500 ms minimum speech.
        auto samples = test::speech_like(rate, 4000, {{1000, 1200}, {2000, 3000}});
        auto segments = segmenter.segment(samples, rate);
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].start_ms == 2000);
        for (const auto& s : segments) {
            REQUIRE(s.duration_ms() >= 500);
        }
    }

    SECTION("Deterministic") {
        auto samples = test::speech_like(rate, 9000, {{500, 1500}, {3000, 4000}, {6000, 8500}});
        auto first = segmenter.segment(samples, rate);
        auto second = segmenter.segment(samples, rate);
        REQUIRE(first == second);
    }

    SECTION("SilenceYieldsNothing") {
        std::vector<float> silence(rate * 3, 0.0f);
        REQUIRE(segmenter.segment(silence, rate).empty());
    }

    SECTION("GarbageYieldsNothing") {
        std::vector<float> nan(rate, std::numeric_limits<float>::quiet_NaN());
        REQUIRE(segmenter.segment(nan, rate).empty());
        REQUIRE(segmenter.segment(std::vector<float>{}, rate).empty());
        REQUIRE(segmenter.segment(std::vector<float>(100, 0.5f), 0).empty());
    }

    SECTION("SpeechUntilTheEnd") {
        auto samples = test::speech_like(rate, 3000, {{1000, 3000}});
        auto segments = segmenter.segment(samples, rate);
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].end_ms == 3000);
    }

    SECTION("LongSpeechIsSplit") {
        Segmenter capped(VadOptions{.max_speech_duration_ms = 2000});
        auto samples = test::speech_like(rate, 7000, {{1000, 6000}});
        auto segments = capped.segment(samples, rate);
        REQUIRE(segments.size() == 3);
        REQUIRE(segments[0] == Segment{1000, 3000, 0});
        REQUIRE(segments[1] == Segment{3000, 5000, 1});
        REQUIRE(segments[2] == Segment{5000, 6000, 2});
    }
}

TEST_CASE("Segmenter at 22050 Hz", "[vad]") {
    // A 10 ms frame is 220 samples here, slightly shorter than 10 ms.
    constexpr uint32_t rate = 22050;
    Segmenter segmenter(VadOptions{});

    SECTION("NoDriftLateInLongFile") {
        auto samples = test::speech_like(rate, 600'000, {{590'000, 595'000}});
        auto segments = segmenter.segment(samples, rate);
        REQUIRE(segments.size() == 1);
        REQUIRE(std::abs(segments[0].start_ms - 590'000) <= 10);
        REQUIRE(std::abs(segments[0].end_ms - 595'000) <= 10);
    }

    SECTION("EndClampedToDuration") {
        auto samples = test::speech_like(rate, 3000, {{1000, 3000}});
        auto segments = segmenter.segment(samples, rate);
        REQUIRE(segments.size() == 1);
        REQUIRE(segments[0].end_ms == 3000);
    }
}

TEST_CASE("VadOptions validation", "[vad]") {

    SECTION("DefaultsAreValid") {
        REQUIRE(validate(VadOptions{}).has_value());
    }

    SECTION("BoundsAreInclusive") {
        REQUIRE(validate(VadOptions{.min_speech_duration_ms = 100, .min_silence_duration_ms = 5000}).has_value());
        REQUIRE(validate(VadOptions{.min_speech_duration_ms = 5000, .min_silence_duration_ms = 100}).has_value());
    }

    SECTION("OutOfRangeIsRejected") {
        auto low = validate(VadOptions{.min_speech_duration_ms = 99});
        REQUIRE_FALSE(low.has_value());
        REQUIRE(low.error().kind == ErrorKind::Configuration);

        auto high = validate(VadOptions{.min_silence_duration_ms = 5001});
        REQUIRE_FALSE(high.has_value());
        REQUIRE(high.error().kind == ErrorKind::Configuration);
        REQUIRE(high.error().message.find("min_silence_duration_ms") != std::string::npos);
    }

    SECTION("FrameAndThreshold") {
        REQUIRE_FALSE(validate(VadOptions{.frame_ms = 0}).has_value());
        REQUIRE_FALSE(validate(VadOptions{.energy_threshold = 0.0f}).has_value());
        REQUIRE_FALSE(validate(VadOptions{.energy_threshold = 1.5f}).has_value());
    }

    SECTION("MaxSpeechDuration") {
        REQUIRE(VadOptions{}.max_speech_duration_ms == 60000);
        REQUIRE(validate(VadOptions{.max_speech_duration_ms = 1000}).has_value());
        REQUIRE_FALSE(validate(VadOptions{.max_speech_duration_ms = 999}).has_value());
        auto below_min = validate(VadOptions{.min_speech_duration_ms = 3000, .max_speech_duration_ms = 2000});
        REQUIRE_FALSE(below_min.has_value());
        REQUIRE(below_min.error().kind == ErrorKind::Configuration);
    }
}

TEST_CASE("SegmentExporter", "[vad]") {
    constexpr uint32_t rate = 16000;
    wav::Audio audio{.samples = test::speech_like(rate, 4000, {{1000, 2000}}), .sample_rate = rate};
    std::vector<Segment> segments = {{1000, 2000, 0}, {2500, 3000, 1}};

    SECTION("InMemory") {
        SegmentExporter exporter;
        auto clips = exporter.export_segments(audio, segments);
        REQUIRE(clips.size() == 2);
        REQUIRE(clips[0].ok());
        REQUIRE(clips[0].path.empty());
        REQUIRE(clips[0].samples.size() == rate);
        REQUIRE(clips[0].duration_s() == 1.0);
        REQUIRE(clips[1].samples.size() == rate / 2);
    }

    SECTION("WritesNumberedFiles") {
        test::TmpDir dir("export");
        SegmentExporter exporter(dir.path / "segments");
        auto clips = exporter.export_segments(audio, segments);
        REQUIRE(clips.size() == 2);
        REQUIRE(clips[0].path == (dir.path / "segments" / "segment_0001.wav").string());
        REQUIRE(clips[1].path == (dir.path / "segments" / "segment_0002.wav").string());

        auto back = wav::read_file(clips[0].path);
        REQUIRE(back.has_value());
        REQUIRE(back->samples.size() == rate);
        REQUIRE(back->sample_rate == rate);
    }

    SECTION("OutOfBoundsClipFailsAlone") {
        std::vector<Segment> bad = {{1000, 2000, 0}, {9000, 9500, 1}};
        SegmentExporter exporter;
        auto clips = exporter.export_segments(audio, bad);
        REQUIRE(clips.size() == 2);
        REQUIRE(clips[0].ok());
        REQUIRE_FALSE(clips[1].ok());
        REQUIRE(clips[1].segment.index == 1);
    }

    SECTION("Filename") {
        REQUIRE(SegmentExporter::clip_filename(0) == "segment_0001.wav");
        REQUIRE(SegmentExporter::clip_filename(41) == "segment_0042.wav");
    }
}
