#include <catch2/catch_test_macros.hpp>

#include "audio/archive_sink.hpp"
#include "audio/audio_capture.hpp"
#include "audio/file_playback_source.hpp"
#include "support/test_audio.hpp"

#include <filesystem>
#include <stdexcept>

using namespace funnel;
using namespace funnel::audio;
using namespace funnel::testing;

namespace {

std::vector<AudioFrame> drain(FrameQueue& queue) {
    std::vector<AudioFrame> frames;
    AudioFrame frame;
    while (queue.pop(frame)) frames.push_back(std::move(frame));
    return frames;
}

class MemorySink : public ArchiveSink {
public:
    void write(const AudioFrame& frame) override { samples += frame.samples.size(); }
    void close() override { closed = true; }
    size_t samples = 0;
    bool closed = false;
};

class FailingSink : public ArchiveSink {
public:
    void write(const AudioFrame&) override {
        writes++;
        throw std::runtime_error("disk full");
    }
    void close() override {}
    int writes = 0;
};

std::string temp_path(const std::string& name) {
    return (std::filesystem::temp_directory_path() / name).string();
}

} // namespace

TEST_CASE("Capture chunks playback into fixed-duration frames", "[capture]") {
    FrameQueue queue;

    SECTION("OneSecondAt16kIsTenFrames") {
        auto source = std::make_unique<FilePlaybackSource>(make_tone(1.0, 16000, 440.0, 0.5f), 16000, 1);
        AudioCapture capture(std::move(source), queue, 100);
        capture.start();

        auto frames = drain(queue);
        capture.stop();

        REQUIRE(frames.size() == 10);
        for (const auto& frame : frames) {
            REQUIRE(frame.samples.size() == 1600);
            REQUIRE(frame.sample_rate == 16000);
        }
        REQUIRE(capture.samples_captured() == 16000);
    }

    SECTION("TrailingPartialFrameIsFlushed") {
        auto source = std::make_unique<FilePlaybackSource>(make_silence(1.05, 16000), 16000, 1);
        AudioCapture capture(std::move(source), queue, 100);
        capture.start();

        auto frames = drain(queue);
        REQUIRE(frames.size() == 11);
        REQUIRE(frames.back().samples.size() == 800);
    }

    SECTION("ChunkCadenceIsConfigurable") {
        auto source = std::make_unique<FilePlaybackSource>(make_silence(1.0, 16000), 16000, 1);
        AudioCapture capture(std::move(source), queue, 250);
        capture.start();

        auto frames = drain(queue);
        REQUIRE(frames.size() == 4);
        REQUIRE(frames[0].samples.size() == 4000);
    }
}

TEST_CASE("Capture keeps channel 0 of multi-channel input", "[capture]") {
    FrameQueue queue;
    // Channel 1 is held at full scale; the output must only follow channel 0.
    auto source = std::make_unique<FilePlaybackSource>(make_tone(0.5, 8000, 200.0, 0.25f, 2, 1.0f), 8000, 2);
    AudioCapture capture(std::move(source), queue, 100);
    capture.start();

    auto frames = drain(queue);
    size_t total = 0;
    for (const auto& frame : frames) {
        total += frame.samples.size();
        for (int16_t s : frame.samples) {
            REQUIRE(s <= 8192);
            REQUIRE(s >= -8192);
        }
    }
    REQUIRE(total == 4000);
}

TEST_CASE("Capture publishes loudness and archives alongside streaming", "[capture]") {
    FrameQueue queue;

    SECTION("LevelCallbackStaysInUnitRange") {
        auto source = std::make_unique<FilePlaybackSource>(make_tone(0.3, 16000, 440.0, 0.8f), 16000, 1);
        AudioCapture capture(std::move(source), queue, 100);
        std::vector<float> levels;
        capture.on_level([&](float level) { levels.push_back(level); });
        capture.start();
        drain(queue);
        capture.stop();

        REQUIRE_FALSE(levels.empty());
        for (float level : levels) {
            REQUIRE(level >= 0.0f);
            REQUIRE(level <= 1.0f);
        }
        REQUIRE(capture.level() > 0.5f);
    }

    SECTION("OneReadingPerOutboundFrame") {
        // A single 200 ms source block: 100 ms of full-scale tone, then 100 ms of silence.
        std::vector<float> block = make_tone(0.1, 16000, 440.0, 1.0f);
        std::vector<float> quiet = make_silence(0.1, 16000);
        block.insert(block.end(), quiet.begin(), quiet.end());

        auto source = std::make_unique<FilePlaybackSource>(std::move(block), 16000, 1, 200);
        AudioCapture capture(std::move(source), queue, 100);
        std::vector<float> levels;
        capture.on_level([&](float level) { levels.push_back(level); });
        capture.start();
        auto frames = drain(queue);
        capture.stop();

        REQUIRE(frames.size() == 2);
        REQUIRE(levels.size() == 2);
        REQUIRE(levels.front() > 0.5f);
        REQUIRE(levels.back() == 0.0f);
        REQUIRE(capture.level() == 0.0f);
    }

    SECTION("ArchiveReceivesEverySample") {
        MemorySink sink;
        auto source = std::make_unique<FilePlaybackSource>(make_silence(0.5, 16000), 16000, 1);
        AudioCapture capture(std::move(source), queue, 100, &sink);
        capture.start();
        drain(queue);
        REQUIRE(sink.samples == 8000);
    }

    SECTION("FailingArchiveDoesNotAffectStream") {
        FailingSink sink;
        auto source = std::make_unique<FilePlaybackSource>(make_silence(1.0, 16000), 16000, 1);
        AudioCapture capture(std::move(source), queue, 100, &sink);
        capture.start();

        auto frames = drain(queue);
        REQUIRE(frames.size() == 10);
        REQUIRE(sink.writes == 1);
    }

    SECTION("RawPcmSinkWritesLittleEndianBytes") {
        std::string path = temp_path("funnel_capture_archive.pcm");
        {
            RawPcmFileSink sink(path);
            auto source = std::make_unique<FilePlaybackSource>(make_silence(0.2, 16000), 16000, 1);
            AudioCapture capture(std::move(source), queue, 100, &sink);
            capture.start();
            drain(queue);
            capture.stop();
            sink.close();
            REQUIRE(sink.bytes_written() == 6400);
        }
        REQUIRE(std::filesystem::file_size(path) == 6400);
        std::filesystem::remove(path);
    }
}

TEST_CASE("File playback source", "[capture][playback]") {
    SECTION("ReadsPcm16Wav") {
        std::string path = temp_path("funnel_playback_test.wav");
        std::vector<int16_t> pcm(2 * 4410);
        for (size_t i = 0; i < pcm.size(); i += 2) {
            pcm[i] = 1000;
            pcm[i + 1] = -1000;
        }
        write_wav16(path, pcm, 44100, 2);

        FilePlaybackSource source(path);
        source.start();
        REQUIRE(source.sample_rate() == 44100);
        REQUIRE(source.channels() == 2);
        REQUIRE(source.duration_seconds() > 0.099);
        REQUIRE(source.duration_seconds() < 0.101);

        auto block = source.next();
        REQUIRE(block);
        REQUIRE(block->channels == 2);
        REQUIRE(block->samples[0] > 0.0f);
        REQUIRE(block->samples[1] < 0.0f);
        std::filesystem::remove(path);
    }

    SECTION("MissingFileIsCaptureFailure") {
        FilePlaybackSource source(temp_path("funnel_does_not_exist.wav"));
        try {
            source.start();
            FAIL("expected CaptureFailure");
        } catch (const FunnelError& e) {
            REQUIRE(e.code() == ErrorCode::CaptureFailure);
        }
    }

    SECTION("CancelEndsTheSequence") {
        FilePlaybackSource source(make_silence(1.0, 16000), 16000, 1);
        source.start();
        REQUIRE(source.next());
        source.cancel();
        REQUIRE_FALSE(source.next());
    }

    SECTION("BrokenSourceFailsCaptureStartAndClosesQueue") {
        FrameQueue queue;
        AudioCapture capture(std::make_unique<BrokenSource>(), queue, 100);
        REQUIRE_THROWS_AS(capture.start(), FunnelError);
        REQUIRE(queue.closed());
    }
}
