#include <catch2/catch_test_macros.hpp>

#include "relay/stream_handler.hpp"
#include "support/fake_backend.hpp"

#include <future>
#include <thread>

using namespace funnel;
using namespace funnel::relay;
using namespace funnel::testing;

namespace {

// Captures what the handler would put on the socket.
struct FakeSocket {
    std::vector<std::string> frames;
    std::vector<std::string> closes;

    StreamHandler::SendText sender() {
        return [this](const std::string& frame) { frames.push_back(frame); };
    }
    StreamHandler::Close closer() {
        return [this](const std::string& reason) { closes.push_back(reason); };
    }

    std::vector<StreamEvent> events() const {
        std::vector<StreamEvent> out;
        for (const auto& frame : frames) out.push_back(parse_event(frame));
        return out;
    }
};

std::string config_frame(int rate = 16000) {
    StreamConfig config;
    config.sample_rate = rate;
    return make_config_frame(config);
}

} // namespace

TEST_CASE("Stream handler opening sequence", "[stream]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);
    FakeSocket socket;
    StreamHandler handler(registry, StreamLimits{8000, 48000}, "rec1", socket.sender(), socket.closer());
    handler.on_open();

    SECTION("ConfigThenReady") {
        handler.on_text(config_frame());
        auto events = socket.events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == EventType::Ready);
        REQUIRE(registry.get("rec1")->state() == SessionState::Streaming);
    }

    SECTION("AudioBeforeConfigIsReportedOnceAndDropped") {
        handler.on_binary(std::string(320, '\0'));
        handler.on_binary(std::string(320, '\0'));
        auto events = socket.events();
        REQUIRE(events.size() == 1);
        REQUIRE(events[0].type == EventType::Error);
        REQUIRE(events[0].message == "audio received before config");
        REQUIRE(registry.get("rec1")->audio_bytes_received() == 0);
        REQUIRE(socket.closes.empty());
    }

    SECTION("BadConfigClosesAndFailsSession") {
        handler.on_text(R"({"type":"config","format":"pcm16","sampleRate":16000,"channels":2})");
        REQUIRE(socket.events().at(0).type == EventType::Error);
        REQUIRE(socket.closes.size() == 1);
        REQUIRE(registry.get("rec1")->state() == SessionState::Failed);
    }

    SECTION("SampleRateOutsideLimitsIsRejected") {
        handler.on_text(config_frame(96000));
        REQUIRE(socket.events().at(0).type == EventType::Error);
        REQUIRE(socket.closes.size() == 1);
        REQUIRE(backend->connect_calls() == 0);
    }

    SECTION("SecondConfigIsIgnored") {
        handler.on_text(config_frame());
        handler.on_text(config_frame(8000));
        auto events = socket.events();
        REQUIRE(events.size() == 2);
        REQUIRE(events[1].type == EventType::Error);
        REQUIRE(backend->connect_calls() == 1);
        REQUIRE(backend->connection("rec1")->config().sample_rate == 16000);
    }

    SECTION("BackendRefusalIsReportedAndCloses") {
        backend->refuse_connections(true);
        handler.on_text(config_frame());
        REQUIRE(socket.events().at(0).type == EventType::Error);
        REQUIRE(socket.closes.size() == 1);
        REQUIRE(registry.get("rec1")->state() == SessionState::Failed);
    }
}

TEST_CASE("Stream handler audio and events", "[stream]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);
    FakeSocket socket;
    StreamHandler handler(registry, StreamLimits{}, "rec2", socket.sender(), socket.closer());
    handler.on_open();
    handler.on_text(config_frame());

    SECTION("WholeSampleFramesAreForwarded") {
        handler.on_binary(std::string("\x01\x00\x02\x00", 4));
        handler.on_binary(std::string("\x03\x00", 2));
        REQUIRE(backend->connection("rec2")->received() == std::string("\x01\x00\x02\x00\x03\x00", 6));
    }

    SECTION("OddLengthFrameIsRejected") {
        handler.on_binary(std::string(3, '\0'));
        REQUIRE(backend->connection("rec2")->received().empty());
        REQUIRE(socket.events().back().type == EventType::Error);
    }

    SECTION("BackendTranscriptsReachTheClient") {
        backend->connection("rec2")->emit_transcript(final_segment("hi there", 0, 1));
        auto events = socket.events();
        REQUIRE(events.back().type == EventType::Transcript);
        REQUIRE(events.back().segment.text == "hi there");
        REQUIRE(events.back().full_transcript == "hi there");
    }

    SECTION("MetadataIsForwardedAsProcessingComplete") {
        registry.append_audio("rec2", std::string(32000, '\0'));
        registry.finalize("rec2");
        bool seen = false;
        for (const auto& event : socket.events()) {
            if (event.type == EventType::ProcessingComplete) seen = true;
        }
        REQUIRE(seen);
    }

    SECTION("FrameOvertakenByFinalizeStillReachesTheBackend") {
        handler.on_binary(std::string(32000, '\0'));
        auto pending = std::async(std::launch::async, [&] { return registry.finalize("rec2", 35200); });
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        handler.on_binary(std::string(3200, '\0'));

        AssembledTranscript result = pending.get();
        REQUIRE(result.audio_bytes == 35200);
        REQUIRE_FALSE(result.partial);
        REQUIRE(backend->connection("rec2")->received().size() == 35200);
        for (const auto& event : socket.events()) {
            REQUIRE(event.type != EventType::Error);
        }
    }

    SECTION("DisconnectWhileStreamingFailsSession") {
        handler.on_close("gone");
        REQUIRE(registry.get("rec2")->state() == SessionState::Failed);
        REQUIRE(backend->connection("rec2")->close_calls() == 1);
    }

    SECTION("DisconnectAfterFinalizeLeavesResult") {
        registry.finalize("rec2");
        handler.on_close("done");
        REQUIRE(registry.get("rec2")->state() == SessionState::Completed);
        REQUIRE(registry.get("rec2")->cached_result());
    }

    SECTION("NothingIsSentAfterClose") {
        handler.on_close("gone");
        size_t before = socket.frames.size();
        backend->connection("rec2")->emit_transcript(final_segment("late", 0, 1));
        REQUIRE(socket.frames.size() == before);
    }
}

TEST_CASE("Stream handler refuses duplicate session ids", "[stream]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);

    FakeSocket first_socket;
    StreamHandler first(registry, StreamLimits{}, "same", first_socket.sender(), first_socket.closer());
    first.on_open();
    first.on_text(config_frame());

    FakeSocket second_socket;
    StreamHandler second(registry, StreamLimits{}, "same", second_socket.sender(), second_socket.closer());
    second.on_open();

    REQUIRE_FALSE(second.owns_session());
    REQUIRE(second_socket.events().at(0).type == EventType::Error);
    REQUIRE(second_socket.closes.size() == 1);

    // The intruder leaving must not disturb the original stream.
    second.on_close("refused");
    REQUIRE(registry.get("same")->state() == SessionState::Streaming);
}
