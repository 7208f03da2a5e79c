#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "client/finalize_client.hpp"
#include "common/errors.hpp"
#include "common/protocol.hpp"
#include "common/session_id.hpp"
#include "common/session_state.hpp"
#include "relay/deepgram_backend.hpp"
#include "relay/stream_handler.hpp"
#include "support/fake_backend.hpp"

#include <functional>
#include <set>

using namespace funnel;
using Catch::Matchers::WithinAbs;

namespace {
ErrorCode code_of(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const FunnelError& e) {
        return e.code();
    }
    FAIL("expected FunnelError");
    return ErrorCode::InvalidState;
}
} // namespace

TEST_CASE("Config frame", "[protocol]") {
    SECTION("BuildsTheDeclaredFields") {
        StreamConfig config;
        config.sample_rate = 44100;
        json frame = json::parse(make_config_frame(config));
        REQUIRE(frame["type"] == "config");
        REQUIRE(frame["format"] == "pcm16");
        REQUIRE(frame["sampleRate"] == 44100);
        REQUIRE(frame["channels"] == 1);

        StreamConfig parsed = parse_config_frame(frame.dump());
        REQUIRE(parsed.sample_rate == 44100);
    }

    SECTION("RejectsMalformedFrames") {
        REQUIRE(code_of([] { parse_config_frame("not json"); }) == ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"hello"})"); }) == ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"opus","sampleRate":16000,"channels":1})"); }) ==
                ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"pcm16","sampleRate":16000,"channels":2})"); }) ==
                ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"pcm16","sampleRate":0,"channels":1})"); }) ==
                ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"pcm16","sampleRate":"fast","channels":1})"); }) ==
                ErrorCode::ProtocolError);
    }

    SECTION("SampleRateMustBeAnIntegerThatFits") {
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"pcm16","sampleRate":16000.7,"channels":1})"); }) ==
                ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"pcm16","sampleRate":4294983296,"channels":1})"); }) ==
                ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"pcm16","sampleRate":-16000,"channels":1})"); }) ==
                ErrorCode::ProtocolError);
        REQUIRE(code_of([] { parse_config_frame(R"({"type":"config","format":"pcm16","sampleRate":16000,"channels":1.0})"); }) ==
                ErrorCode::ProtocolError);
    }
}

TEST_CASE("Event frames", "[protocol]") {
    SECTION("TranscriptEventCarriesSegmentAndFullText") {
        auto segment = testing::final_segment("hello world", 0.5, 2.1, 0.97);
        StreamEvent event = parse_event(make_transcript_event(segment, "hello world"));
        REQUIRE(event.type == EventType::Transcript);
        REQUIRE(event.segment.text == "hello world");
        REQUIRE(event.segment.is_final);
        REQUIRE_THAT(event.segment.start, WithinAbs(0.5, 1e-9));
        REQUIRE_THAT(event.segment.end, WithinAbs(2.1, 1e-9));
        REQUIRE_THAT(event.segment.confidence, WithinAbs(0.97, 1e-9));
        REQUIRE(event.full_transcript == "hello world");

        json raw = json::parse(make_transcript_event(segment, "x"));
        REQUIRE(raw["segment"].contains("isFinal"));
    }

    SECTION("OtherEventTypes") {
        REQUIRE(parse_event(make_ready_event()).type == EventType::Ready);

        StreamEvent error = parse_event(make_error_event("boom"));
        REQUIRE(error.type == EventType::Error);
        REQUIRE(error.message == "boom");

        StreamEvent done = parse_event(make_processing_complete_event(4.5));
        REQUIRE(done.type == EventType::ProcessingComplete);
        REQUIRE_THAT(done.duration, WithinAbs(4.5, 1e-9));

        StreamEvent metadata = parse_event(R"({"type":"metadata","duration":3.0})");
        REQUIRE(metadata.type == EventType::Metadata);

        REQUIRE(parse_event(R"({"type":"SpeechStarted"})").type == EventType::Unknown);
        REQUIRE(code_of([] { parse_event("{"); }) == ErrorCode::ProtocolError);
    }
}

TEST_CASE("Assembled transcript", "[protocol]") {
    std::vector<TranscriptSegment> segments = {
        testing::final_segment(" The quick ", 0.0, 1.0),
        testing::interim_segment("brown fax", 1.0, 1.5),
        testing::final_segment("brown fox", 1.0, 2.0),
        testing::final_segment("   ", 2.0, 2.5),
        testing::final_segment("jumps.", 2.5, 3.0),
    };

    SECTION("OnlyFinalSegmentsInArrivalOrder") {
        REQUIRE(assemble_final_text(segments) == "The quick brown fox jumps.");
    }

    SECTION("EmptyInputGivesEmptyText") {
        REQUIRE(assemble_final_text({}).empty());
        REQUIRE(assemble_final_text({testing::interim_segment("maybe", 0, 1)}).empty());
    }

    SECTION("FinalizeResponseShape") {
        AssembledTranscript result;
        result.session_id = "abc";
        result.transcript = assemble_final_text(segments);
        result.segments = segments;
        result.duration = 3.0;
        result.audio_bytes = 96000;

        json body = result;
        REQUIRE(body["success"] == true);
        REQUIRE(body["recordingId"] == "abc");
        REQUIRE(body["segmentCount"] == 5);
        REQUIRE(body["partial"] == false);

        auto back = body.get<AssembledTranscript>();
        REQUIRE(back.transcript == result.transcript);
        REQUIRE(back.segments.size() == 5);
        REQUIRE(back.audio_bytes == 96000);
    }
}

TEST_CASE("Deepgram message translation", "[protocol][deepgram]") {
    using relay::BackendEventType;
    using relay::translate_deepgram_message;

    SECTION("ResultsBecomeSegments") {
        auto event = translate_deepgram_message(R"({
            "type": "Results", "start": 1.25, "duration": 0.75, "is_final": true,
            "channel": {"alternatives": [{"transcript": "hello there", "confidence": 0.91}]}
        })");
        REQUIRE(event);
        REQUIRE(event->type == BackendEventType::Transcript);
        REQUIRE(event->segment.text == "hello there");
        REQUIRE(event->segment.is_final);
        REQUIRE_THAT(event->segment.start, WithinAbs(1.25, 1e-9));
        REQUIRE_THAT(event->segment.end, WithinAbs(2.0, 1e-9));
        REQUIRE_THAT(event->segment.confidence, WithinAbs(0.91, 1e-9));
    }

    SECTION("EmptyResultsAreDropped") {
        REQUIRE_FALSE(translate_deepgram_message(R"({
            "type": "Results", "start": 0, "duration": 1, "is_final": true,
            "channel": {"alternatives": [{"transcript": "  ", "confidence": 0}]}
        })"));
    }

    SECTION("MetadataIsTerminalEvent") {
        auto event = translate_deepgram_message(R"({"type":"Metadata","duration":5.02,"request_id":"r"})");
        REQUIRE(event);
        REQUIRE(event->type == BackendEventType::Metadata);
        REQUIRE_THAT(event->duration, WithinAbs(5.02, 1e-9));
    }

    SECTION("ErrorsAndNoise") {
        auto error = translate_deepgram_message(R"({"type":"Error","description":"bad audio"})");
        REQUIRE(error);
        REQUIRE(error->type == BackendEventType::Error);
        REQUIRE(error->message == "bad audio");

        REQUIRE_FALSE(translate_deepgram_message(R"({"type":"SpeechStarted"})"));
        REQUIRE_FALSE(translate_deepgram_message("garbage"));
    }

    SECTION("ListenPathDeclaresExactStream") {
        RelayConfig cfg;
        cfg.deepgram_model = "nova-3";
        StreamConfig stream;
        stream.sample_rate = 48000;

        std::string path = relay::build_listen_path(cfg, stream);
        REQUIRE(path.rfind("/v1/listen?", 0) == 0);
        REQUIRE(path.find("model=nova-3") != std::string::npos);
        REQUIRE(path.find("encoding=linear16") != std::string::npos);
        REQUIRE(path.find("sample_rate=48000") != std::string::npos);
        REQUIRE(path.find("channels=1") != std::string::npos);
        REQUIRE(path.find("interim_results=false") != std::string::npos);
    }
}

TEST_CASE("Error codes", "[errors]") {
    REQUIRE(std::string(to_string(ErrorCode::BackendUnavailable)) == "BACKEND_UNAVAILABLE");
    REQUIRE(http_status_for(ErrorCode::UnknownSession) == 404);
    REQUIRE(http_status_for(ErrorCode::InvalidState) == 409);
    REQUIRE(http_status_for(ErrorCode::AlreadyFinalized) == 409);
    REQUIRE(http_status_for(ErrorCode::ProtocolError) == 400);
    REQUIRE(http_status_for(ErrorCode::BackendUnavailable) == 500);

    REQUIRE(error_code_from_string("RECORDING_TOO_SHORT") == ErrorCode::RecordingTooShort);
    REQUIRE_FALSE(error_code_from_string("NOPE"));
}

TEST_CASE("Finalize error responses map back to codes", "[errors][client]") {
    SECTION("NamedCode") {
        auto e = client::error_from_response(409, R"({"error":"INVALID_STATE","message":"session failed"})");
        REQUIRE(e.code() == ErrorCode::InvalidState);
        REQUIRE(std::string(e.what()) == "session failed");
    }

    SECTION("NotFoundWithoutBody") {
        REQUIRE(client::error_from_response(404, "").code() == ErrorCode::UnknownSession);
    }

    SECTION("UnknownNameFallsBack") {
        auto e = client::error_from_response(500, R"({"error":"SOMETHING_NEW"})");
        REQUIRE(e.code() == ErrorCode::ConnectionFailure);
    }
}

TEST_CASE("Session lifecycle graph", "[state]") {
    using S = SessionState;

    SECTION("ForwardEdges") {
        REQUIRE(can_transition(S::Idle, S::Connecting));
        REQUIRE(can_transition(S::Connecting, S::Streaming));
        REQUIRE(can_transition(S::Streaming, S::Finalizing));
        REQUIRE(can_transition(S::Finalizing, S::Completed));
    }

    SECTION("NoSkippingOrRevisiting") {
        REQUIRE_FALSE(can_transition(S::Idle, S::Streaming));
        REQUIRE_FALSE(can_transition(S::Streaming, S::Connecting));
        REQUIRE_FALSE(can_transition(S::Streaming, S::Completed));
        REQUIRE_FALSE(can_transition(S::Finalizing, S::Streaming));
    }

    SECTION("FailedFromAnyLiveStateAndTerminal") {
        for (S from : {S::Idle, S::Connecting, S::Streaming, S::Finalizing}) {
            REQUIRE(can_transition(from, S::Failed));
        }
        for (S to : {S::Idle, S::Connecting, S::Streaming, S::Finalizing, S::Completed, S::Failed}) {
            REQUIRE_FALSE(can_transition(S::Completed, to));
            REQUIRE_FALSE(can_transition(S::Failed, to));
        }
    }
}

TEST_CASE("Session identifiers", "[session_id]") {
    SECTION("GeneratedIdsAreUniqueAndValid") {
        std::set<std::string> seen;
        for (int i = 0; i < 100; ++i) {
            std::string id = generate_session_id();
            REQUIRE(id.size() == 36);
            REQUIRE(id[14] == '4');
            REQUIRE(is_valid_session_id(id));
            seen.insert(id);
        }
        REQUIRE(seen.size() == 100);
    }

    SECTION("Validation") {
        REQUIRE(is_valid_session_id("rec_01-A"));
        REQUIRE_FALSE(is_valid_session_id(""));
        REQUIRE_FALSE(is_valid_session_id("../etc"));
        REQUIRE_FALSE(is_valid_session_id("a b"));
        REQUIRE_FALSE(is_valid_session_id(std::string(129, 'a')));
    }

    SECTION("StreamPathParsing") {
        REQUIRE(relay::session_id_from_stream_path("/recordings/abc-1/stream") == std::string("abc-1"));
        REQUIRE(relay::session_id_from_stream_path("/api/recordings/abc/stream?x=1") == std::string("abc"));
        REQUIRE_FALSE(relay::session_id_from_stream_path("/recordings//stream"));
        REQUIRE_FALSE(relay::session_id_from_stream_path("/recordings/abc/done"));
        REQUIRE_FALSE(relay::session_id_from_stream_path("/recordings/a.b/stream"));
        REQUIRE_FALSE(relay::session_id_from_stream_path("/other/abc/stream"));
    }
}
