#include <catch2/catch_test_macros.hpp>

#include "relay/session_registry.hpp"
#include "support/fake_backend.hpp"

#include <functional>
#include <thread>

using namespace funnel;
using namespace funnel::relay;
using namespace funnel::testing;

namespace {

StreamConfig config_at(int rate) {
    StreamConfig config;
    config.sample_rate = rate;
    return config;
}

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

TEST_CASE("Session registry lookups", "[registry]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);

    SECTION("CreateRegistersInConnecting") {
        auto session = registry.create_session("s1");
        REQUIRE(session->state() == SessionState::Connecting);
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.find("s1") == session);
    }

    SECTION("DuplicateIdIsRejected") {
        registry.create_session("s1");
        REQUIRE(code_of([&] { registry.create_session("s1"); }) == ErrorCode::DuplicateSession);
        REQUIRE(registry.size() == 1);
    }

    SECTION("UnknownSession") {
        REQUIRE(registry.find("nope") == nullptr);
        REQUIRE(code_of([&] { registry.get("nope"); }) == ErrorCode::UnknownSession);
        REQUIRE(code_of([&] { registry.append_audio("nope", "\x01\x02"); }) == ErrorCode::UnknownSession);
        REQUIRE(code_of([&] { registry.finalize("nope"); }) == ErrorCode::UnknownSession);
        REQUIRE(code_of([&] { registry.append_transcript("nope", final_segment("x", 0, 1)); }) ==
                ErrorCode::UnknownSession);
    }
}

TEST_CASE("Session registry audio path", "[registry]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);
    auto session = registry.create_session("s1");

    SECTION("AudioBeforeConfigureIsBackendUnavailable") {
        REQUIRE(code_of([&] { registry.append_audio("s1", std::string(320, '\0')); }) ==
                ErrorCode::BackendUnavailable);
        REQUIRE(session->state() == SessionState::Connecting);
    }

    SECTION("ConfigureOpensBackendAtDeclaredRate") {
        registry.configure("s1", config_at(44100));
        REQUIRE(session->state() == SessionState::Streaming);
        REQUIRE(backend->connection("s1")->config().sample_rate == 44100);
        REQUIRE(code_of([&] { registry.configure("s1", config_at(16000)); }) == ErrorCode::ProtocolError);
        REQUIRE(backend->connect_calls() == 1);
    }

    SECTION("FramesAreForwardedInOrderAndCounted") {
        registry.configure("s1", config_at(16000));
        std::string expected;
        for (char c = 'a'; c <= 'j'; ++c) {
            std::string frame(64, c);
            registry.append_audio("s1", frame);
            expected += frame;
        }
        REQUIRE(backend->connection("s1")->received() == expected);
        REQUIRE(session->audio_bytes_received() == expected.size());
    }

    SECTION("ClosedBackendIsBackendUnavailableAndFailsSession") {
        registry.configure("s1", config_at(16000));
        backend->connection("s1")->drop("reset by peer");

        REQUIRE(session->state() == SessionState::Failed);
        REQUIRE(session->failure() == ErrorCode::ConnectionFailure);
        REQUIRE(code_of([&] { registry.append_audio("s1", std::string(2, '\0')); }) ==
                ErrorCode::BackendUnavailable);
    }

    SECTION("BackendRefusalFailsSession") {
        backend->refuse_connections(true);
        REQUIRE(code_of([&] { registry.configure("s1", config_at(16000)); }) == ErrorCode::ConnectionFailure);
        REQUIRE(session->state() == SessionState::Failed);
    }

    SECTION("AbandonReleasesBackendExactlyOnce") {
        registry.configure("s1", config_at(16000));
        auto conn = backend->connection("s1");
        registry.abandon("s1", "client went away");
        registry.abandon("s1", "again");
        REQUIRE(session->state() == SessionState::Failed);
        REQUIRE(conn->close_calls() == 1);
    }
}

TEST_CASE("Session registry transcript buffer", "[registry]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);
    auto session = registry.create_session("s1");
    registry.configure("s1", config_at(16000));

    std::vector<std::string> sent;
    session->set_client_sink([&](const std::string& frame) { sent.push_back(frame); });

    backend->connection("s1")->emit_transcript(final_segment("one", 0, 1));
    registry.append_transcript("s1", interim_segment("tw", 1, 1.5));
    backend->connection("s1")->emit_transcript(final_segment("two", 1, 2));

    auto segments = session->segments();
    REQUIRE(segments.size() == 2);
    REQUIRE(segments[0].text == "one");
    REQUIRE(segments[1].text == "two");

    REQUIRE(sent.size() == 3);
    StreamEvent interim = parse_event(sent[1]);
    REQUIRE(interim.segment.text == "tw");
    REQUIRE_FALSE(interim.segment.is_final);
    REQUIRE(interim.full_transcript == "one");
    StreamEvent last = parse_event(sent.back());
    REQUIRE(last.type == EventType::Transcript);
    REQUIRE(last.full_transcript == "one two");
}

TEST_CASE("Concurrent sessions stay isolated", "[registry][concurrency]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);

    const std::vector<std::string> ids = {"alpha", "bravo", "charlie", "delta"};
    for (const auto& id : ids) {
        registry.create_session(id);
        registry.configure(id, config_at(16000));
    }

    std::vector<std::thread> workers;
    for (const auto& id : ids) {
        workers.emplace_back([&registry, &backend, id] {
            auto conn = backend->connection(id);
            for (int i = 0; i < 50; ++i) {
                registry.append_audio(id, std::string(320, static_cast<char>(id[0])));
                conn->emit_transcript(final_segment(id + "-" + std::to_string(i), i, i + 1));
            }
        });
    }
    for (auto& t : workers) t.join();

    for (const auto& id : ids) {
        auto session = registry.get(id);
        auto segments = session->segments();
        REQUIRE(segments.size() == 50);
        for (size_t i = 0; i < segments.size(); ++i) {
            REQUIRE(segments[i].text == id + "-" + std::to_string(i));
        }
        REQUIRE(backend->connection(id)->received() == std::string(50 * 320, id[0]));

        AssembledTranscript result = registry.finalize(id);
        for (const auto& other : ids) {
            if (other == id) continue;
            REQUIRE(result.transcript.find(other) == std::string::npos);
        }
    }
}

TEST_CASE("Session retention", "[registry][retention]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend, FinalizeOptions{}, std::chrono::milliseconds(1000));

    registry.create_session("done");
    registry.configure("done", config_at(16000));
    registry.finalize("done");

    registry.create_session("failed");
    registry.abandon("failed", "client went away");

    registry.create_session("live");
    registry.configure("live", config_at(16000));

    auto now = Session::Clock::now();
    REQUIRE(registry.evict_expired(now) == 0);
    REQUIRE(registry.size() == 3);

    REQUIRE(registry.evict_expired(now + std::chrono::seconds(2)) == 2);
    REQUIRE(registry.size() == 1);
    REQUIRE(registry.find("live"));
    REQUIRE(code_of([&] { registry.finalize("done"); }) == ErrorCode::UnknownSession);
}

TEST_CASE("Session state only moves forward", "[registry][state]") {
    auto backend = std::make_shared<FakeBackendConnector>();
    SessionRegistry registry(backend);
    auto session = registry.create_session("s1");

    std::vector<SessionState> seen{session->state()};
    registry.configure("s1", config_at(16000));
    seen.push_back(session->state());
    registry.append_audio("s1", std::string(3200, '\0'));
    registry.finalize("s1");
    seen.push_back(session->state());

    REQUIRE(seen == std::vector<SessionState>{SessionState::Connecting, SessionState::Streaming,
                                              SessionState::Completed});
    for (size_t i = 1; i < seen.size(); ++i) {
        REQUIRE(static_cast<int>(seen[i - 1]) < static_cast<int>(seen[i]));
    }

    // Terminal: failing a completed session changes nothing.
    session->fail(ErrorCode::ConnectionFailure, "late drop");
    REQUIRE(session->state() == SessionState::Completed);
}
