#include "relay/finalization_coordinator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace funnel::relay {

double duration_from_bytes(uint64_t bytes, int sample_rate) {
    if (sample_rate <= 0) return 0.0;
    return static_cast<double>(bytes / 2) / static_cast<double>(sample_rate);
}

AssembledTranscript FinalizationCoordinator::finalize(const std::shared_ptr<Session>& session,
                                                      std::optional<uint64_t> expected_audio_bytes) const {
    switch (session->claim_finalize()) {
        case Session::FinalizeClaim::Done:
            std::cout << "[finalize] " << session->id() << " already finalized, returning cached result" << std::endl;
            return *session->cached_result();

        case Session::FinalizeClaim::InProgress: {
            std::cout << "[finalize] " << session->id() << " finalize already running, waiting for it" << std::endl;
            // The running handshake is bounded by the same timeout; allow it to finish assembling.
            auto result = session->wait_for_result(options_.timeout + std::chrono::seconds(5));
            if (!result) {
                throw FunnelError(ErrorCode::InvalidState,
                                  "concurrent finalize of session " + session->id() + " did not complete");
            }
            return *result;
        }

        case Session::FinalizeClaim::Claimed:
            break;
    }

    try {
        return run_handshake(*session, expected_audio_bytes);
    } catch (const FunnelError& e) {
        session->fail(e.code(), e.what());
        throw;
    } catch (const std::exception& e) {
        session->fail(ErrorCode::InvalidState, e.what());
        throw;
    }
}

AssembledTranscript FinalizationCoordinator::run_handshake(Session& session,
                                                          std::optional<uint64_t> expected_audio_bytes) const {
    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + options_.timeout;
    auto remaining = [deadline] {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    };
    const std::string& id = session.id();

    auto backend = session.backend();
    bool flushed = false;
    bool audio_short = false;

    if (backend) {
        // The finalize request can overtake the last frames still in the stream connection.
        if (expected_audio_bytes && session.audio_bytes_received() < *expected_audio_bytes) {
            session.set_phase(FinalizePhase::AwaitingClientAudio);
            std::cout << "[finalize] " << id << " waiting for trailing audio: "
                      << session.audio_bytes_received() << " of " << *expected_audio_bytes << " bytes" << std::endl;
            if (!session.wait_for_audio(*expected_audio_bytes, remaining())) {
                audio_short = true;
                std::cerr << "[finalize] " << id << " client sent " << *expected_audio_bytes << " bytes, only "
                          << session.audio_bytes_received() << " arrived" << std::endl;
            }
        }
        session.close_input();

        session.set_phase(FinalizePhase::AwaitingBackendFlush);
        std::cout << "[finalize] " << id << " signalling end of stream" << std::endl;
        try {
            backend->close_stream();
        } catch (const FunnelError& e) {
            std::cerr << "[finalize] " << id << " close-stream failed (" << to_string(e.code())
                      << "): " << e.what() << std::endl;
        }

        flushed = session.wait_for_flush(remaining());
        if (!flushed) {
            session.set_phase(FinalizePhase::TimedOut);
            std::cerr << "[finalize] " << id << " " << to_string(ErrorCode::FinalizeTimeout)
                      << ": no terminal event after " << options_.timeout.count()
                      << "ms, returning partial transcript" << std::endl;
        }
    } else {
        std::cout << "[finalize] " << id << " never streamed, nothing to flush" << std::endl;
    }

    if (session.state() == SessionState::Failed) {
        auto code = session.failure().value_or(ErrorCode::ConnectionFailure);
        throw FunnelError(code, "session " + id + " failed during finalize");
    }

    session.set_phase(FinalizePhase::AssemblingTranscript);

    AssembledTranscript result;
    result.session_id = id;
    result.segments = session.segments();
    result.transcript = session.final_text();
    result.audio_bytes = session.audio_bytes_received();

    const double from_bytes = duration_from_bytes(result.audio_bytes, session.sample_rate());
    const auto reported = session.metadata_duration();
    if (reported) {
        result.duration = *reported;
        if (std::fabs(*reported - from_bytes) > options_.duration_tolerance) {
            std::cerr << "[finalize] " << id << " duration mismatch: backend " << *reported
                      << "s, received audio " << from_bytes << "s" << std::endl;
        }
    } else {
        result.duration = from_bytes;
    }
    result.partial = backend != nullptr && (!reported || audio_short);
    result.processing_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();

    session.complete(result);

    std::cout << "[finalize] " << id << " completed: " << result.segments.size() << " segments, "
              << result.duration << "s" << (result.partial ? " (partial)" : "")
              << ", " << result.processing_ms << "ms" << std::endl;
    return result;
}

} // namespace funnel::relay
