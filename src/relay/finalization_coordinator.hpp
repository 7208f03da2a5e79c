#pragma once

#include "common/protocol.hpp"
#include "relay/session.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace funnel::relay {

struct FinalizeOptions {
    /// Ceiling on the whole handshake: trailing audio plus the backend's terminal metadata event.
    std::chrono::milliseconds timeout{30000};
    /// Allowed gap (seconds) between reported and byte-derived duration before a warning.
    double duration_tolerance = 0.5;
};

// Drives the stop sequence for one session: close-stream signal, bounded wait
// for the terminal metadata event, transcript assembly. A timeout degrades to a
// partial result instead of an error.
class FinalizationCoordinator {
public:
    explicit FinalizationCoordinator(FinalizeOptions options = {}) : options_(options) {}

    /// Runs (or joins, or replays) the finalize handshake for `session`.
    /// With `expected_audio_bytes`, the close-stream signal waits (within the same
    /// timeout) until that much audio has been forwarded.
    /// Throws FunnelError(InvalidState) if the session already failed.
    AssembledTranscript finalize(const std::shared_ptr<Session>& session,
                                 std::optional<uint64_t> expected_audio_bytes = std::nullopt) const;

    const FinalizeOptions& options() const { return options_; }

private:
    AssembledTranscript run_handshake(Session& session, std::optional<uint64_t> expected_audio_bytes) const;

    FinalizeOptions options_;
};

/// Duration implied by a PCM16 mono byte count at `sample_rate`.
double duration_from_bytes(uint64_t bytes, int sample_rate);

} // namespace funnel::relay
