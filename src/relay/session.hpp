#pragma once

#include "common/errors.hpp"
#include "common/protocol.hpp"
#include "common/session_state.hpp"
#include "relay/backend_connection.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace funnel::relay {

/// Finalize-side progress of one session.
enum class FinalizePhase {
    Streaming,
    AwaitingClientAudio,
    AwaitingBackendFlush,
    AssemblingTranscript,
    TimedOut,
    Done
};

const char* to_string(FinalizePhase phase);

// Relay-side record of one recording: backend channel, transcript buffer and
// lifecycle state. Each session has its own lock; nothing is shared between
// sessions. Client-bound frames are delivered outside the lock.
class Session {
public:
    using Clock = std::chrono::steady_clock;
    using ClientSink = std::function<void(const std::string&)>;

    enum class FinalizeClaim {
        Claimed,     // caller drives the handshake
        InProgress,  // another caller is driving it
        Done         // a cached result is available
    };

    explicit Session(std::string id);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    const std::string& id() const { return id_; }
    SessionState state() const;
    FinalizePhase phase() const;

    // ---- streaming path -------------------------------------------------

    void set_client_sink(ClientSink sink);
    void clear_client_sink();

    /// Connecting -> Streaming with the backend channel now owned by this session.
    void attach_backend(std::shared_ptr<BackendConnection> backend, const StreamConfig& config);
    bool configured() const;

    /// Forwards and counts one audio frame. Accepted while Streaming, and while
    /// Finalizing until close_input(). Throws FunnelError(BackendUnavailable).
    void append_audio(const std::string& pcm);

    /// Notifies the client of a segment. Final segments join the buffer in arrival
    /// order; interim ones are forwarded only.
    void append_transcript(const TranscriptSegment& segment);

    /// Entry point for everything the backend reports.
    void handle_backend_event(const BackendEvent& event);

    /// Moves a non-terminal session to Failed and releases the backend. No-op once terminal.
    void fail(ErrorCode code, const std::string& reason);

    // ---- finalize path (driven by FinalizationCoordinator) ---------------

    /// Throws FunnelError(InvalidState) if the session already failed.
    FinalizeClaim claim_finalize();
    void set_phase(FinalizePhase phase);
    std::shared_ptr<BackendConnection> backend() const;

    /// Waits until `expected_bytes` of audio have been forwarded. False on timeout.
    bool wait_for_audio(uint64_t expected_bytes, std::chrono::milliseconds timeout);

    /// No audio is accepted after this returns; any frame in flight has been sent.
    void close_input();

    /// Waits for the terminal metadata event or the backend going away.
    /// Returns false if `timeout` elapsed first.
    bool wait_for_flush(std::chrono::milliseconds timeout);

    /// Finalizing -> Completed, caches the result and releases the backend.
    void complete(const AssembledTranscript& result);

    std::optional<AssembledTranscript> wait_for_result(std::chrono::milliseconds timeout);
    std::optional<AssembledTranscript> cached_result() const;

    // ---- inspection -----------------------------------------------------

    std::vector<TranscriptSegment> segments() const;
    std::string final_text() const;
    uint64_t audio_bytes_received() const;
    std::optional<double> metadata_duration() const;
    int sample_rate() const;
    std::optional<ErrorCode> failure() const;

    /// Terminal for at least `retention`.
    bool expired(Clock::time_point now, std::chrono::milliseconds retention) const;

    json snapshot() const;

private:
    void transition_locked(SessionState next);
    std::shared_ptr<BackendConnection> take_backend_locked();
    void send_to_client(const ClientSink& sink, const std::string& frame);

    const std::string id_;
    std::mutex input_mutex_; // taken before mutex_
    mutable std::mutex mutex_;
    std::condition_variable cv_;

    SessionState state_ = SessionState::Connecting;
    FinalizePhase phase_ = FinalizePhase::Streaming;
    std::optional<ErrorCode> failure_;
    std::string failure_reason_;

    std::chrono::system_clock::time_point started_at_;
    std::optional<std::chrono::system_clock::time_point> ended_at_;
    std::optional<Clock::time_point> terminal_at_;

    StreamConfig config_;
    bool configured_ = false;
    std::shared_ptr<BackendConnection> backend_;
    bool backend_gone_ = false;
    std::optional<double> metadata_duration_;

    std::vector<TranscriptSegment> segments_; // finals only
    std::string final_text_;
    uint64_t audio_bytes_received_ = 0;
    bool input_closed_ = false;

    ClientSink client_sink_;
    bool finalize_claimed_ = false;
    std::optional<AssembledTranscript> result_;
};

} // namespace funnel::relay
