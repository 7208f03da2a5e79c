#pragma once

#include "relay/backend_connection.hpp"
#include "relay/finalization_coordinator.hpp"
#include "relay/session.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace funnel::relay {

// sessionId -> Session. The map lock only guards insertion, lookup and removal;
// all per-session work happens on the Session under its own lock.
class SessionRegistry {
public:
    SessionRegistry(std::shared_ptr<BackendConnector> connector,
                    FinalizeOptions finalize_options = {},
                    std::chrono::milliseconds retention = std::chrono::seconds(30));
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /// Registers a fresh session in Connecting. Throws FunnelError(DuplicateSession).
    std::shared_ptr<Session> create_session(const std::string& session_id);

    /// nullptr when not registered.
    std::shared_ptr<Session> find(const std::string& session_id) const;

    /// Throws FunnelError(UnknownSession).
    std::shared_ptr<Session> get(const std::string& session_id) const;

    /// Opens the session's backend channel for `config` and moves it to Streaming.
    /// Throws FunnelError(ConnectionFailure) or FunnelError(ProtocolError) if already configured.
    void configure(const std::string& session_id, const StreamConfig& config);

    /// Throws FunnelError(UnknownSession) or FunnelError(BackendUnavailable).
    void append_audio(const std::string& session_id, const std::string& pcm);

    /// Backend-side path; throws FunnelError(UnknownSession).
    void append_transcript(const std::string& session_id, const TranscriptSegment& segment);

    /// Runs the finalize handshake. `expected_audio_bytes` is what the client reports
    /// having sent on the stream. Throws FunnelError(UnknownSession) or FunnelError(InvalidState).
    AssembledTranscript finalize(const std::string& session_id,
                                 std::optional<uint64_t> expected_audio_bytes = std::nullopt);

    /// Client went away without finalizing: fail the session and release its backend.
    void abandon(const std::string& session_id, const std::string& reason);

    /// Removes sessions that have been terminal for longer than the retention window.
    size_t evict_expired(Session::Clock::time_point now = Session::Clock::now());

    size_t size() const;
    std::vector<std::string> session_ids() const;

    /// Fails every live session and clears the map.
    void shutdown();

private:
    std::shared_ptr<BackendConnector> connector_;
    FinalizationCoordinator coordinator_;
    std::chrono::milliseconds retention_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace funnel::relay
