#pragma once

#include "common/protocol.hpp"

#include <functional>
#include <memory>
#include <string>

namespace funnel::relay {

enum class BackendEventType {
    Transcript,
    Metadata,   // terminal: all submitted audio has been processed
    Error,
    Closed      // the backend side of the connection went away
};

struct BackendEvent {
    BackendEventType type = BackendEventType::Error;
    TranscriptSegment segment;
    double duration = 0.0;
    std::string message;
};

using BackendEventHandler = std::function<void(const BackendEvent&)>;

// One live duplex channel to the transcription service, owned by exactly one session.
class BackendConnection {
public:
    virtual ~BackendConnection() = default;

    /// Forwards PCM16LE bytes. Throws FunnelError(BackendUnavailable) if the channel is closed.
    virtual void send_audio(const std::string& pcm) = 0;

    /// Asks the backend to flush and close its input; a Metadata event follows.
    virtual void close_stream() = 0;

    /// Releases the channel. Idempotent, safe from any thread.
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

class BackendConnector {
public:
    virtual ~BackendConnector() = default;

    /// Opens a backend channel configured for `config`. Events are delivered on a
    /// backend-owned thread. Throws FunnelError(ConnectionFailure).
    virtual std::shared_ptr<BackendConnection> connect(const std::string& session_id,
                                                       const StreamConfig& config,
                                                       BackendEventHandler on_event) = 0;
};

} // namespace funnel::relay
