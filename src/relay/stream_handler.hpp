#pragma once

#include "relay/session_registry.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace funnel::relay {

struct StreamLimits {
    int min_sample_rate = 8000;
    int max_sample_rate = 48000;
};

/// Extracts {id} from "/recordings/{id}/stream" or "/api/recordings/{id}/stream".
/// std::nullopt if the path does not match or the id is not a valid session id.
std::optional<std::string> session_id_from_stream_path(const std::string& path);

// Per-connection half of the streaming endpoint, independent of the WebSocket
// server. The server feeds it open/text/binary/close notifications in order;
// it talks back through send_text and close.
class StreamHandler {
public:
    using SendText = std::function<void(const std::string&)>;
    using Close = std::function<void(const std::string&)>;

    StreamHandler(SessionRegistry& registry, StreamLimits limits, std::string session_id,
                  SendText send_text, Close close);
    ~StreamHandler();

    StreamHandler(const StreamHandler&) = delete;
    StreamHandler& operator=(const StreamHandler&) = delete;

    /// Registers the session. On a duplicate id the client gets an error and the connection is closed.
    void on_open();
    void on_text(const std::string& text);
    void on_binary(const std::string& data);
    void on_close(const std::string& reason);

    const std::string& session_id() const { return session_id_; }
    bool owns_session() const { return owns_session_; }

private:
    // Shared with the session's client sink so backend-thread sends stop once the socket is gone.
    struct ClientChannel {
        std::mutex mutex;
        bool open = true;
        SendText send_text;
    };

    void send(const std::string& frame);
    void close_connection(const std::string& reason);
    void handle_config(const std::string& text);

    SessionRegistry& registry_;
    StreamLimits limits_;
    std::string session_id_;
    std::shared_ptr<ClientChannel> channel_;
    Close close_;

    bool owns_session_ = false;
    bool configured_ = false;
    bool closed_ = false;
    bool early_audio_reported_ = false;
    bool audio_error_reported_ = false;
    int64_t frames_received_ = 0;
};

} // namespace funnel::relay
