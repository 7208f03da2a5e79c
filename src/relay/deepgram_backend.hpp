#pragma once

#include "common/config.hpp"
#include "relay/backend_connection.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include <atomic>
#include <mutex>
#include <optional>

namespace funnel::relay {

/// Builds the /v1/listen path with query parameters for one session.
std::string build_listen_path(const RelayConfig& cfg, const StreamConfig& stream);

/// Translates one Deepgram text message into a backend event.
/// Returns std::nullopt for messages that carry nothing we keep (empty results, SpeechStarted, ...).
std::optional<BackendEvent> translate_deepgram_message(const std::string& text);

class DeepgramConnection : public BackendConnection,
                           public std::enable_shared_from_this<DeepgramConnection> {
public:
    DeepgramConnection(RelayConfig cfg, std::string session_id, BackendEventHandler on_event);
    ~DeepgramConnection() override;

    /// TLS (unless deepgram_tls is off) + WebSocket handshake, then starts the read loop.
    /// Throws FunnelError(ConnectionFailure).
    void open(const StreamConfig& stream);

    void send_audio(const std::string& pcm) override;
    void close_stream() override;
    void close() override;
    bool is_open() const override { return !closed_.load(); }

private:
    using tls_stream = boost::beast::websocket::stream<boost::beast::ssl_stream<boost::asio::ip::tcp::socket>>;
    using plain_stream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

    static void read_loop(std::shared_ptr<DeepgramConnection> self);

    template <class F>
    void with_stream(F&& f) {
        if (tls_) {
            f(*tls_);
        } else {
            f(*plain_);
        }
    }

    RelayConfig cfg_;
    std::string session_id_;
    BackendEventHandler on_event_;

    std::shared_ptr<boost::asio::io_context> ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::shared_ptr<tls_stream> tls_;
    std::shared_ptr<plain_stream> plain_;
    std::mutex write_mutex_;
    std::atomic<bool> closed_{true};
    std::atomic<int64_t> to_backend_count_{0};
    std::atomic<int64_t> from_backend_count_{0};
};

class DeepgramConnector : public BackendConnector {
public:
    explicit DeepgramConnector(RelayConfig cfg) : cfg_(std::move(cfg)) {}

    std::shared_ptr<BackendConnection> connect(const std::string& session_id,
                                               const StreamConfig& config,
                                               BackendEventHandler on_event) override;

private:
    RelayConfig cfg_;
};

} // namespace funnel::relay
