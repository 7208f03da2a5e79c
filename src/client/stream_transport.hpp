#pragma once

#include "audio/pcm.hpp"
#include "common/errors.hpp"
#include "common/protocol.hpp"

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace funnel::client {

// Client half of the streaming endpoint: one ordered duplex channel per session.
// Outbound: exactly one config frame, then binary PCM16LE frames.
// Inbound: JSON event frames, delivered on a transport-owned thread.
class StreamTransport {
public:
    using EventHandler = std::function<void(const StreamEvent&)>;
    using ErrorHandler = std::function<void(const FunnelError&)>;

    virtual ~StreamTransport() = default;

    /// Connects to the stream endpoint of `session_id`. Throws FunnelError(ConnectionFailure).
    /// `on_error` fires at most once, when the channel drops without close() having been called.
    virtual void open(const std::string& session_id, EventHandler on_event, ErrorHandler on_error) = 0;

    virtual void send_config(const StreamConfig& config) = 0;

    /// Throws FunnelError(ConnectionFailure) if the channel is gone.
    virtual void send_audio(const audio::AudioFrame& frame) = 0;

    /// Idempotent; safe from any thread, including the event thread.
    virtual void close() = 0;
};

/// Plain ws:// transport over Boost.Beast.
class BeastStreamTransport : public StreamTransport {
public:
    BeastStreamTransport(std::string host, std::string port);
    ~BeastStreamTransport() override;

    void open(const std::string& session_id, EventHandler on_event, ErrorHandler on_error) override;
    void send_config(const StreamConfig& config) override;
    void send_audio(const audio::AudioFrame& frame) override;
    void close() override;

private:
    using ws_stream = boost::beast::websocket::stream<boost::asio::ip::tcp::socket>;

    void read_loop();
    void write(const std::string& payload, bool binary);

    std::string host_;
    std::string port_;
    std::string session_id_;
    EventHandler on_event_;
    ErrorHandler on_error_;

    boost::asio::io_context ioc_;
    std::unique_ptr<ws_stream> ws_;
    std::mutex write_mutex_;
    std::mutex close_mutex_;
    std::thread reader_;
    std::atomic<bool> closing_{false};
    std::atomic<int64_t> frames_sent_{0};
};

} // namespace funnel::client
