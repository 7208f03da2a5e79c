#include "client/stream_transport.hpp"

#include <iostream>

namespace funnel::client {

namespace beast = boost::beast;
namespace websocket = beast::websocket;
namespace net = boost::asio;
using tcp = net::ip::tcp;

BeastStreamTransport::BeastStreamTransport(std::string host, std::string port)
    : host_(std::move(host)), port_(std::move(port)) {}

BeastStreamTransport::~BeastStreamTransport() {
    close();
}

void BeastStreamTransport::open(const std::string& session_id, EventHandler on_event, ErrorHandler on_error) {
    session_id_ = session_id;
    on_event_ = std::move(on_event);
    on_error_ = std::move(on_error);

    const std::string path = "/recordings/" + session_id + "/stream";
    try {
        tcp::resolver resolver(ioc_);
        auto results = resolver.resolve(host_, port_);

        ws_ = std::make_unique<ws_stream>(ioc_);
        net::connect(ws_->next_layer(), results);
        ws_->set_option(websocket::stream_base::decorator(
            [](websocket::request_type& req) {
                req.set(beast::http::field::user_agent, "funnel-record");
            }));
        ws_->handshake(host_ + ":" + port_, path);
    } catch (const std::exception& e) {
        throw FunnelError(ErrorCode::ConnectionFailure,
                          "Failed to connect to relay at " + host_ + ":" + port_ + ": " + e.what());
    }

    std::cout << "[transport] connected to ws://" << host_ << ":" << port_ << path << std::endl;
    reader_ = std::thread(&BeastStreamTransport::read_loop, this);
}

void BeastStreamTransport::send_config(const StreamConfig& config) {
    std::cout << "[transport] sending config: " << config.format << ", " << config.sample_rate
              << " Hz, " << config.channels << " channel(s)" << std::endl;
    write(make_config_frame(config), false);
}

void BeastStreamTransport::send_audio(const audio::AudioFrame& frame) {
    int64_t count = frames_sent_.fetch_add(1) + 1;
    if (count % 10 == 0) {
        std::cout << "[client->relay] audio frame #" << count << " (samples: " << frame.samples.size() << ")" << std::endl;
    }
    write(audio::to_le_bytes(frame.samples), true);
}

void BeastStreamTransport::write(const std::string& payload, bool binary) {
    if (closing_.load() || !ws_) {
        throw FunnelError(ErrorCode::ConnectionFailure, "stream transport is closed");
    }
    boost::system::error_code ec;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        ws_->binary(binary);
        ws_->write(net::buffer(payload), ec);
    }
    if (ec) {
        throw FunnelError(ErrorCode::ConnectionFailure, "write to relay failed: " + ec.message());
    }
}

void BeastStreamTransport::read_loop() {
    int64_t count = 0;
    try {
        while (!closing_.load()) {
            beast::flat_buffer buffer;
            boost::system::error_code ec;
            ws_->read(buffer, ec);

            if (ec) {
                if (!closing_.load()) {
                    std::cerr << "[transport] connection to relay lost: " << ec.message() << std::endl;
                    if (on_error_) on_error_(FunnelError(ErrorCode::ConnectionFailure,
                                                         "connection to relay lost: " + ec.message()));
                }
                return;
            }
            if (!ws_->got_text()) continue;

            std::string text = beast::buffers_to_string(buffer.data());
            if (++count % 10 == 0) {
                std::cout << "[relay->client] event #" << count << " (size: " << text.size() << ")" << std::endl;
            }

            try {
                StreamEvent event = parse_event(text);
                if (on_event_) on_event_(event);
            } catch (const FunnelError& e) {
                std::cerr << "[transport] dropping malformed event: " << e.what() << std::endl;
            }
        }
    } catch (const std::exception& e) {
        if (!closing_.load()) {
            std::cerr << "[transport] reader exception: " << e.what() << std::endl;
            if (on_error_) on_error_(FunnelError(ErrorCode::ConnectionFailure, e.what()));
        }
    }
}

void BeastStreamTransport::close() {
    std::lock_guard<std::mutex> close_lock(close_mutex_);
    if (closing_.exchange(true)) return;

    if (ws_) {
        // The reader owns the read side, so the socket is shut down rather than
        // running a close handshake that would read concurrently with it.
        boost::system::error_code ec;
        std::lock_guard<std::mutex> lock(write_mutex_);
        ws_->next_layer().shutdown(tcp::socket::shutdown_both, ec);
        ws_->next_layer().close(ec);
    }

    if (reader_.joinable()) {
        if (reader_.get_id() == std::this_thread::get_id()) {
            reader_.detach();
        } else {
            reader_.join();
        }
    }
    std::cout << "[transport] closed stream for session " << session_id_ << std::endl;
}

} // namespace funnel::client
