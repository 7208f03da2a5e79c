#include "relay/deepgram_backend.hpp"
#include "common/errors.hpp"

#include <iostream>
#include <thread>

namespace funnel::relay {

namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
namespace net = boost::asio;
namespace ssl = net::ssl;
using tcp = net::ip::tcp;

// ============================================================================
// MESSAGE TRANSLATION
// ============================================================================

std::string build_listen_path(const RelayConfig& cfg, const StreamConfig& stream) {
    std::vector<std::pair<std::string, std::string>> params = {
        {"model",           cfg.deepgram_model},
        {"language",        cfg.deepgram_language},
        {"smart_format",    "true"},
        {"punctuate",       "true"},
        {"interim_results", cfg.deepgram_interim_results ? "true" : "false"},
        {"encoding",        "linear16"},
        {"sample_rate",     std::to_string(stream.sample_rate)},
        {"channels",        std::to_string(stream.channels)}
    };

    std::string path = "/v1/listen?";
    bool first = true;
    for (auto& [name, val] : params) {
        if (!first) path += "&";
        path += name + "=" + val;
        first = false;
    }
    return path;
}

std::optional<BackendEvent> translate_deepgram_message(const std::string& text) {
    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::parse_error& e) {
        std::cerr << "[deepgram] unparseable message: " << e.what() << std::endl;
        return std::nullopt;
    }
    if (!msg.is_object()) return std::nullopt;

    const std::string type = msg.value("type", "");
    BackendEvent event;

    if (type == "Results") {
        if (!msg.contains("channel") || !msg["channel"].contains("alternatives")) return std::nullopt;
        const auto& alternatives = msg["channel"]["alternatives"];
        if (!alternatives.is_array() || alternatives.empty()) return std::nullopt;

        const auto& best = alternatives[0];
        std::string transcript = best.value("transcript", "");
        if (transcript.find_first_not_of(" \t\r\n") == std::string::npos) return std::nullopt;

        event.type = BackendEventType::Transcript;
        event.segment.text = transcript;
        event.segment.confidence = best.value("confidence", 0.0);
        event.segment.start = msg.value("start", 0.0);
        event.segment.end = event.segment.start + msg.value("duration", 0.0);
        event.segment.is_final = msg.value("is_final", false);
        return event;
    }

    if (type == "Metadata") {
        event.type = BackendEventType::Metadata;
        event.duration = msg.value("duration", 0.0);
        return event;
    }

    if (type == "Error") {
        event.type = BackendEventType::Error;
        event.message = msg.value("description", msg.value("message", std::string("transcription service error")));
        return event;
    }

    return std::nullopt;
}

// ============================================================================
// CONNECTION
// ============================================================================

DeepgramConnection::DeepgramConnection(RelayConfig cfg, std::string session_id, BackendEventHandler on_event)
    : cfg_(std::move(cfg)), session_id_(std::move(session_id)), on_event_(std::move(on_event)) {}

DeepgramConnection::~DeepgramConnection() {
    close();
}

void DeepgramConnection::open(const StreamConfig& stream) {
    std::string path = build_listen_path(cfg_, stream);
    std::cout << "[deepgram] connecting for session " << session_id_ << ": model=" << cfg_.deepgram_model
              << ", language=" << cfg_.deepgram_language
              << ", sample_rate=" << stream.sample_rate << std::endl;

    ioc_ = std::make_shared<net::io_context>();

    try {
        tcp::resolver resolver(*ioc_);
        auto results = resolver.resolve(cfg_.deepgram_host, cfg_.deepgram_port);

        if (cfg_.deepgram_tls) {
            ssl_ctx_ = std::make_shared<ssl::context>(ssl::context::tlsv12_client);
            ssl_ctx_->set_default_verify_paths();
            ssl_ctx_->set_verify_mode(ssl::verify_peer);

            tls_ = std::make_shared<tls_stream>(*ioc_, *ssl_ctx_);
            net::connect(beast::get_lowest_layer(*tls_), results);

            // Set SNI hostname for TLS
            if (!SSL_set_tlsext_host_name(tls_->next_layer().native_handle(), cfg_.deepgram_host.c_str())) {
                throw std::runtime_error("Failed to set SNI hostname");
            }
            tls_->next_layer().set_verify_callback(ssl::host_name_verification(cfg_.deepgram_host));
            tls_->next_layer().handshake(ssl::stream_base::client);
        } else {
            plain_ = std::make_shared<plain_stream>(*ioc_);
            net::connect(beast::get_lowest_layer(*plain_), results);
        }

        const std::string auth = "Token " + cfg_.deepgram_api_key;
        const std::string host = cfg_.deepgram_host;
        with_stream([&](auto& ws) {
            ws.set_option(websocket::stream_base::decorator(
                [auth, host](websocket::request_type& req) {
                    req.set(http::field::authorization, auth);
                    req.set(http::field::host, host);
                }));
            ws.handshake(host, path);
        });
    } catch (const std::exception& e) {
        throw FunnelError(ErrorCode::ConnectionFailure,
                          std::string("Failed to connect to transcription backend: ") + e.what());
    }

    closed_ = false;
    std::cout << "[deepgram] connected for session " << session_id_
              << (cfg_.deepgram_tls ? "" : " (unencrypted)") << std::endl;

    std::thread(&DeepgramConnection::read_loop, shared_from_this()).detach();
}

/// Reads backend messages until the connection closes and hands them to the session.
void DeepgramConnection::read_loop(std::shared_ptr<DeepgramConnection> self) {
    try {
        while (!self->closed_.load()) {
            beast::flat_buffer buffer;
            boost::system::error_code ec;
            bool got_text = false;
            self->with_stream([&](auto& ws) {
                ws.read(buffer, ec);
                got_text = ws.got_text();
            });

            if (ec) {
                // Expected once close() has shut the socket down; unexpected while streaming.
                if (!self->closed_.exchange(true)) {
                    if (ec != websocket::error::closed &&
                        ec != net::error::operation_aborted &&
                        ec != net::ssl::error::stream_truncated) {
                        std::cerr << "[deepgram] read error for session " << self->session_id_
                                  << ": " << ec.message() << std::endl;
                    }
                    BackendEvent closed;
                    closed.type = BackendEventType::Closed;
                    closed.message = ec.message();
                    self->on_event_(closed);
                }
                break;
            }

            if (!got_text) continue;

            std::string msg = beast::buffers_to_string(buffer.data());
            int64_t count = self->from_backend_count_.fetch_add(1) + 1;
            if (count % 10 == 0) {
                std::cout << "[deepgram->relay] message #" << count << " for session " << self->session_id_
                          << " (size: " << msg.size() << ")" << std::endl;
            }

            if (auto event = translate_deepgram_message(msg)) {
                self->on_event_(*event);
            }
        }
    } catch (const std::exception& e) {
        if (!self->closed_.exchange(true)) {
            std::cerr << "[deepgram] exception for session " << self->session_id_ << ": " << e.what() << std::endl;
            BackendEvent closed;
            closed.type = BackendEventType::Closed;
            closed.message = e.what();
            self->on_event_(closed);
        }
    }
}

void DeepgramConnection::send_audio(const std::string& pcm) {
    if (closed_.load()) {
        throw FunnelError(ErrorCode::BackendUnavailable, "backend connection is closed");
    }

    int64_t count = to_backend_count_.fetch_add(1) + 1;
    if (count % 10 == 0) {
        std::cout << "[relay->deepgram] audio frame #" << count << " for session " << session_id_
                  << " (size: " << pcm.size() << ")" << std::endl;
    }

    boost::system::error_code ec;
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        with_stream([&](auto& ws) {
            ws.binary(true);
            ws.write(net::buffer(pcm), ec);
        });
    }
    if (ec) {
        throw FunnelError(ErrorCode::BackendUnavailable, "write to backend failed: " + ec.message());
    }
}

void DeepgramConnection::close_stream() {
    if (closed_.load()) {
        throw FunnelError(ErrorCode::BackendUnavailable, "backend connection is closed");
    }
    std::cout << "[deepgram] sending CloseStream for session " << session_id_ << std::endl;

    boost::system::error_code ec;
    {
        const std::string frame = json{{"type", "CloseStream"}}.dump();
        std::lock_guard<std::mutex> lock(write_mutex_);
        with_stream([&](auto& ws) {
            ws.text(true);
            ws.write(net::buffer(frame), ec);
        });
    }
    if (ec) {
        throw FunnelError(ErrorCode::BackendUnavailable, "CloseStream failed: " + ec.message());
    }
}

void DeepgramConnection::close() {
    if (closed_.exchange(true) || (!tls_ && !plain_)) return;

    // The read loop owns the read side. Shutting the socket down fails its pending
    // read, and it exits on seeing closed_ without reporting a Closed event.
    boost::system::error_code ec;
    std::lock_guard<std::mutex> lock(write_mutex_);
    with_stream([&](auto& ws) {
        beast::get_lowest_layer(ws).shutdown(tcp::socket::shutdown_both, ec);
    });
    if (ec && ec != net::error::not_connected) {
        std::cerr << "[deepgram] shutdown for session " << session_id_ << ": " << ec.message() << std::endl;
    }
    std::cout << "[deepgram] closed connection for session " << session_id_ << std::endl;
}

std::shared_ptr<BackendConnection> DeepgramConnector::connect(const std::string& session_id,
                                                              const StreamConfig& config,
                                                              BackendEventHandler on_event) {
    auto conn = std::make_shared<DeepgramConnection>(cfg_, session_id, std::move(on_event));
    conn->open(config);
    return conn;
}

} // namespace funnel::relay
