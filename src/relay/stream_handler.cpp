#include "relay/stream_handler.hpp"
#include "common/session_id.hpp"

#include <iostream>

namespace funnel::relay {

std::optional<std::string> session_id_from_stream_path(const std::string& path) {
    std::string rest = path;
    auto query = rest.find('?');
    if (query != std::string::npos) rest.resize(query);

    for (const std::string prefix : {"/api/recordings/", "/recordings/"}) {
        if (rest.compare(0, prefix.size(), prefix) != 0) continue;

        const std::string suffix = "/stream";
        if (rest.size() <= prefix.size() + suffix.size() ||
            rest.compare(rest.size() - suffix.size(), suffix.size(), suffix) != 0) {
            return std::nullopt;
        }
        std::string id = rest.substr(prefix.size(), rest.size() - prefix.size() - suffix.size());
        if (!is_valid_session_id(id)) return std::nullopt;
        return id;
    }
    return std::nullopt;
}

StreamHandler::StreamHandler(SessionRegistry& registry, StreamLimits limits, std::string session_id,
                             SendText send_text, Close close)
    : registry_(registry),
      limits_(limits),
      session_id_(std::move(session_id)),
      channel_(std::make_shared<ClientChannel>()),
      close_(std::move(close)) {
    channel_->send_text = std::move(send_text);
}

StreamHandler::~StreamHandler() {
    on_close("handler destroyed");
}

void StreamHandler::on_open() {
    std::shared_ptr<Session> session;
    try {
        session = registry_.create_session(session_id_);
    } catch (const FunnelError& e) {
        std::cerr << "[stream] " << session_id_ << " refused: " << e.what() << std::endl;
        send(make_error_event(e.what()));
        close_connection(to_string(e.code()));
        return;
    }
    owns_session_ = true;

    std::weak_ptr<ClientChannel> weak = channel_;
    session->set_client_sink([weak](const std::string& frame) {
        auto channel = weak.lock();
        if (!channel) return;
        std::lock_guard<std::mutex> lock(channel->mutex);
        if (channel->open && channel->send_text) channel->send_text(frame);
    });
    std::cout << "[stream] client connected for session " << session_id_ << std::endl;
}

void StreamHandler::on_text(const std::string& text) {
    if (closed_ || !owns_session_) return;

    std::cout << "[client->relay] text frame for session " << session_id_
              << " (size: " << text.size() << ")" << std::endl;

    if (!configured_) {
        handle_config(text);
        return;
    }

    // Exactly one config frame per connection; anything after it is ignored.
    json frame = json::parse(text, nullptr, false);
    if (!frame.is_discarded() && frame.is_object() && frame.value("type", "") == "config") {
        send(make_error_event("config already received"));
    } else {
        std::cerr << "[stream] " << session_id_ << " ignoring unexpected text frame" << std::endl;
    }
}

void StreamHandler::handle_config(const std::string& text) {
    StreamConfig config;
    try {
        config = parse_config_frame(text);
        if (config.sample_rate < limits_.min_sample_rate || config.sample_rate > limits_.max_sample_rate) {
            throw FunnelError(ErrorCode::ProtocolError,
                              "sampleRate " + std::to_string(config.sample_rate) + " outside " +
                                  std::to_string(limits_.min_sample_rate) + ".." +
                                  std::to_string(limits_.max_sample_rate));
        }
    } catch (const FunnelError& e) {
        std::cerr << "[stream] " << session_id_ << " bad config: " << e.what() << std::endl;
        send(make_error_event(e.what()));
        registry_.abandon(session_id_, e.what());
        close_connection(to_string(e.code()));
        return;
    }

    try {
        registry_.configure(session_id_, config);
    } catch (const FunnelError& e) {
        std::cerr << "[stream] " << session_id_ << " backend setup failed: " << e.what() << std::endl;
        send(make_error_event(e.what()));
        registry_.abandon(session_id_, e.what());
        close_connection(to_string(e.code()));
        return;
    }

    configured_ = true;
    send(make_ready_event());
}

void StreamHandler::on_binary(const std::string& data) {
    if (closed_ || !owns_session_) return;

    if (!configured_) {
        if (!early_audio_reported_) {
            early_audio_reported_ = true;
            std::cerr << "[stream] " << session_id_ << " audio received before config" << std::endl;
            send(make_error_event("audio received before config"));
        }
        return;
    }

    if (data.size() % 2 != 0) {
        std::cerr << "[stream] " << session_id_ << " rejected odd-length frame (" << data.size() << " bytes)" << std::endl;
        send(make_error_event("audio frame length must be a whole number of 16-bit samples"));
        return;
    }

    int64_t count = ++frames_received_;
    if (count % 10 == 0) {
        std::cout << "[client->relay] audio frame #" << count << " for session " << session_id_
                  << " (size: " << data.size() << ")" << std::endl;
    }

    try {
        registry_.append_audio(session_id_, data);
        audio_error_reported_ = false;
    } catch (const FunnelError& e) {
        if (!audio_error_reported_) {
            audio_error_reported_ = true;
            std::cerr << "[stream] " << session_id_ << " " << to_string(e.code()) << ": " << e.what() << std::endl;
            send(make_error_event(e.what()));
        }
    }
}

void StreamHandler::on_close(const std::string& reason) {
    if (closed_) return;
    closed_ = true;
    {
        std::lock_guard<std::mutex> lock(channel_->mutex);
        channel_->open = false;
    }
    if (!owns_session_) return;

    std::cout << "[stream] client disconnected from session " << session_id_
              << (reason.empty() ? "" : " (" + reason + ")") << std::endl;

    auto session = registry_.find(session_id_);
    if (!session) return;
    session->clear_client_sink();

    // Finalize owns the session from here; only an unfinished stream is abandoned.
    SessionState state = session->state();
    if (state == SessionState::Connecting || state == SessionState::Streaming) {
        registry_.abandon(session_id_, "client disconnected before finalize");
    }
}

void StreamHandler::send(const std::string& frame) {
    std::lock_guard<std::mutex> lock(channel_->mutex);
    if (channel_->open && channel_->send_text) channel_->send_text(frame);
}

void StreamHandler::close_connection(const std::string& reason) {
    if (close_) close_(reason);
}

} // namespace funnel::relay
