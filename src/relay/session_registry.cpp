#include "relay/session_registry.hpp"

#include <iostream>

namespace funnel::relay {

SessionRegistry::SessionRegistry(std::shared_ptr<BackendConnector> connector,
                                 FinalizeOptions finalize_options,
                                 std::chrono::milliseconds retention)
    : connector_(std::move(connector)), coordinator_(finalize_options), retention_(retention) {}

SessionRegistry::~SessionRegistry() {
    shutdown();
}

std::shared_ptr<Session> SessionRegistry::create_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.count(session_id)) {
        throw FunnelError(ErrorCode::DuplicateSession, "session " + session_id + " already exists");
    }
    auto session = std::make_shared<Session>(session_id);
    sessions_.emplace(session_id, session);
    std::cout << "[registry] session " << session_id << " created (" << sessions_.size() << " active)" << std::endl;
    return session;
}

std::shared_ptr<Session> SessionRegistry::find(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(session_id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::shared_ptr<Session> SessionRegistry::get(const std::string& session_id) const {
    auto session = find(session_id);
    if (!session) {
        throw FunnelError(ErrorCode::UnknownSession, "unknown session " + session_id);
    }
    return session;
}

void SessionRegistry::configure(const std::string& session_id, const StreamConfig& config) {
    auto session = get(session_id);
    if (session->configured()) {
        throw FunnelError(ErrorCode::ProtocolError, "session " + session_id + " is already configured");
    }

    // The backend thread only holds a weak reference; eviction ends delivery.
    std::weak_ptr<Session> weak = session;
    auto handler = [weak](const BackendEvent& event) {
        if (auto s = weak.lock()) {
            s->handle_backend_event(event);
        }
    };

    std::shared_ptr<BackendConnection> backend;
    try {
        backend = connector_->connect(session_id, config, handler);
    } catch (const FunnelError& e) {
        session->fail(e.code(), e.what());
        throw;
    } catch (const std::exception& e) {
        session->fail(ErrorCode::ConnectionFailure, e.what());
        throw FunnelError(ErrorCode::ConnectionFailure, e.what());
    }

    session->attach_backend(std::move(backend), config);
    std::cout << "[registry] session " << session_id << " streaming at " << config.sample_rate << " Hz" << std::endl;
}

void SessionRegistry::append_audio(const std::string& session_id, const std::string& pcm) {
    get(session_id)->append_audio(pcm);
}

void SessionRegistry::append_transcript(const std::string& session_id, const TranscriptSegment& segment) {
    get(session_id)->append_transcript(segment);
}

AssembledTranscript SessionRegistry::finalize(const std::string& session_id,
                                              std::optional<uint64_t> expected_audio_bytes) {
    return coordinator_.finalize(get(session_id), expected_audio_bytes);
}

void SessionRegistry::abandon(const std::string& session_id, const std::string& reason) {
    if (auto session = find(session_id)) {
        session->fail(ErrorCode::ConnectionFailure, reason);
    }
}

size_t SessionRegistry::evict_expired(Session::Clock::time_point now) {
    std::vector<std::shared_ptr<Session>> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (it->second->expired(now, retention_)) {
                evicted.push_back(it->second);
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& session : evicted) {
        std::cout << "[registry] evicted session " << session->id() << " ("
                  << to_string(session->state()) << ")" << std::endl;
    }
    return evicted.size();
}

size_t SessionRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

std::vector<std::string> SessionRegistry::session_ids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
        ids.push_back(id);
    }
    return ids;
}

void SessionRegistry::shutdown() {
    std::map<std::string, std::shared_ptr<Session>> sessions;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sessions.swap(sessions_);
    }
    for (auto& [id, session] : sessions) {
        session->fail(ErrorCode::ConnectionFailure, "relay shutting down");
    }
}

} // namespace funnel::relay
