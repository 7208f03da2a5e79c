#include "relay/session.hpp"

#include <ctime>
#include <iostream>

namespace funnel::relay {

namespace {

std::string iso_timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

} // namespace

const char* to_string(FinalizePhase phase) {
    switch (phase) {
        case FinalizePhase::Streaming:            return "streaming";
        case FinalizePhase::AwaitingClientAudio:  return "awaiting_client_audio";
        case FinalizePhase::AwaitingBackendFlush: return "awaiting_backend_flush";
        case FinalizePhase::AssemblingTranscript: return "assembling_transcript";
        case FinalizePhase::TimedOut:             return "timed_out";
        case FinalizePhase::Done:                 return "done";
    }
    return "unknown";
}

Session::Session(std::string id)
    : id_(std::move(id)), started_at_(std::chrono::system_clock::now()) {}

Session::~Session() {
    std::shared_ptr<BackendConnection> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        backend = take_backend_locked();
    }
    if (backend) backend->close();
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

FinalizePhase Session::phase() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return phase_;
}

// ============================================================================
// STREAMING PATH
// ============================================================================

void Session::set_client_sink(ClientSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    client_sink_ = std::move(sink);
}

void Session::clear_client_sink() {
    std::lock_guard<std::mutex> lock(mutex_);
    client_sink_ = nullptr;
}

void Session::attach_backend(std::shared_ptr<BackendConnection> backend, const StreamConfig& config) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (state_ != SessionState::Connecting || configured_) {
        lock.unlock();
        // Session moved on while the backend was connecting; the channel has no owner.
        if (backend) backend->close();
        throw FunnelError(ErrorCode::InvalidState,
                          "session " + id_ + " cannot accept a backend in state " + to_string(state()));
    }
    backend_ = std::move(backend);
    config_ = config;
    configured_ = true;
    transition_locked(SessionState::Streaming);
}

bool Session::configured() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return configured_;
}

void Session::append_audio(const std::string& pcm) {
    // Held across the send so close_input() cannot slip in between check and send.
    std::lock_guard<std::mutex> input(input_mutex_);
    std::shared_ptr<BackendConnection> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool accepting = state_ == SessionState::Streaming ||
                               (state_ == SessionState::Finalizing && !input_closed_);
        if (!accepting || !backend_ || !backend_->is_open()) {
            throw FunnelError(ErrorCode::BackendUnavailable,
                              "no open backend connection for session " + id_);
        }
        backend = backend_;
    }
    // Frames of one session arrive on one client connection, so sends stay in order.
    backend->send_audio(pcm);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        audio_bytes_received_ += pcm.size();
    }
    cv_.notify_all();
}

void Session::close_input() {
    std::lock_guard<std::mutex> input(input_mutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    input_closed_ = true;
}

void Session::append_transcript(const TranscriptSegment& segment) {
    ClientSink sink;
    std::string full;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) return;
        // Interim hypotheses only go to the client; the next final supersedes them.
        if (segment.is_final) {
            segments_.push_back(segment);
            append_final_text(final_text_, segment);
        }
        full = final_text_;
        sink = client_sink_;
    }
    send_to_client(sink, make_transcript_event(segment, full));
}

void Session::handle_backend_event(const BackendEvent& event) {
    switch (event.type) {
        case BackendEventType::Transcript:
            append_transcript(event.segment);
            return;

        case BackendEventType::Metadata: {
            ClientSink sink;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (metadata_duration_) return;
                metadata_duration_ = event.duration;
                sink = client_sink_;
            }
            cv_.notify_all();
            std::cout << "[session] " << id_ << " backend reported " << event.duration
                      << "s processed" << std::endl;
            send_to_client(sink, make_processing_complete_event(event.duration));
            return;
        }

        case BackendEventType::Error: {
            ClientSink sink;
            bool streaming;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                streaming = state_ == SessionState::Streaming || state_ == SessionState::Connecting;
                if (!streaming) backend_gone_ = true;
                sink = client_sink_;
            }
            std::cerr << "[session] " << id_ << " backend error: " << event.message << std::endl;
            send_to_client(sink, make_error_event(event.message));
            if (streaming) {
                fail(ErrorCode::BackendUnavailable, event.message);
            } else {
                cv_.notify_all();
            }
            return;
        }

        case BackendEventType::Closed: {
            ClientSink sink;
            bool streaming;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                backend_gone_ = true;
                streaming = state_ == SessionState::Streaming;
                sink = client_sink_;
            }
            cv_.notify_all();
            if (streaming) {
                send_to_client(sink, make_error_event("transcription backend disconnected"));
                fail(ErrorCode::ConnectionFailure, "backend closed: " + event.message);
            }
            return;
        }
    }
}

void Session::fail(ErrorCode code, const std::string& reason) {
    std::shared_ptr<BackendConnection> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (is_terminal(state_)) return;
        failure_ = code;
        failure_reason_ = reason;
        transition_locked(SessionState::Failed);
        backend = take_backend_locked();
    }
    cv_.notify_all();
    std::cerr << "[session] " << id_ << " failed (" << to_string(code) << "): " << reason << std::endl;
    if (backend) backend->close();
}

// ============================================================================
// FINALIZE PATH
// ============================================================================

Session::FinalizeClaim Session::claim_finalize() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::Failed) {
        throw FunnelError(ErrorCode::InvalidState,
                          "session " + id_ + " failed: " + failure_reason_);
    }
    if (result_) return FinalizeClaim::Done;
    if (finalize_claimed_) return FinalizeClaim::InProgress;

    finalize_claimed_ = true;
    ended_at_ = std::chrono::system_clock::now();
    transition_locked(SessionState::Finalizing);
    return FinalizeClaim::Claimed;
}

void Session::set_phase(FinalizePhase phase) {
    std::lock_guard<std::mutex> lock(mutex_);
    phase_ = phase;
}

std::shared_ptr<BackendConnection> Session::backend() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return backend_;
}

bool Session::wait_for_audio(uint64_t expected_bytes, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this, expected_bytes] {
        return audio_bytes_received_ >= expected_bytes || backend_gone_ || state_ == SessionState::Failed;
    });
    return audio_bytes_received_ >= expected_bytes;
}

bool Session::wait_for_flush(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        return metadata_duration_.has_value() || backend_gone_ || state_ == SessionState::Failed;
    });
}

void Session::complete(const AssembledTranscript& result) {
    std::shared_ptr<BackendConnection> backend;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Finalizing) {
            throw FunnelError(ErrorCode::InvalidState,
                              "session " + id_ + " cannot complete from state " + to_string(state_));
        }
        result_ = result;
        phase_ = FinalizePhase::Done;
        transition_locked(SessionState::Completed);
        backend = take_backend_locked();
    }
    cv_.notify_all();
    if (backend) backend->close();
}

std::optional<AssembledTranscript> Session::wait_for_result(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return result_.has_value() || state_ == SessionState::Failed; });
    return result_;
}

std::optional<AssembledTranscript> Session::cached_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return result_;
}

// ============================================================================
// INSPECTION
// ============================================================================

std::vector<TranscriptSegment> Session::segments() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return segments_;
}

std::string Session::final_text() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return final_text_;
}

uint64_t Session::audio_bytes_received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return audio_bytes_received_;
}

std::optional<double> Session::metadata_duration() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_duration_;
}

int Session::sample_rate() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.sample_rate;
}

std::optional<ErrorCode> Session::failure() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_;
}

bool Session::expired(Clock::time_point now, std::chrono::milliseconds retention) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_at_ && now - *terminal_at_ >= retention;
}

json Session::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    json j = {
        {"recordingId", id_},
        {"state", to_string(state_)},
        {"finalizePhase", to_string(phase_)},
        {"audioBytesReceived", audio_bytes_received_},
        {"segmentCount", segments_.size()},
        {"transcript", final_text_},
        {"startedAt", iso_timestamp(started_at_)},
        {"endedAt", ended_at_ ? json(iso_timestamp(*ended_at_)) : json(nullptr)}
    };
    if (configured_) {
        j["sampleRate"] = config_.sample_rate;
    }
    if (failure_) {
        j["error"] = to_string(*failure_);
        j["message"] = failure_reason_;
    }
    return j;
}

// ============================================================================
// INTERNALS
// ============================================================================

void Session::transition_locked(SessionState next) {
    if (!can_transition(state_, next)) {
        throw FunnelError(ErrorCode::InvalidState,
                          std::string("illegal transition ") + to_string(state_) + " -> " + to_string(next) +
                              " for session " + id_);
    }
    state_ = next;
    if (is_terminal(next)) {
        terminal_at_ = Clock::now();
    }
}

std::shared_ptr<BackendConnection> Session::take_backend_locked() {
    return std::move(backend_);
}

void Session::send_to_client(const ClientSink& sink, const std::string& frame) {
    if (!sink) return;
    try {
        sink(frame);
    } catch (const std::exception& e) {
        std::cerr << "[session] " << id_ << " client send failed: " << e.what() << std::endl;
    }
}

} // namespace funnel::relay
