#include "client/recording_state_machine.hpp"
#include "common/session_id.hpp"

#include <iostream>

namespace funnel::client {

RecordingStateMachine::RecordingStateMachine(ClientConfig cfg,
                                             StreamTransportFactory transport_factory,
                                             std::shared_ptr<FinalizeClient> finalize_client,
                                             std::shared_ptr<audio::PermissionGate> permission,
                                             audio::AudioSourceFactory source_factory,
                                             audio::ArchiveSink* archive,
                                             ClockFn clock)
    : cfg_(std::move(cfg)),
      transport_factory_(std::move(transport_factory)),
      finalize_client_(std::move(finalize_client)),
      permission_(std::move(permission)),
      source_factory_(std::move(source_factory)),
      archive_(archive),
      clock_(std::move(clock)) {}

RecordingStateMachine::~RecordingStateMachine() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!is_terminal(state_) && state_ != SessionState::Idle) {
            state_ = SessionState::Failed;
        }
    }
    release();
}

// ============================================================================
// START
// ============================================================================

void RecordingStateMachine::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != SessionState::Idle && !is_terminal(state_)) {
            throw FunnelError(ErrorCode::InvalidState,
                              std::string("recording already in progress (") + to_string(state_) + ")");
        }
    }
    release();

    std::string session_id = generate_session_id();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // A finished recording leaves its state behind; a new start begins a fresh session.
        state_ = SessionState::Idle;
        session_id_ = session_id;
        ready_ = false;
        error_.reset();
        live_transcript_.clear();
        drained_ = false;
        audio_bytes_sent_ = 0;
        set_state_locked(SessionState::Connecting);
    }
    notify_state(SessionState::Connecting);
    std::cout << "[client] starting session " << session_id << std::endl;

    if (!permission_->request()) {
        FunnelError denied(ErrorCode::PermissionDenied, "microphone access was denied");
        {
            std::lock_guard<std::mutex> lock(mutex_);
            state_ = SessionState::Idle;
            error_ = denied;
        }
        notify_state(SessionState::Idle);
        std::cerr << "[client] " << denied.what() << std::endl;
        throw denied;
    }

    try {
        queue_ = std::make_unique<audio::FrameQueue>(cfg_.queue_capacity);
        capture_ = std::make_unique<audio::AudioCapture>(source_factory_(), *queue_, cfg_.chunk_ms, archive_);
        if (level_cb_) capture_->on_level(level_cb_);
        capture_->on_error([this](const FunnelError& e) { fail(e); });
        capture_->start();

        StreamConfig config;
        config.sample_rate = capture_->sample_rate();
        if (config.sample_rate != cfg_.sample_rate) {
            std::cout << "[client] device delivers " << config.sample_rate << " Hz (requested "
                      << cfg_.sample_rate << " Hz), declaring the device rate" << std::endl;
        }

        transport_ = transport_factory_();
        transport_->open(session_id,
                         [this](const StreamEvent& event) { handle_event(event); },
                         [this](const FunnelError& e) { handle_transport_error(e); });
        transport_->send_config(config);

        std::unique_lock<std::mutex> lock(mutex_);
        bool answered = cv_.wait_for(lock, cfg_.ready_timeout, [this] {
            return ready_ || error_.has_value() || state_ != SessionState::Connecting;
        });
        if (error_) {
            throw *error_;
        }
        if (!answered || !ready_) {
            throw FunnelError(ErrorCode::ConnectionFailure,
                              "relay did not acknowledge the config frame within " +
                                  std::to_string(cfg_.ready_timeout.count()) + "ms");
        }
        started_at_ = clock_();
        set_state_locked(SessionState::Streaming);
    } catch (const FunnelError& e) {
        fail(e);
        release();
        throw;
    } catch (const std::exception& e) {
        FunnelError wrapped(ErrorCode::ConnectionFailure, e.what());
        fail(wrapped);
        release();
        throw wrapped;
    }

    notify_state(SessionState::Streaming);
    sender_ = std::thread(&RecordingStateMachine::send_loop, this);
    std::cout << "[client] session " << session_id << " streaming at " << capture_->sample_rate() << " Hz" << std::endl;
}

// ============================================================================
// STOP
// ============================================================================

std::optional<AssembledTranscript> RecordingStateMachine::stop() {
    std::string session_id;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (state_ != SessionState::Streaming) {
            std::cout << "[client] stop ignored in state " << to_string(state_) << std::endl;
            return std::nullopt;
        }
        session_id = session_id_;

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started_at_);
        if (elapsed < cfg_.min_duration) {
            FunnelError too_short(ErrorCode::RecordingTooShort,
                                  "recording lasted " + std::to_string(elapsed.count()) + "ms, minimum is " +
                                      std::to_string(cfg_.min_duration.count()) + "ms");
            error_ = too_short;
            set_state_locked(SessionState::Failed);
            lock.unlock();

            std::cerr << "[client] " << too_short.what() << ", abandoning session " << session_id << std::endl;
            abandon();
            notify_state(SessionState::Failed);
            throw too_short;
        }

        set_state_locked(SessionState::Finalizing);
    }
    notify_state(SessionState::Finalizing);

    // Capture first, then drain what is queued, then finalize.
    capture_->stop();
    if (sender_.joinable()) sender_.join();
    drained_ = true;

    std::optional<FunnelError> drain_error;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Failed) {
            drain_error = error_.value_or(FunnelError(ErrorCode::ConnectionFailure, "session failed"));
        }
    }
    if (drain_error) {
        release();
        throw *drain_error;
    }

    AssembledTranscript result;
    try {
        result = finalize_client_->finalize(session_id, audio_bytes_sent_.load());
    } catch (const FunnelError& e) {
        std::cerr << "[client] finalize failed (" << to_string(e.code()) << "): " << e.what() << std::endl;
        fail(e);
        release();
        throw;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Finalizing) {
            set_state_locked(SessionState::Completed);
        }
    }
    // The stream stays open until the finalize response is in hand.
    release();
    notify_state(SessionState::Completed);

    std::cout << "[client] session " << session_id << " completed: " << result.segments.size()
              << " segments, " << result.duration << "s" << (result.partial ? " (partial)" : "") << std::endl;
    return result;
}

// ============================================================================
// EVENTS AND FAILURES
// ============================================================================

void RecordingStateMachine::handle_event(const StreamEvent& event) {
    switch (event.type) {
        case EventType::Ready: {
            std::lock_guard<std::mutex> lock(mutex_);
            ready_ = true;
            cv_.notify_all();
            return;
        }

        case EventType::Transcript: {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                live_transcript_ = event.full_transcript;
            }
            if (transcript_cb_) transcript_cb_(event.segment, event.full_transcript);
            return;
        }

        case EventType::Error: {
            SessionState state = this->state();
            std::cerr << "[client] relay error in state " << to_string(state) << ": " << event.message << std::endl;
            if (state == SessionState::Connecting) {
                std::lock_guard<std::mutex> lock(mutex_);
                if (!error_) error_ = FunnelError(ErrorCode::ConnectionFailure, event.message);
                cv_.notify_all();
            } else if (state == SessionState::Streaming) {
                fail(FunnelError(ErrorCode::BackendUnavailable, event.message));
            }
            return;
        }

        case EventType::Metadata:
        case EventType::ProcessingComplete:
            std::cout << "[client] relay processed " << event.duration << "s of audio" << std::endl;
            return;

        case EventType::Unknown:
            return;
    }
}

void RecordingStateMachine::handle_transport_error(const FunnelError& error) {
    // After the drain the stream only carries advisory events; finalize goes over its own request.
    if (drained_.load()) {
        std::cerr << "[client] stream closed during finalize: " << error.what() << std::endl;
        return;
    }
    fail(error);
}

void RecordingStateMachine::fail(const FunnelError& error) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == SessionState::Idle || is_terminal(state_)) return;
        if (!error_) error_ = error;
        set_state_locked(SessionState::Failed);
    }
    std::cerr << "[client] session failed (" << to_string(error.code()) << "): " << error.what() << std::endl;
    if (capture_) capture_->cancel();
    notify_state(SessionState::Failed);
}

// ============================================================================
// SENDER AND TEARDOWN
// ============================================================================

void RecordingStateMachine::send_loop() {
    audio::AudioFrame frame;
    while (queue_->pop(frame)) {
        try {
            transport_->send_audio(frame);
            audio_bytes_sent_ += frame.samples.size() * sizeof(int16_t);
        } catch (const FunnelError& e) {
            fail(e);
            queue_->discard();
            return;
        }
    }
}

void RecordingStateMachine::abandon() {
    if (capture_) capture_->abort();
    if (sender_.joinable()) sender_.join();
    release();
}

void RecordingStateMachine::release() {
    std::lock_guard<std::mutex> lock(release_mutex_);
    if (capture_) capture_->abort();
    if (sender_.joinable() && sender_.get_id() != std::this_thread::get_id()) {
        sender_.join();
    }
    if (transport_) transport_->close();
    capture_.reset();
    transport_.reset();
    queue_.reset();
}

// ============================================================================
// STATE
// ============================================================================

void RecordingStateMachine::set_state_locked(SessionState next) {
    if (!can_transition(state_, next)) {
        throw FunnelError(ErrorCode::InvalidState,
                          std::string("illegal transition ") + to_string(state_) + " -> " + to_string(next));
    }
    state_ = next;
    cv_.notify_all();
}

void RecordingStateMachine::notify_state(SessionState state) {
    if (state_cb_) state_cb_(state);
}

SessionState RecordingStateMachine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string RecordingStateMachine::session_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

std::optional<FunnelError> RecordingStateMachine::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

std::string RecordingStateMachine::live_transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return live_transcript_;
}

bool RecordingStateMachine::wait_for_state(SessionState target, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, target] { return state_ == target; });
}

} // namespace funnel::client
