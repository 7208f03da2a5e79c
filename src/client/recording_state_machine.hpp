#pragma once

#include "audio/archive_sink.hpp"
#include "audio/audio_capture.hpp"
#include "audio/audio_source.hpp"
#include "audio/frame_queue.hpp"
#include "client/finalize_client.hpp"
#include "client/stream_transport.hpp"
#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/protocol.hpp"
#include "common/session_state.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace funnel::client {

using StreamTransportFactory = std::function<std::unique_ptr<StreamTransport>()>;

// Client-side lifecycle of one recording at a time:
// Idle -> Connecting -> Streaming -> Finalizing -> {Completed | Failed}.
// The audio source strategy (microphone or file playback) is fixed at construction.
class RecordingStateMachine {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using StateCallback = std::function<void(SessionState)>;
    using TranscriptCallback = std::function<void(const TranscriptSegment&, const std::string&)>;
    using LevelCallback = std::function<void(float)>;

    RecordingStateMachine(ClientConfig cfg,
                          StreamTransportFactory transport_factory,
                          std::shared_ptr<FinalizeClient> finalize_client,
                          std::shared_ptr<audio::PermissionGate> permission,
                          audio::AudioSourceFactory source_factory,
                          audio::ArchiveSink* archive = nullptr,
                          ClockFn clock = Clock::now);
    ~RecordingStateMachine();

    RecordingStateMachine(const RecordingStateMachine&) = delete;
    RecordingStateMachine& operator=(const RecordingStateMachine&) = delete;

    void on_state(StateCallback cb) { state_cb_ = std::move(cb); }
    void on_transcript(TranscriptCallback cb) { transcript_cb_ = std::move(cb); }
    void on_level(LevelCallback cb) { level_cb_ = std::move(cb); }

    /// Begins a new recording and returns once the relay has sent "ready".
    /// Throws FunnelError: PermissionDenied (back to Idle), CaptureFailure or
    /// ConnectionFailure (Failed), InvalidState while a recording is in progress.
    void start();

    /// Stops and finalizes. No-op (std::nullopt) unless Streaming.
    /// Throws FunnelError(RecordingTooShort) below the minimum duration; the
    /// session is then abandoned and no finalize request is made.
    std::optional<AssembledTranscript> stop();

    SessionState state() const;
    std::string session_id() const;
    std::optional<FunnelError> last_error() const;
    std::string live_transcript() const;

    /// True once `target` is reached within `timeout`.
    bool wait_for_state(SessionState target, std::chrono::milliseconds timeout) const;

private:
    void set_state_locked(SessionState next);
    void notify_state(SessionState state);

    void handle_event(const StreamEvent& event);
    void handle_transport_error(const FunnelError& error);

    /// Failure from any thread: marks Failed and cancels capture without joining.
    void fail(const FunnelError& error);

    void send_loop();
    void abandon();
    void release();

    ClientConfig cfg_;
    StreamTransportFactory transport_factory_;
    std::shared_ptr<FinalizeClient> finalize_client_;
    std::shared_ptr<audio::PermissionGate> permission_;
    audio::AudioSourceFactory source_factory_;
    audio::ArchiveSink* archive_;
    ClockFn clock_;

    StateCallback state_cb_;
    TranscriptCallback transcript_cb_;
    LevelCallback level_cb_;

    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    SessionState state_ = SessionState::Idle;
    std::string session_id_;
    Clock::time_point started_at_;
    bool ready_ = false;
    std::optional<FunnelError> error_;
    std::string live_transcript_;

    // Per-recording resources, torn down by release().
    std::mutex release_mutex_;
    std::unique_ptr<StreamTransport> transport_;
    std::unique_ptr<audio::FrameQueue> queue_;
    std::unique_ptr<audio::AudioCapture> capture_;
    std::thread sender_;
    std::atomic<bool> drained_{false};
    std::atomic<uint64_t> audio_bytes_sent_{0};
};

} // namespace funnel::client
