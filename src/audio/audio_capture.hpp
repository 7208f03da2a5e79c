#pragma once

#include "audio/archive_sink.hpp"
#include "audio/audio_source.hpp"
#include "audio/frame_queue.hpp"
#include "common/errors.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <thread>

namespace funnel::audio {

// Pulls blocks from an AudioSource on its own thread, converts them to mono
// PCM16, cuts them into chunk_ms frames and hands each frame to the outbound
// queue (and the optional archive). Also publishes the loudness meter.
class AudioCapture {
public:
    using LevelCallback = std::function<void(float)>;
    using ErrorCallback = std::function<void(const FunnelError&)>;

    AudioCapture(std::unique_ptr<AudioSource> source, FrameQueue& queue, int chunk_ms = 100,
                 ArchiveSink* archive = nullptr);
    ~AudioCapture();

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    void on_level(LevelCallback cb) { level_cb_ = std::move(cb); }
    void on_error(ErrorCallback cb) { error_cb_ = std::move(cb); }

    /// Starts the source and the pump thread. Throws FunnelError if the source fails to start.
    void start();

    /// Stops the source, flushes the last partial frame, closes the queue. Idempotent.
    void stop();

    /// Like stop() but discards anything not yet sent.
    void abort();

    /// Non-blocking half of abort(): stops the source and discards the queue
    /// without joining. Safe from any callback thread.
    void cancel();

    int sample_rate() const { return sample_rate_; }
    float level() const { return level_.load(); }
    uint64_t samples_captured() const { return samples_captured_.load(); }
    uint64_t frames_emitted() const { return frames_emitted_.load(); }

private:
    void pump();
    void emit(std::vector<int16_t>&& samples);
    void join();

    std::unique_ptr<AudioSource> source_;
    FrameQueue& queue_;
    int chunk_ms_;
    ArchiveSink* archive_;
    int sample_rate_ = 0;

    LevelCallback level_cb_;
    ErrorCallback error_cb_;

    std::vector<int16_t> pending_;
    std::thread pump_thread_;
    std::atomic<bool> started_{false};
    std::atomic<float> level_{0.0f};
    std::atomic<uint64_t> samples_captured_{0};
    std::atomic<uint64_t> frames_emitted_{0};
};

} // namespace funnel::audio
