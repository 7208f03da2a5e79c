#pragma once

#include "audio/audio_source.hpp"
#include "audio/ring_buffer.hpp"

#include <portaudio.h>

#include <atomic>
#include <mutex>

namespace funnel::audio {

// Live microphone through PortAudio's callback API. The callback only copies
// channel 0 into a lock-free ring; next() drains the ring on the caller's thread.
class PortAudioSource : public AudioSource {
public:
    explicit PortAudioSource(int requested_sample_rate = 16000, int block_ms = 20);
    ~PortAudioSource() override;

    PortAudioSource(const PortAudioSource&) = delete;
    PortAudioSource& operator=(const PortAudioSource&) = delete;

    void start() override;
    std::optional<AudioBlock> next() override;
    void cancel() override;

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return 1; }

    size_t dropped_samples() const { return dropped_.load(); }

private:
    static int pa_callback(const void* input, void* output,
                           unsigned long frame_count,
                           const PaStreamCallbackTimeInfo* time_info,
                           PaStreamCallbackFlags status_flags,
                           void* user_data);

    void close_stream();

    int requested_sample_rate_;
    int sample_rate_ = 0;
    int device_channels_ = 1;
    int block_ms_;
    RingBufferF32 ring_;

    std::mutex stream_mutex_;
    PaStream* stream_ = nullptr;
    std::atomic<bool> cancelled_{false};
    std::atomic<size_t> dropped_{0};
};

// Grants access when PortAudio reports a default input device with input channels.
class PortAudioPermissionGate : public PermissionGate {
public:
    bool request() override;
};

} // namespace funnel::audio
