#include "audio/portaudio_source.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <thread>

namespace funnel::audio {

namespace {

// Ten seconds at the highest rate we accept.
constexpr size_t kRingCapacity = 48000 * 10;

void ensure_portaudio_initialized() {
    static std::mutex init_mutex;
    static bool initialized = false;

    std::lock_guard<std::mutex> lock(init_mutex);
    if (initialized) return;
    PaError err = Pa_Initialize();
    if (err != paNoError) {
        throw FunnelError(ErrorCode::CaptureFailure, "PortAudio init failed: " + std::string(Pa_GetErrorText(err)));
    }
    initialized = true;
    std::atexit([] { Pa_Terminate(); });
}

} // namespace

PortAudioSource::PortAudioSource(int requested_sample_rate, int block_ms)
    : requested_sample_rate_(requested_sample_rate), block_ms_(block_ms > 0 ? block_ms : 20), ring_(kRingCapacity) {}

PortAudioSource::~PortAudioSource() {
    close_stream();
}

void PortAudioSource::start() {
    ensure_portaudio_initialized();

    PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (device == paNoDevice) {
        throw FunnelError(ErrorCode::PermissionDenied, "no default input device is available");
    }
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    if (!info || info->maxInputChannels < 1) {
        throw FunnelError(ErrorCode::PermissionDenied, "default input device has no input channels");
    }

    PaStreamParameters params{};
    params.device = device;
    params.channelCount = 1;
    params.sampleFormat = paFloat32;
    params.suggestedLatency = info->defaultLowInputLatency;
    params.hostApiSpecificStreamInfo = nullptr;

    // Prefer the requested rate; fall back to the device's native rate.
    double rate = requested_sample_rate_;
    if (Pa_IsFormatSupported(&params, nullptr, rate) != paFormatIsSupported) {
        rate = info->defaultSampleRate;
        if (Pa_IsFormatSupported(&params, nullptr, rate) != paFormatIsSupported && info->maxInputChannels >= 2) {
            params.channelCount = 2;
        }
    }
    device_channels_ = params.channelCount;
    sample_rate_ = static_cast<int>(rate);

    std::lock_guard<std::mutex> lock(stream_mutex_);
    PaError err = Pa_OpenStream(&stream_, &params, nullptr, rate, paFramesPerBufferUnspecified,
                                paNoFlag, &PortAudioSource::pa_callback, this);
    if (err != paNoError) {
        stream_ = nullptr;
        throw FunnelError(ErrorCode::CaptureFailure, "PortAudio error (open stream): " + std::string(Pa_GetErrorText(err)));
    }
    err = Pa_StartStream(stream_);
    if (err != paNoError) {
        Pa_CloseStream(stream_);
        stream_ = nullptr;
        throw FunnelError(ErrorCode::CaptureFailure, "PortAudio error (start stream): " + std::string(Pa_GetErrorText(err)));
    }

    std::cout << "[capture] recording from '" << info->name << "' at " << sample_rate_
              << " Hz (" << device_channels_ << " channel(s), using channel 0)" << std::endl;
}

int PortAudioSource::pa_callback(const void* input, void*,
                                 unsigned long frame_count,
                                 const PaStreamCallbackTimeInfo*,
                                 PaStreamCallbackFlags,
                                 void* user_data) {
    auto* self = static_cast<PortAudioSource*>(user_data);
    if (!input) return paContinue;

    size_t written = self->ring_.push_strided(static_cast<const float*>(input), frame_count,
                                              static_cast<size_t>(self->device_channels_));
    if (written < frame_count) {
        self->dropped_.fetch_add(frame_count - written, std::memory_order_relaxed);
    }
    return self->cancelled_.load(std::memory_order_relaxed) ? paComplete : paContinue;
}

std::optional<AudioBlock> PortAudioSource::next() {
    const size_t block = std::max<size_t>(1, static_cast<size_t>(sample_rate_) * block_ms_ / 1000);
    AudioBlock out;
    out.channels = 1;
    out.sample_rate = sample_rate_;
    out.samples.resize(block);

    while (true) {
        // Drain what the callback already produced, even after cancel().
        size_t n = ring_.pop(out.samples.data(), block);
        if (n > 0) {
            out.samples.resize(n);
            return out;
        }
        if (cancelled_.load()) return std::nullopt;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void PortAudioSource::cancel() {
    if (cancelled_.exchange(true)) return;
    close_stream();
    if (dropped_.load() > 0) {
        std::cerr << "[capture] ring buffer overrun, dropped " << dropped_.load() << " samples" << std::endl;
    }
}

void PortAudioSource::close_stream() {
    std::lock_guard<std::mutex> lock(stream_mutex_);
    if (!stream_) return;
    Pa_StopStream(stream_); // ignore error if already stopped
    Pa_CloseStream(stream_);
    stream_ = nullptr;
}

bool PortAudioPermissionGate::request() {
    try {
        ensure_portaudio_initialized();
    } catch (const FunnelError& e) {
        std::cerr << "[capture] " << e.what() << std::endl;
        return false;
    }
    PaDeviceIndex device = Pa_GetDefaultInputDevice();
    if (device == paNoDevice) return false;
    const PaDeviceInfo* info = Pa_GetDeviceInfo(device);
    return info && info->maxInputChannels > 0;
}

} // namespace funnel::audio
