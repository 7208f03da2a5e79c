#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace funnel::audio {

/// A block of interleaved float samples as delivered by a source.
struct AudioBlock {
    std::vector<float> samples;
    int channels = 1;
    int sample_rate = 0;
};

// Lazy, cancelable sequence of audio blocks. Two variants exist: the live
// microphone (PortAudioSource) and file playback (FilePlaybackSource).
class AudioSource {
public:
    virtual ~AudioSource() = default;

    // Opens the device or file. Throws FunnelError(CaptureFailure) on failure.
    virtual void start() = 0;

    // Blocks until the next block is available. std::nullopt once the source
    // is exhausted or cancel() was called and everything captured so far was returned.
    virtual std::optional<AudioBlock> next() = 0;

    // Stops producing new audio. Safe to call from any thread, more than once.
    virtual void cancel() = 0;

    virtual int sample_rate() const = 0;
    virtual int channels() const = 0;
};

using AudioSourceFactory = std::function<std::unique_ptr<AudioSource>()>;

// Asked once per start() before any device is opened.
class PermissionGate {
public:
    virtual ~PermissionGate() = default;
    virtual bool request() = 0;
};

// Used for file playback, where no device access is involved.
class GrantedPermission : public PermissionGate {
public:
    bool request() override { return true; }
};

} // namespace funnel::audio
