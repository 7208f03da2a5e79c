#pragma once

#include "audio/audio_source.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>

namespace funnel::audio {

// Replays a WAV file (PCM16 or float32, any channel count) or an in-memory
// buffer as if it were a microphone. With `realtime` set, each block is held
// back for its own duration; otherwise blocks are returned as fast as asked.
class FilePlaybackSource : public AudioSource {
public:
    FilePlaybackSource(std::string path, int block_ms = 20, bool realtime = false);
    FilePlaybackSource(std::vector<float> interleaved, int sample_rate, int channels,
                       int block_ms = 20, bool realtime = false);

    void start() override;
    std::optional<AudioBlock> next() override;
    void cancel() override;

    int sample_rate() const override { return sample_rate_; }
    int channels() const override { return channels_; }
    double duration_seconds() const;

private:
    void load_wav();

    std::string path_;
    std::vector<float> samples_; // interleaved
    int sample_rate_ = 0;
    int channels_ = 0;
    int block_ms_;
    bool realtime_;
    size_t cursor_ = 0;
    bool started_ = false;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> cancelled_{false};
};

} // namespace funnel::audio
