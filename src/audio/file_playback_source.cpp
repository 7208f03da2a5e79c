#include "audio/file_playback_source.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <fstream>

namespace funnel::audio {

namespace {
struct WavHeader {
    char riff[4];
    uint32_t chunkSize;
    char wave[4];
    char fmt[4];
    uint32_t subchunk1Size;
    uint16_t audioFormat; // 1=PCM, 3=float
    uint16_t numChannels;
    uint32_t sampleRate;
    uint32_t byteRate;
    uint16_t blockAlign;
    uint16_t bitsPerSample;
};

[[noreturn]] void fail(const std::string& path, const std::string& why) {
    throw FunnelError(ErrorCode::CaptureFailure, "cannot play '" + path + "': " + why);
}
} // namespace

FilePlaybackSource::FilePlaybackSource(std::string path, int block_ms, bool realtime)
    : path_(std::move(path)), block_ms_(std::max(1, block_ms)), realtime_(realtime) {}

FilePlaybackSource::FilePlaybackSource(std::vector<float> interleaved, int sample_rate, int channels,
                                       int block_ms, bool realtime)
    : samples_(std::move(interleaved)),
      sample_rate_(sample_rate),
      channels_(channels),
      block_ms_(std::max(1, block_ms)),
      realtime_(realtime) {
    if (sample_rate_ <= 0 || channels_ <= 0) {
        throw FunnelError(ErrorCode::CaptureFailure, "playback buffer needs a positive rate and channel count");
    }
}

void FilePlaybackSource::start() {
    if (!path_.empty()) load_wav();
    cursor_ = 0;
    started_ = true;
}

void FilePlaybackSource::load_wav() {
    std::ifstream f(path_, std::ios::binary);
    if (!f) fail(path_, "file not found");
    WavHeader hdr{};
    if (!f.read(reinterpret_cast<char*>(&hdr), sizeof(hdr))) fail(path_, "truncated header");
    if (std::strncmp(hdr.riff, "RIFF", 4) != 0 || std::strncmp(hdr.wave, "WAVE", 4) != 0) {
        fail(path_, "not a RIFF/WAVE file");
    }

    // Skip the optional fmt extension, then walk chunks until "data"
    uint32_t fmtExtra = hdr.subchunk1Size > 16 ? hdr.subchunk1Size - 16 : 0;
    if (fmtExtra) f.seekg(fmtExtra, std::ios::cur);

    char chunkId[4];
    uint32_t chunkSize = 0;
    bool found = false;
    while (f.read(chunkId, 4)) {
        if (!f.read(reinterpret_cast<char*>(&chunkSize), 4)) break;
        if (std::strncmp(chunkId, "data", 4) == 0) {
            found = true;
            break;
        }
        f.seekg(chunkSize, std::ios::cur);
    }
    if (!found) fail(path_, "no data chunk");
    if (hdr.numChannels == 0 || hdr.sampleRate == 0) fail(path_, "invalid fmt chunk");

    const size_t count = chunkSize / std::max<size_t>(1, hdr.bitsPerSample / 8);
    samples_.resize(count);

    if (hdr.audioFormat == 1 && hdr.bitsPerSample == 16) {
        std::vector<int16_t> buf(count);
        if (!f.read(reinterpret_cast<char*>(buf.data()), buf.size() * sizeof(int16_t))) {
            fail(path_, "truncated data chunk");
        }
        for (size_t i = 0; i < count; ++i) {
            samples_[i] = static_cast<float>(buf[i]) / 32768.0f;
        }
    } else if (hdr.audioFormat == 3 && hdr.bitsPerSample == 32) {
        if (!f.read(reinterpret_cast<char*>(samples_.data()), samples_.size() * sizeof(float))) {
            fail(path_, "truncated data chunk");
        }
    } else {
        fail(path_, "only 16-bit PCM and 32-bit float WAV are supported");
    }

    sample_rate_ = static_cast<int>(hdr.sampleRate);
    channels_ = hdr.numChannels;
}

std::optional<AudioBlock> FilePlaybackSource::next() {
    if (!started_ || cancelled_.load()) return std::nullopt;

    const size_t frames_per_block = std::max<size_t>(1, static_cast<size_t>(sample_rate_) * block_ms_ / 1000);
    const size_t total_frames = samples_.size() / static_cast<size_t>(channels_);
    const size_t frame_cursor = cursor_ / static_cast<size_t>(channels_);
    if (frame_cursor >= total_frames) return std::nullopt;

    size_t n = std::min(frames_per_block, total_frames - frame_cursor);

    if (realtime_) {
        auto hold = std::chrono::microseconds(static_cast<int64_t>(n) * 1000000 / sample_rate_);
        std::unique_lock<std::mutex> lock(mutex_);
        if (cv_.wait_for(lock, hold, [this] { return cancelled_.load(); })) {
            return std::nullopt;
        }
    }

    AudioBlock block;
    block.channels = channels_;
    block.sample_rate = sample_rate_;
    auto first = samples_.begin() + static_cast<std::ptrdiff_t>(cursor_);
    block.samples.assign(first, first + static_cast<std::ptrdiff_t>(n * channels_));
    cursor_ += n * channels_;
    return block;
}

void FilePlaybackSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

double FilePlaybackSource::duration_seconds() const {
    if (sample_rate_ <= 0 || channels_ <= 0) return 0.0;
    return static_cast<double>(samples_.size() / channels_) / sample_rate_;
}

} // namespace funnel::audio
