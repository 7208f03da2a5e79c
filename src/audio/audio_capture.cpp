#include "audio/audio_capture.hpp"

#include <algorithm>
#include <iostream>

namespace funnel::audio {

AudioCapture::AudioCapture(std::unique_ptr<AudioSource> source, FrameQueue& queue, int chunk_ms,
                           ArchiveSink* archive)
    : source_(std::move(source)), queue_(queue), chunk_ms_(chunk_ms > 0 ? chunk_ms : 100), archive_(archive) {}

AudioCapture::~AudioCapture() {
    abort();
}

void AudioCapture::start() {
    if (started_.exchange(true)) {
        throw FunnelError(ErrorCode::InvalidState, "capture already started");
    }
    try {
        source_->start();
    } catch (...) {
        queue_.close();
        throw;
    }
    sample_rate_ = source_->sample_rate();
    pump_thread_ = std::thread(&AudioCapture::pump, this);
}

void AudioCapture::stop() {
    source_->cancel();
    join();
    queue_.close();
}

void AudioCapture::abort() {
    source_->cancel();
    queue_.discard();
    join();
}

void AudioCapture::cancel() {
    source_->cancel();
    queue_.discard();
}

void AudioCapture::join() {
    if (pump_thread_.joinable() && pump_thread_.get_id() != std::this_thread::get_id()) {
        pump_thread_.join();
    }
}

void AudioCapture::pump() {
    const size_t chunk_samples =
        std::max<size_t>(1, static_cast<size_t>(sample_rate_) * static_cast<size_t>(chunk_ms_) / 1000);

    try {
        while (auto block = source_->next()) {
            // Mono only: keep channel 0 of interleaved input
            const size_t channels = static_cast<size_t>(std::max(1, block->channels));
            std::vector<float> mono;
            if (channels == 1) {
                mono = std::move(block->samples);
            } else {
                mono.reserve(block->samples.size() / channels);
                for (size_t i = 0; i < block->samples.size(); i += channels) {
                    mono.push_back(block->samples[i]);
                }
            }

            std::vector<int16_t> pcm = float_to_pcm16(mono.data(), mono.size());
            samples_captured_ += pcm.size();

            pending_.insert(pending_.end(), pcm.begin(), pcm.end());
            while (pending_.size() >= chunk_samples) {
                std::vector<int16_t> chunk(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(chunk_samples));
                pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(chunk_samples));
                emit(std::move(chunk));
            }
        }
        if (!pending_.empty()) {
            emit(std::move(pending_));
            pending_.clear();
        }
    } catch (const FunnelError& e) {
        std::cerr << "[capture] " << to_string(e.code()) << ": " << e.what() << std::endl;
        source_->cancel();
        queue_.close();
        if (error_cb_) error_cb_(e);
        return;
    }

    queue_.close();
    std::cout << "[capture] source finished after " << samples_captured_.load() << " samples, "
              << frames_emitted_.load() << " frames" << std::endl;
}

void AudioCapture::emit(std::vector<int16_t>&& samples) {
    AudioFrame frame{std::move(samples), sample_rate_};

    // One reading per outbound frame.
    float level = normalized_level(frame.samples.data(), frame.samples.size());
    level_.store(level);
    if (level_cb_) level_cb_(level);

    if (archive_) {
        try {
            archive_->write(frame);
        } catch (const std::exception& e) {
            std::cerr << "[capture] archive disabled: " << e.what() << std::endl;
            archive_ = nullptr;
        }
    }

    uint64_t count = frames_emitted_.fetch_add(1) + 1;
    if (!queue_.try_push(std::move(frame)) && !queue_.closed()) {
        std::cerr << "[capture] outbound queue full, frame #" << count << " dropped (overruns: "
                  << queue_.overruns() << ")" << std::endl;
    }
}

} // namespace funnel::audio
