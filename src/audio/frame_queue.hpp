#pragma once

#include "audio/pcm.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>

namespace funnel::audio {

// Bounded hand-off between the capture pump and the network sender.
// The producer never blocks: a full queue rejects the frame and counts an overrun.
// After close() the consumer still drains every frame already queued.
class FrameQueue {
public:
    explicit FrameQueue(size_t capacity = 256) : capacity_(capacity) {}

    // Called by the capture pump. Returns false if the queue is full or closed.
    bool try_push(AudioFrame&& frame) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= capacity_) {
            overruns_++;
            return false;
        }
        queue_.push(std::move(frame));
        cv_pop_.notify_one();
        return true;
    }

    // Called by the sender. Blocks until a frame is available; false once closed and empty.
    bool pop(AudioFrame& frame) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_pop_.wait(lock, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return false;
        }
        frame = std::move(queue_.front());
        queue_.pop();
        return true;
    }

    // No more frames will be accepted. Idempotent.
    void close() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        cv_pop_.notify_all();
    }

    // Drops anything still queued and closes; used on the failure path.
    void discard() {
        std::unique_lock<std::mutex> lock(mutex_);
        closed_ = true;
        std::queue<AudioFrame>().swap(queue_);
        cv_pop_.notify_all();
    }

    size_t size() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool closed() const {
        std::unique_lock<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t overruns() const {
        return overruns_.load();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_pop_;
    std::queue<AudioFrame> queue_;
    size_t capacity_;
    bool closed_ = false;
    std::atomic<size_t> overruns_{0};
};

} // namespace funnel::audio
