#pragma once

#include <atomic>
#include <cstddef>
#include <vector>

namespace funnel::audio {

// Single-producer single-consumer lock-free ring buffer of mono float samples.
// The producer is the PortAudio callback, which must never block or allocate.
class RingBufferF32 {
public:
    explicit RingBufferF32(size_t capacity)
        : buffer_(capacity), capacity_(capacity), head_(0), tail_(0) {}

    size_t capacity() const { return capacity_; }

    // Push every `stride`-th sample of `data` (channel 0 of an interleaved block).
    // Returns samples actually written; the rest are dropped.
    size_t push_strided(const float* data, size_t frames, size_t stride) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t tail = tail_.load(std::memory_order_acquire);
        size_t free_space = capacity_ - (head - tail);
        size_t to_write = frames < free_space ? frames : free_space;
        for (size_t i = 0; i < to_write; ++i) {
            buffer_[(head + i) % capacity_] = data[i * stride];
        }
        head_.store(head + to_write, std::memory_order_release);
        return to_write;
    }

    // Pop up to n samples, returns samples actually read.
    size_t pop(float* out, size_t n) {
        size_t tail = tail_.load(std::memory_order_relaxed);
        size_t head = head_.load(std::memory_order_acquire);
        size_t available = head - tail;
        size_t to_read = n < available ? n : available;
        for (size_t i = 0; i < to_read; ++i) {
            out[i] = buffer_[(tail + i) % capacity_];
        }
        tail_.store(tail + to_read, std::memory_order_release);
        return to_read;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return head - tail;
    }

private:
    std::vector<float> buffer_;
    const size_t capacity_;
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
};

} // namespace funnel::audio
