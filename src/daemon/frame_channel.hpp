#pragma once

#include "audio_frame.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <optional>
#include <semaphore>
#include <vector>

// Lock-free single-producer single-consumer queue of audio frames.
// Producer (PipeWire real-time thread) calls try_push(), which never blocks.
// Consumer (pipeline pump thread) calls pop_for().
class FrameChannel {
public:
    explicit FrameChannel(size_t capacity)
        : slots_(capacity), capacity_(capacity) {}

    FrameChannel(const FrameChannel&) = delete;
    FrameChannel& operator=(const FrameChannel&) = delete;

    // Producer: hands the frame over. Returns false (frame dropped) when full.
    bool try_push(AudioFrame&& frame) {
        size_t w = write_pos_.load(std::memory_order_relaxed);
        size_t r = read_pos_.load(std::memory_order_acquire);
        if (w - r >= capacity_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return false;
        }

        slots_[w % capacity_] = std::move(frame);
        write_pos_.store(w + 1, std::memory_order_release);
        ready_.release();
        return true;
    }

    // Consumer: non-blocking pop.
    std::optional<AudioFrame> try_pop() {
        size_t r = read_pos_.load(std::memory_order_relaxed);
        size_t w = write_pos_.load(std::memory_order_acquire);
        if (r == w) return std::nullopt;

        AudioFrame f = std::move(slots_[r % capacity_]);
        read_pos_.store(r + 1, std::memory_order_release);
        return f;
    }

    // Consumer: waits up to timeout for a frame.
    std::optional<AudioFrame> pop_for(std::chrono::milliseconds timeout) {
        if (auto f = try_pop()) return f;
        if (!ready_.try_acquire_for(timeout)) return std::nullopt;
        return try_pop();
    }

    // Wakes a consumer blocked in pop_for() without a frame.
    void wake() { ready_.release(); }

    size_t size() const {
        return write_pos_.load(std::memory_order_acquire) - read_pos_.load(std::memory_order_acquire);
    }
    size_t capacity() const { return capacity_; }
    uint64_t dropped() const { return dropped_.load(std::memory_order_relaxed); }

private:
    std::vector<AudioFrame> slots_;
    size_t capacity_;
    std::counting_semaphore<> ready_{0};
    std::atomic<uint64_t> dropped_{0};
    alignas(64) std::atomic<size_t> write_pos_{0};
    alignas(64) std::atomic<size_t> read_pos_{0};
};
