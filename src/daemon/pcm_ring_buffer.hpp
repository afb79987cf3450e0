#pragma once

#include "audio_frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>

// Bounded time window of canonical PCM frames with drop-oldest eviction.
// Owned by one transport I/O thread; not synchronized.
class PcmRingBuffer {
public:
    PcmRingBuffer(std::chrono::milliseconds window, uint32_t sample_rate, uint16_t channels = 1)
        : window_(window),
          capacity_bytes_(static_cast<size_t>(window.count()) * sample_rate * channels *
                          sizeof(int16_t) / 1000) {}

    // Appends a frame, evicting the oldest audio until the window fits.
    // A single frame longer than the whole window keeps only its newest part.
    void push(AudioFrame frame) {
        if (capacity_bytes_ == 0) {
            evicted_bytes_ += frame.byte_size();
            return;
        }

        if (frame.byte_size() > capacity_bytes_) {
            size_t keep = capacity_bytes_ / sizeof(int16_t);
            size_t drop = frame.pcm.size() - keep;
            evicted_bytes_ += drop * sizeof(int16_t);
            frame.pcm.erase(frame.pcm.begin(), frame.pcm.begin() + static_cast<std::ptrdiff_t>(drop));
            if (frame.sample_rate > 0) {
                frame.captured_at += std::chrono::microseconds(
                    static_cast<int64_t>(drop) * 1'000'000 / frame.sample_rate);
            }
        }

        while (!frames_.empty() && bytes_ + frame.byte_size() > capacity_bytes_) {
            bytes_ -= frames_.front().byte_size();
            evicted_bytes_ += frames_.front().byte_size();
            ++evicted_frames_;
            frames_.pop_front();
        }

        bytes_ += frame.byte_size();
        frames_.push_back(std::move(frame));

        if (bytes_ > capacity_bytes_) {
            ++overruns_;
        }
    }

    // Puts back a frame taken by pop() so it is the oldest again. Dropped and
    // counted if the window has since filled.
    void restore(AudioFrame frame) {
        if (bytes_ + frame.byte_size() > capacity_bytes_) {
            evicted_bytes_ += frame.byte_size();
            ++evicted_frames_;
            return;
        }
        bytes_ += frame.byte_size();
        frames_.push_front(std::move(frame));
    }

    // Removes and returns the oldest frame.
    std::optional<AudioFrame> pop() {
        if (frames_.empty()) return std::nullopt;
        AudioFrame f = std::move(frames_.front());
        frames_.pop_front();
        bytes_ -= f.byte_size();
        return f;
    }

    void clear() {
        frames_.clear();
        bytes_ = 0;
    }

    bool empty() const { return frames_.empty(); }
    size_t frame_count() const { return frames_.size(); }
    size_t bytes() const { return bytes_; }
    size_t capacity_bytes() const { return capacity_bytes_; }
    std::chrono::milliseconds window() const { return window_; }

    uint64_t evicted_bytes() const { return evicted_bytes_; }
    uint64_t evicted_frames() const { return evicted_frames_; }
    // Times the window was exceeded despite eviction. Stays zero.
    uint64_t overruns() const { return overruns_; }

private:
    std::chrono::milliseconds window_;
    size_t capacity_bytes_;
    std::deque<AudioFrame> frames_;
    size_t bytes_ = 0;
    uint64_t evicted_bytes_ = 0;
    uint64_t evicted_frames_ = 0;
    uint64_t overruns_ = 0;
};
