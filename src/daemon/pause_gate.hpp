#pragma once

#include "audio_frame.hpp"

#include <atomic>
#include <cstdint>
#include <functional>

// Shared gate CaptureSources consult before delivering a frame.
//
// While paused, frames are dropped. Sources that are being restarted are
// "awaited": the first frame from an awaited source clears it, and once no
// source is awaited any more the gate reopens and that frame passes.
// admit() runs on real-time threads and only touches atomics.
class PauseGate {
public:
    using FirstFrameCallback = std::function<void(SourceId)>;

    bool paused() const { return paused_.load(std::memory_order_acquire); }

    void pause() {
        awaiting_.store(0, std::memory_order_release);
        paused_.store(true, std::memory_order_release);
    }

    void resume() {
        awaiting_.store(0, std::memory_order_release);
        paused_.store(false, std::memory_order_release);
    }

    void await(SourceId id) {
        awaiting_.fetch_or(bit(id), std::memory_order_acq_rel);
    }

    // Stops waiting on a source; reopens the gate if it was the last one.
    // Returns true if this call reopened the gate.
    bool abandon(SourceId id) {
        uint32_t prev = awaiting_.fetch_and(~bit(id), std::memory_order_acq_rel);
        if ((prev & bit(id)) && (prev & ~bit(id)) == 0) {
            paused_.store(false, std::memory_order_release);
            return true;
        }
        return false;
    }

    bool awaiting(SourceId id) const {
        return (awaiting_.load(std::memory_order_acquire) & bit(id)) != 0;
    }

    // Must be set before any source can call admit().
    void set_first_frame_callback(FirstFrameCallback cb) { on_first_frame_ = std::move(cb); }

    // Returns true if a frame from this source may be delivered.
    bool admit(SourceId id) {
        if (!paused_.load(std::memory_order_acquire)) return true;

        uint32_t prev = awaiting_.load(std::memory_order_acquire);
        while (prev & bit(id)) {
            if (awaiting_.compare_exchange_weak(prev, prev & ~bit(id), std::memory_order_acq_rel)) {
                bool last = (prev & ~bit(id)) == 0;
                if (last) paused_.store(false, std::memory_order_release);
                if (on_first_frame_) on_first_frame_(id);
                return last;
            }
        }
        return false;
    }

private:
    static constexpr uint32_t bit(SourceId id) { return 1u << static_cast<uint32_t>(id); }

    std::atomic<bool> paused_{false};
    std::atomic<uint32_t> awaiting_{0};
    FirstFrameCallback on_first_frame_;
};
