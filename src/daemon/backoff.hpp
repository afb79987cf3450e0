#pragma once

#include <chrono>
#include <cstddef>
#include <vector>

// Walks a fixed delay sequence; the last delay repeats once exhausted.
class Backoff {
public:
    explicit Backoff(std::vector<std::chrono::milliseconds> delays)
        : delays_(std::move(delays)) {}

    std::chrono::milliseconds next() {
        if (delays_.empty()) return std::chrono::milliseconds(0);
        size_t i = attempt_ < delays_.size() ? attempt_ : delays_.size() - 1;
        ++attempt_;
        return delays_[i];
    }

    void reset() { attempt_ = 0; }

    // Delays handed out since the last reset.
    size_t attempts() const { return attempt_; }

    const std::vector<std::chrono::milliseconds>& delays() const { return delays_; }

private:
    std::vector<std::chrono::milliseconds> delays_;
    size_t attempt_ = 0;
};
