#pragma once

#include "audio_frame.hpp"
#include "errors.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <vector>

// Conversion from a device's native layout to canonical mono int16 PCM.
//
// N interleaved input frames at rate R always yield floor(N * target / R)
// output samples. Channels are averaged into mono, the result is clamped to
// [-1, 1] and quantized. Resampling is linear interpolation; an output sample
// is only emitted once the input covers its whole period, so no partial
// trailing sample ever appears.
namespace pcm {

inline constexpr uint32_t min_sample_rate = 8000;
inline constexpr uint32_t max_sample_rate = 192000;

// Rejects formats the converter cannot consume.
std::expected<void, Error> validate(const NativeFormat& fmt);

size_t output_samples(size_t input_frames, uint32_t src_rate, uint32_t dst_rate);

int16_t quantize(float sample);

std::vector<int16_t> convert(std::span<const float> interleaved, uint32_t channels,
                             uint32_t src_rate, uint32_t dst_rate);
std::vector<int16_t> convert(std::span<const int16_t> interleaved, uint32_t channels,
                             uint32_t src_rate, uint32_t dst_rate);

// Stateful wrapper for a continuous stream cut into callback-sized chunks.
// Carries the resampling phase and the few input frames the next output
// sample still needs. Output over any chunking is the one-shot conversion of
// the whole stream, sample for sample. When upsampling, samples that
// interpolate towards a frame not yet pushed wait for it; flush() emits them
// as a one-shot conversion would at the end of input.
class StreamConverter {
public:
    StreamConverter(NativeFormat native, uint32_t target_rate);

    std::vector<int16_t> push(std::span<const float> interleaved);
    std::vector<int16_t> push(std::span<const int16_t> interleaved);

    // Emits the samples still waiting on input, then resets.
    std::vector<int16_t> flush();
    void reset();

    const NativeFormat& native_format() const { return native_; }
    uint32_t target_rate() const { return target_rate_; }

private:
    template <typename Sample>
    std::vector<int16_t> push_impl(std::span<const Sample> interleaved);

    NativeFormat native_;
    uint32_t target_rate_;

    // Position of the next output sample relative to mono_[0], in units of
    // 1/target_rate input frames.
    uint64_t phase_ = 0;
    std::vector<float> mono_;
};

} // namespace pcm
