#include "format_converter.hpp"

#include <algorithm>
#include <cmath>
#include <format>

namespace pcm {

namespace {

inline float to_float(float s) { return s; }
inline float to_float(int16_t s) { return static_cast<float>(s) / 32768.0f; }

template <typename Sample>
float downmix(const Sample* frame, uint32_t channels) {
    float sum = 0.0f;
    for (uint32_t c = 0; c < channels; ++c) {
        sum += to_float(frame[c]);
    }
    return sum / static_cast<float>(channels);
}

// Emits every output sample whose period lies inside mono, starting at
// position phase / dst_rate. Returns the position of the next sample not
// emitted, in the same units.
//
// With hold_last, a sample that falls between the final input frame and the
// end of input repeats that frame. Otherwise it is left for a later call,
// once the frame it interpolates towards has arrived.
uint64_t resample(std::span<const float> mono, uint64_t phase, uint32_t src_rate,
                  uint32_t dst_rate, bool hold_last, std::vector<int16_t>& out) {
    const uint64_t limit = static_cast<uint64_t>(mono.size()) * dst_rate;
    uint64_t pos = phase;

    while (pos + src_rate <= limit) {
        uint64_t idx = pos / dst_rate;
        uint64_t rem = pos % dst_rate;
        bool has_next = idx + 1 < mono.size();
        if (rem != 0 && !has_next && !hold_last) break;

        float s = mono[idx];
        if (rem != 0 && has_next) {
            float t = static_cast<float>(rem) / static_cast<float>(dst_rate);
            s += t * (mono[idx + 1] - s);
        }
        out.push_back(quantize(s));
        pos += src_rate;
    }
    return pos;
}

template <typename Sample>
std::vector<int16_t> convert_impl(std::span<const Sample> interleaved, uint32_t channels,
                                  uint32_t src_rate, uint32_t dst_rate) {
    if (channels == 0 || src_rate == 0 || dst_rate == 0) return {};

    size_t frames = interleaved.size() / channels;
    std::vector<float> mono(frames);
    for (size_t f = 0; f < frames; ++f) {
        mono[f] = downmix(interleaved.data() + f * channels, channels);
    }

    std::vector<int16_t> out;
    out.reserve(output_samples(frames, src_rate, dst_rate));
    resample(mono, 0, src_rate, dst_rate, true, out);
    return out;
}

} // namespace

std::expected<void, Error> validate(const NativeFormat& fmt) {
    if (fmt.sample_format != SampleFormat::F32 && fmt.sample_format != SampleFormat::S16) {
        return std::unexpected(Error{ErrorCode::FormatNegotiationError,
                                     "unsupported native sample format"});
    }
    if (fmt.channels == 0) {
        return std::unexpected(Error{ErrorCode::FormatNegotiationError,
                                     "native format has no channels"});
    }
    if (fmt.sample_rate < min_sample_rate || fmt.sample_rate > max_sample_rate) {
        return std::unexpected(Error{ErrorCode::FormatNegotiationError,
                                     std::format("native rate {} Hz out of range", fmt.sample_rate)});
    }
    return {};
}

size_t output_samples(size_t input_frames, uint32_t src_rate, uint32_t dst_rate) {
    if (src_rate == 0) return 0;
    return static_cast<size_t>(static_cast<uint64_t>(input_frames) * dst_rate / src_rate);
}

int16_t quantize(float sample) {
    float s = std::clamp(sample, -1.0f, 1.0f);
    return static_cast<int16_t>(std::lrintf(s * 32767.0f));
}

std::vector<int16_t> convert(std::span<const float> interleaved, uint32_t channels,
                             uint32_t src_rate, uint32_t dst_rate) {
    return convert_impl(interleaved, channels, src_rate, dst_rate);
}

std::vector<int16_t> convert(std::span<const int16_t> interleaved, uint32_t channels,
                             uint32_t src_rate, uint32_t dst_rate) {
    return convert_impl(interleaved, channels, src_rate, dst_rate);
}

StreamConverter::StreamConverter(NativeFormat native, uint32_t target_rate)
    : native_(native), target_rate_(target_rate) {
    // Enough for a large PipeWire quantum plus carry, so the audio thread
    // does not reallocate in steady state.
    mono_.reserve(8192);
}

std::vector<int16_t> StreamConverter::push(std::span<const float> interleaved) {
    return push_impl(interleaved);
}

std::vector<int16_t> StreamConverter::push(std::span<const int16_t> interleaved) {
    return push_impl(interleaved);
}

void StreamConverter::reset() {
    phase_ = 0;
    mono_.clear();
}

std::vector<int16_t> StreamConverter::flush() {
    std::vector<int16_t> out;
    if (native_.sample_rate != 0 && target_rate_ != 0) {
        resample(mono_, phase_, native_.sample_rate, target_rate_, true, out);
    }
    reset();
    return out;
}

template <typename Sample>
std::vector<int16_t> StreamConverter::push_impl(std::span<const Sample> interleaved) {
    const uint32_t channels = native_.channels;
    const uint32_t src_rate = native_.sample_rate;
    if (channels == 0 || src_rate == 0 || target_rate_ == 0) return {};

    size_t frames = interleaved.size() / channels;
    for (size_t f = 0; f < frames; ++f) {
        mono_.push_back(downmix(interleaved.data() + f * channels, channels));
    }

    std::vector<int16_t> out;
    out.reserve(output_samples(mono_.size(), src_rate, target_rate_) + 1);
    uint64_t end = resample(mono_, phase_, src_rate, target_rate_, false, out);

    // Keep the frames the next output still interpolates from.
    size_t keep_from = std::min(static_cast<size_t>(end / target_rate_), mono_.size());
    mono_.erase(mono_.begin(), mono_.begin() + static_cast<std::ptrdiff_t>(keep_from));
    phase_ = end - static_cast<uint64_t>(keep_from) * target_rate_;
    return out;
}

} // namespace pcm
