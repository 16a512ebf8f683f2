#include "audio/resampler.hpp"

#include <algorithm>
#include <cmath>

namespace scribe {
namespace audio {

std::vector<float> downmixToMono(const float* interleaved, size_t frames, int channels) {
    std::vector<float> mono(frames);
    if (channels <= 1) {
        std::copy(interleaved, interleaved + frames, mono.begin());
        return mono;
    }
    for (size_t i = 0; i < frames; ++i) {
        float sum = 0.0f;
        for (int ch = 0; ch < channels; ++ch) {
            sum += interleaved[i * channels + ch];
        }
        mono[i] = sum / channels;
    }
    return mono;
}

int16_t quantizeSample(float s) {
    if (std::isnan(s)) return 0;
    s = std::max(-1.0f, std::min(1.0f, s));
    float scaled = s < 0.0f ? s * 32768.0f : s * 32767.0f;
    return static_cast<int16_t>(scaled);
}

std::vector<int16_t> quantize(const float* samples, size_t count) {
    std::vector<int16_t> out(count);
    for (size_t i = 0; i < count; ++i) {
        out[i] = quantizeSample(samples[i]);
    }
    return out;
}

float peakAmplitude(const float* samples, size_t count) {
    float peak = 0.0f;
    for (size_t i = 0; i < count; ++i) {
        peak = std::max(peak, std::fabs(samples[i]));
    }
    return peak;
}

float peakAmplitude(const int16_t* samples, size_t count) {
    int peak = 0;
    for (size_t i = 0; i < count; ++i) {
        peak = std::max(peak, std::abs(static_cast<int>(samples[i])));
    }
    return static_cast<float>(peak) / 32768.0f;
}

std::vector<float> resampleNearest(const float* input, size_t count, int from_rate, int to_rate) {
    std::vector<float> out;
    NearestResampler resampler(from_rate, to_rate);
    resampler.process(input, count, out);
    return out;
}

// =============================================================================
// NearestResampler
// =============================================================================

NearestResampler::NearestResampler(int from_rate, int to_rate)
    : from_rate_(from_rate)
    , to_rate_(to_rate)
    , step_(to_rate > 0 ? static_cast<double>(from_rate) / to_rate : 1.0) {
}

void NearestResampler::process(const float* input, size_t count, std::vector<float>& out) {
    if (count == 0) return;

    if (from_rate_ == to_rate_) {
        out.insert(out.end(), input, input + count);
        return;
    }

    // 输出样本 i 取输入 floor(position) 处的样本
    while (position_ < static_cast<double>(count)) {
        size_t index = static_cast<size_t>(position_);
        out.push_back(input[std::min(index, count - 1)]);
        position_ += step_;
    }
    position_ -= static_cast<double>(count);
}

// =============================================================================
// GainNormalizer
// =============================================================================

float GainNormalizer::apply(std::vector<float>& samples) {
    float peak = peakAmplitude(samples.data(), samples.size());
    if (peak > 1e-4f) {
        float desired = std::min(max_gain_, target_peak_ / peak);
        // 平滑: 降增益立即生效, 升增益逐步
        gain_ = desired < gain_ ? desired : gain_ + (desired - gain_) * 0.25f;
    }
    if (gain_ != 1.0f) {
        for (auto& s : samples) {
            s = std::max(-1.0f, std::min(1.0f, s * gain_));
        }
    }
    return gain_;
}

}  // namespace audio
}  // namespace scribe
