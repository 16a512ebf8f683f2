#ifndef SCRIBE_AUDIO_RESAMPLER_HPP
#define SCRIBE_AUDIO_RESAMPLER_HPP

#include <cstddef>
#include <cstdint>
#include <vector>

namespace scribe {
namespace audio {

// =============================================================================
// Sample conversion helpers (样本转换)
// =============================================================================

/// @brief 交错多声道 → 单声道 (取平均)
std::vector<float> downmixToMono(const float* interleaved, size_t frames, int channels);

/// @brief float [-1, 1] → int16 (先钳位, 负数乘 32768, 正数乘 32767)
int16_t quantizeSample(float s);
std::vector<int16_t> quantize(const float* samples, size_t count);

/// @brief 峰值幅度
float peakAmplitude(const float* samples, size_t count);
float peakAmplitude(const int16_t* samples, size_t count);

/// @brief 最近邻重采样 (单块, 不保留跨块状态)
std::vector<float> resampleNearest(const float* input, size_t count, int from_rate, int to_rate);

// =============================================================================
// Nearest Resampler (流式最近邻重采样, 保留跨块相位)
// =============================================================================

class NearestResampler {
public:
    NearestResampler(int from_rate, int to_rate);

    /// @brief 处理一块输入, 输出追加到 out
    void process(const float* input, size_t count, std::vector<float>& out);

    void reset() { position_ = 0.0; }

    int fromRate() const { return from_rate_; }
    int toRate() const { return to_rate_; }

private:
    int from_rate_;
    int to_rate_;
    double step_;           // from / to
    double position_ = 0.0; // 下一个输出样本在当前块中的位置
};

// =============================================================================
// Gain Normalizer (增益归一化 - 在 flush 线程执行)
// =============================================================================

class GainNormalizer {
public:
    GainNormalizer(float target_peak, float max_gain)
        : target_peak_(target_peak), max_gain_(max_gain) {}

    /// @brief 原地缩放, 返回使用的增益
    float apply(std::vector<float>& samples);

    float currentGain() const { return gain_; }

private:
    float target_peak_;
    float max_gain_;
    float gain_ = 1.0f;
};

}  // namespace audio
}  // namespace scribe

#endif  // SCRIBE_AUDIO_RESAMPLER_HPP
