#ifndef SCRIBE_AUDIO_AUDIO_SOURCE_HPP
#define SCRIBE_AUDIO_AUDIO_SOURCE_HPP

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../scribe_types.hpp"
#include "../scribe_config.hpp"

namespace scribe {
namespace audio {

// =============================================================================
// Audio Source Interface (音频输入源抽象接口)
// =============================================================================
//
// 实现:
// - PortAudioSource      麦克风 (可选构建)
// - WavFileAudioSource   实时回放 WAV 文件
// - SyntheticAudioSource 正弦波 / 静音 (测试与 demo)
//

struct AudioSourceInfo {
    std::string name;
    std::string driver;
    int sample_rate = 48000;    // 原生采样率
    int channels = 1;
};

/// @brief 音频回调 (在音频线程中调用, 不得阻塞)
/// @param interleaved 交错 float 样本
/// @param frames 帧数 (每帧 channels 个样本)
using SampleCallback = std::function<void(const float* interleaved, size_t frames)>;

using SourceErrorCallback = std::function<void(const ErrorInfo& error)>;

class IAudioSource {
public:
    virtual ~IAudioSource() = default;

    /// @brief 打开设备 (获取硬件资源)
    virtual ErrorInfo open(const CaptureConfig& config) = 0;

    /// @brief 开始采集
    virtual ErrorInfo start(SampleCallback on_samples, SourceErrorCallback on_error) = 0;

    /// @brief 停止采集, 返回后不再有回调
    virtual void stop() = 0;

    /// @brief 释放设备
    virtual void close() = 0;

    virtual bool isCapturing() const = 0;

    virtual AudioSourceInfo info() const = 0;
};

// =============================================================================
// Threaded Source (由内部线程按实时节奏产生样本的源)
// =============================================================================

class ThreadedAudioSource : public IAudioSource {
public:
    /// 派生类析构时须先调用 stop(), 线程会回调 produceBlock()
    ~ThreadedAudioSource() override;

    ErrorInfo start(SampleCallback on_samples, SourceErrorCallback on_error) override;
    void stop() override;
    bool isCapturing() const override { return running_.load(); }

protected:
    /// @param block_ms 每次回调的时长
    explicit ThreadedAudioSource(int block_ms = 10) : block_ms_(block_ms) {}

    /// @brief 生成一块样本, 返回 false 表示已结束
    virtual bool produceBlock(std::vector<float>& interleaved, size_t frames) = 0;

    virtual int nativeRate() const = 0;
    virtual int nativeChannels() const = 0;

private:
    void run();

    int block_ms_;
    std::atomic<bool> running_{false};
    std::thread thread_;
    SampleCallback on_samples_;
    SourceErrorCallback on_error_;
};

// =============================================================================
// Synthetic Source (合成源)
// =============================================================================

class SyntheticAudioSource : public ThreadedAudioSource {
public:
    /// @param amplitude 0 表示静音
    SyntheticAudioSource(int sample_rate = 48000, int channels = 1,
            float frequency = 440.0f, float amplitude = 0.3f);
    ~SyntheticAudioSource() override { stop(); }

    ErrorInfo open(const CaptureConfig& config) override;
    void close() override;
    AudioSourceInfo info() const override;

    void setAmplitude(float amplitude) { amplitude_.store(amplitude); }
    bool isOpen() const { return open_.load(); }
    int openCount() const { return open_count_.load(); }

protected:
    bool produceBlock(std::vector<float>& interleaved, size_t frames) override;
    int nativeRate() const override { return sample_rate_; }
    int nativeChannels() const override { return channels_; }

private:
    int sample_rate_;
    int channels_;
    float frequency_;
    std::atomic<float> amplitude_;
    double phase_ = 0.0;
    std::atomic<bool> open_{false};
    std::atomic<int> open_count_{0};
};

// =============================================================================
// WAV File Source (libsndfile 读取, 按实时节奏回放)
// =============================================================================

class WavFileAudioSource : public ThreadedAudioSource {
public:
    explicit WavFileAudioSource(std::string path, bool loop = false);
    ~WavFileAudioSource() override { stop(); }

    ErrorInfo open(const CaptureConfig& config) override;
    void close() override;
    AudioSourceInfo info() const override;

    /// @brief 文件已播放完毕
    bool finished() const { return finished_.load(); }

protected:
    bool produceBlock(std::vector<float>& interleaved, size_t frames) override;
    int nativeRate() const override { return sample_rate_; }
    int nativeChannels() const override { return channels_; }

private:
    std::string path_;
    bool loop_;
    std::vector<float> samples_;    // 交错
    int sample_rate_ = 0;
    int channels_ = 1;
    size_t cursor_ = 0;             // 帧位置
    std::atomic<bool> finished_{false};
};

/// @brief 按名称创建音频源: "synthetic", "silence", "file:<path>", "" / "default" (麦克风)
std::unique_ptr<IAudioSource> createAudioSource(const std::string& name, int device_index = -1);

/// @brief 是否编译了麦克风支持
bool microphoneSupported();

}  // namespace audio
}  // namespace scribe

#endif  // SCRIBE_AUDIO_AUDIO_SOURCE_HPP
