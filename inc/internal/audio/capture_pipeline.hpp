#ifndef SCRIBE_AUDIO_CAPTURE_PIPELINE_HPP
#define SCRIBE_AUDIO_CAPTURE_PIPELINE_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include "../scribe_types.hpp"
#include "../scribe_config.hpp"
#include "audio_source.hpp"
#include "microphone_arbiter.hpp"
#include "resampler.hpp"
#include "ring_buffer.hpp"

namespace scribe {
namespace audio {

// =============================================================================
// Capture Pipeline (采集 → 重采样 → 量化 → 定时成帧)
// =============================================================================
//
// 线程模型:
// - 音频线程: IAudioSource 回调, 只写入 SPSC 环形缓冲
// - flush 线程: 每 frame_interval_ms 取出全部样本, 下混、重采样、
//   (可选) 增益归一化、量化为 PCM16, 生成 AudioFrame 交给 sink
//
// 没有样本时 flush 不产生帧。
//

using FrameSink = std::function<void(const AudioFrame& frame)>;

class CapturePipeline {
public:
    explicit CapturePipeline(std::unique_ptr<IAudioSource> source,
            MicrophoneArbiter& arbiter = MicrophoneArbiter::instance());
    ~CapturePipeline();

    CapturePipeline(const CapturePipeline&) = delete;
    CapturePipeline& operator=(const CapturePipeline&) = delete;

    /// @brief 获取麦克风并开始采集
    /// @param sink 在 flush 线程中调用
    /// @param on_error 设备错误 (可选)
    ErrorInfo start(const CaptureConfig& config, FrameSink sink,
            SourceErrorCallback on_error = nullptr);

    /// @brief 同步停止: 返回后设备已释放, 不再调用 sink。
    /// 未 flush 的样本保留, 可由 drain() 取出。
    void stop();

    /// @brief 取出剩余样本组成的最后一帧
    std::optional<AudioFrame> drain();

    bool isRunning() const { return running_.load(); }

    uint64_t droppedSamples() const { return dropped_samples_.load(); }
    uint64_t framesProduced() const { return frames_produced_.load(); }
    AudioSourceInfo sourceInfo() const;

private:
    void onSamples(const float* interleaved, size_t frames);
    void flushLoop();
    std::optional<AudioFrame> buildFrame();

    std::unique_ptr<IAudioSource> source_;
    MicrophoneArbiter& arbiter_;
    MicrophoneArbiter::Lease lease_;

    CaptureConfig config_;
    FrameSink sink_;
    int channels_ = 1;

    std::unique_ptr<SpscRingBuffer<float>> ring_;
    std::unique_ptr<NearestResampler> resampler_;
    std::unique_ptr<GainNormalizer> gain_;
    std::vector<float> scratch_;
    std::mutex build_mutex_;        // flush 线程与 drain() 互斥

    std::mutex lifecycle_mutex_;
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread flush_thread_;
    std::atomic<bool> running_{false};

    std::atomic<uint64_t> dropped_samples_{0};
    std::atomic<uint64_t> frames_produced_{0};
    int64_t next_sequence_ = 0;
};

}  // namespace audio
}  // namespace scribe

#endif  // SCRIBE_AUDIO_CAPTURE_PIPELINE_HPP
