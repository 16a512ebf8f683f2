#ifndef SCRIBE_AUDIO_PORTAUDIO_SOURCE_HPP
#define SCRIBE_AUDIO_PORTAUDIO_SOURCE_HPP

#include <atomic>

#include "audio_source.hpp"

namespace scribe {
namespace audio {

// =============================================================================
// PortAudio Microphone Source (麦克风输入, 回调模式)
// =============================================================================
//
// 仅在 SCRIBE_HAS_PORTAUDIO 构建时可用。音频回调直接转发给 SampleCallback,
// 不做任何分配或加锁。
//

class PortAudioSource : public IAudioSource {
public:
    /// @param device_index -1 表示默认输入设备
    explicit PortAudioSource(int device_index = -1);
    ~PortAudioSource() override;

    ErrorInfo open(const CaptureConfig& config) override;
    ErrorInfo start(SampleCallback on_samples, SourceErrorCallback on_error) override;
    void stop() override;
    void close() override;
    bool isCapturing() const override { return capturing_.load(); }
    AudioSourceInfo info() const override { return info_; }

    /// @brief 由 PortAudio 回调线程调用
    void deliver(const float* interleaved, size_t frames);

private:
    int device_index_;
    void* stream_ = nullptr;        // PaStream*
    bool initialized_ = false;
    std::atomic<bool> capturing_{false};
    AudioSourceInfo info_;
    SampleCallback on_samples_;
    SourceErrorCallback on_error_;
};

}  // namespace audio
}  // namespace scribe

#endif  // SCRIBE_AUDIO_PORTAUDIO_SOURCE_HPP
