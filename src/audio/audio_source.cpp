#include "audio/audio_source.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

#include "audio/wav_codec.hpp"
#include "scribe_log.hpp"

#ifdef SCRIBE_HAS_PORTAUDIO
#include "audio/portaudio_source.hpp"
#endif

namespace scribe {
namespace audio {

namespace {
constexpr double kTwoPi = 6.283185307179586;
}

// =============================================================================
// ThreadedAudioSource
// =============================================================================

ThreadedAudioSource::~ThreadedAudioSource() {
    stop();
}

ErrorInfo ThreadedAudioSource::start(SampleCallback on_samples, SourceErrorCallback on_error) {
    if (running_.load()) {
        return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Audio source already started");
    }
    if (!on_samples) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Sample callback is required");
    }
    if (nativeRate() <= 0) {
        return ErrorInfo::error(ErrorCode::NOT_STARTED, "Audio source is not open");
    }

    on_samples_ = std::move(on_samples);
    on_error_ = std::move(on_error);
    running_ = true;
    thread_ = std::thread(&ThreadedAudioSource::run, this);
    return ErrorInfo::ok();
}

void ThreadedAudioSource::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
}

void ThreadedAudioSource::run() {
    const size_t frames = static_cast<size_t>(nativeRate()) * block_ms_ / 1000;
    std::vector<float> block(frames * nativeChannels());
    auto next_tick = std::chrono::steady_clock::now();

    while (running_.load()) {
        if (!produceBlock(block, frames)) {
            break;
        }
        on_samples_(block.data(), frames);

        // 按实时节奏推进
        next_tick += std::chrono::milliseconds(block_ms_);
        std::this_thread::sleep_until(next_tick);
    }
}

// =============================================================================
// SyntheticAudioSource
// =============================================================================

SyntheticAudioSource::SyntheticAudioSource(int sample_rate, int channels,
        float frequency, float amplitude)
    : sample_rate_(sample_rate)
    , channels_(channels)
    , frequency_(frequency)
    , amplitude_(amplitude) {
}

ErrorInfo SyntheticAudioSource::open(const CaptureConfig& config) {
    (void)config;
    if (sample_rate_ <= 0 || channels_ <= 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid synthetic source format");
    }
    open_ = true;
    ++open_count_;
    phase_ = 0.0;
    return ErrorInfo::ok();
}

void SyntheticAudioSource::close() {
    stop();
    open_ = false;
}

AudioSourceInfo SyntheticAudioSource::info() const {
    AudioSourceInfo info;
    info.name = amplitude_.load() > 0.0f ? "synthetic tone" : "silence";
    info.driver = "synthetic";
    info.sample_rate = sample_rate_;
    info.channels = channels_;
    return info;
}

bool SyntheticAudioSource::produceBlock(std::vector<float>& interleaved, size_t frames) {
    const float amplitude = amplitude_.load();
    const double step = kTwoPi * frequency_ / sample_rate_;
    for (size_t i = 0; i < frames; ++i) {
        float value = amplitude * static_cast<float>(std::sin(phase_));
        phase_ += step;
        if (phase_ > kTwoPi) phase_ -= kTwoPi;
        for (int ch = 0; ch < channels_; ++ch) {
            interleaved[i * channels_ + ch] = value;
        }
    }
    return true;
}

// =============================================================================
// WavFileAudioSource
// =============================================================================

WavFileAudioSource::WavFileAudioSource(std::string path, bool loop)
    : path_(std::move(path))
    , loop_(loop) {
}

ErrorInfo WavFileAudioSource::open(const CaptureConfig& config) {
    (void)config;
    WavData data;
    auto result = readWavFile(path_, data);
    if (!result.isOk()) {
        return result;
    }
    if (data.frames == 0) {
        return ErrorInfo::error(ErrorCode::NO_INPUT_DEVICE, "Audio file is empty");
    }

    samples_ = std::move(data.samples);
    sample_rate_ = data.sample_rate;
    channels_ = data.channels;
    cursor_ = 0;
    finished_ = false;

    safeLog("WavFileSource", "Opened file: ", sample_rate_, " Hz, ", channels_,
        " ch, ", data.frames * 1000 / sample_rate_, " ms");
    return ErrorInfo::ok();
}

void WavFileAudioSource::close() {
    stop();
    samples_.clear();
    samples_.shrink_to_fit();
}

AudioSourceInfo WavFileAudioSource::info() const {
    AudioSourceInfo info;
    info.name = path_;
    info.driver = "sndfile";
    info.sample_rate = sample_rate_;
    info.channels = channels_;
    return info;
}

bool WavFileAudioSource::produceBlock(std::vector<float>& interleaved, size_t frames) {
    const size_t total_frames = samples_.size() / channels_;
    if (cursor_ >= total_frames) {
        if (!loop_) {
            finished_ = true;
            return false;
        }
        cursor_ = 0;
    }

    size_t available = std::min(frames, total_frames - cursor_);
    std::copy(samples_.begin() + cursor_ * channels_,
              samples_.begin() + (cursor_ + available) * channels_,
              interleaved.begin());
    // 文件末尾不足一块时补零
    std::fill(interleaved.begin() + available * channels_, interleaved.end(), 0.0f);
    cursor_ += available;
    return true;
}

// =============================================================================
// Factory
// =============================================================================

bool microphoneSupported() {
#ifdef SCRIBE_HAS_PORTAUDIO
    return true;
#else
    return false;
#endif
}

std::unique_ptr<IAudioSource> createAudioSource(const std::string& name, int device_index) {
    if (name == "synthetic") {
        return std::make_unique<SyntheticAudioSource>();
    }
    if (name == "silence") {
        return std::make_unique<SyntheticAudioSource>(48000, 1, 440.0f, 0.0f);
    }
    if (name.rfind("file:", 0) == 0) {
        return std::make_unique<WavFileAudioSource>(name.substr(5));
    }
    if (name.empty() || name == "default" || name == "mic") {
#ifdef SCRIBE_HAS_PORTAUDIO
        return std::make_unique<PortAudioSource>(device_index);
#else
        (void)device_index;
        safeWarn("AudioSource", "Built without PortAudio, microphone capture unavailable");
        return nullptr;
#endif
    }
    safeWarn("AudioSource", "Unknown audio source: ", name);
    return nullptr;
}

}  // namespace audio
}  // namespace scribe
