#include "audio/capture_pipeline.hpp"

#include <algorithm>
#include <chrono>

#include "scribe_log.hpp"

namespace scribe {
namespace audio {

CapturePipeline::CapturePipeline(std::unique_ptr<IAudioSource> source, MicrophoneArbiter& arbiter)
    : source_(std::move(source))
    , arbiter_(arbiter) {
}

CapturePipeline::~CapturePipeline() {
    stop();
}

AudioSourceInfo CapturePipeline::sourceInfo() const {
    return source_ ? source_->info() : AudioSourceInfo{};
}

// =============================================================================
// Lifecycle
// =============================================================================

ErrorInfo CapturePipeline::start(const CaptureConfig& config, FrameSink sink,
        SourceErrorCallback on_error) {
    auto validation = ConfigValidator::validate(config);
    if (!validation.isOk()) {
        return validation;
    }
    if (!source_) {
        return ErrorInfo::error(ErrorCode::NO_INPUT_DEVICE, "No audio source available");
    }
    if (running_.load()) {
        return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Capture already running");
    }

    // 在 lifecycle 锁外获取: 对方的 revoke hook 可能需要这把锁
    MicrophoneArbiter::Lease lease;
    auto result = arbiter_.acquire("capture:" + source_->info().driver,
        [this]() { stop(); }, lease);
    if (!result.isOk()) {
        return result;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    result = source_->open(config);
    if (!result.isOk()) {
        safeWarn("Capture", "Failed to open audio source: ", result.message);
        return result;
    }

    AudioSourceInfo info = source_->info();
    if (info.sample_rate <= 0 || info.channels <= 0) {
        source_->close();
        return ErrorInfo::error(ErrorCode::AUDIO_DEVICE_ERROR, "Audio source reported an invalid format");
    }

    config_ = config;
    sink_ = std::move(sink);
    channels_ = info.channels;
    ring_ = std::make_unique<SpscRingBuffer<float>>(config.ring_capacity_samples * channels_);
    resampler_ = std::make_unique<NearestResampler>(info.sample_rate, config.target_sample_rate);
    gain_.reset();
    if (config.gain_normalization) {
        gain_ = std::make_unique<GainNormalizer>(config.gain_target_peak, config.gain_max);
    }
    next_sequence_ = 0;
    dropped_samples_ = 0;
    frames_produced_ = 0;

    running_ = true;
    result = source_->start(
        [this](const float* interleaved, size_t frames) { onSamples(interleaved, frames); },
        std::move(on_error));
    if (!result.isOk()) {
        running_ = false;
        source_->close();
        return result;
    }

    flush_thread_ = std::thread(&CapturePipeline::flushLoop, this);
    lease_ = std::move(lease);

    safeLog("Capture", "Started: ", info.driver, " ", info.sample_rate, " Hz -> ",
        config.target_sample_rate, " Hz, ", config.frame_interval_ms, " ms frames");
    return ErrorInfo::ok();
}

void CapturePipeline::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);

    bool was_running = false;
    {
        std::lock_guard<std::mutex> wake_lock(wake_mutex_);
        was_running = running_.exchange(false);
    }
    if (!was_running) {
        lease_.release();
        return;
    }

    source_->stop();
    wake_.notify_all();
    if (flush_thread_.joinable()) {
        if (flush_thread_.get_id() == std::this_thread::get_id()) {
            flush_thread_.detach();
        } else {
            flush_thread_.join();
        }
    }
    source_->close();
    lease_.release();

    safeLog("Capture", "Stopped: ", frames_produced_.load(), " frames, ",
        dropped_samples_.load(), " samples dropped");
}

std::optional<AudioFrame> CapturePipeline::drain() {
    auto frame = buildFrame();
    if (frame) {
        ++frames_produced_;
    }
    return frame;
}

// =============================================================================
// Audio thread
// =============================================================================

void CapturePipeline::onSamples(const float* interleaved, size_t frames) {
    // 只写入完整的多声道帧, 满时丢弃新样本
    const size_t total = frames * channels_;
    const size_t free_space = ring_->capacity() - ring_->size();
    const size_t fit = std::min(frames, free_space / channels_) * channels_;
    if (fit > 0) {
        ring_->push(interleaved, fit);
    }
    if (fit < total) {
        dropped_samples_ += total - fit;
    }
}

// =============================================================================
// Flush thread
// =============================================================================

void CapturePipeline::flushLoop() {
    const auto interval = std::chrono::milliseconds(config_.frame_interval_ms);
    while (true) {
        {
            std::unique_lock<std::mutex> lock(wake_mutex_);
            if (wake_.wait_for(lock, interval, [this]() { return !running_.load(); })) {
                break;
            }
        }

        auto frame = buildFrame();
        if (frame) {
            ++frames_produced_;
            sink_(*frame);
        }
    }
}

std::optional<AudioFrame> CapturePipeline::buildFrame() {
    std::lock_guard<std::mutex> lock(build_mutex_);
    if (!ring_) {
        return std::nullopt;
    }

    scratch_.clear();
    ring_->drainInto(scratch_);
    const size_t frames = scratch_.size() / channels_;
    if (frames == 0) {
        return std::nullopt;
    }

    std::vector<float> mono = downmixToMono(scratch_.data(), frames, channels_);
    std::vector<float> resampled;
    resampled.reserve(mono.size() * resampler_->toRate() / resampler_->fromRate() + 1);
    resampler_->process(mono.data(), mono.size(), resampled);
    if (resampled.empty()) {
        return std::nullopt;
    }

    if (gain_) {
        gain_->apply(resampled);
    }

    return AudioFrame(quantize(resampled.data(), resampled.size()),
        config_.target_sample_rate, next_sequence_++);
}

}  // namespace audio
}  // namespace scribe
