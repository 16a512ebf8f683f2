// Tests for sample conversion, ring buffer, capture pipeline and microphone arbiter

#include <atomic>
#include <cassert>
#include <chrono>
#include <cmath>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "audio/audio_source.hpp"
#include "audio/capture_pipeline.hpp"
#include "audio/microphone_arbiter.hpp"
#include "audio/resampler.hpp"
#include "audio/ring_buffer.hpp"
#include "audio/wav_codec.hpp"
#include "scribe_config.hpp"

using namespace scribe;
using namespace scribe::audio;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

bool approx_equal(float a, float b, float tol = 1e-5f) {
    return std::fabs(a - b) < tol;
}

}  // namespace

// ============================================================================
// Sample conversion
// ============================================================================

void test_downmix() {
    std::vector<float> stereo = {0.2f, 0.4f, -1.0f, 1.0f, 0.5f, 0.5f};
    auto mono = downmixToMono(stereo.data(), 3, 2);
    assert(mono.size() == 3);
    assert(approx_equal(mono[0], 0.3f));
    assert(approx_equal(mono[1], 0.0f));
    assert(approx_equal(mono[2], 0.5f));

    auto same = downmixToMono(stereo.data(), stereo.size(), 1);
    assert(same == stereo);
    test_passed("downmix to mono");
}

void test_quantize() {
    assert(quantizeSample(1.0f) == 32767);
    assert(quantizeSample(-1.0f) == -32768);
    assert(quantizeSample(2.5f) == 32767);
    assert(quantizeSample(-3.0f) == -32768);
    assert(quantizeSample(0.0f) == 0);
    assert(quantizeSample(0.5f) == 16383);
    assert(quantizeSample(std::numeric_limits<float>::quiet_NaN()) == 0);
    test_passed("quantize");
}

void test_peak_amplitude() {
    std::vector<float> f = {0.1f, -0.7f, 0.3f};
    assert(approx_equal(peakAmplitude(f.data(), f.size()), 0.7f));
    std::vector<int16_t> s = {100, -32768, 5};
    assert(approx_equal(peakAmplitude(s.data(), s.size()), 1.0f));
    assert(peakAmplitude(s.data(), 0) == 0.0f);
    test_passed("peak amplitude");
}

void test_resample_nearest() {
    std::vector<float> input(480);
    for (size_t i = 0; i < input.size(); ++i) input[i] = static_cast<float>(i);

    auto out = resampleNearest(input.data(), input.size(), 48000, 16000);
    assert(out.size() == 160);
    for (size_t i = 0; i < out.size(); ++i) {
        assert(out[i] == static_cast<float>(i * 3));
    }

    auto same = resampleNearest(input.data(), input.size(), 16000, 16000);
    assert(same == input);
    test_passed("resample nearest");
}

void test_resampler_keeps_phase_across_blocks() {
    std::vector<float> input(480);
    for (size_t i = 0; i < input.size(); ++i) input[i] = static_cast<float>(i);

    NearestResampler resampler(48000, 16000);
    std::vector<float> out;
    resampler.process(input.data(), 100, out);
    resampler.process(input.data() + 100, 380, out);

    auto whole = resampleNearest(input.data(), input.size(), 48000, 16000);
    assert(out == whole);
    test_passed("resampler keeps phase across blocks");
}

void test_gain_normalizer() {
    GainNormalizer gain(0.9f, 4.0f);
    std::vector<float> quiet = {0.1f, -0.1f};
    float g = gain.apply(quiet);
    // 升增益逐步
    assert(approx_equal(g, 1.75f));
    assert(approx_equal(quiet[0], 0.175f));

    std::vector<float> loud = {0.9f, -0.9f};
    g = gain.apply(loud);
    // 降增益立即生效
    assert(approx_equal(g, 1.0f));
    assert(approx_equal(loud[0], 0.9f));
    test_passed("gain normalizer");
}

void test_ring_buffer() {
    SpscRingBuffer<int16_t> ring(4);
    std::vector<int16_t> in = {1, 2, 3, 4, 5, 6};
    assert(ring.push(in.data(), in.size()) == 4);
    assert(ring.size() == 4);

    int16_t out[2];
    assert(ring.pop(out, 2) == 2);
    assert(out[0] == 1 && out[1] == 2);

    assert(ring.push(in.data() + 4, 2) == 2);
    std::vector<int16_t> drained;
    assert(ring.drainInto(drained) == 4);
    assert((drained == std::vector<int16_t>{3, 4, 5, 6}));
    assert(ring.empty());
    test_passed("ring buffer");
}

void test_wav_encode() {
    std::vector<int16_t> pcm(1600);
    for (size_t i = 0; i < pcm.size(); ++i) pcm[i] = static_cast<int16_t>((i % 200) * 100);

    std::vector<uint8_t> wav;
    auto result = encodeWav(pcm.data(), pcm.size(), 16000, wav);
    assert(result.isOk());
    assert(wav.size() >= 44 + pcm.size() * 2);
    assert(wav[0] == 'R' && wav[1] == 'I' && wav[2] == 'F' && wav[3] == 'F');

    WavData decoded;
    assert(decodeWav(wav, decoded).isOk());
    assert(decoded.sample_rate == 16000);
    assert(decoded.channels == 1);
    assert(decoded.frames == static_cast<int64_t>(pcm.size()));
    test_passed("wav encode");
}

// ============================================================================
// Capture pipeline
// ============================================================================

void test_capture_pipeline_frames() {
    MicrophoneArbiter arbiter;
    auto source = std::make_unique<SyntheticAudioSource>(48000, 2, 440.0f, 0.5f);
    CapturePipeline pipeline(std::move(source), arbiter);

    std::mutex mutex;
    std::vector<AudioFrame> frames;

    CaptureConfig config = CaptureConfig::streaming();
    config.frame_interval_ms = 50;
    auto result = pipeline.start(config, [&](const AudioFrame& frame) {
        std::lock_guard<std::mutex> lock(mutex);
        frames.push_back(frame);
    });
    assert(result.isOk());
    assert(pipeline.isRunning());
    assert(arbiter.isHeld());

    std::this_thread::sleep_for(std::chrono::milliseconds(400));
    pipeline.stop();
    assert(!pipeline.isRunning());
    assert(!arbiter.isHeld());

    std::lock_guard<std::mutex> lock(mutex);
    assert(frames.size() >= 3);
    uint64_t total_samples = 0;
    for (size_t i = 0; i < frames.size(); ++i) {
        assert(frames[i].sampleRate() == 16000);
        assert(frames[i].sequence() == static_cast<int64_t>(i));
        assert(!frames[i].empty());
        total_samples += frames[i].sampleCount();
    }
    // 400 ms @ 16 kHz, 允许调度误差
    assert(total_samples > 16000 * 200 / 1000);
    assert(total_samples < 16000 * 600 / 1000);
    assert(peakAmplitude(frames[0].samples().data(), frames[0].sampleCount()) > 0.3f);

    // 停止后不再产生帧
    size_t count = frames.size();
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    assert(frames.size() == count);
    test_passed("capture pipeline frames");
}

void test_capture_rejects_bad_config() {
    MicrophoneArbiter arbiter;
    CapturePipeline pipeline(std::make_unique<SyntheticAudioSource>(), arbiter);
    CaptureConfig config;
    config.target_sample_rate = 44100;
    auto result = pipeline.start(config, [](const AudioFrame&) {});
    assert(result.code == ErrorCode::UNSUPPORTED_SAMPLE_RATE);
    assert(!arbiter.isHeld());

    CapturePipeline empty(nullptr, arbiter);
    assert(empty.start(CaptureConfig(), [](const AudioFrame&) {}).code == ErrorCode::NO_INPUT_DEVICE);
    test_passed("capture rejects bad config");
}

void test_capture_silence_source() {
    MicrophoneArbiter arbiter;
    CapturePipeline pipeline(createAudioSource("silence"), arbiter);
    std::atomic<int> frames{0};
    std::atomic<bool> all_silent{true};

    CaptureConfig config;
    config.frame_interval_ms = 50;
    auto result = pipeline.start(config, [&](const AudioFrame& frame) {
        ++frames;
        if (peakAmplitude(frame.samples().data(), frame.sampleCount()) > 0.0f) {
            all_silent = false;
        }
    });
    assert(result.isOk());
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    pipeline.stop();

    assert(frames.load() > 0);
    assert(all_silent.load());
    assert(createAudioSource("bogus") == nullptr);
    test_passed("capture silence source");
}

// ============================================================================
// Microphone arbiter
// ============================================================================

void test_arbiter_revokes_previous_recorder() {
    MicrophoneArbiter arbiter;
    CapturePipeline first(std::make_unique<SyntheticAudioSource>(), arbiter);
    CapturePipeline second(std::make_unique<SyntheticAudioSource>(), arbiter);

    CaptureConfig config;
    config.frame_interval_ms = 50;
    assert(first.start(config, [](const AudioFrame&) {}).isOk());
    assert(first.isRunning());

    assert(second.start(config, [](const AudioFrame&) {}).isOk());
    assert(!first.isRunning());
    assert(second.isRunning());
    assert(arbiter.isHeld());

    second.stop();
    assert(!arbiter.isHeld());
    test_passed("arbiter revokes previous recorder");
}

void test_arbiter_device_busy() {
    MicrophoneArbiter arbiter;
    MicrophoneArbiter::Lease holder;
    assert(arbiter.acquire("stuck", []() {}, holder).isOk());
    assert(holder.valid());
    assert(arbiter.holder() == "stuck");

    MicrophoneArbiter::Lease other;
    auto result = arbiter.acquire("next", nullptr, other, 50);
    assert(result.code == ErrorCode::DEVICE_BUSY);
    assert(!other.valid());

    holder.release();
    assert(!arbiter.isHeld());
    assert(arbiter.acquire("next", nullptr, other, 50).isOk());
    test_passed("arbiter device busy");
}

void test_arbiter_lease_move() {
    MicrophoneArbiter arbiter;
    MicrophoneArbiter::Lease outer;
    {
        MicrophoneArbiter::Lease inner;
        assert(arbiter.acquire("inner", nullptr, inner).isOk());
        outer = std::move(inner);
        assert(!inner.valid());
    }
    // 移动后 inner 析构不释放
    assert(arbiter.isHeld());
    outer.release();
    outer.release();
    assert(!arbiter.isHeld());
    test_passed("arbiter lease move");
}

int main() {
    std::cout << "=== Audio Pipeline Tests ===" << std::endl;

    test_downmix();
    test_quantize();
    test_peak_amplitude();
    test_resample_nearest();
    test_resampler_keeps_phase_across_blocks();
    test_gain_normalizer();
    test_ring_buffer();
    test_wav_encode();
    test_capture_pipeline_frames();
    test_capture_rejects_bad_config();
    test_capture_silence_source();
    test_arbiter_revokes_previous_recorder();
    test_arbiter_device_busy();
    test_arbiter_lease_move();

    std::cout << "All audio pipeline tests passed" << std::endl;
    return 0;
}
