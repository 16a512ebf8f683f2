#include "audio/portaudio_source.hpp"

#include <portaudio.h>

#include <string>

#include "scribe_log.hpp"

namespace scribe {
namespace audio {

namespace {

ErrorInfo paCheck(PaError e, const char* what) {
    if (e == paNoError) {
        return ErrorInfo::ok();
    }
    return ErrorInfo::error(ErrorCode::AUDIO_DEVICE_ERROR,
        std::string(what) + " failed",
        std::to_string(static_cast<int>(e)) + ": " + Pa_GetErrorText(e));
}

int inputCallback(const void* input, void* output, unsigned long frames,
        const PaStreamCallbackTimeInfo* time_info, PaStreamCallbackFlags status_flags,
        void* user_data) {
    (void)output;
    (void)time_info;
    (void)status_flags;
    auto* self = static_cast<PortAudioSource*>(user_data);
    if (input) {
        self->deliver(static_cast<const float*>(input), frames);
    }
    return paContinue;
}

}  // namespace

PortAudioSource::PortAudioSource(int device_index)
    : device_index_(device_index) {
    info_.driver = "portaudio";
}

PortAudioSource::~PortAudioSource() {
    close();
}

ErrorInfo PortAudioSource::open(const CaptureConfig& config) {
    if (stream_) {
        return ErrorInfo::ok();
    }

    auto result = paCheck(Pa_Initialize(), "Pa_Initialize");
    if (!result.isOk()) return result;
    initialized_ = true;

    PaStreamParameters in_params{};
    in_params.device = device_index_ >= 0 ? device_index_ : Pa_GetDefaultInputDevice();
    if (in_params.device == paNoDevice || in_params.device >= Pa_GetDeviceCount()) {
        close();
        return ErrorInfo::error(ErrorCode::NO_INPUT_DEVICE, "No input device available");
    }

    const PaDeviceInfo* device = Pa_GetDeviceInfo(in_params.device);
    if (!device || device->maxInputChannels < 1) {
        close();
        return ErrorInfo::error(ErrorCode::NO_INPUT_DEVICE, "Selected device has no input channels");
    }

    // 单声道采集, 在设备原生采样率下运行, 由管线重采样
    in_params.channelCount = 1;
    in_params.sampleFormat = paFloat32;
    in_params.suggestedLatency = device->defaultLowInputLatency;
    in_params.hostApiSpecificStreamInfo = nullptr;

    info_.name = device->name ? device->name : "(unknown)";
    info_.sample_rate = static_cast<int>(device->defaultSampleRate);
    info_.channels = 1;

    // PortAudio 没有跨平台的回声消除/降噪开关, 只记录请求
    if (config.echo_cancellation || config.noise_suppression) {
        debugLog("PortAudio", "Echo cancellation / noise suppression not available on this backend");
    }

    PaStream* stream = nullptr;
    PaError err = Pa_OpenStream(&stream, &in_params, nullptr,
            device->defaultSampleRate, paFramesPerBufferUnspecified,
            paNoFlag, &inputCallback, this);
    if (err != paNoError) {
        result = paCheck(err, "Pa_OpenStream");
        if (err == paDeviceUnavailable) {
            result.code = ErrorCode::DEVICE_BUSY;
        }
        close();
        return result;
    }
    stream_ = stream;

    safeLog("PortAudio", "Input device: ", info_.name, " @ ", info_.sample_rate, " Hz");
    return ErrorInfo::ok();
}

ErrorInfo PortAudioSource::start(SampleCallback on_samples, SourceErrorCallback on_error) {
    if (!stream_) {
        return ErrorInfo::error(ErrorCode::NOT_STARTED, "Audio device is not open");
    }
    if (capturing_.load()) {
        return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Audio device already capturing");
    }
    on_samples_ = std::move(on_samples);
    on_error_ = std::move(on_error);

    auto result = paCheck(Pa_StartStream(static_cast<PaStream*>(stream_)), "Pa_StartStream");
    if (!result.isOk()) {
        return result;
    }
    capturing_ = true;
    return ErrorInfo::ok();
}

void PortAudioSource::deliver(const float* interleaved, size_t frames) {
    if (capturing_.load() && on_samples_) {
        on_samples_(interleaved, frames);
    }
}

void PortAudioSource::stop() {
    if (!stream_ || !capturing_.exchange(false)) {
        return;
    }
    // Pa_StopStream 等待回调结束后返回
    auto result = paCheck(Pa_StopStream(static_cast<PaStream*>(stream_)), "Pa_StopStream");
    if (!result.isOk()) {
        safeWarn("PortAudio", result.message, " (", result.detail, ")");
        if (on_error_) on_error_(result);
    }
}

void PortAudioSource::close() {
    stop();
    if (stream_) {
        auto result = paCheck(Pa_CloseStream(static_cast<PaStream*>(stream_)), "Pa_CloseStream");
        if (!result.isOk()) {
            safeWarn("PortAudio", result.message, " (", result.detail, ")");
        }
        stream_ = nullptr;
    }
    if (initialized_) {
        Pa_Terminate();
        initialized_ = false;
    }
}

}  // namespace audio
}  // namespace scribe
