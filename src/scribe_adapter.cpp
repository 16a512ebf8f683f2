/**
 * Scribe LiveScribe Adapter Implementation
 *
 * 适配层实现, 将 scribe::LiveSession 封装为 Scribe::LiveScribe 接口。
 */

#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include "scribe_api.hpp"
#include "live_session.hpp"
#include "scribe_config.hpp"
#include "scribe_log.hpp"
#include "scribe_types.hpp"

namespace Scribe {

namespace {

Engine toPublic(scribe::EngineKind kind) {
    switch (kind) {
        case scribe::EngineKind::RELAY:   return Engine::Relay;
        case scribe::EngineKind::BROWSER: return Engine::Browser;
        case scribe::EngineKind::CHUNK:
        default:                          return Engine::Chunk;
    }
}

EngineInfo toPublic(const scribe::engine::EngineState& state) {
    EngineInfo info;
    info.preferred = toPublic(state.preferred);
    info.active = toPublic(state.active);
    info.status = scribe::engineStatusToString(state.status);
    info.label = state.label;
    info.did_fallback = state.did_fallback;
    info.fallback_warning = state.fallback_warning;
    return info;
}

SessionStats toPublic(const scribe::SessionStats& stats) {
    SessionStats out;
    out.duration_ms = stats.duration_ms;
    out.audio_bytes_sent = stats.audio_bytes_sent;
    out.partial_count = stats.partial_count;
    out.final_count = stats.final_count;
    out.final_transcript_length = stats.final_transcript_length;
    return out;
}

// 公开配置转内部配置
scribe::LiveSessionConfig toInternal(const LiveScribeConfig& config) {
    scribe::LiveSessionConfig out;

    out.client.relay_host = config.relay_host;
    out.client.relay_port = config.relay_port;
    out.client.relay_path = config.relay_path;
    out.client.use_tls = config.relay_tls;
    out.client.access_token = config.access_token;
    out.client.origin = config.origin;
    out.client.wire_mode = config.event_stream ? scribe::WireMode::EVENT_STREAM : scribe::WireMode::RELAY;

    out.chunk.endpoint = config.transcribe_endpoint;
    out.chunk.api_key = config.api_key;
    out.chunk.access_token = config.access_token;
    out.chunk.chunk_ms = config.chunk_ms;

    out.summary.endpoint = config.summary_endpoint;
    out.summary.api_key = config.api_key;
    out.summary.access_token = config.access_token;
    out.summary.preferences_json = config.preferences_json;
    out.summary.debounce_ms = config.summary_debounce_ms;
    out.summary_enabled = !config.summary_endpoint.empty();

    out.selector.forced = scribe::parseForcedEngine(config.force_engine);
    out.audio_source = config.audio_source;
    out.device_index = config.device_index;
    return out;
}

// 宿主的 PlatformRecognizer 转内部接口
class PlatformRecognizerAdapter : public scribe::engine::IPlatformRecognizer {
public:
    explicit PlatformRecognizerAdapter(std::shared_ptr<PlatformRecognizer> recognizer)
        : recognizer_(std::move(recognizer)) {
    }

    bool isSupported() const override {
        return recognizer_->IsSupported();
    }

    scribe::ErrorInfo start(scribe::engine::PlatformRecognizerHandlers handlers) override {
        auto on_result = handlers.on_result;
        auto on_error = handlers.on_error;
        const bool started = recognizer_->Start(
            [on_result](const std::string& text, bool is_final) {
                if (on_result) on_result(text, is_final);
            },
            [on_error](const std::string& message) {
                if (on_error) {
                    on_error(scribe::ErrorInfo::error(scribe::ErrorCode::UPSTREAM_FATAL,
                        "Platform recognizer failed", message));
                }
            });
        if (!started) {
            return scribe::ErrorInfo::error(scribe::ErrorCode::INVALID_STATE,
                "Platform recognizer failed to start");
        }
        return scribe::ErrorInfo::ok();
    }

    void stop() override {
        recognizer_->Stop();
    }

private:
    std::shared_ptr<PlatformRecognizer> recognizer_;
};

}  // namespace

LiveScribeConfig LiveScribeConfig::FromEnvironment() {
    LiveScribeConfig config;
    auto selector = scribe::EngineSelectorConfig::fromEnvironment();
    config.force_engine = scribe::forcedEngineToString(selector.forced);
    return config;
}

// =============================================================================
// CallbackAdapter - 回调适配器
// =============================================================================

class CallbackAdapter : public scribe::ILiveSessionListener {
public:
    explicit CallbackAdapter(std::shared_ptr<LiveScribeCallback> callback)
        : callback_(std::move(callback)) {
    }

    void onOpen(scribe::EngineKind engine) override {
        if (callback_) callback_->OnOpen(toPublic(engine));
    }

    void onPartial(const std::string& text) override {
        if (callback_) callback_->OnPartial(text);
    }

    void onFinal(const std::string& text, const std::string& inserted) override {
        if (callback_) callback_->OnFinal(text, inserted);
    }

    void onEngineChanged(const scribe::engine::EngineState& state) override {
        if (callback_) callback_->OnEngineChanged(toPublic(state));
    }

    void onSummary(const std::string& summary) override {
        if (callback_) callback_->OnSummary(summary);
    }

    void onNoTarget() override {
        if (callback_) callback_->OnNoFieldFocused();
    }

    void onError(const scribe::ErrorInfo& error) override {
        if (callback_) {
            callback_->OnError(static_cast<int>(error.code), scribe::toUserMessage(error));
        }
    }

    void onClose(const scribe::SessionStats& stats) override {
        if (callback_) callback_->OnClose(toPublic(stats));
    }

    bool hasFocusedTarget() override {
        return callback_ ? callback_->HasFocusedField() : true;
    }

private:
    std::shared_ptr<LiveScribeCallback> callback_;
};

// =============================================================================
// LiveScribe::Impl
// =============================================================================

struct LiveScribe::Impl {
    std::unique_ptr<scribe::LiveSession> session;

    mutable std::mutex error_mutex;
    std::string last_error;

    bool record(const scribe::ErrorInfo& result) {
        std::lock_guard<std::mutex> lock(error_mutex);
        if (result.isOk()) {
            last_error.clear();
            return true;
        }
        last_error = scribe::toUserMessage(result);
        return false;
    }
};

// =============================================================================
// LiveScribe Implementation
// =============================================================================

LiveScribe::LiveScribe()
    : LiveScribe(LiveScribeConfig::Default()) {
}

LiveScribe::LiveScribe(const LiveScribeConfig& config, std::shared_ptr<PlatformRecognizer> recognizer)
    : impl_(std::make_unique<Impl>()) {

    scribe::LiveSessionDeps deps;
    if (recognizer) {
        deps.recognizer = std::make_shared<PlatformRecognizerAdapter>(std::move(recognizer));
    }
    impl_->session = std::make_unique<scribe::LiveSession>(toInternal(config), std::move(deps));
}

LiveScribe::~LiveScribe() = default;

void LiveScribe::SetCallback(std::shared_ptr<LiveScribeCallback> callback) {
    impl_->session->setListener(std::make_shared<CallbackAdapter>(std::move(callback)));
}

bool LiveScribe::Start() {
    return impl_->record(impl_->session->start());
}

void LiveScribe::Stop() {
    impl_->record(impl_->session->stop());
}

bool LiveScribe::Pause() {
    return impl_->record(impl_->session->pause());
}

bool LiveScribe::Resume() {
    return impl_->record(impl_->session->resume());
}

std::string LiveScribe::GetTranscript() const {
    return impl_->session->transcript();
}

std::string LiveScribe::GetRunningSummary() const {
    return impl_->session->runningSummary();
}

std::string LiveScribe::GetEngineLabel() const {
    return impl_->session->engineState().label;
}

EngineInfo LiveScribe::GetEngineInfo() const {
    return toPublic(impl_->session->engineState());
}

SessionStats LiveScribe::GetLastStats() const {
    return toPublic(impl_->session->lastStats());
}

std::string LiveScribe::GetLastError() const {
    std::lock_guard<std::mutex> lock(impl_->error_mutex);
    return impl_->last_error;
}

bool LiveScribe::IsRecording() const {
    return impl_->session->isRecording();
}

}  // namespace Scribe
