#ifndef SCRIBE_LIVE_SESSION_HPP
#define SCRIBE_LIVE_SESSION_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "audio/audio_source.hpp"
#include "audio/microphone_arbiter.hpp"
#include "client/relay_transport.hpp"
#include "client/session_client.hpp"
#include "client/transcript_reconciler.hpp"
#include "engine/chunk_upload_engine.hpp"
#include "engine/engine_selector.hpp"
#include "engine/platform_recognizer.hpp"
#include "scribe_callback.hpp"
#include "scribe_config.hpp"
#include "scribe_types.hpp"
#include "summary/summary_service.hpp"
#include "summary/summary_throttler.hpp"

namespace scribe {

// =============================================================================
// Live Session Configuration
// =============================================================================

struct LiveSessionConfig {
    ClientConfig client;
    ChunkConfig chunk;
    SummaryConfig summary;
    EngineSelectorConfig selector;

    /// @brief 音频源 (见 audio::createAudioSource)
    std::string audio_source = "default";
    int device_index = -1;

    bool summary_enabled = true;

    /// @brief relay 是否可用 (地址与 access token 都已配置)
    bool relayConfigured() const {
        return !client.relay_host.empty() && !client.access_token.empty();
    }
};

/// @brief 可替换的外部依赖 (测试中注入假实现)
struct LiveSessionDeps {
    client::RelayTransportFactory transport_factory = client::makeBeastRelayTransport;
    std::shared_ptr<engine::IChunkTranscriber> transcriber;     // 空则按 chunk.endpoint 创建
    std::shared_ptr<summary::ISummaryService> summary_service;  // 空则按 summary.endpoint 创建
    std::shared_ptr<engine::IPlatformRecognizer> recognizer;    // 空表示不支持
    std::function<std::unique_ptr<audio::IAudioSource>()> source_factory;
    audio::MicrophoneArbiter* arbiter = nullptr;
};

// =============================================================================
// Live Session Listener
// =============================================================================
//
// 回调在内部线程中调用。不要在回调中同步调用 stop()/pause()。
//

class ILiveSessionListener {
public:
    virtual ~ILiveSessionListener() = default;

    virtual void onOpen(EngineKind engine) { (void)engine; }
    virtual void onPartial(const std::string& text) { (void)text; }

    /// @param inserted 去重后应插入的文本, 可能为空
    virtual void onFinal(const std::string& text, const std::string& inserted) {
        (void)text;
        (void)inserted;
    }

    virtual void onEngineChanged(const engine::EngineState& state) { (void)state; }
    virtual void onSummary(const std::string& summary) { (void)summary; }
    virtual void onNoTarget() {}
    virtual void onError(const ErrorInfo& error) { (void)error; }
    virtual void onClose(const SessionStats& stats) { (void)stats; }

    /// @brief 宿主当前是否有可输入的焦点
    virtual bool hasFocusedTarget() { return true; }
};

// =============================================================================
// Live Session (引擎选择 + 会话 + 去重 + 摘要)
// =============================================================================
//
// 一个逻辑录音会话可能跨越多个引擎: relay 在 Connecting / Listening 中失败时,
// 失败报告给 EngineSelector, 然后在下一级引擎上继续, 文本保留在同一个
// TranscriptReconciler 中。
//
// start/stop/pause/resume 与引擎降级都在一个控制线程上串行执行。
//

class LiveSession {
public:
    explicit LiveSession(LiveSessionConfig config, LiveSessionDeps deps = LiveSessionDeps());
    ~LiveSession();

    LiveSession(const LiveSession&) = delete;
    LiveSession& operator=(const LiveSession&) = delete;

    void setListener(std::shared_ptr<ILiveSessionListener> listener);

    /// @brief 新的录音: 清空文本与摘要
    ErrorInfo start();

    /// @brief 停止录音并请求最终摘要
    ErrorInfo stop();

    /// @brief 停止但保留文本与摘要
    ErrorInfo pause();

    /// @brief 新会话继续追加到同一份文本
    ErrorInfo resume();

    bool isRecording() const;
    bool isPaused() const;
    std::string transcript() const;
    std::string runningSummary() const;
    engine::EngineState engineState() const;
    SessionStats lastStats() const;

    engine::EngineSelector& selector() { return selector_; }
    client::TranscriptReconciler& reconciler() { return *reconciler_; }

private:
    class RelayListener;
    class ChunkListener;
    class TextTarget;

    // 控制线程
    void post(std::function<void()> task);
    ErrorInfo call(std::function<ErrorInfo()> task);
    void controlLoop();

    ErrorInfo startRecording(bool preserve);
    ErrorInfo stopRecording(bool preserve);
    ErrorInfo startFrom(EngineKind kind);
    ErrorInfo startEngine(EngineKind kind);
    void stopActiveEngine();
    void fallback(uint64_t generation, EngineKind failed, const ErrorInfo& error);

    // 引擎事件 (任意线程)
    void onEngineOpen(EngineKind kind);
    void onEngineFinal(const std::string& text, const std::string& inserted);
    void onPlatformResult(uint64_t generation, const std::string& text, bool is_final);
    void updateSignals(const std::function<void(engine::EngineSignals&)>& mutate);

    std::unique_ptr<audio::IAudioSource> createSource();
    std::shared_ptr<ILiveSessionListener> listener() const;

    LiveSessionConfig config_;
    LiveSessionDeps deps_;

    std::shared_ptr<client::TranscriptReconciler> reconciler_;
    engine::EngineSelector selector_;
    std::unique_ptr<TextTarget> target_;
    std::shared_ptr<RelayListener> relay_listener_;
    std::shared_ptr<ChunkListener> chunk_listener_;
    std::unique_ptr<client::SessionClient> relay_;
    std::unique_ptr<engine::ChunkUploadEngine> chunk_;
    std::unique_ptr<summary::SummaryThrottler> throttler_;

    mutable std::mutex listener_mutex_;
    std::shared_ptr<ILiveSessionListener> listener_;

    std::mutex signals_mutex_;

    mutable std::mutex state_mutex_;
    bool recording_ = false;
    bool paused_ = false;
    EngineKind active_ = EngineKind::CHUNK;
    SessionStats last_stats_;
    std::atomic<uint64_t> generation_{0};
    uint64_t platform_seq_ = 0;

    // 控制线程
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::function<void()>> tasks_;
    bool shutting_down_ = false;
    std::thread control_;
};

}  // namespace scribe

#endif  // SCRIBE_LIVE_SESSION_HPP
