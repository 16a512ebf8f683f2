#include "live_session.hpp"

#include <future>

#include "scribe_log.hpp"

namespace scribe {

namespace {

bool isDeviceError(ErrorCode code) {
    return code == ErrorCode::NO_INPUT_DEVICE || code == ErrorCode::DEVICE_BUSY ||
        code == ErrorCode::AUDIO_DEVICE_ERROR;
}

}  // namespace

// =============================================================================
// 内部适配器
// =============================================================================

class LiveSession::TextTarget : public client::ITextTarget {
public:
    explicit TextTarget(LiveSession* owner) : owner_(owner) {}

    bool hasFocusedTarget() const override {
        auto l = owner_->listener();
        return l ? l->hasFocusedTarget() : true;
    }

    // 插入由宿主在 onFinal 中完成
    bool insertText(const std::string& text) override {
        (void)text;
        return true;
    }

private:
    LiveSession* owner_;
};

class LiveSession::RelayListener : public ISessionCallback {
public:
    explicit RelayListener(LiveSession* owner) : owner_(owner) {}

    void onStateChanged(ClientState from, ClientState to) override {
        (void)from;
        if (to == ClientState::CONNECTING) {
            owner_->updateSignals([](engine::EngineSignals& s) {
                s.relay_connecting = true;
                s.relay_ready = false;
            });
        } else if (to == ClientState::IDLE) {
            owner_->updateSignals([](engine::EngineSignals& s) {
                s.relay_connecting = false;
                s.relay_ready = false;
            });
        }
    }

    void onReady() override {
        owner_->updateSignals([](engine::EngineSignals& s) {
            s.relay_connecting = false;
            s.relay_ready = true;
        });
        owner_->onEngineOpen(EngineKind::RELAY);
    }

    void onPartial(const TranscriptFragment& fragment) override {
        if (auto l = owner_->listener()) l->onPartial(fragment.text());
    }

    void onFinal(const TranscriptFragment& fragment, const std::string& inserted) override {
        owner_->onEngineFinal(fragment.text(), inserted);
    }

    void onNoTarget() override {
        if (auto l = owner_->listener()) l->onNoTarget();
    }

    void onDone(const SessionStats& stats, const ClientMetrics& metrics) override {
        (void)metrics;
        std::lock_guard<std::mutex> lock(owner_->state_mutex_);
        owner_->last_stats_ = stats;
    }

    void onError(const ErrorInfo& error) override {
        const uint64_t generation = owner_->generation_.load();
        LiveSession* owner = owner_;
        owner_->post([owner, generation, error]() {
            owner->fallback(generation, EngineKind::RELAY, error);
        });
    }

    void onWarning(const ErrorInfo& warning) override {
        safeWarn("LiveSession", "Relay warning: ", warning.message);
    }

private:
    LiveSession* owner_;
};

class LiveSession::ChunkListener : public ISessionCallback {
public:
    explicit ChunkListener(LiveSession* owner) : owner_(owner) {}

    void onReady() override {
        owner_->onEngineOpen(EngineKind::CHUNK);
    }

    void onFinal(const TranscriptFragment& fragment, const std::string& inserted) override {
        owner_->onEngineFinal(fragment.text(), inserted);
    }

    void onNoTarget() override {
        if (auto l = owner_->listener()) l->onNoTarget();
    }

    void onDone(const SessionStats& stats, const ClientMetrics& metrics) override {
        (void)metrics;
        std::lock_guard<std::mutex> lock(owner_->state_mutex_);
        owner_->last_stats_ = stats;
    }

    void onError(const ErrorInfo& error) override {
        if (auto l = owner_->listener()) l->onError(error);
    }

    void onWarning(const ErrorInfo& warning) override {
        safeWarn("LiveSession", "Chunk engine warning: ", warning.message);
    }

private:
    LiveSession* owner_;
};

// =============================================================================
// 构造 / 析构
// =============================================================================

LiveSession::LiveSession(LiveSessionConfig config, LiveSessionDeps deps)
    : config_(std::move(config))
    , deps_(std::move(deps))
    , reconciler_(std::make_shared<client::TranscriptReconciler>(config_.client.tail_window))
    , selector_(config_.selector)
    , target_(std::make_unique<TextTarget>(this))
    , relay_listener_(std::make_shared<RelayListener>(this))
    , chunk_listener_(std::make_shared<ChunkListener>(this)) {

    relay_ = std::make_unique<client::SessionClient>(config_.client, deps_.transport_factory);
    relay_->setCallback(relay_listener_);
    relay_->setTextTarget(target_.get());
    relay_->setReconciler(reconciler_);

    if (!deps_.transcriber && !config_.chunk.endpoint.empty()) {
        deps_.transcriber = std::make_shared<engine::CurlChunkTranscriber>(config_.chunk);
    }
    chunk_ = std::make_unique<engine::ChunkUploadEngine>(config_.chunk, deps_.transcriber);
    chunk_->setCallback(chunk_listener_);
    chunk_->setTextTarget(target_.get());
    chunk_->setReconciler(reconciler_);

    if (deps_.arbiter) {
        relay_->setArbiter(deps_.arbiter);
        chunk_->setArbiter(deps_.arbiter);
    }

    if (config_.summary_enabled) {
        auto service = deps_.summary_service;
        if (!service && !config_.summary.endpoint.empty()) {
            service = std::make_shared<summary::CurlSummaryService>(config_.summary);
        }
        if (service) {
            throttler_ = std::make_unique<summary::SummaryThrottler>(config_.summary, service);
            throttler_->setCallback(
                [this](const std::string& summary) {
                    if (auto l = listener()) l->onSummary(summary);
                },
                [](const ErrorInfo& error) {
                    safeWarn("LiveSession", "Summary failed: ", error.message);
                });
        }
    }

    selector_.setListener([this](const engine::EngineState& state) {
        if (auto l = listener()) l->onEngineChanged(state);
    });

    const bool relay_configured = config_.relayConfigured();
    const bool browser_supported = deps_.recognizer && deps_.recognizer->isSupported();
    updateSignals([relay_configured, browser_supported](engine::EngineSignals& s) {
        s.relay_configured = relay_configured;
        s.browser_supported = browser_supported;
    });

    control_ = std::thread(&LiveSession::controlLoop, this);
}

LiveSession::~LiveSession() {
    if (isRecording()) {
        auto result = stop();
        if (!result.isOk()) {
            safeWarn("LiveSession", "Stop during shutdown failed: ", result.message);
        }
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutting_down_ = true;
    }
    queue_cv_.notify_all();
    if (control_.joinable()) {
        control_.join();
    }

    // 引擎回调引用 throttler, 先释放引擎
    relay_.reset();
    chunk_.reset();
    if (throttler_) {
        throttler_->shutdown();
        throttler_.reset();
    }
}

void LiveSession::setListener(std::shared_ptr<ILiveSessionListener> listener) {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listener_ = std::move(listener);
}

std::shared_ptr<ILiveSessionListener> LiveSession::listener() const {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    return listener_;
}

// =============================================================================
// 控制线程
// =============================================================================

void LiveSession::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutting_down_) return;
        tasks_.push_back(std::move(task));
    }
    queue_cv_.notify_one();
}

ErrorInfo LiveSession::call(std::function<ErrorInfo()> task) {
    if (std::this_thread::get_id() == control_.get_id()) {
        return task();
    }

    auto promise = std::make_shared<std::promise<ErrorInfo>>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutting_down_) {
            return ErrorInfo::error(ErrorCode::INVALID_STATE, "Session is shutting down");
        }
        tasks_.push_back([promise, task]() { promise->set_value(task()); });
    }
    queue_cv_.notify_one();
    return future.get();
}

void LiveSession::controlLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait(lock, [this]() { return shutting_down_ || !tasks_.empty(); });
            if (tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }
        task();
    }
}

// =============================================================================
// 公开操作
// =============================================================================

ErrorInfo LiveSession::start() {
    return call([this]() { return startRecording(false); });
}

ErrorInfo LiveSession::stop() {
    return call([this]() { return stopRecording(false); });
}

ErrorInfo LiveSession::pause() {
    return call([this]() { return stopRecording(true); });
}

ErrorInfo LiveSession::resume() {
    return call([this]() {
        if (!isPaused()) {
            return ErrorInfo::error(ErrorCode::INVALID_STATE, "Session is not paused");
        }
        return startRecording(true);
    });
}

// =============================================================================
// 录音生命周期 (仅控制线程)
// =============================================================================

ErrorInfo LiveSession::startRecording(bool preserve) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (recording_) {
            return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Recording already in progress");
        }
        recording_ = true;
        paused_ = false;
        last_stats_ = SessionStats();
    }

    if (!preserve) {
        reconciler_->reset();
        if (throttler_) throttler_->reset();
    }

    selector_.beginSession();
    updateSignals([](engine::EngineSignals& s) {
        s.recording = true;
        s.relay_connecting = false;
        s.relay_ready = false;
        s.browser_listening = false;
    });

    const auto state = selector_.state();
    safeLog("LiveSession", preserve ? "Resuming on " : "Starting on ", engine::engineLabel(state.active));
    return startFrom(state.active);
}

ErrorInfo LiveSession::startFrom(EngineKind kind) {
    while (true) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            active_ = kind;
        }
        ++generation_;

        auto result = startEngine(kind);
        if (result.isOk()) {
            return result;
        }

        safeWarn("LiveSession", engine::engineLabel(kind), " failed to start: ", result.message);
        EngineKind next = kind;
        if (kind != EngineKind::CHUNK && !isDeviceError(result.code)) {
            next = selector_.reportFailure(kind).active;
        }
        if (engine::engineRank(next) <= engine::engineRank(kind)) {
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                recording_ = false;
            }
            updateSignals([](engine::EngineSignals& s) { s.recording = false; });
            return result;
        }
        kind = next;
    }
}

ErrorInfo LiveSession::startEngine(EngineKind kind) {
    switch (kind) {
        case EngineKind::RELAY: {
            auto source = createSource();
            if (!source) {
                return ErrorInfo::error(ErrorCode::NO_INPUT_DEVICE, "No audio input available");
            }
            return relay_->start(std::move(source));
        }

        case EngineKind::CHUNK: {
            auto source = createSource();
            if (!source) {
                return ErrorInfo::error(ErrorCode::NO_INPUT_DEVICE, "No audio input available");
            }
            return chunk_->start(std::move(source));
        }

        case EngineKind::BROWSER: {
            if (!deps_.recognizer) {
                return ErrorInfo::error(ErrorCode::INVALID_STATE, "Platform recognizer is not available");
            }
            const uint64_t generation = generation_.load();
            engine::PlatformRecognizerHandlers handlers;
            handlers.on_result = [this, generation](const std::string& text, bool is_final) {
                onPlatformResult(generation, text, is_final);
            };
            handlers.on_error = [this, generation](const ErrorInfo& error) {
                post([this, generation, error]() {
                    fallback(generation, EngineKind::BROWSER, error);
                });
            };
            handlers.on_end = []() {
                debugLog("LiveSession", "Platform recognizer ended");
            };

            auto result = deps_.recognizer->start(std::move(handlers));
            if (!result.isOk()) {
                return result;
            }
            updateSignals([](engine::EngineSignals& s) { s.browser_listening = true; });
            onEngineOpen(EngineKind::BROWSER);
            return result;
        }
    }
    return ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Unknown engine");
}

void LiveSession::stopActiveEngine() {
    EngineKind active;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        active = active_;
    }

    switch (active) {
        case EngineKind::RELAY: {
            auto result = relay_->stop();
            if (!result.isOk()) {
                safeWarn("LiveSession", "Relay stop failed: ", result.message);
            }
            break;
        }
        case EngineKind::CHUNK: {
            auto result = chunk_->stop();
            if (!result.isOk()) {
                safeWarn("LiveSession", "Chunk engine stop failed: ", result.message);
            }
            break;
        }
        case EngineKind::BROWSER:
            if (deps_.recognizer) {
                deps_.recognizer->stop();
            }
            break;
    }
}

ErrorInfo LiveSession::stopRecording(bool preserve) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!recording_) {
            if (preserve) {
                return ErrorInfo::error(ErrorCode::NOT_STARTED, "Not recording");
            }
            // 暂停后 stop: 结束整个会话
            if (paused_) {
                paused_ = false;
                if (throttler_) throttler_->requestFinal(reconciler_->transcript());
            }
            return ErrorInfo::ok();
        }
    }

    // 之后到达的降级请求一律作废
    ++generation_;
    stopActiveEngine();

    SessionStats stats;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        recording_ = false;
        paused_ = preserve;
        stats = last_stats_;
    }
    updateSignals([](engine::EngineSignals& s) {
        s.recording = false;
        s.relay_connecting = false;
        s.relay_ready = false;
        s.browser_listening = false;
    });

    if (!preserve && throttler_) {
        throttler_->requestFinal(reconciler_->transcript());
    }

    safeLog("LiveSession", preserve ? "Paused" : "Stopped", ", transcript length ",
        reconciler_->transcript().size());
    if (auto l = listener()) l->onClose(stats);
    return ErrorInfo::ok();
}

void LiveSession::fallback(uint64_t generation, EngineKind failed, const ErrorInfo& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (generation != generation_.load() || !recording_ || active_ != failed) {
            debugLog("LiveSession", "Ignoring stale engine failure");
            return;
        }
    }

    safeWarn("LiveSession", engine::engineLabel(failed), " failed: ", error.message);
    if (failed == EngineKind::BROWSER && deps_.recognizer) {
        deps_.recognizer->stop();
    }

    const EngineKind next = selector_.reportFailure(failed).active;
    if (engine::engineRank(next) <= engine::engineRank(failed)) {
        SessionStats stats;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            recording_ = false;
            stats = last_stats_;
        }
        updateSignals([](engine::EngineSignals& s) { s.recording = false; });
        if (auto l = listener()) {
            l->onError(error);
            l->onClose(stats);
        }
        return;
    }

    reconciler_->beginSession();
    auto result = startFrom(next);
    if (!result.isOk()) {
        if (auto l = listener()) {
            l->onError(result);
            l->onClose(lastStats());
        }
    }
}

// =============================================================================
// 引擎事件
// =============================================================================

void LiveSession::onEngineOpen(EngineKind kind) {
    safeLog("LiveSession", engine::engineLabel(kind), " ready");
    if (auto l = listener()) l->onOpen(kind);
}

void LiveSession::onEngineFinal(const std::string& text, const std::string& inserted) {
    if (auto l = listener()) l->onFinal(text, inserted);
    if (throttler_ && !inserted.empty()) {
        throttler_->onTranscriptDelta(reconciler_->transcript());
    }
}

void LiveSession::onPlatformResult(uint64_t generation, const std::string& text, bool is_final) {
    if (generation != generation_.load()) {
        return;
    }
    if (!is_final) {
        if (!text.empty()) {
            if (auto l = listener()) l->onPartial(text);
        }
        return;
    }

    std::string result_id;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        result_id = "browser-" + std::to_string(++platform_seq_);
    }

    std::string inserted;
    if (auto prepared = reconciler_->prepare(result_id, text)) {
        if (!target_->hasFocusedTarget()) {
            if (auto l = listener()) l->onNoTarget();
        } else {
            reconciler_->accept(*prepared);
            inserted = *prepared;
        }
    }
    onEngineFinal(text, inserted);
}

void LiveSession::updateSignals(const std::function<void(engine::EngineSignals&)>& mutate) {
    std::lock_guard<std::mutex> lock(signals_mutex_);
    auto signals = selector_.signals();
    mutate(signals);
    selector_.update(signals);
}

std::unique_ptr<audio::IAudioSource> LiveSession::createSource() {
    if (deps_.source_factory) {
        return deps_.source_factory();
    }
    return audio::createAudioSource(config_.audio_source, config_.device_index);
}

// =============================================================================
// 查询
// =============================================================================

bool LiveSession::isRecording() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return recording_;
}

bool LiveSession::isPaused() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return paused_;
}

std::string LiveSession::transcript() const {
    return reconciler_->transcript();
}

std::string LiveSession::runningSummary() const {
    return throttler_ ? throttler_->runningSummary() : std::string();
}

engine::EngineState LiveSession::engineState() const {
    return selector_.state();
}

SessionStats LiveSession::lastStats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_stats_;
}

}  // namespace scribe
