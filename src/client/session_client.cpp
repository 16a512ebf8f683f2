#include "client/session_client.hpp"

#include <algorithm>

#include "protocol/control_messages.hpp"
#include "scribe_log.hpp"

namespace scribe {
namespace client {

namespace {

constexpr auto kErrorCloseGrace = std::chrono::milliseconds(1000);
constexpr auto kStopWaitMargin = std::chrono::milliseconds(2000);

bool isValidClientTransition(ClientState from, ClientState to) {
    switch (from) {
        case ClientState::IDLE:
            return to == ClientState::CONNECTING;
        case ClientState::CONNECTING:
            return to == ClientState::LISTENING || to == ClientState::STOPPING ||
                to == ClientState::ERROR || to == ClientState::IDLE;
        case ClientState::LISTENING:
            return to == ClientState::STOPPING || to == ClientState::ERROR;
        case ClientState::STOPPING:
            return to == ClientState::IDLE;
        case ClientState::ERROR:
            return to == ClientState::IDLE;
        default:
            return false;
    }
}

template <typename TimePoint>
int64_t elapsedMs(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

std::string trimmed(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    const auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

}  // namespace

// =============================================================================
// Construction
// =============================================================================

SessionClient::SessionClient(ClientConfig config, RelayTransportFactory transport_factory)
    : config_(std::move(config))
    , transport_factory_(std::move(transport_factory))
    , reconciler_(std::make_shared<TranscriptReconciler>(config_.tail_window)) {
    worker_ = std::thread([this]() { workerLoop(); });
}

SessionClient::~SessionClient() {
    stop();
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        shutting_down_ = true;
    }
    queue_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
    if (transport_) {
        transport_->abort();
        transport_.reset();
    }
    stopCapture();
}

void SessionClient::setCallback(std::shared_ptr<ISessionCallback> callback) {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    callback_ = std::move(callback);
}

void SessionClient::setTextTarget(ITextTarget* target) {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    target_ = target;
}

void SessionClient::setReconciler(std::shared_ptr<TranscriptReconciler> reconciler) {
    if (!reconciler) return;
    std::lock_guard<std::mutex> lock(setup_mutex_);
    reconciler_ = std::move(reconciler);
}

void SessionClient::setArbiter(audio::MicrophoneArbiter* arbiter) {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    arbiter_ = arbiter;
}

std::shared_ptr<ISessionCallback> SessionClient::callback() const {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    return callback_;
}

// =============================================================================
// Public control
// =============================================================================

ErrorInfo SessionClient::start(std::unique_ptr<audio::IAudioSource> source) {
    auto validation = ConfigValidator::validate(config_);
    if (!validation.isOk()) {
        return validation;
    }

    // IDLE -> CONNECTING 在同一把锁内完成, 并发 start 只有一个能通过
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != ClientState::IDLE ||
                !isValidClientTransition(state_, ClientState::CONNECTING)) {
            return ErrorInfo::error(ErrorCode::INVALID_STATE, "Session already active");
        }
        metrics_ = ClientMetrics();
        last_stats_ = SessionStats();
        last_error_ = ErrorInfo::ok();
        finals_.clear();
        generation = ++generation_;
        state_ = ClientState::CONNECTING;
    }
    state_cv_.notify_all();
    debugLog("SessionClient", clientStateToString(ClientState::IDLE), " -> ",
        clientStateToString(ClientState::CONNECTING));
    if (auto cb = callback()) {
        cb->onStateChanged(ClientState::IDLE, ClientState::CONNECTING);
    }

    audio::MicrophoneArbiter* arbiter = nullptr;
    {
        std::lock_guard<std::mutex> lock(setup_mutex_);
        reconciler_->beginSession();
        arbiter = arbiter_;
    }

    if (source) {
        auto pipeline = std::make_unique<audio::CapturePipeline>(std::move(source),
            arbiter ? *arbiter : audio::MicrophoneArbiter::instance());
        auto result = pipeline->start(config_.capture,
            [this, generation](const AudioFrame& frame) {
                Event event{EventType::FRAME};
                event.generation = generation;
                event.frame = frame;
                post(std::move(event));
            },
            [this](const ErrorInfo& error) {
                if (auto cb = callback()) cb->onWarning(error);
            });
        if (!result.isOk()) {
            safeWarn("SessionClient", "Capture failed to start: ", result.message);
            ++generation_;
            transition(ClientState::IDLE);
            return result;
        }
        std::lock_guard<std::mutex> lock(capture_mutex_);
        capture_ = std::move(pipeline);
    }

    Event event{EventType::CONNECT};
    event.generation = generation;
    post(std::move(event));
    return ErrorInfo::ok();
}

ErrorInfo SessionClient::sendFrame(const AudioFrame& frame) {
    const ClientState current = state();
    if (current != ClientState::CONNECTING && current != ClientState::LISTENING) {
        return ErrorInfo::error(ErrorCode::INVALID_STATE, "Session is not active");
    }
    Event event{EventType::FRAME};
    event.generation = generation_.load();
    event.frame = frame;
    post(std::move(event));
    return ErrorInfo::ok();
}

ErrorInfo SessionClient::stop() {
    if (state() == ClientState::IDLE) {
        return ErrorInfo::ok();
    }
    const uint64_t generation = generation_.load();

    // 同步释放麦克风, 未 flush 的样本作为最后一帧发送
    std::optional<AudioFrame> last;
    {
        std::lock_guard<std::mutex> lock(capture_mutex_);
        if (capture_) {
            capture_->stop();
            last = capture_->drain();
        }
    }
    if (last && !last->empty()) {
        Event frame_event{EventType::FRAME};
        frame_event.generation = generation;
        frame_event.frame = *last;
        post(std::move(frame_event));
    }

    Event event{EventType::STOP};
    event.generation = generation;
    post(std::move(event));

    // 回调内调用: 不能等待自己
    if (std::this_thread::get_id() == worker_.get_id()) {
        return ErrorInfo::ok();
    }

    std::unique_lock<std::mutex> lock(state_mutex_);
    const auto bound = std::chrono::milliseconds(config_.stop_ack_timeout_ms) + kStopWaitMargin;
    if (!state_cv_.wait_for(lock, bound, [this]() { return state_ == ClientState::IDLE; })) {
        return ErrorInfo::error(ErrorCode::TIMEOUT, "Session did not stop in time");
    }
    return ErrorInfo::ok();
}

ErrorInfo SessionClient::pause() {
    safeWarn("SessionClient", "Pause is not supported on the streaming path");
    return ErrorInfo::error(ErrorCode::INVALID_STATE,
        "Pause is not supported while streaming, stop and start a new session instead");
}

// =============================================================================
// Queries
// =============================================================================

ClientState SessionClient::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

bool SessionClient::isActive() const {
    return state() != ClientState::IDLE;
}

ClientMetrics SessionClient::metrics() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return metrics_;
}

SessionStats SessionClient::lastStats() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_stats_;
}

ErrorInfo SessionClient::lastError() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return last_error_;
}

std::string SessionClient::finalTranscript() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    std::string joined;
    for (const auto& text : finals_) {
        if (!joined.empty()) joined += ' ';
        joined += text;
    }
    return joined;
}

// =============================================================================
// Event loop
// =============================================================================

void SessionClient::post(Event event) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (shutting_down_) return;
        queue_.push_back(std::move(event));
    }
    queue_cv_.notify_one();
}

std::optional<SessionClient::Clock::time_point> SessionClient::nextDeadline() const {
    std::optional<Clock::time_point> next;
    for (const auto& deadline : {connect_deadline_, stop_deadline_, error_close_deadline_}) {
        if (deadline && (!next || *deadline < *next)) {
            next = deadline;
        }
    }
    return next;
}

void SessionClient::workerLoop() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    while (true) {
        if (queue_.empty()) {
            if (shutting_down_) break;
            auto deadline = nextDeadline();
            if (deadline) {
                queue_cv_.wait_until(lock, *deadline);
            } else {
                queue_cv_.wait(lock);
            }
        }

        if (!queue_.empty()) {
            Event event = std::move(queue_.front());
            queue_.pop_front();
            lock.unlock();
            handleEvent(event);
            lock.lock();
        }

        lock.unlock();
        checkDeadlines();
        lock.lock();
    }
}

void SessionClient::handleEvent(Event& event) {
    if (event.generation != generation_.load()) {
        // 旧会话的迟到事件
        return;
    }

    switch (event.type) {
        case EventType::CONNECT:         onConnect(); break;
        case EventType::OPEN:            onOpen(); break;
        case EventType::TEXT:            onText(event.text); break;
        case EventType::BINARY:          onBinary(event.data); break;
        case EventType::CLOSE:           onClose(event.code, event.text); break;
        case EventType::TRANSPORT_ERROR: onTransportError(event.text); break;
        case EventType::FRAME:           onFrame(event.frame); break;
        case EventType::STOP:            onStop(); break;
    }
}

void SessionClient::checkDeadlines() {
    const auto now = Clock::now();
    const ClientState current = state();

    if (connect_deadline_ && now >= *connect_deadline_) {
        connect_deadline_.reset();
        if (current == ClientState::CONNECTING) {
            safeWarn("SessionClient", "Connect timed out after ", config_.connect_timeout_ms, "ms");
            fail(ErrorInfo::error(ErrorCode::CONNECT_TIMEOUT,
                "Could not connect to transcription service (timeout)"));
            return;
        }
    }

    if (stop_deadline_ && now >= *stop_deadline_) {
        stop_deadline_.reset();
        if (current == ClientState::STOPPING) {
            safeWarn("SessionClient", "No stop acknowledgment after ",
                config_.stop_ack_timeout_ms, "ms, cleaning up");
            SessionStats stats;
            finish(stats, false);
            return;
        }
    }

    if (error_close_deadline_ && now >= *error_close_deadline_) {
        error_close_deadline_.reset();
        if (current == ClientState::CONNECTING || current == ClientState::LISTENING) {
            fail(ErrorInfo::error(ErrorCode::UPSTREAM_FATAL, "Transcription service error", relay_error_));
        }
    }
}

// =============================================================================
// State machine
// =============================================================================

bool SessionClient::transition(ClientState to) {
    ClientState from;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        from = state_;
        if (!isValidClientTransition(from, to)) {
            debugLog("SessionClient", "Ignoring transition ", clientStateToString(from),
                " -> ", clientStateToString(to));
            return false;
        }
        state_ = to;
    }
    state_cv_.notify_all();
    debugLog("SessionClient", clientStateToString(from), " -> ", clientStateToString(to));
    if (auto cb = callback()) {
        cb->onStateChanged(from, to);
    }
    return true;
}

void SessionClient::onConnect() {
    if (state() != ClientState::CONNECTING) return;

    reader_.reset();
    pending_.clear();
    backlog_.clear();
    send_failure_warned_ = false;
    relay_error_.clear();
    relay_final_seq_ = 0;
    stop_deadline_.reset();
    error_close_deadline_.reset();
    last_no_target_signal_.reset();
    started_at_ = Clock::now();
    connect_deadline_ = started_at_ + std::chrono::milliseconds(config_.connect_timeout_ms);

    transport_ = transport_factory_ ? transport_factory_(config_) : nullptr;
    if (!transport_) {
        fail(ErrorInfo::error(ErrorCode::CONNECTION_FAILED, "No transport available"));
        return;
    }

    const uint64_t generation = generation_.load();
    TransportHandlers handlers;
    handlers.on_open = [this, generation]() {
        Event event{EventType::OPEN};
        event.generation = generation;
        post(std::move(event));
    };
    handlers.on_text = [this, generation](const std::string& text) {
        Event event{EventType::TEXT};
        event.generation = generation;
        event.text = text;
        post(std::move(event));
    };
    handlers.on_binary = [this, generation](std::vector<uint8_t> data) {
        Event event{EventType::BINARY};
        event.generation = generation;
        event.data = std::move(data);
        post(std::move(event));
    };
    handlers.on_close = [this, generation](int code, const std::string& reason) {
        Event event{EventType::CLOSE};
        event.generation = generation;
        event.code = code;
        event.text = reason;
        post(std::move(event));
    };
    handlers.on_error = [this, generation](const std::string& detail) {
        Event event{EventType::TRANSPORT_ERROR};
        event.generation = generation;
        event.text = detail;
        post(std::move(event));
    };

    safeLog("SessionClient", "Connecting to ", config_.relay_host, ":", config_.relay_port,
        config_.relay_path, config_.wire_mode == WireMode::EVENT_STREAM ? " (event-stream)" : "");
    transport_->connect(std::move(handlers));
}

void SessionClient::onOpen() {
    if (state() != ClientState::CONNECTING) return;

    if (config_.wire_mode == WireMode::RELAY) {
        if (!transport_->sendText(protocol::makeAuthMessage(config_.access_token))) {
            fail(ErrorInfo::error(ErrorCode::CONNECTION_FAILED, "Could not send authentication"));
            return;
        }
        debugLog("SessionClient", "Connected, auth sent");
        return;
    }
    becomeListening();
}

void SessionClient::becomeListening() {
    connect_deadline_.reset();
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        metrics_.connection_time_ms = elapsedMs(started_at_, Clock::now());
    }
    if (!transition(ClientState::LISTENING)) return;

    safeLog("SessionClient", "Listening (connected in ", metrics().connection_time_ms, "ms)");
    if (auto cb = callback()) {
        cb->onReady();
    }

    std::deque<AudioFrame> pending;
    pending.swap(pending_);
    for (const auto& frame : pending) {
        sendFrameNow(frame);
    }
}

void SessionClient::onText(const std::string& text) {
    auto message = protocol::parseServerMessage(text);
    if (!message) {
        debugLog("SessionClient", "Ignoring malformed control message");
        return;
    }

    const ClientState current = state();
    const bool receiving = current == ClientState::LISTENING || current == ClientState::STOPPING;

    switch (message->type) {
        case protocol::ServerMessageType::AUTHENTICATED:
            debugLog("SessionClient", "Authenticated");
            break;

        case protocol::ServerMessageType::READY:
            if (current == ClientState::CONNECTING) {
                becomeListening();
            }
            break;

        case protocol::ServerMessageType::PARTIAL:
            if (receiving) {
                handlePartial(TranscriptFragment::makePartial(message->text));
            }
            break;

        case protocol::ServerMessageType::FINAL:
            if (receiving) {
                handleFinal(TranscriptFragment::makeFinal(
                    "relay-" + std::to_string(++relay_final_seq_), message->text, message->speech_final));
            }
            break;

        case protocol::ServerMessageType::UTTERANCE_END:
            debugLog("SessionClient", "Utterance end");
            break;

        case protocol::ServerMessageType::DONE:
            if (receiving) {
                finish(message->stats, true);
            }
            break;

        case protocol::ServerMessageType::PONG:
            break;

        case protocol::ServerMessageType::ERROR:
            relay_error_ = message->error.empty() ? "Relay error" : message->error;
            safeWarn("SessionClient", "Relay reported an error: ", maskSensitive(relay_error_));
            // 通常紧跟 close, 由关闭码决定错误类型
            error_close_deadline_ = Clock::now() + kErrorCloseGrace;
            break;

        case protocol::ServerMessageType::UNKNOWN:
            debugLog("SessionClient", "Ignoring unknown control message");
            break;
    }
}

void SessionClient::onBinary(const std::vector<uint8_t>& data) {
    if (config_.wire_mode != WireMode::EVENT_STREAM) {
        debugLog("SessionClient", "Ignoring binary frame in relay mode");
        return;
    }

    reader_.feed(data);
    while (auto message = reader_.next()) {
        if (auto exception = codec::exceptionFromMessage(*message)) {
            fail(*exception);
            return;
        }
        if (message->messageType() != "event" || message->eventType() != "TranscriptEvent") {
            continue;
        }
        for (const auto& fragment : codec::parseTranscriptEvent(*message)) {
            if (fragment.is_partial) {
                handlePartial(fragment);
            } else {
                handleFinal(fragment);
            }
        }
    }

    if (reader_.shouldTearDown()) {
        fail(ErrorInfo::error(ErrorCode::PROTOCOL_DECODE_ERROR,
            "Transcription stream could not be decoded",
            std::to_string(reader_.decodeErrors()) + " malformed frames"));
    }
}

void SessionClient::onClose(int code, const std::string& reason) {
    const ClientState current = state();
    debugLog("SessionClient", "Transport closed, code ", code);
    (void)reason;

    if (current == ClientState::STOPPING) {
        if (config_.wire_mode == WireMode::EVENT_STREAM) {
            // event-stream 模式下关闭即确认
            SessionStats stats;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                stats.duration_ms = elapsedMs(started_at_, Clock::now());
                stats.audio_bytes_sent = metrics_.audio_bytes_sent;
                stats.partial_count = metrics_.partial_count;
                stats.final_count = metrics_.final_count;
                for (const auto& text : finals_) {
                    stats.final_transcript_length += text.size();
                }
            }
            finish(stats, true);
        } else {
            SessionStats stats;
            finish(stats, false);
        }
        return;
    }

    if (current != ClientState::CONNECTING && current != ClientState::LISTENING) {
        return;
    }

    ErrorInfo error;
    switch (code) {
        case close_code::AUTH_TIMEOUT:
            error = ErrorInfo::error(ErrorCode::AUTH_FAILED, "Authentication timed out");
            break;
        case close_code::AUTH_FAILED:
            error = ErrorInfo::error(ErrorCode::AUTH_FAILED, "Authentication failed");
            break;
        case close_code::ORIGIN_NOT_ALLOWED:
            error = ErrorInfo::error(ErrorCode::CONNECTION_FAILED, "Origin not allowed");
            break;
        default:
            if (!relay_error_.empty()) {
                error = ErrorInfo::error(ErrorCode::UPSTREAM_FATAL, "Transcription service error",
                    relay_error_);
            } else {
                error = ErrorInfo::error(ErrorCode::UPSTREAM_FATAL, "Connection closed unexpectedly",
                    "close code " + std::to_string(code));
            }
            break;
    }
    fail(error);
}

void SessionClient::onTransportError(const std::string& detail) {
    const ClientState current = state();
    switch (current) {
        case ClientState::CONNECTING:
            fail(ErrorInfo::error(ErrorCode::CONNECTION_FAILED,
                "Could not connect to transcription service", maskSensitive(detail)));
            break;
        case ClientState::LISTENING:
            fail(ErrorInfo::error(ErrorCode::UPSTREAM_FATAL,
                "Connection to transcription service lost", maskSensitive(detail)));
            break;
        case ClientState::STOPPING: {
            safeWarn("SessionClient", "Transport error while stopping");
            SessionStats stats;
            finish(stats, false);
            break;
        }
        default:
            break;
    }
}

// =============================================================================
// Audio
// =============================================================================

void SessionClient::onFrame(const AudioFrame& frame) {
    if (frame.empty()) return;

    const ClientState current = state();
    if (current == ClientState::CONNECTING) {
        if (pending_.size() >= config_.max_pending_frames) {
            pending_.pop_front();
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++metrics_.frames_dropped_backlog;
        }
        pending_.push_back(frame);
        return;
    }
    if (current == ClientState::LISTENING) {
        sendFrameNow(frame);
    }
}

void SessionClient::sendFrameNow(const AudioFrame& frame) {
    ITextTarget* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(setup_mutex_);
        target = target_;
    }

    if (target && !target->hasFocusedTarget()) {
        // 没有地方放文本: 丢弃本帧而不是排队
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++metrics_.frames_dropped_no_target;
        }
        const auto now = Clock::now();
        const auto interval = std::chrono::milliseconds(config_.no_target_signal_interval_ms);
        if (!last_no_target_signal_ || now - *last_no_target_signal_ >= interval) {
            last_no_target_signal_ = now;
            if (auto cb = callback()) cb->onNoTarget();
        }
        return;
    }

    flushBacklog();
    if (backlog_.empty() && trySend(frame)) {
        return;
    }

    if (!send_failure_warned_) {
        send_failure_warned_ = true;
        safeWarn("SessionClient", "Audio send failed, buffering");
        if (auto cb = callback()) {
            cb->onWarning(ErrorInfo::error(ErrorCode::NETWORK_ERROR,
                "Network unstable, buffering audio"));
        }
    }
    if (backlog_.size() >= config_.max_pending_frames) {
        backlog_.pop_front();
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            ++metrics_.frames_dropped_backlog;
        }
        if (auto cb = callback()) {
            cb->onWarning(ErrorInfo::error(ErrorCode::NETWORK_ERROR,
                "Audio buffer full, oldest audio dropped"));
        }
    }
    backlog_.push_back(frame);
}

bool SessionClient::trySend(const AudioFrame& frame) {
    if (!transport_) return false;

    std::vector<uint8_t> bytes = config_.wire_mode == WireMode::EVENT_STREAM
        ? codec::encodeAudioEvent(frame)
        : frame.toBytes();
    if (!transport_->sendBinary(std::move(bytes))) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    metrics_.audio_bytes_sent += frame.sampleCount() * sizeof(int16_t);
    return true;
}

void SessionClient::flushBacklog() {
    while (!backlog_.empty() && trySend(backlog_.front())) {
        backlog_.pop_front();
    }
}

// =============================================================================
// Results
// =============================================================================

void SessionClient::handlePartial(const TranscriptFragment& fragment) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++metrics_.partial_count;
    }
    debugLogPHI("SessionClient", fragment.text());
    if (auto cb = callback()) {
        cb->onPartial(fragment);
    }
}

void SessionClient::handleFinal(const TranscriptFragment& fragment) {
    const std::string text = trimmed(fragment.text());
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        ++metrics_.final_count;
        if (!text.empty()) {
            finals_.push_back(text);
        }
    }

    std::shared_ptr<TranscriptReconciler> reconciler;
    ITextTarget* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(setup_mutex_);
        reconciler = reconciler_;
        target = target_;
    }

    std::string inserted;
    if (auto prepared = reconciler->prepare(fragment.result_id, fragment.text())) {
        if (!target || target->insertText(*prepared)) {
            reconciler->accept(*prepared);
            inserted = *prepared;
        } else {
            debugLog("SessionClient", "Text target rejected insertion");
        }
    }
    debugLogPHI("SessionClient", inserted);

    if (auto cb = callback()) {
        cb->onFinal(fragment, inserted);
    }
}

// =============================================================================
// Stop / failure
// =============================================================================

void SessionClient::onStop() {
    const ClientState current = state();

    if (current == ClientState::CONNECTING) {
        safeLog("SessionClient", "Stop while connecting, aborting connection");
        teardown();
        transition(ClientState::STOPPING);
        if (auto cb = callback()) {
            cb->onDone(SessionStats(), metrics());
        }
        transition(ClientState::IDLE);
        return;
    }

    if (current != ClientState::LISTENING) {
        return;
    }

    stop_requested_at_ = Clock::now();
    flushBacklog();
    if (!backlog_.empty()) {
        safeWarn("SessionClient", backlog_.size(), " audio frames could not be sent before stop");
        if (auto cb = callback()) {
            cb->onWarning(ErrorInfo::error(ErrorCode::NETWORK_ERROR,
                "Some audio could not be sent before stopping"));
        }
        backlog_.clear();
    }

    bool sent = false;
    if (config_.wire_mode == WireMode::RELAY) {
        sent = transport_ && transport_->sendText(protocol::makeStopMessage());
    } else {
        // 空 AudioEvent 表示流结束
        sent = transport_ && transport_->sendBinary(codec::encodeAudioEvent(nullptr, 0));
    }

    transition(ClientState::STOPPING);
    if (!sent) {
        safeWarn("SessionClient", "Could not send stop, cleaning up");
        SessionStats stats;
        finish(stats, false);
        return;
    }
    stop_deadline_ = Clock::now() + std::chrono::milliseconds(config_.stop_ack_timeout_ms);
}

void SessionClient::fail(const ErrorInfo& error) {
    safeWarn("SessionClient", "Session failed: ", errorCodeToString(error.code), " (", error.message, ")");
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_error_ = error;
    }

    transition(ClientState::ERROR);
    teardown();
    if (auto cb = callback()) {
        cb->onError(error);
    }
    transition(ClientState::IDLE);
}

void SessionClient::finish(const SessionStats& stats, bool ack_received) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        last_stats_ = stats;
        if (ack_received && stop_requested_at_ != Clock::time_point()) {
            metrics_.stop_to_done_ms = elapsedMs(stop_requested_at_, Clock::now());
        }
    }
    if (state() == ClientState::LISTENING) {
        transition(ClientState::STOPPING);
    }
    teardown();

    const ClientMetrics current = metrics();
    safeLog("SessionClient", "Session complete, bytes: ", current.audio_bytes_sent,
        ", finals: ", current.final_count, ack_received ? "" : " (no acknowledgment)");
    if (auto cb = callback()) {
        cb->onDone(stats, current);
    }
    transition(ClientState::IDLE);
}

void SessionClient::teardown() {
    // 之后到达的事件全部视为过期
    ++generation_;
    connect_deadline_.reset();
    stop_deadline_.reset();
    error_close_deadline_.reset();
    stop_requested_at_ = Clock::time_point();

    if (transport_) {
        transport_->abort();
        transport_.reset();
    }
    stopCapture();
    pending_.clear();
    backlog_.clear();
}

void SessionClient::stopCapture() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (capture_) {
        capture_->stop();
        capture_.reset();
    }
}

}  // namespace client
}  // namespace scribe
