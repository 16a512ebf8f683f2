#include "engine/chunk_upload_engine.hpp"

#include <chrono>
#include <random>
#include <sstream>

#include <nlohmann/json.hpp>

#include "audio/resampler.hpp"
#include "audio/wav_codec.hpp"
#include "scribe_log.hpp"
#include "util/base64.hpp"

namespace scribe {
namespace engine {

using json = nlohmann::json;

namespace {

int64_t steadyNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

std::string generateChunkSessionId() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static const char* hex = "0123456789abcdef";

    std::stringstream ss;
    ss << "chunk-";
    for (int i = 0; i < 8; ++i) {
        ss << hex[dis(gen)];
    }
    ss << "-";
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    ss << std::hex << ms;
    return ss.str();
}

}  // namespace

// =============================================================================
// 请求/响应
// =============================================================================

std::string buildChunkRequestBody(const ChunkRequest& request) {
    json body = {
        {"audio", util::base64Encode(request.wav)},
        {"mimeType", "audio/wav"},
        {"sessionId", request.session_id},
    };
    return body.dump();
}

ErrorInfo parseChunkResponse(const std::string& body, std::string& text) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return ErrorInfo::error(ErrorCode::PROTOCOL_DECODE_ERROR, "Invalid transcription response");
    }

    auto error = data.find("error");
    if (error != data.end() && error->is_string()) {
        return ErrorInfo::error(ErrorCode::HTTP_ERROR, "Transcription service error",
            maskSensitive(error->get<std::string>()));
    }

    auto it = data.find("text");
    text = (it != data.end() && it->is_string()) ? it->get<std::string>() : std::string();
    return ErrorInfo::ok();
}

// =============================================================================
// CurlChunkTranscriber
// =============================================================================

CurlChunkTranscriber::CurlChunkTranscriber(ChunkConfig config,
        std::shared_ptr<transport::IHttpClient> http)
    : config_(std::move(config))
    , http_(std::move(http)) {
}

ErrorInfo CurlChunkTranscriber::transcribe(const ChunkRequest& request, std::string& text) {
    if (config_.endpoint.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Transcription endpoint is not configured");
    }

    transport::HttpRequest http_request;
    http_request.url = config_.endpoint;
    http_request.body = buildChunkRequestBody(request);
    http_request.timeout_ms = config_.request_timeout_ms;
    if (!config_.access_token.empty()) {
        http_request.headers.push_back(transport::bearerHeader(config_.access_token));
    }
    if (!config_.api_key.empty()) {
        http_request.headers.push_back("apikey: " + config_.api_key);
    }

    transport::HttpResponse response;
    auto result = transport::postWithRetry(*http_, http_request, config_.retry, response,
        [this]() { return cancelled_.load(); });
    if (!result.isOk()) {
        return result;
    }
    return parseChunkResponse(response.body, text);
}

ChunkVerdict classifyChunk(const AudioFrame& frame, const ChunkConfig& config) {
    if (frame.durationMs() < config.min_chunk_ms) {
        return ChunkVerdict::TOO_SHORT;
    }
    const auto& samples = frame.samples();
    if (audio::peakAmplitude(samples.data(), samples.size()) < config.silence_peak) {
        return ChunkVerdict::SILENT;
    }
    return ChunkVerdict::UPLOAD;
}

// =============================================================================
// ChunkUploadEngine
// =============================================================================

ChunkUploadEngine::ChunkUploadEngine(ChunkConfig config,
        std::shared_ptr<IChunkTranscriber> transcriber)
    : config_(std::move(config))
    , transcriber_(std::move(transcriber))
    , reconciler_(std::make_shared<client::TranscriptReconciler>()) {
    worker_ = std::thread(&ChunkUploadEngine::workerLoop, this);
}

ChunkUploadEngine::~ChunkUploadEngine() {
    {
        std::lock_guard<std::mutex> lock(lifecycle_mutex_);
        if (capture_) {
            capture_->stop();
            capture_.reset();
        }
    }
    if (transcriber_) {
        transcriber_->cancel();
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shutting_down_ = true;
        queue_.clear();
        session_id_.clear();
    }
    cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ChunkUploadEngine::setCallback(std::shared_ptr<ISessionCallback> callback) {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    callback_ = std::move(callback);
}

void ChunkUploadEngine::setTextTarget(client::ITextTarget* target) {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    target_ = target;
}

void ChunkUploadEngine::setReconciler(std::shared_ptr<client::TranscriptReconciler> reconciler) {
    if (!reconciler) return;
    std::lock_guard<std::mutex> lock(setup_mutex_);
    reconciler_ = std::move(reconciler);
}

void ChunkUploadEngine::setArbiter(audio::MicrophoneArbiter* arbiter) {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    arbiter_ = arbiter;
}

std::shared_ptr<ISessionCallback> ChunkUploadEngine::callback() const {
    std::lock_guard<std::mutex> lock(setup_mutex_);
    return callback_;
}

void ChunkUploadEngine::transition(ClientState to) {
    ClientState from;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = state_;
        if (from == to) return;
        state_ = to;
    }
    debugLog("ChunkEngine", clientStateToString(from), " -> ", clientStateToString(to));
    if (auto cb = callback()) {
        cb->onStateChanged(from, to);
    }
}

ErrorInfo ChunkUploadEngine::start(std::unique_ptr<audio::IAudioSource> source) {
    auto validation = ConfigValidator::validate(config_);
    if (!validation.isOk()) {
        return validation;
    }
    if (!transcriber_) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "No chunk transcriber configured");
    }

    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    std::string session_id = generateChunkSessionId();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ClientState::IDLE) {
            return ErrorInfo::error(ErrorCode::INVALID_STATE, "Session already active");
        }
        session_id_ = session_id;
        metrics_ = ClientMetrics();
        diagnostics_ = ChunkDiagnostics();
        result_seq_ = 0;
        started_at_ms_ = steadyNowMs();
    }

    audio::MicrophoneArbiter* arbiter = nullptr;
    {
        std::lock_guard<std::mutex> lock(setup_mutex_);
        reconciler_->beginSession();
        arbiter = arbiter_;
    }

    transition(ClientState::CONNECTING);

    if (source) {
        auto pipeline = std::make_unique<audio::CapturePipeline>(std::move(source),
            arbiter ? *arbiter : audio::MicrophoneArbiter::instance());
        auto result = pipeline->start(CaptureConfig::chunked(config_.chunk_ms),
            [this, session_id](const AudioFrame& frame) { enqueue(frame, session_id); },
            [this](const ErrorInfo& error) {
                if (auto cb = callback()) cb->onWarning(error);
            });
        if (!result.isOk()) {
            safeWarn("ChunkEngine", "Capture failed to start: ", result.message);
            {
                std::lock_guard<std::mutex> lock(mutex_);
                session_id_.clear();
                state_ = ClientState::IDLE;
            }
            if (auto cb = callback()) {
                cb->onStateChanged(ClientState::CONNECTING, ClientState::IDLE);
            }
            return result;
        }
        capture_ = std::move(pipeline);
    }

    safeLog("ChunkEngine", "Session started, chunk ", config_.chunk_ms, "ms");
    transition(ClientState::LISTENING);
    if (auto cb = callback()) {
        cb->onReady();
    }
    return ErrorInfo::ok();
}

ErrorInfo ChunkUploadEngine::submitChunk(const AudioFrame& chunk) {
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ClientState::LISTENING && state_ != ClientState::STOPPING) {
            return ErrorInfo::error(ErrorCode::INVALID_STATE, "Session is not active");
        }
        session_id = session_id_;
    }
    enqueue(chunk, session_id);
    return ErrorInfo::ok();
}

void ChunkUploadEngine::enqueue(const AudioFrame& chunk, const std::string& session_id) {
    switch (classifyChunk(chunk, config_)) {
        case ChunkVerdict::TOO_SHORT: {
            std::lock_guard<std::mutex> lock(mutex_);
            diagnostics_.chunks_skipped_short++;
            debugLog("ChunkEngine", "Skipping short chunk (", chunk.durationMs(), "ms)");
            return;
        }
        case ChunkVerdict::SILENT: {
            std::lock_guard<std::mutex> lock(mutex_);
            diagnostics_.chunks_skipped_silent++;
            debugLog("ChunkEngine", "Skipping silent chunk");
            return;
        }
        case ChunkVerdict::UPLOAD:
            break;
    }

    client::ITextTarget* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(setup_mutex_);
        target = target_;
    }
    if (target && !target->hasFocusedTarget()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            metrics_.frames_dropped_no_target++;
        }
        if (auto cb = callback()) cb->onNoTarget();
        return;
    }

    bool overflowed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id.empty() || session_id != session_id_) {
            return;
        }
        if (queue_.size() >= config_.max_queued_chunks) {
            queue_.pop_front();
            diagnostics_.chunks_dropped_backlog++;
            metrics_.frames_dropped_backlog++;
            overflowed = true;
        }
        queue_.push_back(Job{session_id, chunk});
        diagnostics_.queued = queue_.size();
    }
    cv_.notify_one();

    if (overflowed) {
        safeWarn("ChunkEngine", "Upload queue full, dropped oldest chunk");
        if (auto cb = callback()) {
            cb->onWarning(ErrorInfo::error(ErrorCode::NETWORK_ERROR,
                "Transcription is falling behind, some audio was dropped"));
        }
    }
}

ErrorInfo ChunkUploadEngine::stop() {
    std::unique_lock<std::mutex> lifecycle(lifecycle_mutex_);
    std::string session_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ != ClientState::LISTENING) {
            return ErrorInfo::ok();
        }
        session_id = session_id_;
    }

    transition(ClientState::STOPPING);

    if (capture_) {
        capture_->stop();
        if (auto last = capture_->drain()) {
            enqueue(*last, session_id);
        }
        capture_.reset();
    }

    // 等待已排队的分块上传完成
    {
        std::unique_lock<std::mutex> lock(mutex_);
        const bool drained = idle_cv_.wait_for(lock,
            std::chrono::milliseconds(config_.request_timeout_ms),
            [this]() { return queue_.empty() && !in_flight_; });
        if (!drained) {
            safeWarn("ChunkEngine", "Pending uploads did not finish before stop, discarding ",
                queue_.size(), " queued chunks");
            queue_.clear();
            diagnostics_.queued = 0;
        }
        // 之后到达的结果都视为过期
        session_id_.clear();
    }

    SessionStats stats;
    ClientMetrics metrics;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stats.duration_ms = steadyNowMs() - started_at_ms_;
        stats.audio_bytes_sent = metrics_.audio_bytes_sent;
        stats.final_count = metrics_.final_count;
        metrics = metrics_;
    }
    {
        std::lock_guard<std::mutex> lock(setup_mutex_);
        stats.final_transcript_length = reconciler_->transcript().size();
    }

    safeLog("ChunkEngine", "Session stopped after ", stats.duration_ms, "ms, chunks: ",
        diagnostics().chunks_uploaded);
    transition(ClientState::IDLE);
    if (auto cb = callback()) {
        cb->onDone(stats, metrics);
    }
    return ErrorInfo::ok();
}

// =============================================================================
// Upload worker
// =============================================================================

void ChunkUploadEngine::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        cv_.wait(lock, [this]() { return shutting_down_ || !queue_.empty(); });
        if (shutting_down_) {
            break;
        }

        Job job = std::move(queue_.front());
        queue_.pop_front();
        diagnostics_.queued = queue_.size();
        in_flight_ = true;
        diagnostics_.in_flight = true;

        lock.unlock();
        upload(job);
        lock.lock();

        in_flight_ = false;
        diagnostics_.in_flight = false;
        if (queue_.empty()) {
            idle_cv_.notify_all();
        }
    }
    in_flight_ = false;
    idle_cv_.notify_all();
}

void ChunkUploadEngine::upload(const Job& job) {
    const auto& samples = job.frame.samples();
    ChunkRequest request;
    request.session_id = job.session_id;
    request.sequence = job.frame.sequence();
    request.duration_ms = job.frame.durationMs();

    auto encoded = audio::encodeWav(samples.data(), samples.size(),
        job.frame.sampleRate(), request.wav);
    if (!encoded.isOk()) {
        safeError("ChunkEngine", "WAV encode failed: ", encoded.message);
        std::lock_guard<std::mutex> lock(mutex_);
        diagnostics_.upload_failures++;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        metrics_.audio_bytes_sent += request.wav.size();
    }
    debugLog("ChunkEngine", "Uploading chunk ", request.sequence, " (", request.duration_ms, "ms, ",
        request.wav.size(), " bytes)");

    std::string text;
    auto result = transcriber_->transcribe(request, text);
    if (!result.isOk()) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            diagnostics_.upload_failures++;
        }
        safeWarn("ChunkEngine", "Chunk upload failed: ", result.message);
        if (auto cb = callback()) {
            cb->onWarning(result);
        }
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        diagnostics_.chunks_uploaded++;
    }
    deliver(job.session_id, text);
}

void ChunkUploadEngine::deliver(const std::string& session_id, const std::string& text) {
    std::string result_id;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id != session_id_) {
            diagnostics_.stale_results++;
            debugLog("ChunkEngine", "Discarding result for stale session");
            return;
        }
        result_id = "chunk-" + std::to_string(++result_seq_);
        metrics_.final_count++;
    }

    debugLogPHI("ChunkEngine", text);

    std::shared_ptr<client::TranscriptReconciler> reconciler;
    client::ITextTarget* target = nullptr;
    {
        std::lock_guard<std::mutex> lock(setup_mutex_);
        reconciler = reconciler_;
        target = target_;
    }

    const auto fragment = TranscriptFragment::makeFinal(result_id, text, true);
    std::string inserted;
    if (auto prepared = reconciler->prepare(result_id, text)) {
        if (!target || target->insertText(*prepared)) {
            reconciler->accept(*prepared);
            inserted = *prepared;
        } else {
            debugLog("ChunkEngine", "Text target rejected insertion");
        }
    }

    if (auto cb = callback()) {
        cb->onFinal(fragment, inserted);
    }
}

// =============================================================================
// 查询
// =============================================================================

bool ChunkUploadEngine::isActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == ClientState::LISTENING || state_ == ClientState::CONNECTING;
}

ClientState ChunkUploadEngine::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::string ChunkUploadEngine::sessionId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_id_;
}

ClientMetrics ChunkUploadEngine::metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metrics_;
}

ChunkDiagnostics ChunkUploadEngine::diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return diagnostics_;
}

}  // namespace engine
}  // namespace scribe
