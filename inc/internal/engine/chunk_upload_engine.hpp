#ifndef SCRIBE_ENGINE_CHUNK_UPLOAD_ENGINE_HPP
#define SCRIBE_ENGINE_CHUNK_UPLOAD_ENGINE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "../audio/capture_pipeline.hpp"
#include "../client/session_client.hpp"
#include "../client/transcript_reconciler.hpp"
#include "../scribe_callback.hpp"
#include "../scribe_config.hpp"
#include "../scribe_types.hpp"
#include "../transport/http_client.hpp"

namespace scribe {
namespace engine {

// =============================================================================
// Chunk Transcriber (单个分块的识别接口)
// =============================================================================
//
//   请求: {audio: base64 WAV, mimeType: "audio/wav", sessionId}
//   响应: {text}
//

struct ChunkRequest {
    std::string session_id;
    int64_t sequence = 0;
    int64_t duration_ms = 0;
    std::vector<uint8_t> wav;
};

class IChunkTranscriber {
public:
    virtual ~IChunkTranscriber() = default;

    /// @brief 同步识别 (在上传 worker 线程中执行)
    virtual ErrorInfo transcribe(const ChunkRequest& request, std::string& text) = 0;

    /// @brief 放弃剩余重试
    virtual void cancel() {}
};

/// @brief 请求体 JSON
std::string buildChunkRequestBody(const ChunkRequest& request);

/// @brief 解析 {text}, 缺少 text 视为空结果
ErrorInfo parseChunkResponse(const std::string& body, std::string& text);

class CurlChunkTranscriber : public IChunkTranscriber {
public:
    explicit CurlChunkTranscriber(ChunkConfig config,
            std::shared_ptr<transport::IHttpClient> http = std::make_shared<transport::CurlHttpClient>());

    ErrorInfo transcribe(const ChunkRequest& request, std::string& text) override;
    void cancel() override { cancelled_ = true; }

private:
    ChunkConfig config_;
    std::shared_ptr<transport::IHttpClient> http_;
    std::atomic<bool> cancelled_{false};
};

// =============================================================================
// Chunk 过滤
// =============================================================================

enum class ChunkVerdict {
    UPLOAD,
    TOO_SHORT,
    SILENT,
};

/// @brief 短于 min_chunk_ms 或峰值低于 silence_peak 的分块不上传
ChunkVerdict classifyChunk(const AudioFrame& frame, const ChunkConfig& config);

struct ChunkDiagnostics {
    uint64_t chunks_uploaded = 0;
    uint64_t chunks_skipped_short = 0;
    uint64_t chunks_skipped_silent = 0;
    uint64_t chunks_dropped_backlog = 0;
    uint64_t upload_failures = 0;
    uint64_t stale_results = 0;
    size_t queued = 0;
    bool in_flight = false;
};

// =============================================================================
// Chunk Upload Engine (周期性分块上传)
// =============================================================================
//
// 采集以 chunk_ms 为间隔成帧, 每帧编码为 WAV 后上传。
// 上传单飞: 后续分块在有界队列中排队, 溢出时丢弃最旧的分块并告警。
// 每次 start() 生成新的 session id, 旧 session 的结果到达时丢弃。
// 结果经同一个 TranscriptReconciler 去重, result id 为 "chunk-<n>"。
//
// 回调接口与 SessionClient 相同 (ISessionCallback), 没有 partial。
//

class ChunkUploadEngine {
public:
    ChunkUploadEngine(ChunkConfig config, std::shared_ptr<IChunkTranscriber> transcriber);
    ~ChunkUploadEngine();

    ChunkUploadEngine(const ChunkUploadEngine&) = delete;
    ChunkUploadEngine& operator=(const ChunkUploadEngine&) = delete;

    void setCallback(std::shared_ptr<ISessionCallback> callback);
    void setTextTarget(client::ITextTarget* target);
    void setReconciler(std::shared_ptr<client::TranscriptReconciler> reconciler);
    void setArbiter(audio::MicrophoneArbiter* arbiter);

    /// @param source 音频源, nullptr 表示由调用者经 submitChunk() 提供
    ErrorInfo start(std::unique_ptr<audio::IAudioSource> source);

    /// @brief 外部提供的分块
    ErrorInfo submitChunk(const AudioFrame& chunk);

    /// @brief 停止采集, 提交剩余音频并等待队列清空 (最多 request_timeout_ms)
    ErrorInfo stop();

    bool isActive() const;
    ClientState state() const;
    std::string sessionId() const;
    ClientMetrics metrics() const;
    ChunkDiagnostics diagnostics() const;

    const ChunkConfig& config() const { return config_; }
    client::TranscriptReconciler& reconciler() { return *reconciler_; }

private:
    struct Job {
        std::string session_id;
        AudioFrame frame;
    };

    void enqueue(const AudioFrame& chunk, const std::string& session_id);
    void workerLoop();
    void upload(const Job& job);
    void deliver(const std::string& session_id, const std::string& text);
    void transition(ClientState to);
    std::shared_ptr<ISessionCallback> callback() const;

    ChunkConfig config_;
    std::shared_ptr<IChunkTranscriber> transcriber_;

    mutable std::mutex setup_mutex_;
    std::shared_ptr<ISessionCallback> callback_;
    client::ITextTarget* target_ = nullptr;
    std::shared_ptr<client::TranscriptReconciler> reconciler_;
    audio::MicrophoneArbiter* arbiter_ = nullptr;

    std::mutex lifecycle_mutex_;
    std::unique_ptr<audio::CapturePipeline> capture_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    ClientState state_ = ClientState::IDLE;
    std::string session_id_;
    std::deque<Job> queue_;
    bool in_flight_ = false;
    bool shutting_down_ = false;
    uint64_t result_seq_ = 0;
    ClientMetrics metrics_;
    ChunkDiagnostics diagnostics_;
    int64_t started_at_ms_ = 0;

    std::thread worker_;
};

}  // namespace engine
}  // namespace scribe

#endif  // SCRIBE_ENGINE_CHUNK_UPLOAD_ENGINE_HPP
