/**
 * Scribe - Live medical transcription SDK
 *
 * 实时听写接口: 低延迟 relay 流式识别, 平台原生识别, 分块上传三种引擎
 * 自动选择与降级, 最终结果去重后交给宿主插入, 并可生成滚动摘要。
 *
 * 使用示例 1 - 默认配置:
 *
 *   Scribe::LiveScribeConfig config;
 *   config.relay_host = "relay.example.com";
 *   config.relay_tls = true;
 *   config.access_token = token;
 *   auto scribe = std::make_shared<Scribe::LiveScribe>(config);
 *   scribe->SetCallback(std::make_shared<MyCallback>());
 *   scribe->Start();
 *   ...
 *   scribe->Stop();
 *   std::cout << scribe->GetTranscript() << std::endl;
 *
 * 使用示例 2 - 仅分块上传:
 *
 *   Scribe::LiveScribeConfig config = Scribe::LiveScribeConfig::Chunked(endpoint, api_key);
 *   Scribe::LiveScribe scribe(config);
 *
 * 使用示例 3 - 暂停与继续 (文本保留):
 *
 *   scribe->Pause();
 *   scribe->Resume();
 */

#ifndef SCRIBE_API_HPP
#define SCRIBE_API_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace Scribe {

// =============================================================================
// LiveScribeConfig - 配置
// =============================================================================

struct LiveScribeConfig {
    // relay
    std::string relay_host = "localhost";   ///< relay 主机, 空表示不使用 relay
    std::string relay_port = "8080";
    std::string relay_path = "/dictate";
    bool relay_tls = false;
    std::string access_token;               ///< Bearer JWT, 空表示 relay 未配置
    std::string origin;                     ///< 发送的 Origin 头 (可选)
    bool event_stream = false;              ///< 使用二进制 event-stream 线路格式

    // 音频
    std::string audio_source = "default";   ///< "default" (麦克风), "synthetic", "file:<path>"
    int device_index = -1;

    // 分块上传
    std::string transcribe_endpoint;        ///< 空表示分块引擎不可用
    int chunk_ms = 5000;

    // 摘要
    std::string summary_endpoint;           ///< 空表示不生成摘要
    std::string preferences_json = "{}";
    int summary_debounce_ms = 45000;

    std::string api_key;                    ///< 分块与摘要接口的 apikey 头

    /// @brief 强制引擎: "auto", "relay", "browser", "chunk"
    std::string force_engine = "auto";

    /// @brief 创建默认配置
    static LiveScribeConfig Default() {
        return LiveScribeConfig();
    }

    /// @brief 仅使用分块上传
    static LiveScribeConfig Chunked(const std::string& endpoint, const std::string& api_key = "") {
        LiveScribeConfig config;
        config.relay_host.clear();
        config.transcribe_endpoint = endpoint;
        config.api_key = api_key;
        config.force_engine = "chunk";
        return config;
    }

    /// @brief 在默认配置上应用 SCRIBE_FORCE_ENGINE
    static LiveScribeConfig FromEnvironment();
};

// =============================================================================
// 枚举与结构
// =============================================================================

enum class Engine {
    Relay,      ///< Deepgram (relay)
    Browser,    ///< 平台原生识别
    Chunk,      ///< 分块上传
};

struct EngineInfo {
    Engine preferred = Engine::Chunk;
    Engine active = Engine::Chunk;
    std::string status;             ///< "idle", "connecting", "ready", "error", "fallback", "loading"
    std::string label;              ///< "Engine: Deepgram (relay) (connecting...)"
    bool did_fallback = false;
    std::string fallback_warning;
};

struct SessionStats {
    int64_t duration_ms = 0;
    uint64_t audio_bytes_sent = 0;
    uint64_t partial_count = 0;
    uint64_t final_count = 0;
    uint64_t final_transcript_length = 0;
};

// =============================================================================
// PlatformRecognizer - 宿主提供的原生识别
// =============================================================================

class PlatformRecognizer {
public:
    using ResultHandler = std::function<void(const std::string& text, bool is_final)>;
    using ErrorHandler = std::function<void(const std::string& message)>;

    virtual ~PlatformRecognizer() = default;

    /// @brief 当前平台是否支持
    virtual bool IsSupported() const = 0;

    /// @brief 开始识别
    /// @return 失败返回 false
    virtual bool Start(ResultHandler on_result, ErrorHandler on_error) = 0;

    /// @brief 同步停止, 返回后不再回调
    virtual void Stop() = 0;
};

// =============================================================================
// LiveScribeCallback - 回调接口
// =============================================================================

/**
 * @brief 听写回调接口
 *
 * ## 回调调用链
 *
 * ```
 *   Start()
 *      │
 *      ▼
 *   OnEngineChanged()     ← 引擎或状态变化 (含降级)
 *      │
 *      ▼
 *   OnOpen()              ← 引擎就绪
 *      │
 *      ├─► OnPartial()    ← 中间结果
 *      ├─► OnFinal()      ← 最终结果, inserted 为去重后应插入的文本
 *      └─► OnSummary()    ← 滚动摘要更新
 *      ▼
 *   Stop() / Pause()
 *      │
 *      ▼
 *   OnClose()
 * ```
 *
 * 回调在内部线程中调用。不要在回调中同步调用 Stop() 或 Pause()。
 */
class LiveScribeCallback {
public:
    virtual ~LiveScribeCallback() = default;

    /// @brief 引擎就绪, 开始识别
    virtual void OnOpen(Engine engine) {}

    /// @brief 中间结果 (文本可能变化)
    virtual void OnPartial(const std::string& text) {}

    /// @brief 最终结果
    /// @param inserted 去重后应插入焦点输入框的文本, 可能为空
    virtual void OnFinal(const std::string& text, const std::string& inserted) {}

    /// @brief 引擎选择结果变化
    virtual void OnEngineChanged(const EngineInfo& info) {}

    /// @brief 滚动摘要更新
    virtual void OnSummary(const std::string& summary) {}

    /// @brief 没有获得焦点的输入框, 本段音频已丢弃
    virtual void OnNoFieldFocused() {}

    /// @brief 会话级错误 (所有引擎都不可用)
    /// @param message 面向用户的提示, 不含敏感信息
    virtual void OnError(int code, const std::string& message) {}

    /// @brief 会话关闭 (Stop / Pause / 错误之后)
    virtual void OnClose(const SessionStats& stats) {}

    /// @brief 宿主当前是否有获得焦点的输入框
    virtual bool HasFocusedField() { return true; }
};

// =============================================================================
// LiveScribe - 听写会话
// =============================================================================

class LiveScribe {
public:
    /// @brief 使用默认配置构造
    LiveScribe();

    /// @brief 使用配置构造
    /// @param config 配置对象
    /// @param recognizer 平台原生识别 (可选)
    explicit LiveScribe(const LiveScribeConfig& config,
        std::shared_ptr<PlatformRecognizer> recognizer = nullptr);

    ~LiveScribe();

    LiveScribe(const LiveScribe&) = delete;
    LiveScribe& operator=(const LiveScribe&) = delete;

    // -------------------------------------------------------------------------
    // 会话控制
    // -------------------------------------------------------------------------

    /// @brief 设置回调监听器
    void SetCallback(std::shared_ptr<LiveScribeCallback> callback);

    /// @brief 开始新的录音 (清空文本与摘要)
    /// @return 失败返回 false, 原因见 GetLastError()
    bool Start();

    /// @brief 停止录音, 等待剩余结果并请求最终摘要
    void Stop();

    /// @brief 暂停: 停止当前会话但保留文本
    bool Pause();

    /// @brief 继续: 新会话追加到同一份文本
    bool Resume();

    // -------------------------------------------------------------------------
    // 查询
    // -------------------------------------------------------------------------

    /// @brief 去重后的完整文本
    std::string GetTranscript() const;

    /// @brief 当前滚动摘要
    std::string GetRunningSummary() const;

    /// @brief "Engine: <label>" 显示文本
    std::string GetEngineLabel() const;

    /// @brief 当前引擎信息
    EngineInfo GetEngineInfo() const;

    /// @brief 最近一次会话的统计
    SessionStats GetLastStats() const;

    /// @brief 最近一次失败的提示
    std::string GetLastError() const;

    bool IsRecording() const;

private:
    friend class CallbackAdapter;

    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace Scribe

#endif  // SCRIBE_API_HPP
