#ifndef SCRIBE_CLIENT_SESSION_CLIENT_HPP
#define SCRIBE_CLIENT_SESSION_CLIENT_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "../audio/capture_pipeline.hpp"
#include "../codec/event_stream.hpp"
#include "../scribe_callback.hpp"
#include "../scribe_config.hpp"
#include "../scribe_types.hpp"
#include "relay_transport.hpp"
#include "transcript_reconciler.hpp"

namespace scribe {
namespace client {

// =============================================================================
// Text Target (最终文本的插入目标, 由宿主提供)
// =============================================================================

class ITextTarget {
public:
    virtual ~ITextTarget() = default;

    /// @brief 当前是否有获得焦点的输入目标
    virtual bool hasFocusedTarget() const = 0;

    /// @brief 插入文本, 失败返回 false (尾部窗口不更新)
    virtual bool insertText(const std::string& text) = 0;
};

// =============================================================================
// Session Client (一次听写会话)
// =============================================================================
//
// 状态机:
//   Idle -> Connecting -> Listening -> Stopping -> Idle
//   Connecting / Listening -> Error -> Idle
//
// 所有事件 (连接回调、音频帧、stop 命令、超时) 进入同一个队列,
// 由一个 worker 线程按顺序驱动状态机。每次 start() 生成新的 generation,
// 旧连接迟到的回调一律丢弃。
//
// 使用示例:
//
//   client::SessionClient session(ClientConfig::lowLatency("localhost", "8080", token));
//   session.setCallback(std::make_shared<SimpleCallback>());
//   session.start(audio::createAudioSource("synthetic"));
//   ...
//   session.stop();     // 最多等待 stop_ack_timeout_ms
//

class SessionClient {
public:
    explicit SessionClient(ClientConfig config,
            RelayTransportFactory transport_factory = makeBeastRelayTransport);
    ~SessionClient();

    SessionClient(const SessionClient&) = delete;
    SessionClient& operator=(const SessionClient&) = delete;

    // -------------------------------------------------------------------------
    // 配置 (在 start() 之前调用)
    // -------------------------------------------------------------------------

    void setCallback(std::shared_ptr<ISessionCallback> callback);

    /// @brief 插入目标 (调用者管理生命周期), nullptr 表示总是可插入
    void setTextTarget(ITextTarget* target);

    /// @brief 共享的去重器 (用于跨会话保留文本), 默认每个客户端一个
    void setReconciler(std::shared_ptr<TranscriptReconciler> reconciler);

    /// @brief 采集使用的麦克风仲裁器 (默认全局实例)
    void setArbiter(audio::MicrophoneArbiter* arbiter);

    // -------------------------------------------------------------------------
    // 会话控制
    // -------------------------------------------------------------------------

    /// @brief 获取音频源并开始连接
    /// @param source 音频源, nullptr 表示由调用者经 sendFrame() 提供帧
    /// @return 设备或配置错误; 连接结果经回调返回
    ErrorInfo start(std::unique_ptr<audio::IAudioSource> source);

    /// @brief 外部提供的音频帧 (Connecting / Listening)
    ErrorInfo sendFrame(const AudioFrame& frame);

    /// @brief 发送剩余音频与 stop, 等待 done (有上限) 后清理
    /// @note 连接中调用时直接中止连接。返回时麦克风已释放。
    ErrorInfo stop();

    /// @brief 流式路径不支持暂停
    ErrorInfo pause();

    // -------------------------------------------------------------------------
    // 查询
    // -------------------------------------------------------------------------

    ClientState state() const;
    bool isActive() const;
    ClientMetrics metrics() const;
    SessionStats lastStats() const;
    ErrorInfo lastError() const;

    /// @brief 本会话的最终结果, 以单个空格连接
    std::string finalTranscript() const;

    const ClientConfig& config() const { return config_; }
    TranscriptReconciler& reconciler() { return *reconciler_; }

private:
    // -------------------------------------------------------------------------
    // 事件队列
    // -------------------------------------------------------------------------

    enum class EventType {
        CONNECT,
        OPEN,
        TEXT,
        BINARY,
        CLOSE,
        TRANSPORT_ERROR,
        FRAME,
        STOP,
    };

    struct Event {
        EventType type;
        uint64_t generation = 0;
        std::string text;
        std::vector<uint8_t> data;
        int code = 0;
        AudioFrame frame;
    };

    using Clock = std::chrono::steady_clock;

    void post(Event event);
    void workerLoop();
    void handleEvent(Event& event);
    void checkDeadlines();
    std::optional<Clock::time_point> nextDeadline() const;

    // -------------------------------------------------------------------------
    // 状态机 (仅 worker 线程)
    // -------------------------------------------------------------------------

    bool transition(ClientState to);
    void onConnect();
    void onOpen();
    void onText(const std::string& text);
    void onBinary(const std::vector<uint8_t>& data);
    void onClose(int code, const std::string& reason);
    void onTransportError(const std::string& detail);
    void onFrame(const AudioFrame& frame);
    void onStop();

    void becomeListening();
    void handleFinal(const TranscriptFragment& fragment);
    void handlePartial(const TranscriptFragment& fragment);
    void sendFrameNow(const AudioFrame& frame);
    bool trySend(const AudioFrame& frame);
    void flushBacklog();
    void fail(const ErrorInfo& error);
    void finish(const SessionStats& stats, bool ack_received);
    void teardown();
    void stopCapture();

    std::shared_ptr<ISessionCallback> callback() const;

    ClientConfig config_;
    RelayTransportFactory transport_factory_;

    // 宿主设置
    mutable std::mutex setup_mutex_;
    std::shared_ptr<ISessionCallback> callback_;
    ITextTarget* target_ = nullptr;
    std::shared_ptr<TranscriptReconciler> reconciler_;
    audio::MicrophoneArbiter* arbiter_ = nullptr;

    // 状态
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    ClientState state_ = ClientState::IDLE;
    std::atomic<uint64_t> generation_{0};
    ClientMetrics metrics_;
    SessionStats last_stats_;
    ErrorInfo last_error_;
    std::vector<std::string> finals_;

    // 采集
    std::mutex capture_mutex_;
    std::unique_ptr<audio::CapturePipeline> capture_;

    // 事件队列
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Event> queue_;
    bool shutting_down_ = false;
    std::thread worker_;

    // 以下仅 worker 线程访问
    std::unique_ptr<IRelayTransport> transport_;
    codec::EventStreamReader reader_;
    std::deque<AudioFrame> pending_;        // Connecting 期间
    std::deque<AudioFrame> backlog_;        // 发送失败待重试
    bool send_failure_warned_ = false;
    std::string relay_error_;
    uint64_t relay_final_seq_ = 0;
    Clock::time_point started_at_;
    Clock::time_point stop_requested_at_;
    std::optional<Clock::time_point> connect_deadline_;
    std::optional<Clock::time_point> stop_deadline_;
    std::optional<Clock::time_point> error_close_deadline_;
    std::optional<Clock::time_point> last_no_target_signal_;
};

}  // namespace client
}  // namespace scribe

#endif  // SCRIBE_CLIENT_SESSION_CLIENT_HPP
