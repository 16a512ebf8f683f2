#ifndef SCRIBE_RELAY_RELAY_SESSION_MACHINE_HPP
#define SCRIBE_RELAY_RELAY_SESSION_MACHINE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "../scribe_config.hpp"
#include "../scribe_types.hpp"
#include "token_verifier.hpp"

namespace scribe {
namespace relay {

// =============================================================================
// Relay Session State (服务端会话状态)
// =============================================================================
//
//   New -> AwaitingAuth -> Authenticated -> Streaming -> Finalizing -> Closed
//                       \-> AuthTimeout
//   任意状态遇到上游错误 -> Closed
//

enum class RelaySessionState {
    NEW,
    AWAITING_AUTH,
    AUTHENTICATED,      // 已认证, 上游连接中
    STREAMING,          // 上游已连接, 转发音频
    FINALIZING,         // 收到 stop, 等待尾部结果
    CLOSED,
    AUTH_TIMEOUT,
};

const char* relaySessionStateToString(RelaySessionState state);

/// @brief 状态迁移是否合法
bool isValidTransition(RelaySessionState from, RelaySessionState to);

/// @brief 7 位 base36 随机会话 id
std::string generateSessionId();

// =============================================================================
// Session IO (状态机的副作用出口)
// =============================================================================
//
// 由 RelaySession (Beast) 实现; 测试中由 fake 实现。
// 所有调用都在会话的 strand 上发生。
//

class IRelaySessionIO {
public:
    virtual ~IRelaySessionIO() = default;

    virtual void sendToClient(const std::string& text) = 0;
    virtual void closeClient(int code, const std::string& reason) = 0;

    virtual void openUpstream() = 0;
    virtual void sendUpstreamAudio(std::shared_ptr<const std::vector<uint8_t>> audio) = 0;
    virtual void sendUpstreamText(const std::string& text) = 0;
    virtual void closeUpstream() = 0;

    virtual void startAuthTimer(int ms) = 0;
    virtual void cancelAuthTimer() = 0;
    virtual void startFlushTimer(int ms) = 0;
    virtual void cancelFlushTimer() = 0;
    /// @brief 周期性触发 RelaySessionMachine::onKeepAliveTick()
    virtual void startKeepAlive(int interval_ms) = 0;
    virtual void stopKeepAlive() = 0;

    /// @brief 单调时钟 (毫秒)
    virtual int64_t nowMs() const = 0;
};

// =============================================================================
// Relay Session Machine (每个连接一个, 单线程驱动)
// =============================================================================

class RelaySessionMachine {
public:
    RelaySessionMachine(std::string session_id, const RelayConfig& config,
            const ITokenVerifier& verifier, IRelaySessionIO& io);

    // -------------------------------------------------------------------------
    // 客户端事件
    // -------------------------------------------------------------------------

    /// @return false 表示 origin 被拒绝, 连接已关闭
    bool onClientConnected(const std::string& origin);
    void onClientText(const std::string& text);
    void onClientBinary(std::shared_ptr<const std::vector<uint8_t>> audio);
    void onClientClosed();

    /// @brief 服务端关闭: 取消定时器、关闭上游、以 1001 关闭客户端
    void onServerShutdown();

    // -------------------------------------------------------------------------
    // 上游事件
    // -------------------------------------------------------------------------

    void onUpstreamOpen();
    void onUpstreamText(const std::string& text);
    void onUpstreamClosed();
    void onUpstreamError(const std::string& detail);

    // -------------------------------------------------------------------------
    // 定时器
    // -------------------------------------------------------------------------

    void onAuthTimeout();
    void onFlushTimeout();
    void onKeepAliveTick();

    // -------------------------------------------------------------------------
    // 查询
    // -------------------------------------------------------------------------

    RelaySessionState state() const { return state_; }
    const std::string& sessionId() const { return session_id_; }
    const std::string& userId() const { return user_id_; }
    bool isAuthenticated() const { return !user_id_.empty(); }
    bool upstreamOpen() const { return upstream_open_; }
    bool doneSent() const { return done_sent_; }
    bool isTerminal() const {
        return state_ == RelaySessionState::CLOSED || state_ == RelaySessionState::AUTH_TIMEOUT;
    }

    /// @brief 当前统计 (durationMs 截至现在)
    SessionStats stats() const;

private:
    bool transition(RelaySessionState to);
    void handleAuth(const std::string& token);
    void handleStop();
    void sendDone();
    void failUpstream();
    void releaseUpstream();

    std::string session_id_;
    const RelayConfig& config_;
    const ITokenVerifier& verifier_;
    IRelaySessionIO& io_;

    RelaySessionState state_ = RelaySessionState::NEW;
    std::string user_id_;

    bool upstream_requested_ = false;
    bool upstream_open_ = false;
    bool upstream_ever_opened_ = false;
    bool done_sent_ = false;

    int64_t connected_at_ms_ = 0;
    int64_t upstream_started_ms_ = -1;

    uint64_t audio_bytes_sent_ = 0;
    uint64_t partial_count_ = 0;
    uint64_t final_count_ = 0;
    uint64_t final_transcript_length_ = 0;
};

}  // namespace relay
}  // namespace scribe

#endif  // SCRIBE_RELAY_RELAY_SESSION_MACHINE_HPP
