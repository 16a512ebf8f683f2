#ifndef SCRIBE_CALLBACK_HPP
#define SCRIBE_CALLBACK_HPP

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "scribe_types.hpp"

namespace scribe {

// =============================================================================
// Client Session State (客户端会话状态)
// =============================================================================

enum class ClientState {
    IDLE,
    CONNECTING,
    LISTENING,
    STOPPING,
    ERROR,
};

inline const char* clientStateToString(ClientState state) {
    switch (state) {
        case ClientState::IDLE:       return "idle";
        case ClientState::CONNECTING: return "connecting";
        case ClientState::LISTENING:  return "listening";
        case ClientState::STOPPING:   return "stopping";
        case ClientState::ERROR:      return "error";
        default:                      return "unknown";
    }
}

// =============================================================================
// Client Metrics (客户端指标)
// =============================================================================

struct ClientMetrics {
    uint64_t audio_bytes_sent = 0;
    uint64_t partial_count = 0;
    uint64_t final_count = 0;
    int64_t connection_time_ms = -1;        // start() 到 Listening
    int64_t stop_to_done_ms = -1;           // stop() 到收到 done
    uint64_t frames_dropped_no_target = 0;
    uint64_t frames_dropped_backlog = 0;
};

// =============================================================================
// Session Callback Interface (会话回调接口)
// =============================================================================
//
// 回调在会话内部线程中调用, 不要在回调中调用 stop() 以外的阻塞操作。
// 两种实现方式:
// 1. 继承此类并重写虚函数
// 2. 使用 LambdaCallback::create() 设置 lambda
//

class ISessionCallback {
public:
    virtual ~ISessionCallback() = default;

    // -------------------------------------------------------------------------
    // 生命周期
    // -------------------------------------------------------------------------

    /// @brief 状态迁移
    virtual void onStateChanged(ClientState from, ClientState to) {
        (void)from;
        (void)to;
    }

    /// @brief 上游引擎已就绪, 开始发送音频
    virtual void onReady() {}

    /// @brief 会话结束 (收到 done 或强制清理)
    /// @param stats relay 返回的统计, 未收到 done 时为空
    /// @param metrics 客户端侧指标
    virtual void onDone(const SessionStats& stats, const ClientMetrics& metrics) {
        (void)stats;
        (void)metrics;
    }

    // -------------------------------------------------------------------------
    // 结果
    // -------------------------------------------------------------------------

    /// @brief 中间结果 (文本可能变化)
    virtual void onPartial(const TranscriptFragment& fragment) {
        (void)fragment;
    }

    /// @brief 最终结果
    /// @param fragment 原始片段
    /// @param inserted 去重后实际插入的文本, 可能为空
    virtual void onFinal(const TranscriptFragment& fragment, const std::string& inserted) {
        (void)fragment;
        (void)inserted;
    }

    /// @brief 没有可输入的焦点目标, 本帧已丢弃
    virtual void onNoTarget() {}

    // -------------------------------------------------------------------------
    // 错误
    // -------------------------------------------------------------------------

    /// @brief 会话级错误
    virtual void onError(const ErrorInfo& error) = 0;

    /// @brief 可恢复的警告 (网络抖动等), 会话继续
    virtual void onWarning(const ErrorInfo& warning) {
        (void)warning;
    }
};

// =============================================================================
// Callback using std::function (函数式回调)
// =============================================================================

using OnStateChangedCallback = std::function<void(ClientState, ClientState)>;
using OnReadyCallback = std::function<void()>;
using OnDoneCallback = std::function<void(const SessionStats&, const ClientMetrics&)>;
using OnPartialCallback = std::function<void(const TranscriptFragment&)>;
using OnFinalCallback = std::function<void(const TranscriptFragment&, const std::string&)>;
using OnNoTargetCallback = std::function<void()>;
using OnErrorCallback = std::function<void(const ErrorInfo&)>;

// =============================================================================
// Lambda Callback Adapter (Lambda适配器)
// =============================================================================
//
//   auto callback = LambdaCallback::create()
//       .onFinal([](const TranscriptFragment& f, const std::string& inserted) { ... })
//       .onError([](const ErrorInfo& e) { ... })
//       .build();
//

class LambdaCallback : public ISessionCallback {
public:
    class Builder {
    public:
        Builder& onStateChanged(OnStateChangedCallback cb) { on_state_ = std::move(cb); return *this; }
        Builder& onReady(OnReadyCallback cb) { on_ready_ = std::move(cb); return *this; }
        Builder& onDone(OnDoneCallback cb) { on_done_ = std::move(cb); return *this; }
        Builder& onPartial(OnPartialCallback cb) { on_partial_ = std::move(cb); return *this; }
        Builder& onFinal(OnFinalCallback cb) { on_final_ = std::move(cb); return *this; }
        Builder& onNoTarget(OnNoTargetCallback cb) { on_no_target_ = std::move(cb); return *this; }
        Builder& onError(OnErrorCallback cb) { on_error_ = std::move(cb); return *this; }
        Builder& onWarning(OnErrorCallback cb) { on_warning_ = std::move(cb); return *this; }

        std::unique_ptr<LambdaCallback> build() {
            auto cb = std::make_unique<LambdaCallback>();
            cb->on_state_ = std::move(on_state_);
            cb->on_ready_ = std::move(on_ready_);
            cb->on_done_ = std::move(on_done_);
            cb->on_partial_ = std::move(on_partial_);
            cb->on_final_ = std::move(on_final_);
            cb->on_no_target_ = std::move(on_no_target_);
            cb->on_error_ = std::move(on_error_);
            cb->on_warning_ = std::move(on_warning_);
            return cb;
        }

    private:
        OnStateChangedCallback on_state_;
        OnReadyCallback on_ready_;
        OnDoneCallback on_done_;
        OnPartialCallback on_partial_;
        OnFinalCallback on_final_;
        OnNoTargetCallback on_no_target_;
        OnErrorCallback on_error_;
        OnErrorCallback on_warning_;
    };

    static Builder create() { return Builder(); }

    void onStateChanged(ClientState from, ClientState to) override {
        if (on_state_) on_state_(from, to);
    }
    void onReady() override { if (on_ready_) on_ready_(); }
    void onDone(const SessionStats& stats, const ClientMetrics& metrics) override {
        if (on_done_) on_done_(stats, metrics);
    }
    void onPartial(const TranscriptFragment& fragment) override {
        if (on_partial_) on_partial_(fragment);
    }
    void onFinal(const TranscriptFragment& fragment, const std::string& inserted) override {
        if (on_final_) on_final_(fragment, inserted);
    }
    void onNoTarget() override { if (on_no_target_) on_no_target_(); }
    void onError(const ErrorInfo& error) override { if (on_error_) on_error_(error); }
    void onWarning(const ErrorInfo& warning) override { if (on_warning_) on_warning_(warning); }

private:
    OnStateChangedCallback on_state_;
    OnReadyCallback on_ready_;
    OnDoneCallback on_done_;
    OnPartialCallback on_partial_;
    OnFinalCallback on_final_;
    OnNoTargetCallback on_no_target_;
    OnErrorCallback on_error_;
    OnErrorCallback on_warning_;
};

// =============================================================================
// Simple Callback (记录所有事件 - 用于测试与 demo)
// =============================================================================

class SimpleCallback : public ISessionCallback {
public:
    void onStateChanged(ClientState from, ClientState to) override {
        (void)from;
        std::lock_guard<std::mutex> lock(mutex_);
        states_.push_back(to);
    }

    void onReady() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ready_ = true;
    }

    void onDone(const SessionStats& stats, const ClientMetrics& metrics) override {
        std::lock_guard<std::mutex> lock(mutex_);
        done_ = true;
        stats_ = stats;
        metrics_ = metrics;
    }

    void onPartial(const TranscriptFragment& fragment) override {
        std::lock_guard<std::mutex> lock(mutex_);
        partials_.push_back(fragment.text());
    }

    void onFinal(const TranscriptFragment& fragment, const std::string& inserted) override {
        (void)fragment;
        std::lock_guard<std::mutex> lock(mutex_);
        inserted_.push_back(inserted);
    }

    void onNoTarget() override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++no_target_count_;
    }

    void onError(const ErrorInfo& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.push_back(error);
    }

    void onWarning(const ErrorInfo& warning) override {
        std::lock_guard<std::mutex> lock(mutex_);
        warnings_.push_back(warning);
    }

    bool ready() const { std::lock_guard<std::mutex> lock(mutex_); return ready_; }
    bool done() const { std::lock_guard<std::mutex> lock(mutex_); return done_; }
    SessionStats stats() const { std::lock_guard<std::mutex> lock(mutex_); return stats_; }
    ClientMetrics metrics() const { std::lock_guard<std::mutex> lock(mutex_); return metrics_; }
    std::vector<ClientState> states() const { std::lock_guard<std::mutex> lock(mutex_); return states_; }
    std::vector<std::string> partials() const { std::lock_guard<std::mutex> lock(mutex_); return partials_; }
    std::vector<std::string> inserted() const { std::lock_guard<std::mutex> lock(mutex_); return inserted_; }
    std::vector<ErrorInfo> errors() const { std::lock_guard<std::mutex> lock(mutex_); return errors_; }
    std::vector<ErrorInfo> warnings() const { std::lock_guard<std::mutex> lock(mutex_); return warnings_; }
    int noTargetCount() const { std::lock_guard<std::mutex> lock(mutex_); return no_target_count_; }

private:
    mutable std::mutex mutex_;
    bool ready_ = false;
    bool done_ = false;
    SessionStats stats_;
    ClientMetrics metrics_;
    std::vector<ClientState> states_;
    std::vector<std::string> partials_;
    std::vector<std::string> inserted_;
    std::vector<ErrorInfo> errors_;
    std::vector<ErrorInfo> warnings_;
    int no_target_count_ = 0;
};

}  // namespace scribe

#endif  // SCRIBE_CALLBACK_HPP
