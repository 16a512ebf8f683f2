#ifndef SCRIBE_SUMMARY_SUMMARY_THROTTLER_HPP
#define SCRIBE_SUMMARY_SUMMARY_THROTTLER_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "../scribe_config.hpp"
#include "../scribe_types.hpp"
#include "summary_service.hpp"

namespace scribe {
namespace summary {

struct SummaryDiagnostics {
    bool in_flight = false;
    bool scheduled = false;
    uint64_t call_count = 0;
    uint64_t failure_count = 0;
    ErrorCode last_error_code = ErrorCode::OK;
    std::string last_error;
    int64_t last_call_at_ms = 0;            // unix 毫秒, 0 表示从未调用
    size_t last_summarized_length = 0;
};

// =============================================================================
// Summary Throttler (摘要节流 - 单飞, 不阻塞音频路径)
// =============================================================================
//
// 触发条件:
//   - 新增长度 >= min_delta_chars 且当前没有进行中的调用
//   - 距上次调用不足 debounce_ms 时延后到剩余时间, 已有定时则原地重排
//   - 去空白后的增量 >= min_trimmed_delta_chars
//
// 调用在独立 worker 线程执行, 无论成功失败都会清除 in-flight。
// 失败只记录在诊断信息中, 不影响转写。
//

class SummaryThrottler {
public:
    using SummaryCallback = std::function<void(const std::string& summary)>;
    using FailureCallback = std::function<void(const ErrorInfo& error)>;

    SummaryThrottler(SummaryConfig config, std::shared_ptr<ISummaryService> service);
    ~SummaryThrottler();

    SummaryThrottler(const SummaryThrottler&) = delete;
    SummaryThrottler& operator=(const SummaryThrottler&) = delete;

    /// @brief 回调在 worker 线程中调用
    void setCallback(SummaryCallback on_summary, FailureCallback on_failure = nullptr);

    /// @brief 新的最终文本到达 (不阻塞)
    void onTranscriptDelta(const std::string& full_transcript);

    /// @brief 停止录音后的最终摘要, 不受 debounce 限制
    void requestFinal(const std::string& full_transcript);

    /// @brief 丢弃摘要与计数 (新的 encounter)
    void reset();

    /// @brief 取消定时并等待 worker 退出 (进行中的请求受超时限制)
    void shutdown();

    std::string runningSummary() const;
    SummaryDiagnostics diagnostics() const;
    bool inFlight() const;

private:
    using Clock = std::chrono::steady_clock;

    void workerLoop();
    bool takeDueCall(std::unique_lock<std::mutex>& lock, std::string& transcript);
    void runCall(const std::string& transcript, uint64_t epoch);

    SummaryConfig config_;
    std::shared_ptr<ISummaryService> service_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    SummaryCallback on_summary_;
    FailureCallback on_failure_;

    std::string latest_transcript_;
    std::string running_summary_;
    std::optional<Clock::time_point> scheduled_at_;
    std::optional<Clock::time_point> last_call_at_;
    size_t last_summarized_length_ = 0;
    bool final_requested_ = false;
    bool in_flight_ = false;
    bool shutting_down_ = false;
    uint64_t epoch_ = 0;
    SummaryDiagnostics diagnostics_;

    std::thread worker_;
};

}  // namespace summary
}  // namespace scribe

#endif  // SCRIBE_SUMMARY_SUMMARY_THROTTLER_HPP
