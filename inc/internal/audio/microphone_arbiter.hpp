#ifndef SCRIBE_AUDIO_MICROPHONE_ARBITER_HPP
#define SCRIBE_AUDIO_MICROPHONE_ARBITER_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

#include "../scribe_types.hpp"

namespace scribe {
namespace audio {

// =============================================================================
// Microphone Arbiter (麦克风独占仲裁)
// =============================================================================
//
// 全局只有一个 "active recorder" 槽位。新的采集管线获取 Lease 前,
// 先调用上一个持有者的 revoke hook (同步停止其管线), 再在限定时间内
// 等待其释放。Lease 析构时自动释放。
//

class MicrophoneArbiter {
public:
    using RevokeHook = std::function<void()>;

    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(Lease&& other) noexcept { *this = std::move(other); }
        Lease& operator=(Lease&& other) noexcept;

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        bool valid() const { return arbiter_ != nullptr; }
        uint64_t id() const { return id_; }

        /// @brief 提前释放 (幂等)
        void release();

    private:
        friend class MicrophoneArbiter;
        Lease(MicrophoneArbiter* arbiter, uint64_t id) : arbiter_(arbiter), id_(id) {}

        MicrophoneArbiter* arbiter_ = nullptr;
        uint64_t id_ = 0;
    };

    MicrophoneArbiter() = default;
    MicrophoneArbiter(const MicrophoneArbiter&) = delete;
    MicrophoneArbiter& operator=(const MicrophoneArbiter&) = delete;

    /// @brief 进程级实例
    static MicrophoneArbiter& instance();

    /// @brief 获取麦克风
    /// @param owner 持有者名称 (仅用于日志)
    /// @param revoke 被抢占时调用, 须同步停止采集并释放 Lease
    /// @param lease [out] 成功时有效
    /// @param wait_ms 等待上一个持有者释放的上限
    /// @return DEVICE_BUSY 表示上一个持有者未在限定时间内释放
    ErrorInfo acquire(const std::string& owner, RevokeHook revoke, Lease& lease, int wait_ms = 2000);

    bool isHeld() const;
    std::string holder() const;

private:
    void release(uint64_t id);

    mutable std::mutex mutex_;
    std::condition_variable released_;
    uint64_t active_id_ = 0;        // 0 = 空闲
    uint64_t next_id_ = 1;
    std::string owner_;
    RevokeHook revoke_;
};

}  // namespace audio
}  // namespace scribe

#endif  // SCRIBE_AUDIO_MICROPHONE_ARBITER_HPP
