#include "audio/microphone_arbiter.hpp"

#include <chrono>

#include "scribe_log.hpp"

namespace scribe {
namespace audio {

// =============================================================================
// Lease
// =============================================================================

MicrophoneArbiter::Lease& MicrophoneArbiter::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        arbiter_ = other.arbiter_;
        id_ = other.id_;
        other.arbiter_ = nullptr;
        other.id_ = 0;
    }
    return *this;
}

void MicrophoneArbiter::Lease::release() {
    if (arbiter_) {
        arbiter_->release(id_);
        arbiter_ = nullptr;
        id_ = 0;
    }
}

// =============================================================================
// MicrophoneArbiter
// =============================================================================

MicrophoneArbiter& MicrophoneArbiter::instance() {
    static MicrophoneArbiter arbiter;
    return arbiter;
}

ErrorInfo MicrophoneArbiter::acquire(const std::string& owner, RevokeHook revoke,
        Lease& lease, int wait_ms) {
    lease.release();

    std::unique_lock<std::mutex> lock(mutex_);
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(wait_ms);

    while (active_id_ != 0) {
        const uint64_t previous = active_id_;
        RevokeHook hook = revoke_;
        std::string previous_owner = owner_;

        // hook 会回调 release(), 必须在锁外调用
        lock.unlock();
        safeLog("MicArbiter", "Revoking microphone from ", previous_owner, " for ", owner);
        if (hook) {
            hook();
        }
        lock.lock();

        if (!released_.wait_until(lock, deadline, [&] { return active_id_ != previous; })) {
            safeWarn("MicArbiter", "Previous recorder did not release the microphone in time");
            return ErrorInfo::error(ErrorCode::DEVICE_BUSY,
                "Microphone is in use by another recorder", previous_owner);
        }
    }

    active_id_ = next_id_++;
    owner_ = owner;
    revoke_ = std::move(revoke);
    lease = Lease(this, active_id_);
    debugLog("MicArbiter", "Lease ", active_id_, " granted to ", owner);
    return ErrorInfo::ok();
}

void MicrophoneArbiter::release(uint64_t id) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (id == 0 || id != active_id_) {
            return;
        }
        active_id_ = 0;
        owner_.clear();
        revoke_ = nullptr;
    }
    released_.notify_all();
}

bool MicrophoneArbiter::isHeld() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_id_ != 0;
}

std::string MicrophoneArbiter::holder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return owner_;
}

}  // namespace audio
}  // namespace scribe
