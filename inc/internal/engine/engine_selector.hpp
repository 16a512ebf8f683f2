#ifndef SCRIBE_ENGINE_ENGINE_SELECTOR_HPP
#define SCRIBE_ENGINE_ENGINE_SELECTOR_HPP

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "../scribe_config.hpp"
#include "../scribe_types.hpp"

namespace scribe {
namespace engine {

// =============================================================================
// Engine Signals (引擎选择的输入信号)
// =============================================================================

struct EngineSignals {
    bool config_loading = false;
    bool recording = false;

    bool relay_configured = false;
    bool relay_connecting = false;
    bool relay_ready = false;
    bool relay_error = false;

    bool browser_supported = false;
    bool browser_listening = false;
    bool browser_error = false;
};

// =============================================================================
// Engine State (每次信号变化时重新计算, 不跨会话保存)
// =============================================================================

struct EngineState {
    EngineKind preferred = EngineKind::CHUNK;
    EngineKind active = EngineKind::CHUNK;
    EngineStatus status = EngineStatus::IDLE;
    std::string label;
    bool did_fallback = false;
    std::string fallback_warning;
    bool debug_forced = false;
    bool config_loading = false;

    bool operator==(const EngineState& other) const {
        return preferred == other.preferred && active == other.active &&
            status == other.status && label == other.label &&
            did_fallback == other.did_fallback && fallback_warning == other.fallback_warning;
    }
    bool operator!=(const EngineState& other) const { return !(*this == other); }
};

/// @brief "Deepgram (relay)" / "Browser STT" / "Chunked backend"
const char* engineLabel(EngineKind kind);

/// @brief 降级顺序: relay(0) > browser(1) > chunk(2)
int engineRank(EngineKind kind);

// =============================================================================
// Engine Selector
// =============================================================================
//
// 自动模式优先级: relay (已配置) > browser (宿主支持) > chunk。
// 录音期间降级是单向的: 到达过的最低引擎保持不变, 停止录音或
// beginSession() 后重新评估。
//

class EngineSelector {
public:
    using Listener = std::function<void(const EngineState&)>;

    explicit EngineSelector(EngineSelectorConfig config = EngineSelectorConfig());

    /// @brief 用新信号重新计算, 状态变化时通知 listener
    EngineState update(const EngineSignals& signals);

    /// @brief 标记某个引擎在本次录音中失败并重新计算
    EngineState reportFailure(EngineKind kind);

    /// @brief 新会话: 清除降级锁存与失败记录
    void beginSession();

    EngineState state() const;
    EngineSignals signals() const;
    const EngineSelectorConfig& config() const { return config_; }

    void setListener(Listener listener);

    /// @brief 不含锁存的纯计算
    static EngineState compute(const EngineSignals& signals, ForcedEngine forced);

private:
    /// @brief 调用者持有 mutex_
    EngineState recompute(bool& changed);

    EngineSelectorConfig config_;
    mutable std::mutex mutex_;
    EngineSignals signals_;
    EngineState state_;
    std::optional<EngineKind> latched_;
    Listener listener_;
};

}  // namespace engine
}  // namespace scribe

#endif  // SCRIBE_ENGINE_ENGINE_SELECTOR_HPP
