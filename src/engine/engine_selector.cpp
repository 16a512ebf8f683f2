#include "engine/engine_selector.hpp"

#include "scribe_log.hpp"

namespace scribe {
namespace engine {

namespace {

EngineKind preferredEngine(const EngineSignals& signals, ForcedEngine forced) {
    switch (forced) {
        case ForcedEngine::RELAY:   return EngineKind::RELAY;
        case ForcedEngine::BROWSER: return EngineKind::BROWSER;
        case ForcedEngine::CHUNK:   return EngineKind::CHUNK;
        default:
            break;
    }
    if (signals.relay_configured) return EngineKind::RELAY;
    if (signals.browser_supported) return EngineKind::BROWSER;
    return EngineKind::CHUNK;
}

EngineKind belowRelay(const EngineSignals& signals) {
    return signals.browser_supported && !signals.browser_error ? EngineKind::BROWSER : EngineKind::CHUNK;
}

EngineKind activeEngine(const EngineSignals& signals, ForcedEngine forced, EngineKind preferred) {
    EngineKind active = preferred;

    if (forced != ForcedEngine::AUTO) {
        if (forced == ForcedEngine::RELAY && !signals.relay_configured) {
            active = belowRelay(signals);
        } else if (forced == ForcedEngine::BROWSER && !signals.browser_supported) {
            active = EngineKind::CHUNK;
        }
    } else if (preferred == EngineKind::RELAY && signals.relay_error) {
        active = belowRelay(signals);
    }

    if (active == EngineKind::BROWSER && signals.browser_error) {
        active = EngineKind::CHUNK;
    }
    return active;
}

EngineStatus engineStatus(const EngineSignals& signals, EngineKind preferred, EngineKind active) {
    if (signals.config_loading) return EngineStatus::LOADING;
    if (!signals.recording) return EngineStatus::IDLE;
    if (active != preferred) return EngineStatus::FALLBACK;

    switch (active) {
        case EngineKind::RELAY:
            if (signals.relay_connecting) return EngineStatus::CONNECTING;
            if (signals.relay_ready) return EngineStatus::READY;
            if (signals.relay_error) return EngineStatus::ERROR;
            return EngineStatus::CONNECTING;
        case EngineKind::BROWSER:
            return signals.browser_listening ? EngineStatus::READY : EngineStatus::CONNECTING;
        case EngineKind::CHUNK:
        default:
            return EngineStatus::READY;
    }
}

std::string engineStateLabel(const EngineSignals& signals, EngineKind active, EngineStatus status) {
    if (signals.config_loading) {
        return "Engine: Loading config...";
    }
    std::string label = std::string("Engine: ") + engineLabel(active);
    if (status == EngineStatus::CONNECTING) {
        label += " (connecting...)";
    } else if (status == EngineStatus::FALLBACK) {
        label += " [fallback]";
    }
    return label;
}

std::string fallbackWarning(const EngineSignals& signals, EngineKind preferred, EngineKind active) {
    if (preferred == EngineKind::RELAY) {
        const bool unreachable = signals.relay_error || signals.relay_configured;
        if (active == EngineKind::BROWSER) {
            return unreachable ? "Relay unreachable, falling back to Browser STT"
                               : "Relay not configured, using Browser STT";
        }
        return unreachable ? "Relay unreachable, falling back to chunked backend"
                           : "Relay not configured, using chunked backend";
    }
    if (preferred == EngineKind::BROWSER) {
        return "Browser STT unavailable, falling back to chunked backend";
    }
    return "";
}

}  // namespace

const char* engineLabel(EngineKind kind) {
    switch (kind) {
        case EngineKind::RELAY:   return "Deepgram (relay)";
        case EngineKind::BROWSER: return "Browser STT";
        case EngineKind::CHUNK:   return "Chunked backend";
        default:                  return "Unknown";
    }
}

int engineRank(EngineKind kind) {
    switch (kind) {
        case EngineKind::RELAY:   return 0;
        case EngineKind::BROWSER: return 1;
        case EngineKind::CHUNK:
        default:                  return 2;
    }
}

// =============================================================================
// Pure computation
// =============================================================================

EngineState EngineSelector::compute(const EngineSignals& signals, ForcedEngine forced) {
    EngineState state;
    state.preferred = preferredEngine(signals, forced);
    state.active = activeEngine(signals, forced, state.preferred);
    state.status = engineStatus(signals, state.preferred, state.active);
    state.label = engineStateLabel(signals, state.active, state.status);
    state.debug_forced = forced != ForcedEngine::AUTO;
    state.config_loading = signals.config_loading;

    if (signals.recording && state.active != state.preferred) {
        state.did_fallback = true;
        state.fallback_warning = fallbackWarning(signals, state.preferred, state.active);
    }
    return state;
}

// =============================================================================
// EngineSelector
// =============================================================================

EngineSelector::EngineSelector(EngineSelectorConfig config)
    : config_(config)
    , state_(compute(EngineSignals(), config.forced)) {
}

EngineState EngineSelector::update(const EngineSignals& signals) {
    EngineState next;
    Listener listener;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        signals_ = signals;
        // 录音结束: 下一次录音重新评估
        if (!signals_.recording) {
            latched_.reset();
        }
        next = recompute(changed);
        listener = listener_;
    }
    if (changed && listener) listener(next);
    return next;
}

EngineState EngineSelector::reportFailure(EngineKind kind) {
    EngineState next;
    Listener listener;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (kind) {
            case EngineKind::RELAY:
                signals_.relay_error = true;
                signals_.relay_connecting = false;
                signals_.relay_ready = false;
                break;
            case EngineKind::BROWSER:
                signals_.browser_error = true;
                signals_.browser_listening = false;
                break;
            case EngineKind::CHUNK:
                // 最后一级, 没有可降级的引擎
                break;
        }
        next = recompute(changed);
        listener = listener_;
    }
    if (changed && listener) listener(next);
    return next;
}

void EngineSelector::beginSession() {
    EngineState next;
    Listener listener;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        latched_.reset();
        signals_.relay_error = false;
        signals_.browser_error = false;
        next = recompute(changed);
        listener = listener_;
    }
    if (changed && listener) listener(next);
}

EngineState EngineSelector::recompute(bool& changed) {
    EngineState next = compute(signals_, config_.forced);

    if (signals_.recording) {
        if (latched_ && engineRank(*latched_) > engineRank(next.active)) {
            // 不在会话中途回升
            next.active = *latched_;
            next.status = engineStatus(signals_, next.preferred, next.active);
            next.label = engineStateLabel(signals_, next.active, next.status);
            next.did_fallback = next.active != next.preferred;
            next.fallback_warning = next.did_fallback
                ? fallbackWarning(signals_, next.preferred, next.active) : "";
        }
        latched_ = next.active;
    }

    changed = next != state_;
    if (!next.fallback_warning.empty() && next.fallback_warning != state_.fallback_warning) {
        safeWarn("EngineSelector", next.fallback_warning);
    }
    if (changed) {
        debugLog("EngineSelector", next.label, " (", engineStatusToString(next.status), ")");
    }
    state_ = next;
    return next;
}

EngineState EngineSelector::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

EngineSignals EngineSelector::signals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return signals_;
}

void EngineSelector::setListener(Listener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

}  // namespace engine
}  // namespace scribe
