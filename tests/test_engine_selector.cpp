// Tests for engine preference, fallback latching and labels

#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>
#include <vector>

#include "engine/engine_selector.hpp"
#include "scribe_config.hpp"

using namespace scribe;
using namespace scribe::engine;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

EngineSignals recordingWithRelay() {
    EngineSignals s;
    s.recording = true;
    s.relay_configured = true;
    s.browser_supported = true;
    return s;
}

}  // namespace

// ============================================================================
// Pure computation
// ============================================================================

void test_idle_prefers_relay() {
    EngineSignals s;
    s.relay_configured = true;
    auto state = EngineSelector::compute(s, ForcedEngine::AUTO);
    assert(state.preferred == EngineKind::RELAY);
    assert(state.active == EngineKind::RELAY);
    assert(state.status == EngineStatus::IDLE);
    assert(state.label == "Engine: Deepgram (relay)");
    assert(!state.did_fallback);
    assert(!state.debug_forced);
    test_passed("idle prefers relay");
}

void test_loading_label() {
    EngineSignals s;
    s.config_loading = true;
    s.recording = true;
    auto state = EngineSelector::compute(s, ForcedEngine::AUTO);
    assert(state.status == EngineStatus::LOADING);
    assert(state.label == "Engine: Loading config...");
    assert(state.config_loading);
    test_passed("loading label");
}

void test_relay_connecting_and_ready() {
    auto s = recordingWithRelay();
    s.relay_connecting = true;
    auto state = EngineSelector::compute(s, ForcedEngine::AUTO);
    assert(state.status == EngineStatus::CONNECTING);
    assert(state.label == "Engine: Deepgram (relay) (connecting...)");

    s.relay_connecting = false;
    s.relay_ready = true;
    state = EngineSelector::compute(s, ForcedEngine::AUTO);
    assert(state.status == EngineStatus::READY);
    assert(state.label == "Engine: Deepgram (relay)");
    test_passed("relay connecting and ready");
}

void test_relay_error_falls_back_to_browser() {
    auto s = recordingWithRelay();
    s.relay_error = true;
    auto state = EngineSelector::compute(s, ForcedEngine::AUTO);
    assert(state.preferred == EngineKind::RELAY);
    assert(state.active == EngineKind::BROWSER);
    assert(state.status == EngineStatus::FALLBACK);
    assert(state.did_fallback);
    assert(state.fallback_warning == "Relay unreachable, falling back to Browser STT");
    assert(state.label == "Engine: Browser STT [fallback]");

    s.browser_supported = false;
    state = EngineSelector::compute(s, ForcedEngine::AUTO);
    assert(state.active == EngineKind::CHUNK);
    assert(state.fallback_warning == "Relay unreachable, falling back to chunked backend");
    test_passed("relay error falls back to browser");
}

void test_no_relay_no_browser_uses_chunk() {
    EngineSignals s;
    s.recording = true;
    auto state = EngineSelector::compute(s, ForcedEngine::AUTO);
    assert(state.preferred == EngineKind::CHUNK);
    assert(state.active == EngineKind::CHUNK);
    assert(state.status == EngineStatus::READY);
    assert(!state.did_fallback);
    assert(state.fallback_warning.empty());
    test_passed("no relay no browser uses chunk");
}

void test_forced_relay_without_config() {
    EngineSignals s;
    s.recording = true;
    auto state = EngineSelector::compute(s, ForcedEngine::RELAY);
    assert(state.preferred == EngineKind::RELAY);
    assert(state.active == EngineKind::CHUNK);
    assert(state.debug_forced);
    assert(state.fallback_warning == "Relay not configured, using chunked backend");

    state = EngineSelector::compute(recordingWithRelay(), ForcedEngine::CHUNK);
    assert(state.preferred == EngineKind::CHUNK);
    assert(state.active == EngineKind::CHUNK);
    assert(!state.did_fallback);
    test_passed("forced relay without config");
}

// ============================================================================
// Stateful selector
// ============================================================================

void test_fallback_latched_during_recording() {
    EngineSelector selector;
    auto s = recordingWithRelay();
    s.relay_error = true;
    auto state = selector.update(s);
    assert(state.active == EngineKind::BROWSER);

    // relay 恢复, 录音期间不回升
    s.relay_error = false;
    s.relay_ready = true;
    state = selector.update(s);
    assert(state.active == EngineKind::BROWSER);
    assert(state.did_fallback);

    // 停止录音后重新评估
    s.recording = false;
    state = selector.update(s);
    assert(state.active == EngineKind::RELAY);
    assert(state.status == EngineStatus::IDLE);
    test_passed("fallback latched during recording");
}

void test_report_failure_chain() {
    EngineSelector selector;
    auto state = selector.update(recordingWithRelay());
    assert(state.active == EngineKind::RELAY);
    assert(state.status == EngineStatus::CONNECTING);

    state = selector.reportFailure(EngineKind::RELAY);
    assert(state.active == EngineKind::BROWSER);
    assert(selector.signals().relay_error);

    state = selector.reportFailure(EngineKind::BROWSER);
    assert(state.active == EngineKind::CHUNK);
    assert(state.status == EngineStatus::FALLBACK);
    assert(state.fallback_warning == "Relay unreachable, falling back to chunked backend");

    // 最后一级失败不改变选择
    state = selector.reportFailure(EngineKind::CHUNK);
    assert(state.active == EngineKind::CHUNK);

    selector.beginSession();
    state = selector.state();
    assert(state.active == EngineKind::RELAY);
    assert(!state.did_fallback);
    assert(!selector.signals().relay_error);
    test_passed("report failure chain");
}

void test_listener_only_on_change() {
    EngineSelector selector;
    std::vector<EngineState> seen;
    selector.setListener([&seen](const EngineState& state) { seen.push_back(state); });

    auto s = recordingWithRelay();
    s.relay_connecting = true;
    selector.update(s);
    selector.update(s);
    assert(seen.size() == 1);
    assert(seen[0].status == EngineStatus::CONNECTING);

    s.relay_connecting = false;
    s.relay_ready = true;
    selector.update(s);
    assert(seen.size() == 2);
    assert(seen[1].status == EngineStatus::READY);
    test_passed("listener only on change");
}

void test_forced_selector_config() {
    EngineSelector selector(EngineSelectorConfig().withForced(ForcedEngine::CHUNK));
    assert(selector.config().isForced());
    auto state = selector.update(recordingWithRelay());
    assert(state.active == EngineKind::CHUNK);
    assert(state.debug_forced);
    test_passed("forced selector config");
}

void test_parse_forced_engine() {
    assert(parseForcedEngine("relay") == ForcedEngine::RELAY);
    assert(parseForcedEngine("deepgram") == ForcedEngine::RELAY);
    assert(parseForcedEngine("browser") == ForcedEngine::BROWSER);
    assert(parseForcedEngine("chunk") == ForcedEngine::CHUNK);
    assert(parseForcedEngine("auto") == ForcedEngine::AUTO);
    assert(parseForcedEngine("whisper") == ForcedEngine::AUTO);
    assert(std::string(forcedEngineToString(ForcedEngine::BROWSER)) == "browser");

    setenv("SCRIBE_FORCE_ENGINE", "chunk", 1);
    assert(EngineSelectorConfig::fromEnvironment().forced == ForcedEngine::CHUNK);
    unsetenv("SCRIBE_FORCE_ENGINE");
    assert(EngineSelectorConfig::fromEnvironment().forced == ForcedEngine::AUTO);
    test_passed("parse forced engine");
}

void test_engine_rank_and_labels() {
    assert(engineRank(EngineKind::RELAY) < engineRank(EngineKind::BROWSER));
    assert(engineRank(EngineKind::BROWSER) < engineRank(EngineKind::CHUNK));
    assert(std::string(engineLabel(EngineKind::CHUNK)) == "Chunked backend");
    test_passed("engine rank and labels");
}

int main() {
    std::cout << "=== Engine Selector Tests ===" << std::endl;

    test_idle_prefers_relay();
    test_loading_label();
    test_relay_connecting_and_ready();
    test_relay_error_falls_back_to_browser();
    test_no_relay_no_browser_uses_chunk();
    test_forced_relay_without_config();
    test_fallback_latched_during_recording();
    test_report_failure_chain();
    test_listener_only_on_change();
    test_forced_selector_config();
    test_parse_forced_engine();
    test_engine_rank_and_labels();

    std::cout << "All engine selector tests passed" << std::endl;
    return 0;
}
