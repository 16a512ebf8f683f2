// Tests for the live dictation session: engine choice, fallback chain,
// pause / resume and running summary

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "audio/audio_source.hpp"
#include "audio/microphone_arbiter.hpp"
#include "live_session.hpp"
#include "protocol/control_messages.hpp"

using namespace scribe;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

bool waitFor(const std::function<bool()>& predicate, int timeout_ms = 3000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// ----------------------------------------------------------------------------
// relay transport
// ----------------------------------------------------------------------------

class ScriptedRelay {
public:
    void attach(client::TransportHandlers handlers) {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_ = std::move(handlers);
        ++connects_;
    }

    void open() { handlers().on_open(); }
    void text(const std::string& message) { handlers().on_text(message); }

    bool record(const std::string& message) {
        std::lock_guard<std::mutex> lock(mutex_);
        texts_.push_back(message);
        return true;
    }

    int connects() const { std::lock_guard<std::mutex> lock(mutex_); return connects_; }

    bool authSent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& t : texts_) {
            auto message = protocol::parseClientMessage(t);
            if (message && message->type == protocol::ClientMessageType::AUTH) return true;
        }
        return false;
    }

    std::atomic<size_t> audio_bytes{0};

private:
    client::TransportHandlers handlers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_;
    }

    mutable std::mutex mutex_;
    client::TransportHandlers handlers_;
    int connects_ = 0;
    std::vector<std::string> texts_;
};

class ScriptedTransport : public client::IRelayTransport {
public:
    explicit ScriptedTransport(std::shared_ptr<ScriptedRelay> relay) : relay_(std::move(relay)) {}

    void connect(client::TransportHandlers handlers) override { relay_->attach(std::move(handlers)); }
    bool sendText(const std::string& text) override { return relay_->record(text); }
    bool sendBinary(std::vector<uint8_t> data) override {
        relay_->audio_bytes += data.size();
        return true;
    }
    void close(int code) override { (void)code; }
    void abort() override {}
    bool isOpen() const override { return true; }

private:
    std::shared_ptr<ScriptedRelay> relay_;
};

// 连接立即失败
class UnreachableTransport : public client::IRelayTransport {
public:
    void connect(client::TransportHandlers handlers) override {
        handlers.on_error("connect: Connection refused");
    }
    bool sendText(const std::string&) override { return false; }
    bool sendBinary(std::vector<uint8_t>) override { return false; }
    void close(int) override {}
    void abort() override {}
    bool isOpen() const override { return false; }
};

client::RelayTransportFactory unreachableFactory() {
    return [](const ClientConfig&) -> std::unique_ptr<client::IRelayTransport> {
        return std::make_unique<UnreachableTransport>();
    };
}

// ----------------------------------------------------------------------------
// 其他引擎与服务
// ----------------------------------------------------------------------------

class FakeRecognizer : public engine::IPlatformRecognizer {
public:
    explicit FakeRecognizer(bool supported = true) : supported_(supported) {}

    bool isSupported() const override { return supported_; }

    ErrorInfo start(engine::PlatformRecognizerHandlers handlers) override {
        std::lock_guard<std::mutex> lock(mutex_);
        handlers_ = std::move(handlers);
        ++starts_;
        listening_ = true;
        return ErrorInfo::ok();
    }

    void stop() override {
        std::lock_guard<std::mutex> lock(mutex_);
        listening_ = false;
    }

    void emit(const std::string& text, bool is_final) {
        auto h = handlers();
        if (h.on_result) h.on_result(text, is_final);
    }

    void fail(const ErrorInfo& error) {
        auto h = handlers();
        if (h.on_error) h.on_error(error);
    }

    int starts() const { std::lock_guard<std::mutex> lock(mutex_); return starts_; }
    bool listening() const { std::lock_guard<std::mutex> lock(mutex_); return listening_; }

private:
    engine::PlatformRecognizerHandlers handlers() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return handlers_;
    }

    bool supported_;
    mutable std::mutex mutex_;
    engine::PlatformRecognizerHandlers handlers_;
    int starts_ = 0;
    bool listening_ = false;
};

class FakeTranscriber : public engine::IChunkTranscriber {
public:
    explicit FakeTranscriber(std::string reply) : reply_(std::move(reply)) {}

    ErrorInfo transcribe(const engine::ChunkRequest& request, std::string& text) override {
        (void)request;
        ++calls;
        text = reply_;
        return ErrorInfo::ok();
    }

    std::atomic<int> calls{0};

private:
    std::string reply_;
};

class FakeSummaryService : public summary::ISummaryService {
public:
    ErrorInfo summarize(const summary::SummaryRequest& request, std::string& summary) override {
        (void)request;
        summary = "summary " + std::to_string(++calls);
        return ErrorInfo::ok();
    }

    std::atomic<int> calls{0};
};

// ----------------------------------------------------------------------------
// listener
// ----------------------------------------------------------------------------

class RecordingListener : public ILiveSessionListener {
public:
    void onOpen(EngineKind engine) override {
        std::lock_guard<std::mutex> lock(mutex_);
        opens_.push_back(engine);
    }

    void onFinal(const std::string& text, const std::string& inserted) override {
        (void)text;
        std::lock_guard<std::mutex> lock(mutex_);
        inserted_.push_back(inserted);
    }

    void onSummary(const std::string& summary) override {
        std::lock_guard<std::mutex> lock(mutex_);
        summaries_.push_back(summary);
    }

    void onNoTarget() override { ++no_target; }

    void onError(const ErrorInfo& error) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.push_back(error);
    }

    void onClose(const SessionStats& stats) override {
        (void)stats;
        ++closes;
    }

    bool hasFocusedTarget() override { return focused.load(); }

    std::vector<EngineKind> opens() const { std::lock_guard<std::mutex> lock(mutex_); return opens_; }
    std::vector<std::string> inserted() const { std::lock_guard<std::mutex> lock(mutex_); return inserted_; }
    std::vector<std::string> summaries() const { std::lock_guard<std::mutex> lock(mutex_); return summaries_; }
    std::vector<ErrorInfo> errors() const { std::lock_guard<std::mutex> lock(mutex_); return errors_; }

    bool opened(EngineKind engine) const {
        for (auto e : opens()) {
            if (e == engine) return true;
        }
        return false;
    }

    std::atomic<bool> focused{true};
    std::atomic<int> no_target{0};
    std::atomic<int> closes{0};

private:
    mutable std::mutex mutex_;
    std::vector<EngineKind> opens_;
    std::vector<std::string> inserted_;
    std::vector<std::string> summaries_;
    std::vector<ErrorInfo> errors_;
};

LiveSessionConfig relayConfigured() {
    LiveSessionConfig config;
    config.client = ClientConfig::lowLatency("relay.test", "8080", "good-token").withTimeouts(2000, 300);
    config.chunk = ChunkConfig::dictation();
    config.chunk.chunk_ms = 1000;
    config.chunk.request_timeout_ms = 2000;
    return config;
}

LiveSessionConfig relayNotConfigured() {
    LiveSessionConfig config = relayConfigured();
    config.client.access_token.clear();
    return config;
}

LiveSessionDeps baseDeps(audio::MicrophoneArbiter& arbiter) {
    LiveSessionDeps deps;
    deps.arbiter = &arbiter;
    deps.source_factory = []() -> std::unique_ptr<audio::IAudioSource> {
        return std::make_unique<audio::SyntheticAudioSource>(48000, 1);
    };
    deps.transcriber = std::make_shared<FakeTranscriber>("chunked text");
    return deps;
}

}  // namespace

// ============================================================================
// Engine selection
// ============================================================================

void test_relay_session() {
    audio::MicrophoneArbiter arbiter;
    auto relay = std::make_shared<ScriptedRelay>();
    LiveSessionDeps deps = baseDeps(arbiter);
    deps.transport_factory = [relay](const ClientConfig&) -> std::unique_ptr<client::IRelayTransport> {
        return std::make_unique<ScriptedTransport>(relay);
    };

    LiveSession session(relayConfigured(), deps);
    auto listener = std::make_shared<RecordingListener>();
    session.setListener(listener);
    assert(session.engineState().preferred == EngineKind::RELAY);

    assert(session.start().isOk());
    assert(session.isRecording());
    assert(session.start().code == ErrorCode::ALREADY_STARTED);
    assert(arbiter.isHeld());

    assert(waitFor([&] { return relay->connects() == 1; }));
    relay->open();
    assert(waitFor([&] { return relay->authSent(); }));
    relay->text(protocol::makeReadyMessage());
    assert(waitFor([&] { return listener->opened(EngineKind::RELAY); }));
    assert(waitFor([&] { return session.engineState().status == EngineStatus::READY; }));

    // 采集到的音频经 relay 发送
    assert(waitFor([&] { return relay->audio_bytes.load() > 0; }));

    relay->text(protocol::makeFinalMessage("patient reports chest pain", true));
    assert(waitFor([&] { return listener->inserted().size() == 1; }));
    assert(listener->inserted()[0] == "patient reports chest pain ");
    assert(session.transcript() == "patient reports chest pain ");

    assert(session.stop().isOk());
    assert(!session.isRecording());
    assert(!arbiter.isHeld());
    assert(listener->closes == 1);
    assert(listener->errors().empty());
    test_passed("relay session");
}

void test_fallback_chain() {
    audio::MicrophoneArbiter arbiter;
    auto recognizer = std::make_shared<FakeRecognizer>();
    LiveSessionDeps deps = baseDeps(arbiter);
    deps.transport_factory = unreachableFactory();
    deps.recognizer = recognizer;

    LiveSession session(relayConfigured(), deps);
    auto listener = std::make_shared<RecordingListener>();
    session.setListener(listener);

    assert(session.start().isOk());
    assert(waitFor([&] { return listener->opened(EngineKind::BROWSER); }));
    assert(recognizer->starts() == 1);

    auto state = session.engineState();
    assert(state.active == EngineKind::BROWSER);
    assert(state.did_fallback);
    assert(state.fallback_warning == "Relay unreachable, falling back to Browser STT");
    assert(!arbiter.isHeld());

    recognizer->emit("heart", false);
    recognizer->emit("heart rate 72", true);
    assert(waitFor([&] { return listener->inserted().size() == 1; }));
    assert(session.transcript() == "heart rate 72 ");

    // 平台识别也失败, 继续降级到分块上传, 文本保留
    recognizer->fail(ErrorInfo::error(ErrorCode::AUDIO_DEVICE_ERROR, "not-allowed"));
    assert(waitFor([&] { return listener->opened(EngineKind::CHUNK); }));
    assert(!recognizer->listening());
    assert(session.engineState().active == EngineKind::CHUNK);
    assert(waitFor([&] { return arbiter.isHeld(); }));
    assert(session.transcript() == "heart rate 72 ");

    assert(waitFor([&] { return listener->inserted().size() >= 2; }, 4000));
    assert(session.transcript() == "heart rate 72 chunked text ");

    assert(session.stop().isOk());
    assert(listener->errors().empty());
    assert(!arbiter.isHeld());
    test_passed("fallback chain");
}

void test_chunk_only_with_summary() {
    audio::MicrophoneArbiter arbiter;
    auto summaries = std::make_shared<FakeSummaryService>();
    LiveSessionDeps deps = baseDeps(arbiter);
    deps.transcriber = std::make_shared<FakeTranscriber>(
        "patient is a 54 year old male presenting with intermittent chest pain radiating to the left arm "
        "for the past two days");
    deps.summary_service = summaries;

    LiveSession session(relayNotConfigured(), deps);
    auto listener = std::make_shared<RecordingListener>();
    session.setListener(listener);
    assert(session.engineState().preferred == EngineKind::CHUNK);

    assert(session.start().isOk());
    assert(waitFor([&] { return listener->opened(EngineKind::CHUNK); }));
    assert(waitFor([&] { return listener->summaries().size() == 1; }, 4000));
    assert(listener->summaries()[0] == "summary 1");
    assert(session.runningSummary() == "summary 1");

    assert(session.stop().isOk());
    assert(!session.runningSummary().empty());

    // 新的录音清空文本与摘要
    assert(session.start().isOk());
    assert(session.transcript().empty());
    assert(session.runningSummary().empty());
    assert(session.stop().isOk());
    test_passed("chunk only with summary");
}

void test_forced_engine() {
    audio::MicrophoneArbiter arbiter;
    LiveSessionDeps deps = baseDeps(arbiter);
    deps.transport_factory = unreachableFactory();

    LiveSessionConfig config = relayConfigured();
    config.selector = EngineSelectorConfig().withForced(ForcedEngine::CHUNK);
    LiveSession session(config, deps);
    auto listener = std::make_shared<RecordingListener>();
    session.setListener(listener);

    assert(session.start().isOk());
    assert(waitFor([&] { return listener->opened(EngineKind::CHUNK); }));
    assert(!listener->opened(EngineKind::RELAY));
    assert(session.engineState().debug_forced);
    assert(session.stop().isOk());
    test_passed("forced engine");
}

void test_device_error_does_not_fall_back() {
    audio::MicrophoneArbiter arbiter;
    auto recognizer = std::make_shared<FakeRecognizer>();
    LiveSessionDeps deps = baseDeps(arbiter);
    deps.recognizer = recognizer;
    deps.source_factory = []() -> std::unique_ptr<audio::IAudioSource> { return nullptr; };

    LiveSession session(relayConfigured(), deps);
    auto result = session.start();
    assert(result.code == ErrorCode::NO_INPUT_DEVICE);
    assert(!session.isRecording());
    assert(recognizer->starts() == 0);
    assert(!session.engineState().did_fallback);
    test_passed("device error does not fall back");
}

// ============================================================================
// Pause / resume and text handling
// ============================================================================

void test_pause_and_resume() {
    audio::MicrophoneArbiter arbiter;
    auto recognizer = std::make_shared<FakeRecognizer>();
    LiveSessionDeps deps = baseDeps(arbiter);
    deps.recognizer = recognizer;

    LiveSession session(relayNotConfigured(), deps);
    auto listener = std::make_shared<RecordingListener>();
    session.setListener(listener);

    assert(session.pause().code == ErrorCode::NOT_STARTED);
    assert(session.resume().code == ErrorCode::INVALID_STATE);

    assert(session.start().isOk());
    assert(session.engineState().active == EngineKind::BROWSER);
    recognizer->emit("first part", true);
    assert(session.transcript() == "first part ");

    assert(session.pause().isOk());
    assert(session.isPaused());
    assert(!session.isRecording());
    assert(!recognizer->listening());
    assert(listener->closes == 1);

    // 暂停期间的迟到结果被丢弃
    recognizer->emit("late words", true);
    assert(session.transcript() == "first part ");

    assert(session.resume().isOk());
    assert(recognizer->starts() == 2);
    recognizer->emit("part two", true);
    assert(session.transcript() == "first part two ");
    assert(listener->inserted().back() == "two ");

    assert(session.stop().isOk());
    assert(!session.isPaused());
    assert(session.transcript() == "first part two ");
    test_passed("pause and resume");
}

void test_no_focus_skips_insert() {
    audio::MicrophoneArbiter arbiter;
    auto recognizer = std::make_shared<FakeRecognizer>();
    LiveSessionDeps deps = baseDeps(arbiter);
    deps.recognizer = recognizer;

    LiveSession session(relayNotConfigured(), deps);
    auto listener = std::make_shared<RecordingListener>();
    listener->focused = false;
    session.setListener(listener);

    assert(session.start().isOk());
    recognizer->emit("blood pressure normal", true);
    assert(listener->no_target == 1);
    assert(listener->inserted().size() == 1 && listener->inserted()[0].empty());
    assert(session.transcript().empty());

    listener->focused = true;
    recognizer->emit("blood pressure normal", true);
    assert(session.transcript() == "blood pressure normal ");
    assert(session.stop().isOk());
    test_passed("no focus skips insert");
}

int main() {
    std::cout << "=== Live Session Tests ===" << std::endl;

    test_relay_session();
    test_fallback_chain();
    test_chunk_only_with_summary();
    test_forced_engine();
    test_device_error_does_not_fall_back();
    test_pause_and_resume();
    test_no_focus_skips_insert();

    std::cout << "All live session tests passed" << std::endl;
    return 0;
}
