// Tests for the per-connection relay state machine, driven through a fake IO

#include <cassert>
#include <cctype>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "protocol/control_messages.hpp"
#include "relay/relay_session_machine.hpp"
#include "relay/token_verifier.hpp"
#include "relay/upstream_protocol.hpp"
#include "scribe_config.hpp"

using namespace scribe;
using namespace scribe::relay;
using scribe::protocol::ServerMessageType;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

class FakeVerifier : public ITokenVerifier {
public:
    std::optional<AuthResult> verify(const std::string& token) const override {
        if (token == "good-token") return AuthResult{"user-1"};
        return std::nullopt;
    }
};

// 记录全部副作用
class FakeSessionIO : public IRelaySessionIO {
public:
    void sendToClient(const std::string& text) override { client_texts.push_back(text); }
    void closeClient(int code, const std::string& reason) override {
        close_code = code;
        close_reason = reason;
        ++close_calls;
    }

    void openUpstream() override { ++upstream_opens; }
    void sendUpstreamAudio(std::shared_ptr<const std::vector<uint8_t>> audio) override {
        upstream_audio_bytes += audio->size();
    }
    void sendUpstreamText(const std::string& text) override { upstream_texts.push_back(text); }
    void closeUpstream() override { ++upstream_closes; }

    void startAuthTimer(int ms) override { auth_timer_ms = ms; auth_timer = true; }
    void cancelAuthTimer() override { auth_timer = false; }
    void startFlushTimer(int ms) override { flush_timer_ms = ms; flush_timer = true; }
    void cancelFlushTimer() override { flush_timer = false; }
    void startKeepAlive(int interval_ms) override { keepalive_ms = interval_ms; keepalive = true; }
    void stopKeepAlive() override { keepalive = false; }

    int64_t nowMs() const override { return now_ms; }

    std::vector<ServerMessageType> clientTypes() const {
        std::vector<ServerMessageType> types;
        for (const auto& text : client_texts) {
            auto message = protocol::parseServerMessage(text);
            assert(message.has_value());
            types.push_back(message->type);
        }
        return types;
    }

    protocol::ServerMessage lastClientMessage() const {
        assert(!client_texts.empty());
        return *protocol::parseServerMessage(client_texts.back());
    }

    std::vector<std::string> client_texts;
    int close_code = 0;
    std::string close_reason;
    int close_calls = 0;

    int upstream_opens = 0;
    int upstream_closes = 0;
    uint64_t upstream_audio_bytes = 0;
    std::vector<std::string> upstream_texts;

    bool auth_timer = false;
    int auth_timer_ms = 0;
    bool flush_timer = false;
    int flush_timer_ms = 0;
    bool keepalive = false;
    int keepalive_ms = 0;

    int64_t now_ms = 1000;
};

// 测试夹具: 配置 + 校验器 + IO + 状态机
struct Harness {
    RelayConfig config;
    FakeVerifier verifier;
    FakeSessionIO io;
    std::unique_ptr<RelaySessionMachine> machine;

    explicit Harness(RelayConfig c = RelayConfig()) : config(std::move(c)) {
        machine = std::make_unique<RelaySessionMachine>("abc1234", config, verifier, io);
    }

    void authenticate() {
        assert(machine->onClientConnected(""));
        machine->onClientText(protocol::makeAuthMessage("good-token"));
    }

    void stream() {
        authenticate();
        machine->onUpstreamOpen();
    }
};

std::shared_ptr<const std::vector<uint8_t>> audio(size_t bytes) {
    return std::make_shared<const std::vector<uint8_t>>(bytes, 0x11);
}

std::string results(const std::string& transcript, bool is_final, bool speech_final = false) {
    return std::string(R"({"type":"Results","is_final":)") + (is_final ? "true" : "false") +
        R"(,"speech_final":)" + (speech_final ? "true" : "false") +
        R"(,"channel":{"alternatives":[{"transcript":")" + transcript + R"("}]}})";
}

}  // namespace

// ============================================================================
// Happy path
// ============================================================================

void test_full_session() {
    Harness h;
    assert(h.machine->onClientConnected(""));
    assert(h.machine->state() == RelaySessionState::AWAITING_AUTH);
    assert(h.io.auth_timer && h.io.auth_timer_ms == 5000);

    h.machine->onClientText(protocol::makeAuthMessage("good-token"));
    assert(h.machine->state() == RelaySessionState::AUTHENTICATED);
    assert(h.machine->userId() == "user-1");
    assert(!h.io.auth_timer);
    assert(h.io.upstream_opens == 1);

    h.io.now_ms = 1100;
    h.machine->onUpstreamOpen();
    assert(h.machine->state() == RelaySessionState::STREAMING);
    assert(h.io.keepalive && h.io.keepalive_ms == 8000);

    h.machine->onClientBinary(audio(3200));
    h.machine->onUpstreamText(results("patient", false));
    h.machine->onUpstreamText(results("", false));      // 空中间结果不转发
    h.machine->onUpstreamText(results("patient is stable", true, true));
    h.machine->onUpstreamText(R"({"type":"UtteranceEnd"})");
    h.machine->onUpstreamText(R"({"type":"Metadata","request_id":"x"})");
    h.machine->onUpstreamText("not json");
    assert(h.io.upstream_audio_bytes == 3200);

    h.machine->onClientText(protocol::makeStopMessage());
    assert(h.machine->state() == RelaySessionState::FINALIZING);
    assert(h.io.upstream_texts.back() == closeStreamMessage());
    assert(h.io.flush_timer && h.io.flush_timer_ms == 500);
    assert(!h.io.keepalive);

    // flush 期间的尾部结果仍然转发
    h.machine->onUpstreamText(results("no distress", true));
    h.io.now_ms = 3100;
    h.machine->onUpstreamClosed();

    assert(h.machine->state() == RelaySessionState::CLOSED);
    assert(h.machine->doneSent());
    assert(!h.io.flush_timer);
    assert(h.io.close_code == close_code::NORMAL);

    auto types = h.io.clientTypes();
    std::vector<ServerMessageType> expected = {
        ServerMessageType::AUTHENTICATED,
        ServerMessageType::READY,
        ServerMessageType::PARTIAL,
        ServerMessageType::FINAL,
        ServerMessageType::UTTERANCE_END,
        ServerMessageType::FINAL,
        ServerMessageType::DONE,
    };
    assert(types == expected);

    auto done = h.io.lastClientMessage();
    assert(done.stats.duration_ms == 2100);
    assert(done.stats.audio_bytes_sent == 3200);
    assert(done.stats.partial_count == 1);
    assert(done.stats.final_count == 2);
    assert(done.stats.final_transcript_length == std::string("patient is stable").size() +
        std::string("no distress").size());

    auto first_final = protocol::parseServerMessage(h.io.client_texts[3]);
    assert(first_final->text == "patient is stable");
    assert(first_final->speech_final);
    test_passed("full session");
}

// ============================================================================
// Auth
// ============================================================================

void test_audio_before_auth_dropped() {
    Harness h;
    h.machine->onClientConnected("");
    h.machine->onClientBinary(audio(640));
    assert(h.io.upstream_audio_bytes == 0);

    h.machine->onClientText(protocol::makeAuthMessage("good-token"));
    // 上游尚未连接
    h.machine->onClientBinary(audio(640));
    assert(h.io.upstream_audio_bytes == 0);
    assert(h.machine->stats().audio_bytes_sent == 0);
    test_passed("audio before auth dropped");
}

void test_auth_failure() {
    Harness h;
    h.machine->onClientConnected("");
    h.machine->onClientText(protocol::makeAuthMessage("forged"));
    assert(h.machine->state() == RelaySessionState::CLOSED);
    assert(h.io.close_code == close_code::AUTH_FAILED);
    assert(h.io.lastClientMessage().type == ServerMessageType::ERROR);
    assert(h.io.lastClientMessage().error == "Authentication failed");
    assert(h.io.upstream_opens == 0);
    assert(!h.io.auth_timer);
    test_passed("auth failure");
}

void test_auth_timeout() {
    Harness h;
    h.machine->onClientConnected("");
    h.machine->onAuthTimeout();
    assert(h.machine->state() == RelaySessionState::AUTH_TIMEOUT);
    assert(h.io.close_code == close_code::AUTH_TIMEOUT);

    // 超时后的 auth 忽略
    h.machine->onClientText(protocol::makeAuthMessage("good-token"));
    assert(h.io.upstream_opens == 0);
    assert(!h.machine->isAuthenticated());
    test_passed("auth timeout");
}

void test_second_auth_ignored() {
    Harness h;
    h.authenticate();
    h.machine->onClientText(protocol::makeAuthMessage("good-token"));
    assert(h.io.upstream_opens == 1);
    test_passed("second auth ignored");
}

void test_origin_rejected() {
    Harness h(RelayConfig().withAllowedOrigins({"https://app.example.com"}));
    assert(!h.machine->onClientConnected("https://evil.example.com"));
    assert(h.io.close_code == close_code::ORIGIN_NOT_ALLOWED);
    assert(h.machine->state() == RelaySessionState::CLOSED);

    Harness ok(RelayConfig().withAllowedOrigins({"https://app.example.com"}));
    assert(ok.machine->onClientConnected("https://app.example.com"));
    test_passed("origin rejected");
}

// ============================================================================
// Stop / flush
// ============================================================================

void test_stop_before_upstream_open() {
    Harness h;
    h.authenticate();
    h.machine->onClientText(protocol::makeStopMessage());

    assert(h.machine->doneSent());
    assert(h.io.upstream_closes == 1);
    auto done = h.io.lastClientMessage();
    assert(done.type == ServerMessageType::DONE);
    assert(done.stats.duration_ms == 0);
    assert(h.io.close_code == close_code::NORMAL);

    // 迟到的上游连接被关闭
    h.machine->onUpstreamOpen();
    assert(h.io.upstream_closes == 2);
    assert(!h.machine->upstreamOpen());
    test_passed("stop before upstream open");
}

void test_stop_while_awaiting_auth() {
    Harness h;
    h.machine->onClientConnected("");
    h.machine->onClientText(protocol::makeStopMessage());
    assert(h.machine->doneSent());
    assert(!h.io.auth_timer);
    assert(h.io.upstream_closes == 0);
    test_passed("stop while awaiting auth");
}

void test_flush_timeout() {
    Harness h;
    h.stream();
    h.machine->onClientText(protocol::makeStopMessage());
    h.machine->onClientText(protocol::makeStopMessage());  // 重复 stop
    assert(h.io.upstream_texts.size() == 1);

    h.machine->onFlushTimeout();
    assert(h.machine->doneSent());
    assert(h.io.upstream_closes == 1);
    assert(h.io.lastClientMessage().type == ServerMessageType::DONE);

    // done 只发一次
    size_t count = h.io.client_texts.size();
    h.machine->onUpstreamClosed();
    assert(h.io.client_texts.size() == count);
    test_passed("flush timeout");
}

// ============================================================================
// Upstream failures
// ============================================================================

void test_upstream_error_while_streaming() {
    Harness h;
    h.stream();
    h.machine->onUpstreamError("connection reset https://api.example.com/v1?key=secret");
    assert(h.machine->state() == RelaySessionState::CLOSED);
    assert(h.io.close_code == close_code::INTERNAL);
    assert(h.io.lastClientMessage().error == "Upstream connection failed");
    assert(!h.io.keepalive);
    test_passed("upstream error while streaming");
}

void test_upstream_connect_failure() {
    Harness h;
    h.authenticate();
    h.machine->onUpstreamClosed();
    assert(h.machine->state() == RelaySessionState::CLOSED);
    assert(h.io.close_code == close_code::INTERNAL);
    test_passed("upstream connect failure");
}

void test_upstream_error_while_finalizing() {
    Harness h;
    h.stream();
    h.machine->onClientText(protocol::makeStopMessage());
    h.machine->onUpstreamError("eof");
    assert(h.machine->doneSent());
    assert(h.io.close_code == close_code::NORMAL);
    test_passed("upstream error while finalizing");
}

// ============================================================================
// Misc
// ============================================================================

void test_keepalive_and_ping() {
    Harness h;
    h.stream();
    h.machine->onKeepAliveTick();
    assert(h.io.upstream_texts.size() == 1);
    assert(h.io.upstream_texts[0] == keepAliveMessage());

    h.machine->onClientText(protocol::makePingMessage());
    assert(h.io.lastClientMessage().type == ServerMessageType::PONG);

    size_t count = h.io.client_texts.size();
    h.machine->onClientText("{broken");
    h.machine->onClientText(R"({"type":"configure"})");
    assert(h.io.client_texts.size() == count);

    h.machine->onClientText(protocol::makeStopMessage());
    h.machine->onKeepAliveTick();
    assert(h.io.upstream_texts.size() == 2);        // keepalive + CloseStream
    test_passed("keepalive and ping");
}

void test_client_disconnect_and_shutdown() {
    Harness h;
    h.stream();
    h.machine->onClientClosed();
    assert(h.machine->state() == RelaySessionState::CLOSED);
    assert(h.io.upstream_closes == 1);
    assert(h.io.close_calls == 0);

    Harness s;
    s.stream();
    s.machine->onServerShutdown();
    assert(s.io.close_code == close_code::GOING_AWAY);
    assert(s.io.upstream_closes == 1);
    assert(!s.io.keepalive);
    test_passed("client disconnect and shutdown");
}

void test_transitions_and_ids() {
    using S = RelaySessionState;
    assert(isValidTransition(S::NEW, S::AWAITING_AUTH));
    assert(isValidTransition(S::AWAITING_AUTH, S::AUTH_TIMEOUT));
    assert(isValidTransition(S::STREAMING, S::FINALIZING));
    assert(!isValidTransition(S::STREAMING, S::AUTHENTICATED));
    assert(!isValidTransition(S::CLOSED, S::STREAMING));
    assert(!isValidTransition(S::AUTH_TIMEOUT, S::AUTHENTICATED));

    auto id = generateSessionId();
    assert(id.size() == 7);
    for (char c : id) {
        assert(std::isdigit(static_cast<unsigned char>(c)) || (c >= 'a' && c <= 'z'));
    }
    test_passed("transitions and ids");
}

void test_upstream_protocol() {
    UpstreamConfig config;
    config.api_key = "dg-key";
    auto target = buildListenTarget(config);
    assert(target.rfind("/v1/listen?model=nova-2-medical", 0) == 0);
    assert(target.find("&encoding=linear16") != std::string::npos);
    assert(target.find("&sample_rate=16000") != std::string::npos);
    assert(target.find("&interim_results=true") != std::string::npos);
    assert(target.find("&endpointing=300") != std::string::npos);
    assert(buildListenUrl(config).rfind("wss://api.deepgram.com/v1/listen?", 0) == 0);
    assert(buildListenUrl(UpstreamConfig::plain("127.0.0.1", "9001"))
        .rfind("ws://127.0.0.1:9001/", 0) == 0);
    assert(authorizationHeader(config) == "Token dg-key");

    auto final_event = classifyUpstreamMessage(results("", true));
    assert(final_event && final_event->type == UpstreamEventType::FINAL);
    assert(final_event->transcript.empty());
    auto ignored = classifyUpstreamMessage(R"({"type":"SpeechStarted"})");
    assert(ignored && ignored->type == UpstreamEventType::IGNORED);
    assert(!classifyUpstreamMessage("[1,2]").has_value());
    test_passed("upstream protocol");
}

int main() {
    std::cout << "=== Relay Session Machine Tests ===" << std::endl;

    test_full_session();
    test_audio_before_auth_dropped();
    test_auth_failure();
    test_auth_timeout();
    test_second_auth_ignored();
    test_origin_rejected();
    test_stop_before_upstream_open();
    test_stop_while_awaiting_auth();
    test_flush_timeout();
    test_upstream_error_while_streaming();
    test_upstream_connect_failure();
    test_upstream_error_while_finalizing();
    test_keepalive_and_ping();
    test_client_disconnect_and_shutdown();
    test_transitions_and_ids();
    test_upstream_protocol();

    std::cout << "All relay session machine tests passed" << std::endl;
    return 0;
}
