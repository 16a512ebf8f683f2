#include "relay/relay_session_machine.hpp"

#include <algorithm>
#include <random>

#include "protocol/control_messages.hpp"
#include "relay/upstream_protocol.hpp"
#include "scribe_log.hpp"

namespace scribe {
namespace relay {

const char* relaySessionStateToString(RelaySessionState state) {
    switch (state) {
        case RelaySessionState::NEW:           return "new";
        case RelaySessionState::AWAITING_AUTH: return "awaiting_auth";
        case RelaySessionState::AUTHENTICATED: return "authenticated";
        case RelaySessionState::STREAMING:     return "streaming";
        case RelaySessionState::FINALIZING:    return "finalizing";
        case RelaySessionState::CLOSED:        return "closed";
        case RelaySessionState::AUTH_TIMEOUT:  return "auth_timeout";
        default:                               return "unknown";
    }
}

bool isValidTransition(RelaySessionState from, RelaySessionState to) {
    using S = RelaySessionState;
    switch (from) {
        case S::NEW:
            return to == S::AWAITING_AUTH || to == S::CLOSED;
        case S::AWAITING_AUTH:
            return to == S::AUTHENTICATED || to == S::AUTH_TIMEOUT || to == S::CLOSED;
        case S::AUTHENTICATED:
            return to == S::STREAMING || to == S::FINALIZING || to == S::CLOSED;
        case S::STREAMING:
            return to == S::FINALIZING || to == S::CLOSED;
        case S::FINALIZING:
            return to == S::CLOSED;
        case S::CLOSED:
        case S::AUTH_TIMEOUT:
        default:
            return false;
    }
}

std::string generateSessionId() {
    static const char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    static thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);

    std::string id(7, '0');
    for (auto& c : id) {
        c = kAlphabet[pick(rng)];
    }
    return id;
}

// =============================================================================
// RelaySessionMachine
// =============================================================================

RelaySessionMachine::RelaySessionMachine(std::string session_id, const RelayConfig& config,
        const ITokenVerifier& verifier, IRelaySessionIO& io)
    : session_id_(std::move(session_id))
    , config_(config)
    , verifier_(verifier)
    , io_(io) {
}

bool RelaySessionMachine::transition(RelaySessionState to) {
    if (!isValidTransition(state_, to)) {
        debugLog(session_id_, "Ignored transition ", relaySessionStateToString(state_),
            " -> ", relaySessionStateToString(to));
        return false;
    }
    state_ = to;
    return true;
}

SessionStats RelaySessionMachine::stats() const {
    SessionStats stats;
    if (upstream_ever_opened_ && upstream_started_ms_ >= 0) {
        stats.duration_ms = io_.nowMs() - upstream_started_ms_;
    }
    stats.audio_bytes_sent = audio_bytes_sent_;
    stats.partial_count = partial_count_;
    stats.final_count = final_count_;
    stats.final_transcript_length = final_transcript_length_;
    return stats;
}

// =============================================================================
// Client events
// =============================================================================

bool RelaySessionMachine::onClientConnected(const std::string& origin) {
    connected_at_ms_ = io_.nowMs();
    safeLog(session_id_, "Client connected, origin: ", origin.empty() ? "(none)" : origin);

    const auto& allowed = config_.allowed_origins;
    if (!allowed.empty() && std::find(allowed.begin(), allowed.end(), origin) == allowed.end()) {
        safeWarn(session_id_, "Origin not allowed");
        transition(RelaySessionState::CLOSED);
        io_.closeClient(close_code::ORIGIN_NOT_ALLOWED, "Origin not allowed");
        return false;
    }

    transition(RelaySessionState::AWAITING_AUTH);
    io_.startAuthTimer(config_.auth_timeout_ms);
    return true;
}

void RelaySessionMachine::onClientText(const std::string& text) {
    if (isTerminal()) {
        return;
    }

    auto message = protocol::parseClientMessage(text);
    if (!message) {
        safeError(session_id_, "Invalid message format");
        return;
    }

    switch (message->type) {
        case protocol::ClientMessageType::AUTH:
            handleAuth(message->access_token);
            break;
        case protocol::ClientMessageType::STOP:
            handleStop();
            break;
        case protocol::ClientMessageType::PING:
            io_.sendToClient(protocol::makePongMessage());
            break;
        case protocol::ClientMessageType::UNKNOWN:
        default:
            debugLog(session_id_, "Ignoring message type: ", message->raw_type);
            break;
    }
}

void RelaySessionMachine::handleAuth(const std::string& token) {
    if (state_ != RelaySessionState::AWAITING_AUTH) {
        if (isAuthenticated()) {
            safeWarn(session_id_, "Already authenticated");
        }
        return;
    }

    auto result = verifier_.verify(token);
    if (!result) {
        safeWarn(session_id_, "Auth failed");
        io_.cancelAuthTimer();
        transition(RelaySessionState::CLOSED);
        io_.sendToClient(protocol::makeErrorMessage("Authentication failed"));
        io_.closeClient(close_code::AUTH_FAILED, "Authentication failed");
        return;
    }

    user_id_ = result->user_id;
    io_.cancelAuthTimer();
    transition(RelaySessionState::AUTHENTICATED);
    safeLog(session_id_, "Authenticated");
    io_.sendToClient(protocol::makeAuthenticatedMessage());

    safeLog(session_id_, "Connecting to upstream...");
    upstream_requested_ = true;
    upstream_started_ms_ = io_.nowMs();
    io_.openUpstream();
}

void RelaySessionMachine::handleStop() {
    if (state_ == RelaySessionState::FINALIZING || done_sent_) {
        return;
    }
    safeLog(session_id_, "Stop received");
    io_.stopKeepAlive();

    if (state_ == RelaySessionState::STREAMING && upstream_open_) {
        transition(RelaySessionState::FINALIZING);
        io_.sendUpstreamText(closeStreamMessage());
        safeLog(session_id_, "CloseStream sent, waiting for flush...");
        io_.startFlushTimer(config_.flush_grace_ms);
        return;
    }

    // 上游未打开: 立即结束
    if (state_ == RelaySessionState::AUTHENTICATED) {
        transition(RelaySessionState::FINALIZING);
        releaseUpstream();
    } else if (state_ == RelaySessionState::AWAITING_AUTH) {
        io_.cancelAuthTimer();
    }
    sendDone();
}

void RelaySessionMachine::onClientBinary(std::shared_ptr<const std::vector<uint8_t>> audio) {
    if (isTerminal() || !audio) {
        return;
    }
    if (!isAuthenticated()) {
        safeWarn(session_id_, "Audio received before auth");
        return;
    }
    if (state_ != RelaySessionState::STREAMING || !upstream_open_) {
        debugLog(session_id_, "Dropping audio while ", relaySessionStateToString(state_));
        return;
    }

    audio_bytes_sent_ += audio->size();
    io_.sendUpstreamAudio(std::move(audio));
}

void RelaySessionMachine::onClientClosed() {
    const int64_t duration = io_.nowMs() - connected_at_ms_;
    safeLog(session_id_, "Client disconnected after ", duration, "ms, bytes: ",
        audio_bytes_sent_, ", finals: ", final_count_);

    io_.cancelAuthTimer();
    io_.cancelFlushTimer();
    io_.stopKeepAlive();
    releaseUpstream();
    if (!isTerminal()) {
        transition(RelaySessionState::CLOSED);
    }
}

void RelaySessionMachine::onServerShutdown() {
    io_.cancelAuthTimer();
    io_.cancelFlushTimer();
    io_.stopKeepAlive();
    releaseUpstream();
    if (isTerminal()) {
        return;
    }
    safeLog(session_id_, "Server shutting down, closing session");
    transition(RelaySessionState::CLOSED);
    io_.closeClient(close_code::GOING_AWAY, "Server shutting down");
}

// =============================================================================
// Upstream events
// =============================================================================

void RelaySessionMachine::onUpstreamOpen() {
    if (state_ != RelaySessionState::AUTHENTICATED) {
        // stop 或断开之后才连上
        safeLog(session_id_, "Late upstream open discarded");
        io_.closeUpstream();
        return;
    }

    upstream_open_ = true;
    upstream_ever_opened_ = true;
    transition(RelaySessionState::STREAMING);
    safeLog(session_id_, "Upstream connected");
    io_.sendToClient(protocol::makeReadyMessage());
    io_.startKeepAlive(config_.upstream.keepalive_interval_ms);
}

void RelaySessionMachine::onUpstreamText(const std::string& text) {
    if (state_ != RelaySessionState::STREAMING && state_ != RelaySessionState::FINALIZING) {
        return;
    }

    auto event = classifyUpstreamMessage(text);
    if (!event) {
        return;
    }

    switch (event->type) {
        case UpstreamEventType::FINAL:
            ++final_count_;
            final_transcript_length_ += event->transcript.size();
            io_.sendToClient(protocol::makeFinalMessage(event->transcript, event->speech_final));
            break;
        case UpstreamEventType::PARTIAL:
            ++partial_count_;
            io_.sendToClient(protocol::makePartialMessage(event->transcript));
            break;
        case UpstreamEventType::UTTERANCE_END:
            io_.sendToClient(protocol::makeUtteranceEndMessage());
            break;
        case UpstreamEventType::METADATA:
            safeLog(session_id_, "Upstream metadata received");
            break;
        case UpstreamEventType::IGNORED:
        default:
            break;
    }
}

void RelaySessionMachine::onUpstreamClosed() {
    const bool was_open = upstream_open_;
    upstream_open_ = false;
    upstream_requested_ = false;
    io_.stopKeepAlive();

    if (isTerminal()) {
        return;
    }
    safeLog(session_id_, "Upstream closed");

    if (state_ == RelaySessionState::FINALIZING) {
        io_.cancelFlushTimer();
        sendDone();
    } else if (state_ == RelaySessionState::STREAMING ||
               (state_ == RelaySessionState::AUTHENTICATED && !was_open)) {
        failUpstream();
    }
}

void RelaySessionMachine::onUpstreamError(const std::string& detail) {
    safeError(session_id_, "Upstream error: ", maskSensitive(detail));
    upstream_open_ = false;
    io_.stopKeepAlive();

    if (isTerminal()) {
        return;
    }
    if (state_ == RelaySessionState::FINALIZING) {
        io_.cancelFlushTimer();
        releaseUpstream();
        sendDone();
        return;
    }
    failUpstream();
}

void RelaySessionMachine::failUpstream() {
    io_.cancelAuthTimer();
    io_.cancelFlushTimer();
    releaseUpstream();
    transition(RelaySessionState::CLOSED);
    io_.sendToClient(protocol::makeErrorMessage("Upstream connection failed"));
    io_.closeClient(close_code::INTERNAL, "Upstream connection failed");
}

void RelaySessionMachine::releaseUpstream() {
    if (upstream_requested_ || upstream_open_) {
        upstream_requested_ = false;
        upstream_open_ = false;
        io_.closeUpstream();
    }
}

// =============================================================================
// Timers
// =============================================================================

void RelaySessionMachine::onAuthTimeout() {
    if (state_ != RelaySessionState::AWAITING_AUTH) {
        return;
    }
    safeWarn(session_id_, "Auth timeout - closing");
    transition(RelaySessionState::AUTH_TIMEOUT);
    io_.closeClient(close_code::AUTH_TIMEOUT, "Authentication timeout");
}

void RelaySessionMachine::onFlushTimeout() {
    if (state_ != RelaySessionState::FINALIZING) {
        return;
    }
    safeLog(session_id_, "Flush timeout expired, closing upstream");
    releaseUpstream();
    sendDone();
}

void RelaySessionMachine::onKeepAliveTick() {
    if (state_ == RelaySessionState::STREAMING && upstream_open_) {
        io_.sendUpstreamText(keepAliveMessage());
    }
}

void RelaySessionMachine::sendDone() {
    if (done_sent_) {
        return;
    }
    done_sent_ = true;
    io_.cancelFlushTimer();

    SessionStats final_stats = stats();
    transition(RelaySessionState::CLOSED);
    io_.sendToClient(protocol::makeDoneMessage(final_stats));
    safeLog(session_id_, "Done: ", final_stats.duration_ms, "ms, bytes: ",
        final_stats.audio_bytes_sent, ", partials: ", final_stats.partial_count,
        ", finals: ", final_stats.final_count);
    io_.closeClient(close_code::NORMAL, "Session complete");
}

}  // namespace relay
}  // namespace scribe
