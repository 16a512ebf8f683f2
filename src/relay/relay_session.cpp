#include "relay/relay_session.hpp"

#include <chrono>

#include <boost/asio/post.hpp>

#include "scribe_log.hpp"

namespace scribe {
namespace relay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;

namespace {
constexpr std::size_t kMaxClientMessageBytes = 1024 * 1024;
}

RelaySession::RelaySession(net::ip::tcp::socket&& socket,
        std::string session_id,
        const RelayConfig& config,
        const ITokenVerifier& verifier,
        UpstreamFactory upstream_factory,
        FinishedCallback on_finished)
    : session_id_(std::move(session_id))
    , ws_(std::move(socket))
    , config_(config)
    , upstream_factory_(std::move(upstream_factory))
    , on_finished_(std::move(on_finished))
    , machine_(session_id_, config_, verifier, *this)
    , auth_timer_(ws_.get_executor())
    , flush_timer_(ws_.get_executor())
    , keepalive_timer_(ws_.get_executor()) {
}

RelaySession::~RelaySession() {
    debugLog(session_id_, "Session released");
}

// =============================================================================
// Client socket
// =============================================================================

void RelaySession::run(http::request<http::string_body> request) {
    const std::string origin(request[http::field::origin]);

    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type& res) {
            res.set(http::field::server, "scribe-relay");
        }));
    ws_.read_message_max(kMaxClientMessageBytes);

    auto req = std::make_shared<http::request<http::string_body>>(std::move(request));
    ws_.async_accept(*req,
        [self = shared_from_this(), req, origin](beast::error_code ec) {
            self->onAccept(ec, origin);
        });
}

void RelaySession::onAccept(beast::error_code ec, const std::string& origin) {
    if (ec) {
        safeWarn(session_id_, "WebSocket accept failed: ", ec.message());
        finish();
        return;
    }
    accepted_ = true;
    machine_.onClientConnected(origin);
    // origin 被拒绝时也继续读取, 以完成关闭握手
    doRead();
}

void RelaySession::doRead() {
    ws_.async_read(buffer_,
        [self = shared_from_this()](beast::error_code ec, std::size_t bytes) {
            self->onRead(ec, bytes);
        });
}

void RelaySession::onRead(beast::error_code ec, std::size_t bytes) {
    if (ec) {
        if (ec != websocket::error::closed) {
            debugLog(session_id_, "Client read ended: ", ec.message());
        }
        finish();
        return;
    }

    if (ws_.got_text()) {
        std::string text = beast::buffers_to_string(buffer_.data());
        buffer_.consume(buffer_.size());
        machine_.onClientText(text);
    } else {
        auto audio = std::make_shared<std::vector<uint8_t>>(bytes);
        net::buffer_copy(net::buffer(*audio), buffer_.data());
        buffer_.consume(buffer_.size());
        machine_.onClientBinary(std::move(audio));
    }

    if (!finished_) {
        doRead();
    }
}

void RelaySession::sendToClient(const std::string& text) {
    if (close_queued_ || finished_) {
        return;
    }
    Outgoing out;
    out.text = text;
    outbox_.push_back(std::move(out));
    if (!writing_) {
        doWrite();
    }
}

void RelaySession::closeClient(int code, const std::string& reason) {
    if (close_queued_ || finished_) {
        return;
    }
    close_queued_ = true;
    Outgoing out;
    out.close = true;
    out.code = code;
    out.reason = reason;
    outbox_.push_back(std::move(out));
    if (!writing_) {
        doWrite();
    }
}

void RelaySession::doWrite() {
    if (outbox_.empty() || finished_) {
        writing_ = false;
        return;
    }
    writing_ = true;
    Outgoing& front = outbox_.front();

    if (front.close) {
        websocket::close_reason reason(static_cast<websocket::close_code>(front.code), front.reason);
        ws_.async_close(reason,
            [self = shared_from_this()](beast::error_code ec) {
                if (ec) {
                    debugLog(self->session_id_, "Client close failed: ", ec.message());
                }
                self->outbox_.clear();
                self->writing_ = false;
            });
        return;
    }

    ws_.text(true);
    ws_.async_write(net::buffer(front.text),
        [self = shared_from_this()](beast::error_code ec, std::size_t) {
            self->outbox_.pop_front();
            if (ec) {
                debugLog(self->session_id_, "Client write failed: ", ec.message());
                self->outbox_.clear();
                self->writing_ = false;
                return;
            }
            self->doWrite();
        });
}

void RelaySession::finish() {
    if (finished_) {
        return;
    }
    if (accepted_) {
        machine_.onClientClosed();
    } else {
        cancelAuthTimer();
        cancelFlushTimer();
        stopKeepAlive();
        closeUpstream();
    }
    finished_ = true;
    if (on_finished_) {
        on_finished_(session_id_);
    }
}

void RelaySession::shutdown() {
    net::post(ws_.get_executor(), [self = shared_from_this()]() {
        if (self->finished_) {
            return;
        }
        if (!self->accepted_) {
            beast::get_lowest_layer(self->ws_).close();
            return;
        }
        self->machine_.onServerShutdown();
    });
}

// =============================================================================
// Upstream
// =============================================================================

void RelaySession::openUpstream() {
    const uint64_t generation = ++upstream_generation_;
    std::weak_ptr<RelaySession> weak = weak_from_this();

    UpstreamHandlers handlers;
    handlers.on_open = [weak, generation]() {
        auto self = weak.lock();
        if (self && generation == self->upstream_generation_) {
            self->machine_.onUpstreamOpen();
        }
    };
    handlers.on_text = [weak, generation](const std::string& text) {
        auto self = weak.lock();
        if (self && generation == self->upstream_generation_) {
            self->machine_.onUpstreamText(text);
        }
    };
    handlers.on_closed = [weak, generation]() {
        auto self = weak.lock();
        if (self && generation == self->upstream_generation_) {
            self->upstream_.reset();
            self->machine_.onUpstreamClosed();
        }
    };
    handlers.on_error = [weak, generation](const std::string& detail) {
        auto self = weak.lock();
        if (self && generation == self->upstream_generation_) {
            self->upstream_.reset();
            self->machine_.onUpstreamError(detail);
        }
    };

    upstream_ = upstream_factory_(ws_.get_executor(), std::move(handlers));
    if (upstream_) {
        upstream_->start();
    }
}

void RelaySession::sendUpstreamAudio(std::shared_ptr<const std::vector<uint8_t>> audio) {
    if (upstream_) {
        upstream_->sendBinary(std::move(audio));
    }
}

void RelaySession::sendUpstreamText(const std::string& text) {
    if (upstream_) {
        upstream_->sendText(text);
    }
}

void RelaySession::closeUpstream() {
    if (upstream_) {
        // 关闭后旧连接的回调一律丢弃
        ++upstream_generation_;
        upstream_->close();
        upstream_.reset();
    }
}

// =============================================================================
// Timers
// =============================================================================

void RelaySession::startAuthTimer(int ms) {
    const uint64_t generation = ++auth_generation_;
    auth_timer_.expires_after(std::chrono::milliseconds(ms));
    auth_timer_.async_wait([self = shared_from_this(), generation](beast::error_code ec) {
        if (ec || generation != self->auth_generation_) return;
        self->machine_.onAuthTimeout();
    });
}

void RelaySession::cancelAuthTimer() {
    ++auth_generation_;
    auth_timer_.cancel();
}

void RelaySession::startFlushTimer(int ms) {
    const uint64_t generation = ++flush_generation_;
    flush_timer_.expires_after(std::chrono::milliseconds(ms));
    flush_timer_.async_wait([self = shared_from_this(), generation](beast::error_code ec) {
        if (ec || generation != self->flush_generation_) return;
        self->machine_.onFlushTimeout();
    });
}

void RelaySession::cancelFlushTimer() {
    ++flush_generation_;
    flush_timer_.cancel();
}

void RelaySession::startKeepAlive(int interval_ms) {
    keepalive_interval_ms_ = interval_ms;
    scheduleKeepAlive(++keepalive_generation_);
}

void RelaySession::scheduleKeepAlive(uint64_t generation) {
    keepalive_timer_.expires_after(std::chrono::milliseconds(keepalive_interval_ms_));
    keepalive_timer_.async_wait([self = shared_from_this(), generation](beast::error_code ec) {
        if (ec || generation != self->keepalive_generation_) return;
        self->machine_.onKeepAliveTick();
        self->scheduleKeepAlive(generation);
    });
}

void RelaySession::stopKeepAlive() {
    ++keepalive_generation_;
    keepalive_timer_.cancel();
}

int64_t RelaySession::nowMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

}  // namespace relay
}  // namespace scribe
