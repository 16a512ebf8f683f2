#include "transport/websocket_client.hpp"

#include <chrono>
#include <deque>
#include <type_traits>

#include <openssl/err.h>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>

#include "scribe_log.hpp"

namespace scribe {
namespace transport {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

template <class T>
struct IsSslStream : std::false_type {};

template <class S>
struct IsSslStream<beast::ssl_stream<S>> : std::true_type {};

// =============================================================================
// BeastWebSocketClient (明文与 TLS 共用实现)
// =============================================================================

template <class WsStream>
class BeastWebSocketClient : public WebSocketClient,
                             public std::enable_shared_from_this<BeastWebSocketClient<WsStream>> {
public:
    template <class... StreamArgs>
    BeastWebSocketClient(net::any_io_executor executor, WebSocketOptions options,
            WebSocketHandlers handlers, StreamArgs&&... stream_args)
        : resolver_(executor)
        , ws_(executor, std::forward<StreamArgs>(stream_args)...)
        , options_(std::move(options))
        , handlers_(std::move(handlers)) {
    }

    void start() override {
        resolver_.async_resolve(options_.host, options_.port,
            [self = this->shared_from_this()](beast::error_code ec, tcp::resolver::results_type results) {
                self->onResolve(ec, results);
            });
    }

    void sendBinary(std::shared_ptr<const std::vector<uint8_t>> data) override {
        if (closing_ || !data) return;
        Outgoing out;
        out.binary = true;
        out.data = std::move(data);
        enqueue(std::move(out));
    }

    void sendText(const std::string& text) override {
        if (closing_) return;
        Outgoing out;
        out.text = text;
        enqueue(std::move(out));
    }

    void close(int code) override {
        if (closing_) return;
        closing_ = true;

        if (!opened_) {
            // 仍在连接: 中止
            resolver_.cancel();
            beast::get_lowest_layer(ws_).close();
            return;
        }
        Outgoing out;
        out.close = true;
        out.close_code = code;
        outbox_.push_back(std::move(out));
        if (!writing_) doWrite();
    }

    bool isOpen() const override { return opened_ && !closing_; }
    size_t queuedMessages() const override { return outbox_.size(); }

private:
    struct Outgoing {
        bool binary = false;
        bool close = false;
        int close_code = 1000;
        std::shared_ptr<const std::vector<uint8_t>> data;
        std::string text;
    };

    void fail(const char* stage, beast::error_code ec) {
        if (closing_) return;
        closing_ = true;
        if (handlers_.on_error) {
            handlers_.on_error(std::string(stage) + ": " + ec.message());
        }
    }

    void onResolve(beast::error_code ec, tcp::resolver::results_type results) {
        if (ec) return fail("resolve", ec);
        if (closing_) return;

        beast::get_lowest_layer(ws_).expires_after(
            std::chrono::milliseconds(options_.connect_timeout_ms));
        beast::get_lowest_layer(ws_).async_connect(results,
            [self = this->shared_from_this()](beast::error_code ec, tcp::endpoint) {
                self->onConnect(ec);
            });
    }

    void onConnect(beast::error_code ec) {
        if (ec) return fail("connect", ec);
        if (closing_) return;

        if constexpr (IsSslStream<typename WsStream::next_layer_type>::value) {
            // SNI
            if (!SSL_set_tlsext_host_name(ws_.next_layer().native_handle(), options_.host.c_str())) {
                beast::error_code sni_ec(static_cast<int>(::ERR_get_error()),
                    net::error::get_ssl_category());
                return fail("sni", sni_ec);
            }
            ws_.next_layer().set_verify_callback(net::ssl::host_name_verification(options_.host));
            ws_.next_layer().async_handshake(net::ssl::stream_base::client,
                [self = this->shared_from_this()](beast::error_code ec) {
                    if (ec) return self->fail("tls", ec);
                    self->doHandshake();
                });
        } else {
            doHandshake();
        }
    }

    void doHandshake() {
        if (closing_) return;

        // websocket 自身的超时设置接管
        beast::get_lowest_layer(ws_).expires_never();
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));

        auto headers = options_.headers;
        auto user_agent = options_.user_agent;
        ws_.set_option(websocket::stream_base::decorator(
            [headers, user_agent](websocket::request_type& req) {
                req.set(http::field::user_agent, user_agent);
                for (const auto& header : headers) {
                    req.set(header.first, header.second);
                }
            }));

        ws_.async_handshake(options_.host, options_.target,
            [self = this->shared_from_this()](beast::error_code ec) {
                self->onHandshake(ec);
            });
    }

    void onHandshake(beast::error_code ec) {
        if (ec) return fail("handshake", ec);
        if (closing_) return;
        opened_ = true;
        if (handlers_.on_open) handlers_.on_open();
        doRead();
        if (!outbox_.empty() && !writing_) doWrite();
    }

    void doRead() {
        ws_.async_read(buffer_,
            [self = this->shared_from_this()](beast::error_code ec, std::size_t bytes) {
                self->onRead(ec, bytes);
            });
    }

    void onRead(beast::error_code ec, std::size_t bytes) {
        if (ec) {
            if (closing_) return;
            if (ec == websocket::error::closed) {
                closing_ = true;
                const auto& reason = ws_.reason();
                if (handlers_.on_close) {
                    handlers_.on_close(static_cast<int>(reason.code), std::string(reason.reason.data(), reason.reason.size()));
                }
                return;
            }
            return fail("read", ec);
        }

        if (!closing_) {
            if (ws_.got_text()) {
                if (handlers_.on_text) handlers_.on_text(beast::buffers_to_string(buffer_.data()));
            } else if (handlers_.on_binary) {
                std::vector<uint8_t> data(bytes);
                net::buffer_copy(net::buffer(data), buffer_.data());
                handlers_.on_binary(std::move(data));
            }
        }
        buffer_.consume(buffer_.size());
        doRead();
    }

    void enqueue(Outgoing out) {
        outbox_.push_back(std::move(out));
        if (opened_ && !writing_) doWrite();
    }

    void doWrite() {
        if (outbox_.empty()) {
            writing_ = false;
            return;
        }
        writing_ = true;
        Outgoing& front = outbox_.front();

        if (front.close) {
            websocket::close_reason reason(static_cast<std::uint16_t>(front.close_code));
            ws_.async_close(reason,
                [self = this->shared_from_this()](beast::error_code ec) {
                    if (ec) {
                        debugLog(self->options_.log_tag, "Close handshake failed: ", ec.message());
                    }
                    self->outbox_.clear();
                    self->writing_ = false;
                });
            return;
        }

        auto on_write = [self = this->shared_from_this()](beast::error_code ec, std::size_t) {
            self->outbox_.pop_front();
            if (ec) {
                self->writing_ = false;
                return self->fail("write", ec);
            }
            self->doWrite();
        };

        if (front.binary) {
            ws_.binary(true);
            ws_.async_write(net::buffer(*front.data), std::move(on_write));
        } else {
            ws_.text(true);
            ws_.async_write(net::buffer(front.text), std::move(on_write));
        }
    }

    tcp::resolver resolver_;
    WsStream ws_;
    WebSocketOptions options_;
    WebSocketHandlers handlers_;
    beast::flat_buffer buffer_;
    std::deque<Outgoing> outbox_;
    bool opened_ = false;
    bool writing_ = false;
    bool closing_ = false;
};

using PlainWs = websocket::stream<beast::tcp_stream>;
using TlsWs = websocket::stream<beast::ssl_stream<beast::tcp_stream>>;

}  // namespace

std::shared_ptr<WebSocketClient> makeWebSocketClient(
        net::any_io_executor executor,
        net::ssl::context& ssl_context,
        WebSocketOptions options,
        WebSocketHandlers handlers) {
    if (options.use_tls) {
        return std::make_shared<BeastWebSocketClient<TlsWs>>(
            executor, std::move(options), std::move(handlers), ssl_context);
    }
    return std::make_shared<BeastWebSocketClient<PlainWs>>(
        executor, std::move(options), std::move(handlers));
}

}  // namespace transport
}  // namespace scribe
