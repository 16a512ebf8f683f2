#include "relay/upstream_connection.hpp"

#include "relay/upstream_protocol.hpp"
#include "transport/websocket_client.hpp"

namespace scribe {
namespace relay {

namespace {

// =============================================================================
// Upstream Connection (WebSocketClient + 引擎鉴权与参数)
// =============================================================================

class UpstreamConnection : public IUpstreamConnection {
public:
    explicit UpstreamConnection(std::shared_ptr<transport::WebSocketClient> client)
        : client_(std::move(client)) {
    }

    void start() override { client_->start(); }

    void sendBinary(std::shared_ptr<const std::vector<uint8_t>> data) override {
        client_->sendBinary(std::move(data));
    }

    void sendText(const std::string& text) override { client_->sendText(text); }

    void close() override { client_->close(); }

private:
    std::shared_ptr<transport::WebSocketClient> client_;
};

}  // namespace

std::shared_ptr<IUpstreamConnection> makeUpstreamConnection(
        boost::asio::any_io_executor executor,
        boost::asio::ssl::context& ssl_context,
        const UpstreamConfig& config,
        UpstreamHandlers handlers) {
    transport::WebSocketOptions options;
    options.host = config.host;
    options.port = config.port;
    options.target = buildListenTarget(config);
    options.use_tls = config.use_tls;
    options.headers.emplace_back("Authorization", authorizationHeader(config));
    options.user_agent = "scribe-relay";
    options.connect_timeout_ms = config.connect_timeout_ms;
    options.log_tag = "Upstream";

    transport::WebSocketHandlers ws_handlers;
    ws_handlers.on_open = std::move(handlers.on_open);
    ws_handlers.on_text = std::move(handlers.on_text);
    // 引擎只下发 JSON 文本帧
    auto on_closed = std::move(handlers.on_closed);
    ws_handlers.on_close = [on_closed](int, const std::string&) {
        if (on_closed) on_closed();
    };
    ws_handlers.on_error = std::move(handlers.on_error);

    return std::make_shared<UpstreamConnection>(transport::makeWebSocketClient(
        executor, ssl_context, std::move(options), std::move(ws_handlers)));
}

}  // namespace relay
}  // namespace scribe
