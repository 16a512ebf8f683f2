#ifndef SCRIBE_TRANSPORT_WEBSOCKET_CLIENT_HPP
#define SCRIBE_TRANSPORT_WEBSOCKET_CLIENT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>

namespace scribe {
namespace transport {

// =============================================================================
// WebSocket Client (Beast 客户端, ws / wss)
// =============================================================================
//
// 所有方法必须在构造时传入的 executor 上调用, 回调也在该 executor 上执行。
// close() 之后不再有回调。写入经队列串行化, close 排在已排队写入之后。
//

struct WebSocketOptions {
    std::string host;
    std::string port;
    std::string target = "/";
    bool use_tls = false;
    std::vector<std::pair<std::string, std::string>> headers;
    std::string user_agent = "scribe";
    int connect_timeout_ms = 10000;
    std::string log_tag = "WebSocket";
};

struct WebSocketHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_text;
    std::function<void(std::vector<uint8_t>)> on_binary;
    /// @brief 对端发起的关闭 (收到 close 帧)
    std::function<void(int code, const std::string& reason)> on_close;
    /// @brief 连接失败或传输错误
    std::function<void(const std::string& detail)> on_error;
};

class WebSocketClient {
public:
    virtual ~WebSocketClient() = default;

    /// @brief 解析、连接、(TLS 握手)、WebSocket 握手
    virtual void start() = 0;
    virtual void sendBinary(std::shared_ptr<const std::vector<uint8_t>> data) = 0;
    virtual void sendText(const std::string& text) = 0;
    /// @brief 连接中则中止, 否则发送 close 帧
    virtual void close(int code = 1000) = 0;

    virtual bool isOpen() const = 0;
    virtual size_t queuedMessages() const = 0;
};

/// @brief use_tls 为 true 时使用 ssl_context (SNI + 主机名校验)
std::shared_ptr<WebSocketClient> makeWebSocketClient(
    boost::asio::any_io_executor executor,
    boost::asio::ssl::context& ssl_context,
    WebSocketOptions options,
    WebSocketHandlers handlers);

}  // namespace transport
}  // namespace scribe

#endif  // SCRIBE_TRANSPORT_WEBSOCKET_CLIENT_HPP
