#ifndef SCRIBE_RELAY_UPSTREAM_CONNECTION_HPP
#define SCRIBE_RELAY_UPSTREAM_CONNECTION_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ssl/context.hpp>

#include "../scribe_config.hpp"

namespace scribe {
namespace relay {

// =============================================================================
// Upstream Connection (到识别引擎的 WebSocket 连接)
// =============================================================================
//
// 所有回调都在构造时传入的 executor (会话 strand) 上执行。
// close() 之后不再有回调。
//

struct UpstreamHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_text;
    std::function<void()> on_closed;
    std::function<void(const std::string&)> on_error;
};

class IUpstreamConnection {
public:
    virtual ~IUpstreamConnection() = default;

    /// @brief 解析、连接、(TLS 握手)、WebSocket 握手
    virtual void start() = 0;
    virtual void sendBinary(std::shared_ptr<const std::vector<uint8_t>> data) = 0;
    virtual void sendText(const std::string& text) = 0;
    /// @brief 排在已排队写入之后关闭; 连接中则中止
    virtual void close() = 0;
};

using UpstreamFactory = std::function<std::shared_ptr<IUpstreamConnection>(
    boost::asio::any_io_executor executor, UpstreamHandlers handlers)>;

/// @brief 按配置创建 (use_tls 决定 wss / ws)
std::shared_ptr<IUpstreamConnection> makeUpstreamConnection(
    boost::asio::any_io_executor executor,
    boost::asio::ssl::context& ssl_context,
    const UpstreamConfig& config,
    UpstreamHandlers handlers);

}  // namespace relay
}  // namespace scribe

#endif  // SCRIBE_RELAY_UPSTREAM_CONNECTION_HPP
