#ifndef SCRIBE_CLIENT_RELAY_TRANSPORT_HPP
#define SCRIBE_CLIENT_RELAY_TRANSPORT_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "../scribe_config.hpp"

namespace scribe {
namespace client {

// =============================================================================
// Relay Transport (客户端到 relay 的连接)
// =============================================================================
//
// 回调可能在任意线程执行, 实现方只需保证同一连接的回调按顺序到达。
// abort() 之后不再有回调。
//

struct TransportHandlers {
    std::function<void()> on_open;
    std::function<void(const std::string&)> on_text;
    std::function<void(std::vector<uint8_t>)> on_binary;
    std::function<void(int code, const std::string& reason)> on_close;
    std::function<void(const std::string& detail)> on_error;
};

class IRelayTransport {
public:
    virtual ~IRelayTransport() = default;

    /// @brief 异步连接, 结果经 on_open / on_error 返回
    virtual void connect(TransportHandlers handlers) = 0;

    /// @return false 表示连接不可用, 数据未排队
    virtual bool sendText(const std::string& text) = 0;
    virtual bool sendBinary(std::vector<uint8_t> data) = 0;

    /// @brief 正常关闭 (发送 close 帧)
    virtual void close(int code) = 0;

    /// @brief 中止连接 (包括连接中), 之后不再回调
    virtual void abort() = 0;

    virtual bool isOpen() const = 0;
};

using RelayTransportFactory = std::function<std::unique_ptr<IRelayTransport>(const ClientConfig&)>;

/// @brief Beast WebSocket 实现 (自带 io 线程)
std::unique_ptr<IRelayTransport> makeBeastRelayTransport(const ClientConfig& config);

}  // namespace client
}  // namespace scribe

#endif  // SCRIBE_CLIENT_RELAY_TRANSPORT_HPP
