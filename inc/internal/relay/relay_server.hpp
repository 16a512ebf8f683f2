#ifndef SCRIBE_RELAY_RELAY_SERVER_HPP
#define SCRIBE_RELAY_RELAY_SERVER_HPP

#include <cstddef>
#include <cstdint>
#include <memory>

#include "../scribe_config.hpp"
#include "../scribe_types.hpp"
#include "token_verifier.hpp"
#include "upstream_connection.hpp"

namespace scribe {
namespace relay {

// =============================================================================
// Relay Server (HTTP 健康检查 + /dictate WebSocket 中继)
// =============================================================================
//
// 路由:
//   GET /health, /health/   -> {status:"healthy", sessions, uptime}
//   GET /                   -> {service:"scribe-relay", status:"running"}
//   WebSocket <dictate_path> -> RelaySession
//   其他                    -> 404 {error:"Not found"}
//
// 使用示例:
//   RelayConfig config;
//   RelayConfig::fromEnvironment(config);
//   RelayServer server(config, std::make_shared<JwtTokenVerifier>(config.jwt_secret));
//   server.start();
//   server.installSignalHandlers();
//   server.wait();
//

class RelayServer {
public:
    RelayServer(RelayConfig config, std::shared_ptr<ITokenVerifier> verifier);

    /// @brief 测试用: 替换上游连接工厂
    RelayServer(RelayConfig config, std::shared_ptr<ITokenVerifier> verifier,
            UpstreamFactory upstream_factory);

    ~RelayServer();

    RelayServer(const RelayServer&) = delete;
    RelayServer& operator=(const RelayServer&) = delete;

    /// @brief 绑定端口并启动 io 线程
    ErrorInfo start();

    /// @brief 停止接受连接, 关闭所有会话, 等待 io 线程退出 (幂等)
    void stop();

    /// @brief 阻塞直到 stop() 完成 (信号或其他线程调用)
    void wait();

    /// @brief SIGINT / SIGTERM 触发 stop()
    void installSignalHandlers();

    /// @brief 实际监听端口 (配置为 0 时由系统分配)
    uint16_t port() const;

    size_t sessionCount() const;

    bool isRunning() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace relay
}  // namespace scribe

#endif  // SCRIBE_RELAY_RELAY_SERVER_HPP
