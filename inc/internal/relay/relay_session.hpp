#ifndef SCRIBE_RELAY_RELAY_SESSION_HPP
#define SCRIBE_RELAY_RELAY_SESSION_HPP

#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "../scribe_config.hpp"
#include "relay_session_machine.hpp"
#include "token_verifier.hpp"
#include "upstream_connection.hpp"

namespace scribe {
namespace relay {

// =============================================================================
// Relay Session (一个客户端 WebSocket 连接)
// =============================================================================
//
// 套接字、定时器、上游连接共用同一个 strand, 所有事件串行进入
// RelaySessionMachine。客户端写入经队列串行化, close 排在已排队的写入之后。
//

class RelaySession : public std::enable_shared_from_this<RelaySession>,
                     public IRelaySessionIO {
public:
    using FinishedCallback = std::function<void(const std::string& session_id)>;

    RelaySession(boost::asio::ip::tcp::socket&& socket,
            std::string session_id,
            const RelayConfig& config,
            const ITokenVerifier& verifier,
            UpstreamFactory upstream_factory,
            FinishedCallback on_finished);

    ~RelaySession() override;

    /// @brief 用已读取的升级请求完成 WebSocket 握手并开始读取
    void run(boost::beast::http::request<boost::beast::http::string_body> request);

    /// @brief 服务端关闭 (可从任意线程调用)
    void shutdown();

    const std::string& id() const { return session_id_; }

    // -------------------------------------------------------------------------
    // IRelaySessionIO
    // -------------------------------------------------------------------------

    void sendToClient(const std::string& text) override;
    void closeClient(int code, const std::string& reason) override;

    void openUpstream() override;
    void sendUpstreamAudio(std::shared_ptr<const std::vector<uint8_t>> audio) override;
    void sendUpstreamText(const std::string& text) override;
    void closeUpstream() override;

    void startAuthTimer(int ms) override;
    void cancelAuthTimer() override;
    void startFlushTimer(int ms) override;
    void cancelFlushTimer() override;
    void startKeepAlive(int interval_ms) override;
    void stopKeepAlive() override;

    int64_t nowMs() const override;

private:
    struct Outgoing {
        bool close = false;
        std::string text;
        int code = 0;
        std::string reason;
    };

    void onAccept(boost::beast::error_code ec, const std::string& origin);
    void doRead();
    void onRead(boost::beast::error_code ec, std::size_t bytes);
    void doWrite();
    void finish();
    void scheduleKeepAlive(uint64_t generation);

    std::string session_id_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;

    const RelayConfig& config_;
    UpstreamFactory upstream_factory_;
    FinishedCallback on_finished_;
    RelaySessionMachine machine_;

    std::shared_ptr<IUpstreamConnection> upstream_;
    uint64_t upstream_generation_ = 0;

    boost::asio::steady_timer auth_timer_;
    boost::asio::steady_timer flush_timer_;
    boost::asio::steady_timer keepalive_timer_;
    uint64_t auth_generation_ = 0;
    uint64_t flush_generation_ = 0;
    uint64_t keepalive_generation_ = 0;
    int keepalive_interval_ms_ = 0;

    std::deque<Outgoing> outbox_;
    bool writing_ = false;
    bool close_queued_ = false;
    bool accepted_ = false;
    bool finished_ = false;
};

}  // namespace relay
}  // namespace scribe

#endif  // SCRIBE_RELAY_RELAY_SESSION_HPP
