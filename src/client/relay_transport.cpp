#include "client/relay_transport.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <optional>
#include <thread>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>

#include "scribe_log.hpp"
#include "transport/websocket_client.hpp"

namespace scribe {
namespace client {

namespace net = boost::asio;

namespace {

constexpr auto kShutdownWait = std::chrono::milliseconds(1000);

// =============================================================================
// BeastRelayTransport
// =============================================================================
//
// 一个 io 线程 + strand。公开方法可从任意线程调用, 统一 post 到 strand。
//

class BeastRelayTransport : public IRelayTransport {
public:
    explicit BeastRelayTransport(const ClientConfig& config)
        : config_(config)
        , strand_(net::make_strand(ioc_))
        , work_(net::make_work_guard(ioc_)) {
        ssl_context_.set_default_verify_paths();
        ssl_context_.set_verify_mode(net::ssl::verify_peer);

        auto finished = std::make_shared<std::promise<void>>();
        io_finished_ = finished->get_future();
        io_thread_ = std::thread([this, finished]() {
            ioc_.run();
            finished->set_value();
        });
    }

    ~BeastRelayTransport() override {
        abort();
        work_.reset();
        // 给 close 握手一点时间, 超时后强制停止
        if (io_finished_.valid() &&
            io_finished_.wait_for(kShutdownWait) == std::future_status::timeout) {
            ioc_.stop();
        }
        if (io_thread_.joinable()) {
            io_thread_.join();
        }
    }

    void connect(TransportHandlers handlers) override {
        handlers_ = std::move(handlers);

        transport::WebSocketOptions options;
        options.host = config_.relay_host;
        options.port = config_.relay_port;
        options.target = config_.relay_path;
        options.use_tls = config_.use_tls;
        if (!config_.origin.empty()) {
            options.headers.emplace_back("Origin", config_.origin);
        }
        options.user_agent = "scribe-client";
        options.connect_timeout_ms = config_.connect_timeout_ms;
        options.log_tag = "RelayTransport";

        transport::WebSocketHandlers ws_handlers;
        ws_handlers.on_open = [this]() {
            if (aborted_) return;
            open_ = true;
            if (handlers_.on_open) handlers_.on_open();
        };
        ws_handlers.on_text = [this](const std::string& text) {
            if (aborted_) return;
            if (handlers_.on_text) handlers_.on_text(text);
        };
        ws_handlers.on_binary = [this](std::vector<uint8_t> data) {
            if (aborted_) return;
            if (handlers_.on_binary) handlers_.on_binary(std::move(data));
        };
        ws_handlers.on_close = [this](int code, const std::string& reason) {
            open_ = false;
            if (aborted_) return;
            if (handlers_.on_close) handlers_.on_close(code, reason);
        };
        ws_handlers.on_error = [this](const std::string& detail) {
            open_ = false;
            if (aborted_) return;
            if (handlers_.on_error) handlers_.on_error(detail);
        };

        net::post(strand_, [this, options = std::move(options), ws_handlers = std::move(ws_handlers)]() mutable {
            client_ = transport::makeWebSocketClient(strand_, ssl_context_,
                std::move(options), std::move(ws_handlers));
            client_->start();
        });
    }

    bool sendText(const std::string& text) override {
        if (!open_ || aborted_) return false;
        net::post(strand_, [this, text]() {
            if (client_) client_->sendText(text);
        });
        return true;
    }

    bool sendBinary(std::vector<uint8_t> data) override {
        if (!open_ || aborted_) return false;
        auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(data));
        net::post(strand_, [this, shared]() {
            if (client_) client_->sendBinary(shared);
        });
        return true;
    }

    void close(int code) override {
        net::post(strand_, [this, code]() {
            if (client_) client_->close(code);
        });
    }

    void abort() override {
        if (aborted_.exchange(true)) return;
        open_ = false;
        net::post(strand_, [this]() {
            if (client_) client_->close(1000);
        });
    }

    bool isOpen() const override { return open_.load(); }

private:
    ClientConfig config_;
    net::io_context ioc_{1};
    net::ssl::context ssl_context_{net::ssl::context::tls_client};
    net::strand<net::io_context::executor_type> strand_;
    net::executor_work_guard<net::io_context::executor_type> work_;
    std::thread io_thread_;
    std::future<void> io_finished_;

    TransportHandlers handlers_;
    std::shared_ptr<transport::WebSocketClient> client_;    // 仅在 strand 上访问
    std::atomic<bool> open_{false};
    std::atomic<bool> aborted_{false};
};

}  // namespace

std::unique_ptr<IRelayTransport> makeBeastRelayTransport(const ClientConfig& config) {
    return std::make_unique<BeastRelayTransport>(config);
}

}  // namespace client
}  // namespace scribe
