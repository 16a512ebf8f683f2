#include "relay/relay_server.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

#include <boost/asio/dispatch.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <nlohmann/json.hpp>

#include "relay/relay_session.hpp"
#include "relay/relay_session_machine.hpp"
#include "scribe_log.hpp"

namespace scribe {
namespace relay {

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;
using json = nlohmann::json;

namespace {

constexpr auto kHttpReadTimeout = std::chrono::seconds(30);
constexpr auto kShutdownDrain = std::chrono::seconds(2);

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

struct HttpRoutes {
    std::string dictate_path;
    std::function<size_t()> session_count;
    std::function<double()> uptime_seconds;
    std::function<void(tcp::socket&&, Request&&)> upgrade;
};

std::string targetPath(const Request& req) {
    std::string target(req.target());
    auto query = target.find('?');
    return query == std::string::npos ? target : target.substr(0, query);
}

Response makeJsonResponse(const Request& req, http::status status, const json& body) {
    Response res{status, req.version()};
    res.set(http::field::server, "scribe-relay");
    res.set(http::field::content_type, "application/json");
    res.keep_alive(req.keep_alive());
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

// =============================================================================
// HTTP Session (读取一个请求: 普通请求直接应答, 升级请求交给 RelaySession)
// =============================================================================

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, const HttpRoutes& routes)
        : stream_(std::move(socket))
        , routes_(routes) {
    }

    void run() {
        net::dispatch(stream_.get_executor(),
            [self = shared_from_this()]() { self->doRead(); });
    }

private:
    void doRead() {
        request_ = {};
        stream_.expires_after(kHttpReadTimeout);
        http::async_read(stream_, buffer_, request_,
            [self = shared_from_this()](beast::error_code ec, std::size_t) {
                self->onRead(ec);
            });
    }

    void onRead(beast::error_code ec) {
        if (ec == http::error::end_of_stream) {
            stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
            return;
        }
        if (ec) {
            debugLog("RelayServer", "HTTP read failed: ", ec.message());
            return;
        }

        const std::string path = targetPath(request_);

        if (websocket::is_upgrade(request_)) {
            if (path == routes_.dictate_path) {
                stream_.expires_never();
                routes_.upgrade(stream_.release_socket(), std::move(request_));
                return;
            }
            respond(makeJsonResponse(request_, http::status::not_found, {{"error", "Not found"}}));
            return;
        }

        if (path == "/health" || path == "/health/") {
            respond(makeJsonResponse(request_, http::status::ok, {
                {"status", "healthy"},
                {"sessions", routes_.session_count()},
                {"uptime", routes_.uptime_seconds()},
            }));
        } else if (path == "/") {
            respond(makeJsonResponse(request_, http::status::ok, {
                {"service", "scribe-relay"},
                {"status", "running"},
            }));
        } else {
            respond(makeJsonResponse(request_, http::status::not_found, {{"error", "Not found"}}));
        }
    }

    void respond(Response&& response) {
        auto res = std::make_shared<Response>(std::move(response));
        http::async_write(stream_, *res,
            [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
                if (ec) {
                    debugLog("RelayServer", "HTTP write failed: ", ec.message());
                    return;
                }
                if (res->need_eof()) {
                    self->stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
                    return;
                }
                self->doRead();
            });
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    Request request_;
    const HttpRoutes& routes_;
};

}  // namespace

// =============================================================================
// RelayServer::Impl
// =============================================================================

struct RelayServer::Impl {
    RelayConfig config;
    std::shared_ptr<ITokenVerifier> verifier;
    UpstreamFactory upstream_factory;
    HttpRoutes routes;

    net::io_context ioc;
    net::ssl::context ssl_context{net::ssl::context::tls_client};
    tcp::acceptor acceptor{ioc};
    net::signal_set signals{ioc};
    std::optional<net::executor_work_guard<net::io_context::executor_type>> work;
    std::vector<std::thread> threads;

    mutable std::mutex sessions_mutex;
    std::map<std::string, std::weak_ptr<RelaySession>> sessions;

    std::atomic<bool> running{false};
    std::atomic<bool> stopping{false};
    std::chrono::steady_clock::time_point started_at;
    uint16_t bound_port = 0;

    std::mutex state_mutex;
    std::condition_variable state_cv;
    bool stop_requested = false;

    Impl(RelayConfig cfg, std::shared_ptr<ITokenVerifier> v, UpstreamFactory factory)
        : config(std::move(cfg))
        , verifier(std::move(v))
        , upstream_factory(std::move(factory))
        , ioc(std::max(1, config.io_threads)) {
        if (!upstream_factory) {
            upstream_factory = [this](net::any_io_executor executor, UpstreamHandlers handlers) {
                return makeUpstreamConnection(executor, ssl_context, config.upstream, std::move(handlers));
            };
        }
        ssl_context.set_default_verify_paths();
        ssl_context.set_verify_mode(net::ssl::verify_peer);

        routes.dictate_path = config.dictate_path;
        routes.session_count = [this]() { return sessionCount(); };
        routes.uptime_seconds = [this]() {
            return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at).count();
        };
        routes.upgrade = [this](tcp::socket&& socket, Request&& req) {
            acceptSession(std::move(socket), std::move(req));
        };
    }

    size_t sessionCount() const {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        return sessions.size();
    }

    void doAccept() {
        acceptor.async_accept(net::make_strand(ioc),
            [this](beast::error_code ec, tcp::socket socket) {
                if (ec) {
                    if (!acceptor.is_open()) return;
                    safeWarn("RelayServer", "Accept failed: ", ec.message());
                } else {
                    std::make_shared<HttpSession>(std::move(socket), routes)->run();
                }
                if (acceptor.is_open()) {
                    doAccept();
                }
            });
    }

    void acceptSession(tcp::socket&& socket, Request&& req) {
        if (stopping.load()) {
            beast::error_code ec;
            socket.close(ec);
            return;
        }

        std::shared_ptr<RelaySession> session;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex);
            std::string id = generateSessionId();
            while (sessions.count(id)) {
                id = generateSessionId();
            }
            session = std::make_shared<RelaySession>(std::move(socket), id, config, *verifier,
                upstream_factory, [this](const std::string& finished_id) { removeSession(finished_id); });
            sessions[id] = session;
        }
        session->run(std::move(req));
    }

    void removeSession(const std::string& id) {
        std::lock_guard<std::mutex> lock(sessions_mutex);
        sessions.erase(id);
    }

    void closeAllSessions() {
        std::vector<std::shared_ptr<RelaySession>> live;
        {
            std::lock_guard<std::mutex> lock(sessions_mutex);
            for (auto& entry : sessions) {
                if (auto session = entry.second.lock()) {
                    live.push_back(std::move(session));
                }
            }
        }
        for (auto& session : live) {
            session->shutdown();
        }
    }

    void requestStop() {
        {
            std::lock_guard<std::mutex> lock(state_mutex);
            stop_requested = true;
        }
        state_cv.notify_all();
    }
};

// =============================================================================
// RelayServer
// =============================================================================

RelayServer::RelayServer(RelayConfig config, std::shared_ptr<ITokenVerifier> verifier)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(verifier), nullptr)) {
}

RelayServer::RelayServer(RelayConfig config, std::shared_ptr<ITokenVerifier> verifier,
        UpstreamFactory upstream_factory)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(verifier), std::move(upstream_factory))) {
}

RelayServer::~RelayServer() {
    stop();
}

ErrorInfo RelayServer::start() {
    if (impl_->running.load()) {
        return ErrorInfo::error(ErrorCode::ALREADY_STARTED, "Relay server already running");
    }
    if (!impl_->verifier) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Token verifier is required");
    }
    auto validation = ConfigValidator::validate(impl_->config);
    if (!validation.isOk()) {
        return validation;
    }

    beast::error_code ec;
    auto address = net::ip::make_address(impl_->config.bind_address, ec);
    if (ec) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Invalid bind address", ec.message());
    }
    tcp::endpoint endpoint{address, impl_->config.port};

    auto& acceptor = impl_->acceptor;
    acceptor.open(endpoint.protocol(), ec);
    if (!ec) acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (!ec) acceptor.bind(endpoint, ec);
    if (!ec) acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        beast::error_code ignored;
        acceptor.close(ignored);
        return ErrorInfo::error(ErrorCode::CONNECTION_FAILED, "Failed to listen", ec.message());
    }
    impl_->bound_port = acceptor.local_endpoint().port();

    impl_->work.emplace(net::make_work_guard(impl_->ioc));
    impl_->started_at = std::chrono::steady_clock::now();
    impl_->stopping = false;
    impl_->stop_requested = false;
    impl_->running = true;
    impl_->doAccept();

    for (int i = 0; i < std::max(1, impl_->config.io_threads); ++i) {
        impl_->threads.emplace_back([this]() { impl_->ioc.run(); });
    }

    safeLog("RelayServer", "Listening on ", impl_->config.bind_address, ":", impl_->bound_port,
        ", dictate path ", impl_->config.dictate_path);
    return ErrorInfo::ok();
}

void RelayServer::installSignalHandlers() {
    auto& signals = impl_->signals;
    beast::error_code ec;
    signals.add(SIGINT, ec);
    signals.add(SIGTERM, ec);
    if (ec) {
        safeWarn("RelayServer", "Failed to install signal handlers: ", ec.message());
        return;
    }
    signals.async_wait([this](beast::error_code ec, int signal_number) {
        if (ec) return;
        safeLog("RelayServer", "Received signal ", signal_number, ", shutting down");
        impl_->requestStop();
    });
}

void RelayServer::wait() {
    {
        std::unique_lock<std::mutex> lock(impl_->state_mutex);
        impl_->state_cv.wait(lock, [this]() {
            return impl_->stop_requested || !impl_->running.load();
        });
    }
    stop();
}

void RelayServer::stop() {
    if (!impl_->running.exchange(false)) {
        return;
    }
    impl_->stopping = true;
    safeLog("RelayServer", "Stopping, ", impl_->sessionCount(), " active sessions");

    net::post(impl_->ioc, [this]() {
        beast::error_code ec;
        impl_->acceptor.close(ec);
        impl_->signals.cancel(ec);
        impl_->closeAllSessions();
    });
    impl_->work.reset();

    // 给会话完成关闭握手的时间
    const auto deadline = std::chrono::steady_clock::now() + kShutdownDrain;
    while (impl_->sessionCount() > 0 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    impl_->ioc.stop();

    for (auto& thread : impl_->threads) {
        if (!thread.joinable()) continue;
        if (thread.get_id() == std::this_thread::get_id()) {
            thread.detach();
        } else {
            thread.join();
        }
    }
    impl_->threads.clear();

    impl_->requestStop();
    safeLog("RelayServer", "Stopped");
}

uint16_t RelayServer::port() const {
    return impl_->bound_port;
}

size_t RelayServer::sessionCount() const {
    return impl_->sessionCount();
}

bool RelayServer::isRunning() const {
    return impl_->running.load();
}

}  // namespace relay
}  // namespace scribe
