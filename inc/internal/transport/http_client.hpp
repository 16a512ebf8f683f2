#ifndef SCRIBE_TRANSPORT_HTTP_CLIENT_HPP
#define SCRIBE_TRANSPORT_HTTP_CLIENT_HPP

#include <functional>
#include <string>
#include <vector>

#include "../scribe_config.hpp"
#include "../scribe_types.hpp"

namespace scribe {
namespace transport {

// =============================================================================
// HTTP Client (摘要与分块上传使用的 JSON POST)
// =============================================================================

struct HttpRequest {
    std::string url;
    std::string body;
    std::string content_type = "application/json";
    std::vector<std::string> headers;       // "Name: value"
    int timeout_ms = 30000;
};

struct HttpResponse {
    long status = 0;
    std::string body;
};

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    /// @brief 发送 POST
    /// @return 网络失败为 NETWORK_ERROR; 非 2xx 为 HTTP_ERROR (401/403 为 AUTH_FAILED)
    virtual ErrorInfo post(const HttpRequest& request, HttpResponse& response) = 0;
};

// -----------------------------------------------------------------------------
// libcurl 实现
// -----------------------------------------------------------------------------

class CurlHttpClient : public IHttpClient {
public:
    CurlHttpClient();

    ErrorInfo post(const HttpRequest& request, HttpResponse& response) override;
};

// -----------------------------------------------------------------------------
// 重试
// -----------------------------------------------------------------------------

/// @brief 网络错误、429 与 5xx 可重试
bool isTransient(const ErrorInfo& error, long status);

/// @brief 第 attempt 次重试前的等待 (attempt 从 1 开始)
int backoffDelayMs(const RetryPolicy& policy, int attempt);

/// @brief 按策略重试瞬时失败
/// @param cancelled 返回 true 时放弃剩余重试
ErrorInfo postWithRetry(IHttpClient& client, const HttpRequest& request,
        const RetryPolicy& policy, HttpResponse& response,
        const std::function<bool()>& cancelled = nullptr);

/// @brief "Authorization: Bearer <token>"
std::string bearerHeader(const std::string& token);

}  // namespace transport
}  // namespace scribe

#endif  // SCRIBE_TRANSPORT_HTTP_CLIENT_HPP
