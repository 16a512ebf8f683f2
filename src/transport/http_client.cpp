#include "transport/http_client.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <memory>
#include <mutex>
#include <thread>

#include "scribe_log.hpp"

namespace scribe {
namespace transport {

namespace {

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using CurlHeaders = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

std::once_flag g_curl_init;

size_t writeCallback(void* contents, size_t size, size_t nmemb, void* userp) {
    auto* body = static_cast<std::string*>(userp);
    body->append(static_cast<const char*>(contents), size * nmemb);
    return size * nmemb;
}

bool isTransientStatus(long status) {
    return status == 429 || (status >= 500 && status <= 599);
}

}  // namespace

// =============================================================================
// CurlHttpClient
// =============================================================================

CurlHttpClient::CurlHttpClient() {
    std::call_once(g_curl_init, []() {
        curl_global_init(CURL_GLOBAL_DEFAULT);
    });
}

ErrorInfo CurlHttpClient::post(const HttpRequest& request, HttpResponse& response) {
    response = HttpResponse();

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        safeError("HttpClient", "Failed to init curl");
        return ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Failed to init HTTP client");
    }

    curl_slist* raw_headers = nullptr;
    raw_headers = curl_slist_append(raw_headers, ("Content-Type: " + request.content_type).c_str());
    for (const auto& header : request.headers) {
        raw_headers = curl_slist_append(raw_headers, header.c_str());
    }
    CurlHeaders headers(raw_headers, &curl_slist_free_all);

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "scribe/1.0");

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        // 详情可能包含 URL
        return ErrorInfo::error(ErrorCode::NETWORK_ERROR, "Network request failed",
            maskSensitive(curl_easy_strerror(res)));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    if (response.status == 401 || response.status == 403) {
        return ErrorInfo::error(ErrorCode::AUTH_FAILED, "Request was not authorized",
            "HTTP " + std::to_string(response.status));
    }
    if (response.status < 200 || response.status >= 300) {
        return ErrorInfo::error(ErrorCode::HTTP_ERROR, "Request failed",
            "HTTP " + std::to_string(response.status));
    }
    return ErrorInfo::ok();
}

// =============================================================================
// Retry
// =============================================================================

bool isTransient(const ErrorInfo& error, long status) {
    if (error.code == ErrorCode::NETWORK_ERROR) return true;
    if (error.code == ErrorCode::HTTP_ERROR) return isTransientStatus(status);
    return false;
}

int backoffDelayMs(const RetryPolicy& policy, int attempt) {
    if (attempt <= 0) return 0;
    double delay = policy.initial_backoff_ms * std::pow(policy.multiplier, attempt - 1);
    return static_cast<int>(std::min<double>(delay, policy.max_backoff_ms));
}

ErrorInfo postWithRetry(IHttpClient& client, const HttpRequest& request,
        const RetryPolicy& policy, HttpResponse& response,
        const std::function<bool()>& cancelled) {
    const int max_attempts = std::max(1, policy.max_attempts);
    ErrorInfo result;

    for (int attempt = 0; attempt < max_attempts; ++attempt) {
        if (attempt > 0) {
            const int delay = backoffDelayMs(policy, attempt);
            debugLog("HttpClient", "Retry ", attempt, " in ", delay, "ms");
            const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay);
            while (std::chrono::steady_clock::now() < until) {
                if (cancelled && cancelled()) {
                    return result;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        }

        result = client.post(request, response);
        if (result.isOk() || !isTransient(result, response.status)) {
            return result;
        }
        safeWarn("HttpClient", "Attempt ", attempt + 1, "/", max_attempts, " failed: ",
            errorCodeToString(result.code), " ", result.detail);
        if (cancelled && cancelled()) {
            return result;
        }
    }
    return result;
}

std::string bearerHeader(const std::string& token) {
    return "Authorization: Bearer " + token;
}

}  // namespace transport
}  // namespace scribe
