// Tests for HTTP retry policy and the HTTP-backed summary / chunk services

#include <atomic>
#include <cassert>
#include <chrono>
#include <deque>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "engine/chunk_upload_engine.hpp"
#include "scribe_config.hpp"
#include "summary/summary_service.hpp"
#include "transport/http_client.hpp"

using namespace scribe;
using namespace scribe::transport;
using json = nlohmann::json;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

// 按脚本返回结果的 HTTP 客户端
class ScriptedHttpClient : public IHttpClient {
public:
    struct Reply {
        ErrorInfo result;
        long status;
        std::string body;
    };

    void push(ErrorInfo result, long status, const std::string& body = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        replies_.push_back({result, status, body});
    }

    ErrorInfo post(const HttpRequest& request, HttpResponse& response) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (replies_.empty()) {
            response.status = 200;
            response.body = "{}";
            return ErrorInfo::ok();
        }
        Reply reply = replies_.front();
        replies_.pop_front();
        response.status = reply.status;
        response.body = reply.body;
        return reply.result;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    HttpRequest request(size_t i) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.at(i);
    }

private:
    mutable std::mutex mutex_;
    std::deque<Reply> replies_;
    std::vector<HttpRequest> requests_;
};

RetryPolicy fastRetry(int attempts) {
    RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_backoff_ms = 10;
    policy.multiplier = 2.0;
    policy.max_backoff_ms = 40;
    return policy;
}

ErrorInfo httpError(long status) {
    return ErrorInfo::error(ErrorCode::HTTP_ERROR, "HTTP " + std::to_string(status));
}

bool hasHeader(const HttpRequest& request, const std::string& header) {
    for (const auto& h : request.headers) {
        if (h == header) return true;
    }
    return false;
}

}  // namespace

// ============================================================================
// Retry policy
// ============================================================================

void test_transient_classification() {
    auto network = ErrorInfo::error(ErrorCode::NETWORK_ERROR, "reset");
    assert(isTransient(network, 0));
    assert(isTransient(httpError(429), 429));
    assert(isTransient(httpError(503), 503));
    assert(!isTransient(httpError(400), 400));
    assert(!isTransient(httpError(404), 404));
    assert(!isTransient(ErrorInfo::error(ErrorCode::AUTH_FAILED, "401"), 401));
    assert(!isTransient(ErrorInfo::ok(), 200));
    test_passed("transient classification");
}

void test_backoff_delays() {
    RetryPolicy policy;
    assert(backoffDelayMs(policy, 0) == 0);
    assert(backoffDelayMs(policy, 1) == 500);
    assert(backoffDelayMs(policy, 2) == 1000);
    assert(backoffDelayMs(policy, 3) == 2000);
    assert(backoffDelayMs(policy, 4) == 4000);
    assert(backoffDelayMs(policy, 8) == 4000);
    test_passed("backoff delays");
}

void test_retry_until_success() {
    ScriptedHttpClient http;
    http.push(ErrorInfo::error(ErrorCode::NETWORK_ERROR, "timeout"), 0);
    http.push(httpError(502), 502);
    http.push(ErrorInfo::ok(), 200, R"({"ok":true})");

    HttpRequest request;
    request.url = "https://api.example.com/summarize";
    HttpResponse response;
    auto result = postWithRetry(http, request, fastRetry(3), response);
    assert(result.isOk());
    assert(http.calls() == 3);
    assert(response.body == R"({"ok":true})");
    test_passed("retry until success");
}

void test_permanent_failure_not_retried() {
    ScriptedHttpClient http;
    http.push(httpError(400), 400, R"({"error":"bad"})");

    HttpResponse response;
    auto result = postWithRetry(http, HttpRequest(), fastRetry(3), response);
    assert(result.code == ErrorCode::HTTP_ERROR);
    assert(http.calls() == 1);
    assert(response.status == 400);
    test_passed("permanent failure not retried");
}

void test_attempts_exhausted() {
    ScriptedHttpClient http;
    for (int i = 0; i < 5; ++i) {
        http.push(httpError(503), 503);
    }
    HttpResponse response;
    auto result = postWithRetry(http, HttpRequest(), fastRetry(2), response);
    assert(result.code == ErrorCode::HTTP_ERROR);
    assert(http.calls() == 2);

    // 单次策略不重试
    ScriptedHttpClient once;
    once.push(httpError(503), 503);
    result = postWithRetry(once, HttpRequest(), RetryPolicy::none(), response);
    assert(!result.isOk());
    assert(once.calls() == 1);
    test_passed("attempts exhausted");
}

void test_cancel_stops_retries() {
    ScriptedHttpClient http;
    for (int i = 0; i < 3; ++i) {
        http.push(ErrorInfo::error(ErrorCode::NETWORK_ERROR, "down"), 0);
    }
    RetryPolicy slow = fastRetry(3);
    slow.initial_backoff_ms = 5000;
    slow.max_backoff_ms = 5000;

    std::atomic<bool> cancelled{false};
    HttpResponse response;
    const auto begin = std::chrono::steady_clock::now();
    auto result = postWithRetry(http, HttpRequest(), slow, response, [&cancelled]() {
        return cancelled.exchange(true);
    });
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - begin).count();
    assert(result.code == ErrorCode::NETWORK_ERROR);
    assert(http.calls() == 1);
    assert(elapsed < 1000);
    test_passed("cancel stops retries");
}

void test_bearer_header() {
    assert(bearerHeader("abc") == "Authorization: Bearer abc");
    test_passed("bearer header");
}

// ============================================================================
// HTTP-backed services
// ============================================================================

void test_summary_service_request() {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(ErrorInfo::ok(), 200, R"({"runningSummary":"Chest pain, stable vitals."})");

    SummaryConfig config;
    config.endpoint = "https://api.example.com/functions/v1/summarize";
    config.access_token = "user-jwt";
    config.api_key = "anon-key";
    config.retry = fastRetry(2);
    summary::CurlSummaryService service(config, http);

    summary::SummaryRequest request;
    request.transcript_delta = "patient reports chest pain";
    std::string result;
    assert(service.summarize(request, result).isOk());
    assert(result == "Chest pain, stable vitals.");

    auto sent = http->request(0);
    assert(sent.url == config.endpoint);
    assert(hasHeader(sent, "Authorization: Bearer user-jwt"));
    assert(hasHeader(sent, "apikey: anon-key"));
    assert(json::parse(sent.body)["transcriptDelta"] == "patient reports chest pain");
    test_passed("summary service request");
}

void test_summary_service_errors() {
    auto http = std::make_shared<ScriptedHttpClient>();
    summary::CurlSummaryService unconfigured(SummaryConfig(), http);
    std::string result;
    assert(unconfigured.summarize(summary::SummaryRequest(), result).code == ErrorCode::INVALID_CONFIG);
    assert(http->calls() == 0);

    SummaryConfig config;
    config.endpoint = "https://api.example.com/summarize";
    config.retry = fastRetry(1);
    summary::CurlSummaryService service(config, http);
    http->push(ErrorInfo::error(ErrorCode::AUTH_FAILED, "HTTP 401"), 401);
    assert(service.summarize(summary::SummaryRequest(), result).code == ErrorCode::AUTH_FAILED);

    http->push(ErrorInfo::ok(), 200, R"({"error":"model overloaded"})");
    assert(service.summarize(summary::SummaryRequest(), result).code == ErrorCode::HTTP_ERROR);
    test_passed("summary service errors");
}

void test_chunk_transcriber_request() {
    auto http = std::make_shared<ScriptedHttpClient>();
    http->push(httpError(503), 503);
    http->push(ErrorInfo::ok(), 200, R"({"text":"no known allergies"})");

    ChunkConfig config;
    config.endpoint = "https://api.example.com/transcribe";
    config.access_token = "user-jwt";
    config.retry = fastRetry(3);
    engine::CurlChunkTranscriber transcriber(config, http);

    engine::ChunkRequest request;
    request.session_id = "chunk-abc";
    request.wav = {'R', 'I', 'F', 'F'};
    std::string text;
    assert(transcriber.transcribe(request, text).isOk());
    assert(text == "no known allergies");
    assert(http->calls() == 2);

    auto body = json::parse(http->request(1).body);
    assert(body["audio"] == "UklGRg==");
    assert(body["mimeType"] == "audio/wav");
    assert(body["sessionId"] == "chunk-abc");
    assert(hasHeader(http->request(1), "Authorization: Bearer user-jwt"));
    test_passed("chunk transcriber request");
}

int main() {
    std::cout << "=== HTTP Retry Tests ===" << std::endl;

    test_transient_classification();
    test_backoff_delays();
    test_retry_until_success();
    test_permanent_failure_not_retried();
    test_attempts_exhausted();
    test_cancel_stops_retries();
    test_bearer_header();
    test_summary_service_request();
    test_summary_service_errors();
    test_chunk_transcriber_request();

    std::cout << "All HTTP retry tests passed" << std::endl;
    return 0;
}
