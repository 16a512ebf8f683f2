// Tests for the running-summary throttler and summary wire format

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "scribe_config.hpp"
#include "summary/summary_service.hpp"
#include "summary/summary_throttler.hpp"

using namespace scribe;
using namespace scribe::summary;
using json = nlohmann::json;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

bool waitFor(const std::function<bool()>& predicate, int timeout_ms = 2000) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// 记录请求的假摘要服务
class FakeSummaryService : public ISummaryService {
public:
    ErrorInfo summarize(const SummaryRequest& request, std::string& summary) override {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(request);
        if (fail_next_ > 0) {
            --fail_next_;
            return ErrorInfo::error(ErrorCode::HTTP_ERROR, "Summary service error");
        }
        summary = reply_.empty() ? "summary " + std::to_string(requests_.size()) : reply_;
        return ErrorInfo::ok();
    }

    void cancel() override { cancelled_ = true; }

    void failNext(int n) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_next_ = n;
    }

    void setReply(const std::string& reply) {
        std::lock_guard<std::mutex> lock(mutex_);
        reply_ = reply;
    }

    size_t calls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.size();
    }

    SummaryRequest request(size_t i) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_.at(i);
    }

    bool cancelled() const { return cancelled_.load(); }

private:
    mutable std::mutex mutex_;
    std::vector<SummaryRequest> requests_;
    int fail_next_ = 0;
    std::string reply_;
    std::atomic<bool> cancelled_{false};
};

// 每次调用耗时 delay_ms, 记录同时进行的调用数峰值
class SlowSummaryService : public ISummaryService {
public:
    explicit SlowSummaryService(int delay_ms) : delay_ms_(delay_ms) {}

    ErrorInfo summarize(const SummaryRequest& request, std::string& summary) override {
        (void)request;
        const int now = ++active_;
        int peak = peak_.load();
        while (now > peak && !peak_.compare_exchange_weak(peak, now)) {
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms_));
        ++calls_;
        --active_;
        summary = "summary";
        return ErrorInfo::ok();
    }

    void cancel() override {}

    int peak() const { return peak_.load(); }
    int calls() const { return calls_.load(); }

private:
    int delay_ms_;
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
    std::atomic<int> calls_{0};
};

SummaryConfig testConfig(int debounce_ms) {
    SummaryConfig config = SummaryConfig().withDebounce(debounce_ms);
    config.preferences_json = R"({"style":"SOAP"})";
    return config;
}

}  // namespace

// ============================================================================
// Throttling
// ============================================================================

void test_small_delta_not_summarized() {
    auto service = std::make_shared<FakeSummaryService>();
    SummaryThrottler throttler(testConfig(50), service);

    throttler.onTranscriptDelta(std::string(99, 'a'));
    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    assert(service->calls() == 0);
    assert(!throttler.diagnostics().scheduled);
    test_passed("small delta not summarized");
}

void test_first_call_immediate() {
    auto service = std::make_shared<FakeSummaryService>();
    SummaryThrottler throttler(testConfig(200), service);

    std::mutex mutex;
    std::vector<std::string> delivered;
    throttler.setCallback([&](const std::string& summary) {
        std::lock_guard<std::mutex> lock(mutex);
        delivered.push_back(summary);
    });

    const std::string transcript(120, 'x');
    throttler.onTranscriptDelta(transcript);
    assert(waitFor([&] { return !throttler.runningSummary().empty(); }));

    assert(service->calls() == 1);
    auto request = service->request(0);
    assert(request.running_summary.empty());
    assert(request.transcript_delta == transcript);
    assert(request.preferences_json == R"({"style":"SOAP"})");
    assert(throttler.runningSummary() == "summary 1");

    assert(waitFor([&] {
        std::lock_guard<std::mutex> lock(mutex);
        return delivered.size() == 1;
    }));
    auto diag = throttler.diagnostics();
    assert(diag.call_count == 1);
    assert(diag.last_summarized_length == transcript.size());
    assert(diag.last_call_at_ms > 0);
    test_passed("first call immediate");
}

void test_second_call_debounced() {
    auto service = std::make_shared<FakeSummaryService>();
    SummaryThrottler throttler(testConfig(300), service);

    std::string transcript(120, 'x');
    throttler.onTranscriptDelta(transcript);
    assert(waitFor([&] { return service->calls() == 1 && !throttler.inFlight(); }));

    transcript += " " + std::string(119, 'y');
    throttler.onTranscriptDelta(transcript);
    assert(throttler.diagnostics().scheduled);

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(service->calls() == 1);

    assert(waitFor([&] { return service->calls() == 2; }));
    auto request = service->request(1);
    assert(request.running_summary == "summary 1");
    assert(request.transcript_delta == " " + std::string(119, 'y'));
    assert(waitFor([&] { return throttler.runningSummary() == "summary 2"; }));
    test_passed("second call debounced");
}

void test_whitespace_delta_skipped() {
    auto service = std::make_shared<FakeSummaryService>();
    SummaryThrottler throttler(testConfig(0), service);

    throttler.onTranscriptDelta(std::string(100, ' ') + "short text");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(service->calls() == 0);
    test_passed("whitespace delta skipped");
}

void test_final_ignores_debounce_and_delta() {
    auto service = std::make_shared<FakeSummaryService>();
    SummaryThrottler throttler(testConfig(60000), service);

    std::string transcript(120, 'x');
    throttler.onTranscriptDelta(transcript);
    assert(waitFor([&] { return service->calls() == 1 && !throttler.inFlight(); }));

    transcript += " patient stable";
    throttler.requestFinal(transcript);
    assert(waitFor([&] { return service->calls() == 2; }));
    assert(service->request(1).transcript_delta == " patient stable");

    // 没有新增文本时不调用
    throttler.requestFinal(transcript);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    assert(service->calls() == 2);
    test_passed("final ignores debounce and delta");
}

void test_failure_retried_after_debounce() {
    auto service = std::make_shared<FakeSummaryService>();
    service->failNext(1);
    SummaryThrottler throttler(testConfig(100), service);

    std::atomic<int> failures{0};
    throttler.setCallback(nullptr, [&failures](const ErrorInfo& error) {
        assert(error.code == ErrorCode::HTTP_ERROR);
        ++failures;
    });

    const std::string transcript(150, 'z');
    throttler.onTranscriptDelta(transcript);
    assert(waitFor([&] { return failures.load() == 1; }));
    auto diag = throttler.diagnostics();
    assert(diag.failure_count == 1);
    assert(diag.last_error_code == ErrorCode::HTTP_ERROR);
    assert(throttler.runningSummary().empty());

    assert(waitFor([&] { return service->calls() == 2; }));
    assert(service->request(1).transcript_delta == transcript);
    assert(waitFor([&] { return !throttler.runningSummary().empty(); }));
    assert(throttler.diagnostics().last_error_code == ErrorCode::OK);
    test_passed("failure retried after debounce");
}

void test_summary_truncated() {
    auto service = std::make_shared<FakeSummaryService>();
    service->setReply(std::string(2000, 's'));
    SummaryThrottler throttler(testConfig(0), service);

    throttler.onTranscriptDelta(std::string(120, 'x'));
    assert(waitFor([&] { return !throttler.runningSummary().empty(); }));
    const auto summary = throttler.runningSummary();
    assert(summary.size() == 1203);
    assert(summary.substr(1200) == "...");
    test_passed("summary truncated");
}

void test_single_flight_under_rapid_deltas() {
    auto service = std::make_shared<SlowSummaryService>(30);
    SummaryThrottler throttler(testConfig(1), service);

    std::atomic<bool> feeding{true};
    std::thread finals([&]() {
        std::string transcript;
        while (feeding.load()) {
            transcript += std::string(60, 'f') + " ";
            throttler.requestFinal(transcript);
            std::this_thread::sleep_for(std::chrono::milliseconds(3));
        }
    });

    std::string transcript;
    for (int i = 0; i < 3000; ++i) {
        transcript += "patient reports intermittent chest pain radiating to the left arm ";
        throttler.onTranscriptDelta(transcript);
        if (i % 100 == 0) {
            assert(service->peak() <= 1);
        }
    }
    feeding = false;
    finals.join();

    assert(waitFor([&] { return !throttler.inFlight(); }, 5000));
    assert(service->calls() >= 1);
    assert(service->peak() == 1);
    throttler.shutdown();
    assert(service->peak() == 1);
    test_passed("single flight under rapid deltas");
}

void test_reset_and_shutdown() {
    auto service = std::make_shared<FakeSummaryService>();
    SummaryThrottler throttler(testConfig(0), service);

    throttler.onTranscriptDelta(std::string(120, 'x'));
    assert(waitFor([&] { return !throttler.runningSummary().empty() && !throttler.inFlight(); }));

    throttler.reset();
    assert(throttler.runningSummary().empty());
    assert(throttler.diagnostics().call_count == 0);
    assert(throttler.diagnostics().last_summarized_length == 0);

    throttler.shutdown();
    assert(service->cancelled());
    throttler.onTranscriptDelta(std::string(500, 'x'));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    assert(service->calls() == 1);
    test_passed("reset and shutdown");
}

// ============================================================================
// Wire format
// ============================================================================

void test_request_body() {
    SummaryRequest request;
    request.transcript_delta = "bp 120/80";
    request.preferences_json = "not json";
    auto body = json::parse(buildSummaryRequestBody(request));
    assert(body["transcriptDelta"] == "bp 120/80");
    assert(body["runningSummary"].is_null());
    assert(body["preferences"].is_object() && body["preferences"].empty());

    request.running_summary = "prior";
    request.preferences_json = R"({"length":"short"})";
    body = json::parse(buildSummaryRequestBody(request));
    assert(body["runningSummary"] == "prior");
    assert(body["preferences"]["length"] == "short");
    test_passed("request body");
}

void test_parse_response() {
    std::string summary;
    assert(parseSummaryResponse(R"({"runningSummary":"A"})", summary).isOk());
    assert(summary == "A");
    assert(parseSummaryResponse(R"({"summary":"B"})", summary).isOk());
    assert(summary == "B");
    assert(parseSummaryResponse(R"({"error":"quota"})", summary).code == ErrorCode::HTTP_ERROR);
    assert(parseSummaryResponse("<html>", summary).code == ErrorCode::PROTOCOL_DECODE_ERROR);
    assert(parseSummaryResponse(R"({"runningSummary":""})", summary).code == ErrorCode::PROTOCOL_DECODE_ERROR);
    assert(truncateSummary("abc", 3) == "abc");
    assert(truncateSummary("abcd", 3) == "abc...");
    test_passed("parse response");
}

int main() {
    std::cout << "=== Summary Throttler Tests ===" << std::endl;

    test_small_delta_not_summarized();
    test_first_call_immediate();
    test_second_call_debounced();
    test_whitespace_delta_skipped();
    test_final_ignores_debounce_and_delta();
    test_failure_retried_after_debounce();
    test_summary_truncated();
    test_single_flight_under_rapid_deltas();
    test_reset_and_shutdown();
    test_request_body();
    test_parse_response();

    std::cout << "All summary throttler tests passed" << std::endl;
    return 0;
}
