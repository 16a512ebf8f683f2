#ifndef SCRIBE_SUMMARY_SUMMARY_SERVICE_HPP
#define SCRIBE_SUMMARY_SUMMARY_SERVICE_HPP

#include <atomic>
#include <memory>
#include <string>

#include "../scribe_config.hpp"
#include "../scribe_types.hpp"
#include "../transport/http_client.hpp"

namespace scribe {
namespace summary {

// =============================================================================
// Summary Service (外部摘要接口)
// =============================================================================
//
//   请求: {transcriptDelta, runningSummary, preferences}
//   响应: {runningSummary}
//

struct SummaryRequest {
    std::string transcript_delta;
    std::string running_summary;        // 空表示第一次
    std::string preferences_json = "{}";
};

class ISummaryService {
public:
    virtual ~ISummaryService() = default;

    /// @brief 同步调用 (在节流器的 worker 线程中执行)
    virtual ErrorInfo summarize(const SummaryRequest& request, std::string& summary) = 0;

    /// @brief 放弃剩余重试 (shutdown 时调用)
    virtual void cancel() {}
};

/// @brief 超过 max_chars 时截断并追加 "..."
std::string truncateSummary(const std::string& summary, size_t max_chars);

/// @brief 请求体 JSON
std::string buildSummaryRequestBody(const SummaryRequest& request);

/// @brief 解析响应, 读取 runningSummary (或 summary); 包含 error 时返回错误
ErrorInfo parseSummaryResponse(const std::string& body, std::string& summary);

// -----------------------------------------------------------------------------
// HTTP 实现
// -----------------------------------------------------------------------------

class CurlSummaryService : public ISummaryService {
public:
    explicit CurlSummaryService(SummaryConfig config,
            std::shared_ptr<transport::IHttpClient> http = std::make_shared<transport::CurlHttpClient>());

    ErrorInfo summarize(const SummaryRequest& request, std::string& summary) override;
    void cancel() override { cancelled_ = true; }

private:
    SummaryConfig config_;
    std::shared_ptr<transport::IHttpClient> http_;
    std::atomic<bool> cancelled_{false};
};

}  // namespace summary
}  // namespace scribe

#endif  // SCRIBE_SUMMARY_SUMMARY_SERVICE_HPP
