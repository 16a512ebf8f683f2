#include "summary/summary_service.hpp"

#include <nlohmann/json.hpp>

#include "scribe_log.hpp"

namespace scribe {
namespace summary {

using json = nlohmann::json;

std::string truncateSummary(const std::string& summary, size_t max_chars) {
    if (summary.size() <= max_chars) {
        return summary;
    }
    return summary.substr(0, max_chars) + "...";
}

std::string buildSummaryRequestBody(const SummaryRequest& request) {
    json preferences = json::parse(request.preferences_json, nullptr, false);
    if (preferences.is_discarded() || !preferences.is_object()) {
        preferences = json::object();
    }

    json body = {
        {"transcriptDelta", request.transcript_delta},
        {"preferences", preferences},
    };
    if (request.running_summary.empty()) {
        body["runningSummary"] = nullptr;
    } else {
        body["runningSummary"] = request.running_summary;
    }
    return body.dump();
}

ErrorInfo parseSummaryResponse(const std::string& body, std::string& summary) {
    json data = json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return ErrorInfo::error(ErrorCode::PROTOCOL_DECODE_ERROR, "Invalid summary response");
    }

    auto error = data.find("error");
    if (error != data.end() && error->is_string()) {
        return ErrorInfo::error(ErrorCode::HTTP_ERROR, "Summary service error",
            maskSensitive(error->get<std::string>()));
    }

    for (const char* key : {"runningSummary", "summary"}) {
        auto it = data.find(key);
        if (it != data.end() && it->is_string() && !it->get<std::string>().empty()) {
            summary = it->get<std::string>();
            return ErrorInfo::ok();
        }
    }
    return ErrorInfo::error(ErrorCode::PROTOCOL_DECODE_ERROR, "Summary response is empty");
}

// =============================================================================
// CurlSummaryService
// =============================================================================

CurlSummaryService::CurlSummaryService(SummaryConfig config,
        std::shared_ptr<transport::IHttpClient> http)
    : config_(std::move(config))
    , http_(std::move(http)) {
}

ErrorInfo CurlSummaryService::summarize(const SummaryRequest& request, std::string& summary) {
    if (config_.endpoint.empty()) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Summary endpoint is not configured");
    }

    transport::HttpRequest http_request;
    http_request.url = config_.endpoint;
    http_request.body = buildSummaryRequestBody(request);
    http_request.timeout_ms = config_.request_timeout_ms;
    if (!config_.access_token.empty()) {
        http_request.headers.push_back(transport::bearerHeader(config_.access_token));
    }
    if (!config_.api_key.empty()) {
        http_request.headers.push_back("apikey: " + config_.api_key);
    }

    transport::HttpResponse response;
    auto result = transport::postWithRetry(*http_, http_request, config_.retry, response,
        [this]() { return cancelled_.load(); });
    if (!result.isOk()) {
        return result;
    }
    return parseSummaryResponse(response.body, summary);
}

}  // namespace summary
}  // namespace scribe
