#include "summary/summary_throttler.hpp"

#include <algorithm>
#include <exception>

#include "scribe_log.hpp"

namespace scribe {
namespace summary {

namespace {

size_t trimmedLength(const std::string& text) {
    const auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return 0;
    const auto end = text.find_last_not_of(" \t\r\n");
    return end - begin + 1;
}

int64_t unixMillis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

}  // namespace

SummaryThrottler::SummaryThrottler(SummaryConfig config, std::shared_ptr<ISummaryService> service)
    : config_(std::move(config))
    , service_(std::move(service)) {
    worker_ = std::thread([this]() { workerLoop(); });
}

SummaryThrottler::~SummaryThrottler() {
    shutdown();
}

void SummaryThrottler::setCallback(SummaryCallback on_summary, FailureCallback on_failure) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_summary_ = std::move(on_summary);
    on_failure_ = std::move(on_failure);
}

// =============================================================================
// Scheduling
// =============================================================================

void SummaryThrottler::onTranscriptDelta(const std::string& full_transcript) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) return;
    latest_transcript_ = full_transcript;

    if (in_flight_) {
        debugLog("Summary", "Call in flight, skipping schedule");
        return;
    }
    if (full_transcript.size() < last_summarized_length_ ||
        full_transcript.size() - last_summarized_length_ < config_.min_delta_chars) {
        return;
    }

    const auto now = Clock::now();
    auto wait = std::chrono::milliseconds(0);
    if (last_call_at_) {
        const auto since = std::chrono::duration_cast<std::chrono::milliseconds>(now - *last_call_at_);
        wait = std::max(std::chrono::milliseconds(0), std::chrono::milliseconds(config_.debounce_ms) - since);
    }

    // 只有一个定时, 新的增量原地重排
    scheduled_at_ = now + wait;
    debugLog("Summary", "Scheduling summary in ", wait.count(), "ms, delta: ",
        full_transcript.size() - last_summarized_length_, " chars");
    cv_.notify_all();
}

void SummaryThrottler::requestFinal(const std::string& full_transcript) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) return;
    latest_transcript_ = full_transcript;
    final_requested_ = true;
    cv_.notify_all();
}

void SummaryThrottler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++epoch_;
    latest_transcript_.clear();
    running_summary_.clear();
    scheduled_at_.reset();
    last_call_at_.reset();
    last_summarized_length_ = 0;
    final_requested_ = false;
    diagnostics_ = SummaryDiagnostics();
}

void SummaryThrottler::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (shutting_down_ && !worker_.joinable()) return;
        shutting_down_ = true;
        scheduled_at_.reset();
        final_requested_ = false;
    }
    cv_.notify_all();
    if (service_) {
        service_->cancel();
    }
    if (worker_.joinable()) {
        worker_.join();
    }
}

// =============================================================================
// Worker
// =============================================================================

bool SummaryThrottler::takeDueCall(std::unique_lock<std::mutex>& lock, std::string& transcript) {
    (void)lock;
    const auto now = Clock::now();
    const bool final_due = final_requested_;
    const bool timer_due = scheduled_at_ && now >= *scheduled_at_;
    if (!final_due && !timer_due) {
        return false;
    }

    final_requested_ = false;
    scheduled_at_.reset();

    if (latest_transcript_.size() <= last_summarized_length_) {
        return false;
    }
    const std::string delta = latest_transcript_.substr(last_summarized_length_);
    const size_t meaningful = trimmedLength(delta);
    if (meaningful == 0 || (!final_due && meaningful < config_.min_trimmed_delta_chars)) {
        return false;
    }
    transcript = latest_transcript_;
    return true;
}

void SummaryThrottler::workerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (!shutting_down_) {
        std::string transcript;
        if (takeDueCall(lock, transcript)) {
            in_flight_ = true;
            const uint64_t epoch = epoch_;
            lock.unlock();
            runCall(transcript, epoch);
            lock.lock();
            continue;
        }

        if (scheduled_at_) {
            cv_.wait_until(lock, *scheduled_at_);
        } else {
            cv_.wait(lock);
        }
    }
}

void SummaryThrottler::runCall(const std::string& transcript, uint64_t epoch) {
    // 所有退出路径都清除 in-flight
    struct InFlightGuard {
        SummaryThrottler* self;
        ~InFlightGuard() {
            std::lock_guard<std::mutex> lock(self->mutex_);
            self->in_flight_ = false;
        }
    } guard{this};

    SummaryRequest request;
    SummaryCallback on_summary;
    FailureCallback on_failure;
    size_t from = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        from = std::min(last_summarized_length_, transcript.size());
        request.running_summary = running_summary_;
        on_summary = on_summary_;
        on_failure = on_failure_;
        diagnostics_.call_count++;
        diagnostics_.last_call_at_ms = unixMillis();
    }
    request.transcript_delta = transcript.substr(from);
    request.preferences_json = config_.preferences_json;

    safeLog("Summary", "Updating running summary, delta: ", request.transcript_delta.size(), " chars");

    std::string summary;
    ErrorInfo result;
    if (!service_) {
        result = ErrorInfo::error(ErrorCode::INVALID_CONFIG, "No summary service configured");
    } else {
        try {
            result = service_->summarize(request, summary);
        } catch (const std::exception& e) {
            result = ErrorInfo::error(ErrorCode::INTERNAL_ERROR, "Summary call threw", e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch != epoch_) {
            // reset() 之后到达的结果
            return;
        }
        last_call_at_ = Clock::now();
        if (result.isOk()) {
            running_summary_ = truncateSummary(summary, config_.max_summary_chars);
            last_summarized_length_ = transcript.size();
            diagnostics_.last_error_code = ErrorCode::OK;
            diagnostics_.last_error.clear();
            summary = running_summary_;
        } else {
            diagnostics_.failure_count++;
            diagnostics_.last_error_code = result.code;
            diagnostics_.last_error = result.message;
            // debounce 之后重试同一段增量
            if (!shutting_down_ && !scheduled_at_) {
                scheduled_at_ = *last_call_at_ + std::chrono::milliseconds(config_.debounce_ms);
            }
        }
    }

    if (result.isOk()) {
        safeLog("Summary", "Summary updated, length: ", summary.size());
        debugLogPHI("Summary", summary);
        if (on_summary) on_summary(summary);
    } else {
        // 只记录, 不作为会话错误
        safeWarn("Summary", "Summary update failed: ", errorCodeToString(result.code), " ", result.message);
        if (on_failure) on_failure(result);
    }
}

// =============================================================================
// Queries
// =============================================================================

std::string SummaryThrottler::runningSummary() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_summary_;
}

SummaryDiagnostics SummaryThrottler::diagnostics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    SummaryDiagnostics snapshot = diagnostics_;
    snapshot.in_flight = in_flight_;
    snapshot.scheduled = scheduled_at_.has_value();
    snapshot.last_summarized_length = last_summarized_length_;
    return snapshot;
}

bool SummaryThrottler::inFlight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_;
}

}  // namespace summary
}  // namespace scribe
