#include "client/transcript_reconciler.hpp"

#include <algorithm>
#include <cctype>

#include "scribe_log.hpp"

namespace scribe {
namespace client {

namespace {

bool isSpace(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

std::string trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isSpace(text[begin])) ++begin;
    while (end > begin && isSpace(text[end - 1])) --end;
    return text.substr(begin, end - begin);
}

std::string trimStart(const std::string& text) {
    size_t begin = 0;
    while (begin < text.size() && isSpace(text[begin])) ++begin;
    return text.substr(begin);
}

bool equalsIgnoreCase(const char* a, const char* b, size_t n) {
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

TranscriptReconciler::TranscriptReconciler(size_t window)
    : window_(window == 0 ? 80 : window) {
}

size_t TranscriptReconciler::overlapLength(const std::string& tail, const std::string& text) {
    const size_t max_check = std::min(tail.size(), text.size());
    for (size_t len = max_check; len > 0; --len) {
        if (equalsIgnoreCase(tail.data() + tail.size() - len, text.data(), len)) {
            return len;
        }
    }
    return 0;
}

std::optional<std::string> TranscriptReconciler::prepare(const std::string& result_id,
        const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!result_id.empty()) {
        if (!seen_ids_.insert(result_id).second) {
            return std::nullopt;
        }
    }

    std::string candidate = trim(text);
    if (candidate.empty()) {
        return std::nullopt;
    }

    const size_t overlap = overlapLength(tail_, candidate);
    if (overlap > 0) {
        candidate = trimStart(candidate.substr(overlap));
        debugLog("Reconciler", "Trimmed overlap of ", overlap, " chars");
    }
    if (candidate.empty()) {
        return std::nullopt;
    }
    return candidate + " ";
}

void TranscriptReconciler::accept(const std::string& inserted) {
    if (inserted.empty()) return;

    std::lock_guard<std::mutex> lock(mutex_);
    transcript_ += inserted;
    std::string combined = tail_ + inserted;
    tail_ = combined.size() > window_ ? combined.substr(combined.size() - window_) : combined;
}

std::string TranscriptReconciler::commit(const std::string& result_id, const std::string& text) {
    auto prepared = prepare(result_id, text);
    if (!prepared) {
        return "";
    }
    accept(*prepared);
    return *prepared;
}

void TranscriptReconciler::beginSession() {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_ids_.clear();
}

void TranscriptReconciler::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    seen_ids_.clear();
    transcript_.clear();
    tail_.clear();
}

std::string TranscriptReconciler::transcript() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return transcript_;
}

std::string TranscriptReconciler::tail() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tail_;
}

}  // namespace client
}  // namespace scribe
