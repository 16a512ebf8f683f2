#include "scribe_types.hpp"

#include <regex>
#include <string>

namespace scribe {

std::string maskSensitive(const std::string& text) {
    static const std::regex kUrl(R"((wss?|https?)://[^\s]+)");
    static const std::regex kSignedParam(R"(X-Amz-[A-Za-z-]+=[^\s&]+)");
    static const std::regex kAccessKey(R"(AKIA[A-Z0-9]{16})");
    static const std::regex kBearer(R"((Bearer|Token)\s+[A-Za-z0-9._\-]+)");

    std::string out = std::regex_replace(text, kUrl, "[MASKED_URL]");
    out = std::regex_replace(out, kSignedParam, "[MASKED]");
    out = std::regex_replace(out, kAccessKey, "[MASKED_KEY]");
    out = std::regex_replace(out, kBearer, "$1 [MASKED]");
    return out;
}

std::string toUserMessage(const ErrorInfo& error) {
    switch (error.code) {
        case ErrorCode::OK:
            return "";
        case ErrorCode::AUTH_FAILED:
            return "Authentication failed. Please sign in again.";
        case ErrorCode::CONNECT_TIMEOUT:
            return "Could not reach the transcription service. Check your connection and try again.";
        case ErrorCode::UPSTREAM_FATAL:
            return "Transcription service disconnected. Your transcript so far was kept.";
        case ErrorCode::NETWORK_ERROR:
        case ErrorCode::CONNECTION_FAILED:
            return "Network problem while transcribing: " + maskSensitive(error.message);
        case ErrorCode::NO_INPUT_DEVICE:
        case ErrorCode::AUDIO_DEVICE_ERROR:
            return "Microphone unavailable. Check microphone permissions.";
        case ErrorCode::DEVICE_BUSY:
            return "Microphone is in use by another recording.";
        default:
            return maskSensitive(error.message);
    }
}

}  // namespace scribe
