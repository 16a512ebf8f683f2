#ifndef SCRIBE_TYPES_HPP
#define SCRIBE_TYPES_HPP

#include <string>
#include <vector>
#include <cstdint>
#include <cstddef>
#include <memory>
#include <utility>

namespace scribe {

// =============================================================================
// Error Info (错误信息)
// =============================================================================

enum class ErrorCode {
    OK = 0,

    // 配置错误 (1xx)
    INVALID_CONFIG = 100,
    UNSUPPORTED_SAMPLE_RATE = 101,
    MISSING_SECRET = 102,

    // 运行时错误 (2xx)
    NOT_STARTED = 200,
    ALREADY_STARTED = 201,
    INVALID_STATE = 202,
    TIMEOUT = 203,
    NO_INPUT_DEVICE = 204,
    DEVICE_BUSY = 205,

    // 网络错误 (3xx)
    NETWORK_ERROR = 300,        // 会话中的瞬时收发失败
    CONNECTION_FAILED = 301,
    AUTH_FAILED = 302,          // 凭证无效或过期, 不重试
    CONNECT_TIMEOUT = 303,      // 超时未连上 relay / upstream
    UPSTREAM_FATAL = 304,       // 引擎连接意外关闭
    HTTP_ERROR = 305,

    // 协议错误 (4xx)
    PROTOCOL_DECODE_ERROR = 400,

    // 内部错误 (5xx)
    INTERNAL_ERROR = 500,
    AUDIO_DEVICE_ERROR = 501,
    ENCODE_FAILED = 502,
};

inline const char* errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK:                      return "ok";
        case ErrorCode::INVALID_CONFIG:          return "invalid_config";
        case ErrorCode::UNSUPPORTED_SAMPLE_RATE: return "unsupported_sample_rate";
        case ErrorCode::MISSING_SECRET:          return "missing_secret";
        case ErrorCode::NOT_STARTED:             return "not_started";
        case ErrorCode::ALREADY_STARTED:         return "already_started";
        case ErrorCode::INVALID_STATE:           return "invalid_state";
        case ErrorCode::TIMEOUT:                 return "timeout";
        case ErrorCode::NO_INPUT_DEVICE:         return "no_input_device";
        case ErrorCode::DEVICE_BUSY:             return "device_busy";
        case ErrorCode::NETWORK_ERROR:           return "network_error";
        case ErrorCode::CONNECTION_FAILED:       return "connection_failed";
        case ErrorCode::AUTH_FAILED:             return "auth_failed";
        case ErrorCode::CONNECT_TIMEOUT:         return "connect_timeout";
        case ErrorCode::UPSTREAM_FATAL:          return "upstream_fatal";
        case ErrorCode::HTTP_ERROR:              return "http_error";
        case ErrorCode::PROTOCOL_DECODE_ERROR:   return "protocol_decode_error";
        case ErrorCode::INTERNAL_ERROR:          return "internal_error";
        case ErrorCode::AUDIO_DEVICE_ERROR:      return "audio_device_error";
        case ErrorCode::ENCODE_FAILED:           return "encode_failed";
        default:                                 return "unknown";
    }
}

struct ErrorInfo {
    ErrorCode code = ErrorCode::OK;
    std::string message;
    std::string detail;         // 详细信息(调试用, 不得包含转写内容)

    bool isOk() const { return code == ErrorCode::OK; }

    static ErrorInfo ok() {
        return {ErrorCode::OK, "", ""};
    }

    static ErrorInfo error(ErrorCode code, const std::string& msg, const std::string& detail = "") {
        return {code, msg, detail};
    }
};

/// @brief 该错误是否终止当前会话
inline bool isSessionFatal(ErrorCode code) {
    return code == ErrorCode::AUTH_FAILED ||
        code == ErrorCode::CONNECT_TIMEOUT ||
        code == ErrorCode::UPSTREAM_FATAL;
}

/// @brief 将错误转换为面向用户的简短提示 (屏蔽 URL 与密钥)
std::string toUserMessage(const ErrorInfo& error);

/// @brief 屏蔽文本中的 URL 与类似密钥的长 token
std::string maskSensitive(const std::string& text);

// =============================================================================
// Relay Close Codes (关闭码)
// =============================================================================

namespace close_code {
constexpr int NORMAL = 1000;
constexpr int GOING_AWAY = 1001;
constexpr int INTERNAL = 1011;
constexpr int AUTH_TIMEOUT = 4001;
constexpr int AUTH_FAILED = 4002;
constexpr int ORIGIN_NOT_ALLOWED = 4003;
}  // namespace close_code

// =============================================================================
// Audio Frame (音频帧 - 定时产生, 创建后不可变)
// =============================================================================

class AudioFrame {
public:
    AudioFrame() = default;
    AudioFrame(std::vector<int16_t> samples, int sample_rate, int64_t sequence)
        : samples_(std::make_shared<const std::vector<int16_t>>(std::move(samples)))
        , sample_rate_(sample_rate)
        , sequence_(sequence) {
    }

    const std::vector<int16_t>& samples() const {
        static const std::vector<int16_t> kEmpty;
        return samples_ ? *samples_ : kEmpty;
    }

    int sampleRate() const { return sample_rate_; }
    int64_t sequence() const { return sequence_; }
    size_t sampleCount() const { return samples().size(); }
    bool empty() const { return sampleCount() == 0; }

    int64_t durationMs() const {
        if (sample_rate_ <= 0) return 0;
        return static_cast<int64_t>(sampleCount()) * 1000 / sample_rate_;
    }

    /// @brief 16-bit 小端 PCM 字节
    std::vector<uint8_t> toBytes() const {
        const auto& s = samples();
        std::vector<uint8_t> bytes(s.size() * 2);
        for (size_t i = 0; i < s.size(); ++i) {
            uint16_t v = static_cast<uint16_t>(s[i]);
            bytes[i * 2] = static_cast<uint8_t>(v & 0xFF);
            bytes[i * 2 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
        }
        return bytes;
    }

private:
    std::shared_ptr<const std::vector<int16_t>> samples_;
    int sample_rate_ = 0;
    int64_t sequence_ = 0;
};

// =============================================================================
// Transcript Fragment (转写片段)
// =============================================================================

struct TranscriptItem {
    std::string content;
    double start_time = 0.0;
    double end_time = 0.0;
    std::string type;           // "pronunciation" / "punctuation"
};

struct TranscriptAlternative {
    std::string transcript;
    std::vector<TranscriptItem> items;
};

struct TranscriptFragment {
    std::string result_id;
    bool is_partial = true;
    bool speech_final = false;
    double start_time = 0.0;
    double end_time = 0.0;
    std::vector<TranscriptAlternative> alternatives;

    /// @brief 首选假设文本
    const std::string& text() const {
        static const std::string kEmpty;
        return alternatives.empty() ? kEmpty : alternatives.front().transcript;
    }

    static TranscriptFragment makeFinal(const std::string& id, const std::string& text,
            bool speech_final = false) {
        TranscriptFragment f;
        f.result_id = id;
        f.is_partial = false;
        f.speech_final = speech_final;
        f.alternatives.push_back({text, {}});
        return f;
    }

    static TranscriptFragment makePartial(const std::string& text) {
        TranscriptFragment f;
        f.is_partial = true;
        f.alternatives.push_back({text, {}});
        return f;
    }
};

// =============================================================================
// Session Stats (会话统计)
// =============================================================================

struct SessionStats {
    int64_t duration_ms = 0;
    uint64_t audio_bytes_sent = 0;
    uint64_t partial_count = 0;
    uint64_t final_count = 0;
    uint64_t final_transcript_length = 0;
};

// =============================================================================
// Engine Kind / Status (引擎选择)
// =============================================================================

enum class EngineKind {
    RELAY,          // 低延迟流式 relay
    BROWSER,        // 平台原生识别 (由宿主提供)
    CHUNK,          // 周期性分块上传
};

enum class EngineStatus {
    IDLE,
    CONNECTING,
    READY,
    ERROR,
    FALLBACK,
    LOADING,
};

inline const char* engineKindToString(EngineKind kind) {
    switch (kind) {
        case EngineKind::RELAY:   return "relay";
        case EngineKind::BROWSER: return "browser";
        case EngineKind::CHUNK:   return "chunk";
        default:                  return "unknown";
    }
}

inline const char* engineStatusToString(EngineStatus status) {
    switch (status) {
        case EngineStatus::IDLE:       return "idle";
        case EngineStatus::CONNECTING: return "connecting";
        case EngineStatus::READY:      return "ready";
        case EngineStatus::ERROR:      return "error";
        case EngineStatus::FALLBACK:   return "fallback";
        case EngineStatus::LOADING:    return "loading";
        default:                       return "unknown";
    }
}

}  // namespace scribe

#endif  // SCRIBE_TYPES_HPP
