#ifndef SCRIBE_CONFIG_HPP
#define SCRIBE_CONFIG_HPP

#include <string>
#include <vector>
#include <cstdint>

#include "scribe_types.hpp"

namespace scribe {

// =============================================================================
// Upstream Engine Configuration (上游识别引擎配置)
// =============================================================================

struct UpstreamConfig {
    // -------------------------------------------------------------------------
    // 连接
    // -------------------------------------------------------------------------

    std::string host = "api.deepgram.com";
    std::string port = "443";
    std::string path = "/v1/listen";
    bool use_tls = true;
    std::string api_key;            // 服务端持有, 不下发给客户端

    // -------------------------------------------------------------------------
    // 固定识别参数
    // -------------------------------------------------------------------------

    std::string model = "nova-2-medical";
    std::string language = "en-US";
    std::string encoding = "linear16";
    int sample_rate = 16000;
    int channels = 1;
    bool interim_results = true;
    int endpointing_ms = 300;
    bool punctuate = true;
    bool smart_format = true;

    int keepalive_interval_ms = 8000;
    int connect_timeout_ms = 10000;

    /// @brief 本地明文上游 (测试用 mock)
    static UpstreamConfig plain(const std::string& host, const std::string& port) {
        UpstreamConfig config;
        config.host = host;
        config.port = port;
        config.use_tls = false;
        config.api_key = "test";
        return config;
    }
};

// =============================================================================
// Relay Configuration (Relay 服务配置)
// =============================================================================

struct RelayConfig {
    std::string bind_address = "0.0.0.0";
    uint16_t port = 8080;               // 0 = 临时端口
    std::string jwt_secret;
    std::vector<std::string> allowed_origins;   // 为空表示不检查
    std::string dictate_path = "/dictate";

    int auth_timeout_ms = 5000;
    int flush_grace_ms = 500;
    int io_threads = 2;

    UpstreamConfig upstream;

    RelayConfig withPort(uint16_t p) const {
        RelayConfig config = *this;
        config.port = p;
        return config;
    }

    RelayConfig withUpstream(const UpstreamConfig& u) const {
        RelayConfig config = *this;
        config.upstream = u;
        return config;
    }

    RelayConfig withAllowedOrigins(const std::vector<std::string>& origins) const {
        RelayConfig config = *this;
        config.allowed_origins = origins;
        return config;
    }

    /// @brief 从环境变量读取 (先加载 .env, 已存在的变量优先)
    /// @param config [out] 结果
    /// @return 缺少必需变量时返回错误
    static ErrorInfo fromEnvironment(RelayConfig& config, const std::string& dotenv_path = ".env");
};

// =============================================================================
// Capture Configuration (采集配置)
// =============================================================================

struct CaptureConfig {
    int target_sample_rate = 16000;
    int frame_interval_ms = 100;        // 定时 flush 间隔
    size_t ring_capacity_samples = 48000 * 10;

    bool gain_normalization = false;
    float gain_target_peak = 0.9f;
    float gain_max = 4.0f;

    // 平台支持时在采集端开启
    bool echo_cancellation = true;
    bool noise_suppression = true;

    /// @brief 低延迟流式 (100ms 帧)
    static CaptureConfig streaming() {
        return CaptureConfig();
    }

    /// @brief 分块上传 (5s 帧)
    static CaptureConfig chunked(int chunk_ms = 5000) {
        CaptureConfig config;
        config.frame_interval_ms = chunk_ms;
        return config;
    }
};

// =============================================================================
// Session Client Configuration (客户端会话配置)
// =============================================================================

enum class WireMode {
    RELAY,          // JSON 控制协议 + 原始 PCM16 二进制帧
    EVENT_STREAM,   // 二进制 event-stream (prelude + headers + CRC32)
};

struct ClientConfig {
    std::string relay_host = "localhost";
    std::string relay_port = "8080";
    std::string relay_path = "/dictate";
    bool use_tls = false;
    std::string origin;
    std::string access_token;

    WireMode wire_mode = WireMode::RELAY;

    int connect_timeout_ms = 8000;
    int stop_ack_timeout_ms = 3000;
    size_t tail_window = 80;
    size_t max_pending_frames = 300;    // 约 30 秒
    int no_target_signal_interval_ms = 2000;

    CaptureConfig capture;

    static ClientConfig lowLatency(const std::string& host, const std::string& port,
            const std::string& token) {
        ClientConfig config;
        config.relay_host = host;
        config.relay_port = port;
        config.access_token = token;
        config.capture = CaptureConfig::streaming();
        return config;
    }

    ClientConfig withEventStream(const std::string& path) const {
        ClientConfig config = *this;
        config.wire_mode = WireMode::EVENT_STREAM;
        config.relay_path = path;
        return config;
    }

    ClientConfig withTimeouts(int connect_ms, int stop_ack_ms) const {
        ClientConfig config = *this;
        config.connect_timeout_ms = connect_ms;
        config.stop_ack_timeout_ms = stop_ack_ms;
        return config;
    }
};

// =============================================================================
// Retry Policy (重试策略)
// =============================================================================

struct RetryPolicy {
    int max_attempts = 3;
    int initial_backoff_ms = 500;
    double multiplier = 2.0;
    int max_backoff_ms = 4000;

    static RetryPolicy none() {
        RetryPolicy policy;
        policy.max_attempts = 1;
        return policy;
    }
};

// =============================================================================
// Summary Configuration (摘要节流配置)
// =============================================================================

struct SummaryConfig {
    size_t min_delta_chars = 100;
    size_t min_trimmed_delta_chars = 50;
    int debounce_ms = 45000;
    size_t max_summary_chars = 1200;

    std::string endpoint;
    std::string api_key;
    std::string access_token;
    std::string preferences_json = "{}";
    int request_timeout_ms = 30000;
    RetryPolicy retry;

    SummaryConfig withDebounce(int ms) const {
        SummaryConfig config = *this;
        config.debounce_ms = ms;
        return config;
    }
};

// =============================================================================
// Chunk Upload Configuration (分块上传配置)
// =============================================================================

struct ChunkConfig {
    int chunk_ms = 5000;
    int min_chunk_ms = 800;
    float silence_peak = 0.01f;
    size_t max_queued_chunks = 12;

    std::string endpoint;
    std::string api_key;
    std::string access_token;
    int request_timeout_ms = 30000;
    RetryPolicy retry;

    /// @brief 听写模式使用更短的分块
    static ChunkConfig dictation() {
        ChunkConfig config;
        config.chunk_ms = 1500;
        return config;
    }
};

// =============================================================================
// Engine Selector Configuration (引擎选择配置)
// =============================================================================

enum class ForcedEngine {
    AUTO,
    RELAY,
    BROWSER,
    CHUNK,
};

/// @brief "relay" / "deepgram" / "browser" / "chunk", 其他值 (含 "auto") 为 AUTO
ForcedEngine parseForcedEngine(const std::string& value);

const char* forcedEngineToString(ForcedEngine engine);

struct EngineSelectorConfig {
    ForcedEngine forced = ForcedEngine::AUTO;

    bool isForced() const { return forced != ForcedEngine::AUTO; }

    EngineSelectorConfig withForced(ForcedEngine engine) const {
        EngineSelectorConfig config = *this;
        config.forced = engine;
        return config;
    }

    /// @brief 读取 SCRIBE_FORCE_ENGINE (调试用)
    static EngineSelectorConfig fromEnvironment();
};

// =============================================================================
// Config Validator (配置验证器)
// =============================================================================

class ConfigValidator {
public:
    static ErrorInfo validate(const UpstreamConfig& config) {
        if (config.host.empty() || config.port.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Upstream host and port are required");
        }
        if (config.api_key.empty()) {
            return ErrorInfo::error(ErrorCode::MISSING_SECRET, "Upstream API key is required");
        }
        if (config.sample_rate != 16000 && config.sample_rate != 8000) {
            return ErrorInfo::error(ErrorCode::UNSUPPORTED_SAMPLE_RATE,
                "Sample rate must be 16000 or 8000 Hz");
        }
        if (config.channels != 1) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Only mono audio is supported");
        }
        return ErrorInfo::ok();
    }

    static ErrorInfo validate(const RelayConfig& config) {
        if (config.jwt_secret.empty()) {
            return ErrorInfo::error(ErrorCode::MISSING_SECRET, "JWT secret is required");
        }
        if (config.auth_timeout_ms <= 0 || config.flush_grace_ms < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Timeouts must be positive");
        }
        if (config.dictate_path.empty() || config.dictate_path[0] != '/') {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Dictate path must start with '/'");
        }
        if (config.io_threads < 1) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "At least one io thread is required");
        }
        return validate(config.upstream);
    }

    static ErrorInfo validate(const CaptureConfig& config) {
        if (config.target_sample_rate != 16000 && config.target_sample_rate != 8000) {
            return ErrorInfo::error(ErrorCode::UNSUPPORTED_SAMPLE_RATE,
                "Target sample rate must be 16000 or 8000 Hz");
        }
        if (config.frame_interval_ms < 10 || config.frame_interval_ms > 10000) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Frame interval must be between 10 and 10000 ms");
        }
        if (config.ring_capacity_samples == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Ring capacity must be non-zero");
        }
        return ErrorInfo::ok();
    }

    static ErrorInfo validate(const ClientConfig& config) {
        if (config.relay_host.empty() || config.relay_port.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Relay host and port are required");
        }
        if (config.wire_mode == WireMode::RELAY && config.access_token.empty()) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Access token is required");
        }
        if (config.connect_timeout_ms <= 0 || config.stop_ack_timeout_ms <= 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Timeouts must be positive");
        }
        if (config.tail_window == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Tail window must be non-zero");
        }
        return validate(config.capture);
    }

    static ErrorInfo validate(const SummaryConfig& config) {
        if (config.debounce_ms < 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Debounce must not be negative");
        }
        if (config.max_summary_chars == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Summary bound must be non-zero");
        }
        return ErrorInfo::ok();
    }

    static ErrorInfo validate(const ChunkConfig& config) {
        if (config.chunk_ms < config.min_chunk_ms) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG,
                "Chunk length must not be shorter than the minimum chunk");
        }
        if (config.max_queued_chunks == 0) {
            return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Chunk queue must be non-zero");
        }
        return ErrorInfo::ok();
    }
};

// =============================================================================
// Environment helpers (环境变量)
// =============================================================================

namespace env {

/// @brief 读取 .env 文件并设置环境变量 (不覆盖已有变量)
/// @return 设置的变量个数, 文件不存在返回 0
int loadDotenv(const std::string& path = ".env");

/// @brief 读取字符串变量
std::string get(const char* name, const std::string& fallback = "");

/// @brief 读取布尔变量 ("true"/"1"/"yes")
bool getBool(const char* name, bool fallback);

/// @brief 读取整数变量, 无法解析时返回 fallback
int getInt(const char* name, int fallback);

/// @brief 按逗号切分并去掉空项
std::vector<std::string> splitList(const std::string& value);

}  // namespace env

}  // namespace scribe

#endif  // SCRIBE_CONFIG_HPP
