#ifndef SCRIBE_CODEC_EVENT_STREAM_HPP
#define SCRIBE_CODEC_EVENT_STREAM_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "../scribe_types.hpp"

namespace scribe {
namespace codec {

// =============================================================================
// Event Stream Wire Format (二进制事件流格式)
// =============================================================================
//
//   [total length: 4 BE][headers length: 4 BE][prelude CRC32: 4 BE]
//   [headers ...][payload ...][message CRC32: 4 BE]
//
// 每个 header: [name len: 1][name][type: 1][value len: 2 BE][value]
// message CRC 覆盖它之前的全部字节。
//

constexpr size_t kPreludeLength = 12;
constexpr size_t kMessageCrcLength = 4;
constexpr size_t kMinimumFrameLength = kPreludeLength + kMessageCrcLength;
constexpr uint32_t kMaximumFrameLength = 16 * 1024 * 1024;

enum class HeaderType : uint8_t {
    BOOL_TRUE = 0,
    BOOL_FALSE = 1,
    BYTE = 2,
    SHORT = 3,
    INTEGER = 4,
    LONG = 5,
    BYTE_ARRAY = 6,
    STRING = 7,
    TIMESTAMP = 8,
    UUID = 9,
};

using EventHeaders = std::map<std::string, std::string>;
using OrderedHeaders = std::vector<std::pair<std::string, std::string>>;

struct EventMessage {
    EventHeaders headers;
    std::vector<uint8_t> payload;

    std::string header(const std::string& name) const {
        auto it = headers.find(name);
        return it == headers.end() ? std::string() : it->second;
    }

    std::string messageType() const { return header(":message-type"); }
    std::string eventType() const { return header(":event-type"); }
};

enum class DecodeMode {
    TRUSTED,        // 固定且已认证的上游, 不重算 CRC
    VERIFY_CRC,     // 校验 prelude CRC 与 message CRC
};

// -----------------------------------------------------------------------------
// CRC32 (反射多项式 0xEDB88320, 查表)
// -----------------------------------------------------------------------------

uint32_t crc32(const uint8_t* data, size_t len);

// -----------------------------------------------------------------------------
// Encode / Decode
// -----------------------------------------------------------------------------

/// @brief 编码一条消息 (只写 string 类型 header)
/// @return header 名或值超长时返回 nullopt
std::optional<std::vector<uint8_t>> encodeMessage(const OrderedHeaders& headers,
        const uint8_t* payload, size_t payload_len);

/// @brief 编码 AudioEvent (payload 为 PCM16 小端字节)
std::vector<uint8_t> encodeAudioEvent(const int16_t* pcm, size_t samples);
std::vector<uint8_t> encodeAudioEvent(const AudioFrame& frame);

/// @brief 解码单条消息
/// @return 不足 16 字节、不足 total length、长度字段非法或 header 无法解析时返回 nullopt;
///         VERIFY_CRC 模式下 CRC 不匹配也返回 nullopt。从不抛异常。
std::optional<EventMessage> decodeMessage(const uint8_t* data, size_t len,
        DecodeMode mode = DecodeMode::TRUSTED);

inline std::optional<EventMessage> decodeMessage(const std::vector<uint8_t>& data,
        DecodeMode mode = DecodeMode::TRUSTED) {
    return decodeMessage(data.data(), data.size(), mode);
}

/// @brief 将 AudioEvent payload 还原为 PCM16 样本
std::vector<int16_t> pcmFromPayload(const std::vector<uint8_t>& payload);

// -----------------------------------------------------------------------------
// Transcript events
// -----------------------------------------------------------------------------

/// @brief 解析 TranscriptEvent payload (JSON Transcript.Results[])
/// @return 解析失败返回空列表
std::vector<TranscriptFragment> parseTranscriptEvent(const EventMessage& message);

/// @brief 若为 exception 消息, 返回对应错误
std::optional<ErrorInfo> exceptionFromMessage(const EventMessage& message);

// =============================================================================
// Event Stream Reader (增量读取 - 处理跨 read 拆分的帧)
// =============================================================================

class EventStreamReader {
public:
    explicit EventStreamReader(DecodeMode mode = DecodeMode::TRUSTED,
            int max_consecutive_errors = 3)
        : mode_(mode), max_consecutive_errors_(max_consecutive_errors) {}

    /// @brief 追加收到的字节
    void feed(const uint8_t* data, size_t len);
    void feed(const std::vector<uint8_t>& data) { feed(data.data(), data.size()); }

    /// @brief 取出下一条完整消息, 数据不足或帧被丢弃时返回 nullopt
    std::optional<EventMessage> next();

    size_t buffered() const { return buffer_.size(); }
    uint64_t decodeErrors() const { return decode_errors_; }
    int consecutiveErrors() const { return consecutive_errors_; }

    /// @brief 连续解码失败达到阈值, 调用方应断开连接
    bool shouldTearDown() const { return consecutive_errors_ >= max_consecutive_errors_; }

    void reset();

private:
    void recordError();

    DecodeMode mode_;
    int max_consecutive_errors_;
    std::vector<uint8_t> buffer_;
    uint64_t decode_errors_ = 0;
    int consecutive_errors_ = 0;
};

}  // namespace codec
}  // namespace scribe

#endif  // SCRIBE_CODEC_EVENT_STREAM_HPP
