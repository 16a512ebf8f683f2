#include "codec/event_stream.hpp"

#include <array>
#include <string>

#include <nlohmann/json.hpp>

#include "scribe_log.hpp"

namespace scribe {
namespace codec {

using json = nlohmann::json;

namespace {

// encode 与 decode 共用同一张表
const std::array<uint32_t, 256>& crcTable() {
    static const std::array<uint32_t, 256> table = [] {
        std::array<uint32_t, 256> t{};
        for (uint32_t i = 0; i < 256; ++i) {
            uint32_t c = i;
            for (int j = 0; j < 8; ++j) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();
    return table;
}

void putUint32(std::vector<uint8_t>& out, uint32_t v) {
    out.push_back(static_cast<uint8_t>((v >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((v >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(v & 0xFF));
}

uint32_t readUint32(const uint8_t* p) {
    return (static_cast<uint32_t>(p[0]) << 24) |
        (static_cast<uint32_t>(p[1]) << 16) |
        (static_cast<uint32_t>(p[2]) << 8) |
        static_cast<uint32_t>(p[3]);
}

uint16_t readUint16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

bool preludeLooksValid(uint32_t total_length, uint32_t headers_length) {
    if (total_length < kMinimumFrameLength || total_length > kMaximumFrameLength) {
        return false;
    }
    return static_cast<uint64_t>(headers_length) + kMinimumFrameLength <= total_length;
}

/// 解析 header 块, 失败返回 false
bool decodeHeaders(const uint8_t* data, size_t len, EventHeaders& headers) {
    size_t offset = 0;
    while (offset < len) {
        uint8_t name_len = data[offset++];
        if (name_len == 0 || offset + name_len + 1 > len) {
            return false;
        }
        std::string name(reinterpret_cast<const char*>(data + offset), name_len);
        offset += name_len;

        auto type = static_cast<HeaderType>(data[offset++]);
        size_t width = 0;
        switch (type) {
            case HeaderType::BOOL_TRUE:
                headers[name] = "true";
                continue;
            case HeaderType::BOOL_FALSE:
                headers[name] = "false";
                continue;
            case HeaderType::BYTE:      width = 1; break;
            case HeaderType::SHORT:     width = 2; break;
            case HeaderType::INTEGER:   width = 4; break;
            case HeaderType::LONG:      width = 8; break;
            case HeaderType::TIMESTAMP: width = 8; break;
            case HeaderType::UUID:      width = 16; break;
            case HeaderType::BYTE_ARRAY:
            case HeaderType::STRING: {
                if (offset + 2 > len) return false;
                size_t value_len = readUint16(data + offset);
                offset += 2;
                if (offset + value_len > len) return false;
                headers[name] = std::string(reinterpret_cast<const char*>(data + offset), value_len);
                offset += value_len;
                continue;
            }
            default:
                return false;
        }
        // 定长类型只跳过
        if (offset + width > len) return false;
        offset += width;
    }
    return true;
}

double numberOr(const json& obj, const char* key, double fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_number()) return fallback;
    return it->get<double>();
}

std::string stringOr(const json& obj, const char* key, const std::string& fallback) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

}  // namespace

uint32_t crc32(const uint8_t* data, size_t len) {
    const auto& table = crcTable();
    uint32_t crc = 0xFFFFFFFFu;
    for (size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ data[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFFu;
}

std::optional<std::vector<uint8_t>> encodeMessage(const OrderedHeaders& headers,
        const uint8_t* payload, size_t payload_len) {
    std::vector<uint8_t> header_block;
    for (const auto& [name, value] : headers) {
        if (name.empty() || name.size() > 255 || value.size() > 0xFFFF) {
            return std::nullopt;
        }
        header_block.push_back(static_cast<uint8_t>(name.size()));
        header_block.insert(header_block.end(), name.begin(), name.end());
        header_block.push_back(static_cast<uint8_t>(HeaderType::STRING));
        header_block.push_back(static_cast<uint8_t>((value.size() >> 8) & 0xFF));
        header_block.push_back(static_cast<uint8_t>(value.size() & 0xFF));
        header_block.insert(header_block.end(), value.begin(), value.end());
    }

    uint64_t total = kPreludeLength + header_block.size() + payload_len + kMessageCrcLength;
    if (total > kMaximumFrameLength) {
        return std::nullopt;
    }

    std::vector<uint8_t> out;
    out.reserve(static_cast<size_t>(total));
    putUint32(out, static_cast<uint32_t>(total));
    putUint32(out, static_cast<uint32_t>(header_block.size()));
    putUint32(out, crc32(out.data(), 8));
    out.insert(out.end(), header_block.begin(), header_block.end());
    if (payload_len > 0) {
        out.insert(out.end(), payload, payload + payload_len);
    }
    putUint32(out, crc32(out.data(), out.size()));
    return out;
}

std::vector<uint8_t> encodeAudioEvent(const int16_t* pcm, size_t samples) {
    static const OrderedHeaders kAudioHeaders = {
        {":content-type", "application/octet-stream"},
        {":event-type", "AudioEvent"},
        {":message-type", "event"},
    };

    std::vector<uint8_t> payload(samples * 2);
    for (size_t i = 0; i < samples; ++i) {
        uint16_t v = static_cast<uint16_t>(pcm[i]);
        payload[i * 2] = static_cast<uint8_t>(v & 0xFF);
        payload[i * 2 + 1] = static_cast<uint8_t>((v >> 8) & 0xFF);
    }

    auto encoded = encodeMessage(kAudioHeaders, payload.data(), payload.size());
    // 固定 header, 只有超出最大帧长时才会失败
    if (!encoded) {
        safeWarn("EventStream", "Audio event too large, samples: ", samples);
        return {};
    }
    return std::move(*encoded);
}

std::vector<uint8_t> encodeAudioEvent(const AudioFrame& frame) {
    const auto& samples = frame.samples();
    return encodeAudioEvent(samples.data(), samples.size());
}

std::optional<EventMessage> decodeMessage(const uint8_t* data, size_t len, DecodeMode mode) {
    if (data == nullptr || len < kMinimumFrameLength) {
        return std::nullopt;
    }

    uint32_t total_length = readUint32(data);
    uint32_t headers_length = readUint32(data + 4);
    if (len < total_length || !preludeLooksValid(total_length, headers_length)) {
        return std::nullopt;
    }

    if (mode == DecodeMode::VERIFY_CRC) {
        if (crc32(data, 8) != readUint32(data + 8)) {
            return std::nullopt;
        }
        size_t crc_offset = total_length - kMessageCrcLength;
        if (crc32(data, crc_offset) != readUint32(data + crc_offset)) {
            return std::nullopt;
        }
    }

    EventMessage message;
    const uint8_t* headers_begin = data + kPreludeLength;
    if (!decodeHeaders(headers_begin, headers_length, message.headers)) {
        return std::nullopt;
    }

    const uint8_t* payload_begin = headers_begin + headers_length;
    const uint8_t* payload_end = data + total_length - kMessageCrcLength;
    message.payload.assign(payload_begin, payload_end);
    return message;
}

std::vector<int16_t> pcmFromPayload(const std::vector<uint8_t>& payload) {
    std::vector<int16_t> pcm(payload.size() / 2);
    for (size_t i = 0; i < pcm.size(); ++i) {
        uint16_t v = static_cast<uint16_t>(payload[i * 2]) |
            static_cast<uint16_t>(payload[i * 2 + 1] << 8);
        pcm[i] = static_cast<int16_t>(v);
    }
    return pcm;
}

std::vector<TranscriptFragment> parseTranscriptEvent(const EventMessage& message) {
    std::vector<TranscriptFragment> fragments;

    json data = json::parse(message.payload.begin(), message.payload.end(), nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return fragments;
    }

    auto transcript = data.find("Transcript");
    if (transcript == data.end() || !transcript->is_object()) {
        return fragments;
    }
    auto results = transcript->find("Results");
    if (results == transcript->end() || !results->is_array()) {
        return fragments;
    }

    for (const auto& result : *results) {
        if (!result.is_object()) continue;

        TranscriptFragment fragment;
        auto partial = result.find("IsPartial");
        fragment.is_partial = (partial != result.end() && partial->is_boolean())
            ? partial->get<bool>() : true;
        fragment.result_id = stringOr(result, "ResultId", "");
        fragment.start_time = numberOr(result, "StartTime", 0.0);
        fragment.end_time = numberOr(result, "EndTime", 0.0);

        auto alternatives = result.find("Alternatives");
        if (alternatives != result.end() && alternatives->is_array()) {
            for (const auto& alt : *alternatives) {
                if (!alt.is_object()) continue;
                TranscriptAlternative alternative;
                alternative.transcript = stringOr(alt, "Transcript", "");
                auto items = alt.find("Items");
                if (items != alt.end() && items->is_array()) {
                    for (const auto& item : *items) {
                        if (!item.is_object()) continue;
                        TranscriptItem ti;
                        ti.content = stringOr(item, "Content", "");
                        ti.start_time = numberOr(item, "StartTime", 0.0);
                        ti.end_time = numberOr(item, "EndTime", 0.0);
                        ti.type = stringOr(item, "Type", "pronunciation");
                        alternative.items.push_back(std::move(ti));
                    }
                }
                fragment.alternatives.push_back(std::move(alternative));
            }
        }
        fragments.push_back(std::move(fragment));
    }
    return fragments;
}

std::optional<ErrorInfo> exceptionFromMessage(const EventMessage& message) {
    if (message.messageType() != "exception" && message.messageType() != "error") {
        return std::nullopt;
    }

    std::string type = message.header(":exception-type");
    if (type.empty()) type = message.header(":error-code");

    std::string text;
    json data = json::parse(message.payload.begin(), message.payload.end(), nullptr, false);
    if (!data.is_discarded() && data.is_object()) {
        text = stringOr(data, "Message", stringOr(data, "message", ""));
    }
    if (text.empty()) text = message.header(":error-message");

    return ErrorInfo::error(ErrorCode::UPSTREAM_FATAL,
        type.empty() ? "Upstream exception" : type, maskSensitive(text));
}

// =============================================================================
// EventStreamReader
// =============================================================================

void EventStreamReader::feed(const uint8_t* data, size_t len) {
    if (data == nullptr || len == 0) return;
    buffer_.insert(buffer_.end(), data, data + len);
}

std::optional<EventMessage> EventStreamReader::next() {
    while (buffer_.size() >= 8) {
        uint32_t total_length = readUint32(buffer_.data());
        uint32_t headers_length = readUint32(buffer_.data() + 4);
        if (!preludeLooksValid(total_length, headers_length)) {
            // 无法再定位帧边界, 丢弃已缓冲数据
            safeWarn("EventStream", "Discarding ", buffer_.size(), " bytes with invalid prelude");
            buffer_.clear();
            recordError();
            return std::nullopt;
        }

        if (buffer_.size() < total_length) {
            return std::nullopt;
        }

        auto message = decodeMessage(buffer_.data(), total_length, mode_);
        buffer_.erase(buffer_.begin(), buffer_.begin() + total_length);
        if (message) {
            consecutive_errors_ = 0;
            return message;
        }

        // 帧边界已知, 跳过这一帧继续
        safeWarn("EventStream", "Dropped malformed frame of ", total_length, " bytes");
        recordError();
    }
    return std::nullopt;
}

void EventStreamReader::reset() {
    buffer_.clear();
    consecutive_errors_ = 0;
}

void EventStreamReader::recordError() {
    ++decode_errors_;
    ++consecutive_errors_;
}

}  // namespace codec
}  // namespace scribe
