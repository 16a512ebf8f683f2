#ifndef SCRIBE_RELAY_UPSTREAM_PROTOCOL_HPP
#define SCRIBE_RELAY_UPSTREAM_PROTOCOL_HPP

#include <optional>
#include <string>

#include "../scribe_config.hpp"

namespace scribe {
namespace relay {

// =============================================================================
// Upstream engine protocol (上游流式识别 JSON 协议)
// =============================================================================

/// @brief 构造 WebSocket 请求目标: "<path>?model=...&language=...&..."
std::string buildListenTarget(const UpstreamConfig& config);

/// @brief 完整 URL (日志中须经 maskSensitive)
std::string buildListenUrl(const UpstreamConfig& config);

/// @brief Authorization 头的值: "Token <api key>"
std::string authorizationHeader(const UpstreamConfig& config);

enum class UpstreamEventType {
    PARTIAL,            // 非空中间结果
    FINAL,              // is_final (文本可能为空)
    UTTERANCE_END,
    METADATA,           // 只记日志, 不转发
    IGNORED,            // 空中间结果、未知类型
};

struct UpstreamEvent {
    UpstreamEventType type = UpstreamEventType::IGNORED;
    std::string transcript;
    bool speech_final = false;
};

/// @brief 分类上游消息, 非 JSON 返回 nullopt
std::optional<UpstreamEvent> classifyUpstreamMessage(const std::string& text);

std::string keepAliveMessage();
std::string closeStreamMessage();

}  // namespace relay
}  // namespace scribe

#endif  // SCRIBE_RELAY_UPSTREAM_PROTOCOL_HPP
