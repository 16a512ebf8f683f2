#ifndef SCRIBE_PROTOCOL_CONTROL_MESSAGES_HPP
#define SCRIBE_PROTOCOL_CONTROL_MESSAGES_HPP

#include <optional>
#include <string>

#include "../scribe_types.hpp"

namespace scribe {
namespace protocol {

// =============================================================================
// Client <-> Relay control protocol (JSON 文本帧)
// =============================================================================
//
//   C->S  {type:"auth", access_token}   {type:"stop"}   {type:"ping"}
//   S->C  authenticated / ready / partial / final / utterance_end / done / pong / error
//
// 音频以二进制帧发送 (PCM16 LE mono), 不经过本模块。
//

enum class ClientMessageType {
    AUTH,
    STOP,
    PING,
    UNKNOWN,
};

struct ClientMessage {
    ClientMessageType type = ClientMessageType::UNKNOWN;
    std::string access_token;       // 仅 AUTH
    std::string raw_type;
};

/// @brief 解析客户端文本帧, 非 JSON 或缺少 type 时返回 nullopt
std::optional<ClientMessage> parseClientMessage(const std::string& text);

std::string makeAuthMessage(const std::string& access_token);
std::string makeStopMessage();
std::string makePingMessage();

// -----------------------------------------------------------------------------
// Server -> Client
// -----------------------------------------------------------------------------

enum class ServerMessageType {
    AUTHENTICATED,
    READY,
    PARTIAL,
    FINAL,
    UTTERANCE_END,
    DONE,
    PONG,
    ERROR,
    UNKNOWN,
};

struct ServerMessage {
    ServerMessageType type = ServerMessageType::UNKNOWN;
    std::string text;               // PARTIAL / FINAL
    bool speech_final = false;      // FINAL
    SessionStats stats;             // DONE
    std::string error;              // ERROR
};

std::optional<ServerMessage> parseServerMessage(const std::string& text);

std::string makeAuthenticatedMessage();
std::string makeReadyMessage();
std::string makePartialMessage(const std::string& text);
std::string makeFinalMessage(const std::string& text, bool speech_final);
std::string makeUtteranceEndMessage();
std::string makeDoneMessage(const SessionStats& stats);
std::string makePongMessage();
std::string makeErrorMessage(const std::string& error);

}  // namespace protocol
}  // namespace scribe

#endif  // SCRIBE_PROTOCOL_CONTROL_MESSAGES_HPP
