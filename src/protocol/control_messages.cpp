#include "protocol/control_messages.hpp"

#include <nlohmann/json.hpp>

namespace scribe {
namespace protocol {

using json = nlohmann::json;

namespace {

std::string typed(const char* type) {
    return json{{"type", type}}.dump();
}

template <typename T>
T valueOr(const json& object, const char* key, T fallback) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return fallback;
    }
    try {
        return it->get<T>();
    } catch (const json::exception&) {
        return fallback;
    }
}

}  // namespace

// =============================================================================
// Client -> Server
// =============================================================================

std::optional<ClientMessage> parseClientMessage(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return std::nullopt;
    }
    auto type_it = data.find("type");
    if (type_it == data.end() || !type_it->is_string()) {
        return std::nullopt;
    }

    ClientMessage message;
    message.raw_type = type_it->get<std::string>();
    if (message.raw_type == "auth") {
        message.type = ClientMessageType::AUTH;
        message.access_token = valueOr<std::string>(data, "access_token", "");
    } else if (message.raw_type == "stop") {
        message.type = ClientMessageType::STOP;
    } else if (message.raw_type == "ping") {
        message.type = ClientMessageType::PING;
    }
    return message;
}

std::string makeAuthMessage(const std::string& access_token) {
    return json{{"type", "auth"}, {"access_token", access_token}}.dump();
}

std::string makeStopMessage() { return typed("stop"); }
std::string makePingMessage() { return typed("ping"); }

// =============================================================================
// Server -> Client
// =============================================================================

std::optional<ServerMessage> parseServerMessage(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return std::nullopt;
    }
    std::string type = valueOr<std::string>(data, "type", "");
    if (type.empty()) {
        return std::nullopt;
    }

    ServerMessage message;
    if (type == "authenticated") {
        message.type = ServerMessageType::AUTHENTICATED;
    } else if (type == "ready") {
        message.type = ServerMessageType::READY;
    } else if (type == "partial") {
        message.type = ServerMessageType::PARTIAL;
        message.text = valueOr<std::string>(data, "text", "");
    } else if (type == "final") {
        message.type = ServerMessageType::FINAL;
        message.text = valueOr<std::string>(data, "text", "");
        message.speech_final = valueOr<bool>(data, "speech_final", false);
    } else if (type == "utterance_end") {
        message.type = ServerMessageType::UTTERANCE_END;
    } else if (type == "done") {
        message.type = ServerMessageType::DONE;
        auto stats = data.find("stats");
        if (stats != data.end() && stats->is_object()) {
            message.stats.duration_ms = valueOr<int64_t>(*stats, "durationMs", 0);
            message.stats.audio_bytes_sent = valueOr<uint64_t>(*stats, "audioBytesSent", 0);
            message.stats.partial_count = valueOr<uint64_t>(*stats, "partialCount", 0);
            message.stats.final_count = valueOr<uint64_t>(*stats, "finalCount", 0);
            message.stats.final_transcript_length =
                valueOr<uint64_t>(*stats, "finalTranscriptLength", 0);
        }
    } else if (type == "pong") {
        message.type = ServerMessageType::PONG;
    } else if (type == "error") {
        message.type = ServerMessageType::ERROR;
        message.error = valueOr<std::string>(data, "error", "");
    }
    return message;
}

std::string makeAuthenticatedMessage() { return typed("authenticated"); }
std::string makeReadyMessage() { return typed("ready"); }
std::string makeUtteranceEndMessage() { return typed("utterance_end"); }
std::string makePongMessage() { return typed("pong"); }

std::string makePartialMessage(const std::string& text) {
    return json{{"type", "partial"}, {"text", text}}.dump();
}

std::string makeFinalMessage(const std::string& text, bool speech_final) {
    return json{{"type", "final"}, {"text", text}, {"speech_final", speech_final}}.dump();
}

std::string makeDoneMessage(const SessionStats& stats) {
    json body = {
        {"type", "done"},
        {"stats", {
            {"durationMs", stats.duration_ms},
            {"audioBytesSent", stats.audio_bytes_sent},
            {"partialCount", stats.partial_count},
            {"finalCount", stats.final_count},
            {"finalTranscriptLength", stats.final_transcript_length},
        }},
    };
    return body.dump();
}

std::string makeErrorMessage(const std::string& error) {
    return json{{"type", "error"}, {"error", error}}.dump();
}

}  // namespace protocol
}  // namespace scribe
