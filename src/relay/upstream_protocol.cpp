#include "relay/upstream_protocol.hpp"

#include <cctype>
#include <cstdio>

#include <nlohmann/json.hpp>

namespace scribe {
namespace relay {

using json = nlohmann::json;

namespace {

std::string urlEncode(const std::string& value) {
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else {
            char buf[4];
            std::snprintf(buf, sizeof(buf), "%%%02X", c);
            out += buf;
        }
    }
    return out;
}

const char* boolString(bool value) {
    return value ? "true" : "false";
}

}  // namespace

std::string buildListenTarget(const UpstreamConfig& config) {
    std::string target = config.path;
    target += "?model=" + urlEncode(config.model);
    target += "&language=" + urlEncode(config.language);
    target += "&encoding=" + urlEncode(config.encoding);
    target += "&sample_rate=" + std::to_string(config.sample_rate);
    target += "&channels=" + std::to_string(config.channels);
    target += "&interim_results=" + std::string(boolString(config.interim_results));
    target += "&endpointing=" + std::to_string(config.endpointing_ms);
    target += "&punctuate=" + std::string(boolString(config.punctuate));
    target += "&smart_format=" + std::string(boolString(config.smart_format));
    return target;
}

std::string buildListenUrl(const UpstreamConfig& config) {
    std::string scheme = config.use_tls ? "wss://" : "ws://";
    bool default_port = (config.use_tls && config.port == "443") ||
        (!config.use_tls && config.port == "80");
    std::string authority = default_port ? config.host : config.host + ":" + config.port;
    return scheme + authority + buildListenTarget(config);
}

std::string authorizationHeader(const UpstreamConfig& config) {
    return "Token " + config.api_key;
}

std::optional<UpstreamEvent> classifyUpstreamMessage(const std::string& text) {
    json data = json::parse(text, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return std::nullopt;
    }

    UpstreamEvent event;
    auto type_it = data.find("type");
    const std::string type = (type_it != data.end() && type_it->is_string())
        ? type_it->get<std::string>() : std::string();

    if (type == "Results") {
        // channel.alternatives[0].transcript
        const json* channel = data.contains("channel") ? &data["channel"] : nullptr;
        if (channel && channel->is_object() && channel->contains("alternatives")) {
            const json& alternatives = (*channel)["alternatives"];
            if (alternatives.is_array() && !alternatives.empty() && alternatives[0].is_object()) {
                const json& first = alternatives[0];
                auto it = first.find("transcript");
                if (it != first.end() && it->is_string()) {
                    event.transcript = it->get<std::string>();
                }
            }
        }
        auto is_final = data.find("is_final");
        auto speech_final = data.find("speech_final");
        bool final = is_final != data.end() && is_final->is_boolean() && is_final->get<bool>();
        event.speech_final = speech_final != data.end() && speech_final->is_boolean() &&
            speech_final->get<bool>();

        if (final) {
            event.type = UpstreamEventType::FINAL;
        } else if (!event.transcript.empty()) {
            event.type = UpstreamEventType::PARTIAL;
        }
    } else if (type == "UtteranceEnd") {
        event.type = UpstreamEventType::UTTERANCE_END;
    } else if (type == "Metadata") {
        event.type = UpstreamEventType::METADATA;
    }
    return event;
}

std::string keepAliveMessage() {
    return json{{"type", "KeepAlive"}}.dump();
}

std::string closeStreamMessage() {
    return json{{"type", "CloseStream"}}.dump();
}

}  // namespace relay
}  // namespace scribe
