#include "scribe_config.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "scribe_log.hpp"

namespace scribe {

namespace env {

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

}  // namespace

int loadDotenv(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return 0;
    }

    int count = 0;
    std::string line;
    while (std::getline(file, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') continue;
        auto pos = line.find('=');
        if (pos == std::string::npos) continue;

        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (val.size() >= 2 &&
            ((val.front() == '"' && val.back() == '"') ||
             (val.front() == '\'' && val.back() == '\''))) {
            val = val.substr(1, val.size() - 2);
        }
        if (key.empty()) continue;
        if (setenv(key.c_str(), val.c_str(), 0) == 0) {
            ++count;
        }
    }
    return count;
}

std::string get(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    if (!value || value[0] == '\0') {
        return fallback;
    }
    return value;
}

bool getBool(const char* name, bool fallback) {
    std::string value = get(name);
    if (value.empty()) return fallback;
    return value == "true" || value == "1" || value == "yes";
}

int getInt(const char* name, int fallback) {
    std::string value = get(name);
    if (value.empty()) return fallback;
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        safeWarn("Config", "Ignoring non-numeric value for ", name);
        return fallback;
    }
}

std::vector<std::string> splitList(const std::string& value) {
    std::vector<std::string> items;
    std::istringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

}  // namespace env

ErrorInfo RelayConfig::fromEnvironment(RelayConfig& config, const std::string& dotenv_path) {
    env::loadDotenv(dotenv_path);

    config = RelayConfig();
    config.bind_address = env::get("HOST", config.bind_address);
    config.port = static_cast<uint16_t>(env::getInt("PORT", config.port));
    config.allowed_origins = env::splitList(env::get("ALLOWED_ORIGINS"));

    config.jwt_secret = env::get("SUPABASE_JWT_SECRET");
    if (config.jwt_secret.empty()) {
        config.jwt_secret = env::get("SCRIBE_JWT_SECRET");
    }

    config.upstream.api_key = env::get("DEEPGRAM_API_KEY");
    config.upstream.host = env::get("UPSTREAM_HOST", config.upstream.host);
    config.upstream.port = env::get("UPSTREAM_PORT", config.upstream.port);
    config.upstream.use_tls = env::getBool("UPSTREAM_TLS", config.upstream.use_tls);
    config.upstream.model = env::get("UPSTREAM_MODEL", config.upstream.model);
    config.upstream.language = env::get("UPSTREAM_LANGUAGE", config.upstream.language);

    if (config.upstream.api_key.empty()) {
        return ErrorInfo::error(ErrorCode::MISSING_SECRET, "DEEPGRAM_API_KEY is required");
    }
    if (config.jwt_secret.empty()) {
        return ErrorInfo::error(ErrorCode::MISSING_SECRET,
            "SUPABASE_JWT_SECRET is required for local JWT verification");
    }
    return ConfigValidator::validate(config);
}

ForcedEngine parseForcedEngine(const std::string& value) {
    if (value == "relay" || value == "deepgram") return ForcedEngine::RELAY;
    if (value == "browser") return ForcedEngine::BROWSER;
    if (value == "chunk") return ForcedEngine::CHUNK;
    return ForcedEngine::AUTO;
}

const char* forcedEngineToString(ForcedEngine engine) {
    switch (engine) {
        case ForcedEngine::AUTO:    return "auto";
        case ForcedEngine::RELAY:   return "relay";
        case ForcedEngine::BROWSER: return "browser";
        case ForcedEngine::CHUNK:   return "chunk";
        default:                    return "unknown";
    }
}

EngineSelectorConfig EngineSelectorConfig::fromEnvironment() {
    EngineSelectorConfig config;
    const std::string value = env::get("SCRIBE_FORCE_ENGINE", "auto");
    config.forced = parseForcedEngine(value);
    if (config.isForced()) {
        safeLog("Config", "Engine forced to ", forcedEngineToString(config.forced));
    } else if (value != "auto") {
        safeWarn("Config", "Unknown SCRIBE_FORCE_ENGINE value, using auto");
    }
    return config;
}

}  // namespace scribe
