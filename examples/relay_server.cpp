/**
 * Scribe relay server
 *
 * 接受客户端 WebSocket (/dictate), 本地校验 JWT 后把 PCM16 音频中继到
 * 上游流式识别服务, 并把结果转发给客户端。
 *
 * 配置来自环境变量 (启动时读取 .env, 已有变量优先):
 *   PORT, HOST, DEEPGRAM_API_KEY, SUPABASE_JWT_SECRET, ALLOWED_ORIGINS,
 *   UPSTREAM_HOST, UPSTREAM_PORT, UPSTREAM_TLS, SCRIBE_DEBUG
 *
 * Usage:
 *   ./scribe_relay [--env FILE]
 *   ./scribe_relay --issue-token SUBJECT    # 用本地密钥签发测试 token
 */

#include <cstring>

#include <iostream>
#include <memory>
#include <string>

#include "relay/relay_server.hpp"
#include "relay/token_verifier.hpp"
#include "scribe_config.hpp"
#include "scribe_log.hpp"

namespace {

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --env FILE              .env 文件路径 (默认 .env)" << std::endl;
    std::cout << "  --issue-token SUBJECT   签发 1 小时有效的测试 token 并退出" << std::endl;
    std::cout << "  -h, --help              显示帮助" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string dotenv_path = ".env";
    std::string issue_subject;

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            printUsage(argv[0]);
            return 0;
        } else if (std::strcmp(argv[i], "--env") == 0 && i + 1 < argc) {
            dotenv_path = argv[++i];
        } else if (std::strcmp(argv[i], "--issue-token") == 0 && i + 1 < argc) {
            issue_subject = argv[++i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    scribe::RelayConfig config;
    auto result = scribe::RelayConfig::fromEnvironment(config, dotenv_path);

    if (!issue_subject.empty()) {
        if (config.jwt_secret.empty()) {
            scribe::safeError("Relay", "SUPABASE_JWT_SECRET is required to issue tokens");
            return 1;
        }
        std::cout << scribe::relay::issueToken(config.jwt_secret, issue_subject) << std::endl;
        return 0;
    }

    if (!result.isOk()) {
        scribe::safeError("Relay", "Configuration error: ", result.message);
        return 1;
    }

    scribe::relay::RelayServer server(config,
        std::make_shared<scribe::relay::JwtTokenVerifier>(config.jwt_secret));

    result = server.start();
    if (!result.isOk()) {
        scribe::safeError("Relay", "Failed to start: ", result.message,
            result.detail.empty() ? "" : " (" + result.detail + ")");
        return 1;
    }

    server.installSignalHandlers();
    server.wait();

    scribe::safeLog("Relay", "Shutdown complete");
    return 0;
}
