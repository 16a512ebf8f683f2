/**
 * Scribe 实时听写示例
 *
 * 采集麦克风 (或 WAV 文件 / 合成音) 推流到 relay, 打印中间结果与去重后的
 * 最终结果。relay 失败时自动降级到分块上传 (需配置 --chunk-endpoint)。
 *
 * Usage:
 *   ./scribe_dictation_demo [options]
 *
 * Examples:
 *   ./scribe_dictation_demo --token $TOKEN                    # 默认麦克风, 30 秒
 *   ./scribe_dictation_demo --secret $SECRET --source file:note.wav
 *   ./scribe_dictation_demo --host relay.example.com --port 443 --tls --token $TOKEN
 */

#include <csignal>
#include <cstdlib>
#include <cstring>

#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "scribe_api.hpp"
#include "relay/token_verifier.hpp"

// 全局停止标志
static std::atomic<bool> g_running{true};

void signalHandler(int signum) {
    std::cout << "\n收到信号 " << signum << ", 停止中..." << std::endl;
    g_running = false;
}

// =============================================================================
// DictationCallback
// =============================================================================

class DictationCallback : public Scribe::LiveScribeCallback {
public:
    void OnOpen(Scribe::Engine engine) override {
        (void)engine;
        std::cout << "    [回调] 开始听写" << std::endl;
    }

    void OnPartial(const std::string& text) override {
        std::cout << "    [回调] 中间结果: " << text << std::endl;
    }

    void OnFinal(const std::string& text, const std::string& inserted) override {
        std::cout << "    [回调] 最终结果: " << text << std::endl;
        if (!inserted.empty() && inserted != text + " ") {
            std::cout << "    [回调] 去重后插入: " << inserted << std::endl;
        }
    }

    void OnEngineChanged(const Scribe::EngineInfo& info) override {
        std::cout << "    [回调] " << info.label << std::endl;
        if (!info.fallback_warning.empty()) {
            std::cout << "    [回调] " << info.fallback_warning << std::endl;
        }
    }

    void OnSummary(const std::string& summary) override {
        std::cout << "    [回调] 摘要更新 (" << summary.size() << " 字符)" << std::endl;
    }

    void OnNoFieldFocused() override {
        std::cout << "    [回调] 没有焦点输入框" << std::endl;
    }

    void OnError(int code, const std::string& message) override {
        std::cerr << "    [回调] 错误 " << code << ": " << message << std::endl;
        failed_ = true;
    }

    void OnClose(const Scribe::SessionStats& stats) override {
        std::cout << "    [回调] 会话关闭 (时长 " << stats.duration_ms << " ms, 最终结果 "
            << stats.final_count << " 条)" << std::endl;
    }

    bool failed() const { return failed_.load(); }

private:
    std::atomic<bool> failed_{false};
};

// =============================================================================
// Utility Functions
// =============================================================================

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --host HOST            relay 主机 (默认 localhost)" << std::endl;
    std::cout << "  --port PORT            relay 端口 (默认 8080)" << std::endl;
    std::cout << "  --path PATH            WebSocket 路径 (默认 /dictate)" << std::endl;
    std::cout << "  --tls                  使用 wss://" << std::endl;
    std::cout << "  --token TOKEN          access token (或环境变量 SCRIBE_ACCESS_TOKEN)" << std::endl;
    std::cout << "  --secret SECRET        用本地 JWT 密钥签发 token" << std::endl;
    std::cout << "  --source NAME          default | synthetic | file:<path> (默认 default)" << std::endl;
    std::cout << "  --device N             麦克风设备索引" << std::endl;
    std::cout << "  --seconds N            录音时长 (默认 30)" << std::endl;
    std::cout << "  --event-stream         使用二进制 event-stream 线路格式" << std::endl;
    std::cout << "  --chunk-endpoint URL   分块上传接口 (降级使用)" << std::endl;
    std::cout << "  --summary-endpoint URL 摘要接口" << std::endl;
    std::cout << "  --api-key KEY          分块/摘要接口的 apikey" << std::endl;
    std::cout << "  --force ENGINE         auto | relay | chunk" << std::endl;
    std::cout << "  -h, --help             显示帮助" << std::endl;
}

int main(int argc, char* argv[]) {
    Scribe::LiveScribeConfig config = Scribe::LiveScribeConfig::FromEnvironment();
    int seconds = 30;
    std::string secret;

    if (const char* token = std::getenv("SCRIBE_ACCESS_TOKEN")) {
        config.access_token = token;
    }

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--host" && has_value) {
            config.relay_host = argv[++i];
        } else if (arg == "--port" && has_value) {
            config.relay_port = argv[++i];
        } else if (arg == "--path" && has_value) {
            config.relay_path = argv[++i];
        } else if (arg == "--tls") {
            config.relay_tls = true;
        } else if (arg == "--token" && has_value) {
            config.access_token = argv[++i];
        } else if (arg == "--secret" && has_value) {
            secret = argv[++i];
        } else if (arg == "--source" && has_value) {
            config.audio_source = argv[++i];
        } else if (arg == "--device" && has_value) {
            config.device_index = std::atoi(argv[++i]);
        } else if (arg == "--seconds" && has_value) {
            seconds = std::atoi(argv[++i]);
        } else if (arg == "--event-stream") {
            config.event_stream = true;
        } else if (arg == "--chunk-endpoint" && has_value) {
            config.transcribe_endpoint = argv[++i];
        } else if (arg == "--summary-endpoint" && has_value) {
            config.summary_endpoint = argv[++i];
        } else if (arg == "--api-key" && has_value) {
            config.api_key = argv[++i];
        } else if (arg == "--force" && has_value) {
            config.force_engine = argv[++i];
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (!secret.empty() && config.access_token.empty()) {
        config.access_token = scribe::relay::issueToken(secret, "dictation-demo");
    }

    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);

    std::cout << "=== Scribe 实时听写 ===" << std::endl;
    std::cout << "  relay:  " << (config.relay_tls ? "wss://" : "ws://") << config.relay_host
        << ":" << config.relay_port << config.relay_path << std::endl;
    std::cout << "  音频源: " << config.audio_source << std::endl;
    std::cout << "  时长:   " << seconds << " 秒 (Ctrl+C 提前结束)" << std::endl;
    std::cout << std::endl;

    auto callback = std::make_shared<DictationCallback>();
    Scribe::LiveScribe scribe(config);
    scribe.SetCallback(callback);

    if (!scribe.Start()) {
        std::cerr << "启动失败: " << scribe.GetLastError() << std::endl;
        return 1;
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(seconds);
    while (g_running && std::chrono::steady_clock::now() < deadline && scribe.IsRecording()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    scribe.Stop();

    std::cout << std::endl;
    std::cout << "=== 完整文本 ===" << std::endl;
    std::cout << scribe.GetTranscript() << std::endl;

    const auto summary = scribe.GetRunningSummary();
    if (!summary.empty()) {
        std::cout << std::endl;
        std::cout << "=== 摘要 ===" << std::endl;
        std::cout << summary << std::endl;
    }

    return callback->failed() ? 1 : 0;
}
