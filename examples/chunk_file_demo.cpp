/**
 * Scribe 分块上传示例 (文件识别)
 *
 * 读取音频文件, 下混并重采样到 16kHz 单声道, 按 chunk_ms 切块后经分块上传
 * 引擎识别, 打印每块结果与去重后的完整文本。
 *
 * Usage:
 *   ./scribe_chunk_file_demo <audio_file> --endpoint URL [options]
 *
 * Examples:
 *   ./scribe_chunk_file_demo note.wav --endpoint https://api.example.com/transcribe
 *   ./scribe_chunk_file_demo note.wav --endpoint $URL --api-key $KEY --chunk-ms 3000
 */

#include <cstdlib>
#include <cstring>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "audio/resampler.hpp"
#include "audio/wav_codec.hpp"
#include "engine/chunk_upload_engine.hpp"
#include "scribe_callback.hpp"
#include "scribe_config.hpp"
#include "scribe_log.hpp"

namespace {

constexpr int TARGET_SAMPLE_RATE = 16000;

void printUsage(const char* program) {
    std::cout << "Usage: " << program << " <audio_file> --endpoint URL [options]" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  --endpoint URL     识别接口 (或环境变量 SCRIBE_TRANSCRIBE_ENDPOINT)" << std::endl;
    std::cout << "  --api-key KEY      apikey 头" << std::endl;
    std::cout << "  --token TOKEN      Bearer token" << std::endl;
    std::cout << "  --chunk-ms N       分块长度 (默认 5000)" << std::endl;
    std::cout << "  -h, --help         显示帮助" << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    scribe::ChunkConfig config;
    if (const char* endpoint = std::getenv("SCRIBE_TRANSCRIBE_ENDPOINT")) {
        config.endpoint = endpoint;
    }
    std::string path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        const bool has_value = i + 1 < argc;
        if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--endpoint" && has_value) {
            config.endpoint = argv[++i];
        } else if (arg == "--api-key" && has_value) {
            config.api_key = argv[++i];
        } else if (arg == "--token" && has_value) {
            config.access_token = argv[++i];
        } else if (arg == "--chunk-ms" && has_value) {
            config.chunk_ms = std::atoi(argv[++i]);
        } else if (path.empty() && arg[0] != '-') {
            path = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (path.empty() || config.endpoint.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    // 1. 读取并转换音频
    scribe::audio::WavData wav;
    auto result = scribe::audio::readWavFile(path, wav);
    if (!result.isOk()) {
        std::cerr << "读取音频失败: " << result.message << std::endl;
        return 1;
    }

    auto mono = scribe::audio::downmixToMono(wav.samples.data(),
        static_cast<size_t>(wav.frames), wav.channels);
    auto resampled = scribe::audio::resampleNearest(mono.data(), mono.size(),
        wav.sample_rate, TARGET_SAMPLE_RATE);
    auto pcm = scribe::audio::quantize(resampled.data(), resampled.size());

    std::cout << "=== Scribe 分块识别 ===" << std::endl;
    std::cout << "  文件:   " << path << " (" << wav.sample_rate << " Hz, " << wav.channels
        << " ch, " << (pcm.size() * 1000 / TARGET_SAMPLE_RATE) << " ms)" << std::endl;
    std::cout << "  分块:   " << config.chunk_ms << " ms" << std::endl;
    std::cout << std::endl;

    // 2. 分块上传
    scribe::engine::ChunkUploadEngine engine(config,
        std::make_shared<scribe::engine::CurlChunkTranscriber>(config));

    auto callback = scribe::LambdaCallback::create()
        .onFinal([](const scribe::TranscriptFragment& fragment, const std::string& inserted) {
            std::cout << "    [" << fragment.result_id << "] " << fragment.text() << std::endl;
            if (!inserted.empty() && inserted != fragment.text() + " ") {
                std::cout << "        去重后: " << inserted << std::endl;
            }
        })
        .onWarning([](const scribe::ErrorInfo& warning) {
            std::cerr << "    警告: " << scribe::toUserMessage(warning) << std::endl;
        })
        .onError([](const scribe::ErrorInfo& error) {
            std::cerr << "    错误: " << scribe::toUserMessage(error) << std::endl;
        })
        .build();
    engine.setCallback(std::shared_ptr<scribe::ISessionCallback>(std::move(callback)));

    result = engine.start(nullptr);
    if (!result.isOk()) {
        std::cerr << "启动失败: " << result.message << std::endl;
        return 1;
    }

    const size_t chunk_samples = static_cast<size_t>(config.chunk_ms) * TARGET_SAMPLE_RATE / 1000;
    int64_t sequence = 0;
    auto waitForQueue = [&engine](size_t limit) {
        while (true) {
            auto d = engine.diagnostics();
            if (d.queued + (d.in_flight ? 1 : 0) <= limit) break;
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    };

    for (size_t offset = 0; offset < pcm.size(); offset += chunk_samples) {
        // 文件比实时快, 控制排队深度避免溢出丢块
        waitForQueue(config.max_queued_chunks - 1);
        const size_t end = std::min(pcm.size(), offset + chunk_samples);
        std::vector<int16_t> chunk(pcm.begin() + offset, pcm.begin() + end);
        result = engine.submitChunk(scribe::AudioFrame(std::move(chunk), TARGET_SAMPLE_RATE, sequence++));
        if (!result.isOk()) {
            std::cerr << "提交分块失败: " << result.message << std::endl;
            break;
        }
    }

    waitForQueue(0);
    engine.stop();

    auto diagnostics = engine.diagnostics();
    std::cout << std::endl;
    std::cout << "=== 完整文本 ===" << std::endl;
    std::cout << engine.reconciler().transcript() << std::endl;
    std::cout << std::endl;
    std::cout << "上传: " << diagnostics.chunks_uploaded
        << ", 跳过 (短): " << diagnostics.chunks_skipped_short
        << ", 跳过 (静音): " << diagnostics.chunks_skipped_silent
        << ", 失败: " << diagnostics.upload_failures << std::endl;

    return diagnostics.upload_failures == 0 ? 0 : 1;
}
