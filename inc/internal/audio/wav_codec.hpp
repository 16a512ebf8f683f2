#ifndef SCRIBE_AUDIO_WAV_CODEC_HPP
#define SCRIBE_AUDIO_WAV_CODEC_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "../scribe_types.hpp"

namespace scribe {
namespace audio {

struct WavData {
    std::vector<float> samples;     // 交错 float
    int sample_rate = 0;
    int channels = 0;
    int64_t frames = 0;
};

/// @brief 读取音频文件 (libsndfile 支持的任意格式)
ErrorInfo readWavFile(const std::string& path, WavData& out);

/// @brief 在内存中编码 16-bit PCM 单声道 WAV
ErrorInfo encodeWav(const int16_t* pcm, size_t samples, int sample_rate, std::vector<uint8_t>& out);

/// @brief 从内存解码 WAV
ErrorInfo decodeWav(const std::vector<uint8_t>& bytes, WavData& out);

}  // namespace audio
}  // namespace scribe

#endif  // SCRIBE_AUDIO_WAV_CODEC_HPP
