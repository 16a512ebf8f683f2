#include "audio/wav_codec.hpp"

#include <sndfile.h>

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace scribe {
namespace audio {

namespace {

// =============================================================================
// libsndfile virtual IO over a byte vector (内存文件)
// =============================================================================

struct MemoryFile {
    std::vector<uint8_t>* data = nullptr;
    const std::vector<uint8_t>* readonly = nullptr;
    sf_count_t position = 0;

    sf_count_t size() const {
        return static_cast<sf_count_t>(data ? data->size() : readonly->size());
    }
};

sf_count_t memGetLength(void* user) {
    return static_cast<MemoryFile*>(user)->size();
}

sf_count_t memSeek(sf_count_t offset, int whence, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    sf_count_t target = 0;
    switch (whence) {
        case SEEK_SET: target = offset; break;
        case SEEK_CUR: target = file->position + offset; break;
        case SEEK_END: target = file->size() + offset; break;
        default: return -1;
    }
    if (target < 0) return -1;
    file->position = target;
    return target;
}

sf_count_t memRead(void* ptr, sf_count_t count, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    sf_count_t available = file->size() - file->position;
    sf_count_t n = std::max<sf_count_t>(0, std::min(count, available));
    const uint8_t* base = file->data ? file->data->data() : file->readonly->data();
    if (n > 0) {
        std::memcpy(ptr, base + file->position, static_cast<size_t>(n));
        file->position += n;
    }
    return n;
}

sf_count_t memWrite(const void* ptr, sf_count_t count, void* user) {
    auto* file = static_cast<MemoryFile*>(user);
    if (!file->data) return 0;
    size_t end = static_cast<size_t>(file->position + count);
    if (end > file->data->size()) {
        file->data->resize(end);
    }
    std::memcpy(file->data->data() + file->position, ptr, static_cast<size_t>(count));
    file->position += count;
    return count;
}

sf_count_t memTell(void* user) {
    return static_cast<MemoryFile*>(user)->position;
}

SF_VIRTUAL_IO makeVirtualIo() {
    SF_VIRTUAL_IO io;
    io.get_filelen = &memGetLength;
    io.seek = &memSeek;
    io.read = &memRead;
    io.write = &memWrite;
    io.tell = &memTell;
    return io;
}

ErrorInfo readAll(SNDFILE* file, const SF_INFO& sf_info, WavData& out) {
    out.sample_rate = sf_info.samplerate;
    out.channels = sf_info.channels;
    out.samples.assign(static_cast<size_t>(sf_info.frames) * sf_info.channels, 0.0f);

    sf_count_t frames_read = sf_readf_float(file, out.samples.data(), sf_info.frames);
    sf_close(file);

    if (frames_read < 0) {
        return ErrorInfo::error(ErrorCode::INVALID_CONFIG, "Failed to read audio data");
    }
    out.frames = frames_read;
    out.samples.resize(static_cast<size_t>(frames_read) * sf_info.channels);
    return ErrorInfo::ok();
}

}  // namespace

ErrorInfo readWavFile(const std::string& path, WavData& out) {
    SF_INFO sf_info;
    std::memset(&sf_info, 0, sizeof(sf_info));

    SNDFILE* file = sf_open(path.c_str(), SFM_READ, &sf_info);
    if (!file) {
        return ErrorInfo::error(ErrorCode::NO_INPUT_DEVICE,
            "Failed to open audio file", sf_strerror(nullptr));
    }
    return readAll(file, sf_info, out);
}

ErrorInfo encodeWav(const int16_t* pcm, size_t samples, int sample_rate, std::vector<uint8_t>& out) {
    out.clear();
    MemoryFile memory;
    memory.data = &out;
    SF_VIRTUAL_IO io = makeVirtualIo();

    SF_INFO sf_info;
    std::memset(&sf_info, 0, sizeof(sf_info));
    sf_info.samplerate = sample_rate;
    sf_info.channels = 1;
    sf_info.format = SF_FORMAT_WAV | SF_FORMAT_PCM_16;

    SNDFILE* file = sf_open_virtual(&io, SFM_WRITE, &sf_info, &memory);
    if (!file) {
        return ErrorInfo::error(ErrorCode::ENCODE_FAILED,
            "Failed to create WAV encoder", sf_strerror(nullptr));
    }

    sf_count_t written = sf_write_short(file, pcm, static_cast<sf_count_t>(samples));
    // sf_close 回写 RIFF / data 长度
    int close_result = sf_close(file);

    if (written != static_cast<sf_count_t>(samples) || close_result != 0) {
        out.clear();
        return ErrorInfo::error(ErrorCode::ENCODE_FAILED, "Failed to encode WAV data");
    }
    return ErrorInfo::ok();
}

ErrorInfo decodeWav(const std::vector<uint8_t>& bytes, WavData& out) {
    MemoryFile memory;
    memory.readonly = &bytes;
    SF_VIRTUAL_IO io = makeVirtualIo();

    SF_INFO sf_info;
    std::memset(&sf_info, 0, sizeof(sf_info));

    SNDFILE* file = sf_open_virtual(&io, SFM_READ, &sf_info, &memory);
    if (!file) {
        return ErrorInfo::error(ErrorCode::PROTOCOL_DECODE_ERROR,
            "Failed to parse WAV data", sf_strerror(nullptr));
    }
    return readAll(file, sf_info, out);
}

}  // namespace audio
}  // namespace scribe
