// Tests for the binary event-stream codec

#include <cassert>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <string>
#include <vector>

#include "codec/event_stream.hpp"
#include "scribe_types.hpp"

using namespace scribe;
using namespace scribe::codec;

namespace {

void test_passed(const char* name) {
    std::cout << "[PASS] " << name << std::endl;
}

std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

std::vector<uint8_t> transcriptEvent(const std::string& json_payload) {
    OrderedHeaders headers = {
        {":content-type", "application/json"},
        {":event-type", "TranscriptEvent"},
        {":message-type", "event"},
    };
    auto payload = bytesOf(json_payload);
    auto encoded = encodeMessage(headers, payload.data(), payload.size());
    assert(encoded.has_value());
    return *encoded;
}

}  // namespace

// ============================================================================
// CRC / framing
// ============================================================================

void test_crc32_check_value() {
    const std::string check = "123456789";
    assert(crc32(reinterpret_cast<const uint8_t*>(check.data()), check.size()) == 0xCBF43926u);
    assert(crc32(nullptr, 0) == 0u);
    test_passed("crc32 check value");
}

void test_audio_event_layout() {
    std::vector<int16_t> pcm = {0, 1, -1, 32767, -32768};
    auto frame = encodeAudioEvent(pcm.data(), pcm.size());
    assert(frame.size() >= kMinimumFrameLength);

    uint32_t total = (uint32_t(frame[0]) << 24) | (uint32_t(frame[1]) << 16) |
        (uint32_t(frame[2]) << 8) | uint32_t(frame[3]);
    assert(total == frame.size());

    auto message = decodeMessage(frame, DecodeMode::VERIFY_CRC);
    assert(message.has_value());
    assert(message->eventType() == "AudioEvent");
    assert(message->messageType() == "event");
    assert(message->header(":content-type") == "application/octet-stream");
    assert(message->payload.size() == pcm.size() * 2);
    // 小端
    assert(message->payload[2] == 0x01 && message->payload[3] == 0x00);
    assert(message->payload[4] == 0xFF && message->payload[5] == 0xFF);
    assert(pcmFromPayload(message->payload) == pcm);
    test_passed("audio event layout");
}

void test_empty_audio_event() {
    auto frame = encodeAudioEvent(nullptr, 0);
    auto message = decodeMessage(frame, DecodeMode::VERIFY_CRC);
    assert(message.has_value());
    assert(message->payload.empty());
    assert(message->eventType() == "AudioEvent");
    test_passed("empty audio event");
}

void test_encode_rejects_oversized_header() {
    OrderedHeaders too_long_name = {{std::string(256, 'x'), "v"}};
    assert(!encodeMessage(too_long_name, nullptr, 0).has_value());
    OrderedHeaders empty_name = {{"", "v"}};
    assert(!encodeMessage(empty_name, nullptr, 0).has_value());
    test_passed("encode rejects bad headers");
}

// ============================================================================
// Decode failures
// ============================================================================

void test_decode_short_and_truncated() {
    std::vector<uint8_t> tiny(10, 0);
    assert(!decodeMessage(tiny).has_value());

    std::vector<int16_t> pcm(32, 100);
    auto frame = encodeAudioEvent(pcm.data(), pcm.size());
    std::vector<uint8_t> truncated(frame.begin(), frame.end() - 3);
    assert(!decodeMessage(truncated).has_value());
    test_passed("decode short / truncated");
}

void test_decode_crc_modes() {
    std::vector<int16_t> pcm(16, 42);
    auto frame = encodeAudioEvent(pcm.data(), pcm.size());
    frame[frame.size() - 6] ^= 0x5A;  // 破坏 payload

    // 受信任模式不校验 CRC
    assert(decodeMessage(frame, DecodeMode::TRUSTED).has_value());
    assert(!decodeMessage(frame, DecodeMode::VERIFY_CRC).has_value());

    auto bad_prelude = encodeAudioEvent(pcm.data(), pcm.size());
    bad_prelude[9] ^= 0x01;
    assert(!decodeMessage(bad_prelude, DecodeMode::VERIFY_CRC).has_value());
    test_passed("decode crc modes");
}

void test_decode_bad_lengths() {
    std::vector<uint8_t> frame(20, 0);
    frame[3] = 20;      // total = 20
    frame[7] = 200;     // headers > total
    assert(!decodeMessage(frame).has_value());

    std::vector<uint8_t> huge(16, 0);
    huge[0] = 0x7F;     // total 远超上限
    assert(!decodeMessage(huge).has_value());
    test_passed("decode bad lengths");
}

// ============================================================================
// Transcript events
// ============================================================================

void test_parse_transcript_event() {
    auto frame = transcriptEvent(R"({"Transcript":{"Results":[
        {"ResultId":"r1","IsPartial":false,"StartTime":0.5,"EndTime":1.25,
         "Alternatives":[{"Transcript":"patient denies chest pain",
           "Items":[{"Content":"patient","StartTime":0.5,"EndTime":0.8,"Type":"pronunciation"}]}]},
        {"ResultId":"r2","Alternatives":[{"Transcript":"blood"}]}
    ]}})");
    auto message = decodeMessage(frame, DecodeMode::VERIFY_CRC);
    assert(message.has_value());

    auto fragments = parseTranscriptEvent(*message);
    assert(fragments.size() == 2);
    assert(fragments[0].result_id == "r1");
    assert(!fragments[0].is_partial);
    assert(fragments[0].text() == "patient denies chest pain");
    assert(fragments[0].alternatives[0].items.size() == 1);
    assert(fragments[0].alternatives[0].items[0].content == "patient");
    assert(fragments[0].end_time == 1.25);
    // 缺省 IsPartial 视为 partial
    assert(fragments[1].is_partial);
    assert(fragments[1].text() == "blood");
    test_passed("parse transcript event");
}

void test_parse_malformed_transcript() {
    EventMessage message;
    message.payload = bytesOf("{not json");
    assert(parseTranscriptEvent(message).empty());

    message.payload = bytesOf(R"({"Transcript":{"Results":"nope"}})");
    assert(parseTranscriptEvent(message).empty());
    test_passed("parse malformed transcript");
}

void test_exception_message() {
    OrderedHeaders headers = {
        {":exception-type", "BadRequestException"},
        {":message-type", "exception"},
    };
    auto payload = bytesOf(R"({"Message":"bad audio"})");
    auto frame = encodeMessage(headers, payload.data(), payload.size());
    assert(frame.has_value());
    auto message = decodeMessage(*frame, DecodeMode::VERIFY_CRC);
    assert(message.has_value());

    auto error = exceptionFromMessage(*message);
    assert(error.has_value());
    assert(error->code == ErrorCode::UPSTREAM_FATAL);
    assert(error->message == "BadRequestException");

    auto event = decodeMessage(transcriptEvent("{}"));
    assert(!exceptionFromMessage(*event).has_value());
    test_passed("exception message");
}

// ============================================================================
// Incremental reader
// ============================================================================

void test_reader_split_frames() {
    auto first = transcriptEvent(R"({"Transcript":{"Results":[]}})");
    std::vector<int16_t> pcm(8, 7);
    auto second = encodeAudioEvent(pcm.data(), pcm.size());

    std::vector<uint8_t> stream = first;
    stream.insert(stream.end(), second.begin(), second.end());

    EventStreamReader reader(DecodeMode::VERIFY_CRC);
    // 逐字节喂入
    size_t messages = 0;
    for (uint8_t b : stream) {
        reader.feed(&b, 1);
        while (auto message = reader.next()) {
            ++messages;
            if (messages == 1) assert(message->eventType() == "TranscriptEvent");
            if (messages == 2) assert(pcmFromPayload(message->payload) == pcm);
        }
    }
    assert(messages == 2);
    assert(reader.buffered() == 0);
    assert(reader.decodeErrors() == 0);
    test_passed("reader split frames");
}

void test_reader_skips_corrupt_frame() {
    std::vector<int16_t> pcm(8, 9);
    auto bad = encodeAudioEvent(pcm.data(), pcm.size());
    bad[bad.size() - 1] ^= 0xFF;
    auto good = encodeAudioEvent(pcm.data(), pcm.size());

    EventStreamReader reader(DecodeMode::VERIFY_CRC);
    reader.feed(bad);
    reader.feed(good);

    auto message = reader.next();
    assert(message.has_value());
    assert(reader.decodeErrors() == 1);
    assert(reader.consecutiveErrors() == 0);
    test_passed("reader skips corrupt frame");
}

void test_reader_tear_down_threshold() {
    EventStreamReader reader(DecodeMode::VERIFY_CRC, 3);
    std::vector<int16_t> pcm(4, 1);
    for (int i = 0; i < 3; ++i) {
        auto bad = encodeAudioEvent(pcm.data(), pcm.size());
        bad[bad.size() - 2] ^= 0x10;
        reader.feed(bad);
        assert(!reader.next().has_value());
    }
    assert(reader.shouldTearDown());

    // 无效 prelude 丢弃全部缓冲
    EventStreamReader garbage;
    std::vector<uint8_t> junk(32, 0xFF);
    garbage.feed(junk);
    assert(!garbage.next().has_value());
    assert(garbage.buffered() == 0);
    assert(garbage.decodeErrors() == 1);

    reader.reset();
    assert(!reader.shouldTearDown());
    test_passed("reader tear-down threshold");
}

int main() {
    std::cout << "=== Event Stream Tests ===" << std::endl;

    test_crc32_check_value();
    test_audio_event_layout();
    test_empty_audio_event();
    test_encode_rejects_oversized_header();
    test_decode_short_and_truncated();
    test_decode_crc_modes();
    test_decode_bad_lengths();
    test_parse_transcript_event();
    test_parse_malformed_transcript();
    test_exception_message();
    test_reader_split_frames();
    test_reader_skips_corrupt_frame();
    test_reader_tear_down_threshold();

    std::cout << "All event stream tests passed" << std::endl;
    return 0;
}
