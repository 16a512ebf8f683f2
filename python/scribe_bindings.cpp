/**
 * Scribe Python Bindings
 *
 * Exposes the event-stream codec, transcript reconciler, engine selector and
 * resampling helpers to Python using pybind11. Audio goes in and out as numpy
 * arrays, wire frames as bytes.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/functional.h>
#include <pybind11/numpy.h>

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "audio/resampler.hpp"
#include "client/transcript_reconciler.hpp"
#include "codec/event_stream.hpp"
#include "engine/engine_selector.hpp"
#include "scribe_config.hpp"
#include "scribe_types.hpp"

namespace py = pybind11;

namespace {

std::vector<uint8_t> toVector(const py::bytes& data) {
    std::string str = data;
    return std::vector<uint8_t>(str.begin(), str.end());
}

py::bytes toBytes(const std::vector<uint8_t>& data) {
    return py::bytes(reinterpret_cast<const char*>(data.data()), data.size());
}

template <typename T>
py::array_t<T> toArray(const std::vector<T>& values) {
    py::array_t<T> out(values.size());
    std::copy(values.begin(), values.end(), out.mutable_data());
    return out;
}

py::dict messageToDict(const scribe::codec::EventMessage& message) {
    py::dict headers;
    for (const auto& [name, value] : message.headers) {
        headers[py::str(name)] = py::bytes(value);
    }
    py::dict out;
    out["headers"] = headers;
    out["payload"] = toBytes(message.payload);
    return out;
}

}  // namespace

// =============================================================================
// Python Module Definition
// =============================================================================

PYBIND11_MODULE(_scribe, m) {
    m.doc() = "Scribe live transcription Python bindings";

    // -------------------------------------------------------------------------
    // Enums
    // -------------------------------------------------------------------------

    py::enum_<scribe::ErrorCode>(m, "ErrorCode", "Error codes")
        .value("OK", scribe::ErrorCode::OK)
        .value("INVALID_CONFIG", scribe::ErrorCode::INVALID_CONFIG)
        .value("UNSUPPORTED_SAMPLE_RATE", scribe::ErrorCode::UNSUPPORTED_SAMPLE_RATE)
        .value("MISSING_SECRET", scribe::ErrorCode::MISSING_SECRET)
        .value("NOT_STARTED", scribe::ErrorCode::NOT_STARTED)
        .value("ALREADY_STARTED", scribe::ErrorCode::ALREADY_STARTED)
        .value("INVALID_STATE", scribe::ErrorCode::INVALID_STATE)
        .value("TIMEOUT", scribe::ErrorCode::TIMEOUT)
        .value("NO_INPUT_DEVICE", scribe::ErrorCode::NO_INPUT_DEVICE)
        .value("DEVICE_BUSY", scribe::ErrorCode::DEVICE_BUSY)
        .value("NETWORK_ERROR", scribe::ErrorCode::NETWORK_ERROR)
        .value("CONNECTION_FAILED", scribe::ErrorCode::CONNECTION_FAILED)
        .value("AUTH_FAILED", scribe::ErrorCode::AUTH_FAILED)
        .value("CONNECT_TIMEOUT", scribe::ErrorCode::CONNECT_TIMEOUT)
        .value("UPSTREAM_FATAL", scribe::ErrorCode::UPSTREAM_FATAL)
        .value("HTTP_ERROR", scribe::ErrorCode::HTTP_ERROR)
        .value("PROTOCOL_DECODE_ERROR", scribe::ErrorCode::PROTOCOL_DECODE_ERROR)
        .value("INTERNAL_ERROR", scribe::ErrorCode::INTERNAL_ERROR)
        .value("AUDIO_DEVICE_ERROR", scribe::ErrorCode::AUDIO_DEVICE_ERROR)
        .value("ENCODE_FAILED", scribe::ErrorCode::ENCODE_FAILED)
        .export_values();

    py::enum_<scribe::EngineKind>(m, "EngineKind", "Transcription engines")
        .value("RELAY", scribe::EngineKind::RELAY, "Low-latency relay streaming")
        .value("BROWSER", scribe::EngineKind::BROWSER, "Platform recognizer")
        .value("CHUNK", scribe::EngineKind::CHUNK, "Periodic chunk upload");

    py::enum_<scribe::EngineStatus>(m, "EngineStatus", "Engine status")
        .value("IDLE", scribe::EngineStatus::IDLE)
        .value("CONNECTING", scribe::EngineStatus::CONNECTING)
        .value("READY", scribe::EngineStatus::READY)
        .value("ERROR", scribe::EngineStatus::ERROR)
        .value("FALLBACK", scribe::EngineStatus::FALLBACK)
        .value("LOADING", scribe::EngineStatus::LOADING);

    py::enum_<scribe::ForcedEngine>(m, "ForcedEngine", "Engine override")
        .value("AUTO", scribe::ForcedEngine::AUTO)
        .value("RELAY", scribe::ForcedEngine::RELAY)
        .value("BROWSER", scribe::ForcedEngine::BROWSER)
        .value("CHUNK", scribe::ForcedEngine::CHUNK);

    py::enum_<scribe::codec::DecodeMode>(m, "DecodeMode", "Event-stream decode mode")
        .value("TRUSTED", scribe::codec::DecodeMode::TRUSTED, "Skip CRC verification")
        .value("VERIFY_CRC", scribe::codec::DecodeMode::VERIFY_CRC, "Verify prelude and message CRC");

    // -------------------------------------------------------------------------
    // Error Info
    // -------------------------------------------------------------------------

    py::class_<scribe::ErrorInfo>(m, "ErrorInfo", "Error information")
        .def(py::init<>())
        .def_readonly("code", &scribe::ErrorInfo::code)
        .def_readonly("message", &scribe::ErrorInfo::message)
        .def_readonly("detail", &scribe::ErrorInfo::detail)
        .def("is_ok", &scribe::ErrorInfo::isOk, "Check if no error")
        .def("__bool__", &scribe::ErrorInfo::isOk)
        .def("__repr__", [](const scribe::ErrorInfo& e) {
            if (e.isOk()) return std::string("ErrorInfo(OK)");
            return "ErrorInfo(" + e.message + ")";
        });

    m.def("to_user_message", &scribe::toUserMessage, py::arg("error"),
        "Short user-facing message with URLs and keys masked");

    // -------------------------------------------------------------------------
    // Transcript Fragment
    // -------------------------------------------------------------------------

    py::class_<scribe::TranscriptItem>(m, "TranscriptItem")
        .def_readonly("content", &scribe::TranscriptItem::content)
        .def_readonly("start_time", &scribe::TranscriptItem::start_time)
        .def_readonly("end_time", &scribe::TranscriptItem::end_time)
        .def_readonly("type", &scribe::TranscriptItem::type);

    py::class_<scribe::TranscriptAlternative>(m, "TranscriptAlternative")
        .def_readonly("transcript", &scribe::TranscriptAlternative::transcript)
        .def_readonly("items", &scribe::TranscriptAlternative::items);

    py::class_<scribe::TranscriptFragment>(m, "TranscriptFragment", "Recognized transcript fragment")
        .def_readonly("result_id", &scribe::TranscriptFragment::result_id)
        .def_readonly("is_partial", &scribe::TranscriptFragment::is_partial)
        .def_readonly("start_time", &scribe::TranscriptFragment::start_time)
        .def_readonly("end_time", &scribe::TranscriptFragment::end_time)
        .def_readonly("alternatives", &scribe::TranscriptFragment::alternatives)
        .def_property_readonly("text", [](const scribe::TranscriptFragment& f) { return f.text(); })
        .def("__repr__", [](const scribe::TranscriptFragment& f) {
            return "TranscriptFragment('" + f.result_id + "', partial=" +
                (f.is_partial ? "True" : "False") + ")";
        });

    // -------------------------------------------------------------------------
    // Event-stream codec
    // -------------------------------------------------------------------------

    m.def("crc32", [](const py::bytes& data) {
        auto bytes = toVector(data);
        return scribe::codec::crc32(bytes.data(), bytes.size());
    }, py::arg("data"), "CRC32 (reflected 0xEDB88320)");

    m.def("encode_message", [](const std::vector<std::pair<std::string, std::string>>& headers,
            const py::bytes& payload) -> py::object {
        auto bytes = toVector(payload);
        auto encoded = scribe::codec::encodeMessage(headers, bytes.data(), bytes.size());
        if (!encoded) return py::none();
        return toBytes(*encoded);
    }, py::arg("headers"), py::arg("payload"), "Encode a message with string headers");

    m.def("encode_audio_event", [](py::array_t<int16_t> audio) {
        auto buf = audio.request();
        if (buf.ndim != 1) {
            throw std::runtime_error("Audio array must be 1-dimensional");
        }
        return toBytes(scribe::codec::encodeAudioEvent(
            static_cast<const int16_t*>(buf.ptr), static_cast<size_t>(buf.size)));
    }, py::arg("audio"), "Encode PCM16 samples as an AudioEvent frame");

    m.def("decode_message", [](const py::bytes& data, scribe::codec::DecodeMode mode) -> py::object {
        auto bytes = toVector(data);
        auto message = scribe::codec::decodeMessage(bytes, mode);
        if (!message) return py::none();
        return messageToDict(*message);
    }, py::arg("data"), py::arg("mode") = scribe::codec::DecodeMode::TRUSTED,
        "Decode one frame, None when short, truncated or corrupt");

    m.def("pcm_from_payload", [](const py::bytes& payload) {
        return toArray(scribe::codec::pcmFromPayload(toVector(payload)));
    }, py::arg("payload"), "AudioEvent payload to int16 samples");

    m.def("parse_transcript_event", [](const py::bytes& data) {
        auto message = scribe::codec::decodeMessage(toVector(data));
        if (!message) return std::vector<scribe::TranscriptFragment>();
        return scribe::codec::parseTranscriptEvent(*message);
    }, py::arg("data"), "Decode a TranscriptEvent frame into fragments");

    py::class_<scribe::codec::EventStreamReader>(m, "EventStreamReader",
            "Incremental reader for frames split across transport reads")
        .def(py::init<scribe::codec::DecodeMode, int>(),
            py::arg("mode") = scribe::codec::DecodeMode::TRUSTED,
            py::arg("max_consecutive_errors") = 3)
        .def("feed", [](scribe::codec::EventStreamReader& self, const py::bytes& data) {
            self.feed(toVector(data));
        }, py::arg("data"))
        .def("next", [](scribe::codec::EventStreamReader& self) -> py::object {
            auto message = self.next();
            if (!message) return py::none();
            return messageToDict(*message);
        }, "Next complete message, or None")
        .def_property_readonly("buffered", &scribe::codec::EventStreamReader::buffered)
        .def_property_readonly("decode_errors", &scribe::codec::EventStreamReader::decodeErrors)
        .def("should_tear_down", &scribe::codec::EventStreamReader::shouldTearDown)
        .def("reset", &scribe::codec::EventStreamReader::reset);

    // -------------------------------------------------------------------------
    // Transcript Reconciler
    // -------------------------------------------------------------------------

    py::class_<scribe::client::TranscriptReconciler,
            std::shared_ptr<scribe::client::TranscriptReconciler>>(m, "TranscriptReconciler",
            "Tail-overlap de-duplication of final fragments")
        .def(py::init<size_t>(), py::arg("window") = 80)
        .def("commit", &scribe::client::TranscriptReconciler::commit,
            py::arg("result_id"), py::arg("text"),
            "Reconcile and accept, returns the inserted text")
        .def("prepare", &scribe::client::TranscriptReconciler::prepare,
            py::arg("result_id"), py::arg("text"))
        .def("accept", &scribe::client::TranscriptReconciler::accept, py::arg("inserted"))
        .def("begin_session", &scribe::client::TranscriptReconciler::beginSession)
        .def("reset", &scribe::client::TranscriptReconciler::reset)
        .def_property_readonly("transcript", &scribe::client::TranscriptReconciler::transcript)
        .def_property_readonly("tail", &scribe::client::TranscriptReconciler::tail)
        .def_static("overlap_length", &scribe::client::TranscriptReconciler::overlapLength,
            py::arg("tail"), py::arg("text"));

    // -------------------------------------------------------------------------
    // Engine Selector
    // -------------------------------------------------------------------------

    py::class_<scribe::engine::EngineSignals>(m, "EngineSignals")
        .def(py::init<>())
        .def_readwrite("config_loading", &scribe::engine::EngineSignals::config_loading)
        .def_readwrite("recording", &scribe::engine::EngineSignals::recording)
        .def_readwrite("relay_configured", &scribe::engine::EngineSignals::relay_configured)
        .def_readwrite("relay_connecting", &scribe::engine::EngineSignals::relay_connecting)
        .def_readwrite("relay_ready", &scribe::engine::EngineSignals::relay_ready)
        .def_readwrite("relay_error", &scribe::engine::EngineSignals::relay_error)
        .def_readwrite("browser_supported", &scribe::engine::EngineSignals::browser_supported)
        .def_readwrite("browser_listening", &scribe::engine::EngineSignals::browser_listening)
        .def_readwrite("browser_error", &scribe::engine::EngineSignals::browser_error);

    py::class_<scribe::engine::EngineState>(m, "EngineState")
        .def_readonly("preferred", &scribe::engine::EngineState::preferred)
        .def_readonly("active", &scribe::engine::EngineState::active)
        .def_readonly("status", &scribe::engine::EngineState::status)
        .def_readonly("label", &scribe::engine::EngineState::label)
        .def_readonly("did_fallback", &scribe::engine::EngineState::did_fallback)
        .def_readonly("fallback_warning", &scribe::engine::EngineState::fallback_warning)
        .def_readonly("debug_forced", &scribe::engine::EngineState::debug_forced)
        .def("__repr__", [](const scribe::engine::EngineState& s) {
            return "EngineState('" + s.label + "')";
        });

    py::class_<scribe::engine::EngineSelector>(m, "EngineSelector",
            "Engine selection with one-way fallback during a recording")
        .def(py::init([](scribe::ForcedEngine forced) {
            scribe::EngineSelectorConfig config;
            config.forced = forced;
            return std::make_unique<scribe::engine::EngineSelector>(config);
        }), py::arg("forced") = scribe::ForcedEngine::AUTO)
        .def("update", &scribe::engine::EngineSelector::update, py::arg("signals"))
        .def("report_failure", &scribe::engine::EngineSelector::reportFailure, py::arg("engine"))
        .def("begin_session", &scribe::engine::EngineSelector::beginSession)
        .def_property_readonly("state", &scribe::engine::EngineSelector::state)
        .def_static("compute", &scribe::engine::EngineSelector::compute,
            py::arg("signals"), py::arg("forced") = scribe::ForcedEngine::AUTO);

    m.def("parse_forced_engine", &scribe::parseForcedEngine, py::arg("value"));

    // -------------------------------------------------------------------------
    // Resampling
    // -------------------------------------------------------------------------

    m.def("downmix_to_mono", [](py::array_t<float> audio, int channels) {
        auto buf = audio.request();
        if (channels <= 0 || buf.size % channels != 0) {
            throw std::runtime_error("Sample count must be a multiple of channels");
        }
        return toArray(scribe::audio::downmixToMono(static_cast<const float*>(buf.ptr),
            static_cast<size_t>(buf.size / channels), channels));
    }, py::arg("audio"), py::arg("channels"), "Average interleaved channels");

    m.def("resample_nearest", [](py::array_t<float> audio, int from_rate, int to_rate) {
        auto buf = audio.request();
        return toArray(scribe::audio::resampleNearest(static_cast<const float*>(buf.ptr),
            static_cast<size_t>(buf.size), from_rate, to_rate));
    }, py::arg("audio"), py::arg("from_rate"), py::arg("to_rate"));

    m.def("quantize", [](py::array_t<float> audio) {
        auto buf = audio.request();
        return toArray(scribe::audio::quantize(static_cast<const float*>(buf.ptr),
            static_cast<size_t>(buf.size)));
    }, py::arg("audio"), "Float [-1, 1] to int16");

    m.def("peak_amplitude", [](py::array_t<float> audio) {
        auto buf = audio.request();
        return scribe::audio::peakAmplitude(static_cast<const float*>(buf.ptr),
            static_cast<size_t>(buf.size));
    }, py::arg("audio"));

    py::class_<scribe::audio::NearestResampler>(m, "NearestResampler",
            "Streaming nearest-neighbour resampler keeping phase across blocks")
        .def(py::init<int, int>(), py::arg("from_rate"), py::arg("to_rate"))
        .def("process", [](scribe::audio::NearestResampler& self, py::array_t<float> audio) {
            auto buf = audio.request();
            std::vector<float> out;
            self.process(static_cast<const float*>(buf.ptr), static_cast<size_t>(buf.size), out);
            return toArray(out);
        }, py::arg("audio"))
        .def("reset", &scribe::audio::NearestResampler::reset)
        .def_property_readonly("from_rate", &scribe::audio::NearestResampler::fromRate)
        .def_property_readonly("to_rate", &scribe::audio::NearestResampler::toRate);
}
