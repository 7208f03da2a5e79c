#include "common/protocol.hpp"
#include "common/errors.hpp"

#include <limits>

namespace funnel {

void to_json(json& j, const TranscriptSegment& segment) {
    j = json{
        {"text", segment.text},
        {"confidence", segment.confidence},
        {"start", segment.start},
        {"end", segment.end},
        {"isFinal", segment.is_final}
    };
}

void from_json(const json& j, TranscriptSegment& segment) {
    segment.text = j.value("text", "");
    segment.confidence = j.value("confidence", 0.0);
    segment.start = j.value("start", 0.0);
    segment.end = j.value("end", 0.0);
    segment.is_final = j.value("isFinal", false);
}

void to_json(json& j, const AssembledTranscript& result) {
    j = json{
        {"success", true},
        {"recordingId", result.session_id},
        {"transcript", result.transcript},
        {"duration", result.duration},
        {"segments", result.segments},
        {"segmentCount", result.segments.size()},
        {"partial", result.partial},
        {"audioBytes", result.audio_bytes},
        {"processingTime", result.processing_ms}
    };
}

void from_json(const json& j, AssembledTranscript& result) {
    result.session_id = j.value("recordingId", "");
    result.transcript = j.value("transcript", "");
    result.duration = j.value("duration", 0.0);
    result.segments = j.value("segments", std::vector<TranscriptSegment>{});
    result.partial = j.value("partial", false);
    result.audio_bytes = j.value("audioBytes", static_cast<uint64_t>(0));
    result.processing_ms = j.value("processingTime", static_cast<int64_t>(0));
}

void append_final_text(std::string& text, const TranscriptSegment& segment) {
    if (!segment.is_final) return;

    size_t first = segment.text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return;
    size_t last = segment.text.find_last_not_of(" \t\r\n");

    if (!text.empty()) text += ' ';
    text.append(segment.text, first, last - first + 1);
}

std::string assemble_final_text(const std::vector<TranscriptSegment>& segments) {
    std::string out;
    for (const auto& segment : segments) {
        append_final_text(out, segment);
    }
    return out;
}

// ============================================================================
// WIRE FRAMES
// ============================================================================

std::string make_config_frame(const StreamConfig& config) {
    json frame = {
        {"type", "config"},
        {"format", config.format},
        {"sampleRate", config.sample_rate},
        {"channels", config.channels}
    };
    return frame.dump();
}

StreamConfig parse_config_frame(const std::string& text) {
    json frame;
    try {
        frame = json::parse(text);
    } catch (const json::parse_error& e) {
        throw FunnelError(ErrorCode::ProtocolError, std::string("config frame is not JSON: ") + e.what());
    }

    if (!frame.is_object() || frame.value("type", "") != "config") {
        throw FunnelError(ErrorCode::ProtocolError, "expected a config frame");
    }

    // Numeric fields must be JSON integers that fit an int.
    auto integer_field = [&frame](const char* key, int fallback) {
        if (!frame.contains(key)) return fallback;
        const json& v = frame[key];
        if (!v.is_number_integer()) {
            throw FunnelError(ErrorCode::ProtocolError, std::string(key) + " must be an integer");
        }
        if (v.is_number_unsigned() ? v.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                                   : (v.get<int64_t>() > std::numeric_limits<int>::max() ||
                                      v.get<int64_t>() < std::numeric_limits<int>::min())) {
            throw FunnelError(ErrorCode::ProtocolError, std::string(key) + " is out of range");
        }
        return v.get<int>();
    };

    StreamConfig config;
    try {
        config.format = frame.value("format", "");
    } catch (const json::type_error& e) {
        throw FunnelError(ErrorCode::ProtocolError, std::string("malformed config frame: ") + e.what());
    }
    config.sample_rate = integer_field("sampleRate", 0);
    config.channels = integer_field("channels", 1);

    if (config.format != "pcm16") {
        throw FunnelError(ErrorCode::ProtocolError, "unsupported format '" + config.format + "'");
    }
    if (config.channels != 1) {
        throw FunnelError(ErrorCode::ProtocolError, "only mono audio is supported");
    }
    if (config.sample_rate <= 0) {
        throw FunnelError(ErrorCode::ProtocolError, "sampleRate must be positive");
    }
    return config;
}

std::string make_ready_event() {
    return json{{"type", "ready"}}.dump();
}

std::string make_transcript_event(const TranscriptSegment& segment, const std::string& full_transcript) {
    json event = {
        {"type", "transcript"},
        {"segment", segment},
        {"fullTranscript", full_transcript}
    };
    return event.dump();
}

std::string make_error_event(const std::string& message) {
    return json{{"type", "error"}, {"message", message}}.dump();
}

std::string make_processing_complete_event(double duration) {
    return json{{"type", "processingComplete"}, {"duration", duration}}.dump();
}

std::string make_finalize_request(uint64_t audio_bytes_sent) {
    return json{{"audioBytesSent", audio_bytes_sent}}.dump();
}

std::optional<uint64_t> parse_finalize_request(const std::string& body) {
    if (body.find_first_not_of(" \t\r\n") == std::string::npos) return std::nullopt;

    json frame = json::parse(body, nullptr, false);
    if (frame.is_discarded() || !frame.is_object()) {
        throw FunnelError(ErrorCode::ProtocolError, "finalize request body is not a JSON object");
    }
    if (!frame.contains("audioBytesSent")) return std::nullopt;

    const json& sent = frame["audioBytesSent"];
    if (!sent.is_number_integer() || (!sent.is_number_unsigned() && sent.get<int64_t>() < 0)) {
        throw FunnelError(ErrorCode::ProtocolError, "audioBytesSent must be a non-negative integer");
    }
    return sent.get<uint64_t>();
}

StreamEvent parse_event(const std::string& text) {
    json frame;
    try {
        frame = json::parse(text);
    } catch (const json::parse_error& e) {
        throw FunnelError(ErrorCode::ProtocolError, std::string("event frame is not JSON: ") + e.what());
    }
    if (!frame.is_object()) {
        throw FunnelError(ErrorCode::ProtocolError, "event frame is not an object");
    }

    StreamEvent event;
    try {
        std::string type = frame.value("type", "");
        if (type == "ready") {
            event.type = EventType::Ready;
        } else if (type == "transcript") {
            event.type = EventType::Transcript;
            if (frame.contains("segment")) {
                event.segment = frame.at("segment").get<TranscriptSegment>();
            }
            event.full_transcript = frame.value("fullTranscript", "");
        } else if (type == "error") {
            event.type = EventType::Error;
            event.message = frame.value("message", "");
        } else if (type == "metadata") {
            event.type = EventType::Metadata;
            event.duration = frame.value("duration", 0.0);
        } else if (type == "processingComplete") {
            event.type = EventType::ProcessingComplete;
            event.duration = frame.value("duration", 0.0);
        }
    } catch (const json::type_error& e) {
        throw FunnelError(ErrorCode::ProtocolError, std::string("malformed event frame: ") + e.what());
    }
    return event;
}

} // namespace funnel
