#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace funnel {

using json = nlohmann::json;

// ============================================================================
// DATA MODEL
// ============================================================================

struct TranscriptSegment {
    std::string text;
    double confidence = 0.0;
    double start = 0.0;
    double end = 0.0;
    bool is_final = false;
};

void to_json(json& j, const TranscriptSegment& segment);
void from_json(const json& j, TranscriptSegment& segment);

/// Declared by the client in the one-time config frame.
struct StreamConfig {
    std::string format = "pcm16";
    int sample_rate = 16000;
    int channels = 1;
};

/// Result of the finalization handshake, returned by POST .../done.
struct AssembledTranscript {
    std::string session_id;
    std::string transcript;
    double duration = 0.0;
    std::vector<TranscriptSegment> segments;
    bool partial = false;
    uint64_t audio_bytes = 0;
    int64_t processing_ms = 0;
};

void to_json(json& j, const AssembledTranscript& result);
void from_json(const json& j, AssembledTranscript& result);

/// Appends a final segment's trimmed text to `text`, single-space separated. Interim segments are ignored.
void append_final_text(std::string& text, const TranscriptSegment& segment);

/// Concatenates the text of final segments in arrival order, single-space separated.
std::string assemble_final_text(const std::vector<TranscriptSegment>& segments);

// ============================================================================
// WIRE FRAMES
// ============================================================================

enum class EventType {
    Ready,
    Transcript,
    Error,
    Metadata,
    ProcessingComplete,
    Unknown
};

/// Inbound (relay -> client) event frame.
struct StreamEvent {
    EventType type = EventType::Unknown;
    TranscriptSegment segment;
    std::string full_transcript;
    std::string message;
    double duration = 0.0;
};

std::string make_config_frame(const StreamConfig& config);

/// Parses and validates a config frame. Throws FunnelError(ProtocolError).
StreamConfig parse_config_frame(const std::string& text);

std::string make_ready_event();
std::string make_transcript_event(const TranscriptSegment& segment, const std::string& full_transcript);
std::string make_error_event(const std::string& message);
std::string make_processing_complete_event(double duration);

// ============================================================================
// FINALIZE REQUEST
// ============================================================================

/// Body of POST /recordings/{id}/done: {"audioBytesSent": N}.
std::string make_finalize_request(uint64_t audio_bytes_sent);

/// The client's sent-byte count, or std::nullopt for an empty body or one without it.
/// Throws FunnelError(ProtocolError) for malformed JSON or a non-integer count.
std::optional<uint64_t> parse_finalize_request(const std::string& body);

/// Parses an event frame. Throws FunnelError(ProtocolError) on malformed JSON.
StreamEvent parse_event(const std::string& text);

} // namespace funnel
