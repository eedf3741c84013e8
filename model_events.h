#ifndef RTBRIDGE_MODEL_EVENTS_H
#define RTBRIDGE_MODEL_EVENTS_H

#include <string>

namespace rtbridge {

// Inbound OpenAI realtime server events the bridge understands.
// Everything else decodes to Unhandled and keeps its type name.
enum class ModelEventType
{
    SessionCreated,
    SessionUpdated,
    SpeechStarted,
    SpeechStopped,
    AudioCommitted,
    ResponseCreated,
    OutputItemAdded,
    AudioDelta,
    AudioDone,
    ResponseDone,
    Error,
    Closed,    // synthesized by RealtimeClient when the socket goes away
    Unhandled
};

const char* modelEventName(ModelEventType type);

struct ModelEvent
{
    ModelEventType type = ModelEventType::Unhandled;
    std::string name;    // wire "type" value
    std::string audio;   // AudioDelta: decoded PCM16 bytes
    std::string message; // Error: description; Closed: reason
    int closeCode = 0;   // Closed only
    std::string raw;     // original text, for diagnostics
};

// A text frame from the model socket. Throws ProtocolError if the text is
// not a JSON object, or if an audio delta carries invalid base64.
ModelEvent decodeModelEvent(const std::string& text);

// A binary frame is taken as raw PCM16 at the model rate.
ModelEvent decodeModelBinary(const std::string& bytes);

struct SessionSettings
{
    std::string voice;
    std::string instructions;
    std::string turnDetection; // "semantic_vad" or "server_vad"
    unsigned inputRate = 24000;
};

// Outbound client events.
std::string makeSessionUpdate(const SessionSettings& settings);
std::string makeSystemInstructions(const std::string& instructions);
std::string makeAudioAppend(const std::string& pcm16);
std::string makeResponseCancel();

// Synthetic inbound frames for transport failures.
std::string makeTransportError(const std::string& message);
std::string makeTransportClosed(int code, const std::string& reason);

} // namespace rtbridge

#endif // RTBRIDGE_MODEL_EVENTS_H
