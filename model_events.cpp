#include "model_events.h"
#include "base64.h"
#include "bridge_errors.h"

#include <nlohmann/json.hpp>
#include <unordered_map>

namespace rtbridge {

using json = nlohmann::json;

namespace {

const std::unordered_map<std::string, ModelEventType>& eventTable()
{
    // Both the beta and the GA names of the audio events are in use.
    static const std::unordered_map<std::string, ModelEventType> table = {
        {"session.created", ModelEventType::SessionCreated},
        {"session.updated", ModelEventType::SessionUpdated},
        {"input_audio_buffer.speech_started", ModelEventType::SpeechStarted},
        {"input_audio_buffer.speech_stopped", ModelEventType::SpeechStopped},
        {"input_audio_buffer.committed", ModelEventType::AudioCommitted},
        {"response.created", ModelEventType::ResponseCreated},
        {"response.output_item.added", ModelEventType::OutputItemAdded},
        {"response.audio.delta", ModelEventType::AudioDelta},
        {"response.output_audio.delta", ModelEventType::AudioDelta},
        {"response.audio.done", ModelEventType::AudioDone},
        {"response.output_audio.done", ModelEventType::AudioDone},
        {"response.done", ModelEventType::ResponseDone},
        {"error", ModelEventType::Error},
        {"closed", ModelEventType::Closed},
    };
    return table;
}

std::string stringField(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return "";
    return it->get<std::string>();
}

std::string errorText(const json& j)
{
    auto it = j.find("error");
    if (it == j.end())
        return "unknown error";
    if (it->is_string())
        return it->get<std::string>();
    if (it->is_object()) {
        auto msg = it->find("message");
        if (msg != it->end() && msg->is_string())
            return msg->get<std::string>();
    }
    return it->dump();
}

} // namespace

const char* modelEventName(ModelEventType type)
{
    switch (type) {
    case ModelEventType::SessionCreated: return "session.created";
    case ModelEventType::SessionUpdated: return "session.updated";
    case ModelEventType::SpeechStarted: return "input_audio_buffer.speech_started";
    case ModelEventType::SpeechStopped: return "input_audio_buffer.speech_stopped";
    case ModelEventType::AudioCommitted: return "input_audio_buffer.committed";
    case ModelEventType::ResponseCreated: return "response.created";
    case ModelEventType::OutputItemAdded: return "response.output_item.added";
    case ModelEventType::AudioDelta: return "response.audio.delta";
    case ModelEventType::AudioDone: return "response.audio.done";
    case ModelEventType::ResponseDone: return "response.done";
    case ModelEventType::Error: return "error";
    case ModelEventType::Closed: return "closed";
    case ModelEventType::Unhandled: break;
    }
    return "unhandled";
}

ModelEvent decodeModelEvent(const std::string& text)
{
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw ProtocolError("model: not a JSON object");

    ModelEvent ev;
    ev.raw = text;
    ev.name = stringField(j, "type");
    if (ev.name.empty())
        ev.name = stringField(j, "event");

    auto it = eventTable().find(ev.name);
    ev.type = it == eventTable().end() ? ModelEventType::Unhandled : it->second;

    switch (ev.type) {
    case ModelEventType::AudioDelta: {
        auto delta = j.find("delta");
        if (delta != j.end() && delta->is_string())
            ev.audio = base64Decode(delta->get<std::string>());
        break;
    }
    case ModelEventType::Error:
        ev.message = errorText(j);
        break;
    case ModelEventType::Closed: {
        auto code = j.find("code");
        if (code != j.end() && code->is_number_integer())
            ev.closeCode = code->get<int>();
        ev.message = stringField(j, "reason");
        break;
    }
    default:
        break;
    }
    return ev;
}

ModelEvent decodeModelBinary(const std::string& bytes)
{
    ModelEvent ev;
    ev.type = ModelEventType::AudioDelta;
    ev.name = "binary";
    ev.audio = bytes;
    return ev;
}

std::string makeSessionUpdate(const SessionSettings& settings)
{
    json event_msg = {
        {"type", "session.update"},
        {"session", {
            {"type", "realtime"},
            {"output_modalities", json::array({"audio"})},
            {"audio", {
                {"input", {
                    {"format", {
                        {"type", "audio/pcm"},
                        {"rate", settings.inputRate}
                    }},
                    {"turn_detection", {
                        {"type", settings.turnDetection}
                    }}
                }},
                {"output", {
                    {"format", {
                        {"type", "audio/pcm"}
                    }},
                    {"voice", settings.voice}
                }}
            }},
            {"instructions", settings.instructions}
        }}
    };
    return event_msg.dump();
}

std::string makeSystemInstructions(const std::string& instructions)
{
    json event_msg = {
        {"type", "conversation.item.create"},
        {"item", {
            {"type", "message"},
            {"role", "system"},
            {"content", json::array({
                {{"type", "input_text"}, {"text", instructions}}
            })}
        }}
    };
    return event_msg.dump();
}

std::string makeAudioAppend(const std::string& pcm16)
{
    json j = {
        {"type", "input_audio_buffer.append"},
        {"audio", base64Encode(pcm16)}
    };
    return j.dump();
}

std::string makeResponseCancel()
{
    return json{{"type", "response.cancel"}}.dump();
}

std::string makeTransportError(const std::string& message)
{
    json j = {
        {"type", "error"},
        {"error", {{"type", "transport"}, {"message", message}}}
    };
    return j.dump();
}

std::string makeTransportClosed(int code, const std::string& reason)
{
    json j = {
        {"type", "closed"},
        {"code", code},
        {"reason", reason}
    };
    return j.dump();
}

} // namespace rtbridge
