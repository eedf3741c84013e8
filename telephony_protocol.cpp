#include "telephony_protocol.h"
#include "base64.h"
#include "bridge_errors.h"

#include <nlohmann/json.hpp>

namespace rtbridge {

using json = nlohmann::json;

namespace {

std::string stringField(const json& obj, const char* key)
{
    auto it = obj.find(key);
    if (it == obj.end() || !it->is_string())
        return "";
    return it->get<std::string>();
}

} // namespace

TelephonyEvent parseTelephonyEvent(const std::string& text)
{
    json j = json::parse(text, nullptr, false);
    if (j.is_discarded() || !j.is_object())
        throw ProtocolError("telephony: not a JSON object");

    TelephonyEvent ev;
    ev.name = stringField(j, "event");
    if (ev.name == "connected") {
        ev.type = TelephonyEventType::Connected;
    } else if (ev.name == "start") {
        ev.type = TelephonyEventType::Start;
        auto start = j.find("start");
        if (start != j.end() && start->is_object()) {
            ev.streamSid = stringField(*start, "streamSid");
            auto fmt = start->find("mediaFormat");
            if (fmt != start->end())
                ev.mediaFormat = fmt->dump();
        }
        // Some carriers only put it at the top level.
        if (ev.streamSid.empty())
            ev.streamSid = stringField(j, "streamSid");
    } else if (ev.name == "media") {
        ev.type = TelephonyEventType::Media;
        auto media = j.find("media");
        if (media != j.end() && media->is_object())
            ev.payload = stringField(*media, "payload");
    } else if (ev.name == "mark") {
        ev.type = TelephonyEventType::Mark;
    } else if (ev.name == "stop") {
        ev.type = TelephonyEventType::Stop;
    }
    return ev;
}

std::string makeMediaMessage(const std::string& streamSid, const std::string& mulaw)
{
    json message = {
        {"event", "media"},
        {"streamSid", streamSid},
        {"media", {{"payload", base64Encode(mulaw)}}}
    };
    return message.dump();
}

std::string makeClearMessage(const std::string& streamSid)
{
    json message = {
        {"event", "clear"},
        {"streamSid", streamSid}
    };
    return message.dump();
}

} // namespace rtbridge
