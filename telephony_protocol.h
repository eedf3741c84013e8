#ifndef RTBRIDGE_TELEPHONY_PROTOCOL_H
#define RTBRIDGE_TELEPHONY_PROTOCOL_H

#include <string>

namespace rtbridge {

// Twilio media stream events, JSON text frames.
enum class TelephonyEventType
{
    Connected,
    Start,
    Media,
    Mark,
    Stop,
    Other
};

struct TelephonyEvent
{
    TelephonyEventType type = TelephonyEventType::Other;
    std::string name;        // raw "event" value
    std::string streamSid;   // start only
    std::string mediaFormat; // start only, compact JSON for logging
    std::string payload;     // media only, still base64
};

// Throws ProtocolError when the text is not a JSON object.
TelephonyEvent parseTelephonyEvent(const std::string& text);

std::string makeMediaMessage(const std::string& streamSid, const std::string& mulaw);
std::string makeClearMessage(const std::string& streamSid);

} // namespace rtbridge

#endif // RTBRIDGE_TELEPHONY_PROTOCOL_H
