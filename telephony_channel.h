#ifndef RTBRIDGE_TELEPHONY_CHANNEL_H
#define RTBRIDGE_TELEPHONY_CHANNEL_H

#include <string>

namespace rtbridge {

// Outbound side of one telephony media-stream connection.
class TelephonyChannel
{
public:
    virtual ~TelephonyChannel() = default;

    // Queues one text message. Returns false once the connection is gone.
    virtual bool sendText(const std::string& message) = 0;

    // Ends the connection from our side. Idempotent.
    virtual void close() = 0;
};

} // namespace rtbridge

#endif // RTBRIDGE_TELEPHONY_CHANNEL_H
