#ifndef RTBRIDGE_REALTIME_TRANSPORT_H
#define RTBRIDGE_REALTIME_TRANSPORT_H

#include <chrono>
#include <string>

namespace rtbridge {

enum class ConnectionState
{
    Idle,
    Connecting,
    Open,
    Closed,
    Failed
};

const char* connectionStateName(ConnectionState state);

struct InboundMessage
{
    bool binary = false;
    std::string data;
};

// One socket session to the speech model.
//
// Transport failures never throw out of receive(): they arrive as
// synthetic "error" and "closed" text messages in the inbound stream.
class RealtimeTransport
{
public:
    virtual ~RealtimeTransport() = default;

    // Starts connecting in the background and returns at once.
    virtual void start() = 0;

    // Blocks until the socket is open (true), or it failed, was closed
    // or the timeout elapsed (false).
    virtual bool waitOpen(std::chrono::milliseconds timeout) = 0;

    // Thread safe. Messages from one caller go out in call order.
    // False when the message was not queued.
    virtual bool send(const std::string& message) = 0;

    // Blocks for the next inbound message. False once closed and drained.
    virtual bool receive(InboundMessage& out) = 0;

    // Idempotent; safe before start() and from any thread.
    virtual void close() = 0;

    virtual ConnectionState state() const = 0;
};

} // namespace rtbridge

#endif // RTBRIDGE_REALTIME_TRANSPORT_H
