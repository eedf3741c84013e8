#ifndef RTBRIDGE_REALTIME_CLIENT_H
#define RTBRIDGE_REALTIME_CLIENT_H

#include "bounded_queue.h"
#include "realtime_transport.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <thread>

namespace rtbridge {

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace http = beast::http;           // from <boost/beast/http.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace net = boost::asio;            // from <boost/asio.hpp>
namespace ssl = boost::asio::ssl;       // from <boost/asio/ssl.hpp>
using tcp = net::ip::tcp;               // from <boost/asio/ip/tcp.hpp>

struct RealtimeEndpoint
{
    std::string host;
    std::string port;
    std::string path;   // "/v1/realtime?model=..."
    std::string apiKey;
    std::string caFile; // extra trust anchors (PEM), on top of the system store
    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::seconds pingInterval{30};
    std::chrono::seconds pingTimeout{10};
    size_t sendQueueLimit = 256;
    size_t inboundQueueLimit = 1024;
};

// OpenAI realtime WebSocket over TLS, driven by its own io_context thread.
//
// All socket work happens on that thread; send() and close() post to it.
class RealtimeClient : public RealtimeTransport
{
public:
    explicit RealtimeClient(RealtimeEndpoint endpoint);
    ~RealtimeClient() override;

    RealtimeClient(const RealtimeClient&) = delete;
    RealtimeClient& operator=(const RealtimeClient&) = delete;

    void start() override;
    bool waitOpen(std::chrono::milliseconds timeout) override;
    bool send(const std::string& message) override;
    bool receive(InboundMessage& out) override;
    void close() override;
    ConnectionState state() const override;

private:
    void onResolve(beast::error_code ec, tcp::resolver::results_type results);
    void onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep);
    void onSslHandshake(beast::error_code ec);
    void onHandshake(beast::error_code ec);

    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes);
    void resumeRead();
    void releaseParked();
    void doWrite();
    void onWrite(beast::error_code ec, std::size_t bytes);

    void schedulePing();
    void onPingTimer(beast::error_code ec);
    void onPongDeadline(beast::error_code ec);
    void onControl(websocket::frame_type kind, beast::string_view payload);

    void doClose();
    void fail(const std::string& what, beast::error_code ec);
    void finish(int code, const std::string& reason);
    void setState(ConnectionState s);
    bool terminal() const;

    RealtimeEndpoint endpoint;

    net::io_context ioc;
    ssl::context ctx;
    tcp::resolver resolver;
    websocket::stream<beast::ssl_stream<beast::tcp_stream>> ws;
    net::steady_timer pingTimer;
    net::steady_timer pongTimer;
    beast::flat_buffer readBuffer;

    // io thread only
    std::deque<std::string> writeQueue;
    bool isOpen;
    bool writing;
    bool closing;
    bool awaitingPong;
    bool finished;
    // A message that did not fit in `inbound`. While one is parked no read
    // is outstanding, so the server is held back by TCP flow control.
    InboundMessage parked;
    bool hasParked;

    std::atomic<size_t> pendingSends;
    std::atomic<bool> started;
    std::atomic<bool> closeRequested;
    std::atomic<bool> readPaused;
    BoundedQueue<InboundMessage> inbound;

    mutable std::mutex stateMtx;
    std::condition_variable stateCv;
    ConnectionState connState;

    std::thread ioThread;
};

} // namespace rtbridge

#endif // RTBRIDGE_REALTIME_CLIENT_H
