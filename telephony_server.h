#ifndef RTBRIDGE_TELEPHONY_SERVER_H
#define RTBRIDGE_TELEPHONY_SERVER_H

#include "bridge_config.h"
#include "bridge_session.h"
#include "telephony_channel.h"

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace rtbridge {

class AudioMonitor;
class SessionRegistry;
class TelephonyServer;

// One media-stream WebSocket from the carrier. Runs on its own strand.
class TelephonyConnection : public TelephonyChannel,
                            public std::enable_shared_from_this<TelephonyConnection>
{
public:
    TelephonyConnection(boost::asio::ip::tcp::socket&& socket, TelephonyServer& server);
    ~TelephonyConnection() override;

    void run();

    bool sendText(const std::string& message) override;
    void close() override;

private:
    void onRequest(boost::beast::error_code ec, std::size_t bytes);
    void onAccept(boost::beast::error_code ec);
    void doRead();
    void onRead(boost::beast::error_code ec, std::size_t bytes);
    void handleEvent(const std::string& text);
    void startSession(const std::string& streamSid, const std::string& mediaFormat);
    void endSession(const std::string& reason);
    void doWrite();
    void onWrite(boost::beast::error_code ec, std::size_t bytes);
    void doClose();

    TelephonyServer& server;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws;
    boost::beast::flat_buffer buffer;
    boost::beast::http::request<boost::beast::http::string_body> req;
    boost::beast::http::response<boost::beast::http::string_body> res;

    // strand only
    std::deque<std::string> outbox;
    bool writing;
    bool closing;
    bool accepted;
    std::shared_ptr<BridgeSession> session;
    std::string peer;

    std::atomic<bool> gone;
};

// Accepts carrier connections on BRIDGE_HOST:BRIDGE_PORT/BRIDGE_PATH.
class TelephonyServer
{
public:
    TelephonyServer(const BridgeConfig& config, SessionRegistry& registry,
                    TransportFactory factory, AudioMonitor* monitor = nullptr);
    ~TelephonyServer();

    TelephonyServer(const TelephonyServer&) = delete;
    TelephonyServer& operator=(const TelephonyServer&) = delete;

    // Binds and starts the I/O threads. Throws boost::system::system_error.
    void start();

    // Closes the listener and every call, then waits for them. Idempotent.
    void stop();

    unsigned short port() const;

    const BridgeConfig& config() const { return cfg; }
    SessionRegistry& registry() { return sessions; }
    const TransportFactory& transportFactory() const { return factory; }
    AudioMonitor* monitor() const { return audioMonitor; }

    // Joins a finished session off the I/O threads. The connection is kept
    // alive until the session's pumps are gone.
    void reap(std::shared_ptr<BridgeSession> session, std::shared_ptr<TelephonyConnection> conn);

private:
    void doAccept();
    void onAccept(boost::beast::error_code ec, boost::asio::ip::tcp::socket socket);

    const BridgeConfig& cfg;
    SessionRegistry& sessions;
    TransportFactory factory;
    AudioMonitor* audioMonitor;

    boost::asio::io_context ioc;
    boost::asio::ip::tcp::acceptor acceptor;
    std::vector<std::thread> threads;
    std::atomic<bool> stopped;

    std::mutex connMtx;
    std::vector<std::weak_ptr<TelephonyConnection>> connections;

    std::mutex reapMtx;
    std::condition_variable reapCv;
    size_t reaping;
};

} // namespace rtbridge

#endif // RTBRIDGE_TELEPHONY_SERVER_H
