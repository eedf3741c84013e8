#include "telephony_server.h"
#include "bridge_errors.h"
#include "log.h"
#include "media_endpoint.h"
#include "session_registry.h"
#include "telephony_protocol.h"

#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <algorithm>

namespace rtbridge {

namespace beast = boost::beast;         // from <boost/beast.hpp>
namespace http = beast::http;           // from <boost/beast/http.hpp>
namespace websocket = beast::websocket; // from <boost/beast/websocket.hpp>
namespace net = boost::asio;            // from <boost/asio.hpp>
using tcp = net::ip::tcp;               // from <boost/asio/ip/tcp.hpp>

// --- TelephonyConnection ---

TelephonyConnection::TelephonyConnection(tcp::socket&& socket, TelephonyServer& server_)
    : server(server_),
      ws(std::move(socket)),
      writing(false),
      closing(false),
      accepted(false),
      gone(false)
{
    beast::error_code ec;
    auto ep = beast::get_lowest_layer(ws).socket().remote_endpoint(ec);
    peer = ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

TelephonyConnection::~TelephonyConnection()
{
    logging::debug("Twilio", "connection " + peer + " released");
}

void TelephonyConnection::run()
{
    net::dispatch(ws.get_executor(), [self = shared_from_this()]() {
        beast::get_lowest_layer(self->ws).expires_after(std::chrono::seconds(30));
        http::async_read(self->ws.next_layer(), self->buffer, self->req,
                         beast::bind_front_handler(&TelephonyConnection::onRequest, self));
    });
}

void TelephonyConnection::onRequest(beast::error_code ec, std::size_t)
{
    if (ec) {
        logging::debug("Twilio", "upgrade request from " + peer + ": " + ec.message());
        gone = true;
        return;
    }

    std::string target(req.target().data(), req.target().size());
    target = target.substr(0, target.find('?'));
    if (!websocket::is_upgrade(req) || target != server.config().listenPath) {
        logging::warn("Twilio", "rejecting " + peer + " request for " + target);
        res = http::response<http::string_body>(http::status::not_found, req.version());
        res.set(http::field::content_type, "text/plain");
        res.body() = "not found\n";
        res.keep_alive(false);
        res.prepare_payload();
        gone = true;
        http::async_write(ws.next_layer(), res,
            [self = shared_from_this()](beast::error_code, std::size_t) {
                beast::error_code ignored;
                beast::get_lowest_layer(self->ws).socket().shutdown(tcp::socket::shutdown_send, ignored);
            });
        return;
    }

    beast::get_lowest_layer(ws).expires_never();
    ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws.set_option(websocket::stream_base::decorator([](websocket::response_type& r) {
        r.set(http::field::server, "rtbridge/1.0");
    }));
    ws.async_accept(req, beast::bind_front_handler(&TelephonyConnection::onAccept, shared_from_this()));
}

void TelephonyConnection::onAccept(beast::error_code ec)
{
    if (ec) {
        logging::warn("Twilio", "websocket accept failed for " + peer + ": " + ec.message());
        gone = true;
        return;
    }
    accepted = true;
    logging::info("Twilio", "connected " + peer);
    doRead();
}

void TelephonyConnection::doRead()
{
    ws.async_read(buffer, beast::bind_front_handler(&TelephonyConnection::onRead, shared_from_this()));
}

void TelephonyConnection::onRead(beast::error_code ec, std::size_t)
{
    if (ec) {
        if (ec == websocket::error::closed)
            logging::info("Twilio", "WS disconnected " + peer);
        else if (ec != net::error::operation_aborted)
            logging::warn("Twilio", "read from " + peer + ": " + ec.message());
        gone = true;
        endSession("telephony disconnected");
        return;
    }

    std::string text = beast::buffers_to_string(buffer.data());
    buffer.consume(buffer.size());
    handleEvent(text);

    if (!gone)
        doRead();
}

void TelephonyConnection::handleEvent(const std::string& text)
{
    TelephonyEvent ev;
    try {
        ev = parseTelephonyEvent(text);
    } catch (ProtocolError const& e) {
        logging::debug("Twilio", std::string("ignoring frame: ") + e.what());
        return;
    }

    switch (ev.type) {
    case TelephonyEventType::Connected:
        logging::debug("Twilio", "media stream connected");
        break;
    case TelephonyEventType::Start:
        startSession(ev.streamSid, ev.mediaFormat);
        break;
    case TelephonyEventType::Media:
        if (session)
            session->onMedia(ev.payload);
        break;
    case TelephonyEventType::Stop:
        if (session)
            session->stop();
        endSession("stream stopped");
        close();
        break;
    case TelephonyEventType::Mark:
    case TelephonyEventType::Other:
        logging::debug("Twilio", "event " + ev.name);
        break;
    }
}

void TelephonyConnection::startSession(const std::string& streamSid, const std::string& mediaFormat)
{
    if (session) {
        logging::warn("Twilio", "duplicate start on stream " + session->streamSid() + ", ignored");
        return;
    }
    logging::info("Twilio", "Stream started (sid=" + streamSid + ") format=" + mediaFormat);
    if (streamSid.empty()) {
        logging::error("Twilio", "start event without streamSid from " + peer);
        close();
        return;
    }

    std::shared_ptr<BridgeSession> s;
    try {
        s = std::make_shared<BridgeSession>(server.config(), *this, streamSid,
                                            server.transportFactory(), server.monitor());
    } catch (std::exception const& e) {
        logging::error("Bridge", std::string("cannot create session: ") + e.what());
        close();
        return;
    } catch (pj::Error& err) {
        logging::error("Bridge", "cannot create session: " + err.info());
        close();
        return;
    }

    if (!server.registry().insert(streamSid, s)) {
        logging::error("Bridge", "stream " + streamSid + " is already active");
        s->teardown("duplicate stream id");
        server.reap(s, shared_from_this());
        close();
        return;
    }
    session = s;
    if (!session->start()) {
        endSession("session start failed");
        close();
    }
}

void TelephonyConnection::endSession(const std::string& reason)
{
    if (!session)
        return;
    std::shared_ptr<BridgeSession> s = std::move(session);
    session.reset();
    s->teardown(reason);
    server.registry().remove(s->streamSid(), s);
    server.reap(s, shared_from_this());
}

bool TelephonyConnection::sendText(const std::string& message)
{
    if (gone)
        return false;
    std::shared_ptr<TelephonyConnection> self = weak_from_this().lock();
    if (!self)
        return false;
    net::post(ws.get_executor(), [self, message]() {
        if (self->closing || self->gone || !self->accepted)
            return;
        self->outbox.push_back(message);
        if (!self->writing)
            self->doWrite();
    });
    return true;
}

void TelephonyConnection::close()
{
    std::shared_ptr<TelephonyConnection> self = weak_from_this().lock();
    if (!self)
        return;
    net::post(ws.get_executor(), [self]() {
        if (self->closing)
            return;
        self->closing = true;
        if (!self->writing)
            self->doClose();
    });
}

void TelephonyConnection::doWrite()
{
    writing = true;
    ws.text(true);
    ws.async_write(net::buffer(outbox.front()),
                   beast::bind_front_handler(&TelephonyConnection::onWrite, shared_from_this()));
}

void TelephonyConnection::onWrite(beast::error_code ec, std::size_t)
{
    writing = false;
    if (ec) {
        logging::warn("Twilio", "write to " + peer + ": " + ec.message());
        gone = true;
        outbox.clear();
        return;
    }
    outbox.pop_front();
    if (!outbox.empty())
        doWrite();
    else if (closing)
        doClose();
}

void TelephonyConnection::doClose()
{
    if (!accepted || gone) {
        beast::error_code ignored;
        beast::get_lowest_layer(ws).socket().close(ignored);
        return;
    }
    ws.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (ec)
            logging::debug("Twilio", "close " + self->peer + ": " + ec.message());
    });
}

// --- TelephonyServer ---

TelephonyServer::TelephonyServer(const BridgeConfig& config, SessionRegistry& registry,
                                 TransportFactory factory_, AudioMonitor* monitor)
    : cfg(config),
      sessions(registry),
      factory(std::move(factory_)),
      audioMonitor(monitor),
      acceptor(ioc),
      stopped(false),
      reaping(0)
{
}

TelephonyServer::~TelephonyServer()
{
    stop();
}

void TelephonyServer::start()
{
    auto const address = net::ip::make_address(cfg.listenHost);
    tcp::endpoint endpoint{address, cfg.listenPort};

    acceptor.open(endpoint.protocol());
    acceptor.set_option(net::socket_base::reuse_address(true));
    acceptor.bind(endpoint);
    acceptor.listen(net::socket_base::max_listen_connections);

    doAccept();

    for (unsigned i = 0; i < cfg.ioThreads; i++) {
        threads.emplace_back([this, i]() {
            MediaEndpoint::registerThread(("twilio-io-" + std::to_string(i)).c_str());
            try {
                ioc.run();
            } catch (std::exception const& e) {
                logging::error("Twilio", std::string("io thread exception: ") + e.what());
            } catch (pj::Error& err) {
                logging::error("Twilio", "io thread exception: " + err.info());
            }
        });
    }
    logging::info("Twilio", "listening on ws://" + cfg.listenHost + ":" + std::to_string(port()) + cfg.listenPath);
}

unsigned short TelephonyServer::port() const
{
    beast::error_code ec;
    auto ep = acceptor.local_endpoint(ec);
    return ec ? 0 : ep.port();
}

void TelephonyServer::doAccept()
{
    acceptor.async_accept(net::make_strand(ioc),
                          beast::bind_front_handler(&TelephonyServer::onAccept, this));
}

void TelephonyServer::onAccept(beast::error_code ec, tcp::socket socket)
{
    if (ec) {
        if (ec != net::error::operation_aborted)
            logging::warn("Twilio", "accept: " + ec.message());
        if (stopped || !acceptor.is_open())
            return;
    } else {
        auto conn = std::make_shared<TelephonyConnection>(std::move(socket), *this);
        {
            std::lock_guard<std::mutex> lock(connMtx);
            connections.erase(std::remove_if(connections.begin(), connections.end(),
                                             [](const std::weak_ptr<TelephonyConnection>& w) { return w.expired(); }),
                              connections.end());
            connections.push_back(conn);
        }
        conn->run();
    }
    if (!stopped)
        doAccept();
}

void TelephonyServer::reap(std::shared_ptr<BridgeSession> session, std::shared_ptr<TelephonyConnection> conn)
{
    {
        std::lock_guard<std::mutex> lock(reapMtx);
        reaping++;
    }
    std::thread([this, session, conn]() mutable {
        MediaEndpoint::registerThread("reaper");
        session->join();
        session.reset();
        conn.reset();
        {
            std::lock_guard<std::mutex> lock(reapMtx);
            reaping--;
        }
        reapCv.notify_all();
    }).detach();
}

void TelephonyServer::stop()
{
    if (stopped.exchange(true))
        return;

    logging::info("Twilio", "shutting down, " + std::to_string(sessions.size()) + " active call(s)");

    net::post(ioc, [this]() {
        beast::error_code ignored;
        acceptor.close(ignored);
    });

    for (auto& s : sessions.snapshot())
        s->teardown("bridge shutting down");

    std::vector<std::shared_ptr<TelephonyConnection>> live;
    {
        std::lock_guard<std::mutex> lock(connMtx);
        for (auto& w : connections)
            if (auto c = w.lock())
                live.push_back(c);
        connections.clear();
    }
    for (auto& c : live)
        c->close();
    live.clear();

    // Calls hang up on their own; stragglers are cut after a grace period.
    {
        std::unique_lock<std::mutex> lock(reapMtx);
        reapCv.wait_for(lock, std::chrono::seconds(5), [this] { return reaping == 0; });
    }
    ioc.stop();
    for (auto& t : threads)
        if (t.joinable())
            t.join();
    threads.clear();

    std::unique_lock<std::mutex> lock(reapMtx);
    reapCv.wait(lock, [this] { return reaping == 0; });
}

} // namespace rtbridge
