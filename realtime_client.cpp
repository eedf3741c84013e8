#include "realtime_client.h"
#include "log.h"
#include "model_events.h"

#include <boost/asio/connect.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/ssl.hpp>

namespace rtbridge {

const char* connectionStateName(ConnectionState state)
{
    switch (state) {
    case ConnectionState::Idle: return "idle";
    case ConnectionState::Connecting: return "connecting";
    case ConnectionState::Open: return "open";
    case ConnectionState::Closed: return "closed";
    case ConnectionState::Failed: return "failed";
    }
    return "unknown";
}

namespace {

ssl::context makeTlsContext(const std::string& caFile)
{
    ssl::context ctx{ssl::context::tlsv12_client};
    // Load default trust certificates (CA)
    ctx.set_default_verify_paths();
    if (!caFile.empty())
        ctx.load_verify_file(caFile);
    ctx.set_verify_mode(ssl::verify_peer);
    return ctx;
}

const int CLOSE_ABNORMAL = 1006;

} // namespace

RealtimeClient::RealtimeClient(RealtimeEndpoint endpoint_)
    : endpoint(std::move(endpoint_)),
      ctx(makeTlsContext(endpoint.caFile)),
      resolver(ioc),
      ws(ioc, ctx),
      pingTimer(ioc),
      pongTimer(ioc),
      isOpen(false),
      writing(false),
      closing(false),
      awaitingPong(false),
      finished(false),
      hasParked(false),
      pendingSends(0),
      started(false),
      closeRequested(false),
      readPaused(false),
      inbound(endpoint.inboundQueueLimit),
      connState(ConnectionState::Idle)
{
    ws.next_layer().set_verify_callback(ssl::host_name_verification(endpoint.host));
}

RealtimeClient::~RealtimeClient()
{
    close();
    if (ioThread.joinable()) {
        // Give the close handshake a moment, then abandon whatever is left.
        {
            std::unique_lock<std::mutex> lock(stateMtx);
            stateCv.wait_for(lock, std::chrono::seconds(2), [this] { return terminal(); });
        }
        ioc.stop();
        ioThread.join();
    }
}

void RealtimeClient::start()
{
    if (started.exchange(true))
        return;
    if (closeRequested) {
        setState(ConnectionState::Closed);
        return;
    }

    setState(ConnectionState::Connecting);
    logging::info("OAI", "Connecting to wss://" + endpoint.host + endpoint.path);

    resolver.async_resolve(endpoint.host, endpoint.port,
                           beast::bind_front_handler(&RealtimeClient::onResolve, this));

    ioThread = std::thread([this]() {
        try {
            ioc.run();
        } catch (std::exception const& e) {
            logging::error("OAI", std::string("io thread exception: ") + e.what());
            setState(ConnectionState::Failed);
            inbound.close();
        }
    });
}

bool RealtimeClient::waitOpen(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(stateMtx);
    stateCv.wait_for(lock, timeout, [this] {
        return connState != ConnectionState::Idle && connState != ConnectionState::Connecting;
    });
    return connState == ConnectionState::Open;
}

bool RealtimeClient::send(const std::string& message)
{
    ConnectionState s = state();
    if (closeRequested || s == ConnectionState::Closed || s == ConnectionState::Failed)
        return false;

    if (pendingSends.fetch_add(1) >= endpoint.sendQueueLimit) {
        pendingSends--;
        logging::warn("OAI", "outbound queue full, message dropped");
        return false;
    }

    net::post(ioc, [this, message]() {
        if (finished || closing) {
            pendingSends--;
            return;
        }
        writeQueue.push_back(message);
        if (isOpen && !writing)
            doWrite();
    });
    return true;
}

bool RealtimeClient::receive(InboundMessage& out)
{
    if (!inbound.pop(out))
        return false;
    if (readPaused)
        net::post(ioc, [this]() { resumeRead(); });
    return true;
}

void RealtimeClient::close()
{
    if (closeRequested.exchange(true))
        return;

    if (!started) {
        setState(ConnectionState::Closed);
        inbound.close();
        return;
    }
    net::post(ioc, [this]() { doClose(); });
}

ConnectionState RealtimeClient::state() const
{
    std::lock_guard<std::mutex> lock(stateMtx);
    return connState;
}

void RealtimeClient::onResolve(beast::error_code ec, tcp::resolver::results_type results)
{
    if (ec)
        return closing ? finish(websocket::close_code::normal, "closed by client") : fail("resolve", ec);

    beast::get_lowest_layer(ws).expires_after(endpoint.connectTimeout);
    beast::get_lowest_layer(ws).async_connect(results,
        beast::bind_front_handler(&RealtimeClient::onConnect, this));
}

void RealtimeClient::onConnect(beast::error_code ec, tcp::resolver::results_type::endpoint_type)
{
    if (ec)
        return closing ? finish(websocket::close_code::normal, "closed by client") : fail("connect", ec);

    // SNI, many hosts need it to pick the right certificate
    if (!SSL_set_tlsext_host_name(ws.next_layer().native_handle(), endpoint.host.c_str())) {
        ec = beast::error_code(static_cast<int>(::ERR_get_error()), net::error::get_ssl_category());
        return fail("SSL_set_tlsext_host_name", ec);
    }

    beast::get_lowest_layer(ws).expires_after(endpoint.connectTimeout);
    ws.next_layer().async_handshake(ssl::stream_base::client,
        beast::bind_front_handler(&RealtimeClient::onSslHandshake, this));
}

void RealtimeClient::onSslHandshake(beast::error_code ec)
{
    if (ec)
        return closing ? finish(websocket::close_code::normal, "closed by client") : fail("ssl handshake", ec);

    // The websocket stream has its own timeout system
    beast::get_lowest_layer(ws).expires_never();
    websocket::stream_base::timeout opt{
        endpoint.connectTimeout,      // handshake and close
        websocket::stream_base::none(),
        false                          // pings are ours, see schedulePing()
    };
    ws.set_option(opt);

    // The Realtime API requires the Authorization header and the
    // "OpenAI-Beta" protocol marker.
    const std::string host = endpoint.host;
    const std::string key = endpoint.apiKey;
    ws.set_option(websocket::stream_base::decorator(
        [host, key](websocket::request_type& req) {
            req.set(http::field::host, host);
            req.set(http::field::user_agent, "rtbridge/1.0");
            req.set(http::field::authorization, "Bearer " + key);
            req.set("OpenAI-Beta", "realtime=v1");
        }));
    ws.control_callback(beast::bind_front_handler(&RealtimeClient::onControl, this));

    ws.async_handshake(endpoint.host, endpoint.path,
        beast::bind_front_handler(&RealtimeClient::onHandshake, this));
}

void RealtimeClient::onHandshake(beast::error_code ec)
{
    if (ec)
        return closing ? finish(websocket::close_code::normal, "closed by client") : fail("websocket handshake", ec);

    if (closing)
        return;

    logging::info("OAI", "WebSocket open");
    isOpen = true;
    setState(ConnectionState::Open);

    doRead();
    schedulePing();
    if (!writeQueue.empty() && !writing)
        doWrite();
}

void RealtimeClient::doRead()
{
    ws.async_read(readBuffer, beast::bind_front_handler(&RealtimeClient::onRead, this));
}

void RealtimeClient::onRead(beast::error_code ec, std::size_t)
{
    if (ec == websocket::error::closed) {
        const websocket::close_reason& cr = ws.reason();
        std::string reason(cr.reason.data(), cr.reason.size());
        logging::info("OAI", "closed: code=" + std::to_string(cr.code) + " reason=" + reason);
        return finish(cr.code, reason);
    }
    if (ec)
        return closing ? finish(websocket::close_code::normal, "closed by client") : fail("read", ec);

    InboundMessage msg;
    msg.binary = !ws.got_text();
    msg.data = beast::buffers_to_string(readBuffer.data());
    readBuffer.consume(readBuffer.size());

    if (msg.binary)
        logging::trace("OAI", "<< <" + std::to_string(msg.data.size()) + " bytes>");
    else
        logging::trace("OAI", "<< " + logging::preview(msg.data, 300));

    // Set before the push so a receive() racing with a full queue always
    // sees it and schedules resumeRead().
    readPaused = true;
    if (!inbound.tryPush(msg)) {
        logging::debug("OAI", "inbound queue full, reading paused");
        parked = std::move(msg);
        hasParked = true;
        return;
    }
    readPaused = false;
    doRead();
}

void RealtimeClient::resumeRead()
{
    if (!hasParked || finished)
        return;
    if (!inbound.tryPush(parked))
        return;
    hasParked = false;
    readPaused = false;
    logging::debug("OAI", "reading resumed");
    doRead();
}

// Terminal path only: the consumer must still see what was read.
void RealtimeClient::releaseParked()
{
    if (!hasParked)
        return;
    inbound.append(std::move(parked));
    hasParked = false;
    readPaused = false;
}

void RealtimeClient::doWrite()
{
    writing = true;
    ws.text(true);
    ws.async_write(net::buffer(writeQueue.front()),
        beast::bind_front_handler(&RealtimeClient::onWrite, this));
}

void RealtimeClient::onWrite(beast::error_code ec, std::size_t)
{
    writing = false;
    // finish() may have emptied the queue while this write was in flight.
    if (finished || writeQueue.empty())
        return;
    if (ec)
        return closing ? finish(websocket::close_code::normal, "closed by client") : fail("write", ec);

    logging::trace("OAI", ">> " + logging::preview(writeQueue.front(), 200));
    writeQueue.pop_front();
    pendingSends--;

    if (!writeQueue.empty() && !closing)
        doWrite();
}

void RealtimeClient::schedulePing()
{
    pingTimer.expires_after(endpoint.pingInterval);
    pingTimer.async_wait(beast::bind_front_handler(&RealtimeClient::onPingTimer, this));
}

void RealtimeClient::onPingTimer(beast::error_code ec)
{
    if (ec || closing || finished)
        return;
    // Pongs are only seen by an outstanding read.
    if (hasParked)
        return schedulePing();

    awaitingPong = true;
    ws.async_ping({}, [this](beast::error_code pingEc) {
        // A broken socket shows up on the read side as well.
        if (pingEc && !closing)
            logging::debug("OAI", "ping failed: " + pingEc.message());
    });
    logging::trace("OAI", "<ping>");

    pongTimer.expires_after(endpoint.pingTimeout);
    pongTimer.async_wait(beast::bind_front_handler(&RealtimeClient::onPongDeadline, this));
}

void RealtimeClient::onPongDeadline(beast::error_code ec)
{
    if (ec || closing || finished || !awaitingPong)
        return;
    if (hasParked) {
        // The consumer is slow, not the server.
        awaitingPong = false;
        return schedulePing();
    }
    fail("keep-alive", net::error::timed_out);
}

void RealtimeClient::onControl(websocket::frame_type kind, beast::string_view)
{
    if (kind == websocket::frame_type::pong) {
        logging::trace("OAI", "<pong>");
        if (awaitingPong) {
            awaitingPong = false;
            pongTimer.cancel();
            schedulePing();
        }
    } else if (kind == websocket::frame_type::ping) {
        logging::trace("OAI", "<ping from server>");
    }
}

void RealtimeClient::doClose()
{
    if (closing || finished)
        return;
    closing = true;
    pingTimer.cancel();
    pongTimer.cancel();

    if (!isOpen) {
        // Still connecting: abort whatever step is in flight.
        resolver.cancel();
        beast::error_code ignored;
        beast::get_lowest_layer(ws).socket().close(ignored);
        finish(websocket::close_code::normal, "closed by client");
        return;
    }

    ws.async_close(websocket::close_code::normal, [this](beast::error_code ec) {
        if (ec)
            logging::debug("OAI", "close handshake: " + ec.message());
        finish(websocket::close_code::normal, "closed by client");
    });
}

void RealtimeClient::fail(const std::string& what, beast::error_code ec)
{
    if (finished)
        return;
    std::string text = what + ": " + ec.message();
    logging::error("OAI", "error: " + text);
    releaseParked();
    inbound.append(InboundMessage{false, makeTransportError(text)});
    setState(ConnectionState::Failed);
    finish(CLOSE_ABNORMAL, text);
}

void RealtimeClient::finish(int code, const std::string& reason)
{
    if (finished)
        return;
    finished = true;
    isOpen = false;

    pingTimer.cancel();
    pongTimer.cancel();
    resolver.cancel();
    beast::error_code ignored;
    beast::get_lowest_layer(ws).socket().close(ignored);

    pendingSends -= writeQueue.size();
    writeQueue.clear();

    releaseParked();
    inbound.append(InboundMessage{false, makeTransportClosed(code, reason)});
    inbound.close();

    {
        std::lock_guard<std::mutex> lock(stateMtx);
        if (connState != ConnectionState::Failed)
            connState = ConnectionState::Closed;
    }
    stateCv.notify_all();
}

void RealtimeClient::setState(ConnectionState s)
{
    {
        std::lock_guard<std::mutex> lock(stateMtx);
        connState = s;
    }
    stateCv.notify_all();
}

// Caller holds stateMtx.
bool RealtimeClient::terminal() const
{
    return connState == ConnectionState::Closed || connState == ConnectionState::Failed;
}

} // namespace rtbridge
