#include "bridge_session.h"
#include "audio_monitor.h"
#include "base64.h"
#include "bridge_errors.h"
#include "log.h"
#include "model_events.h"
#include "realtime_client.h"

namespace rtbridge {

TransportFactory realtimeClientFactory()
{
    return [](const BridgeConfig& cfg) -> std::unique_ptr<RealtimeTransport> {
        RealtimeEndpoint ep;
        ep.host = cfg.host;
        ep.port = cfg.port;
        ep.path = cfg.path();
        ep.apiKey = cfg.apiKey;
        ep.caFile = cfg.caFile;
        ep.connectTimeout = cfg.connectTimeout;
        ep.pingInterval = cfg.pingInterval;
        ep.pingTimeout = cfg.pingTimeout;
        ep.sendQueueLimit = cfg.modelSendQueue;
        return std::unique_ptr<RealtimeTransport>(new RealtimeClient(ep));
    };
}

BridgeSession::BridgeSession(const BridgeConfig& config_, TelephonyChannel& channel_, std::string streamSid,
                             TransportFactory factory_, AudioMonitor* monitor_)
    : config(config_),
      channel(channel_),
      sid(std::move(streamSid)),
      factory(std::move(factory_)),
      monitor(monitor_),
      packer(channel_, sid, MODEL_RATE),
      upsampler(TELEPHONY_RATE, MODEL_RATE),
      uplink(config_.uplinkQueue),
      turns(*this),
      currentTurn(TurnState::Idle),
      isReady(false),
      isClosed(false),
      isStarted(false),
      mediaFrames(0),
      badMedia(0),
      chunksToModel(0),
      sendFailures(0),
      malformedEvents(0),
      modelErrors(0),
      audioDeltas(0),
      bargeIns(0)
{
}

BridgeSession::~BridgeSession()
{
    teardown("session released");
    join();
}

bool BridgeSession::start()
{
    // Held until the threads exist, so a concurrent teardown() either
    // prevents them or finds the transport to close.
    std::unique_lock<std::mutex> lock(lifecycleMtx);
    if (isStarted.exchange(true) || isClosed)
        return false;

    if (config.apiKey.empty()) {
        lock.unlock();
        logging::error("Bridge", "OPENAI_API_KEY not set, rejecting stream " + sid);
        teardown("missing credential");
        return false;
    }

    std::unique_ptr<RealtimeTransport> created;
    try {
        created = factory(config);
    } catch (std::exception const& e) {
        lock.unlock();
        logging::error("Bridge", std::string("cannot create model transport: ") + e.what());
        teardown("transport creation failed");
        return false;
    }

    if (isClosed) {
        created->close();
        return false;
    }
    transport = std::move(created);
    modelThread = std::thread(&BridgeSession::runModel, this);
    uplinkThread = std::thread(&BridgeSession::runUplink, this);
    return true;
}

void BridgeSession::onMedia(const std::string& payloadB64)
{
    if (isClosed || payloadB64.empty())
        return;

    std::string pcm8k;
    try {
        pcm8k = mulawExpand(base64Decode(payloadB64));
    } catch (ProtocolError const& e) {
        badMedia++;
        logging::debug("Twilio", std::string("dropping media frame: ") + e.what());
        return;
    }

    bool dropped = false;
    if (!uplink.push(std::move(pcm8k), &dropped))
        return;
    if (dropped)
        logging::debug("Bridge", "uplink queue full, oldest chunk dropped for " + sid);

    size_t n = ++mediaFrames;
    if (n % 50 == 0)
        logging::info("Twilio", "Received media frames: " + std::to_string(n));
}

void BridgeSession::stop()
{
    logging::info("Twilio", "Stream stopped (sid=" + sid + ")");
    teardown("stream stopped");
}

void BridgeSession::teardown(const std::string& reason)
{
    if (isClosed.exchange(true))
        return;

    logging::info("Bridge", "closing session " + sid + ": " + reason);

    // Whatever the model already said still reaches the caller.
    packer.flush(true);
    packer.markClosed();

    uplink.close();
    {
        std::lock_guard<std::mutex> lock(readyMtx);
        readyCv.notify_all();
    }
    RealtimeTransport* active = nullptr;
    {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        active = transport.get();
    }
    if (active)
        active->close();

    SessionStats s = stats();
    logging::info("Bridge", "session " + sid + " stats: media in " + std::to_string(s.mediaFrames) +
                  ", dropped " + std::to_string(s.uplinkDropped) +
                  ", chunks to model " + std::to_string(s.chunksToModel) +
                  ", audio deltas " + std::to_string(s.audioDeltas) +
                  ", frames out " + std::to_string(s.framesOut));
}

void BridgeSession::join()
{
    std::thread pumps[2];
    {
        std::lock_guard<std::mutex> lock(lifecycleMtx);
        pumps[0] = std::move(modelThread);
        pumps[1] = std::move(uplinkThread);
    }
    for (std::thread& t : pumps) {
        if (!t.joinable())
            continue;
        if (t.get_id() == std::this_thread::get_id())
            t.detach();
        else
            t.join();
    }
}

bool BridgeSession::ready() const
{
    std::lock_guard<std::mutex> lock(readyMtx);
    return isReady;
}

SessionStats BridgeSession::stats() const
{
    SessionStats s;
    s.mediaFrames = mediaFrames;
    s.badMedia = badMedia;
    s.uplinkDropped = uplink.dropped();
    s.chunksToModel = chunksToModel;
    s.sendFailures = sendFailures;
    s.audioDeltas = audioDeltas;
    s.framesOut = packer.framesSent();
    s.malformedEvents = malformedEvents;
    s.modelErrors = modelErrors;
    s.bargeIns = bargeIns;
    return s;
}

void BridgeSession::setReady()
{
    {
        std::lock_guard<std::mutex> lock(readyMtx);
        isReady = true;
    }
    readyCv.notify_all();
}

bool BridgeSession::waitReady()
{
    std::unique_lock<std::mutex> lock(readyMtx);
    readyCv.wait(lock, [this] { return isReady || isClosed; });
    return isReady && !isClosed;
}

void BridgeSession::runModel()
{
    try {
        transport->start();

        // Catch early failures instead of streaming audio into a dead socket.
        if (!transport->waitOpen(config.connectTimeout)) {
            logging::error("OAI", "Failed to open WebSocket within timeout (" +
                           std::string(connectionStateName(transport->state())) + ")");
            teardown("model connection failed");
            channel.close();
            return;
        }

        // Configure the session before any audio goes out.
        logging::info("OAI", "applying instructions: " + logging::preview(config.instructions));
        SessionSettings settings;
        settings.voice = config.voice;
        settings.instructions = config.instructions;
        settings.turnDetection = config.turnDetection;
        settings.inputRate = MODEL_RATE;
        if (!transport->send(makeSessionUpdate(settings)))
            logging::warn("OAI", "session.update could not be queued");
        else
            logging::debug("OAI", ">> session.update (" + config.turnDetection + ", voice " + config.voice + ")");
        if (!transport->send(makeSystemInstructions(config.instructions)))
            logging::warn("OAI", "conversation.item.create could not be queued");
        else
            logging::debug("OAI", ">> conversation.item.create (system instructions)");

        setReady();

        InboundMessage msg;
        while (transport->receive(msg)) {
            ModelEvent ev;
            try {
                ev = msg.binary ? decodeModelBinary(msg.data) : decodeModelEvent(msg.data);
            } catch (ProtocolError const& e) {
                malformedEvents++;
                logging::debug("OAI", std::string("dropping model event: ") + e.what());
                continue;
            }

            try {
                turns.handle(ev);
            } catch (AudioFormatError const& e) {
                logging::warn("OAI", std::string("dropping audio: ") + e.what());
            }
            currentTurn = turns.state();
        }
    } catch (std::exception const& e) {
        logging::error("Bridge", std::string("model pump: ") + e.what());
    }

    if (!isClosed) {
        teardown("model stream ended");
        channel.close();
    }
}

void BridgeSession::runUplink()
{
    if (!waitReady())
        return;

    std::string chunk;
    // Chunks queued before a teardown are still attempted; send() fails
    // fast once the transport is closed.
    while (uplink.pop(chunk)) {
        try {
            // Resample 8k -> 24k
            std::string pcm24 = upsampler.convert(chunk);
            if (pcm24.empty())
                continue;
            if (transport->send(makeAudioAppend(pcm24)))
                chunksToModel++;
            else
                sendFailures++;
        } catch (std::exception const& e) {
            logging::warn("Bridge", std::string("uplink chunk dropped: ") + e.what());
        }
    }
}

void BridgeSession::onAssistantAudio(const std::string& pcm16)
{
    packer.accept(pcm16);
    if (monitor)
        monitor->write(pcm16);
    audioDeltas++;
}

void BridgeSession::onAssistantAudioDone()
{
    packer.flush(true);
}

void BridgeSession::onBargeIn()
{
    bargeIns++;
    if (!config.bargeIn)
        return;

    // Best effort: nothing waits for an acknowledgement.
    if (transport->send(makeResponseCancel()))
        logging::debug("OAI", ">> response.cancel (interruption)");
    else
        logging::debug("OAI", "response.cancel not sent");

    // Audio the caller has not heard yet belongs to the cancelled answer.
    packer.interrupt();
}

void BridgeSession::onModelError(const std::string& message)
{
    modelErrors++;
    logging::warn("Bridge", "model error on " + sid + ": " + message);
}

void BridgeSession::onModelClosed(int code, const std::string& reason)
{
    logging::info("OAI", "closed: code=" + std::to_string(code) + " reason=" + reason);
    if (!isClosed) {
        teardown("model socket closed");
        channel.close();
    }
}

} // namespace rtbridge
