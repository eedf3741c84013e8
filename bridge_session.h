#ifndef RTBRIDGE_BRIDGE_SESSION_H
#define RTBRIDGE_BRIDGE_SESSION_H

#include "audio_codec.h"
#include "bounded_queue.h"
#include "bridge_config.h"
#include "frame_packer.h"
#include "realtime_transport.h"
#include "telephony_channel.h"
#include "turn_state.h"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace rtbridge {

class AudioMonitor;

using TransportFactory = std::function<std::unique_ptr<RealtimeTransport>(const BridgeConfig&)>;

// Production factory: RealtimeClient against the configured endpoint.
TransportFactory realtimeClientFactory();

struct SessionStats
{
    size_t mediaFrames = 0;    // telephony frames accepted
    size_t badMedia = 0;       // undecodable telephony payloads
    size_t uplinkDropped = 0;  // chunks evicted from the full uplink queue
    size_t chunksToModel = 0;  // input_audio_buffer.append sent
    size_t sendFailures = 0;
    size_t audioDeltas = 0;    // assistant chunks forwarded
    size_t framesOut = 0;      // telephony media frames sent
    size_t malformedEvents = 0;
    size_t modelErrors = 0;
    size_t bargeIns = 0;
};

// One telephony stream bridged to one model session.
//
// Threads: the caller's telephony receive loop (onMedia/stop), an uplink
// pump (telephony -> model) and a model pump that owns the transport's
// inbound stream and the turn state machine (model -> telephony).
class BridgeSession : private TurnObserver
{
public:
    BridgeSession(const BridgeConfig& config, TelephonyChannel& channel, std::string streamSid,
                  TransportFactory factory, AudioMonitor* monitor = nullptr);
    ~BridgeSession() override;

    BridgeSession(const BridgeSession&) = delete;
    BridgeSession& operator=(const BridgeSession&) = delete;

    // Returns false, and tears the session down, when the configuration
    // lacks a credential. Otherwise connects in the background.
    bool start();

    // Base64 mu-law 8 kHz from the telephony side. Never blocks.
    void onMedia(const std::string& payloadB64);

    // Telephony "stop" or disconnect: padded flush, then teardown.
    void stop();

    // Idempotent and safe from any thread, including the session's own.
    void teardown(const std::string& reason);

    // Waits for the pumps. Must not be called from them.
    void join();

    bool closed() const { return isClosed; }
    bool ready() const;
    const std::string& streamSid() const { return sid; }
    SessionStats stats() const;

    // Model pump state, approximate when read from another thread.
    TurnState turnState() const { return currentTurn; }

private:
    void runModel();
    void runUplink();
    bool waitReady();
    void setReady();

    // TurnObserver
    void onAssistantAudio(const std::string& pcm16) override;
    void onAssistantAudioDone() override;
    void onBargeIn() override;
    void onModelError(const std::string& message) override;
    void onModelClosed(int code, const std::string& reason) override;

    const BridgeConfig& config;
    TelephonyChannel& channel;
    const std::string sid;
    TransportFactory factory;
    AudioMonitor* monitor;

    std::unique_ptr<RealtimeTransport> transport;
    TelephonyFramePacker packer;
    Resampler upsampler;          // uplink pump only
    BoundedQueue<std::string> uplink;
    TurnStateMachine turns;       // model pump only
    std::atomic<TurnState> currentTurn;

    mutable std::mutex readyMtx;
    std::condition_variable readyCv;
    bool isReady;

    std::mutex lifecycleMtx; // transport and the two threads
    std::atomic<bool> isClosed;
    std::atomic<bool> isStarted;

    std::atomic<size_t> mediaFrames;
    std::atomic<size_t> badMedia;
    std::atomic<size_t> chunksToModel;
    std::atomic<size_t> sendFailures;
    std::atomic<size_t> malformedEvents;
    std::atomic<size_t> modelErrors;
    std::atomic<size_t> audioDeltas;
    std::atomic<size_t> bargeIns;

    std::thread modelThread;
    std::thread uplinkThread;
};

} // namespace rtbridge

#endif // RTBRIDGE_BRIDGE_SESSION_H
