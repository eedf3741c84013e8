#ifndef RTBRIDGE_BRIDGE_CONFIG_H
#define RTBRIDGE_BRIDGE_CONFIG_H

#include <chrono>
#include <string>

namespace rtbridge {

// --- Configuration ---
const std::string DEFAULT_OPENAI_HOST = "api.openai.com";
const std::string DEFAULT_OPENAI_PORT = "443";
const std::string DEFAULT_OPENAI_MODEL = "gpt-4o-realtime-preview-2024-12-17";
const std::string DEFAULT_VOICE = "verse";
const std::string DEFAULT_TURN_DETECTION = "semantic_vad";

struct BridgeConfig
{
    // OpenAI realtime endpoint
    std::string apiKey;
    std::string host = DEFAULT_OPENAI_HOST;
    std::string port = DEFAULT_OPENAI_PORT;
    std::string model = DEFAULT_OPENAI_MODEL;
    std::string voice = DEFAULT_VOICE;
    std::string turnDetection = DEFAULT_TURN_DETECTION;
    std::string instructions;
    std::string caFile; // PEM bundle trusted in addition to the system store

    std::chrono::milliseconds connectTimeout{10000};
    std::chrono::seconds pingInterval{30};
    std::chrono::seconds pingTimeout{10};
    size_t modelSendQueue = 256; // pending outbound messages per call

    // Telephony listener
    std::string listenHost = "0.0.0.0";
    unsigned short listenPort = 8000;
    std::string listenPath = "/audio";
    unsigned ioThreads = 2;
    size_t uplinkQueue = 50; // 20 ms chunks, one second

    bool localPlayback = true;
    bool bargeIn = true;
    bool debug = false;
    bool trace = false;

    std::string path() const { return "/v1/realtime?model=" + model; }

    // Throws ConfigError on values the bridge cannot run with. A missing
    // API key is not checked here: it fails each call at stream start.
    void validate() const;
};

// Sets variables from a KEY=VALUE file unless they are already set in the
// environment. A missing file is not an error. Returns the number applied.
int loadEnvFile(const std::string& path);

// Reads every BridgeConfig field from the environment.
BridgeConfig configFromEnvironment();

// OPENAI_SYSTEM_PROMPT, else a translator prompt for OPENAI_TRANSLATE_TO,
// else the default English/Korean interpreter prompt.
std::string buildInstructions();

bool parseBool(const std::string& value, bool fallback);

} // namespace rtbridge

#endif // RTBRIDGE_BRIDGE_CONFIG_H
