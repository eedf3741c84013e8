#include "bridge_config.h"
#include "bridge_errors.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

namespace rtbridge {

namespace {

const char* DEFAULT_PROMPT =
    "You are a bilingual translator. Strictly translate all input speech and text between English and Korean. "
    "If the input is English, output Korean. If the input is Korean, output natural, idiomatic English. "
    "Do not add prefaces, commentary, or explanations. Preserve meaning, tone, names, numbers, punctuation, "
    "and formatting. If proper nouns have a well-known translation, use it. If the input mixes both languages, "
    "translate each segment into the other language so the output is fully in one language.";

std::string trim(const std::string& s)
{
    size_t b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos)
        return "";
    size_t e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string env(const char* name, const std::string& fallback = "")
{
    const char* v = std::getenv(name);
    return v ? std::string(v) : fallback;
}

// First variable that is set wins.
std::string env2(const char* name, const char* alias, const std::string& fallback)
{
    const char* v = std::getenv(name);
    if (!v)
        v = std::getenv(alias);
    return v ? std::string(v) : fallback;
}

long envNumber(const char* name, long fallback)
{
    std::string v = trim(env(name));
    if (v.empty())
        return fallback;
    try {
        size_t used = 0;
        long n = std::stol(v, &used);
        if (used != v.size())
            throw ConfigError(std::string(name) + ": not a number: " + v);
        return n;
    } catch (std::logic_error const&) {
        throw ConfigError(std::string(name) + ": not a number: " + v);
    }
}

} // namespace

bool parseBool(const std::string& value, bool fallback)
{
    std::string v = trim(value);
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) { return std::tolower(c); });
    if (v.empty())
        return fallback;
    return v == "1" || v == "true" || v == "yes";
}

int loadEnvFile(const std::string& path)
{
    std::ifstream in(path);
    if (!in)
        return 0;

    int applied = 0;
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#')
            continue;
        if (line.compare(0, 7, "export ") == 0)
            line = trim(line.substr(7));
        size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0)
            continue;
        std::string key = trim(line.substr(0, eq));
        std::string value = trim(line.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front())
            value = value.substr(1, value.size() - 2);
        if (std::getenv(key.c_str()))
            continue;
        if (::setenv(key.c_str(), value.c_str(), 0) == 0)
            applied++;
    }
    return applied;
}

std::string buildInstructions()
{
    std::string explicitPrompt = trim(env("OPENAI_SYSTEM_PROMPT"));
    if (!explicitPrompt.empty())
        return explicitPrompt;

    std::string target = trim(env2("OPENAI_TRANSLATE_TO", "TRANSLATE_TO", ""));
    if (target.empty())
        return DEFAULT_PROMPT;

    std::string style = env2("OPENAI_TRANSLATE_STYLE", "TRANSLATE_STYLE", "natural and concise");
    std::string extras = trim(env("OPENAI_TRANSLATE_EXTRAS"));
    std::string base =
        "You are a translator. Translate all user speech into " + target + ". "
        "Return only the translation with no preface or commentary. "
        "Keep the original meaning, tone, and intent. Speak " + style + ". "
        "If the user already speaks " + target + ", rephrase to improve clarity and flow.";
    if (!extras.empty())
        base += " " + extras;
    return base;
}

BridgeConfig configFromEnvironment()
{
    BridgeConfig cfg;
    cfg.apiKey = trim(env("OPENAI_API_KEY"));
    cfg.host = env("OPENAI_HOST", cfg.host);
    cfg.port = env("OPENAI_PORT", cfg.port);
    cfg.model = env("OPENAI_MODEL", cfg.model);
    cfg.voice = env("OPENAI_VOICE", cfg.voice);
    cfg.turnDetection = env("OPENAI_TURN_DETECTION", cfg.turnDetection);
    cfg.caFile = trim(env("OPENAI_CA_FILE"));
    cfg.instructions = buildInstructions();

    cfg.connectTimeout = std::chrono::milliseconds(envNumber("OPENAI_CONNECT_TIMEOUT_MS", cfg.connectTimeout.count()));
    cfg.pingInterval = std::chrono::seconds(envNumber("OPENAI_PING_INTERVAL_S", cfg.pingInterval.count()));
    cfg.pingTimeout = std::chrono::seconds(envNumber("OPENAI_PING_TIMEOUT_S", cfg.pingTimeout.count()));

    cfg.listenHost = env("BRIDGE_HOST", cfg.listenHost);
    long port = envNumber("BRIDGE_PORT", cfg.listenPort);
    if (port <= 0 || port > 65535)
        throw ConfigError("BRIDGE_PORT out of range: " + std::to_string(port));
    cfg.listenPort = static_cast<unsigned short>(port);
    cfg.listenPath = env("BRIDGE_PATH", cfg.listenPath);
    long threads = envNumber("BRIDGE_THREADS", cfg.ioThreads);
    long uplink = envNumber("BRIDGE_UPLINK_QUEUE", static_cast<long>(cfg.uplinkQueue));
    if (threads <= 0 || uplink <= 0)
        throw ConfigError("BRIDGE_THREADS and BRIDGE_UPLINK_QUEUE must be positive");
    cfg.ioThreads = static_cast<unsigned>(threads);
    cfg.uplinkQueue = static_cast<size_t>(uplink);

    cfg.localPlayback = parseBool(env("ENABLE_LOCAL_PLAYBACK"), cfg.localPlayback);
    cfg.bargeIn = parseBool(env("BRIDGE_BARGE_IN"), cfg.bargeIn);
    cfg.debug = parseBool(env("OPENAI_WS_DEBUG"), cfg.debug);
    cfg.trace = parseBool(env("OPENAI_WS_TRACE"), cfg.trace);
    return cfg;
}

void BridgeConfig::validate() const
{
    if (host.empty() || port.empty() || model.empty())
        throw ConfigError("OpenAI host, port and model must not be empty");
    if (voice.empty())
        throw ConfigError("OPENAI_VOICE must not be empty");
    if (turnDetection != "semantic_vad" && turnDetection != "server_vad")
        throw ConfigError("OPENAI_TURN_DETECTION must be semantic_vad or server_vad, got " + turnDetection);
    if (connectTimeout.count() <= 0)
        throw ConfigError("OPENAI_CONNECT_TIMEOUT_MS must be positive");
    if (pingTimeout.count() <= 0 || pingInterval <= pingTimeout)
        throw ConfigError("OPENAI_PING_INTERVAL_S must exceed OPENAI_PING_TIMEOUT_S");
    if (listenPath.empty() || listenPath[0] != '/')
        throw ConfigError("BRIDGE_PATH must start with '/'");
    if (ioThreads == 0 || uplinkQueue == 0 || modelSendQueue == 0)
        throw ConfigError("thread and queue sizes must be positive");
}

} // namespace rtbridge
