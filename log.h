#ifndef RTBRIDGE_LOG_H
#define RTBRIDGE_LOG_H

#include <atomic>
#include <sstream>
#include <string>

namespace rtbridge {

// Console logging, "[Tag] message" per line.
// info/debug/trace go to stdout, warn/error to stderr.
namespace logging {

extern std::atomic<bool> debugEnabled; // OPENAI_WS_DEBUG
extern std::atomic<bool> traceEnabled; // OPENAI_WS_TRACE

void write(bool toStderr, const std::string& tag, const std::string& text);

inline void info(const std::string& tag, const std::string& text) { write(false, tag, text); }
inline void warn(const std::string& tag, const std::string& text) { write(true, tag, "warning: " + text); }
inline void error(const std::string& tag, const std::string& text) { write(true, tag, text); }

inline void debug(const std::string& tag, const std::string& text)
{
    if (debugEnabled.load(std::memory_order_relaxed))
        write(false, tag, text);
}

inline void trace(const std::string& tag, const std::string& text)
{
    if (traceEnabled.load(std::memory_order_relaxed))
        write(false, tag, text);
}

// Shortens long payloads (prompts, raw events) for a log line.
std::string preview(const std::string& text, size_t maxLen = 160);

} // namespace logging
} // namespace rtbridge

#endif // RTBRIDGE_LOG_H
