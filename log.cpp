#include "log.h"

#include <iostream>
#include <mutex>

namespace rtbridge {
namespace logging {

std::atomic<bool> debugEnabled{false};
std::atomic<bool> traceEnabled{false};

namespace {
std::mutex outputMutex;
}

void write(bool toStderr, const std::string& tag, const std::string& text)
{
    std::lock_guard<std::mutex> lock(outputMutex);
    std::ostream& os = toStderr ? std::cerr : std::cout;
    os << "[" << tag << "] " << text << std::endl;
}

std::string preview(const std::string& text, size_t maxLen)
{
    if (text.size() <= maxLen)
        return text;
    return text.substr(0, maxLen) + "...";
}

} // namespace logging
} // namespace rtbridge
