#ifndef RTBRIDGE_BRIDGE_ERRORS_H
#define RTBRIDGE_BRIDGE_ERRORS_H

#include <stdexcept>
#include <string>

namespace rtbridge {

// PCM buffer that cannot be converted (odd byte count, bad rate).
class AudioFormatError : public std::runtime_error
{
public:
    explicit AudioFormatError(const std::string& what) : std::runtime_error(what) {}
};

// Undecodable JSON / base64 from either socket.
class ProtocolError : public std::runtime_error
{
public:
    explicit ProtocolError(const std::string& what) : std::runtime_error(what) {}
};

// pjmedia / pjsua2 call that returned a failure status.
class MediaError : public std::runtime_error
{
public:
    explicit MediaError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error
{
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

} // namespace rtbridge

#endif // RTBRIDGE_BRIDGE_ERRORS_H
