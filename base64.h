#ifndef RTBRIDGE_BASE64_H
#define RTBRIDGE_BASE64_H

#include <string>

namespace rtbridge {

// Bytes are carried in std::string throughout the bridge.
std::string base64Encode(const std::string& bytes);

// Throws ProtocolError on characters outside the alphabet or bad padding.
std::string base64Decode(const std::string& in);

} // namespace rtbridge

#endif // RTBRIDGE_BASE64_H
