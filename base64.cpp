#include "base64.h"
#include "bridge_errors.h"

#include <array>
#include <cstdint>

namespace rtbridge {

static const std::string b64_table = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

namespace {

std::array<int, 256> makeReverseTable()
{
    std::array<int, 256> t;
    t.fill(-1);
    for (int i = 0; i < 64; i++)
        t[static_cast<unsigned char>(b64_table[i])] = i;
    return t;
}

} // namespace

std::string base64Encode(const std::string& bytes)
{
    std::string ret;
    ret.reserve((bytes.size() + 2) / 3 * 4);
    int val = 0, valb = -6;
    for (unsigned char c : bytes) {
        val = ((val << 8) + c) & 0xFFFFFF;
        valb += 8;
        while (valb >= 0) {
            ret.push_back(b64_table[(val >> valb) & 0x3F]);
            valb -= 6;
        }
    }
    if (valb > -6) ret.push_back(b64_table[((val << 8) >> (valb + 8)) & 0x3F]);
    while (ret.size() % 4) ret.push_back('=');
    return ret;
}

std::string base64Decode(const std::string& in)
{
    static const std::array<int, 256> T = makeReverseTable();

    std::string out;
    out.reserve(in.size() / 4 * 3);
    int val = 0, valb = -8;
    size_t padding = 0;
    size_t symbols = 0;
    for (unsigned char c : in) {
        if (c == '=') {
            padding++;
            continue;
        }
        if (c == '\r' || c == '\n')
            continue;
        if (T[c] == -1 || padding > 0)
            throw ProtocolError("base64: invalid character in payload");
        val = ((val << 6) + T[c]) & 0xFFFFFF;
        valb += 6;
        symbols++;
        if (valb >= 0) {
            out.push_back(static_cast<char>((val >> valb) & 0xFF));
            valb -= 8;
        }
    }
    if (padding > 2 || symbols % 4 == 1)
        throw ProtocolError("base64: truncated payload");
    return out;
}

} // namespace rtbridge
