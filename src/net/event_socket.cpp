// CHAINSYNC - Event Transport Helpers
// Copyright (c) 2024 CHAINSYNC Developers
// MIT License

#include <chainsync/net/event_socket.h>

namespace chainsync {
namespace net {

std::string HexStr(const std::string& bytes) {
    static const char hexDigits[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (unsigned char c : bytes) {
        result.push_back(hexDigits[c >> 4]);
        result.push_back(hexDigits[c & 0x0F]);
    }
    return result;
}

} // namespace net
} // namespace chainsync
