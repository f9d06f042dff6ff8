#pragma once

#include <cstdint>
#include <cstdlib>
#include <string>

namespace seqreport {

// Parse "host:port". Returns false on invalid format.
inline bool parse_host_port(const std::string& addr, std::string& host,
                            uint16_t& port) {
    auto colon = addr.rfind(':');
    if (colon == std::string::npos) return false;

    host = addr.substr(0, colon);
    std::string port_str = addr.substr(colon + 1);
    if (port_str.empty()) return false;

    char* end = nullptr;
    long val = std::strtol(port_str.c_str(), &end, 10);
    if (*end != '\0' || val <= 0 || val > 65535) return false;
    port = static_cast<uint16_t>(val);
    return true;
}

} // namespace seqreport
