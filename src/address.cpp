// ============================================================================
// address.cpp — implementation for bacgate/address.hpp
// ============================================================================

#include "bacgate/address.hpp"

#include <cstdlib>      // strtoul for bounded component parsing

namespace bacgate {

std::string BipAddress::to_string() const {
    std::string s;
    s.reserve(21);
    s += std::to_string((ip >> 24) & 0xFF); s += '.';
    s += std::to_string((ip >> 16) & 0xFF); s += '.';
    s += std::to_string((ip >> 8)  & 0xFF); s += '.';
    s += std::to_string(ip & 0xFF);
    s += ':';
    s += std::to_string(port);
    return s;
}

void BipAddress::to_bip_bytes(uint8_t* out) const {
    out[0] = static_cast<uint8_t>(ip >> 24);
    out[1] = static_cast<uint8_t>(ip >> 16);
    out[2] = static_cast<uint8_t>(ip >> 8);
    out[3] = static_cast<uint8_t>(ip);
    out[4] = static_cast<uint8_t>(port >> 8);
    out[5] = static_cast<uint8_t>(port);
}

BipAddress BipAddress::from_bip_bytes(const uint8_t* in) {
    BipAddress a;
    a.ip = (uint32_t(in[0]) << 24) | (uint32_t(in[1]) << 16) |
           (uint32_t(in[2]) << 8)  |  uint32_t(in[3]);
    a.port = static_cast<uint16_t>((in[4] << 8) | in[5]);
    return a;
}

// Parse a decimal component in [0, hi]. Rejects empty strings, signs and junk.
static bool parse_component(const std::string& s, unsigned long hi, unsigned long& out) {
    if (s.empty() || s.size() > 5) return false;
    for (char c : s) if (c < '0' || c > '9') return false;
    char* e = nullptr;
    unsigned long v = std::strtoul(s.c_str(), &e, 10);
    if (!e || *e || v > hi) return false;
    out = v;
    return true;
}

bool parse_address(const std::string& text, BipAddress& out, uint16_t default_port) {
    std::string host = text;
    uint16_t port = default_port;

    const auto colon = text.rfind(':');
    if (colon != std::string::npos) {
        unsigned long p = 0;
        if (!parse_component(text.substr(colon + 1), 65535, p)) return false;
        port = static_cast<uint16_t>(p);
        host = text.substr(0, colon);
    }

    // Exactly four dotted octets.
    uint32_t ip = 0;
    size_t start = 0;
    for (int i = 0; i < 4; ++i) {
        const size_t dot = host.find('.', start);
        const bool last = (i == 3);
        if (last != (dot == std::string::npos)) return false;
        const std::string part = host.substr(start, last ? std::string::npos : dot - start);
        unsigned long octet = 0;
        if (!parse_component(part, 255, octet)) return false;
        ip = (ip << 8) | static_cast<uint32_t>(octet);
        start = dot + 1;
    }

    out.ip = ip;
    out.port = port;
    return true;
}

} // namespace bacgate
