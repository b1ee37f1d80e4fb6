#include "AddressCodec.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstdint>
#include <cstdio>

namespace conn_tracker {

static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Fills out[0..n) with the bytes spelled by 2*n hex digits, in text order.
static bool hex_to_bytes(const std::string& hex, uint8_t* out, size_t n) {
    if (hex.size() != n * 2) return false;
    for (size_t i = 0; i < n; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) return false;
        out[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return true;
}

static std::string bytes_to_hex(const uint8_t* in, size_t n) {
    std::string out;
    out.reserve(n * 2);
    char buf[3];
    for (size_t i = 0; i < n; ++i) {
        std::snprintf(buf, sizeof(buf), "%02X", in[i]);
        out += buf;
    }
    return out;
}

std::optional<std::string> decode_ipv4(const std::string& hex) {
    uint8_t raw[4];
    if (!hex_to_bytes(hex, raw, sizeof(raw))) return std::nullopt;
    // The table prints the 32-bit value most significant digit first; the
    // address bytes sit in memory least significant first.
    struct in_addr addr{};
    uint8_t* dst = reinterpret_cast<uint8_t*>(&addr.s_addr);
    for (int i = 0; i < 4; ++i) dst[i] = raw[3 - i];
    char text[INET_ADDRSTRLEN];
    if (!inet_ntop(AF_INET, &addr, text, sizeof(text))) return std::nullopt;
    return std::string(text);
}

std::optional<std::string> decode_ipv6(const std::string& hex) {
    struct in6_addr addr{};
    if (!hex_to_bytes(hex, addr.s6_addr, sizeof(addr.s6_addr))) return std::nullopt;
    char text[INET6_ADDRSTRLEN];
    if (!inet_ntop(AF_INET6, &addr, text, sizeof(text))) return std::nullopt;
    return std::string(text);
}

std::optional<std::string> encode_ipv4(const std::string& text) {
    struct in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1) return std::nullopt;
    const uint8_t* src = reinterpret_cast<const uint8_t*>(&addr.s_addr);
    uint8_t raw[4] = { src[3], src[2], src[1], src[0] };
    return bytes_to_hex(raw, sizeof(raw));
}

std::optional<std::string> encode_ipv6(const std::string& text) {
    struct in6_addr addr{};
    if (inet_pton(AF_INET6, text.c_str(), &addr) != 1) return std::nullopt;
    return bytes_to_hex(addr.s6_addr, sizeof(addr.s6_addr));
}

}
