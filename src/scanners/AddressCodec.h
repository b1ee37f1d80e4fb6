#pragma once
#include <string>
#include <optional>

namespace conn_tracker {

// Address columns of /proc/net/tcp{,6} are fixed-width hex dumps of the
// kernel's in-memory address. Decoders return the canonical text form
// (inet_ntop) or nullopt when the input is not exactly the expected number
// of hex digits.

// 8 hex digits, host little-endian: "0100007F" -> "127.0.0.1".
std::optional<std::string> decode_ipv4(const std::string& hex);

// 32 hex digits read big-endian: hex pair i is address byte i.
std::optional<std::string> decode_ipv6(const std::string& hex);

// Inverse of the decoders; nullopt if the text is not a valid address.
std::optional<std::string> encode_ipv4(const std::string& addr);
std::optional<std::string> encode_ipv6(const std::string& addr);

}
