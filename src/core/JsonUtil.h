#pragma once
#include <string>
#include <chrono>

namespace conn_tracker {
namespace jsonutil {

// Escapes a string for embedding between JSON double quotes (RFC 8259).
std::string escape(const std::string& s);

// RFC3339 with nanosecond fraction and explicit UTC offset,
// e.g. "2024-05-01T10:20:30.123456789+00:00".
std::string time_to_rfc3339(std::chrono::system_clock::time_point tp);

}
}
