#pragma once
#include <string>
#include <vector>
#include <map>
#include <set>
#include <unordered_set>
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace conn_tracker {

// Local ports of interest; fixed at startup.
using PortSet = std::unordered_set<uint16_t>;

// Result of scanning one connection table: local port -> distinct remote
// addresses (canonical text form). Ordered so output is stable.
using PortMap = std::map<uint16_t, std::set<std::string>>;

struct PortObservation {
    uint16_t port = 0;
    std::set<std::string> unique_ips;
    std::string timestamp; // shared by every observation of one snapshot
    size_t count() const { return unique_ips.size(); }
};

// Output of one capture cycle. Built from scratch every cycle and never
// mutated once handed to the reporters.
struct Snapshot {
    std::string host;
    std::chrono::system_clock::time_point captured_at{};
    std::string timestamp;
    std::vector<PortObservation> connections; // ascending port order

    const PortObservation* find(uint16_t port) const {
        for (const auto& obs : connections) if (obs.port == port) return &obs;
        return nullptr;
    }
};

}
