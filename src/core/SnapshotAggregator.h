#pragma once
#include "Snapshot.h"
#include <string>
#include <chrono>

namespace conn_tracker {

// Union of two scanner results; a port present in both gets one entry.
PortMap merge_port_maps(const PortMap& a, const PortMap& b);

// Builds the cycle's snapshot. The timestamp is formatted once from
// captured_at and copied to every observation.
Snapshot aggregate(const PortMap& tcp4, const PortMap& tcp6,
                   const std::string& host,
                   std::chrono::system_clock::time_point captured_at);

}
