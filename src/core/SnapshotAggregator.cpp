#include "SnapshotAggregator.h"
#include "JsonUtil.h"

namespace conn_tracker {

PortMap merge_port_maps(const PortMap& a, const PortMap& b) {
    PortMap out = a;
    for (const auto& kv : b) {
        out[kv.first].insert(kv.second.begin(), kv.second.end());
    }
    return out;
}

Snapshot aggregate(const PortMap& tcp4, const PortMap& tcp6,
                   const std::string& host,
                   std::chrono::system_clock::time_point captured_at) {
    Snapshot snap;
    snap.host = host;
    snap.captured_at = captured_at;
    snap.timestamp = jsonutil::time_to_rfc3339(captured_at);

    PortMap merged = merge_port_maps(tcp4, tcp6);
    snap.connections.reserve(merged.size());
    for (auto& kv : merged) {
        PortObservation obs;
        obs.port = kv.first;
        obs.unique_ips = std::move(kv.second);
        obs.timestamp = snap.timestamp;
        snap.connections.push_back(std::move(obs));
    }
    return snap;
}

}
