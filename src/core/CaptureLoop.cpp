#include "CaptureLoop.h"
#include "SnapshotAggregator.h"
#include "Logging.h"
#include "../scanners/TcpTableScanner.h"
#include "../reporters/ReporterRegistry.h"
#include <future>
#include <thread>
#include <algorithm>

namespace conn_tracker {

static const std::chrono::milliseconds kStopPollSlice(200);

CaptureLoop::CaptureLoop(const Config& cfg, std::string host, ReporterRegistry& registry)
    : cfg_(cfg), host_(std::move(host)), registry_(registry),
      interval_(std::chrono::seconds(cfg.interval_seconds)) {}

// Each call owns its scanner; concurrent calls share only the read-only port set.
static PortMap scan_source(const PortSet& ports, const std::string& path, bool is_ipv6) {
    TcpTableScanner scanner(ports, is_ipv6);
    PortMap out = scanner.scan(path);
    const auto& st = scanner.stats();
    if (st.source_available) {
        Logger::instance().debug(scanner.name() + ": " + std::to_string(st.matched) + "/" +
                                 std::to_string(st.lines) + " rows matched");
    }
    return out;
}

Snapshot CaptureLoop::capture_once() const {
    auto captured_at = std::chrono::system_clock::now();
    PortMap tcp4, tcp6;
    if (cfg_.parallel) {
        auto f6 = std::async(std::launch::async, scan_source, std::cref(cfg_.ports), std::cref(cfg_.tcp6_table), true);
        tcp4 = scan_source(cfg_.ports, cfg_.tcp4_table, false);
        tcp6 = f6.get();
    } else {
        tcp4 = scan_source(cfg_.ports, cfg_.tcp4_table, false);
        tcp6 = scan_source(cfg_.ports, cfg_.tcp6_table, true);
    }
    return aggregate(tcp4, tcp6, host_, captured_at);
}

size_t CaptureLoop::run_cycle() {
    Snapshot snap = capture_once();
    Logger::instance().debug("cycle " + snap.timestamp + ": " + std::to_string(snap.connections.size()) + " active port(s)");
    return registry_.deliver_all(snap);
}

bool CaptureLoop::wait_until(std::chrono::steady_clock::time_point deadline, const std::function<bool()>& should_stop) const {
    for (;;) {
        if (should_stop && should_stop()) return true;
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return false;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, kStopPollSlice));
    }
}

int CaptureLoop::run(const std::function<bool()>& should_stop) {
    int cycles = 0;
    while (!(should_stop && should_stop())) {
        auto started = std::chrono::steady_clock::now();
        run_cycle();
        ++cycles;
        if (cfg_.max_cycles > 0 && cycles >= cfg_.max_cycles) break;
        if (wait_until(started + interval_, should_stop)) break;
    }
    Logger::instance().info("capture loop stopped after " + std::to_string(cycles) + " cycle(s)");
    return cycles;
}

}
