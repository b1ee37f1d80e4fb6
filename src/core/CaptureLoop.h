#pragma once
#include "Config.h"
#include "Snapshot.h"
#include <chrono>
#include <functional>
#include <string>

namespace conn_tracker {

class ReporterRegistry;

// Drives capture cycles: scan both tables, aggregate, hand to reporters,
// wait out the rest of the interval. One cycle at a time; nothing but the
// config and host identifier survives from one cycle to the next.
class CaptureLoop {
public:
    CaptureLoop(const Config& cfg, std::string host, ReporterRegistry& registry);

    // Reads both tables and builds a fresh snapshot stamped with the
    // instant the cycle started.
    Snapshot capture_once() const;

    // capture_once() + delivery. Returns the number of reporters that failed.
    size_t run_cycle();

    // Repeats run_cycle() until should_stop() returns true or max_cycles
    // cycles have run. The next cycle starts interval after the previous
    // one started. Returns the number of cycles completed.
    int run(const std::function<bool()>& should_stop);

    void set_interval(std::chrono::milliseconds interval) { interval_ = interval; }
    std::chrono::milliseconds interval() const { return interval_; }
    const std::string& host() const { return host_; }

private:
    // Sleeps until deadline in short slices; true if stopped early.
    bool wait_until(std::chrono::steady_clock::time_point deadline, const std::function<bool()>& should_stop) const;

    Config cfg_;
    std::string host_;
    ReporterRegistry& registry_;
    std::chrono::milliseconds interval_;
};

}
