#pragma once
#include "Snapshot.h"
#include "Logging.h"
#include <string>

namespace conn_tracker {

struct Config {
    PortSet ports;
    // Reporter targets; at least one of output_file or brokers+topic
    std::string output_file;
    std::string output_format = "nested"; // "nested" | "flat"
    bool pretty = true;
    bool compact = false; // inverse of pretty; wins if both set
    std::string kafka_brokers;
    std::string kafka_topic;
    // Loop
    int interval_seconds = 10;
    int max_cycles = 0; // 0 = run until stopped
    bool parallel = false; // read tcp and tcp6 concurrently
    // Sources
    std::string tcp4_table = "/proc/net/tcp";
    std::string tcp6_table = "/proc/net/tcp6";
    std::string hostname_override;
    LogLevel log_level = LogLevel::Info;
    // Hardening
    bool drop_priv = false;
    bool keep_cap_dac = false;
    bool seccomp = false;
    bool seccomp_strict = false;

    bool kafka_enabled() const { return !kafka_brokers.empty() && !kafka_topic.empty(); }
};

// Parses "4317, 4318,abc" -> {4317, 4318}. Tokens that are not decimal
// integers in [0, 65535] are dropped.
PortSet parse_port_list(const std::string& list);

}
