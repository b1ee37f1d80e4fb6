#pragma once
#include "Snapshot.h"
#include <string>

namespace conn_tracker {

struct Config;

class JSONWriter {
public:
    // Whole-snapshot document. output_format "nested":
    //   {"host":..,"connections":[{"port","unique_ips","count","timestamp"},..]}
    // "flat":
    //   [{"host","port","unique_ips","count","timestamp"},..]
    // Pretty-printed unless cfg.compact.
    std::string write(const Snapshot& snap, const Config& cfg) const;

    // Compact single-entry payload in the flat shape; used per message.
    std::string write_entry(const Snapshot& snap, const PortObservation& obs) const;
};

// Re-indents compact JSON with two spaces per level.
std::string pretty_print_json(const std::string& compact_json);

}
