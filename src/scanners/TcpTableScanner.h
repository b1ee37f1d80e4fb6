#pragma once
#include "../core/Snapshot.h"
#include <string>
#include <optional>
#include <istream>

namespace conn_tracker {

// One ESTABLISHED row on a watched port.
struct TableRow {
    uint16_t local_port = 0;
    std::string remote_address;
};

struct ScanStats {
    size_t lines = 0;    // data lines, header excluded
    size_t matched = 0;
    size_t skipped = 0;
    bool source_available = true;
};

// Reads the /proc/net/tcp or /proc/net/tcp6 layout:
//   sl  local_address rem_address   st tx_queue rx_queue ...
//   0: 0100007F:1A85 01020304:0050 01 ...
// The address family is fixed per instance; it is never guessed from a row.
class TcpTableScanner {
public:
    TcpTableScanner(const PortSet& ports, bool is_ipv6) : ports_(ports), is_ipv6_(is_ipv6) {}

    std::string name() const { return is_ipv6_ ? "tcp6" : "tcp"; }

    // Skips the header line, then groups remote addresses by local port.
    // Malformed rows are dropped without aborting the scan.
    PortMap scan(std::istream& in);
    // Unreadable path yields an empty map and stats().source_available == false.
    PortMap scan(const std::string& path);

    const ScanStats& stats() const { return stats_; }

    static std::optional<TableRow> parse_line(const std::string& line, const PortSet& ports, bool is_ipv6);
    // Strict 1-4 digit hex port; false on anything else.
    static bool parse_hex_port(const std::string& hex, uint16_t& out);

private:
    const PortSet& ports_;
    bool is_ipv6_;
    ScanStats stats_;
};

}
