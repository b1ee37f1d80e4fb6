#include "TcpTableScanner.h"
#include "AddressCodec.h"
#include "../core/Logging.h"
#include <fstream>
#include <sstream>
#include <vector>

namespace conn_tracker {

static const char* const kStateEstablished = "01";

bool TcpTableScanner::parse_hex_port(const std::string& hex, uint16_t& out) {
    if (hex.empty() || hex.size() > 4) return false;
    unsigned v = 0;
    for (char c : hex) {
        int d;
        if (c >= '0' && c <= '9') d = c - '0';
        else if (c >= 'a' && c <= 'f') d = c - 'a' + 10;
        else if (c >= 'A' && c <= 'F') d = c - 'A' + 10;
        else return false;
        v = (v << 4) | static_cast<unsigned>(d);
    }
    out = static_cast<uint16_t>(v);
    return true;
}

// Splits "HEXADDR:HEXPORT". A missing colon leaves both halves empty.
static void split_endpoint(const std::string& field, std::string& addr, std::string& port) {
    auto colon = field.find(':');
    if (colon == std::string::npos) { addr.clear(); port.clear(); return; }
    addr = field.substr(0, colon);
    port = field.substr(colon + 1);
}

std::optional<TableRow> TcpTableScanner::parse_line(const std::string& line, const PortSet& ports, bool is_ipv6) {
    std::istringstream iss(line);
    std::vector<std::string> fields;
    std::string tok;
    while (fields.size() < 4 && iss >> tok) fields.push_back(tok);
    if (fields.size() < 4) return std::nullopt;

    if (fields[3] != kStateEstablished) return std::nullopt;

    std::string local_ip, local_port_hex, remote_ip, remote_port_hex;
    split_endpoint(fields[1], local_ip, local_port_hex);
    split_endpoint(fields[2], remote_ip, remote_port_hex);

    uint16_t local_port = 0;
    if (!parse_hex_port(local_port_hex, local_port)) return std::nullopt;
    if (!ports.count(local_port)) return std::nullopt;

    auto remote = is_ipv6 ? decode_ipv6(remote_ip) : decode_ipv4(remote_ip);
    if (!remote) return std::nullopt;

    TableRow row;
    row.local_port = local_port;
    row.remote_address = std::move(*remote);
    return row;
}

PortMap TcpTableScanner::scan(std::istream& in) {
    PortMap out;
    std::string line;
    bool header_skipped = false;
    while (std::getline(in, line)) {
        if (!header_skipped) { header_skipped = true; continue; }
        ++stats_.lines;
        auto row = parse_line(line, ports_, is_ipv6_);
        if (!row) { ++stats_.skipped; continue; }
        ++stats_.matched;
        out[row->local_port].insert(std::move(row->remote_address));
    }
    return out;
}

PortMap TcpTableScanner::scan(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        stats_.source_available = false;
        Logger::instance().debug(name() + ": cannot open " + path + ", treating as empty");
        return {};
    }
    PortMap out = scan(f);
    Logger::instance().trace(name() + ": " + std::to_string(stats_.lines) + " rows, " +
                             std::to_string(stats_.matched) + " matched, " +
                             std::to_string(out.size()) + " ports");
    return out;
}

}
