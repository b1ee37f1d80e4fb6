#include "scanners/TcpTableScanner.h"
#include "scanners/AddressCodec.h"
#include <cstdint>
#include <sstream>
#include <string>

// Feeds arbitrary bytes through the table scanner for both families and
// checks the decoders never return a value that does not re-encode.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);
    conn_tracker::PortSet ports = {22, 80, 443, 4317, 6789};

    for (bool is_ipv6 : {false, true}) {
        std::istringstream in("header\n" + input);
        conn_tracker::TcpTableScanner scanner(ports, is_ipv6);
        auto result = scanner.scan(in);
        for (const auto& kv : result) {
            if (!ports.count(kv.first)) __builtin_trap();
        }
    }

    if (auto v4 = conn_tracker::decode_ipv4(input)) {
        if (!conn_tracker::encode_ipv4(*v4)) __builtin_trap();
    }
    if (auto v6 = conn_tracker::decode_ipv6(input)) {
        if (!conn_tracker::encode_ipv6(*v6)) __builtin_trap();
    }
    return 0;
}
