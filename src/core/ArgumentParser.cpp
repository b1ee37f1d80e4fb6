#include "ArgumentParser.h"
#include "BuildInfo.h" // configured header (CMake adds generated dir to include path)
#include <iostream>
#include <cstdlib>
#include <cerrno>
#include <climits>

namespace conn_tracker {

static bool need_int(const std::string& v, const char* flag, int min_value, int& out){
    if(v.empty()){ std::cerr << "Invalid integer for " << flag << "\n"; return false; }
    char* end = nullptr; errno = 0;
    long n = std::strtol(v.c_str(), &end, 10);
    if(errno != 0 || *end != '\0' || n < min_value || n > INT_MAX){
        std::cerr << "Invalid integer for " << flag << ": " << v << "\n";
        return false;
    }
    out = static_cast<int>(n);
    return true;
}

ArgumentParser::ArgumentParser(){
    specs_ = {
        {"--ports", "-p", ArgKind::String, "LIST", "Comma-separated local ports to watch (e.g. 4317,4318)",
            [](const std::string& v, Config& c){ c.ports = parse_port_list(v); return true; }},
        {"--output", "-o", ArgKind::String, "FILE", "Write snapshot JSON to FILE (replaced atomically)",
            [](const std::string& v, Config& c){ c.output_file = v; return true; }},
        {"--format", nullptr, ArgKind::String, "nested|flat", "Shape of the output file (default nested)",
            [](const std::string& v, Config& c){ c.output_format = v; return true; }},
        {"--pretty", nullptr, ArgKind::None, nullptr, "Pretty-print JSON (default)",
            [](const std::string&, Config& c){ c.pretty = true; return true; }},
        {"--compact", nullptr, ArgKind::None, nullptr, "Minified JSON output",
            [](const std::string&, Config& c){ c.compact = true; return true; }},
        {"--brokers", nullptr, ArgKind::String, "HOST:PORT[,..]", "Kafka bootstrap servers",
            [](const std::string& v, Config& c){ c.kafka_brokers = v; return true; }},
        {"--topic", nullptr, ArgKind::String, "NAME", "Kafka topic, one message per port",
            [](const std::string& v, Config& c){ c.kafka_topic = v; return true; }},
        {"--interval", nullptr, ArgKind::Int, "SECONDS", "Seconds between capture cycles (default 10)",
            [](const std::string& v, Config& c){ return need_int(v, "--interval", 1, c.interval_seconds); }},
        {"--once", nullptr, ArgKind::None, nullptr, "Run a single cycle and exit",
            [](const std::string&, Config& c){ c.max_cycles = 1; return true; }},
        {"--cycles", nullptr, ArgKind::Int, "N", "Stop after N cycles (0 = forever)",
            [](const std::string& v, Config& c){ return need_int(v, "--cycles", 0, c.max_cycles); }},
        {"--tcp4-table", nullptr, ArgKind::String, "PATH", "IPv4 table (default /proc/net/tcp)",
            [](const std::string& v, Config& c){ c.tcp4_table = v; return true; }},
        {"--tcp6-table", nullptr, ArgKind::String, "PATH", "IPv6 table (default /proc/net/tcp6)",
            [](const std::string& v, Config& c){ c.tcp6_table = v; return true; }},
        {"--host", nullptr, ArgKind::String, "NAME", "Host identifier (default: hostname)",
            [](const std::string& v, Config& c){ c.hostname_override = v; return true; }},
        {"--parallel", nullptr, ArgKind::None, nullptr, "Read IPv4 and IPv6 tables concurrently",
            [](const std::string&, Config& c){ c.parallel = true; return true; }},
        {"--log-level", nullptr, ArgKind::String, "LEVEL", "error|warn|info|debug|trace",
            [](const std::string& v, Config& c){
                if(!parse_log_level(v, c.log_level)){ std::cerr << "Invalid --log-level value: " << v << "\n"; return false; }
                return true; }},
        {"--drop-priv", nullptr, ArgKind::None, nullptr, "Drop Linux capabilities before the loop",
            [](const std::string&, Config& c){ c.drop_priv = true; return true; }},
        {"--keep-cap-dac", nullptr, ArgKind::None, nullptr, "Retain CAP_DAC_READ_SEARCH when dropping",
            [](const std::string&, Config& c){ c.keep_cap_dac = true; return true; }},
        {"--seccomp", nullptr, ArgKind::None, nullptr, "Apply seccomp profile",
            [](const std::string&, Config& c){ c.seccomp = true; return true; }},
        {"--seccomp-strict", nullptr, ArgKind::None, nullptr, "Fail if seccomp apply fails",
            [](const std::string&, Config& c){ c.seccomp = true; c.seccomp_strict = true; return true; }},
    };
}

const ArgumentParser::FlagSpec* ArgumentParser::find_spec(const std::string& flag) const {
    for(const auto& s : specs_){
        if(flag == s.name) return &s;
        if(s.alias && flag == s.alias) return &s;
    }
    return nullptr;
}

void ArgumentParser::print_help() const {
    std::cout << "conn-tracker options:\n";
    for(const auto& s : specs_){
        std::string name = s.name;
        if(s.alias) name = std::string(s.alias) + ", " + name;
        if(s.arg_help) name += std::string(" ") + s.arg_help;
        std::cout << "  " << name;
        if(name.size() < 30) for(size_t i = name.size(); i < 30; ++i) std::cout << ' '; else std::cout << ' ';
        std::cout << s.help << "\n";
    }
    std::cout << "  --version                     Print version & exit\n"
              << "  --help                        Show this help\n"
              << "At least one of --output or --brokers/--topic is required.\n";
}

void ArgumentParser::print_version(){
    std::cout << "conn-tracker " << buildinfo::APP_VERSION
              << " (git=" << buildinfo::GIT_COMMIT
              << ", compiler=" << buildinfo::COMPILER_ID << " " << buildinfo::COMPILER_VERSION
              << ", cxx_std=" << buildinfo::CXX_STANDARD << ")\n";
}

bool ArgumentParser::parse(int argc, char** argv, Config& cfg){
    exit_code_ = 0;
    for(int i = 1; i < argc; ++i){
        if(!argv[i]) continue;
        std::string a = argv[i];
        if(a == "--help" || a == "-h"){ print_help(); return false; }
        if(a == "--version"){ print_version(); return false; }

        // --flag=value form
        std::string val;
        bool inline_val = false;
        auto eq = a.find('=');
        if(a.rfind("--", 0) == 0 && eq != std::string::npos){
            val = a.substr(eq + 1);
            a = a.substr(0, eq);
            inline_val = true;
        }

        const FlagSpec* spec = find_spec(a);
        if(!spec){ std::cerr << "Unknown arg: " << a << "\n"; exit_code_ = 2; return false; }
        if(spec->kind == ArgKind::None){
            if(inline_val){ std::cerr << a << " takes no value\n"; exit_code_ = 2; return false; }
        } else if(!inline_val){
            if(i + 1 >= argc || !argv[i + 1]){ std::cerr << "Missing value for " << a << "\n"; exit_code_ = 2; return false; }
            val = argv[++i];
        }
        if(!spec->apply(val, cfg)){ exit_code_ = 2; return false; }
    }
    return true;
}

}
