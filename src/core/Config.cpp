#include "Config.h"
#include <cctype>
#include <cstdlib>

namespace conn_tracker {

static std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e - b);
}

static bool parse_port(const std::string& tok, uint16_t& out){
    if(tok.empty() || tok.size() > 5) return false;
    for(char c : tok) if(!std::isdigit(static_cast<unsigned char>(c))) return false;
    unsigned long v = std::strtoul(tok.c_str(), nullptr, 10);
    if(v > 65535) return false;
    out = static_cast<uint16_t>(v);
    return true;
}

PortSet parse_port_list(const std::string& list){
    PortSet ports;
    size_t pos = 0;
    while(pos <= list.size()){
        size_t comma = list.find(',', pos);
        std::string tok = trim(list.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
        uint16_t port = 0;
        if(parse_port(tok, port)) ports.insert(port);
        else if(!tok.empty()) Logger::instance().debug("ignoring port token '" + tok + "'");
        if(comma == std::string::npos) break;
        pos = comma + 1;
    }
    return ports;
}

}
