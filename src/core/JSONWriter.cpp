#include "JSONWriter.h"
#include "JsonUtil.h"
#include "Config.h"
#include <sstream>

namespace conn_tracker {
namespace {
    using jsonutil::escape;

    void emit_ips(const PortObservation& obs, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& ip : obs.unique_ips) {
            if (!first) os << ',';
            first = false;
            os << '"' << escape(ip) << '"';
        }
        os << ']';
    }

    void emit_entry_fields(const PortObservation& obs, std::ostream& os) {
        os << "\"port\":" << obs.port << ",\"unique_ips\":";
        emit_ips(obs, os);
        os << ",\"count\":" << obs.count()
           << ",\"timestamp\":\"" << escape(obs.timestamp) << '"';
    }

    void emit_flat_entry(const Snapshot& snap, const PortObservation& obs, std::ostream& os) {
        os << "{\"host\":\"" << escape(snap.host) << "\",";
        emit_entry_fields(obs, os);
        os << '}';
    }

    void emit_nested(const Snapshot& snap, std::ostream& os) {
        os << "{\"host\":\"" << escape(snap.host) << "\",\"connections\":[";
        bool first = true;
        for (const auto& obs : snap.connections) {
            if (!first) os << ',';
            first = false;
            os << '{';
            emit_entry_fields(obs, os);
            os << '}';
        }
        os << "]}";
    }

    void emit_flat(const Snapshot& snap, std::ostream& os) {
        os << '[';
        bool first = true;
        for (const auto& obs : snap.connections) {
            if (!first) os << ',';
            first = false;
            emit_flat_entry(snap, obs, os);
        }
        os << ']';
    }
} // anonymous namespace

std::string pretty_print_json(const std::string& compact_json) {
    std::string out;
    out.reserve(compact_json.size() * 2);
    int depth = 0;
    bool in_string = false;
    bool esc = false;

    auto indent = [&](int d) {
        for (int i = 0; i < d; i++) out.append("  ");
    };

    for (size_t i = 0; i < compact_json.size(); ++i) {
        char c = compact_json[i];

        if (in_string) {
            out.push_back(c);
            if (esc) esc = false;
            else if (c == '\\') esc = true;
            else if (c == '"') in_string = false;
            continue;
        }

        switch (c) {
            case '"':
                in_string = true;
                out.push_back(c);
                break;
            case '{':
            case '[': {
                out.push_back(c);
                char close = (c == '{') ? '}' : ']';
                if (i + 1 < compact_json.size() && compact_json[i + 1] == close) {
                    out.push_back(close); // keep empty containers on one line
                    ++i;
                    break;
                }
                out.push_back('\n');
                depth++;
                indent(depth);
                break;
            }
            case '}':
            case ']':
                out.push_back('\n');
                depth--;
                if (depth < 0) depth = 0;
                indent(depth);
                out.push_back(c);
                break;
            case ',':
                out.push_back(c);
                out.push_back('\n');
                indent(depth);
                break;
            case ':':
                out.append(": ");
                break;
            default:
                out.push_back(c);
                break;
        }
    }
    out.push_back('\n');
    return out;
}

std::string JSONWriter::write(const Snapshot& snap, const Config& cfg) const {
    std::ostringstream os;
    if (cfg.output_format == "flat") emit_flat(snap, os);
    else emit_nested(snap, os);
    std::string compact = os.str();
    if (cfg.pretty && !cfg.compact) {
        return pretty_print_json(compact);
    }
    return compact;
}

std::string JSONWriter::write_entry(const Snapshot& snap, const PortObservation& obs) const {
    std::ostringstream os;
    emit_flat_entry(snap, obs, os);
    return os.str();
}

}
