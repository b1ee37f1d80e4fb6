#include "JsonUtil.h"
#include <cstdio>
#include <ctime>

namespace conn_tracker {
namespace jsonutil {

std::string escape(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 8);
    for (unsigned char c : s) {
        switch (c) {
            case '"':  out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            default:
                if (c < 0x20) {
                    char buf[7];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", c);
                    out += buf;
                } else {
                    out.push_back(static_cast<char>(c));
                }
        }
    }
    return out;
}

static bool to_utc_tm(std::time_t t, std::tm& out) {
    return gmtime_r(&t, &out) != nullptr;
}

std::string time_to_rfc3339(std::chrono::system_clock::time_point tp) {
    using namespace std::chrono;
    auto since = tp.time_since_epoch();
    auto secs = duration_cast<seconds>(since);
    auto nanos = duration_cast<nanoseconds>(since - secs).count();
    if (nanos < 0) { // pre-epoch instants round toward the earlier second
        secs -= seconds(1);
        nanos += 1000000000LL;
    }
    std::tm tm{};
    if (!to_utc_tm(static_cast<std::time_t>(secs.count()), tm)) return "";
    char date[32];
    std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &tm);
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s.%09lld+00:00", date, static_cast<long long>(nanos));
    return buf;
}

}
}
