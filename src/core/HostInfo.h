#pragma once
#include <string>

namespace conn_tracker {

// Host identifier stamped on every snapshot. Precedence:
// CONN_TRACKER_HOSTNAME env, then override (--host), then the uname() node name.
// Empty when nothing resolves.
std::string resolve_hostname(const std::string& override_name);

}
