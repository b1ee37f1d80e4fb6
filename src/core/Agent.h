#pragma once
#include <functional>

namespace conn_tracker {

// Everything main() does after signal setup: parse and validate arguments,
// harden the process, build the reporters and run the capture loop until
// should_stop() or the cycle limit. Hardening happens before any reporter
// exists so threads started by reporter libraries inherit it.
// Returns the process exit code: 0 normal stop, 2 usage or configuration
// error, 4 strict seccomp failure.
int run_agent(int argc, char** argv, const std::function<bool()>& should_stop);

}
