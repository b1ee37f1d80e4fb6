#pragma once
#include "../core/Snapshot.h"
#include <string>
#include <memory>

namespace conn_tracker {

// Sink for one cycle's snapshot. deliver() returns false on a failure that
// was already logged; it may also throw, the registry contains both.
class Reporter {
public:
    virtual ~Reporter() = default;
    virtual std::string name() const = 0;
    virtual bool deliver(const Snapshot& snapshot) = 0;
};

using ReporterPtr = std::unique_ptr<Reporter>;

}
