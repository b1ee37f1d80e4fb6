#pragma once
#include "Reporter.h"
#include <vector>

namespace conn_tracker {

class ReporterRegistry {
public:
    void register_reporter(ReporterPtr reporter);
    // Hands the snapshot to every reporter in registration order. A failing
    // reporter never prevents the others from running. Returns the number of
    // reporters that failed.
    size_t deliver_all(const Snapshot& snapshot);

    size_t size() const { return reporters_.size(); }
    bool empty() const { return reporters_.empty(); }
private:
    std::vector<ReporterPtr> reporters_;
};

}
