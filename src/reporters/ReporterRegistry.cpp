#include "ReporterRegistry.h"
#include "../core/Logging.h"
#include <exception>

namespace conn_tracker {

void ReporterRegistry::register_reporter(ReporterPtr reporter) {
    reporters_.push_back(std::move(reporter));
}

size_t ReporterRegistry::deliver_all(const Snapshot& snapshot) {
    size_t failures = 0;
    for (auto& r : reporters_) {
        Logger::instance().trace("Delivering snapshot via " + r->name());
        bool ok = false;
        try {
            ok = r->deliver(snapshot);
        } catch (const std::exception& ex) {
            Logger::instance().error(r->name() + ": delivery threw: " + ex.what());
        }
        if (!ok) {
            ++failures;
            Logger::instance().warn(r->name() + ": delivery failed for this cycle");
        }
    }
    return failures;
}

}
