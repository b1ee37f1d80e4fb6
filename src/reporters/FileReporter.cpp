#include "FileReporter.h"
#include "../core/Logging.h"
#include <fstream>
#include <cstdio>
#include <cerrno>
#include <cstring>

namespace conn_tracker {

bool FileReporter::deliver(const Snapshot& snapshot) {
    std::string json = writer_.write(snapshot, cfg_);
    std::string tmp = path_ + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::out | std::ios::trunc | std::ios::binary);
        if (!ofs.is_open()) {
            Logger::instance().error("file: cannot open " + tmp + ": " + std::strerror(errno));
            return false;
        }
        ofs << json;
        ofs.flush();
        if (!ofs) {
            Logger::instance().error("file: write to " + tmp + " failed");
            ofs.close();
            std::remove(tmp.c_str());
            return false;
        }
    }
    if (std::rename(tmp.c_str(), path_.c_str()) != 0) {
        Logger::instance().error("file: rename " + tmp + " -> " + path_ + " failed: " + std::strerror(errno));
        std::remove(tmp.c_str());
        return false;
    }
    Logger::instance().debug("file: wrote " + std::to_string(snapshot.connections.size()) + " port entries to " + path_);
    return true;
}

}
