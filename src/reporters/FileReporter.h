#pragma once
#include "Reporter.h"
#include "../core/Config.h"
#include "../core/JSONWriter.h"

namespace conn_tracker {

// Replaces the output file with the latest snapshot. Readers never see a
// partially written document: the JSON goes to "<path>.tmp" first and is
// renamed over the target.
class FileReporter : public Reporter {
public:
    explicit FileReporter(const Config& cfg) : cfg_(cfg), path_(cfg.output_file) {}
    std::string name() const override { return "file"; }
    bool deliver(const Snapshot& snapshot) override;

    const std::string& path() const { return path_; }
private:
    Config cfg_;
    std::string path_;
    JSONWriter writer_;
};

}
