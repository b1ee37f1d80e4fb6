#include "Agent.h"
#include "ArgumentParser.h"
#include "ConfigValidator.h"
#include "Config.h"
#include "CaptureLoop.h"
#include "HostInfo.h"
#include "Logging.h"
#include "Privilege.h"
#include "../reporters/ReporterRegistry.h"
#include "../reporters/FileReporter.h"
#ifdef CONN_TRACKER_HAVE_RDKAFKA
#include "../reporters/KafkaReporter.h"
#endif
#include <iostream>
#include <memory>
#include <set>

namespace conn_tracker {

// Returns false when a reporter cannot be set up.
static bool register_reporters(const Config& cfg, ReporterRegistry& registry){
    if(!cfg.output_file.empty()){
        registry.register_reporter(std::make_unique<FileReporter>(cfg));
        Logger::instance().info("Writing snapshots to " + cfg.output_file + " (" + cfg.output_format + ")");
    }
#ifdef CONN_TRACKER_HAVE_RDKAFKA
    if(cfg.kafka_enabled()){
        std::string err;
        auto kafka = KafkaReporter::create(cfg.kafka_brokers, cfg.kafka_topic, err);
        if(!kafka){ std::cerr << "Kafka producer setup failed: " << err << "\n"; return false; }
        registry.register_reporter(std::move(kafka));
        Logger::instance().info("Publishing snapshots to topic " + cfg.kafka_topic + " via " + cfg.kafka_brokers);
    }
#endif
    return true;
}

int run_agent(int argc, char** argv, const std::function<bool()>& should_stop) {
    Logger::instance().set_level(LogLevel::Info);
    Config cfg;
    ArgumentParser parser;
    if(!parser.parse(argc, argv, cfg)) return parser.exit_code();
    Logger::instance().set_level(cfg.log_level);

    if(!ConfigValidator::validate(cfg)) return 2;

    std::string host = resolve_hostname(cfg.hostname_override);

    if(cfg.drop_priv){ drop_capabilities(cfg.keep_cap_dac); }
    if(cfg.seccomp){
        if(!apply_seccomp_profile(cfg.kafka_enabled())){
            std::cerr << "Failed to apply seccomp profile";
            if(cfg.seccomp_strict){ std::cerr << "\n"; return 4; }
            std::cerr << " (continuing)\n";
        }
    }

    ReporterRegistry registry;
    if(!register_reporters(cfg, registry)) return 2;

    std::string ports;
    for(uint16_t p : std::set<uint16_t>(cfg.ports.begin(), cfg.ports.end())){
        if(!ports.empty()) ports += ",";
        ports += std::to_string(p);
    }
    Logger::instance().info("Tracking ports " + ports + " on host '" + host + "' every " +
                            std::to_string(cfg.interval_seconds) + "s");

    CaptureLoop loop(cfg, host, registry);
    loop.run(should_stop);
    return 0;
}

}
