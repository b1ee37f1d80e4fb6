#include "ConfigValidator.h"
#include <iostream>

namespace conn_tracker {

bool ConfigValidator::kafka_supported(){
#ifdef CONN_TRACKER_HAVE_RDKAFKA
    return true;
#else
    return false;
#endif
}

bool ConfigValidator::validate(Config& cfg) {
    // pretty vs compact: if both set, compact wins (documented behavior)
    if(cfg.pretty && cfg.compact) {
        cfg.pretty = false;
    }

    if(cfg.ports.empty()) {
        std::cerr << "--ports requires at least one valid port number (0-65535)\n";
        return false;
    }

    if(cfg.kafka_brokers.empty() != cfg.kafka_topic.empty()) {
        std::cerr << "--brokers and --topic must be given together\n";
        return false;
    }

    if(cfg.output_file.empty() && !cfg.kafka_enabled()) {
        std::cerr << "At least one output is required: --output FILE or --brokers LIST --topic NAME\n";
        return false;
    }

    if(cfg.kafka_enabled() && !kafka_supported()) {
        std::cerr << "--brokers/--topic given but this build has no Kafka support (librdkafka not found)\n";
        return false;
    }

    if(cfg.output_format != "nested" && cfg.output_format != "flat") {
        std::cerr << "Invalid --format value: " << cfg.output_format << " (expected nested or flat)\n";
        return false;
    }

    if(cfg.interval_seconds < 1) {
        std::cerr << "--interval must be at least 1 second\n";
        return false;
    }

    if(cfg.max_cycles < 0) {
        std::cerr << "--cycles cannot be negative\n";
        return false;
    }

    if(cfg.keep_cap_dac && !cfg.drop_priv) {
        std::cerr << "--keep-cap-dac requires --drop-priv\n";
        return false;
    }

    return true;
}

}
