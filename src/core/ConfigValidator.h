#pragma once
#include "Config.h"

namespace conn_tracker {

class ConfigValidator {
public:
    // Normalizes cfg and checks startup requirements. Problems are printed
    // to stderr; false means the process must exit with a usage error.
    static bool validate(Config& cfg);

    // True when this build can publish to Kafka.
    static bool kafka_supported();
};

}
