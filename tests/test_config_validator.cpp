#include "core/ConfigValidator.h"
#include "core/Config.h"
#include <gtest/gtest.h>

namespace conn_tracker {

class ConfigValidatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        cfg.ports = {4317};
        cfg.output_file = "/tmp/conn-tracker-test.json";
    }
    Config cfg;
};

TEST_F(ConfigValidatorTest, MinimalFileConfigIsValid) {
    EXPECT_TRUE(ConfigValidator::validate(cfg));
}

TEST_F(ConfigValidatorTest, CompactOverridesPretty) {
    cfg.pretty = true;
    cfg.compact = true;
    EXPECT_TRUE(ConfigValidator::validate(cfg));
    EXPECT_FALSE(cfg.pretty);
}

TEST_F(ConfigValidatorTest, EmptyPortSetRejected) {
    cfg.ports.clear();
    EXPECT_FALSE(ConfigValidator::validate(cfg));
}

TEST_F(ConfigValidatorTest, BrokersWithoutTopicRejected) {
    cfg.kafka_brokers = "localhost:9092";
    EXPECT_FALSE(ConfigValidator::validate(cfg));
    cfg.kafka_brokers.clear();
    cfg.kafka_topic = "conns";
    EXPECT_FALSE(ConfigValidator::validate(cfg));
}

TEST_F(ConfigValidatorTest, NoOutputRejected) {
    cfg.output_file.clear();
    EXPECT_FALSE(ConfigValidator::validate(cfg));
}

TEST_F(ConfigValidatorTest, KafkaOnlyDependsOnBuild) {
    cfg.output_file.clear();
    cfg.kafka_brokers = "localhost:9092";
    cfg.kafka_topic = "conns";
    EXPECT_EQ(ConfigValidator::validate(cfg), ConfigValidator::kafka_supported());
}

TEST_F(ConfigValidatorTest, UnknownFormatRejected) {
    cfg.output_format = "yaml";
    EXPECT_FALSE(ConfigValidator::validate(cfg));
    cfg.output_format = "flat";
    EXPECT_TRUE(ConfigValidator::validate(cfg));
}

TEST_F(ConfigValidatorTest, IntervalAndCyclesBounds) {
    cfg.interval_seconds = 0;
    EXPECT_FALSE(ConfigValidator::validate(cfg));
    cfg.interval_seconds = 1;
    cfg.max_cycles = -1;
    EXPECT_FALSE(ConfigValidator::validate(cfg));
    cfg.max_cycles = 0;
    EXPECT_TRUE(ConfigValidator::validate(cfg));
}

TEST_F(ConfigValidatorTest, KeepCapDacRequiresDropPriv) {
    cfg.keep_cap_dac = true;
    EXPECT_FALSE(ConfigValidator::validate(cfg));
    cfg.drop_priv = true;
    EXPECT_TRUE(ConfigValidator::validate(cfg));
}

} // namespace conn_tracker
