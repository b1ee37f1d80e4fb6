#include "core/Agent.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>
#include <vector>

namespace conn_tracker {

class AgentTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("CONN_TRACKER_HOSTNAME");
        char tmpl[] = "/tmp/conn_tracker_agent_XXXXXX";
        char* d = mkdtemp(tmpl);
        ASSERT_NE(d, nullptr);
        dir = d;
        tcp4 = dir + "/tcp";
        tcp6 = dir + "/tcp6";
        output = dir + "/out.json";
        // 127.0.0.1:22 <- 10.0.0.1
        std::ofstream(tcp4) << "  sl  local_address rem_address   st\n"
                            << "   0: 0100007F:0016 0100000A:D000 01 00000000:00000000 00:00000000 00000000 0 0 1\n";
    }

    void TearDown() override {
        std::remove(tcp4.c_str());
        std::remove(output.c_str());
        rmdir(dir.c_str());
    }

    int run(std::vector<std::string> args, bool stop = false) {
        args.insert(args.begin(), "conn-tracker");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
        return run_agent(static_cast<int>(argv.size()), argv.data(), [stop]{ return stop; });
    }

    std::vector<std::string> once_args() const {
        return {"--ports", "22,4317", "--output", output, "--once", "--host", "node-7",
                "--tcp4-table", tcp4, "--tcp6-table", tcp6};
    }

    std::string dir, tcp4, tcp6, output;
};

TEST_F(AgentTest, MissingOutputIsUsageError) {
    EXPECT_EQ(run({"--ports", "22"}), 2);
}

TEST_F(AgentTest, NoValidPortIsUsageError) {
    EXPECT_EQ(run({"--ports", "abc,70000", "--output", output}), 2);
}

TEST_F(AgentTest, UnknownFlagIsUsageError) {
    EXPECT_EQ(run({"--bogus"}), 2);
}

TEST_F(AgentTest, HelpExitsZero) {
    EXPECT_EQ(run({"--help"}), 0);
}

#ifndef CONN_TRACKER_HAVE_RDKAFKA
TEST_F(AgentTest, KafkaWithoutSupportIsUsageError) {
    EXPECT_EQ(run({"--ports", "22", "--brokers", "127.0.0.1:9092", "--topic", "conns"}), 2);
}
#endif

TEST_F(AgentTest, OnceWritesSnapshot) {
    ASSERT_EQ(run(once_args()), 0);

    std::ifstream in(output);
    std::stringstream ss;
    ss << in.rdbuf();
    auto doc = nlohmann::json::parse(ss.str());
    EXPECT_EQ(doc["host"], "node-7");
    ASSERT_EQ(doc["connections"].size(), 1u);
    EXPECT_EQ(doc["connections"][0]["port"], 22);
    EXPECT_EQ(doc["connections"][0]["unique_ips"], nlohmann::json::array({"10.0.0.1"}));
}

TEST_F(AgentTest, StopBeforeFirstCycleWritesNothing) {
    EXPECT_EQ(run(once_args(), true), 0);
    EXPECT_NE(access(output.c_str(), F_OK), 0);
}

// Reporters may start their own threads, so capabilities must already be
// dropped by the time the first reporter is created.
TEST_F(AgentTest, HardeningPrecedesReporterSetup) {
    auto args = once_args();
    args.push_back("--drop-priv");
    ::testing::internal::CaptureStderr();
    int rc = run(args);
    std::string log = ::testing::internal::GetCapturedStderr();
    ASSERT_EQ(rc, 0);

    size_t hardening = log.find("Dropping capabilities");
    if (hardening == std::string::npos) hardening = log.find("Capability dropping not available");
    size_t reporter = log.find("Writing snapshots to");
    ASSERT_NE(hardening, std::string::npos) << log;
    ASSERT_NE(reporter, std::string::npos) << log;
    EXPECT_LT(hardening, reporter);
}

} // namespace conn_tracker
