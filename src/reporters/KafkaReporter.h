#pragma once
#include "Reporter.h"
#include "../core/JSONWriter.h"
#include <librdkafka/rdkafka.h>
#include <atomic>
#include <map>
#include <string>
#include <memory>

namespace conn_tracker {

// Publishes one message per port entry, keyed "{host}:{port}", payload the
// flat entry JSON. Produce calls only enqueue; each entry succeeds or fails
// on its own.
class KafkaReporter : public Reporter {
public:
    // nullptr and err filled when the producer cannot be configured.
    // overrides are extra librdkafka properties applied last.
    static std::unique_ptr<KafkaReporter> create(const std::string& brokers, const std::string& topic,
                                                 std::string& err, int flush_timeout_ms = 5000,
                                                 const std::map<std::string, std::string>& overrides = {});
    ~KafkaReporter() override;

    KafkaReporter(const KafkaReporter&) = delete;
    KafkaReporter& operator=(const KafkaReporter&) = delete;

    std::string name() const override { return "kafka"; }
    bool deliver(const Snapshot& snapshot) override;

    static std::string message_key(const std::string& host, uint16_t port);

    size_t enqueue_failures() const { return enqueue_failures_.load(); }
    size_t delivery_failures() const { return delivery_failures_.load(); }
    // Messages and requests still waiting in the producer queue.
    int queue_length() const { return rd_kafka_outq_len(rk_); }

private:
    KafkaReporter(std::string topic, int flush_timeout_ms);
    static void on_delivery(rd_kafka_t* rk, const rd_kafka_message_t* msg, void* opaque);

    rd_kafka_t* rk_ = nullptr;
    rd_kafka_topic_t* rkt_ = nullptr;
    std::string topic_;
    int flush_timeout_ms_;
    JSONWriter writer_;
    std::atomic<size_t> enqueue_failures_{0};
    std::atomic<size_t> delivery_failures_{0};
};

}
