#include "KafkaReporter.h"
#include "../core/Logging.h"

namespace conn_tracker {

static const int kQueueFullWaitMs = 100;

std::string KafkaReporter::message_key(const std::string& host, uint16_t port) {
    return host + ":" + std::to_string(port);
}

void KafkaReporter::on_delivery(rd_kafka_t*, const rd_kafka_message_t* msg, void* opaque) {
    if (!msg->err) return;
    auto* self = static_cast<KafkaReporter*>(opaque);
    if (self) self->delivery_failures_++;
    std::string key = msg->key ? std::string(static_cast<const char*>(msg->key), msg->key_len) : "";
    Logger::instance().warn("kafka: delivery of " + key + " failed: " + rd_kafka_err2str(msg->err));
}

std::unique_ptr<KafkaReporter> KafkaReporter::create(const std::string& brokers, const std::string& topic,
                                                     std::string& err, int flush_timeout_ms,
                                                     const std::map<std::string, std::string>& overrides) {
    std::unique_ptr<KafkaReporter> rep(new KafkaReporter(topic, flush_timeout_ms));

    char errstr[512];
    rd_kafka_conf_t* conf = rd_kafka_conf_new();
    auto set = [&](const char* k, const std::string& v) {
        if (rd_kafka_conf_set(conf, k, v.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
            err = std::string(k) + ": " + errstr;
            return false;
        }
        return true;
    };
    if (!set("bootstrap.servers", brokers) || !set("client.id", "conn-tracker") ||
        !set("message.timeout.ms", "30000")) {
        rd_kafka_conf_destroy(conf);
        return nullptr;
    }
    for (const auto& kv : overrides) {
        if (!set(kv.first.c_str(), kv.second)) {
            rd_kafka_conf_destroy(conf);
            return nullptr;
        }
    }
    rd_kafka_conf_set_dr_msg_cb(conf, &KafkaReporter::on_delivery);
    rd_kafka_conf_set_opaque(conf, rep.get());

    // rd_kafka_new takes ownership of conf on success only
    rep->rk_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
    if (!rep->rk_) {
        err = std::string("rd_kafka_new: ") + errstr;
        rd_kafka_conf_destroy(conf);
        return nullptr;
    }
    rep->rkt_ = rd_kafka_topic_new(rep->rk_, topic.c_str(), nullptr);
    if (!rep->rkt_) {
        err = std::string("rd_kafka_topic_new: ") + rd_kafka_err2str(rd_kafka_last_error());
        return nullptr;
    }
    return rep;
}

KafkaReporter::KafkaReporter(std::string topic, int flush_timeout_ms)
    : topic_(std::move(topic)), flush_timeout_ms_(flush_timeout_ms) {}

KafkaReporter::~KafkaReporter() {
    if (!rk_) return;
    if (rd_kafka_flush(rk_, flush_timeout_ms_) != RD_KAFKA_RESP_ERR_NO_ERROR) {
        Logger::instance().warn("kafka: " + std::to_string(rd_kafka_outq_len(rk_)) + " message(s) not delivered at shutdown");
    }
    if (rkt_) rd_kafka_topic_destroy(rkt_);
    rd_kafka_destroy(rk_);
}

bool KafkaReporter::deliver(const Snapshot& snapshot) {
    size_t failed = 0;
    for (const auto& obs : snapshot.connections) {
        std::string key = message_key(snapshot.host, obs.port);
        std::string payload = writer_.write_entry(snapshot, obs);
        auto produce = [&]() {
            return rd_kafka_produce(rkt_, RD_KAFKA_PARTITION_UA, RD_KAFKA_MSG_F_COPY,
                                    const_cast<char*>(payload.data()), payload.size(),
                                    key.data(), key.size(), nullptr);
        };
        rd_kafka_resp_err_t err = produce() == 0 ? RD_KAFKA_RESP_ERR_NO_ERROR : rd_kafka_last_error();
        if (err == RD_KAFKA_RESP_ERR__QUEUE_FULL) {
            // let delivery reports drain the local queue, then try once more
            rd_kafka_poll(rk_, kQueueFullWaitMs);
            err = produce() == 0 ? RD_KAFKA_RESP_ERR_NO_ERROR : rd_kafka_last_error();
        }
        // serves delivery reports between produce calls
        rd_kafka_poll(rk_, 0);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            ++failed;
            enqueue_failures_++;
            Logger::instance().warn("kafka: produce " + key + " to " + topic_ + " failed: " +
                                    rd_kafka_err2str(err));
        }
    }
    Logger::instance().debug("kafka: issued " + std::to_string(snapshot.connections.size() - failed) +
                             "/" + std::to_string(snapshot.connections.size()) + " messages to " + topic_);
    return failed == 0;
}

}
