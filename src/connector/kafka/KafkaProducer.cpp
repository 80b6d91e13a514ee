#include "connector/kafka/KafkaProducer.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace connector::kafka {

    KafkaProducer::KafkaProducer(const KafkaConfig &config)
            : config_(config), producer_(nullptr), ready_(false) {
        try {
            createProducer();
        } catch (const core::types::TransportException &e) {
            // Republishing is optional, the monitor keeps running without it
            Logger::logError("[KafkaProducer] Failed to initialize producer: " + std::string(e.what()));
            ready_ = false;
        }
    }

    KafkaProducer::~KafkaProducer() {
        destroyProducer();
    }

    bool KafkaProducer::sendMessage(const std::string &topic, const std::string &message, const std::string &key) {
        if (!ready_ || !producer_) {
            Logger::logDebug("[KafkaProducer] Producer not ready, dropping message for " + topic);
            return false;
        }

        const char *keyPtr = key.empty() ? nullptr : key.c_str();
        size_t keyLen = key.empty() ? 0 : key.length();

        rd_kafka_resp_err_t result = rd_kafka_producev(
                producer_,
                RD_KAFKA_V_TOPIC(topic.c_str()),
                RD_KAFKA_V_MSGFLAGS(RD_KAFKA_MSG_F_COPY),
                RD_KAFKA_V_VALUE(const_cast<char *>(message.c_str()), message.length()),
                RD_KAFKA_V_KEY(const_cast<char *>(keyPtr), keyLen),
                RD_KAFKA_V_OPAQUE(this),
                RD_KAFKA_V_END
        );

        if (result != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logError("[KafkaProducer] Failed to produce to " + topic + ": " +
                             std::string(rd_kafka_err2str(result)));
            return false;
        }

        rd_kafka_poll(producer_, 0);
        return true;
    }

    bool KafkaProducer::isReady() const {
        return ready_;
    }

    void KafkaProducer::poll() {
        if (producer_) rd_kafka_poll(producer_, 0);
    }

    void KafkaProducer::setOption(rd_kafka_conf_t *conf, const char *name, const std::string &value) {
        char errstr[512];
        errstr[0] = '\0';
        if (rd_kafka_conf_set(conf, name, value.c_str(), errstr, sizeof(errstr)) != RD_KAFKA_CONF_OK) {
            throw core::types::TransportException("Kafka option " + std::string(name) + ": " + errstr);
        }
    }

    void KafkaProducer::createProducer() {
        char errstr[512];
        errstr[0] = '\0';

        rd_kafka_conf_t *conf = rd_kafka_conf_new();
        if (!conf) {
            throw core::types::TransportException("Failed to create Kafka producer configuration object");
        }

        try {
            setOption(conf, "bootstrap.servers", config_.brokers);
            setOption(conf, "client.id", config_.clientId);
            setOption(conf, "delivery.timeout.ms", std::to_string(config_.deliveryTimeoutMs));
            setOption(conf, "request.timeout.ms", std::to_string(config_.requestTimeoutMs));
            setOption(conf, "compression.type", config_.compressionType);
            setOption(conf, "batch.size", std::to_string(config_.batchSize));
            setOption(conf, "linger.ms", std::to_string(config_.lingerMs));
            setOption(conf, "socket.keepalive.enable", "true");

            if (!config_.securityProtocol.empty()) {
                setOption(conf, "security.protocol", config_.securityProtocol);
            }
            if (!config_.sslCaLocation.empty()) {
                setOption(conf, "ssl.ca.location", config_.sslCaLocation);
            }
            if (!config_.saslMechanism.empty()) {
                setOption(conf, "sasl.mechanisms", config_.saslMechanism);
                setOption(conf, "sasl.username", config_.saslUsername);
                setOption(conf, "sasl.password", config_.saslPassword);
            }
        } catch (const core::types::TransportException &) {
            rd_kafka_conf_destroy(conf);
            throw;
        }

        rd_kafka_conf_set_dr_msg_cb(conf, deliveryReportCallback);
        rd_kafka_conf_set_error_cb(conf, errorCallback);

        // rd_kafka_new takes ownership of conf on success only
        producer_ = rd_kafka_new(RD_KAFKA_PRODUCER, conf, errstr, sizeof(errstr));
        if (!producer_) {
            rd_kafka_conf_destroy(conf);
            throw core::types::TransportException("Failed to create Kafka producer: " + std::string(errstr));
        }

        ready_ = true;
        Logger::logInfo("[KafkaProducer] Producer ready on " + config_.brokers);
    }

    void KafkaProducer::destroyProducer() {
        if (!producer_) return;

        ready_ = false;
        rd_kafka_resp_err_t err = rd_kafka_flush(producer_, 5000);
        if (err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            Logger::logWarning("[KafkaProducer] Flush incomplete: " + std::string(rd_kafka_err2str(err)) + ", " +
                               std::to_string(rd_kafka_outq_len(producer_)) + " message(s) lost");
        }
        rd_kafka_destroy(producer_);
        producer_ = nullptr;
        Logger::logInfo("[KafkaProducer] Producer destroyed");
    }

    void KafkaProducer::deliveryReportCallback(rd_kafka_t *rk, const rd_kafka_message_t *rkmessage, void *opaque) {
        (void) rk;
        (void) opaque;

        if (rkmessage->err != RD_KAFKA_RESP_ERR_NO_ERROR) {
            if (auto *self = static_cast<KafkaProducer *>(rkmessage->_private)) {
                self->deliveryFailures_++;
            }
            Logger::logError("[KafkaProducer] Delivery failed: " + std::string(rd_kafka_err2str(rkmessage->err)));
        }
    }

    void KafkaProducer::errorCallback(rd_kafka_t *rk, int err, const char *reason, void *opaque) {
        (void) rk;
        (void) opaque;
        Logger::logError(
                "[KafkaProducer] Error: " + std::string(rd_kafka_err2str(static_cast<rd_kafka_resp_err_t>(err))) +
                " - " + reason);
    }

}
