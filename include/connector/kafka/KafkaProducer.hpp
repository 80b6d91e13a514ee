#pragma once

#include "connector/kafka/KafkaConfig.hpp"
#include "connector/kafka/MessageSender.hpp"
#include <librdkafka/rdkafka.h>
#include <atomic>
#include <string>

namespace connector::kafka {

    /**
     * @brief librdkafka producer writing to any topic per message
     */
    class KafkaProducer : public MessageSender {
    public:
        explicit KafkaProducer(const KafkaConfig &config);

        ~KafkaProducer() override;

        KafkaProducer(const KafkaProducer &) = delete;

        KafkaProducer &operator=(const KafkaProducer &) = delete;

        bool sendMessage(const std::string &topic, const std::string &message, const std::string &key = "") override;

        bool isReady() const override;

        std::string getSenderName() const override { return "KafkaProducer"; }

        /**
         * @brief Serve delivery reports, call periodically
         */
        void poll();

        size_t deliveryFailures() const { return deliveryFailures_; }

    private:
        KafkaConfig config_;
        rd_kafka_t *producer_;
        bool ready_;
        std::atomic<size_t> deliveryFailures_{0};

        void createProducer();

        void destroyProducer();

        static void setOption(rd_kafka_conf_t *conf, const char *name, const std::string &value);

        static void deliveryReportCallback(rd_kafka_t *rk, const rd_kafka_message_t *rkmessage, void *opaque);

        static void errorCallback(rd_kafka_t *rk, int err, const char *reason, void *opaque);
    };

}
