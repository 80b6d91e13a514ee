#pragma once

#include <string>

namespace connector::kafka {
    struct KafkaConfig {
        // Connection - with Spring Boot style placeholders
        std::string enabled = "${KAFKA_REPUBLISH_ENABLED:false}";
        std::string brokers = "${KAFKA_BROKERS:localhost:9092}";
        std::string clientId = "${KAFKA_CLIENT_ID:printfleet_monitor}";
        std::string topicPrefix = "${KAFKA_TOPIC_PREFIX:printfleet}";

        // Producer settings
        int deliveryTimeoutMs = 30000;
        int requestTimeoutMs = 5000;
        std::string compressionType = "${KAFKA_COMPRESSION_TYPE:snappy}";
        int batchSize = 16384;
        int lingerMs = 5;

        // Security (optional)
        std::string securityProtocol = "${KAFKA_SECURITY_PROTOCOL:}";
        std::string sslCaLocation = "${KAFKA_SSL_CA_LOCATION:}";
        std::string saslMechanism = "${KAFKA_SASL_MECHANISM:}";
        std::string saslUsername = "${KAFKA_SASL_USERNAME:}";
        std::string saslPassword = "${KAFKA_SASL_PASSWORD:}";

        /**
         * @brief Resolve all placeholders with environment variables
         * @param envFilePath optional .env file loaded first, never overriding the real environment
         */
        void resolveFromEnvironment(const std::string &envFilePath = ".env");

        /**
         * @brief True once resolved to "true", "1" or "yes"
         */
        bool isEnabled() const;

        void printConfig() const;

        /**
         * @brief Replace every ${VAR:default} in value
         */
        static std::string resolvePlaceholder(const std::string &value);

    private:
        static void loadEnvFile(const std::string &envFilePath);
    };
}
