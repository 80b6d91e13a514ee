#include "connector/kafka/KafkaConfig.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <regex>
#include <string>

namespace connector::kafka {

    namespace {
        void trim(std::string &text) {
            text.erase(0, text.find_first_not_of(" \t\r"));
            auto last = text.find_last_not_of(" \t\r");
            text.erase(last == std::string::npos ? 0 : last + 1);
        }
    }

    std::string KafkaConfig::resolvePlaceholder(const std::string &value) {
        std::regex placeholderRegex(R"(\$\{([^}:]+):([^}]*)\})");
        std::string result = value;

        std::smatch matches;
        while (std::regex_search(result, matches, placeholderRegex)) {
            std::string varName = matches[1].str();
            std::string defaultValue = matches[2].str();

            const char *envValue = std::getenv(varName.c_str());
            std::string replacement = envValue ? envValue : defaultValue;

            if (envValue) {
                Logger::logDebug("[KafkaConfig] Resolved " + varName + " from environment");
            }

            result.replace(static_cast<size_t>(matches.position(0)), static_cast<size_t>(matches.length(0)),
                           replacement);
        }

        return result;
    }

    void KafkaConfig::loadEnvFile(const std::string &envFilePath) {
        std::ifstream envFile(envFilePath);
        if (!envFile.is_open()) {
            Logger::logDebug("[KafkaConfig] No .env file at " + envFilePath + " (using system environment only)");
            return;
        }

        std::string line;
        int loadedVars = 0;

        while (std::getline(envFile, line)) {
            trim(line);
            if (line.empty() || line[0] == '#') continue;

            size_t pos = line.find('=');
            if (pos == std::string::npos) continue;

            std::string key = line.substr(0, pos);
            std::string value = line.substr(pos + 1);
            trim(key);
            trim(value);

            if (value.size() >= 2 &&
                ((value.front() == '"' && value.back() == '"') ||
                 (value.front() == '\'' && value.back() == '\''))) {
                value = value.substr(1, value.size() - 2);
            }

            // The real environment wins over .env
            if (std::getenv(key.c_str()) == nullptr) {
                setenv(key.c_str(), value.c_str(), 0);
                loadedVars++;
            }
        }

        Logger::logInfo("[KafkaConfig] Loaded " + std::to_string(loadedVars) + " variables from " + envFilePath);
    }

    void KafkaConfig::resolveFromEnvironment(const std::string &envFilePath) {
        if (!envFilePath.empty()) {
            loadEnvFile(envFilePath);
        }

        enabled = resolvePlaceholder(enabled);
        brokers = resolvePlaceholder(brokers);
        clientId = resolvePlaceholder(clientId);
        topicPrefix = resolvePlaceholder(topicPrefix);
        compressionType = resolvePlaceholder(compressionType);
        securityProtocol = resolvePlaceholder(securityProtocol);
        sslCaLocation = resolvePlaceholder(sslCaLocation);
        saslMechanism = resolvePlaceholder(saslMechanism);
        saslUsername = resolvePlaceholder(saslUsername);
        saslPassword = resolvePlaceholder(saslPassword);

        if (topicPrefix.empty()) topicPrefix = "printfleet";
    }

    bool KafkaConfig::isEnabled() const {
        std::string value = enabled;
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return value == "true" || value == "1" || value == "yes";
    }

    void KafkaConfig::printConfig() const {
        Logger::logInfo("[KafkaConfig] Republish: " + std::string(isEnabled() ? "enabled" : "disabled"));
        if (!isEnabled()) return;
        Logger::logInfo("  Brokers: " + brokers);
        Logger::logInfo("  Client ID: " + clientId);
        Logger::logInfo("  Topic prefix: " + topicPrefix);
        if (!securityProtocol.empty()) {
            Logger::logInfo("  Security protocol: " + securityProtocol);
        }
        if (!saslMechanism.empty()) {
            Logger::logInfo("  SASL Mechanism: " + saslMechanism);
        }
    }

}
