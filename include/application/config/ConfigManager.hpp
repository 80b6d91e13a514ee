#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "application/config/Settings.hpp"
#include "core/utils/Cancellation.hpp"

namespace core::config {

    /**
     * @brief Flat dotted-key configuration loaded from JSON and the environment.
     *
     * Precedence, lowest first: built-in defaults, the JSON file, environment
     * variables. Nested JSON objects become dotted keys ("alerts.smtp.host");
     * arrays of strings are joined with commas.
     */
    class ConfigManager {
    public:
        static ConfigManager &getInstance();

        ConfigManager();

        ~ConfigManager();

        ConfigManager(const ConfigManager &) = delete;

        ConfigManager &operator=(const ConfigManager &) = delete;

        /**
         * @brief Load defaults, then the file if it exists. A malformed file keeps the defaults.
         */
        void loadFromFile(const std::string &configPath = "config.json");

        /**
         * @throws core::types::ConfigException on malformed JSON
         */
        void loadFromString(const std::string &jsonText);

        void loadFromEnv();

        bool reload();

        StorageConfig getStorageConfig() const;

        SupervisorConfig getSupervisorConfig() const;

        DetectorConfig getDetectorConfig() const;

        LinkerConfig getLinkerConfig() const;

        AlertConfig getAlertConfig() const;

        RelayConfig getRelayConfig() const;

        LoggingConfig getLoggingConfig() const;

        // Generic getters with defaults
        template<typename T>
        T get(const std::string &key, const T &defaultValue) const;

        bool has(const std::string &key) const;

        void set(const std::string &key, const std::string &value);

        // Hot reload support
        void enableHotReload(std::chrono::milliseconds checkInterval = std::chrono::seconds(30));

        void disableHotReload();

        // Change notifications
        using ConfigChangeCallback = std::function<void(const std::string &key, const std::string &oldValue,
                                                        const std::string &newValue)>;

        void registerChangeCallback(const std::string &key, ConfigChangeCallback callback);

        struct ValidationResult {
            bool isValid = true;
            std::vector<std::string> errors;
        };

        ValidationResult validate() const;

    private:
        using ConfigMap = std::unordered_map<std::string, std::string>;

        mutable std::mutex configMutex_;
        ConfigMap config_;
        std::unordered_map<std::string, ConfigChangeCallback> changeCallbacks_;

        std::string configPath_;
        std::filesystem::file_time_type lastModified_{};
        std::thread hotReloadThread_;
        std::atomic<bool> hotReloadEnabled_{false};
        utils::CancellationSignal hotReloadStop_;

        void hotReloadLoop(std::chrono::milliseconds checkInterval);

        /**
         * @brief Swap in a new map and report every key whose value changed
         */
        void apply(ConfigMap next);

        void notifyChange(const std::string &key, const std::string &oldValue, const std::string &newValue);

        static ConfigMap defaults();

        static ConfigMap parse(const std::string &jsonText);

        static void overlayEnvironment(ConfigMap &config);

        bool fileChanged() const;
    };

    template<>
    inline int ConfigManager::get<int>(const std::string &key, const int &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stoi(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline long ConfigManager::get<long>(const std::string &key, const long &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stol(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }

    template<>
    inline std::string ConfigManager::get<std::string>(const std::string &key, const std::string &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        return (it != config_.end()) ? it->second : defaultValue;
    }

    template<>
    inline bool ConfigManager::get<bool>(const std::string &key, const bool &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        return it->second == "true" || it->second == "1";
    }

    template<>
    inline double ConfigManager::get<double>(const std::string &key, const double &defaultValue) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        auto it = config_.find(key);
        if (it == config_.end()) return defaultValue;
        try {
            return std::stod(it->second);
        } catch (const std::exception &) {
            return defaultValue;
        }
    }
} // namespace core::config
