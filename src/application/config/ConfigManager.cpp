#include "application/config/ConfigManager.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <tuple>

namespace core::config {

    namespace {
        // Environment variable -> config key
        const std::pair<const char *, const char *> ENV_OVERLAY[] = {
                {"PRINTFLEET_DB_PATH", "storage.path"},
                {"PRINTFLEET_LOG_LEVEL", "logging.level"},
                {"PRINTFLEET_LOG_DIR", "logging.directory"},
                {"PRINTFLEET_PUSH_GATEWAY", "alerts.push.gateway_url"},
                {"KAFKA_REPUBLISH_ENABLED", "kafka.enabled"},
                {"KAFKA_BROKERS", "kafka.brokers"},
                {"KAFKA_TOPIC_PREFIX", "kafka.topic_prefix"}
        };

        std::string scalarToString(const nlohmann::json &value) {
            if (value.is_string()) return value.get<std::string>();
            return value.dump();
        }
    }

    ConfigManager &ConfigManager::getInstance() {
        static ConfigManager instance;
        return instance;
    }

    ConfigManager::ConfigManager() : config_(defaults()) {
    }

    ConfigManager::~ConfigManager() {
        disableHotReload();
    }

    ConfigManager::ConfigMap ConfigManager::defaults() {
        return {
                {"storage.path", "printfleet.db"},

                {"supervisor.health_interval_s", "30"},
                {"supervisor.discovery_interval_s", "60"},
                {"supervisor.reconnect_delay_ms", "1000"},
                {"supervisor.push_stale_s", "60"},
                {"supervisor.pull_stale_s", "120"},
                {"supervisor.poll_interval_s", "10"},
                {"supervisor.connect_timeout_ms", "5000"},
                {"supervisor.telemetry_interval_s", "10"},

                {"detector.progress_min_delta", "1.0"},
                {"detector.progress_min_interval_s", "5"},
                {"detector.print_stopping_codes", "klippy:shutdown,klippy:error,sdcp:*"},

                {"linker.stale_schedule_hours", "2"},
                {"linker.time_window_fallback", "false"},
                {"linker.candidate_limit", "10"},

                {"alerts.dedup_window_s", "300"},
                {"alerts.delivery_timeout_ms", "10000"},
                {"alerts.quiet_hours.enabled", "false"},
                {"alerts.quiet_hours.start", "22:00"},
                {"alerts.quiet_hours.end", "07:00"},
                {"alerts.quiet_hours.digest_enabled", "false"},
                {"alerts.smtp.enabled", "false"},
                {"alerts.smtp.host", ""},
                {"alerts.smtp.port", "587"},
                {"alerts.smtp.username", ""},
                {"alerts.smtp.password", ""},
                {"alerts.smtp.from", ""},
                {"alerts.smtp.use_tls", "true"},
                {"alerts.push.gateway_url", ""},

                {"relay.ttl_s", "60"},
                {"relay.cleanup_interval_s", "30"},

                {"logging.level", "INFO"},
                {"logging.directory", "logs"}
        };
    }

    ConfigManager::ConfigMap ConfigManager::parse(const std::string &jsonText) {
        nlohmann::json json;
        try {
            json = nlohmann::json::parse(jsonText);
        } catch (const nlohmann::json::parse_error &e) {
            throw types::ConfigException(e.what());
        }
        if (!json.is_object()) {
            throw types::ConfigException("top level must be an object");
        }

        ConfigMap flat;
        std::function<void(const nlohmann::json &, const std::string &)> flatten;
        flatten = [&](const nlohmann::json &obj, const std::string &prefix) {
            for (auto it = obj.begin(); it != obj.end(); ++it) {
                std::string key = prefix.empty() ? it.key() : prefix + "." + it.key();

                if (it.value().is_object()) {
                    flatten(it.value(), key);
                } else if (it.value().is_array()) {
                    std::string joined;
                    for (const auto &item: it.value()) {
                        if (!joined.empty()) joined += ",";
                        joined += scalarToString(item);
                    }
                    flat[key] = joined;
                } else if (!it.value().is_null()) {
                    flat[key] = scalarToString(it.value());
                }
            }
        };
        flatten(json, "");
        return flat;
    }

    void ConfigManager::overlayEnvironment(ConfigMap &config) {
        for (const auto &[envVar, key]: ENV_OVERLAY) {
            if (const char *value = std::getenv(envVar)) {
                config[key] = value;
            }
        }
    }

    void ConfigManager::loadFromString(const std::string &jsonText) {
        ConfigMap next = defaults();
        for (auto &[key, value]: parse(jsonText)) {
            next[key] = std::move(value);
        }
        apply(std::move(next));
    }

    void ConfigManager::loadFromFile(const std::string &configPath) {
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            configPath_ = configPath;
        }

        std::error_code ec;
        if (!std::filesystem::exists(configPath, ec)) {
            Logger::logWarning("[ConfigManager] Config file not found: " + configPath + ", using defaults");
            apply(defaults());
            return;
        }

        std::ifstream file(configPath);
        std::stringstream buffer;
        buffer << file.rdbuf();

        try {
            loadFromString(buffer.str());
            std::lock_guard<std::mutex> lock(configMutex_);
            lastModified_ = std::filesystem::last_write_time(configPath, ec);
            Logger::logInfo("[ConfigManager] Loaded " + std::to_string(config_.size()) + " settings from " +
                            configPath);
        } catch (const types::ConfigException &e) {
            Logger::logError("[ConfigManager] Failed to load " + configPath + ": " + e.what() + ", using defaults");
            apply(defaults());
        }
    }

    void ConfigManager::loadFromEnv() {
        ConfigMap next;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            next = config_;
        }
        size_t before = next.size();
        overlayEnvironment(next);
        apply(std::move(next));
        Logger::logDebug("[ConfigManager] Environment overlay applied (" + std::to_string(before) + " keys)");
    }

    bool ConfigManager::reload() {
        std::string path;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            path = configPath_;
        }
        if (path.empty()) return false;

        std::ifstream file(path);
        if (!file.is_open()) {
            Logger::logError("[ConfigManager] Reload failed: cannot open " + path);
            return false;
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        try {
            ConfigMap next = defaults();
            for (auto &[key, value]: parse(buffer.str())) {
                next[key] = std::move(value);
            }
            overlayEnvironment(next);
            apply(std::move(next));

            std::error_code ec;
            std::lock_guard<std::mutex> lock(configMutex_);
            lastModified_ = std::filesystem::last_write_time(path, ec);
            return true;
        } catch (const types::ConfigException &e) {
            Logger::logError("[ConfigManager] Reload failed, keeping current settings: " + std::string(e.what()));
            return false;
        }
    }

    void ConfigManager::apply(ConfigMap next) {
        std::vector<std::tuple<std::string, std::string, std::string>> changes;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            for (const auto &[key, newValue]: next) {
                auto it = config_.find(key);
                std::string oldValue = it != config_.end() ? it->second : "";
                if (it == config_.end() || it->second != newValue) {
                    changes.emplace_back(key, oldValue, newValue);
                }
            }
            config_ = std::move(next);
        }

        for (const auto &[key, oldValue, newValue]: changes) {
            notifyChange(key, oldValue, newValue);
        }
    }

    bool ConfigManager::has(const std::string &key) const {
        std::lock_guard<std::mutex> lock(configMutex_);
        return config_.count(key) > 0;
    }

    void ConfigManager::set(const std::string &key, const std::string &value) {
        std::string oldValue;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            auto it = config_.find(key);
            if (it != config_.end()) {
                if (it->second == value) return;
                oldValue = it->second;
            }
            config_[key] = value;
        }
        notifyChange(key, oldValue, value);
    }

    StorageConfig ConfigManager::getStorageConfig() const {
        StorageConfig config;
        config.path = get<std::string>("storage.path", config.path);
        return config;
    }

    SupervisorConfig ConfigManager::getSupervisorConfig() const {
        SupervisorConfig config;
        config.healthInterval = std::chrono::seconds(get<int>("supervisor.health_interval_s", 30));
        config.discoveryInterval = std::chrono::seconds(get<int>("supervisor.discovery_interval_s", 60));
        config.reconnectDelay = std::chrono::milliseconds(get<int>("supervisor.reconnect_delay_ms", 1000));
        config.pushStaleness = std::chrono::seconds(get<int>("supervisor.push_stale_s", 60));
        config.pullStaleness = std::chrono::seconds(get<int>("supervisor.pull_stale_s", 120));
        config.pollInterval = std::chrono::seconds(get<int>("supervisor.poll_interval_s", 10));
        config.connectTimeout = std::chrono::milliseconds(get<int>("supervisor.connect_timeout_ms", 5000));
        config.telemetryInterval = std::chrono::seconds(get<int>("supervisor.telemetry_interval_s", 10));
        return config;
    }

    DetectorConfig ConfigManager::getDetectorConfig() const {
        DetectorConfig config;
        config.progressMinDelta = get<double>("detector.progress_min_delta", 1.0);
        config.progressMinInterval = std::chrono::seconds(get<int>("detector.progress_min_interval_s", 5));
        config.printStoppingCodes = get<std::string>("detector.print_stopping_codes", config.printStoppingCodes);
        return config;
    }

    LinkerConfig ConfigManager::getLinkerConfig() const {
        LinkerConfig config;
        config.staleScheduleAge = std::chrono::hours(get<int>("linker.stale_schedule_hours", 2));
        config.timeWindowFallback = get<bool>("linker.time_window_fallback", false);
        config.candidateLimit = get<int>("linker.candidate_limit", 10);
        return config;
    }

    AlertConfig ConfigManager::getAlertConfig() const {
        AlertConfig config;
        config.dedupWindow = std::chrono::seconds(get<int>("alerts.dedup_window_s", 300));
        config.deliveryTimeoutMs = get<long>("alerts.delivery_timeout_ms", 10000);

        config.quietHours.enabled = get<bool>("alerts.quiet_hours.enabled", false);
        config.quietHours.start = get<std::string>("alerts.quiet_hours.start", "22:00");
        config.quietHours.end = get<std::string>("alerts.quiet_hours.end", "07:00");
        config.quietHours.digestEnabled = get<bool>("alerts.quiet_hours.digest_enabled", false);

        config.smtp.enabled = get<bool>("alerts.smtp.enabled", false);
        config.smtp.host = get<std::string>("alerts.smtp.host", "");
        config.smtp.port = get<int>("alerts.smtp.port", 587);
        config.smtp.username = get<std::string>("alerts.smtp.username", "");
        config.smtp.password = get<std::string>("alerts.smtp.password", "");
        config.smtp.fromAddress = get<std::string>("alerts.smtp.from", "");
        config.smtp.useTls = get<bool>("alerts.smtp.use_tls", true);

        config.pushGatewayUrl = get<std::string>("alerts.push.gateway_url", "");
        return config;
    }

    RelayConfig ConfigManager::getRelayConfig() const {
        RelayConfig config;
        config.ttl = std::chrono::seconds(get<int>("relay.ttl_s", 60));
        config.cleanupInterval = std::chrono::seconds(get<int>("relay.cleanup_interval_s", 30));
        return config;
    }

    LoggingConfig ConfigManager::getLoggingConfig() const {
        LoggingConfig config;
        config.level = get<std::string>("logging.level", "INFO");
        config.directory = get<std::string>("logging.directory", "logs");
        return config;
    }

    void ConfigManager::enableHotReload(std::chrono::milliseconds checkInterval) {
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            if (configPath_.empty()) return;
        }
        if (hotReloadEnabled_.exchange(true)) return;

        hotReloadStop_.reset();
        hotReloadThread_ = std::thread([this, checkInterval]() {
            try {
                hotReloadLoop(checkInterval);
            } catch (const std::exception &e) {
                Logger::logError("[ConfigManager] Hot reload thread crashed: " + std::string(e.what()));
            }
        });

        Logger::logInfo("[ConfigManager] Hot reload enabled");
    }

    void ConfigManager::disableHotReload() {
        if (!hotReloadEnabled_.exchange(false)) return;

        hotReloadStop_.requestStop();
        if (hotReloadThread_.joinable()) {
            hotReloadThread_.join();
        }

        Logger::logInfo("[ConfigManager] Hot reload disabled");
    }

    void ConfigManager::registerChangeCallback(const std::string &key, ConfigChangeCallback callback) {
        std::lock_guard<std::mutex> lock(configMutex_);
        changeCallbacks_[key] = std::move(callback);
    }

    ConfigManager::ValidationResult ConfigManager::validate() const {
        ValidationResult result;

        auto requirePositive = [&](const char *key) {
            if (get<int>(key, 0) <= 0) {
                result.errors.push_back(std::string(key) + " must be > 0");
            }
        };

        if (get<std::string>("storage.path", "").empty()) {
            result.errors.emplace_back("storage.path must not be empty");
        }

        requirePositive("supervisor.health_interval_s");
        requirePositive("supervisor.discovery_interval_s");
        requirePositive("supervisor.push_stale_s");
        requirePositive("supervisor.pull_stale_s");
        requirePositive("supervisor.poll_interval_s");
        requirePositive("supervisor.connect_timeout_ms");
        requirePositive("alerts.dedup_window_s");
        requirePositive("relay.ttl_s");
        requirePositive("relay.cleanup_interval_s");

        if (get<int>("supervisor.reconnect_delay_ms", -1) < 0) {
            result.errors.emplace_back("supervisor.reconnect_delay_ms must be >= 0");
        }
        if (get<double>("detector.progress_min_delta", -1.0) < 0.0) {
            result.errors.emplace_back("detector.progress_min_delta must be >= 0");
        }
        if (get<int>("linker.candidate_limit", 0) < 1) {
            result.errors.emplace_back("linker.candidate_limit must be >= 1");
        }

        for (const char *key: {"alerts.quiet_hours.start", "alerts.quiet_hours.end"}) {
            if (!::utils::parseTimeOfDay(get<std::string>(key, ""))) {
                result.errors.push_back(std::string(key) + " must be HH:MM");
            }
        }

        if (get<bool>("alerts.smtp.enabled", false) && get<std::string>("alerts.smtp.host", "").empty()) {
            result.errors.emplace_back("alerts.smtp.host is required when alerts.smtp.enabled is true");
        }

        std::string level = get<std::string>("logging.level", "INFO");
        std::transform(level.begin(), level.end(), level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        if (level != "DEBUG" && level != "INFO" && level != "WARNING" && level != "WARN" && level != "ERROR") {
            result.errors.push_back("logging.level '" + level + "' is not DEBUG, INFO, WARNING or ERROR");
        }

        result.isValid = result.errors.empty();
        return result;
    }

    void ConfigManager::hotReloadLoop(std::chrono::milliseconds checkInterval) {
        while (!hotReloadStop_.waitFor(checkInterval)) {
            if (fileChanged()) {
                Logger::logInfo("[ConfigManager] Config file changed, reloading...");
                reload();
            }
        }
    }

    bool ConfigManager::fileChanged() const {
        std::lock_guard<std::mutex> lock(configMutex_);
        std::error_code ec;
        if (configPath_.empty() || !std::filesystem::exists(configPath_, ec)) {
            return false;
        }

        auto currentModified = std::filesystem::last_write_time(configPath_, ec);
        return !ec && currentModified > lastModified_;
    }

    void ConfigManager::notifyChange(const std::string &key, const std::string &oldValue, const std::string &newValue) {
        ConfigChangeCallback callback;
        {
            std::lock_guard<std::mutex> lock(configMutex_);
            auto it = changeCallbacks_.find(key);
            if (it == changeCallbacks_.end()) return;
            callback = it->second;
        }
        try {
            callback(key, oldValue, newValue);
        } catch (const std::exception &e) {
            Logger::logError("[ConfigManager] Change callback failed for " + key + ": " + e.what());
        }
    }
} // namespace core::config
