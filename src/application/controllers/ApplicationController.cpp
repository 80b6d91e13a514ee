#include "application/controllers/ApplicationController.hpp"
#include "application/config/ConfigManager.hpp"
#include "connector/adapters/AdapterFactory.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

using core::config::ConfigManager;

ApplicationController::ApplicationController(std::string configPath)
        : configPath_(std::move(configPath)),
          bus_(core::events::EventBus::getInstance()) {
}

ApplicationController::~ApplicationController() {
    shutdown();
}

bool ApplicationController::initialize() {
    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] STARTING PRINTFLEET MONITOR");
    Logger::logInfo("===============================================");

    Logger::logInfo("[ApplicationController] [1/6] Loading configuration...");
    if (!loadConfiguration()) {
        return false;
    }

    Logger::logInfo("[ApplicationController] [2/6] Opening database...");
    if (!initializeStorage()) {
        return false;
    }

    Logger::logInfo("[ApplicationController] [3/6] Starting job lifecycle and alerting...");
    Logger::logInfo("[ApplicationController] [4/6] Attaching event consumers...");
    try {
        initializePipeline();
    } catch (const core::types::FleetException &e) {
        Logger::logError("[ApplicationController] Pipeline initialization failed: " + std::string(e.what()));
        return false;
    }

    Logger::logInfo("[ApplicationController] [5/6] Configuring Kafka republish...");
    initializeKafka();

    Logger::logInfo("[ApplicationController] [6/6] Connecting printers...");
    auto &config = ConfigManager::getInstance();
    auto supervisorConfig = config.getSupervisorConfig();

    connector::adapters::AdapterOptions options;
    options.connectTimeout = supervisorConfig.connectTimeout;
    options.pushStaleness = supervisorConfig.pushStaleness;
    options.pullStaleness = supervisorConfig.pullStaleness;
    options.pollInterval = supervisorConfig.pollInterval;
    connector::adapters::AdapterFactory factory(options);

    supervisor_ = std::make_unique<core::supervisor::ConnectionSupervisor>(
            *database_, *lifecycle_, bus_, factory.asFunction(), supervisorConfig, config.getDetectorConfig());
    supervisor_->start();

    monitor_ = std::make_unique<SystemMonitor>(*supervisor_, *lifecycle_, *deliveries_, bus_, dispatcher_.get(),
                                               kafkaProducer_);
    monitor_->start();

    printInitializationSummary();
    isRunning_ = true;

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SYSTEM READY - MONITORING FLEET");
    Logger::logInfo("===============================================");
    return true;
}

bool ApplicationController::loadConfiguration() {
    auto &config = ConfigManager::getInstance();
    config.loadFromFile(configPath_);
    config.loadFromEnv();

    auto logging = config.getLoggingConfig();
    Logger::init(logging.directory, "printfleet");
    Logger::setMinLevel(Logger::parseLevel(logging.level));

    auto validation = config.validate();
    if (!validation.isValid) {
        for (const auto &error: validation.errors) {
            Logger::logError("[ApplicationController] Config: " + error);
        }
        return false;
    }

    config.registerChangeCallback("logging.level", [](const std::string &, const std::string &,
                                                      const std::string &newValue) {
        Logger::setMinLevel(Logger::parseLevel(newValue));
        Logger::logInfo("[ApplicationController] Log level changed to " + newValue);
    });
    config.enableHotReload();
    return true;
}

bool ApplicationController::initializeStorage() {
    auto storageConfig = ConfigManager::getInstance().getStorageConfig();
    try {
        database_ = std::make_unique<storage::Database>(storageConfig.path);
        database_->migrate();
    } catch (const core::types::StorageException &e) {
        Logger::logError("[ApplicationController] " + std::string(e.what()));
        database_.reset();
        return false;
    }
    Logger::logInfo("[ApplicationController] Database ready at " + storageConfig.path);
    return true;
}

void ApplicationController::initializePipeline() {
    auto &config = ConfigManager::getInstance();

    deliveries_ = std::make_unique<core::alerts::DeliveryQueue>();
    deliveries_->start();

    lifecycle_ = std::make_unique<core::jobs::JobLifecycle>(*database_, bus_,
                                                           core::jobs::JobLinker(config.getLinkerConfig()));
    dispatcher_ = std::make_unique<core::alerts::AlertDispatcher>(*database_, bus_, *deliveries_,
                                                                  config.getAlertConfig());

    alertRules_ = std::make_unique<core::consumers::AlertRules>(*dispatcher_);
    alertRules_->attach(bus_);
    archiveWriter_ = std::make_unique<core::consumers::ArchiveWriter>(*database_);
    archiveWriter_->attach(bus_);
    careCounters_ = std::make_unique<core::consumers::CareCounterUpdater>(*database_);
    careCounters_->attach(bus_);
    eventRelay_ = std::make_unique<core::consumers::EventRelay>(*database_, config.getRelayConfig());
    eventRelay_->attach(bus_);
}

void ApplicationController::initializeKafka() {
    auto &config = ConfigManager::getInstance();

    connector::kafka::KafkaConfig kafkaConfig;
    kafkaConfig.resolveFromEnvironment();
    if (config.has("kafka.enabled")) kafkaConfig.enabled = config.get<std::string>("kafka.enabled", "false");
    if (config.has("kafka.brokers")) kafkaConfig.brokers = config.get<std::string>("kafka.brokers", "");
    if (config.has("kafka.topic_prefix")) {
        kafkaConfig.topicPrefix = config.get<std::string>("kafka.topic_prefix", "printfleet");
    }
    kafkaConfig.printConfig();

    if (!kafkaConfig.isEnabled()) {
        return;
    }

    kafkaProducer_ = std::make_shared<connector::kafka::KafkaProducer>(kafkaConfig);
    if (!kafkaProducer_->isReady()) {
        Logger::logWarning("[ApplicationController] Kafka producer not ready - continuing without republish");
        kafkaProducer_.reset();
        return;
    }

    republisher_ = std::make_unique<connector::kafka::EventRepublisher>(kafkaProducer_, kafkaConfig.topicPrefix);
    republisher_->attach(bus_);
}

void ApplicationController::shutdown() {
    if (!isRunning_.exchange(false) && !database_) {
        return;
    }

    Logger::logInfo("===============================================");
    Logger::logInfo("[ApplicationController] SHUTTING DOWN");
    Logger::logInfo("===============================================");

    if (monitor_) {
        monitor_->stop();
        monitor_.reset();
    }
    if (supervisor_) {
        supervisor_->stop();
        supervisor_.reset();
        Logger::logInfo("[ApplicationController] Printer connections closed");
    }

    if (republisher_) {
        republisher_->detach(bus_);
        republisher_.reset();
    }
    kafkaProducer_.reset();

    if (eventRelay_) eventRelay_->detach(bus_);
    if (careCounters_) careCounters_->detach(bus_);
    if (archiveWriter_) archiveWriter_->detach(bus_);
    if (alertRules_) alertRules_->detach(bus_);

    if (deliveries_) {
        deliveries_->stop();
    }

    eventRelay_.reset();
    careCounters_.reset();
    archiveWriter_.reset();
    alertRules_.reset();
    dispatcher_.reset();
    lifecycle_.reset();
    deliveries_.reset();
    database_.reset();

    ConfigManager::getInstance().disableHotReload();
    Logger::logInfo("[ApplicationController] Shutdown complete");
}

void ApplicationController::printInitializationSummary() const {
    auto stats = supervisor_->getStatistics();
    Logger::logInfo("[ApplicationController] ===== Initialization Summary =====");
    Logger::logInfo("  Database: " + database_->path());
    Logger::logInfo("  Printers: " + std::to_string(stats.supervised) + " supervised, " +
                    std::to_string(stats.connected) + " connected");
    Logger::logInfo("  Delivery queue: " + std::string(deliveries_->isRunning() ? "RUNNING" : "STOPPED"));
    Logger::logInfo("  Kafka republish: " + std::string(republisher_ ? "ACTIVE" : "OFF"));
    Logger::logInfo("  System monitor: " + std::string(monitor_ && monitor_->isRunning() ? "ACTIVE" : "OFF"));
}
