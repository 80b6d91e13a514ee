#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "application/monitor/SystemMonitor.hpp"
#include "connector/kafka/EventRepublisher.hpp"
#include "connector/kafka/KafkaProducer.hpp"
#include "core/alerts/AlertDispatcher.hpp"
#include "core/alerts/DeliveryQueue.hpp"
#include "core/consumers/AlertRules.hpp"
#include "core/consumers/ArchiveWriter.hpp"
#include "core/consumers/CareCounterUpdater.hpp"
#include "core/consumers/EventRelay.hpp"
#include "core/jobs/JobLifecycle.hpp"
#include "core/supervisor/ConnectionSupervisor.hpp"
#include "storage/Database.hpp"

/**
 * @class ApplicationController
 * @brief Builds and owns the monitoring pipeline.
 *
 * Initialization sequence:
 * 1. Configuration and logging
 * 2. Database and schema
 * 3. Delivery queue, job lifecycle and alert dispatcher
 * 4. Bus consumers (alert rules, archive, care counters, relay)
 * 5. Kafka republisher (optional)
 * 6. Connection supervisor and system monitor
 *
 * Shutdown runs in reverse order.
 */
class ApplicationController {
public:
    explicit ApplicationController(std::string configPath = "config.json");

    ~ApplicationController();

    /**
     * @return false if the configuration is invalid or storage cannot be opened
     */
    bool initialize();

    void shutdown();

    bool isRunning() const { return isRunning_; }

private:
    std::string configPath_;
    core::events::EventBus &bus_;

    std::unique_ptr<storage::Database> database_;
    std::unique_ptr<core::alerts::DeliveryQueue> deliveries_;
    std::unique_ptr<core::jobs::JobLifecycle> lifecycle_;
    std::unique_ptr<core::alerts::AlertDispatcher> dispatcher_;

    std::unique_ptr<core::consumers::AlertRules> alertRules_;
    std::unique_ptr<core::consumers::ArchiveWriter> archiveWriter_;
    std::unique_ptr<core::consumers::CareCounterUpdater> careCounters_;
    std::unique_ptr<core::consumers::EventRelay> eventRelay_;

    std::shared_ptr<connector::kafka::KafkaProducer> kafkaProducer_;
    std::unique_ptr<connector::kafka::EventRepublisher> republisher_;

    std::unique_ptr<core::supervisor::ConnectionSupervisor> supervisor_;
    std::unique_ptr<SystemMonitor> monitor_;

    std::atomic<bool> isRunning_{false};

    bool loadConfiguration();

    bool initializeStorage();

    void initializePipeline();

    void initializeKafka();

    void printInitializationSummary() const;
};
