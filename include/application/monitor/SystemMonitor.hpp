#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>

#include <nlohmann/json.hpp>

#include "connector/kafka/KafkaProducer.hpp"
#include "core/alerts/AlertDispatcher.hpp"
#include "core/alerts/DeliveryQueue.hpp"
#include "core/events/EventSystem.hpp"
#include "core/jobs/JobLifecycle.hpp"
#include "core/supervisor/ConnectionSupervisor.hpp"
#include "core/utils/Cancellation.hpp"

/**
 * @brief Periodic fleet report, fleet.summary publisher and housekeeping.
 *
 * Also drives the quiet-hours digest and serves Kafka delivery reports,
 * both of which need a periodic tick.
 */
class SystemMonitor {
public:
    SystemMonitor(core::supervisor::ConnectionSupervisor &supervisor,
                  core::jobs::JobLifecycle &lifecycle,
                  core::alerts::DeliveryQueue &deliveries,
                  core::events::EventBus &bus,
                  core::alerts::AlertDispatcher *dispatcher = nullptr,
                  std::shared_ptr<connector::kafka::KafkaProducer> producer = nullptr,
                  std::chrono::seconds reportInterval = std::chrono::seconds(30));

    ~SystemMonitor();

    void start();

    void stop();

    bool isRunning() const;

    /**
     * @brief Payload of fleet.summary
     */
    nlohmann::json buildSummary() const;

    void reportFleetStatus() const;

private:
    core::supervisor::ConnectionSupervisor &supervisor_;
    core::jobs::JobLifecycle &lifecycle_;
    core::alerts::DeliveryQueue &deliveries_;
    core::events::EventBus &bus_;
    core::alerts::AlertDispatcher *dispatcher_;
    std::shared_ptr<connector::kafka::KafkaProducer> producer_;
    std::chrono::seconds reportInterval_;

    std::atomic<bool> running_{false};
    utils::CancellationSignal stop_;
    std::thread monitorThread_;

    void monitorLoop();
};
