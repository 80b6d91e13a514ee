#include "application/monitor/SystemMonitor.hpp"
#include "core/events/EventTypes.hpp"
#include "logger/Logger.hpp"
#include <utility>

SystemMonitor::SystemMonitor(core::supervisor::ConnectionSupervisor &supervisor,
                             core::jobs::JobLifecycle &lifecycle,
                             core::alerts::DeliveryQueue &deliveries,
                             core::events::EventBus &bus,
                             core::alerts::AlertDispatcher *dispatcher,
                             std::shared_ptr<connector::kafka::KafkaProducer> producer,
                             std::chrono::seconds reportInterval)
        : supervisor_(supervisor),
          lifecycle_(lifecycle),
          deliveries_(deliveries),
          bus_(bus),
          dispatcher_(dispatcher),
          producer_(std::move(producer)),
          reportInterval_(reportInterval) {
}

SystemMonitor::~SystemMonitor() {
    stop();
}

void SystemMonitor::start() {
    if (running_) {
        Logger::logWarning("[SystemMonitor] Already running");
        return;
    }

    running_ = true;
    stop_.reset();
    monitorThread_ = std::thread([this]() {
        try {
            monitorLoop();
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Monitor thread crashed: " + std::string(e.what()));
        }
    });

    Logger::logInfo("[SystemMonitor] Started");
}

void SystemMonitor::stop() {
    if (!running_) return;

    running_ = false;
    stop_.requestStop();
    if (monitorThread_.joinable()) {
        monitorThread_.join();
    }

    Logger::logInfo("[SystemMonitor] Stopped");
}

bool SystemMonitor::isRunning() const {
    return running_;
}

void SystemMonitor::monitorLoop() {
    auto nextReport = std::chrono::steady_clock::now() + reportInterval_;

    while (!stop_.waitFor(std::chrono::seconds(1))) {
        try {
            if (producer_) producer_->poll();

            auto now = std::chrono::steady_clock::now();
            if (now >= nextReport) {
                reportFleetStatus();
                bus_.publish(core::events::Event(core::events::types::FLEET_SUMMARY, "monitor", buildSummary()));
                if (dispatcher_) dispatcher_->sendDigestIfDue();
                nextReport = now + reportInterval_;
            }
        } catch (const std::exception &e) {
            Logger::logError("[SystemMonitor] Loop error: " + std::string(e.what()));
        }
    }
}

nlohmann::json SystemMonitor::buildSummary() const {
    auto reports = supervisor_.report();
    auto jobs = lifecycle_.getStatistics();
    auto queue = deliveries_.getStatistics();

    size_t connected = 0, printing = 0, paused = 0, idle = 0, offline = 0, error = 0;
    nlohmann::json printers = nlohmann::json::array();
    for (const auto &entry: reports) {
        if (entry.connected) connected++;
        switch (entry.state) {
            case core::printer::PrinterState::Printing:
                printing++;
                break;
            case core::printer::PrinterState::Paused:
                paused++;
                break;
            case core::printer::PrinterState::Idle:
                idle++;
                break;
            case core::printer::PrinterState::Error:
                error++;
                break;
            default:
                offline++;
                break;
        }
        printers.push_back({
                {"printer_id", entry.printerId},
                {"printer_name", entry.name},
                {"protocol", entry.protocol},
                {"connected", entry.connected},
                {"state", core::printer::printerStateToString(entry.state)},
                {"lifecycle", core::detector::lifecycleStateToString(entry.lifecycle)},
                {"reconnects", entry.reconnects},
                {"last_error", entry.lastError}
        });
    }

    return {
            {"printers_total", reports.size()},
            {"connected", connected},
            {"printing", printing},
            {"paused", paused},
            {"idle", idle},
            {"error", error},
            {"offline", offline},
            {"jobs_started", jobs.jobsStarted},
            {"jobs_completed", jobs.jobsCompleted},
            {"jobs_failed", jobs.jobsFailed},
            {"jobs_cancelled", jobs.jobsCancelled},
            {"deliveries_pending", queue.currentQueueSize},
            {"deliveries_failed", queue.totalFailed},
            {"printers", printers}
    };
}

void SystemMonitor::reportFleetStatus() const {
    Logger::logInfo("[SystemMonitor] ===== Fleet Status Report =====");

    auto supervisorStats = supervisor_.getStatistics();
    Logger::logInfo("[SystemMonitor] Connections:");
    Logger::logInfo("  Supervised: " + std::to_string(supervisorStats.supervised));
    Logger::logInfo("  Connected: " + std::to_string(supervisorStats.connected));
    Logger::logInfo("  Reconnect attempts: " + std::to_string(supervisorStats.reconnectAttempts) +
                    " (" + std::to_string(supervisorStats.reconnectFailures) + " failed)");

    for (const auto &entry: supervisor_.report()) {
        std::string line = "  " + entry.name + " [" + entry.protocol + "]: " +
                           core::printer::printerStateToString(entry.state);
        if (!entry.connected && !entry.lastError.empty()) {
            line += " (" + entry.lastError + ")";
        }
        if (entry.reconnects > 0) {
            line += ", " + std::to_string(entry.reconnects) + " reconnect(s)";
        }
        Logger::logInfo(line);
    }

    auto jobs = lifecycle_.getStatistics();
    Logger::logInfo("[SystemMonitor] Jobs:");
    Logger::logInfo("  Started: " + std::to_string(jobs.jobsStarted) + ", linked: " +
                    std::to_string(jobs.jobsLinked));
    Logger::logInfo("  Completed: " + std::to_string(jobs.jobsCompleted) + ", failed: " +
                    std::to_string(jobs.jobsFailed) + ", cancelled: " + std::to_string(jobs.jobsCancelled));
    if (jobs.storageErrors > 0) {
        Logger::logWarning("  Storage errors: " + std::to_string(jobs.storageErrors));
    }

    auto queue = deliveries_.getStatistics();
    Logger::logInfo("[SystemMonitor] Delivery Queue:");
    Logger::logInfo("  Running: " + std::string(deliveries_.isRunning() ? "TRUE" : "FALSE"));
    Logger::logInfo("  Enqueued: " + std::to_string(queue.totalEnqueued) + ", delivered: " +
                    std::to_string(queue.totalDelivered) + ", failed: " + std::to_string(queue.totalFailed));
    Logger::logInfo("  Pending: " + std::to_string(queue.currentQueueSize));

    if (!deliveries_.isRunning() && queue.currentQueueSize > 0) {
        Logger::logError("[SystemMonitor] WARNING: Delivery queue has tasks but is not running!");
    }

    auto bus = bus_.getStatistics();
    Logger::logInfo("[SystemMonitor] Event Bus:");
    Logger::logInfo("  Published: " + std::to_string(bus.eventsPublished) + ", handler errors: " +
                    std::to_string(bus.handlerErrors));

    if (producer_) {
        Logger::logInfo("[SystemMonitor] Kafka: " + std::string(producer_->isReady() ? "ready" : "NOT READY") +
                        ", delivery failures: " + std::to_string(producer_->deliveryFailures()));
    }
}
