#include "core/supervisor/ConnectionSupervisor.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

#include <set>

namespace core::supervisor {

    ConnectionSupervisor::ConnectionSupervisor(storage::Database &db,
                                               jobs::JobLifecycle &lifecycle,
                                               events::EventBus &bus,
                                               connector::adapters::AdapterFactoryFn factory,
                                               config::SupervisorConfig config,
                                               config::DetectorConfig detectorConfig)
            : printers_(db),
              lifecycle_(lifecycle),
              bus_(bus),
              factory_(std::move(factory)),
              config_(config),
              detectorConfig_(std::move(detectorConfig)),
              stoppingCodes_(detector::PrintStoppingCodes::parse(detectorConfig_.printStoppingCodes)) {
    }

    ConnectionSupervisor::~ConnectionSupervisor() {
        stop();
    }

    void ConnectionSupervisor::start() {
        if (running_) {
            Logger::logWarning("[Supervisor] Already running");
            return;
        }

        stop_.reset();
        running_ = true;
        runDiscoverySweep();

        worker_ = std::thread([this]() {
            try {
                supervisorLoop();
            } catch (const std::exception &e) {
                Logger::logError("[Supervisor] Supervisor thread crashed: " + std::string(e.what()));
            }
        });

        Logger::logInfo("[Supervisor] Started, supervising " + std::to_string(all().size()) + " printer(s)");
    }

    void ConnectionSupervisor::stop() {
        if (running_.exchange(false)) {
            stop_.requestStop();
            if (worker_.joinable()) {
                worker_.join();
            }
        }

        std::map<int, std::shared_ptr<PrinterConnection>> connections;
        {
            std::lock_guard lock(connectionsMutex_);
            connections.swap(connections_);
        }
        for (auto &[id, connection]: connections) {
            connection->stop();
        }
        if (!connections.empty()) {
            Logger::logInfo("[Supervisor] Stopped " + std::to_string(connections.size()) + " connection(s)");
        }
    }

    void ConnectionSupervisor::supervisorLoop() {
        Logger::logInfo("[Supervisor] Supervisor loop started");

        auto nextHealth = std::chrono::steady_clock::now() + config_.healthInterval;
        auto nextDiscovery = std::chrono::steady_clock::now() + config_.discoveryInterval;

        while (!stop_.waitFor(std::chrono::seconds(1))) {
            auto now = std::chrono::steady_clock::now();
            try {
                if (now >= nextDiscovery) {
                    runDiscoverySweep();
                    nextDiscovery = now + config_.discoveryInterval;
                }
                if (now >= nextHealth) {
                    runHealthSweep(now);
                    nextHealth = std::chrono::steady_clock::now() + config_.healthInterval;
                }
            } catch (const std::exception &e) {
                Logger::logError("[Supervisor] Sweep error: " + std::string(e.what()));
            }
        }
    }

    void ConnectionSupervisor::runHealthSweep(std::chrono::steady_clock::time_point now) {
        std::lock_guard sweep(sweepMutex_);

        for (const auto &connection: all()) {
            if (stop_.stopRequested()) break;

            auto problem = connection->healthProblem(now);
            if (!problem) continue;

            const auto &name = connection->endpoint().name;
            Logger::logWarning("[Supervisor] " + name + " unhealthy: " + *problem + ", reconnecting");

            bool ok = connection->reconnect(config_.reconnectDelay, stop_);
            {
                std::lock_guard lock(statsMutex_);
                stats_.reconnectAttempts++;
                if (!ok) stats_.reconnectFailures++;
            }
            if (ok) {
                Logger::logInfo("[Supervisor] " + name + " reconnected");
            } else if (!stop_.stopRequested()) {
                Logger::logWarning("[Supervisor] " + name + " still unreachable, next attempt in " +
                                   std::to_string(config_.healthInterval.count()) + "s");
            }
        }

        std::lock_guard lock(statsMutex_);
        stats_.healthSweeps++;
    }

    size_t ConnectionSupervisor::runDiscoverySweep() {
        std::lock_guard sweep(sweepMutex_);

        std::vector<storage::PrinterRecord> records;
        try {
            records = printers_.listEnabled();
        } catch (const types::StorageException &e) {
            Logger::logError("[Supervisor] Cannot list printers: " + std::string(e.what()));
            return 0;
        }

        std::set<int> enabled;
        size_t started = 0;

        for (const auto &record: records) {
            auto endpoint = storage::PrinterRepository::toEndpoint(record);
            if (!endpoint) {
                Logger::logWarning("[Supervisor] Skipping " + record.name + ": unsupported protocol '" +
                                   record.protocol + "'");
                continue;
            }
            enabled.insert(record.id);
            if (find(record.id)) continue;

            auto connection = std::make_shared<PrinterConnection>(*endpoint, factory_, stoppingCodes_,
                                                                  detectorConfig_, lifecycle_, bus_,
                                                                  config_.telemetryInterval);
            {
                std::lock_guard lock(connectionsMutex_);
                connections_[record.id] = connection;
            }
            started++;

            // A printer that is down now is picked up by the next health sweep
            if (connection->start()) {
                Logger::logInfo("[Supervisor] Connected to " + record.name + " (" + record.protocol + ")");
            } else {
                Logger::logWarning("[Supervisor] Initial connect to " + record.name + " failed");
            }
        }

        std::vector<std::shared_ptr<PrinterConnection>> removed;
        {
            std::lock_guard lock(connectionsMutex_);
            for (auto it = connections_.begin(); it != connections_.end();) {
                if (enabled.count(it->first) == 0) {
                    removed.push_back(it->second);
                    it = connections_.erase(it);
                } else {
                    ++it;
                }
            }
        }
        for (auto &connection: removed) {
            Logger::logInfo("[Supervisor] " + connection->endpoint().name + " no longer enabled, stopping");
            connection->stop();
        }

        return started;
    }

    std::shared_ptr<PrinterConnection> ConnectionSupervisor::find(int printerId) const {
        std::lock_guard lock(connectionsMutex_);
        auto it = connections_.find(printerId);
        return it == connections_.end() ? nullptr : it->second;
    }

    std::vector<std::shared_ptr<PrinterConnection>> ConnectionSupervisor::all() const {
        std::lock_guard lock(connectionsMutex_);
        std::vector<std::shared_ptr<PrinterConnection>> result;
        result.reserve(connections_.size());
        for (const auto &[id, connection]: connections_) {
            result.push_back(connection);
        }
        return result;
    }

    printer::CanonicalStatus ConnectionSupervisor::getStatus(int printerId) const {
        auto connection = find(printerId);
        if (!connection) return printer::CanonicalStatus::offline(printerId, "not supervised");
        return connection->getStatus();
    }

    std::vector<ConnectionReport> ConnectionSupervisor::report() const {
        std::vector<ConnectionReport> reports;
        for (const auto &connection: all()) {
            auto status = connection->getStatus();
            ConnectionReport entry;
            entry.printerId = connection->endpoint().printerId;
            entry.name = connection->endpoint().name;
            entry.protocol = printer::protocolKindToString(connection->endpoint().kind);
            entry.connected = connection->isConnected();
            entry.state = status.state;
            entry.lifecycle = connection->lifecycleState();
            entry.reconnects = connection->reconnectCount();
            entry.lastError = status.lastError;
            reports.push_back(std::move(entry));
        }
        return reports;
    }

    types::Result ConnectionSupervisor::pause(int printerId) {
        auto connection = find(printerId);
        return connection ? connection->pause() : types::Result::notConnected("Unknown printer");
    }

    types::Result ConnectionSupervisor::resume(int printerId) {
        auto connection = find(printerId);
        return connection ? connection->resume() : types::Result::notConnected("Unknown printer");
    }

    types::Result ConnectionSupervisor::cancel(int printerId) {
        auto connection = find(printerId);
        return connection ? connection->cancel() : types::Result::notConnected("Unknown printer");
    }

    types::Result ConnectionSupervisor::setTemperature(int printerId, printer::Heater heater, double celsius) {
        auto connection = find(printerId);
        return connection ? connection->setTemperature(heater, celsius)
                          : types::Result::notConnected("Unknown printer");
    }

    ConnectionSupervisor::Statistics ConnectionSupervisor::getStatistics() const {
        auto connections = all();
        std::lock_guard lock(statsMutex_);
        Statistics stats = stats_;
        stats.supervised = connections.size();
        stats.connected = 0;
        for (const auto &connection: connections) {
            if (connection->isConnected()) stats.connected++;
        }
        return stats;
    }

} // namespace core::supervisor
