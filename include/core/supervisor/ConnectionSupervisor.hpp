#pragma once

#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "application/config/Settings.hpp"
#include "connector/adapters/AdapterFactory.hpp"
#include "core/supervisor/PrinterConnection.hpp"
#include "storage/PrinterRepository.hpp"

namespace core::supervisor {

    struct ConnectionReport {
        int printerId = 0;
        std::string name;
        std::string protocol;
        bool connected = false;
        printer::PrinterState state = printer::PrinterState::Offline;
        detector::LifecycleState lifecycle = detector::LifecycleState::Unknown;
        size_t reconnects = 0;
        std::string lastError;
    };

    /**
     * @brief Keeps one live adapter per enabled printer.
     *
     * A background thread runs a health sweep (reconnect on disconnect or
     * stalled data) and a discovery sweep (start newly enabled printers, stop
     * removed ones). Sweeps are sequential, so a printer is never being
     * reconnected twice at the same time.
     */
    class ConnectionSupervisor {
    public:
        ConnectionSupervisor(storage::Database &db,
                             jobs::JobLifecycle &lifecycle,
                             events::EventBus &bus,
                             connector::adapters::AdapterFactoryFn factory,
                             config::SupervisorConfig config = {},
                             config::DetectorConfig detectorConfig = {});

        ~ConnectionSupervisor();

        void start();

        void stop();

        bool isRunning() const { return running_; }

        /**
         * @brief Reconnect every connection that is down or stalled
         */
        void runHealthSweep(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

        /**
         * @brief Sync connections with the enabled printers in storage
         * @return number of printers newly started
         */
        size_t runDiscoverySweep();

        /**
         * @brief Latest status, OFFLINE for printers that are not supervised
         */
        printer::CanonicalStatus getStatus(int printerId) const;

        std::vector<ConnectionReport> report() const;

        types::Result pause(int printerId);

        types::Result resume(int printerId);

        types::Result cancel(int printerId);

        types::Result setTemperature(int printerId, printer::Heater heater, double celsius);

        struct Statistics {
            size_t supervised = 0;
            size_t connected = 0;
            size_t healthSweeps = 0;
            size_t reconnectAttempts = 0;
            size_t reconnectFailures = 0;
        };

        Statistics getStatistics() const;

    private:
        storage::PrinterRepository printers_;
        jobs::JobLifecycle &lifecycle_;
        events::EventBus &bus_;
        connector::adapters::AdapterFactoryFn factory_;
        config::SupervisorConfig config_;
        config::DetectorConfig detectorConfig_;
        detector::PrintStoppingCodes stoppingCodes_;

        mutable std::mutex connectionsMutex_;
        std::map<int, std::shared_ptr<PrinterConnection>> connections_;

        std::mutex sweepMutex_;
        std::atomic<bool> running_{false};
        utils::CancellationSignal stop_;
        std::thread worker_;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        void supervisorLoop();

        std::shared_ptr<PrinterConnection> find(int printerId) const;

        std::vector<std::shared_ptr<PrinterConnection>> all() const;
    };

} // namespace core::supervisor
