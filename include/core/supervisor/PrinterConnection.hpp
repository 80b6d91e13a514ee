#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "application/config/Settings.hpp"
#include "connector/adapters/AdapterFactory.hpp"
#include "core/detector/StateTransitionDetector.hpp"
#include "core/events/EventSystem.hpp"
#include "core/jobs/JobLifecycle.hpp"
#include "core/utils/Cancellation.hpp"

namespace core::supervisor {

    /**
     * @brief One printer's adapter, detector and ingestion path.
     *
     * Owned by the ConnectionSupervisor. Every status the adapter produces
     * goes through onStatus() under the ingestion lock, so lifecycle
     * signals for this printer are strictly ordered.
     */
    class PrinterConnection {
    public:
        PrinterConnection(printer::PrinterEndpoint endpoint,
                          connector::adapters::AdapterFactoryFn factory,
                          detector::PrintStoppingCodes stoppingCodes,
                          config::DetectorConfig detectorConfig,
                          jobs::JobLifecycle &lifecycle,
                          events::EventBus &bus,
                          std::chrono::seconds telemetryInterval = std::chrono::seconds(10));

        ~PrinterConnection();

        PrinterConnection(const PrinterConnection &) = delete;

        PrinterConnection &operator=(const PrinterConnection &) = delete;

        /**
         * @brief Seed the detector from storage, build the adapter and connect
         */
        bool start();

        void stop();

        /**
         * @brief Tear the adapter down, wait out the settle time, build a fresh one and connect
         * @param stopSignal aborts the wait when the supervisor shuts down
         */
        bool reconnect(std::chrono::milliseconds delay, utils::CancellationSignal &stopSignal);

        /**
         * @return why the link must be rebuilt, nullopt while it is healthy
         */
        std::optional<std::string> healthProblem(std::chrono::steady_clock::time_point now) const;

        printer::CanonicalStatus getStatus() const;

        bool isConnected() const;

        detector::LifecycleState lifecycleState() const;

        const printer::PrinterEndpoint &endpoint() const { return endpoint_; }

        size_t reconnectCount() const { return reconnects_; }

        types::Result pause();

        types::Result resume();

        types::Result cancel();

        types::Result setTemperature(printer::Heater heater, double celsius);

        /**
         * @brief Ingestion entry point, called on the adapter's receive thread
         */
        void onStatus(const printer::CanonicalStatus &status);

    private:
        printer::PrinterEndpoint endpoint_;
        connector::adapters::AdapterFactoryFn factory_;
        jobs::JobLifecycle &lifecycle_;
        events::EventBus &bus_;
        std::chrono::seconds telemetryInterval_;

        // Guards the pointer only; adapter calls run on a copy taken under the lock
        mutable std::mutex adapterMutex_;
        std::shared_ptr<printer::PrinterAdapter> adapter_;
        std::chrono::steady_clock::time_point connectedAt_{};

        mutable std::mutex ingestMutex_;
        detector::StateTransitionDetector detector_;
        std::chrono::steady_clock::time_point lastTelemetry_{};

        std::atomic<bool> linkUp_{false};
        std::atomic<size_t> reconnects_{0};

        bool connectAdapter();

        void teardown(const std::string &reason, bool announce);

        std::shared_ptr<printer::PrinterAdapter> currentAdapter() const;

        void publishConnectivity(const char *type, const std::string &reason);

        types::Result withAdapter(const std::function<types::Result(printer::PrinterAdapter &)> &command);
    };

} // namespace core::supervisor
