#include "core/supervisor/PrinterConnection.hpp"
#include "core/events/EventTypes.hpp"
#include "logger/Logger.hpp"

#include <algorithm>

namespace core::supervisor {

    using printer::CanonicalStatus;

    PrinterConnection::PrinterConnection(printer::PrinterEndpoint endpoint,
                                         connector::adapters::AdapterFactoryFn factory,
                                         detector::PrintStoppingCodes stoppingCodes,
                                         config::DetectorConfig detectorConfig,
                                         jobs::JobLifecycle &lifecycle,
                                         events::EventBus &bus,
                                         std::chrono::seconds telemetryInterval)
            : endpoint_(std::move(endpoint)),
              factory_(std::move(factory)),
              lifecycle_(lifecycle),
              bus_(bus),
              telemetryInterval_(telemetryInterval),
              detector_(endpoint_.printerId, std::move(stoppingCodes), std::move(detectorConfig)) {
    }

    PrinterConnection::~PrinterConnection() {
        stop();
    }

    bool PrinterConnection::start() {
        try {
            auto open = lifecycle_.openJob(endpoint_.printerId);
            std::lock_guard lock(ingestMutex_);
            detector_.seed(open.has_value());
        } catch (const std::exception &e) {
            Logger::logError("[Connection:" + endpoint_.name + "] Cannot read open job: " + e.what());
        }
        return connectAdapter();
    }

    void PrinterConnection::stop() {
        // A deliberate stop is not an outage: no disconnect event, no OFFLINE edge
        teardown("monitor stopped", false);
    }

    bool PrinterConnection::connectAdapter() {
        auto adapter = factory_(endpoint_, [this](const CanonicalStatus &status) { onStatus(status); });
        if (!adapter) {
            Logger::logError("[Connection:" + endpoint_.name + "] No adapter for protocol " +
                             printer::protocolKindToString(endpoint_.kind));
            return false;
        }

        bool connected = adapter->connect();
        {
            std::lock_guard lock(adapterMutex_);
            adapter_ = std::move(adapter);
            connectedAt_ = std::chrono::steady_clock::now();
        }

        if (connected) {
            linkUp_ = true;
            publishConnectivity(events::types::PRINTER_CONNECTED, "");
        }
        return connected;
    }

    void PrinterConnection::teardown(const std::string &reason, bool announce) {
        std::shared_ptr<printer::PrinterAdapter> adapter;
        {
            std::lock_guard lock(adapterMutex_);
            adapter = std::move(adapter_);
        }
        if (adapter) {
            // Joins the adapter's receive thread, which may be waiting on ingestMutex_
            adapter->disconnect();
        }

        if (linkUp_.exchange(false) && announce) {
            std::string lastError = adapter ? adapter->lastTransportError() : "";
            std::string why = lastError.empty() ? reason : lastError;
            publishConnectivity(events::types::PRINTER_DISCONNECTED, why);
            onStatus(CanonicalStatus::offline(endpoint_.printerId, why));
        }
    }

    bool PrinterConnection::reconnect(std::chrono::milliseconds delay, utils::CancellationSignal &stopSignal) {
        std::chrono::milliseconds settle = delay;
        if (auto adapter = currentAdapter()) {
            settle = std::max(delay, adapter->teardownSettleTime());
        }

        teardown("link lost", true);
        reconnects_++;

        if (stopSignal.waitFor(settle)) {
            return false;
        }

        Logger::logInfo("[Connection:" + endpoint_.name + "] Reconnecting (attempt " +
                        std::to_string(reconnects_.load()) + ")");
        return connectAdapter();
    }

    std::shared_ptr<printer::PrinterAdapter> PrinterConnection::currentAdapter() const {
        std::lock_guard lock(adapterMutex_);
        return adapter_;
    }

    std::optional<std::string> PrinterConnection::healthProblem(std::chrono::steady_clock::time_point now) const {
        std::shared_ptr<printer::PrinterAdapter> adapter;
        std::chrono::steady_clock::time_point connectedAt;
        {
            std::lock_guard lock(adapterMutex_);
            adapter = adapter_;
            connectedAt = connectedAt_;
        }
        if (!adapter) return std::string("no adapter");
        if (!adapter->isConnected()) {
            std::string error = adapter->lastTransportError();
            return error.empty() ? std::string("transport disconnected") : error;
        }

        // A socket can stay open while the device has stopped talking
        auto since = adapter->hasIngested() ? adapter->lastIngest() : connectedAt;
        auto silence = std::chrono::duration_cast<std::chrono::seconds>(now - since);
        if (silence > adapter->stalenessThreshold()) {
            return "no data for " + std::to_string(silence.count()) + "s";
        }
        return std::nullopt;
    }

    CanonicalStatus PrinterConnection::getStatus() const {
        auto adapter = currentAdapter();
        if (!adapter) return CanonicalStatus::offline(endpoint_.printerId, "not connected");
        return adapter->getStatus();
    }

    bool PrinterConnection::isConnected() const {
        auto adapter = currentAdapter();
        return adapter && adapter->isConnected();
    }

    detector::LifecycleState PrinterConnection::lifecycleState() const {
        std::lock_guard lock(ingestMutex_);
        return detector_.current();
    }

    void PrinterConnection::onStatus(const CanonicalStatus &status) {
        std::lock_guard lock(ingestMutex_);

        auto signals = detector_.observe(status);
        for (const auto &signal: signals) {
            lifecycle_.handle(endpoint_, signal);
        }

        auto now = std::chrono::steady_clock::now();
        if (status.state != printer::PrinterState::Offline && now - lastTelemetry_ >= telemetryInterval_) {
            lastTelemetry_ = now;
            auto data = status.toJson();
            data["printer_name"] = endpoint_.name;
            bus_.publish(events::Event(events::types::PRINTER_TELEMETRY, "supervisor", data));
        }
    }

    void PrinterConnection::publishConnectivity(const char *type, const std::string &reason) {
        nlohmann::json data = {
                {"printer_id", endpoint_.printerId},
                {"printer_name", endpoint_.name},
                {"protocol", printer::protocolKindToString(endpoint_.kind)}
        };
        if (!reason.empty()) data["reason"] = reason;
        bus_.publish(events::Event(type, "supervisor", data));
    }

    types::Result PrinterConnection::withAdapter(
            const std::function<types::Result(printer::PrinterAdapter &)> &command) {
        auto adapter = currentAdapter();
        if (!adapter) return types::Result::notConnected();
        return command(*adapter);
    }

    types::Result PrinterConnection::pause() {
        return withAdapter([](printer::PrinterAdapter &adapter) { return adapter.pause(); });
    }

    types::Result PrinterConnection::resume() {
        return withAdapter([](printer::PrinterAdapter &adapter) { return adapter.resume(); });
    }

    types::Result PrinterConnection::cancel() {
        return withAdapter([](printer::PrinterAdapter &adapter) { return adapter.cancel(); });
    }

    types::Result PrinterConnection::setTemperature(printer::Heater heater, double celsius) {
        return withAdapter([heater, celsius](printer::PrinterAdapter &adapter) {
            return adapter.setTemperature(heater, celsius);
        });
    }

} // namespace core::supervisor
