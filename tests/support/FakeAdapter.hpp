#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "connector/adapters/AdapterFactory.hpp"
#include "core/printer/PrinterAdapter.hpp"

namespace fakes {

    /**
     * @brief Adapter driven by the test: connect() succeeds when the link is up, push() ingests a status
     */
    class FakeAdapter : public core::printer::PrinterAdapter {
    public:
        FakeAdapter(core::printer::PrinterEndpoint endpoint, StatusCallback onStatus, bool linkUp)
                : PrinterAdapter(std::move(endpoint), std::move(onStatus)), linkUp_(linkUp) {}

        bool connect() override {
            connected_ = linkUp_;
            if (!connected_) recordTransportError("connection refused");
            return connected_;
        }

        void disconnect() override { connected_ = false; }

        bool isConnected() const override { return connected_; }

        core::printer::ProtocolKind kind() const override { return endpoint_.kind; }

        std::chrono::seconds stalenessThreshold() const override { return std::chrono::seconds(60); }

        std::chrono::milliseconds teardownSettleTime() const override { return std::chrono::milliseconds(0); }

        core::types::Result pause() override {
            pauses++;
            pauseStarted = true;
            std::this_thread::sleep_for(pauseDelay);
            return core::types::Result::success();
        }

        core::types::Result resume() override { return core::types::Result::success(); }

        core::types::Result cancel() override { return core::types::Result::success(); }

        core::types::Result setTemperature(core::printer::Heater, double) override {
            return core::types::Result::unsupported();
        }

        void push(core::printer::CanonicalStatus status) { ingest(std::move(status)); }

        void dropLink(const std::string &reason) {
            connected_ = false;
            recordTransportError(reason);
        }

        std::atomic<int> pauses{0};
        std::atomic<bool> pauseStarted{false};
        std::chrono::milliseconds pauseDelay{0};

    private:
        bool linkUp_;
        std::atomic<bool> connected_{false};
    };

    /**
     * @brief Factory that hands out FakeAdapters and remembers the latest one per printer
     */
    class FakeAdapterFactory {
    public:
        connector::adapters::AdapterFactoryFn function() {
            return [this](const core::printer::PrinterEndpoint &endpoint,
                          core::printer::PrinterAdapter::StatusCallback onStatus)
                    -> std::unique_ptr<core::printer::PrinterAdapter> {
                auto adapter = std::make_unique<FakeAdapter>(endpoint, std::move(onStatus), linkUp);
                std::lock_guard lock(mutex_);
                latest_[endpoint.printerId] = adapter.get();
                created++;
                return adapter;
            };
        }

        FakeAdapter *latest(int printerId) {
            std::lock_guard lock(mutex_);
            auto it = latest_.find(printerId);
            return it == latest_.end() ? nullptr : it->second;
        }

        std::atomic<bool> linkUp{true};
        std::atomic<int> created{0};

    private:
        std::mutex mutex_;
        std::map<int, FakeAdapter *> latest_;
    };

} // namespace fakes
