#pragma once

#include <atomic>
#include <memory>
#include <mutex>

#include "connector/adapters/AdapterOptions.hpp"
#include "connector/adapters/moonraker/MoonrakerSnapshot.hpp"
#include "connector/client/WebSocketClient.hpp"
#include "core/printer/PrinterAdapter.hpp"

namespace connector::adapters::moonraker {

    /**
     * @brief Klipper printers through Moonraker's websocket JSON-RPC API.
     *
     * Subscribes to the printer objects once the socket is open and merges
     * every notify_status_update delta into a MoonrakerSnapshot.
     */
    class MoonrakerAdapter : public core::printer::PrinterAdapter {
    public:
        MoonrakerAdapter(core::printer::PrinterEndpoint endpoint,
                         StatusCallback onStatus,
                         AdapterOptions options = {},
                         WebSocketFactory socketFactory = createWebSocketClient);

        ~MoonrakerAdapter() override;

        bool connect() override;

        void disconnect() override;

        bool isConnected() const override;

        core::printer::ProtocolKind kind() const override {
            return core::printer::ProtocolKind::Moonraker;
        }

        std::chrono::seconds stalenessThreshold() const override {
            return options_.pushStaleness;
        }

        core::types::Result pause() override;

        core::types::Result resume() override;

        core::types::Result cancel() override;

        core::types::Result setTemperature(core::printer::Heater heater, double celsius) override;

        /**
         * @brief Entry point for every text frame from the socket
         */
        void handleMessage(const std::string &payload);

        std::string url() const;

    private:
        AdapterOptions options_;
        WebSocketFactory socketFactory_;

        mutable std::mutex socketMutex_;
        std::unique_ptr<WebSocketClient> socket_;

        std::mutex snapshotMutex_;
        MoonrakerSnapshot snapshot_;

        std::atomic<int> nextRequestId_{1};
        std::atomic<int> subscribeRequestId_{-1};

        bool subscribe();

        core::types::Result sendRpc(const std::string &method,
                                    const nlohmann::json &params = nlohmann::json::object(),
                                    int requestId = 0);

        void publishSnapshot(const nlohmann::json &raw);
    };

} // namespace connector::adapters::moonraker
