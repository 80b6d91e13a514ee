#pragma once

#include <memory>
#include <mutex>
#include <optional>

#include "connector/adapters/AdapterOptions.hpp"
#include "connector/adapters/elegoo/SdcpMessages.hpp"
#include "connector/client/WebSocketClient.hpp"
#include "core/printer/PrinterAdapter.hpp"

namespace connector::adapters::elegoo {

    /**
     * @brief Elegoo printers over SDCP v3 (full status pushes on one websocket)
     */
    class ElegooAdapter : public core::printer::PrinterAdapter {
    public:
        ElegooAdapter(core::printer::PrinterEndpoint endpoint,
                      StatusCallback onStatus,
                      AdapterOptions options = {},
                      WebSocketFactory socketFactory = createWebSocketClient);

        ~ElegooAdapter() override;

        bool connect() override;

        void disconnect() override;

        bool isConnected() const override;

        core::printer::ProtocolKind kind() const override {
            return core::printer::ProtocolKind::Elegoo;
        }

        std::chrono::seconds stalenessThreshold() const override {
            return options_.pushStaleness;
        }

        // The mainboard refuses a new session while the previous one is closing
        std::chrono::milliseconds teardownSettleTime() const override {
            return std::chrono::milliseconds(2000);
        }

        core::types::Result pause() override;

        core::types::Result resume() override;

        core::types::Result cancel() override;

        core::types::Result setTemperature(core::printer::Heater heater, double celsius) override;

        core::types::Result setPrintSpeed(int percent);

        void handleMessage(const std::string &payload);

        std::string url() const;

        std::string mainboardId() const;

    private:
        AdapterOptions options_;
        WebSocketFactory socketFactory_;

        mutable std::mutex socketMutex_;
        std::unique_ptr<WebSocketClient> socket_;

        mutable std::mutex stateMutex_;
        std::string mainboardId_;
        std::optional<SdcpStatus> lastStatus_;
        int latchedError_ = 0;

        core::types::Result sendCommand(int cmd, const nlohmann::json &data = nlohmann::json::object());

        void publish(const SdcpStatus &status, const nlohmann::json &raw);
    };

} // namespace connector::adapters::elegoo
