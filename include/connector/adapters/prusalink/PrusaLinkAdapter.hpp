#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>

#include "connector/adapters/AdapterOptions.hpp"
#include "connector/client/HttpClient.hpp"
#include "core/printer/PrinterAdapter.hpp"
#include "core/utils/Cancellation.hpp"

namespace connector::adapters::prusalink {

    /**
     * @brief Prusa printers through the PrusaLink REST API.
     *
     * A dedicated worker polls /api/v1/status every poll interval. Firmware
     * that answers 404 there is switched to the legacy /api/printer and
     * /api/job pair for the rest of the session.
     */
    class PrusaLinkAdapter : public core::printer::PrinterAdapter {
    public:
        PrusaLinkAdapter(core::printer::PrinterEndpoint endpoint,
                         StatusCallback onStatus,
                         AdapterOptions options = {},
                         std::shared_ptr<HttpClient> http = createHttpClient());

        ~PrusaLinkAdapter() override;

        /**
         * @brief Poll once synchronously, then start the poll worker
         */
        bool connect() override;

        void disconnect() override;

        bool isConnected() const override { return connected_; }

        core::printer::ProtocolKind kind() const override {
            return core::printer::ProtocolKind::PrusaLink;
        }

        std::chrono::seconds stalenessThreshold() const override {
            return options_.pullStaleness;
        }

        core::types::Result pause() override;

        core::types::Result resume() override;

        core::types::Result cancel() override;

        core::types::Result setTemperature(core::printer::Heater heater, double celsius) override;

        /**
         * @brief One status round trip
         * @return false on transport or HTTP failure
         */
        bool pollOnce();

        bool usingLegacyApi() const { return legacyApi_; }

        std::string baseUrl() const;

    private:
        AdapterOptions options_;
        std::shared_ptr<HttpClient> http_;

        std::atomic<bool> connected_{false};
        std::atomic<bool> legacyApi_{false};
        std::string lastJobId_;
        std::string lastFilename_;

        std::mutex workerMutex_;
        std::thread worker_;
        utils::CancellationSignal stop_;

        HttpResponse request(const std::string &method, const std::string &path);

        bool pollV1();

        bool pollLegacy();

        bool fail(const std::string &reason);

        core::types::Result jobCommand(const std::string &method, const std::string &suffix);

        void pollLoop();
    };

} // namespace connector::adapters::prusalink
