#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>

#include "core/printer/CanonicalStatus.hpp"
#include "core/printer/state/StatusTracker.hpp"
#include "core/types/Result.hpp"

namespace core::printer {

    struct PrinterEndpoint {
        int printerId = 0;
        std::string name;
        ProtocolKind kind = ProtocolKind::Moonraker;
        std::string host;
        int port = 0;
        std::string apiKey;
        std::string username;
        std::string password;
        std::string serial; // device identity where the protocol needs one (SDCP MainboardID)
    };

    enum class Heater {
        Bed,
        Nozzle
    };

    /**
     * @brief One wire protocol to one printer, normalised to CanonicalStatus.
     *
     * Every parsed message is stored in the adapter's StatusTracker and then
     * handed to the status callback given at construction, on the adapter's
     * own receive thread. Transport and parse errors are logged here and never
     * leave the adapter; the owner learns about them through isConnected()
     * and lastIngest().
     */
    class PrinterAdapter {
    public:
        using StatusCallback = std::function<void(const CanonicalStatus &)>;

        PrinterAdapter(PrinterEndpoint endpoint, StatusCallback onStatus);

        virtual ~PrinterAdapter() = default;

        virtual bool connect() = 0;

        virtual void disconnect() = 0;

        virtual bool isConnected() const = 0;

        virtual ProtocolKind kind() const = 0;

        /**
         * @brief Silence longer than this means the link is stalled
         */
        virtual std::chrono::seconds stalenessThreshold() const = 0;

        /**
         * @brief Pause the device needs after a disconnect before it accepts a new session
         */
        virtual std::chrono::milliseconds teardownSettleTime() const {
            return std::chrono::milliseconds(1000);
        }

        virtual types::Result pause() = 0;

        virtual types::Result resume() = 0;

        virtual types::Result cancel() = 0;

        virtual types::Result setTemperature(Heater heater, double celsius) = 0;

        /**
         * @brief Latest snapshot, never blocks on the transport
         */
        CanonicalStatus getStatus() const { return tracker_.snapshot(); }

        std::chrono::steady_clock::time_point lastIngest() const { return tracker_.lastIngest(); }

        bool hasIngested() const { return tracker_.hasIngested(); }

        const PrinterEndpoint &endpoint() const { return endpoint_; }

        std::string lastTransportError() const;

    protected:
        PrinterEndpoint endpoint_;
        state::StatusTracker tracker_;

        /**
         * @brief Store a freshly parsed status and notify the owner
         */
        void ingest(CanonicalStatus status);

        void recordTransportError(const std::string &reason);

        std::string logTag() const;

    private:
        StatusCallback onStatus_;
        mutable std::mutex errorMutex_;
        std::string lastTransportError_;
    };

} // namespace core::printer
