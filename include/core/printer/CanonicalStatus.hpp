#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace core::printer {

    enum class PrinterState {
        Idle,
        Printing,
        Paused,
        Error,
        Offline,
        Unknown
    };

    /**
     * @brief Outcome the device itself reports for its most recent job
     */
    enum class JobResult {
        None,
        Completed,
        Cancelled,
        Failed
    };

    enum class ProtocolKind {
        Moonraker,
        Elegoo,
        PrusaLink
    };

    std::string printerStateToString(PrinterState state);

    std::string jobResultToString(JobResult result);

    std::string protocolKindToString(ProtocolKind kind);

    std::optional<ProtocolKind> protocolKindFromString(const std::string &name);

    struct Temperatures {
        double bed = 0.0;
        double bedTarget = 0.0;
        double nozzle = 0.0;
        double nozzleTarget = 0.0;
        std::optional<double> chamber;
    };

    /**
     * @brief Protocol-agnostic snapshot of one printer.
     *
     * Default constructed it reads OFFLINE with zeroed telemetry, so a
     * snapshot is always safe to hand out.
     */
    struct CanonicalStatus {
        int printerId = 0;
        PrinterState state = PrinterState::Offline;
        JobResult jobResult = JobResult::None;

        double progressPercent = 0.0;
        int currentLayer = 0;
        int totalLayers = 0;
        Temperatures temperatures;
        std::optional<int> timeRemainingSeconds;
        std::optional<int> printDurationSeconds;

        std::string filename;
        std::string jobName;
        std::string deviceJobId;

        // Error reported by the device for the current print, empty when healthy
        std::string deviceErrorCode;
        std::string deviceErrorMessage;

        // Why the printer is unreachable, shown next to OFFLINE
        std::string lastError;

        nlohmann::json raw = nlohmann::json::object();
        std::chrono::steady_clock::time_point receivedAt{};

        bool isActive() const {
            return state == PrinterState::Printing || state == PrinterState::Paused;
        }

        /**
         * @brief Name to show for the current job, falls back to the filename
         */
        std::string displayName() const;

        nlohmann::json toJson() const;

        static CanonicalStatus offline(int printerId, const std::string &lastError = "");
    };

} // namespace core::printer
