#include "core/printer/CanonicalStatus.hpp"

#include <algorithm>
#include <cctype>

namespace core::printer {

    std::string printerStateToString(PrinterState state) {
        switch (state) {
            case PrinterState::Idle:
                return "IDLE";
            case PrinterState::Printing:
                return "PRINTING";
            case PrinterState::Paused:
                return "PAUSED";
            case PrinterState::Error:
                return "ERROR";
            case PrinterState::Offline:
                return "OFFLINE";
            case PrinterState::Unknown:
                return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    std::string jobResultToString(JobResult result) {
        switch (result) {
            case JobResult::None:
                return "none";
            case JobResult::Completed:
                return "completed";
            case JobResult::Cancelled:
                return "cancelled";
            case JobResult::Failed:
                return "failed";
        }
        return "none";
    }

    std::string protocolKindToString(ProtocolKind kind) {
        switch (kind) {
            case ProtocolKind::Moonraker:
                return "moonraker";
            case ProtocolKind::Elegoo:
                return "elegoo";
            case ProtocolKind::PrusaLink:
                return "prusalink";
        }
        return "unknown";
    }

    std::optional<ProtocolKind> protocolKindFromString(const std::string &name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "moonraker" || lower == "klipper") return ProtocolKind::Moonraker;
        if (lower == "elegoo" || lower == "sdcp") return ProtocolKind::Elegoo;
        if (lower == "prusalink" || lower == "prusa") return ProtocolKind::PrusaLink;
        return std::nullopt;
    }

    std::string CanonicalStatus::displayName() const {
        if (!jobName.empty()) return jobName;
        auto slash = filename.find_last_of('/');
        return slash == std::string::npos ? filename : filename.substr(slash + 1);
    }

    nlohmann::json CanonicalStatus::toJson() const {
        nlohmann::json j = {
                {"printer_id", printerId},
                {"state", printerStateToString(state)},
                {"job_result", jobResultToString(jobResult)},
                {"progress", progressPercent},
                {"current_layer", currentLayer},
                {"total_layers", totalLayers},
                {"bed_temp", temperatures.bed},
                {"bed_target", temperatures.bedTarget},
                {"nozzle_temp", temperatures.nozzle},
                {"nozzle_target", temperatures.nozzleTarget},
                {"filename", filename},
                {"job_name", displayName()}
        };
        j["remaining_min"] = timeRemainingSeconds ? nlohmann::json(*timeRemainingSeconds / 60) : nlohmann::json();
        j["chamber_temp"] = temperatures.chamber ? nlohmann::json(*temperatures.chamber) : nlohmann::json();
        if (!deviceErrorCode.empty()) {
            j["error_code"] = deviceErrorCode;
            j["error_message"] = deviceErrorMessage;
        }
        if (!lastError.empty()) {
            j["last_error"] = lastError;
        }
        return j;
    }

    CanonicalStatus CanonicalStatus::offline(int printerId, const std::string &lastError) {
        CanonicalStatus status;
        status.printerId = printerId;
        status.state = PrinterState::Offline;
        status.lastError = lastError;
        return status;
    }

} // namespace core::printer
