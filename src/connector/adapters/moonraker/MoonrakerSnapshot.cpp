#include "connector/adapters/moonraker/MoonrakerSnapshot.hpp"
#include "connector/adapters/JsonFields.hpp"

#include <cmath>

namespace connector::adapters::moonraker {

    using core::printer::CanonicalStatus;
    using core::printer::JobResult;
    using core::printer::PrinterState;

    namespace {
        template<typename T>
        bool assign(std::optional<T> &target, const std::optional<T> &value, size_t &updated) {
            if (!value) return false;
            target = value;
            updated++;
            return true;
        }

        std::optional<int> optionalInt(const nlohmann::json &j, const char *key) {
            auto value = fields::optionalNumber(j, key);
            if (!value) return std::nullopt;
            return static_cast<int>(*value);
        }
    }

    nlohmann::json MoonrakerSnapshot::subscriptionObjects() {
        return {
                {"print_stats", nullptr},
                {"virtual_sdcard", nullptr},
                {"display_status", nullptr},
                {"heater_bed", nullptr},
                {"extruder", nullptr},
                {"webhooks", nullptr}
        };
    }

    size_t MoonrakerSnapshot::applyDelta(const nlohmann::json &objects) {
        size_t updated = 0;
        if (!objects.is_object()) return updated;

        if (objects.contains("print_stats")) {
            const auto &ps = fields::object(objects, "print_stats");
            assign(printState, fields::optionalString(ps, "state"), updated);
            assign(filename, fields::optionalString(ps, "filename"), updated);
            assign(printMessage, fields::optionalString(ps, "message"), updated);
            assign(printDuration, fields::optionalNumber(ps, "print_duration"), updated);

            const auto &info = fields::object(ps, "info");
            assign(currentLayer, optionalInt(info, "current_layer"), updated);
            assign(totalLayer, optionalInt(info, "total_layer"), updated);
        }

        if (objects.contains("virtual_sdcard")) {
            assign(sdcardProgress, fields::optionalNumber(fields::object(objects, "virtual_sdcard"), "progress"),
                   updated);
        }

        if (objects.contains("display_status")) {
            assign(displayProgress, fields::optionalNumber(fields::object(objects, "display_status"), "progress"),
                   updated);
        }

        if (objects.contains("heater_bed")) {
            const auto &bed = fields::object(objects, "heater_bed");
            assign(bedTemp, fields::optionalNumber(bed, "temperature"), updated);
            assign(bedTarget, fields::optionalNumber(bed, "target"), updated);
        }

        if (objects.contains("extruder")) {
            const auto &extruder = fields::object(objects, "extruder");
            assign(nozzleTemp, fields::optionalNumber(extruder, "temperature"), updated);
            assign(nozzleTarget, fields::optionalNumber(extruder, "target"), updated);
        }

        if (objects.contains("webhooks")) {
            const auto &webhooks = fields::object(objects, "webhooks");
            if (assign(klippyState, fields::optionalString(webhooks, "state"), updated) && *klippyState == "ready") {
                klippyNotice.clear();
            }
            assign(klippyMessage, fields::optionalString(webhooks, "state_message"), updated);
        }

        return updated;
    }

    CanonicalStatus MoonrakerSnapshot::toCanonical() const {
        CanonicalStatus status;
        status.state = PrinterState::Unknown;

        const std::string state = printState.value_or("");
        if (state == "printing") {
            status.state = PrinterState::Printing;
        } else if (state == "paused") {
            status.state = PrinterState::Paused;
        } else if (state == "error") {
            status.state = PrinterState::Error;
            status.jobResult = JobResult::Failed;
        } else if (state == "complete") {
            status.state = PrinterState::Idle;
            status.jobResult = JobResult::Completed;
        } else if (state == "cancelled") {
            status.state = PrinterState::Idle;
            status.jobResult = JobResult::Cancelled;
        } else if (state == "standby") {
            status.state = PrinterState::Idle;
        }

        status.filename = filename.value_or("");
        status.currentLayer = currentLayer.value_or(0);
        status.totalLayers = totalLayer.value_or(0);

        double fraction = sdcardProgress.value_or(displayProgress.value_or(0.0));
        status.progressPercent = std::round(fraction * 1000.0) / 10.0;

        status.temperatures.bed = bedTemp.value_or(0.0);
        status.temperatures.bedTarget = bedTarget.value_or(0.0);
        status.temperatures.nozzle = nozzleTemp.value_or(0.0);
        status.temperatures.nozzleTarget = nozzleTarget.value_or(0.0);

        if (printDuration) {
            status.printDurationSeconds = static_cast<int>(*printDuration);
        }

        // Moonraker has no remaining-time field; extrapolate from elapsed time
        if (printDuration && *printDuration > 0.0 && status.progressPercent > 1.0) {
            double remaining = *printDuration * (100.0 - status.progressPercent) / status.progressPercent;
            status.timeRemainingSeconds = std::max(0, static_cast<int>(std::lround(remaining)));
        }

        std::string klippy = klippyNotice;
        if (klippy.empty() && klippyState && (*klippyState == "shutdown" || *klippyState == "error")) {
            klippy = *klippyState;
        }
        if (!klippy.empty()) {
            status.deviceErrorCode = "klippy:" + klippy;
            status.deviceErrorMessage = klippyMessage.value_or("Klipper " + klippy);
        } else if (status.state == PrinterState::Error) {
            status.deviceErrorMessage = printMessage.value_or("");
        }

        return status;
    }

} // namespace connector::adapters::moonraker
