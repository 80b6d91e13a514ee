#include "connector/adapters/prusalink/PrusaLinkStatusParser.hpp"
#include "connector/adapters/JsonFields.hpp"

#include <algorithm>
#include <cctype>

namespace connector::adapters::prusalink {

    using core::printer::CanonicalStatus;
    using core::printer::JobResult;
    using core::printer::PrinterState;

    namespace {
        std::string upper(std::string text) {
            std::transform(text.begin(), text.end(), text.begin(),
                           [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
            return text;
        }

        std::string jobIdOf(const nlohmann::json &job) {
            if (!job.is_object()) return "";
            auto it = job.find("id");
            if (it == job.end()) return "";
            if (it->is_number_integer()) return std::to_string(it->get<long long>());
            if (it->is_string()) return it->get<std::string>();
            return "";
        }
    }

    void PrusaLinkStatusParser::applyState(CanonicalStatus &status, const std::string &state) {
        const std::string name = upper(state);
        status.jobResult = JobResult::None;

        if (name == "PRINTING") {
            status.state = PrinterState::Printing;
        } else if (name == "PAUSED" || name == "ATTENTION") {
            status.state = PrinterState::Paused;
        } else if (name == "ERROR") {
            status.state = PrinterState::Error;
            status.jobResult = JobResult::Failed;
        } else if (name == "FINISHED") {
            status.state = PrinterState::Idle;
            status.jobResult = JobResult::Completed;
        } else if (name == "STOPPED") {
            status.state = PrinterState::Idle;
            status.jobResult = JobResult::Cancelled;
        } else {
            // IDLE, READY, OPERATIONAL, BUSY and anything newer firmware adds
            status.state = PrinterState::Idle;
        }
    }

    CanonicalStatus PrusaLinkStatusParser::parseStatus(const nlohmann::json &body) {
        CanonicalStatus status;

        const auto &printer = fields::object(body, "printer");
        applyState(status, fields::string(printer, "state", "IDLE"));

        status.temperatures.bed = fields::number(printer, "temp_bed");
        status.temperatures.bedTarget = fields::number(printer, "target_bed");
        status.temperatures.nozzle = fields::number(printer, "temp_nozzle");
        status.temperatures.nozzleTarget = fields::number(printer, "target_nozzle");

        const auto &job = fields::object(body, "job");
        if (!job.empty()) {
            status.deviceJobId = jobIdOf(job);
            status.progressPercent = fields::number(job, "progress");
            if (auto remaining = fields::optionalNumber(job, "time_remaining")) {
                status.timeRemainingSeconds = static_cast<int>(*remaining);
            }
            if (auto printing = fields::optionalNumber(job, "time_printing")) {
                status.printDurationSeconds = static_cast<int>(*printing);
            }
        }

        if (status.state == PrinterState::Error) {
            status.deviceErrorMessage = fields::string(printer, "status_printer", "Printer reported ERROR");
        }
        status.raw = body;
        return status;
    }

    void PrusaLinkStatusParser::applyJob(CanonicalStatus &status, const nlohmann::json &body) {
        const auto &file = fields::object(body, "file");
        std::string display = fields::string(file, "display_name");
        status.filename = display.empty() ? fields::string(file, "name") : display;
        if (status.deviceJobId.empty()) {
            status.deviceJobId = jobIdOf(body);
        }
    }

    CanonicalStatus PrusaLinkStatusParser::parseLegacy(const nlohmann::json &printer, const nlohmann::json &job) {
        CanonicalStatus status;

        const auto &temperature = fields::object(printer, "temperature");
        const auto &tool0 = fields::object(temperature, "tool0");
        const auto &bed = fields::object(temperature, "bed");
        status.temperatures.nozzle = fields::number(tool0, "actual");
        status.temperatures.nozzleTarget = fields::number(tool0, "target");
        status.temperatures.bed = fields::number(bed, "actual");
        status.temperatures.bedTarget = fields::number(bed, "target");

        const auto &flags = fields::object(fields::object(printer, "state"), "flags");
        if (fields::optionalBool(flags, "printing").value_or(false)) {
            status.state = PrinterState::Printing;
        } else if (fields::optionalBool(flags, "paused").value_or(false) ||
                   fields::optionalBool(flags, "pausing").value_or(false)) {
            status.state = PrinterState::Paused;
        } else if (fields::optionalBool(flags, "error").value_or(false) ||
                   fields::optionalBool(flags, "closedOnError").value_or(false)) {
            status.state = PrinterState::Error;
            status.jobResult = JobResult::Failed;
            status.deviceErrorMessage = fields::string(fields::object(printer, "state"), "text", "Printer error");
        } else {
            status.state = PrinterState::Idle;
        }

        if (job.is_object()) {
            const auto &progress = fields::object(job, "progress");
            status.progressPercent = fields::number(progress, "completion");
            if (auto left = fields::optionalNumber(progress, "printTimeLeft")) {
                status.timeRemainingSeconds = static_cast<int>(*left);
            }
            if (auto elapsed = fields::optionalNumber(progress, "printTime")) {
                status.printDurationSeconds = static_cast<int>(*elapsed);
            }

            const auto &file = fields::object(fields::object(job, "job"), "file");
            std::string display = fields::string(file, "display");
            status.filename = display.empty() ? fields::string(file, "name") : display;
        }

        status.raw = {{"printer", printer}, {"job", job}};
        return status;
    }

} // namespace connector::adapters::prusalink
