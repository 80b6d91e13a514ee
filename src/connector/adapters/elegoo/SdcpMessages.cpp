#include "connector/adapters/elegoo/SdcpMessages.hpp"
#include "connector/adapters/JsonFields.hpp"

#include <algorithm>
#include <chrono>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace connector::adapters::elegoo {

    using core::printer::CanonicalStatus;
    using core::printer::JobResult;
    using core::printer::PrinterState;

    namespace {
        std::string topicOf(const nlohmann::json &message) {
            return fields::string(message, "Topic");
        }

        std::string newId() {
            static thread_local boost::uuids::random_generator generator;
            return boost::uuids::to_string(generator());
        }

        int firstInt(const nlohmann::json &j, const char *key) {
            if (!j.is_object()) return 0;
            auto it = j.find(key);
            if (it == j.end()) return 0;
            if (it->is_array()) {
                return !it->empty() && (*it)[0].is_number() ? (*it)[0].get<int>() : 0;
            }
            return it->is_number() ? it->get<int>() : 0;
        }
    }

    std::optional<SdcpStatus> parseStatusMessage(const nlohmann::json &message) {
        if (!message.is_object()) return std::nullopt;

        const nlohmann::json *statusBlock = &fields::object(message, "Status");
        if (statusBlock->empty()) {
            statusBlock = &fields::object(fields::object(message, "Data"), "Status");
        }
        if (statusBlock->empty()) return std::nullopt;
        const auto &s = *statusBlock;

        SdcpStatus status;
        status.mainboardId = fields::string(message, "MainboardID",
                                            fields::string(fields::object(message, "Data"), "MainboardID"));
        status.currentStatus = firstInt(s, "CurrentStatus");

        status.bedTemp = fields::number(s, "TempOfHotbed");
        status.bedTarget = fields::number(s, "TempTargetHotbed");
        status.nozzleTemp = fields::number(s, "TempOfNozzle");
        status.nozzleTarget = fields::number(s, "TempTargetNozzle");
        status.boxTemp = fields::optionalNumber(s, "TempOfBox");

        const auto &info = fields::object(s, "PrintInfo");
        status.printStatus = fields::integer(info, "Status");
        status.errorNumber = fields::integer(info, "ErrorNumber");
        status.filename = fields::string(info, "Filename");
        status.currentLayer = fields::integer(info, "CurrentLayer");
        status.totalLayers = fields::integer(info, "TotalLayer");
        status.currentTicks = fields::integer(info, "CurrentTicks");
        status.totalTicks = fields::integer(info, "TotalTicks");
        status.progress = fields::number(info, "Progress");

        return status;
    }

    CanonicalStatus SdcpStatus::toCanonical() const {
        CanonicalStatus status;

        if (printStatus == sdcp::PRINT_PRINTING || currentStatus == sdcp::MACHINE_PRINTING) {
            status.state = PrinterState::Printing;
        } else if (printStatus == sdcp::PRINT_PAUSED || printStatus == sdcp::PRINT_PAUSING) {
            status.state = PrinterState::Paused;
        } else if (printStatus == sdcp::PRINT_COMPLETE) {
            status.state = PrinterState::Idle;
            status.jobResult = JobResult::Completed;
        } else if (printStatus == sdcp::PRINT_STOPPING) {
            status.state = PrinterState::Idle;
            status.jobResult = JobResult::Cancelled;
        } else {
            status.state = PrinterState::Idle;
        }

        status.temperatures.bed = bedTemp;
        status.temperatures.bedTarget = bedTarget;
        status.temperatures.nozzle = nozzleTemp;
        status.temperatures.nozzleTarget = nozzleTarget;
        status.temperatures.chamber = boxTemp;

        status.filename = filename;
        status.currentLayer = currentLayer;
        status.totalLayers = totalLayers;
        status.progressPercent = std::clamp(progress, 0.0, 100.0);

        if (totalTicks > 0 && currentTicks > 0) {
            status.timeRemainingSeconds = std::max(0, totalTicks - currentTicks);
            status.printDurationSeconds = currentTicks;
        }

        if (errorNumber != 0) {
            status.deviceErrorCode = "sdcp:" + std::to_string(errorNumber);
            status.deviceErrorMessage = "Device error " + std::to_string(errorNumber);
        }
        return status;
    }

    std::optional<int> parseErrorMessage(const nlohmann::json &message) {
        if (topicOf(message).rfind("sdcp/error/", 0) != 0) return std::nullopt;

        const auto &data = fields::object(message, "Data");
        auto code = fields::optionalNumber(fields::object(data, "Data"), "ErrorCode");
        if (!code) code = fields::optionalNumber(data, "ErrorCode");
        if (!code) code = fields::optionalNumber(message, "ErrorCode");
        if (!code) return std::nullopt;
        return static_cast<int>(*code);
    }

    nlohmann::json buildCommand(int cmd, const std::string &mainboardId, const nlohmann::json &data) {
        auto timestamp = std::chrono::duration_cast<std::chrono::seconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
        return {
                {"Id", newId()},
                {"Data", {
                        {"Cmd", cmd},
                        {"Data", data},
                        {"RequestID", newId()},
                        {"MainboardID", mainboardId},
                        {"TimeStamp", timestamp},
                        {"From", 0}
                }},
                {"Topic", "sdcp/request/" + mainboardId}
        };
    }

    std::optional<DiscoveredPrinter> parseDiscoveryReply(const std::string &payload, const std::string &ip) {
        auto reply = nlohmann::json::parse(payload, nullptr, false);
        if (reply.is_discarded() || !reply.is_object()) return std::nullopt;

        const nlohmann::json *attrs = &reply;
        if (reply.contains("Data")) {
            const auto &data = fields::object(reply, "Data");
            attrs = data.contains("Attributes") ? &fields::object(data, "Attributes") : &data;
        }

        DiscoveredPrinter printer;
        printer.ip = ip;
        printer.name = fields::string(*attrs, "Name", "Unknown");
        printer.machineName = fields::string(*attrs, "MachineName");
        printer.brand = fields::string(*attrs, "BrandName", "ELEGOO");
        printer.mainboardId = fields::string(*attrs, "MainboardID");
        printer.firmware = fields::string(*attrs, "FirmwareVersion");
        printer.protocolVersion = fields::string(*attrs, "ProtocolVersion");
        return printer;
    }

} // namespace connector::adapters::elegoo
