#include "core/consumers/AlertRules.hpp"
#include "core/events/EventTypes.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace core::consumers {

    namespace event_types = events::types;

    namespace {
        const char *WATCHED[] = {
                event_types::JOB_COMPLETED,
                event_types::PRINTER_ERROR,
                event_types::PRINTER_DISCONNECTED
        };

        std::string text(const nlohmann::json &data, const char *key) {
            auto it = data.find(key);
            return it != data.end() && it->is_string() ? it->get<std::string>() : std::string();
        }

        std::optional<int> printerIdOf(const nlohmann::json &data) {
            auto it = data.find("printer_id");
            if (it == data.end() || !it->is_number_integer()) return std::nullopt;
            return it->get<int>();
        }

        std::optional<int64_t> jobIdOf(const nlohmann::json &data) {
            auto it = data.find("print_job_id");
            if (it == data.end() || !it->is_number_integer()) return std::nullopt;
            return it->get<int64_t>();
        }

        std::string percent(double value) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(0) << std::floor(value);
            return ss.str();
        }
    }

    AlertRules::AlertRules(alerts::AlertDispatcher &dispatcher)
            : dispatcher_(dispatcher),
              observer_(events::makeObserver([this](const events::Event &event) { onEvent(event); })) {
    }

    void AlertRules::attach(events::EventBus &bus) {
        for (const char *type: WATCHED) {
            bus.subscribe(type, observer_);
        }
    }

    void AlertRules::detach(events::EventBus &bus) {
        for (const char *type: WATCHED) {
            bus.unsubscribe(type, observer_);
        }
    }

    std::optional<alerts::Alert> AlertRules::alertFor(const events::Event &event) {
        const auto &data = event.data;
        const std::string printer = text(data, "printer_name");

        alerts::Alert alert;
        alert.printerId = printerIdOf(data);
        alert.jobId = jobIdOf(data);

        if (event.type == event_types::JOB_COMPLETED) {
            const std::string job = text(data, "job_name");
            if (data.value("success", false)) {
                alert.type = alerts::alert_types::PRINT_COMPLETE;
                alert.severity = alerts::Severity::Info;
                alert.title = "Print Complete: " + job + " (" + printer + ")";
                alert.message = "Job '" + job + "' finished on " + printer + ".";
                return alert;
            }

            alert.type = alerts::alert_types::PRINT_FAILED;
            alert.severity = alerts::Severity::Critical;
            alert.title = "Print Failed: " + job + " (" + printer + ")";
            alert.message = "Job '" + job + "' failed on " + printer + " at " +
                            percent(data.value("progress", 0.0)) + "% progress.";
            std::string code = text(data, "error_code");
            if (!code.empty()) alert.message += " Error: " + code;
            return alert;
        }

        if (event.type == event_types::PRINTER_ERROR) {
            // Recoverable device warnings stay on the printer record only
            if (!data.value("print_stopping", false)) return std::nullopt;
            alert.type = alerts::alert_types::PRINTER_ERROR;
            alert.severity = alerts::Severity::Error;
            alert.title = "Printer Error: " + printer;
            alert.message = text(data, "error_code");
            std::string message = text(data, "message");
            if (!message.empty()) alert.message += ": " + message;
            return alert;
        }

        if (event.type == event_types::PRINTER_DISCONNECTED) {
            alert.type = alerts::alert_types::PRINTER_OFFLINE;
            alert.severity = alerts::Severity::Warning;
            alert.title = "Printer Offline: " + printer;
            std::string reason = text(data, "reason");
            alert.message = printer + " is unreachable" + (reason.empty() ? "." : ": " + reason);
            return alert;
        }

        return std::nullopt;
    }

    void AlertRules::onEvent(const events::Event &event) {
        if (auto alert = alertFor(event)) {
            dispatcher_.dispatch(*alert);
        }
    }

} // namespace core::consumers
