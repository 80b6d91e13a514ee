#pragma once

namespace core::events::types {

    // Printer telemetry and connectivity
    inline constexpr const char *PRINTER_STATE_CHANGED = "printer.state_changed";
    inline constexpr const char *PRINTER_CONNECTED = "printer.connected";
    inline constexpr const char *PRINTER_DISCONNECTED = "printer.disconnected";
    inline constexpr const char *PRINTER_ERROR = "printer.error";
    inline constexpr const char *PRINTER_TELEMETRY = "printer.telemetry";

    // Job lifecycle
    inline constexpr const char *JOB_STARTED = "job.started";
    inline constexpr const char *JOB_PROGRESS = "job.progress";
    inline constexpr const char *JOB_PAUSED = "job.paused";
    inline constexpr const char *JOB_RESUMED = "job.resumed";
    inline constexpr const char *JOB_COMPLETED = "job.completed";
    inline constexpr const char *JOB_FAILED = "job.failed";
    inline constexpr const char *JOB_CANCELLED = "job.cancelled";

    inline constexpr const char *ALERT_DISPATCHED = "notifications.alert_dispatched";
    inline constexpr const char *FLEET_SUMMARY = "fleet.summary";

    inline constexpr const char *WILDCARD = "*";

}
