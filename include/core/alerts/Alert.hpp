#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace core::alerts {

    enum class Severity {
        Info,
        Warning,
        Error,
        Critical
    };

    std::string severityToString(Severity severity);

    /**
     * @brief Unknown names read as Info
     */
    Severity severityFromString(const std::string &name);

    namespace alert_types {
        inline constexpr const char *PRINT_COMPLETE = "print_complete";
        inline constexpr const char *PRINT_FAILED = "print_failed";
        inline constexpr const char *PRINTER_ERROR = "printer_error";
        inline constexpr const char *PRINTER_OFFLINE = "printer_offline";
    }

    struct Alert {
        std::string type;
        Severity severity = Severity::Info;
        std::string title;
        std::string message;
        std::optional<int> printerId;
        std::optional<int64_t> jobId;
    };

} // namespace core::alerts
