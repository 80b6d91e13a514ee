#include "core/alerts/Alert.hpp"

namespace core::alerts {

    std::string severityToString(Severity severity) {
        switch (severity) {
            case Severity::Info:
                return "info";
            case Severity::Warning:
                return "warning";
            case Severity::Error:
                return "error";
            case Severity::Critical:
                return "critical";
        }
        return "info";
    }

    Severity severityFromString(const std::string &name) {
        if (name == "warning") return Severity::Warning;
        if (name == "error") return Severity::Error;
        if (name == "critical") return Severity::Critical;
        return Severity::Info;
    }

} // namespace core::alerts
