#pragma once

#include <chrono>
#include <string>

namespace core::config {

    struct StorageConfig {
        std::string path = "printfleet.db";
    };

    struct SupervisorConfig {
        std::chrono::seconds healthInterval{30};
        std::chrono::seconds discoveryInterval{60};
        std::chrono::milliseconds reconnectDelay{1000};
        std::chrono::seconds pushStaleness{60};
        std::chrono::seconds pullStaleness{120};
        std::chrono::seconds pollInterval{10};
        std::chrono::milliseconds connectTimeout{5000};
        std::chrono::seconds telemetryInterval{10};
    };

    struct DetectorConfig {
        double progressMinDelta = 1.0; // percentage points
        std::chrono::seconds progressMinInterval{5};
        std::string printStoppingCodes = "klippy:shutdown,klippy:error,sdcp:*";
    };

    struct LinkerConfig {
        std::chrono::hours staleScheduleAge{2};
        bool timeWindowFallback = false;
        int candidateLimit = 10;
    };

    struct SmtpConfig {
        bool enabled = false;
        std::string host;
        int port = 587;
        std::string username;
        std::string password;
        std::string fromAddress;
        bool useTls = true;
    };

    struct QuietHoursConfig {
        bool enabled = false;
        std::string start = "22:00";
        std::string end = "07:00";
        bool digestEnabled = false;
    };

    struct AlertConfig {
        std::chrono::seconds dedupWindow{300};
        QuietHoursConfig quietHours;
        SmtpConfig smtp;
        std::string pushGatewayUrl;
        long deliveryTimeoutMs = 10000;
    };

    struct RelayConfig {
        std::chrono::seconds ttl{60};
        std::chrono::seconds cleanupInterval{30};
    };

    struct LoggingConfig {
        std::string level = "INFO";
        std::string directory = "logs";
    };

} // namespace core::config
