#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "core/printer/CanonicalStatus.hpp"

namespace connector::adapters::elegoo {

    namespace sdcp {
        // Cmd codes
        inline constexpr int STATUS_REQUEST = 0;
        inline constexpr int PAUSE_PRINT = 129;
        inline constexpr int STOP_PRINT = 130;
        inline constexpr int RESUME_PRINT = 131;
        inline constexpr int SET_PRINT_SPEED = 403;

        // Status.CurrentStatus
        inline constexpr int MACHINE_PRINTING = 1;

        // Status.PrintInfo.Status
        inline constexpr int PRINT_PAUSED = 5;
        inline constexpr int PRINT_PAUSING = 6;
        inline constexpr int PRINT_STOPPING = 7;
        inline constexpr int PRINT_PRINTING = 8;
        inline constexpr int PRINT_COMPLETE = 16;

        inline constexpr int DISCOVERY_PORT = 3000;
        inline constexpr int WEBSOCKET_PORT = 3030;
        inline constexpr const char *DISCOVERY_PROBE = "M99999";
    }

    /**
     * @brief One full SDCP status push, decoded
     */
    struct SdcpStatus {
        std::string mainboardId;
        int currentStatus = 0;
        int printStatus = 0;
        int errorNumber = 0;

        double bedTemp = 0.0;
        double bedTarget = 0.0;
        double nozzleTemp = 0.0;
        double nozzleTarget = 0.0;
        std::optional<double> boxTemp;

        std::string filename;
        int currentLayer = 0;
        int totalLayers = 0;
        int currentTicks = 0;
        int totalTicks = 0;
        double progress = 0.0;

        core::printer::CanonicalStatus toCanonical() const;
    };

    struct DiscoveredPrinter {
        std::string ip;
        std::string name;
        std::string machineName;
        std::string brand;
        std::string mainboardId;
        std::string firmware;
        std::string protocolVersion;
    };

    /**
     * @brief Decode an sdcp/status message
     * @return nullopt when the message carries no Status block
     */
    std::optional<SdcpStatus> parseStatusMessage(const nlohmann::json &message);

    /**
     * @brief Error number from an sdcp/error message, nullopt for other topics
     */
    std::optional<int> parseErrorMessage(const nlohmann::json &message);

    /**
     * @brief Build an sdcp/request envelope for the given mainboard
     */
    nlohmann::json buildCommand(int cmd, const std::string &mainboardId,
                                const nlohmann::json &data = nlohmann::json::object());

    /**
     * @brief Decode one UDP discovery reply, nullopt if it is not SDCP JSON
     */
    std::optional<DiscoveredPrinter> parseDiscoveryReply(const std::string &payload, const std::string &ip);

} // namespace connector::adapters::elegoo
