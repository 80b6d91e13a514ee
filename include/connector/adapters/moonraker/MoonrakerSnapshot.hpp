#pragma once

#include <optional>
#include <string>
#include <nlohmann/json.hpp>

#include "core/printer/CanonicalStatus.hpp"

namespace connector::adapters::moonraker {

    /**
     * @brief Klipper object state accumulated from subscription deltas.
     *
     * Moonraker only sends the fields that changed, so each field keeps its
     * last known value until a delta overwrites it. Fields never seen stay
     * empty and map to safe defaults in toCanonical().
     */
    struct MoonrakerSnapshot {
        // print_stats
        std::optional<std::string> printState;
        std::optional<std::string> filename;
        std::optional<std::string> printMessage;
        std::optional<double> printDuration;
        std::optional<int> currentLayer;
        std::optional<int> totalLayer;

        // virtual_sdcard / display_status
        std::optional<double> sdcardProgress;
        std::optional<double> displayProgress;

        // heaters
        std::optional<double> bedTemp;
        std::optional<double> bedTarget;
        std::optional<double> nozzleTemp;
        std::optional<double> nozzleTarget;

        // webhooks (klippy host state)
        std::optional<std::string> klippyState;
        std::optional<std::string> klippyMessage;

        // set from notify_klippy_* notifications
        std::string klippyNotice;

        /**
         * @brief Merge one "objects" map, as found in notify_status_update
         * params[0] or the subscribe reply's result.status
         * @return number of fields updated
         */
        size_t applyDelta(const nlohmann::json &objects);

        core::printer::CanonicalStatus toCanonical() const;

        /**
         * @brief Objects requested in printer.objects.subscribe
         */
        static nlohmann::json subscriptionObjects();
    };

} // namespace connector::adapters::moonraker
