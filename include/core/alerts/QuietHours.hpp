#pragma once

#include <chrono>
#include <optional>
#include <utility>

#include "application/config/Settings.hpp"

namespace core::alerts {

    /**
     * @brief Local time-of-day window during which external channels stay silent.
     *
     * A window whose end is before its start wraps past midnight
     * (22:00-07:00). The start minute is inside the window, the end minute
     * is not. Equal start and end means no window.
     */
    class QuietHours {
    public:
        /**
         * @throws core::types::ConfigException when start or end is not HH:MM
         */
        explicit QuietHours(const config::QuietHoursConfig &config);

        bool enabled() const { return enabled_; }

        bool digestEnabled() const { return digestEnabled_; }

        bool isActive(int minutesOfDay) const;

        bool isActive(std::chrono::system_clock::time_point when) const;

        /**
         * @return [from, to) in epoch seconds of the latest window that ended at or before now
         */
        std::optional<std::pair<double, double>> lastWindow(std::chrono::system_clock::time_point now) const;

        static bool inWindow(int startMinute, int endMinute, int minute);

    private:
        bool enabled_;
        bool digestEnabled_;
        int startMinute_;
        int endMinute_;
    };

} // namespace core::alerts
