#include "core/alerts/QuietHours.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Time.hpp"

#include <ctime>

namespace core::alerts {

    namespace {
        constexpr int MINUTES_PER_DAY = 24 * 60;

        int parseOrThrow(const std::string &text, const char *field) {
            auto minutes = utils::parseTimeOfDay(text);
            if (!minutes) {
                throw types::ConfigException(std::string("quiet hours ") + field + " '" + text +
                                             "' is not HH:MM");
            }
            return *minutes;
        }
    }

    QuietHours::QuietHours(const config::QuietHoursConfig &config)
            : enabled_(config.enabled),
              digestEnabled_(config.digestEnabled),
              startMinute_(parseOrThrow(config.start, "start")),
              endMinute_(parseOrThrow(config.end, "end")) {
    }

    bool QuietHours::inWindow(int startMinute, int endMinute, int minute) {
        if (startMinute == endMinute) return false;
        if (startMinute < endMinute) {
            return minute >= startMinute && minute < endMinute;
        }
        return minute >= startMinute || minute < endMinute;
    }

    bool QuietHours::isActive(int minutesOfDay) const {
        return enabled_ && inWindow(startMinute_, endMinute_, minutesOfDay);
    }

    bool QuietHours::isActive(std::chrono::system_clock::time_point when) const {
        return isActive(utils::localMinutesOfDay(when));
    }

    std::optional<std::pair<double, double>> QuietHours::lastWindow(std::chrono::system_clock::time_point now) const {
        if (!enabled_ || startMinute_ == endMinute_) return std::nullopt;

        auto t = std::chrono::system_clock::to_time_t(now);
        std::tm local{};
        localtime_r(&t, &local);
        local.tm_hour = endMinute_ / 60;
        local.tm_min = endMinute_ % 60;
        local.tm_sec = 0;
        local.tm_isdst = -1;

        double end = static_cast<double>(std::mktime(&local));
        double nowSeconds = utils::toEpochSeconds(now);
        if (end > nowSeconds) {
            end -= MINUTES_PER_DAY * 60.0;
        }

        int length = (endMinute_ - startMinute_ + MINUTES_PER_DAY) % MINUTES_PER_DAY;
        return std::make_pair(end - length * 60.0, end);
    }

} // namespace core::alerts
