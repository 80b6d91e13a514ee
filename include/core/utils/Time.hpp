#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace utils {

    inline long long currentTimeMillis() {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::system_clock::now().time_since_epoch()).count();
    }

    inline double toEpochSeconds(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration<double>(tp.time_since_epoch()).count();
    }

    inline std::chrono::system_clock::time_point fromEpochSeconds(double seconds) {
        return std::chrono::system_clock::time_point(
                std::chrono::duration_cast<std::chrono::system_clock::duration>(
                        std::chrono::duration<double>(seconds)));
    }

    /**
     * @brief ISO-8601 UTC rendering, e.g. 2025-09-01T21:04:05Z
     */
    inline std::string formatUtc(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm utc{};
        gmtime_r(&t, &utc);
        std::ostringstream ss;
        ss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
        return ss.str();
    }

    /**
     * @brief Minutes elapsed since local midnight
     */
    inline int localMinutesOfDay(std::chrono::system_clock::time_point tp) {
        auto t = std::chrono::system_clock::to_time_t(tp);
        std::tm local{};
        localtime_r(&t, &local);
        return local.tm_hour * 60 + local.tm_min;
    }

    /**
     * @brief Parse "HH:MM" into minutes since midnight
     */
    inline std::optional<int> parseTimeOfDay(const std::string &text) {
        auto colon = text.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
            return std::nullopt;
        }
        try {
            size_t used = 0;
            int hours = std::stoi(text.substr(0, colon), &used);
            if (used != colon) return std::nullopt;
            std::string minutePart = text.substr(colon + 1);
            int minutes = std::stoi(minutePart, &used);
            if (used != minutePart.size()) return std::nullopt;
            if (hours < 0 || hours > 23 || minutes < 0 || minutes > 59) return std::nullopt;
            return hours * 60 + minutes;
        } catch (const std::exception &) {
            return std::nullopt;
        }
    }

}
