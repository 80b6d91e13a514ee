#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "application/config/Settings.hpp"
#include "storage/ScheduleRepository.hpp"

namespace core::jobs {

    enum class LinkStrategy {
        None,
        Name,
        LayerCount,
        TimeWindow
    };

    std::string linkStrategyToString(LinkStrategy strategy);

    struct LinkResult {
        std::optional<int64_t> scheduledJobId;
        LinkStrategy strategy = LinkStrategy::None;
        std::string detail;

        bool linked() const { return scheduledJobId.has_value(); }
    };

    /**
     * @brief Associates an observed print start with a scheduled job.
     *
     * Strategies run in order: name containment, unique layer count, and
     * (when enabled) the sole scheduled job near the current time. An
     * ambiguous match is never guessed.
     */
    class JobLinker {
    public:
        explicit JobLinker(config::LinkerConfig config = {});

        LinkResult match(const std::string &observedName, int totalLayers,
                         const std::vector<storage::ScheduledJob> &candidates, double nowEpoch) const;

        /**
         * @brief Lowercase and drop .3mf/.gcode/.bgcode so file and item names compare
         */
        static std::string normalize(const std::string &name);

        const config::LinkerConfig &config() const { return config_; }

    private:
        config::LinkerConfig config_;

        static std::optional<int64_t> matchByName(const std::string &observed,
                                                  const std::vector<storage::ScheduledJob> &candidates,
                                                  std::string &detail);

        static std::optional<int64_t> matchByLayers(int totalLayers,
                                                    const std::vector<storage::ScheduledJob> &candidates,
                                                    std::string &detail);

        static std::optional<int64_t> matchByTimeWindow(int totalLayers, double nowEpoch,
                                                        const std::vector<storage::ScheduledJob> &candidates,
                                                        std::string &detail);
    };

} // namespace core::jobs
