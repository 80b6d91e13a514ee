#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "storage/Database.hpp"

namespace storage {

    /**
     * @brief A job the scheduling collaborator placed (or will place) on a printer
     */
    struct ScheduledJob {
        int64_t id = 0;
        std::optional<int> printerId;
        std::string itemName;
        std::string modelName;
        std::string filename;
        std::optional<int> layerCount;
        std::string status = "pending";
        std::optional<double> scheduledStart;
        std::optional<double> actualStart;
        std::optional<double> actualEnd;
        std::optional<double> durationHours;
    };

    class ScheduleRepository {
    public:
        explicit ScheduleRepository(Database &db) : db_(db) {}

        int64_t insert(const ScheduledJob &job);

        std::optional<ScheduledJob> find(int64_t id);

        /**
         * @brief Scheduled or pending jobs assigned to a printer, earliest start first
         */
        std::vector<ScheduledJob> candidatesFor(int printerId, int limit = 10);

        /**
         * @brief Return 'scheduled' jobs whose start is older than cutoff to the pending pool
         * @return the jobs that were swept
         */
        std::vector<ScheduledJob> sweepStale(int printerId, double cutoff);

        void markPrinting(int64_t id, double startedAt);

        /**
         * @brief Set the final status, actual_end and duration_hours
         */
        void markFinished(int64_t id, const std::string &status, double endedAt);

    private:
        Database &db_;

        static ScheduledJob readRow(const Statement &stmt);
    };

} // namespace storage
