#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "storage/Database.hpp"

namespace storage {

    namespace job_status {
        inline constexpr const char *RUNNING = "running";
        inline constexpr const char *COMPLETED = "completed";
        inline constexpr const char *FAILED = "failed";
        inline constexpr const char *CANCELLED = "cancelled";
    }

    struct PrintJobRecord {
        int64_t id = 0;
        int printerId = 0;
        std::string jobName;
        std::string filename;
        double startedAt = 0.0;
        std::optional<double> endedAt;
        std::string status = job_status::RUNNING;
        std::optional<int> totalLayers;
        std::optional<int64_t> scheduledJobId;
        std::string errorCode;
        std::optional<int64_t> durationSeconds;

        bool isOpen() const { return !endedAt.has_value(); }
    };

    struct JobTotals {
        int running = 0;
        int completed = 0;
        int failed = 0;
        int cancelled = 0;
    };

    class PrintJobRepository {
    public:
        explicit PrintJobRepository(Database &db) : db_(db) {}

        /**
         * @throws core::types::StorageException if the printer already has an open job
         */
        int64_t insertRunning(const PrintJobRecord &record);

        std::optional<PrintJobRecord> findOpen(int printerId);

        std::optional<PrintJobRecord> find(int64_t id);

        /**
         * @brief Set ended_at, status, error code and duration
         * @return false if the record was already closed
         */
        bool close(int64_t id, double endedAt, const std::string &status, const std::string &errorCode);

        int countOpen(int printerId);

        std::vector<PrintJobRecord> listForPrinter(int printerId, int limit = 50);

        JobTotals totals();

    private:
        Database &db_;

        static PrintJobRecord readRow(const Statement &stmt);
    };

} // namespace storage
