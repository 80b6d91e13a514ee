#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "storage/Database.hpp"

namespace storage {

    struct ArchiveRecord {
        int64_t id = 0;
        int64_t printJobId = 0;
        int printerId = 0;
        std::string jobName;
        std::string status;
        bool success = false;
        std::optional<double> startedAt;
        std::optional<double> endedAt;
        std::optional<int64_t> durationSeconds;
        std::string errorCode;
    };

    class ArchiveRepository {
    public:
        explicit ArchiveRepository(Database &db) : db_(db) {}

        /**
         * @return false if the job was already archived
         */
        bool insertIfAbsent(const ArchiveRecord &record);

        std::optional<ArchiveRecord> findByJob(int64_t printJobId);

        int count();

    private:
        Database &db_;
    };

} // namespace storage
