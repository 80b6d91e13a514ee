#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "storage/Database.hpp"

namespace storage {

    struct RelayRow {
        int64_t id = 0;
        std::string eventType;
        std::string data; // JSON payload
        double createdAt = 0.0;
    };

    /**
     * @brief Append-only ws_events table read by pollers in other processes
     */
    class RelayRepository {
    public:
        explicit RelayRepository(Database &db) : db_(db) {}

        int64_t append(const std::string &eventType, const std::string &data, double createdAt);

        /**
         * @brief Rows with id greater than lastId, oldest first
         */
        std::vector<RelayRow> readSince(int64_t lastId, int limit = 500);

        /**
         * @return number of rows removed
         */
        int pruneOlderThan(double cutoff);

        int count();

    private:
        Database &db_;
    };

} // namespace storage
