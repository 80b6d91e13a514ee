#include "storage/RelayRepository.hpp"

namespace storage {

    int64_t RelayRepository::append(const std::string &eventType, const std::string &data, double createdAt) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("INSERT INTO ws_events (event_type, data, created_at) VALUES (?, ?, ?)");
        stmt.bind(1, eventType).bind(2, data).bind(3, createdAt);
        stmt.run();
        return db_.lastInsertId();
    }

    std::vector<RelayRow> RelayRepository::readSince(int64_t lastId, int limit) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "SELECT id, event_type, data, created_at FROM ws_events WHERE id > ? ORDER BY id ASC LIMIT ?");
        stmt.bind(1, lastId).bind(2, limit);
        std::vector<RelayRow> rows;
        while (stmt.step()) {
            RelayRow row;
            row.id = stmt.columnInt64(0);
            row.eventType = stmt.columnText(1);
            row.data = stmt.columnText(2);
            row.createdAt = stmt.columnDouble(3);
            rows.push_back(std::move(row));
        }
        return rows;
    }

    int RelayRepository::pruneOlderThan(double cutoff) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("DELETE FROM ws_events WHERE created_at < ?");
        stmt.bind(1, cutoff);
        stmt.run();
        return db_.changes();
    }

    int RelayRepository::count() {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("SELECT COUNT(*) FROM ws_events");
        return stmt.step() ? stmt.columnInt(0) : 0;
    }

} // namespace storage
