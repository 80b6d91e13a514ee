#include "storage/ScheduleRepository.hpp"

namespace storage {

    namespace {
        const char *SELECT_COLUMNS =
                "SELECT id, printer_id, item_name, model_name, filename, layer_count, status, scheduled_start, "
                "actual_start, actual_end, duration_hours FROM scheduled_jobs ";
    }

    ScheduledJob ScheduleRepository::readRow(const Statement &stmt) {
        ScheduledJob job;
        job.id = stmt.columnInt64(0);
        if (!stmt.isNull(1)) job.printerId = stmt.columnInt(1);
        job.itemName = stmt.columnText(2);
        job.modelName = stmt.columnText(3);
        job.filename = stmt.columnText(4);
        if (!stmt.isNull(5)) job.layerCount = stmt.columnInt(5);
        job.status = stmt.columnText(6);
        job.scheduledStart = stmt.optionalDouble(7);
        job.actualStart = stmt.optionalDouble(8);
        job.actualEnd = stmt.optionalDouble(9);
        job.durationHours = stmt.optionalDouble(10);
        return job;
    }

    int64_t ScheduleRepository::insert(const ScheduledJob &job) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT INTO scheduled_jobs (printer_id, item_name, model_name, filename, layer_count, status, "
                "scheduled_start) VALUES (?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, job.printerId).bind(2, job.itemName).bind(3, job.modelName).bind(4, job.filename)
                .bind(5, job.layerCount).bind(6, job.status).bind(7, job.scheduledStart);
        stmt.run();
        return db_.lastInsertId();
    }

    std::optional<ScheduledJob> ScheduleRepository::find(int64_t id) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(std::string(SELECT_COLUMNS) + "WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) return std::nullopt;
        return readRow(stmt);
    }

    std::vector<ScheduledJob> ScheduleRepository::candidatesFor(int printerId, int limit) {
        std::lock_guard lock(db_.mutex());
        // NULL starts sort last
        auto stmt = db_.prepare(std::string(SELECT_COLUMNS) +
                                "WHERE printer_id = ? AND status IN ('scheduled', 'pending') "
                                "ORDER BY scheduled_start IS NULL, scheduled_start ASC, id ASC LIMIT ?");
        stmt.bind(1, printerId).bind(2, limit);
        std::vector<ScheduledJob> jobs;
        while (stmt.step()) {
            jobs.push_back(readRow(stmt));
        }
        return jobs;
    }

    std::vector<ScheduledJob> ScheduleRepository::sweepStale(int printerId, double cutoff) {
        std::lock_guard lock(db_.mutex());
        std::vector<ScheduledJob> stale;
        {
            auto select = db_.prepare(std::string(SELECT_COLUMNS) +
                                      "WHERE printer_id = ? AND status = 'scheduled' AND scheduled_start < ?");
            select.bind(1, printerId).bind(2, cutoff);
            while (select.step()) {
                stale.push_back(readRow(select));
            }
        }
        if (stale.empty()) return stale;

        auto update = db_.prepare(
                "UPDATE scheduled_jobs SET status = 'pending', printer_id = NULL, scheduled_start = NULL "
                "WHERE id = ?");
        for (const auto &job: stale) {
            update.bind(1, job.id);
            update.run();
            update.reset();
        }
        return stale;
    }

    void ScheduleRepository::markPrinting(int64_t id, double startedAt) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "UPDATE scheduled_jobs SET status = 'printing', actual_start = COALESCE(actual_start, ?) "
                "WHERE id = ?");
        stmt.bind(1, startedAt).bind(2, id);
        stmt.run();
    }

    void ScheduleRepository::markFinished(int64_t id, const std::string &status, double endedAt) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "UPDATE scheduled_jobs SET status = ?, actual_end = ?, "
                "duration_hours = CASE WHEN actual_start IS NULL THEN NULL "
                "ELSE ROUND((? - actual_start) / 3600.0, 4) END WHERE id = ?");
        stmt.bind(1, status).bind(2, endedAt).bind(3, endedAt).bind(4, id);
        stmt.run();
    }

} // namespace storage
