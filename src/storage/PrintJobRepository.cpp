#include "storage/PrintJobRepository.hpp"

namespace storage {

    namespace {
        const char *SELECT_COLUMNS =
                "SELECT id, printer_id, job_name, filename, started_at, ended_at, status, total_layers, "
                "scheduled_job_id, error_code, duration_seconds FROM print_jobs ";
    }

    PrintJobRecord PrintJobRepository::readRow(const Statement &stmt) {
        PrintJobRecord record;
        record.id = stmt.columnInt64(0);
        record.printerId = stmt.columnInt(1);
        record.jobName = stmt.columnText(2);
        record.filename = stmt.columnText(3);
        record.startedAt = stmt.columnDouble(4);
        record.endedAt = stmt.optionalDouble(5);
        record.status = stmt.columnText(6);
        if (!stmt.isNull(7)) record.totalLayers = stmt.columnInt(7);
        record.scheduledJobId = stmt.optionalInt64(8);
        record.errorCode = stmt.columnText(9);
        record.durationSeconds = stmt.optionalInt64(10);
        return record;
    }

    int64_t PrintJobRepository::insertRunning(const PrintJobRecord &record) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT INTO print_jobs (printer_id, job_name, filename, started_at, status, total_layers, "
                "scheduled_job_id) VALUES (?, ?, ?, ?, 'running', ?, ?)");
        stmt.bind(1, record.printerId).bind(2, record.jobName).bind(3, record.filename)
                .bind(4, record.startedAt).bind(5, record.totalLayers).bind(6, record.scheduledJobId);
        stmt.run();
        return db_.lastInsertId();
    }

    std::optional<PrintJobRecord> PrintJobRepository::findOpen(int printerId) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(std::string(SELECT_COLUMNS) + "WHERE printer_id = ? AND ended_at IS NULL");
        stmt.bind(1, printerId);
        if (!stmt.step()) return std::nullopt;
        return readRow(stmt);
    }

    std::optional<PrintJobRecord> PrintJobRepository::find(int64_t id) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(std::string(SELECT_COLUMNS) + "WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) return std::nullopt;
        return readRow(stmt);
    }

    bool PrintJobRepository::close(int64_t id, double endedAt, const std::string &status,
                                   const std::string &errorCode) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "UPDATE print_jobs SET ended_at = ?, status = ?, error_code = ?, "
                "duration_seconds = CAST(MAX(0, ? - started_at) AS INTEGER) "
                "WHERE id = ? AND ended_at IS NULL");
        stmt.bind(1, endedAt).bind(2, status);
        if (errorCode.empty()) {
            stmt.bindNull(3);
        } else {
            stmt.bind(3, errorCode);
        }
        stmt.bind(4, endedAt).bind(5, id);
        stmt.run();
        return db_.changes() > 0;
    }

    int PrintJobRepository::countOpen(int printerId) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("SELECT COUNT(*) FROM print_jobs WHERE printer_id = ? AND ended_at IS NULL");
        stmt.bind(1, printerId);
        return stmt.step() ? stmt.columnInt(0) : 0;
    }

    std::vector<PrintJobRecord> PrintJobRepository::listForPrinter(int printerId, int limit) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(std::string(SELECT_COLUMNS) + "WHERE printer_id = ? ORDER BY id DESC LIMIT ?");
        stmt.bind(1, printerId).bind(2, limit);
        std::vector<PrintJobRecord> records;
        while (stmt.step()) {
            records.push_back(readRow(stmt));
        }
        return records;
    }

    JobTotals PrintJobRepository::totals() {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("SELECT status, COUNT(*) FROM print_jobs GROUP BY status");
        JobTotals totals;
        while (stmt.step()) {
            std::string status = stmt.columnText(0);
            int count = stmt.columnInt(1);
            if (status == job_status::RUNNING) totals.running = count;
            else if (status == job_status::COMPLETED) totals.completed = count;
            else if (status == job_status::FAILED) totals.failed = count;
            else if (status == job_status::CANCELLED) totals.cancelled = count;
        }
        return totals;
    }

} // namespace storage
