#include "storage/ArchiveRepository.hpp"

namespace storage {

    bool ArchiveRepository::insertIfAbsent(const ArchiveRecord &record) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT OR IGNORE INTO print_archives (print_job_id, printer_id, job_name, status, success, "
                "started_at, ended_at, duration_seconds, error_code) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, record.printJobId).bind(2, record.printerId).bind(3, record.jobName).bind(4, record.status)
                .bind(5, record.success ? 1 : 0).bind(6, record.startedAt).bind(7, record.endedAt)
                .bind(8, record.durationSeconds);
        if (record.errorCode.empty()) {
            stmt.bindNull(9);
        } else {
            stmt.bind(9, record.errorCode);
        }
        stmt.run();
        return db_.changes() > 0;
    }

    std::optional<ArchiveRecord> ArchiveRepository::findByJob(int64_t printJobId) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "SELECT id, print_job_id, printer_id, job_name, status, success, started_at, ended_at, "
                "duration_seconds, error_code FROM print_archives WHERE print_job_id = ?");
        stmt.bind(1, printJobId);
        if (!stmt.step()) return std::nullopt;

        ArchiveRecord record;
        record.id = stmt.columnInt64(0);
        record.printJobId = stmt.columnInt64(1);
        record.printerId = stmt.columnInt(2);
        record.jobName = stmt.columnText(3);
        record.status = stmt.columnText(4);
        record.success = stmt.columnInt(5) != 0;
        record.startedAt = stmt.optionalDouble(6);
        record.endedAt = stmt.optionalDouble(7);
        record.durationSeconds = stmt.optionalInt64(8);
        record.errorCode = stmt.columnText(9);
        return record;
    }

    int ArchiveRepository::count() {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("SELECT COUNT(*) FROM print_archives");
        return stmt.step() ? stmt.columnInt(0) : 0;
    }

} // namespace storage
