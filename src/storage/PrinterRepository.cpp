#include "storage/PrinterRepository.hpp"

namespace storage {

    namespace {
        const char *SELECT_COLUMNS =
                "SELECT id, name, protocol, host, port, api_key, username, password, serial, enabled, "
                "last_error_code, last_error_message, last_error_at, last_seen FROM printers ";
    }

    PrinterRecord PrinterRepository::readRow(const Statement &stmt) {
        PrinterRecord record;
        record.id = stmt.columnInt(0);
        record.name = stmt.columnText(1);
        record.protocol = stmt.columnText(2);
        record.host = stmt.columnText(3);
        record.port = stmt.columnInt(4);
        record.apiKey = stmt.columnText(5);
        record.username = stmt.columnText(6);
        record.password = stmt.columnText(7);
        record.serial = stmt.columnText(8);
        record.enabled = stmt.columnInt(9) != 0;
        record.lastErrorCode = stmt.columnText(10);
        record.lastErrorMessage = stmt.columnText(11);
        record.lastErrorAt = stmt.optionalDouble(12);
        record.lastSeen = stmt.optionalDouble(13);
        return record;
    }

    int PrinterRepository::insert(const PrinterRecord &record) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "INSERT INTO printers (name, protocol, host, port, api_key, username, password, serial, enabled) "
                "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        stmt.bind(1, record.name).bind(2, record.protocol).bind(3, record.host).bind(4, record.port)
                .bind(5, record.apiKey).bind(6, record.username).bind(7, record.password)
                .bind(8, record.serial).bind(9, record.enabled ? 1 : 0);
        stmt.run();
        return static_cast<int>(db_.lastInsertId());
    }

    std::vector<PrinterRecord> PrinterRepository::listEnabled() {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(std::string(SELECT_COLUMNS) + "WHERE enabled = 1 ORDER BY id");
        std::vector<PrinterRecord> records;
        while (stmt.step()) {
            records.push_back(readRow(stmt));
        }
        return records;
    }

    std::optional<PrinterRecord> PrinterRepository::find(int id) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(std::string(SELECT_COLUMNS) + "WHERE id = ?");
        stmt.bind(1, id);
        if (!stmt.step()) return std::nullopt;
        return readRow(stmt);
    }

    void PrinterRepository::recordError(int id, const std::string &code, const std::string &message, double at) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "UPDATE printers SET last_error_code = ?, last_error_message = ?, last_error_at = ? WHERE id = ?");
        stmt.bind(1, code).bind(2, message).bind(3, at).bind(4, id);
        stmt.run();
    }

    void PrinterRepository::clearError(int id) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "UPDATE printers SET last_error_code = NULL, last_error_message = NULL, last_error_at = NULL "
                "WHERE id = ? AND last_error_code IS NOT NULL");
        stmt.bind(1, id);
        stmt.run();
    }

    void PrinterRepository::touchLastSeen(int id, double at) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare("UPDATE printers SET last_seen = ? WHERE id = ?");
        stmt.bind(1, at).bind(2, id);
        stmt.run();
    }

    void PrinterRepository::addCompletedPrint(int id, double hours) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "UPDATE printers SET total_print_hours = total_print_hours + ?, "
                "total_print_count = total_print_count + 1, "
                "hours_since_maintenance = hours_since_maintenance + ?, "
                "prints_since_maintenance = prints_since_maintenance + 1 WHERE id = ?");
        stmt.bind(1, hours).bind(2, hours).bind(3, id);
        stmt.run();
    }

    CareCounters PrinterRepository::careCounters(int id) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "SELECT total_print_hours, total_print_count, hours_since_maintenance, prints_since_maintenance "
                "FROM printers WHERE id = ?");
        stmt.bind(1, id);
        CareCounters counters;
        if (stmt.step()) {
            counters.totalPrintHours = stmt.columnDouble(0);
            counters.totalPrintCount = stmt.columnInt(1);
            counters.hoursSinceMaintenance = stmt.columnDouble(2);
            counters.printsSinceMaintenance = stmt.columnInt(3);
        }
        return counters;
    }

    void PrinterRepository::resetMaintenance(int id) {
        std::lock_guard lock(db_.mutex());
        auto stmt = db_.prepare(
                "UPDATE printers SET hours_since_maintenance = 0, prints_since_maintenance = 0 WHERE id = ?");
        stmt.bind(1, id);
        stmt.run();
    }

    std::optional<core::printer::PrinterEndpoint> PrinterRepository::toEndpoint(const PrinterRecord &record) {
        auto kind = core::printer::protocolKindFromString(record.protocol);
        if (!kind) return std::nullopt;

        core::printer::PrinterEndpoint endpoint;
        endpoint.printerId = record.id;
        endpoint.name = record.name;
        endpoint.kind = *kind;
        endpoint.host = record.host;
        endpoint.port = record.port;
        endpoint.apiKey = record.apiKey;
        endpoint.username = record.username;
        endpoint.password = record.password;
        endpoint.serial = record.serial;
        return endpoint;
    }

} // namespace storage
