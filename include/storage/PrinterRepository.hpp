#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/printer/PrinterAdapter.hpp"
#include "storage/Database.hpp"

namespace storage {

    struct PrinterRecord {
        int id = 0;
        std::string name;
        std::string protocol;
        std::string host;
        int port = 0;
        std::string apiKey;
        std::string username;
        std::string password;
        std::string serial;
        bool enabled = true;

        std::string lastErrorCode;
        std::string lastErrorMessage;
        std::optional<double> lastErrorAt;
        std::optional<double> lastSeen;
    };

    struct CareCounters {
        double totalPrintHours = 0.0;
        int totalPrintCount = 0;
        double hoursSinceMaintenance = 0.0;
        int printsSinceMaintenance = 0;
    };

    class PrinterRepository {
    public:
        explicit PrinterRepository(Database &db) : db_(db) {}

        int insert(const PrinterRecord &record);

        std::vector<PrinterRecord> listEnabled();

        std::optional<PrinterRecord> find(int id);

        void recordError(int id, const std::string &code, const std::string &message, double at);

        void clearError(int id);

        void touchLastSeen(int id, double at);

        /**
         * @brief Add one successful print of the given length to the care counters
         */
        void addCompletedPrint(int id, double hours);

        CareCounters careCounters(int id);

        void resetMaintenance(int id);

        /**
         * @return nullopt when the stored protocol name is not supported
         */
        static std::optional<core::printer::PrinterEndpoint> toEndpoint(const PrinterRecord &record);

    private:
        Database &db_;

        static PrinterRecord readRow(const Statement &stmt);
    };

} // namespace storage
