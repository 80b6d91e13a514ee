#include "core/consumers/ArchiveWriter.hpp"
#include "core/events/EventTypes.hpp"
#include "core/types/Error.hpp"
#include "logger/Logger.hpp"

namespace core::consumers {

    namespace {
        const char *WATCHED[] = {
                events::types::JOB_COMPLETED,
                events::types::JOB_FAILED,
                events::types::JOB_CANCELLED
        };

        std::optional<double> optionalNumber(const nlohmann::json &data, const char *key) {
            auto it = data.find(key);
            if (it == data.end() || !it->is_number()) return std::nullopt;
            return it->get<double>();
        }
    }

    ArchiveWriter::ArchiveWriter(storage::Database &db)
            : archives_(db),
              observer_(events::makeObserver([this](const events::Event &event) { onJobClosed(event); })) {
    }

    void ArchiveWriter::attach(events::EventBus &bus) {
        for (const char *type: WATCHED) {
            bus.subscribe(type, observer_);
        }
    }

    void ArchiveWriter::detach(events::EventBus &bus) {
        for (const char *type: WATCHED) {
            bus.unsubscribe(type, observer_);
        }
    }

    void ArchiveWriter::onJobClosed(const events::Event &event) {
        const auto &data = event.data;
        if (!data.contains("print_job_id") || !data["print_job_id"].is_number_integer()) return;

        storage::ArchiveRecord record;
        record.printJobId = data["print_job_id"].get<int64_t>();
        record.printerId = data.value("printer_id", 0);
        record.jobName = data.value("job_name", "");
        record.status = data.value("status", "");
        record.success = data.value("success", false);
        record.startedAt = optionalNumber(data, "started_at");
        record.endedAt = optionalNumber(data, "ended_at");
        if (auto duration = optionalNumber(data, "duration_seconds")) {
            record.durationSeconds = static_cast<int64_t>(*duration);
        }
        record.errorCode = data.value("error_code", "");

        try {
            // job.completed and job.failed both arrive for a failure
            if (archives_.insertIfAbsent(record)) {
                archived_++;
                Logger::logDebug("[ArchiveWriter] Archived job " + std::to_string(record.printJobId));
            }
        } catch (const types::StorageException &e) {
            Logger::logError("[ArchiveWriter] Cannot archive job " + std::to_string(record.printJobId) + ": " +
                             e.what());
        }
    }

} // namespace core::consumers
