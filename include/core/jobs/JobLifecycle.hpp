#pragma once

#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "core/detector/StateTransitionDetector.hpp"
#include "core/events/EventSystem.hpp"
#include "core/jobs/JobLinker.hpp"
#include "core/printer/PrinterAdapter.hpp"
#include "storage/Database.hpp"
#include "storage/PrintJobRepository.hpp"
#include "storage/PrinterRepository.hpp"
#include "storage/ScheduleRepository.hpp"

namespace core::jobs {

    /**
     * @brief Turns detector signals into persisted job records and bus events.
     *
     * Every mutation commits before the matching event is published, so a
     * consumer that reads the database from its handler sees the change.
     * Opening a job and closing a linked job each run in one transaction
     * together with the schedule update.
     */
    class JobLifecycle {
    public:
        using Clock = std::function<double()>; // epoch seconds

        JobLifecycle(storage::Database &db, events::EventBus &bus, JobLinker linker, Clock clock = {});

        /**
         * @brief The open record for a printer, used to seed its detector
         */
        std::optional<storage::PrintJobRecord> openJob(int printerId);

        /**
         * @brief Apply one signal; storage failures are logged and rolled back
         */
        void handle(const printer::PrinterEndpoint &printer, const detector::LifecycleSignal &signal);

        struct Statistics {
            size_t jobsStarted = 0;
            size_t jobsCompleted = 0;
            size_t jobsFailed = 0;
            size_t jobsCancelled = 0;
            size_t jobsLinked = 0;
            size_t storageErrors = 0;
        };

        Statistics getStatistics() const;

    private:
        storage::Database &db_;
        events::EventBus &bus_;
        JobLinker linker_;
        Clock clock_;

        storage::PrintJobRepository jobs_;
        storage::ScheduleRepository schedules_;
        storage::PrinterRepository printers_;

        mutable std::mutex statsMutex_;
        Statistics stats_;

        void recordStart(const printer::PrinterEndpoint &printer, const detector::LifecycleSignal &signal);

        void recordEnd(const printer::PrinterEndpoint &printer, const detector::LifecycleSignal &signal,
                       const std::string &status);

        void publishJobEvent(const char *type, const printer::PrinterEndpoint &printer,
                             const detector::LifecycleSignal &signal);

        void recordDeviceError(const printer::PrinterEndpoint &printer, const detector::LifecycleSignal &signal);

        nlohmann::json basePayload(const printer::PrinterEndpoint &printer) const;
    };

} // namespace core::jobs
