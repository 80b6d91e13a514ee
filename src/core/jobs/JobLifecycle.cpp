#include "core/jobs/JobLifecycle.hpp"
#include "core/events/EventTypes.hpp"
#include "core/types/Error.hpp"
#include "core/utils/Time.hpp"
#include "logger/Logger.hpp"

#include <cmath>

namespace core::jobs {

    using detector::LifecycleSignal;
    using detector::SignalKind;
    namespace event_types = events::types;

    namespace {
        std::string tag(const printer::PrinterEndpoint &printer) {
            return "[JobLifecycle:" + printer.name + "]";
        }

        nlohmann::json nullable(const std::optional<int64_t> &value) {
            return value ? nlohmann::json(*value) : nlohmann::json();
        }
    }

    JobLifecycle::JobLifecycle(storage::Database &db, events::EventBus &bus, JobLinker linker, Clock clock)
            : db_(db),
              bus_(bus),
              linker_(std::move(linker)),
              clock_(clock ? std::move(clock) : Clock([] {
                  return utils::toEpochSeconds(std::chrono::system_clock::now());
              })),
              jobs_(db),
              schedules_(db),
              printers_(db) {
    }

    std::optional<storage::PrintJobRecord> JobLifecycle::openJob(int printerId) {
        return jobs_.findOpen(printerId);
    }

    JobLifecycle::Statistics JobLifecycle::getStatistics() const {
        std::lock_guard lock(statsMutex_);
        return stats_;
    }

    nlohmann::json JobLifecycle::basePayload(const printer::PrinterEndpoint &printer) const {
        return {
                {"printer_id", printer.printerId},
                {"printer_name", printer.name},
                {"protocol", printer::protocolKindToString(printer.kind)}
        };
    }

    void JobLifecycle::handle(const printer::PrinterEndpoint &printer, const LifecycleSignal &signal) {
        try {
            switch (signal.kind) {
                case SignalKind::StateChanged: {
                    auto data = basePayload(printer);
                    data["from"] = detector::lifecycleStateToString(signal.from);
                    data["to"] = detector::lifecycleStateToString(signal.to);
                    data["status"] = signal.status.toJson();
                    printers_.touchLastSeen(printer.printerId, clock_());
                    bus_.publish(events::Event(event_types::PRINTER_STATE_CHANGED, "lifecycle", data));
                    break;
                }
                case SignalKind::JobStarted:
                    recordStart(printer, signal);
                    break;
                case SignalKind::JobProgress:
                    publishJobEvent(event_types::JOB_PROGRESS, printer, signal);
                    break;
                case SignalKind::JobPaused:
                    publishJobEvent(event_types::JOB_PAUSED, printer, signal);
                    break;
                case SignalKind::JobResumed:
                    publishJobEvent(event_types::JOB_RESUMED, printer, signal);
                    break;
                case SignalKind::JobCompleted:
                    recordEnd(printer, signal, signal.success ? storage::job_status::COMPLETED
                                                              : storage::job_status::FAILED);
                    break;
                case SignalKind::JobCancelled:
                    recordEnd(printer, signal, storage::job_status::CANCELLED);
                    break;
                case SignalKind::DeviceError:
                    recordDeviceError(printer, signal);
                    break;
                case SignalKind::DeviceErrorCleared:
                    printers_.clearError(printer.printerId);
                    Logger::logInfo(tag(printer) + " Device error cleared");
                    break;
            }
        } catch (const types::StorageException &e) {
            {
                std::lock_guard lock(statsMutex_);
                stats_.storageErrors++;
            }
            Logger::logError(tag(printer) + " " + detector::signalKindToString(signal.kind) +
                             " not recorded: " + e.what());
        }
    }

    void JobLifecycle::recordStart(const printer::PrinterEndpoint &printer, const LifecycleSignal &signal) {
        const auto &status = signal.status;
        const double now = clock_();
        const std::string jobName = status.displayName();

        storage::PrintJobRecord record;
        LinkResult link;
        {
            storage::Database::Transaction tx(db_);

            if (auto existing = jobs_.findOpen(printer.printerId)) {
                tx.commit();
                Logger::logWarning(tag(printer) + " Job " + std::to_string(existing->id) +
                                   " is still open, not opening another");
                return;
            }

            double cutoff = now - std::chrono::duration<double>(linker_.config().staleScheduleAge).count();
            auto swept = schedules_.sweepStale(printer.printerId, cutoff);
            if (!swept.empty()) {
                Logger::logInfo(tag(printer) + " Returned " + std::to_string(swept.size()) +
                                " stale scheduled job(s) to pending");
            }

            auto candidates = schedules_.candidatesFor(printer.printerId, linker_.config().candidateLimit);
            link = linker_.match(jobName, status.totalLayers, candidates, now);

            record.printerId = printer.printerId;
            record.jobName = jobName;
            record.filename = status.filename;
            record.startedAt = now;
            if (status.totalLayers > 0) record.totalLayers = status.totalLayers;
            record.scheduledJobId = link.scheduledJobId;
            record.id = jobs_.insertRunning(record);

            if (link.linked()) {
                schedules_.markPrinting(*link.scheduledJobId, now);
            }
            tx.commit();
        }

        if (link.linked()) {
            Logger::logInfo(tag(printer) + " Linked '" + jobName + "' to scheduled job " +
                            std::to_string(*link.scheduledJobId) + " by " + linkStrategyToString(link.strategy) +
                            " (" + link.detail + ")");
        } else {
            Logger::logInfo(tag(printer) + " '" + jobName + "' not linked: " + link.detail);
        }
        Logger::logInfo(tag(printer) + " Job started: " + jobName + " (id " + std::to_string(record.id) + ")");

        {
            std::lock_guard lock(statsMutex_);
            stats_.jobsStarted++;
            if (link.linked()) stats_.jobsLinked++;
        }

        auto data = basePayload(printer);
        data["print_job_id"] = record.id;
        data["job_name"] = jobName;
        data["filename"] = status.filename;
        data["total_layers"] = status.totalLayers;
        data["scheduled_job_id"] = nullable(link.scheduledJobId);
        data["link_strategy"] = linkStrategyToString(link.strategy);
        data["started_at"] = now;
        bus_.publish(events::Event(event_types::JOB_STARTED, "lifecycle", data));
    }

    void JobLifecycle::recordEnd(const printer::PrinterEndpoint &printer, const LifecycleSignal &signal,
                                 const std::string &status) {
        const double now = clock_();
        const bool failed = status == storage::job_status::FAILED;
        std::optional<storage::PrintJobRecord> closed;
        {
            storage::Database::Transaction tx(db_);

            auto open = jobs_.findOpen(printer.printerId);
            if (!open) {
                tx.commit();
                Logger::logInfo(tag(printer) + " No open job to close as " + status);
                return;
            }

            if (!jobs_.close(open->id, now, status, failed ? signal.errorCode : std::string())) {
                tx.commit();
                Logger::logInfo(tag(printer) + " Job " + std::to_string(open->id) + " already closed");
                return;
            }
            if (open->scheduledJobId) {
                schedules_.markFinished(*open->scheduledJobId, status, now);
            }
            tx.commit();
            closed = jobs_.find(open->id);
        }
        if (!closed) return;

        {
            std::lock_guard lock(statsMutex_);
            if (status == storage::job_status::COMPLETED) stats_.jobsCompleted++;
            else if (failed) stats_.jobsFailed++;
            else stats_.jobsCancelled++;
        }

        auto data = basePayload(printer);
        data["print_job_id"] = closed->id;
        data["job_name"] = closed->jobName;
        data["filename"] = closed->filename;
        data["status"] = status;
        data["success"] = status == storage::job_status::COMPLETED;
        data["progress"] = signal.status.progressPercent;
        data["started_at"] = closed->startedAt;
        data["ended_at"] = now;
        data["duration_seconds"] = nullable(closed->durationSeconds);
        data["scheduled_job_id"] = nullable(closed->scheduledJobId);
        data["error_code"] = closed->errorCode;
        data["reason"] = signal.reason;

        if (status == storage::job_status::CANCELLED) {
            Logger::logInfo(tag(printer) + " Job cancelled: " + closed->jobName + " (" + signal.reason + ")");
            bus_.publish(events::Event(event_types::JOB_CANCELLED, "lifecycle", data));
            return;
        }

        if (failed) {
            Logger::logWarning(tag(printer) + " Job failed: " + closed->jobName + " (" + signal.reason + ")");
        } else {
            Logger::logInfo(tag(printer) + " Job completed: " + closed->jobName);
        }
        bus_.publish(events::Event(event_types::JOB_COMPLETED, "lifecycle", data));
        if (failed) {
            bus_.publish(events::Event(event_types::JOB_FAILED, "lifecycle", data));
        }
    }

    void JobLifecycle::publishJobEvent(const char *type, const printer::PrinterEndpoint &printer,
                                       const LifecycleSignal &signal) {
        const auto &status = signal.status;
        auto data = basePayload(printer);
        auto open = jobs_.findOpen(printer.printerId);
        data["print_job_id"] = open ? nlohmann::json(open->id) : nlohmann::json();
        data["job_name"] = open ? open->jobName : status.displayName();
        data["progress"] = status.progressPercent;
        data["current_layer"] = status.currentLayer;
        data["total_layers"] = status.totalLayers;
        data["remaining_min"] = status.timeRemainingSeconds
                                ? nlohmann::json(static_cast<int>(std::lround(*status.timeRemainingSeconds / 60.0)))
                                : nlohmann::json();
        bus_.publish(events::Event(type, "lifecycle", data));
    }

    void JobLifecycle::recordDeviceError(const printer::PrinterEndpoint &printer, const LifecycleSignal &signal) {
        printers_.recordError(printer.printerId, signal.errorCode, signal.reason, clock_());
        Logger::logWarning(tag(printer) + " Device error " + signal.errorCode + ": " + signal.reason);

        auto data = basePayload(printer);
        data["error_code"] = signal.errorCode;
        data["message"] = signal.reason;
        data["print_stopping"] = signal.printStopping;
        data["state"] = detector::lifecycleStateToString(signal.to);
        bus_.publish(events::Event(event_types::PRINTER_ERROR, "lifecycle", data));
    }

} // namespace core::jobs
