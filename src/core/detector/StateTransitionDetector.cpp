#include "core/detector/StateTransitionDetector.hpp"
#include "logger/Logger.hpp"

#include <cmath>

namespace core::detector {

    using printer::CanonicalStatus;
    using printer::JobResult;
    using printer::PrinterState;

    std::string lifecycleStateToString(LifecycleState state) {
        switch (state) {
            case LifecycleState::Idle:
                return "IDLE";
            case LifecycleState::Printing:
                return "PRINTING";
            case LifecycleState::Paused:
                return "PAUSED";
            case LifecycleState::Finish:
                return "FINISH";
            case LifecycleState::Failed:
                return "FAILED";
            case LifecycleState::Offline:
                return "OFFLINE";
            case LifecycleState::Unknown:
                return "UNKNOWN";
        }
        return "UNKNOWN";
    }

    std::string signalKindToString(SignalKind kind) {
        switch (kind) {
            case SignalKind::StateChanged:
                return "state_changed";
            case SignalKind::JobStarted:
                return "job_started";
            case SignalKind::JobProgress:
                return "job_progress";
            case SignalKind::JobPaused:
                return "job_paused";
            case SignalKind::JobResumed:
                return "job_resumed";
            case SignalKind::JobCompleted:
                return "job_completed";
            case SignalKind::JobCancelled:
                return "job_cancelled";
            case SignalKind::DeviceError:
                return "device_error";
            case SignalKind::DeviceErrorCleared:
                return "device_error_cleared";
        }
        return "unknown";
    }

    StateTransitionDetector::StateTransitionDetector(int printerId, PrintStoppingCodes stoppingCodes,
                                                     config::DetectorConfig config)
            : printerId_(printerId),
              stoppingCodes_(std::move(stoppingCodes)),
              config_(std::move(config)) {
    }

    void StateTransitionDetector::seed(bool jobOpen, double progressPercent) {
        jobOpen_ = jobOpen;
        lastProgress_ = progressPercent;
        if (jobOpen) {
            Logger::logInfo("[Detector] Printer " + std::to_string(printerId_) + " resumes with an open job");
        }
    }

    LifecycleState StateTransitionDetector::classify(const CanonicalStatus &status, bool wasActive) const {
        // Firmware updates the top-level state seconds after a fatal error
        if ((status.isActive() || wasActive) && stoppingCodes_.matches(status.deviceErrorCode)) {
            return LifecycleState::Failed;
        }

        switch (status.state) {
            case PrinterState::Printing:
                return LifecycleState::Printing;
            case PrinterState::Paused:
                return LifecycleState::Paused;
            case PrinterState::Error:
                return LifecycleState::Failed;
            case PrinterState::Idle:
                if (status.jobResult == JobResult::Completed) return LifecycleState::Finish;
                if (status.jobResult == JobResult::Failed) return LifecycleState::Failed;
                return LifecycleState::Idle;
            case PrinterState::Offline:
                return LifecycleState::Offline;
            case PrinterState::Unknown:
                return LifecycleState::Unknown;
        }
        return LifecycleState::Unknown;
    }

    LifecycleSignal StateTransitionDetector::makeSignal(SignalKind kind, LifecycleState from, LifecycleState to,
                                                        const CanonicalStatus &status) const {
        LifecycleSignal signal;
        signal.kind = kind;
        signal.from = from;
        signal.to = to;
        signal.errorCode = status.deviceErrorCode;
        signal.printStopping = stoppingCodes_.matches(status.deviceErrorCode);
        signal.status = status;
        return signal;
    }

    std::string StateTransitionDetector::failureReason(const CanonicalStatus &status) const {
        if (!status.deviceErrorMessage.empty()) return status.deviceErrorMessage;
        if (!status.deviceErrorCode.empty()) return "Device error " + status.deviceErrorCode;
        return "Printer reported an error";
    }

    std::vector<LifecycleSignal> StateTransitionDetector::observe(const CanonicalStatus &status,
                                                                  std::chrono::steady_clock::time_point now) {
        std::vector<LifecycleSignal> signals;

        const LifecycleState previous = state_;
        const LifecycleState next = classify(status, isActive(previous));

        // An OFFLINE/UNKNOWN snapshot says nothing about the device error
        bool reportsHealth = next != LifecycleState::Offline && next != LifecycleState::Unknown;
        if (status.deviceErrorCode != lastErrorCode_ && (reportsHealth || !status.deviceErrorCode.empty())) {
            if (!status.deviceErrorCode.empty()) {
                signals.push_back(makeSignal(SignalKind::DeviceError, previous, next, status));
                signals.back().reason = failureReason(status);
            } else {
                signals.push_back(makeSignal(SignalKind::DeviceErrorCleared, previous, next, status));
            }
            lastErrorCode_ = status.deviceErrorCode;
        }

        if (!observed_ || next != previous) {
            signals.push_back(makeSignal(SignalKind::StateChanged, previous, next, status));
        }
        observed_ = true;
        state_ = next;

        switch (next) {
            case LifecycleState::Printing:
                if (!jobOpen_) {
                    signals.push_back(makeSignal(SignalKind::JobStarted, previous, next, status));
                    jobOpen_ = true;
                    lastProgress_ = status.progressPercent;
                    lastProgressAt_ = now;
                } else if (previous == LifecycleState::Paused) {
                    signals.push_back(makeSignal(SignalKind::JobResumed, previous, next, status));
                }
                break;

            case LifecycleState::Paused:
                if (!jobOpen_) {
                    signals.push_back(makeSignal(SignalKind::JobStarted, previous, LifecycleState::Printing, status));
                    jobOpen_ = true;
                    lastProgress_ = status.progressPercent;
                    lastProgressAt_ = now;
                }
                if (previous != LifecycleState::Paused) {
                    signals.push_back(makeSignal(SignalKind::JobPaused, previous, next, status));
                }
                break;

            case LifecycleState::Finish:
                if (jobOpen_) {
                    auto signal = makeSignal(SignalKind::JobCompleted, previous, next, status);
                    signal.success = true;
                    signals.push_back(std::move(signal));
                    jobOpen_ = false;
                }
                break;

            case LifecycleState::Failed:
                if (jobOpen_) {
                    auto signal = makeSignal(SignalKind::JobCompleted, previous, next, status);
                    signal.success = false;
                    signal.reason = failureReason(status);
                    signals.push_back(std::move(signal));
                    jobOpen_ = false;
                }
                break;

            case LifecycleState::Idle:
                // No FINISH or FAILED was seen while the job was open
                if (jobOpen_) {
                    auto signal = makeSignal(SignalKind::JobCancelled, previous, next, status);
                    signal.reason = status.jobResult == JobResult::Cancelled ? "Cancelled on the printer"
                                                                             : "Printer returned to idle";
                    signals.push_back(std::move(signal));
                    jobOpen_ = false;
                }
                break;

            case LifecycleState::Offline:
            case LifecycleState::Unknown:
                // Telemetry gap; the open job stays open until the printer reports again
                break;
        }

        if (next == LifecycleState::Printing && jobOpen_ && previous == LifecycleState::Printing) {
            double delta = std::fabs(status.progressPercent - lastProgress_);
            bool intervalElapsed = now - lastProgressAt_ >= config_.progressMinInterval;
            if (delta >= config_.progressMinDelta || (intervalElapsed && delta > 0.0)) {
                signals.push_back(makeSignal(SignalKind::JobProgress, previous, next, status));
                lastProgress_ = status.progressPercent;
                lastProgressAt_ = now;
            }
        }

        return signals;
    }

} // namespace core::detector
