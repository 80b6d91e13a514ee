#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "application/config/Settings.hpp"
#include "core/detector/PrintStoppingCodes.hpp"
#include "core/printer/CanonicalStatus.hpp"

namespace core::detector {

    enum class LifecycleState {
        Idle,
        Printing,
        Paused,
        Finish,
        Failed,
        Offline,
        Unknown
    };

    std::string lifecycleStateToString(LifecycleState state);

    enum class SignalKind {
        StateChanged,
        JobStarted,
        JobProgress,
        JobPaused,
        JobResumed,
        JobCompleted,
        JobCancelled,
        DeviceError,
        DeviceErrorCleared
    };

    std::string signalKindToString(SignalKind kind);

    struct LifecycleSignal {
        SignalKind kind;
        LifecycleState from = LifecycleState::Unknown;
        LifecycleState to = LifecycleState::Unknown;
        bool success = false;   // JobCompleted only
        std::string reason;     // failure or cancellation reason
        std::string errorCode;  // device error code that caused the edge, if any
        bool printStopping = false; // errorCode is on the print-stopping list
        printer::CanonicalStatus status;
    };

    /**
     * @brief Infers job lifecycle edges from successive CanonicalStatus snapshots.
     *
     * One instance per printer, fed from that printer's single ingestion
     * path; not thread-safe on its own. Signals come back in the order
     * consumers must see them (e.g. job.started before job.paused).
     */
    class StateTransitionDetector {
    public:
        StateTransitionDetector(int printerId, PrintStoppingCodes stoppingCodes,
                                config::DetectorConfig config = {});

        /**
         * @brief Restore the open-job flag from storage before the first observation
         */
        void seed(bool jobOpen, double progressPercent = 0.0);

        std::vector<LifecycleSignal> observe(const printer::CanonicalStatus &status,
                                             std::chrono::steady_clock::time_point now =
                                             std::chrono::steady_clock::now());

        LifecycleState current() const { return state_; }

        bool jobOpen() const { return jobOpen_; }

        int printerId() const { return printerId_; }

        /**
         * @brief Lifecycle state for one snapshot
         * @param wasActive whether the previous state was PRINTING or PAUSED
         */
        LifecycleState classify(const printer::CanonicalStatus &status, bool wasActive) const;

    private:
        const int printerId_;
        PrintStoppingCodes stoppingCodes_;
        config::DetectorConfig config_;

        LifecycleState state_ = LifecycleState::Unknown;
        bool observed_ = false;
        bool jobOpen_ = false;
        std::string lastErrorCode_;

        double lastProgress_ = 0.0;
        std::chrono::steady_clock::time_point lastProgressAt_{};

        static bool isActive(LifecycleState state) {
            return state == LifecycleState::Printing || state == LifecycleState::Paused;
        }

        LifecycleSignal makeSignal(SignalKind kind, LifecycleState from, LifecycleState to,
                                   const printer::CanonicalStatus &status) const;

        std::string failureReason(const printer::CanonicalStatus &status) const;
    };

} // namespace core::detector
