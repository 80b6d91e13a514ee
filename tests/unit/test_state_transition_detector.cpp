#include <catch2/catch.hpp>

#include "core/detector/StateTransitionDetector.hpp"

using namespace core::detector;
using core::printer::CanonicalStatus;
using core::printer::JobResult;
using core::printer::PrinterState;

namespace {

    CanonicalStatus snapshot(PrinterState state, double progress = 0.0) {
        CanonicalStatus status;
        status.printerId = 7;
        status.state = state;
        status.progressPercent = progress;
        status.filename = "benchy.gcode";
        return status;
    }

    std::vector<SignalKind> kinds(const std::vector<LifecycleSignal> &signals) {
        std::vector<SignalKind> out;
        for (const auto &s: signals) out.push_back(s.kind);
        return out;
    }

    StateTransitionDetector makeDetector() {
        return StateTransitionDetector(7, PrintStoppingCodes::parse("klippy:shutdown, sdcp:*"));
    }

}

TEST_CASE("PrintStoppingCodes matches exact codes and prefixes", "[detector]") {
    auto codes = PrintStoppingCodes::parse(" klippy:shutdown , sdcp:* ,, ");
    CHECK(codes.entries().size() == 2);
    CHECK(codes.matches("klippy:shutdown"));
    CHECK(codes.matches("sdcp:thermal_runaway"));
    CHECK_FALSE(codes.matches("klippy:ready"));
    CHECK_FALSE(codes.matches(""));
}

TEST_CASE("Detector emits job start, progress and completion", "[detector]") {
    auto detector = makeDetector();
    auto t0 = std::chrono::steady_clock::now();

    auto first = detector.observe(snapshot(PrinterState::Idle), t0);
    CHECK(kinds(first) == std::vector<SignalKind>{SignalKind::StateChanged});
    CHECK(detector.current() == LifecycleState::Idle);

    auto started = detector.observe(snapshot(PrinterState::Printing, 0.0), t0);
    CHECK(kinds(started) == std::vector<SignalKind>{SignalKind::StateChanged, SignalKind::JobStarted});
    CHECK(detector.jobOpen());

    SECTION("small progress changes inside the interval are suppressed") {
        auto quiet = detector.observe(snapshot(PrinterState::Printing, 0.5), t0 + std::chrono::seconds(1));
        CHECK(quiet.empty());
    }

    SECTION("progress past the delta is reported") {
        auto progress = detector.observe(snapshot(PrinterState::Printing, 12.0), t0 + std::chrono::seconds(1));
        CHECK(kinds(progress) == std::vector<SignalKind>{SignalKind::JobProgress});
    }

    SECTION("FINISH closes the job once") {
        auto done = snapshot(PrinterState::Idle, 100.0);
        done.jobResult = JobResult::Completed;
        auto finished = detector.observe(done, t0 + std::chrono::seconds(10));
        REQUIRE(kinds(finished) == std::vector<SignalKind>{SignalKind::StateChanged, SignalKind::JobCompleted});
        CHECK(finished[1].success);
        CHECK(detector.current() == LifecycleState::Finish);
        CHECK_FALSE(detector.jobOpen());

        CHECK(detector.observe(done, t0 + std::chrono::seconds(11)).empty());
    }
}

TEST_CASE("Detector pause and resume keep the job open", "[detector]") {
    auto detector = makeDetector();
    detector.observe(snapshot(PrinterState::Printing, 10.0));

    auto paused = detector.observe(snapshot(PrinterState::Paused, 10.0));
    CHECK(kinds(paused) == std::vector<SignalKind>{SignalKind::StateChanged, SignalKind::JobPaused});

    auto resumed = detector.observe(snapshot(PrinterState::Printing, 10.0));
    CHECK(kinds(resumed) == std::vector<SignalKind>{SignalKind::StateChanged, SignalKind::JobResumed});
    CHECK(detector.jobOpen());
}

TEST_CASE("Detector fails the job on a print-stopping code while PRINTING", "[detector]") {
    auto detector = makeDetector();
    detector.observe(snapshot(PrinterState::Printing, 40.0));

    auto fault = snapshot(PrinterState::Printing, 40.0);
    fault.deviceErrorCode = "klippy:shutdown";
    fault.deviceErrorMessage = "MCU shutdown";

    auto signals = detector.observe(fault);
    REQUIRE(kinds(signals) == std::vector<SignalKind>{SignalKind::DeviceError, SignalKind::StateChanged,
                                                     SignalKind::JobCompleted});
    CHECK(signals[0].printStopping);
    CHECK(signals[1].to == LifecycleState::Failed);
    CHECK_FALSE(signals[2].success);
    CHECK(signals[2].reason == "MCU shutdown");
    CHECK(signals[2].errorCode == "klippy:shutdown");
    CHECK_FALSE(detector.jobOpen());
}

TEST_CASE("Detector reports non-stopping errors without ending the job", "[detector]") {
    auto detector = makeDetector();
    detector.observe(snapshot(PrinterState::Printing, 40.0));

    auto warning = snapshot(PrinterState::Printing, 40.0);
    warning.deviceErrorCode = "filament_runout_warning";
    auto signals = detector.observe(warning);
    REQUIRE(kinds(signals) == std::vector<SignalKind>{SignalKind::DeviceError});
    CHECK_FALSE(signals[0].printStopping);
    CHECK(detector.jobOpen());

    auto cleared = detector.observe(snapshot(PrinterState::Printing, 40.0));
    CHECK(kinds(cleared) == std::vector<SignalKind>{SignalKind::DeviceErrorCleared});
}

TEST_CASE("Detector treats a return to IDLE as a cancellation", "[detector]") {
    auto detector = makeDetector();
    detector.observe(snapshot(PrinterState::Printing, 20.0));

    auto idle = snapshot(PrinterState::Idle, 20.0);
    idle.jobResult = JobResult::Cancelled;
    auto signals = detector.observe(idle);
    REQUIRE(kinds(signals) == std::vector<SignalKind>{SignalKind::StateChanged, SignalKind::JobCancelled});
    CHECK(signals[1].reason == "Cancelled on the printer");
}

TEST_CASE("Detector keeps the job open across an OFFLINE gap", "[detector]") {
    auto detector = makeDetector();
    detector.observe(snapshot(PrinterState::Printing, 20.0));

    auto gap = detector.observe(CanonicalStatus::offline(7, "socket closed"));
    CHECK(kinds(gap) == std::vector<SignalKind>{SignalKind::StateChanged});
    CHECK(detector.current() == LifecycleState::Offline);
    CHECK(detector.jobOpen());

    auto back = detector.observe(snapshot(PrinterState::Printing, 25.0));
    CHECK(kinds(back) == std::vector<SignalKind>{SignalKind::StateChanged});
}

TEST_CASE("Detector seeded with an open job does not restart it", "[detector]") {
    auto detector = makeDetector();
    detector.seed(true, 50.0);

    auto signals = detector.observe(snapshot(PrinterState::Printing, 50.0));
    CHECK(kinds(signals) == std::vector<SignalKind>{SignalKind::StateChanged});

    SECTION("and a printer found idle closes it as cancelled") {
        auto idle = detector.observe(snapshot(PrinterState::Idle));
        CHECK(kinds(idle) == std::vector<SignalKind>{SignalKind::StateChanged, SignalKind::JobCancelled});
    }
}
