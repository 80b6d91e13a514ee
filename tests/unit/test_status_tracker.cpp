#include <catch2/catch.hpp>

#include "core/printer/state/StatusTracker.hpp"

using core::printer::CanonicalStatus;
using core::printer::PrinterState;
using core::state::StatusTracker;

TEST_CASE("StatusTracker starts OFFLINE and stale", "[status]") {
    StatusTracker tracker(4);
    auto status = tracker.snapshot();
    CHECK(status.printerId == 4);
    CHECK(status.state == PrinterState::Offline);
    CHECK_FALSE(tracker.hasIngested());
    CHECK_FALSE(tracker.isFresh(std::chrono::seconds(60)));
}

TEST_CASE("StatusTracker replaces the snapshot on update", "[status]") {
    StatusTracker tracker(4);
    CanonicalStatus status;
    status.printerId = 99;
    status.state = PrinterState::Printing;
    status.progressPercent = 12.5;
    tracker.update(status);

    auto snapshot = tracker.snapshot();
    CHECK(snapshot.printerId == 4);
    CHECK(snapshot.state == PrinterState::Printing);
    CHECK(snapshot.progressPercent == Approx(12.5));
    CHECK(tracker.getUpdateCount() == 1);

    auto ingested = tracker.lastIngest();
    CHECK(tracker.isFresh(std::chrono::seconds(60), ingested + std::chrono::seconds(59)));
    CHECK_FALSE(tracker.isFresh(std::chrono::seconds(60), ingested + std::chrono::seconds(60)));

    SECTION("markOffline keeps the telemetry and records the reason") {
        tracker.markOffline("connection reset");
        auto offline = tracker.snapshot();
        CHECK(offline.state == PrinterState::Offline);
        CHECK(offline.lastError == "connection reset");
        CHECK(offline.progressPercent == Approx(12.5));
    }
}

TEST_CASE("CanonicalStatus serialises for telemetry", "[status]") {
    auto offline = CanonicalStatus::offline(3, "timeout");
    auto json = offline.toJson();
    CHECK(json["printer_id"] == 3);
    CHECK(json["state"] == "OFFLINE");
    CHECK(json["last_error"] == "timeout");

    CanonicalStatus status;
    status.filename = "plate_1.gcode";
    CHECK(status.displayName() == "plate_1.gcode");
    status.jobName = "Plate 1";
    CHECK(status.displayName() == "Plate 1");
}
