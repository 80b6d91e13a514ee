#include <catch2/catch.hpp>

#include "connector/adapters/moonraker/MoonrakerSnapshot.hpp"

using connector::adapters::moonraker::MoonrakerSnapshot;
using core::printer::JobResult;
using core::printer::PrinterState;

TEST_CASE("Moonraker deltas accumulate into one snapshot", "[moonraker]") {
    MoonrakerSnapshot snapshot;
    auto initial = nlohmann::json::parse(R"({
        "print_stats": {"state": "printing", "filename": "benchy.gcode", "print_duration": 600.0,
                        "info": {"current_layer": 12, "total_layer": 120}},
        "virtual_sdcard": {"progress": 0.25},
        "heater_bed": {"temperature": 59.8, "target": 60.0},
        "extruder": {"temperature": 214.6, "target": 215.0},
        "webhooks": {"state": "ready", "state_message": "Printer is ready"}
    })");
    CHECK(snapshot.applyDelta(initial) > 0);

    auto status = snapshot.toCanonical();
    CHECK(status.state == PrinterState::Printing);
    CHECK(status.filename == "benchy.gcode");
    CHECK(status.progressPercent == Approx(25.0));
    CHECK(status.currentLayer == 12);
    CHECK(status.totalLayers == 120);
    CHECK(status.temperatures.nozzle == Approx(214.6));
    REQUIRE(status.timeRemainingSeconds);
    CHECK(*status.timeRemainingSeconds == 1800);
    CHECK(status.deviceErrorCode.empty());

    SECTION("a partial delta keeps the other fields") {
        snapshot.applyDelta(nlohmann::json::parse(R"({"extruder": {"temperature": 216.0}})"));
        auto next = snapshot.toCanonical();
        CHECK(next.temperatures.nozzle == Approx(216.0));
        CHECK(next.temperatures.nozzleTarget == Approx(215.0));
        CHECK(next.filename == "benchy.gcode");
        CHECK(next.state == PrinterState::Printing);
    }

    SECTION("complete maps to idle with a completed result") {
        snapshot.applyDelta(nlohmann::json::parse(R"({"print_stats": {"state": "complete"}})"));
        auto done = snapshot.toCanonical();
        CHECK(done.state == PrinterState::Idle);
        CHECK(done.jobResult == JobResult::Completed);
    }

    SECTION("cancelled maps to idle with a cancelled result") {
        snapshot.applyDelta(nlohmann::json::parse(R"({"print_stats": {"state": "cancelled"}})"));
        CHECK(snapshot.toCanonical().jobResult == JobResult::Cancelled);
    }

    SECTION("klippy shutdown becomes a device error") {
        snapshot.applyDelta(nlohmann::json::parse(
                R"({"webhooks": {"state": "shutdown", "state_message": "MCU 'mcu' shutdown: Timer too close"}})"));
        auto fault = snapshot.toCanonical();
        CHECK(fault.deviceErrorCode == "klippy:shutdown");
        CHECK(fault.deviceErrorMessage == "MCU 'mcu' shutdown: Timer too close");
    }
}

TEST_CASE("Moonraker snapshot with no data is safe", "[moonraker]") {
    MoonrakerSnapshot snapshot;
    CHECK(snapshot.applyDelta(nlohmann::json::array()) == 0);
    auto status = snapshot.toCanonical();
    CHECK(status.state == PrinterState::Unknown);
    CHECK(status.progressPercent == 0.0);
    CHECK_FALSE(status.timeRemainingSeconds);
}

TEST_CASE("Moonraker subscription covers the tracked objects", "[moonraker]") {
    auto objects = MoonrakerSnapshot::subscriptionObjects();
    for (const char *name: {"print_stats", "virtual_sdcard", "heater_bed", "extruder", "webhooks"}) {
        CHECK(objects.contains(name));
    }
}
