#include <catch2/catch.hpp>

#include "connector/adapters/elegoo/SdcpMessages.hpp"

using namespace connector::adapters::elegoo;
using core::printer::JobResult;
using core::printer::PrinterState;

namespace {

    nlohmann::json statusMessage(int printStatus, int errorNumber = 0) {
        return {
                {"Topic", "sdcp/status/ABC123"},
                {"MainboardID", "ABC123"},
                {"Status", {
                        {"CurrentStatus", nlohmann::json::array({1})},
                        {"TempOfHotbed", 60.1},
                        {"TempTargetHotbed", 60},
                        {"TempOfNozzle", 219.5},
                        {"TempTargetNozzle", 220},
                        {"TempOfBox", 31.0},
                        {"PrintInfo", {
                                {"Status", printStatus},
                                {"ErrorNumber", errorNumber},
                                {"Filename", "cube.gcode"},
                                {"CurrentLayer", 40},
                                {"TotalLayer", 200},
                                {"CurrentTicks", 1200},
                                {"TotalTicks", 6000},
                                {"Progress", 20}
                        }}
                }}
        };
    }

}

TEST_CASE("SDCP status messages map onto canonical status", "[sdcp]") {
    auto parsed = parseStatusMessage(statusMessage(sdcp::PRINT_PRINTING));
    REQUIRE(parsed);
    CHECK(parsed->mainboardId == "ABC123");

    auto status = parsed->toCanonical();
    CHECK(status.state == PrinterState::Printing);
    CHECK(status.filename == "cube.gcode");
    CHECK(status.progressPercent == Approx(20.0));
    CHECK(status.totalLayers == 200);
    REQUIRE(status.timeRemainingSeconds);
    CHECK(*status.timeRemainingSeconds == 4800);
    REQUIRE(status.temperatures.chamber);
    CHECK(*status.temperatures.chamber == Approx(31.0));
}

TEST_CASE("SDCP print status codes", "[sdcp]") {
    auto idleMachine = [](int printStatus) {
        auto message = statusMessage(printStatus);
        message["Status"]["CurrentStatus"] = nlohmann::json::array({0});
        return parseStatusMessage(message)->toCanonical();
    };

    CHECK(idleMachine(sdcp::PRINT_PAUSED).state == PrinterState::Paused);
    CHECK(idleMachine(sdcp::PRINT_COMPLETE).jobResult == JobResult::Completed);
    CHECK(idleMachine(sdcp::PRINT_STOPPING).jobResult == JobResult::Cancelled);
    CHECK(idleMachine(0).state == PrinterState::Idle);
}

TEST_CASE("SDCP error numbers become namespaced device codes", "[sdcp]") {
    auto status = parseStatusMessage(statusMessage(sdcp::PRINT_PRINTING, 12))->toCanonical();
    CHECK(status.deviceErrorCode == "sdcp:12");

    nlohmann::json error = {{"Topic", "sdcp/error/ABC123"}, {"Data", {{"Data", {{"ErrorCode", 7}}}}}};
    CHECK(parseErrorMessage(error) == 7);
    CHECK_FALSE(parseErrorMessage(statusMessage(0)));
}

TEST_CASE("SDCP messages without a status block are ignored", "[sdcp]") {
    CHECK_FALSE(parseStatusMessage(nlohmann::json{{"Topic", "sdcp/attributes/ABC123"}}));
    CHECK_FALSE(parseStatusMessage(nlohmann::json::array()));
}

TEST_CASE("SDCP requests carry the mainboard and command", "[sdcp]") {
    auto request = buildCommand(sdcp::PAUSE_PRINT, "ABC123");
    CHECK(request["Topic"] == "sdcp/request/ABC123");
    CHECK(request["Data"]["Cmd"] == sdcp::PAUSE_PRINT);
    CHECK(request["Data"]["MainboardID"] == "ABC123");
    CHECK(request["Id"].get<std::string>().size() == 36);
}

TEST_CASE("SDCP discovery replies", "[sdcp]") {
    auto printer = parseDiscoveryReply(
            R"({"Id":"x","Data":{"Name":"Centauri","MachineName":"Centauri Carbon","MainboardID":"ABC123",)"
            R"("FirmwareVersion":"V1.1.29","ProtocolVersion":"V3.0.0"}})", "192.168.1.40");
    REQUIRE(printer);
    CHECK(printer->ip == "192.168.1.40");
    CHECK(printer->name == "Centauri");
    CHECK(printer->mainboardId == "ABC123");
    CHECK(printer->brand == "ELEGOO");

    CHECK_FALSE(parseDiscoveryReply("not json", "192.168.1.41"));
}
