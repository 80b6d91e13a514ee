#include <catch2/catch.hpp>

#include "connector/adapters/prusalink/PrusaLinkAdapter.hpp"
#include "connector/adapters/prusalink/PrusaLinkStatusParser.hpp"
#include "support/FakeHttpClient.hpp"

using namespace connector::adapters::prusalink;
using core::printer::CanonicalStatus;
using core::printer::JobResult;
using core::printer::PrinterState;

TEST_CASE("PrusaLink v1 status parsing", "[prusalink]") {
    auto body = nlohmann::json::parse(R"({
        "printer": {"state": "PRINTING", "temp_bed": 60.0, "target_bed": 60.0,
                    "temp_nozzle": 214.0, "target_nozzle": 215.0},
        "job": {"id": 42, "progress": 37.0, "time_remaining": 1500, "time_printing": 900}
    })");
    auto status = PrusaLinkStatusParser::parseStatus(body);
    CHECK(status.state == PrinterState::Printing);
    CHECK(status.deviceJobId == "42");
    CHECK(status.progressPercent == Approx(37.0));
    CHECK(*status.timeRemainingSeconds == 1500);
    CHECK(*status.printDurationSeconds == 900);

    PrusaLinkStatusParser::applyJob(status, nlohmann::json::parse(
            R"({"id": 42, "file": {"name": "BENCHY~1.BGC", "display_name": "benchy.bgcode"}})"));
    CHECK(status.filename == "benchy.bgcode");
}

TEST_CASE("PrusaLink state names", "[prusalink]") {
    CanonicalStatus status;
    PrusaLinkStatusParser::applyState(status, "finished");
    CHECK(status.state == PrinterState::Idle);
    CHECK(status.jobResult == JobResult::Completed);

    PrusaLinkStatusParser::applyState(status, "STOPPED");
    CHECK(status.jobResult == JobResult::Cancelled);

    PrusaLinkStatusParser::applyState(status, "ATTENTION");
    CHECK(status.state == PrinterState::Paused);

    PrusaLinkStatusParser::applyState(status, "ERROR");
    CHECK(status.state == PrinterState::Error);

    PrusaLinkStatusParser::applyState(status, "BUSY");
    CHECK(status.state == PrinterState::Idle);
    CHECK(status.jobResult == JobResult::None);
}

TEST_CASE("PrusaLink legacy endpoints", "[prusalink]") {
    auto printer = nlohmann::json::parse(R"({
        "temperature": {"tool0": {"actual": 210.0, "target": 215.0}, "bed": {"actual": 58.0, "target": 60.0}},
        "state": {"text": "Printing", "flags": {"printing": true}}
    })");
    auto job = nlohmann::json::parse(R"({
        "progress": {"completion": 55.5, "printTimeLeft": 600, "printTime": 700},
        "job": {"file": {"name": "PART~1.GCO", "display": "part.gcode"}}
    })");
    auto status = PrusaLinkStatusParser::parseLegacy(printer, job);
    CHECK(status.state == PrinterState::Printing);
    CHECK(status.progressPercent == Approx(55.5));
    CHECK(status.filename == "part.gcode");
    CHECK(status.temperatures.bedTarget == Approx(60.0));

    auto noJob = PrusaLinkStatusParser::parseLegacy(printer, nullptr);
    CHECK(noJob.filename.empty());
}

TEST_CASE("PrusaLink adapter polls through the HTTP client", "[prusalink]") {
    auto http = std::make_shared<fakes::FakeHttpClient>();
    core::printer::PrinterEndpoint endpoint;
    endpoint.printerId = 9;
    endpoint.name = "MK4";
    endpoint.kind = core::printer::ProtocolKind::PrusaLink;
    endpoint.host = "10.0.0.9";
    endpoint.apiKey = "secret";

    std::vector<CanonicalStatus> received;
    PrusaLinkAdapter adapter(endpoint, [&](const CanonicalStatus &s) { received.push_back(s); }, {}, http);

    SECTION("v1 status plus one job lookup") {
        http->respond(200, R"({"printer": {"state": "PRINTING"}, "job": {"id": 3, "progress": 10}})");
        http->respond(200, R"({"id": 3, "file": {"display_name": "cube.gcode"}})");
        REQUIRE(adapter.pollOnce());

        auto requests = http->requests();
        REQUIRE(requests.size() == 2);
        CHECK(requests[0].url == "http://10.0.0.9:80/api/v1/status");
        CHECK(requests[1].url == "http://10.0.0.9:80/api/v1/job");
        bool hasKey = false;
        for (const auto &header: requests[0].headers) {
            if (header.first == "X-Api-Key" && header.second == "secret") hasKey = true;
        }
        CHECK(hasKey);

        REQUIRE(received.size() == 1);
        CHECK(received[0].printerId == 9);
        CHECK(received[0].filename == "cube.gcode");
        CHECK(adapter.isConnected());

        SECTION("the file name is reused while the job id is unchanged") {
            http->respond(200, R"({"printer": {"state": "PRINTING"}, "job": {"id": 3, "progress": 11}})");
            REQUIRE(adapter.pollOnce());
            CHECK(http->requests().size() == 3);
            CHECK(received.back().filename == "cube.gcode");
        }
    }

    SECTION("404 switches to the legacy API") {
        http->respond(404, "");
        http->respond(200, R"({"state": {"flags": {"operational": true}}})");
        http->respond(204, "");
        REQUIRE(adapter.pollOnce());
        CHECK(adapter.usingLegacyApi());
        REQUIRE(received.size() == 1);
        CHECK(received[0].state == PrinterState::Idle);
    }

    SECTION("rejected credentials fail the poll") {
        http->respond(401, "");
        CHECK_FALSE(adapter.pollOnce());
        CHECK(received.empty());
        CHECK_FALSE(adapter.lastTransportError().empty());
    }

    SECTION("commands need a connection") {
        CHECK(adapter.pause().code == core::types::ResultCode::NotConnected);
        CHECK(adapter.setTemperature(core::printer::Heater::Bed, 60).code ==
              core::types::ResultCode::Unsupported);
    }
}
