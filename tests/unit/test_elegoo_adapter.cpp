#include <catch2/catch.hpp>

#include "connector/adapters/elegoo/ElegooAdapter.hpp"
#include "support/FakeWebSocket.hpp"

using connector::adapters::elegoo::ElegooAdapter;
using core::printer::CanonicalStatus;
using core::printer::PrinterState;
namespace sdcp = connector::adapters::elegoo::sdcp;

namespace {

    std::string statusFrame(int printStatus, int machineStatus) {
        nlohmann::json frame = {
                {"Topic", "sdcp/status/ABC123"},
                {"MainboardID", "ABC123"},
                {"Status", {
                        {"CurrentStatus", nlohmann::json::array({machineStatus})},
                        {"PrintInfo", {
                                {"Status", printStatus},
                                {"ErrorNumber", 0},
                                {"Filename", "cube.gcode"},
                                {"Progress", 20}
                        }}
                }}
        };
        return frame.dump();
    }

    std::string errorFrame(int code) {
        nlohmann::json frame = {
                {"Topic", "sdcp/error/ABC123"},
                {"Data", {{"Data", {{"ErrorCode", code}}}}}
        };
        return frame.dump();
    }

    struct ElegooFixture {
        fakes::FakeWebSocketFactory sockets;
        std::vector<CanonicalStatus> statuses;
        std::unique_ptr<ElegooAdapter> adapter;

        ElegooFixture() {
            core::printer::PrinterEndpoint endpoint;
            endpoint.printerId = 9;
            endpoint.name = "Centauri";
            endpoint.kind = core::printer::ProtocolKind::Elegoo;
            endpoint.host = "10.0.0.9";
            adapter = std::make_unique<ElegooAdapter>(
                    endpoint, [this](const CanonicalStatus &status) { statuses.push_back(status); },
                    connector::adapters::AdapterOptions{}, sockets.function());
        }
    };

}

TEST_CASE("SDCP adapter requests status on connect and learns the mainboard", "[elegoo]") {
    ElegooFixture f;
    REQUIRE(f.adapter->connect());
    CHECK(f.sockets.urls.front() == "ws://10.0.0.9:3030/websocket");

    auto sent = f.sockets.latest->sent();
    REQUIRE(sent.size() == 1);
    CHECK(nlohmann::json::parse(sent[0])["Data"]["Cmd"] == sdcp::STATUS_REQUEST);

    f.sockets.latest->receive(statusFrame(sdcp::PRINT_PRINTING, 1));
    REQUIRE(f.statuses.size() == 1);
    CHECK(f.statuses[0].printerId == 9);
    CHECK(f.statuses[0].state == PrinterState::Printing);
    CHECK(f.adapter->mainboardId() == "ABC123");

    REQUIRE(f.adapter->pause().isSuccess());
    auto pause = nlohmann::json::parse(f.sockets.latest->sent().back());
    CHECK(pause["Topic"] == "sdcp/request/ABC123");
    CHECK(pause["Data"]["Cmd"] == sdcp::PAUSE_PRINT);
}

TEST_CASE("SDCP error notices stay attached until the print ends", "[elegoo]") {
    ElegooFixture f;
    REQUIRE(f.adapter->connect());
    auto &socket = *f.sockets.latest;

    socket.receive(statusFrame(sdcp::PRINT_PRINTING, 1));
    socket.receive(errorFrame(7));
    REQUIRE(f.statuses.size() == 2);
    CHECK(f.statuses[1].state == PrinterState::Printing);
    CHECK(f.statuses[1].deviceErrorCode == "sdcp:7");

    // The next full status has no error number but the print is still marked active
    socket.receive(statusFrame(sdcp::PRINT_PRINTING, 1));
    CHECK(f.statuses.back().deviceErrorCode == "sdcp:7");

    socket.receive(statusFrame(sdcp::PRINT_COMPLETE, 0));
    CHECK(f.statuses.back().state == PrinterState::Idle);
    CHECK(f.statuses.back().deviceErrorCode.empty());

    socket.receive(statusFrame(sdcp::PRINT_PRINTING, 1));
    CHECK(f.statuses.back().deviceErrorCode.empty());
}

TEST_CASE("SDCP error before any status is remembered, not published", "[elegoo]") {
    ElegooFixture f;
    REQUIRE(f.adapter->connect());
    f.sockets.latest->receive(errorFrame(3));
    CHECK(f.statuses.empty());

    f.sockets.latest->receive(statusFrame(sdcp::PRINT_PRINTING, 1));
    REQUIRE(f.statuses.size() == 1);
    CHECK(f.statuses[0].deviceErrorCode == "sdcp:3");
}

TEST_CASE("SDCP adapter drops malformed frames without throwing", "[elegoo]") {
    ElegooFixture f;
    REQUIRE(f.adapter->connect());

    CHECK_NOTHROW(f.adapter->handleMessage(R"({"Topic":7})"));
    CHECK_NOTHROW(f.adapter->handleMessage(R"({"Topic":null,"Status":"busy"})"));
    CHECK_NOTHROW(f.adapter->handleMessage(R"({"Topic":"sdcp/error/ABC123","Data":[]})"));
    CHECK_NOTHROW(f.adapter->handleMessage("\"just a string\""));
    CHECK_NOTHROW(f.adapter->handleMessage("{broken"));
    CHECK(f.statuses.empty());
}
