#include <catch2/catch.hpp>

#include <algorithm>

#include "connector/adapters/moonraker/MoonrakerAdapter.hpp"
#include "core/detector/StateTransitionDetector.hpp"
#include "support/FakeWebSocket.hpp"

using connector::adapters::moonraker::MoonrakerAdapter;
using core::detector::SignalKind;
using core::printer::CanonicalStatus;
using core::printer::PrinterState;

namespace {

    const nlohmann::json PRINTING_OBJECTS = {
            {"print_stats", {{"state", "printing"}, {"filename", "cube.gcode"}, {"print_duration", 600.0}}},
            {"virtual_sdcard", {{"progress", 0.4}}},
            {"webhooks", {{"state", "ready"}}}
    };

    struct MoonrakerFixture {
        fakes::FakeWebSocketFactory sockets;
        std::vector<CanonicalStatus> statuses;
        std::unique_ptr<MoonrakerAdapter> adapter;

        explicit MoonrakerFixture(bool answerSubscribe = true) {
            if (answerSubscribe) {
                sockets.responder = [](fakes::FakeWebSocket &socket, const std::string &frame) {
                    auto request = nlohmann::json::parse(frame);
                    if (request["method"] != "printer.objects.subscribe") return;
                    nlohmann::json reply = {
                            {"jsonrpc", "2.0"},
                            {"id", request["id"]},
                            {"result", {{"eventtime", 1.0}, {"status", PRINTING_OBJECTS}}}
                    };
                    socket.receive(reply.dump());
                };
            }

            core::printer::PrinterEndpoint endpoint;
            endpoint.printerId = 5;
            endpoint.name = "Voron";
            endpoint.kind = core::printer::ProtocolKind::Moonraker;
            endpoint.host = "10.0.0.5";
            endpoint.apiKey = "secret";
            adapter = std::make_unique<MoonrakerAdapter>(
                    endpoint, [this](const CanonicalStatus &status) { statuses.push_back(status); },
                    connector::adapters::AdapterOptions{}, sockets.function());
        }
    };

}

TEST_CASE("Moonraker seeds its snapshot from a subscribe reply sent during send()", "[moonraker]") {
    MoonrakerFixture f;
    REQUIRE(f.adapter->connect());

    CHECK(f.sockets.urls.front() == "ws://10.0.0.5:7125/websocket");
    REQUIRE(f.sockets.latest);
    CHECK(f.sockets.latest->headers.front().first == "X-Api-Key");

    REQUIRE(f.statuses.size() == 1);
    CHECK(f.statuses[0].printerId == 5);
    CHECK(f.statuses[0].state == PrinterState::Printing);
    CHECK(f.statuses[0].progressPercent == Approx(40.0));
    CHECK(f.adapter->getStatus().filename == "cube.gcode");
}

TEST_CASE("Moonraker merges status deltas into the snapshot", "[moonraker]") {
    MoonrakerFixture f;
    REQUIRE(f.adapter->connect());

    f.sockets.latest->receive(R"({"jsonrpc":"2.0","method":"notify_status_update",
        "params":[{"virtual_sdcard":{"progress":0.55}},123.4]})");

    REQUIRE(f.statuses.size() == 2);
    CHECK(f.statuses[1].state == PrinterState::Printing);
    CHECK(f.statuses[1].progressPercent == Approx(55.0));
    CHECK(f.statuses[1].filename == "cube.gcode");
}

TEST_CASE("Klipper shutdown during a print fails the job", "[moonraker]") {
    MoonrakerFixture f;
    REQUIRE(f.adapter->connect());

    core::detector::StateTransitionDetector detector(
            5, core::detector::PrintStoppingCodes::parse("klippy:shutdown,klippy:error,sdcp:*"));
    std::vector<core::detector::LifecycleSignal> signals;
    auto observeAll = [&] {
        for (const auto &status: f.statuses) {
            auto produced = detector.observe(status);
            signals.insert(signals.end(), produced.begin(), produced.end());
        }
        f.statuses.clear();
    };

    auto has = [&](SignalKind kind) {
        return std::any_of(signals.begin(), signals.end(),
                           [kind](const core::detector::LifecycleSignal &s) { return s.kind == kind; });
    };

    observeAll();
    CHECK(has(SignalKind::JobStarted));
    signals.clear();

    f.sockets.latest->receive(R"({"jsonrpc":"2.0","method":"notify_klippy_shutdown"})");
    REQUIRE(f.statuses.size() == 1);
    CHECK(f.statuses[0].state == PrinterState::Printing);
    CHECK(f.statuses[0].deviceErrorCode == "klippy:shutdown");

    observeAll();
    bool failed = false;
    for (const auto &signal: signals) {
        if (signal.kind == SignalKind::JobCompleted) {
            CHECK_FALSE(signal.success);
            CHECK(signal.errorCode == "klippy:shutdown");
            failed = true;
        }
    }
    CHECK(failed);
}

TEST_CASE("Moonraker drops malformed frames without throwing", "[moonraker]") {
    MoonrakerFixture f;
    REQUIRE(f.adapter->connect());
    REQUIRE(f.statuses.size() == 1);

    CHECK_NOTHROW(f.adapter->handleMessage(R"({"jsonrpc":"2.0","method":42})"));
    CHECK_NOTHROW(f.adapter->handleMessage(R"({"jsonrpc":"2.0","method":null,"params":7})"));
    CHECK_NOTHROW(f.adapter->handleMessage(R"({"jsonrpc":"2.0","id":"x","result":[]})"));
    CHECK_NOTHROW(f.adapter->handleMessage(R"({"jsonrpc":"2.0","method":"notify_status_update","params":{}})"));
    CHECK_NOTHROW(f.adapter->handleMessage("[1,2,3]"));
    CHECK_NOTHROW(f.adapter->handleMessage("{not json"));

    CHECK(f.statuses.size() == 1);
    CHECK(f.adapter->getStatus().progressPercent == Approx(40.0));
}

TEST_CASE("Moonraker commands need a live socket", "[moonraker]") {
    MoonrakerFixture f(false);
    CHECK(f.adapter->pause().code == core::types::ResultCode::NotConnected);

    REQUIRE(f.adapter->connect());
    CHECK(f.adapter->pause().isSuccess());
    CHECK(f.adapter->setTemperature(core::printer::Heater::Bed, 60.0).isSuccess());

    auto sent = f.sockets.latest->sent();
    REQUIRE(sent.size() == 3);
    CHECK(nlohmann::json::parse(sent[1])["method"] == "printer.print.pause");
    CHECK(nlohmann::json::parse(sent[2])["params"]["script"] == "M140 S60");
}
