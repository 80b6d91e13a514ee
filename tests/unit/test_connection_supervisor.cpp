#include <catch2/catch.hpp>

#include "core/events/EventTypes.hpp"
#include "core/supervisor/ConnectionSupervisor.hpp"
#include "support/FakeAdapter.hpp"

#include <thread>

using namespace core;
using printer::CanonicalStatus;
using printer::PrinterState;

namespace {

    struct SupervisorFixture {
        storage::Database db{":memory:"};
        events::EventBus bus;
        std::unique_ptr<jobs::JobLifecycle> lifecycle;
        fakes::FakeAdapterFactory factory;
        std::unique_ptr<supervisor::ConnectionSupervisor> supervisor;
        std::vector<events::Event> events;
        std::shared_ptr<events::IEventObserver> recorder;
        int voron = 0;
        int prusa = 0;

        SupervisorFixture() {
            db.migrate();
            voron = addPrinter("Voron", "moonraker", true);
            prusa = addPrinter("MK4", "prusalink", true);
            addPrinter("Old", "moonraker", false);
            addPrinter("Mystery", "octoprint", true);

            recorder = events::makeObserver([this](const events::Event &e) { events.push_back(e); });
            bus.subscribe(events::types::WILDCARD, recorder);

            lifecycle = std::make_unique<jobs::JobLifecycle>(db, bus, jobs::JobLinker());
            config::SupervisorConfig config;
            config.reconnectDelay = std::chrono::milliseconds(0);
            config.telemetryInterval = std::chrono::seconds(0);
            supervisor = std::make_unique<supervisor::ConnectionSupervisor>(db, *lifecycle, bus, factory.function(),
                                                                            config);
        }

        ~SupervisorFixture() {
            supervisor->stop();
        }

        int addPrinter(const std::string &name, const std::string &protocol, bool enabled) {
            storage::PrinterRecord record;
            record.name = name;
            record.protocol = protocol;
            record.host = "10.0.0.1";
            record.enabled = enabled;
            return storage::PrinterRepository(db).insert(record);
        }

        size_t count(const char *type) const {
            size_t n = 0;
            for (const auto &e: events) {
                if (e.type == type) n++;
            }
            return n;
        }
    };

    CanonicalStatus printing(double progress) {
        CanonicalStatus status;
        status.state = PrinterState::Printing;
        status.progressPercent = progress;
        status.filename = "cube.gcode";
        return status;
    }

}

TEST_CASE("Discovery starts one connection per enabled supported printer", "[supervisor]") {
    SupervisorFixture f;
    CHECK(f.supervisor->runDiscoverySweep() == 2);
    CHECK(f.factory.created == 2);
    CHECK(f.count(events::types::PRINTER_CONNECTED) == 2);

    auto stats = f.supervisor->getStatistics();
    CHECK(stats.supervised == 2);
    CHECK(stats.connected == 2);

    CHECK(f.supervisor->runDiscoverySweep() == 0);
    CHECK(f.factory.created == 2);
}

TEST_CASE("Supervised status flows into the job lifecycle", "[supervisor]") {
    SupervisorFixture f;
    f.supervisor->runDiscoverySweep();

    auto *adapter = f.factory.latest(f.voron);
    REQUIRE(adapter);
    adapter->push(printing(5.0));

    CHECK(f.supervisor->getStatus(f.voron).state == PrinterState::Printing);
    CHECK(f.count(events::types::JOB_STARTED) == 1);
    CHECK(f.count(events::types::PRINTER_TELEMETRY) == 1);
    CHECK(f.lifecycle->openJob(f.voron).has_value());

    auto reports = f.supervisor->report();
    REQUIRE(reports.size() == 2);
    CHECK(reports[0].printerId == f.voron);
    CHECK(reports[0].lifecycle == detector::LifecycleState::Printing);
}

TEST_CASE("Health sweep rebuilds a dropped link", "[supervisor]") {
    SupervisorFixture f;
    f.supervisor->runDiscoverySweep();
    auto *adapter = f.factory.latest(f.voron);
    REQUIRE(adapter);
    adapter->push(printing(5.0));

    adapter->dropLink("connection reset by peer");
    f.supervisor->runHealthSweep();

    CHECK(f.factory.created == 3);
    CHECK(f.factory.latest(f.voron) != nullptr);
    REQUIRE(f.count(events::types::PRINTER_DISCONNECTED) == 1);
    for (const auto &e: f.events) {
        if (e.type == events::types::PRINTER_DISCONNECTED) {
            CHECK(e.data["reason"] == "connection reset by peer");
        }
    }
    CHECK(f.count(events::types::PRINTER_CONNECTED) == 3);

    auto stats = f.supervisor->getStatistics();
    CHECK(stats.reconnectAttempts == 1);
    CHECK(stats.reconnectFailures == 0);
    CHECK(stats.healthSweeps == 1);

    // The job survives the outage
    CHECK(f.lifecycle->openJob(f.voron).has_value());
    CHECK(f.count(events::types::JOB_CANCELLED) == 0);
}

TEST_CASE("Health sweep reconnects a silent link", "[supervisor]") {
    SupervisorFixture f;
    f.supervisor->runDiscoverySweep();
    f.factory.latest(f.voron)->push(printing(5.0));
    f.factory.latest(f.prusa)->push(printing(5.0));

    f.supervisor->runHealthSweep(std::chrono::steady_clock::now() + std::chrono::minutes(5));
    CHECK(f.supervisor->getStatistics().reconnectAttempts == 2);
}

TEST_CASE("A failed reconnect is counted and retried on the next sweep", "[supervisor]") {
    SupervisorFixture f;
    f.supervisor->runDiscoverySweep();
    f.factory.linkUp = false;
    f.factory.latest(f.voron)->dropLink("timeout");

    f.supervisor->runHealthSweep();
    auto stats = f.supervisor->getStatistics();
    CHECK(stats.reconnectFailures == 1);
    CHECK(stats.connected == 1);

    f.factory.linkUp = true;
    f.supervisor->runHealthSweep();
    CHECK(f.supervisor->getStatistics().connected == 2);
}

TEST_CASE("Disabled printers are stopped without an offline event", "[supervisor]") {
    SupervisorFixture f;
    f.supervisor->runDiscoverySweep();

    f.db.execute("UPDATE printers SET enabled = 0 WHERE id = " + std::to_string(f.prusa));
    f.supervisor->runDiscoverySweep();

    CHECK(f.supervisor->getStatistics().supervised == 1);
    CHECK(f.count(events::types::PRINTER_DISCONNECTED) == 0);
    CHECK(f.supervisor->getStatus(f.prusa).state == PrinterState::Offline);
    CHECK(f.supervisor->getStatus(f.prusa).lastError == "not supervised");
}

TEST_CASE("Commands route to the printer's adapter", "[supervisor]") {
    SupervisorFixture f;
    f.supervisor->runDiscoverySweep();

    CHECK(f.supervisor->pause(f.voron).isSuccess());
    CHECK(f.factory.latest(f.voron)->pauses == 1);
    CHECK(f.supervisor->setTemperature(f.voron, printer::Heater::Bed, 60.0).code ==
          types::ResultCode::Unsupported);
    CHECK(f.supervisor->cancel(9999).code == types::ResultCode::NotConnected);
}

TEST_CASE("Status reads do not wait for a slow command", "[supervisor]") {
    SupervisorFixture f;
    f.supervisor->runDiscoverySweep();
    auto *adapter = f.factory.latest(f.voron);
    REQUIRE(adapter);
    adapter->push(printing(12.0));
    adapter->pauseDelay = std::chrono::milliseconds(1500);

    std::thread command([&] { f.supervisor->pause(f.voron); });
    while (!adapter->pauseStarted) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }

    auto before = std::chrono::steady_clock::now();
    auto status = f.supervisor->getStatus(f.voron);
    auto connected = f.supervisor->getStatistics().connected;
    auto elapsed = std::chrono::steady_clock::now() - before;
    command.join();

    CHECK(status.state == PrinterState::Printing);
    CHECK(connected == 2);
    CHECK(elapsed < std::chrono::milliseconds(500));
}
