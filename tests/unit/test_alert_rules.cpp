#include <catch2/catch.hpp>

#include "core/consumers/AlertRules.hpp"
#include "core/consumers/ArchiveWriter.hpp"
#include "core/consumers/CareCounterUpdater.hpp"
#include "core/events/EventTypes.hpp"
#include "support/FakeHttpClient.hpp"

using namespace core;
using consumers::AlertRules;

namespace {

    nlohmann::json closedJob(bool success) {
        return {
                {"printer_id", 2},
                {"printer_name", "Voron"},
                {"print_job_id", 17},
                {"job_name", "bracket"},
                {"status", success ? "completed" : "failed"},
                {"success", success},
                {"progress", 63.7},
                {"started_at", 1000.0},
                {"ended_at", 8200.0},
                {"duration_seconds", 7200},
                {"error_code", success ? "" : "klippy:shutdown"}
        };
    }

}

TEST_CASE("AlertRules maps job outcomes", "[alerts][rules]") {
    auto complete = AlertRules::alertFor(events::Event(events::types::JOB_COMPLETED, "test", closedJob(true)));
    REQUIRE(complete);
    CHECK(complete->type == alerts::alert_types::PRINT_COMPLETE);
    CHECK(complete->severity == alerts::Severity::Info);
    CHECK(complete->title == "Print Complete: bracket (Voron)");
    CHECK(*complete->printerId == 2);
    CHECK(*complete->jobId == 17);

    auto failed = AlertRules::alertFor(events::Event(events::types::JOB_COMPLETED, "test", closedJob(false)));
    REQUIRE(failed);
    CHECK(failed->type == alerts::alert_types::PRINT_FAILED);
    CHECK(failed->severity == alerts::Severity::Critical);
    CHECK(failed->message == "Job 'bracket' failed on Voron at 63% progress. Error: klippy:shutdown");
}

TEST_CASE("AlertRules only alerts on print-stopping device errors", "[alerts][rules]") {
    nlohmann::json data = {{"printer_id", 2}, {"printer_name", "Voron"}, {"error_code", "klippy:shutdown"},
                           {"message", "MCU shutdown"}, {"print_stopping", true}};
    auto alert = AlertRules::alertFor(events::Event(events::types::PRINTER_ERROR, "test", data));
    REQUIRE(alert);
    CHECK(alert->type == alerts::alert_types::PRINTER_ERROR);
    CHECK(alert->title == "Printer Error: Voron");
    CHECK(alert->message == "klippy:shutdown: MCU shutdown");

    data["print_stopping"] = false;
    CHECK_FALSE(AlertRules::alertFor(events::Event(events::types::PRINTER_ERROR, "test", data)));
}

TEST_CASE("AlertRules raises offline alerts and ignores other events", "[alerts][rules]") {
    auto offline = AlertRules::alertFor(events::Event(events::types::PRINTER_DISCONNECTED, "test",
                                                      {{"printer_id", 2}, {"printer_name", "Voron"},
                                                       {"reason", "connection refused"}}));
    REQUIRE(offline);
    CHECK(offline->severity == alerts::Severity::Warning);
    CHECK(offline->message == "Voron is unreachable: connection refused");

    CHECK_FALSE(AlertRules::alertFor(events::Event(events::types::JOB_PROGRESS, "test")));
    CHECK_FALSE(AlertRules::alertFor(events::Event(events::types::PRINTER_TELEMETRY, "test")));
}

TEST_CASE("Closed jobs are alerted, archived once and counted", "[alerts][rules]") {
    storage::Database db(":memory:");
    db.migrate();
    storage::PrinterRecord printer;
    printer.name = "Voron";
    printer.protocol = "moonraker";
    printer.host = "10.0.0.2";
    int printerId = storage::PrinterRepository(db).insert(printer);

    events::EventBus bus;
    alerts::DeliveryQueue queue;
    alerts::AlertDispatcher dispatcher(db, bus, queue, {}, std::make_shared<fakes::FakeHttpClient>());
    AlertRules rules(dispatcher);
    consumers::ArchiveWriter archive(db);
    consumers::CareCounterUpdater counters(db);
    rules.attach(bus);
    archive.attach(bus);
    counters.attach(bus);

    auto data = closedJob(true);
    data["printer_id"] = printerId;
    bus.publish(events::Event(events::types::JOB_COMPLETED, "test", data));

    CHECK(storage::AlertRepository(db).count() == 1);
    CHECK(archive.archivedCount() == 1);
    auto care = storage::PrinterRepository(db).careCounters(printerId);
    CHECK(care.totalPrintCount == 1);
    CHECK(care.totalPrintHours == Approx(2.0));

    SECTION("a failure arriving as completed and failed is archived once") {
        auto failure = closedJob(false);
        failure["printer_id"] = printerId;
        failure["print_job_id"] = 18;
        bus.publish(events::Event(events::types::JOB_COMPLETED, "test", failure));
        bus.publish(events::Event(events::types::JOB_FAILED, "test", failure));

        CHECK(archive.archivedCount() == 2);
        auto record = storage::ArchiveRepository(db).findByJob(18);
        REQUIRE(record);
        CHECK_FALSE(record->success);
        CHECK(record->errorCode == "klippy:shutdown");
        CHECK(storage::PrinterRepository(db).careCounters(printerId).totalPrintCount == 1);
    }
}
