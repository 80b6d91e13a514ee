#include <catch2/catch.hpp>

#include "core/events/EventTypes.hpp"
#include "core/jobs/JobLifecycle.hpp"

using namespace core;
using detector::LifecycleSignal;
using detector::LifecycleState;
using detector::SignalKind;

namespace {

    struct LifecycleFixture {
        storage::Database db{":memory:"};
        events::EventBus bus;
        double now = 1000.0;
        std::vector<events::Event> events;
        std::shared_ptr<events::IEventObserver> recorder;
        printer::PrinterEndpoint endpoint;
        std::unique_ptr<jobs::JobLifecycle> lifecycle;

        LifecycleFixture() {
            db.migrate();
            storage::PrinterRecord record;
            record.name = "Voron";
            record.protocol = "moonraker";
            record.host = "10.0.0.5";
            endpoint.printerId = storage::PrinterRepository(db).insert(record);
            endpoint.name = "Voron";

            recorder = events::makeObserver([this](const events::Event &e) { events.push_back(e); });
            bus.subscribe(events::types::WILDCARD, recorder);
            lifecycle = std::make_unique<jobs::JobLifecycle>(db, bus, jobs::JobLinker(), [this] { return now; });
        }

        LifecycleSignal signal(SignalKind kind, printer::PrinterState state, double progress = 0.0) {
            LifecycleSignal s;
            s.kind = kind;
            s.status.printerId = endpoint.printerId;
            s.status.state = state;
            s.status.filename = "Benchy.gcode";
            s.status.progressPercent = progress;
            s.status.totalLayers = 200;
            return s;
        }

        std::vector<std::string> types() const {
            std::vector<std::string> out;
            for (const auto &e: events) out.push_back(e.type);
            return out;
        }
    };

}

TEST_CASE("JobLifecycle records a job from start to finish", "[lifecycle]") {
    LifecycleFixture f;
    storage::ScheduledJob scheduled;
    scheduled.printerId = f.endpoint.printerId;
    scheduled.itemName = "benchy";
    scheduled.status = "scheduled";
    scheduled.scheduledStart = f.now;
    auto scheduledId = storage::ScheduleRepository(f.db).insert(scheduled);

    f.lifecycle->handle(f.endpoint, f.signal(SignalKind::JobStarted, printer::PrinterState::Printing));

    auto open = f.lifecycle->openJob(f.endpoint.printerId);
    REQUIRE(open);
    CHECK(open->status == "running");
    REQUIRE(open->scheduledJobId);
    CHECK(*open->scheduledJobId == scheduledId);
    CHECK(storage::ScheduleRepository(f.db).find(scheduledId)->status == "printing");

    f.now = 4600.0;
    auto done = f.signal(SignalKind::JobCompleted, printer::PrinterState::Idle, 100.0);
    done.success = true;
    done.to = LifecycleState::Finish;
    f.lifecycle->handle(f.endpoint, done);

    CHECK_FALSE(f.lifecycle->openJob(f.endpoint.printerId));
    auto closed = storage::PrintJobRepository(f.db).find(open->id);
    REQUIRE(closed);
    CHECK(closed->status == "completed");
    REQUIRE(closed->endedAt);
    CHECK(*closed->endedAt == Approx(4600.0));
    REQUIRE(closed->durationSeconds);
    CHECK(*closed->durationSeconds == 3600);
    CHECK(storage::ScheduleRepository(f.db).find(scheduledId)->status == "completed");

    CHECK(f.types() == std::vector<std::string>{"job.started", "job.completed"});
    const auto &completed = f.events.back().data;
    CHECK(completed["success"] == true);
    CHECK(completed["printer_name"] == "Voron");
    CHECK(completed["duration_seconds"] == 3600);

    auto stats = f.lifecycle->getStatistics();
    CHECK(stats.jobsStarted == 1);
    CHECK(stats.jobsCompleted == 1);
    CHECK(stats.jobsLinked == 1);
}

TEST_CASE("JobLifecycle publishes job.failed after the failed completion", "[lifecycle]") {
    LifecycleFixture f;
    f.lifecycle->handle(f.endpoint, f.signal(SignalKind::JobStarted, printer::PrinterState::Printing));

    auto failure = f.signal(SignalKind::JobCompleted, printer::PrinterState::Printing, 42.0);
    failure.success = false;
    failure.errorCode = "klippy:shutdown";
    failure.reason = "MCU shutdown";
    f.lifecycle->handle(f.endpoint, failure);

    CHECK(f.types() == std::vector<std::string>{"job.started", "job.completed", "job.failed"});
    CHECK(f.events[1].data["success"] == false);
    CHECK(f.events[2].data["error_code"] == "klippy:shutdown");
    CHECK(f.events[2].data["reason"] == "MCU shutdown");
    CHECK(f.lifecycle->getStatistics().jobsFailed == 1);
}

TEST_CASE("JobLifecycle never opens a second job for a printer", "[lifecycle]") {
    LifecycleFixture f;
    f.lifecycle->handle(f.endpoint, f.signal(SignalKind::JobStarted, printer::PrinterState::Printing));
    f.lifecycle->handle(f.endpoint, f.signal(SignalKind::JobStarted, printer::PrinterState::Printing));

    CHECK(storage::PrintJobRepository(f.db).countOpen(f.endpoint.printerId) == 1);
    CHECK(f.types() == std::vector<std::string>{"job.started"});
}

TEST_CASE("JobLifecycle ignores a close without an open job", "[lifecycle]") {
    LifecycleFixture f;
    f.lifecycle->handle(f.endpoint, f.signal(SignalKind::JobCancelled, printer::PrinterState::Idle));
    CHECK(f.events.empty());
}

TEST_CASE("JobLifecycle records device errors on the printer", "[lifecycle]") {
    LifecycleFixture f;
    auto error = f.signal(SignalKind::DeviceError, printer::PrinterState::Printing);
    error.errorCode = "klippy:shutdown";
    error.reason = "MCU shutdown";
    error.printStopping = true;
    error.to = LifecycleState::Failed;
    f.lifecycle->handle(f.endpoint, error);

    auto printer = storage::PrinterRepository(f.db).find(f.endpoint.printerId);
    REQUIRE(printer);
    CHECK(printer->lastErrorCode == "klippy:shutdown");
    REQUIRE(f.events.size() == 1);
    CHECK(f.events[0].type == "printer.error");
    CHECK(f.events[0].data["print_stopping"] == true);
    CHECK(f.events[0].data["state"] == "FAILED");

    f.lifecycle->handle(f.endpoint, f.signal(SignalKind::DeviceErrorCleared, printer::PrinterState::Idle));
    CHECK(storage::PrinterRepository(f.db).find(f.endpoint.printerId)->lastErrorCode.empty());
}

TEST_CASE("JobLifecycle leaves ambiguous layer-count matches unlinked in storage", "[lifecycle]") {
    LifecycleFixture f;
    storage::ScheduleRepository schedules(f.db);
    std::vector<int64_t> ids;
    for (const char *item: {"bracket", "hinge"}) {
        storage::ScheduledJob scheduled;
        scheduled.printerId = f.endpoint.printerId;
        scheduled.itemName = item;
        scheduled.layerCount = 200;
        scheduled.status = "scheduled";
        scheduled.scheduledStart = f.now;
        ids.push_back(schedules.insert(scheduled));
    }

    f.lifecycle->handle(f.endpoint, f.signal(SignalKind::JobStarted, printer::PrinterState::Printing));
    auto open = f.lifecycle->openJob(f.endpoint.printerId);
    REQUIRE(open);
    CHECK_FALSE(open->scheduledJobId.has_value());

    f.now = 2000.0;
    auto done = f.signal(SignalKind::JobCompleted, printer::PrinterState::Idle, 100.0);
    done.success = true;
    done.to = LifecycleState::Finish;
    f.lifecycle->handle(f.endpoint, done);

    auto closed = storage::PrintJobRepository(f.db).find(open->id);
    REQUIRE(closed);
    CHECK(closed->status == "completed");
    CHECK_FALSE(closed->scheduledJobId.has_value());

    for (auto id: ids) {
        auto row = schedules.find(id);
        REQUIRE(row);
        CHECK(row->status == "scheduled");
        CHECK_FALSE(row->actualStart.has_value());
        CHECK_FALSE(row->actualEnd.has_value());
    }
    CHECK(f.lifecycle->getStatistics().jobsLinked == 0);
}
