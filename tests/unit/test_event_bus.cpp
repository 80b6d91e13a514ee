#include <catch2/catch.hpp>

#include <stdexcept>
#include <vector>

#include "core/events/EventSystem.hpp"
#include "core/events/EventTypes.hpp"

using namespace core::events;

TEST_CASE("EventBus delivers events to exact and wildcard subscribers", "[events]") {
    EventBus bus;
    std::vector<std::string> seen;

    auto exact = makeObserver([&](const Event &e) { seen.push_back("exact:" + e.type); });
    auto any = makeObserver([&](const Event &e) { seen.push_back("any:" + e.type); });
    bus.subscribe(types::JOB_STARTED, exact);
    bus.subscribe(types::WILDCARD, any);

    bus.publish(Event(types::JOB_STARTED, "test"));
    bus.publish(Event(types::PRINTER_CONNECTED, "test"));

    REQUIRE(seen.size() == 3);
    CHECK(seen[0] == "exact:job.started");
    CHECK(seen[1] == "any:job.started");
    CHECK(seen[2] == "any:printer.connected");
}

TEST_CASE("EventBus keeps publish order for one subscriber", "[events]") {
    EventBus bus;
    std::vector<int> order;
    auto observer = makeObserver([&](const Event &e) { order.push_back(e.data.value("n", -1)); });
    bus.subscribe(types::JOB_PROGRESS, observer);

    for (int i = 0; i < 50; ++i) {
        bus.publish(Event(types::JOB_PROGRESS, "test", {{"n", i}}));
    }

    REQUIRE(order.size() == 50);
    for (int i = 0; i < 50; ++i) {
        CHECK(order[i] == i);
    }
}

TEST_CASE("EventBus isolates a throwing handler", "[events]") {
    EventBus bus;
    int delivered = 0;
    auto failing = makeObserver([](const Event &) { throw std::runtime_error("boom"); });
    auto healthy = makeObserver([&](const Event &) { delivered++; });
    bus.subscribe(types::PRINTER_ERROR, failing);
    bus.subscribe(types::PRINTER_ERROR, healthy);

    REQUIRE_NOTHROW(bus.publish(Event(types::PRINTER_ERROR, "test")));
    CHECK(delivered == 1);

    auto stats = bus.getStatistics();
    CHECK(stats.eventsPublished == 1);
    CHECK(stats.handlerInvocations == 2);
    CHECK(stats.handlerErrors == 1);
}

TEST_CASE("EventBus subscriptions are idempotent and weak", "[events]") {
    EventBus bus;
    int delivered = 0;
    auto observer = makeObserver([&](const Event &) { delivered++; });

    CHECK(bus.subscribe(types::JOB_FAILED, observer));
    CHECK_FALSE(bus.subscribe(types::JOB_FAILED, observer));
    bus.publish(Event(types::JOB_FAILED, "test"));
    CHECK(delivered == 1);

    SECTION("unsubscribe stops delivery") {
        bus.unsubscribe(types::JOB_FAILED, observer);
        bus.publish(Event(types::JOB_FAILED, "test"));
        CHECK(delivered == 1);
    }

    SECTION("expired observers are dropped on publish") {
        observer.reset();
        bus.publish(Event(types::JOB_FAILED, "test"));
        CHECK(delivered == 1);
        CHECK(bus.subscriberCount(types::JOB_FAILED) == 0);
    }
}

TEST_CASE("EventBus handlers may publish re-entrantly", "[events]") {
    EventBus bus;
    std::vector<std::string> seen;
    auto chained = makeObserver([&](const Event &e) {
        seen.push_back(e.type);
        bus.publish(Event(types::JOB_FAILED, "chain"));
    });
    auto tail = makeObserver([&](const Event &e) { seen.push_back(e.type); });
    bus.subscribe(types::JOB_COMPLETED, chained);
    bus.subscribe(types::JOB_FAILED, tail);

    bus.publish(Event(types::JOB_COMPLETED, "test"));

    REQUIRE(seen.size() == 2);
    CHECK(seen[0] == "job.completed");
    CHECK(seen[1] == "job.failed");
}

TEST_CASE("EventBus isolates a handler throwing a non-standard type", "[events]") {
    EventBus bus;
    int delivered = 0;
    auto failing = makeObserver([](const Event &) { throw 42; });
    auto healthy = makeObserver([&](const Event &) { delivered++; });
    bus.subscribe(types::JOB_COMPLETED, failing);
    bus.subscribe(types::WILDCARD, healthy);

    REQUIRE_NOTHROW(bus.publish(Event(types::JOB_COMPLETED, "test")));
    CHECK(delivered == 1);
    CHECK(bus.getStatistics().handlerErrors == 1);
}
