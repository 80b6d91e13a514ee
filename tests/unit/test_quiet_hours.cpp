#include <catch2/catch.hpp>

#include "core/alerts/QuietHours.hpp"
#include "core/types/Error.hpp"

using core::alerts::QuietHours;

namespace {

    QuietHours overnight(bool enabled = true) {
        core::config::QuietHoursConfig config;
        config.enabled = enabled;
        config.start = "22:00";
        config.end = "07:00";
        return QuietHours(config);
    }

    constexpr int at(int hour, int minute) { return hour * 60 + minute; }

}

TEST_CASE("Quiet hours wrap past midnight", "[alerts][quiet]") {
    auto quiet = overnight();
    CHECK(quiet.isActive(at(23, 30)));
    CHECK(quiet.isActive(at(6, 30)));
    CHECK_FALSE(quiet.isActive(at(12, 0)));
}

TEST_CASE("Quiet hours include the start minute and exclude the end minute", "[alerts][quiet]") {
    auto quiet = overnight();
    CHECK(quiet.isActive(at(22, 0)));
    CHECK(quiet.isActive(at(6, 59)));
    CHECK_FALSE(quiet.isActive(at(7, 0)));
    CHECK_FALSE(quiet.isActive(at(21, 59)));
}

TEST_CASE("Same-day and empty windows", "[alerts][quiet]") {
    CHECK(QuietHours::inWindow(at(9, 0), at(17, 0), at(12, 0)));
    CHECK_FALSE(QuietHours::inWindow(at(9, 0), at(17, 0), at(17, 0)));
    CHECK_FALSE(QuietHours::inWindow(at(8, 0), at(8, 0), at(8, 0)));
}

TEST_CASE("Disabled quiet hours are never active", "[alerts][quiet]") {
    auto quiet = overnight(false);
    CHECK_FALSE(quiet.isActive(at(23, 30)));
    CHECK_FALSE(quiet.lastWindow(std::chrono::system_clock::now()));
}

TEST_CASE("Malformed quiet hours are rejected", "[alerts][quiet]") {
    core::config::QuietHoursConfig config;
    config.start = "25:00";
    CHECK_THROWS_AS(QuietHours(config), core::types::ConfigException);
    config.start = "22h";
    CHECK_THROWS_AS(QuietHours(config), core::types::ConfigException);
}

TEST_CASE("Last window ends at or before now and spans the configured length", "[alerts][quiet]") {
    auto quiet = overnight();
    auto now = std::chrono::system_clock::now();
    auto window = quiet.lastWindow(now);
    REQUIRE(window);
    CHECK(window->second <= std::chrono::duration<double>(now.time_since_epoch()).count());
    CHECK(window->second - window->first == Approx(9 * 3600.0).margin(3600.0));
}
