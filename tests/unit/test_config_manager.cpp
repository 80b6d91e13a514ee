#include <catch2/catch.hpp>

#include <cstdlib>

#include "application/config/ConfigManager.hpp"
#include "core/types/Error.hpp"

using core::config::ConfigManager;

TEST_CASE("ConfigManager defaults are valid", "[config]") {
    ConfigManager config;
    auto validation = config.validate();
    CHECK(validation.isValid);
    CHECK(validation.errors.empty());

    auto supervisor = config.getSupervisorConfig();
    CHECK(supervisor.healthInterval == std::chrono::seconds(30));
    CHECK(supervisor.discoveryInterval == std::chrono::seconds(60));
    CHECK(supervisor.reconnectDelay == std::chrono::milliseconds(1000));

    auto alerts = config.getAlertConfig();
    CHECK(alerts.dedupWindow == std::chrono::seconds(300));
    CHECK_FALSE(alerts.quietHours.enabled);
    CHECK(config.getStorageConfig().path == "printfleet.db");
}

TEST_CASE("ConfigManager flattens nested JSON", "[config]") {
    ConfigManager config;
    config.loadFromString(R"({
        "storage": {"path": "/var/lib/printfleet/fleet.db"},
        "supervisor": {"health_interval_s": 15},
        "detector": {"print_stopping_codes": ["klippy:shutdown", "sdcp:*"]},
        "alerts": {"quiet_hours": {"enabled": true, "start": "23:00", "end": "06:30"}}
    })");

    CHECK(config.getStorageConfig().path == "/var/lib/printfleet/fleet.db");
    CHECK(config.getSupervisorConfig().healthInterval == std::chrono::seconds(15));
    CHECK(config.getSupervisorConfig().discoveryInterval == std::chrono::seconds(60));
    CHECK(config.getDetectorConfig().printStoppingCodes == "klippy:shutdown,sdcp:*");

    auto quiet = config.getAlertConfig().quietHours;
    CHECK(quiet.enabled);
    CHECK(quiet.start == "23:00");
    CHECK(quiet.end == "06:30");

    CHECK(config.get<bool>("alerts.quiet_hours.enabled", false));
    CHECK(config.get<int>("missing.key", 7) == 7);
    CHECK(config.get<int>("storage.path", 3) == 3);
}

TEST_CASE("ConfigManager rejects malformed JSON", "[config]") {
    ConfigManager config;
    CHECK_THROWS_AS(config.loadFromString("{not json"), core::types::ConfigException);
    CHECK_THROWS_AS(config.loadFromString("[1, 2]"), core::types::ConfigException);
}

TEST_CASE("ConfigManager validation reports every problem", "[config]") {
    ConfigManager config;
    config.loadFromString(R"({
        "supervisor": {"health_interval_s": 0, "reconnect_delay_ms": -5},
        "alerts": {"quiet_hours": {"start": "9pm"}, "smtp": {"enabled": true}},
        "logging": {"level": "verbose"}
    })");

    auto validation = config.validate();
    CHECK_FALSE(validation.isValid);
    CHECK(validation.errors.size() == 5);
}

TEST_CASE("ConfigManager notifies changed keys", "[config]") {
    ConfigManager config;
    std::string seenOld;
    std::string seenNew;
    int calls = 0;
    config.registerChangeCallback("logging.level", [&](const std::string &, const std::string &oldValue,
                                                       const std::string &newValue) {
        seenOld = oldValue;
        seenNew = newValue;
        calls++;
    });

    config.set("logging.level", "DEBUG");
    CHECK(calls == 1);
    CHECK(seenOld == "INFO");
    CHECK(seenNew == "DEBUG");

    config.set("logging.level", "DEBUG");
    CHECK(calls == 1);

    config.loadFromString(R"({"logging": {"level": "ERROR"}})");
    CHECK(calls == 2);
    CHECK(seenNew == "ERROR");
}

TEST_CASE("ConfigManager environment overrides the file", "[config]") {
    ConfigManager config;
    config.loadFromString(R"({"storage": {"path": "from-file.db"}})");

    setenv("PRINTFLEET_DB_PATH", "from-env.db", 1);
    config.loadFromEnv();
    unsetenv("PRINTFLEET_DB_PATH");

    CHECK(config.getStorageConfig().path == "from-env.db");
}
