// [SYNC_AGENT] Configuration validation tests

#include <catch2/catch_test_macros.hpp>
#include "sync/SyncConfig.hpp"
#include <string>

using namespace TankSync;

TEST_CASE("Default sync configuration is valid", "[config]") {
    SyncConfig config;
    std::string error = "stale";

    REQUIRE(config.validate(error));
    REQUIRE(error.empty());

    REQUIRE(config.reconciliation.ignoreBand < config.reconciliation.hardThreshold);
    REQUIRE(config.interpolation.staleThresholdMs == 50);
    REQUIRE(config.projectiles.maxLifetimeMs == 5000);
}

TEST_CASE("Invalid sync configurations are reported", "[config]") {
    SyncConfig config;
    std::string error;

    SECTION("Ignore band above hard threshold") {
        config.reconciliation.ignoreBand = 3.0f;
        REQUIRE_FALSE(config.validate(error));
        REQUIRE(error.find("ignoreBand") != std::string::npos);
    }

    SECTION("Soft factor out of range") {
        config.reconciliation.softFactor = 0.0f;
        REQUIRE_FALSE(config.validate(error));
        REQUIRE(error.find("softFactor") != std::string::npos);
    }

    SECTION("RTT bands out of order") {
        config.interpolation.lowRttMs = 200;
        REQUIRE_FALSE(config.validate(error));
        REQUIRE(error.find("lowRttMs") != std::string::npos);
    }

    SECTION("Projectile blend above snap distance") {
        config.projectiles.blendDistance = 5.0f;
        REQUIRE_FALSE(config.validate(error));
        REQUIRE(error.find("blendDistance") != std::string::npos);
    }

    SECTION("Empty pending queue") {
        config.registry.maxPendingCreations = 0;
        REQUIRE_FALSE(config.validate(error));
        REQUIRE(error.find("maxPendingCreations") != std::string::npos);
    }
}
