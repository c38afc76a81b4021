// [PROJECTILE_AGENT] Unit tests for remote projectile tracking

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sync/ProjectileSyncManager.hpp"
#include <cmath>
#include <string>

using namespace TankSync;

namespace {

ProjectileSpawnMessage makeSpawn(const std::string& id, const std::string& owner,
                                 const glm::vec3& position, const glm::vec3& velocity) {
    ProjectileSpawnMessage spawn;
    spawn.id = id;
    spawn.ownerId = owner;
    spawn.position = position;
    spawn.velocity = velocity;
    return spawn;
}

ProjectileUpdateMessage makeUpdate(const std::string& id, const std::string& owner,
                                   const glm::vec3& position, const glm::vec3& velocity) {
    ProjectileUpdateMessage update;
    update.id = id;
    update.ownerId = owner;
    update.position = position;
    update.velocity = velocity;
    return update;
}

} // namespace

TEST_CASE("Projectile spawn filtering", "[projectile]") {
    ProjectileSyncManager manager;
    manager.setLocalOwnerId("local");

    SECTION("Remote shot is tracked") {
        REQUIRE(manager.spawn(makeSpawn("p1", "tank-1", glm::vec3(0.0f), glm::vec3(10.0f, 0.0f, 0.0f)), 0));
        REQUIRE(manager.isTracked("p1"));
        REQUIRE(manager.count() == 1);

        auto view = manager.find("p1", 0);
        REQUIRE(view.has_value());
        REQUIRE(view->ownerId == "tank-1");
        REQUIRE(view->cannonType == "standard");
        REQUIRE(view->visible);
    }

    SECTION("Local shot is rejected") {
        REQUIRE_FALSE(manager.spawn(makeSpawn("p1", "local", glm::vec3(0.0f), glm::vec3(1.0f)), 0));
        REQUIRE(manager.count() == 0);
    }

    SECTION("Duplicate id is rejected") {
        REQUIRE(manager.spawn(makeSpawn("p1", "tank-1", glm::vec3(0.0f), glm::vec3(1.0f)), 0));
        REQUIRE_FALSE(manager.spawn(makeSpawn("p1", "tank-2", glm::vec3(5.0f), glm::vec3(1.0f)), 10));
        REQUIRE(manager.find("p1", 10)->ownerId == "tank-1");
    }

    SECTION("Non-finite spawn is rejected") {
        REQUIRE_FALSE(manager.spawn(
            makeSpawn("p1", "tank-1", glm::vec3(std::nanf(""), 0.0f, 0.0f), glm::vec3(1.0f)), 0));
        REQUIRE_FALSE(manager.isTracked("p1"));
    }
}

TEST_CASE("Projectile velocity from direction", "[projectile]") {
    ProjectileSyncManager manager;

    ProjectileSpawnMessage spawn;
    spawn.id = "p1";
    spawn.ownerId = "tank-1";
    spawn.direction = glm::vec3(0.0f, 0.0f, 2.0f);

    SECTION("Default speed when none is sent") {
        REQUIRE(manager.spawn(spawn, 0));
        REQUIRE(manager.find("p1", 0)->velocity.z == Catch::Approx(80.0f));
    }

    SECTION("Message speed overrides the default") {
        spawn.speed = 25.0f;
        REQUIRE(manager.spawn(spawn, 0));
        REQUIRE(manager.find("p1", 0)->velocity.z == Catch::Approx(25.0f));
        REQUIRE(manager.find("p1", 0)->velocity.x == Catch::Approx(0.0f));
    }

    SECTION("No velocity and no direction") {
        spawn.direction.reset();
        REQUIRE_FALSE(manager.spawn(spawn, 0));
    }
}

TEST_CASE("Projectiles dead-reckon between updates", "[projectile]") {
    ProjectileSyncManager manager;
    REQUIRE(manager.spawn(makeSpawn("p1", "tank-1", glm::vec3(0.0f), glm::vec3(10.0f, 0.0f, 0.0f)), 0));

    manager.update(500, 0.5f);
    REQUIRE(manager.find("p1", 500)->position.x == Catch::Approx(5.0f));

    manager.update(600, 0.1f);
    REQUIRE(manager.find("p1", 600)->position.x == Catch::Approx(6.0f));
}

TEST_CASE("Projectile sync applies on the next update", "[projectile]") {
    ProjectileSyncManager manager;
    REQUIRE(manager.spawn(makeSpawn("p1", "tank-1", glm::vec3(0.0f), glm::vec3(10.0f, 0.0f, 0.0f)), 0));

    SECTION("Large gap snaps and the synced tick is not integrated") {
        REQUIRE(manager.sync(makeUpdate("p1", "tank-1", glm::vec3(5.0f, 0.0f, 0.0f),
                                        glm::vec3(20.0f, 0.0f, 0.0f)), 50));
        REQUIRE(manager.find("p1", 50)->position.x == 0.0f);  // Stored only

        manager.update(60, 0.1f);
        auto view = manager.find("p1", 60);
        REQUIRE(view->position.x == Catch::Approx(5.0f));
        REQUIRE(view->velocity.x == Catch::Approx(20.0f));

        manager.update(160, 0.1f);
        REQUIRE(manager.find("p1", 160)->position.x == Catch::Approx(7.0f));
    }

    SECTION("Medium gap blends halfway") {
        REQUIRE(manager.sync(makeUpdate("p1", "tank-1", glm::vec3(1.0f, 0.0f, 0.0f),
                                        glm::vec3(10.0f, 0.0f, 0.0f)), 50));
        manager.update(60, 0.1f);
        REQUIRE(manager.find("p1", 60)->position.x == Catch::Approx(0.5f));
    }

    SECTION("Tiny gap keeps the rendered position but takes the velocity") {
        REQUIRE(manager.sync(makeUpdate("p1", "tank-1", glm::vec3(0.05f, 0.0f, 0.0f),
                                        glm::vec3(0.0f, 0.0f, 5.0f)), 50));
        manager.update(60, 0.1f);
        auto view = manager.find("p1", 60);
        REQUIRE(view->position.x == 0.0f);
        REQUIRE(view->velocity.z == Catch::Approx(5.0f));
    }

    SECTION("Latest sync wins") {
        REQUIRE(manager.sync(makeUpdate("p1", "tank-1", glm::vec3(50.0f, 0.0f, 0.0f),
                                        glm::vec3(1.0f, 0.0f, 0.0f)), 40));
        REQUIRE(manager.sync(makeUpdate("p1", "tank-1", glm::vec3(8.0f, 0.0f, 0.0f),
                                        glm::vec3(2.0f, 0.0f, 0.0f)), 50));
        manager.update(60, 0.1f);
        REQUIRE(manager.find("p1", 60)->position.x == Catch::Approx(8.0f));
        REQUIRE(manager.find("p1", 60)->velocity.x == Catch::Approx(2.0f));
    }

    SECTION("Non-finite sync is rejected") {
        REQUIRE_FALSE(manager.sync(makeUpdate("p1", "tank-1", glm::vec3(INFINITY, 0.0f, 0.0f),
                                              glm::vec3(1.0f)), 50));
    }
}

TEST_CASE("Projectile removal", "[projectile][lifecycle]") {
    ProjectileSyncManager manager;
    manager.setLocalOwnerId("local");
    REQUIRE(manager.spawn(makeSpawn("p1", "tank-1", glm::vec3(0.0f), glm::vec3(1.0f)), 0));

    SECTION("Hit removes and signals once") {
        REQUIRE(manager.hit("p1", 0));
        REQUIRE_FALSE(manager.isTracked("p1"));

        auto removed = manager.consumeRemovedProjectiles();
        REQUIRE(removed.size() == 1);
        REQUIRE(removed[0] == "p1");
        REQUIRE(manager.consumeRemovedProjectiles().empty());

        // Late traffic for the same id does not bring it back
        REQUIRE_FALSE(manager.sync(makeUpdate("p1", "tank-1", glm::vec3(1.0f), glm::vec3(1.0f)), 10));
        REQUIRE_FALSE(manager.spawn(makeSpawn("p1", "tank-1", glm::vec3(0.0f), glm::vec3(1.0f)), 10));
        REQUIRE_FALSE(manager.hit("p1", 10));
        REQUIRE(manager.count() == 0);
    }

    SECTION("Maximum lifetime expires the shot") {
        manager.update(4999, 0.0f);
        REQUIRE(manager.isTracked("p1"));

        manager.update(5000, 0.0f);
        REQUIRE_FALSE(manager.isTracked("p1"));
        REQUIRE(manager.consumeRemovedProjectiles().size() == 1);
    }

    SECTION("Hit for an unknown id") {
        REQUIRE_FALSE(manager.hit("p9", 20));
        REQUIRE(manager.consumeRemovedProjectiles().empty());

        // Spawn reordered behind its hit stays out
        REQUIRE_FALSE(manager.spawn(makeSpawn("p9", "tank-2", glm::vec3(0.0f), glm::vec3(1.0f)), 30));
        REQUIRE_FALSE(manager.isTracked("p9"));
        REQUIRE(manager.tombstoneCount() == 1);
    }

    SECTION("Removal records are forgotten after the maximum lifetime") {
        REQUIRE(manager.hit("p1", 100));
        REQUIRE(manager.tombstoneCount() == 1);

        manager.update(5099, 0.0f);
        REQUIRE(manager.tombstoneCount() == 1);

        manager.update(5100, 0.0f);
        REQUIRE(manager.tombstoneCount() == 0);
    }
}

TEST_CASE("Projectile update for an unseen id registers it", "[projectile]") {
    ProjectileSyncManager manager;
    manager.setLocalOwnerId("local");

    REQUIRE(manager.sync(makeUpdate("p7", "tank-3", glm::vec3(2.0f, 1.0f, 0.0f),
                                    glm::vec3(3.0f, 0.0f, 0.0f)), 100));
    REQUIRE(manager.isTracked("p7"));
    REQUIRE(manager.find("p7", 100)->position.x == 2.0f);

    SECTION("Unless the owner is local") {
        REQUIRE_FALSE(manager.sync(makeUpdate("p8", "local", glm::vec3(0.0f), glm::vec3(1.0f)), 100));
        REQUIRE_FALSE(manager.isTracked("p8"));
    }

    SECTION("Unless the owner is unknown") {
        REQUIRE_FALSE(manager.sync(makeUpdate("p9", "", glm::vec3(0.0f), glm::vec3(1.0f)), 100));
        REQUIRE_FALSE(manager.isTracked("p9"));
    }
}

TEST_CASE("Launch delay defers visibility only", "[projectile]") {
    ProjectileConfig config;
    config.launchDelayMs = 100;
    ProjectileSyncManager manager(config);

    REQUIRE(manager.spawn(makeSpawn("p1", "tank-1", glm::vec3(0.0f), glm::vec3(10.0f, 0.0f, 0.0f)), 1000));

    manager.update(1050, 0.05f);
    auto early = manager.find("p1", 1050);
    REQUIRE_FALSE(early->visible);
    REQUIRE(early->position.x == Catch::Approx(0.5f));  // Trajectory unaffected

    manager.update(1100, 0.05f);
    REQUIRE(manager.find("p1", 1100)->visible);

    auto all = manager.projectiles(1100);
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].visible);
}
