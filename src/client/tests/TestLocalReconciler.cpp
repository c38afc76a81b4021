// [RECONCILE_AGENT] Unit tests for local tank reconciliation tiers

#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "sync/LocalReconciler.hpp"
#include "monitoring/SyncMetrics.hpp"
#include "SyncTestHelpers.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>

using namespace TankSync;
using TankSync::Test::RecordingPhysicsBody;
using TankSync::Test::makePose;
using TankSync::Test::makeSnapshot;

namespace {

ReconciliationMessage serverAt(const glm::vec3& position, float reportedDiff = 0.0f) {
    ReconciliationMessage msg;
    msg.serverPose = makePose(position);
    msg.positionDiff = reportedDiff;
    return msg;
}

bool called(const RecordingPhysicsBody& body, const std::string& name) {
    return std::find(body.calls.begin(), body.calls.end(), name) != body.calls.end();
}

} // namespace

TEST_CASE("Tier classification", "[reconcile]") {
    LocalReconciler reconciler;

    REQUIRE(reconciler.classify(0.0f) == CorrectionTier::Ignore);
    REQUIRE(reconciler.classify(0.15f) == CorrectionTier::Ignore);
    REQUIRE(reconciler.classify(0.16f) == CorrectionTier::Soft);
    REQUIRE(reconciler.classify(2.0f) == CorrectionTier::Soft);
    REQUIRE(reconciler.classify(2.01f) == CorrectionTier::Hard);
}

TEST_CASE("Hard correction teleports through a kinematic switch", "[reconcile]") {
    LocalReconciler reconciler;
    RecordingPhysicsBody body(makePose(glm::vec3(0.0f)));

    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(5.0f, 0.0f, 0.0f)), 100));
    CorrectionResult result = reconciler.applyCorrection(body);

    REQUIRE(result.tier == CorrectionTier::Hard);
    REQUIRE_FALSE(result.spawnTeleport);
    REQUIRE(result.positionDiff == Catch::Approx(5.0f));

    // Exactly the authoritative position, no partial blend
    REQUIRE(body.pose().position.x == 5.0f);
    REQUIRE(body.pose().position.y == 0.0f);
    REQUIRE(body.pose().position.z == 0.0f);

    SECTION("Two-phase switch order") {
        std::vector<std::string> expected = {
            "setMotionType:kinematic", "setLinearVelocity", "setAngularVelocity",
            "setTransform", "computeWorldMatrix",
            "setMotionType:dynamic", "setLinearVelocity", "setAngularVelocity",
            "setTurret"};
        REQUIRE(body.calls == expected);
    }

    SECTION("Body is handed back dynamic and at rest") {
        REQUIRE(body.motionType == MotionType::Dynamic);
        REQUIRE(body.linearVelocity == glm::vec3(0.0f));
        REQUIRE(body.angularVelocity == glm::vec3(0.0f));
    }
}

TEST_CASE("Soft correction closes a fraction of the gap per message", "[reconcile]") {
    LocalReconciler reconciler;
    RecordingPhysicsBody body(makePose(glm::vec3(0.0f)));

    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(1.0f, 0.0f, 0.0f)), 100));
    CorrectionResult result = reconciler.applyCorrection(body);

    REQUIRE(result.tier == CorrectionTier::Soft);
    REQUIRE(body.pose().position.x == Catch::Approx(0.3f));
    REQUIRE_FALSE(called(body, "setMotionType:kinematic"));

    SECTION("Applied once per message, not per frame") {
        CorrectionResult again = reconciler.applyCorrection(body);
        REQUIRE(again.tier == CorrectionTier::None);
        REQUIRE(body.pose().position.x == Catch::Approx(0.3f));
    }

    SECTION("Converges within 0.01 after ten corrections") {
        float previousGap = 1.0f - body.pose().position.x;
        for (int i = 1; i < 10; ++i) {
            REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(1.0f, 0.0f, 0.0f)),
                                                100 + static_cast<TimestampMs>(i) * 100));
            reconciler.applyCorrection(body);

            float gap = 1.0f - body.pose().position.x;
            REQUIRE(gap >= 0.0f);
            REQUIRE(gap <= previousGap);
            previousGap = gap;
        }
        REQUIRE(body.pose().position.x == Catch::Approx(1.0f).margin(0.01));
    }

    SECTION("Heading blends along the shortest arc") {
        RecordingPhysicsBody turned(makePose(glm::vec3(0.0f), 3.0f));
        ReconciliationMessage msg = serverAt(glm::vec3(1.0f, 0.0f, 0.0f));
        msg.serverPose->yaw = -3.0f;

        REQUIRE(reconciler.onReconciliation(msg, 200));
        reconciler.applyCorrection(turned);
        REQUIRE(std::abs(turned.pose().yaw) > 3.0f);
    }
}

TEST_CASE("Ignore band leaves the position alone", "[reconcile]") {
    LocalReconciler reconciler;
    RecordingPhysicsBody body(makePose(glm::vec3(0.0f)));

    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(0.05f, 0.0f, 0.0f), 0.05f), 100));
    CorrectionResult result = reconciler.applyCorrection(body);

    REQUIRE(result.tier == CorrectionTier::Ignore);
    REQUIRE(body.calls.empty());
    REQUIRE(body.pose().position.x == 0.0f);

    SECTION("Turret still resyncs past its own tolerance") {
        ReconciliationMessage msg = serverAt(glm::vec3(0.05f, 0.0f, 0.0f));
        msg.serverPose->turretYaw = 0.5f;
        msg.serverPose->aimPitch = 0.1f;

        REQUIRE(reconciler.onReconciliation(msg, 200));
        CorrectionResult turret = reconciler.applyCorrection(body);

        REQUIRE(turret.tier == CorrectionTier::Ignore);
        REQUIRE(turret.turretResynced);
        REQUIRE(body.calls == std::vector<std::string>{"setTurret"});
        REQUIRE(body.pose().turretYaw == 0.5f);
        REQUIRE(body.pose().aimPitch == 0.1f);
        REQUIRE(body.pose().position.x == 0.0f);
    }

    SECTION("Turret inside tolerance is not touched") {
        ReconciliationMessage msg = serverAt(glm::vec3(0.05f, 0.0f, 0.0f));
        msg.serverPose->turretYaw = 0.001f;

        REQUIRE(reconciler.onReconciliation(msg, 200));
        CorrectionResult turret = reconciler.applyCorrection(body);
        REQUIRE_FALSE(turret.turretResynced);
        REQUIRE(body.calls.empty());
    }
}

TEST_CASE("Invalid reconciliation messages are no-ops", "[reconcile]") {
    LocalReconciler reconciler;
    RecordingPhysicsBody body(makePose(glm::vec3(0.0f)));

    SECTION("Missing server pose") {
        ReconciliationMessage msg;
        msg.positionDiff = 4.0f;
        REQUIRE_FALSE(reconciler.onReconciliation(msg, 100));
    }

    SECTION("Non-finite server pose") {
        REQUIRE_FALSE(reconciler.onReconciliation(serverAt(glm::vec3(INFINITY, 0.0f, 0.0f)), 100));
    }

    REQUIRE_FALSE(reconciler.hasPendingCorrection());
    REQUIRE(reconciler.applyCorrection(body).tier == CorrectionTier::None);
    REQUIRE(body.calls.empty());
}

TEST_CASE("Latest reconciliation message wins", "[reconcile]") {
    LocalReconciler reconciler;
    RecordingPhysicsBody body(makePose(glm::vec3(0.0f)));

    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(10.0f, 0.0f, 0.0f), 10.0f), 100));
    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(0.1f, 0.0f, 0.0f), 0.1f), 150));

    CorrectionResult result = reconciler.applyCorrection(body);
    REQUIRE(result.tier == CorrectionTier::Ignore);
    REQUIRE(reconciler.latestSample()->receivedAt == 150);
    REQUIRE(reconciler.latestSample()->positionDiff == Catch::Approx(0.1f));
}

TEST_CASE("Spawn and respawn force a hard teleport", "[reconcile][lifecycle]") {
    LocalReconciler reconciler;
    RecordingPhysicsBody body(makePose(glm::vec3(3.05f, 0.5f, 3.0f)));

    REQUIRE(reconciler.onSnapshot(makeSnapshot("local", 0, glm::vec3(3.0f, 0.5f, 3.0f))));
    REQUIRE(reconciler.hasSpawned());

    CorrectionResult spawn = reconciler.applyCorrection(body);
    REQUIRE(spawn.tier == CorrectionTier::Hard);
    REQUIRE(spawn.spawnTeleport);
    REQUIRE(body.pose().position.x == 3.0f);

    SECTION("Regular snapshots while alive queue nothing") {
        REQUIRE(reconciler.onSnapshot(makeSnapshot("local", 100, glm::vec3(9.0f, 0.5f, 9.0f))));
        REQUIRE_FALSE(reconciler.hasPendingCorrection());
    }

    SECTION("Dead then alive teleports to the respawn point") {
        REQUIRE(reconciler.onSnapshot(makeSnapshot("local", 100, glm::vec3(3.0f, 0.5f, 3.0f), 0.0f,
                                                   EntityStatus::Dead)));
        REQUIRE_FALSE(reconciler.hasPendingCorrection());
        REQUIRE(reconciler.status() == EntityStatus::Dead);

        REQUIRE(reconciler.onSnapshot(makeSnapshot("local", 200, glm::vec3(-20.0f, 0.5f, 4.0f))));
        body.calls.clear();

        CorrectionResult respawn = reconciler.applyCorrection(body);
        REQUIRE(respawn.tier == CorrectionTier::Hard);
        REQUIRE(respawn.spawnTeleport);
        REQUIRE(body.pose().position.x == -20.0f);
        REQUIRE(body.pose().position.z == 4.0f);
        REQUIRE(called(body, "setMotionType:kinematic"));
    }
}

TEST_CASE("Reconciler rejects inconsistent bands", "[reconcile][config]") {
    ReconciliationConfig config;

    SECTION("Ignore band not below hard threshold") {
        config.ignoreBand = 2.0f;
        config.hardThreshold = 2.0f;
        REQUIRE_THROWS_AS(LocalReconciler(config), std::invalid_argument);
    }

    SECTION("Soft factor out of range") {
        config.softFactor = 0.0f;
        REQUIRE_THROWS_AS(LocalReconciler(config), std::invalid_argument);
        config.softFactor = 1.5f;
        REQUIRE_THROWS_AS(LocalReconciler(config), std::invalid_argument);
    }
}

TEST_CASE("Corrections are sampled into metrics", "[reconcile][metrics]") {
    Monitoring::SyncMetrics metrics;
    LocalReconciler reconciler(ReconciliationConfig{}, &metrics);
    RecordingPhysicsBody body(makePose(glm::vec3(0.0f)));

    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(1.0f, 0.0f, 0.0f)), 100));
    reconciler.applyCorrection(body);
    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(20.0f, 0.0f, 0.0f)), 200));
    reconciler.applyCorrection(body);
    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(20.05f, 0.0f, 0.0f)), 300));
    reconciler.applyCorrection(body);

    const auto& data = metrics.getMetrics();
    REQUIRE(data.softCorrections == 1);
    REQUIRE(data.hardCorrections == 1);
    REQUIRE(data.ignoredCorrections == 1);
    REQUIRE(data.samplesCount == 3);
    REQUIRE(data.reconciliationCount == 2);
    REQUIRE(data.lastReconciliationTime == 200);
}

TEST_CASE("Unmeasurable drift does not poison metrics", "[reconcile][metrics]") {
    Monitoring::SyncMetrics metrics;
    LocalReconciler reconciler(ReconciliationConfig{}, &metrics);
    RecordingPhysicsBody body(makePose(glm::vec3(std::nanf(""), 0.0f, 0.0f)));

    REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(1.0f, 0.0f, 0.0f)), 100));
    CorrectionResult result = reconciler.applyCorrection(body);
    REQUIRE(result.tier == CorrectionTier::Hard);
    REQUIRE(body.pose().position.x == 1.0f);

    for (TimestampMs i = 0; i < 200; ++i) {
        REQUIRE(reconciler.onReconciliation(serverAt(glm::vec3(1.0f, 0.0f, 0.0f)), 200 + i));
        REQUIRE(reconciler.applyCorrection(body).tier == CorrectionTier::Ignore);
    }

    const auto& data = metrics.getMetrics();
    REQUIRE(std::isfinite(data.averagePositionDiff));
    REQUIRE(data.averagePositionDiff == Catch::Approx(0.0f));
    REQUIRE(data.criticalDiffs == 1);
    REQUIRE(metrics.getSyncQuality() < 100.0f);
}
