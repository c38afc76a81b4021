// [RECONCILE_AGENT] Local tank reconciliation
// Three tiers driven by the distance between predicted and authoritative pose:
//   <= ignoreBand     : codec noise, position untouched
//   <= hardThreshold  : blend softFactor of the gap, once per message
//   >  hardThreshold  : teleport with a kinematic/dynamic two-phase switch

#include "sync/LocalReconciler.hpp"
#include "monitoring/SyncMetrics.hpp"
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <string>

namespace TankSync {

const char* correctionTierName(CorrectionTier tier) {
    switch (tier) {
        case CorrectionTier::None:   return "none";
        case CorrectionTier::Ignore: return "ignore";
        case CorrectionTier::Soft:   return "soft";
        case CorrectionTier::Hard:   return "hard";
    }
    return "unknown";
}

LocalReconciler::LocalReconciler(const ReconciliationConfig& config,
                                 Monitoring::SyncMetrics* metrics)
    : config_(config), metrics_(metrics) {
    if (!(config_.ignoreBand >= 0.0f) || !(config_.ignoreBand < config_.hardThreshold)) {
        throw std::invalid_argument("LocalReconciler: ignoreBand must be in [0, hardThreshold)");
    }
    if (!(config_.softFactor > 0.0f) || config_.softFactor > 1.0f) {
        throw std::invalid_argument("LocalReconciler: softFactor must be in (0, 1]");
    }
}

bool LocalReconciler::onReconciliation(const ReconciliationMessage& msg, TimestampMs receivedAt) {
    if (!msg.serverPose || !msg.serverPose->isFinite()) {
        std::cerr << "[RECONCILER] Ignored reconciliation without a valid server pose\n";
        return false;
    }
    if (!std::isfinite(msg.positionDiff)) {
        std::cerr << "[RECONCILER] Ignored reconciliation with non-finite positionDiff\n";
        return false;
    }

    ReconciliationSample sample;
    sample.serverPose = *msg.serverPose;
    sample.positionDiff = msg.positionDiff;
    sample.receivedAt = receivedAt;
    sample_ = sample;
    pending_ = true;
    return true;
}

bool LocalReconciler::onSnapshot(const EntitySnapshot& snap) {
    if (!snap.pose.isFinite()) {
        std::cerr << "[RECONCILER] Rejected non-finite local snapshot\n";
        return false;
    }

    bool respawned = status_ == EntityStatus::Dead && snap.isAlive();
    bool firstSpawn = !spawned_ && snap.isAlive();
    status_ = snap.status;

    if (firstSpawn || respawned) {
        ReconciliationSample sample;
        sample.serverPose = snap.pose;
        sample.positionDiff = 0.0f;
        sample.receivedAt = snap.receivedAt;
        sample_ = sample;
        pending_ = true;
        forceHard_ = true;
        spawned_ = true;
        std::cout << "[RECONCILER] " << (respawned ? "Respawn" : "Spawn")
                  << " teleport queued for local tank " << snap.id << "\n";
    }
    return true;
}

CorrectionTier LocalReconciler::classify(float positionDiff) const {
    if (positionDiff <= config_.ignoreBand) {
        return CorrectionTier::Ignore;
    }
    if (positionDiff <= config_.hardThreshold) {
        return CorrectionTier::Soft;
    }
    return CorrectionTier::Hard;
}

CorrectionResult LocalReconciler::applyCorrection(PhysicsBody& body) {
    CorrectionResult result;
    if (!pending_ || !sample_) {
        return result;
    }
    pending_ = false;

    const EntityPose predicted = body.pose();
    const EntityPose& server = sample_->serverPose;

    result.positionDiff = glm::distance(predicted.position, server.position);
    result.rotationDiff = std::abs(shortestAngleDelta(predicted.yaw, server.yaw));
    result.turretDiff = std::abs(shortestAngleDelta(predicted.turretYaw, server.turretYaw));

    if (forceHard_ || !std::isfinite(result.positionDiff)) {
        result.tier = CorrectionTier::Hard;
        result.spawnTeleport = forceHard_;
        forceHard_ = false;
    } else {
        result.tier = classify(result.positionDiff);
    }

    switch (result.tier) {
        case CorrectionTier::Hard:
            applyHard(body, server);
            result.turretResynced = true;
            break;
        case CorrectionTier::Soft:
            applySoft(body, predicted, server);
            resyncTurret(body, predicted, server, result);
            break;
        case CorrectionTier::Ignore:
            resyncTurret(body, predicted, server, result);
            break;
        case CorrectionTier::None:
            break;
    }

    if (metrics_) {
        if (result.tier == CorrectionTier::Ignore) {
            metrics_->recordIgnored(result.positionDiff);
        } else if (!result.spawnTeleport) {
            metrics_->recordReconciliation(result.tier == CorrectionTier::Hard,
                                           result.positionDiff, sample_->receivedAt);
        }
        metrics_->recordRotationDiff(result.rotationDiff, result.turretDiff);
    }
    return result;
}

void LocalReconciler::applySoft(PhysicsBody& body, const EntityPose& predicted,
                                const EntityPose& server) {
    glm::vec3 blended = glm::mix(predicted.position, server.position, config_.softFactor);

    // Residual inside the ignore band: settle on the server position
    if (glm::distance(blended, server.position) <= config_.ignoreBand) {
        blended = server.position;
    }

    float yaw = lerpAngle(predicted.yaw, server.yaw, config_.softFactor);
    body.setTransform(blended, yaw);
    body.computeWorldMatrix();
}

void LocalReconciler::applyHard(PhysicsBody& body, const EntityPose& server) {
    const glm::vec3 zero(0.0f);

    // Phase 1: take the body away from the solver and write the transform
    body.setMotionType(MotionType::Kinematic);
    body.setLinearVelocity(zero);
    body.setAngularVelocity(zero);
    body.setTransform(server.position, server.yaw);
    body.computeWorldMatrix();

    // Phase 2: hand it back at rest so the next step does not react to the jump
    body.setMotionType(MotionType::Dynamic);
    body.setLinearVelocity(zero);
    body.setAngularVelocity(zero);

    body.setTurret(server.turretYaw, server.aimPitch);
}

void LocalReconciler::resyncTurret(PhysicsBody& body, const EntityPose& predicted,
                                   const EntityPose& server, CorrectionResult& result) const {
    float pitchDiff = std::abs(shortestAngleDelta(predicted.aimPitch, server.aimPitch));
    if (result.turretDiff <= config_.rotationTolerance && pitchDiff <= config_.rotationTolerance) {
        return;
    }
    body.setTurret(server.turretYaw, server.aimPitch);
    result.turretResynced = true;
}

} // namespace TankSync
