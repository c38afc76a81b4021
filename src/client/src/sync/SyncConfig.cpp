// [SYNC_AGENT] Configuration validation

#include "sync/SyncConfig.hpp"
#include <cmath>
#include <string>

namespace TankSync {

namespace {

bool isFraction(float value) {
    return std::isfinite(value) && value > 0.0f && value <= 1.0f;
}

} // namespace

bool SyncConfig::validate(std::string& error) const {
    const auto& interp = interpolation;
    if (interp.staleThresholdMs == 0) {
        error = "interpolation.staleThresholdMs must be positive";
        return false;
    }
    if (!isFraction(interp.extrapolationBlend)) {
        error = "interpolation.extrapolationBlend must be in (0, 1]";
        return false;
    }
    if (interp.lowRttMs >= interp.mediumRttMs) {
        error = "interpolation.lowRttMs must be below mediumRttMs";
        return false;
    }
    if (!isFraction(interp.lowRttRate) || !isFraction(interp.mediumRttRate) ||
        !isFraction(interp.highRttRate)) {
        error = "interpolation alpha rates must be in (0, 1]";
        return false;
    }
    if (interp.historyWindowMs == 0) {
        error = "interpolation.historyWindowMs must be positive";
        return false;
    }

    const auto& rec = reconciliation;
    if (!std::isfinite(rec.ignoreBand) || rec.ignoreBand < 0.0f) {
        error = "reconciliation.ignoreBand must be a non-negative number";
        return false;
    }
    if (!std::isfinite(rec.hardThreshold) || rec.ignoreBand >= rec.hardThreshold) {
        error = "reconciliation.ignoreBand must be below hardThreshold";
        return false;
    }
    if (!isFraction(rec.softFactor)) {
        error = "reconciliation.softFactor must be in (0, 1]";
        return false;
    }
    if (!std::isfinite(rec.rotationTolerance) || rec.rotationTolerance < 0.0f) {
        error = "reconciliation.rotationTolerance must be a non-negative number";
        return false;
    }

    const auto& proj = projectiles;
    if (proj.maxLifetimeMs == 0) {
        error = "projectiles.maxLifetimeMs must be positive";
        return false;
    }
    if (proj.blendDistance < 0.0f || proj.blendDistance > proj.snapDistance) {
        error = "projectiles.blendDistance must be in [0, snapDistance]";
        return false;
    }
    if (!isFraction(proj.blendFactor)) {
        error = "projectiles.blendFactor must be in (0, 1]";
        return false;
    }
    if (!std::isfinite(proj.defaultSpeed) || proj.defaultSpeed <= 0.0f) {
        error = "projectiles.defaultSpeed must be positive";
        return false;
    }

    if (registry.maxPendingCreations == 0) {
        error = "registry.maxPendingCreations must be positive";
        return false;
    }
    if (metrics.historySize == 0) {
        error = "metrics.historySize must be positive";
        return false;
    }

    error.clear();
    return true;
}

} // namespace TankSync
