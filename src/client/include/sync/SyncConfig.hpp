#pragma once

#include "Constants.hpp"
#include "sync/SyncTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <string>

// [SYNC_AGENT] Tunable synchronization parameters
// Defaults come from Constants.hpp; all values can be overridden at session start

namespace TankSync {

struct InterpolationConfig {
    // ========================================================================
    // FRESH / STALE CLASSIFICATION
    // ========================================================================

    // No snapshot for longer than this (ms) switches the entity to dead reckoning
    uint32_t staleThresholdMs = Constants::STALE_THRESHOLD_MS;

    // Dead reckoning horizon cap (ms)
    uint32_t maxExtrapolationMs = Constants::MAX_EXTRAPOLATION_MS;

    // Fraction of the gap to the dead-reckoned target closed per tick
    float extrapolationBlend = Constants::EXTRAPOLATION_BLEND;

    // ========================================================================
    // ADAPTIVE RATE
    // ========================================================================

    uint32_t lowRttMs = Constants::RTT_LOW_MS;
    uint32_t mediumRttMs = Constants::RTT_MEDIUM_MS;
    float lowRttRate = Constants::ALPHA_RATE_LOW_RTT;
    float mediumRttRate = Constants::ALPHA_RATE_MEDIUM_RTT;
    float highRttRate = Constants::ALPHA_RATE_HIGH_RTT;

    // ========================================================================
    // HISTORY / PRESENTATION
    // ========================================================================

    uint32_t historyWindowMs = Constants::SNAPSHOT_HISTORY_WINDOW_MS;
    float minRenderHeight = Constants::MIN_RENDER_HEIGHT;
};

struct ReconciliationConfig {
    // Discrepancies at or below this are codec noise (units)
    float ignoreBand = Constants::IGNORE_BAND;

    // Discrepancies above this teleport (units)
    float hardThreshold = Constants::HARD_CORRECTION_THRESHOLD;

    // Fraction of the remaining gap closed per soft correction
    float softFactor = Constants::SOFT_CORRECTION_FACTOR;

    // Turret / barrel resync tolerance (radians)
    float rotationTolerance = Constants::ROTATION_TOLERANCE;
};

struct ProjectileConfig {
    uint32_t maxLifetimeMs = Constants::PROJECTILE_MAX_LIFETIME_MS;

    // Visibility is deferred by this much after spawn; trajectory is unaffected
    uint32_t launchDelayMs = Constants::PROJECTILE_LAUNCH_DELAY_MS;

    float snapDistance = Constants::PROJECTILE_SNAP_DISTANCE;
    float blendDistance = Constants::PROJECTILE_BLEND_DISTANCE;
    float blendFactor = Constants::PROJECTILE_BLEND_FACTOR;
    float defaultSpeed = Constants::PROJECTILE_DEFAULT_SPEED;
};

struct RegistryConfig {
    // Id of the locally controlled tank; its snapshots go to the reconciler
    NetEntityId localEntityId;

    size_t maxPendingCreations = Constants::MAX_PENDING_CREATIONS;
};

struct MetricsConfig {
    size_t historySize = Constants::POSITION_DIFF_HISTORY_SIZE;
    uint32_t rateWindowMs = Constants::RECONCILIATION_RATE_WINDOW_MS;
    float largeDiffThreshold = Constants::LARGE_DIFF_THRESHOLD;
    float criticalDiffThreshold = Constants::CRITICAL_DIFF_THRESHOLD;
};

struct SyncConfig {
    InterpolationConfig interpolation;
    ReconciliationConfig reconciliation;
    ProjectileConfig projectiles;
    RegistryConfig registry;
    MetricsConfig metrics;

    // Check cross-field invariants; on failure `error` names the first problem
    [[nodiscard]] bool validate(std::string& error) const;
};

} // namespace TankSync
