#pragma once

#include <cstdint>
#include <cstddef>

// [ALL-AGENTS] Global constants for the TankSync client synchronization core
// All magic numbers MUST be defined here, not scattered in code

namespace TankSync {
namespace Constants {

inline constexpr const char* VERSION = "0.4.0";

// ============================================================================
// TIMING CONSTANTS
// ============================================================================

// [NETWORK_AGENT] Render tick and server snapshot cadence
inline constexpr uint32_t RENDER_RATE_HZ = 60;
inline constexpr float RENDER_DT_SECONDS = 1.0f / RENDER_RATE_HZ;
inline constexpr uint32_t SERVER_SNAPSHOT_RATE_HZ = 20;

// [NETWORK_AGENT] One typical server tick without data marks an entity stale
inline constexpr uint32_t STALE_THRESHOLD_MS = 50;

// [NETWORK_AGENT] Dead reckoning never projects further than this
inline constexpr uint32_t MAX_EXTRAPOLATION_MS = 500;

// ============================================================================
// INTERPOLATION CONSTANTS
// ============================================================================

// [INTERP_AGENT] Snapshot history window per remote entity
inline constexpr uint32_t SNAPSHOT_HISTORY_WINDOW_MS = 1000;

// [INTERP_AGENT] Adaptive alpha rates, selected from RTT
inline constexpr uint32_t RTT_LOW_MS = 50;
inline constexpr uint32_t RTT_MEDIUM_MS = 150;
inline constexpr float ALPHA_RATE_LOW_RTT = 0.3f;
inline constexpr float ALPHA_RATE_MEDIUM_RTT = 0.2f;
inline constexpr float ALPHA_RATE_HIGH_RTT = 0.1f;

// [INTERP_AGENT] Alpha rates are tuned per 60 Hz frame
inline constexpr float ALPHA_RATE_FRAME_SCALE = 60.0f;

// [INTERP_AGENT] Blend factor toward the dead-reckoned target while stale
inline constexpr float EXTRAPOLATION_BLEND = 0.3f;

// [INTERP_AGENT] Rendered tanks never sink below this height
inline constexpr float MIN_RENDER_HEIGHT = 0.5f;

// [INTERP_AGENT] Pose used when an entity's first snapshot is unusable
inline constexpr float DEFAULT_SPAWN_X = 0.0f;
inline constexpr float DEFAULT_SPAWN_Y = 2.0f;
inline constexpr float DEFAULT_SPAWN_Z = 0.0f;

// ============================================================================
// RECONCILIATION CONSTANTS
// ============================================================================

// [RECONCILE_AGENT] Position codec quantizes to a 0.1 unit grid
inline constexpr float POSITION_QUANTUM = 0.1f;
inline constexpr float QUANTIZATION_ERROR = 0.15f;  // quantum + margin

// [RECONCILE_AGENT] Angle codec quantizes to 0.001 rad
inline constexpr float ANGLE_QUANTUM = 0.001f;
inline constexpr float ROTATION_TOLERANCE = 0.002f;  // quantum + margin

// [RECONCILE_AGENT] Correction tiers (units)
inline constexpr float IGNORE_BAND = QUANTIZATION_ERROR;
inline constexpr float HARD_CORRECTION_THRESHOLD = 2.0f;
inline constexpr float SOFT_CORRECTION_FACTOR = 0.3f;

// ============================================================================
// PROJECTILE CONSTANTS
// ============================================================================

// [PROJECTILE_AGENT] Remote projectile tracking
inline constexpr uint32_t PROJECTILE_MAX_LIFETIME_MS = 5000;
inline constexpr uint32_t PROJECTILE_LAUNCH_DELAY_MS = 0;
inline constexpr float PROJECTILE_SNAP_DISTANCE = 2.0f;
inline constexpr float PROJECTILE_BLEND_DISTANCE = 0.1f;
inline constexpr float PROJECTILE_BLEND_FACTOR = 0.5f;
inline constexpr float PROJECTILE_DEFAULT_SPEED = 80.0f;  // units/s

// ============================================================================
// REGISTRY CONSTANTS
// ============================================================================

// [REGISTRY_AGENT] Messages held while the renderer is not ready
inline constexpr size_t MAX_PENDING_CREATIONS = 256;

// ============================================================================
// METRICS CONSTANTS
// ============================================================================

// [METRICS_AGENT] Rolling diagnostics
inline constexpr size_t POSITION_DIFF_HISTORY_SIZE = 60;
inline constexpr uint32_t RECONCILIATION_RATE_WINDOW_MS = 1000;
inline constexpr float LARGE_DIFF_THRESHOLD = 10.0f;
inline constexpr float CRITICAL_DIFF_THRESHOLD = 20.0f;
inline constexpr float ROTATION_EMA_ALPHA = 0.1f;

} // namespace Constants
} // namespace TankSync
