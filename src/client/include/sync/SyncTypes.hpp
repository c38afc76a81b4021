#pragma once

#include "Constants.hpp"
#include <cstdint>
#include <entt/entt.hpp>
#include <glm/glm.hpp>
#include <cmath>
#include <optional>
#include <string>

// [SYNC_AGENT] Core state types shared by the synchronization components
// Snapshots are immutable values; a newer one replaces, never mutates, an older one

namespace TankSync {

using EntityID = entt::entity;
using Registry = entt::registry;
using NetEntityId = std::string;  // Server-assigned player / projectile id
using TimestampMs = uint32_t;     // Client clock, milliseconds

inline constexpr float PI = 3.14159265358979323846f;
inline constexpr float TWO_PI = 2.0f * PI;

// ============================================================================
// MATH HELPERS
// ============================================================================

[[nodiscard]] inline bool isFinite(float v) {
    return std::isfinite(v);
}

[[nodiscard]] inline bool isFinite(const glm::vec3& v) {
    return std::isfinite(v.x) && std::isfinite(v.y) && std::isfinite(v.z);
}

// Wrap an angle into (-PI, PI]
[[nodiscard]] inline float normalizeAngle(float angle) {
    float wrapped = std::fmod(angle, TWO_PI);
    if (wrapped <= -PI) {
        wrapped += TWO_PI;
    } else if (wrapped > PI) {
        wrapped -= TWO_PI;
    }
    return wrapped;
}

// Signed shortest rotation taking `from` to `to`, in (-PI, PI]
[[nodiscard]] inline float shortestAngleDelta(float from, float to) {
    return normalizeAngle(to - from);
}

[[nodiscard]] inline float lerpAngle(float from, float to, float t) {
    return normalizeAngle(from + shortestAngleDelta(from, to) * t);
}

// Cubic smoothstep t^2 (3 - 2t), C1-continuous at both ends
[[nodiscard]] inline float smoothstep(float t) {
    return t * t * (3.0f - 2.0f * t);
}

// ============================================================================
// ENTITY STATE
// ============================================================================

enum class EntityStatus : uint8_t {
    Alive = 0,
    Dead = 1
};

// Renderable pose of one tank
struct EntityPose {
    glm::vec3 position{0.0f};
    float yaw{0.0f};        // Chassis heading, radians
    float turretYaw{0.0f};  // Relative to chassis, radians
    float aimPitch{0.0f};   // Barrel elevation, radians

    [[nodiscard]] bool isFinite() const {
        return TankSync::isFinite(position) && std::isfinite(yaw) &&
               std::isfinite(turretYaw) && std::isfinite(aimPitch);
    }

    static EntityPose defaultSpawn() {
        EntityPose pose;
        pose.position = glm::vec3(Constants::DEFAULT_SPAWN_X,
                                  Constants::DEFAULT_SPAWN_Y,
                                  Constants::DEFAULT_SPAWN_Z);
        return pose;
    }
};

// What the renderer reads once per tick
struct RenderPose {
    glm::vec3 position{0.0f};
    float yaw{0.0f};
    float turretYaw{0.0f};
    float aimPitch{0.0f};
    bool visible{false};
};

// Server description of one entity at one instant
struct EntitySnapshot {
    NetEntityId id;
    EntityPose pose;
    float health{0.0f};
    float maxHealth{0.0f};
    EntityStatus status{EntityStatus::Alive};
    std::optional<uint8_t> team;
    TimestampMs receivedAt{0};

    [[nodiscard]] bool isAlive() const { return status == EntityStatus::Alive; }

    // Same arrival time and same pose: re-applying it must be a no-op
    [[nodiscard]] bool sameSample(const EntitySnapshot& other) const {
        return receivedAt == other.receivedAt &&
               pose.position == other.pose.position &&
               pose.yaw == other.pose.yaw &&
               pose.turretYaw == other.pose.turretYaw &&
               pose.aimPitch == other.pose.aimPitch &&
               status == other.status;
    }
};

// Latest authoritative belief about the local entity
struct ReconciliationSample {
    EntityPose serverPose;
    float positionDiff{0.0f};  // As reported by the server
    TimestampMs receivedAt{0};
};

// ============================================================================
// PROJECTILE STATE
// ============================================================================

// [PROJECTILE_AGENT] One remote-owned projectile, stored as an EnTT component
struct ProjectileState {
    NetEntityId id;
    NetEntityId ownerId;
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
    std::string cannonType;
    TimestampMs spawnedAt{0};
    TimestampMs visibleAt{0};
};

} // namespace TankSync
