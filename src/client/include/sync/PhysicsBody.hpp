#pragma once

#include "sync/SyncTypes.hpp"
#include <cstdint>

// [PHYSICS_AGENT] Seam to the physics collaborator that owns the local tank body
// The reconciler drives corrections through this interface during the physics step

namespace TankSync {

enum class MotionType : uint8_t {
    Dynamic = 0,    // Simulated by the solver
    Kinematic = 1   // Moved only by direct transform writes
};

class PhysicsBody {
public:
    virtual ~PhysicsBody() = default;

    // Locally predicted pose of the tank
    [[nodiscard]] virtual EntityPose pose() const = 0;

    // Chassis position and heading
    virtual void setTransform(const glm::vec3& position, float yaw) = 0;

    // Turret and barrel are presentation-only, not solver state
    virtual void setTurret(float turretYaw, float aimPitch) = 0;

    virtual void setMotionType(MotionType type) = 0;
    virtual void setLinearVelocity(const glm::vec3& velocity) = 0;
    virtual void setAngularVelocity(const glm::vec3& velocity) = 0;

    // Recompute the world matrix from the freshly written transform
    virtual void computeWorldMatrix() = 0;
};

} // namespace TankSync
