#pragma once

#include "sync/SyncTypes.hpp"
#include "sync/SyncConfig.hpp"
#include "sync/SyncMessages.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// [PROJECTILE_AGENT] Client-visible tracking of server-simulated projectiles
// Only remote-owned shots live here; local shots are predicted elsewhere

namespace TankSync {

// Latest-wins kinematic update, consumed by the next update() pass
struct PendingProjectileSync {
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
    TimestampMs receivedAt{0};
};

// What the renderer reads for one projectile
struct ProjectileView {
    NetEntityId id;
    NetEntityId ownerId;
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
    std::string cannonType;
    bool visible{false};
};

class ProjectileSyncManager {
public:
    explicit ProjectileSyncManager(const ProjectileConfig& config = ProjectileConfig{});

    // Shots fired by this id are never tracked
    void setLocalOwnerId(NetEntityId ownerId) { localOwnerId_ = std::move(ownerId); }
    [[nodiscard]] const NetEntityId& localOwnerId() const { return localOwnerId_; }

    // Begin tracking a remote shot. Rejects local-owned, duplicate, removed and
    // non-finite spawns.
    bool spawn(const ProjectileSpawnMessage& msg, TimestampMs now);

    // Store the newest kinematics for a projectile; an unseen remote id is
    // registered on the spot.
    bool sync(const ProjectileUpdateMessage& msg, TimestampMs now);

    // Stop tracking and queue the id for the renderer. An id not yet seen is
    // still tombstoned so a late spawn cannot bring it back.
    bool hit(const NetEntityId& id, TimestampMs now);

    // Apply pending syncs, dead-reckon the rest, expire old shots and
    // forget tombstones older than the maximum lifetime
    void update(TimestampMs now, float dtSeconds);

    // Ids removed since the last call
    [[nodiscard]] std::vector<NetEntityId> consumeRemovedProjectiles();

    [[nodiscard]] std::vector<ProjectileView> projectiles(TimestampMs now) const;
    [[nodiscard]] std::optional<ProjectileView> find(const NetEntityId& id, TimestampMs now) const;

    [[nodiscard]] bool isTracked(const NetEntityId& id) const { return index_.count(id) > 0; }
    [[nodiscard]] size_t count() const { return index_.size(); }
    [[nodiscard]] size_t tombstoneCount() const { return removed_.size(); }
    [[nodiscard]] const ProjectileConfig& getConfig() const { return config_; }

    // Drop everything, including removal history (end of match)
    void clear();

private:
    [[nodiscard]] bool isLocalOwner(const NetEntityId& ownerId) const;
    [[nodiscard]] ProjectileView makeView(const ProjectileState& state, TimestampMs now) const;
    [[nodiscard]] std::optional<glm::vec3> resolveVelocity(const ProjectileSpawnMessage& msg) const;

    EntityID create(const NetEntityId& id, const NetEntityId& ownerId, const glm::vec3& position,
                    const glm::vec3& velocity, const std::string& cannonType, TimestampMs now);
    void destroy(const NetEntityId& id, TimestampMs now);
    void pruneTombstones(TimestampMs now);

    ProjectileConfig config_;
    NetEntityId localOwnerId_;

    Registry registry_;
    std::unordered_map<NetEntityId, EntityID> index_;
    std::unordered_map<NetEntityId, TimestampMs> removed_;  // Hit or expired -> removal time
    std::vector<NetEntityId> pendingRemovals_;     // Drained by the renderer
};

} // namespace TankSync
