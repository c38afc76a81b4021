// [PROJECTILE_AGENT] Projectile sync implementation
// Straight-line dead reckoning between server updates; an update pulls the
// rendered shot back by snap, half-blend or nothing depending on the gap

#include "sync/ProjectileSyncManager.hpp"
#include <cmath>
#include <iostream>
#include <utility>

namespace TankSync {

ProjectileSyncManager::ProjectileSyncManager(const ProjectileConfig& config)
    : config_(config) {
}

bool ProjectileSyncManager::isLocalOwner(const NetEntityId& ownerId) const {
    return !localOwnerId_.empty() && ownerId == localOwnerId_;
}

std::optional<glm::vec3> ProjectileSyncManager::resolveVelocity(
    const ProjectileSpawnMessage& msg) const {
    if (msg.velocity) {
        if (!isFinite(*msg.velocity)) {
            return std::nullopt;
        }
        return *msg.velocity;
    }

    if (msg.direction && isFinite(*msg.direction)) {
        float length = glm::length(*msg.direction);
        if (length > 0.0f) {
            float speed = (std::isfinite(msg.speed) && msg.speed > 0.0f) ? msg.speed
                                                                          : config_.defaultSpeed;
            return (*msg.direction / length) * speed;
        }
    }
    return std::nullopt;
}

bool ProjectileSyncManager::spawn(const ProjectileSpawnMessage& msg, TimestampMs now) {
    if (msg.id.empty() || isLocalOwner(msg.ownerId)) {
        return false;
    }
    if (index_.count(msg.id) > 0 || removed_.count(msg.id) > 0) {
        return false;
    }
    if (!isFinite(msg.position)) {
        std::cerr << "[PROJECTILE] Rejected spawn " << msg.id << " with non-finite position\n";
        return false;
    }

    auto velocity = resolveVelocity(msg);
    if (!velocity) {
        std::cerr << "[PROJECTILE] Rejected spawn " << msg.id << " without usable velocity\n";
        return false;
    }

    create(msg.id, msg.ownerId, msg.position, *velocity, msg.cannonType, now);
    return true;
}

bool ProjectileSyncManager::sync(const ProjectileUpdateMessage& msg, TimestampMs now) {
    if (msg.id.empty() || isLocalOwner(msg.ownerId) || removed_.count(msg.id) > 0) {
        return false;
    }
    if (!isFinite(msg.position) || !isFinite(msg.velocity)) {
        std::cerr << "[PROJECTILE] Rejected non-finite update for " << msg.id << "\n";
        return false;
    }

    auto it = index_.find(msg.id);
    if (it == index_.end()) {
        if (msg.ownerId.empty()) {
            return false;  // Unknown owner, cannot tell whether it is ours
        }
        create(msg.id, msg.ownerId, msg.position, msg.velocity, "standard", now);
        return true;
    }

    registry_.emplace_or_replace<PendingProjectileSync>(it->second, msg.position, msg.velocity,
                                                        now);
    return true;
}

bool ProjectileSyncManager::hit(const NetEntityId& id, TimestampMs now) {
    if (id.empty()) {
        return false;
    }
    if (index_.count(id) == 0) {
        // Hit overtook the spawn; keep the id out
        removed_.emplace(id, now);
        return false;
    }
    destroy(id, now);
    return true;
}

void ProjectileSyncManager::update(TimestampMs now, float dtSeconds) {
    if (!std::isfinite(dtSeconds) || dtSeconds < 0.0f) {
        dtSeconds = 0.0f;
    }

    std::vector<NetEntityId> expired;

    auto view = registry_.view<ProjectileState>();
    for (auto entity : view) {
        ProjectileState& state = view.get<ProjectileState>(entity);

        if (now >= state.spawnedAt && now - state.spawnedAt >= config_.maxLifetimeMs) {
            expired.push_back(state.id);
            continue;
        }

        if (const PendingProjectileSync* pending = registry_.try_get<PendingProjectileSync>(entity)) {
            float gap = glm::distance(state.position, pending->position);
            if (gap > config_.snapDistance) {
                state.position = pending->position;
            } else if (gap > config_.blendDistance) {
                state.position = glm::mix(state.position, pending->position, config_.blendFactor);
            }
            state.velocity = pending->velocity;
        } else {
            state.position += state.velocity * dtSeconds;
        }
    }

    // Pending syncs are consumed by this pass
    registry_.clear<PendingProjectileSync>();

    for (const auto& id : expired) {
        destroy(id, now);
    }

    pruneTombstones(now);
}

void ProjectileSyncManager::pruneTombstones(TimestampMs now) {
    // No legitimate traffic for an id outlives its maximum lifetime
    for (auto it = removed_.begin(); it != removed_.end();) {
        if (now >= it->second && now - it->second >= config_.maxLifetimeMs) {
            it = removed_.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<NetEntityId> ProjectileSyncManager::consumeRemovedProjectiles() {
    std::vector<NetEntityId> removed;
    removed.swap(pendingRemovals_);
    return removed;
}

std::vector<ProjectileView> ProjectileSyncManager::projectiles(TimestampMs now) const {
    std::vector<ProjectileView> result;
    result.reserve(index_.size());

    auto view = registry_.view<const ProjectileState>();
    for (auto entity : view) {
        result.push_back(makeView(view.get<const ProjectileState>(entity), now));
    }
    return result;
}

std::optional<ProjectileView> ProjectileSyncManager::find(const NetEntityId& id,
                                                          TimestampMs now) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return std::nullopt;
    }
    return makeView(registry_.get<ProjectileState>(it->second), now);
}

void ProjectileSyncManager::clear() {
    registry_.clear();
    index_.clear();
    removed_.clear();
    pendingRemovals_.clear();
}

ProjectileView ProjectileSyncManager::makeView(const ProjectileState& state,
                                               TimestampMs now) const {
    ProjectileView view;
    view.id = state.id;
    view.ownerId = state.ownerId;
    view.position = state.position;
    view.velocity = state.velocity;
    view.cannonType = state.cannonType;
    view.visible = now >= state.visibleAt;
    return view;
}

EntityID ProjectileSyncManager::create(const NetEntityId& id, const NetEntityId& ownerId,
                                       const glm::vec3& position, const glm::vec3& velocity,
                                       const std::string& cannonType, TimestampMs now) {
    EntityID entity = registry_.create();

    ProjectileState& state = registry_.emplace<ProjectileState>(entity);
    state.id = id;
    state.ownerId = ownerId;
    state.position = position;
    state.velocity = velocity;
    state.cannonType = cannonType;
    state.spawnedAt = now;
    state.visibleAt = now + config_.launchDelayMs;

    index_[id] = entity;
    return entity;
}

void ProjectileSyncManager::destroy(const NetEntityId& id, TimestampMs now) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return;
    }

    // Track for removal notification
    pendingRemovals_.push_back(id);
    removed_[id] = now;

    registry_.destroy(it->second);
    index_.erase(it);
}

} // namespace TankSync
