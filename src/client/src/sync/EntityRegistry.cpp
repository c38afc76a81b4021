// [REGISTRY_AGENT] Entity registry implementation
// Message dispatch, lazy creation, the renderer readiness gate and removal

#include "sync/EntityRegistry.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace TankSync {

namespace {

SyncConfig validated(const SyncConfig& config) {
    std::string error;
    if (!config.validate(error)) {
        throw std::invalid_argument("EntityRegistry: invalid config: " + error);
    }
    return config;
}

} // namespace

EntityRegistry::EntityRegistry(const SyncConfig& config)
    : config_(validated(config)),
      metrics_(config_.metrics),
      reconciler_(config_.reconciliation, &metrics_),
      projectiles_(config_.projectiles) {
    projectiles_.setLocalOwnerId(config_.registry.localEntityId);
}

bool EntityRegistry::isLocal(const NetEntityId& id) const {
    return !config_.registry.localEntityId.empty() && id == config_.registry.localEntityId;
}

// ============================================================================
// MESSAGE DISPATCH
// ============================================================================

void EntityRegistry::onMessage(const SyncMessage& msg) {
    stats_.messagesHandled++;

    switch (msg.kind) {
        case MessageKind::PlayerStates:
            if (const auto* batch = std::get_if<PlayerStateBatch>(&msg.payload)) {
                handlePlayerStates(*batch, msg.receivedAt);
                return;
            }
            break;
        case MessageKind::Reconciliation:
            if (const auto* rec = std::get_if<ReconciliationMessage>(&msg.payload)) {
                handleReconciliation(*rec, msg.receivedAt);
                return;
            }
            break;
        case MessageKind::ProjectileSpawn:
            if (const auto* spawn = std::get_if<ProjectileSpawnMessage>(&msg.payload)) {
                if (!projectiles_.spawn(*spawn, msg.receivedAt)) {
                    stats_.projectileMessagesRejected++;
                }
                return;
            }
            break;
        case MessageKind::ProjectileUpdate:
            if (const auto* update = std::get_if<ProjectileUpdateMessage>(&msg.payload)) {
                if (!projectiles_.sync(*update, msg.receivedAt)) {
                    stats_.projectileMessagesRejected++;
                }
                return;
            }
            break;
        case MessageKind::ProjectileHit:
            if (const auto* hit = std::get_if<ProjectileHitMessage>(&msg.payload)) {
                if (!projectiles_.hit(hit->id, msg.receivedAt)) {
                    stats_.projectileMessagesRejected++;
                }
                return;
            }
            break;
        case MessageKind::EntityLeft:
            if (const auto* left = std::get_if<EntityLeftMessage>(&msg.payload)) {
                handleEntityLeft(*left);
                return;
            }
            break;
        case MessageKind::PlayerJoined:
            if (const auto* joined = std::get_if<PlayerJoinedMessage>(&msg.payload)) {
                handlePlayerJoined(*joined, msg.receivedAt);
                return;
            }
            break;
    }

    std::cerr << "[REGISTRY] Payload does not match message kind "
              << messageKindName(msg.kind) << ", dropped\n";
}

void EntityRegistry::handlePlayerStates(const PlayerStateBatch& batch, TimestampMs receivedAt) {
    for (const auto& player : batch.players) {
        routePlayer(player, receivedAt);
    }

    if (batch.fullRoster) {
        std::unordered_set<NetEntityId> present;
        present.reserve(batch.players.size());
        for (const auto& player : batch.players) {
            present.insert(player.id);
        }
        pruneAbsent(present);
    }
}

void EntityRegistry::handleReconciliation(const ReconciliationMessage& msg,
                                          TimestampMs receivedAt) {
    if (!reconciler_.onReconciliation(msg, receivedAt)) {
        stats_.snapshotsRejected++;
    }
}

void EntityRegistry::handleEntityLeft(const EntityLeftMessage& msg) {
    if (msg.id.empty()) {
        return;
    }
    if (isLocal(msg.id)) {
        std::cerr << "[REGISTRY] Ignored EntityLeft for the local tank\n";
        return;
    }

    departed_.insert(msg.id);
    destroyRemote(msg.id);

    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&msg](const PendingCreation& p) { return p.id == msg.id; }),
                   pending_.end());

    std::cout << "[REGISTRY] Entity " << msg.id << " left the session\n";
}

void EntityRegistry::handlePlayerJoined(const PlayerJoinedMessage& msg, TimestampMs receivedAt) {
    if (msg.player.id.empty()) {
        return;
    }
    if (departed_.erase(msg.player.id) > 0) {
        std::cout << "[REGISTRY] Entity " << msg.player.id << " rejoined\n";
    }
    routePlayer(msg.player, receivedAt);
}

// ============================================================================
// ROUTING
// ============================================================================

void EntityRegistry::routePlayer(const PlayerStateSnapshot& player, TimestampMs receivedAt) {
    if (player.id.empty()) {
        stats_.snapshotsRejected++;
        return;
    }

    auto snapshot = toEntitySnapshot(player, receivedAt);

    if (isLocal(player.id)) {
        if (!snapshot || !reconciler_.onSnapshot(*snapshot)) {
            stats_.snapshotsRejected++;
        }
        return;
    }

    if (departed_.count(player.id) > 0) {
        stats_.snapshotsDropped++;
        return;
    }

    if (rendererState_ == RendererState::Pending) {
        enqueuePending(player.id, snapshot);
        return;
    }

    applyRemote(player.id, snapshot);
}

void EntityRegistry::applyRemote(const NetEntityId& id,
                                 const std::optional<EntitySnapshot>& snapshot) {
    auto it = index_.find(id);
    EntityID entity = (it != index_.end()) ? it->second : createRemote(id);

    if (!snapshot) {
        // Previous valid pose (or the default spawn pose) is kept
        std::cerr << "[REGISTRY] Rejected invalid snapshot for " << id << "\n";
        stats_.snapshotsRejected++;
        return;
    }

    auto& interpolator = registry_.get<RemoteEntityInterpolator>(entity);
    if (interpolator.onSnapshot(*snapshot)) {
        stats_.snapshotsApplied++;
    } else {
        stats_.snapshotsRejected++;
    }
}

void EntityRegistry::enqueuePending(const NetEntityId& id,
                                    const std::optional<EntitySnapshot>& snapshot) {
    auto existing = std::find_if(pending_.begin(), pending_.end(),
                                 [&id](const PendingCreation& p) { return p.id == id; });
    if (existing != pending_.end()) {
        // Newest truth only; keep the older one if this update is unusable
        if (snapshot) {
            existing->snapshot = snapshot;
        }
        return;
    }

    if (pending_.size() >= config_.registry.maxPendingCreations) {
        std::cerr << "[REGISTRY] Pending creation queue full, dropping " << pending_.front().id
                  << "\n";
        pending_.pop_front();
        stats_.pendingOverflows++;
    }
    pending_.push_back(PendingCreation{id, snapshot});
}

void EntityRegistry::markRendererReady() {
    if (rendererState_ == RendererState::Ready) {
        return;
    }
    rendererState_ = RendererState::Ready;

    std::deque<PendingCreation> queued;
    queued.swap(pending_);

    std::cout << "[REGISTRY] Renderer ready, creating " << queued.size()
              << " queued entities\n";

    for (const auto& creation : queued) {
        applyRemote(creation.id, creation.snapshot);
    }
}

// ============================================================================
// LIFECYCLE
// ============================================================================

EntityID EntityRegistry::createRemote(const NetEntityId& id) {
    EntityID entity = registry_.create();
    registry_.emplace<RemoteEntityInterpolator>(entity, id, config_.interpolation);
    index_[id] = entity;
    stats_.entitiesCreated++;
    return entity;
}

void EntityRegistry::destroyRemote(const NetEntityId& id) {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return;
    }
    registry_.destroy(it->second);
    index_.erase(it);
    stats_.entitiesRemoved++;
}

void EntityRegistry::pruneAbsent(const std::unordered_set<NetEntityId>& present) {
    std::vector<NetEntityId> absent;
    for (const auto& [id, entity] : index_) {
        if (present.count(id) == 0) {
            absent.push_back(id);
        }
    }

    for (const auto& id : absent) {
        destroyRemote(id);
        stats_.entitiesPruned++;
    }

    pending_.erase(std::remove_if(pending_.begin(), pending_.end(),
                                  [&present](const PendingCreation& p) {
                                      return present.count(p.id) == 0;
                                  }),
                   pending_.end());

    if (!absent.empty()) {
        std::cout << "[REGISTRY] Pruned " << absent.size()
                  << " entities missing from full roster\n";
    }
}

// ============================================================================
// TICK / QUERIES
// ============================================================================

void EntityRegistry::update(TimestampMs now, float dtSeconds, uint32_t rttMs) {
    auto view = registry_.view<RemoteEntityInterpolator>();
    view.each([now, dtSeconds, rttMs](RemoteEntityInterpolator& interpolator) {
        interpolator.update(now, dtSeconds, rttMs);
    });

    projectiles_.update(now, dtSeconds);
}

CorrectionResult EntityRegistry::applyLocalCorrection(PhysicsBody& body) {
    return reconciler_.applyCorrection(body);
}

const RemoteEntityInterpolator* EntityRegistry::findRemote(const NetEntityId& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) {
        return nullptr;
    }
    return registry_.try_get<RemoteEntityInterpolator>(it->second);
}

std::optional<RenderPose> EntityRegistry::remotePose(const NetEntityId& id) const {
    const RemoteEntityInterpolator* interpolator = findRemote(id);
    if (!interpolator) {
        return std::nullopt;
    }
    return interpolator->currentPose();
}

std::vector<NetEntityId> EntityRegistry::remoteIds() const {
    std::vector<NetEntityId> ids;
    ids.reserve(index_.size());
    for (const auto& [id, entity] : index_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace TankSync
