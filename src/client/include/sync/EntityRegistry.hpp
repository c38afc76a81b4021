#pragma once

#include "sync/SyncTypes.hpp"
#include "sync/SyncConfig.hpp"
#include "sync/SyncMessages.hpp"
#include "sync/RemoteEntityInterpolator.hpp"
#include "sync/LocalReconciler.hpp"
#include "sync/ProjectileSyncManager.hpp"
#include "monitoring/SyncMetrics.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

// [REGISTRY_AGENT] Session-scoped owner of all synchronized entity state
// The only component with lifecycle authority: creation, pruning and removal

namespace TankSync {

// Remote tanks cannot be created before the renderer has its resources
enum class RendererState : uint8_t {
    Pending = 0,  // Snapshots for new entities are queued
    Ready = 1     // Queue drained, entities created on first snapshot
};

struct RegistryStats {
    uint64_t messagesHandled{0};
    uint64_t snapshotsApplied{0};
    uint64_t snapshotsRejected{0};    // Invalid or out of order
    uint64_t snapshotsDropped{0};     // Id has left the session
    uint64_t pendingOverflows{0};     // Oldest queued creation evicted
    uint64_t entitiesCreated{0};
    uint64_t entitiesRemoved{0};
    uint64_t entitiesPruned{0};
    uint64_t projectileMessagesRejected{0};  // Local, duplicate, unknown or removed ids
};

class EntityRegistry {
public:
    // Throws std::invalid_argument when the config does not validate
    explicit EntityRegistry(const SyncConfig& config = SyncConfig{});

    // The reconciler holds a pointer to metrics_; one owner per session
    EntityRegistry(const EntityRegistry&) = delete;
    EntityRegistry& operator=(const EntityRegistry&) = delete;
    EntityRegistry(EntityRegistry&&) = delete;
    EntityRegistry& operator=(EntityRegistry&&) = delete;

    // Network callback: store only, never touches rendered poses
    void onMessage(const SyncMessage& msg);

    // Pending -> Ready, drains the creation queue exactly once
    void markRendererReady();

    // Once per render tick
    void update(TimestampMs now, float dtSeconds, uint32_t rttMs);

    // Called by the physics collaborator during its step
    CorrectionResult applyLocalCorrection(PhysicsBody& body);

    [[nodiscard]] std::optional<RenderPose> remotePose(const NetEntityId& id) const;
    [[nodiscard]] const RemoteEntityInterpolator* findRemote(const NetEntityId& id) const;
    [[nodiscard]] std::vector<NetEntityId> remoteIds() const;

    [[nodiscard]] bool isTracked(const NetEntityId& id) const { return index_.count(id) > 0; }
    [[nodiscard]] bool hasLeft(const NetEntityId& id) const { return departed_.count(id) > 0; }
    [[nodiscard]] size_t remoteCount() const { return index_.size(); }
    [[nodiscard]] size_t pendingCount() const { return pending_.size(); }
    [[nodiscard]] RendererState rendererState() const { return rendererState_; }

    [[nodiscard]] const NetEntityId& localEntityId() const { return config_.registry.localEntityId; }
    [[nodiscard]] const SyncConfig& getConfig() const { return config_; }
    [[nodiscard]] const RegistryStats& getStats() const { return stats_; }

    [[nodiscard]] LocalReconciler& reconciler() { return reconciler_; }
    [[nodiscard]] const LocalReconciler& reconciler() const { return reconciler_; }
    [[nodiscard]] ProjectileSyncManager& projectiles() { return projectiles_; }
    [[nodiscard]] const ProjectileSyncManager& projectiles() const { return projectiles_; }
    [[nodiscard]] Monitoring::SyncMetrics& metrics() { return metrics_; }
    [[nodiscard]] const Monitoring::SyncMetrics& metrics() const { return metrics_; }

private:
    // Queued before the renderer was ready; `snapshot` empty when the first
    // data for the id was unusable
    struct PendingCreation {
        NetEntityId id;
        std::optional<EntitySnapshot> snapshot;
    };

    void handlePlayerStates(const PlayerStateBatch& batch, TimestampMs receivedAt);
    void handleReconciliation(const ReconciliationMessage& msg, TimestampMs receivedAt);
    void handleEntityLeft(const EntityLeftMessage& msg);
    void handlePlayerJoined(const PlayerJoinedMessage& msg, TimestampMs receivedAt);

    // Route one decoded player entry to the reconciler or a remote interpolator
    void routePlayer(const PlayerStateSnapshot& player, TimestampMs receivedAt);
    void applyRemote(const NetEntityId& id, const std::optional<EntitySnapshot>& snapshot);
    void enqueuePending(const NetEntityId& id, const std::optional<EntitySnapshot>& snapshot);

    EntityID createRemote(const NetEntityId& id);
    void destroyRemote(const NetEntityId& id);
    void pruneAbsent(const std::unordered_set<NetEntityId>& present);

    [[nodiscard]] bool isLocal(const NetEntityId& id) const;

    SyncConfig config_;
    Monitoring::SyncMetrics metrics_;
    LocalReconciler reconciler_;
    ProjectileSyncManager projectiles_;

    // Remote tanks: one RemoteEntityInterpolator component per entity
    Registry registry_;
    std::unordered_map<NetEntityId, EntityID> index_;

    // Ids removed by EntityLeft; later snapshots for them are dropped
    std::unordered_set<NetEntityId> departed_;

    RendererState rendererState_{RendererState::Pending};
    std::deque<PendingCreation> pending_;

    RegistryStats stats_;
};

} // namespace TankSync
