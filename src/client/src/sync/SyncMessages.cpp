// [NETWORK_AGENT] Decoded message helpers

#include "sync/SyncMessages.hpp"
#include <cmath>
#include <utility>

namespace TankSync {

const char* messageKindName(MessageKind kind) {
    switch (kind) {
        case MessageKind::PlayerStates:     return "PlayerStates";
        case MessageKind::Reconciliation:   return "Reconciliation";
        case MessageKind::ProjectileSpawn:  return "ProjectileSpawn";
        case MessageKind::ProjectileUpdate: return "ProjectileUpdate";
        case MessageKind::ProjectileHit:    return "ProjectileHit";
        case MessageKind::EntityLeft:       return "EntityLeft";
        case MessageKind::PlayerJoined:     return "PlayerJoined";
    }
    return "Unknown";
}

std::optional<EntitySnapshot> toEntitySnapshot(const PlayerStateSnapshot& player,
                                               TimestampMs receivedAt) {
    if (player.id.empty() || !player.position) {
        return std::nullopt;
    }

    EntitySnapshot snap;
    snap.id = player.id;
    snap.pose.position = *player.position;
    snap.pose.yaw = player.rotation;
    snap.pose.turretYaw = player.turretRotation;
    snap.pose.aimPitch = player.aimPitch;
    snap.health = player.health;
    snap.maxHealth = player.maxHealth;
    snap.status = player.status;
    snap.team = player.team;
    snap.receivedAt = receivedAt;

    if (!snap.pose.isFinite()) {
        return std::nullopt;
    }
    return snap;
}

SyncMessage makePlayerStates(std::vector<PlayerStateSnapshot> players, bool fullRoster,
                             TimestampMs receivedAt) {
    PlayerStateBatch batch;
    batch.players = std::move(players);
    batch.fullRoster = fullRoster;
    return SyncMessage{MessageKind::PlayerStates, std::move(batch), receivedAt};
}

SyncMessage makeReconciliation(std::optional<EntityPose> serverPose, float positionDiff,
                               TimestampMs receivedAt) {
    ReconciliationMessage msg;
    msg.serverPose = serverPose;
    msg.positionDiff = positionDiff;
    return SyncMessage{MessageKind::Reconciliation, msg, receivedAt};
}

SyncMessage makeProjectileSpawn(ProjectileSpawnMessage spawn, TimestampMs receivedAt) {
    return SyncMessage{MessageKind::ProjectileSpawn, std::move(spawn), receivedAt};
}

SyncMessage makeProjectileUpdate(ProjectileUpdateMessage update, TimestampMs receivedAt) {
    return SyncMessage{MessageKind::ProjectileUpdate, std::move(update), receivedAt};
}

SyncMessage makeProjectileHit(NetEntityId id, NetEntityId ownerId, TimestampMs receivedAt) {
    return SyncMessage{MessageKind::ProjectileHit,
                       ProjectileHitMessage{std::move(id), std::move(ownerId)}, receivedAt};
}

SyncMessage makeEntityLeft(NetEntityId id, TimestampMs receivedAt) {
    return SyncMessage{MessageKind::EntityLeft, EntityLeftMessage{std::move(id)}, receivedAt};
}

SyncMessage makePlayerJoined(PlayerStateSnapshot player, TimestampMs receivedAt) {
    return SyncMessage{MessageKind::PlayerJoined, PlayerJoinedMessage{std::move(player)},
                       receivedAt};
}

} // namespace TankSync
