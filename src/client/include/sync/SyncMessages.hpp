#pragma once

#include "sync/SyncTypes.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

// [NETWORK_AGENT] Already-decoded inbound messages from the transport layer
// The transport owns framing and wire encoding; this core only sees these values

namespace TankSync {

// Message kinds, dispatched by an explicit switch in EntityRegistry
enum class MessageKind : uint8_t {
    PlayerStates = 1,     // Server -> Client: full roster or partial update
    Reconciliation = 2,   // Server -> Client: authoritative local pose
    ProjectileSpawn = 3,  // Server -> Client: remote shot fired
    ProjectileUpdate = 4, // Server -> Client: periodic projectile kinematics
    ProjectileHit = 5,    // Server -> Client: projectile hit or despawned
    EntityLeft = 6,       // Server -> Client: authoritative removal
    PlayerJoined = 7,     // Server -> Client: explicit (re)join
};

// One player entry as decoded from the wire; any field may be missing
struct PlayerStateSnapshot {
    NetEntityId id;
    std::optional<glm::vec3> position;
    float rotation{0.0f};
    float turretRotation{0.0f};
    float aimPitch{0.0f};
    float health{0.0f};
    float maxHealth{0.0f};
    EntityStatus status{EntityStatus::Alive};
    std::optional<uint8_t> team;
};

struct PlayerStateBatch {
    std::vector<PlayerStateSnapshot> players;
    bool fullRoster{false};  // Ids absent from a full roster are pruned
};

struct ReconciliationMessage {
    std::optional<EntityPose> serverPose;
    float positionDiff{0.0f};
};

struct ProjectileSpawnMessage {
    NetEntityId id;
    NetEntityId ownerId;
    glm::vec3 position{0.0f};
    std::optional<glm::vec3> velocity;
    std::optional<glm::vec3> direction;  // Used when no velocity is sent
    float speed{0.0f};                   // Optional, pairs with direction
    std::string cannonType{"standard"};
};

struct ProjectileUpdateMessage {
    NetEntityId id;
    NetEntityId ownerId;
    glm::vec3 position{0.0f};
    glm::vec3 velocity{0.0f};
};

struct ProjectileHitMessage {
    NetEntityId id;
    NetEntityId ownerId;
};

struct EntityLeftMessage {
    NetEntityId id;
};

struct PlayerJoinedMessage {
    PlayerStateSnapshot player;
};

using MessagePayload = std::variant<PlayerStateBatch,
                                    ReconciliationMessage,
                                    ProjectileSpawnMessage,
                                    ProjectileUpdateMessage,
                                    ProjectileHitMessage,
                                    EntityLeftMessage,
                                    PlayerJoinedMessage>;

// Tagged message; `kind` selects the payload alternative
struct SyncMessage {
    MessageKind kind{MessageKind::PlayerStates};
    MessagePayload payload;
    TimestampMs receivedAt{0};
};

[[nodiscard]] const char* messageKindName(MessageKind kind);

// Convert a decoded wire entry into a stored snapshot.
// Returns nullopt when the position is missing or any value is non-finite.
[[nodiscard]] std::optional<EntitySnapshot> toEntitySnapshot(const PlayerStateSnapshot& player,
                                                             TimestampMs receivedAt);

// Builders used by the transport glue and the tests
SyncMessage makePlayerStates(std::vector<PlayerStateSnapshot> players, bool fullRoster,
                             TimestampMs receivedAt);
SyncMessage makeReconciliation(std::optional<EntityPose> serverPose, float positionDiff,
                               TimestampMs receivedAt);
SyncMessage makeProjectileSpawn(ProjectileSpawnMessage spawn, TimestampMs receivedAt);
SyncMessage makeProjectileUpdate(ProjectileUpdateMessage update, TimestampMs receivedAt);
SyncMessage makeProjectileHit(NetEntityId id, NetEntityId ownerId, TimestampMs receivedAt);
SyncMessage makeEntityLeft(NetEntityId id, TimestampMs receivedAt);
SyncMessage makePlayerJoined(PlayerStateSnapshot player, TimestampMs receivedAt);

} // namespace TankSync
