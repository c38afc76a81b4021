#pragma once

#include "sync/SyncTypes.hpp"
#include "sync/SyncConfig.hpp"
#include "sync/SyncMessages.hpp"
#include "sync/PhysicsBody.hpp"
#include <optional>
#include <cstdint>

// [RECONCILE_AGENT] Bounds drift between the locally simulated tank and the server
// Policy: active three-tier correction (ignore / soft blend / hard teleport).
// Local simulation keeps movement authority between corrections.

namespace TankSync {

namespace Monitoring {
class SyncMetrics;
}

enum class CorrectionTier : uint8_t {
    None = 0,    // Nothing pending
    Ignore = 1,  // Within codec noise
    Soft = 2,    // Blend a fraction of the gap
    Hard = 3     // Teleport through a kinematic switch
};

[[nodiscard]] const char* correctionTierName(CorrectionTier tier);

struct CorrectionResult {
    CorrectionTier tier{CorrectionTier::None};
    float positionDiff{0.0f};   // Measured against the predicted pose
    float rotationDiff{0.0f};
    float turretDiff{0.0f};
    bool turretResynced{false};
    bool spawnTeleport{false};  // Spawn / respawn, forced hard
};

class LocalReconciler {
public:
    // Throws std::invalid_argument if ignoreBand >= hardThreshold or the
    // soft factor is outside (0, 1]
    explicit LocalReconciler(const ReconciliationConfig& config = ReconciliationConfig{},
                             Monitoring::SyncMetrics* metrics = nullptr);

    // Store the newest authoritative pose; replaces any unapplied one.
    // Missing or non-finite poses are a no-op and return false.
    bool onReconciliation(const ReconciliationMessage& msg, TimestampMs receivedAt);

    // The local tank's own entry from a player-state message. Only spawn and
    // respawn (dead -> alive) produce a correction; status is tracked always.
    bool onSnapshot(const EntitySnapshot& snap);

    // Called by the physics collaborator during its step. Applies the pending
    // sample at most once, then clears it.
    CorrectionResult applyCorrection(PhysicsBody& body);

    [[nodiscard]] CorrectionTier classify(float positionDiff) const;

    [[nodiscard]] bool hasPendingCorrection() const { return pending_; }
    [[nodiscard]] const std::optional<ReconciliationSample>& latestSample() const { return sample_; }
    [[nodiscard]] EntityStatus status() const { return status_; }
    [[nodiscard]] bool hasSpawned() const { return spawned_; }
    [[nodiscard]] const ReconciliationConfig& getConfig() const { return config_; }

private:
    void applySoft(PhysicsBody& body, const EntityPose& predicted, const EntityPose& server);
    void applyHard(PhysicsBody& body, const EntityPose& server);

    // Turret and barrel resync on their own tolerance, in every tier
    void resyncTurret(PhysicsBody& body, const EntityPose& predicted, const EntityPose& server,
                      CorrectionResult& result) const;

    ReconciliationConfig config_;
    Monitoring::SyncMetrics* metrics_;

    std::optional<ReconciliationSample> sample_;
    bool pending_{false};
    bool forceHard_{false};

    EntityStatus status_{EntityStatus::Alive};
    bool spawned_{false};
};

} // namespace TankSync
