#pragma once

#include "sync/SyncTypes.hpp"
#include "sync/SyncConfig.hpp"
#include "sync/SnapshotHistory.hpp"
#include <optional>
#include <cstdint>

// [INTERP_AGENT] Latency-hiding pose reconstruction for one server-driven tank
// Snapshot arrival only stores data and the rendered pose moves in update(),
// except for the first snapshot and a respawn, which snap the pose on arrival

namespace TankSync {

struct InterpolationState {
    EntityPose current;                      // Rendered pose (before ground clamp)
    EntityPose origin;                       // Rendered pose when the latest snapshot arrived
    std::optional<EntitySnapshot> previousSnapshot;
    std::optional<EntitySnapshot> latestSnapshot;
    glm::vec3 estimatedVelocity{0.0f};       // Units per second, for dead reckoning only
    bool hasVelocity{false};
    float alpha{1.0f};                       // Progress origin -> latest, always in [0, 1]
    TimestampMs lastUpdateTime{0};
    SnapshotHistory history;
};

class RemoteEntityInterpolator {
public:
    enum class Mode : uint8_t {
        Waiting,  // No valid snapshot yet, default spawn pose, hidden
        Fresh,    // Interpolating between the last two snapshots
        Stale,    // Dead reckoning past the latest snapshot
        Frozen    // Dead: last pose held, hidden
    };

    explicit RemoteEntityInterpolator(NetEntityId id,
                                      const InterpolationConfig& config = InterpolationConfig{});

    // Store a new snapshot. Returns false (and keeps the previous valid state)
    // when the snapshot is non-finite, for another id, or older than the latest.
    bool onSnapshot(const EntitySnapshot& snap);

    // Per-tick pose computation. `now` in ms, `dtSeconds` frame time,
    // `rttMs` the transport's round-trip estimate.
    void update(TimestampMs now, float dtSeconds, uint32_t rttMs);

    // Pose the renderer reads this tick
    [[nodiscard]] RenderPose currentPose() const;

    // Alpha step per 60 Hz frame for a given RTT
    [[nodiscard]] float selectAdaptiveRate(uint32_t rttMs) const;

    [[nodiscard]] bool isStale(TimestampMs now) const;

    [[nodiscard]] const NetEntityId& id() const { return id_; }
    [[nodiscard]] Mode mode() const { return mode_; }
    [[nodiscard]] float alpha() const { return state_.alpha; }
    [[nodiscard]] bool hasSnapshot() const { return state_.latestSnapshot.has_value(); }
    [[nodiscard]] const InterpolationState& state() const { return state_; }

private:
    // First snapshot or respawn: no interpolation from an undefined origin
    void snapTo(const EntitySnapshot& snap);

    void updateFresh(float dtSeconds, uint32_t rttMs);
    void updateStale(TimestampMs now);

    NetEntityId id_;
    InterpolationConfig config_;
    InterpolationState state_;
    Mode mode_{Mode::Waiting};
};

} // namespace TankSync
