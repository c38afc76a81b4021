// [INTERP_AGENT] Remote entity interpolation / dead reckoning
// Fresh entities ease toward the latest snapshot with an RTT-adaptive rate;
// stale entities are projected forward along their estimated velocity

#include "sync/RemoteEntityInterpolator.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace TankSync {

RemoteEntityInterpolator::RemoteEntityInterpolator(NetEntityId id,
                                                   const InterpolationConfig& config)
    : id_(std::move(id)), config_(config) {
    state_.history = SnapshotHistory(config_.historyWindowMs);
    state_.current = EntityPose::defaultSpawn();
    state_.origin = state_.current;
}

bool RemoteEntityInterpolator::onSnapshot(const EntitySnapshot& snap) {
    if (snap.id != id_) {
        std::cerr << "[INTERP] Snapshot for " << snap.id << " routed to " << id_ << "\n";
        return false;
    }
    if (!snap.pose.isFinite()) {
        std::cerr << "[INTERP] Rejected non-finite snapshot for " << id_ << "\n";
        return false;
    }

    if (!state_.latestSnapshot) {
        snapTo(snap);
        return true;
    }

    const EntitySnapshot& latest = *state_.latestSnapshot;
    if (snap.sameSample(latest)) {
        return true;  // Re-delivery, nothing new
    }
    if (snap.receivedAt < latest.receivedAt) {
        return false;
    }

    if (!latest.isAlive() && snap.isAlive()) {
        snapTo(snap);  // Respawn teleport
        return true;
    }

    state_.history.record(latest.receivedAt, latest.pose.position, latest.pose.yaw);

    auto velocity = state_.history.velocityTo(snap.receivedAt, snap.pose.position);
    state_.hasVelocity = velocity.has_value();
    state_.estimatedVelocity = velocity.value_or(glm::vec3(0.0f));

    state_.previousSnapshot = std::move(state_.latestSnapshot);
    state_.latestSnapshot = snap;
    state_.lastUpdateTime = snap.receivedAt;
    state_.origin = state_.current;
    state_.alpha = 0.0f;
    return true;
}

void RemoteEntityInterpolator::snapTo(const EntitySnapshot& snap) {
    state_.history.clear();
    state_.previousSnapshot.reset();
    state_.latestSnapshot = snap;
    state_.estimatedVelocity = glm::vec3(0.0f);
    state_.hasVelocity = false;
    state_.current = snap.pose;
    state_.origin = snap.pose;
    state_.alpha = 1.0f;
    state_.lastUpdateTime = snap.receivedAt;
    mode_ = snap.isAlive() ? Mode::Fresh : Mode::Frozen;
}

void RemoteEntityInterpolator::update(TimestampMs now, float dtSeconds, uint32_t rttMs) {
    if (!state_.latestSnapshot) {
        mode_ = Mode::Waiting;
        return;
    }

    // Visibility follows status only; a dead tank's pose is frozen
    if (!state_.latestSnapshot->isAlive()) {
        mode_ = Mode::Frozen;
        return;
    }

    if (!std::isfinite(dtSeconds) || dtSeconds < 0.0f) {
        dtSeconds = 0.0f;
    }

    if (isStale(now)) {
        mode_ = Mode::Stale;
        updateStale(now);
    } else {
        mode_ = Mode::Fresh;
        updateFresh(dtSeconds, rttMs);
    }
}

void RemoteEntityInterpolator::updateFresh(float dtSeconds, uint32_t rttMs) {
    const EntityPose& target = state_.latestSnapshot->pose;
    const EntityPose& origin = state_.origin;

    float rate = selectAdaptiveRate(rttMs);
    state_.alpha = std::clamp(
        state_.alpha + rate * dtSeconds * Constants::ALPHA_RATE_FRAME_SCALE, 0.0f, 1.0f);

    float t = smoothstep(state_.alpha);
    state_.current.position = glm::mix(origin.position, target.position, t);
    state_.current.yaw = lerpAngle(origin.yaw, target.yaw, t);
    state_.current.turretYaw = lerpAngle(origin.turretYaw, target.turretYaw, t);
    state_.current.aimPitch = lerpAngle(origin.aimPitch, target.aimPitch, t);

    if (state_.alpha >= 1.0f) {
        // Fully caught up, snap to avoid float drift
        state_.current = target;
    }
}

void RemoteEntityInterpolator::updateStale(TimestampMs now) {
    const EntityPose& latest = state_.latestSnapshot->pose;

    uint32_t horizonMs = std::min(now - state_.lastUpdateTime, config_.maxExtrapolationMs);
    float horizonSeconds = static_cast<float>(horizonMs) / 1000.0f;
    glm::vec3 extrapolated = latest.position + state_.estimatedVelocity * horizonSeconds;

    float k = config_.extrapolationBlend;
    state_.current.position = glm::mix(state_.current.position, extrapolated, k);
    state_.current.yaw = lerpAngle(state_.current.yaw, latest.yaw, k);
    state_.current.turretYaw = lerpAngle(state_.current.turretYaw, latest.turretYaw, k);
    state_.current.aimPitch = lerpAngle(state_.current.aimPitch, latest.aimPitch, k);
}

RenderPose RemoteEntityInterpolator::currentPose() const {
    RenderPose pose;
    pose.position = state_.current.position;
    pose.position.y = std::max(pose.position.y, config_.minRenderHeight);
    pose.yaw = state_.current.yaw;
    pose.turretYaw = state_.current.turretYaw;
    pose.aimPitch = state_.current.aimPitch;
    pose.visible = state_.latestSnapshot && state_.latestSnapshot->isAlive();
    return pose;
}

float RemoteEntityInterpolator::selectAdaptiveRate(uint32_t rttMs) const {
    // Higher latency: slower, smoother catch-up
    if (rttMs < config_.lowRttMs) {
        return config_.lowRttRate;
    }
    if (rttMs < config_.mediumRttMs) {
        return config_.mediumRttRate;
    }
    return config_.highRttRate;
}

bool RemoteEntityInterpolator::isStale(TimestampMs now) const {
    if (!state_.latestSnapshot || now < state_.lastUpdateTime) {
        return false;
    }
    return (now - state_.lastUpdateTime) > config_.staleThresholdMs;
}

} // namespace TankSync
