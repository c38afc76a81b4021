// [INTERP_AGENT] Snapshot history implementation
// One second window of superseded snapshots, used for velocity estimation

#include "sync/SnapshotHistory.hpp"
#include <cstdint>

namespace TankSync {

SnapshotHistory::SnapshotHistory(uint32_t windowMs)
    : windowMs_(windowMs) {
}

void SnapshotHistory::record(TimestampMs time, const glm::vec3& position, float yaw) {
    if (!buffer_.empty() && time < buffer_.back().time) {
        return;
    }

    HistorySample sample;
    sample.time = time;
    sample.position = position;
    sample.yaw = yaw;
    buffer_.push_back(sample);

    prune(time);
}

void SnapshotHistory::prune(TimestampMs now) {
    // Remove entries older than the window
    while (!buffer_.empty() && now >= buffer_.front().time &&
           (now - buffer_.front().time) > windowMs_) {
        buffer_.pop_front();
    }
}

std::optional<HistorySample> SnapshotHistory::newest() const {
    if (buffer_.empty()) {
        return std::nullopt;
    }
    return buffer_.back();
}

std::optional<glm::vec3> SnapshotHistory::velocityTo(TimestampMs time,
                                                     const glm::vec3& position) const {
    if (buffer_.empty()) {
        return std::nullopt;
    }

    const HistorySample& last = buffer_.back();
    if (time <= last.time) {
        return std::nullopt;
    }

    float dtSeconds = static_cast<float>(time - last.time) / 1000.0f;
    return (position - last.position) / dtSeconds;
}

uint32_t SnapshotHistory::getOldestEntryAge(TimestampMs now) const {
    if (buffer_.empty() || now < buffer_.front().time) {
        return 0;
    }
    return now - buffer_.front().time;
}

} // namespace TankSync
