#pragma once

#include "sync/SyncTypes.hpp"
#include "Constants.hpp"
#include <deque>
#include <optional>
#include <cstddef>
#include <cstdint>

// [INTERP_AGENT] Per-entity snapshot history, bounded by a time window
// Owned exclusively by one RemoteEntityInterpolator; no locking

namespace TankSync {

// ============================================================================
// History entry for one superseded snapshot
// ============================================================================
struct HistorySample {
    TimestampMs time{0};
    glm::vec3 position{0.0f};
    float yaw{0.0f};
};

// ============================================================================
// Time-windowed ring buffer (1 second by default)
// ============================================================================
class SnapshotHistory {
public:
    explicit SnapshotHistory(uint32_t windowMs = Constants::SNAPSHOT_HISTORY_WINDOW_MS);

    // Append a sample, then drop every sample older than the window measured
    // from `time`. Out-of-order samples (older than the newest) are ignored.
    void record(TimestampMs time, const glm::vec3& position, float yaw);

    // Drop samples older than the window measured from `now`
    void prune(TimestampMs now);

    // Most recent sample, if any
    [[nodiscard]] std::optional<HistorySample> newest() const;

    // Velocity from the newest sample to (time, position).
    // Returns nullopt without a sample or when no time has elapsed.
    [[nodiscard]] std::optional<glm::vec3> velocityTo(TimestampMs time,
                                                      const glm::vec3& position) const;

    // Age of the oldest entry relative to `now`, 0 when empty
    [[nodiscard]] uint32_t getOldestEntryAge(TimestampMs now) const;

    void clear() { buffer_.clear(); }

    [[nodiscard]] size_t size() const { return buffer_.size(); }
    [[nodiscard]] bool empty() const { return buffer_.empty(); }
    [[nodiscard]] uint32_t windowMs() const { return windowMs_; }

private:
    std::deque<HistorySample> buffer_;
    uint32_t windowMs_;
};

} // namespace TankSync
