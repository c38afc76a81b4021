#pragma once

// [METRICS_AGENT] Diagnostic sampling of local reconciliation quality
// Read-only with respect to control flow: nothing in the sync core branches on it

#include "sync/SyncConfig.hpp"
#include "sync/SyncTypes.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

namespace TankSync {
namespace Monitoring {

enum class SyncQualityStatus : uint8_t {
    Excellent,
    Good,
    Fair,
    Poor
};

[[nodiscard]] const char* syncQualityStatusName(SyncQualityStatus status);

struct SyncMetricsData {
    // Positions
    float averagePositionDiff{0.0f};
    float maxPositionDiff{0.0f};
    std::vector<float> positionDiffHistory;  // Oldest first

    // Reconciliation
    uint64_t reconciliationCount{0};
    uint32_t reconciliationRate{0};          // Corrections in the last window
    uint64_t hardCorrections{0};
    uint64_t softCorrections{0};
    uint64_t ignoredCorrections{0};

    // Large discrepancies
    uint64_t largeDiffs{0};
    uint64_t criticalDiffs{0};

    // Rotation (exponential moving averages)
    float averageRotationDiff{0.0f};
    float averageTurretDiff{0.0f};

    TimestampMs lastReconciliationTime{0};
    uint64_t samplesCount{0};
};

class SyncMetrics {
public:
    explicit SyncMetrics(const MetricsConfig& config = MetricsConfig{});

    // Record one positionDiff sample into the rolling window.
    // Non-finite samples only bump the critical counter.
    void recordPositionDiff(float diff);

    // Record an applied soft or hard correction (also samples its diff)
    void recordReconciliation(bool isHard, float positionDiff, TimestampMs now);

    // Record a discrepancy that fell inside the ignore band
    void recordIgnored(float positionDiff);

    void recordRotationDiff(float rotationDiff, float turretDiff);

    [[nodiscard]] const SyncMetricsData& getMetrics() const { return data_; }

    // 0-100, 100 is perfect
    [[nodiscard]] float getSyncQuality() const;
    [[nodiscard]] SyncQualityStatus getSyncQualityStatus() const;

    void reset();

    [[nodiscard]] std::string exportCSV() const;

    // Prometheus text exposition format
    [[nodiscard]] std::string exportPrometheus() const;

    // Print a human readable report to stdout
    void generateReport() const;

private:
    MetricsConfig config_;
    SyncMetricsData data_;
    std::deque<TimestampMs> reconciliationTimes_;
    double historySum_{0.0};
};

} // namespace Monitoring
} // namespace TankSync
