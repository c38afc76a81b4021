// [METRICS_AGENT] Sync metrics implementation
// Rolling positionDiff window, correction counters and export helpers

#include "monitoring/SyncMetrics.hpp"
#include "Constants.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace TankSync {
namespace Monitoring {

const char* syncQualityStatusName(SyncQualityStatus status) {
    switch (status) {
        case SyncQualityStatus::Excellent: return "excellent";
        case SyncQualityStatus::Good:      return "good";
        case SyncQualityStatus::Fair:      return "fair";
        case SyncQualityStatus::Poor:      return "poor";
    }
    return "unknown";
}

SyncMetrics::SyncMetrics(const MetricsConfig& config)
    : config_(config) {
    data_.positionDiffHistory.reserve(config_.historySize);
}

void SyncMetrics::recordPositionDiff(float diff) {
    if (!std::isfinite(diff)) {
        // Unmeasurable drift counts as critical but stays out of the window
        data_.criticalDiffs++;
        data_.samplesCount++;
        return;
    }

    auto& history = data_.positionDiffHistory;
    history.push_back(diff);
    historySum_ += diff;
    if (history.size() > config_.historySize) {
        historySum_ -= history.front();
        history.erase(history.begin());
    }

    data_.averagePositionDiff = static_cast<float>(historySum_ / history.size());
    data_.maxPositionDiff = std::max(data_.maxPositionDiff, diff);

    if (diff > config_.criticalDiffThreshold) {
        data_.criticalDiffs++;
    } else if (diff > config_.largeDiffThreshold) {
        data_.largeDiffs++;
    }

    data_.samplesCount++;
}

void SyncMetrics::recordReconciliation(bool isHard, float positionDiff, TimestampMs now) {
    data_.reconciliationCount++;
    reconciliationTimes_.push_back(now);

    // Drop records outside the rate window
    while (!reconciliationTimes_.empty() && now >= reconciliationTimes_.front() &&
           now - reconciliationTimes_.front() > config_.rateWindowMs) {
        reconciliationTimes_.pop_front();
    }
    data_.reconciliationRate = static_cast<uint32_t>(reconciliationTimes_.size());

    if (isHard) {
        data_.hardCorrections++;
    } else {
        data_.softCorrections++;
    }

    data_.lastReconciliationTime = now;
    recordPositionDiff(positionDiff);
}

void SyncMetrics::recordIgnored(float positionDiff) {
    data_.ignoredCorrections++;
    recordPositionDiff(positionDiff);
}

void SyncMetrics::recordRotationDiff(float rotationDiff, float turretDiff) {
    const float alpha = Constants::ROTATION_EMA_ALPHA;
    data_.averageRotationDiff = data_.averageRotationDiff * (1.0f - alpha) + rotationDiff * alpha;
    data_.averageTurretDiff = data_.averageTurretDiff * (1.0f - alpha) + turretDiff * alpha;
}

float SyncMetrics::getSyncQuality() const {
    float quality = 100.0f;

    // Penalty for average drift
    if (data_.averagePositionDiff > 1.0f) {
        quality -= std::min(30.0f, data_.averagePositionDiff * 10.0f);
    }

    // Penalty for correction frequency
    if (data_.reconciliationRate > 5) {
        quality -= std::min(30.0f, static_cast<float>(data_.reconciliationRate - 5) * 5.0f);
    }

    // Penalty for large discrepancies
    quality -= std::min(20.0f, static_cast<float>(data_.largeDiffs) * 0.1f);
    quality -= std::min(20.0f, static_cast<float>(data_.criticalDiffs) * 0.2f);

    return std::clamp(quality, 0.0f, 100.0f);
}

SyncQualityStatus SyncMetrics::getSyncQualityStatus() const {
    float quality = getSyncQuality();
    if (quality >= 80.0f) return SyncQualityStatus::Excellent;
    if (quality >= 60.0f) return SyncQualityStatus::Good;
    if (quality >= 40.0f) return SyncQualityStatus::Fair;
    return SyncQualityStatus::Poor;
}

void SyncMetrics::reset() {
    data_ = SyncMetricsData{};
    data_.positionDiffHistory.reserve(config_.historySize);
    reconciliationTimes_.clear();
    historySum_ = 0.0;
}

std::string SyncMetrics::exportCSV() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(3);

    oss << "Metric,Value\n";
    oss << "Average Position Diff," << data_.averagePositionDiff << "\n";
    oss << "Max Position Diff," << data_.maxPositionDiff << "\n";
    oss << "Reconciliation Count," << data_.reconciliationCount << "\n";
    oss << "Reconciliation Rate," << data_.reconciliationRate << "\n";
    oss << "Hard Corrections," << data_.hardCorrections << "\n";
    oss << "Soft Corrections," << data_.softCorrections << "\n";
    oss << "Ignored Corrections," << data_.ignoredCorrections << "\n";
    oss << "Large Diffs (>" << config_.largeDiffThreshold << ")," << data_.largeDiffs << "\n";
    oss << "Critical Diffs (>" << config_.criticalDiffThreshold << ")," << data_.criticalDiffs << "\n";
    oss << "Average Rotation Diff," << data_.averageRotationDiff << "\n";
    oss << "Average Turret Diff," << data_.averageTurretDiff << "\n";
    oss << "Samples Count," << data_.samplesCount << "\n";

    oss << "\nPosition Diff History\n";
    for (size_t i = 0; i < data_.positionDiffHistory.size(); ++i) {
        oss << i << "," << data_.positionDiffHistory[i] << "\n";
    }
    return oss.str();
}

std::string SyncMetrics::exportPrometheus() const {
    std::ostringstream oss;

    auto gauge = [&oss](const char* name, const char* help, double value) {
        oss << "# HELP " << name << " " << help << "\n";
        oss << "# TYPE " << name << " gauge\n";
        oss << name << " " << std::fixed << std::setprecision(4) << value << "\n";
    };
    auto counter = [&oss](const char* name, const char* help, uint64_t value) {
        oss << "# HELP " << name << " " << help << "\n";
        oss << "# TYPE " << name << " counter\n";
        oss << name << " " << value << "\n";
    };

    gauge("tanksync_position_diff_average", "Rolling average local position discrepancy",
          data_.averagePositionDiff);
    gauge("tanksync_position_diff_max", "Largest local position discrepancy seen",
          data_.maxPositionDiff);
    gauge("tanksync_reconciliation_rate", "Corrections applied in the last window",
          data_.reconciliationRate);
    gauge("tanksync_sync_quality", "Sync quality score 0-100", getSyncQuality());
    counter("tanksync_corrections_hard_total", "Hard corrections applied", data_.hardCorrections);
    counter("tanksync_corrections_soft_total", "Soft corrections applied", data_.softCorrections);
    counter("tanksync_corrections_ignored_total", "Discrepancies inside the ignore band",
            data_.ignoredCorrections);
    counter("tanksync_diffs_large_total", "Discrepancies above the large threshold",
            data_.largeDiffs);
    counter("tanksync_diffs_critical_total", "Discrepancies above the critical threshold",
            data_.criticalDiffs);

    return oss.str();
}

void SyncMetrics::generateReport() const {
    std::cout << "\n[SYNC_METRICS] Report:\n";
    std::cout << "==============================\n";
    std::cout << "  Samples: " << data_.samplesCount << "\n";
    std::cout << "  Average Position Diff: " << data_.averagePositionDiff << "\n";
    std::cout << "  Max Position Diff: " << data_.maxPositionDiff << "\n";
    std::cout << "  Corrections: " << data_.softCorrections << " soft, "
              << data_.hardCorrections << " hard, "
              << data_.ignoredCorrections << " ignored\n";
    std::cout << "  Reconciliation Rate: " << data_.reconciliationRate << " /window\n";
    std::cout << "  Quality: " << getSyncQuality() << " ("
              << syncQualityStatusName(getSyncQualityStatus()) << ")\n";
    std::cout << std::endl;
}

} // namespace Monitoring
} // namespace TankSync
