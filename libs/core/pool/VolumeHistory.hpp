/*
RangeScope — VolumeHistory
Role: Folds raw volume samples into one point per UTC day and derives min/avg/max.
Inputs/Outputs: Raw samples (epoch seconds, USD volume, optional fees) in; sorted daily series out.
Threading: Pure functions; called on the main thread after the HTTP reply is parsed.
Integration: PoolResponseParser builds the samples; VolumeHistoryChartWidget renders the result.
Related: VolumeHistory.cpp, PoolResponseParser.hpp.
*/
#pragma once

#include <cstdint>
#include <optional>
#include <vector>

struct RawVolumeSample {
    int64_t epochSec = 0;
    double volumeUsd = 0.0;
    std::optional<double> feesUsd;
};

struct VolumePoint {
    int64_t dayStartSec = 0;   // UTC midnight
    double volumeUsd = 0.0;
    std::optional<double> feesUsd;
};

struct VolumeStats {
    double min = 0.0;
    double avg = 0.0;
    double max = 0.0;
};

struct VolumeSummary {
    std::optional<double> tvlUsd;
    std::optional<double> avgDailyFeesUsd;
    std::optional<double> dailyFeesTvlPct;
    std::optional<double> avgDailyVolumeUsd;
    std::optional<double> dailyVolumeTvlPct;
    std::optional<double> priceVolatilityPct;
    std::optional<double> correlation;
    std::optional<double> geometricMeanPrice;
};

struct VolumeHistory {
    std::vector<VolumePoint> points;   // one per UTC day, ascending
    std::optional<VolumeStats> stats;  // absent for an empty series
    std::optional<VolumeSummary> summary;
};

namespace VolumeHistoryMath {

inline constexpr int64_t DAY_SECONDS = 24 * 60 * 60;

// Floor to the UTC day start, also for pre-epoch timestamps
int64_t utcDayStart(int64_t epochSec);

/**
 * Buckets samples by UTC day. Volumes are summed; fees are summed treating a
 * missing value as zero once a day has more than one sample.
 */
std::vector<VolumePoint> aggregateByUtcDay(const std::vector<RawVolumeSample>& samples);

std::optional<VolumeStats> computeStats(const std::vector<VolumePoint>& points);

VolumeHistory build(const std::vector<RawVolumeSample>& samples, std::optional<VolumeSummary> summary);

} // namespace VolumeHistoryMath
