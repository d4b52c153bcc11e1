#include "VolumeHistory.hpp"

#include <algorithm>
#include <map>

namespace VolumeHistoryMath {

int64_t utcDayStart(int64_t epochSec) {
    int64_t day = epochSec / DAY_SECONDS;
    if (epochSec % DAY_SECONDS < 0) --day;
    return day * DAY_SECONDS;
}

std::vector<VolumePoint> aggregateByUtcDay(const std::vector<RawVolumeSample>& samples) {
    std::map<int64_t, VolumePoint> byDay;
    for (const auto& sample : samples) {
        const int64_t dayStart = utcDayStart(sample.epochSec);
        auto it = byDay.find(dayStart);
        if (it == byDay.end()) {
            byDay.emplace(dayStart, VolumePoint{dayStart, sample.volumeUsd, sample.feesUsd});
            continue;
        }
        VolumePoint& current = it->second;
        current.volumeUsd += sample.volumeUsd;
        current.feesUsd = current.feesUsd.value_or(0.0) + sample.feesUsd.value_or(0.0);
    }

    std::vector<VolumePoint> out;
    out.reserve(byDay.size());
    for (auto& [day, point] : byDay) {
        out.push_back(point);
    }
    return out;
}

std::optional<VolumeStats> computeStats(const std::vector<VolumePoint>& points) {
    if (points.empty()) return std::nullopt;

    VolumeStats stats;
    stats.min = points.front().volumeUsd;
    stats.max = points.front().volumeUsd;
    double sum = 0.0;
    for (const auto& p : points) {
        stats.min = std::min(stats.min, p.volumeUsd);
        stats.max = std::max(stats.max, p.volumeUsd);
        sum += p.volumeUsd;
    }
    stats.avg = sum / static_cast<double>(points.size());
    return stats;
}

VolumeHistory build(const std::vector<RawVolumeSample>& samples, std::optional<VolumeSummary> summary) {
    VolumeHistory history;
    history.points = aggregateByUtcDay(samples);
    history.stats = computeStats(history.points);
    history.summary = std::move(summary);
    return history;
}

} // namespace VolumeHistoryMath
