#pragma once

#include <QString>
#include <vector>

/**
 * AxisScale - "nice" tick placement for chart axes
 *
 * Produces round-numbered ticks (1/2/5 x 10^n) for value axes and
 * calendar-aligned ticks for millisecond time axes.
 */
namespace AxisScale {

struct AxisTick {
    double value;      // Raw value (tick, price, volume or timestamp_ms)
    QString label;     // Formatted label
};

double calculateNiceStep(double range, int targetTicks);

std::vector<AxisTick> valueTicks(double min, double max, int targetTicks);
std::vector<AxisTick> timeTicks(double minMs, double maxMs, int targetTicks);

// Compact label: 1.2K / 3.4M / 5.6B above a thousand, fixed decimals below
QString formatCompact(double value);

} // namespace AxisScale
