#include "AxisScale.hpp"

#include <QDateTime>
#include <QTimeZone>
#include <array>
#include <cmath>
#include <fmt/format.h>

namespace AxisScale {

double calculateNiceStep(double range, int targetTicks) {
    if (range <= 0 || targetTicks <= 0) return 1.0;

    double rawStep = range / targetTicks;
    double magnitude = std::pow(10.0, std::floor(std::log10(rawStep)));
    double normalizedStep = rawStep / magnitude;

    // Choose nice step sizes
    double niceStep;
    if (normalizedStep <= 1.0) {
        niceStep = 1.0;
    } else if (normalizedStep <= 2.0) {
        niceStep = 2.0;
    } else if (normalizedStep <= 5.0) {
        niceStep = 5.0;
    } else {
        niceStep = 10.0;
    }

    return niceStep * magnitude;
}

QString formatCompact(double value) {
    const double a = std::abs(value);
    if (a >= 1e9) return QString::fromStdString(fmt::format("{:.1f}B", value / 1e9));
    if (a >= 1e6) return QString::fromStdString(fmt::format("{:.1f}M", value / 1e6));
    if (a >= 1e3) return QString::fromStdString(fmt::format("{:.1f}K", value / 1e3));
    if (a >= 1.0 || a == 0.0) return QString::fromStdString(fmt::format("{:.2f}", value));
    return QString::fromStdString(fmt::format("{:.4g}", value));
}

std::vector<AxisTick> valueTicks(double min, double max, int targetTicks) {
    std::vector<AxisTick> ticks;
    if (!(max > min)) return ticks;

    const double step = calculateNiceStep(max - min, targetTicks);
    for (double v = std::ceil(min / step) * step; v <= max + step * 1e-9; v += step) {
        ticks.push_back({v, formatCompact(v)});
        if (ticks.size() > 64) break;
    }
    return ticks;
}

std::vector<AxisTick> timeTicks(double minMs, double maxMs, int targetTicks) {
    std::vector<AxisTick> ticks;
    if (!(maxMs > minMs) || targetTicks <= 0) return ticks;

    constexpr double kHour = 3600.0 * 1000.0;
    constexpr double kDay = 24.0 * kHour;
    static constexpr std::array<double, 9> kSteps = {
        kHour, 3 * kHour, 6 * kHour, 12 * kHour, kDay, 2 * kDay, 7 * kDay, 14 * kDay, 30 * kDay};

    const double raw = (maxMs - minMs) / targetTicks;
    double step = kSteps.back();
    for (double candidate : kSteps) {
        if (candidate >= raw) {
            step = candidate;
            break;
        }
    }

    const QString format = step < kDay ? QStringLiteral("dd/MM HH:mm") : QStringLiteral("dd/MM");
    for (double v = std::ceil(minMs / step) * step; v <= maxMs; v += step) {
        const QDateTime t = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(v), QTimeZone::utc());
        ticks.push_back({v, t.toString(format)});
        if (ticks.size() > 64) break;
    }
    return ticks;
}

} // namespace AxisScale
