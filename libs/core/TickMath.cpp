#include "TickMath.hpp"

#include <algorithm>
#include <cmath>

namespace TickMath {

namespace {

const double kLogBase = std::log(TICK_BASE);

bool validInputs(double price, int32_t spacing, double decimalAdjust) {
    return std::isfinite(price) && price > 0.0 && spacing > 0 &&
           std::isfinite(decimalAdjust) && decimalAdjust > 0.0;
}

std::optional<double> rawTickFor(double price, double decimalAdjust) {
    const double raw = std::log(price / decimalAdjust) / kLogBase;
    if (!std::isfinite(raw)) return std::nullopt;
    return raw;
}

// Index of the spacing multiple the raw tick resolves to
double boundaryIndex(double rawTick, int32_t spacing, bool roundDown) {
    const double q = rawTick / spacing;
    const double nearest = std::round(q);
    if (std::abs(rawTick - nearest * spacing) <= SNAP_TOLERANCE_TICKS) {
        return nearest;
    }
    return roundDown ? std::floor(q) : std::ceil(q);
}

int32_t clampToUsable(double tick, int32_t spacing) {
    const double lo = minUsableTick(spacing);
    const double hi = maxUsableTick(spacing);
    return static_cast<int32_t>(std::clamp(tick, lo, hi));
}

} // namespace

int32_t tickSpacingForFeeTier(int feeTier) {
    switch (feeTier) {
        case 100:   return 1;
        case 500:   return 10;
        case 3000:  return 60;
        case 10000: return 200;
        default:    return 1;
    }
}

double decimalAdjustFor(int token0Decimals, int token1Decimals) {
    return std::pow(10.0, token0Decimals - token1Decimals);
}

int32_t minUsableTick(int32_t spacing) {
    if (spacing <= 0) return MIN_TICK;
    // Truncating division rounds toward zero, i.e. up for negative ticks
    return (MIN_TICK / spacing) * spacing;
}

int32_t maxUsableTick(int32_t spacing) {
    if (spacing <= 0) return MAX_TICK;
    return (MAX_TICK / spacing) * spacing;
}

std::optional<int32_t> priceToTick(double price, int32_t spacing, double decimalAdjust, bool roundDown) {
    if (!validInputs(price, spacing, decimalAdjust)) return std::nullopt;
    const auto raw = rawTickFor(price, decimalAdjust);
    if (!raw) return std::nullopt;
    return clampToUsable(boundaryIndex(*raw, spacing, roundDown) * spacing, spacing);
}

double tickToPrice(int32_t tick, double decimalAdjust) {
    return std::pow(TICK_BASE, static_cast<double>(tick)) * decimalAdjust;
}

std::optional<double> snap(double price, int32_t spacing, double decimalAdjust, bool roundDown) {
    const auto tick = priceToTick(price, spacing, decimalAdjust, roundDown);
    if (!tick) return std::nullopt;
    return tickToPrice(*tick, decimalAdjust);
}

std::optional<double> stepTick(double price, int direction, int32_t spacing, double decimalAdjust) {
    if (direction == 0 || !validInputs(price, spacing, decimalAdjust)) return std::nullopt;
    const auto raw = rawTickFor(price, decimalAdjust);
    if (!raw) return std::nullopt;

    const bool up = direction > 0;
    // Stepping up starts from the boundary at or below, stepping down from the one at or above
    const double base = boundaryIndex(*raw, spacing, up);
    const double next = (base + (up ? 1.0 : -1.0)) * spacing;
    return tickToPrice(clampToUsable(next, spacing), decimalAdjust);
}

std::optional<TickBounds> tickBoundsFor(double minPrice, double maxPrice, bool fullRange,
                                        int32_t spacing, double decimalAdjust) {
    if (spacing <= 0 || !std::isfinite(decimalAdjust) || decimalAdjust <= 0.0) return std::nullopt;

    TickBounds bounds;
    bounds.spacing = spacing;
    bounds.decimalAdjust = decimalAdjust;

    if (fullRange) {
        bounds.lowerTick = minUsableTick(spacing);
        bounds.upperTick = maxUsableTick(spacing);
        return bounds;
    }

    const auto lower = priceToTick(minPrice, spacing, decimalAdjust, true);
    const auto upper = priceToTick(maxPrice, spacing, decimalAdjust, false);
    if (!lower || !upper) return std::nullopt;

    bounds.lowerTick = std::min(*lower, *upper);
    bounds.upperTick = std::max(*lower, *upper);
    return bounds;
}

} // namespace TickMath
