/*
RangeScope — TickMath
Role: Pure conversions between price and the discretized tick coordinate of concentrated-liquidity pools.
Inputs/Outputs: Prices (token1 per token0, decimal-adjusted) in, ticks or snapped prices out.
Threading: Stateless free functions; safe from any thread.
Performance: A log/pow per call; no allocation.
Integration: Used by RangeController for snapping and steppers, and by the tick chart for range markers.
Observability: None; invalid input is reported through std::nullopt.
Related: TickMath.cpp, RangeController.hpp.
Assumptions: price = 1.0001^tick * decimalAdjust, decimalAdjust = 10^(decimals0 - decimals1).
*/
#pragma once

#include <cstdint>
#include <optional>

namespace TickMath {

inline constexpr int32_t MIN_TICK = -887272;
inline constexpr int32_t MAX_TICK = 887272;
inline constexpr double TICK_BASE = 1.0001;

// A raw tick this close to a multiple of the spacing is treated as sitting on it.
inline constexpr double SNAP_TOLERANCE_TICKS = 1e-8;

// Fallbacks used while pool metadata is missing
inline constexpr int DEFAULT_FEE_TIER = 3000;
inline constexpr int DEFAULT_TOKEN0_DECIMALS = 18;
inline constexpr int DEFAULT_TOKEN1_DECIMALS = 6;

struct TickBounds {
    int32_t lowerTick = MIN_TICK;
    int32_t upperTick = MAX_TICK;
    int32_t spacing = 1;
    double decimalAdjust = 1.0;

    bool operator==(const TickBounds&) const = default;
};

/**
 * Tick spacing for a fee tier in hundredths of a basis point.
 * @return 1 / 10 / 60 / 200 for 100 / 500 / 3000 / 10000; 1 for unknown tiers
 */
int32_t tickSpacingForFeeTier(int feeTier);

/// 10^(token0Decimals - token1Decimals)
double decimalAdjustFor(int token0Decimals, int token1Decimals);

// Outermost multiples of spacing inside [MIN_TICK, MAX_TICK]
int32_t minUsableTick(int32_t spacing);
int32_t maxUsableTick(int32_t spacing);

/**
 * Converts a price to a usable tick.
 * @param roundDown Snap to the lower multiple of spacing (true) or the upper one (false)
 * @return Tick clamped to the usable range, or nullopt when price, spacing or
 *         decimalAdjust is not strictly positive or the logarithm is not finite
 */
std::optional<int32_t> priceToTick(double price, int32_t spacing, double decimalAdjust, bool roundDown);

double tickToPrice(int32_t tick, double decimalAdjust);

/**
 * Snaps a price onto the tick grid. Idempotent: a price already within
 * SNAP_TOLERANCE_TICKS of a boundary maps to that exact boundary price
 * regardless of roundDown.
 */
std::optional<double> snap(double price, int32_t spacing, double decimalAdjust, bool roundDown);

/**
 * Moves one spacing unit from the boundary at or below (direction > 0) or at or
 * above (direction < 0) the given price. Used by the +/- range steppers.
 * @return Boundary price clamped to the usable range; nullopt on invalid input or direction 0
 */
std::optional<double> stepTick(double price, int direction, int32_t spacing, double decimalAdjust);

/**
 * Tick bounds for a resolved price range. Full range spans the usable ticks.
 * The low side rounds down and the high side rounds up.
 */
std::optional<TickBounds> tickBoundsFor(double minPrice, double maxPrice, bool fullRange,
                                        int32_t spacing, double decimalAdjust);

} // namespace TickMath
