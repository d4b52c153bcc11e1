/*
RangeScope — TickMath Tests
Role: Verify price/tick conversion, boundary snapping and tick stepping
Testing Strategy: Known tick-aligned prices → assert ticks, idempotence and step symmetry
Coverage: Fee tier spacing, usable tick limits, invalid inputs, clamping, tick bounds
*/
#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>

#include "TickMath.hpp"

using namespace TickMath;

// =============================================================================
// Spacing and Limits
// =============================================================================

TEST(TickMath, SpacingFollowsFeeTier) {
    EXPECT_EQ(tickSpacingForFeeTier(100), 1);
    EXPECT_EQ(tickSpacingForFeeTier(500), 10);
    EXPECT_EQ(tickSpacingForFeeTier(3000), 60);
    EXPECT_EQ(tickSpacingForFeeTier(10000), 200);
    EXPECT_EQ(tickSpacingForFeeTier(2500), 1);
}

TEST(TickMath, UsableTicksAreSpacingMultiplesInsideLimits) {
    EXPECT_EQ(minUsableTick(60), -887220);
    EXPECT_EQ(maxUsableTick(60), 887220);
    EXPECT_EQ(minUsableTick(200), -887200);
    EXPECT_EQ(maxUsableTick(200), 887200);
    EXPECT_EQ(maxUsableTick(1), MAX_TICK);
}

TEST(TickMath, DecimalAdjustFromTokenDecimals) {
    EXPECT_DOUBLE_EQ(decimalAdjustFor(18, 6), 1e12);
    EXPECT_DOUBLE_EQ(decimalAdjustFor(6, 18), 1e-12);
    EXPECT_DOUBLE_EQ(decimalAdjustFor(18, 18), 1.0);
}

// =============================================================================
// Conversion
// =============================================================================

TEST(TickMath, PriceOneIsTickZero) {
    auto tick = priceToTick(1.0, 60, 1.0, true);
    ASSERT_TRUE(tick.has_value());
    EXPECT_EQ(*tick, 0);
}

TEST(TickMath, AlignedTickRoundTripsInBothDirections) {
    for (int32_t t : {-120000, -600, 0, 60, 1200, 201060}) {
        const double price = tickToPrice(t, 1.0);
        EXPECT_EQ(priceToTick(price, 60, 1.0, true), t) << "tick " << t;
        EXPECT_EQ(priceToTick(price, 60, 1.0, false), t) << "tick " << t;
    }
}

TEST(TickMath, OffGridPriceRoundsPerDirection) {
    const double price = tickToPrice(90, 1.0);
    EXPECT_EQ(priceToTick(price, 60, 1.0, true), 60);
    EXPECT_EQ(priceToTick(price, 60, 1.0, false), 120);

    const double negative = tickToPrice(-90, 1.0);
    EXPECT_EQ(priceToTick(negative, 60, 1.0, true), -120);
    EXPECT_EQ(priceToTick(negative, 60, 1.0, false), -60);
}

TEST(TickMath, DecimalAdjustScalesPrices) {
    const double adjust = decimalAdjustFor(18, 6);
    const double price = tickToPrice(-196260, adjust);
    EXPECT_EQ(priceToTick(price, 60, adjust, true), -196260);
    EXPECT_NEAR(price / adjust, std::pow(1.0001, -196260.0), 1e-20);
}

TEST(TickMath, InvalidInputsAreRejected) {
    const double inf = std::numeric_limits<double>::infinity();
    const double nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_FALSE(priceToTick(0.0, 60, 1.0, true).has_value());
    EXPECT_FALSE(priceToTick(-5.0, 60, 1.0, true).has_value());
    EXPECT_FALSE(priceToTick(nan, 60, 1.0, true).has_value());
    EXPECT_FALSE(priceToTick(inf, 60, 1.0, true).has_value());
    EXPECT_FALSE(priceToTick(1.0, 0, 1.0, true).has_value());
    EXPECT_FALSE(priceToTick(1.0, 60, 0.0, true).has_value());
    EXPECT_FALSE(priceToTick(1.0, 60, -1.0, true).has_value());
    EXPECT_FALSE(snap(0.0, 60, 1.0, false).has_value());
    EXPECT_FALSE(stepTick(1.0, 0, 60, 1.0).has_value());
}

TEST(TickMath, ExtremePricesClampToUsableTicks) {
    EXPECT_EQ(priceToTick(1e300, 60, 1.0, false), maxUsableTick(60));
    EXPECT_EQ(priceToTick(1e-300, 60, 1.0, true), minUsableTick(60));
}

// =============================================================================
// Snapping
// =============================================================================

TEST(TickMath, SnapIsIdempotent) {
    const std::vector<double> prices = {0.00031, 0.5, 1.0, 1.2345, 2833.5, 3242.4, 98765.4321};
    for (bool roundDown : {true, false}) {
        for (double p : prices) {
            const auto once = snap(p, 60, 1.0, roundDown);
            ASSERT_TRUE(once.has_value());
            const auto twice = snap(*once, 60, 1.0, roundDown);
            ASSERT_TRUE(twice.has_value());
            EXPECT_DOUBLE_EQ(*once, *twice) << "price " << p << " roundDown " << roundDown;
        }
    }
}

TEST(TickMath, SnapOnBoundaryIgnoresDirection) {
    const double boundary = tickToPrice(1200, 1.0);
    EXPECT_DOUBLE_EQ(*snap(boundary, 60, 1.0, true), boundary);
    EXPECT_DOUBLE_EQ(*snap(boundary, 60, 1.0, false), boundary);
}

TEST(TickMath, SnapBracketsOffGridPrice) {
    const double price = 2833.5;
    const double low = *snap(price, 60, 1.0, true);
    const double high = *snap(price, 60, 1.0, false);
    EXPECT_LE(low, price);
    EXPECT_GE(high, price);
    EXPECT_EQ(*priceToTick(high, 60, 1.0, true) - *priceToTick(low, 60, 1.0, true), 60);
}

// =============================================================================
// Stepping
// =============================================================================

TEST(TickMath, StepMovesOneSpacingFromAlignedPrice) {
    const double price = tickToPrice(600, 1.0);
    EXPECT_EQ(priceToTick(*stepTick(price, +1, 60, 1.0), 60, 1.0, true), 660);
    EXPECT_EQ(priceToTick(*stepTick(price, -1, 60, 1.0), 60, 1.0, true), 540);
}

TEST(TickMath, StepFromOffGridGoesToAdjacentBoundary) {
    const double price = tickToPrice(630, 1.0);
    EXPECT_EQ(priceToTick(*stepTick(price, +1, 60, 1.0), 60, 1.0, true), 660);
    EXPECT_EQ(priceToTick(*stepTick(price, -1, 60, 1.0), 60, 1.0, true), 600);
}

TEST(TickMath, StepUpThenDownReturnsToStart) {
    for (int32_t t : {-6000, -60, 0, 60, 76020}) {
        const double start = tickToPrice(t, 1.0);
        const auto up = stepTick(start, +1, 60, 1.0);
        ASSERT_TRUE(up.has_value());
        const auto back = stepTick(*up, -1, 60, 1.0);
        ASSERT_TRUE(back.has_value());
        EXPECT_EQ(priceToTick(*back, 60, 1.0, true), t);
        EXPECT_NEAR(*back / start, 1.0, 1e-12);
    }
}

TEST(TickMath, StepClampsAtUsableLimit) {
    const double top = tickToPrice(maxUsableTick(60), 1.0);
    EXPECT_EQ(priceToTick(*stepTick(top, +1, 60, 1.0), 60, 1.0, true), maxUsableTick(60));
}

// =============================================================================
// Tick Bounds
// =============================================================================

TEST(TickMath, FullRangeBoundsUseUsableLimits) {
    auto bounds = tickBoundsFor(0.0, std::numeric_limits<double>::infinity(), true, 60, 1.0);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(bounds->lowerTick, -887220);
    EXPECT_EQ(bounds->upperTick, 887220);
    EXPECT_EQ(bounds->spacing, 60);
}

TEST(TickMath, CustomBoundsRoundOutward) {
    auto bounds = tickBoundsFor(tickToPrice(90, 1.0), tickToPrice(250, 1.0), false, 60, 1.0);
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(bounds->lowerTick, 60);
    EXPECT_EQ(bounds->upperTick, 300);
}

TEST(TickMath, InvalidCustomBoundsYieldNothing) {
    EXPECT_FALSE(tickBoundsFor(0.0, 10.0, false, 60, 1.0).has_value());
    EXPECT_FALSE(tickBoundsFor(1.0, 10.0, false, 0, 1.0).has_value());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
