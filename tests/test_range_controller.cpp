/*
RangeScope — RangeController Tests
Role: Verify the editable price range state machine and its derived tick bounds
Testing Strategy: Drive edits, commits, steps and toggles → assert texts, resolved range and signals
Coverage: Snapping on commit, untouched commits, full-range round trip, degenerate bounds,
          default-range compare-and-set, matched ranges, pool sessions
*/
#include <gtest/gtest.h>
#include <QCoreApplication>
#include <cmath>

#include "TickMath.hpp"
#include "range/RangeController.hpp"

using Side = RangeController::Side;

class RangeControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // fee tier 3000 -> spacing 60; equal decimals -> decimalAdjust 1
        params.feeTier = 3000;
        params.token0Decimals = 18;
        params.token1Decimals = 18;
        range.beginPoolSession(params);
    }

    PoolParameters params;
    RangeController range;
};

// =============================================================================
// Commit and Snap
// =============================================================================

TEST_F(RangeControllerTest, CommitSnapsMinDownAndMaxUp) {
    range.beginEdit(Side::Min);
    range.setMinPrice("2833,5");
    EXPECT_TRUE(range.commit(Side::Min, "2833,5"));

    range.beginEdit(Side::Max);
    range.setMaxPrice("3242,4");
    EXPECT_TRUE(range.commit(Side::Max, "3242,4"));

    const double low = *TickMath::snap(2833.5, 60, 1.0, true);
    const double high = *TickMath::snap(3242.4, 60, 1.0, false);
    EXPECT_EQ(range.minPrice(), RangeController::formatPrice(low));
    EXPECT_EQ(range.maxPrice(), RangeController::formatPrice(high));

    auto resolved = range.resolvedRange();
    ASSERT_TRUE(resolved.has_value());
    EXPECT_DOUBLE_EQ(resolved->minPrice, low);
    EXPECT_DOUBLE_EQ(resolved->maxPrice, high);
    EXPECT_FALSE(resolved->fullRange);

    auto bounds = range.tickBounds();
    ASSERT_TRUE(bounds.has_value());
    EXPECT_EQ(bounds->lowerTick, *TickMath::priceToTick(2833.5, 60, 1.0, true));
    EXPECT_EQ(bounds->upperTick, *TickMath::priceToTick(3242.4, 60, 1.0, false));
    EXPECT_EQ(bounds->lowerTick % 60, 0);
}

TEST_F(RangeControllerTest, CommittingSnappedValueAgainIsStable) {
    range.beginEdit(Side::Min);
    range.setMinPrice("2833.5");
    range.commit(Side::Min, "2833.5");
    const QString once = range.minPrice();

    range.beginEdit(Side::Min);
    range.setMinPrice(once + " ");
    range.commit(Side::Min, once + " ");
    EXPECT_EQ(range.minPrice(), once);
}

TEST_F(RangeControllerTest, UntouchedFieldIsNotSnapped) {
    ASSERT_TRUE(range.trySeedDefaultRange(1000.0, 2000.0));
    const QString before = range.minPrice();

    range.beginEdit(Side::Min);
    EXPECT_FALSE(range.commit(Side::Min, before));

    EXPECT_EQ(range.minPrice(), before);
    EXPECT_DOUBLE_EQ(range.resolvedRange()->minPrice, 1000.0);
}

TEST_F(RangeControllerTest, UnparsableCommitIsNoOp) {
    range.beginEdit(Side::Min);
    range.setMinPrice("abc");
    EXPECT_FALSE(range.commit(Side::Min, "abc"));

    EXPECT_EQ(range.minPrice(), "abc");
    EXPECT_FALSE(range.resolvedRange().has_value());
    EXPECT_FALSE(range.tickBounds().has_value());
}

TEST_F(RangeControllerTest, ReversedBoundsResolveInOrder) {
    range.setMinPrice("3000");
    range.setMaxPrice("2000");

    auto resolved = range.resolvedRange();
    ASSERT_TRUE(resolved.has_value());
    EXPECT_DOUBLE_EQ(resolved->minPrice, 2000.0);
    EXPECT_DOUBLE_EQ(resolved->maxPrice, 3000.0);
}

// =============================================================================
// Full Range
// =============================================================================

TEST_F(RangeControllerTest, FullRangeRoundTripRestoresExactStrings) {
    range.setMinPrice("1234,5");
    range.setMaxPrice("2000.00");

    int toggles = 0;
    QObject::connect(&range, &RangeController::fullRangeChanged, [&](bool) { ++toggles; });

    ASSERT_TRUE(range.enterFullRange());
    EXPECT_TRUE(range.isFullRange());
    EXPECT_EQ(range.minPrice(), "0");
    EXPECT_EQ(range.maxPrice(), QString::fromUtf8("∞"));

    auto resolved = range.resolvedRange();
    ASSERT_TRUE(resolved.has_value());
    EXPECT_TRUE(resolved->fullRange);
    EXPECT_TRUE(std::isinf(resolved->maxPrice));
    EXPECT_EQ(range.tickBounds()->lowerTick, TickMath::minUsableTick(60));
    EXPECT_EQ(range.tickBounds()->upperTick, TickMath::maxUsableTick(60));

    range.exitFullRange();
    EXPECT_FALSE(range.isFullRange());
    EXPECT_EQ(range.minPrice(), "1234,5");
    EXPECT_EQ(range.maxPrice(), "2000.00");
    EXPECT_EQ(toggles, 2);
}

TEST_F(RangeControllerTest, DegenerateBoundsRefuseFullRange) {
    range.setMinPrice("5");
    range.setMaxPrice("5");

    EXPECT_FALSE(range.enterFullRange());
    EXPECT_FALSE(range.isFullRange());
    EXPECT_EQ(range.minPrice(), "5");
    EXPECT_EQ(range.maxPrice(), "5");
    EXPECT_FALSE(range.resolvedRange().has_value());
}

TEST_F(RangeControllerTest, InvalidBoundsRefuseFullRange) {
    range.setMinPrice("");
    range.setMaxPrice("12");
    EXPECT_FALSE(range.setFullRange(true));
    EXPECT_FALSE(range.isFullRange());
}

TEST_F(RangeControllerTest, EditWhileFullRangeExitsFirst) {
    range.setMinPrice("100");
    range.setMaxPrice("200");
    ASSERT_TRUE(range.enterFullRange());

    range.setMaxPrice("300");
    EXPECT_FALSE(range.isFullRange());
    EXPECT_EQ(range.minPrice(), "100");
    EXPECT_EQ(range.maxPrice(), "300");
}

TEST_F(RangeControllerTest, StepIsRefusedInFullRange) {
    range.setMinPrice("100");
    range.setMaxPrice("200");
    ASSERT_TRUE(range.enterFullRange());
    EXPECT_FALSE(range.step(Side::Min, +1));
}

// =============================================================================
// Stepping
// =============================================================================

TEST_F(RangeControllerTest, StepMovesOneSpacing) {
    ASSERT_TRUE(range.trySeedDefaultRange(TickMath::tickToPrice(600, 1.0), TickMath::tickToPrice(1200, 1.0)));

    EXPECT_TRUE(range.step(Side::Min, +1));
    EXPECT_EQ(range.tickBounds()->lowerTick, 660);

    EXPECT_TRUE(range.step(Side::Max, -1));
    EXPECT_EQ(range.tickBounds()->upperTick, 1140);

    EXPECT_TRUE(range.step(Side::Min, -1));
    EXPECT_EQ(range.tickBounds()->lowerTick, 600);
    EXPECT_TRUE(range.isTouched());
}

// =============================================================================
// Seeding and Sessions
// =============================================================================

TEST_F(RangeControllerTest, DefaultRangeSeedsUntouchedRange) {
    int changes = 0;
    QObject::connect(&range, &RangeController::rangeChanged, [&]() { ++changes; });

    EXPECT_TRUE(range.trySeedDefaultRange(2000.0, 1000.0));
    EXPECT_DOUBLE_EQ(range.resolvedRange()->minPrice, 1000.0);
    EXPECT_DOUBLE_EQ(range.resolvedRange()->maxPrice, 2000.0);
    EXPECT_FALSE(range.isTouched());
    EXPECT_EQ(changes, 1);
}

TEST_F(RangeControllerTest, DefaultRangeRejectedOnceUserFocusedAField) {
    range.beginEdit(Side::Max);
    EXPECT_FALSE(range.trySeedDefaultRange(1000.0, 2000.0));
    EXPECT_TRUE(range.minPrice().isEmpty());
}

TEST_F(RangeControllerTest, NewPoolSessionClearsTouchedAndFullRange) {
    range.setMinPrice("1");
    range.setMaxPrice("2");
    ASSERT_TRUE(range.enterFullRange());

    bool lastFull = true;
    QObject::connect(&range, &RangeController::fullRangeChanged, [&](bool full) { lastFull = full; });

    range.beginPoolSession(params);
    EXPECT_FALSE(lastFull);
    EXPECT_FALSE(range.isFullRange());
    EXPECT_FALSE(range.isTouched());
    EXPECT_TRUE(range.minPrice().isEmpty());
    EXPECT_TRUE(range.trySeedDefaultRange(1.0, 2.0));
}

TEST_F(RangeControllerTest, MatchedRangeOverridesTouchedRange) {
    range.setMinPrice("10");
    range.setMaxPrice("20");
    ASSERT_TRUE(range.enterFullRange());

    EXPECT_TRUE(range.applyMatchedRange(11.5, 19.25));
    EXPECT_FALSE(range.isFullRange());
    EXPECT_DOUBLE_EQ(range.resolvedRange()->minPrice, 11.5);
    EXPECT_DOUBLE_EQ(range.resolvedRange()->maxPrice, 19.25);
    EXPECT_FALSE(range.applyMatchedRange(0.0, 5.0));
}

TEST_F(RangeControllerTest, PoolParametersRecomputeTickBounds) {
    ASSERT_TRUE(range.trySeedDefaultRange(TickMath::tickToPrice(600, 1.0), TickMath::tickToPrice(1200, 1.0)));

    int boundsChanges = 0;
    QObject::connect(&range, &RangeController::tickBoundsChanged, [&]() { ++boundsChanges; });

    PoolParameters narrow = params;
    narrow.feeTier = 500;
    range.setPoolParameters(narrow);
    EXPECT_EQ(boundsChanges, 1);
    EXPECT_EQ(range.tickBounds()->spacing, 10);

    range.setPoolParameters(narrow);
    EXPECT_EQ(boundsChanges, 1);
}

TEST_F(RangeControllerTest, TickBoundsUpdateBeforeRangeChangedFires) {
    std::optional<TickMath::TickBounds> seen;
    QObject::connect(&range, &RangeController::rangeChanged, [&]() { seen = range.tickBounds(); });

    range.setMinPrice("100");
    range.setMaxPrice("200");
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(seen, range.tickBounds());
}

// =============================================================================
// Formatting
// =============================================================================

TEST(RangeControllerFormat, FormatsFixedAndTinyPrices) {
    EXPECT_EQ(RangeController::formatPrice(1234.5), "1234.500000");
    EXPECT_EQ(RangeController::formatPrice(0.0), "0.000000");
    EXPECT_EQ(RangeController::formatPrice(0.00001234), "1.234e-05");
    EXPECT_EQ(RangeController::formatPrice(std::numeric_limits<double>::infinity()), QString::fromUtf8("∞"));
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
