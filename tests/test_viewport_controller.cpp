/*
RangeScope — ViewportController Tests
Role: Verify the 1-D pan/zoom engine over tick and time domains
Testing Strategy: Wheel and drag sequences → assert window bounds, anchoring and hit testing
Coverage: Zoom limits, pointer anchoring, pan clamping, reset, visible slice fallback, nearest index
*/
#include <gtest/gtest.h>
#include <QCoreApplication>
#include <vector>

#include "viewport/ViewportController.hpp"

namespace {
constexpr double kEps = 1e-9;

void expectWindowInsideDomain(const ViewportController& vp) {
    EXPECT_GE(vp.getViewMin(), vp.getDomainMin() - kEps);
    EXPECT_LE(vp.getViewMax(), vp.getDomainMax() + kEps);
    EXPECT_GE(vp.getZoomRange(), vp.getEffectiveMinZoom() - kEps);
    EXPECT_LE(vp.getZoomRange(), vp.getDomainSpan() + kEps);
}
} // namespace

class ViewportControllerTest : public ::testing::Test {
protected:
    void SetUp() override {
        vp.setDomain(0.0, 1000.0);
    }

    ViewportController vp{50.0};
};

// =============================================================================
// Domain
// =============================================================================

TEST_F(ViewportControllerTest, NewDomainShowsEverything) {
    EXPECT_DOUBLE_EQ(vp.getViewMin(), 0.0);
    EXPECT_DOUBLE_EQ(vp.getViewMax(), 1000.0);
    EXPECT_FALSE(vp.isZoomed());
}

TEST_F(ViewportControllerTest, DomainNarrowerThanMinZoomIsShownWhole) {
    vp.setDomain(100.0, 120.0);
    EXPECT_DOUBLE_EQ(vp.getEffectiveMinZoom(), 20.0);
    vp.onWheel(0.5, true);
    EXPECT_DOUBLE_EQ(vp.getZoomRange(), 20.0);
}

// =============================================================================
// Zoom
// =============================================================================

TEST_F(ViewportControllerTest, WheelZoomScalesRange) {
    vp.onWheel(0.5, true);
    EXPECT_NEAR(vp.getZoomRange(), 850.0, kEps);
    EXPECT_NEAR(vp.getZoomCenter(), 500.0, kEps);

    vp.onWheel(0.5, false);
    EXPECT_NEAR(vp.getZoomRange(), 977.5, kEps);
}

TEST_F(ViewportControllerTest, ZoomKeepsPointUnderPointer) {
    vp.onWheel(0.5, true);
    vp.onWheel(0.5, true);   // range 722.5 centred at 500

    const double ratio = 0.3;
    const double before = vp.ratioToDomain(ratio);
    vp.onWheel(ratio, true);
    EXPECT_NEAR(vp.ratioToDomain(ratio), before, 1e-6);
}

TEST_F(ViewportControllerTest, ZoomOutNeverExceedsDomain) {
    for (int i = 0; i < 10; ++i) vp.onWheel(0.9, false);
    EXPECT_DOUBLE_EQ(vp.getZoomRange(), 1000.0);
    EXPECT_DOUBLE_EQ(vp.getViewMin(), 0.0);
    EXPECT_DOUBLE_EQ(vp.getViewMax(), 1000.0);
}

TEST_F(ViewportControllerTest, ZoomInStopsAtMinZoom) {
    for (int i = 0; i < 60; ++i) vp.onWheel(0.1, true);
    EXPECT_NEAR(vp.getZoomRange(), 50.0, kEps);
    expectWindowInsideDomain(vp);
}

TEST_F(ViewportControllerTest, ZoomAtEdgeIsClampedToDomain) {
    vp.onWheel(0.0, true);
    EXPECT_NEAR(vp.getViewMin(), 0.0, kEps);
    vp.onWheel(1.0, false);
    expectWindowInsideDomain(vp);
}

// =============================================================================
// Pan
// =============================================================================

TEST_F(ViewportControllerTest, DragPansOppositeToPointer) {
    for (int i = 0; i < 5; ++i) vp.onWheel(0.5, true);
    const double range = vp.getZoomRange();
    const double center = vp.getZoomCenter();

    vp.onDragStart(0.5);
    vp.onDragMove(0.6);
    EXPECT_NEAR(vp.getZoomCenter(), center - 0.1 * range, kEps);
    vp.onDragEnd();
    EXPECT_FALSE(vp.isDragging());
}

TEST_F(ViewportControllerTest, DragIsClampedAtDomainEdges) {
    for (int i = 0; i < 5; ++i) vp.onWheel(0.5, true);

    vp.onDragStart(0.0);
    vp.onDragMove(50.0);
    EXPECT_NEAR(vp.getViewMin(), 0.0, kEps);
    vp.onDragMove(-50.0);
    EXPECT_NEAR(vp.getViewMax(), 1000.0, kEps);
    vp.onDragEnd();
}

TEST_F(ViewportControllerTest, DragWithoutStartDoesNothing) {
    vp.onWheel(0.5, true);
    const double center = vp.getZoomCenter();
    vp.onDragMove(0.9);
    EXPECT_DOUBLE_EQ(vp.getZoomCenter(), center);
}

TEST_F(ViewportControllerTest, RandomInteractionKeepsInvariants) {
    const double ratios[] = {0.1, 0.9, 0.33, 0.0, 1.0, 0.5, 0.75};
    for (int i = 0; i < 200; ++i) {
        const double r = ratios[i % 7];
        if (i % 3 == 0) {
            vp.onWheel(r, (i % 5) != 0);
        } else {
            vp.onDragStart(r);
            vp.onDragMove(ratios[(i + 3) % 7] * 2.0 - 0.5);
            vp.onDragEnd();
        }
        expectWindowInsideDomain(vp);
    }
}

TEST_F(ViewportControllerTest, ResetRestoresFullDomain) {
    vp.onWheel(0.2, true);
    vp.onWheel(0.2, true);
    ASSERT_TRUE(vp.isZoomed());

    int changes = 0;
    QObject::connect(&vp, &ViewportController::viewportChanged, [&]() { ++changes; });
    vp.reset();
    EXPECT_FALSE(vp.isZoomed());
    EXPECT_EQ(changes, 1);

    vp.reset();
    EXPECT_EQ(changes, 1);
}

TEST_F(ViewportControllerTest, ZoomSurvivesDomainGrowth) {
    for (int i = 0; i < 5; ++i) vp.onWheel(0.5, true);
    const double range = vp.getZoomRange();

    vp.setDomain(0.0, 1200.0);
    EXPECT_TRUE(vp.isZoomed());
    EXPECT_NEAR(vp.getZoomRange(), range, kEps);
}

// =============================================================================
// Hit Testing
// =============================================================================

TEST_F(ViewportControllerTest, VisibleSliceCoversWindow) {
    std::vector<double> values;
    for (int i = 0; i <= 100; ++i) values.push_back(i * 10.0);

    vp.onWheel(0.5, true);   // [75, 925]
    auto slice = vp.visibleSlice(values);
    EXPECT_FALSE(slice.fallback);
    EXPECT_EQ(slice.first, 8u);
    EXPECT_EQ(slice.last, 93u);
}

TEST_F(ViewportControllerTest, SparseWindowFallsBackToFullSeries) {
    const std::vector<double> values = {0.0, 500.0, 1000.0};
    for (int i = 0; i < 60; ++i) vp.onWheel(0.25, true);

    auto slice = vp.visibleSlice(values);
    EXPECT_TRUE(slice.fallback);
    EXPECT_EQ(slice.first, 0u);
    EXPECT_EQ(slice.last, values.size());
}

TEST_F(ViewportControllerTest, NearestIndexPicksClosestPoint) {
    const std::vector<double> values = {0.0, 100.0, 250.0, 1000.0};
    EXPECT_EQ(vp.nearestIndex(0.0, values), 0u);
    EXPECT_EQ(vp.nearestIndex(0.16, values), 1u);
    EXPECT_EQ(vp.nearestIndex(0.2, values), 2u);
    EXPECT_EQ(vp.nearestIndex(1.0, values), 3u);
    EXPECT_FALSE(vp.nearestIndex(0.5, {}).has_value());
}

TEST(ViewportControllerStatic, NearestIndexTieResolvesLow) {
    const std::vector<double> values = {10.0, 20.0};
    EXPECT_EQ(ViewportController::nearestIndexTo(values, 15.0), 0u);
    EXPECT_EQ(ViewportController::nearestIndexTo(values, 15.1), 1u);
    EXPECT_EQ(ViewportController::nearestIndexTo(values, -5.0), 0u);
    EXPECT_EQ(ViewportController::nearestIndexTo(values, 99.0), 1u);
}

TEST(ViewportControllerStatic, TimeDomainUsesCallerMinZoom) {
    ViewportController vp(3600.0 * 1000.0);
    vp.setDomain(1705276800000.0, 1705276800000.0 + 14.0 * 86400000.0);
    for (int i = 0; i < 200; ++i) vp.onWheel(0.5, true);
    EXPECT_NEAR(vp.getZoomRange(), 3600.0 * 1000.0, 1e-3);
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
