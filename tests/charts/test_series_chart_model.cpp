/*
RangeScope — SeriesChartModel Tests
Role: Verify the display-independent chart state shared by the three charts
Testing Strategy: Feed series, drive the owned viewport and pointer ratios, assert slices and hover
Coverage: Sorting, domain fit, zoomed slicing, hover clamping, default hover modes, axis tick placement
*/
#include <gtest/gtest.h>
#include <QCoreApplication>
#include <vector>

#include "charts/AxisScale.hpp"
#include "charts/SeriesChartModel.hpp"

namespace {

std::vector<SeriesPoint> linearSeries(int count) {
    std::vector<SeriesPoint> points;
    for (int i = 0; i < count; ++i) {
        points.push_back({static_cast<double>(i), static_cast<double>(i)});
    }
    return points;
}

} // namespace

TEST(SeriesChartModelTest, SetSeriesSortsAndFitsDomain) {
    SeriesChartModel model(5.0);
    int changes = 0;
    QObject::connect(&model, &SeriesChartModel::changed, [&]() { ++changes; });

    model.setSeries({{30.0, 1.0}, {10.0, 2.0}, {20.0, 3.0}});
    ASSERT_EQ(model.points().size(), 3u);
    EXPECT_EQ(model.domainValues(), (std::vector<double>{10.0, 20.0, 30.0}));
    EXPECT_DOUBLE_EQ(model.points()[0].measure, 2.0);
    EXPECT_DOUBLE_EQ(model.viewport().getViewMin(), 10.0);
    EXPECT_DOUBLE_EQ(model.viewport().getViewMax(), 30.0);
    EXPECT_DOUBLE_EQ(model.maxVisibleMeasure(), 3.0);
    EXPECT_DOUBLE_EQ(model.minVisibleMeasure(), 1.0);
    EXPECT_GE(changes, 1);
}

TEST(SeriesChartModelTest, DefaultHoverModes) {
    SeriesChartModel model(5.0);
    model.setSeries({{10.0, 1.0}, {20.0, 2.0}, {30.0, 3.0}});

    // Last point by default
    EXPECT_EQ(model.hoverIndex(), 2u);

    model.setDefaultHover(SeriesChartModel::DefaultHover::NearestToAnchor, 19.0);
    EXPECT_EQ(model.hoverIndex(), 1u);

    model.setDefaultHover(SeriesChartModel::DefaultHover::NearestToAnchor);
    EXPECT_FALSE(model.hoverIndex().has_value());

    model.setDefaultHover(SeriesChartModel::DefaultHover::None);
    EXPECT_FALSE(model.hoverIndex().has_value());
}

TEST(SeriesChartModelTest, ExplicitHoverOverridesDefault) {
    SeriesChartModel model(5.0);
    model.setSeries(linearSeries(11));

    model.hoverAt(0.0);
    EXPECT_EQ(model.hoverIndex(), 0u);
    EXPECT_TRUE(model.hasExplicitHover());

    model.hoverAt(0.52);
    EXPECT_EQ(model.hoverIndex(), 5u);

    model.clearHover();
    EXPECT_FALSE(model.hasExplicitHover());
    EXPECT_EQ(model.hoverIndex(), 10u);
}

TEST(SeriesChartModelTest, ZoomedSliceAndHoverStayInsideView) {
    SeriesChartModel model(5.0);
    model.setSeries(linearSeries(101));

    model.viewport().onWheel(0.5, true);
    EXPECT_NEAR(model.viewport().getViewMin(), 7.5, 1e-9);
    EXPECT_NEAR(model.viewport().getViewMax(), 92.5, 1e-9);

    const auto slice = model.visibleSlice();
    EXPECT_FALSE(slice.fallback);
    EXPECT_EQ(slice.first, 8u);
    EXPECT_EQ(slice.last, 93u);
    EXPECT_DOUBLE_EQ(model.maxVisibleMeasure(), 92.0);
    EXPECT_NEAR(model.xRatio(50.0), 0.5, 1e-9);

    // Point 7 ties with point 8 at the left edge but is not rendered
    model.hoverAt(0.0);
    EXPECT_EQ(model.hoverIndex(), 8u);
    model.hoverAt(1.0);
    EXPECT_EQ(model.hoverIndex(), 92u);
}

TEST(SeriesChartModelTest, ViewportChangeDropsExplicitHover) {
    SeriesChartModel model(5.0);
    model.setSeries(linearSeries(101));
    model.hoverAt(0.3);
    ASSERT_TRUE(model.hasExplicitHover());

    model.viewport().onWheel(0.5, true);
    EXPECT_FALSE(model.hasExplicitHover());
    EXPECT_EQ(model.hoverIndex(), 100u);
}

TEST(SeriesChartModelTest, SparseViewFallsBackToWholeSeries) {
    SeriesChartModel model(5.0);
    model.setSeries({{0.0, 4.0}, {100.0, 9.0}});

    for (int i = 0; i < 40; ++i) model.viewport().onWheel(0.5, true);
    EXPECT_NEAR(model.viewport().getZoomRange(), 5.0, 1e-9);

    EXPECT_TRUE(model.visibleSlice().fallback);
    EXPECT_DOUBLE_EQ(model.renderMin(), 0.0);
    EXPECT_DOUBLE_EQ(model.renderMax(), 100.0);
    EXPECT_DOUBLE_EQ(model.maxVisibleMeasure(), 9.0);
}

TEST(SeriesChartModelTest, ClearEmptiesModel) {
    SeriesChartModel model(5.0);
    model.setSeries(linearSeries(5));
    model.hoverAt(0.5);
    model.clear();

    EXPECT_TRUE(model.isEmpty());
    EXPECT_FALSE(model.hoverIndex().has_value());
    EXPECT_DOUBLE_EQ(model.maxVisibleMeasure(), 0.0);
}

// =============================================================================
// AxisScale
// =============================================================================

TEST(AxisScaleTest, NiceValueTicks) {
    EXPECT_DOUBLE_EQ(AxisScale::calculateNiceStep(100.0, 5), 20.0);
    EXPECT_DOUBLE_EQ(AxisScale::calculateNiceStep(7.0, 5), 2.0);

    const auto ticks = AxisScale::valueTicks(0.0, 100.0, 5);
    ASSERT_EQ(ticks.size(), 6u);
    EXPECT_DOUBLE_EQ(ticks.front().value, 0.0);
    EXPECT_DOUBLE_EQ(ticks.back().value, 100.0);

    EXPECT_TRUE(AxisScale::valueTicks(5.0, 5.0, 5).empty());
}

TEST(AxisScaleTest, CompactLabels) {
    EXPECT_EQ(AxisScale::formatCompact(1500.0), "1.5K");
    EXPECT_EQ(AxisScale::formatCompact(2.5e6), "2.5M");
    EXPECT_EQ(AxisScale::formatCompact(3.2e9), "3.2B");
    EXPECT_EQ(AxisScale::formatCompact(12.5), "12.50");
    EXPECT_EQ(AxisScale::formatCompact(0.000123), "0.000123");
}

TEST(AxisScaleTest, TimeTicksAlignToCalendarSteps) {
    const double start = 1705276800000.0;   // 2024-01-15T00:00:00Z
    const double twoDays = 2 * 24 * 3600 * 1000.0;

    const auto ticks = AxisScale::timeTicks(start, start + twoDays, 4);
    ASSERT_EQ(ticks.size(), 5u);
    EXPECT_EQ(ticks.front().label, "15/01 00:00");
    EXPECT_EQ(ticks[1].label, "15/01 12:00");
    EXPECT_EQ(ticks.back().label, "17/01 00:00");
}

int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
