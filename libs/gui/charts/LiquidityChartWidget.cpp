#include "LiquidityChartWidget.hpp"

#include <QPainter>
#include <algorithm>

#include "charts/AxisScale.hpp"

LiquidityChartWidget::LiquidityChartWidget(double minZoomTicks, QWidget* parent)
    : ViewportChartWidget(minZoomTicks, parent) {
    setTitle(tr("Liquidity distribution"));
    model().setDefaultHover(SeriesChartModel::DefaultHover::None);
}

void LiquidityChartWidget::setDistribution(const LiquidityDistribution& distribution) {
    m_distribution = distribution;
    std::vector<SeriesPoint> points;
    points.reserve(distribution.bars.size());
    for (const auto& bar : distribution.bars) {
        points.push_back({static_cast<double>(bar.tick), bar.liquidity});
    }
    model().setSeries(std::move(points));

    if (distribution.currentTick) {
        model().setDefaultHover(SeriesChartModel::DefaultHover::NearestToAnchor,
                                static_cast<double>(*distribution.currentTick));
    } else {
        model().setDefaultHover(SeriesChartModel::DefaultHover::None);
    }
}

void LiquidityChartWidget::clearDistribution() {
    m_distribution = {};
    model().clear();
}

void LiquidityChartWidget::setTickBounds(const std::optional<TickMath::TickBounds>& bounds) {
    if (bounds == m_bounds) return;
    m_bounds = bounds;
    update();
}

void LiquidityChartWidget::setTokenSymbols(const QString& token0, const QString& token1) {
    m_token0 = token0;
    m_token1 = token1;
    update();
}

QString LiquidityChartWidget::headerText() const {
    if (m_token0.isEmpty() || m_token1.isEmpty()) return {};
    return QStringLiteral("%1/%2").arg(m_token0, m_token1);
}

void LiquidityChartWidget::drawSeries(QPainter& painter, const QRectF& plot) {
    const auto& pts = model().points();
    const auto slice = model().visibleSlice();
    const double maxMeasure = model().maxVisibleMeasure();
    const size_t count = slice.last - slice.first;
    const double barWidth = std::max(1.0, plot.width() / std::max<size_t>(count, 1) * 0.9);

    const bool haveBounds = m_bounds.has_value();
    for (size_t i = slice.first; i < slice.last; ++i) {
        const double x = xForDomain(plot, pts[i].domainValue);
        const double y = yForMeasure(plot, pts[i].measure, maxMeasure);
        const auto tick = static_cast<int32_t>(pts[i].domainValue);
        const bool inRange = haveBounds && tick >= m_bounds->lowerTick && tick < m_bounds->upperTick;
        const QColor fill = inRange ? QColor(80, 160, 240) : QColor(70, 70, 90);
        painter.fillRect(QRectF(x - barWidth / 2.0, y, barWidth, plot.bottom() - y), fill);
    }

    if (m_distribution.currentTick) {
        drawTickMarker(painter, plot, *m_distribution.currentTick, QColor(240, 200, 60));
    }
    if (haveBounds) {
        drawTickMarker(painter, plot, m_bounds->lowerTick, QColor(90, 220, 120));
        drawTickMarker(painter, plot, m_bounds->upperTick, QColor(230, 90, 90));
    }
}

void LiquidityChartWidget::drawTickMarker(QPainter& painter, const QRectF& plot, double tick,
                                          const QColor& color) const {
    const double x = xForDomain(plot, tick);
    if (x < plot.left() || x > plot.right()) return;
    painter.setPen(QPen(color, 1.5));
    painter.drawLine(QPointF(x, plot.top()), QPointF(x, plot.bottom()));
}

void LiquidityChartWidget::drawDomainAxis(QPainter& painter, const QRectF& plot) {
    painter.setPen(QColor(160, 160, 160));
    for (const auto& tick : AxisScale::valueTicks(model().renderMin(), model().renderMax(), 6)) {
        const double x = xForDomain(plot, tick.value);
        painter.drawText(QRectF(x - 40, plot.bottom() + 4, 80, kBottomMargin - 6), Qt::AlignCenter,
                         QString::number(static_cast<qint64>(tick.value)));
    }
}

QString LiquidityChartWidget::tooltipText(size_t index) const {
    const auto& bar = m_distribution.bars.at(index);
    QString text = tr("Tick: %1\nLiquidity: %2").arg(bar.tick).arg(AxisScale::formatCompact(bar.liquidity));
    if (bar.price) text += tr("\nPrice: %1").arg(AxisScale::formatCompact(*bar.price));
    if (m_distribution.currentTick && *m_distribution.currentTick == bar.tick) text += tr("\n(current)");
    return text;
}
