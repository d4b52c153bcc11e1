#include "PriceHistoryChartWidget.hpp"

#include <QDateTime>
#include <QPainter>
#include <QPolygonF>
#include <QTimeZone>
#include <algorithm>
#include <cmath>

#include "charts/AxisScale.hpp"

PriceHistoryChartWidget::PriceHistoryChartWidget(double minZoomMs, QWidget* parent)
    : ViewportChartWidget(minZoomMs, parent) {
    setTitle(tr("Price history"));
    model().setDefaultHover(SeriesChartModel::DefaultHover::Last);
}

void PriceHistoryChartWidget::setSeries(const PriceSeries& series) {
    m_stats = series.stats;
    std::vector<SeriesPoint> points;
    points.reserve(series.points.size());
    for (const auto& p : series.points) {
        points.push_back({static_cast<double>(p.timestampMs), p.price});
    }
    model().setSeries(std::move(points));
}

void PriceHistoryChartWidget::clearSeries() {
    m_stats = {};
    model().clear();
}

void PriceHistoryChartWidget::setRange(const std::optional<ResolvedRange>& range) {
    m_range = range;
    update();
}

QString PriceHistoryChartWidget::headerText() const {
    QStringList parts;
    if (m_stats.price) parts << tr("Current %1").arg(AxisScale::formatCompact(*m_stats.price));
    if (m_stats.min) parts << tr("Min %1").arg(AxisScale::formatCompact(*m_stats.min));
    if (m_stats.avg) parts << tr("Avg %1").arg(AxisScale::formatCompact(*m_stats.avg));
    if (m_stats.max) parts << tr("Max %1").arg(AxisScale::formatCompact(*m_stats.max));
    return parts.join(QStringLiteral("  "));
}

PriceHistoryChartWidget::ValueSpan PriceHistoryChartWidget::valueSpan() const {
    ValueSpan span{model().minVisibleMeasure(), model().maxVisibleMeasure()};
    if (span.hi <= span.lo) {
        const double pad = std::max(std::abs(span.lo) * 0.01, 1e-12);
        span.lo -= pad;
        span.hi += pad;
    }
    const double margin = (span.hi - span.lo) * 0.05;
    span.lo -= margin;
    span.hi += margin;
    return span;
}

double PriceHistoryChartWidget::yForPrice(const QRectF& plot, const ValueSpan& span, double price) const {
    return plot.bottom() - (price - span.lo) / (span.hi - span.lo) * plot.height();
}

void PriceHistoryChartWidget::drawSeries(QPainter& painter, const QRectF& plot) {
    const auto& pts = model().points();
    const auto slice = model().visibleSlice();
    const ValueSpan span = valueSpan();

    QPolygonF line;
    line.reserve(static_cast<qsizetype>(slice.last - slice.first));
    for (size_t i = slice.first; i < slice.last; ++i) {
        line << QPointF(xForDomain(plot, pts[i].domainValue), yForPrice(plot, span, pts[i].measure));
    }
    painter.setPen(QPen(QColor(80, 160, 240), 1.5));
    painter.drawPolyline(line);

    if (m_range && !m_range->fullRange) {
        drawGuide(painter, plot, span, m_range->minPrice, QColor(90, 220, 120));
        drawGuide(painter, plot, span, m_range->maxPrice, QColor(230, 90, 90));
    }
    if (m_stats.price) drawGuide(painter, plot, span, *m_stats.price, QColor(240, 200, 60));
}

void PriceHistoryChartWidget::drawGuide(QPainter& painter, const QRectF& plot, const ValueSpan& span,
                                        double price, const QColor& color) const {
    const double y = yForPrice(plot, span, price);
    if (y < plot.top() || y > plot.bottom()) return;
    painter.setPen(QPen(color, 1, Qt::DashLine));
    painter.drawLine(QPointF(plot.left(), y), QPointF(plot.right(), y));
}

void PriceHistoryChartWidget::drawValueAxis(QPainter& painter, const QRectF& plot) {
    const ValueSpan span = valueSpan();
    const auto ticks = AxisScale::valueTicks(span.lo, span.hi, 5);
    for (const auto& tick : ticks) {
        const double y = yForPrice(plot, span, tick.value);
        painter.setPen(QColor(40, 40, 48));
        painter.drawLine(QPointF(plot.left(), y), QPointF(plot.right(), y));
        painter.setPen(QColor(160, 160, 160));
        painter.drawText(QRectF(0, y - 9, kLeftMargin - 6, 18), Qt::AlignRight | Qt::AlignVCenter, tick.label);
    }
}

void PriceHistoryChartWidget::drawDomainAxis(QPainter& painter, const QRectF& plot) {
    painter.setPen(QColor(160, 160, 160));
    for (const auto& tick : AxisScale::timeTicks(model().renderMin(), model().renderMax(), 5)) {
        const double x = xForDomain(plot, tick.value);
        painter.drawText(QRectF(x - 50, plot.bottom() + 4, 100, kBottomMargin - 6), Qt::AlignCenter, tick.label);
    }
}

QString PriceHistoryChartWidget::tooltipText(size_t index) const {
    const auto& p = model().points().at(index);
    const QDateTime when = QDateTime::fromMSecsSinceEpoch(static_cast<qint64>(p.domainValue), QTimeZone::utc());
    return tr("%1\nPrice: %2").arg(when.toString(QStringLiteral("yyyy-MM-dd HH:mm")),
                                   AxisScale::formatCompact(p.measure));
}
