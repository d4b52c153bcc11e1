#include "VolumeHistoryChartWidget.hpp"

#include <QDateTime>
#include <QPainter>
#include <QTimeZone>
#include <algorithm>

#include "charts/AxisScale.hpp"

VolumeHistoryChartWidget::VolumeHistoryChartWidget(double minZoomMs, QWidget* parent)
    : ViewportChartWidget(minZoomMs, parent) {
    setTitle(tr("Daily volume"));
    model().setDefaultHover(SeriesChartModel::DefaultHover::Last);
}

void VolumeHistoryChartWidget::setHistory(const VolumeHistory& history) {
    m_history = history;
    std::vector<SeriesPoint> points;
    points.reserve(history.points.size());
    for (const auto& p : history.points) {
        points.push_back({static_cast<double>(p.dayStartSec) * 1000.0, p.volumeUsd});
    }
    model().setSeries(std::move(points));
}

void VolumeHistoryChartWidget::clearHistory() {
    m_history = {};
    model().clear();
}

QString VolumeHistoryChartWidget::headerText() const {
    QStringList parts;
    if (m_history.stats) {
        parts << tr("Min $%1").arg(AxisScale::formatCompact(m_history.stats->min))
              << tr("Avg $%1").arg(AxisScale::formatCompact(m_history.stats->avg))
              << tr("Max $%1").arg(AxisScale::formatCompact(m_history.stats->max));
    }
    if (m_history.summary) {
        const auto& s = *m_history.summary;
        if (s.tvlUsd) parts << tr("TVL $%1").arg(AxisScale::formatCompact(*s.tvlUsd));
        if (s.avgDailyFeesUsd) parts << tr("Fees/day $%1").arg(AxisScale::formatCompact(*s.avgDailyFeesUsd));
        if (s.dailyVolumeTvlPct) parts << tr("Vol/TVL %1%").arg(*s.dailyVolumeTvlPct, 0, 'f', 2);
    }
    return parts.join(QStringLiteral("  "));
}

void VolumeHistoryChartWidget::drawSeries(QPainter& painter, const QRectF& plot) {
    const auto& pts = model().points();
    const auto slice = model().visibleSlice();
    const double maxMeasure = model().maxVisibleMeasure();
    const double dayWidth = std::abs(xForDomain(plot, VolumeHistoryMath::DAY_SECONDS * 1000.0)
                                     - xForDomain(plot, 0.0));
    const double barWidth = std::clamp(dayWidth * 0.8, 1.0, 60.0);

    const auto hover = model().hoverIndex();
    for (size_t i = slice.first; i < slice.last; ++i) {
        const double x = xForDomain(plot, pts[i].domainValue);
        const double y = yForMeasure(plot, pts[i].measure, maxMeasure);
        const QColor fill = (hover && *hover == i) ? QColor(120, 190, 250) : QColor(70, 130, 200);
        painter.fillRect(QRectF(x - barWidth / 2.0, y, barWidth, plot.bottom() - y), fill);
    }

    if (m_history.stats && maxMeasure > 0.0) {
        const double y = yForMeasure(plot, m_history.stats->avg, maxMeasure);
        painter.setPen(QPen(QColor(240, 200, 60), 1, Qt::DashLine));
        painter.drawLine(QPointF(plot.left(), y), QPointF(plot.right(), y));
    }
}

void VolumeHistoryChartWidget::drawDomainAxis(QPainter& painter, const QRectF& plot) {
    painter.setPen(QColor(160, 160, 160));
    for (const auto& tick : AxisScale::timeTicks(model().renderMin(), model().renderMax(), 5)) {
        const double x = xForDomain(plot, tick.value);
        painter.drawText(QRectF(x - 50, plot.bottom() + 4, 100, kBottomMargin - 6), Qt::AlignCenter, tick.label);
    }
}

QString VolumeHistoryChartWidget::tooltipText(size_t index) const {
    const auto& p = m_history.points.at(index);
    const QDate day = QDateTime::fromSecsSinceEpoch(p.dayStartSec, QTimeZone::utc()).date();
    QString text = tr("%1\nVolume: $%2").arg(day.toString(Qt::ISODate), AxisScale::formatCompact(p.volumeUsd));
    if (p.feesUsd) text += tr("\nFees: $%1").arg(AxisScale::formatCompact(*p.feesUsd));
    return text;
}
