/*
RangeScope — PriceHistoryChartWidget
Role: Line chart of the pool price over the chosen timeframe with range guide lines.
Inputs/Outputs: PriceSeries and the resolved range in; painted line, guides and tooltip out.
Threading: Main GUI thread.
Performance: Only the visible slice is stroked, as one polyline.
Integration: Fed by MainWindow from the pool price stage and RangeController::rangeChanged.
Observability: Inherits throttled render logging from ViewportChartWidget.
Related: PriceHistoryChartWidget.cpp, ViewportChartWidget.hpp.
Assumptions: Timestamps are epoch milliseconds; the value axis spans the visible min..max.
*/
#pragma once

#include <optional>

#include "charts/ViewportChartWidget.hpp"
#include "pool/PoolTypes.hpp"

class PriceHistoryChartWidget : public ViewportChartWidget {
    Q_OBJECT

public:
    explicit PriceHistoryChartWidget(double minZoomMs, QWidget* parent = nullptr);

    void setSeries(const PriceSeries& series);
    void clearSeries();
    void setRange(const std::optional<ResolvedRange>& range);

protected:
    void drawSeries(QPainter& painter, const QRectF& plot) override;
    void drawValueAxis(QPainter& painter, const QRectF& plot) override;
    void drawDomainAxis(QPainter& painter, const QRectF& plot) override;
    QString tooltipText(size_t index) const override;
    QString headerText() const override;

private:
    struct ValueSpan {
        double lo = 0.0;
        double hi = 1.0;
    };
    ValueSpan valueSpan() const;
    double yForPrice(const QRectF& plot, const ValueSpan& span, double price) const;
    void drawGuide(QPainter& painter, const QRectF& plot, const ValueSpan& span, double price,
                   const QColor& color) const;

    PriceStats m_stats;
    std::optional<ResolvedRange> m_range;
};
