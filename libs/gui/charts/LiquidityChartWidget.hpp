/*
RangeScope — LiquidityChartWidget
Role: Bar chart of liquidity per tick with the current tick and the selected range overlaid.
Inputs/Outputs: LiquidityDistribution and TickBounds in; painted bars and range markers out.
Threading: Main GUI thread.
Performance: Only bars inside the visible slice are painted.
Integration: Fed by MainWindow from the distribution stage and RangeController::tickBoundsChanged.
Observability: Inherits throttled render logging from ViewportChartWidget.
Related: LiquidityChartWidget.cpp, ViewportChartWidget.hpp, TickMath.hpp.
Assumptions: Bars are keyed by tick index; prices are shown only when the backend supplies them.
*/
#pragma once

#include <optional>

#include "TickMath.hpp"
#include "charts/ViewportChartWidget.hpp"
#include "pool/PoolTypes.hpp"

class LiquidityChartWidget : public ViewportChartWidget {
    Q_OBJECT

public:
    explicit LiquidityChartWidget(double minZoomTicks, QWidget* parent = nullptr);

    void setDistribution(const LiquidityDistribution& distribution);
    void clearDistribution();
    void setTickBounds(const std::optional<TickMath::TickBounds>& bounds);
    void setTokenSymbols(const QString& token0, const QString& token1);

protected:
    void drawSeries(QPainter& painter, const QRectF& plot) override;
    void drawDomainAxis(QPainter& painter, const QRectF& plot) override;
    QString tooltipText(size_t index) const override;
    QString headerText() const override;

private:
    void drawTickMarker(QPainter& painter, const QRectF& plot, double tick, const QColor& color) const;

    LiquidityDistribution m_distribution;
    std::optional<TickMath::TickBounds> m_bounds;
    QString m_token0;
    QString m_token1;
};
