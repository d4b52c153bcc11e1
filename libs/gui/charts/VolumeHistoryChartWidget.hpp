/*
RangeScope — VolumeHistoryChartWidget
Role: Daily traded volume bars with min/avg/max stats and the pool summary in the header.
Inputs/Outputs: VolumeHistory in; painted bars and tooltip out.
Threading: Main GUI thread.
Performance: Only the visible slice is painted.
Integration: Fed by MainWindow from the volume history stage.
Observability: Inherits throttled render logging from ViewportChartWidget.
Related: VolumeHistoryChartWidget.cpp, VolumeHistory.hpp.
Assumptions: One point per UTC day; the domain is milliseconds at day start.
*/
#pragma once

#include "charts/ViewportChartWidget.hpp"
#include "pool/VolumeHistory.hpp"

class VolumeHistoryChartWidget : public ViewportChartWidget {
    Q_OBJECT

public:
    explicit VolumeHistoryChartWidget(double minZoomMs, QWidget* parent = nullptr);

    void setHistory(const VolumeHistory& history);
    void clearHistory();

protected:
    void drawSeries(QPainter& painter, const QRectF& plot) override;
    void drawDomainAxis(QPainter& painter, const QRectF& plot) override;
    QString tooltipText(size_t index) const override;
    QString headerText() const override;

private:
    VolumeHistory m_history;
};
