/*
RangeScope — ViewportChartWidget
Role: QWidget base for the interactive charts; turns mouse input into viewport and hover actions.
Inputs/Outputs: Wheel, drag, hover and double-click events in; repaints on model changes.
Threading: Main GUI thread.
Performance: QPainter immediate-mode drawing over the visible slice only.
Integration: Subclassed by the liquidity, price history and volume history charts.
Observability: Paints logged via rsLog_Render (throttled).
Related: ViewportChartWidget.cpp, SeriesChartModel.hpp.
Assumptions: The plot area excludes fixed axis margins.
*/
#pragma once

#include <QRectF>
#include <QString>
#include <QWidget>

#include "charts/SeriesChartModel.hpp"

class QPainter;

class ViewportChartWidget : public QWidget {
    Q_OBJECT

public:
    explicit ViewportChartWidget(double minZoom, QWidget* parent = nullptr);

    SeriesChartModel& model() { return m_model; }
    const SeriesChartModel& model() const { return m_model; }

    void setTitle(const QString& title);
    void setLoading(bool loading);
    void setErrorText(const QString& error);

protected:
    void paintEvent(QPaintEvent* event) override;
    void wheelEvent(QWheelEvent* event) override;
    void mousePressEvent(QMouseEvent* event) override;
    void mouseMoveEvent(QMouseEvent* event) override;
    void mouseReleaseEvent(QMouseEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;
    void leaveEvent(QEvent* event) override;

    // Subclass hooks
    virtual void drawSeries(QPainter& painter, const QRectF& plot) = 0;
    virtual void drawValueAxis(QPainter& painter, const QRectF& plot);
    virtual void drawDomainAxis(QPainter& painter, const QRectF& plot) = 0;
    virtual QString tooltipText(size_t index) const = 0;
    virtual QString headerText() const { return {}; }

    QRectF plotRect() const;
    double pointerRatio(double x) const;
    double xForDomain(const QRectF& plot, double domainValue) const;
    double yForMeasure(const QRectF& plot, double measure, double maxMeasure) const;
    void drawTooltip(QPainter& painter, const QRectF& plot);

    static constexpr double kLeftMargin = 64.0;
    static constexpr double kRightMargin = 12.0;
    static constexpr double kTopMargin = 28.0;
    static constexpr double kBottomMargin = 26.0;

private:
    SeriesChartModel m_model;
    QString m_title;
    QString m_error;
    bool m_loading = false;
};
