/*
RangeScope — SeriesChartModel
Role: Display-independent state of one interactive chart: sorted series, viewport and hover.
Inputs/Outputs: Series points and pointer ratios in; visible slice, x mapping and hover index out.
Threading: Main GUI thread.
Performance: Sorting on setSeries only; hover and slicing are binary searches.
Integration: Owned by a ViewportChartWidget; the liquidity chart uses ticks, the history charts milliseconds.
Observability: None; the owning widget logs paints.
Related: SeriesChartModel.cpp, ViewportController.hpp, ViewportChartWidget.hpp.
Assumptions: Domain values are finite.
*/
#pragma once

#include <QObject>
#include <optional>
#include <vector>

#include "viewport/ViewportController.hpp"

struct SeriesPoint {
    double domainValue = 0.0;   // tick or timestamp (ms)
    double measure = 0.0;       // liquidity, price or volume
};

class SeriesChartModel : public QObject {
    Q_OBJECT

public:
    // Point shown in the tooltip while the pointer is outside the chart
    enum class DefaultHover { None, NearestToAnchor, Last };

    explicit SeriesChartModel(double minZoom, QObject* parent = nullptr);

    void setSeries(std::vector<SeriesPoint> points);
    void clear();
    bool isEmpty() const { return m_points.empty(); }
    const std::vector<SeriesPoint>& points() const { return m_points; }
    const std::vector<double>& domainValues() const { return m_domainValues; }

    ViewportController& viewport() { return m_viewport; }
    const ViewportController& viewport() const { return m_viewport; }

    // Rendering window: the view window, or the whole series in fallback mode
    ViewportController::VisibleSlice visibleSlice() const;
    double renderMin() const;
    double renderMax() const;
    double xRatio(double domainValue) const;
    double maxVisibleMeasure() const;
    double minVisibleMeasure() const;

    // Hover
    void hoverAt(double pointerRatio);
    void clearHover();
    void setDefaultHover(DefaultHover mode, std::optional<double> anchor = std::nullopt);
    std::optional<size_t> hoverIndex() const;
    bool hasExplicitHover() const { return m_hoverIndex.has_value(); }

signals:
    void changed();

private:
    std::vector<SeriesPoint> m_points;
    std::vector<double> m_domainValues;
    ViewportController m_viewport;

    std::optional<size_t> m_hoverIndex;
    DefaultHover m_defaultHover = DefaultHover::Last;
    std::optional<double> m_hoverAnchor;
};
