/*
RangeScope — ViewportController
Role: Domain-agnostic 1-D pan/zoom/hover state machine over an ordered numeric domain.
Inputs/Outputs: Wheel and drag events as pointer ratios in [0,1]; emits viewportChanged.
Threading: Lives on the main GUI thread; all methods are executed on this thread.
Performance: O(1) pan/zoom; O(log n) hit testing over sorted domain values.
Integration: One instance per chart (tick domain for liquidity, milliseconds for price and volume).
Observability: Logs zoom and pan via rsLog_Render.
Related: ViewportController.cpp, SeriesChartModel.hpp.
Assumptions: minZoom is supplied by the caller in domain units; domain values are sorted ascending.
*/
#pragma once

#include <QObject>
#include <cstddef>
#include <optional>
#include <vector>

class ViewportController : public QObject {
    Q_OBJECT

public:
    // Half-open index range [first, last) of the points to render
    struct VisibleSlice {
        size_t first = 0;
        size_t last = 0;
        bool fallback = false;   // fewer than 2 points in view; the full series is rendered
        bool operator==(const VisibleSlice&) const = default;
    };

    static constexpr double ZOOM_IN_FACTOR = 0.85;
    static constexpr double ZOOM_OUT_FACTOR = 1.15;

    explicit ViewportController(double minZoom, QObject* parent = nullptr);

    // Domain
    void setDomain(double domainMin, double domainMax);
    void setMinZoom(double minZoom);
    bool isValid() const { return m_valid; }

    double getDomainMin() const { return m_domainMin; }
    double getDomainMax() const { return m_domainMax; }
    double getDomainSpan() const { return m_domainMax - m_domainMin; }
    double getMinZoom() const { return m_minZoom; }
    double getEffectiveMinZoom() const;

    // View window
    double getZoomRange() const { return m_zoomRange; }
    double getZoomCenter() const { return m_zoomCenter; }
    double getViewMin() const { return m_zoomCenter - m_zoomRange / 2.0; }
    double getViewMax() const { return m_zoomCenter + m_zoomRange / 2.0; }
    bool isZoomed() const { return m_valid && m_zoomRange < getDomainSpan(); }

    // Interaction
    void onWheel(double pointerRatio, bool zoomingIn);
    void onDragStart(double pointerRatio);
    void onDragMove(double pointerRatio);
    void onDragEnd();
    bool isDragging() const { return m_dragging; }
    void reset();

    // Coordinate mapping over the current view window
    double ratioToDomain(double pointerRatio) const;
    double domainToRatio(double value) const;

    VisibleSlice visibleSlice(const std::vector<double>& sortedValues) const;
    std::optional<size_t> nearestIndex(double pointerRatio, const std::vector<double>& sortedValues) const;

    // Index of the value closest to target; ties resolve to the lower index
    static std::optional<size_t> nearestIndexTo(const std::vector<double>& sortedValues, double target);

signals:
    void viewportChanged();

private:
    double clampCenter(double center) const;
    void applyView(double zoomRange, double zoomCenter);

    double m_domainMin = 0.0;
    double m_domainMax = 0.0;
    double m_minZoom = 1.0;
    double m_zoomRange = 0.0;
    double m_zoomCenter = 0.0;
    bool m_valid = false;

    // Mouse interaction state
    bool m_dragging = false;
    double m_dragStartRatio = 0.0;
    double m_dragStartCenter = 0.0;
};
