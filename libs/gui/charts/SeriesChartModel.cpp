#include "SeriesChartModel.hpp"

#include <algorithm>

SeriesChartModel::SeriesChartModel(double minZoom, QObject* parent)
    : QObject(parent)
    , m_viewport(minZoom) {
    connect(&m_viewport, &ViewportController::viewportChanged, this, [this]() {
        // Hover index refers to the rendered slice, which just moved
        m_hoverIndex.reset();
        emit changed();
    });
}

void SeriesChartModel::setSeries(std::vector<SeriesPoint> points) {
    std::stable_sort(points.begin(), points.end(),
                     [](const SeriesPoint& a, const SeriesPoint& b) { return a.domainValue < b.domainValue; });
    m_points = std::move(points);
    m_domainValues.clear();
    m_domainValues.reserve(m_points.size());
    for (const auto& p : m_points) m_domainValues.push_back(p.domainValue);
    m_hoverIndex.reset();

    if (m_points.empty()) {
        emit changed();
        return;
    }
    // setDomain emits viewportChanged, which emits changed()
    m_viewport.setDomain(m_domainValues.front(), m_domainValues.back());
}

void SeriesChartModel::clear() {
    m_points.clear();
    m_domainValues.clear();
    m_hoverIndex.reset();
    emit changed();
}

ViewportController::VisibleSlice SeriesChartModel::visibleSlice() const {
    return m_viewport.visibleSlice(m_domainValues);
}

double SeriesChartModel::renderMin() const {
    if (m_points.empty()) return 0.0;
    return visibleSlice().fallback ? m_domainValues.front() : m_viewport.getViewMin();
}

double SeriesChartModel::renderMax() const {
    if (m_points.empty()) return 1.0;
    return visibleSlice().fallback ? m_domainValues.back() : m_viewport.getViewMax();
}

double SeriesChartModel::xRatio(double domainValue) const {
    const double lo = renderMin();
    const double hi = renderMax();
    if (hi <= lo) return 0.5;
    return (domainValue - lo) / (hi - lo);
}

double SeriesChartModel::maxVisibleMeasure() const {
    const auto slice = visibleSlice();
    double out = 0.0;
    for (size_t i = slice.first; i < slice.last; ++i) out = std::max(out, m_points[i].measure);
    return out;
}

double SeriesChartModel::minVisibleMeasure() const {
    const auto slice = visibleSlice();
    if (slice.first >= slice.last) return 0.0;
    double out = m_points[slice.first].measure;
    for (size_t i = slice.first; i < slice.last; ++i) out = std::min(out, m_points[i].measure);
    return out;
}

void SeriesChartModel::hoverAt(double pointerRatio) {
    if (m_points.empty()) return;
    const auto slice = visibleSlice();
    const double target = renderMin() + std::clamp(pointerRatio, 0.0, 1.0) * (renderMax() - renderMin());
    const auto nearest = ViewportController::nearestIndexTo(m_domainValues, target);
    if (!nearest) return;

    // Global nearest clamped into the slice is the nearest rendered point
    const size_t index = std::clamp(*nearest, slice.first, slice.last - 1);
    if (m_hoverIndex == index) return;
    m_hoverIndex = index;
    emit changed();
}

void SeriesChartModel::clearHover() {
    if (!m_hoverIndex) return;
    m_hoverIndex.reset();
    emit changed();
}

void SeriesChartModel::setDefaultHover(DefaultHover mode, std::optional<double> anchor) {
    m_defaultHover = mode;
    m_hoverAnchor = anchor;
    emit changed();
}

std::optional<size_t> SeriesChartModel::hoverIndex() const {
    if (m_hoverIndex) return m_hoverIndex;
    if (m_points.empty()) return std::nullopt;

    switch (m_defaultHover) {
        case DefaultHover::None:
            return std::nullopt;
        case DefaultHover::Last:
            return m_points.size() - 1;
        case DefaultHover::NearestToAnchor:
            if (!m_hoverAnchor) return std::nullopt;
            return ViewportController::nearestIndexTo(m_domainValues, *m_hoverAnchor);
    }
    return std::nullopt;
}
