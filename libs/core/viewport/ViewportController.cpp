#include "ViewportController.hpp"

#include <algorithm>
#include <cmath>

#include "RangeScopeLogging.hpp"

ViewportController::ViewportController(double minZoom, QObject* parent)
    : QObject(parent)
    , m_minZoom(minZoom > 0.0 ? minZoom : 1.0) {
}

double ViewportController::getEffectiveMinZoom() const {
    // A domain narrower than minZoom is shown whole
    return std::min(m_minZoom, getDomainSpan());
}

void ViewportController::setDomain(double domainMin, double domainMax) {
    if (!std::isfinite(domainMin) || !std::isfinite(domainMax)) return;
    if (domainMax < domainMin) std::swap(domainMin, domainMax);

    const bool keepZoom = m_valid && isZoomed();
    const double oldRange = m_zoomRange;
    const double oldCenter = m_zoomCenter;

    m_domainMin = domainMin;
    m_domainMax = domainMax;
    m_valid = true;
    m_dragging = false;

    const double span = getDomainSpan();
    if (keepZoom) {
        const double range = std::clamp(oldRange, getEffectiveMinZoom(), span);
        m_zoomRange = range;
        m_zoomCenter = clampCenter(oldCenter);
    } else {
        m_zoomRange = span;
        m_zoomCenter = m_domainMin + span / 2.0;
    }
    emit viewportChanged();
}

void ViewportController::setMinZoom(double minZoom) {
    if (minZoom <= 0.0 || minZoom == m_minZoom) return;
    m_minZoom = minZoom;
    if (m_valid && m_zoomRange < getEffectiveMinZoom()) {
        applyView(getEffectiveMinZoom(), m_zoomCenter);
    }
}

double ViewportController::clampCenter(double center) const {
    const double half = m_zoomRange / 2.0;
    const double lo = m_domainMin + half;
    const double hi = m_domainMax - half;
    if (lo >= hi) return m_domainMin + getDomainSpan() / 2.0;
    return std::clamp(center, lo, hi);
}

void ViewportController::applyView(double zoomRange, double zoomCenter) {
    const double range = std::clamp(zoomRange, getEffectiveMinZoom(), getDomainSpan());
    const double oldRange = m_zoomRange;
    const double oldCenter = m_zoomCenter;
    m_zoomRange = range;
    m_zoomCenter = clampCenter(zoomCenter);
    if (m_zoomRange != oldRange || m_zoomCenter != oldCenter) {
        emit viewportChanged();
    }
}

void ViewportController::onWheel(double pointerRatio, bool zoomingIn) {
    if (!m_valid || getDomainSpan() <= 0.0) return;

    const double ratio = std::clamp(pointerRatio, 0.0, 1.0);
    const double anchor = getViewMin() + ratio * m_zoomRange;
    const double target = m_zoomRange * (zoomingIn ? ZOOM_IN_FACTOR : ZOOM_OUT_FACTOR);
    const double newRange = std::clamp(target, getEffectiveMinZoom(), getDomainSpan());
    if (newRange == m_zoomRange) return;

    // Keep the domain value under the pointer at the same ratio
    const double newMin = anchor - ratio * newRange;
    applyView(newRange, newMin + newRange / 2.0);

    rsLog_Render("Viewport zoom" << (zoomingIn ? "in" : "out") << "range:" << m_zoomRange
                 << "center:" << m_zoomCenter);
}

void ViewportController::onDragStart(double pointerRatio) {
    if (!m_valid) return;
    m_dragging = true;
    m_dragStartRatio = pointerRatio;
    m_dragStartCenter = m_zoomCenter;
}

void ViewportController::onDragMove(double pointerRatio) {
    if (!m_dragging) return;
    const double delta = pointerRatio - m_dragStartRatio;
    applyView(m_zoomRange, m_dragStartCenter - delta * m_zoomRange);
    rsLog_Render("Viewport pan center:" << m_zoomCenter);
}

void ViewportController::onDragEnd() {
    m_dragging = false;
}

void ViewportController::reset() {
    if (!m_valid) return;
    m_dragging = false;
    applyView(getDomainSpan(), m_domainMin + getDomainSpan() / 2.0);
}

double ViewportController::ratioToDomain(double pointerRatio) const {
    return getViewMin() + std::clamp(pointerRatio, 0.0, 1.0) * m_zoomRange;
}

double ViewportController::domainToRatio(double value) const {
    if (m_zoomRange <= 0.0) return 0.5;
    return (value - getViewMin()) / m_zoomRange;
}

ViewportController::VisibleSlice ViewportController::visibleSlice(const std::vector<double>& sortedValues) const {
    VisibleSlice slice;
    slice.last = sortedValues.size();
    if (!m_valid || sortedValues.empty()) {
        slice.fallback = true;
        return slice;
    }

    const auto lo = std::lower_bound(sortedValues.begin(), sortedValues.end(), getViewMin());
    const auto hi = std::upper_bound(lo, sortedValues.end(), getViewMax());
    if (hi - lo < 2) {
        slice.fallback = true;
        return slice;
    }
    slice.first = static_cast<size_t>(lo - sortedValues.begin());
    slice.last = static_cast<size_t>(hi - sortedValues.begin());
    return slice;
}

std::optional<size_t> ViewportController::nearestIndex(double pointerRatio,
                                                       const std::vector<double>& sortedValues) const {
    if (sortedValues.empty()) return std::nullopt;
    return nearestIndexTo(sortedValues, ratioToDomain(pointerRatio));
}

std::optional<size_t> ViewportController::nearestIndexTo(const std::vector<double>& sortedValues, double target) {
    if (sortedValues.empty()) return std::nullopt;

    const auto it = std::lower_bound(sortedValues.begin(), sortedValues.end(), target);
    if (it == sortedValues.begin()) return 0;
    if (it == sortedValues.end()) return sortedValues.size() - 1;

    const size_t upper = static_cast<size_t>(it - sortedValues.begin());
    const size_t lower = upper - 1;
    return (target - sortedValues[lower] <= sortedValues[upper] - target) ? lower : upper;
}
