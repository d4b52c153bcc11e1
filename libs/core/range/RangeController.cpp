#include "RangeController.hpp"

#include <algorithm>
#include <cmath>
#include <fmt/format.h>
#include <limits>

#include "RangeScopeLogging.hpp"
#include "ValueParsing.hpp"

RangeController::RangeController(QObject* parent)
    : QObject(parent) {
}

QString RangeController::formatPrice(double price) {
    if (!std::isfinite(price)) return QString::fromUtf8(FULL_RANGE_MAX_TEXT);
    if (price != 0.0 && std::abs(price) < 1e-4) {
        return QString::fromStdString(fmt::format("{:.10g}", price));
    }
    return QString::fromStdString(fmt::format("{:.6f}", price));
}

std::optional<double> RangeController::valueOf(Side side) const {
    const Bound& b = bound(side);
    if (b.exact) return b.exact;
    return ValueParsing::parseDecimal(b.text.toStdString());
}

void RangeController::storeValue(Side side, double value) {
    Bound& b = bound(side);
    b.text = formatPrice(value);
    b.exact = value;
}

void RangeController::markTouched() {
    m_touched = true;
}

void RangeController::publish() {
    recomputeTickBounds();
    emit rangeChanged();
}

void RangeController::recomputeTickBounds() {
    std::optional<TickMath::TickBounds> next;
    if (const auto range = resolvedRange()) {
        next = TickMath::tickBoundsFor(range->minPrice, range->maxPrice, range->fullRange,
                                       m_params.tickSpacing(), m_params.decimalAdjust());
    }
    if (next != m_tickBounds) {
        m_tickBounds = next;
        emit tickBoundsChanged();
    }
}

std::optional<ResolvedRange> RangeController::resolvedRange() const {
    if (m_fullRange) return ResolvedRange{};

    const auto a = valueOf(Side::Min);
    const auto b = valueOf(Side::Max);
    if (!a || !b) return std::nullopt;

    const double low = std::min(*a, *b);
    const double high = std::max(*a, *b);
    if (low < 0.0 || high <= low) return std::nullopt;
    return ResolvedRange{low, high, false};
}

void RangeController::beginPoolSession(const PoolParameters& params) {
    m_params = params;
    m_bounds = {};
    m_focusValues = {};
    m_snapshot.reset();
    m_touched = false;
    const bool wasFull = m_fullRange;
    m_fullRange = false;
    rsLog_Debug("Range session reset, spacing" << m_params.tickSpacing());
    if (wasFull) emit fullRangeChanged(false);
    publish();
}

void RangeController::setPoolParameters(const PoolParameters& params) {
    if (params == m_params) return;
    m_params = params;
    recomputeTickBounds();
}

void RangeController::setPrice(Side side, const QString& text) {
    if (m_fullRange) exitFullRange();
    markTouched();
    Bound& b = bound(side);
    if (b.text == text) return;
    b.text = text;
    b.exact.reset();
    publish();
}

void RangeController::beginEdit(Side side) {
    m_focusValues[static_cast<size_t>(side)] = bound(side);
    markTouched();
}

bool RangeController::commit(Side side, const QString& value) {
    auto& focus = m_focusValues[static_cast<size_t>(side)];
    const std::optional<Bound> captured = focus;
    focus.reset();

    // Untouched field: leave it exactly as it was
    if (captured && captured->text == value) {
        if (bound(side).text != value) {
            setPrice(side, value);
        }
        return false;
    }

    const auto parsed = ValueParsing::parseDecimal(value.toStdString());
    if (!parsed) return false;

    // Re-entering the displayed rounding of a stored value keeps the stored value
    double target = *parsed;
    if (captured && captured->exact
        && ValueParsing::parseDecimal(formatPrice(*captured->exact).toStdString()) == parsed) {
        target = *captured->exact;
    }

    const bool roundDown = (side == Side::Min);
    const auto snapped = TickMath::snap(target, m_params.tickSpacing(), m_params.decimalAdjust(), roundDown);
    if (!snapped) return false;

    if (m_fullRange) exitFullRange();
    markTouched();
    storeValue(side, *snapped);
    rsLog_Debug("Committed" << (roundDown ? "min" : "max") << value << "->" << bound(side).text);
    publish();
    return true;
}

bool RangeController::step(Side side, int direction) {
    if (m_fullRange) return false;
    const auto current = valueOf(side);
    if (!current) return false;

    const auto next = TickMath::stepTick(*current, direction, m_params.tickSpacing(), m_params.decimalAdjust());
    if (!next) return false;

    markTouched();
    storeValue(side, *next);
    publish();
    return true;
}

bool RangeController::enterFullRange() {
    if (m_fullRange) return true;

    const auto a = valueOf(Side::Min);
    const auto b = valueOf(Side::Max);
    if (!a || !b || *a == *b) {
        rsLog_Debug("Full range refused: invalid or degenerate bounds" << minPrice() << maxPrice());
        return false;
    }

    markTouched();
    m_snapshot = m_bounds;
    m_bounds[0] = Bound{QString::fromUtf8(FULL_RANGE_MIN_TEXT), std::nullopt};
    m_bounds[1] = Bound{QString::fromUtf8(FULL_RANGE_MAX_TEXT), std::nullopt};
    m_fullRange = true;
    emit fullRangeChanged(true);
    publish();
    return true;
}

void RangeController::exitFullRange() {
    if (!m_fullRange) return;

    markTouched();
    if (m_snapshot) {
        m_bounds = *m_snapshot;
        m_snapshot.reset();
    }
    m_fullRange = false;
    emit fullRangeChanged(false);
    publish();
}

bool RangeController::setFullRange(bool enabled) {
    if (enabled) return enterFullRange();
    exitFullRange();
    return true;
}

bool RangeController::trySeedDefaultRange(double minPrice, double maxPrice) {
    if (m_touched) {
        rsLog_Debug("Default range dropped: range already touched");
        return false;
    }
    if (!std::isfinite(minPrice) || !std::isfinite(maxPrice)) return false;

    storeValue(Side::Min, std::min(minPrice, maxPrice));
    storeValue(Side::Max, std::max(minPrice, maxPrice));
    publish();
    return true;
}

bool RangeController::applyMatchedRange(double minPrice, double maxPrice) {
    if (!std::isfinite(minPrice) || !std::isfinite(maxPrice) || minPrice <= 0.0 || maxPrice <= 0.0) {
        return false;
    }
    if (m_fullRange) exitFullRange();

    markTouched();
    storeValue(Side::Min, std::min(minPrice, maxPrice));
    storeValue(Side::Max, std::max(minPrice, maxPrice));
    publish();
    return true;
}
