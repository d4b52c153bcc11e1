/*
RangeScope — RangeController
Role: Owns the user-facing min/max price range and the full-range toggle.
Inputs/Outputs: Text edits, focus/commit events, steppers and toggles in; rangeChanged/tickBoundsChanged out.
Threading: Main GUI thread only.
Performance: Constant-time state updates; TickMath calls on commit and step.
Integration: Sole writer of the range. RequestOrchestrator reads resolvedRange()/tickBounds() and seeds
             the default range through trySeedDefaultRange().
Observability: State transitions logged via rsLog_Debug.
Related: RangeController.cpp, TickMath.hpp, RequestOrchestrator.hpp.
Assumptions: Bounds are kept as the strings the user sees; numeric values are derived on demand.
*/
#pragma once

#include <QObject>
#include <QString>
#include <array>
#include <optional>

#include "TickMath.hpp"
#include "pool/PoolTypes.hpp"

class RangeController : public QObject {
    Q_OBJECT

public:
    enum class Side { Min = 0, Max = 1 };

    static constexpr const char* FULL_RANGE_MIN_TEXT = "0";
    static constexpr const char* FULL_RANGE_MAX_TEXT = "∞";

    explicit RangeController(QObject* parent = nullptr);

    QString minPrice() const { return m_bounds[0].text; }
    QString maxPrice() const { return m_bounds[1].text; }
    QString price(Side side) const { return bound(side).text; }
    bool isFullRange() const { return m_fullRange; }
    bool isTouched() const { return m_touched; }
    const PoolParameters& poolParameters() const { return m_params; }

    /// Parsed, ordered range; (0, +inf) in full range; nullopt when a bound is invalid or degenerate
    std::optional<ResolvedRange> resolvedRange() const;
    std::optional<TickMath::TickBounds> tickBounds() const { return m_tickBounds; }

    // Pool session: clears the range and the touched flag
    void beginPoolSession(const PoolParameters& params);
    void setPoolParameters(const PoolParameters& params);

    // Direct edits (typing); leave full range first
    void setMinPrice(const QString& text) { setPrice(Side::Min, text); }
    void setMaxPrice(const QString& text) { setPrice(Side::Max, text); }
    void setPrice(Side side, const QString& text);

    void beginEdit(Side side);
    bool commit(Side side, const QString& value);
    bool step(Side side, int direction);

    bool enterFullRange();
    void exitFullRange();
    bool setFullRange(bool enabled);

    // Returns false when the range was already touched for this pool
    bool trySeedDefaultRange(double minPrice, double maxPrice);
    bool applyMatchedRange(double minPrice, double maxPrice);

    static QString formatPrice(double price);

signals:
    void rangeChanged();
    void fullRangeChanged(bool fullRange);
    void tickBoundsChanged();

private:
    struct Bound {
        QString text;
        std::optional<double> exact;   // value behind text when it was produced from a number
    };

    Bound& bound(Side side) { return m_bounds[static_cast<size_t>(side)]; }
    const Bound& bound(Side side) const { return m_bounds[static_cast<size_t>(side)]; }

    std::optional<double> valueOf(Side side) const;
    void storeValue(Side side, double value);
    void markTouched();
    void publish();
    void recomputeTickBounds();

    std::array<Bound, 2> m_bounds;
    std::array<std::optional<Bound>, 2> m_focusValues;   // bound as it was when the field gained focus
    bool m_fullRange = false;
    std::optional<std::array<Bound, 2>> m_snapshot;
    bool m_touched = false;
    PoolParameters m_params;
    std::optional<TickMath::TickBounds> m_tickBounds;
};
