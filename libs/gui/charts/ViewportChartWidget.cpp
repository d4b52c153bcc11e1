#include "ViewportChartWidget.hpp"

#include <QFontMetrics>
#include <QMouseEvent>
#include <QPainter>
#include <QPen>
#include <QWheelEvent>
#include <algorithm>

#include "RangeScopeLogging.hpp"
#include "charts/AxisScale.hpp"

ViewportChartWidget::ViewportChartWidget(double minZoom, QWidget* parent)
    : QWidget(parent)
    , m_model(minZoom) {
    setMinimumSize(320, 200);
    setMouseTracking(true);
    setAutoFillBackground(true);
    QPalette pal = palette();
    pal.setColor(QPalette::Window, QColor(18, 18, 22));
    setPalette(pal);

    connect(&m_model, &SeriesChartModel::changed, this, qOverload<>(&QWidget::update));
}

void ViewportChartWidget::setTitle(const QString& title) {
    m_title = title;
    update();
}

void ViewportChartWidget::setLoading(bool loading) {
    if (m_loading == loading) return;
    m_loading = loading;
    update();
}

void ViewportChartWidget::setErrorText(const QString& error) {
    if (m_error == error) return;
    m_error = error;
    update();
}

QRectF ViewportChartWidget::plotRect() const {
    return QRectF(kLeftMargin, kTopMargin,
                  std::max(1.0, width() - kLeftMargin - kRightMargin),
                  std::max(1.0, height() - kTopMargin - kBottomMargin));
}

double ViewportChartWidget::pointerRatio(double x) const {
    const QRectF plot = plotRect();
    return std::clamp((x - plot.left()) / plot.width(), 0.0, 1.0);
}

double ViewportChartWidget::xForDomain(const QRectF& plot, double domainValue) const {
    return plot.left() + m_model.xRatio(domainValue) * plot.width();
}

double ViewportChartWidget::yForMeasure(const QRectF& plot, double measure, double maxMeasure) const {
    if (maxMeasure <= 0.0) return plot.bottom();
    return plot.bottom() - (measure / maxMeasure) * plot.height();
}

// =============================================================================
// Painting
// =============================================================================

void ViewportChartWidget::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(this);
    painter.setRenderHint(QPainter::Antialiasing, true);

    const QRectF plot = plotRect();

    painter.setPen(QColor(220, 220, 220));
    QString header = m_title;
    const QString extra = headerText();
    if (!extra.isEmpty()) header += QStringLiteral("   ") + extra;
    painter.drawText(QRectF(8, 4, width() - 16, kTopMargin - 6), Qt::AlignLeft | Qt::AlignVCenter, header);

    if (!m_error.isEmpty()) {
        painter.setPen(QColor(230, 90, 90));
        painter.drawText(plot, Qt::AlignCenter | Qt::TextWordWrap, m_error);
        return;
    }
    if (m_model.isEmpty()) {
        painter.setPen(QColor(150, 150, 150));
        painter.drawText(plot, Qt::AlignCenter, m_loading ? tr("Loading...") : tr("No data"));
        return;
    }

    painter.save();
    painter.setClipRect(plot.adjusted(-1, -1, 1, 1));
    drawSeries(painter, plot);
    painter.restore();

    drawValueAxis(painter, plot);
    drawDomainAxis(painter, plot);
    drawTooltip(painter, plot);

    if (m_loading) {
        painter.setPen(QColor(150, 150, 150));
        painter.drawText(plot.adjusted(0, 4, -4, 0), Qt::AlignTop | Qt::AlignRight, tr("Updating..."));
    }

    rsLog_Render("Painted" << m_title << "points:" << m_model.points().size()
                 << "zoomed:" << m_model.viewport().isZoomed());
}

void ViewportChartWidget::drawValueAxis(QPainter& painter, const QRectF& plot) {
    const double maxMeasure = m_model.maxVisibleMeasure();
    painter.setPen(QColor(40, 40, 48));
    for (const auto& tick : AxisScale::valueTicks(0.0, maxMeasure, 4)) {
        const double y = yForMeasure(plot, tick.value, maxMeasure);
        painter.drawLine(QPointF(plot.left(), y), QPointF(plot.right(), y));
    }
    painter.setPen(QColor(160, 160, 160));
    for (const auto& tick : AxisScale::valueTicks(0.0, maxMeasure, 4)) {
        const double y = yForMeasure(plot, tick.value, maxMeasure);
        painter.drawText(QRectF(0, y - 9, kLeftMargin - 6, 18), Qt::AlignRight | Qt::AlignVCenter, tick.label);
    }
}

void ViewportChartWidget::drawTooltip(QPainter& painter, const QRectF& plot) {
    const auto index = m_model.hoverIndex();
    if (!index || *index >= m_model.points().size()) return;

    const double x = xForDomain(plot, m_model.points()[*index].domainValue);
    if (x < plot.left() - 0.5 || x > plot.right() + 0.5) return;

    painter.setPen(QPen(QColor(200, 200, 200, 120), 1, Qt::DashLine));
    painter.drawLine(QPointF(x, plot.top()), QPointF(x, plot.bottom()));

    const QString text = tooltipText(*index);
    const QFontMetrics fm(painter.font());
    const QRectF textRect = fm.boundingRect(QRect(0, 0, 260, 200), Qt::TextWordWrap, text);
    QRectF box(x + 8, plot.top() + 4, textRect.width() + 12, textRect.height() + 8);
    if (box.right() > plot.right()) box.moveRight(x - 8);

    painter.setPen(QColor(90, 90, 100));
    painter.setBrush(QColor(30, 30, 36, 230));
    painter.drawRoundedRect(box, 4, 4);
    painter.setPen(QColor(230, 230, 230));
    painter.drawText(box.adjusted(6, 4, -6, -4), Qt::TextWordWrap, text);
}

// =============================================================================
// Interaction
// =============================================================================

void ViewportChartWidget::wheelEvent(QWheelEvent* event) {
    const int delta = event->angleDelta().y();
    if (delta == 0 || m_model.isEmpty()) {
        event->ignore();
        return;
    }
    m_model.viewport().onWheel(pointerRatio(event->position().x()), delta > 0);
    event->accept();
}

void ViewportChartWidget::mousePressEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton && !m_model.isEmpty()) {
        m_model.viewport().onDragStart(pointerRatio(event->position().x()));
        setCursor(Qt::ClosedHandCursor);
    }
    QWidget::mousePressEvent(event);
}

void ViewportChartWidget::mouseMoveEvent(QMouseEvent* event) {
    const double ratio = pointerRatio(event->position().x());
    if (m_model.viewport().isDragging()) {
        m_model.viewport().onDragMove(ratio);
    } else if (plotRect().contains(event->position())) {
        m_model.hoverAt(ratio);
    } else {
        m_model.clearHover();
    }
    QWidget::mouseMoveEvent(event);
}

void ViewportChartWidget::mouseReleaseEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton && m_model.viewport().isDragging()) {
        m_model.viewport().onDragEnd();
        unsetCursor();
    }
    QWidget::mouseReleaseEvent(event);
}

void ViewportChartWidget::mouseDoubleClickEvent(QMouseEvent* event) {
    m_model.viewport().reset();
    QWidget::mouseDoubleClickEvent(event);
}

void ViewportChartWidget::leaveEvent(QEvent* event) {
    m_model.clearHover();
    QWidget::leaveEvent(event);
}
