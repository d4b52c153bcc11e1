#include "RangePanel.hpp"

#include <QCheckBox>
#include <QEvent>
#include <QGridLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QSignalBlocker>
#include <QVBoxLayout>

RangePanel::RangePanel(RangeController& range, QWidget* parent)
    : DockablePanel("RangePanel", tr("Price Range"), parent)
    , m_range(range)
{
    buildUi();

    connect(&m_range, &RangeController::rangeChanged, this, &RangePanel::syncFromController);
    connect(&m_range, &RangeController::fullRangeChanged, this, &RangePanel::syncFromController);
    connect(&m_range, &RangeController::tickBoundsChanged, this, &RangePanel::syncTickLabel);
    syncFromController();
}

RangePanel::SideWidgets RangePanel::buildSide(const QString& label, RangeController::Side side,
                                              QGridLayout* grid, int row) {
    SideWidgets w;
    grid->addWidget(new QLabel(label, m_contentWidget), row, 0);

    w.down = new QPushButton("-", m_contentWidget);
    w.down->setFixedWidth(28);
    w.down->setToolTip(tr("One tick spacing down"));
    grid->addWidget(w.down, row, 1);

    w.input = new QLineEdit(m_contentWidget);
    w.input->installEventFilter(this);
    grid->addWidget(w.input, row, 2);

    w.up = new QPushButton("+", m_contentWidget);
    w.up->setFixedWidth(28);
    w.up->setToolTip(tr("One tick spacing up"));
    grid->addWidget(w.up, row, 3);

    QLineEdit* input = w.input;
    connect(input, &QLineEdit::textEdited, this, [this, side](const QString& text) {
        m_range.setPrice(side, text);
    });
    connect(input, &QLineEdit::editingFinished, this, [this, side, input]() {
        m_range.commit(side, input->text());
        syncFromController();
    });
    connect(w.down, &QPushButton::clicked, this, [this, side]() { m_range.step(side, -1); });
    connect(w.up, &QPushButton::clicked, this, [this, side]() { m_range.step(side, +1); });
    return w;
}

void RangePanel::buildUi() {
    QVBoxLayout* layout = new QVBoxLayout(m_contentWidget);
    layout->setContentsMargins(8, 8, 8, 8);

    QGridLayout* grid = new QGridLayout();
    m_min = buildSide(tr("Min price"), RangeController::Side::Min, grid, 0);
    m_max = buildSide(tr("Max price"), RangeController::Side::Max, grid, 1);
    layout->addLayout(grid);

    m_fullRangeCheck = new QCheckBox(tr("Full range"), m_contentWidget);
    layout->addWidget(m_fullRangeCheck);
    connect(m_fullRangeCheck, &QCheckBox::toggled, this, [this](bool checked) {
        if (!m_range.setFullRange(checked)) {
            // Refused: bounds invalid or equal
            const QSignalBlocker blocker(m_fullRangeCheck);
            m_fullRangeCheck->setChecked(m_range.isFullRange());
        }
    });

    m_tickLabel = new QLabel(m_contentWidget);
    m_tickLabel->setStyleSheet("QLabel { color: #888; font-size: 10px; }");
    layout->addWidget(m_tickLabel);

    m_matchButton = new QPushButton(tr("Match ticks"), m_contentWidget);
    m_matchButton->setToolTip(tr("Snap the range to initialized ticks on the server"));
    m_matchButton->setEnabled(false);
    layout->addWidget(m_matchButton);
    connect(m_matchButton, &QPushButton::clicked, this, &RangePanel::matchTicksRequested);

    m_matchStatus = new QLabel(m_contentWidget);
    m_matchStatus->setStyleSheet("QLabel { color: #888; font-size: 10px; }");
    layout->addWidget(m_matchStatus);

    layout->addStretch();
}

QLineEdit* RangePanel::inputFor(RangeController::Side side) const {
    return side == RangeController::Side::Min ? m_min.input : m_max.input;
}

bool RangePanel::eventFilter(QObject* watched, QEvent* event) {
    if (event->type() == QEvent::FocusIn) {
        if (watched == m_min.input) m_range.beginEdit(RangeController::Side::Min);
        else if (watched == m_max.input) m_range.beginEdit(RangeController::Side::Max);
    }
    return DockablePanel::eventFilter(watched, event);
}

void RangePanel::syncFromController() {
    for (auto side : {RangeController::Side::Min, RangeController::Side::Max}) {
        QLineEdit* input = inputFor(side);
        const QString text = m_range.price(side);
        if (input->text() != text) {
            const QSignalBlocker blocker(input);
            input->setText(text);
        }
    }

    const bool full = m_range.isFullRange();
    {
        const QSignalBlocker blocker(m_fullRangeCheck);
        m_fullRangeCheck->setChecked(full);
    }
    for (const SideWidgets* w : {&m_min, &m_max}) {
        w->down->setEnabled(!full);
        w->up->setEnabled(!full);
    }
    syncTickLabel();
}

void RangePanel::syncTickLabel() {
    const auto bounds = m_range.tickBounds();
    if (!bounds) {
        m_tickLabel->setText(tr("Range invalid"));
        return;
    }
    m_tickLabel->setText(tr("Ticks %1 .. %2 (spacing %3)")
                             .arg(bounds->lowerTick)
                             .arg(bounds->upperTick)
                             .arg(bounds->spacing));
}

void RangePanel::setMatchEnabled(bool enabled) {
    m_matchButton->setEnabled(enabled);
}

void RangePanel::setMatchStatus(const QString& text) {
    m_matchStatus->setText(text);
}

void RangePanel::onPoolChanged(const PoolIdentity& pool) {
    Q_UNUSED(pool);
    m_matchStatus->clear();
    syncFromController();
}
