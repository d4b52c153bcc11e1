#include "SimulationPanel.hpp"

#include <QComboBox>
#include <QFormLayout>
#include <QLabel>
#include <QLineEdit>
#include <QSpinBox>
#include <QVBoxLayout>

namespace {

QString formatUsd(double value) {
    return QStringLiteral("$%1").arg(value, 0, 'f', 2);
}

QString formatAmount(double value, const std::string& symbol) {
    return QStringLiteral("%1 %2").arg(value, 0, 'g', 8).arg(QString::fromStdString(symbol));
}

} // namespace

SimulationPanel::SimulationPanel(RequestOrchestrator& orchestrator, const QString& defaultDeposit, QWidget* parent)
    : DockablePanel("SimulationPanel", tr("Position Simulation"), parent)
    , m_orchestrator(orchestrator)
    , m_defaultDeposit(defaultDeposit)
{
    buildUi();
    m_orchestrator.setDepositUsd(m_defaultDeposit);
    refresh();
}

void SimulationPanel::buildUi() {
    QVBoxLayout* layout = new QVBoxLayout(m_contentWidget);
    layout->setContentsMargins(8, 8, 8, 8);

    QFormLayout* inputs = new QFormLayout();
    m_depositInput = new QLineEdit(m_defaultDeposit, m_contentWidget);
    inputs->addRow(tr("Deposit (USD)"), m_depositInput);

    m_timeframeInput = new QSpinBox(m_contentWidget);
    m_timeframeInput->setRange(RequestOrchestrator::MIN_TIMEFRAME_DAYS, RequestOrchestrator::MAX_TIMEFRAME_DAYS);
    m_timeframeInput->setSuffix(tr(" days"));
    m_timeframeInput->setValue(m_orchestrator.timeframeDays());
    inputs->addRow(tr("Timeframe"), m_timeframeInput);

    m_methodInput = new QComboBox(m_contentWidget);
    m_methodInput->addItem(tr("Average liquidity"), static_cast<int>(CalculationMethod::AverageLiquidity));
    m_methodInput->addItem(tr("Current liquidity"), static_cast<int>(CalculationMethod::CurrentLiquidity));
    m_methodInput->setCurrentIndex(m_methodInput->findData(static_cast<int>(m_orchestrator.calculationMethod())));
    inputs->addRow(tr("Method"), m_methodInput);
    layout->addLayout(inputs);

    QFormLayout* outputs = new QFormLayout();
    m_token0Label = new QLabel("-", m_contentWidget);
    m_token1Label = new QLabel("-", m_contentWidget);
    m_aprLabel = new QLabel("-", m_contentWidget);
    m_monthlyLabel = new QLabel("-", m_contentWidget);
    m_yearlyLabel = new QLabel("-", m_contentWidget);
    m_fees24hLabel = new QLabel("-", m_contentWidget);
    outputs->addRow(tr("Token 0"), m_token0Label);
    outputs->addRow(tr("Token 1"), m_token1Label);
    outputs->addRow(tr("Fee APR"), m_aprLabel);
    outputs->addRow(tr("Monthly"), m_monthlyLabel);
    outputs->addRow(tr("Yearly"), m_yearlyLabel);
    outputs->addRow(tr("Fees (24h)"), m_fees24hLabel);
    layout->addLayout(outputs);

    m_statusLabel = new QLabel(m_contentWidget);
    m_statusLabel->setWordWrap(true);
    m_statusLabel->setStyleSheet("QLabel { color: #888; font-size: 10px; }");
    layout->addWidget(m_statusLabel);
    layout->addStretch();

    connect(m_depositInput, &QLineEdit::textEdited, this, [this](const QString& text) {
        m_orchestrator.setDepositUsd(text);
    });
    connect(m_timeframeInput, qOverload<int>(&QSpinBox::valueChanged), this, [this](int days) {
        m_orchestrator.setTimeframeDays(days);
    });
    connect(m_methodInput, qOverload<int>(&QComboBox::currentIndexChanged), this, [this](int index) {
        m_orchestrator.setCalculationMethod(static_cast<CalculationMethod>(m_methodInput->itemData(index).toInt()));
    });
}

void SimulationPanel::refresh() {
    refreshAllocation();
    refreshApr();

    const auto& allocation = m_orchestrator.allocation();
    const auto& apr = m_orchestrator.aprSimulation();
    if (!allocation.error().isEmpty()) {
        m_statusLabel->setStyleSheet("QLabel { color: #ff4444; font-size: 10px; }");
        m_statusLabel->setText(allocation.error());
    } else if (!apr.error().isEmpty()) {
        m_statusLabel->setStyleSheet("QLabel { color: #ff4444; font-size: 10px; }");
        m_statusLabel->setText(apr.error());
    } else if (allocation.isLoading() || apr.isLoading()) {
        m_statusLabel->setStyleSheet("QLabel { color: #888; font-size: 10px; }");
        m_statusLabel->setText(tr("Calculating..."));
    } else {
        m_statusLabel->clear();
    }
}

void SimulationPanel::refreshAllocation() {
    const auto& data = m_orchestrator.allocation().data();
    if (!data) {
        m_token0Label->setText("-");
        m_token1Label->setText("-");
        return;
    }
    QString t0 = formatAmount(data->amountToken0, data->token0Symbol);
    QString t1 = formatAmount(data->amountToken1, data->token1Symbol);
    if (data->priceToken0Usd) t0 += QStringLiteral(" (%1)").arg(formatUsd(data->amountToken0 * *data->priceToken0Usd));
    if (data->priceToken1Usd) t1 += QStringLiteral(" (%1)").arg(formatUsd(data->amountToken1 * *data->priceToken1Usd));
    m_token0Label->setText(t0);
    m_token1Label->setText(t1);
}

void SimulationPanel::refreshApr() {
    const auto& data = m_orchestrator.aprSimulation().data();
    if (!data) {
        for (QLabel* label : {m_aprLabel, m_monthlyLabel, m_yearlyLabel, m_fees24hLabel}) label->setText("-");
        return;
    }
    m_aprLabel->setText(data->feeApr ? QStringLiteral("%1%").arg(*data->feeApr, 0, 'f', 2) : QStringLiteral("-"));

    QString monthly = data->monthlyUsd ? formatUsd(*data->monthlyUsd) : QStringLiteral("-");
    if (data->monthlyPercent) monthly += QStringLiteral(" (%1%)").arg(*data->monthlyPercent, 0, 'f', 2);
    m_monthlyLabel->setText(monthly);
    m_yearlyLabel->setText(data->yearlyUsd ? formatUsd(*data->yearlyUsd) : QStringLiteral("-"));
    m_fees24hLabel->setText(data->estimatedFees24h ? formatUsd(*data->estimatedFees24h) : QStringLiteral("-"));
}

void SimulationPanel::onPoolChanged(const PoolIdentity& pool) {
    Q_UNUSED(pool);
    refresh();
}
