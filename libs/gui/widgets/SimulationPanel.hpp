#pragma once

#include "DockablePanel.hpp"
#include "orchestrator/RequestOrchestrator.hpp"

class QComboBox;
class QLabel;
class QLineEdit;
class QSpinBox;

/**
 * Deposit, timeframe and method inputs with the token split and fee APR outputs.
 * Reads allocation and APR stage state from the orchestrator on every refresh().
 */
class SimulationPanel : public DockablePanel {
    Q_OBJECT

public:
    SimulationPanel(RequestOrchestrator& orchestrator, const QString& defaultDeposit, QWidget* parent = nullptr);
    ~SimulationPanel() override = default;

    void buildUi() override;
    void onPoolChanged(const PoolIdentity& pool) override;

    // Re-reads the allocation and APR stages
    void refresh();

private:
    void refreshAllocation();
    void refreshApr();

    RequestOrchestrator& m_orchestrator;
    QString m_defaultDeposit;

    QLineEdit* m_depositInput = nullptr;
    QSpinBox* m_timeframeInput = nullptr;
    QComboBox* m_methodInput = nullptr;

    QLabel* m_token0Label = nullptr;
    QLabel* m_token1Label = nullptr;
    QLabel* m_aprLabel = nullptr;
    QLabel* m_monthlyLabel = nullptr;
    QLabel* m_yearlyLabel = nullptr;
    QLabel* m_fees24hLabel = nullptr;
    QLabel* m_statusLabel = nullptr;
};
