/*
RangeScope — RangePanel
Role: Min/max price inputs, tick steppers, full-range toggle and tick matching for the active pool.
Inputs/Outputs: User edits in; RangeController calls out; mirrors RangeController state back into the inputs.
Threading: Main GUI thread.
Performance: Inputs are rewritten only when the controller text differs from what is shown.
Integration: Docked by MainWindow; the Match button calls RequestOrchestrator::matchTicks.
Observability: None beyond the controller's own logging.
Related: RangePanel.cpp, RangeController.hpp.
Assumptions: Focus-in marks the start of an edit session; editingFinished commits it.
*/
#pragma once

#include "DockablePanel.hpp"
#include "range/RangeController.hpp"

class QCheckBox;
class QGridLayout;
class QLabel;
class QLineEdit;
class QPushButton;

class RangePanel : public DockablePanel {
    Q_OBJECT

public:
    explicit RangePanel(RangeController& range, QWidget* parent = nullptr);
    ~RangePanel() override = default;

    void buildUi() override;
    void onPoolChanged(const PoolIdentity& pool) override;

    void setMatchEnabled(bool enabled);
    void setMatchStatus(const QString& text);

signals:
    void matchTicksRequested();

protected:
    bool eventFilter(QObject* watched, QEvent* event) override;

private:
    struct SideWidgets {
        QLineEdit* input = nullptr;
        QPushButton* down = nullptr;
        QPushButton* up = nullptr;
    };

    SideWidgets buildSide(const QString& label, RangeController::Side side, QGridLayout* grid, int row);
    QLineEdit* inputFor(RangeController::Side side) const;
    void syncFromController();
    void syncTickLabel();

    RangeController& m_range;
    SideWidgets m_min;
    SideWidgets m_max;
    QCheckBox* m_fullRangeCheck = nullptr;
    QPushButton* m_matchButton = nullptr;
    QLabel* m_tickLabel = nullptr;
    QLabel* m_matchStatus = nullptr;
};
