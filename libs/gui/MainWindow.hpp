/*
RangeScope — MainWindow
Role: Main QWidget-based window hosting the three charts and the range, simulation and pool docks.
Inputs/Outputs: AppConfig and an optional initial pool in; forwards UI input to the range controller and orchestrator.
Threading: Runs on the main GUI thread; network completions arrive through the event loop.
Performance: UI setup is a one-time cost; widgets repaint on stage changes only.
Integration: Instantiated in main.cpp; owns the HttpPoolApi, RangeController and RequestOrchestrator.
Observability: Logs lifecycle and pool switches via rsLog_App.
Related: MainWindow.cpp, RequestOrchestrator.hpp, RangeController.hpp, charts/*.hpp, widgets/*.hpp.
Assumptions: The API outlives the orchestrator so aborts during teardown reach live replies.
*/
#pragma once

#include <QMainWindow>
#include <memory>

#include "AppConfig.hpp"
#include "orchestrator/RequestOrchestrator.hpp"
#include "pool/PoolTypes.hpp"

class QCloseEvent;
class HttpPoolApi;
class RangeController;
class LiquidityChartWidget;
class PriceHistoryChartWidget;
class VolumeHistoryChartWidget;
class PoolControlDock;
class RangePanel;
class SimulationPanel;

class MainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit MainWindow(const AppConfig& config, QWidget* parent = nullptr);
    ~MainWindow() override;

    void loadPool(const PoolIdentity& pool);

signals:
    /**
     * Emitted when the active pool changes.
     * Dock panels receive it through DockablePanel::onPoolChanged.
     */
    void poolChanged(const PoolIdentity& pool);

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onStageChanged(StageId stage);
    void onRangeChanged();
    void onTickBoundsChanged();
    void onMatchTicksRequested();

private:
    void setupUI();
    void setupMenuBar();
    void setupConnections();
    void arrangeDefaultLayout();
    void propagatePoolChange(const PoolIdentity& pool);

    void updateMetadataView();
    void updatePriceView();
    void updateDistributionView();
    void updateVolumeView();
    void updateMatchView();

    AppConfig m_config;

    // Declaration order is destruction order in reverse: orchestrator first, API last
    std::unique_ptr<HttpPoolApi> m_api;
    std::unique_ptr<RangeController> m_range;
    std::unique_ptr<RequestOrchestrator> m_orchestrator;

    LiquidityChartWidget* m_liquidityChart = nullptr;
    PriceHistoryChartWidget* m_priceChart = nullptr;
    VolumeHistoryChartWidget* m_volumeChart = nullptr;

    PoolControlDock* m_poolDock = nullptr;
    RangePanel* m_rangePanel = nullptr;
    SimulationPanel* m_simulationPanel = nullptr;
};
