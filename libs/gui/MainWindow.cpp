#include "MainWindow.hpp"

#include <QCloseEvent>
#include <QMenuBar>
#include <QSettings>
#include <QSplitter>
#include <QStatusBar>

#include "RangeScopeLogging.hpp"
#include "api/HttpPoolApi.hpp"
#include "charts/LiquidityChartWidget.hpp"
#include "charts/PriceHistoryChartWidget.hpp"
#include "charts/VolumeHistoryChartWidget.hpp"
#include "orchestrator/RequestOrchestrator.hpp"
#include "range/RangeController.hpp"
#include "widgets/PoolControlDock.hpp"
#include "widgets/RangePanel.hpp"
#include "widgets/SimulationPanel.hpp"

namespace {

QSettings layoutSettings() {
    return QSettings(QSettings::IniFormat, QSettings::UserScope, "RangeScope", "layout");
}

} // namespace

MainWindow::MainWindow(const AppConfig& config, QWidget* parent)
    : QMainWindow(parent)
    , m_config(config)
{
    m_api = std::make_unique<HttpPoolApi>(m_config.apiBaseUrl, m_config.apiTimeoutMs);
    m_range = std::make_unique<RangeController>();
    m_orchestrator = std::make_unique<RequestOrchestrator>(*m_api, *m_range, m_config.orchestrator);

    setupUI();
    setupMenuBar();
    setupConnections();

    setWindowTitle("RangeScope");
    resize(1400, 900);

    QSettings layout = layoutSettings();
    if (!restoreGeometry(layout.value("window/geometry").toByteArray())
        || !restoreState(layout.value("window/state").toByteArray())) {
        rsLog_App("No saved layout found, using default arrangement");
    }

    rsLog_App("MainWindow ready, API:" << m_config.apiBaseUrl);
}

MainWindow::~MainWindow() {
    // Stop reacting before the orchestrator tears its stages down
    disconnect(m_orchestrator.get(), nullptr, this, nullptr);
    disconnect(m_range.get(), nullptr, this, nullptr);

    // Panels hold references to the range controller and orchestrator
    delete m_rangePanel;
    delete m_simulationPanel;
    delete m_poolDock;
}

void MainWindow::setupUI() {
    setDockOptions(QMainWindow::AllowTabbedDocks | QMainWindow::AnimatedDocks);
    setUpdatesEnabled(false);

    const double minZoomMs = m_config.minZoomSeconds * 1000.0;
    m_liquidityChart = new LiquidityChartWidget(m_config.minZoomTicks, this);
    m_priceChart = new PriceHistoryChartWidget(minZoomMs, this);
    m_volumeChart = new VolumeHistoryChartWidget(minZoomMs, this);

    QSplitter* charts = new QSplitter(Qt::Vertical, this);
    charts->addWidget(m_liquidityChart);
    charts->addWidget(m_priceChart);
    charts->addWidget(m_volumeChart);
    charts->setStretchFactor(0, 3);
    charts->setStretchFactor(1, 2);
    charts->setStretchFactor(2, 2);
    setCentralWidget(charts);

    m_poolDock = new PoolControlDock(this);
    m_rangePanel = new RangePanel(*m_range, this);
    m_simulationPanel = new SimulationPanel(*m_orchestrator, m_config.defaultDeposit, this);

    arrangeDefaultLayout();
    statusBar()->showMessage(tr("Enter a pool address to begin"));
    setUpdatesEnabled(true);
}

void MainWindow::arrangeDefaultLayout() {
    addDockWidget(Qt::TopDockWidgetArea, m_poolDock);
    addDockWidget(Qt::LeftDockWidgetArea, m_rangePanel);
    addDockWidget(Qt::LeftDockWidgetArea, m_simulationPanel);
    m_poolDock->show();
    m_rangePanel->show();
    m_simulationPanel->show();
}

void MainWindow::setupMenuBar() {
    QMenu* viewMenu = menuBar()->addMenu("&View");
    viewMenu->addAction(m_rangePanel->toggleViewAction());
    viewMenu->addAction(m_simulationPanel->toggleViewAction());
    viewMenu->addSeparator();

    QAction* resetZoom = viewMenu->addAction("Reset &Zoom");
    connect(resetZoom, &QAction::triggered, this, [this]() {
        m_liquidityChart->model().viewport().reset();
        m_priceChart->model().viewport().reset();
        m_volumeChart->model().viewport().reset();
    });

    QAction* resetLayout = viewMenu->addAction("Reset &Layout");
    connect(resetLayout, &QAction::triggered, this, [this]() {
        rsLog_App("Resetting layout to default");
        arrangeDefaultLayout();
        QSettings layout = layoutSettings();
        layout.remove("window");
    });
}

void MainWindow::setupConnections() {
    connect(m_poolDock, &PoolControlDock::poolRequested, this, &MainWindow::loadPool);
    connect(m_orchestrator.get(), &RequestOrchestrator::stageChanged, this, &MainWindow::onStageChanged);
    connect(m_orchestrator.get(), &RequestOrchestrator::matchedRangeReady, m_range.get(),
            &RangeController::applyMatchedRange);
    connect(m_range.get(), &RangeController::rangeChanged, this, &MainWindow::onRangeChanged);
    connect(m_range.get(), &RangeController::tickBoundsChanged, this, &MainWindow::onTickBoundsChanged);
    connect(m_rangePanel, &RangePanel::matchTicksRequested, this, &MainWindow::onMatchTicksRequested);
}

void MainWindow::loadPool(const PoolIdentity& pool) {
    if (!pool.isValid()) return;
    rsLog_App("Loading pool" << QString::fromStdString(pool.poolAddress) << "chain" << pool.chainId
              << "dex" << pool.dexId);

    m_liquidityChart->clearDistribution();
    m_priceChart->clearSeries();
    m_volumeChart->clearHistory();

    m_orchestrator->setPool(pool);
    propagatePoolChange(pool);
}

void MainWindow::propagatePoolChange(const PoolIdentity& pool) {
    emit poolChanged(pool);
    for (auto* dock : findChildren<DockablePanel*>()) {
        dock->onPoolChanged(pool);
    }
}

void MainWindow::closeEvent(QCloseEvent* event) {
    QSettings layout = layoutSettings();
    layout.setValue("window/geometry", saveGeometry());
    layout.setValue("window/state", saveState());
    QMainWindow::closeEvent(event);
}

// =============================================================================
// Stage views
// =============================================================================

void MainWindow::onStageChanged(StageId stage) {
    switch (stage) {
        case StageId::Metadata:
            updateMetadataView();
            break;
        case StageId::PoolPrice:
            updatePriceView();
            break;
        case StageId::DefaultRange:
            break;
        case StageId::Distribution:
            updateDistributionView();
            break;
        case StageId::Allocation:
        case StageId::AprSimulation:
            m_simulationPanel->refresh();
            break;
        case StageId::VolumeHistory:
            updateVolumeView();
            break;
        case StageId::MatchTicks:
            updateMatchView();
            break;
    }
}

void MainWindow::updateMetadataView() {
    const auto& stage = m_orchestrator->metadata();
    if (stage.isLoading()) {
        m_poolDock->setStatus(tr("Loading pool..."), false);
    } else if (!stage.error().isEmpty()) {
        m_poolDock->setStatus(stage.error(), true);
        statusBar()->showMessage(stage.error());
    } else if (const auto& meta = stage.data()) {
        const QString pair = QStringLiteral("%1/%2").arg(QString::fromStdString(meta->token0.symbol),
                                                         QString::fromStdString(meta->token1.symbol));
        m_poolDock->setStatus(pair, false);
        m_liquidityChart->setTokenSymbols(QString::fromStdString(meta->token0.symbol),
                                          QString::fromStdString(meta->token1.symbol));
        statusBar()->showMessage(tr("Pool %1, fee tier %2").arg(pair).arg(meta->feeTier.value_or(0)));
    }
    onRangeChanged();
}

void MainWindow::updatePriceView() {
    const auto& stage = m_orchestrator->poolPrice();
    m_priceChart->setLoading(stage.isLoading());
    m_priceChart->setErrorText(stage.error());
    if (stage.data()) {
        m_priceChart->setSeries(*stage.data());
    } else if (!stage.isLoading()) {
        m_priceChart->clearSeries();
    }
}

void MainWindow::updateDistributionView() {
    const auto& stage = m_orchestrator->distribution();
    m_liquidityChart->setLoading(stage.isLoading());
    m_liquidityChart->setErrorText(stage.error());
    if (stage.data()) {
        m_liquidityChart->setDistribution(*stage.data());
    } else if (!stage.isLoading()) {
        m_liquidityChart->clearDistribution();
    }
}

void MainWindow::updateVolumeView() {
    const auto& stage = m_orchestrator->volumeHistory();
    m_volumeChart->setLoading(stage.isLoading());
    m_volumeChart->setErrorText(stage.error());
    if (stage.data()) {
        m_volumeChart->setHistory(*stage.data());
    } else if (!stage.isLoading()) {
        m_volumeChart->clearHistory();
    }
}

void MainWindow::updateMatchView() {
    const auto& stage = m_orchestrator->matchTicksStage();
    if (stage.isLoading()) {
        m_rangePanel->setMatchStatus(tr("Matching ticks..."));
    } else if (!stage.error().isEmpty()) {
        m_rangePanel->setMatchStatus(stage.error());
    } else if (stage.data()) {
        m_rangePanel->setMatchStatus(tr("Range matched to initialized ticks"));
    } else {
        m_rangePanel->setMatchStatus({});
    }
}

void MainWindow::onRangeChanged() {
    const auto range = m_range->resolvedRange();
    m_priceChart->setRange(range);
    m_rangePanel->setMatchEnabled(m_orchestrator->metadata().data().has_value() && range && !range->fullRange);
}

void MainWindow::onTickBoundsChanged() {
    m_liquidityChart->setTickBounds(m_range->tickBounds());
}

void MainWindow::onMatchTicksRequested() {
    if (!m_orchestrator->matchTicks()) {
        m_rangePanel->setMatchStatus(tr("Set a valid custom range first"));
    }
}
