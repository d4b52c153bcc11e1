/*
RangeScope — RequestOrchestrator
Role: Sequences the dependent backend stages of a pool session and keeps them consistent under rapid input.
Inputs/Outputs: Pool identity, deposit, timeframe, calculation method and RangeController signals in;
                per-stage {data, loading, error} and stageChanged/matchedRangeReady signals out.
Threading: Main GUI thread; network completions arrive through the event loop.
Performance: Distribution, allocation and APR stages are trailing-debounced; superseded calls are aborted.
Integration: Owned by MainWindow with an injected PoolApi; reads RangeController, seeds it once per pool.
Observability: Stage transitions logged via rsLog_Data; failures via rsLog_Warning.
Related: RequestStage.hpp, RangeController.hpp, PoolApi.hpp.
Assumptions: Every stage receives an immutable request value captured when it is triggered.
*/
#pragma once

#include <QObject>
#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "api/PoolApi.hpp"
#include "orchestrator/RequestStage.hpp"
#include "pool/PoolTypes.hpp"

class RangeController;

enum class StageId {
    Metadata,
    PoolPrice,
    DefaultRange,
    Distribution,
    Allocation,
    AprSimulation,
    VolumeHistory,
    MatchTicks
};

const char* stageName(StageId stage);

struct OrchestratorSettings {
    int distributionDebounceMs = 350;
    int allocationDebounceMs = 400;
    int aprDebounceMs = 400;
    int tickWindow = 6000;
    std::string defaultRangePreset = "most_ticks";
    int timeframeDays = 14;
    CalculationMethod calculationMethod = CalculationMethod::AverageLiquidity;
};

class RequestOrchestrator : public QObject {
    Q_OBJECT

public:
    static constexpr int MIN_TIMEFRAME_DAYS = 1;
    static constexpr int MAX_TIMEFRAME_DAYS = 365;

    using MetadataStage = RequestStage<PoolIdentity, PoolMetadata>;
    using PriceStage = RequestStage<PoolPriceRequest, PriceSeries>;
    using DefaultRangeStage = RequestStage<DefaultRangeRequest, DefaultRange>;
    using DistributionStage = RequestStage<DistributionRequest, LiquidityDistribution>;
    using AllocationStage = RequestStage<AllocationRequest, AllocationResult>;
    using AprStage = RequestStage<AprSimulationRequest, AprSimulationResult>;
    using VolumeStage = RequestStage<VolumeHistoryRequest, VolumeHistory>;
    using MatchTicksStage = RequestStage<MatchTicksRequest, MatchedRange>;

    RequestOrchestrator(PoolApi& api, RangeController& range, OrchestratorSettings settings = {},
                        QObject* parent = nullptr);
    ~RequestOrchestrator() override;

    // Inputs
    void setPool(const PoolIdentity& pool);
    void setDepositUsd(const QString& text);
    void setTimeframeDays(int days);
    void setCalculationMethod(CalculationMethod method);
    void setSnapshotDateProvider(std::function<std::string()> provider);

    // Server-side snapping of the current custom range
    bool matchTicks();

    const PoolIdentity& pool() const { return m_pool; }
    const QString& depositText() const { return m_depositText; }
    int timeframeDays() const { return m_timeframeDays; }
    CalculationMethod calculationMethod() const { return m_method; }
    const OrchestratorSettings& settings() const { return m_settings; }

    // Reactive read access
    const MetadataStage& metadata() const { return *m_metadata; }
    const PriceStage& poolPrice() const { return *m_price; }
    const DefaultRangeStage& defaultRange() const { return *m_defaultRange; }
    const DistributionStage& distribution() const { return *m_distribution; }
    const AllocationStage& allocation() const { return *m_allocation; }
    const AprStage& aprSimulation() const { return *m_apr; }
    const VolumeStage& volumeHistory() const { return *m_volume; }
    const MatchTicksStage& matchTicksStage() const { return *m_matchTicks; }

    // Keys derived from the current inputs
    std::optional<DistributionRequest> currentDistributionKey() const;
    std::optional<AllocationRequest> currentAllocationKey() const;
    std::optional<AprSimulationRequest> currentAprKey() const;
    const std::optional<AllocationRequest>& lastAcceptedAllocationKey() const { return m_lastAcceptedAllocation; }
    const std::optional<AprSimulationRequest>& lastComputedAprKey() const { return m_lastComputedApr; }

signals:
    void stageChanged(StageId stage);
    void matchedRangeReady(double minPrice, double maxPrice);

private:
    void createStages();
    void resetSession();

    void refreshPrice();
    void refreshVolume();
    void refreshDistribution();
    void refreshAllocation();
    void refreshApr();

    void onMetadataReady(const PoolMetadata& meta);
    void onPriceReady(const PriceSeries& series);
    void onDefaultRangeReady(const DefaultRange& range);
    void onAllocationReady(const AllocationRequest& key);
    void onMatchedRange(const MatchTicksRequest& key, const MatchedRange& matched);

    std::optional<double> depositValue() const;
    std::string snapshotDate() const;

    PoolApi& m_api;
    RangeController& m_range;
    OrchestratorSettings m_settings;

    PoolIdentity m_pool;
    QString m_depositText;
    int m_timeframeDays = 14;
    CalculationMethod m_method = CalculationMethod::AverageLiquidity;
    std::function<std::string()> m_snapshotDateProvider;

    bool m_defaultRangeRequested = false;
    std::optional<AllocationRequest> m_lastAcceptedAllocation;
    std::optional<AprSimulationRequest> m_lastComputedApr;

    std::unique_ptr<MetadataStage> m_metadata;
    std::unique_ptr<PriceStage> m_price;
    std::unique_ptr<DefaultRangeStage> m_defaultRange;
    std::unique_ptr<DistributionStage> m_distribution;
    std::unique_ptr<AllocationStage> m_allocation;
    std::unique_ptr<AprStage> m_apr;
    std::unique_ptr<VolumeStage> m_volume;
    std::unique_ptr<MatchTicksStage> m_matchTicks;
};
