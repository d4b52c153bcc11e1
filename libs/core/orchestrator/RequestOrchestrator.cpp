#include "RequestOrchestrator.hpp"

#include <QDateTime>
#include <algorithm>
#include <cmath>

#include "RangeScopeLogging.hpp"
#include "ValueParsing.hpp"
#include "range/RangeController.hpp"

const char* stageName(StageId stage) {
    switch (stage) {
        case StageId::Metadata:      return "metadata";
        case StageId::PoolPrice:     return "pool-price";
        case StageId::DefaultRange:  return "default-range";
        case StageId::Distribution:  return "distribution";
        case StageId::Allocation:    return "allocation";
        case StageId::AprSimulation: return "apr-simulation";
        case StageId::VolumeHistory: return "volume-history";
        case StageId::MatchTicks:    return "match-ticks";
    }
    return "unknown";
}

RequestOrchestrator::RequestOrchestrator(PoolApi& api, RangeController& range, OrchestratorSettings settings,
                                         QObject* parent)
    : QObject(parent)
    , m_api(api)
    , m_range(range)
    , m_settings(std::move(settings)) {
    m_timeframeDays = std::clamp(m_settings.timeframeDays, MIN_TIMEFRAME_DAYS, MAX_TIMEFRAME_DAYS);
    m_method = m_settings.calculationMethod;
    createStages();

    connect(&m_range, &RangeController::rangeChanged, this, [this]() {
        refreshDistribution();
        refreshAllocation();
    });
    connect(&m_range, &RangeController::tickBoundsChanged, this, [this]() { refreshApr(); });
}

RequestOrchestrator::~RequestOrchestrator() {
    // In-flight calls are aborted by the stage destructors
    m_matchTicks.reset();
    m_volume.reset();
    m_apr.reset();
    m_allocation.reset();
    m_distribution.reset();
    m_defaultRange.reset();
    m_price.reset();
    m_metadata.reset();
}

void RequestOrchestrator::createStages() {
    auto changed = [this](StageId id) {
        return [this, id]() { emit stageChanged(id); };
    };

    m_metadata = std::make_unique<MetadataStage>(
        "metadata", 0,
        [this](const PoolIdentity& pool, ApiCallback<PoolMetadata> cb) {
            return m_api.fetchPoolMetadata(pool, std::move(cb));
        },
        changed(StageId::Metadata));
    m_metadata->onSuccess([this](const PoolIdentity&, const PoolMetadata& meta) { onMetadataReady(meta); });
    m_metadata->onSettled([this](const PoolIdentity&) { refreshVolume(); });

    m_price = std::make_unique<PriceStage>(
        "pool-price", 0,
        [this](const PoolPriceRequest& req, ApiCallback<PriceSeries> cb) {
            return m_api.fetchPoolPrice(req, std::move(cb));
        },
        changed(StageId::PoolPrice));
    m_price->onSuccess([this](const PoolPriceRequest&, const PriceSeries& series) { onPriceReady(series); });

    m_defaultRange = std::make_unique<DefaultRangeStage>(
        "default-range", 0,
        [this](const DefaultRangeRequest& req, ApiCallback<DefaultRange> cb) {
            return m_api.fetchDefaultRange(req, std::move(cb));
        },
        changed(StageId::DefaultRange));
    m_defaultRange->onSuccess([this](const DefaultRangeRequest&, const DefaultRange& range) {
        onDefaultRangeReady(range);
    });

    m_distribution = std::make_unique<DistributionStage>(
        "distribution", m_settings.distributionDebounceMs,
        [this](const DistributionRequest& req, ApiCallback<LiquidityDistribution> cb) {
            return m_api.fetchLiquidityDistribution(req, std::move(cb));
        },
        changed(StageId::Distribution));

    m_allocation = std::make_unique<AllocationStage>(
        "allocation", m_settings.allocationDebounceMs,
        [this](const AllocationRequest& req, ApiCallback<AllocationResult> cb) {
            return m_api.fetchAllocation(req, std::move(cb));
        },
        changed(StageId::Allocation));
    m_allocation->onSuccess([this](const AllocationRequest& key, const AllocationResult&) {
        onAllocationReady(key);
    });

    m_apr = std::make_unique<AprStage>(
        "apr-simulation", m_settings.aprDebounceMs,
        [this](const AprSimulationRequest& req, ApiCallback<AprSimulationResult> cb) {
            return m_api.simulateApr(req, std::move(cb));
        },
        changed(StageId::AprSimulation));
    m_apr->onSuccess([this](const AprSimulationRequest& key, const AprSimulationResult&) {
        m_lastComputedApr = key;
    });

    m_volume = std::make_unique<VolumeStage>(
        "volume-history", 0,
        [this](const VolumeHistoryRequest& req, ApiCallback<VolumeHistory> cb) {
            return m_api.fetchVolumeHistory(req, std::move(cb));
        },
        changed(StageId::VolumeHistory));

    m_matchTicks = std::make_unique<MatchTicksStage>(
        "match-ticks", 0,
        [this](const MatchTicksRequest& req, ApiCallback<MatchedRange> cb) {
            return m_api.matchTicks(req, std::move(cb));
        },
        changed(StageId::MatchTicks));
    m_matchTicks->onSuccess([this](const MatchTicksRequest& key, const MatchedRange& matched) {
        onMatchedRange(key, matched);
    });
}

// =============================================================================
// Inputs
// =============================================================================

void RequestOrchestrator::setPool(const PoolIdentity& pool) {
    if (pool == m_pool) return;

    rsLog_Data("Pool session" << QString::fromStdString(pool.poolAddress) << "chain" << pool.chainId
               << "dex" << pool.dexId);
    m_pool = pool;
    resetSession();

    // Clears the range and its touched flag; RangeController re-emits rangeChanged
    m_range.beginPoolSession(PoolParameters{});

    if (!m_pool.isValid()) return;
    m_metadata->trigger(m_pool);
    refreshPrice();
}

void RequestOrchestrator::resetSession() {
    m_defaultRangeRequested = false;
    m_lastAcceptedAllocation.reset();
    m_lastComputedApr.reset();

    m_metadata->reset();
    m_price->reset();
    m_defaultRange->reset();
    m_distribution->reset();
    m_allocation->reset();
    m_apr->reset();
    m_volume->reset();
    m_matchTicks->reset();
}

void RequestOrchestrator::setDepositUsd(const QString& text) {
    if (text == m_depositText) return;
    m_depositText = text;
    refreshAllocation();
}

void RequestOrchestrator::setTimeframeDays(int days) {
    const int clamped = std::clamp(days, MIN_TIMEFRAME_DAYS, MAX_TIMEFRAME_DAYS);
    if (clamped == m_timeframeDays) return;
    m_timeframeDays = clamped;
    refreshPrice();
    refreshVolume();
    refreshApr();
}

void RequestOrchestrator::setCalculationMethod(CalculationMethod method) {
    if (method == m_method) return;
    m_method = method;
    refreshApr();
}

void RequestOrchestrator::setSnapshotDateProvider(std::function<std::string()> provider) {
    m_snapshotDateProvider = std::move(provider);
}

bool RequestOrchestrator::matchTicks() {
    const auto& meta = m_metadata->data();
    const auto range = m_range.resolvedRange();
    if (!m_pool.isValid() || !meta || !range || range->fullRange) {
        rsLog_Data("Match ticks unavailable: needs pool metadata and a custom range");
        return false;
    }
    m_matchTicks->trigger(MatchTicksRequest{m_pool, meta->poolId, range->minPrice, range->maxPrice});
    return true;
}

// =============================================================================
// Keys
// =============================================================================

std::optional<double> RequestOrchestrator::depositValue() const {
    const auto value = ValueParsing::parseDecimal(m_depositText.toStdString());
    if (!value || *value <= 0.0) return std::nullopt;
    return value;
}

std::string RequestOrchestrator::snapshotDate() const {
    if (m_snapshotDateProvider) return m_snapshotDateProvider();
    return QDateTime::currentDateTimeUtc().date().toString(Qt::ISODate).toStdString();
}

std::optional<DistributionRequest> RequestOrchestrator::currentDistributionKey() const {
    const auto& meta = m_metadata->data();
    const auto range = m_range.resolvedRange();
    if (!m_pool.isValid() || !meta || !range) return std::nullopt;
    return DistributionRequest{m_pool, meta->poolId, *range, m_settings.tickWindow, snapshotDate()};
}

std::optional<AllocationRequest> RequestOrchestrator::currentAllocationKey() const {
    const auto deposit = depositValue();
    const auto range = m_range.resolvedRange();
    if (!m_pool.isValid() || !deposit || !range) return std::nullopt;
    return AllocationRequest{m_pool, *deposit, *range};
}

std::optional<AprSimulationRequest> RequestOrchestrator::currentAprKey() const {
    const auto allocationKey = currentAllocationKey();
    if (!allocationKey || !m_lastAcceptedAllocation || *m_lastAcceptedAllocation != *allocationKey) {
        return std::nullopt;
    }
    const auto& allocation = m_allocation->data();
    const auto bounds = m_range.tickBounds();
    if (!allocation || !bounds) return std::nullopt;

    AprSimulationRequest key;
    key.allocation = *allocationKey;
    key.tickLower = bounds->lowerTick;
    key.tickUpper = bounds->upperTick;
    key.horizonDays = m_timeframeDays;
    key.method = m_method;
    key.amountToken0 = allocation->amountToken0;
    key.amountToken1 = allocation->amountToken1;
    return key;
}

// =============================================================================
// Stage refresh
// =============================================================================

void RequestOrchestrator::refreshPrice() {
    if (!m_pool.isValid()) return;
    m_price->trigger(PoolPriceRequest{m_pool, m_timeframeDays});
}

void RequestOrchestrator::refreshVolume() {
    if (!m_pool.isValid() || !m_metadata->settledKey()) return;
    VolumeHistoryRequest req{m_pool, m_timeframeDays, {}, {}};
    if (const auto& meta = m_metadata->data()) {
        req.symbol0 = meta->token0.symbol;
        req.symbol1 = meta->token1.symbol;
    }
    m_volume->trigger(req);
}

void RequestOrchestrator::refreshDistribution() {
    const auto key = currentDistributionKey();
    if (!key) {
        // Keep the last chart while the range is being typed
        m_distribution->cancel();
        return;
    }
    m_distribution->trigger(*key);
}

void RequestOrchestrator::refreshAllocation() {
    const auto key = currentAllocationKey();
    if (!key) {
        m_allocation->reset();
        refreshApr();
        return;
    }

    const auto& settled = m_allocation->settledKey();
    if (settled && *settled != *key) {
        m_allocation->invalidate();
    }
    m_allocation->trigger(*key);
    refreshApr();
}

void RequestOrchestrator::refreshApr() {
    const auto key = currentAprKey();
    if (!key) {
        m_apr->cancel();
        // The shown estimate belongs to an allocation that is no longer current
        const auto& settled = m_apr->settledKey();
        const auto allocationKey = currentAllocationKey();
        if (settled && (!allocationKey || settled->allocation != *allocationKey)) {
            m_apr->invalidate();
        }
        return;
    }
    m_apr->trigger(*key);
}

// =============================================================================
// Completions
// =============================================================================

void RequestOrchestrator::onMetadataReady(const PoolMetadata& meta) {
    rsLog_Data("Pool metadata" << QString::fromStdString(meta.token0.symbol) << "/"
               << QString::fromStdString(meta.token1.symbol) << "fee tier" << meta.feeTier.value_or(-1));
    m_range.setPoolParameters(meta.parameters());
    refreshDistribution();
}

void RequestOrchestrator::onPriceReady(const PriceSeries& series) {
    if (m_defaultRangeRequested) return;

    std::optional<double> initialPrice = series.stats.price;
    if (!initialPrice && !series.points.empty()) initialPrice = series.points.back().price;
    if (!initialPrice || *initialPrice <= 0.0) return;

    m_defaultRangeRequested = true;
    rsLog_Data("Requesting default range around" << *initialPrice);
    m_defaultRange->trigger(DefaultRangeRequest{m_pool, *initialPrice, m_settings.defaultRangePreset});
}

void RequestOrchestrator::onDefaultRangeReady(const DefaultRange& range) {
    const bool seeded = m_range.trySeedDefaultRange(range.minPrice, range.maxPrice);
    rsLog_Data("Default range" << range.minPrice << range.maxPrice << (seeded ? "seeded" : "ignored"));
}

void RequestOrchestrator::onAllocationReady(const AllocationRequest& key) {
    m_lastAcceptedAllocation = key;
    refreshApr();
}

void RequestOrchestrator::onMatchedRange(const MatchTicksRequest& key, const MatchedRange& matched) {
    const auto current = m_range.resolvedRange();
    if (!current || current->fullRange || current->minPrice != key.minPrice || current->maxPrice != key.maxPrice) {
        rsLog_Data("Matched ticks dropped: range changed while matching");
        return;
    }
    emit matchedRangeReady(matched.minPrice, matched.maxPrice);
}
