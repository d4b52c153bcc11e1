#pragma once

#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include "TickMath.hpp"

// =============================================================================
// Pool identity and parameters
// =============================================================================

struct PoolIdentity {
    std::string poolAddress;
    int64_t chainId = 0;
    int64_t dexId = 0;

    bool isValid() const { return !poolAddress.empty(); }
    bool operator==(const PoolIdentity&) const = default;
};

// Missing values fall back to TickMath defaults (fee tier 3000, decimals 18/6)
struct PoolParameters {
    std::optional<int> feeTier;
    std::optional<int> token0Decimals;
    std::optional<int> token1Decimals;

    int32_t tickSpacing() const {
        return TickMath::tickSpacingForFeeTier(feeTier.value_or(TickMath::DEFAULT_FEE_TIER));
    }
    double decimalAdjust() const {
        return TickMath::decimalAdjustFor(token0Decimals.value_or(TickMath::DEFAULT_TOKEN0_DECIMALS),
                                          token1Decimals.value_or(TickMath::DEFAULT_TOKEN1_DECIMALS));
    }
    bool operator==(const PoolParameters&) const = default;
};

// Numeric form of the user range; (0, +inf) while full range is active
struct ResolvedRange {
    double minPrice = 0.0;
    double maxPrice = std::numeric_limits<double>::infinity();
    bool fullRange = true;

    bool operator==(const ResolvedRange&) const = default;
};

enum class CalculationMethod {
    AverageLiquidity,   // Liquidity averaged over the horizon
    CurrentLiquidity    // Liquidity snapshot at the current tick
};

inline const char* toWireString(CalculationMethod method) {
    switch (method) {
        case CalculationMethod::AverageLiquidity: return "average_liquidity";
        case CalculationMethod::CurrentLiquidity: return "current_liquidity";
    }
    return "average_liquidity";
}

// =============================================================================
// Request keys: every input a stage depends on, compared structurally
// =============================================================================

struct PoolPriceRequest {
    PoolIdentity pool;
    int timeframeDays = 14;
    bool operator==(const PoolPriceRequest&) const = default;
};

struct DefaultRangeRequest {
    PoolIdentity pool;
    double initialPrice = 0.0;
    std::string preset;
    bool operator==(const DefaultRangeRequest&) const = default;
};

struct DistributionRequest {
    PoolIdentity pool;
    std::string poolId;
    ResolvedRange range;
    int tickWindow = 6000;
    std::string snapshotDate;   // YYYY-MM-DD
    bool operator==(const DistributionRequest&) const = default;
};

struct AllocationRequest {
    PoolIdentity pool;
    double depositUsd = 0.0;
    ResolvedRange range;
    bool operator==(const AllocationRequest&) const = default;
};

struct AprSimulationRequest {
    AllocationRequest allocation;
    int32_t tickLower = TickMath::MIN_TICK;
    int32_t tickUpper = TickMath::MAX_TICK;
    int horizonDays = 14;
    CalculationMethod method = CalculationMethod::AverageLiquidity;
    double amountToken0 = 0.0;
    double amountToken1 = 0.0;
    bool operator==(const AprSimulationRequest&) const = default;
};

struct VolumeHistoryRequest {
    PoolIdentity pool;
    int days = 14;
    std::string symbol0;
    std::string symbol1;
    bool operator==(const VolumeHistoryRequest&) const = default;
};

struct MatchTicksRequest {
    PoolIdentity pool;
    std::string poolId;
    double minPrice = 0.0;
    double maxPrice = 0.0;
    bool operator==(const MatchTicksRequest&) const = default;
};

// =============================================================================
// Responses
// =============================================================================

struct TokenInfo {
    std::string symbol;
    std::string address;
    std::optional<int> decimals;
};

struct PoolMetadata {
    std::string poolId;
    std::optional<int> feeTier;
    TokenInfo token0;
    TokenInfo token1;

    PoolParameters parameters() const { return {feeTier, token0.decimals, token1.decimals}; }
};

struct PricePoint {
    int64_t timestampMs = 0;
    double price = 0.0;
};

struct PriceStats {
    std::optional<double> min;
    std::optional<double> avg;
    std::optional<double> max;
    std::optional<double> price;   // current
};

struct PriceSeries {
    std::vector<PricePoint> points;   // ascending timestamps
    PriceStats stats;
};

struct DefaultRange {
    double minPrice = 0.0;
    double maxPrice = 0.0;
    std::optional<int32_t> tickSpacing;
};

struct LiquidityBar {
    int32_t tick = 0;
    double liquidity = 0.0;
    std::optional<double> price;
};

struct LiquidityDistribution {
    std::vector<LiquidityBar> bars;   // ascending ticks
    std::optional<int32_t> currentTick;
};

struct AllocationResult {
    double amountToken0 = 0.0;
    double amountToken1 = 0.0;
    std::optional<double> priceToken0Usd;
    std::optional<double> priceToken1Usd;
    std::string token0Symbol;
    std::string token1Symbol;
};

struct AprSimulationResult {
    std::optional<double> feeApr;
    std::optional<double> monthlyUsd;
    std::optional<double> monthlyPercent;
    std::optional<double> yearlyUsd;
    std::optional<double> estimatedFees24h;
};

struct MatchedRange {
    double minPrice = 0.0;
    double maxPrice = 0.0;
    std::optional<double> currentPrice;
};
