#include "PoolWire.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include "ValueParsing.hpp"

using nlohmann::json;

namespace PoolWire {

namespace {

const json& requireObject(const json& j, const char* what) {
    if (!j.is_object()) {
        throw std::runtime_error(std::string(what) + ": expected a JSON object");
    }
    return j;
}

double requireNumber(const json& obj, const char* key, const char* what) {
    const auto v = numberField(obj, key);
    if (!v) {
        throw std::runtime_error(std::string(what) + ": missing or invalid '" + key + "'");
    }
    return *v;
}

// Pool ids are numeric on the backend but travel as strings internally
json poolIdJson(const std::string& poolId) {
    const bool numeric = !poolId.empty() &&
        std::all_of(poolId.begin(), poolId.end(), [](char c) { return c >= '0' && c <= '9'; });
    if (numeric && poolId.size() < 19) {
        return std::stoll(poolId);
    }
    return poolId;
}

json boundOrNull(double value, bool fullRange) {
    if (fullRange || !std::isfinite(value)) return nullptr;
    return value;
}

std::optional<int64_t> timestampField(const json& obj, const char* key) {
    if (!obj.contains(key)) return std::nullopt;
    const json& v = obj[key];
    if (v.is_number()) {
        return ValueParsing::epochMsFromNumber(v.get<double>());
    }
    if (v.is_string()) {
        return ValueParsing::parseTimestampMs(v.get<std::string>());
    }
    return std::nullopt;
}

int64_t floorDiv(int64_t value, int64_t divisor) {
    int64_t q = value / divisor;
    if (value % divisor < 0) --q;
    return q;
}

} // namespace

// =============================================================================
// Tolerant field access
// =============================================================================

std::optional<double> toNumber(const json& value) {
    if (value.is_number()) {
        const double v = value.get<double>();
        if (!std::isfinite(v)) return std::nullopt;
        return v;
    }
    if (value.is_string()) {
        return ValueParsing::parseDecimal(value.get<std::string>());
    }
    return std::nullopt;
}

std::optional<double> numberField(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return std::nullopt;
    return toNumber(obj[key]);
}

std::optional<int> intField(const json& obj, const char* key) {
    const auto v = numberField(obj, key);
    if (!v) return std::nullopt;
    return ValueParsing::roundToInt32(*v);
}

std::string stringField(const json& obj, const char* key) {
    if (!obj.is_object() || !obj.contains(key)) return {};
    const json& v = obj[key];
    if (v.is_string()) return v.get<std::string>();
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    return {};
}

// =============================================================================
// Request bodies
// =============================================================================

json distributionBody(const DistributionRequest& req) {
    return json{
        {"pool_id", poolIdJson(req.poolId)},
        {"snapshot_date", req.snapshotDate},
        {"current_tick", 0},
        {"tick_range", req.tickWindow},
        {"range_min", boundOrNull(req.range.minPrice, req.range.fullRange)},
        {"range_max", boundOrNull(req.range.maxPrice, req.range.fullRange)},
    };
}

json allocationBody(const AllocationRequest& req) {
    return json{
        {"pool_address", req.pool.poolAddress},
        {"chain_id", req.pool.chainId},
        {"dex_id", req.pool.dexId},
        {"amount", req.depositUsd},
        {"range1", boundOrNull(req.range.minPrice, req.range.fullRange)},
        {"range2", boundOrNull(req.range.maxPrice, req.range.fullRange)},
        {"full_range", req.range.fullRange},
    };
}

json aprSimulationBody(const AprSimulationRequest& req) {
    const AllocationRequest& alloc = req.allocation;
    return json{
        {"pool_address", alloc.pool.poolAddress},
        {"chain_id", alloc.pool.chainId},
        {"dex_id", alloc.pool.dexId},
        {"tick_lower", req.tickLower},
        {"tick_upper", req.tickUpper},
        {"min_price", boundOrNull(alloc.range.minPrice, alloc.range.fullRange)},
        {"max_price", boundOrNull(alloc.range.maxPrice, alloc.range.fullRange)},
        {"full_range", alloc.range.fullRange},
        {"days", req.horizonDays},
        {"calculation_method", toWireString(req.method)},
        {"deposit_usd", alloc.depositUsd},
        {"amount_token0", req.amountToken0},
        {"amount_token1", req.amountToken1},
    };
}

json matchTicksBody(const MatchTicksRequest& req) {
    return json{
        {"pool_id", poolIdJson(req.poolId)},
        {"min_price", req.minPrice},
        {"max_price", req.maxPrice},
    };
}

// =============================================================================
// Responses
// =============================================================================

PoolMetadata parsePoolMetadata(const json& j) {
    requireObject(j, "pool metadata");

    PoolMetadata meta;
    meta.poolId = stringField(j, "id");
    if (meta.poolId.empty()) {
        throw std::runtime_error("pool metadata: missing 'id'");
    }
    meta.feeTier = intField(j, "fee_tier");
    meta.token0.symbol = stringField(j, "token0_symbol");
    meta.token0.address = stringField(j, "token0_address");
    meta.token0.decimals = intField(j, "token0_decimals");
    meta.token1.symbol = stringField(j, "token1_symbol");
    meta.token1.address = stringField(j, "token1_address");
    meta.token1.decimals = intField(j, "token1_decimals");
    return meta;
}

PriceSeries parsePriceSeries(const json& j) {
    requireObject(j, "pool price");

    PriceSeries out;
    if (j.contains("series") && j["series"].is_array()) {
        for (const auto& item : j["series"]) {
            if (!item.is_object()) continue;
            const auto ts = timestampField(item, "timestamp");
            const auto price = numberField(item, "price");
            if (!ts || !price) continue;
            out.points.push_back(PricePoint{*ts, *price});
        }
    }
    std::stable_sort(out.points.begin(), out.points.end(),
                     [](const PricePoint& a, const PricePoint& b) { return a.timestampMs < b.timestampMs; });

    if (j.contains("stats") && j["stats"].is_object()) {
        const json& stats = j["stats"];
        out.stats.min = numberField(stats, "min");
        out.stats.avg = numberField(stats, "avg");
        out.stats.max = numberField(stats, "max");
        out.stats.price = numberField(stats, "price");
    }
    return out;
}

DefaultRange parseDefaultRange(const json& j) {
    requireObject(j, "default range");

    DefaultRange out;
    out.minPrice = requireNumber(j, "min_price", "default range");
    out.maxPrice = requireNumber(j, "max_price", "default range");
    if (const auto spacing = intField(j, "tick_spacing")) {
        out.tickSpacing = *spacing;
    }
    if (out.minPrice > out.maxPrice) std::swap(out.minPrice, out.maxPrice);
    return out;
}

LiquidityDistribution parseLiquidityDistribution(const json& j) {
    requireObject(j, "liquidity distribution");

    LiquidityDistribution out;
    if (j.contains("data") && j["data"].is_array()) {
        for (const auto& item : j["data"]) {
            if (!item.is_object()) continue;
            // Ticks outside int32 have no chart position
            const auto tick = intField(item, "tick");
            const auto liquidity = numberField(item, "liquidity");
            if (!tick || !liquidity) continue;
            out.bars.push_back(LiquidityBar{*tick, *liquidity, numberField(item, "price")});
        }
    }
    std::stable_sort(out.bars.begin(), out.bars.end(),
                     [](const LiquidityBar& a, const LiquidityBar& b) { return a.tick < b.tick; });

    if (const auto tick = intField(j, "current_tick")) {
        out.currentTick = *tick;
    }
    return out;
}

AllocationResult parseAllocation(const json& j) {
    requireObject(j, "allocation");

    AllocationResult out;
    out.amountToken0 = requireNumber(j, "amount_token0", "allocation");
    out.amountToken1 = requireNumber(j, "amount_token1", "allocation");
    out.priceToken0Usd = numberField(j, "price_token0_usd");
    out.priceToken1Usd = numberField(j, "price_token1_usd");
    out.token0Symbol = stringField(j, "token0_symbol");
    out.token1Symbol = stringField(j, "token1_symbol");
    return out;
}

AprSimulationResult parseAprSimulation(const json& j) {
    requireObject(j, "estimated fees");

    AprSimulationResult out;
    out.estimatedFees24h = numberField(j, "estimated_fees_24h");
    out.feeApr = numberField(j, "fee_apr");
    if (j.contains("monthly") && j["monthly"].is_object()) {
        out.monthlyUsd = numberField(j["monthly"], "value");
        out.monthlyPercent = numberField(j["monthly"], "percent");
    }
    if (j.contains("yearly") && j["yearly"].is_object()) {
        out.yearlyUsd = numberField(j["yearly"], "value");
        if (!out.feeApr) out.feeApr = numberField(j["yearly"], "apr");
    }
    return out;
}

VolumeHistory parseVolumeHistory(const json& j) {
    const json* items = nullptr;
    std::optional<VolumeSummary> summary;

    if (j.is_array()) {
        items = &j;
    } else if (j.is_object()) {
        if (j.contains("volume_history") && j["volume_history"].is_array()) {
            items = &j["volume_history"];
        }
        if (j.contains("summary") && j["summary"].is_object()) {
            const json& s = j["summary"];
            VolumeSummary vs;
            vs.tvlUsd = numberField(s, "tvl_usd");
            vs.avgDailyFeesUsd = numberField(s, "avg_daily_fees_usd");
            vs.dailyFeesTvlPct = numberField(s, "daily_fees_tvl_pct");
            vs.avgDailyVolumeUsd = numberField(s, "avg_daily_volume_usd");
            vs.dailyVolumeTvlPct = numberField(s, "daily_volume_tvl_pct");
            vs.priceVolatilityPct = numberField(s, "price_volatility_pct");
            vs.correlation = numberField(s, "correlation");
            vs.geometricMeanPrice = numberField(s, "geometric_mean_price");
            summary = vs;
        }
    } else {
        throw std::runtime_error("volume history: expected an array or object");
    }

    std::vector<RawVolumeSample> samples;
    if (items) {
        samples.reserve(items->size());
        for (const auto& item : *items) {
            if (!item.is_object()) continue;
            const auto ts = timestampField(item, "time");
            const auto value = numberField(item, "value");
            if (!ts || !value) continue;
            samples.push_back(RawVolumeSample{floorDiv(*ts, 1000), *value, numberField(item, "fees_usd")});
        }
    }
    return VolumeHistoryMath::build(samples, std::move(summary));
}

MatchedRange parseMatchedRange(const json& j) {
    requireObject(j, "match ticks");

    MatchedRange out;
    out.minPrice = requireNumber(j, "min_price_matched", "match ticks");
    out.maxPrice = requireNumber(j, "max_price_matched", "match ticks");
    out.currentPrice = numberField(j, "current_price_matched");
    return out;
}

std::string errorMessage(std::string_view body, std::string_view url) {
    const std::string fallback = "Unable to reach " + std::string(url);
    if (body.empty()) return fallback;

    const json parsed = json::parse(body.begin(), body.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return std::string(body);
    }
    if (parsed.is_object() && parsed.contains("message") && parsed["message"].is_string()) {
        const std::string message = parsed["message"].get<std::string>();
        if (!message.empty()) return message;
    }
    return fallback;
}

} // namespace PoolWire
