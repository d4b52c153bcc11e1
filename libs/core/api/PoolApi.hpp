#pragma once

#include <QString>
#include <functional>
#include <memory>
#include <optional>
#include <utility>

#include "pool/PoolTypes.hpp"
#include "pool/VolumeHistory.hpp"

// Outcome of one asynchronous backend call
template <typename T>
struct ApiResult {
    std::optional<T> value;
    QString error;            // set when the call failed
    bool cancelled = false;   // superseded or aborted; never shown to the user

    bool ok() const { return value.has_value(); }

    static ApiResult success(T v) {
        ApiResult r;
        r.value = std::move(v);
        return r;
    }
    static ApiResult failure(QString message) {
        ApiResult r;
        r.error = std::move(message);
        return r;
    }
    static ApiResult aborted() {
        ApiResult r;
        r.cancelled = true;
        return r;
    }
};

template <typename T>
using ApiCallback = std::function<void(ApiResult<T>)>;

// Handle to an in-flight call. abort() and destruction of an unfinished call
// both guarantee the callback is never invoked.
class PendingCall {
public:
    virtual ~PendingCall() = default;
    virtual void abort() = 0;
    virtual bool isFinished() const = 0;
};

using PendingCallPtr = std::unique_ptr<PendingCall>;

// Backend surface consumed by RequestOrchestrator (no transport logic)
class PoolApi {
public:
    PoolApi() = default;
    virtual ~PoolApi() = default;

    virtual PendingCallPtr fetchPoolMetadata(const PoolIdentity& pool, ApiCallback<PoolMetadata> cb) = 0;
    virtual PendingCallPtr fetchPoolPrice(const PoolPriceRequest& req, ApiCallback<PriceSeries> cb) = 0;
    virtual PendingCallPtr fetchDefaultRange(const DefaultRangeRequest& req, ApiCallback<DefaultRange> cb) = 0;
    virtual PendingCallPtr fetchLiquidityDistribution(const DistributionRequest& req,
                                                      ApiCallback<LiquidityDistribution> cb) = 0;
    virtual PendingCallPtr fetchAllocation(const AllocationRequest& req, ApiCallback<AllocationResult> cb) = 0;
    virtual PendingCallPtr simulateApr(const AprSimulationRequest& req, ApiCallback<AprSimulationResult> cb) = 0;
    virtual PendingCallPtr fetchVolumeHistory(const VolumeHistoryRequest& req, ApiCallback<VolumeHistory> cb) = 0;
    virtual PendingCallPtr matchTicks(const MatchTicksRequest& req, ApiCallback<MatchedRange> cb) = 0;
};
