#pragma once
#include "api/PoolApi.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

/// Scripted PoolApi: records every request and lets the test decide when and how each call completes
class FakePoolApi : public PoolApi {
public:
    struct CallState {
        bool aborted = false;
        bool finished = false;
    };

    class FakeCall : public PendingCall {
    public:
        explicit FakeCall(std::shared_ptr<CallState> state) : state_(std::move(state)) {}
        ~FakeCall() override {
            if (!state_->finished) state_->aborted = true;
        }
        void abort() override {
            if (!state_->finished) state_->aborted = true;
        }
        bool isFinished() const override { return state_->finished; }

    private:
        std::shared_ptr<CallState> state_;
    };

    template <typename Req, typename Res>
    class Channel {
    public:
        struct Call {
            Req request;
            ApiCallback<Res> callback;
            std::shared_ptr<CallState> state;
        };

        PendingCallPtr record(const Req& req, ApiCallback<Res> cb) {
            auto state = std::make_shared<CallState>();
            calls_.push_back(Call{req, std::move(cb), state});
            return std::make_unique<FakeCall>(state);
        }

        size_t count() const { return calls_.size(); }
        const Call& call(size_t index) const { return calls_.at(index); }
        const Req& lastRequest() const { return last().request; }
        bool isAborted(size_t index) const { return calls_.at(index).state->aborted; }

        // Calls neither finished nor aborted
        size_t liveCount() const {
            size_t live = 0;
            for (const auto& c : calls_) {
                if (!c.state->aborted && !c.state->finished) ++live;
            }
            return live;
        }

        // Completes like a real transport: aborted calls never call back
        void resolve(size_t index, Res value) { complete(index, ApiResult<Res>::success(std::move(value)), false); }
        void fail(size_t index, const QString& message) { complete(index, ApiResult<Res>::failure(message), false); }
        void resolveLast(Res value) { resolve(calls_.size() - 1, std::move(value)); }
        void failLast(const QString& message) { fail(calls_.size() - 1, message); }

        // Delivers even to an aborted call, like a response racing its abort
        void forceResolve(size_t index, Res value) { complete(index, ApiResult<Res>::success(std::move(value)), true); }
        void forceCancel(size_t index) { complete(index, ApiResult<Res>::aborted(), true); }

    private:
        const Call& last() const {
            if (calls_.empty()) {
                throw std::runtime_error("FakePoolApi: no calls recorded");
            }
            return calls_.back();
        }

        void complete(size_t index, ApiResult<Res> result, bool ignoreAbort) {
            Call& c = calls_.at(index);
            if (c.state->finished) return;
            if (c.state->aborted && !ignoreAbort) return;
            c.state->finished = true;
            // Copy: the callback may record new calls and reallocate calls_
            ApiCallback<Res> cb = c.callback;
            cb(std::move(result));
        }

        std::vector<Call> calls_;
    };

    PendingCallPtr fetchPoolMetadata(const PoolIdentity& pool, ApiCallback<PoolMetadata> cb) override {
        return metadata.record(pool, std::move(cb));
    }
    PendingCallPtr fetchPoolPrice(const PoolPriceRequest& req, ApiCallback<PriceSeries> cb) override {
        return price.record(req, std::move(cb));
    }
    PendingCallPtr fetchDefaultRange(const DefaultRangeRequest& req, ApiCallback<DefaultRange> cb) override {
        return defaultRange.record(req, std::move(cb));
    }
    PendingCallPtr fetchLiquidityDistribution(const DistributionRequest& req,
                                              ApiCallback<LiquidityDistribution> cb) override {
        return distribution.record(req, std::move(cb));
    }
    PendingCallPtr fetchAllocation(const AllocationRequest& req, ApiCallback<AllocationResult> cb) override {
        return allocation.record(req, std::move(cb));
    }
    PendingCallPtr simulateApr(const AprSimulationRequest& req, ApiCallback<AprSimulationResult> cb) override {
        return apr.record(req, std::move(cb));
    }
    PendingCallPtr fetchVolumeHistory(const VolumeHistoryRequest& req, ApiCallback<VolumeHistory> cb) override {
        return volume.record(req, std::move(cb));
    }
    PendingCallPtr matchTicks(const MatchTicksRequest& req, ApiCallback<MatchedRange> cb) override {
        return match.record(req, std::move(cb));
    }

    Channel<PoolIdentity, PoolMetadata> metadata;
    Channel<PoolPriceRequest, PriceSeries> price;
    Channel<DefaultRangeRequest, DefaultRange> defaultRange;
    Channel<DistributionRequest, LiquidityDistribution> distribution;
    Channel<AllocationRequest, AllocationResult> allocation;
    Channel<AprSimulationRequest, AprSimulationResult> apr;
    Channel<VolumeHistoryRequest, VolumeHistory> volume;
    Channel<MatchTicksRequest, MatchedRange> match;
};
