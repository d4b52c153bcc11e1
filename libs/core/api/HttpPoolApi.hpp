/*
RangeScope — HttpPoolApi
Role: PoolApi over HTTP/JSON using QNetworkAccessManager.
Inputs/Outputs: Typed requests in; ApiResult callbacks out, delivered on the main thread.
Threading: Lives on the main thread; replies are serviced by the Qt event loop.
Performance: One QNetworkReply per call; bodies parsed with nlohmann::json.
Integration: Injected into RequestOrchestrator by MainWindow.
Observability: Logs each request and failure via rsLog_Data / rsLog_Warning.
Related: PoolApi.hpp, PoolWire.hpp.
Assumptions: Aborted or destroyed calls never reach their callback.
*/
#pragma once

#include <QObject>
#include <QPointer>
#include <QString>
#include <QUrl>
#include <QUrlQuery>
#include <nlohmann/json.hpp>

#include "api/PoolApi.hpp"

class QNetworkAccessManager;
class QNetworkReply;

// Owns nothing but a reply pointer; destruction of an unfinished call aborts it silently
class HttpPendingCall : public PendingCall {
public:
    explicit HttpPendingCall(QNetworkReply* reply);
    ~HttpPendingCall() override;

    void abort() override;
    bool isFinished() const override;

private:
    QPointer<QNetworkReply> m_reply;
};

class HttpPoolApi : public QObject, public PoolApi {
    Q_OBJECT

public:
    explicit HttpPoolApi(QString baseUrl, int timeoutMs = 15000, QObject* parent = nullptr);
    ~HttpPoolApi() override;

    QString baseUrl() const { return m_baseUrl; }

    PendingCallPtr fetchPoolMetadata(const PoolIdentity& pool, ApiCallback<PoolMetadata> cb) override;
    PendingCallPtr fetchPoolPrice(const PoolPriceRequest& req, ApiCallback<PriceSeries> cb) override;
    PendingCallPtr fetchDefaultRange(const DefaultRangeRequest& req, ApiCallback<DefaultRange> cb) override;
    PendingCallPtr fetchLiquidityDistribution(const DistributionRequest& req,
                                              ApiCallback<LiquidityDistribution> cb) override;
    PendingCallPtr fetchAllocation(const AllocationRequest& req, ApiCallback<AllocationResult> cb) override;
    PendingCallPtr simulateApr(const AprSimulationRequest& req, ApiCallback<AprSimulationResult> cb) override;
    PendingCallPtr fetchVolumeHistory(const VolumeHistoryRequest& req, ApiCallback<VolumeHistory> cb) override;
    PendingCallPtr matchTicks(const MatchTicksRequest& req, ApiCallback<MatchedRange> cb) override;

private:
    using Handler = std::function<void(const QByteArray& body, const QString& error, bool cancelled)>;

    QUrl endpoint(const QString& path, const QUrlQuery& query = QUrlQuery()) const;
    QUrlQuery poolQuery(const PoolIdentity& pool) const;

    PendingCallPtr get(const QUrl& url, Handler handler);
    PendingCallPtr post(const QUrl& url, const nlohmann::json& body, Handler handler);
    PendingCallPtr track(QNetworkReply* reply, Handler handler);

    // Parses the body with parseFn and routes the outcome into cb
    template <typename T, typename ParseFn>
    static Handler deliver(ApiCallback<T> cb, ParseFn parseFn, QString what);

    QNetworkAccessManager* m_network = nullptr;
    QString m_baseUrl;
    int m_timeoutMs = 15000;
};
