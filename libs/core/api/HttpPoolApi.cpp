#include "HttpPoolApi.hpp"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <exception>

#include "RangeScopeLogging.hpp"
#include "api/PoolWire.hpp"

using nlohmann::json;

namespace {
constexpr const char* kTimedOutProperty = "rangescope_timeout";
}

// =============================================================================
// HttpPendingCall
// =============================================================================

HttpPendingCall::HttpPendingCall(QNetworkReply* reply)
    : m_reply(reply) {
}

HttpPendingCall::~HttpPendingCall() {
    abort();
}

void HttpPendingCall::abort() {
    if (!m_reply || m_reply->isFinished()) return;
    // finished() fires synchronously from abort(); disconnect first so no callback runs
    QObject::disconnect(m_reply, nullptr, nullptr, nullptr);
    m_reply->abort();
    m_reply->deleteLater();
    m_reply.clear();
}

bool HttpPendingCall::isFinished() const {
    return !m_reply || m_reply->isFinished();
}

// =============================================================================
// HttpPoolApi
// =============================================================================

HttpPoolApi::HttpPoolApi(QString baseUrl, int timeoutMs, QObject* parent)
    : QObject(parent)
    , m_network(new QNetworkAccessManager(this))
    , m_baseUrl(std::move(baseUrl))
    , m_timeoutMs(timeoutMs) {
    while (m_baseUrl.endsWith('/')) m_baseUrl.chop(1);
    rsLog_App("HttpPoolApi base URL:" << m_baseUrl << "timeout:" << m_timeoutMs << "ms");
}

HttpPoolApi::~HttpPoolApi() = default;

QUrl HttpPoolApi::endpoint(const QString& path, const QUrlQuery& query) const {
    QUrl url(m_baseUrl + path);
    if (!query.isEmpty()) url.setQuery(query);
    return url;
}

QUrlQuery HttpPoolApi::poolQuery(const PoolIdentity& pool) const {
    QUrlQuery q;
    q.addQueryItem("pool_address", QString::fromStdString(pool.poolAddress));
    q.addQueryItem("chain_id", QString::number(pool.chainId));
    q.addQueryItem("dex_id", QString::number(pool.dexId));
    return q;
}

PendingCallPtr HttpPoolApi::get(const QUrl& url, Handler handler) {
    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setRawHeader("Accept", "application/json");
    rsLog_Data("GET" << url.toString());
    return track(m_network->get(req), std::move(handler));
}

PendingCallPtr HttpPoolApi::post(const QUrl& url, const json& body, Handler handler) {
    QNetworkRequest req(url);
    req.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    req.setRawHeader("Accept", "application/json");
    const std::string payload = body.dump();
    rsLog_Data("POST" << url.toString() << QString::fromStdString(payload));
    return track(m_network->post(req, QByteArray::fromStdString(payload)), std::move(handler));
}

PendingCallPtr HttpPoolApi::track(QNetworkReply* reply, Handler handler) {
    if (m_timeoutMs > 0) {
        auto* timer = new QTimer(reply);
        timer->setSingleShot(true);
        timer->setInterval(m_timeoutMs);
        connect(timer, &QTimer::timeout, reply, [reply]() {
            if (!reply->isFinished()) {
                reply->setProperty(kTimedOutProperty, true);
                reply->abort();
            }
        });
        timer->start();
    }

    connect(reply, &QNetworkReply::finished, this, [reply, handler = std::move(handler)]() {
        const auto err = reply->error();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const QByteArray body = reply->readAll();
        const bool timedOut = reply->property(kTimedOutProperty).toBool();
        const QString url = reply->url().toString();
        reply->deleteLater();

        if (err == QNetworkReply::OperationCanceledError && !timedOut) {
            handler({}, {}, true);
            return;
        }
        if (timedOut) {
            rsLog_Warning("Request timed out:" << url);
            handler({}, QStringLiteral("Request timed out: %1").arg(url), false);
            return;
        }
        if (err != QNetworkReply::NoError || status >= 400) {
            const QString message = QString::fromStdString(
                PoolWire::errorMessage(std::string_view(body.constData(), static_cast<size_t>(body.size())),
                                       url.toStdString()));
            rsLog_Warning("Request failed:" << url << "status:" << status << message);
            handler({}, message, false);
            return;
        }
        handler(body, {}, false);
    });

    return std::make_unique<HttpPendingCall>(reply);
}

template <typename T, typename ParseFn>
HttpPoolApi::Handler HttpPoolApi::deliver(ApiCallback<T> cb, ParseFn parseFn, QString what) {
    return [cb = std::move(cb), parseFn, what = std::move(what)](const QByteArray& body, const QString& error,
                                                                  bool cancelled) {
        if (cancelled) {
            cb(ApiResult<T>::aborted());
            return;
        }
        if (!error.isEmpty()) {
            cb(ApiResult<T>::failure(error));
            return;
        }

        std::optional<T> parsed;
        QString parseError;
        try {
            parsed = parseFn(json::parse(body.constData(), body.constData() + body.size()));
        } catch (const std::exception& e) {
            parseError = QStringLiteral("Invalid %1 response: %2").arg(what, QString::fromUtf8(e.what()));
            rsLog_Warning(parseError);
        }

        if (parsed) {
            cb(ApiResult<T>::success(std::move(*parsed)));
        } else {
            cb(ApiResult<T>::failure(parseError));
        }
    };
}

PendingCallPtr HttpPoolApi::fetchPoolMetadata(const PoolIdentity& pool, ApiCallback<PoolMetadata> cb) {
    QUrlQuery q;
    q.addQueryItem("chain_id", QString::number(pool.chainId));
    q.addQueryItem("dex_id", QString::number(pool.dexId));
    const QString path = "/v1/pools/by-address/" +
        QString::fromUtf8(QUrl::toPercentEncoding(QString::fromStdString(pool.poolAddress)));
    return get(endpoint(path, q), deliver<PoolMetadata>(std::move(cb), &PoolWire::parsePoolMetadata, "pool metadata"));
}

PendingCallPtr HttpPoolApi::fetchPoolPrice(const PoolPriceRequest& req, ApiCallback<PriceSeries> cb) {
    QUrlQuery q = poolQuery(req.pool);
    q.addQueryItem("days", QString::number(req.timeframeDays));
    return get(endpoint("/v1/pool-price", q), deliver<PriceSeries>(std::move(cb), &PoolWire::parsePriceSeries, "pool price"));
}

PendingCallPtr HttpPoolApi::fetchDefaultRange(const DefaultRangeRequest& req, ApiCallback<DefaultRange> cb) {
    QUrlQuery q = poolQuery(req.pool);
    q.addQueryItem("initial_price", QString::number(req.initialPrice, 'g', 17));
    q.addQueryItem("preset", QString::fromStdString(req.preset));
    return get(endpoint("/v1/default-range", q),
               deliver<DefaultRange>(std::move(cb), &PoolWire::parseDefaultRange, "default range"));
}

PendingCallPtr HttpPoolApi::fetchLiquidityDistribution(const DistributionRequest& req,
                                                       ApiCallback<LiquidityDistribution> cb) {
    return post(endpoint("/v1/liquidity-distribution"), PoolWire::distributionBody(req),
                deliver<LiquidityDistribution>(std::move(cb), &PoolWire::parseLiquidityDistribution,
                                               "liquidity distribution"));
}

PendingCallPtr HttpPoolApi::fetchAllocation(const AllocationRequest& req, ApiCallback<AllocationResult> cb) {
    return post(endpoint("/v1/allocate"), PoolWire::allocationBody(req),
                deliver<AllocationResult>(std::move(cb), &PoolWire::parseAllocation, "allocation"));
}

PendingCallPtr HttpPoolApi::simulateApr(const AprSimulationRequest& req, ApiCallback<AprSimulationResult> cb) {
    return post(endpoint("/v1/estimated-fees"), PoolWire::aprSimulationBody(req),
                deliver<AprSimulationResult>(std::move(cb), &PoolWire::parseAprSimulation, "estimated fees"));
}

PendingCallPtr HttpPoolApi::fetchVolumeHistory(const VolumeHistoryRequest& req, ApiCallback<VolumeHistory> cb) {
    QUrlQuery q;
    q.addQueryItem("days", QString::number(req.days));
    q.addQueryItem("chain_id", QString::number(req.pool.chainId));
    q.addQueryItem("dex_id", QString::number(req.pool.dexId));
    if (!req.symbol0.empty()) q.addQueryItem("symbol0", QString::fromStdString(req.symbol0));
    if (!req.symbol1.empty()) q.addQueryItem("symbol1", QString::fromStdString(req.symbol1));
    const QString path = "/v1/pools/" +
        QString::fromUtf8(QUrl::toPercentEncoding(QString::fromStdString(req.pool.poolAddress))) +
        "/volume-history";
    return get(endpoint(path, q),
               deliver<VolumeHistory>(std::move(cb), &PoolWire::parseVolumeHistory, "volume history"));
}

PendingCallPtr HttpPoolApi::matchTicks(const MatchTicksRequest& req, ApiCallback<MatchedRange> cb) {
    return post(endpoint("/v1/match-ticks"), PoolWire::matchTicksBody(req),
                deliver<MatchedRange>(std::move(cb), &PoolWire::parseMatchedRange, "match ticks"));
}
