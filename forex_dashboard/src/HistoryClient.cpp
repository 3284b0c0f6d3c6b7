#include "HistoryClient.h"
#include "ApiResponse.h"
#include <QUrlQuery>
#include <QJsonObject>
#include <QDateTime>
#include <QDebug>

HistoryClient::HistoryClient(std::shared_ptr<HttpTransport> t, QString apiBaseUrl, int d, bool single)
    : transport(std::move(t)), baseUrl(std::move(apiBaseUrl)), days(d), singleRequest(single) {}

QUrl HistoryClient::historyUrl(const QString& apiKey, const CurrencyPair& pair, const QDate& start, const QDate& end) const {
    QUrl url = apiUrl(baseUrl, apiKey, {QStringLiteral("history"), pair.base, pair.target});
    QUrlQuery q;
    q.addQueryItem("start_date", start.toString(Qt::ISODate));
    q.addQueryItem("end_date", end.toString(Qt::ISODate));
    url.setQuery(q);
    return url;
}

std::optional<QJsonObject> HistoryClient::fetchRates(const QUrl& url, FetchError* error) const {
    const auto root = decodeApiObject(transport->get(url), error);
    if (!root) return std::nullopt;
    return requireObjectField(*root, QStringLiteral("rates"), error);
}

std::optional<QVector<RateSample>> HistoryClient::fetchHistory(const QString& apiKey, const CurrencyPair& pair, const QDate& endDate, FetchError* error) const {
    const QDate startDate = endDate.addDays(-days);
    const QUrl url = historyUrl(apiKey, pair, startDate, endDate);
    QVector<RateSample> out; out.reserve(days + 1);
    std::optional<QJsonObject> rates;
    int requests = 0;
    for (QDate d = startDate; d <= endDate; d = d.addDays(1)) {
        if (!rates || !singleRequest) {
            FetchError err;
            rates = fetchRates(url, &err);
            ++requests;
            if (!rates) {
                qWarning() << "[HistoryClient]" << pair.code() << "aborted on" << d.toString(Qt::ISODate) << "after" << out.size() << "samples:" << err.toString();
                if (error) *error = err;
                return std::nullopt;
            }
        }
        const QJsonValue day = rates->value(d.toString(Qt::ISODate));
        if (!day.isObject()) continue;
        const QJsonValue v = day.toObject().value(pair.target);
        if (!v.isDouble()) continue;
        out.push_back({d, v.toDouble()});
    }
    qDebug() << "[HistoryClient]" << pair.code() << startDate.toString(Qt::ISODate) << ".." << endDate.toString(Qt::ISODate)
             << "samples=" << out.size() << "requests=" << requests;
    return out;
}

std::optional<QVector<RateSample>> HistoryClient::fetchHistory(const QString& apiKey, const CurrencyPair& pair, FetchError* error) const {
    return fetchHistory(apiKey, pair, QDateTime::currentDateTimeUtc().date(), error);
}
