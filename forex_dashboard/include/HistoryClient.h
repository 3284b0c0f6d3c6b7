#pragma once
#include <QDate>
#include <QString>
#include <QUrl>
#include <QVector>
#include <QJsonObject>
#include <memory>
#include <optional>
#include "Currency.h"
#include "FetchError.h"
#include "HttpTransport.h"

// Trailing-window history from GET {base}/v6/{key}/history/{BASE}/{TARGET}?start_date=..&end_date=..
// By default the identical range request is repeated once per day of the window and
// each response is indexed by that day. With singleRequest the range is fetched once.
// Any transport or top-level decode failure discards everything gathered so far.
class HistoryClient {
public:
    HistoryClient(std::shared_ptr<HttpTransport> transport, QString apiBaseUrl, int days = 30, bool singleRequest = false);
    QUrl historyUrl(const QString& apiKey, const CurrencyPair& pair, const QDate& start, const QDate& end) const;
    std::optional<QVector<RateSample>> fetchHistory(const QString& apiKey, const CurrencyPair& pair, const QDate& endDate, FetchError* error) const;
    // endDate = today (UTC)
    std::optional<QVector<RateSample>> fetchHistory(const QString& apiKey, const CurrencyPair& pair, FetchError* error) const;
    int windowDays() const { return days; }
private:
    std::optional<QJsonObject> fetchRates(const QUrl& url, FetchError* error) const;
    std::shared_ptr<HttpTransport> transport;
    QString baseUrl;
    int days;
    bool singleRequest;
};
