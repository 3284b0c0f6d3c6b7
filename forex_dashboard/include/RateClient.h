#pragma once
#include <QString>
#include <QUrl>
#include <memory>
#include <optional>
#include "Currency.h"
#include "FetchError.h"
#include "HttpTransport.h"

// GET {base}/v6/{key}/latest/{BASE} -> conversion_rates[TARGET]
class RateClient {
public:
    RateClient(std::shared_ptr<HttpTransport> transport, QString apiBaseUrl);
    QUrl latestUrl(const QString& apiKey, const QString& base) const;
    // Returns the rate, or nullopt with *error filled
    std::optional<double> fetchPointRate(const QString& apiKey, const CurrencyPair& pair, FetchError* error) const;
private:
    std::shared_ptr<HttpTransport> transport;
    QString baseUrl;
};
