#include "RateClient.h"
#include "ApiResponse.h"
#include <QJsonObject>
#include <QDebug>

RateClient::RateClient(std::shared_ptr<HttpTransport> t, QString apiBaseUrl)
    : transport(std::move(t)), baseUrl(std::move(apiBaseUrl)) {}

QUrl RateClient::latestUrl(const QString& apiKey, const QString& base) const {
    return apiUrl(baseUrl, apiKey, {QStringLiteral("latest"), base});
}

std::optional<double> RateClient::fetchPointRate(const QString& apiKey, const CurrencyPair& pair, FetchError* error) const {
    FetchError err;
    auto fail = [&](const FetchError& e) -> std::optional<double> {
        qWarning() << "[RateClient]" << pair.code() << e.toString();
        if (error) *error = e;
        return std::nullopt;
    };
    const HttpResponse resp = transport->get(latestUrl(apiKey, pair.base));
    const auto root = decodeApiObject(resp, &err);
    if (!root) return fail(err);
    const auto rates = requireObjectField(*root, QStringLiteral("conversion_rates"), &err);
    if (!rates) return fail(err);
    if (!rates->contains(pair.target)) return fail(FetchError::pairNotFound(QString("%1 not in conversion_rates for %2").arg(pair.target, pair.base)));
    const QJsonValue v = rates->value(pair.target);
    if (!v.isDouble()) return fail(FetchError::networkOrDecode(QString("conversion_rates.%1 is not a number").arg(pair.target)));
    qDebug() << "[RateClient]" << pair.code() << "=" << v.toDouble();
    return v.toDouble();
}
