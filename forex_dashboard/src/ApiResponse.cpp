#include "ApiResponse.h"
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStringList>

std::optional<QJsonObject> decodeApiObject(const HttpResponse& resp, FetchError* error) {
    if (!resp.reachedServer()) {
        if (error) *error = FetchError::networkOrDecode(resp.transportError);
        return std::nullopt;
    }
    QJsonParseError pe;
    const QJsonDocument doc = QJsonDocument::fromJson(resp.body, &pe);
    if (pe.error != QJsonParseError::NoError) {
        if (error) *error = FetchError::networkOrDecode(QString("invalid JSON (HTTP %1) at offset %2: %3").arg(resp.status).arg(pe.offset).arg(pe.errorString()));
        return std::nullopt;
    }
    if (!doc.isObject()) {
        if (error) *error = FetchError::networkOrDecode(QString("expected a JSON object (HTTP %1)").arg(resp.status));
        return std::nullopt;
    }
    return doc.object();
}

std::optional<QJsonObject> requireObjectField(const QJsonObject& root, const QString& field, FetchError* error) {
    const QJsonValue v = root.value(field);
    if (v.isObject()) return v.toObject();
    if (error) {
        // ExchangeRate-API reports failures as {"result":"error","error-type":"invalid-key"}
        if (root.value("result").toString() == "error") {
            *error = FetchError::networkOrDecode(QString("service error: %1").arg(root.value("error-type").toString("unknown")));
        } else {
            *error = FetchError::networkOrDecode(QString("missing field `%1`").arg(field));
        }
    }
    return std::nullopt;
}

QUrl apiUrl(const QString& baseUrl, const QString& apiKey, const QStringList& tail) {
    QStringList segs;
    segs << QString::fromLatin1(QUrl::toPercentEncoding(apiKey));
    for (const QString& s : tail) segs << QString::fromLatin1(QUrl::toPercentEncoding(s));
    return QUrl(baseUrl + "/v6/" + segs.join(QLatin1Char('/')));
}
