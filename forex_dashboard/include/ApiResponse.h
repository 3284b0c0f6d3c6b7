#pragma once
#include <QJsonObject>
#include <QStringList>
#include <QUrl>
#include <optional>
#include "HttpTransport.h"
#include "FetchError.h"

// Turns a raw response into the top-level JSON object.
// Transport failures, non-JSON bodies and non-object documents yield NetworkOrDecode.
std::optional<QJsonObject> decodeApiObject(const HttpResponse& resp, FetchError* error);

// Object-valued member lookup; reports the service's error envelope when the member is missing
std::optional<QJsonObject> requireObjectField(const QJsonObject& root, const QString& field, FetchError* error);

// Builds {baseUrl}/v6/{apiKey}/{tail...}
QUrl apiUrl(const QString& baseUrl, const QString& apiKey, const QStringList& tail);
