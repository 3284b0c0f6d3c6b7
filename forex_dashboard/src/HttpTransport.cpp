#include "HttpTransport.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QNetworkReply>
#include <QEventLoop>
#include <QStringList>
#include <QDebug>
#include <memory>

HttpResponse QtHttpTransport::get(const QUrl& url) {
    // The manager lives in this thread only; worker threads each get their own
    QNetworkAccessManager nam;
    QNetworkRequest request{url};
    request.setHeader(QNetworkRequest::UserAgentHeader, QStringLiteral("forex-dashboard/1.0"));
    if (timeoutMs > 0) request.setTransferTimeout(timeoutMs);
    std::unique_ptr<QNetworkReply> reply(nam.get(request));
    QEventLoop loop;
    QObject::connect(reply.get(), &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) loop.exec();

    HttpResponse out;
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    out.status = status.isValid() ? status.toInt() : 0;
    out.body = reply->readAll();
    // HTTP error statuses still carry a JSON body worth decoding; only a missing response is a transport failure
    if (reply->error() != QNetworkReply::NoError && out.status == 0) {
        out.transportError = reply->errorString();
        qWarning() << "[QtHttpTransport] GET" << redactedUrl(url) << "failed:" << out.transportError;
    } else {
        qDebug() << "[QtHttpTransport] GET" << redactedUrl(url) << "->" << out.status << "bytes=" << out.body.size();
    }
    return out;
}

QString redactedUrl(const QUrl& url) {
    QStringList parts = url.path().split('/');
    // "/v6/<key>/..." -> ["", "v6", "<key>", ...]
    if (parts.size() > 2 && parts[1] == "v6") parts[2] = "***";
    QUrl copy(url); copy.setPath(parts.join('/'));
    return copy.toString();
}
