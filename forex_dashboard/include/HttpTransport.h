#pragma once
#include <QByteArray>
#include <QString>
#include <QUrl>

struct HttpResponse {
    int status = 0;         // HTTP status, 0 when no response arrived
    QByteArray body;
    QString transportError; // non-empty when the request never produced a response
    bool reachedServer() const { return transportError.isEmpty(); }
};

// Blocking GET seam shared by the rate and history clients.
// Implementations must be callable from any worker thread.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse get(const QUrl& url) = 0;
};

// QNetworkAccessManager driven by a local event loop in the calling thread.
class QtHttpTransport : public HttpTransport {
public:
    explicit QtHttpTransport(int timeoutMs = 20000) : timeoutMs(timeoutMs) {}
    HttpResponse get(const QUrl& url) override;
    int transferTimeoutMs() const { return timeoutMs; }
private:
    int timeoutMs;
};

// Replaces the api key path segment so URLs can be logged
QString redactedUrl(const QUrl& url);
