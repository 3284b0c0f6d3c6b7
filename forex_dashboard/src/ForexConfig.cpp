#include "ForexConfig.h"
#include "Currency.h"
#include <QSettings>
#include <QUrl>
#include <QDebug>
#include <algorithm>

static int readClampedInt(const QSettings& st, const QString& key, int def, int lo, int hi) {
    bool ok = false;
    const int v = st.value(key, def).toInt(&ok);
    if (!ok) { qWarning() << "[ForexConfig]" << key << "is not an integer, using" << def; return def; }
    const int c = std::clamp(v, lo, hi);
    if (c != v) qWarning() << "[ForexConfig]" << key << "=" << v << "out of range, clamped to" << c;
    return c;
}

static QString readCurrency(const QSettings& st, const QString& key, const QString& def) {
    const QString v = st.value(key, def).toString().trimmed().toUpper();
    if (isSupportedCurrency(v)) return v;
    qWarning() << "[ForexConfig]" << key << "=" << v << "is not a supported currency, using" << def;
    return def;
}

ForexConfig ForexConfig::fromSettings(const QSettings& st) {
    ForexConfig cfg;
    const QString base = st.value("api/baseUrl", cfg.apiBaseUrl).toString().trimmed();
    const QUrl u(base);
    if (u.isValid() && !u.host().isEmpty() && (u.scheme() == "https" || u.scheme() == "http")) {
        cfg.apiBaseUrl = base.endsWith('/') ? base.chopped(1) : base;
    } else {
        qWarning() << "[ForexConfig] api/baseUrl" << base << "is not an http(s) URL, using" << cfg.apiBaseUrl;
    }
    cfg.httpTimeoutMs = readClampedInt(st, "http/timeoutMs", cfg.httpTimeoutMs, 0, 600000);
    cfg.historyDays = readClampedInt(st, "history/days", cfg.historyDays, 1, 366);
    cfg.historySingleRequest = st.value("history/singleRequest", cfg.historySingleRequest).toBool();
    cfg.frameIntervalMs = readClampedInt(st, "ui/frameMs", cfg.frameIntervalMs, 8, 1000);
    cfg.defaultBase = readCurrency(st, "ui/defaultBase", cfg.defaultBase);
    cfg.defaultTarget = readCurrency(st, "ui/defaultTarget", cfg.defaultTarget);
    return cfg;
}

ForexConfig ForexConfig::load() {
    QSettings st("forex-dashboard", "forex_dashboard");
    ForexConfig cfg = fromSettings(st);
    qInfo() << "[ForexConfig] baseUrl=" << cfg.apiBaseUrl << "timeoutMs=" << cfg.httpTimeoutMs
            << "historyDays=" << cfg.historyDays << "singleRequest=" << cfg.historySingleRequest
            << "frameMs=" << cfg.frameIntervalMs << "pair=" << cfg.defaultBase + "/" + cfg.defaultTarget;
    return cfg;
}
