#pragma once
#include <QString>

class QSettings;

// Runtime knobs read from QSettings. Nothing is ever written back.
struct ForexConfig {
    QString apiBaseUrl = QStringLiteral("https://v6.exchangerate-api.com");
    int httpTimeoutMs = 20000;        // 0 disables the transfer timeout
    int historyDays = 30;             // window is [today - days, today]
    bool historySingleRequest = false; // false: one identical range request per day
    int frameIntervalMs = 16;
    QString defaultBase = QStringLiteral("USD");
    QString defaultTarget = QStringLiteral("EUR");

    static ForexConfig fromSettings(const QSettings& st);
    static ForexConfig load();
};
