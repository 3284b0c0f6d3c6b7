#include "AppState.h"
#include <QDebug>
#include <QLocale>

AppState withApiKey(AppState state, const QString& apiKey) {
    state.apiKey = apiKey.trimmed();
    return state;
}

AppState withBaseCurrency(AppState state, const QString& code) {
    if (isSupportedCurrency(code)) state.pair.base = code;
    else qWarning() << "[AppState] ignoring unsupported base" << code;
    return state;
}

AppState withTargetCurrency(AppState state, const QString& code) {
    if (isSupportedCurrency(code)) state.pair.target = code;
    else qWarning() << "[AppState] ignoring unsupported target" << code;
    return state;
}

AppState applyOutcome(AppState state, const FetchOutcome& outcome) {
    if (!outcome.ok()) {
        state.lastError = outcome.error;
        state.lastErrorKind = outcome.kind;
        return state;
    }
    if (outcome.kind == FetchKind::PointRate) {
        if (outcome.rate) state.rate = outcome.rate;
    } else {
        state.historicalRates = outcome.samples;
        for (const auto& s : outcome.samples) state.trend.push_back(s.rate);
    }
    state.lastError.reset();
    state.lastErrorKind.reset();
    return state;
}

QString rateLabelText(const AppState& state) {
    return state.rate ? QStringLiteral("Rate: ") + QString::number(*state.rate, 'f', QLocale::FloatingPointShortest) : QStringLiteral("Rate: Not fetched");
}
