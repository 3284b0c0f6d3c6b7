#pragma once
#include <QString>
#include <QVector>
#include <optional>
#include "Currency.h"
#include "FetchError.h"
#include "ResultChannel.h"

struct AppState {
    QString apiKey;
    CurrencyPair pair{QStringLiteral("USD"), QStringLiteral("EUR")};
    std::optional<double> rate;             // last successful point rate
    QVector<double> trend;                  // index stands in for date, grows with every history fetch
    QVector<RateSample> historicalRates;    // last successful history fetch
    std::optional<FetchError> lastError;
    std::optional<FetchKind> lastErrorKind; // which request produced lastError
};

// Update steps: each takes the current state and returns the next one
AppState withApiKey(AppState state, const QString& apiKey);
AppState withBaseCurrency(AppState state, const QString& code);
AppState withTargetCurrency(AppState state, const QString& code);
// Failed outcomes never clear what is already displayed
AppState applyOutcome(AppState state, const FetchOutcome& outcome);

QString rateLabelText(const AppState& state);
