#pragma once
#include <QString>
#include <QStringList>
#include <QDate>
#include <QHashFunctions>

// Fixed catalog of supported ISO codes, alphabetical
const QStringList& supportedCurrencies();
bool isSupportedCurrency(const QString& code);

struct CurrencyPair {
    QString base;   // e.g. USD
    QString target; // e.g. EUR
    // 6-letter wire form, base followed by target
    QString code() const { return base + target; }
    bool operator==(const CurrencyPair& o) const { return base == o.base && target == o.target; }
    bool operator!=(const CurrencyPair& o) const { return !(*this == o); }
};

inline size_t qHash(const CurrencyPair& p, size_t seed = 0) noexcept { return qHashMulti(seed, p.base, p.target); }

// One day of a historical series
struct RateSample {
    QDate date;
    double rate = 0.0;
    bool operator==(const RateSample& o) const { return date == o.date && rate == o.rate; }
};
