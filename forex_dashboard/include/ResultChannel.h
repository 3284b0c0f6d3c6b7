#pragma once
#include <QMutex>
#include <QVector>
#include <deque>
#include <optional>
#include "Currency.h"
#include "FetchError.h"

enum class FetchKind { PointRate, History };

// One message per background task: a success value or a structured error
struct FetchOutcome {
    FetchKind kind = FetchKind::PointRate;
    CurrencyPair pair;
    std::optional<double> rate;  // PointRate success
    QVector<RateSample> samples; // History success
    std::optional<FetchError> error;
    bool ok() const { return !error.has_value(); }
};

// Multiple producers (worker threads), single consumer (UI frame)
class ResultChannel {
public:
    void send(FetchOutcome outcome);
    // Non-blocking; takes at most one message
    std::optional<FetchOutcome> tryReceive();
    int pending() const;
private:
    mutable QMutex mutex;
    std::deque<FetchOutcome> queue;
};
