#pragma once
#include <QMutex>
#include <QSet>
#include <QString>
#include <QWaitCondition>
#include <functional>
#include <memory>
#include <vector>
#include "Currency.h"
#include "ForexConfig.h"
#include "HttpTransport.h"
#include "ResultChannel.h"

class QThread;

struct RequestKey {
    FetchKind kind = FetchKind::PointRate;
    CurrencyPair pair;
    QString apiKey;
    bool operator==(const RequestKey& o) const { return kind == o.kind && pair == o.pair && apiKey == o.apiKey; }
};

inline size_t qHash(const RequestKey& k, size_t seed = 0) noexcept { return qHashMulti(seed, int(k.kind), k.pair, k.apiKey); }

// Runs rate/history fetches on worker threads and posts one FetchOutcome per task to the channel.
// A request whose (kind, pair, api key) is already in flight is coalesced into the running task.
// Must be driven from a single (UI) thread; workers only touch the ledger and the channel.
class FetchCoordinator {
public:
    FetchCoordinator(std::shared_ptr<HttpTransport> transport, ForexConfig config, std::shared_ptr<ResultChannel> channel);
    // Waits up to one transfer timeout for outstanding workers, then abandons them. There is no cancellation.
    ~FetchCoordinator();
    FetchCoordinator(const FetchCoordinator&) = delete;
    FetchCoordinator& operator=(const FetchCoordinator&) = delete;

    // true: a task was spawned; false: coalesced into an identical in-flight request
    bool requestPointRate(const QString& apiKey, const CurrencyPair& pair);
    bool requestHistory(const QString& apiKey, const CurrencyPair& pair);

    int inFlightCount() const;
    // Any api key
    bool isInFlight(FetchKind kind, const CurrencyPair& pair) const;
    bool waitForIdle(int timeoutMs) const;
private:
    struct Ledger {
        mutable QMutex mutex;
        QWaitCondition idle;
        QSet<RequestKey> inFlight;
    };
    bool spawn(const RequestKey& key, std::function<FetchOutcome()> task);
    void reapFinished();

    std::shared_ptr<HttpTransport> transport;
    ForexConfig config;
    std::shared_ptr<ResultChannel> channel;
    std::shared_ptr<Ledger> ledger;
    std::vector<std::unique_ptr<QThread>> workers;
    quint64 spawned = 0;
};
