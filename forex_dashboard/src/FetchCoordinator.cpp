#include "FetchCoordinator.h"
#include "RateClient.h"
#include "HistoryClient.h"
#include <QThread>
#include <QMutexLocker>
#include <QDeadlineTimer>
#include <QDebug>
#include <algorithm>

static constexpr int kShutdownGraceMs = 20000;

static const char* kindName(FetchKind k) { return k == FetchKind::PointRate ? "rate" : "history"; }

FetchCoordinator::FetchCoordinator(std::shared_ptr<HttpTransport> t, ForexConfig cfg, std::shared_ptr<ResultChannel> ch)
    : transport(std::move(t)), config(std::move(cfg)), channel(std::move(ch)), ledger(std::make_shared<Ledger>()) {}

FetchCoordinator::~FetchCoordinator() {
    const int running = inFlightCount();
    if (running == 0) { for (auto& w : workers) w->wait(); return; }
    const int graceMs = config.httpTimeoutMs > 0 ? config.httpTimeoutMs : kShutdownGraceMs;
    qInfo() << "[FetchCoordinator] waiting up to" << graceMs << "ms for" << running << "in-flight task(s)";
    QDeadlineTimer deadline(graceMs);
    int abandoned = 0;
    for (auto& w : workers) {
        if (w->wait(deadline)) continue;
        // Still inside a request: it only holds shared state, process exit reclaims it
        w.release();
        ++abandoned;
    }
    if (abandoned > 0) qWarning() << "[FetchCoordinator] abandoned" << abandoned << "worker(s) still fetching at shutdown";
}

bool FetchCoordinator::requestPointRate(const QString& apiKey, const CurrencyPair& pair) {
    RateClient client(transport, config.apiBaseUrl);
    return spawn({FetchKind::PointRate, pair, apiKey}, [client, apiKey, pair]() {
        FetchOutcome out; out.kind = FetchKind::PointRate; out.pair = pair;
        FetchError err;
        out.rate = client.fetchPointRate(apiKey, pair, &err);
        if (!out.rate) out.error = err;
        return out;
    });
}

bool FetchCoordinator::requestHistory(const QString& apiKey, const CurrencyPair& pair) {
    HistoryClient client(transport, config.apiBaseUrl, config.historyDays, config.historySingleRequest);
    return spawn({FetchKind::History, pair, apiKey}, [client, apiKey, pair]() {
        FetchOutcome out; out.kind = FetchKind::History; out.pair = pair;
        FetchError err;
        auto samples = client.fetchHistory(apiKey, pair, &err);
        if (samples) out.samples = std::move(*samples); else out.error = err;
        return out;
    });
}

bool FetchCoordinator::spawn(const RequestKey& key, std::function<FetchOutcome()> task) {
    reapFinished();
    {
        QMutexLocker lock(&ledger->mutex);
        if (ledger->inFlight.contains(key)) {
            qDebug() << "[FetchCoordinator]" << kindName(key.kind) << key.pair.code() << "already in flight, coalesced";
            return false;
        }
        ledger->inFlight.insert(key);
    }
    auto led = ledger; auto ch = channel;
    QThread* t = QThread::create([led, ch, key, task]() {
        FetchOutcome out = task();
        // Clearing the ledger and posting happen together so "not in flight" implies "result queued"
        QMutexLocker lock(&led->mutex);
        led->inFlight.remove(key);
        ch->send(std::move(out));
        if (led->inFlight.isEmpty()) led->idle.wakeAll();
    });
    t->setObjectName(QString("fetch-%1-%2-%3").arg(kindName(key.kind), key.pair.code()).arg(++spawned));
    workers.emplace_back(t);
    t->start();
    qDebug() << "[FetchCoordinator] spawned" << t->objectName() << "workers=" << workers.size();
    return true;
}

void FetchCoordinator::reapFinished() {
    workers.erase(std::remove_if(workers.begin(), workers.end(), [](const std::unique_ptr<QThread>& w){ return w->isFinished(); }), workers.end());
}

int FetchCoordinator::inFlightCount() const {
    QMutexLocker lock(&ledger->mutex);
    return int(ledger->inFlight.size());
}

bool FetchCoordinator::isInFlight(FetchKind kind, const CurrencyPair& pair) const {
    QMutexLocker lock(&ledger->mutex);
    return std::any_of(ledger->inFlight.cbegin(), ledger->inFlight.cend(),
                       [&](const RequestKey& k){ return k.kind == kind && k.pair == pair; });
}

bool FetchCoordinator::waitForIdle(int timeoutMs) const {
    QDeadlineTimer deadline(timeoutMs);
    QMutexLocker lock(&ledger->mutex);
    while (!ledger->inFlight.isEmpty()) {
        if (!ledger->idle.wait(&ledger->mutex, deadline)) return ledger->inFlight.isEmpty();
    }
    return true;
}
