#include "ForexController.h"
#include <QDebug>

ForexController::ForexController(std::shared_ptr<HttpTransport> transport, const ForexConfig& config, QObject* parent)
    : QObject(parent), channel(std::make_shared<ResultChannel>()) {
    current.pair = {config.defaultBase, config.defaultTarget};
    fetcher = std::make_unique<FetchCoordinator>(std::move(transport), config, channel);
}

ForexController::~ForexController() = default;

void ForexController::commit(AppState next) {
    current = std::move(next);
    emit stateChanged();
}

void ForexController::setApiKey(const QString& key) {
    if (key.trimmed() == current.apiKey) return;
    commit(withApiKey(current, key));
}

void ForexController::setBaseCurrency(const QString& code) {
    if (code == current.pair.base) return;
    commit(withBaseCurrency(current, code));
}

void ForexController::setTargetCurrency(const QString& code) {
    if (code == current.pair.target) return;
    commit(withTargetCurrency(current, code));
}

bool ForexController::fetchRate() {
    if (current.apiKey.isEmpty()) qWarning() << "[ForexController] fetching rate with an empty API key";
    return fetcher->requestPointRate(current.apiKey, current.pair);
}

bool ForexController::fetchHistory() {
    if (current.apiKey.isEmpty()) qWarning() << "[ForexController] fetching history with an empty API key";
    return fetcher->requestHistory(current.apiKey, current.pair);
}

bool ForexController::frame() {
    auto msg = channel->tryReceive();
    if (!msg) return false;
    if (msg->ok()) {
        qInfo() << "[ForexController]" << (msg->kind==FetchKind::PointRate?"rate":"history") << msg->pair.code() << "applied"
                << (msg->kind==FetchKind::PointRate ? QString::number(msg->rate.value_or(0.0)) : QString("%1 samples").arg(msg->samples.size()));
    } else {
        qWarning() << "[ForexController]" << (msg->kind==FetchKind::PointRate?"rate":"history") << msg->pair.code() << "failed:" << msg->error->toString();
    }
    commit(applyOutcome(current, *msg));
    return true;
}
