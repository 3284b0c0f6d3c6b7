#include "ResultChannel.h"
#include <QMutexLocker>

void ResultChannel::send(FetchOutcome outcome) {
    QMutexLocker lock(&mutex);
    queue.push_back(std::move(outcome));
}

std::optional<FetchOutcome> ResultChannel::tryReceive() {
    QMutexLocker lock(&mutex);
    if (queue.empty()) return std::nullopt;
    FetchOutcome out = std::move(queue.front());
    queue.pop_front();
    return out;
}

int ResultChannel::pending() const {
    QMutexLocker lock(&mutex);
    return int(queue.size());
}
