#pragma once
#include <QObject>
#include <QString>
#include <memory>
#include "AppState.h"
#include "FetchCoordinator.h"
#include "ForexConfig.h"
#include "HttpTransport.h"
#include "ResultChannel.h"

// Owns the application state and routes form edits, button clicks and drained results through it.
// Lives in the UI thread.
class ForexController : public QObject {
    Q_OBJECT
public:
    ForexController(std::shared_ptr<HttpTransport> transport, const ForexConfig& config, QObject* parent=nullptr);
    ~ForexController() override;

    const AppState& state() const { return current; }
    FetchCoordinator& coordinator() { return *fetcher; }
    int pendingResults() const { return channel->pending(); }

    void setApiKey(const QString& key);
    void setBaseCurrency(const QString& code);
    void setTargetCurrency(const QString& code);
    // Both capture key and pair at click time; false when coalesced into a running request
    bool fetchRate();
    bool fetchHistory();
    // One drain step: consumes at most one queued result. Returns true if a result was applied.
    bool frame();
signals:
    void stateChanged();
private:
    void commit(AppState next);
    AppState current;
    std::shared_ptr<ResultChannel> channel;
    std::unique_ptr<FetchCoordinator> fetcher;
};
