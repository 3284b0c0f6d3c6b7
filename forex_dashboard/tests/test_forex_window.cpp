#include <QApplication>
#include <QComboBox>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <iostream>
#include <memory>

#include "FakeTransport.h"
#include "ForexWindow.h"
#include "RatePlotWidget.h"

namespace {

bool expect(bool cond, const char* what) {
    if (!cond) std::cerr << "FAILED: " << what << std::endl;
    return cond;
}

HttpResponse serve(const QUrl& url, int) {
    if (url.path().contains("/history/")) {
        const QUrlQuery q(url);
        const QDate start = QDate::fromString(q.queryItemValue("start_date"), Qt::ISODate);
        const QDate end = QDate::fromString(q.queryItemValue("end_date"), Qt::ISODate);
        QJsonObject rates;
        double r = 150.0;
        for (QDate d = start; d.isValid() && d <= end; d = d.addDays(1), r += 0.5)
            rates[d.toString(Qt::ISODate)] = QJsonObject{{"JPY", r}};
        return FakeTransport::json(QJsonDocument(QJsonObject{{"rates", rates}}).toJson(QJsonDocument::Compact));
    }
    return FakeTransport::json(R"({"conversion_rates":{"EUR":0.92,"JPY":151.5}})");
}

}  // namespace

int main(int argc, char** argv) {
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QApplication app(argc, argv);
    bool ok = true;

    ForexConfig cfg;
    cfg.historyDays = 3;
    cfg.historySingleRequest = true;
    cfg.frameIntervalMs = 1000;
    auto fake = std::make_shared<FakeTransport>();
    fake->setHandler(serve);
    ForexWindow w(cfg, fake);
    ForexController* ctrl = w.controller();

    ok &= expect(w.baseCombo()->count() == 161 && w.targetCombo()->count() == 161, "both pickers list the catalog");
    ok &= expect(w.baseCombo()->currentText() == "USD" && w.targetCombo()->currentText() == "EUR", "pickers start on USD/EUR");
    ok &= expect(w.rateLabel()->text() == "Rate: Not fetched", "label before any fetch");
    ok &= expect(w.trendPlot()->isHidden() && w.historicalPlot()->isHidden(), "plots hidden while empty");

    w.apiKeyEdit()->setText("abc");
    ok &= expect(ctrl->state().apiKey == "abc", "key field feeds the state");

    w.fetchRateButton()->click();
    ok &= expect(ctrl->coordinator().waitForIdle(5000), "rate fetch finishes");
    w.onFrame();
    ok &= expect(w.rateLabel()->text() == "Rate: 0.92", "label shows the fetched rate");

    w.targetCombo()->setCurrentText("JPY");
    ok &= expect(ctrl->state().pair == CurrencyPair{"USD", "JPY"}, "target picker feeds the state");
    w.baseCombo()->setCurrentText("USD");
    ok &= expect(ctrl->state().pair.base == "USD", "base picker unchanged");

    fake->hold();
    w.fetchHistoryButton()->click();
    ok &= expect(w.statusLabel()->text() == "Fetching... (1 in flight)", "status shows work in flight");
    fake->release(100);
    ok &= expect(ctrl->coordinator().waitForIdle(5000), "history fetch finishes");
    w.onFrame();
    ok &= expect(!w.trendPlot()->isHidden() && !w.historicalPlot()->isHidden(), "plots shown once history arrives");
    ok &= expect(w.historicalPlot()->values() == QVector<double>({150.0, 150.5, 151.0, 151.5}), "historical plot has one point per day");
    ok &= expect(w.trendPlot()->values().size() == 4, "trend plot has the first history");
    ok &= expect(w.statusLabel()->text().isEmpty(), "status clears when idle");

    w.fetchHistoryButton()->click();
    ok &= expect(ctrl->coordinator().waitForIdle(5000), "second history finishes");
    w.onFrame();
    ok &= expect(w.trendPlot()->values().size() == 8, "trend grows with every history fetch");
    ok &= expect(w.historicalPlot()->values().size() == 4, "historical plot shows the latest fetch only");

    fake->setHandler([](const QUrl&, int) { return FakeTransport::transportFailure("Host not found"); });
    w.fetchRateButton()->click();
    ok &= expect(ctrl->coordinator().waitForIdle(5000), "failing fetch finishes");
    w.onFrame();
    ok &= expect(w.rateLabel()->text() == "Rate: 0.92", "label keeps the last good rate");
    ok &= expect(w.statusLabel()->text().contains("Host not found"), "status names the failure");

    if (!ok) return 1;
    std::cout << "test_forex_window passed" << std::endl;
    return 0;
}
