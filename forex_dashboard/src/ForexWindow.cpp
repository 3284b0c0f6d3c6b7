#include "ForexWindow.h"
#include "RatePlotWidget.h"
#include "Currency.h"
#include <QComboBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QLineEdit>
#include <QPushButton>
#include <QScrollArea>
#include <QStatusBar>
#include <QTimer>
#include <QVBoxLayout>
#include <QDebug>

ForexWindow::ForexWindow(const ForexConfig& config, std::shared_ptr<HttpTransport> transport, QWidget* parent) : QMainWindow(parent) {
    if (!transport) transport = std::make_shared<QtHttpTransport>(config.httpTimeoutMs);
    ctrl = new ForexController(std::move(transport), config, this);
    setWindowTitle("Forex Rate Fetcher"); resize(820, 900);

    auto* scroll = new QScrollArea(this); scroll->setWidgetResizable(true); setCentralWidget(scroll);
    auto* central = new QWidget(scroll); scroll->setWidget(central);
    auto* pv = new QVBoxLayout(central); pv->setSpacing(10);

    auto* heading = new QLabel("Forex Rate Fetcher", central);
    QFont hf = heading->font(); hf.setPointSizeF(hf.pointSizeF()*1.6); hf.setBold(true); heading->setFont(hf);
    pv->addWidget(heading);

    auto* keyRow = new QHBoxLayout(); keyRow->addWidget(new QLabel("API Key:", central));
    edtKey = new QLineEdit(central); edtKey->setObjectName("apiKey"); keyRow->addWidget(edtKey, 1);
    pv->addLayout(keyRow);

    auto* curRow = new QHBoxLayout();
    curRow->addWidget(new QLabel("Base Currency:", central));
    cmbBase = new QComboBox(central); cmbBase->addItems(supportedCurrencies()); cmbBase->setCurrentText(ctrl->state().pair.base); curRow->addWidget(cmbBase);
    curRow->addWidget(new QLabel("Target Currency:", central));
    cmbTarget = new QComboBox(central); cmbTarget->addItems(supportedCurrencies()); cmbTarget->setCurrentText(ctrl->state().pair.target); curRow->addWidget(cmbTarget);
    curRow->addStretch();
    pv->addLayout(curRow);

    btnRate = new QPushButton("Fetch Rate", central);
    btnHistory = new QPushButton("Fetch Historical Rates", central);
    auto* btnRow = new QHBoxLayout(); btnRow->addWidget(btnRate); btnRow->addWidget(btnHistory); btnRow->addStretch();
    pv->addLayout(btnRow);

    lblRate = new QLabel(central); lblRate->setTextInteractionFlags(Qt::TextSelectableByMouse); pv->addWidget(lblRate);

    plotTrend = new RatePlotWidget("Trend", central); pv->addWidget(plotTrend);
    plotHistory = new RatePlotWidget("Historical Rates", central); pv->addWidget(plotHistory);
    pv->addStretch();
    lblStatus = new QLabel(this); statusBar()->addPermanentWidget(lblStatus, 1);

    connect(edtKey, &QLineEdit::textChanged, ctrl, &ForexController::setApiKey);
    connect(cmbBase, &QComboBox::currentTextChanged, ctrl, &ForexController::setBaseCurrency);
    connect(cmbTarget, &QComboBox::currentTextChanged, ctrl, &ForexController::setTargetCurrency);
    connect(btnRate, &QPushButton::clicked, this, [this](){
        if (!ctrl->fetchRate()) statusBar()->showMessage(QString("Rate for %1 already being fetched").arg(ctrl->state().pair.code()), 3000);
        render();
    });
    connect(btnHistory, &QPushButton::clicked, this, [this](){
        if (!ctrl->fetchHistory()) statusBar()->showMessage(QString("History for %1 already being fetched").arg(ctrl->state().pair.code()), 3000);
        render();
    });
    connect(ctrl, &ForexController::stateChanged, this, &ForexWindow::render);

    frameTimer = new QTimer(this);
    connect(frameTimer, &QTimer::timeout, this, &ForexWindow::onFrame);
    frameTimer->start(config.frameIntervalMs);
    render();
}

void ForexWindow::onFrame() {
    ctrl->frame();
    render();
}

void ForexWindow::render() {
    const AppState& s = ctrl->state();
    lblRate->setText(rateLabelText(s));
    plotTrend->setValues(s.trend); plotTrend->setVisible(!s.trend.isEmpty());
    QVector<double> hist; hist.reserve(s.historicalRates.size());
    for (const auto& r : s.historicalRates) hist.push_back(r.rate);
    plotHistory->setValues(hist); plotHistory->setVisible(!hist.isEmpty());
    const int busy = ctrl->coordinator().inFlightCount();
    QString status;
    if (busy > 0) status = QString("Fetching... (%1 in flight)").arg(busy);
    else if (s.lastError) status = QString("Last %1 fetch failed, %2").arg(s.lastErrorKind==FetchKind::History?"history":"rate", s.lastError->toString());
    if (lblStatus->text() != status) lblStatus->setText(status);
}
