#pragma once
#include <QMainWindow>
#include <memory>
#include "ForexConfig.h"
#include "ForexController.h"
#include "HttpTransport.h"

class QLineEdit; class QComboBox; class QPushButton; class QLabel; class QTimer;
class RatePlotWidget;

class ForexWindow : public QMainWindow {
    Q_OBJECT
public:
    explicit ForexWindow(const ForexConfig& config, std::shared_ptr<HttpTransport> transport = nullptr, QWidget* parent=nullptr);
    ForexController* controller() const { return ctrl; }
    QLineEdit* apiKeyEdit() const { return edtKey; }
    QComboBox* baseCombo() const { return cmbBase; }
    QComboBox* targetCombo() const { return cmbTarget; }
    QPushButton* fetchRateButton() const { return btnRate; }
    QPushButton* fetchHistoryButton() const { return btnHistory; }
    QLabel* rateLabel() const { return lblRate; }
    QLabel* statusLabel() const { return lblStatus; }
    RatePlotWidget* trendPlot() const { return plotTrend; }
    RatePlotWidget* historicalPlot() const { return plotHistory; }
public slots:
    // Frame tick: drain one result, then redraw
    void onFrame();
private:
    void render();
    ForexController* ctrl=nullptr;
    QLineEdit* edtKey=nullptr; QComboBox* cmbBase=nullptr; QComboBox* cmbTarget=nullptr;
    QPushButton* btnRate=nullptr; QPushButton* btnHistory=nullptr; QLabel* lblRate=nullptr; QLabel* lblStatus=nullptr;
    RatePlotWidget* plotTrend=nullptr; RatePlotWidget* plotHistory=nullptr;
    QTimer* frameTimer=nullptr;
};
