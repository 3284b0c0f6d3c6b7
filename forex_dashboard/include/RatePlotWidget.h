#pragma once
#include <QWidget>
#include <QVector>
#include <QtCharts/QChart>
#include <QtCharts/QChartView>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>

// Index-vs-value line plot kept at a 2:1 aspect ratio
class RatePlotWidget : public QWidget {
    Q_OBJECT
public:
    explicit RatePlotWidget(const QString& title, QWidget* parent=nullptr);
    // No-op when the values did not change
    void setValues(const QVector<double>& values);
    const QVector<double>& values() const { return current; }
    bool hasHeightForWidth() const override { return true; }
    int heightForWidth(int w) const override { return w / 2; }
    QSize sizeHint() const override { return {640, 320}; }
private:
    QChart* chart=nullptr; QChartView* view=nullptr;
    QLineSeries* series=nullptr; QValueAxis* axisX=nullptr; QValueAxis* axisY=nullptr;
    QVector<double> current;
};
