#include "RatePlotWidget.h"
#include <QVBoxLayout>
#include <QPainter>
#include <algorithm>
#include <cmath>

RatePlotWidget::RatePlotWidget(const QString& title, QWidget* parent) : QWidget(parent) {
    chart = new QChart(); chart->setTitle(title); chart->legend()->setVisible(false);
    chart->setAnimationOptions(QChart::NoAnimation); chart->setTheme(QChart::ChartThemeDark);
    series = new QLineSeries(); chart->addSeries(series);
    axisX = new QValueAxis(); axisX->setLabelFormat("%d"); chart->addAxis(axisX, Qt::AlignBottom); series->attachAxis(axisX);
    axisY = new QValueAxis(); axisY->setLabelFormat("%.4f"); chart->addAxis(axisY, Qt::AlignLeft); series->attachAxis(axisY);
    view = new QChartView(chart, this); view->setRenderHint(QPainter::Antialiasing);
    auto* layout = new QVBoxLayout(this); layout->setContentsMargins(0,0,0,0); layout->addWidget(view);
    QSizePolicy sp(QSizePolicy::Expanding, QSizePolicy::Preferred); sp.setHeightForWidth(true); setSizePolicy(sp);
    setMinimumHeight(160);
}

void RatePlotWidget::setValues(const QVector<double>& values) {
    if (values == current) return;
    current = values;
    QList<QPointF> pts; pts.reserve(values.size());
    for (int i=0; i<values.size(); ++i) pts.append(QPointF(i, values[i]));
    series->replace(pts);
    if (values.isEmpty()) return;
    auto [lo, hi] = std::minmax_element(values.cbegin(), values.cend());
    // 5% padding, or a fixed band around a flat line
    double pad = (*hi - *lo) * 0.05; if (pad <= 0.0) pad = std::max(std::abs(*hi) * 0.01, 1e-6);
    axisY->setRange(*lo - pad, *hi + pad);
    axisX->setRange(0, std::max(1, int(values.size()) - 1));
    axisX->setTickCount(std::clamp(int(values.size()), 2, 11));
}
