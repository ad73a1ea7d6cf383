#include "CurveChartSink.hpp"

#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>
#include <QString>
#include <QDebug>

#include <algorithm>
#include <cmath>

namespace gui {

CurveChartSink::CurveChartSink(QtCharts::QLineSeries* directLine,
                               QtCharts::QLineSeries* indirectLine,
                               QtCharts::QLineSeries* breakEvenLine,
                               QtCharts::QValueAxis*  xAxis,
                               QtCharts::QValueAxis*  yAxis)
  : direct_(directLine), indirect_(indirectLine), breakEven_(breakEvenLine),
    xAxis_(xAxis), yAxis_(yAxis) {}

void CurveChartSink::direct_level(double yield) {
  level_ = yield;
  pts_.clear();
  pts_.reserve(100);
}

void CurveChartSink::sample(double rate, double indirect_yield) {
  pts_.append(QPointF(rate, indirect_yield));
}

void CurveChartSink::break_even(double rate) {
  if (pts_.isEmpty()) return;

  // Bornes X : plage échantillonnée élargie au point mort s’il est dehors
  double xLo = std::min(pts_.front().x(), rate);
  double xHi = std::max(pts_.back().x(),  rate);
  if (xHi - xLo <= 0.0) {                 // plage dégénérée
    const double pad = std::max(1e-6, 0.01 * std::abs(xLo));
    xLo -= pad; xHi += pad;
  }

  // Bornes Y : courbe + niveau direct, 10% de marge visuelle
  double yLo = level_, yHi = level_;
  for (const auto& p : pts_) { yLo = std::min(yLo, p.y()); yHi = std::max(yHi, p.y()); }
  const double span = std::max(1e-9, yHi - yLo);
  yLo -= 0.10 * span;
  yHi += 0.10 * span;

  if (indirect_) indirect_->replace(pts_);
  if (direct_) {
    direct_->replace(QVector<QPointF>{ QPointF(xLo, level_), QPointF(xHi, level_) });
    direct_->setName(QString("Direct (%1)").arg(level_, 0, 'f', 0));
  }
  if (breakEven_) {
    breakEven_->replace(QVector<QPointF>{ QPointF(rate, yLo), QPointF(rate, yHi) });
    breakEven_->setName(QString("Break-even: %1").arg(rate, 0, 'f', 2));
  }
  if (xAxis_) xAxis_->setRange(xLo, xHi);
  if (yAxis_) yAxis_->setRange(yLo, yHi);

  qDebug() << "[chart] points=" << pts_.size() << "direct=" << level_ << "breakEven=" << rate
           << "x=[" << xLo << "," << xHi << "]";
}

} // namespace gui
