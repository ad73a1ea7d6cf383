#pragma once
#include <QPointF>
#include <QVector>

#include <fxr/curve/curve.hpp>

namespace QtCharts {
  class QLineSeries;
  class QValueAxis;
}

namespace gui {

// Adaptateur CurveSink -> séries Qt Charts.
// Les points sont accumulés puis posés d’un bloc sur break_even()
// (dernier appel de emit_curve) : les bornes des lignes de référence
// dépendent de toute la courbe.
class CurveChartSink : public fxr::curve::CurveSink {
public:
  CurveChartSink(QtCharts::QLineSeries* directLine,
                 QtCharts::QLineSeries* indirectLine,
                 QtCharts::QLineSeries* breakEvenLine,
                 QtCharts::QValueAxis*  xAxis,
                 QtCharts::QValueAxis*  yAxis);

  void direct_level(double yield) override;
  void sample(double rate, double indirect_yield) override;
  void break_even(double rate) override;

private:
  QtCharts::QLineSeries* direct_;
  QtCharts::QLineSeries* indirect_;
  QtCharts::QLineSeries* breakEven_;
  QtCharts::QValueAxis*  xAxis_;
  QtCharts::QValueAxis*  yAxis_;

  double level_{0.0};
  QVector<QPointF> pts_;
};

} // namespace gui
