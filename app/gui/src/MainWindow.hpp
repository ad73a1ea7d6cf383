#pragma once
#include <QMainWindow>
#include <QSize>
#include <QString>

#include <fxr/routing/comparator.hpp>

QT_BEGIN_NAMESPACE
namespace Ui { class MainWindow; }
QT_END_NAMESPACE

namespace QtCharts {
  class QChartView;
  class QChart;
  class QLineSeries;
  class QValueAxis;
}

class MainWindow : public QMainWindow {
  Q_OBJECT
public:
  explicit MainWindow(QWidget* parent = nullptr);
  ~MainWindow() override;

private slots:
  void onRun();
  void onLoadDefaults();
  void onExportChartPng();

private:
  Ui::MainWindow* ui;

  void wireSignals();

  // Tableau de résultats
  void setupResultsTable();
  void setResults(const fxr::routing::ComparisonResult& res, double i2fRate);
  void clearResults();

  // ===== Graphe de comparaison =====
  void setupCurveChart();      // crée le chart dans le placeholder
  void resetCurveChart();      // vide les séries

  QtCharts::QChartView*  curveChartView_{nullptr};
  QtCharts::QLineSeries* directLine_{nullptr};     // horizontale : route directe
  QtCharts::QLineSeries* indirectLine_{nullptr};   // courbe : route pivot
  QtCharts::QLineSeries* breakEvenLine_{nullptr};  // verticale : point mort
  QtCharts::QValueAxis*  xAxis_{nullptr};
  QtCharts::QValueAxis*  yAxis_{nullptr};

  static bool saveWidgetPng(QWidget* w,
                            const QString& outPath,
                            const QSize& targetPx = QSize(),
                            qreal devicePixelRatio = 2.0);
};
