#include "MainWindow.hpp"
#include "ui_MainWindow.h"

#include <QMessageBox>
#include <QPushButton>
#include <QColor>
#include <QPen>
#include <QTableWidgetItem>
#include <QStatusBar>
#include <QDebug>

#include <QtCharts/QChartView>
#include <QtCharts/QChart>
#include <QtCharts/QLineSeries>
#include <QtCharts/QValueAxis>

#include <QHeaderView>
#include <QTableWidget>
#include <QImage>
#include <QPainter>
#include <QVBoxLayout>
#include <QFileDialog>
#include <QDir>
#include <QDateTime>

#include <cstddef>

#include "CurveChartSink.hpp"

// FXR
#include <fxr/config/forex_config.hpp>
#include <fxr/market/conversion_inputs.hpp>
#include <fxr/routing/report.hpp>
#include <fxr/curve/curve.hpp>

namespace {
const QColor C_DIRECT  (229,57,53);    // route directe (rouge, tirets)
const QColor C_VIA     (30,136,229);   // route pivot (bleu)
const QColor C_BREAK   (67,160,71);    // point mort (vert, pointillés)
}

MainWindow::MainWindow(QWidget* parent)
  : QMainWindow(parent), ui(new Ui::MainWindow) {
  ui->setupUi(this);
  wireSignals();

  setupResultsTable();
  setupCurveChart();

  onLoadDefaults();
  setWindowTitle("FxRoute");
}

MainWindow::~MainWindow() {
  // La vue possède son QChart (et donc séries/axes)
  delete curveChartView_; curveChartView_ = nullptr;
  delete ui;
}

void MainWindow::wireSignals() {
  connect(ui->btnRun,          &QPushButton::clicked, this, &MainWindow::onRun);
  connect(ui->btnLoadDefaults, &QPushButton::clicked, this, &MainWindow::onLoadDefaults);
  connect(ui->btnExportPng,    &QPushButton::clicked, this, &MainWindow::onExportChartPng);
}

void MainWindow::onLoadDefaults() {
  const fxr::config::ForexConfig cfg;
  ui->sbBudget->setValue(cfg.budget);
  ui->sbDirectRate->setValue(cfg.direct_rate);
  ui->sbHomeToIntermediate->setValue(cfg.home_to_intermediate_rate);
  ui->sbI2fMin->setValue(cfg.i2f_min);
  ui->sbI2fMax->setValue(cfg.i2f_max);
}

void MainWindow::onRun() {
  const double budget = ui->sbBudget->value();
  const double direct = ui->sbDirectRate->value();
  const double h2i    = ui->sbHomeToIntermediate->value();
  const double lo     = ui->sbI2fMin->value();
  const double hi     = ui->sbI2fMax->value();

  qDebug() << "[run]" << "budget=" << budget << "direct=" << direct
           << "h2i=" << h2i << "range=[" << lo << "," << hi << "]";

  try {
    // Validation avant tout calcul
    const fxr::market::ConversionInputs in(budget, direct, h2i);
    const fxr::market::RateRange range(lo, hi);

    const double rate = fxr::market::midpoint(range);
    const auto res   = fxr::routing::compare(in, rate);
    const auto curve = fxr::curve::generate_curve(in, range);

    setResults(res, rate);

    resetCurveChart();
    gui::CurveChartSink sink(directLine_, indirectLine_, breakEvenLine_, xAxis_, yAxis_);
    fxr::curve::emit_curve(curve, sink);

    if (curve.break_even_in_range()) {
      statusBar()->showMessage(tr("Break-even %1 inside [%2, %3]")
                                 .arg(curve.break_even_rate, 0, 'f', 2)
                                 .arg(lo, 0, 'f', 2).arg(hi, 0, 'f', 2), 4000);
    } else {
      statusBar()->showMessage(tr("Break-even %1 outside [%2, %3] (axis widened)")
                                 .arg(curve.break_even_rate, 0, 'f', 2)
                                 .arg(lo, 0, 'f', 2).arg(hi, 0, 'f', 2), 6000);
    }
  } catch (const fxr::market::InvalidInput& e) {
    qWarning() << "[run] invalid input:" << e.what();
    clearResults();
    resetCurveChart();
    QMessageBox::warning(this, tr("Invalid input"), QString::fromUtf8(e.what()));
  }
}

// ========================= Résultats =========================
void MainWindow::setupResultsTable() {
  auto* t = ui->tblResults;
  t->setColumnCount(2);
  t->setHorizontalHeaderLabels({tr("Scenario"), tr("Value")});
  t->horizontalHeader()->setSectionResizeMode(0, QHeaderView::Stretch);
  t->horizontalHeader()->setSectionResizeMode(1, QHeaderView::ResizeToContents);
  t->verticalHeader()->setVisible(false);
  t->setEditTriggers(QAbstractItemView::NoEditTriggers);
  t->setSelectionMode(QAbstractItemView::NoSelection);
}

void MainWindow::setResults(const fxr::routing::ComparisonResult& res, double i2fRate) {
  const fxr::config::ForexConfig cfg;
  const auto rows = fxr::routing::result_rows(res);

  ui->tblResults->setRowCount(static_cast<int>(rows.size()));
  for (int i = 0; i < static_cast<int>(rows.size()); ++i) {
    const auto& r = rows[static_cast<std::size_t>(i)];
    auto* label = new QTableWidgetItem(QString::fromStdString(r.label));
    auto* value = new QTableWidgetItem(
        QString::fromStdString(fxr::routing::format_value(r.value, cfg.precision)));
    value->setTextAlignment(Qt::AlignRight | Qt::AlignVCenter);
    ui->tblResults->setItem(i, 0, label);
    ui->tblResults->setItem(i, 1, value);
  }

  QString verdict;
  switch (fxr::routing::better_route(res)) {
    case fxr::routing::Route::Direct:   verdict = tr("Direct route yields more"); break;
    case fxr::routing::Route::Indirect: verdict = tr("Route via intermediate yields more"); break;
    case fxr::routing::Route::Tie:      verdict = tr("Both routes yield the same"); break;
  }
  ui->lblVerdict->setText(tr("%1 (at intermediate → foreign = %2)")
                            .arg(verdict).arg(i2fRate, 0, 'f', 2));
}

void MainWindow::clearResults() {
  ui->tblResults->setRowCount(0);
  ui->lblVerdict->clear();
}

// ========================= Graphe =========================
void MainWindow::setupCurveChart() {
  if (curveChartView_) return;

  using namespace QtCharts;

  // Le chart est parent de toutes les séries/axes
  auto* chart = new QChart();
  chart->setTitle(tr("Direct vs via intermediate"));
  chart->legend()->setVisible(true);
  chart->legend()->setAlignment(Qt::AlignBottom);

  xAxis_ = new QValueAxis(chart);
  yAxis_ = new QValueAxis(chart);
  xAxis_->setTitleText(tr("Intermediate → foreign rate"));
  yAxis_->setTitleText(tr("Foreign currency obtained"));
  xAxis_->setLabelFormat("%.2f");
  yAxis_->setLabelFormat("%.0f");
  chart->addAxis(xAxis_, Qt::AlignBottom);
  chart->addAxis(yAxis_, Qt::AlignLeft);

  directLine_    = new QLineSeries(chart); directLine_->setName(tr("Direct"));
  indirectLine_  = new QLineSeries(chart); indirectLine_->setName(tr("Via intermediate"));
  breakEvenLine_ = new QLineSeries(chart); breakEvenLine_->setName(tr("Break-even"));

  directLine_->setPen(QPen(C_DIRECT, 1.8, Qt::DashLine));
  indirectLine_->setPen(QPen(C_VIA, 2.0, Qt::SolidLine));
  breakEvenLine_->setPen(QPen(C_BREAK, 1.8, Qt::DotLine));

  chart->addSeries(directLine_);
  chart->addSeries(indirectLine_);
  chart->addSeries(breakEvenLine_);

  directLine_->attachAxis(xAxis_);    directLine_->attachAxis(yAxis_);
  indirectLine_->attachAxis(xAxis_);  indirectLine_->attachAxis(yAxis_);
  breakEvenLine_->attachAxis(xAxis_); breakEvenLine_->attachAxis(yAxis_);

  curveChartView_ = new QChartView(chart, ui->chartContainer);
  curveChartView_->setRenderHint(QPainter::Antialiasing);

  auto* lay = new QVBoxLayout(ui->chartContainer);
  lay->setContentsMargins(0,0,0,0);
  lay->addWidget(curveChartView_);
}

void MainWindow::resetCurveChart() {
  setupCurveChart();
  directLine_->clear();
  indirectLine_->clear();
  breakEvenLine_->clear();
  directLine_->setName(tr("Direct"));
  breakEvenLine_->setName(tr("Break-even"));
}

// ========================= Export =========================
bool MainWindow::saveWidgetPng(QWidget* w, const QString& outPath,
                               const QSize& targetPx, qreal dpr) {
  if (!w) return false;
  const QSize base = targetPx.isValid() ? targetPx : w->size();
  const QSize hiRes(int(base.width() * dpr), int(base.height() * dpr));

  QImage img(hiRes, QImage::Format_ARGB32_Premultiplied);
  img.setDevicePixelRatio(dpr);
  img.fill(Qt::transparent);

  w->render(&img);
  return img.save(outPath, "PNG");
}

void MainWindow::onExportChartPng() {
  const QString suggested = QDir::current().filePath(
      "fxroute_" + QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss") + ".png");

  const QString fn = QFileDialog::getSaveFileName(
      this, tr("Export chart"), suggested, tr("PNG (*.png)"));
  if (fn.isEmpty()) return;

  if (!saveWidgetPng(ui->chartContainer, fn)) {
    qWarning() << "[UI] PNG export failed:" << fn;
    QMessageBox::warning(this, tr("Export chart"), tr("Cannot write %1").arg(fn));
    return;
  }
  statusBar()->showMessage(tr("Chart exported to %1").arg(QDir::toNativeSeparators(fn)), 3000);
}
