#include "mainwindow.h"

#include <QCloseEvent>
#include <QColorDialog>
#include <QComboBox>
#include <QFileDialog>
#include <QFileInfo>
#include <QGroupBox>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPixmap>
#include <QPushButton>
#include <QSlider>
#include <QSpinBox>
#include <QStatusBar>
#include <QTextEdit>
#include <QVBoxLayout>
#include <spdlog/spdlog.h>

namespace {
const QString kPngFilter = QStringLiteral("PNG files (*.png)");
const QString kJpgFilter = QStringLiteral("JPEG files (*.jpg)");
const QString kAllFilter = QStringLiteral("All files (*)");

QString levelLabel(ErrorCorrection level) {
  const auto label = errorCorrectionLabel(level);
  return QString::fromUtf8(label.data(), static_cast<qsizetype>(label.size()));
}
} // namespace

MainWindow::MainWindow(const AppConfig &appConfig, QWidget *parent)
    : QMainWindow(parent), controller(appConfig.generator), config(appConfig) {
  spdlog::info("Initializing MainWindow");
  setWindowTitle(tr("QR Code Generator"));
  setFixedSize(WINDOW_WIDTH, WINDOW_HEIGHT);

  setupUI();
  applyConfig();
  setupConnections();

  spdlog::info("MainWindow initialized");
}

void MainWindow::setupUI() {
  auto centralWidget = new QWidget(this);
  auto mainLayout = new QVBoxLayout(centralWidget);
  mainLayout->setContentsMargins(20, 20, 20, 20);
  mainLayout->setSpacing(10);

  auto header = new QLabel(tr("QR Code Generator"));
  header->setAlignment(Qt::AlignCenter);
  header->setStyleSheet("font-size: 16pt; font-weight: bold;");

  mainLayout->addWidget(header);
  mainLayout->addWidget(createInputGroup());
  mainLayout->addWidget(createOptionsGroup());
  mainLayout->addWidget(createButtonRow());
  mainLayout->addWidget(createPreviewGroup(), 1);

  setCentralWidget(centralWidget);

  // 状态栏
  statusLabel = new QLabel(this);
  statusBar()->addWidget(statusLabel, 1);
  updateStatusMessage(tr("Ready"));
}

QGroupBox *MainWindow::createInputGroup() {
  auto group = new QGroupBox(tr("Input"));
  auto layout = new QVBoxLayout(group);

  layout->addWidget(new QLabel(tr("Enter text or URL:")));
  textInput = new QTextEdit;
  textInput->setAcceptRichText(false);
  // 约三行高度
  textInput->setFixedHeight(textInput->fontMetrics().lineSpacing() * 3 + 12);
  layout->addWidget(textInput);
  return group;
}

QGroupBox *MainWindow::createOptionsGroup() {
  auto group = new QGroupBox(tr("Options"));
  auto layout = new QVBoxLayout(group);

  auto errorRow = new QHBoxLayout;
  errorRow->addWidget(new QLabel(tr("Error Correction:")));
  errorRow->addStretch();
  errorCorrectionBox = new QComboBox;
  for (auto level : {ErrorCorrection::Low, ErrorCorrection::Medium,
                     ErrorCorrection::Quartile, ErrorCorrection::High}) {
    errorCorrectionBox->addItem(levelLabel(level), static_cast<int>(level));
  }
  errorRow->addWidget(errorCorrectionBox);
  layout->addLayout(errorRow);

  auto sizeRow = new QHBoxLayout;
  sizeRow->addWidget(new QLabel(tr("Size:")));
  sizeSlider = new QSlider(Qt::Horizontal);
  sizeSlider->setRange(kMinModuleSize, kMaxModuleSize);
  sizeValueLabel = new QLabel;
  sizeValueLabel->setMinimumWidth(24);
  sizeRow->addWidget(sizeSlider, 1);
  sizeRow->addWidget(sizeValueLabel);
  layout->addLayout(sizeRow);

  auto borderRow = new QHBoxLayout;
  borderRow->addWidget(new QLabel(tr("Border:")));
  borderRow->addStretch();
  borderSpinBox = new QSpinBox;
  borderSpinBox->setRange(0, kMaxBorder);
  borderSpinBox->setSuffix(tr(" modules"));
  borderRow->addWidget(borderSpinBox);
  layout->addLayout(borderRow);

  auto colorRow = new QHBoxLayout;
  colorRow->addWidget(new QLabel(tr("Colors:")));
  colorRow->addStretch();
  fillColorButton = new QPushButton(tr("Foreground"));
  backColorButton = new QPushButton(tr("Background"));
  colorRow->addWidget(fillColorButton);
  colorRow->addWidget(backColorButton);
  layout->addLayout(colorRow);

  return group;
}

QWidget *MainWindow::createButtonRow() {
  auto container = new QWidget;
  auto layout = new QHBoxLayout(container);
  layout->setContentsMargins(0, 0, 0, 0);
  layout->setSpacing(10);

  generateButton = new QPushButton(tr("Generate QR Code"));
  saveButton = new QPushButton(tr("Save Image"));
  for (auto *btn : {generateButton, saveButton}) {
    btn->setFixedHeight(32);
    layout->addWidget(btn, 1);
  }
  return container;
}

QGroupBox *MainWindow::createPreviewGroup() {
  auto group = new QGroupBox(tr("Preview"));
  auto layout = new QVBoxLayout(group);

  previewLabel = new QLabel(tr("QR code will appear here"));
  previewLabel->setAlignment(Qt::AlignCenter);
  previewLabel->setMinimumSize(PREVIEW_SIZE, PREVIEW_SIZE);
  layout->addWidget(previewLabel, 1);
  return group;
}

void MainWindow::applyConfig() {
  const QRSettings &settings = controller.currentSettings();

  errorCorrectionBox->setCurrentIndex(
      errorCorrectionBox->findData(static_cast<int>(settings.errorCorrection)));
  sizeSlider->setValue(settings.moduleSize);
  sizeValueLabel->setText(QString::number(settings.moduleSize));
  borderSpinBox->setValue(settings.border);
  updateColorButton(fillColorButton, settings.fillColor);
  updateColorButton(backColorButton, settings.backColor);
}

void MainWindow::setupConnections() {
  connect(generateButton, &QPushButton::clicked, this,
          &MainWindow::onGenerateClicked);
  connect(saveButton, &QPushButton::clicked, this,
          &MainWindow::onSaveClicked);
  connect(errorCorrectionBox, &QComboBox::currentIndexChanged, this,
          &MainWindow::onErrorCorrectionChanged);
  connect(sizeSlider, &QSlider::valueChanged, this,
          &MainWindow::onSizeChanged);
  connect(borderSpinBox, &QSpinBox::valueChanged, this,
          &MainWindow::onBorderChanged);
  connect(fillColorButton, &QPushButton::clicked, this,
          &MainWindow::chooseFillColor);
  connect(backColorButton, &QPushButton::clicked, this,
          &MainWindow::chooseBackColor);

  connect(&controller, &QRController::imageChanged, this,
          &MainWindow::showPreview);
  connect(&controller, &QRController::statusChanged, this,
          &MainWindow::updateStatusMessage);
  connect(&controller, &QRController::errorOccurred, this,
          &MainWindow::showError);
  connect(&controller, &QRController::exported, this,
          &MainWindow::rememberExportDir);
}

void MainWindow::onGenerateClicked() {
  const QString text = textInput->toPlainText().trimmed();
  if (text.isEmpty()) {
    QMessageBox::warning(this, tr("Warning"), tr("Please enter text or URL"));
    return;
  }

  controller.setText(text.toStdString());
  if (!controller.generate())
    updateStatusMessage(tr("Error generating QR code"));
}

void MainWindow::onSaveClicked() {
  if (!controller.hasImage()) {
    QMessageBox::warning(this, tr("Warning"),
                         tr("Generate a QR code first before saving"));
    return;
  }

  ExportFormat format = ExportFormat::PNG;
  const QString path = chooseExportPath(format);
  if (path.isEmpty())
    return;

  if (controller.onExportRequested({toExportPath(path), format})) {
    QMessageBox::information(this, tr("Success"),
                             tr("QR code saved to:\n%1").arg(path));
  }
}

QString MainWindow::chooseExportPath(ExportFormat &format) {
  QString selectedFilter = kPngFilter;
  QString path = QFileDialog::getSaveFileName(
      this, tr("Save QR Code"), config.lastExportDir,
      QStringList{kPngFilter, kJpgFilter, kAllFilter}.join(";;"),
      &selectedFilter);
  if (path.isEmpty())
    return path;

  // 优先使用所选过滤器, 否则根据扩展名判断, 默认PNG
  const auto byExtension = formatFromPath(toExportPath(path));
  if (selectedFilter == kJpgFilter) {
    format = ExportFormat::JPG;
  } else if (selectedFilter == kPngFilter) {
    format = ExportFormat::PNG;
  } else {
    format = byExtension.value_or(ExportFormat::PNG);
  }

  if (QFileInfo(path).suffix().isEmpty()) {
    path += QString::fromUtf8(extensionFor(format).data());
  }
  spdlog::debug("Export path chosen: {}", path.toStdString());
  return path;
}

void MainWindow::onErrorCorrectionChanged(int index) {
  const auto level =
      static_cast<ErrorCorrection>(errorCorrectionBox->itemData(index).toInt());
  controller.setErrorCorrection(level);
  config.generator = controller.currentSettings();
}

void MainWindow::onSizeChanged(int value) {
  sizeValueLabel->setText(QString::number(value));
  // 不自动重新生成, 预览保持为上次生成的结果
  controller.setModuleSize(value);
  config.generator = controller.currentSettings();
}

void MainWindow::onBorderChanged(int value) {
  controller.setBorder(value);
  config.generator = controller.currentSettings();
}

void MainWindow::chooseFillColor() {
  const QRSettings &settings = controller.currentSettings();
  const QColor color =
      QColorDialog::getColor(AppSettings::toQColor(settings.fillColor), this,
                             tr("Foreground Color"));
  if (!color.isValid())
    return;
  controller.setColors(AppSettings::toScalar(color), settings.backColor);
  config.generator = controller.currentSettings();
  updateColorButton(fillColorButton, controller.currentSettings().fillColor);
}

void MainWindow::chooseBackColor() {
  const QRSettings &settings = controller.currentSettings();
  const QColor color =
      QColorDialog::getColor(AppSettings::toQColor(settings.backColor), this,
                             tr("Background Color"));
  if (!color.isValid())
    return;
  controller.setColors(settings.fillColor, AppSettings::toScalar(color));
  config.generator = controller.currentSettings();
  updateColorButton(backColorButton, controller.currentSettings().backColor);
}

void MainWindow::updateColorButton(QPushButton *button,
                                   const cv::Scalar &color) {
  const QColor qcolor = AppSettings::toQColor(color);
  const QString textColor = qcolor.lightness() < 128 ? "white" : "black";
  button->setStyleSheet(QString("QPushButton { background-color: %1; color: "
                                "%2; border: 1px solid #999999; "
                                "border-radius: 4px; padding: 4px 10px; }")
                            .arg(qcolor.name(), textColor));
}

void MainWindow::showPreview(const QImage &image) {
  if (image.isNull())
    return;
  // 最近邻缩放, 保持模块边缘清晰
  previewLabel->setPixmap(QPixmap::fromImage(image).scaled(
      PREVIEW_SIZE, PREVIEW_SIZE, Qt::KeepAspectRatio,
      Qt::FastTransformation));
}

void MainWindow::showError(ControllerError error, const QString &message) {
  spdlog::error("{}", message.toStdString());
  if (error == ControllerError::EmptyInput ||
      error == ControllerError::NoImage) {
    QMessageBox::warning(this, tr("Warning"), message);
  } else {
    QMessageBox::critical(this, tr("Error"), message);
  }
}

void MainWindow::updateStatusMessage(const QString &message) {
  statusLabel->setText(message);
  spdlog::debug("Status: {}", message.toStdString());
}

void MainWindow::rememberExportDir(const QString &path) {
  config.lastExportDir = QFileInfo(path).absolutePath();
}

void MainWindow::closeEvent(QCloseEvent *event) {
  config.generator = controller.currentSettings();
  AppSettings::save(config);
  spdlog::info("Settings saved, closing main window");
  QMainWindow::closeEvent(event);
}
