#ifndef MAINWINDOW_H
#define MAINWINDOW_H

#include <QMainWindow>

#include "QRController.hpp"
#include "utils/AppSettings.hpp"

class QComboBox;
class QLabel;
class QPushButton;
class QSlider;
class QSpinBox;
class QTextEdit;
class QGroupBox;

class MainWindow : public QMainWindow {
  Q_OBJECT

public:
  explicit MainWindow(const AppConfig &config, QWidget *parent = nullptr);

protected:
  void closeEvent(QCloseEvent *event) override;

private slots:
  void onGenerateClicked();
  void onSaveClicked();
  void onErrorCorrectionChanged(int index);
  void onSizeChanged(int value);
  void onBorderChanged(int value);
  void chooseFillColor();
  void chooseBackColor();
  void showPreview(const QImage &image);
  void showError(ControllerError error, const QString &message);
  void updateStatusMessage(const QString &message);
  void rememberExportDir(const QString &path);

private:
  void setupUI();
  QGroupBox *createInputGroup();
  QGroupBox *createOptionsGroup();
  QWidget *createButtonRow();
  QGroupBox *createPreviewGroup();
  void setupConnections();
  void applyConfig();
  void updateColorButton(QPushButton *button, const cv::Scalar &color);
  QString chooseExportPath(ExportFormat &format);

  QRController controller;
  AppConfig config;

  QTextEdit *textInput;
  QComboBox *errorCorrectionBox;
  QSlider *sizeSlider;
  QLabel *sizeValueLabel;
  QSpinBox *borderSpinBox;
  QPushButton *fillColorButton;
  QPushButton *backColorButton;
  QPushButton *generateButton;
  QPushButton *saveButton;
  QLabel *previewLabel;
  QLabel *statusLabel;

  static constexpr int WINDOW_WIDTH = 500;
  static constexpr int WINDOW_HEIGHT = 640;
  static constexpr int PREVIEW_SIZE = 250;
};

#endif // MAINWINDOW_H
