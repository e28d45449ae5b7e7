#include "AppSettings.hpp"

#include <QSettings>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace {
const QString kGroup = QStringLiteral("Generator");

QString levelLabel(ErrorCorrection level) {
  const auto label = errorCorrectionLabel(level);
  return QString::fromUtf8(label.data(), static_cast<qsizetype>(label.size()));
}

QColor readColor(QSettings &settings, const QString &key,
                 const QColor &fallback) {
  QColor color(settings.value(key, fallback.name()).toString());
  if (!color.isValid()) {
    spdlog::warn("Ignoring invalid colour for {}", key.toStdString());
    return fallback;
  }
  return color;
}
} // namespace

namespace AppSettings {

int clampModuleSize(int size) noexcept {
  return std::clamp(size, kMinModuleSize, kMaxModuleSize);
}

QColor toQColor(const cv::Scalar &bgr) {
  return QColor(static_cast<int>(bgr[2]), static_cast<int>(bgr[1]),
                static_cast<int>(bgr[0]));
}

cv::Scalar toScalar(const QColor &color) {
  return cv::Scalar(color.blue(), color.green(), color.red());
}

AppConfig load(QSettings &settings) {
  AppConfig config;
  QRSettings &gen = config.generator;

  settings.beginGroup(kGroup);

  const auto level = errorCorrectionFromLabel(
      settings.value("ErrorCorrection", levelLabel(gen.errorCorrection))
          .toString()
          .toStdString());
  if (level) {
    gen.errorCorrection = *level;
  } else {
    spdlog::warn("Unknown error correction level in settings, using default");
  }

  gen.moduleSize =
      clampModuleSize(settings.value("ModuleSize", gen.moduleSize).toInt());
  gen.border = std::clamp(settings.value("Border", gen.border).toInt(), 0,
                          kMaxBorder);
  gen.fillColor = toScalar(
      readColor(settings, "FillColor", toQColor(gen.fillColor)));
  gen.backColor = toScalar(
      readColor(settings, "BackColor", toQColor(gen.backColor)));

  config.lastExportDir = settings.value("LastExportDir").toString();
  config.logLevel = settings.value("LogLevel", config.logLevel).toString();

  settings.endGroup();
  return config;
}

void save(QSettings &settings, const AppConfig &config) {
  const QRSettings &gen = config.generator;

  settings.beginGroup(kGroup);
  settings.setValue("ErrorCorrection", levelLabel(gen.errorCorrection));
  settings.setValue("ModuleSize", gen.moduleSize);
  settings.setValue("Border", gen.border);
  settings.setValue("FillColor", toQColor(gen.fillColor).name());
  settings.setValue("BackColor", toQColor(gen.backColor).name());
  settings.setValue("LastExportDir", config.lastExportDir);
  settings.setValue("LogLevel", config.logLevel);
  settings.endGroup();

  settings.sync();
}

AppConfig load() {
  QSettings settings;
  return load(settings);
}

void save(const AppConfig &config) {
  QSettings settings;
  save(settings, config);
}

} // namespace AppSettings
