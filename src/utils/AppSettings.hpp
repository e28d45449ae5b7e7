#pragma once

#include <QColor>
#include <QString>
#include <opencv2/core.hpp>

#include "image/QRCode.hpp"

class QSettings;

/**
 * @brief 应用配置, 启动时加载, 关闭窗口时保存
 */
struct AppConfig {
  QRSettings generator;
  QString lastExportDir;
  QString logLevel = "info";
};

namespace AppSettings {
AppConfig load(QSettings &settings);
void save(QSettings &settings, const AppConfig &config);

// 使用应用程序的组织/应用名称打开默认存储
AppConfig load();
void save(const AppConfig &config);

int clampModuleSize(int size) noexcept;

QColor toQColor(const cv::Scalar &bgr);
cv::Scalar toScalar(const QColor &color);
} // namespace AppSettings
