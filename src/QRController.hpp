#pragma once

#include <QImage>
#include <QObject>
#include <QString>

#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "image/ImageIO.hpp"
#include "image/QRCode.hpp"

enum class ControllerError { EmptyInput, Encoding, NoImage, Write };

std::string_view errorToString(ControllerError error) noexcept;

// QString到文件系统路径, 不经过本地8位编码
fs::path toExportPath(const QString &path);

/**
 * @class QRController
 * @brief 持有当前输入与最近一次生成的图像, 响应生成与导出操作
 *
 * Changing the inputs never touches the held image; it is replaced only by
 * a successful generation. Export writes the held image, so after a
 * settings change without regeneration the previous settings are exported.
 */
class QRController : public QObject {
  Q_OBJECT

public:
  enum class State { Idle, Generated };
  Q_ENUM(State)

  explicit QRController(QObject *parent = nullptr);
  explicit QRController(const QRSettings &initial, QObject *parent = nullptr);

  auto onGenerateRequested(const std::string &text, const QRSettings &settings)
      -> std::expected<void, ControllerError>;
  // 使用当前文本和设置生成
  auto generate() -> std::expected<void, ControllerError>;
  auto onExportRequested(const ExportRequest &request)
      -> std::expected<void, ControllerError>;

  void setText(const std::string &text);
  void setSettings(const QRSettings &settings);
  void setErrorCorrection(ErrorCorrection level);
  void setModuleSize(int size);
  void setBorder(int border);
  void setColors(const cv::Scalar &fill, const cv::Scalar &back);

  [[nodiscard]] State state() const noexcept { return state_; }
  [[nodiscard]] bool hasImage() const noexcept { return image_.has_value(); }
  [[nodiscard]] const std::optional<GeneratedImage> &image() const noexcept {
    return image_;
  }
  [[nodiscard]] const QRSettings &currentSettings() const noexcept {
    return settings_;
  }
  [[nodiscard]] const std::string &currentText() const noexcept {
    return text_;
  }
  QImage previewImage() const;

signals:
  void imageChanged(const QImage &image);
  void stateChanged(QRController::State state);
  void statusChanged(const QString &message);
  // 仅在文件成功写入后发出
  void exported(const QString &path);
  void errorOccurred(ControllerError error, const QString &message);

private:
  auto fail(ControllerError error, const QString &detail = {})
      -> std::expected<void, ControllerError>;
  void verifyScan(const GeneratedImage &image) const;

  std::string text_;
  QRSettings settings_;
  std::optional<GeneratedImage> image_;
  State state_ = State::Idle;
};
