#include "QRController.hpp"

#include "utils/AppSettings.hpp"

#include <algorithm>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

namespace {
constexpr int kStatusPreviewChars = 30;

ControllerError fromQRCodeError(QRCodeError error) noexcept {
  return error == QRCodeError::EmptyInput ? ControllerError::EmptyInput
                                          : ControllerError::Encoding;
}

QRSettings clamped(QRSettings settings) {
  settings.moduleSize = AppSettings::clampModuleSize(settings.moduleSize);
  settings.border = std::clamp(settings.border, 0, kMaxBorder);
  return settings;
}
} // namespace

std::string_view errorToString(ControllerError error) noexcept {
  switch (error) {
  case ControllerError::EmptyInput:
    return "Please enter text or URL";
  case ControllerError::Encoding:
    return "Error generating QR code";
  case ControllerError::NoImage:
    return "Generate a QR code first before saving";
  case ControllerError::Write:
    return "Could not save file";
  default:
    return "Unknown error";
  }
}

fs::path toExportPath(const QString &path) {
  return fs::path(path.toStdU16String());
}

QRController::QRController(QObject *parent) : QObject(parent) {}

QRController::QRController(const QRSettings &initial, QObject *parent)
    : QObject(parent), settings_(clamped(initial)) {}

void QRController::setText(const std::string &text) { text_ = text; }

void QRController::setSettings(const QRSettings &settings) {
  settings_ = clamped(settings);
  spdlog::debug("Settings changed: {}, size {}, border {}",
                errorCorrectionLabel(settings_.errorCorrection),
                settings_.moduleSize, settings_.border);
}

void QRController::setErrorCorrection(ErrorCorrection level) {
  QRSettings next = settings_;
  next.errorCorrection = level;
  setSettings(next);
}

void QRController::setModuleSize(int size) {
  QRSettings next = settings_;
  next.moduleSize = size;
  setSettings(next);
}

void QRController::setBorder(int border) {
  QRSettings next = settings_;
  next.border = border;
  setSettings(next);
}

void QRController::setColors(const cv::Scalar &fill, const cv::Scalar &back) {
  QRSettings next = settings_;
  next.fillColor = fill;
  next.backColor = back;
  setSettings(next);
}

auto QRController::generate() -> std::expected<void, ControllerError> {
  return onGenerateRequested(text_, settings_);
}

auto QRController::onGenerateRequested(const std::string &text,
                                       const QRSettings &settings)
    -> std::expected<void, ControllerError> {
  text_ = text;
  settings_ = clamped(settings);

  auto result = generateQRCode(text_, settings_);
  if (!result) {
    spdlog::warn("Generation failed: {}", errorToString(result.error()));
    if (result.error() == QRCodeError::EmptyInput)
      return fail(ControllerError::EmptyInput);
    return fail(fromQRCodeError(result.error()),
                QString::fromUtf8(errorToString(result.error()).data()));
  }

  verifyScan(*result);
  image_ = std::move(*result);

  const bool wasIdle = state_ == State::Idle;
  state_ = State::Generated;
  if (wasIdle)
    emit stateChanged(state_);

  spdlog::info("QR code generated: {}x{} px", image_->raster.cols,
               image_->raster.rows);
  emit imageChanged(previewImage());
  emit statusChanged(
      tr("Generated QR code for: %1...")
          .arg(QString::fromStdString(image_->text).left(kStatusPreviewChars)));
  return {};
}

auto QRController::onExportRequested(const ExportRequest &request)
    -> std::expected<void, ControllerError> {
  if (state_ != State::Generated || !image_) {
    spdlog::warn("Export requested before any QR code was generated");
    return fail(ControllerError::NoImage);
  }

  auto saved = saveImage(request, image_->raster);
  if (!saved) {
    const std::string target =
        QString::fromStdU16String(request.targetPath.u16string())
            .toStdString();
    spdlog::error("Export to {} failed: {}", target,
                  errorToString(saved.error()));
    return fail(ControllerError::Write,
                QString::fromStdString(fmt::format(
                    "{}: {}", target, errorToString(saved.error()))));
  }

  const QString savedPath =
      QString::fromStdU16String(request.targetPath.u16string());
  spdlog::info("QR code exported to {}", savedPath.toStdString());
  emit statusChanged(tr("Saved to: %1").arg(savedPath));
  emit exported(savedPath);
  return {};
}

QImage QRController::previewImage() const {
  if (!image_ || image_->raster.empty())
    return QImage();

  const cv::Mat &mat = image_->raster;
  // 深拷贝, 不与cv::Mat共享缓冲区
  return QImage(mat.data, mat.cols, mat.rows, static_cast<int>(mat.step),
                QImage::Format_BGR888)
      .copy();
}

auto QRController::fail(ControllerError error, const QString &detail)
    -> std::expected<void, ControllerError> {
  QString message = QString::fromUtf8(errorToString(error).data());
  if (!detail.isEmpty())
    message += QStringLiteral(": ") + detail;
  emit errorOccurred(error, message);
  return std::unexpected(error);
}

void QRController::verifyScan(const GeneratedImage &image) const {
  const auto decoded = detectQRCode(image.raster);
  if (!decoded) {
    spdlog::warn("Generated QR code could not be re-scanned");
  } else if (*decoded != image.text) {
    spdlog::warn("Re-scanned payload differs from input ({} vs {} bytes)",
                 decoded->size(), image.text.size());
  }
}
