#include "QRCode.hpp"

#include <array>
#include <cerrno>
#include <cstring>
#include <memory>

#include <QString>
#include <opencv2/imgproc.hpp>
#include <qrencode.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include <zbar.h>

namespace {
std::shared_ptr<spdlog::logger> qrCodeLogger =
    spdlog::basic_logger_mt("QRCodeLogger", "logs/qrcode.log");

// 智能指针包装QRcode释放
struct QRCodeDeleter {
  void operator()(QRcode *qr) const noexcept { QRcode_free(qr); }
};
using QRCodePtr = std::unique_ptr<QRcode, QRCodeDeleter>;

// 版本40, L级, 8位模式的最大字节数
constexpr size_t kMaxPayloadBytes = 2953;

constexpr std::array<std::string_view, 4> kLevelLabels = {
    "Low (7%)", "Medium (15%)", "Quartile (25%)", "High (30%)"};

QRecLevel toQRecLevel(ErrorCorrection level) noexcept {
  switch (level) {
  case ErrorCorrection::Low:
    return QR_ECLEVEL_L;
  case ErrorCorrection::Quartile:
    return QR_ECLEVEL_Q;
  case ErrorCorrection::High:
    return QR_ECLEVEL_H;
  case ErrorCorrection::Medium:
  default:
    return QR_ECLEVEL_M;
  }
}

bool sameColor(const cv::Scalar &a, const cv::Scalar &b) noexcept {
  for (int i = 0; i < 4; ++i) {
    if (a[i] != b[i])
      return false;
  }
  return true;
}
} // namespace

bool QRSettings::operator==(const QRSettings &other) const {
  return errorCorrection == other.errorCorrection &&
         moduleSize == other.moduleSize && border == other.border &&
         sameColor(fillColor, other.fillColor) &&
         sameColor(backColor, other.backColor);
}

// Unicode 空白(如U+00A0, U+3000)同样视为空
bool isBlank(std::string_view text) {
  return QString::fromUtf8(text.data(), static_cast<qsizetype>(text.size()))
      .trimmed()
      .isEmpty();
}

std::string_view errorCorrectionLabel(ErrorCorrection level) noexcept {
  return kLevelLabels[static_cast<size_t>(level)];
}

std::optional<ErrorCorrection>
errorCorrectionFromLabel(std::string_view label) noexcept {
  for (size_t i = 0; i < kLevelLabels.size(); ++i) {
    if (kLevelLabels[i] == label)
      return static_cast<ErrorCorrection>(i);
  }
  return std::nullopt;
}

std::string_view errorToString(QRCodeError error) noexcept {
  switch (error) {
  case QRCodeError::EmptyInput:
    return "Please enter text or URL to generate QR code";
  case QRCodeError::EncodingFailed:
    return "Text cannot be encoded with the selected error correction level";
  case QRCodeError::InvalidSettings:
    return "Invalid QR code settings";
  default:
    return "Unknown error";
  }
}

auto encodeMatrix(const std::string &text, ErrorCorrection level)
    -> std::expected<QRMatrix, QRCodeError> {
  if (text.size() > kMaxPayloadBytes) {
    qrCodeLogger->error("Payload of {} bytes exceeds QR capacity",
                        text.size());
    return std::unexpected(QRCodeError::EncodingFailed);
  }

  // version 0: 由libqrencode自动选择最小版本
  errno = 0;
  QRCodePtr qr(QRcode_encodeData(
      static_cast<int>(text.size()),
      reinterpret_cast<const unsigned char *>(text.data()), 0,
      toQRecLevel(level)));
  if (!qr) {
    qrCodeLogger->error("QRcode_encodeData failed for {} bytes at {}: {}",
                        text.size(), errorCorrectionLabel(level),
                        std::strerror(errno));
    return std::unexpected(QRCodeError::EncodingFailed);
  }

  QRMatrix matrix;
  matrix.width = qr->width;
  const size_t total = static_cast<size_t>(qr->width) * qr->width;
  matrix.modules.resize(total);
  // 每个字节的最低位表示深色模块
  for (size_t i = 0; i < total; ++i) {
    matrix.modules[i] = (qr->data[i] & 1) != 0;
  }

  qrCodeLogger->debug("Encoded {} bytes as version {} ({}x{} modules)",
                      text.size(), qr->version, qr->width, qr->width);
  return matrix;
}

cv::Mat renderMatrix(const QRMatrix &matrix, const QRSettings &settings) {
  const int side = matrix.width + 2 * settings.border;
  cv::Mat mask(side, side, CV_8UC1, cv::Scalar(0));

  for (int y = 0; y < matrix.width; ++y) {
    uchar *row = mask.ptr<uchar>(y + settings.border);
    for (int x = 0; x < matrix.width; ++x) {
      if (matrix.isDark(x, y))
        row[x + settings.border] = 255;
    }
  }

  // INTER_NEAREST保持模块边缘锐利
  cv::Mat scaled;
  cv::resize(mask, scaled,
             cv::Size(side * settings.moduleSize, side * settings.moduleSize),
             0, 0, cv::INTER_NEAREST);

  cv::Mat raster(scaled.size(), CV_8UC3, settings.backColor);
  raster.setTo(settings.fillColor, scaled);
  return raster;
}

auto generateQRCode(const std::string &text, const QRSettings &settings)
    -> std::expected<GeneratedImage, QRCodeError> {
  if (isBlank(text)) {
    qrCodeLogger->warn("Rejected empty input");
    return std::unexpected(QRCodeError::EmptyInput);
  }
  if (settings.moduleSize < 1 || settings.moduleSize > kMaxModuleSize ||
      settings.border < 0 || settings.border > kMaxBorder) {
    qrCodeLogger->error("Invalid settings: moduleSize={}, border={}",
                        settings.moduleSize, settings.border);
    return std::unexpected(QRCodeError::InvalidSettings);
  }

  auto matrix = encodeMatrix(text, settings.errorCorrection);
  if (!matrix)
    return std::unexpected(matrix.error());

  GeneratedImage image;
  try {
    image.raster = renderMatrix(*matrix, settings);
  } catch (const cv::Exception &e) {
    qrCodeLogger->error("Rendering failed: {}", e.what());
    return std::unexpected(QRCodeError::EncodingFailed);
  }
  image.text = text;
  image.settings = settings;
  image.matrixWidth = matrix->width;

  qrCodeLogger->info("Generated {}x{} image ({} modules, {}, size {})",
                     image.raster.cols, image.raster.rows, matrix->width,
                     errorCorrectionLabel(settings.errorCorrection),
                     settings.moduleSize);
  return image;
}

std::optional<std::string> detectQRCode(const cv::Mat &image) {
  if (image.empty())
    return std::nullopt;

  cv::Mat gray;
  if (image.channels() == 3) {
    cv::cvtColor(image, gray, cv::COLOR_BGR2GRAY);
  } else if (image.channels() == 4) {
    cv::cvtColor(image, gray, cv::COLOR_BGRA2GRAY);
  } else {
    gray = image.isContinuous() ? image : image.clone();
  }

  zbar::ImageScanner scanner;
  scanner.set_config(zbar::ZBAR_NONE, zbar::ZBAR_CFG_ENABLE, 0);
  scanner.set_config(zbar::ZBAR_QRCODE, zbar::ZBAR_CFG_ENABLE, 1);

  zbar::Image zbarImage(gray.cols, gray.rows, "Y800", gray.data,
                        static_cast<unsigned long>(gray.total()));
  if (scanner.scan(zbarImage) <= 0) {
    qrCodeLogger->debug("No QR symbol found in {}x{} image", image.cols,
                        image.rows);
    return std::nullopt;
  }

  for (auto symbol = zbarImage.symbol_begin();
       symbol != zbarImage.symbol_end(); ++symbol) {
    return symbol->get_data();
  }
  return std::nullopt;
}
