#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <opencv2/core.hpp>

/**
 * @brief 纠错级别
 */
enum class ErrorCorrection {
  Low,      ///< ~7% 可恢复
  Medium,   ///< ~15% 可恢复
  Quartile, ///< ~25% 可恢复
  High      ///< ~30% 可恢复
};

constexpr int kMinModuleSize = 5;
constexpr int kMaxModuleSize = 20;
constexpr int kMaxBorder = 10;

enum class QRCodeError { EmptyInput, EncodingFailed, InvalidSettings };

/**
 * @brief QR码生成参数
 */
struct QRSettings {
  ErrorCorrection errorCorrection = ErrorCorrection::Medium;
  int moduleSize = 10; ///< 每个模块的像素边长
  int border = 4;      ///< 静区宽度(模块数)
  cv::Scalar fillColor{0, 0, 0};       ///< BGR
  cv::Scalar backColor{255, 255, 255}; ///< BGR

  bool operator==(const QRSettings &other) const;
};

/**
 * @brief 编码后的模块矩阵, 行优先, true 为深色
 */
struct QRMatrix {
  int width = 0;
  std::vector<bool> modules;

  [[nodiscard]] bool isDark(int x, int y) const {
    return modules[static_cast<size_t>(y) * width + x];
  }
};

/**
 * @brief 一次生成的结果, 与生成时的文本和参数保持一致
 */
struct GeneratedImage {
  cv::Mat raster; ///< CV_8UC3
  std::string text;
  QRSettings settings;
  int matrixWidth = 0;
};

/**
 * @brief Encodes text into a module matrix using libqrencode.
 * @param text The payload, encoded byte for byte (embedded NULs included).
 * @param level Error correction level.
 * @return The module matrix, or EncodingFailed when the payload does not
 * fit any symbol version at this level.
 */
auto encodeMatrix(const std::string &text, ErrorCorrection level)
    -> std::expected<QRMatrix, QRCodeError>;

/**
 * @brief Draws a module matrix as a BGR raster.
 *
 * The side length of the result is (width + 2 * border) * moduleSize.
 */
cv::Mat renderMatrix(const QRMatrix &matrix, const QRSettings &settings);

/**
 * @brief Encodes and renders text.
 * @param text The payload. Empty or whitespace-only text is rejected.
 * Module size must be within [1, kMaxModuleSize] and border within
 * [0, kMaxBorder].
 * @param settings Generation parameters.
 * @return The generated image or an error. Has no side effects.
 */
auto generateQRCode(const std::string &text, const QRSettings &settings)
    -> std::expected<GeneratedImage, QRCodeError>;

/**
 * @brief Scans an image for a QR symbol.
 * @return The decoded payload of the first symbol found.
 */
std::optional<std::string> detectQRCode(const cv::Mat &image);

bool isBlank(std::string_view text);

std::string_view errorCorrectionLabel(ErrorCorrection level) noexcept;
std::optional<ErrorCorrection>
errorCorrectionFromLabel(std::string_view label) noexcept;

std::string_view errorToString(QRCodeError error) noexcept;
