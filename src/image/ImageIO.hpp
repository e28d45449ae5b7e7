#ifndef IMAGEIO_HPP
#define IMAGEIO_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string_view>

namespace cv {
class Mat;
}

namespace fs = std::filesystem;

enum class ExportFormat { PNG, JPG };

// Error types for export
enum class ImageIOError { EmptyImage, EncodeError, WriteError, UnsupportedFormat };

/**
 * @brief A single export action: where to write and in which format.
 */
struct ExportRequest {
  fs::path targetPath;
  ExportFormat format = ExportFormat::PNG;
};

/**
 * @brief Maps a file extension (.png, .jpg, .jpeg) to an export format.
 * @param path The target path; only its extension is inspected.
 * @return The format, or nullopt for unknown or missing extensions.
 */
std::optional<ExportFormat> formatFromPath(const fs::path &path) noexcept;

// ".png" or ".jpg"
std::string_view extensionFor(ExportFormat format) noexcept;

/**
 * @brief Encodes an image in the requested format and writes it to disk.
 *
 * The format comes from the request, never from the path. Parent
 * directories are not created. The bytes go to "<target>.part" first and
 * replace the target only once fully written, so a failed save leaves an
 * existing file untouched.
 *
 * @param request Target path and format.
 * @param image The image to save.
 * @param quality JPEG quality (0-100); mapped to PNG compression for PNG.
 * @return Success or specific error.
 */
auto saveImage(const ExportRequest &request, const cv::Mat &image,
               int quality = 95) noexcept -> std::expected<void, ImageIOError>;

// String representation for ImageIOError
std::string_view errorToString(ImageIOError error) noexcept;

#endif // IMAGEIO_HPP
