#include "ImageIO.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/imgcodecs.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace {
std::shared_ptr<spdlog::logger> imageIOLogger =
    spdlog::basic_logger_mt("ImageIOLogger", "logs/image_io.log");

std::string lowerExtension(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext;
}

fs::path temporaryPathFor(const fs::path &target) {
  fs::path temp = target;
  temp += ".part";
  return temp;
}

// Removes a partially written file, logging instead of throwing
void discardPartialFile(const fs::path &path) noexcept {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    imageIOLogger->warn("Could not remove partial file {}: {}", path.string(),
                        ec.message());
  }
}
} // namespace

std::string_view errorToString(ImageIOError error) noexcept {
  switch (error) {
  case ImageIOError::EmptyImage:
    return "Empty image";
  case ImageIOError::EncodeError:
    return "Encode error";
  case ImageIOError::WriteError:
    return "Write error";
  case ImageIOError::UnsupportedFormat:
    return "Unsupported format";
  default:
    return "Unknown error";
  }
}

std::optional<ExportFormat> formatFromPath(const fs::path &path) noexcept {
  try {
    const std::string ext = lowerExtension(path);
    if (ext == ".png")
      return ExportFormat::PNG;
    if (ext == ".jpg" || ext == ".jpeg")
      return ExportFormat::JPG;
  } catch (const std::exception &e) {
    imageIOLogger->error("Cannot inspect extension: {}", e.what());
  }
  return std::nullopt;
}

std::string_view extensionFor(ExportFormat format) noexcept {
  return format == ExportFormat::JPG ? ".jpg" : ".png";
}

auto saveImage(const ExportRequest &request, const cv::Mat &image,
               int quality) noexcept -> std::expected<void, ImageIOError> {
  const fs::path &filepath = request.targetPath;

  try {
    imageIOLogger->info("Starting image save: {} as {}", filepath.string(),
                        extensionFor(request.format));

    if (image.empty()) {
      imageIOLogger->error("Cannot save empty image: {}", filepath.string());
      return std::unexpected(ImageIOError::EmptyImage);
    }

    std::error_code ec;
    const auto parent_path = filepath.parent_path();
    if (!parent_path.empty() && !fs::is_directory(parent_path, ec)) {
      imageIOLogger->error("Target directory does not exist: {}",
                           parent_path.string());
      return std::unexpected(ImageIOError::WriteError);
    }

    // Set format-specific parameters
    std::vector<int> params;
    switch (request.format) {
    case ExportFormat::JPG:
      params = {cv::IMWRITE_JPEG_QUALITY, std::clamp(quality, 0, 100)};
      break;
    case ExportFormat::PNG:
      params = {cv::IMWRITE_PNG_COMPRESSION, std::clamp(quality / 10, 0, 9)};
      break;
    default:
      return std::unexpected(ImageIOError::UnsupportedFormat);
    }

    auto start = std::chrono::high_resolution_clock::now();

    std::vector<uchar> buffer;
    if (!cv::imencode(std::string(extensionFor(request.format)), image, buffer,
                      params)) {
      imageIOLogger->error("imencode failed for {}", filepath.string());
      return std::unexpected(ImageIOError::EncodeError);
    }

    // 先写临时文件, 成功后再替换目标, 失败时原文件保持不变
    const fs::path tempPath = temporaryPathFor(filepath);
    std::ofstream out(tempPath, std::ios::binary | std::ios::trunc);
    if (!out) {
      imageIOLogger->error("Cannot open {} for writing", tempPath.string());
      return std::unexpected(ImageIOError::WriteError);
    }
    out.write(reinterpret_cast<const char *>(buffer.data()),
              static_cast<std::streamsize>(buffer.size()));
    out.close();
    if (!out) {
      imageIOLogger->error("Failed writing {}", tempPath.string());
      discardPartialFile(tempPath);
      return std::unexpected(ImageIOError::WriteError);
    }

    fs::rename(tempPath, filepath, ec);
    if (ec) {
      imageIOLogger->error("Cannot replace {}: {}", filepath.string(),
                           ec.message());
      discardPartialFile(tempPath);
      return std::unexpected(ImageIOError::WriteError);
    }

    auto end = std::chrono::high_resolution_clock::now();
    auto duration =
        std::chrono::duration_cast<std::chrono::milliseconds>(end - start)
            .count();
    imageIOLogger->info("Successfully saved image: {} ({} bytes, {}ms)",
                        filepath.string(), buffer.size(), duration);
    return {};
  } catch (const cv::Exception &e) {
    imageIOLogger->error("OpenCV exception in saveImage: {}", e.what());
    return std::unexpected(ImageIOError::EncodeError);
  } catch (const std::exception &e) {
    imageIOLogger->error("Exception in saveImage: {}", e.what());
    return std::unexpected(ImageIOError::WriteError);
  }
}
