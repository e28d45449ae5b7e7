#include "image/ImageIO.hpp"

#include <cassert>
#include <chrono>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace {
fs::path makeScratchDir() {
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    fs::path dir = fs::temp_directory_path() / ("qrgen_io_test_" + std::to_string(stamp));
    fs::create_directories(dir);
    return dir;
}

std::vector<unsigned char> readHeader(const fs::path &path, size_t count) {
    std::ifstream in(path, std::ios::binary);
    std::vector<unsigned char> bytes(count);
    in.read(reinterpret_cast<char *>(bytes.data()), static_cast<std::streamsize>(count));
    bytes.resize(static_cast<size_t>(in.gcount()));
    return bytes;
}

cv::Mat checkerboard() {
    cv::Mat image(64, 48, CV_8UC3, cv::Scalar(255, 255, 255));
    for (int y = 0; y < image.rows; ++y)
        for (int x = 0; x < image.cols; ++x)
            if (((x / 8) + (y / 8)) % 2 == 0)
                image.at<cv::Vec3b>(y, x) = cv::Vec3b(0, 0, 0);
    return image;
}
} // namespace

void test_format_from_path() {
    assert(formatFromPath("out.png") == ExportFormat::PNG);
    assert(formatFromPath("/tmp/OUT.PNG") == ExportFormat::PNG);
    assert(formatFromPath("out.jpg") == ExportFormat::JPG);
    assert(formatFromPath("out.JPEG") == ExportFormat::JPG);
    assert(!formatFromPath("out.bmp"));
    assert(!formatFromPath("out"));
    assert(extensionFor(ExportFormat::PNG) == ".png");
    assert(extensionFor(ExportFormat::JPG) == ".jpg");

    std::cout << "test_format_from_path passed!" << std::endl;
}

void test_save_png(const fs::path &dir) {
    const fs::path target = dir / "out.png";
    auto result = saveImage({target, ExportFormat::PNG}, checkerboard());
    assert(result);

    auto header = readHeader(target, 8);
    const std::vector<unsigned char> pngSignature = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    assert(header == pngSignature);

    cv::Mat loaded = cv::imread(target.string());
    assert(!loaded.empty());
    assert(loaded.cols == 48 && loaded.rows == 64);
    assert(cv::norm(loaded, checkerboard(), cv::NORM_INF) == 0);

    std::cout << "test_save_png passed!" << std::endl;
}

void test_format_comes_from_request(const fs::path &dir) {
    // JPEG bytes even though the name says .png
    const fs::path target = dir / "really_jpeg.png";
    auto result = saveImage({target, ExportFormat::JPG}, checkerboard());
    assert(result);

    auto header = readHeader(target, 3);
    assert(header.size() == 3);
    assert(header[0] == 0xFF && header[1] == 0xD8 && header[2] == 0xFF);

    std::cout << "test_format_comes_from_request passed!" << std::endl;
}

void test_empty_image_not_written(const fs::path &dir) {
    const fs::path target = dir / "empty.png";
    auto result = saveImage({target, ExportFormat::PNG}, cv::Mat());
    assert(!result);
    assert(result.error() == ImageIOError::EmptyImage);
    assert(!fs::exists(target));

    std::cout << "test_empty_image_not_written passed!" << std::endl;
}

void test_missing_directory_is_write_error(const fs::path &dir) {
    const fs::path target = dir / "does" / "not" / "exist" / "out.png";
    auto result = saveImage({target, ExportFormat::PNG}, checkerboard());
    assert(!result);
    assert(result.error() == ImageIOError::WriteError);
    assert(!fs::exists(target));
    assert(!fs::exists(dir / "does"));

    // A directory in place of the file
    const fs::path asDirectory = dir / "taken.png";
    fs::create_directories(asDirectory);
    result = saveImage({asDirectory, ExportFormat::PNG}, checkerboard());
    assert(!result);
    assert(result.error() == ImageIOError::WriteError);
    assert(fs::is_directory(asDirectory));
    assert(!fs::exists(dir / "taken.png.part"));

    std::cout << "test_missing_directory_is_write_error passed!" << std::endl;
}

void test_overwrite_goes_through_temporary_file(const fs::path &dir) {
    const fs::path target = dir / "replace.png";
    {
        std::ofstream original(target, std::ios::binary);
        original << "original contents";
    }

    // A failed save leaves the existing file as it was
    auto failed = saveImage({target, ExportFormat::PNG}, cv::Mat());
    assert(!failed);
    {
        std::ifstream in(target, std::ios::binary);
        std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(contents == "original contents");
    }

    auto replaced = saveImage({target, ExportFormat::PNG}, checkerboard());
    assert(replaced);
    assert(!fs::exists(dir / "replace.png.part"));
    cv::Mat loaded = cv::imread(target.string());
    assert(loaded.cols == 48 && loaded.rows == 64);

    std::cout << "test_overwrite_goes_through_temporary_file passed!" << std::endl;
}

int main() {
    fs::path dir;
    try {
        dir = makeScratchDir();
        test_format_from_path();
        test_save_png(dir);
        test_format_comes_from_request(dir);
        test_empty_image_not_written(dir);
        test_missing_directory_is_write_error(dir);
        test_overwrite_goes_through_temporary_file(dir);
        fs::remove_all(dir);
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
