#include "image/QRCode.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include <opencv2/core.hpp>

namespace {
const std::string kUrl = "https://example.com";
}

void test_blank_input_rejected() {
    QRSettings settings;
    // includes U+00A0 and U+3000
    for (const std::string text : {"", " ", "   ", "\n\t \r\n", "\xC2\xA0",
                                   "\xE3\x80\x80 \xC2\xA0"}) {
        auto result = generateQRCode(text, settings);
        assert(!result);
        assert(result.error() == QRCodeError::EmptyInput);
    }

    std::cout << "test_blank_input_rejected passed!" << std::endl;
}

void test_invalid_settings_rejected() {
    QRSettings settings;
    settings.moduleSize = 0;
    auto result = generateQRCode(kUrl, settings);
    assert(!result);
    assert(result.error() == QRCodeError::InvalidSettings);

    settings.moduleSize = 10;
    settings.border = -1;
    result = generateQRCode(kUrl, settings);
    assert(!result);
    assert(result.error() == QRCodeError::InvalidSettings);

    settings.border = kMaxBorder + 1;
    result = generateQRCode(kUrl, settings);
    assert(!result);
    assert(result.error() == QRCodeError::InvalidSettings);

    settings.border = 4;
    for (int size : {kMaxModuleSize + 1, 5000, 100'000'000}) {
        settings.moduleSize = size;
        result = generateQRCode(kUrl, settings);
        assert(!result);
        assert(result.error() == QRCodeError::InvalidSettings);
    }

    // Upper bounds themselves are accepted
    settings.moduleSize = kMaxModuleSize;
    settings.border = kMaxBorder;
    result = generateQRCode(kUrl, settings);
    assert(result);
    assert(result->raster.cols == (result->matrixWidth + 2 * kMaxBorder) * kMaxModuleSize);

    std::cout << "test_invalid_settings_rejected passed!" << std::endl;
}

void test_size_strictly_increases_with_module_size() {
    QRSettings settings;
    int previous = 0;
    for (int size = 1; size <= kMaxModuleSize; ++size) {
        settings.moduleSize = size;
        auto result = generateQRCode(kUrl, settings);
        assert(result);
        const cv::Mat &raster = result->raster;
        assert(raster.type() == CV_8UC3);
        assert(raster.cols == raster.rows);
        assert(raster.cols == (result->matrixWidth + 2 * settings.border) * size);
        assert(raster.cols > previous);
        previous = raster.cols;
    }

    std::cout << "test_size_strictly_increases_with_module_size passed!" << std::endl;
}

void test_generation_is_deterministic() {
    QRSettings settings;
    settings.errorCorrection = ErrorCorrection::Quartile;
    auto first = generateQRCode(kUrl, settings);
    auto second = generateQRCode(kUrl, settings);
    assert(first && second);
    assert(first->raster.size() == second->raster.size());
    assert(cv::norm(first->raster, second->raster, cv::NORM_INF) == 0);
    assert(first->text == kUrl);
    assert(first->settings == settings);

    std::cout << "test_generation_is_deterministic passed!" << std::endl;
}

void test_higher_level_needs_more_modules() {
    int widths[4] = {};
    const ErrorCorrection levels[] = {ErrorCorrection::Low, ErrorCorrection::Medium,
                                      ErrorCorrection::Quartile, ErrorCorrection::High};
    for (int i = 0; i < 4; ++i) {
        auto matrix = encodeMatrix(kUrl, levels[i]);
        assert(matrix);
        assert(matrix->modules.size() ==
               static_cast<size_t>(matrix->width) * matrix->width);
        widths[i] = matrix->width;
    }
    assert(widths[0] <= widths[1]);
    assert(widths[1] <= widths[2]);
    assert(widths[2] <= widths[3]);
    // 19 bytes fit version 2 at L but need version 3 at H
    assert(widths[0] == 25);
    assert(widths[3] == 29);

    std::cout << "test_higher_level_needs_more_modules passed!" << std::endl;
}

void test_capacity_exceeded() {
    const std::string huge(3000, 'x');
    QRSettings settings;
    settings.errorCorrection = ErrorCorrection::High;
    auto result = generateQRCode(huge, settings);
    assert(!result);
    assert(result.error() == QRCodeError::EncodingFailed);

    // Still too large for the least redundant level
    auto matrix = encodeMatrix(huge, ErrorCorrection::Low);
    assert(!matrix);
    assert(matrix.error() == QRCodeError::EncodingFailed);

    std::cout << "test_capacity_exceeded passed!" << std::endl;
}

void test_embedded_nul_is_encoded() {
    const std::string withNul("a\0b", 3);
    auto full = encodeMatrix(withNul, ErrorCorrection::Medium);
    auto prefix = encodeMatrix("a", ErrorCorrection::Medium);
    assert(full && prefix);
    // Same version, different data: the bytes after the NUL are part of the symbol
    assert(full->width == prefix->width);
    assert(full->modules != prefix->modules);

    auto image = generateQRCode(withNul, QRSettings{});
    assert(image);
    assert(image->text.size() == 3);

    std::cout << "test_embedded_nul_is_encoded passed!" << std::endl;
}

void test_render_uses_colors_and_quiet_zone() {
    QRSettings settings;
    settings.moduleSize = 4;
    settings.border = 2;
    settings.fillColor = cv::Scalar(0, 0, 200);
    settings.backColor = cv::Scalar(240, 250, 255);

    auto result = generateQRCode(kUrl, settings);
    assert(result);
    const cv::Mat &raster = result->raster;

    // Quiet zone corner
    const cv::Vec3b corner = raster.at<cv::Vec3b>(0, 0);
    assert(corner == cv::Vec3b(240, 250, 255));

    // Top-left module of the finder pattern is always dark
    const int origin = settings.border * settings.moduleSize;
    const cv::Vec3b finder = raster.at<cv::Vec3b>(origin, origin);
    assert(finder == cv::Vec3b(0, 0, 200));
    const cv::Vec3b finderEdge =
        raster.at<cv::Vec3b>(origin + settings.moduleSize - 1, origin + settings.moduleSize - 1);
    assert(finderEdge == cv::Vec3b(0, 0, 200));

    std::cout << "test_render_uses_colors_and_quiet_zone passed!" << std::endl;
}

void test_render_matrix_dimensions() {
    QRMatrix matrix;
    matrix.width = 3;
    matrix.modules = {true, false, true,
                      false, true, false,
                      true, false, true};
    QRSettings settings;
    settings.moduleSize = 2;
    settings.border = 1;

    cv::Mat raster = renderMatrix(matrix, settings);
    assert(raster.cols == 10 && raster.rows == 10);
    assert(raster.at<cv::Vec3b>(2, 2) == cv::Vec3b(0, 0, 0));
    assert(raster.at<cv::Vec3b>(2, 4) == cv::Vec3b(255, 255, 255));
    assert(raster.at<cv::Vec3b>(4, 4) == cv::Vec3b(0, 0, 0));
    assert(raster.at<cv::Vec3b>(0, 0) == cv::Vec3b(255, 255, 255));

    std::cout << "test_render_matrix_dimensions passed!" << std::endl;
}

void test_generated_code_scans_back() {
    for (auto level : {ErrorCorrection::Low, ErrorCorrection::Medium,
                       ErrorCorrection::Quartile, ErrorCorrection::High}) {
        QRSettings settings;
        settings.errorCorrection = level;
        auto result = generateQRCode(kUrl, settings);
        assert(result);
        auto decoded = detectQRCode(result->raster);
        assert(decoded);
        assert(*decoded == kUrl);
    }

    assert(!detectQRCode(cv::Mat()));
    cv::Mat blank(200, 200, CV_8UC3, cv::Scalar(255, 255, 255));
    assert(!detectQRCode(blank));

    std::cout << "test_generated_code_scans_back passed!" << std::endl;
}

void test_level_labels() {
    for (auto level : {ErrorCorrection::Low, ErrorCorrection::Medium,
                       ErrorCorrection::Quartile, ErrorCorrection::High}) {
        auto parsed = errorCorrectionFromLabel(errorCorrectionLabel(level));
        assert(parsed && *parsed == level);
    }
    assert(errorCorrectionLabel(ErrorCorrection::Medium) == "Medium (15%)");
    assert(!errorCorrectionFromLabel("Ultra (50%)"));

    std::cout << "test_level_labels passed!" << std::endl;
}

int main() {
    try {
        test_blank_input_rejected();
        test_invalid_settings_rejected();
        test_size_strictly_increases_with_module_size();
        test_generation_is_deterministic();
        test_higher_level_needs_more_modules();
        test_capacity_exceeded();
        test_embedded_nul_is_encoded();
        test_render_uses_colors_and_quiet_zone();
        test_render_matrix_dimensions();
        test_generated_code_scans_back();
        test_level_labels();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
