#include "ltp_reduce/io/image_io.hpp"
#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/utils.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace ltp_reduce::io {

ImageFormat detect_image_format(const fs::path& path) {
    if (is_fits_image_path(path)) {
        return ImageFormat::FITS;
    }
    std::string ext = core::to_lower(path.extension().string());
    if (ext == ".tif" || ext == ".tiff") {
        return ImageFormat::TIFF;
    }
    return ImageFormat::UNKNOWN;
}

bool is_supported_image_path(const fs::path& path) {
    return detect_image_format(path) != ImageFormat::UNKNOWN;
}

static Matrix2Df read_tiff(const fs::path& path) {
    if (!fs::exists(path)) {
        throw IOError("File not found: " + path.string());
    }

    cv::Mat img;
    try {
        img = cv::imread(path.string(), cv::IMREAD_UNCHANGED | cv::IMREAD_ANYDEPTH);
    } catch (const cv::Exception& e) {
        throw ImageFormatError("Cannot decode " + path.string() + ": " + e.what());
    }
    if (img.empty()) {
        throw ImageFormatError("Cannot decode image: " + path.string());
    }
    if (img.channels() != 1) {
        throw ImageFormatError("Expected a single-channel image, got " +
                               std::to_string(img.channels()) + " channels: " +
                               path.string());
    }

    cv::Mat f32;
    img.convertTo(f32, CV_32F);

    Matrix2Df data(f32.rows, f32.cols);
    for (int y = 0; y < f32.rows; ++y) {
        const float* row = f32.ptr<float>(y);
        for (int x = 0; x < f32.cols; ++x) {
            data(y, x) = row[x];
        }
    }
    return data;
}

static void write_tiff(const fs::path& path, const Matrix2Df& data) {
    cv::Mat f32(static_cast<int>(data.rows()), static_cast<int>(data.cols()), CV_32F);
    for (int y = 0; y < f32.rows; ++y) {
        float* row = f32.ptr<float>(y);
        for (int x = 0; x < f32.cols; ++x) {
            row[x] = data(y, x);
        }
    }

    bool ok = false;
    try {
        ok = cv::imwrite(path.string(), f32);
    } catch (const cv::Exception& e) {
        throw IOError("Cannot write " + path.string() + ": " + e.what());
    }
    if (!ok) {
        throw IOError("Cannot write image: " + path.string());
    }
}

Matrix2Df read_image(const fs::path& path) {
    switch (detect_image_format(path)) {
        case ImageFormat::FITS:
            return read_fits_float(path).first;
        case ImageFormat::TIFF:
            return read_tiff(path);
        default:
            throw ImageFormatError("Unsupported image extension: " + path.string());
    }
}

void write_image(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    if (data.size() == 0) {
        throw IOError("Refusing to write an empty image: " + path.string());
    }
    switch (detect_image_format(path)) {
        case ImageFormat::FITS:
            write_fits_float(path, data, header);
            break;
        case ImageFormat::TIFF:
            write_tiff(path, data);
            break;
        default:
            throw ImageFormatError("Unsupported image extension: " + path.string());
    }
}

ImageIO file_image_io() {
    ImageIO io;
    io.load = [](const fs::path& path) { return read_image(path); };
    io.save = [](const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
        write_image(path, data, header);
    };
    return io;
}

} // namespace ltp_reduce::io
