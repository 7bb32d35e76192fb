#include "ltp_reduce/image/spike_detection.hpp"
#include "ltp_reduce/core/errors.hpp"

#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace ltp_reduce::image {

void validate_detection_parameters(const DetectionParameters& params) {
    if (!std::isfinite(params.sigma) || params.sigma < 0.0f) {
        throw ConfigError("cosmic sigma must be a finite value >= 0 (got " +
                          std::to_string(params.sigma) + ")");
    }
    if (params.window_size < 3 || (params.window_size % 2) == 0) {
        throw ConfigError("cosmic window size must be an odd integer >= 3 (got " +
                          std::to_string(params.window_size) + ")");
    }
    if (params.iterations < 1) {
        throw ConfigError("cosmic iterations must be >= 1 (got " +
                          std::to_string(params.iterations) + ")");
    }
    if (!std::isfinite(params.min_intensity) || params.min_intensity < 0.0f) {
        throw ConfigError("cosmic min intensity must be a finite value >= 0 (got " +
                          std::to_string(params.min_intensity) + ")");
    }
}

SpikeDetectionResult detect_spikes_with_stats(const Matrix2Df& image,
                                              const DetectionParameters& params) {
    validate_detection_parameters(params);

    const int h = static_cast<int>(image.rows());
    const int w = static_cast<int>(image.cols());
    if (params.window_size > h || params.window_size > w) {
        throw ConfigError("cosmic window size " + std::to_string(params.window_size) +
                          " exceeds image dimensions " + std::to_string(w) + "x" +
                          std::to_string(h));
    }
    const int r = params.window_size / 2;
    const double sigma = static_cast<double>(params.sigma);
    const double min_intensity = static_cast<double>(params.min_intensity);

    SpikeDetectionResult result;
    result.flagged_per_pass.reserve(static_cast<size_t>(params.iterations));

    MaskMatrix invalid(h, w);
    for (Eigen::Index i = 0; i < image.size(); ++i) {
        const bool bad = !std::isfinite(image.data()[i]);
        invalid.data()[i] = bad ? 1 : 0;
        if (bad) ++result.input_invalid;
    }

    cv::Mat values(h, w, CV_32F);
    cv::Mat valid(h, w, CV_8U);
    cv::Mat sum, sqsum, count;
    std::vector<Eigen::Index> flagged;

    for (int pass = 0; pass < params.iterations; ++pass) {
        for (int y = 0; y < h; ++y) {
            float* vrow = values.ptr<float>(y);
            uint8_t* mrow = valid.ptr<uint8_t>(y);
            for (int x = 0; x < w; ++x) {
                const bool ok = invalid(y, x) == 0;
                vrow[x] = ok ? image(y, x) : 0.0f;
                mrow[x] = ok ? 1 : 0;
            }
        }

        // Summed-area tables are (h+1) x (w+1)
        cv::integral(values, sum, sqsum, CV_64F, CV_64F);
        cv::integral(valid, count, CV_32S);

        auto box_sum = [](const cv::Mat& m, int y0, int x0, int y1, int x1) {
            return m.at<double>(y1, x1) - m.at<double>(y0, x1) -
                   m.at<double>(y1, x0) + m.at<double>(y0, x0);
        };
        auto box_count = [&](int y0, int x0, int y1, int x1) {
            return count.at<int>(y1, x1) - count.at<int>(y0, x1) -
                   count.at<int>(y1, x0) + count.at<int>(y0, x0);
        };

        flagged.clear();
        int degenerate = 0;
        for (int y = 0; y < h; ++y) {
            const int y0 = std::max(0, y - r);
            const int y1 = std::min(h, y + r + 1);
            for (int x = 0; x < w; ++x) {
                if (invalid(y, x)) continue;
                const int x0 = std::max(0, x - r);
                const int x1 = std::min(w, x + r + 1);

                // Leave the pixel under test out of its own statistics.
                const int n = box_count(y0, x0, y1, x1) - 1;
                if (n <= 0) {
                    ++degenerate;
                    continue;
                }
                const double v = static_cast<double>(image(y, x));
                const double s = box_sum(sum, y0, x0, y1, x1) - v;
                const double ss = box_sum(sqsum, y0, x0, y1, x1) - v * v;
                const double mean = s / n;
                const double var = std::max(0.0, ss / n - mean * mean);
                const double sd = std::sqrt(var);

                if (v > mean + sigma * sd && v > min_intensity) {
                    flagged.push_back(static_cast<Eigen::Index>(y) * w + x);
                }
            }
        }

        for (Eigen::Index idx : flagged) {
            invalid.data()[idx] = 1;
        }
        result.flagged_per_pass.push_back(static_cast<int>(flagged.size()));
        result.degenerate_pixels = degenerate;
    }

    result.image = image;
    const float nan = std::numeric_limits<float>::quiet_NaN();
    for (Eigen::Index i = 0; i < result.image.size(); ++i) {
        if (invalid.data()[i]) {
            result.image.data()[i] = nan;
        }
    }
    return result;
}

Matrix2Df detect_spikes(const Matrix2Df& image, const DetectionParameters& params) {
    return detect_spikes_with_stats(image, params).image;
}

} // namespace ltp_reduce::image
