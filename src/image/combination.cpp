#include "ltp_reduce/image/combination.hpp"
#include "ltp_reduce/core/errors.hpp"

#include <cmath>
#include <limits>
#include <string>

namespace ltp_reduce::image {

void NanAccumulator::add(const Matrix2Df& image) {
    if (image.size() == 0) {
        throw ValidationError("cannot combine an empty image");
    }
    if (n_sources_ == 0) {
        sum_.setZero(image.rows(), image.cols());
        count_.setZero(image.rows(), image.cols());
    } else if (image.rows() != sum_.rows() || image.cols() != sum_.cols()) {
        throw ValidationError("image dimensions " + std::to_string(image.cols()) + "x" +
                              std::to_string(image.rows()) + " do not match " +
                              std::to_string(sum_.cols()) + "x" +
                              std::to_string(sum_.rows()));
    }

    for (Eigen::Index i = 0; i < image.size(); ++i) {
        const float v = image.data()[i];
        if (std::isfinite(v)) {
            sum_.data()[i] += static_cast<double>(v);
            count_.data()[i] += 1;
        }
    }
    ++n_sources_;
}

Matrix2Df NanAccumulator::result(CombineMethod method) const {
    if (n_sources_ == 0) {
        throw ValidationError("no images to combine");
    }
    const float nan = std::numeric_limits<float>::quiet_NaN();
    const double scale = (method == CombineMethod::SUM) ? static_cast<double>(n_sources_) : 1.0;

    Matrix2Df out(sum_.rows(), sum_.cols());
    for (Eigen::Index i = 0; i < out.size(); ++i) {
        const int n = count_.data()[i];
        out.data()[i] = (n > 0)
            ? static_cast<float>(scale * sum_.data()[i] / static_cast<double>(n))
            : nan;
    }
    return out;
}

Matrix2Df combine_nan_aware(const std::vector<Matrix2Df>& images, CombineMethod method) {
    if (images.empty()) {
        throw ValidationError("no images to combine");
    }
    for (size_t i = 1; i < images.size(); ++i) {
        if (!same_shape(images[i], images[0])) {
            throw ValidationError("source " + std::to_string(i) + " is " +
                                  std::to_string(images[i].cols()) + "x" +
                                  std::to_string(images[i].rows()) + ", expected " +
                                  std::to_string(images[0].cols()) + "x" +
                                  std::to_string(images[0].rows()));
        }
    }

    NanAccumulator acc;
    for (const auto& img : images) {
        acc.add(img);
    }
    return acc.result(method);
}

} // namespace ltp_reduce::image
