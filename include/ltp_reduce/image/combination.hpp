#pragma once

#include "ltp_reduce/core/types.hpp"
#include <vector>

namespace ltp_reduce::image {

// Running NaN-aware per-pixel accumulator. A position with no valid sample
// in any added image stays invalid in the result.
class NanAccumulator {
public:
    NanAccumulator() = default;

    // Throws ValidationError when the image is empty or its shape differs
    // from the first image added.
    void add(const Matrix2Df& image);

    Matrix2Df result(CombineMethod method = CombineMethod::MEAN) const;

    int n_sources() const { return n_sources_; }
    int rows() const { return static_cast<int>(sum_.rows()); }
    int cols() const { return static_cast<int>(sum_.cols()); }

private:
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> sum_;
    Eigen::Matrix<int, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor> count_;
    int n_sources_ = 0;
};

Matrix2Df combine_nan_aware(const std::vector<Matrix2Df>& images,
                            CombineMethod method = CombineMethod::MEAN);

} // namespace ltp_reduce::image
