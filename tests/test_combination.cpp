#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/types.hpp"
#include "ltp_reduce/image/combination.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using ltp_reduce::CombineMethod;
using ltp_reduce::Matrix2Df;
namespace image = ltp_reduce::image;

static const float kNaN = std::numeric_limits<float>::quiet_NaN();

TEST_CASE("nan_aware_mean_uses_only_valid_samples") {
    Matrix2Df a(2, 2);
    a << 4.0f, 1.0f,
         kNaN, 2.0f;
    Matrix2Df b(2, 2);
    b << kNaN, 3.0f,
         kNaN, 6.0f;

    auto out = image::combine_nan_aware({a, b});

    REQUIRE(out(0, 0) == Catch::Approx(4.0f));
    REQUIRE(out(0, 1) == Catch::Approx(2.0f));
    REQUIRE(std::isnan(out(1, 0)));
    REQUIRE(out(1, 1) == Catch::Approx(4.0f));
}

TEST_CASE("single_image_combines_to_itself") {
    Matrix2Df a(1, 3);
    a << 1.5f, kNaN, -2.0f;

    auto out = image::combine_nan_aware({a});

    REQUIRE(out(0, 0) == 1.5f);
    REQUIRE(std::isnan(out(0, 1)));
    REQUIRE(out(0, 2) == -2.0f);
}

TEST_CASE("sum_scales_the_nan_aware_mean_by_the_source_count") {
    Matrix2Df a(1, 2);
    a << 2.0f, 10.0f;
    Matrix2Df b(1, 2);
    b << 4.0f, kNaN;
    Matrix2Df c(1, 2);
    c << 6.0f, kNaN;

    auto out = image::combine_nan_aware({a, b, c}, CombineMethod::SUM);

    REQUIRE(out(0, 0) == Catch::Approx(12.0f));
    // rejected samples are filled from the valid exposure
    REQUIRE(out(0, 1) == Catch::Approx(30.0f));
}

TEST_CASE("mismatched_dimensions_are_rejected") {
    Matrix2Df a = Matrix2Df::Constant(4, 4, 1.0f);
    Matrix2Df b = Matrix2Df::Constant(4, 5, 1.0f);

    REQUIRE_THROWS_AS(image::combine_nan_aware({a, b}), ltp_reduce::ValidationError);

    image::NanAccumulator acc;
    acc.add(a);
    REQUIRE_THROWS_AS(acc.add(b), ltp_reduce::ValidationError);
    REQUIRE(acc.n_sources() == 1);
}

TEST_CASE("empty_input_is_rejected") {
    REQUIRE_THROWS_AS(image::combine_nan_aware({}), ltp_reduce::ValidationError);

    image::NanAccumulator acc;
    REQUIRE_THROWS_AS(acc.result(), ltp_reduce::ValidationError);
    REQUIRE_THROWS_AS(acc.add(Matrix2Df()), ltp_reduce::ValidationError);
}

TEST_CASE("accumulator_matches_batch_combination") {
    std::vector<Matrix2Df> imgs;
    for (int k = 0; k < 4; ++k) {
        Matrix2Df m = Matrix2Df::Constant(3, 3, static_cast<float>(k + 1));
        if (k == 2) m(1, 1) = kNaN;
        imgs.push_back(m);
    }

    image::NanAccumulator acc;
    for (const auto& m : imgs) acc.add(m);
    auto streamed = acc.result();
    auto batch = image::combine_nan_aware(imgs);

    REQUIRE(acc.rows() == 3);
    REQUIRE(acc.cols() == 3);
    REQUIRE(streamed(0, 0) == Catch::Approx(2.5f));
    REQUIRE(streamed(1, 1) == Catch::Approx(7.0f / 3.0f));
    REQUIRE(streamed.isApprox(batch));
}
