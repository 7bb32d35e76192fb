#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/types.hpp"
#include "ltp_reduce/core/utils.hpp"
#include "ltp_reduce/image/spike_detection.hpp"

#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_test_macros.hpp>

using ltp_reduce::DetectionParameters;
using ltp_reduce::Matrix2Df;
namespace image = ltp_reduce::image;

static DetectionParameters make_params(float sigma, int window, int iterations, float min_intensity = 0.0f) {
    DetectionParameters p;
    p.sigma = sigma;
    p.window_size = window;
    p.iterations = iterations;
    p.min_intensity = min_intensity;
    return p;
}

TEST_CASE("flat_field_has_no_false_positives") {
    Matrix2Df img = Matrix2Df::Constant(16, 16, 123.5f);

    for (float sigma : {0.5f, 1.0f, 5.0f}) {
        auto res = image::detect_spikes_with_stats(img, make_params(sigma, 5, 3));
        REQUIRE(res.total_flagged() == 0);
        REQUIRE(ltp_reduce::core::count_invalid(res.image) == 0);
        REQUIRE(res.image.isApprox(img));
    }
}

TEST_CASE("single_spike_is_the_only_flagged_pixel") {
    Matrix2Df img = Matrix2Df::Constant(9, 9, 10.0f);
    img(4, 4) = 10000.0f;

    auto res = image::detect_spikes_with_stats(img, make_params(5.0f, 5, 1));

    REQUIRE(res.flagged_per_pass.size() == 1);
    REQUIRE(res.flagged_per_pass[0] == 1);
    REQUIRE(std::isnan(res.image(4, 4)));
    for (int y = 0; y < 9; ++y) {
        for (int x = 0; x < 9; ++x) {
            if (y == 4 && x == 4) continue;
            REQUIRE(res.image(y, x) == 10.0f);
        }
    }
}

TEST_CASE("spike_at_the_border_is_flagged_with_a_clipped_window") {
    Matrix2Df img = Matrix2Df::Constant(8, 8, 10.0f);
    img(0, 7) = 5000.0f;

    auto out = image::detect_spikes(img, make_params(5.0f, 5, 1));

    REQUIRE(std::isnan(out(0, 7)));
    REQUIRE(ltp_reduce::core::count_invalid(out) == 1);
}

TEST_CASE("all_passes_run_and_later_passes_reveal_masked_spikes") {
    // The strong spike hides the weaker one from the first pass.
    Matrix2Df img = Matrix2Df::Constant(7, 7, 10.0f);
    img(3, 3) = 100000.0f;
    img(3, 4) = 200.0f;

    auto res = image::detect_spikes_with_stats(img, make_params(3.0f, 3, 3));

    const std::vector<int> expected{1, 1, 0};
    REQUIRE(res.flagged_per_pass == expected);
    REQUIRE(std::isnan(res.image(3, 3)));
    REQUIRE(std::isnan(res.image(3, 4)));
    REQUIRE(res.total_flagged() == 2);

    auto first_only = image::detect_spikes_with_stats(img, make_params(3.0f, 3, 1));
    REQUIRE(std::isnan(first_only.image(3, 3)));
    REQUIRE(first_only.image(3, 4) == 200.0f);
}

TEST_CASE("detection_is_idempotent_on_its_own_output") {
    Matrix2Df img = Matrix2Df::Constant(12, 12, 50.0f);
    img(2, 3) = 9000.0f;
    img(8, 9) = 7000.0f;
    img(5, 5) = std::numeric_limits<float>::quiet_NaN();

    const auto params = make_params(5.0f, 5, 2);
    Matrix2Df once = image::detect_spikes(img, params);
    Matrix2Df twice = image::detect_spikes(once, params);

    for (int y = 0; y < img.rows(); ++y) {
        for (int x = 0; x < img.cols(); ++x) {
            if (std::isnan(once(y, x))) {
                REQUIRE(std::isnan(twice(y, x)));
            }
        }
    }
    REQUIRE(ltp_reduce::core::count_invalid(twice) >= ltp_reduce::core::count_invalid(once));
}

TEST_CASE("invalid_input_samples_stay_invalid_and_are_not_counted") {
    Matrix2Df img = Matrix2Df::Constant(6, 6, 1.0f);
    img(1, 1) = std::numeric_limits<float>::quiet_NaN();
    img(2, 4) = std::numeric_limits<float>::infinity();

    auto res = image::detect_spikes_with_stats(img, make_params(5.0f, 3, 2));

    REQUIRE(res.input_invalid == 2);
    REQUIRE(res.total_flagged() == 0);
    REQUIRE(std::isnan(res.image(1, 1)));
    REQUIRE(std::isnan(res.image(2, 4)));
    REQUIRE(res.image(0, 0) == 1.0f);
}

TEST_CASE("pixel_without_valid_neighbours_passes_through") {
    const float nan = std::numeric_limits<float>::quiet_NaN();
    Matrix2Df img = Matrix2Df::Constant(3, 3, nan);
    img(1, 1) = 1000.0f;

    auto res = image::detect_spikes_with_stats(img, make_params(1.0f, 3, 1));

    REQUIRE(res.total_flagged() == 0);
    REQUIRE(res.degenerate_pixels == 1);
    REQUIRE(res.image(1, 1) == 1000.0f);
}

TEST_CASE("min_intensity_suppresses_weak_outliers") {
    Matrix2Df img = Matrix2Df::Constant(9, 9, 10.0f);
    img(4, 4) = 60.0f;

    auto below = image::detect_spikes_with_stats(img, make_params(5.0f, 5, 1, 100.0f));
    REQUIRE(below.total_flagged() == 0);

    auto above = image::detect_spikes_with_stats(img, make_params(5.0f, 5, 1, 50.0f));
    REQUIRE(above.total_flagged() == 1);
}

TEST_CASE("sigma_zero_flags_anything_above_the_local_mean") {
    Matrix2Df img = Matrix2Df::Constant(5, 5, 10.0f);
    img(2, 2) = 10.5f;

    auto res = image::detect_spikes_with_stats(img, make_params(0.0f, 3, 1));

    REQUIRE(res.flagged_per_pass[0] == 1);
    REQUIRE(std::isnan(res.image(2, 2)));
}

TEST_CASE("input_image_is_not_modified") {
    Matrix2Df img = Matrix2Df::Constant(9, 9, 10.0f);
    img(4, 4) = 10000.0f;
    const Matrix2Df copy = img;

    (void)image::detect_spikes(img, make_params(5.0f, 5, 3));

    REQUIRE(img(4, 4) == copy(4, 4));
}

TEST_CASE("invalid_detection_parameters_are_config_errors") {
    Matrix2Df img = Matrix2Df::Constant(9, 9, 10.0f);

    REQUIRE_THROWS_AS(image::detect_spikes(img, make_params(5.0f, 4, 1)), ltp_reduce::ConfigError);
    REQUIRE_THROWS_AS(image::detect_spikes(img, make_params(5.0f, 1, 1)), ltp_reduce::ConfigError);
    REQUIRE_THROWS_AS(image::detect_spikes(img, make_params(5.0f, 5, 0)), ltp_reduce::ConfigError);
    REQUIRE_THROWS_AS(image::detect_spikes(img, make_params(-1.0f, 5, 1)), ltp_reduce::ConfigError);
    REQUIRE_THROWS_AS(image::detect_spikes(img, make_params(5.0f, 5, 1, -2.0f)), ltp_reduce::ConfigError);
}

TEST_CASE("window_larger_than_image_is_rejected") {
    Matrix2Df img = Matrix2Df::Constant(4, 20, 10.0f);

    REQUIRE_THROWS_AS(image::detect_spikes(img, make_params(5.0f, 5, 1)), ltp_reduce::ConfigError);
    REQUIRE_NOTHROW(image::detect_spikes(img, make_params(5.0f, 3, 1)));
}
