#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/io/fits_io.hpp"
#include "ltp_reduce/io/image_io.hpp"
#include "test_support.hpp"

#include <cmath>
#include <limits>

#include <catch2/catch_test_macros.hpp>

using ltp_reduce::Matrix2Df;
using ltp_reduce::testing::TempDir;
namespace io = ltp_reduce::io;

static Matrix2Df sample_image() {
    Matrix2Df m(3, 4);
    m << 1.0f, 2.5f, -3.0f, 4.0f,
         5.0f, std::numeric_limits<float>::quiet_NaN(), 7.0f, 8.0f,
         9.0f, 10.0f, 11.0f, 12.25f;
    return m;
}

TEST_CASE("fits_write_read_keeps_values_nan_and_header") {
    TempDir tmp("fits");
    const auto p = tmp.path() / "out.fits";
    io::FitsHeader hdr;
    hdr.set("GROUP", std::string("center"));
    hdr.set("NCOMBINE", 2);
    hdr.set("SPKSIGMA", 5.0);

    io::write_image(p, sample_image(), hdr);
    auto [data, read_hdr] = io::read_fits_float(p);

    REQUIRE(data.rows() == 3);
    REQUIRE(data.cols() == 4);
    REQUIRE(data(0, 1) == 2.5f);
    REQUIRE(data(2, 3) == 12.25f);
    REQUIRE(std::isnan(data(1, 1)));
    REQUIRE(read_hdr.get_int("NCOMBINE") == 2);
    REQUIRE(read_hdr.get_string("GROUP") == std::string("center"));
}

TEST_CASE("tiff_write_read_keeps_float_samples") {
    TempDir tmp("tiff");
    const auto p = tmp.path() / "out.tif";

    io::write_image(p, sample_image());
    Matrix2Df data = io::read_image(p);

    REQUIRE(data.rows() == 3);
    REQUIRE(data.cols() == 4);
    REQUIRE(data(0, 2) == -3.0f);
    REQUIRE(std::isnan(data(1, 1)));
}

TEST_CASE("format_is_chosen_by_extension") {
    REQUIRE(io::detect_image_format("a.FITS") == io::ImageFormat::FITS);
    REQUIRE(io::detect_image_format("a.fit") == io::ImageFormat::FITS);
    REQUIRE(io::detect_image_format("a.tiff") == io::ImageFormat::TIFF);
    REQUIRE(io::detect_image_format("a.jpg") == io::ImageFormat::UNKNOWN);
}

TEST_CASE("unreadable_images_raise_io_errors") {
    TempDir tmp("bad");
    REQUIRE_THROWS_AS(io::read_image(tmp.path() / "missing.tif"), ltp_reduce::IOError);
    REQUIRE_THROWS_AS(io::read_image(tmp.path() / "missing.fits"), ltp_reduce::IOError);
    REQUIRE_THROWS_AS(io::read_image(tmp.path() / "image.png"), ltp_reduce::IOError);
    REQUIRE_THROWS_AS(io::write_image(tmp.path() / "empty.tif", Matrix2Df()), ltp_reduce::IOError);
}
