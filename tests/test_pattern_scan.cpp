#include "ltp_reduce/pipeline/pattern_scan.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

using ltp_reduce::CombinationJob;
using ltp_reduce::testing::TempDir;
using ltp_reduce::testing::touch;
namespace pipeline = ltp_reduce::pipeline;

TEST_CASE("pattern_index_is_the_trailing_number_of_the_stem") {
    REQUIRE(pipeline::parse_pattern_index("img_00001.tif", "") == 1);
    REQUIRE(pipeline::parse_pattern_index("img_00042.TIFF", "") == 42);
    REQUIRE(pipeline::parse_pattern_index("frame7.fits", "") == 7);
    REQUIRE(pipeline::parse_pattern_index("00003.fit", "") == 3);

    REQUIRE_FALSE(pipeline::parse_pattern_index("img.tif", "").has_value());
    REQUIRE_FALSE(pipeline::parse_pattern_index("img_00001.txt", "").has_value());
    REQUIRE_FALSE(pipeline::parse_pattern_index("img_00001.png", "").has_value());
}

TEST_CASE("base_filename_restricts_matching_files") {
    REQUIRE(pipeline::parse_pattern_index("img_00001.tif", "img") == 1);
    REQUIRE(pipeline::parse_pattern_index("img00001.tif", "img") == 1);
    REQUIRE_FALSE(pipeline::parse_pattern_index("dark_00001.tif", "img").has_value());
    REQUIRE_FALSE(pipeline::parse_pattern_index("img_b_00001.tif", "img").has_value());
}

TEST_CASE("folder_scan_groups_files_by_pattern_index") {
    TempDir tmp("scan");
    const auto folder = tmp.path() / "g3";
    touch(folder / "img_00001.tif");
    touch(folder / "img_00002.tif");
    touch(folder / "other_00002.tif");
    touch(folder / "notes.txt");

    auto scan = pipeline::scan_pattern_folder(folder, "");
    REQUIRE(scan.exists);
    REQUIRE(scan.error.empty());
    REQUIRE(scan.files.size() == 2);
    REQUIRE(scan.files.at(1).size() == 1);
    REQUIRE(scan.files.at(2).size() == 2);

    auto filtered = pipeline::scan_pattern_folder(folder, "img");
    REQUIRE(filtered.files.at(2).size() == 1);
    REQUIRE(filtered.files.at(2).front().filename() == "img_00002.tif");

    auto missing = pipeline::scan_pattern_folder(tmp.path() / "g9", "");
    REQUIRE_FALSE(missing.exists);
    REQUIRE(missing.files.empty());
}

TEST_CASE("output_names_follow_prefix_group_index") {
    CombinationJob job;
    job.input_root = "/in";
    job.output_root = "/out";
    job.output_prefix = "X";

    REQUIRE(pipeline::output_path(job, "a", 1) == std::filesystem::path("/out/X_a_00001.tif"));
    REQUIRE(pipeline::output_path(job, "a", -1) == std::filesystem::path("/out/X_a_combined.tif"));
    REQUIRE(pipeline::folder_path(job, 4) == std::filesystem::path("/in/g4"));

    job.output_prefix.clear();
    job.output_extension = ".fits";
    job.index_width = 3;
    job.folder_prefix.clear();
    REQUIRE(pipeline::output_path(job, "side", 12) == std::filesystem::path("/out/side_012.fits"));
    REQUIRE(pipeline::folder_path(job, 4) == std::filesystem::path("/in/4"));
}
