#include "ltp_reduce/config/configuration.hpp"
#include "ltp_reduce/core/errors.hpp"

#include <filesystem>

#include <catch2/catch_test_macros.hpp>
#include <yaml-cpp/yaml.h>

namespace config = ltp_reduce::config;

static const char* kJobYaml = R"(
input:
  root: /data/run7
  start: 2
  end: 5
  folder_prefix: ""
output:
  root: /data/run7/combined
  prefix: X
  extension: fits
groups:
  - center: 2
    side: 2
cosmic:
  sigma: 4.5
  window_size: 7
runtime:
  method: sum
  parallel_workers: 2
)";

TEST_CASE("yaml_job_file_maps_to_a_combination_job") {
    auto cfg = config::CombineConfig::from_yaml(YAML::Load(kJobYaml));

    REQUIRE(cfg.input.root == "/data/run7");
    REQUIRE(cfg.input.folder_prefix.empty());
    REQUIRE(cfg.output.extension == ".fits");
    REQUIRE(cfg.groups.size() == 2);
    REQUIRE(cfg.groups[0].name == "center");
    REQUIRE(cfg.groups[1].name == "side");
    REQUIRE(cfg.cosmic.enabled);
    REQUIRE(cfg.cosmic.iterations == 3);
    REQUIRE_NOTHROW(cfg.validate());

    auto job = cfg.to_job();
    REQUIRE(job.start_index == 2);
    REQUIRE(job.end_index == 5);
    REQUIRE(job.output_prefix == "X");
    REQUIRE(job.detection.has_value());
    REQUIRE(job.detection->window_size == 7);
    REQUIRE(job.detection->sigma == 4.5f);
    REQUIRE(job.method == ltp_reduce::CombineMethod::SUM);
    REQUIRE(job.mode == ltp_reduce::CombineMode::PER_PATTERN);
    REQUIRE(job.parallel_workers == 2);
}

TEST_CASE("missing_cosmic_section_disables_detection") {
    auto cfg = config::CombineConfig::from_yaml(YAML::Load(R"(
input: {root: /in, start: 0, end: 0}
output: {root: /out}
groups: [{name: a, num_directories: 1}]
)"));

    REQUIRE_NOTHROW(cfg.validate());
    REQUIRE_FALSE(cfg.to_job().detection.has_value());
}

TEST_CASE("groups_may_be_given_as_a_json_string") {
    auto cfg = config::CombineConfig::from_yaml(YAML::Load(R"(groups: '[{"a": 2}, {"b": 1}]')"));

    REQUIRE(cfg.groups.size() == 2);
    REQUIRE(cfg.groups[1].folder_count == 1);
}

TEST_CASE("invalid_job_values_fail_validation") {
    auto base = config::CombineConfig::from_yaml(YAML::Load(kJobYaml));

    auto cfg = base;
    cfg.cosmic.window_size = 4;
    REQUIRE_THROWS_AS(cfg.validate(), ltp_reduce::ConfigError);

    cfg = base;
    cfg.runtime.mode = "everything";
    REQUIRE_THROWS_AS(cfg.validate(), ltp_reduce::ConfigError);

    cfg = base;
    cfg.output.extension = ".png";
    REQUIRE_THROWS_AS(cfg.validate(), ltp_reduce::ConfigError);

    cfg = base;
    cfg.input.root.clear();
    REQUIRE_THROWS_AS(cfg.validate(), ltp_reduce::ConfigError);

    cfg = base;
    cfg.groups.clear();
    REQUIRE_THROWS_AS(cfg.validate(), ltp_reduce::ConfigError);

    REQUIRE_THROWS_AS(config::CombineConfig::from_yaml(YAML::Load("groups: [{a: 1.5}]")),
                      ltp_reduce::ConfigError);
    REQUIRE_THROWS_AS(config::CombineConfig::from_yaml(YAML::Load("input: {start: abc}")),
                      ltp_reduce::ConfigError);
}

TEST_CASE("yaml_round_trip_keeps_the_job") {
    auto cfg = config::CombineConfig::from_yaml(YAML::Load(kJobYaml));
    auto again = config::CombineConfig::from_yaml(cfg.to_yaml());

    REQUIRE(again.groups.size() == cfg.groups.size());
    REQUIRE(again.groups[1].name == "side");
    REQUIRE(again.output.prefix == "X");
    REQUIRE(again.cosmic.window_size == 7);
    REQUIRE(again.runtime.method == "sum");
}

TEST_CASE("missing_job_file_is_a_config_error") {
    REQUIRE_THROWS_AS(config::CombineConfig::load("/nonexistent/ltp_job.yaml"), ltp_reduce::ConfigError);
}

TEST_CASE("extensions_are_normalized") {
    REQUIRE(config::normalize_extension("TIF") == ".tif");
    REQUIRE(config::normalize_extension(".fits") == ".fits");
    REQUIRE(config::normalize_extension("") == "");
}
