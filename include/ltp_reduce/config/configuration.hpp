#pragma once

#include "ltp_reduce/core/types.hpp"
#include <filesystem>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace ltp_reduce::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string root;
  int start_index = 0;
  int end_index = 0;
  std::string folder_prefix = "g";
  std::string base_filename; // empty = any base name
};

struct OutputConfig {
  std::string root;
  std::string prefix;
  std::string extension = ".tif";
  int index_width = 5;
};

struct CosmicConfig {
  bool enabled = false;
  float sigma = 5.0f;
  int window_size = 5;
  int iterations = 3;
  float min_intensity = 0.0f;
};

struct RuntimeConfig {
  std::string mode = "pattern"; // pattern | group
  std::string method = "mean";  // mean | sum
  int parallel_workers = 1;
};

struct CombineConfig {
  InputConfig input;
  OutputConfig output;
  std::vector<MeasurementGroup> groups;
  CosmicConfig cosmic;
  RuntimeConfig runtime;

  static CombineConfig load(const fs::path &path);
  static CombineConfig from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  // Throws ConfigError.
  void validate() const;

  // Requires a config that passed validate().
  CombinationJob to_job() const;
};

std::string normalize_extension(const std::string &ext);

} // namespace ltp_reduce::config
