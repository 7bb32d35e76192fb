#pragma once

#include "ltp_reduce/core/types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace ltp_reduce::config {

using ordered_json = nlohmann::ordered_json;

// Group configuration, in configuration order. Two shapes are accepted:
//   [{"center": 2, "side": 2}]                         one object, name -> count
//   [{"name": "center", "num_directories": 2}, ...]    one object per group
// "num_images" is accepted as an alias of "num_directories".
// Throws ConfigError on malformed input.
std::vector<MeasurementGroup> groups_from_json(const ordered_json& j);

std::vector<MeasurementGroup> parse_group_config(const std::string& json_text);

// The argument is either the JSON text itself or the path of a file holding it.
std::vector<MeasurementGroup> load_group_config_text(const std::string& arg);

ordered_json groups_to_json(const std::vector<MeasurementGroup>& groups);

} // namespace ltp_reduce::config
