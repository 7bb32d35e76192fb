#pragma once

#include "ltp_reduce/core/types.hpp"
#include <vector>

namespace ltp_reduce::pipeline {

// Assigns consecutive folder runs to groups in configuration order, starting
// at start_index. Throws ConfigError unless the folder counts add up to
// exactly end_index - start_index + 1, or when a group is malformed (empty or
// duplicate name, name with a path separator, folder_count < 1).
std::vector<PlannedGroup> plan_groups(int start_index, int end_index,
                                      const std::vector<MeasurementGroup>& groups);

} // namespace ltp_reduce::pipeline
