#pragma once

#include "ltp_reduce/core/types.hpp"
#include "ltp_reduce/io/image_io.hpp"

#include <atomic>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace ltp_reduce::pipeline {

using ProgressSink = std::function<void(const ProgressReport&)>;

struct UnitSource {
    int folder_index = 0;
    int pattern_index = 0;
    fs::path path;
};

// One (group, pattern index) task, or one whole group in WHOLE_GROUP mode.
struct CombinationUnit {
    std::string group;
    int pattern_index = -1;
    std::vector<UnitSource> sources;
    std::vector<UnitError> setup_errors;  // non-empty: the unit fails without loading
    fs::path output;
};

struct UnitPlan {
    std::vector<CombinationUnit> units;
    std::vector<UnitError> group_errors;  // reported, but not counted as units
    std::vector<std::string> warnings;
};

// Checks everything that can be checked before any unit runs and returns the
// folder plan. Throws ConfigError.
std::vector<PlannedGroup> validate_job(const CombinationJob& job);

// Scans the planned folders and derives the units of work.
UnitPlan plan_units(const CombinationJob& job, const std::vector<PlannedGroup>& groups);

// Runs the whole job. Configuration errors end the run in FAILED before any
// unit starts; failures inside a unit are collected in RunResult::errors and
// the run continues. stop_flag is checked between units only; already written
// outputs are kept when a run is cancelled. progress is invoked once per
// finished unit, serialised even with parallel workers.
RunResult run_combination(const CombinationJob& job, const io::ImageIO& image_io,
                          const ProgressSink& progress, std::atomic<bool>* stop_flag,
                          std::ostream& event_log);

int exit_code_for(const RunResult& result);

} // namespace ltp_reduce::pipeline
