#include "ltp_reduce/pipeline/group_planner.hpp"
#include "ltp_reduce/core/errors.hpp"

#include <set>
#include <string>

namespace ltp_reduce::pipeline {

std::vector<PlannedGroup> plan_groups(int start_index, int end_index,
                                      const std::vector<MeasurementGroup>& groups) {
    if (groups.empty()) {
        throw ConfigError("group configuration is empty");
    }
    if (end_index < start_index) {
        throw ConfigError("end index " + std::to_string(end_index) +
                          " is before start index " + std::to_string(start_index));
    }

    std::set<std::string> seen;
    long long total = 0;
    for (const auto& g : groups) {
        if (g.name.empty()) {
            throw ConfigError("group name must not be empty");
        }
        if (g.name.find('/') != std::string::npos || g.name.find('\\') != std::string::npos) {
            throw ConfigError("group name '" + g.name + "' must not contain a path separator");
        }
        if (!seen.insert(g.name).second) {
            throw ConfigError("duplicate group name '" + g.name + "'");
        }
        if (g.folder_count < 1) {
            throw ConfigError("group '" + g.name + "' must have a folder count >= 1 (got " +
                              std::to_string(g.folder_count) + ")");
        }
        total += g.folder_count;
    }

    const long long available = static_cast<long long>(end_index) - start_index + 1;
    if (total != available) {
        throw ConfigError("group folder counts sum to " + std::to_string(total) +
                          " but the range [" + std::to_string(start_index) + ", " +
                          std::to_string(end_index) + "] holds " +
                          std::to_string(available) + " folders");
    }

    std::vector<PlannedGroup> plan;
    plan.reserve(groups.size());
    int next = start_index;
    for (const auto& g : groups) {
        PlannedGroup pg;
        pg.name = g.name;
        pg.first_index = next;
        pg.last_index = next + g.folder_count - 1;
        plan.push_back(pg);
        next = pg.last_index + 1;
    }
    return plan;
}

} // namespace ltp_reduce::pipeline
