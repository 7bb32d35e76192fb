#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>

namespace ltp_reduce::core {

using json = nlohmann::json;

class EventEmitter {
public:
    EventEmitter() = default;

    void run_start(const std::string& run_id, const json& extra, std::ostream& out);
    void run_end(const std::string& run_id, RunStatus status, const json& extra, std::ostream& out);

    void group_planned(const std::string& run_id, const PlannedGroup& group,
                       int n_units, std::ostream& out);

    void unit_done(const std::string& run_id, const ProgressReport& report,
                   bool success, std::ostream& out);
    void unit_error(const std::string& run_id, const UnitError& error, std::ostream& out);

    void spikes_detected(const std::string& run_id, const std::string& group,
                         int pattern_index, int folder_index,
                         const std::vector<int>& counts_per_pass, std::ostream& out);

    void warning(const std::string& run_id, const std::string& message, std::ostream& out);
    void error(const std::string& run_id, const std::string& message, std::ostream& out);

private:
    void emit(const json& event, std::ostream& out);
    json base_event(const std::string& type, const std::string& run_id);
};

json progress_to_json(const ProgressReport& report);
json unit_error_to_json(const UnitError& error);

} // namespace ltp_reduce::core
