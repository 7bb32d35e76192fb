#include "ltp_reduce/core/events.hpp"
#include "ltp_reduce/core/utils.hpp"

namespace ltp_reduce::core {

json EventEmitter::base_event(const std::string& type, const std::string& run_id) {
    return {
        {"type", type},
        {"run_id", run_id},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event, std::ostream& out) {
    out << event.dump() << "\n";
    out.flush();
}

void EventEmitter::run_start(const std::string& run_id, const json& extra, std::ostream& out) {
    json event = base_event("run_start", run_id);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::run_end(const std::string& run_id, RunStatus status,
                           const json& extra, std::ostream& out) {
    json event = base_event("run_end", run_id);
    event["success"] = (status == RunStatus::COMPLETED);
    event["status"] = run_status_to_string(status);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::group_planned(const std::string& run_id, const PlannedGroup& group,
                                 int n_units, std::ostream& out) {
    json event = base_event("group_planned", run_id);
    event["group"] = group.name;
    event["first_index"] = group.first_index;
    event["last_index"] = group.last_index;
    event["units"] = n_units;
    emit(event, out);
}

void EventEmitter::unit_done(const std::string& run_id, const ProgressReport& report,
                             bool success, std::ostream& out) {
    json event = base_event("unit_done", run_id);
    for (auto& [key, value] : progress_to_json(report).items()) {
        event[key] = value;
    }
    event["success"] = success;
    emit(event, out);
}

void EventEmitter::unit_error(const std::string& run_id, const UnitError& error,
                              std::ostream& out) {
    json event = base_event("unit_error", run_id);
    for (auto& [key, value] : unit_error_to_json(error).items()) {
        event[key] = value;
    }
    emit(event, out);
}

void EventEmitter::spikes_detected(const std::string& run_id, const std::string& group,
                                   int pattern_index, int folder_index,
                                   const std::vector<int>& counts_per_pass,
                                   std::ostream& out) {
    json event = base_event("spikes_detected", run_id);
    event["group"] = group;
    event["pattern_index"] = pattern_index;
    event["folder_index"] = folder_index;
    event["counts"] = counts_per_pass;
    emit(event, out);
}

void EventEmitter::warning(const std::string& run_id, const std::string& message,
                           std::ostream& out) {
    json event = base_event("warning", run_id);
    event["message"] = message;
    emit(event, out);
}

void EventEmitter::error(const std::string& run_id, const std::string& message,
                         std::ostream& out) {
    json event = base_event("error", run_id);
    event["message"] = message;
    emit(event, out);
}

json progress_to_json(const ProgressReport& report) {
    return {
        {"completed_units", report.completed_units},
        {"total_units", report.total_units},
        {"current_group", report.current_group},
        {"current_pattern_index", report.current_pattern_index}
    };
}

json unit_error_to_json(const UnitError& error) {
    return {
        {"group", error.group},
        {"pattern_index", error.pattern_index},
        {"folder_index", error.folder_index},
        {"path", error.path.string()},
        {"message", error.message}
    };
}

} // namespace ltp_reduce::core
