#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace ltp_reduce {

namespace fs = std::filesystem;

// Image plane. NaN marks an invalid sample.
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

inline bool same_shape(const Matrix2Df& a, const Matrix2Df& b) {
    return a.rows() == b.rows() && a.cols() == b.cols();
}

// Spike (cosmic ray) detection parameters
struct DetectionParameters {
    float sigma = 5.0f;         // threshold in local standard deviations
    int window_size = 5;        // odd, >= 3
    int iterations = 3;         // fixed number of passes
    float min_intensity = 0.0f; // pixel must also exceed this value
};

struct MeasurementGroup {
    std::string name;
    int folder_count = 0;
};

// One planned group: folders [first_index, last_index] inclusive
struct PlannedGroup {
    std::string name;
    int first_index = 0;
    int last_index = 0;

    int folder_count() const { return last_index - first_index + 1; }
};

enum class CombineMode {
    PER_PATTERN,  // one output per pattern index
    WHOLE_GROUP   // one output per group
};

enum class CombineMethod {
    MEAN,
    SUM  // NaN-aware mean scaled by the number of sources
};

inline std::string combine_mode_to_string(CombineMode mode) {
    switch (mode) {
        case CombineMode::PER_PATTERN: return "pattern";
        case CombineMode::WHOLE_GROUP: return "group";
        default: return "UNKNOWN";
    }
}

inline std::optional<CombineMode> string_to_combine_mode(const std::string& s) {
    if (s == "pattern") return CombineMode::PER_PATTERN;
    if (s == "group") return CombineMode::WHOLE_GROUP;
    return std::nullopt;
}

inline std::string combine_method_to_string(CombineMethod method) {
    switch (method) {
        case CombineMethod::MEAN: return "mean";
        case CombineMethod::SUM: return "sum";
        default: return "UNKNOWN";
    }
}

inline std::optional<CombineMethod> string_to_combine_method(const std::string& s) {
    if (s == "mean") return CombineMethod::MEAN;
    if (s == "sum") return CombineMethod::SUM;
    return std::nullopt;
}

// Immutable description of one combination run
struct CombinationJob {
    fs::path input_root;
    fs::path output_root;
    int start_index = 0;
    int end_index = 0;  // inclusive
    std::string output_prefix;
    std::vector<MeasurementGroup> groups;
    std::optional<DetectionParameters> detection;  // nullopt = disabled

    std::string folder_prefix = "g";
    std::string base_filename;          // empty = any base
    std::string output_extension = ".tif";
    int index_width = 5;
    CombineMode mode = CombineMode::PER_PATTERN;
    CombineMethod method = CombineMethod::MEAN;
    int parallel_workers = 1;
};

struct ProgressReport {
    int completed_units = 0;
    int total_units = 0;
    std::string current_group;
    int current_pattern_index = -1;  // -1 for whole-group units
};

// Per-unit failure. folder_index is -1 when no single folder is at fault.
struct UnitError {
    std::string group;
    int pattern_index = -1;
    int folder_index = -1;
    fs::path path;
    std::string message;
};

enum class RunStatus {
    IDLE,
    RUNNING,
    COMPLETED,
    CANCELLED,
    FAILED
};

inline std::string run_status_to_string(RunStatus status) {
    switch (status) {
        case RunStatus::IDLE: return "idle";
        case RunStatus::RUNNING: return "running";
        case RunStatus::COMPLETED: return "completed";
        case RunStatus::CANCELLED: return "cancelled";
        case RunStatus::FAILED: return "failed";
        default: return "unknown";
    }
}

struct RunResult {
    RunStatus status = RunStatus::IDLE;
    std::string run_id;
    std::string error_message;  // set when status == FAILED
    ProgressReport progress;
    int failed_units = 0;
    std::vector<fs::path> outputs;
    std::vector<UnitError> errors;
};

} // namespace ltp_reduce
