#include "ltp_reduce/pipeline/combination_runner.hpp"
#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/events.hpp"
#include "ltp_reduce/core/utils.hpp"
#include "ltp_reduce/image/combination.hpp"
#include "ltp_reduce/image/spike_detection.hpp"
#include "ltp_reduce/pipeline/group_planner.hpp"
#include "ltp_reduce/pipeline/pattern_scan.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>
#include <set>
#include <thread>

namespace ltp_reduce::pipeline {

namespace {

using json = nlohmann::json;

std::string dims_to_string(const Matrix2Df& m) {
    return std::to_string(m.cols()) + "x" + std::to_string(m.rows());
}

std::string folder_range_name(const CombinationJob& job, const PlannedGroup& g) {
    return job.folder_prefix + std::to_string(g.first_index) + ".." +
           job.folder_prefix + std::to_string(g.last_index);
}

json job_to_json(const CombinationJob& job) {
    json j;
    j["input_root"] = job.input_root.string();
    j["output_root"] = job.output_root.string();
    j["start_index"] = job.start_index;
    j["end_index"] = job.end_index;
    j["output_prefix"] = job.output_prefix;
    j["folder_prefix"] = job.folder_prefix;
    j["base_filename"] = job.base_filename;
    j["output_extension"] = job.output_extension;
    j["mode"] = combine_mode_to_string(job.mode);
    j["method"] = combine_method_to_string(job.method);
    j["parallel_workers"] = job.parallel_workers;
    j["groups"] = json::array();
    for (const auto& g : job.groups) {
        j["groups"].push_back({{"name", g.name}, {"num_directories", g.folder_count}});
    }
    if (job.detection) {
        j["cosmic"] = {
            {"sigma", job.detection->sigma},
            {"window_size", job.detection->window_size},
            {"iterations", job.detection->iterations},
            {"min_intensity", job.detection->min_intensity}
        };
    } else {
        j["cosmic"] = nullptr;
    }
    return j;
}

int compute_worker_count(int requested, size_t task_count) {
    int workers = std::max(1, requested);
    int cpu_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (cpu_cores > 0) {
        workers = std::min(workers, cpu_cores);
    }
    if (task_count > 0) {
        workers = std::min(workers, static_cast<int>(task_count));
    }
    return std::max(1, workers);
}

class UnitExecutor {
public:
    UnitExecutor(const CombinationJob& job, const io::ImageIO& image_io,
                 const std::string& run_id, core::EventEmitter& emitter,
                 std::ostream& event_log, std::mutex& log_mutex)
        : job_(job), io_(image_io), run_id_(run_id), emitter_(emitter),
          event_log_(event_log), log_mutex_(log_mutex) {}

    // Returns true when the output was written.
    bool execute(const CombinationUnit& unit, std::vector<UnitError>& errors) {
        if (!unit.setup_errors.empty()) {
            errors = unit.setup_errors;
            return false;
        }

        auto fail = [&](const UnitSource* src, const fs::path& path, const std::string& msg) {
            UnitError e;
            e.group = unit.group;
            e.pattern_index = unit.pattern_index;
            e.folder_index = src ? src->folder_index : -1;
            e.path = path;
            e.message = msg;
            errors.push_back(e);
            return false;
        };

        image::NanAccumulator acc;
        int total_spikes = 0;
        for (const auto& src : unit.sources) {
            Matrix2Df img;
            try {
                img = io_.load(src.path);
            } catch (const std::exception& e) {
                return fail(&src, src.path, e.what());
            }

            if (job_.detection) {
                try {
                    auto det = image::detect_spikes_with_stats(img, *job_.detection);
                    total_spikes += det.total_flagged();
                    log_spikes(unit, src, det.flagged_per_pass);
                    img = std::move(det.image);
                } catch (const LtpReduceError& e) {
                    return fail(&src, src.path, e.what());
                }
            }

            if (acc.n_sources() > 0 && (img.rows() != acc.rows() || img.cols() != acc.cols())) {
                return fail(&src, src.path,
                            "dimension mismatch: " + dims_to_string(img) + " vs " +
                                std::to_string(acc.cols()) + "x" + std::to_string(acc.rows()));
            }
            try {
                acc.add(img);
            } catch (const ValidationError& e) {
                return fail(&src, src.path, e.what());
            }
        }

        if (acc.n_sources() == 0) {
            return fail(nullptr, unit.output, "no source images");
        }

        Matrix2Df combined = acc.result(job_.method);

        io::FitsHeader header;
        header.set("GROUP", unit.group);
        header.set("PATTERN", unit.pattern_index);
        header.set("NCOMBINE", acc.n_sources());
        header.set("COMBMETH", combine_method_to_string(job_.method));
        if (job_.detection) {
            header.set("SPKSIGMA", static_cast<double>(job_.detection->sigma));
            header.set("SPKWIN", job_.detection->window_size);
            header.set("SPKITER", job_.detection->iterations);
            header.set("SPKMIN", static_cast<double>(job_.detection->min_intensity));
            header.set("NSPIKES", total_spikes);
        }

        try {
            io_.save(unit.output, combined, header);
        } catch (const std::exception& e) {
            return fail(nullptr, unit.output, e.what());
        }
        return true;
    }

private:
    void log_spikes(const CombinationUnit& unit, const UnitSource& src,
                    const std::vector<int>& counts) {
        std::lock_guard<std::mutex> lock(log_mutex_);
        std::cout << "[SPIKES] " << unit.group << " " << job_.folder_prefix
                  << src.folder_index << " #" << src.pattern_index
                  << " found per pass: " << core::join_ints(counts, ", ") << std::endl;
        emitter_.spikes_detected(run_id_, unit.group, src.pattern_index,
                                 src.folder_index, counts, event_log_);
    }

    const CombinationJob& job_;
    const io::ImageIO& io_;
    const std::string& run_id_;
    core::EventEmitter& emitter_;
    std::ostream& event_log_;
    std::mutex& log_mutex_;
};

} // namespace

std::vector<PlannedGroup> validate_job(const CombinationJob& job) {
    if (job.detection) {
        image::validate_detection_parameters(*job.detection);
    }
    if (job.output_root.empty()) {
        throw ConfigError("output root must be set");
    }
    if (!io::is_supported_image_path(fs::path("x" + job.output_extension))) {
        throw ConfigError("unsupported output extension '" + job.output_extension + "'");
    }
    if (job.index_width < 1 || job.index_width > 12) {
        throw ConfigError("index width must be in [1,12]");
    }
    if (job.parallel_workers < 1) {
        throw ConfigError("parallel workers must be >= 1");
    }

    std::error_code ec;
    if (job.input_root.empty() || !fs::is_directory(job.input_root, ec)) {
        throw ConfigError("input root does not exist or is not a directory: " +
                          job.input_root.string());
    }

    return plan_groups(job.start_index, job.end_index, job.groups);
}

UnitPlan plan_units(const CombinationJob& job, const std::vector<PlannedGroup>& groups) {
    UnitPlan out;

    for (const auto& g : groups) {
        std::vector<FolderScan> scans;
        scans.reserve(static_cast<size_t>(g.folder_count()));
        std::set<int> all_indices;
        for (int fi = g.first_index; fi <= g.last_index; ++fi) {
            FolderScan scan = scan_pattern_folder(folder_path(job, fi), job.base_filename);
            if (!scan.exists) {
                out.warnings.push_back("folder not found: " + scan.folder.string());
            } else if (!scan.error.empty()) {
                out.warnings.push_back("cannot list folder " + scan.folder.string() + ": " +
                                       scan.error);
            }
            for (const auto& [idx, files] : scan.files) {
                all_indices.insert(idx);
            }
            scans.push_back(std::move(scan));
        }

        if (all_indices.empty()) {
            UnitError e;
            e.group = g.name;
            e.message = "no pattern images found in " + folder_range_name(job, g);
            out.group_errors.push_back(e);
            continue;
        }

        auto source_error = [&](int idx, int folder_index, const fs::path& path,
                                const std::string& msg) {
            UnitError e;
            e.group = g.name;
            e.pattern_index = idx;
            e.folder_index = folder_index;
            e.path = path;
            e.message = msg;
            return e;
        };

        // Collects the single source of idx in every folder, or the reasons it is missing.
        auto collect = [&](int idx, std::vector<UnitSource>& sources,
                           std::vector<UnitError>& errors) {
            for (size_t k = 0; k < scans.size(); ++k) {
                const int folder_index = g.first_index + static_cast<int>(k);
                auto it = scans[k].files.find(idx);
                if (it == scans[k].files.end()) {
                    errors.push_back(source_error(idx, folder_index, scans[k].folder,
                                                  "missing pattern image " +
                                                      core::zero_pad(idx, job.index_width)));
                } else if (it->second.size() > 1) {
                    std::vector<std::string> names;
                    for (const auto& p : it->second) names.push_back(p.filename().string());
                    errors.push_back(source_error(idx, folder_index, scans[k].folder,
                                                  "ambiguous pattern index: " +
                                                      core::join(names, ", ")));
                } else {
                    sources.push_back({folder_index, idx, it->second.front()});
                }
            }
        };

        if (job.mode == CombineMode::PER_PATTERN) {
            for (int idx : all_indices) {
                CombinationUnit unit;
                unit.group = g.name;
                unit.pattern_index = idx;
                unit.output = output_path(job, g.name, idx);
                collect(idx, unit.sources, unit.setup_errors);
                out.units.push_back(std::move(unit));
            }
        } else {
            CombinationUnit unit;
            unit.group = g.name;
            unit.pattern_index = -1;
            unit.output = output_path(job, g.name, -1);
            for (int idx : all_indices) {
                std::vector<UnitSource> sources;
                std::vector<UnitError> errors;
                collect(idx, sources, errors);
                if (errors.empty()) {
                    unit.sources.insert(unit.sources.end(), sources.begin(), sources.end());
                } else {
                    // Incomplete pattern: left out of the group image, reported per folder.
                    out.group_errors.insert(out.group_errors.end(), errors.begin(), errors.end());
                }
            }
            if (unit.sources.empty()) {
                UnitError e;
                e.group = g.name;
                e.message = "no pattern index is present in every folder of " +
                            folder_range_name(job, g);
                unit.setup_errors.push_back(e);
            }
            out.units.push_back(std::move(unit));
        }
    }
    return out;
}

RunResult run_combination(const CombinationJob& job, const io::ImageIO& image_io,
                          const ProgressSink& progress, std::atomic<bool>* stop_flag,
                          std::ostream& event_log) {
    RunResult result;
    result.run_id = core::get_run_id();
    result.status = RunStatus::RUNNING;
    core::EventEmitter emitter;

    std::vector<PlannedGroup> groups;
    try {
        groups = validate_job(job);
        std::error_code ec;
        fs::create_directories(job.output_root, ec);
        if (ec || !fs::is_directory(job.output_root, ec)) {
            throw IOError("cannot create output directory " + job.output_root.string() +
                          (ec ? ": " + ec.message() : std::string()));
        }
    } catch (const LtpReduceError& e) {
        result.status = RunStatus::FAILED;
        result.error_message = e.what();
        std::cerr << "[COMBINE] " << e.what() << std::endl;
        emitter.error(result.run_id, e.what(), event_log);
        emitter.run_end(result.run_id, result.status, {{"error", e.what()}}, event_log);
        return result;
    }

    emitter.run_start(result.run_id, {{"job", job_to_json(job)}}, event_log);

    UnitPlan unit_plan = plan_units(job, groups);
    for (const auto& w : unit_plan.warnings) {
        std::cout << "[PLAN] warning: " << w << std::endl;
        emitter.warning(result.run_id, w, event_log);
    }
    for (const auto& e : unit_plan.group_errors) {
        std::cerr << "[PLAN] " << e.group << ": " << e.message << std::endl;
        emitter.unit_error(result.run_id, e, event_log);
        result.errors.push_back(e);
    }
    for (const auto& g : groups) {
        const auto n = std::count_if(unit_plan.units.begin(), unit_plan.units.end(),
                                     [&](const CombinationUnit& u) { return u.group == g.name; });
        std::cout << "[PLAN] group '" << g.name << "': folders "
                  << folder_range_name(job, g) << ", " << n << " units" << std::endl;
        emitter.group_planned(result.run_id, g, static_cast<int>(n), event_log);
    }

    const auto& units = unit_plan.units;
    result.progress.total_units = static_cast<int>(units.size());

    std::mutex log_mutex;
    UnitExecutor executor(job, image_io, result.run_id, emitter, event_log, log_mutex);

    std::atomic<size_t> next_unit{0};
    std::atomic<bool> cancelled{false};
    int completed = 0;

    auto worker = [&]() {
        while (true) {
            if (stop_flag && stop_flag->load()) {
                if (next_unit.load() < units.size()) {
                    cancelled.store(true);
                }
                break;
            }
            const size_t ui = next_unit.fetch_add(1);
            if (ui >= units.size()) {
                break;
            }
            const CombinationUnit& unit = units[ui];

            std::vector<UnitError> errors;
            const bool ok = executor.execute(unit, errors);

            std::lock_guard<std::mutex> lock(log_mutex);
            ++completed;
            ProgressReport report;
            report.completed_units = completed;
            report.total_units = static_cast<int>(units.size());
            report.current_group = unit.group;
            report.current_pattern_index = unit.pattern_index;
            result.progress = report;

            if (ok) {
                result.outputs.push_back(unit.output);
                std::cout << "[COMBINE] " << completed << "/" << units.size() << " "
                          << unit.output.filename().string() << " ("
                          << unit.sources.size() << " sources)" << std::endl;
            } else {
                ++result.failed_units;
                for (const auto& e : errors) {
                    std::cerr << "[COMBINE] " << unit.group << " #" << unit.pattern_index
                              << " failed: " << e.message << std::endl;
                    emitter.unit_error(result.run_id, e, event_log);
                }
                result.errors.insert(result.errors.end(), errors.begin(), errors.end());
            }
            emitter.unit_done(result.run_id, report, ok, event_log);

            if (progress) {
                try {
                    progress(report);
                } catch (const std::exception& e) {
                    emitter.warning(result.run_id,
                                    std::string("progress callback failed: ") + e.what(),
                                    event_log);
                }
            }
        }
    };

    const int n_workers = compute_worker_count(job.parallel_workers, units.size());
    if (n_workers > 1) {
        std::cout << "[COMBINE] Using " << n_workers << " parallel workers for "
                  << units.size() << " units" << std::endl;
        std::vector<std::thread> workers;
        workers.reserve(static_cast<size_t>(n_workers));
        for (int w = 0; w < n_workers; ++w) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            if (t.joinable()) {
                t.join();
            }
        }
        std::sort(result.outputs.begin(), result.outputs.end());
    } else {
        worker();
    }

    result.status = cancelled.load() ? RunStatus::CANCELLED : RunStatus::COMPLETED;
    emitter.run_end(result.run_id, result.status,
                    {{"completed_units", result.progress.completed_units},
                     {"total_units", result.progress.total_units},
                     {"failed_units", result.failed_units},
                     {"outputs", static_cast<int>(result.outputs.size())},
                     {"errors", static_cast<int>(result.errors.size())}},
                    event_log);
    return result;
}

int exit_code_for(const RunResult& result) {
    switch (result.status) {
        case RunStatus::COMPLETED:
            if (result.progress.total_units == 0 ||
                result.failed_units >= result.progress.total_units) {
                return 1;
            }
            return 0;
        case RunStatus::CANCELLED:
            return 2;
        default:
            return 1;
    }
}

} // namespace ltp_reduce::pipeline
