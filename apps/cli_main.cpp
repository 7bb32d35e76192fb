#include "ltp_reduce/config/configuration.hpp"
#include "ltp_reduce/config/group_config.hpp"
#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/utils.hpp"
#include "ltp_reduce/image/spike_detection.hpp"
#include "ltp_reduce/io/image_io.hpp"
#include "ltp_reduce/pipeline/combination_runner.hpp"
#include "ltp_reduce/pipeline/group_planner.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <iostream>
#include <string>
#include <vector>

using namespace ltp_reduce;
using json = nlohmann::json;

static void print_json(const json& j) {
    std::cout << j.dump(2) << std::endl;
}

static int cmd_remove_spikes(const std::string& in_path, const std::string& out_path,
                             const DetectionParameters& params) {
    try {
        Matrix2Df img = io::read_image(in_path);
        auto det = image::detect_spikes_with_stats(img, params);

        io::FitsHeader header;
        header.set("SPKSIGMA", static_cast<double>(params.sigma));
        header.set("SPKWIN", params.window_size);
        header.set("SPKITER", params.iterations);
        header.set("SPKMIN", static_cast<double>(params.min_intensity));
        header.set("NSPIKES", det.total_flagged());
        io::write_image(out_path, det.image, header);

        json j;
        j["input"] = in_path;
        j["output"] = out_path;
        j["width"] = img.cols();
        j["height"] = img.rows();
        j["flagged_per_pass"] = det.flagged_per_pass;
        j["flagged_total"] = det.total_flagged();
        j["input_invalid"] = det.input_invalid;
        j["invalid_after"] = core::count_invalid(det.image);
        j["degenerate_pixels"] = det.degenerate_pixels;
        print_json(j);
        return 0;
    } catch (const LtpReduceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

static int cmd_plan(const std::string& group_config, int start_index, int end_index,
                    const std::string& input_dir, const std::string& folder_prefix,
                    const std::string& base_filename, const std::string& mode) {
    try {
        const auto groups = config::load_group_config_text(group_config);
        const auto planned = pipeline::plan_groups(start_index, end_index, groups);

        CombinationJob job;
        job.start_index = start_index;
        job.end_index = end_index;
        job.groups = groups;
        job.folder_prefix = folder_prefix;
        job.base_filename = base_filename;
        job.mode = string_to_combine_mode(mode).value_or(CombineMode::PER_PATTERN);

        json j;
        j["start"] = start_index;
        j["end"] = end_index;
        j["groups"] = json::array();
        for (const auto& g : planned) {
            json folders = json::array();
            for (int fi = g.first_index; fi <= g.last_index; ++fi) {
                folders.push_back(folder_prefix + std::to_string(fi));
            }
            j["groups"].push_back({{"name", g.name},
                                   {"first_index", g.first_index},
                                   {"last_index", g.last_index},
                                   {"folders", folders}});
        }

        if (!input_dir.empty()) {
            job.input_root = input_dir;
            const auto units = pipeline::plan_units(job, planned);
            json unit_list = json::array();
            for (const auto& u : units.units) {
                unit_list.push_back({{"group", u.group},
                                     {"pattern_index", u.pattern_index},
                                     {"sources", static_cast<int>(u.sources.size())},
                                     {"ready", u.setup_errors.empty()}});
            }
            json errors = json::array();
            for (const auto& u : units.units) {
                for (const auto& e : u.setup_errors) errors.push_back(core::unit_error_to_json(e));
            }
            for (const auto& e : units.group_errors) errors.push_back(core::unit_error_to_json(e));
            j["units"] = unit_list;
            j["errors"] = errors;
            j["warnings"] = units.warnings;
        }

        print_json(j);
        return 0;
    } catch (const LtpReduceError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}

static int cmd_check_job(const std::string& path) {
    try {
        auto cfg = config::CombineConfig::load(path);
        cfg.validate();
        const auto job = cfg.to_job();
        const auto planned = pipeline::validate_job(job);
        json j;
        j["valid"] = true;
        j["groups"] = config::groups_to_json(cfg.groups);
        j["planned_groups"] = static_cast<int>(planned.size());
        j["spike_detection"] = job.detection.has_value();
        print_json(j);
        return 0;
    } catch (const LtpReduceError& e) {
        print_json({{"valid", false}, {"error", e.what()}});
        return 1;
    }
}

int main(int argc, char* argv[]) {
    CLI::App app{"ltp_reduce tools"};
    app.require_subcommand(1);

    // remove-spikes
    std::string in_path, out_path;
    DetectionParameters params;
    auto* rs = app.add_subcommand("remove-spikes", "Set cosmic-ray spikes of one image invalid");
    rs->add_option("input", in_path, "Input image (.tif/.tiff/.fit/.fits)")->required();
    rs->add_option("output", out_path, "Output image")->required();
    rs->add_option("--sigma,--cosmic-sigma", params.sigma, "Threshold in local standard deviations")
        ->capture_default_str();
    rs->add_option("--window-size,--cosmic-window", params.window_size, "Odd window size, >= 3")
        ->capture_default_str();
    rs->add_option("--iterations,--cosmic-iterations", params.iterations, "Detection passes")
        ->capture_default_str();
    rs->add_option("--min-intensity,--cosmic-min", params.min_intensity, "Minimum spike intensity")
        ->capture_default_str();

    // plan
    std::string group_config, input_dir, base_filename;
    std::string folder_prefix = "g";
    std::string mode = "pattern";
    int start_index = 0;
    int end_index = 0;
    auto* plan = app.add_subcommand("plan", "Print the folder plan of a group configuration");
    plan->add_option("--config", group_config, "Group configuration JSON or file")->required();
    plan->add_option("--start", start_index, "First folder index")->required();
    plan->add_option("--end", end_index, "Last folder index (inclusive)")->required();
    plan->add_option("--input", input_dir, "Also scan this root for pattern images");
    plan->add_option("--folder-prefix", folder_prefix, "Measurement folder name prefix")
        ->capture_default_str();
    plan->add_option("--base-filename", base_filename, "Only use images whose name starts with this");
    plan->add_option("--mode", mode, "pattern | group")
        ->check(CLI::IsMember({"pattern", "group"}));

    // check-job
    std::string job_path;
    auto* check = app.add_subcommand("check-job", "Validate a YAML job file");
    check->add_option("job", job_path, "Job file")->required();

    CLI11_PARSE(app, argc, argv);

    if (rs->parsed()) {
        return cmd_remove_spikes(in_path, out_path, params);
    }
    if (plan->parsed()) {
        return cmd_plan(group_config, start_index, end_index, input_dir, folder_prefix,
                        base_filename, mode);
    }
    if (check->parsed()) {
        return cmd_check_job(job_path);
    }
    return 1;
}
