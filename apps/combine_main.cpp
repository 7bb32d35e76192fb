#include "ltp_reduce/config/configuration.hpp"
#include "ltp_reduce/config/group_config.hpp"
#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/events.hpp"
#include "ltp_reduce/core/utils.hpp"
#include "ltp_reduce/io/image_io.hpp"
#include "ltp_reduce/pipeline/combination_runner.hpp"

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <string>

using namespace ltp_reduce;
using json = nlohmann::json;

namespace {

std::atomic<bool> g_stop_requested{false};

void handle_sigint(int) { g_stop_requested.store(true); }

json build_manifest(const CombinationJob &job, const RunResult &result) {
  json m;
  m["run_id"] = result.run_id;
  m["status"] = run_status_to_string(result.status);
  m["exit_code"] = pipeline::exit_code_for(result);
  if (!result.error_message.empty()) {
    m["error"] = result.error_message;
  }
  m["input_root"] = job.input_root.string();
  m["output_root"] = job.output_root.string();
  m["progress"] = core::progress_to_json(result.progress);
  m["failed_units"] = result.failed_units;
  m["outputs"] = json::array();
  for (const auto &p : result.outputs) {
    m["outputs"].push_back(p.string());
  }
  m["errors"] = json::array();
  for (const auto &e : result.errors) {
    m["errors"].push_back(core::unit_error_to_json(e));
  }
  return m;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"Combine repeated pattern exposures per measurement group"};

  std::string job_path;
  std::string input_dir, output_dir, prefix, group_config;
  int start_index = 0;
  int end_index = 0;
  float sigma = 5.0f;
  int window_size = 5;
  int iterations = 3;
  float min_intensity = 0.0f;
  std::string folder_prefix, base_filename, extension, mode, method;
  int index_width = 5;
  int workers = 1;
  std::string manifest_path, events_path;

  app.add_option("--job", job_path, "YAML job file; flags override its values");
  auto *o_input = app.add_option("--input", input_dir, "Root folder holding the measurement folders");
  auto *o_output = app.add_option("--output", output_dir, "Output folder");
  auto *o_start = app.add_option("--start", start_index, "First folder index");
  auto *o_end = app.add_option("--end", end_index, "Last folder index (inclusive)");
  auto *o_prefix = app.add_option("--prefix", prefix, "Output filename prefix");
  auto *o_config = app.add_option("--config", group_config,
                                  "Group configuration: JSON text or path to a JSON file");

  auto *o_sigma = app.add_option("--cosmic-sigma,--sigma", sigma, "Spike threshold in local standard deviations");
  auto *o_window = app.add_option("--cosmic-window,--window-size", window_size, "Spike detection window (odd, >= 3)");
  auto *o_iter = app.add_option("--cosmic-iterations,--iterations", iterations, "Spike detection passes");
  auto *o_min = app.add_option("--cosmic-min,--min-intensity", min_intensity, "Minimum spike intensity");

  auto *o_folder_prefix = app.add_option("--folder-prefix", folder_prefix, "Measurement folder name prefix (default g)");
  auto *o_base = app.add_option("--base-filename", base_filename, "Only use images whose name starts with this");
  auto *o_ext = app.add_option("--ext", extension, "Output extension: .tif or .fits");
  auto *o_width = app.add_option("--index-width", index_width, "Zero padding of the pattern index");
  auto *o_mode = app.add_option("--mode", mode, "pattern | group")
                     ->check(CLI::IsMember({"pattern", "group"}));
  auto *o_method = app.add_option("--method", method, "mean | sum")
                       ->check(CLI::IsMember({"mean", "sum"}));
  auto *o_workers = app.add_option("--workers", workers, "Parallel workers (1 = sequential)");
  app.add_option("--manifest", manifest_path, "Write a JSON run report to this file");
  app.add_option("--events-file", events_path, "Write JSON-lines events to this file ('-' = stdout)");

  CLI11_PARSE(app, argc, argv);

  CombinationJob job;
  try {
    config::CombineConfig cfg;
    if (!job_path.empty()) {
      cfg = config::CombineConfig::load(job_path);
    }

    if (o_input->count()) cfg.input.root = input_dir;
    if (o_output->count()) cfg.output.root = output_dir;
    if (o_start->count()) cfg.input.start_index = start_index;
    if (o_end->count()) cfg.input.end_index = end_index;
    if (o_prefix->count()) cfg.output.prefix = prefix;
    if (o_config->count()) cfg.groups = config::load_group_config_text(group_config);

    if (o_sigma->count() || o_window->count() || o_iter->count() || o_min->count()) {
      cfg.cosmic.enabled = true;
    }
    if (o_sigma->count()) cfg.cosmic.sigma = sigma;
    if (o_window->count()) cfg.cosmic.window_size = window_size;
    if (o_iter->count()) cfg.cosmic.iterations = iterations;
    if (o_min->count()) cfg.cosmic.min_intensity = min_intensity;

    if (o_folder_prefix->count()) cfg.input.folder_prefix = folder_prefix;
    if (o_base->count()) cfg.input.base_filename = base_filename;
    if (o_ext->count()) cfg.output.extension = config::normalize_extension(extension);
    if (o_width->count()) cfg.output.index_width = index_width;
    if (o_mode->count()) cfg.runtime.mode = mode;
    if (o_method->count()) cfg.runtime.method = method;
    if (o_workers->count()) cfg.runtime.parallel_workers = workers;

    cfg.validate();
    job = cfg.to_job();
  } catch (const LtpReduceError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::ofstream events_file;
  std::ostream null_stream(nullptr);
  std::ostream *event_log = &null_stream;
  if (events_path == "-") {
    event_log = &std::cout;
  } else if (!events_path.empty()) {
    events_file.open(events_path, std::ios::out | std::ios::app);
    if (!events_file) {
      std::cerr << "Error: cannot open events file " << events_path << std::endl;
      return 1;
    }
    event_log = &events_file;
  }

  std::signal(SIGINT, handle_sigint);

  if (job.detection) {
    std::cout << "[COMBINE] Spike detection: sigma=" << job.detection->sigma
              << " window=" << job.detection->window_size
              << " iterations=" << job.detection->iterations
              << " min=" << job.detection->min_intensity << std::endl;
  } else {
    std::cout << "[COMBINE] Spike detection disabled" << std::endl;
  }

  const io::ImageIO image_io = io::file_image_io();
  RunResult result = pipeline::run_combination(job, image_io, {}, &g_stop_requested, *event_log);

  const int code = pipeline::exit_code_for(result);
  std::cout << "[COMBINE] " << run_status_to_string(result.status) << ": "
            << result.progress.completed_units << "/" << result.progress.total_units
            << " units, " << result.outputs.size() << " written, "
            << result.failed_units << " failed" << std::endl;
  if (result.status == RunStatus::COMPLETED && result.progress.total_units == 0) {
    std::cerr << "Error: no pattern images found" << std::endl;
  } else if (code != 0 && result.status == RunStatus::COMPLETED) {
    std::cerr << "Error: every unit failed" << std::endl;
  }

  if (!manifest_path.empty()) {
    try {
      core::write_text(manifest_path, build_manifest(job, result).dump(2) + "\n");
    } catch (const IOError &e) {
      std::cerr << "Error: " << e.what() << std::endl;
      return code == 0 ? 1 : code;
    }
  }

  return code;
}
