#include "ltp_reduce/config/configuration.hpp"
#include "ltp_reduce/config/group_config.hpp"
#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/utils.hpp"
#include "ltp_reduce/image/spike_detection.hpp"
#include "ltp_reduce/io/image_io.hpp"

#include <fstream>

namespace ltp_reduce::config {

namespace {

// Plain scalars that read as integers become JSON integers, everything else a
// string, so a count written as 2.5 is still rejected by groups_from_json.
ordered_json yaml_to_json(const YAML::Node& n) {
    switch (n.Type()) {
        case YAML::NodeType::Sequence: {
            ordered_json arr = ordered_json::array();
            for (const auto& item : n) arr.push_back(yaml_to_json(item));
            return arr;
        }
        case YAML::NodeType::Map: {
            ordered_json obj = ordered_json::object();
            for (const auto& kv : n) obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            return obj;
        }
        case YAML::NodeType::Scalar: {
            long long iv = 0;
            if (n.Tag() != "!" && YAML::convert<long long>::decode(n, iv)) return iv;
            return n.as<std::string>();
        }
        default:
            return nullptr;
    }
}

template <typename T>
void read_value(const YAML::Node& section, const char* key, T& out) {
    if (!section[key]) return;
    try {
        out = section[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

std::string normalize_extension(const std::string& ext) {
    std::string e = core::to_lower(core::trim(ext));
    if (!e.empty() && e.front() != '.') {
        e = "." + e;
    }
    return e;
}

CombineConfig CombineConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

CombineConfig CombineConfig::from_yaml(const YAML::Node& node) {
    CombineConfig cfg;
    if (!node || node.IsNull()) {
        return cfg;
    }
    if (!node.IsMap()) {
        throw ConfigError("job file must be a YAML mapping");
    }

    if (node["input"]) {
        auto in = node["input"];
        read_value(in, "root", cfg.input.root);
        read_value(in, "start", cfg.input.start_index);
        read_value(in, "end", cfg.input.end_index);
        read_value(in, "folder_prefix", cfg.input.folder_prefix);
        read_value(in, "base_filename", cfg.input.base_filename);
    }

    if (node["output"]) {
        auto out = node["output"];
        read_value(out, "root", cfg.output.root);
        read_value(out, "prefix", cfg.output.prefix);
        read_value(out, "extension", cfg.output.extension);
        read_value(out, "index_width", cfg.output.index_width);
        cfg.output.extension = normalize_extension(cfg.output.extension);
    }

    if (node["groups"]) {
        const auto g = node["groups"];
        if (g.IsScalar()) {
            // Inline JSON string or a path to a JSON file, as on the command line.
            cfg.groups = load_group_config_text(g.as<std::string>());
        } else {
            cfg.groups = groups_from_json(yaml_to_json(g));
        }
    }

    if (node["cosmic"]) {
        auto c = node["cosmic"];
        cfg.cosmic.enabled = true;
        read_value(c, "enabled", cfg.cosmic.enabled);
        read_value(c, "sigma", cfg.cosmic.sigma);
        read_value(c, "window_size", cfg.cosmic.window_size);
        read_value(c, "iterations", cfg.cosmic.iterations);
        read_value(c, "min_intensity", cfg.cosmic.min_intensity);
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        read_value(r, "mode", cfg.runtime.mode);
        read_value(r, "method", cfg.runtime.method);
        read_value(r, "parallel_workers", cfg.runtime.parallel_workers);
    }

    return cfg;
}

void CombineConfig::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node CombineConfig::to_yaml() const {
    YAML::Node node;

    node["input"]["root"] = input.root;
    node["input"]["start"] = input.start_index;
    node["input"]["end"] = input.end_index;
    node["input"]["folder_prefix"] = input.folder_prefix;
    node["input"]["base_filename"] = input.base_filename;

    node["output"]["root"] = output.root;
    node["output"]["prefix"] = output.prefix;
    node["output"]["extension"] = output.extension;
    node["output"]["index_width"] = output.index_width;

    YAML::Node groups_node(YAML::NodeType::Sequence);
    for (const auto& g : groups) {
        YAML::Node entry;
        entry["name"] = g.name;
        entry["num_directories"] = g.folder_count;
        groups_node.push_back(entry);
    }
    node["groups"] = groups_node;

    node["cosmic"]["enabled"] = cosmic.enabled;
    node["cosmic"]["sigma"] = cosmic.sigma;
    node["cosmic"]["window_size"] = cosmic.window_size;
    node["cosmic"]["iterations"] = cosmic.iterations;
    node["cosmic"]["min_intensity"] = cosmic.min_intensity;

    node["runtime"]["mode"] = runtime.mode;
    node["runtime"]["method"] = runtime.method;
    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    return node;
}

void CombineConfig::validate() const {
    if (input.root.empty()) {
        throw ConfigError("input.root must be set");
    }
    if (output.root.empty()) {
        throw ConfigError("output.root must be set");
    }
    if (input.end_index < input.start_index) {
        throw ConfigError("input.end must be >= input.start");
    }
    if (groups.empty()) {
        throw ConfigError("groups must name at least one group");
    }
    if (!io::is_supported_image_path(fs::path("x" + output.extension))) {
        throw ConfigError("output.extension '" + output.extension + "' is not a supported format");
    }
    if (output.index_width < 1 || output.index_width > 12) {
        throw ConfigError("output.index_width must be in [1,12]");
    }
    if (!string_to_combine_mode(runtime.mode)) {
        throw ConfigError("runtime.mode must be 'pattern' or 'group'");
    }
    if (!string_to_combine_method(runtime.method)) {
        throw ConfigError("runtime.method must be 'mean' or 'sum'");
    }
    if (runtime.parallel_workers < 1) {
        throw ConfigError("runtime.parallel_workers must be >= 1");
    }
    if (cosmic.enabled) {
        DetectionParameters p;
        p.sigma = cosmic.sigma;
        p.window_size = cosmic.window_size;
        p.iterations = cosmic.iterations;
        p.min_intensity = cosmic.min_intensity;
        image::validate_detection_parameters(p);
    }
}

CombinationJob CombineConfig::to_job() const {
    CombinationJob job;
    job.input_root = input.root;
    job.output_root = output.root;
    job.start_index = input.start_index;
    job.end_index = input.end_index;
    job.output_prefix = output.prefix;
    job.groups = groups;
    job.folder_prefix = input.folder_prefix;
    job.base_filename = input.base_filename;
    job.output_extension = output.extension;
    job.index_width = output.index_width;
    job.mode = string_to_combine_mode(runtime.mode).value_or(CombineMode::PER_PATTERN);
    job.method = string_to_combine_method(runtime.method).value_or(CombineMethod::MEAN);
    job.parallel_workers = runtime.parallel_workers;
    if (cosmic.enabled) {
        DetectionParameters p;
        p.sigma = cosmic.sigma;
        p.window_size = cosmic.window_size;
        p.iterations = cosmic.iterations;
        p.min_intensity = cosmic.min_intensity;
        job.detection = p;
    }
    return job;
}

} // namespace ltp_reduce::config
