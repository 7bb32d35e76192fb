#include "ltp_reduce/config/group_config.hpp"
#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/utils.hpp"

#include <system_error>

namespace ltp_reduce::config {

namespace {

int read_count(const ordered_json& v, const std::string& what) {
    if (!v.is_number_integer()) {
        throw ConfigError(what + " must be an integer, got " + v.dump());
    }
    const auto n = v.get<long long>();
    if (n < 1 || n > 1000000) {
        throw ConfigError(what + " must be >= 1, got " + std::to_string(n));
    }
    return static_cast<int>(n);
}

bool is_explicit_entry(const ordered_json& entry) {
    return entry.contains("name");
}

MeasurementGroup read_explicit_entry(const ordered_json& entry, size_t pos) {
    const std::string where = "groups[" + std::to_string(pos) + "]";
    for (const auto& item : entry.items()) {
        if (item.key() != "name" && item.key() != "num_directories" &&
            item.key() != "num_images") {
            throw ConfigError(where + ": unknown key '" + item.key() + "'");
        }
    }
    if (!entry["name"].is_string()) {
        throw ConfigError(where + ".name must be a string");
    }

    MeasurementGroup g;
    g.name = entry["name"].get<std::string>();

    const bool has_dirs = entry.contains("num_directories");
    const bool has_images = entry.contains("num_images");
    if (!has_dirs && !has_images) {
        throw ConfigError(where + " ('" + g.name + "') needs num_directories");
    }
    if (has_dirs) {
        g.folder_count = read_count(entry["num_directories"], where + ".num_directories");
    }
    if (has_images) {
        const int n = read_count(entry["num_images"], where + ".num_images");
        if (has_dirs && n != g.folder_count) {
            throw ConfigError(where + ": num_directories and num_images disagree (" +
                              std::to_string(g.folder_count) + " vs " + std::to_string(n) + ")");
        }
        g.folder_count = n;
    }
    return g;
}

} // namespace

std::vector<MeasurementGroup> groups_from_json(const ordered_json& j) {
    if (!j.is_array()) {
        throw ConfigError("group configuration must be a JSON array");
    }
    if (j.empty()) {
        throw ConfigError("group configuration is empty");
    }

    std::vector<MeasurementGroup> groups;

    const bool explicit_form = j.front().is_object() && is_explicit_entry(j.front());
    for (size_t i = 0; i < j.size(); ++i) {
        const auto& entry = j[i];
        if (!entry.is_object()) {
            throw ConfigError("groups[" + std::to_string(i) + "] must be an object");
        }
        if (is_explicit_entry(entry) != explicit_form) {
            throw ConfigError("groups[" + std::to_string(i) +
                              "]: cannot mix {name: count} and {\"name\": ...} entries");
        }
        if (explicit_form) {
            groups.push_back(read_explicit_entry(entry, i));
            continue;
        }
        if (entry.empty()) {
            throw ConfigError("groups[" + std::to_string(i) + "] is an empty object");
        }
        for (const auto& item : entry.items()) {
            MeasurementGroup g;
            g.name = item.key();
            g.folder_count = read_count(item.value(), "group '" + g.name + "'");
            groups.push_back(g);
        }
    }
    return groups;
}

std::vector<MeasurementGroup> parse_group_config(const std::string& json_text) {
    ordered_json j;
    try {
        j = ordered_json::parse(json_text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("malformed group configuration JSON: ") + e.what());
    }
    return groups_from_json(j);
}

std::vector<MeasurementGroup> load_group_config_text(const std::string& arg) {
    const std::string text = core::trim(arg);
    if (core::starts_with(text, "[") || core::starts_with(text, "{")) {
        return parse_group_config(text);
    }

    std::error_code ec;
    if (!fs::is_regular_file(fs::path(text), ec)) {
        throw ConfigError("group configuration is neither JSON nor a readable file: " + text);
    }
    try {
        return parse_group_config(core::read_text(text));
    } catch (const IOError& e) {
        throw ConfigError(e.what());
    }
}

ordered_json groups_to_json(const std::vector<MeasurementGroup>& groups) {
    ordered_json j = ordered_json::array();
    for (const auto& g : groups) {
        j.push_back({{"name", g.name}, {"num_directories", g.folder_count}});
    }
    return j;
}

} // namespace ltp_reduce::config
