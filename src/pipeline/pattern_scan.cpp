#include "ltp_reduce/pipeline/pattern_scan.hpp"
#include "ltp_reduce/core/utils.hpp"
#include "ltp_reduce/io/image_io.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace ltp_reduce::pipeline {

std::optional<int> parse_pattern_index(const fs::path& file, const std::string& base_filename) {
    if (!io::is_supported_image_path(file)) {
        return std::nullopt;
    }
    const std::string stem = file.stem().string();

    size_t digits_begin = stem.size();
    while (digits_begin > 0 && std::isdigit(static_cast<unsigned char>(stem[digits_begin - 1]))) {
        --digits_begin;
    }
    if (digits_begin == stem.size()) {
        return std::nullopt;
    }

    if (!base_filename.empty()) {
        std::string base = stem.substr(0, digits_begin);
        if (base != base_filename && base != base_filename + "_") {
            return std::nullopt;
        }
    }

    try {
        return std::stoi(stem.substr(digits_begin));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

FolderScan scan_pattern_folder(const fs::path& folder, const std::string& base_filename) {
    FolderScan scan;
    scan.folder = folder;

    std::error_code ec;
    if (!fs::is_directory(folder, ec)) {
        return scan;
    }
    scan.exists = true;

    std::vector<fs::path> entries;
    fs::directory_iterator it(folder, ec);
    if (ec) {
        scan.error = ec.message();
        return scan;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            scan.error = ec.message();
            break;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            entries.push_back(it->path());
        }
    }
    std::sort(entries.begin(), entries.end());

    for (const auto& p : entries) {
        auto idx = parse_pattern_index(p, base_filename);
        if (idx) {
            scan.files[*idx].push_back(p);
        }
    }
    return scan;
}

fs::path folder_path(const CombinationJob& job, int folder_index) {
    return job.input_root / (job.folder_prefix + std::to_string(folder_index));
}

fs::path output_path(const CombinationJob& job, const std::string& group, int pattern_index) {
    std::string name;
    if (!job.output_prefix.empty()) {
        name = job.output_prefix + "_";
    }
    name += group + "_";
    name += (pattern_index < 0) ? std::string("combined")
                                : core::zero_pad(pattern_index, job.index_width);
    name += job.output_extension;
    return job.output_root / name;
}

} // namespace ltp_reduce::pipeline
