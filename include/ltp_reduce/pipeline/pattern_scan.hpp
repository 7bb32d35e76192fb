#pragma once

#include "ltp_reduce/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace ltp_reduce::pipeline {

struct FolderScan {
    fs::path folder;
    bool exists = false;
    std::string error;  // set when the folder exists but cannot be listed
    // pattern index -> matching files; more than one entry means ambiguous
    std::map<int, std::vector<fs::path>> files;
};

// Pattern index of "<base>_<digits>.<ext>" or "<base><digits>.<ext>".
// When base_filename is non-empty the name must start with it.
std::optional<int> parse_pattern_index(const fs::path& file, const std::string& base_filename);

FolderScan scan_pattern_folder(const fs::path& folder, const std::string& base_filename);

fs::path folder_path(const CombinationJob& job, int folder_index);

// "<prefix>_<group>_<index>.<ext>", or "..._combined.<ext>" for pattern_index < 0
fs::path output_path(const CombinationJob& job, const std::string& group, int pattern_index);

} // namespace ltp_reduce::pipeline
