#pragma once

#include "types.hpp"
#include <filesystem>
#include <string>
#include <vector>

namespace ltp_reduce::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::string join(const std::vector<std::string>& parts, const std::string& delimiter);
std::string join_ints(const std::vector<int>& values, const std::string& delimiter);
std::string zero_pad(int value, int width);

// Image utilities
int count_invalid(const Matrix2Df& image);

} // namespace ltp_reduce::core
