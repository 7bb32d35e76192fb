#pragma once

#include "ltp_reduce/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace ltp_reduce::io {

struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
};

bool is_fits_image_path(const fs::path& path);

// Undefined (BLANK) samples are returned as NaN.
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

} // namespace ltp_reduce::io
