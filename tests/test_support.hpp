#pragma once

#include "ltp_reduce/core/utils.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>

namespace ltp_reduce::testing {

namespace fs = std::filesystem;

// Scratch directory removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag)
        : path_(fs::temp_directory_path() / ("ltp_reduce_" + tag + "_" + core::get_run_id())) {
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};

inline void touch(const fs::path& p) {
    fs::create_directories(p.parent_path());
    std::ofstream out(p);
}

} // namespace ltp_reduce::testing
