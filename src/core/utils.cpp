#include "ltp_reduce/core/utils.hpp"
#include "ltp_reduce/core/errors.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <random>
#include <sstream>

namespace ltp_reduce::core {

std::string get_iso_timestamp() {
    const auto now = std::chrono::system_clock::now();
    const std::time_t secs = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                            now.time_since_epoch()).count() % 1000;

    std::tm utc{};
    gmtime_r(&secs, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.'
        << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

std::string get_run_id() {
    const std::time_t secs = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&secs, &local);

    std::random_device rd;
    const uint32_t suffix = static_cast<uint32_t>(rd());

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y%m%d_%H%M%S") << '_'
        << std::hex << std::setw(8) << std::setfill('0') << suffix;
    return oss.str();
}

std::string read_text(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw IOError("Cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

void write_text(const fs::path& path, const std::string& text) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out || !(out << text) || !out.flush()) {
        throw IOError("Cannot write " + path.string());
    }
}

std::string to_lower(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

std::string trim(const std::string& s) {
    const char* ws = " \t\n\r";
    const auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return "";
    const auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

bool starts_with(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && std::equal(prefix.begin(), prefix.end(), str.begin());
}

std::string join(const std::vector<std::string>& parts, const std::string& delimiter) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += delimiter;
        out += parts[i];
    }
    return out;
}

std::string join_ints(const std::vector<int>& values, const std::string& delimiter) {
    std::vector<std::string> parts;
    parts.reserve(values.size());
    for (int v : values) {
        parts.push_back(std::to_string(v));
    }
    return join(parts, delimiter);
}

std::string zero_pad(int value, int width) {
    std::ostringstream oss;
    if (value < 0) {
        oss << '-';
        value = -value;
    }
    oss << std::setw(std::max(1, width)) << std::setfill('0') << value;
    return oss.str();
}

int count_invalid(const Matrix2Df& image) {
    return static_cast<int>(image.size() - image.array().isFinite().count());
}

} // namespace ltp_reduce::core
