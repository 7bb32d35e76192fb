#pragma once

#include <stdexcept>
#include <string>

namespace ltp_reduce {

class LtpReduceError : public std::runtime_error {
public:
    explicit LtpReduceError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public LtpReduceError {
public:
    explicit ConfigError(const std::string& message)
        : LtpReduceError("Config error: " + message) {}
};

class ValidationError : public LtpReduceError {
public:
    explicit ValidationError(const std::string& message)
        : LtpReduceError("Validation error: " + message) {}
};

class IOError : public LtpReduceError {
public:
    explicit IOError(const std::string& message)
        : LtpReduceError("I/O error: " + message) {}
};

class FitsError : public IOError {
public:
    explicit FitsError(const std::string& message)
        : IOError("FITS error: " + message) {}
};

class ImageFormatError : public IOError {
public:
    explicit ImageFormatError(const std::string& message)
        : IOError("Image format error: " + message) {}
};

} // namespace ltp_reduce
