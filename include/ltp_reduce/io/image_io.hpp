#pragma once

#include "ltp_reduce/core/types.hpp"
#include "ltp_reduce/io/fits_io.hpp"

#include <functional>

namespace ltp_reduce::io {

enum class ImageFormat {
    FITS,
    TIFF,
    UNKNOWN
};

ImageFormat detect_image_format(const fs::path& path);

bool is_supported_image_path(const fs::path& path);

// Single-channel images only; integer samples are converted to float.
Matrix2Df read_image(const fs::path& path);

// FITS keeps the header keys; TIFF is written as 32-bit float and ignores them.
void write_image(const fs::path& path, const Matrix2Df& data,
                 const FitsHeader& header = FitsHeader());

// Load/save hooks used by the combination runner. Both report failures by
// throwing IOError (or a subclass).
struct ImageIO {
    std::function<Matrix2Df(const fs::path&)> load;
    std::function<void(const fs::path&, const Matrix2Df&, const FitsHeader&)> save;
};

ImageIO file_image_io();

} // namespace ltp_reduce::io
