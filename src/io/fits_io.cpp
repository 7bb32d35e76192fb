#include "ltp_reduce/io/fits_io.hpp"
#include "ltp_reduce/core/errors.hpp"
#include "ltp_reduce/core/utils.hpp"

#include <fitsio.h>
#include <limits>
#include <memory>
#include <set>

namespace ltp_reduce::io {

namespace {

struct FitsCloser {
    void operator()(fitsfile* f) const {
        int status = 0;
        fits_close_file(f, &status);
    }
};

using FitsFilePtr = std::unique_ptr<fitsfile, FitsCloser>;

[[noreturn]] void throw_fits(const std::string& what, const fs::path& path, int status) {
    char text[FLEN_STATUS] = {0};
    fits_get_errstatus(status, text);
    throw FitsError(what + " " + path.string() + " (" + text + ")");
}

// Keys cfitsio writes itself from the image geometry.
bool is_structural_key(const std::string& key) {
    static const std::set<std::string> keys = {
        "SIMPLE", "BITPIX", "EXTEND", "XTENSION", "PCOUNT", "GCOUNT", "END"
    };
    return keys.count(key) > 0 || core::starts_with(key, "NAXIS");
}

std::string unquote(const std::string& raw) {
    std::string s = core::trim(raw);
    if (s.size() >= 2 && s.front() == '\'' && s.back() == '\'') {
        s = core::trim(s.substr(1, s.size() - 2));
    }
    return s;
}

FitsHeader read_header(fitsfile* fptr) {
    FitsHeader header;
    int status = 0;
    int nkeys = 0;
    if (fits_get_hdrspace(fptr, &nkeys, nullptr, &status)) {
        return header;
    }

    for (int i = 1; i <= nkeys; ++i) {
        char keyname[FLEN_KEYWORD] = {0};
        char value[FLEN_VALUE] = {0};
        char comment[FLEN_COMMENT] = {0};
        status = 0;
        if (fits_read_keyn(fptr, i, keyname, value, comment, &status)) {
            continue;
        }
        const std::string key(keyname);
        if (key.empty() || key == "COMMENT" || key == "HISTORY" || is_structural_key(key)) {
            continue;
        }

        char dtype = 'C';
        if (value[0] == '\0' || fits_get_keytype(value, &dtype, &status)) {
            dtype = 'C';
        }

        const std::string text = unquote(value);
        try {
            if (dtype == 'I') {
                header.set(key, std::stoi(text));
            } else if (dtype == 'F') {
                header.set(key, std::stod(text));
            } else {
                header.set(key, text);
            }
        } catch (const std::exception&) {
            // Out-of-range numbers stay available as text.
            header.set(key, text);
        }
    }
    return header;
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it == string_values.end()) return std::nullopt;
    return it->second;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) return it->second;
    auto iit = int_values.find(key);
    if (iit != int_values.end()) return static_cast<double>(iit->second);
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it == int_values.end()) return std::nullopt;
    return it->second;
}

void FitsHeader::set(const std::string& key, const std::string& value) {
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, double value) {
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    int_values[key] = value;
}

bool is_fits_image_path(const fs::path& path) {
    const std::string ext = core::to_lower(path.extension().string());
    return ext == ".fit" || ext == ".fits" || ext == ".fts";
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* raw = nullptr;
    int status = 0;
    // First HDU holding an image, so tile-compressed files work too.
    if (fits_open_image(&raw, path.string().c_str(), READONLY, &status)) {
        throw_fits("Cannot open FITS image", path, status);
    }
    FitsFilePtr fptr(raw);

    int naxis = 0;
    if (fits_get_img_dim(fptr.get(), &naxis, &status)) {
        throw_fits("Cannot read image dimensions of", path, status);
    }
    if (naxis != 2) {
        throw FitsError("Expected a 2-D image, NAXIS=" + std::to_string(naxis) + ": " +
                        path.string());
    }
    long naxes[2] = {0, 0};
    if (fits_get_img_size(fptr.get(), 2, naxes, &status)) {
        throw_fits("Cannot read image size of", path, status);
    }

    // FITS stores x fastest, which is the row-major layout of Matrix2Df.
    Matrix2Df data(naxes[1], naxes[0]);
    long fpixel[2] = {1, 1};
    float nulval = std::numeric_limits<float>::quiet_NaN();
    int anynul = 0;
    if (fits_read_pix(fptr.get(), TFLOAT, fpixel, static_cast<LONGLONG>(data.size()), &nulval,
                      data.data(), &anynul, &status)) {
        throw_fits("Cannot read pixels of", path, status);
    }

    return {std::move(data), read_header(fptr.get())};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    fitsfile* raw = nullptr;
    int status = 0;
    const std::string clobber = "!" + path.string();
    if (fits_create_file(&raw, clobber.c_str(), &status)) {
        throw_fits("Cannot create", path, status);
    }
    FitsFilePtr fptr(raw);

    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    if (fits_create_img(fptr.get(), FLOAT_IMG, 2, naxes, &status)) {
        throw_fits("Cannot create image HDU in", path, status);
    }

    for (const auto& [key, value] : header.string_values) {
        if (key.size() > 8) continue;
        fits_update_key_str(fptr.get(), key.c_str(), value.c_str(), nullptr, &status);
    }
    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() > 8) continue;
        fits_update_key_dbl(fptr.get(), key.c_str(), value, -9, nullptr, &status);
    }
    for (const auto& [key, value] : header.int_values) {
        if (key.size() > 8) continue;
        fits_update_key_lng(fptr.get(), key.c_str(), value, nullptr, &status);
    }
    if (status) {
        throw_fits("Cannot write header keys of", path, status);
    }

    long fpixel[2] = {1, 1};
    if (fits_write_pix(fptr.get(), TFLOAT, fpixel, static_cast<LONGLONG>(data.size()),
                       const_cast<float*>(data.data()), &status)) {
        throw_fits("Cannot write pixels of", path, status);
    }

    fitsfile* closing = fptr.release();
    if (fits_close_file(closing, &status)) {
        throw_fits("Cannot close", path, status);
    }
}

} // namespace ltp_reduce::io
