#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"

#include <fitsio.h>
#include <algorithm>
#include <cstring>
#include <set>

namespace insar_rate::io {

namespace {

// Length of the value field of a single header card
constexpr size_t kMaxCardString = 68;

bool is_reserved_key(const std::string& key) {
    static const std::set<std::string> reserved = {
        "SIMPLE", "BITPIX", "NAXIS", "EXTEND", "BZERO", "BSCALE", "PCOUNT",
        "GCOUNT", "CONTINUE", "COMMENT", "HISTORY", "END", "LONGSTRN"};
    if (key.empty() || reserved.count(key) > 0) {
        return true;
    }
    // NAXIS1, NAXIS2, ...
    return core::starts_with(key, "NAXIS");
}

// Closes the file and raises with the cfitsio message attached
[[noreturn]] void fail(fitsfile* fptr, int status, const std::string& what,
                       const fs::path& path) {
    char msg[FLEN_STATUS];
    fits_get_errstatus(status, msg);
    int close_status = 0;
    if (fptr) {
        fits_close_file(fptr, &close_status);
    }
    throw FitsError(what + ": " + path.string() + " (" + msg + ")");
}

fitsfile* open_readonly(const fs::path& path) {
    fitsfile* fptr = nullptr;
    int status = 0;
    if (fits_open_file(&fptr, path.string().c_str(), READONLY, &status)) {
        throw FitsError("Cannot open FITS file: " + path.string());
    }
    return fptr;
}

fitsfile* create_image(const fs::path& path, int bitpix, int naxis, long* naxes) {
    fitsfile* fptr = nullptr;
    int status = 0;

    std::string filepath = "!" + path.string();
    if (fits_create_file(&fptr, filepath.c_str(), &status)) {
        throw FitsError("Cannot create FITS file: " + path.string());
    }

    fits_create_img(fptr, bitpix, naxis, naxes, &status);
    if (status) {
        fail(fptr, status, "Cannot create FITS image", path);
    }
    return fptr;
}

FitsHeader read_header(fitsfile* fptr, const fs::path& path) {
    FitsHeader header;
    int status = 0;

    char card[FLEN_CARD];
    int nkeys = 0;
    fits_get_hdrspace(fptr, &nkeys, nullptr, &status);
    if (status) {
        fail(fptr, status, "Cannot read FITS header", path);
    }

    for (int i = 1; i <= nkeys; ++i) {
        fits_read_record(fptr, i, card, &status);
        if (status) {
            fail(fptr, status, "Cannot read FITS header record", path);
        }

        char keyname[FLEN_KEYWORD];
        char value[FLEN_VALUE];
        char comment[FLEN_COMMENT];
        int keylen = 0;

        fits_get_keyname(card, keyname, &keylen, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string key(keyname);
        if (is_reserved_key(key)) {
            continue;
        }

        fits_parse_value(card, value, comment, &status);
        if (status) {
            status = 0;
            continue;
        }
        if (value[0] == '\0') {
            continue;
        }

        char dtype;
        fits_get_keytype(value, &dtype, &status);
        if (status) {
            status = 0;
            continue;
        }

        std::string val_str(value);
        val_str.erase(0, val_str.find_first_not_of(" '"));
        val_str.erase(val_str.find_last_not_of(" '") + 1);

        switch (dtype) {
            case 'C':
                if (!val_str.empty() && val_str.back() == '&') {
                    char* longstr = nullptr;
                    char long_comment[FLEN_COMMENT];
                    if (fits_read_key_longstr(fptr, key.c_str(), &longstr, long_comment,
                                              &status)) {
                        fail(fptr, status, "Cannot read long string keyword " + key, path);
                    }
                    val_str = longstr;
                    fits_free_memory(longstr, &status);
                }
                header.set(key, val_str);
                break;
            case 'L':
                header.set(key, val_str == "T" || val_str == "1");
                break;
            case 'I':
                try {
                    header.set(key, std::stoi(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, std::stod(val_str));
                }
                break;
            case 'F':
                try {
                    header.set(key, std::stod(val_str));
                } catch (const std::logic_error&) {
                    header.set(key, val_str);
                }
                break;
            default:
                header.set(key, val_str);
                break;
        }
    }

    return header;
}

void write_header(fitsfile* fptr, const FitsHeader& header, const fs::path& path) {
    int status = 0;

    for (const auto& [key, value] : header.string_values) {
        if (key.size() > 8 || is_reserved_key(key)) continue;
        if (value.size() > kMaxCardString) {
            fits_update_key_longstr(fptr, key.c_str(), value.c_str(), nullptr, &status);
        } else {
            fits_update_key(fptr, TSTRING, key.c_str(),
                            const_cast<char*>(value.c_str()), nullptr, &status);
        }
    }

    for (const auto& [key, value] : header.numeric_values) {
        if (key.size() > 8 || is_reserved_key(key)) continue;
        double val = value;
        fits_update_key(fptr, TDOUBLE, key.c_str(), &val, nullptr, &status);
    }

    for (const auto& [key, value] : header.int_values) {
        if (key.size() > 8 || is_reserved_key(key)) continue;
        int val = value;
        fits_update_key(fptr, TINT, key.c_str(), &val, nullptr, &status);
    }

    for (const auto& [key, value] : header.bool_values) {
        if (key.size() > 8 || is_reserved_key(key)) continue;
        int val = value ? 1 : 0;
        fits_update_key(fptr, TLOGICAL, key.c_str(), &val, nullptr, &status);
    }

    if (status) {
        fail(fptr, status, "Cannot write FITS header", path);
    }
}

void close_checked(fitsfile* fptr, const fs::path& path) {
    int status = 0;
    if (fits_close_file(fptr, &status)) {
        throw FitsError("Cannot close FITS file: " + path.string());
    }
}

} // namespace

std::optional<std::string> FitsHeader::get_string(const std::string& key) const {
    auto it = string_values.find(key);
    if (it != string_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_double(const std::string& key) const {
    auto it = numeric_values.find(key);
    if (it != numeric_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<int> FitsHeader::get_int(const std::string& key) const {
    auto it = int_values.find(key);
    if (it != int_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<bool> FitsHeader::get_bool(const std::string& key) const {
    auto it = bool_values.find(key);
    if (it != bool_values.end()) {
        return it->second;
    }
    return std::nullopt;
}

std::optional<double> FitsHeader::get_number(const std::string& key) const {
    if (auto d = get_double(key)) {
        return d;
    }
    if (auto i = get_int(key)) {
        return static_cast<double>(*i);
    }
    return std::nullopt;
}

bool FitsHeader::contains(const std::string& key) const {
    return string_values.count(key) > 0 || numeric_values.count(key) > 0 ||
           int_values.count(key) > 0 || bool_values.count(key) > 0;
}

void FitsHeader::erase(const std::string& key) {
    string_values.erase(key);
    numeric_values.erase(key);
    int_values.erase(key);
    bool_values.erase(key);
}

// A keyword holds exactly one typed value
void FitsHeader::set(const std::string& key, const std::string& value) {
    erase(key);
    string_values[key] = value;
}

void FitsHeader::set(const std::string& key, const char* value) {
    set(key, std::string(value));
}

void FitsHeader::set(const std::string& key, double value) {
    erase(key);
    numeric_values[key] = value;
}

void FitsHeader::set(const std::string& key, int value) {
    erase(key);
    int_values[key] = value;
}

void FitsHeader::set(const std::string& key, bool value) {
    erase(key);
    bool_values[key] = value;
}

bool operator==(const FitsHeader& a, const FitsHeader& b) {
    return a.string_values == b.string_values && a.numeric_values == b.numeric_values &&
           a.int_values == b.int_values && a.bool_values == b.bool_values;
}

std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    int status = 0;

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fail(fptr, status, "Cannot read FITS image parameters", path);
    }

    if (naxis != 2) {
        fail(fptr, BAD_NAXIS, "FITS file is not a 2D image", path);
    }

    long width = naxes[0];
    long height = naxes[1];
    long npixels = width * height;

    Matrix2Df data(height, width);
    long fpixel[2] = {1, 1};

    fits_read_pix(fptr, TFLOAT, fpixel, npixels, nullptr, data.data(), nullptr, &status);
    if (status) {
        fail(fptr, status, "Cannot read FITS pixel data", path);
    }

    FitsHeader header = read_header(fptr, path);
    close_checked(fptr, path);

    return {data, header};
}

void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header) {
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fitsfile* fptr = create_image(path, FLOAT_IMG, 2, naxes);

    write_header(fptr, header, path);

    std::vector<float> buffer(data.data(), data.data() + data.size());

    int status = 0;
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(buffer.size()), buffer.data(),
                   &status);
    if (status) {
        fail(fptr, status, "Cannot write FITS pixel data", path);
    }

    close_checked(fptr, path);
}

Matrix2Dd read_fits_double(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    int status = 0;

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fail(fptr, status, "Cannot read FITS image parameters", path);
    }
    if (naxis != 2) {
        fail(fptr, BAD_NAXIS, "FITS file is not a 2D image", path);
    }

    Matrix2Dd data(naxes[1], naxes[0]);
    long fpixel[2] = {1, 1};
    fits_read_pix(fptr, TDOUBLE, fpixel, naxes[0] * naxes[1], nullptr, data.data(), nullptr,
                  &status);
    if (status) {
        fail(fptr, status, "Cannot read FITS pixel data", path);
    }

    close_checked(fptr, path);
    return data;
}

void write_fits_double(const fs::path& path, const Matrix2Dd& data, const FitsHeader& header) {
    long naxes[2] = {static_cast<long>(data.cols()), static_cast<long>(data.rows())};
    fitsfile* fptr = create_image(path, DOUBLE_IMG, 2, naxes);

    write_header(fptr, header, path);

    std::vector<double> buffer(data.data(), data.data() + data.size());

    int status = 0;
    long fpixel[2] = {1, 1};
    fits_write_pix(fptr, TDOUBLE, fpixel, static_cast<LONGLONG>(buffer.size()), buffer.data(),
                   &status);
    if (status) {
        fail(fptr, status, "Cannot write FITS pixel data", path);
    }

    close_checked(fptr, path);
}

std::pair<Cube, FitsHeader> read_fits_cube(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    int status = 0;

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fail(fptr, status, "Cannot read FITS image parameters", path);
    }
    if (naxis != 3) {
        fail(fptr, BAD_NAXIS, "FITS file is not a 3D cube", path);
    }

    const long width = naxes[0];
    const long height = naxes[1];
    const long depth = naxes[2];

    Cube planes;
    planes.reserve(static_cast<size_t>(depth));
    for (long k = 0; k < depth; ++k) {
        Matrix2Df plane(height, width);
        long fpixel[3] = {1, 1, k + 1};
        fits_read_pix(fptr, TFLOAT, fpixel, width * height, nullptr, plane.data(), nullptr,
                      &status);
        if (status) {
            fail(fptr, status, "Cannot read FITS cube plane " + std::to_string(k), path);
        }
        planes.push_back(std::move(plane));
    }

    FitsHeader header = read_header(fptr, path);
    close_checked(fptr, path);

    return {planes, header};
}

void write_fits_cube(const fs::path& path, const Cube& planes, const FitsHeader& header) {
    if (planes.empty()) {
        throw FitsError("Cannot write an empty cube: " + path.string());
    }

    const long height = static_cast<long>(planes.front().rows());
    const long width = static_cast<long>(planes.front().cols());
    for (const auto& plane : planes) {
        if (plane.rows() != height || plane.cols() != width) {
            throw FitsError("Cube planes differ in shape: " + path.string());
        }
    }

    long naxes[3] = {width, height, static_cast<long>(planes.size())};
    fitsfile* fptr = create_image(path, FLOAT_IMG, 3, naxes);

    write_header(fptr, header, path);

    int status = 0;
    std::vector<float> buffer(static_cast<size_t>(width * height));
    for (size_t k = 0; k < planes.size(); ++k) {
        std::copy(planes[k].data(), planes[k].data() + planes[k].size(), buffer.begin());
        long fpixel[3] = {1, 1, static_cast<long>(k) + 1};
        fits_write_pix(fptr, TFLOAT, fpixel, static_cast<LONGLONG>(buffer.size()),
                       buffer.data(), &status);
        if (status) {
            fail(fptr, status, "Cannot write FITS cube plane " + std::to_string(k), path);
        }
    }

    close_checked(fptr, path);
}

std::tuple<int, int, int> get_fits_dimensions(const fs::path& path) {
    fitsfile* fptr = open_readonly(path);
    int status = 0;

    int naxis = 0;
    long naxes[3] = {0, 0, 0};
    int bitpix = 0;

    fits_get_img_param(fptr, 3, &bitpix, &naxis, naxes, &status);
    if (status) {
        fail(fptr, status, "Cannot read FITS dimensions", path);
    }
    close_checked(fptr, path);

    return {static_cast<int>(naxes[0]), static_cast<int>(naxes[1]), naxis};
}

} // namespace insar_rate::io
