#pragma once

#include "insar_rate/core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>

namespace insar_rate::io {

// Typed view of the non-structural keywords of a FITS primary header.
// String values longer than one card are stored with the long-string
// (CONTINUE) convention.
struct FitsHeader {
    std::map<std::string, std::string> string_values;
    std::map<std::string, double> numeric_values;
    std::map<std::string, int> int_values;
    std::map<std::string, bool> bool_values;

    std::optional<std::string> get_string(const std::string& key) const;
    std::optional<double> get_double(const std::string& key) const;
    std::optional<int> get_int(const std::string& key) const;
    std::optional<bool> get_bool(const std::string& key) const;

    // Numeric lookup that also accepts integer keywords
    std::optional<double> get_number(const std::string& key) const;

    bool contains(const std::string& key) const;
    void erase(const std::string& key);

    void set(const std::string& key, const std::string& value);
    void set(const std::string& key, const char* value);
    void set(const std::string& key, double value);
    void set(const std::string& key, int value);
    void set(const std::string& key, bool value);
};

bool operator==(const FitsHeader& a, const FitsHeader& b);

// 2D single precision image (rows x cols)
std::pair<Matrix2Df, FitsHeader> read_fits_float(const fs::path& path);
void write_fits_float(const fs::path& path, const Matrix2Df& data, const FitsHeader& header);

// 2D double precision image, used for small numeric artifacts
Matrix2Dd read_fits_double(const fs::path& path);
void write_fits_double(const fs::path& path, const Matrix2Dd& data,
                       const FitsHeader& header = FitsHeader());

// 3D single precision image, one plane per cube entry
std::pair<Cube, FitsHeader> read_fits_cube(const fs::path& path);
void write_fits_cube(const fs::path& path, const Cube& planes,
                     const FitsHeader& header = FitsHeader());

// Returns (width, height, naxis)
std::tuple<int, int, int> get_fits_dimensions(const fs::path& path);

} // namespace insar_rate::io
