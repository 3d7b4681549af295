#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/io/fits_io.hpp"

#include <array>
#include <optional>
#include <string>

namespace insar_rate::ifg {

// Header keywords of an interferogram file
namespace keys {
constexpr const char* kMaster = "MASTER";
constexpr const char* kSlave = "SLAVE";
constexpr const char* kWavelength = "WAVELEN";
constexpr const char* kXFirst = "X_FIRST";
constexpr const char* kYFirst = "Y_FIRST";
constexpr const char* kXStep = "X_STEP";
constexpr const char* kYStep = "Y_STEP";
constexpr const char* kDataUnit = "DATAUNIT";
constexpr const char* kNanConverted = "NANCONV";
constexpr const char* kOrbitalCorrection = "ORBCORR";
constexpr const char* kRefPhase = "REFPHASE";
constexpr const char* kMaxVar = "MAXVAR";
constexpr const char* kAlpha = "ALPHA";
constexpr const char* kWkt = "WKT";
} // namespace keys

constexpr const char* kRemoved = "REMOVED";
constexpr const char* kUnitRadians = "RADIANS";
constexpr const char* kUnitMillimetres = "MILLIMETRES";

// Mean radius used to turn degree steps into ground distances
constexpr double kEarthRadiusM = 6371008.8;

// Geotransform in GDAL order: x_first, x_step, 0, y_first, 0, y_step
using GeoTransform = std::array<double, 6>;

// One interferogram raster (unwrapped phase, single 2D float image) with its
// header. Pixel data lives in memory between open() and close(); the file is
// only touched by open() and write_modified_phase().
class Interferogram {
public:
    explicit Interferogram(fs::path path);

    // Raises FitsError for a missing or malformed file
    void open(bool readonly = true);
    void close();
    bool is_open() const { return open_; }
    bool readonly() const { return readonly_; }

    const fs::path& path() const { return path_; }
    std::string basename() const;

    const Matrix2Df& phase_data() const;
    Matrix2Df& phase_data();

    const io::FitsHeader& metadata() const { return header_; }
    io::FitsHeader& metadata() { return header_; }

    const std::string& master() const { return master_; }
    const std::string& slave() const { return slave_; }
    // Years between master and slave epoch
    double time_span() const;

    int nrows() const { return static_cast<int>(phase_data().rows()); }
    int ncols() const { return static_cast<int>(phase_data().cols()); }
    int num_cells() const { return nrows() * ncols(); }
    int x_centre() const { return ncols() / 2; }
    int y_centre() const { return nrows() / 2; }

    // Pixel spacing in metres at the scene centre
    double x_size() const;
    double y_size() const;

    GeoTransform geotransform() const;
    std::string wkt() const;

    double nan_fraction() const;

    void convert_to_nans(double nodata);
    void convert_to_mm(double default_wavelength_m);
    bool nan_converted() const;
    bool mm_converted() const;

    bool orbital_removed() const;
    bool ref_phase_removed() const;

    // Rewrites phase (the given data, or the in-memory phase) and header.
    // Raises IOError on a read-only handle.
    void write_modified_phase(const std::optional<Matrix2Df>& data = std::nullopt);

private:
    double header_number(const char* key) const;
    void require_open() const;

    fs::path path_;
    bool open_ = false;
    bool readonly_ = true;
    Matrix2Df phase_;
    io::FitsHeader header_;
    std::string master_;
    std::string slave_;
};

// Applies the configured no-data conversion and the radian to millimetre
// conversion unless the header records them as already done.
void nan_and_mm_convert(Interferogram& ifg, const config::Config& cfg);

} // namespace insar_rate::ifg
