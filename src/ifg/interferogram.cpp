#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"

#include <cmath>
#include <limits>
#include <utility>

namespace insar_rate::ifg {

namespace {

constexpr double kPi = 3.14159265358979323846;

double degrees_to_radians(double deg) {
    return deg * kPi / 180.0;
}

} // namespace

Interferogram::Interferogram(fs::path path) : path_(std::move(path)) {}

void Interferogram::open(bool readonly) {
    auto [data, header] = io::read_fits_float(path_);

    auto master = header.get_string(keys::kMaster);
    auto slave = header.get_string(keys::kSlave);
    if (!master || !slave) {
        throw FitsError("Missing MASTER/SLAVE epoch keywords: " + path_.string());
    }
    if (!core::is_iso_date(*master) || !core::is_iso_date(*slave)) {
        throw FitsError("Epochs must be YYYY-MM-DD: " + path_.string());
    }
    for (const char* key : {keys::kXFirst, keys::kYFirst, keys::kXStep, keys::kYStep}) {
        if (!header.get_number(key)) {
            throw FitsError(std::string("Missing ") + key + " keyword: " + path_.string());
        }
    }

    phase_ = std::move(data);
    header_ = std::move(header);
    master_ = *master;
    slave_ = *slave;
    readonly_ = readonly;
    open_ = true;
}

void Interferogram::close() {
    phase_ = Matrix2Df();
    open_ = false;
}

std::string Interferogram::basename() const {
    return core::file_stem(path_);
}

void Interferogram::require_open() const {
    if (!open_) {
        throw IOError("Interferogram not open: " + path_.string());
    }
}

const Matrix2Df& Interferogram::phase_data() const {
    require_open();
    return phase_;
}

Matrix2Df& Interferogram::phase_data() {
    require_open();
    return phase_;
}

double Interferogram::time_span() const {
    require_open();
    return core::years_between(master_, slave_);
}

double Interferogram::header_number(const char* key) const {
    auto v = header_.get_number(key);
    if (!v) {
        throw FitsError(std::string("Missing ") + key + " keyword: " + path_.string());
    }
    return *v;
}

double Interferogram::x_size() const {
    const double lat = header_number(keys::kYFirst) + header_number(keys::kYStep) * y_centre();
    return std::fabs(degrees_to_radians(header_number(keys::kXStep))) * kEarthRadiusM *
           std::cos(degrees_to_radians(lat));
}

double Interferogram::y_size() const {
    require_open();
    return std::fabs(degrees_to_radians(header_number(keys::kYStep))) * kEarthRadiusM;
}

GeoTransform Interferogram::geotransform() const {
    return {header_number(keys::kXFirst), header_number(keys::kXStep), 0.0,
            header_number(keys::kYFirst), 0.0, header_number(keys::kYStep)};
}

std::string Interferogram::wkt() const {
    return header_.get_string(keys::kWkt).value_or("");
}

double Interferogram::nan_fraction() const {
    const Matrix2Df& p = phase_data();
    if (p.size() == 0) {
        return 0.0;
    }
    const size_t finite_or_inf = core::count_finite(p) +
        static_cast<size_t>((p.array().isInf()).count());
    const size_t nans = static_cast<size_t>(p.size()) - finite_or_inf;
    return static_cast<double>(nans) / static_cast<double>(p.size());
}

void Interferogram::convert_to_nans(double nodata) {
    Matrix2Df& p = phase_data();
    const float nd = static_cast<float>(nodata);
    for (Eigen::Index i = 0; i < p.size(); ++i) {
        if (p.data()[i] == nd) {
            p.data()[i] = std::numeric_limits<float>::quiet_NaN();
        }
    }
    header_.set(keys::kNanConverted, true);
}

void Interferogram::convert_to_mm(double default_wavelength_m) {
    if (mm_converted()) {
        return;
    }
    const double wavelength = header_.get_number(keys::kWavelength).value_or(default_wavelength_m);
    if (!(wavelength > 0.0)) {
        throw ValidationError("Wavelength must be > 0 for " + path_.string());
    }
    const float factor = static_cast<float>(1000.0 * wavelength / (4.0 * kPi));
    phase_data() *= factor;
    header_.set(keys::kDataUnit, kUnitMillimetres);
}

bool Interferogram::nan_converted() const {
    return header_.get_bool(keys::kNanConverted).value_or(false);
}

bool Interferogram::mm_converted() const {
    return header_.get_string(keys::kDataUnit).value_or(kUnitRadians) == kUnitMillimetres;
}

bool Interferogram::orbital_removed() const {
    return header_.get_string(keys::kOrbitalCorrection).value_or("") == kRemoved;
}

bool Interferogram::ref_phase_removed() const {
    return header_.get_string(keys::kRefPhase).value_or("") == kRemoved;
}

void Interferogram::write_modified_phase(const std::optional<Matrix2Df>& data) {
    require_open();
    if (readonly_) {
        throw IOError("Cannot write read-only interferogram: " + path_.string());
    }
    if (data) {
        if (data->rows() != phase_.rows() || data->cols() != phase_.cols()) {
            throw IOError("Replacement phase has a different shape: " + path_.string());
        }
        phase_ = *data;
    }

    // Write beside the original and swap, so a failed write keeps the input
    fs::path tmp = path_;
    tmp += ".tmp";
    io::write_fits_float(tmp, phase_, header_);
    core::commit_file(tmp, path_);
}

void nan_and_mm_convert(Interferogram& ifg, const config::Config& cfg) {
    if (cfg.ifg.nan_conversion && !ifg.nan_converted()) {
        ifg.convert_to_nans(cfg.ifg.no_data_value);
    }
    if (!ifg.mm_converted()) {
        ifg.convert_to_mm(cfg.ifg.wavelength_m);
    }
}

} // namespace insar_rate::ifg
