#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/parallel/context.hpp"

#include <optional>
#include <string>
#include <vector>

namespace insar_rate::covariance {

// km per metre of pixel spacing
constexpr double kDistFactor = 1000.0;

struct CvdResult {
    double maxvar = 0.0;
    std::optional<double> alpha;
};

// Radially indexed autocorrelation samples that survive the truncation
struct Autocorrelation {
    std::vector<double> acg;
    std::vector<double> r; // km
};

// Autocorrelation of a phase raster (mm, NaN allowed) through the power
// spectrum, with the distance of every lag from the zero-lag cell.
//
// Samples are taken in row-major order and only the first ceil(N/2) + nrows
// are kept: an approximate removal of the mirrored half of the symmetric
// autocorrelation grid. Samples at or beyond the inscribed-circle radius
// min(x_centre*x_size, y_centre*y_size) are dropped.
Autocorrelation autocorrelation(const Matrix2Df& phase, double x_size, double y_size);

// Binned means of the autocorrelation; bin b covers distance b*bin_width.
// Empty bins are NaN.
struct BinnedCovariance {
    double bin_width = 0.0;
    std::vector<double> distances;
    std::vector<double> means;
};

BinnedCovariance bin_autocorrelation(const Autocorrelation& ac, double x_size, double y_size);

// Fits mx*exp(-alpha*r) to (distances, means) by Nelder-Mead on the residual
// L2 norm, starting from alpha0. NaN means are ignored.
double fit_exponential_decay(const std::vector<double>& distances,
                             const std::vector<double>& means, double mx, double alpha0);

fs::path cvd_data_path(const fs::path& tmpdir, const std::string& basename);

// Covariance of one interferogram held in memory. The phase of `ifg` is
// converted in place; `save_acg` writes cvd_data_<base>.fits to tmpdir.
CvdResult cvd_from_ifg(ifg::Interferogram& ifg, const config::Config& cfg, bool calc_alpha,
                       bool save_acg);

// Covariance of the interferogram at `path`. With write_vals the MAXVAR and
// ALPHA keywords are added and the stored phase is rewritten unchanged;
// without it nothing on disk is modified (apart from the optional acg dump).
CvdResult cvd(const fs::path& path, const config::Config& cfg, bool calc_alpha, bool write_vals,
              bool save_acg);

// Temporal structure matrix scaled by sqrt(maxvar_i)*sqrt(maxvar_j)
Matrix2Dd get_vcmt(const std::vector<std::string>& masters, const std::vector<std::string>& slaves,
                   const std::vector<double>& maxvar);

Matrix2Dd get_vcmt(const std::vector<ifg::PrereadIfg>& ifgs, const std::vector<double>& maxvar);

// maxvar of every interferogram in canonical order; full vector on the
// leader, empty elsewhere
std::vector<double> maxvar_alpha_calc(parallel::ExecutionContext& ctx,
                                      const ifg::PrereadRegistry& registry,
                                      const config::Config& cfg);

// Broadcasts maxvar from the leader and returns the leader's VCM on every rank
Matrix2Dd vcm_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                   const std::vector<double>& maxvar);

} // namespace insar_rate::covariance
