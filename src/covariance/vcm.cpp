#include "insar_rate/covariance/vcm.hpp"
#include "insar_rate/algorithm/epochs.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/parallel/collectives.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/optim.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace insar_rate::covariance {

namespace {

// Residual norm of the exponential decay model for a single parameter alpha
class DecayResidual : public cv::MinProblemSolver::Function {
public:
    DecayResidual(const std::vector<double>& distances, const std::vector<double>& means,
                  double mx)
        : distances_(distances), means_(means), mx_(mx) {}

    int getDims() const override { return 1; }

    double calc(const double* x) const override {
        double ss = 0.0;
        for (size_t i = 0; i < distances_.size(); ++i) {
            if (std::isnan(means_[i])) continue;
            const double e = means_[i] - mx_ * std::exp(-x[0] * distances_[i]);
            ss += e * e;
        }
        return std::sqrt(ss);
    }

private:
    const std::vector<double>& distances_;
    const std::vector<double>& means_;
    double mx_;
};

// numpy fftshift: zero lag moves to (rows/2, cols/2)
cv::Mat fftshift(const cv::Mat& in) {
    cv::Mat out(in.size(), in.type());
    const int rows = in.rows;
    const int cols = in.cols;
    for (int r = 0; r < rows; ++r) {
        const int src_r = (r - rows / 2 + rows) % rows;
        for (int c = 0; c < cols; ++c) {
            const int src_c = (c - cols / 2 + cols) % cols;
            out.at<double>(r, c) = in.at<double>(src_r, src_c);
        }
    }
    return out;
}

} // namespace

Autocorrelation autocorrelation(const Matrix2Df& phase, double x_size, double y_size) {
    const int rows = static_cast<int>(phase.rows());
    const int cols = static_cast<int>(phase.cols());
    if (rows < 1 || cols < 1) {
        throw CovarianceError("Empty phase raster");
    }

    cv::Mat work(rows, cols, CV_64F);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const float v = phase(r, c);
            work.at<double>(r, c) = std::isnan(v) ? 0.0 : static_cast<double>(v);
        }
    }

    const int nzc = cv::countNonZero(work);
    if (nzc == 0) {
        throw CovarianceError("Phase raster has no non-zero samples");
    }

    cv::Mat spectrum;
    cv::dft(work, spectrum, cv::DFT_COMPLEX_OUTPUT);

    cv::Mat parts[2];
    cv::split(spectrum, parts);
    cv::Mat power = parts[0].mul(parts[0]) + parts[1].mul(parts[1]);

    cv::Mat power_planes[] = {power, cv::Mat::zeros(power.size(), CV_64F)};
    cv::Mat power_complex;
    cv::merge(power_planes, 2, power_complex);

    cv::Mat acg_complex;
    cv::dft(power_complex, acg_complex, cv::DFT_INVERSE | cv::DFT_SCALE | cv::DFT_COMPLEX_OUTPUT);
    cv::split(acg_complex, parts);

    const cv::Mat acg_grid = fftshift(parts[0]) / static_cast<double>(nzc);

    const int x_centre = cols / 2;
    const int y_centre = rows / 2;
    const double maxdist = std::min(x_centre * x_size, y_centre * y_size) / kDistFactor;

    const size_t n = static_cast<size_t>(rows) * static_cast<size_t>(cols);
    const size_t keep = std::min(n, (n + 1) / 2 + static_cast<size_t>(rows));

    Autocorrelation out;
    for (size_t idx = 0; idx < keep; ++idx) {
        const int r = static_cast<int>(idx / static_cast<size_t>(cols));
        const int c = static_cast<int>(idx % static_cast<size_t>(cols));
        const double dx = (c - x_centre) * x_size;
        const double dy = (r - y_centre) * y_size;
        const double dist = std::sqrt(dx * dx + dy * dy) / kDistFactor;
        if (dist < maxdist) {
            out.acg.push_back(acg_grid.at<double>(r, c));
            out.r.push_back(dist);
        }
    }
    return out;
}

BinnedCovariance bin_autocorrelation(const Autocorrelation& ac, double x_size, double y_size) {
    if (ac.acg.empty()) {
        throw CovarianceError("No autocorrelation samples inside the maximum distance");
    }

    BinnedCovariance out;
    out.bin_width = std::max(x_size, y_size) * 2.0 / kDistFactor;
    if (!(out.bin_width > 0.0)) {
        throw CovarianceError("Bin width must be > 0, got " + core::format_double(out.bin_width));
    }

    std::vector<long> rbin(ac.r.size());
    long maxbin = 0;
    for (size_t i = 0; i < ac.r.size(); ++i) {
        rbin[i] = static_cast<long>(std::ceil(ac.r[i] / out.bin_width));
        maxbin = std::max(maxbin, rbin[i]);
    }
    if (maxbin < 1) {
        throw CovarianceError("All autocorrelation samples fall into the zero-lag bin; "
                              "the raster is too small for an alpha fit");
    }

    std::vector<double> sums(static_cast<size_t>(maxbin), 0.0);
    std::vector<int> counts(static_cast<size_t>(maxbin), 0);
    for (size_t i = 0; i < rbin.size(); ++i) {
        if (rbin[i] < maxbin) {
            sums[static_cast<size_t>(rbin[i])] += ac.acg[i];
            ++counts[static_cast<size_t>(rbin[i])];
        }
    }

    bool populated = false;
    for (long b = 0; b < maxbin; ++b) {
        const size_t i = static_cast<size_t>(b);
        out.distances.push_back(static_cast<double>(b) * out.bin_width);
        if (counts[i] > 0) {
            out.means.push_back(sums[i] / counts[i]);
            populated = true;
        } else {
            out.means.push_back(std::numeric_limits<double>::quiet_NaN());
        }
    }
    if (!populated) {
        throw CovarianceError("No populated distance bins");
    }
    return out;
}

double fit_exponential_decay(const std::vector<double>& distances,
                             const std::vector<double>& means, double mx, double alpha0) {
    if (distances.size() != means.size()) {
        throw CovarianceError("Distances and bin means differ in length");
    }
    if (std::none_of(means.begin(), means.end(), [](double v) { return !std::isnan(v); })) {
        throw CovarianceError("No finite bin means to fit");
    }
    if (!std::isfinite(alpha0) || alpha0 <= 0.0 || !std::isfinite(mx)) {
        throw CovarianceError("Invalid starting point for the alpha fit");
    }

    cv::Ptr<cv::DownhillSolver> solver = cv::DownhillSolver::create();
    solver->setFunction(cv::makePtr<DecayResidual>(distances, means, mx));
    solver->setTermCriteria(
        cv::TermCriteria(cv::TermCriteria::MAX_ITER + cv::TermCriteria::EPS, 10000, 1e-14));

    cv::Mat x = (cv::Mat_<double>(1, 1) << alpha0);
    // A second, narrower simplex around the first optimum
    for (double scale : {0.5, 0.01}) {
        const double step = scale * std::max(std::fabs(x.at<double>(0, 0)), 1e-12);
        solver->setInitStep(cv::Mat_<double>(1, 1, step));
        solver->minimize(x);
    }
    return x.at<double>(0, 0);
}

fs::path cvd_data_path(const fs::path& tmpdir, const std::string& basename) {
    return tmpdir / ("cvd_data_" + basename + ".fits");
}

CvdResult cvd_from_ifg(ifg::Interferogram& ifg, const config::Config& cfg, bool calc_alpha,
                       bool save_acg) {
    ifg::nan_and_mm_convert(ifg, cfg);

    const double x_size = ifg.x_size();
    const double y_size = ifg.y_size();
    const Autocorrelation ac = autocorrelation(ifg.phase_data(), x_size, y_size);
    if (ac.acg.empty()) {
        throw CovarianceError("No autocorrelation samples inside the maximum distance for " +
                              ifg.path().string());
    }

    if (save_acg) {
        Matrix2Dd data(static_cast<Eigen::Index>(ac.acg.size()), 2);
        for (size_t i = 0; i < ac.acg.size(); ++i) {
            data(static_cast<Eigen::Index>(i), 0) = ac.acg[i];
            data(static_cast<Eigen::Index>(i), 1) = ac.r[i];
        }
        const fs::path out = cvd_data_path(cfg.output.tmpdir, ifg.basename());
        fs::create_directories(out.parent_path());
        io::write_fits_double(out, data);
    }

    CvdResult result;
    result.maxvar = *std::max_element(ac.acg.begin(), ac.acg.end());

    if (calc_alpha) {
        const BinnedCovariance bins = bin_autocorrelation(ac, x_size, y_size);
        const double mx = std::isnan(bins.means.front()) ? result.maxvar : bins.means.front();
        const double alpha0 =
            2.0 / (static_cast<double>(bins.means.size()) * bins.bin_width);
        result.alpha = fit_exponential_decay(bins.distances, bins.means, mx, alpha0);
    }
    return result;
}

CvdResult cvd(const fs::path& path, const config::Config& cfg, bool calc_alpha, bool write_vals,
              bool save_acg) {
    ifg::Interferogram ifg(path);
    ifg.open(!write_vals);

    const Matrix2Df stored_phase = ifg.phase_data();
    const io::FitsHeader stored_header = ifg.metadata();

    const CvdResult result = cvd_from_ifg(ifg, cfg, calc_alpha, save_acg);

    if (write_vals) {
        ifg.metadata() = stored_header;
        ifg.metadata().set(ifg::keys::kMaxVar, core::format_double(result.maxvar));
        ifg.metadata().set(ifg::keys::kAlpha,
                           core::format_double(result.alpha.value_or(
                               std::numeric_limits<double>::quiet_NaN())));
        ifg.write_modified_phase(stored_phase);
    }
    ifg.close();
    return result;
}

Matrix2Dd get_vcmt(const std::vector<std::string>& masters, const std::vector<std::string>& slaves,
                   const std::vector<double>& maxvar) {
    const size_t n = masters.size();
    if (slaves.size() != n || maxvar.size() != n) {
        throw CovarianceError("VCM needs one master, slave and maxvar per interferogram");
    }

    std::vector<std::string> dates(masters);
    dates.insert(dates.end(), slaves.begin(), slaves.end());
    const std::map<std::string, int> ids = algorithm::master_slave_ids(dates);

    Matrix2Dd vcm(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n));
    for (size_t i = 0; i < n; ++i) {
        const int m1 = ids.at(masters[i]);
        const int s1 = ids.at(slaves[i]);
        for (size_t j = 0; j < n; ++j) {
            const int m2 = ids.at(masters[j]);
            const int s2 = ids.at(slaves[j]);

            double pattern = 0.0;
            if (m1 == m2 || s1 == s2) pattern = 0.5;
            if (m1 == s2 || s1 == m2) pattern = -0.5;
            if (m1 == m2 && s1 == s2) pattern = 1.0;

            vcm(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j)) =
                pattern * std::sqrt(maxvar[i]) * std::sqrt(maxvar[j]);
        }
    }
    return vcm;
}

Matrix2Dd get_vcmt(const std::vector<ifg::PrereadIfg>& ifgs, const std::vector<double>& maxvar) {
    std::vector<std::string> masters;
    std::vector<std::string> slaves;
    for (const auto& p : ifgs) {
        masters.push_back(p.master);
        slaves.push_back(p.slave);
    }
    return get_vcmt(masters, slaves, maxvar);
}

std::vector<double> maxvar_alpha_calc(parallel::ExecutionContext& ctx,
                                      const ifg::PrereadRegistry& registry,
                                      const config::Config& cfg) {
    std::vector<double> local;
    for (const auto& path : parallel::split(registry.paths, ctx)) {
        local.push_back(cvd(path, cfg, true, true, cfg.covariance.save_acg).maxvar);
    }
    return parallel::gather_ordered_by_rank(ctx, local, registry.size());
}

Matrix2Dd vcm_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                   const std::vector<double>& maxvar) {
    const std::vector<double> shared = parallel::broadcast_value(ctx, maxvar);
    return parallel::run_once(ctx, [&] { return get_vcmt(registry.ordered(), shared); });
}

} // namespace insar_rate::covariance
