#include "insar_rate/correction/orbital.hpp"
#include "insar_rate/algorithm/epochs.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/parallel/collectives.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace insar_rate::correction {

namespace {

constexpr int kMaxTerms = 5;

struct Observation {
    double x = 0.0;
    double y = 0.0;
    double value = 0.0;
};

// Finite multilooked cells with their centre in full-resolution pixel units
std::vector<Observation> observations(const Matrix2Df& phase, int looks) {
    const Matrix2Df ml = multilook(phase, looks);
    std::vector<Observation> obs;
    for (Eigen::Index r = 0; r < ml.rows(); ++r) {
        for (Eigen::Index c = 0; c < ml.cols(); ++c) {
            const float v = ml(r, c);
            if (!std::isfinite(v)) continue;
            const double r0 = static_cast<double>(r * looks);
            const double c0 = static_cast<double>(c * looks);
            const double r1 = std::min<double>(r0 + looks, static_cast<double>(phase.rows()));
            const double c1 = std::min<double>(c0 + looks, static_cast<double>(phase.cols()));
            obs.push_back({(c0 + c1 - 1.0) / 2.0, (r0 + r1 - 1.0) / 2.0, v});
        }
    }
    return obs;
}

void subtract_surface(Matrix2Df& phase, const Matrix2Df& surface) {
    phase -= surface;
}

} // namespace

OrbitalDegree parse_orbital_degree(const std::string& degree) {
    const std::string d = core::to_lower(degree);
    if (d == "planar") return OrbitalDegree::PLANAR;
    if (d == "quadratic") return OrbitalDegree::QUADRATIC;
    throw ConfigError("Unsupported orbital degree '" + degree + "'");
}

int orbital_num_params(OrbitalDegree degree) {
    return degree == OrbitalDegree::PLANAR ? 2 : 5;
}

Matrix2Df multilook(const Matrix2Df& phase, int looks) {
    if (looks < 1) {
        throw ValidationError("orbital.looks must be >= 1");
    }
    if (looks == 1) {
        return phase;
    }

    const Eigen::Index rows = (phase.rows() + looks - 1) / looks;
    const Eigen::Index cols = (phase.cols() + looks - 1) / looks;
    Matrix2Df out(rows, cols);
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            double sum = 0.0;
            int n = 0;
            const Eigen::Index r_end = std::min<Eigen::Index>((r + 1) * looks, phase.rows());
            const Eigen::Index c_end = std::min<Eigen::Index>((c + 1) * looks, phase.cols());
            for (Eigen::Index y = r * looks; y < r_end; ++y) {
                for (Eigen::Index x = c * looks; x < c_end; ++x) {
                    const float v = phase(y, x);
                    if (std::isfinite(v)) {
                        sum += v;
                        ++n;
                    }
                }
            }
            out(r, c) = n > 0 ? static_cast<float>(sum / n)
                              : std::numeric_limits<float>::quiet_NaN();
        }
    }
    return out;
}

void surface_terms(double x, double y, OrbitalDegree degree, double* out) {
    if (degree == OrbitalDegree::PLANAR) {
        out[0] = x;
        out[1] = y;
        return;
    }
    out[0] = x * x;
    out[1] = y * y;
    out[2] = x * y;
    out[3] = x;
    out[4] = y;
}

VectorXd fit_orbital_surface(const Matrix2Df& phase, OrbitalDegree degree, int looks) {
    const int np = orbital_num_params(degree);
    const std::vector<Observation> obs = observations(phase, looks);
    if (static_cast<int>(obs.size()) < np + 1) {
        throw OrbitalError("Only " + std::to_string(obs.size()) +
                           " valid cells for a surface with " + std::to_string(np + 1) +
                           " coefficients");
    }

    Eigen::MatrixXd a(static_cast<Eigen::Index>(obs.size()), np + 1);
    VectorXd b(static_cast<Eigen::Index>(obs.size()));
    double terms[kMaxTerms];
    for (size_t i = 0; i < obs.size(); ++i) {
        const auto row = static_cast<Eigen::Index>(i);
        surface_terms(obs[i].x, obs[i].y, degree, terms);
        for (int k = 0; k < np; ++k) {
            a(row, k) = terms[k];
        }
        a(row, np) = 1.0;
        b(row) = obs[i].value;
    }
    return a.colPivHouseholderQr().solve(b);
}

Matrix2Df evaluate_surface(const VectorXd& coeffs, int rows, int cols, OrbitalDegree degree) {
    const int np = orbital_num_params(degree);
    if (coeffs.size() < np) {
        throw OrbitalError("Too few surface coefficients");
    }
    Matrix2Df out(rows, cols);
    double terms[kMaxTerms];
    for (int y = 0; y < rows; ++y) {
        for (int x = 0; x < cols; ++x) {
            surface_terms(x, y, degree, terms);
            double v = 0.0;
            for (int k = 0; k < np; ++k) {
                v += coeffs(k) * terms[k];
            }
            out(y, x) = static_cast<float>(v);
        }
    }
    return out;
}

void remove_orbital_error(const fs::path& path, const config::Config& cfg) {
    ifg::Interferogram ifg(path);
    ifg.open(false);
    if (ifg.orbital_removed()) {
        return;
    }
    ifg::nan_and_mm_convert(ifg, cfg);

    const OrbitalDegree degree = parse_orbital_degree(cfg.orbital.degree);
    const VectorXd coeffs = fit_orbital_surface(ifg.phase_data(), degree, cfg.orbital.looks);
    subtract_surface(ifg.phase_data(), evaluate_surface(coeffs, ifg.nrows(), ifg.ncols(), degree));

    ifg.metadata().set(ifg::keys::kOrbitalCorrection, ifg::kRemoved);
    ifg.write_modified_phase();
}

void network_orbital_correction(const std::vector<fs::path>& paths, const config::Config& cfg) {
    const OrbitalDegree degree = parse_orbital_degree(cfg.orbital.degree);
    const int np = orbital_num_params(degree);

    std::vector<ifg::Interferogram> ifgs;
    for (const auto& path : paths) {
        ifg::Interferogram ifg(path);
        ifg.open(false);
        if (ifg.orbital_removed()) {
            continue;
        }
        ifg::nan_and_mm_convert(ifg, cfg);
        ifgs.push_back(std::move(ifg));
    }
    if (ifgs.empty()) {
        return;
    }

    std::vector<std::string> dates;
    for (const auto& ifg : ifgs) {
        dates.push_back(ifg.master());
        dates.push_back(ifg.slave());
    }
    const std::map<std::string, int> ids = algorithm::master_slave_ids(dates);
    const int n_epochs = static_cast<int>(ids.size());

    // Unknowns: surface per epoch except the first, then one offset per ifg
    const int n_surface = np * (n_epochs - 1);
    const int n_unknowns = n_surface + static_cast<int>(ifgs.size());

    Eigen::MatrixXd normal = Eigen::MatrixXd::Zero(n_unknowns, n_unknowns);
    VectorXd rhs = VectorXd::Zero(n_unknowns);
    size_t n_obs = 0;

    std::vector<int> cols;
    std::vector<double> vals;
    double terms[kMaxTerms];
    for (size_t k = 0; k < ifgs.size(); ++k) {
        const int master = ids.at(ifgs[k].master());
        const int slave = ids.at(ifgs[k].slave());
        for (const auto& o : observations(ifgs[k].phase_data(), cfg.orbital.looks)) {
            surface_terms(o.x, o.y, degree, terms);
            cols.clear();
            vals.clear();
            for (int t = 0; t < np; ++t) {
                if (master > 0) {
                    cols.push_back((master - 1) * np + t);
                    vals.push_back(-terms[t]);
                }
                if (slave > 0) {
                    cols.push_back((slave - 1) * np + t);
                    vals.push_back(terms[t]);
                }
            }
            cols.push_back(n_surface + static_cast<int>(k));
            vals.push_back(1.0);

            for (size_t i = 0; i < cols.size(); ++i) {
                rhs(cols[i]) += vals[i] * o.value;
                for (size_t j = 0; j < cols.size(); ++j) {
                    normal(cols[i], cols[j]) += vals[i] * vals[j];
                }
            }
            ++n_obs;
        }
    }

    if (n_obs < static_cast<size_t>(n_unknowns)) {
        throw OrbitalError("Network orbital fit has " + std::to_string(n_obs) +
                           " observations for " + std::to_string(n_unknowns) + " unknowns");
    }

    // Minimum-norm solution keeps disconnected networks solvable
    const VectorXd solution = normal.completeOrthogonalDecomposition().solve(rhs);

    auto epoch_coeffs = [&](int id) {
        VectorXd c = VectorXd::Zero(np);
        if (id > 0) {
            c = solution.segment((id - 1) * np, np);
        }
        return c;
    };

    for (auto& ifg : ifgs) {
        const VectorXd coeffs = epoch_coeffs(ids.at(ifg.slave())) - epoch_coeffs(ids.at(ifg.master()));
        subtract_surface(ifg.phase_data(), evaluate_surface(coeffs, ifg.nrows(), ifg.ncols(), degree));
        ifg.metadata().set(ifg::keys::kOrbitalCorrection, ifg::kRemoved);
        ifg.write_modified_phase();
        ifg.close();
    }
}

void DistributedOrbitalExecutor::run(parallel::ExecutionContext& ctx,
                                     const ifg::PrereadRegistry& registry,
                                     const config::Config& cfg) {
    for (const auto& path : parallel::split(registry.paths, ctx)) {
        remove_orbital_error(path, cfg);
    }
}

void LeaderOrbitalExecutor::run(parallel::ExecutionContext& ctx,
                                const ifg::PrereadRegistry& registry,
                                const config::Config& cfg) {
    if (ctx.is_leader()) {
        std::vector<fs::path> paths(registry.paths.begin(), registry.paths.end());
        network_orbital_correction(paths, cfg);
    }
}

std::unique_ptr<OrbitalExecutor> make_orbital_executor(const std::string& method) {
    const std::string m = core::to_lower(method);
    if (m == "independent") {
        return std::make_unique<DistributedOrbitalExecutor>();
    }
    if (m == "network") {
        return std::make_unique<LeaderOrbitalExecutor>();
    }
    throw ConfigError("Unsupported orbital correction method '" + method +
                      "' (expected independent or network)");
}

} // namespace insar_rate::correction
