#include "insar_rate/estimation/timeseries.hpp"
#include "insar_rate/algorithm/epochs.hpp"
#include "insar_rate/core/errors.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace insar_rate::estimation {

Eigen::MatrixXd increment_design(const std::vector<std::string>& masters,
                                 const std::vector<std::string>& slaves,
                                 const std::vector<std::string>& epochs) {
    if (masters.size() != slaves.size()) {
        throw ValidationError("master and slave epoch lists differ in length");
    }
    if (epochs.size() < 2) {
        throw ValidationError("A time series needs at least two epochs");
    }

    std::map<std::string, int> ids;
    for (size_t i = 0; i < epochs.size(); ++i) {
        ids[epochs[i]] = static_cast<int>(i);
    }

    Eigen::MatrixXd design = Eigen::MatrixXd::Zero(static_cast<Eigen::Index>(masters.size()),
                                                   static_cast<Eigen::Index>(epochs.size() - 1));
    for (size_t k = 0; k < masters.size(); ++k) {
        const auto m = ids.find(masters[k]);
        const auto s = ids.find(slaves[k]);
        if (m == ids.end() || s == ids.end()) {
            throw ValidationError("Interferogram epoch missing from the epoch list");
        }
        const int lo = std::min(m->second, s->second);
        const int hi = std::max(m->second, s->second);
        const double sign = m->second <= s->second ? 1.0 : -1.0;
        for (int j = lo; j < hi; ++j) {
            design(static_cast<Eigen::Index>(k), j) = sign;
        }
    }
    return design;
}

VectorXd solve_increments(const Eigen::MatrixXd& design, const VectorXd& obs,
                          const Eigen::MatrixXd& vcm) {
    if (design.rows() != obs.size() || vcm.rows() != obs.size() || vcm.cols() != obs.size()) {
        throw ValidationError("Time series inputs differ in length");
    }

    Eigen::LLT<Eigen::MatrixXd> llt(vcm);
    if (llt.info() != Eigen::Success) {
        return design.completeOrthogonalDecomposition().solve(obs);
    }
    const Eigen::MatrixXd whitened_design = llt.matrixL().solve(design);
    const VectorXd whitened_obs = llt.matrixL().solve(obs);
    return whitened_design.completeOrthogonalDecomposition().solve(whitened_obs);
}

TimeseriesResult time_series(const std::vector<ifg::IfgPart>& parts, const Matrix2Dd& vcmt,
                             const Cube& mst, const config::TimeseriesConfig& cfg) {
    TimeseriesResult result;
    if (parts.empty()) {
        return result;
    }

    const auto n = static_cast<Eigen::Index>(parts.size());
    if (vcmt.rows() != n || vcmt.cols() != n || mst.size() != parts.size()) {
        throw ValidationError("VCM or MST cube does not match the interferogram count");
    }

    std::vector<std::string> masters;
    std::vector<std::string> slaves;
    for (const auto& p : parts) {
        masters.push_back(p.master);
        slaves.push_back(p.slave);
    }
    result.epochs = algorithm::get_epochs(masters, slaves).dates;
    const Eigen::MatrixXd design = increment_design(masters, slaves, result.epochs);
    const auto n_incr = static_cast<size_t>(design.cols());

    const Eigen::Index rows = parts.front().phase.rows();
    const Eigen::Index cols = parts.front().phase.cols();
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].phase.rows() != rows || parts[i].phase.cols() != cols ||
            mst[i].rows() != rows || mst[i].cols() != cols) {
            throw ValidationError("Interferogram tiles and MST planes differ in shape");
        }
    }

    const float nan = std::numeric_limits<float>::quiet_NaN();
    result.tsincr.assign(n_incr, Matrix2Df::Constant(rows, cols, nan));
    result.tscuml.assign(n_incr, Matrix2Df::Constant(rows, cols, nan));

    const Eigen::MatrixXd vcm = vcmt;
    std::vector<Eigen::Index> sel;
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            sel.clear();
            for (size_t i = 0; i < parts.size(); ++i) {
                if (mst[i](r, c) != 0.0f && std::isfinite(parts[i].phase(r, c))) {
                    sel.push_back(static_cast<Eigen::Index>(i));
                }
            }
            if (static_cast<int>(sel.size()) < cfg.pthresh) {
                continue;
            }

            const auto m = static_cast<Eigen::Index>(sel.size());
            Eigen::MatrixXd a(m, design.cols());
            VectorXd obs(m);
            Eigen::MatrixXd v(m, m);
            for (Eigen::Index i = 0; i < m; ++i) {
                const Eigen::Index src = sel[static_cast<size_t>(i)];
                a.row(i) = design.row(src);
                obs(i) = parts[static_cast<size_t>(src)].phase(r, c);
                for (Eigen::Index j = 0; j < m; ++j) {
                    v(i, j) = vcm(src, sel[static_cast<size_t>(j)]);
                }
            }

            const VectorXd incr = solve_increments(a, obs, v);
            double cumulative = 0.0;
            for (size_t k = 0; k < n_incr; ++k) {
                cumulative += incr(static_cast<Eigen::Index>(k));
                result.tsincr[k](r, c) = static_cast<float>(incr(static_cast<Eigen::Index>(k)));
                result.tscuml[k](r, c) = static_cast<float>(cumulative);
            }
        }
    }
    return result;
}

} // namespace insar_rate::estimation
