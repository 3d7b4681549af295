#include "insar_rate/estimation/linrate.hpp"
#include "insar_rate/core/errors.hpp"

#include <cmath>
#include <limits>

namespace insar_rate::estimation {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

Eigen::MatrixXd submatrix(const Eigen::MatrixXd& m, const std::vector<Eigen::Index>& idx) {
    const auto n = static_cast<Eigen::Index>(idx.size());
    Eigen::MatrixXd out(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        for (Eigen::Index j = 0; j < n; ++j) {
            out(i, j) = m(idx[static_cast<size_t>(i)], idx[static_cast<size_t>(j)]);
        }
    }
    return out;
}

VectorXd subvector(const VectorXd& v, const std::vector<Eigen::Index>& idx) {
    VectorXd out(static_cast<Eigen::Index>(idx.size()));
    for (size_t i = 0; i < idx.size(); ++i) {
        out(static_cast<Eigen::Index>(i)) = v(idx[i]);
    }
    return out;
}

void check_stack(const std::vector<ifg::IfgPart>& parts, const Matrix2Dd& vcmt, const Cube& mst) {
    const auto n = static_cast<Eigen::Index>(parts.size());
    if (vcmt.rows() != n || vcmt.cols() != n) {
        throw ValidationError("VCM is " + std::to_string(vcmt.rows()) + "x" +
                              std::to_string(vcmt.cols()) + " for " + std::to_string(n) +
                              " interferograms");
    }
    if (mst.size() != parts.size()) {
        throw ValidationError("MST cube has " + std::to_string(mst.size()) + " planes for " +
                              std::to_string(parts.size()) + " interferograms");
    }
    for (size_t i = 0; i < parts.size(); ++i) {
        if (parts[i].phase.rows() != parts.front().phase.rows() ||
            parts[i].phase.cols() != parts.front().phase.cols() ||
            mst[i].rows() != parts[i].phase.rows() || mst[i].cols() != parts[i].phase.cols()) {
            throw ValidationError("Interferogram tiles and MST planes differ in shape");
        }
    }
}

} // namespace

PixelRate linear_rate_pixel(const VectorXd& displacement, const VectorXd& span,
                            const Eigen::MatrixXd& vcm, const config::LinrateConfig& cfg) {
    const Eigen::Index n = displacement.size();
    if (span.size() != n || vcm.rows() != n || vcm.cols() != n) {
        throw ValidationError("Linear rate inputs differ in length");
    }

    std::vector<Eigen::Index> used;
    for (Eigen::Index i = 0; i < n; ++i) {
        used.push_back(i);
    }

    PixelRate out{kNaN, kNaN, 0};
    while (static_cast<int>(used.size()) >= cfg.pthresh) {
        const VectorXd d = subvector(displacement, used);
        const VectorXd b = subvector(span, used);
        Eigen::MatrixXd v = submatrix(vcm, used);

        Eigen::LLT<Eigen::MatrixXd> llt(v);
        if (llt.info() != Eigen::Success) {
            v = Eigen::MatrixXd::Identity(v.rows(), v.cols());
            llt.compute(v);
        }

        const double normal = b.dot(llt.solve(b));
        if (!(normal > 0.0)) {
            return {kNaN, kNaN, 0};
        }
        const double rate = b.dot(llt.solve(d)) / normal;
        const VectorXd residual = d - b * rate;

        Eigen::Index worst = 0;
        double worst_value = -1.0;
        for (Eigen::Index i = 0; i < residual.size(); ++i) {
            const double r = std::fabs(residual(i)) / std::sqrt(v(i, i));
            if (r > worst_value) {
                worst_value = r;
                worst = i;
            }
        }

        if (worst_value > cfg.nsig) {
            used.erase(used.begin() + worst);
            continue;
        }

        out.rate = rate;
        out.error = std::sqrt(1.0 / normal);
        out.samples = static_cast<int>(used.size());
        if (out.error > cfg.maxsig) {
            out.rate = kNaN;
            out.error = kNaN;
        }
        return out;
    }
    return out;
}

LinrateResult linear_rate(const std::vector<ifg::IfgPart>& parts, const Matrix2Dd& vcmt,
                          const Cube& mst, const config::LinrateConfig& cfg) {
    LinrateResult result;
    if (parts.empty()) {
        return result;
    }
    check_stack(parts, vcmt, mst);

    const Eigen::Index rows = parts.front().phase.rows();
    const Eigen::Index cols = parts.front().phase.cols();
    result.rate = Matrix2Df::Constant(rows, cols, std::numeric_limits<float>::quiet_NaN());
    result.error = Matrix2Df::Constant(rows, cols, std::numeric_limits<float>::quiet_NaN());
    result.samples = Matrix2Df::Zero(rows, cols);

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

            VectorXd d(static_cast<Eigen::Index>(sel.size()));
            VectorXd span(static_cast<Eigen::Index>(sel.size()));
            for (size_t k = 0; k < sel.size(); ++k) {
                const auto& part = parts[static_cast<size_t>(sel[k])];
                d(static_cast<Eigen::Index>(k)) = part.phase(r, c);
                span(static_cast<Eigen::Index>(k)) = part.time_span;
            }

            const PixelRate px = linear_rate_pixel(d, span, submatrix(vcm, sel), cfg);
            result.rate(r, c) = static_cast<float>(px.rate);
            result.error(r, c) = static_cast<float>(px.error);
            result.samples(r, c) = static_cast<float>(px.samples);
        }
    }
    return result;
}

} // namespace insar_rate::estimation
