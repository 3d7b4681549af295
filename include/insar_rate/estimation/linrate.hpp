#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/ifg_part.hpp"

#include <vector>

namespace insar_rate::estimation {

struct PixelRate {
    double rate = 0.0;
    double error = 0.0;
    int samples = 0;
};

struct LinrateResult {
    Matrix2Df rate;
    Matrix2Df error;
    Matrix2Df samples;
};

// Weighted fit of displacement = rate * span through the origin.
// `vcm` is the covariance of the observations; the identity is used when it
// is not positive definite. Observations whose normalised residual exceeds
// nsig are rejected one at a time, largest first.
PixelRate linear_rate_pixel(const VectorXd& displacement, const VectorXd& span,
                            const Eigen::MatrixXd& vcm, const config::LinrateConfig& cfg);

// Per-pixel linear rate over a tile. mst[i] flags the interferograms that
// take part at each pixel; parts and vcmt follow the canonical order.
LinrateResult linear_rate(const std::vector<ifg::IfgPart>& parts, const Matrix2Dd& vcmt,
                          const Cube& mst, const config::LinrateConfig& cfg);

} // namespace insar_rate::estimation
