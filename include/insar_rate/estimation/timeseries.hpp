#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/ifg_part.hpp"

#include <string>
#include <vector>

namespace insar_rate::estimation {

struct TimeseriesResult {
    Cube tsincr; // one plane per epoch increment
    Cube tscuml; // running sum of tsincr
    std::vector<std::string> epochs;
};

// Design matrix mapping epoch increments to interferograms: the row of an
// interferogram (m, s) is 1 on increments id(m) .. id(s)-1.
Eigen::MatrixXd increment_design(const std::vector<std::string>& masters,
                                 const std::vector<std::string>& slaves,
                                 const std::vector<std::string>& epochs);

// Minimum-norm least squares of the increments, whitened by the Cholesky
// factor of `vcm` (identity when not positive definite)
VectorXd solve_increments(const Eigen::MatrixXd& design, const VectorXd& obs,
                          const Eigen::MatrixXd& vcm);

TimeseriesResult time_series(const std::vector<ifg::IfgPart>& parts, const Matrix2Dd& vcmt,
                             const Cube& mst, const config::TimeseriesConfig& cfg);

} // namespace insar_rate::estimation
