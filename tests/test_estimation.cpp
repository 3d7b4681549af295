#include "insar_rate/core/errors.hpp"
#include "insar_rate/estimation/linrate.hpp"
#include "insar_rate/estimation/timeseries.hpp"

#include <cmath>
#include <limits>
#include <string>
#include <utility>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using insar_rate::Cube;
using insar_rate::Matrix2Dd;
using insar_rate::Matrix2Df;
using insar_rate::VectorXd;
namespace config = insar_rate::config;
namespace estimation = insar_rate::estimation;
namespace ifg = insar_rate::ifg;

namespace {

ifg::IfgPart make_part(const std::string& master, const std::string& slave, double span,
                       const Matrix2Df& phase) {
    ifg::IfgPart p;
    p.tile.row_end = static_cast<int>(phase.rows());
    p.tile.col_end = static_cast<int>(phase.cols());
    p.phase = phase;
    p.master = master;
    p.slave = slave;
    p.time_span = span;
    return p;
}

Cube full_mask(size_t n, int rows, int cols) {
    return Cube(n, Matrix2Df::Ones(rows, cols));
}

config::LinrateConfig linrate_config() {
    config::LinrateConfig cfg;
    cfg.nsig = 3.0;
    cfg.pthresh = 3;
    cfg.maxsig = 1000.0;
    return cfg;
}

} // namespace

TEST_CASE("linear_rate_pixel_fits_through_origin") {
    VectorXd span(4);
    span << 0.5, 1.0, 1.5, 2.0;
    const VectorXd disp = 3.0 * span;

    const auto px =
        estimation::linear_rate_pixel(disp, span, Eigen::MatrixXd::Identity(4, 4), linrate_config());
    REQUIRE(px.rate == Catch::Approx(3.0));
    REQUIRE(px.error == Catch::Approx(std::sqrt(1.0 / 7.5)));
    REQUIRE(px.samples == 4);
}

TEST_CASE("linear_rate_pixel_rejects_the_largest_outlier") {
    VectorXd span(5);
    span << 0.5, 1.0, 1.5, 2.0, 2.5;
    VectorXd disp = 3.0 * span;
    disp(0) += 0.01;
    disp(1) -= 0.01;
    disp(2) += 10.0;
    disp(4) += 0.01;

    const auto px =
        estimation::linear_rate_pixel(disp, span, Eigen::MatrixXd::Identity(5, 5), linrate_config());
    REQUIRE(px.samples == 4);
    REQUIRE(px.rate == Catch::Approx(3.0).margin(0.02));

    SECTION("dropping below pthresh gives no estimate") {
        auto cfg = linrate_config();
        cfg.pthresh = 5;
        const auto none =
            estimation::linear_rate_pixel(disp, span, Eigen::MatrixXd::Identity(5, 5), cfg);
        REQUIRE(std::isnan(none.rate));
        REQUIRE(std::isnan(none.error));
        REQUIRE(none.samples == 0);
    }
}

TEST_CASE("linear_rate_pixel_masks_imprecise_rates") {
    VectorXd span(4);
    span << 0.5, 1.0, 1.5, 2.0;
    const VectorXd disp = 3.0 * span;

    auto cfg = linrate_config();
    cfg.maxsig = 0.1;
    const auto px = estimation::linear_rate_pixel(disp, span, Eigen::MatrixXd::Identity(4, 4), cfg);
    REQUIRE(std::isnan(px.rate));
    REQUIRE(std::isnan(px.error));
    REQUIRE(px.samples == 4);
}

TEST_CASE("linear_rate_pixel_uses_identity_for_singular_vcm") {
    VectorXd span(3);
    span << 1.0, 2.0, 3.0;
    const VectorXd disp = -1.5 * span;

    const auto px =
        estimation::linear_rate_pixel(disp, span, Eigen::MatrixXd::Zero(3, 3), linrate_config());
    REQUIRE(px.rate == Catch::Approx(-1.5));
    REQUIRE(px.error == Catch::Approx(std::sqrt(1.0 / 14.0)));

    REQUIRE_THROWS_AS(estimation::linear_rate_pixel(disp, span, Eigen::MatrixXd::Identity(2, 2),
                                                    linrate_config()),
                      insar_rate::ValidationError);
}

TEST_CASE("linear_rate_honours_mask_and_nan") {
    const int rows = 2;
    const int cols = 3;
    std::vector<ifg::IfgPart> parts;
    const double spans[] = {0.5, 1.0, 1.5};
    for (double s : spans) {
        Matrix2Df phase(rows, cols);
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                phase(r, c) = static_cast<float>((1.0 + r + c) * s);
            }
        }
        parts.push_back(make_part("2020-01-01", "2020-07-01", s, phase));
    }
    Cube mst = full_mask(parts.size(), rows, cols);
    mst[1](0, 1) = 0.0f;
    parts[2].phase(1, 2) = std::numeric_limits<float>::quiet_NaN();

    const auto result = estimation::linear_rate(parts, Matrix2Dd::Identity(3, 3), mst,
                                                linrate_config());
    REQUIRE(result.rate(0, 0) == Catch::Approx(1.0));
    REQUIRE(result.rate(1, 1) == Catch::Approx(3.0));
    REQUIRE(result.samples(1, 0) == 3.0f);
    REQUIRE(std::isnan(result.rate(0, 1)));
    REQUIRE(result.samples(0, 1) == 0.0f);
    REQUIRE(std::isnan(result.rate(1, 2)));
    REQUIRE(std::isnan(result.error(1, 2)));

    REQUIRE_THROWS_AS(estimation::linear_rate(parts, Matrix2Dd::Identity(2, 2), mst,
                                              linrate_config()),
                      insar_rate::ValidationError);
    mst.pop_back();
    REQUIRE_THROWS_AS(estimation::linear_rate(parts, Matrix2Dd::Identity(3, 3), mst,
                                              linrate_config()),
                      insar_rate::ValidationError);
}

TEST_CASE("increment_design_spans_the_pair_interval") {
    const std::vector<std::string> epochs{"2020-01-01", "2020-02-01", "2020-03-01", "2020-04-01"};
    const auto a = estimation::increment_design({"2020-01-01", "2020-01-01", "2020-03-01"},
                                                {"2020-02-01", "2020-04-01", "2020-02-01"}, epochs);
    REQUIRE(a.rows() == 3);
    REQUIRE(a.cols() == 3);

    Eigen::MatrixXd expected(3, 3);
    expected << 1, 0, 0,
                1, 1, 1,
                0, -1, 0;
    REQUIRE(a == expected);

    REQUIRE_THROWS_AS(estimation::increment_design({"2020-01-01"}, {"2021-01-01"}, epochs),
                      insar_rate::ValidationError);
    REQUIRE_THROWS_AS(estimation::increment_design({}, {}, {"2020-01-01"}),
                      insar_rate::ValidationError);
}

TEST_CASE("solve_increments_returns_minimum_norm_for_gaps") {
    // (e0, e1) and (e2, e3): the middle increment is unobserved
    Eigen::MatrixXd a(2, 3);
    a << 1, 0, 0,
         0, 0, 1;
    VectorXd obs(2);
    obs << 2.0, -1.0;

    const VectorXd x = estimation::solve_increments(a, obs, Eigen::MatrixXd::Identity(2, 2));
    REQUIRE(x(0) == Catch::Approx(2.0));
    REQUIRE(x(1) == Catch::Approx(0.0).margin(1e-12));
    REQUIRE(x(2) == Catch::Approx(-1.0));
}

TEST_CASE("time_series_recovers_increments_and_cumulative_sums") {
    const std::vector<std::string> epochs{"2020-01-01", "2020-03-01", "2020-05-01", "2020-07-01"};
    const std::vector<std::pair<int, int>> pairs{{0, 1}, {0, 2}, {1, 2}, {1, 3}, {2, 3}};
    const int rows = 2;
    const int cols = 2;

    auto increment = [](int k, int r, int c) { return 1.0 + 0.5 * k - 0.25 * r + 0.1 * c; };

    std::vector<ifg::IfgPart> parts;
    for (const auto& [m, s] : pairs) {
        Matrix2Df phase(rows, cols);
        for (int r = 0; r < rows; ++r) {
            for (int c = 0; c < cols; ++c) {
                double sum = 0.0;
                for (int k = m; k < s; ++k) {
                    sum += increment(k, r, c);
                }
                phase(r, c) = static_cast<float>(sum);
            }
        }
        parts.push_back(make_part(epochs[static_cast<size_t>(m)], epochs[static_cast<size_t>(s)],
                                  0.0, phase));
    }
    Cube mst = full_mask(parts.size(), rows, cols);
    // only two observations left at (1, 1)
    mst[0](1, 1) = 0.0f;
    mst[1](1, 1) = 0.0f;
    mst[2](1, 1) = 0.0f;

    config::TimeseriesConfig cfg;
    cfg.pthresh = 3;
    const auto ts = estimation::time_series(parts, Matrix2Dd::Identity(5, 5), mst, cfg);

    REQUIRE(ts.epochs == epochs);
    REQUIRE(ts.tsincr.size() == 3);
    REQUIRE(ts.tscuml.size() == 3);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            if (r == 1 && c == 1) {
                continue;
            }
            double cumulative = 0.0;
            for (int k = 0; k < 3; ++k) {
                cumulative += increment(k, r, c);
                REQUIRE(ts.tsincr[static_cast<size_t>(k)](r, c) ==
                        Catch::Approx(increment(k, r, c)).margin(1e-5));
                REQUIRE(ts.tscuml[static_cast<size_t>(k)](r, c) ==
                        Catch::Approx(cumulative).margin(1e-5));
            }
        }
    }
    REQUIRE(std::isnan(ts.tsincr[0](1, 1)));
    REQUIRE(std::isnan(ts.tscuml[2](1, 1)));
}
