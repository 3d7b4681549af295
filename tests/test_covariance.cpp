#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/covariance/vcm.hpp"
#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/ifg/phase_cache.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/parallel/local_context.hpp"
#include "test_support.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <random>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using insar_rate::Matrix2Dd;
using insar_rate::Matrix2Df;
namespace fs = std::filesystem;
namespace covariance = insar_rate::covariance;
namespace ifg = insar_rate::ifg;
namespace io = insar_rate::io;
namespace parallel = insar_rate::parallel;
namespace test = insar_rate::test;

namespace {

Matrix2Df noisy_phase(int rows, int cols, unsigned seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, 1.0f);
    Matrix2Df phase(rows, cols);
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            // smooth component plus white noise
            phase(r, c) = static_cast<float>(3.0 * std::sin(0.3 * r) * std::cos(0.2 * c)) +
                          noise(rng);
        }
    }
    return phase;
}

} // namespace

TEST_CASE("vcm_follows_the_shared_epoch_pattern") {
    // A = (e1, e2), B = (e1, e3), C = (e2, e3)
    const std::vector<std::string> masters{"2020-01-01", "2020-01-01", "2020-02-01"};
    const std::vector<std::string> slaves{"2020-02-01", "2020-03-01", "2020-03-01"};

    const Matrix2Dd unit = covariance::get_vcmt(masters, slaves, {1.0, 1.0, 1.0});
    REQUIRE(unit(0, 0) == 1.0);
    REQUIRE(unit(1, 1) == 1.0);
    REQUIRE(unit(2, 2) == 1.0);
    REQUIRE(unit(0, 1) == 0.5);  // same master
    REQUIRE(unit(0, 2) == -0.5); // slave of A is master of C
    REQUIRE(unit(1, 2) == 0.5);  // same slave
    REQUIRE(unit == unit.transpose());

    const Matrix2Dd scaled = covariance::get_vcmt(masters, slaves, {4.0, 9.0, 1.0});
    REQUIRE(scaled(0, 0) == Catch::Approx(4.0));
    REQUIRE(scaled(0, 1) == Catch::Approx(3.0));
    REQUIRE(scaled(0, 2) == Catch::Approx(-1.0));
    REQUIRE(scaled(2, 1) == Catch::Approx(1.5));

    REQUIRE_THROWS_AS(covariance::get_vcmt(masters, slaves, {1.0}), insar_rate::CovarianceError);
}

TEST_CASE("vcm_is_zero_for_disjoint_pairs") {
    const Matrix2Dd v = covariance::get_vcmt({"2020-01-01", "2020-03-01"},
                                             {"2020-02-01", "2020-04-01"}, {2.0, 2.0});
    REQUIRE(v(0, 1) == 0.0);
    REQUIRE(v(1, 0) == 0.0);
}

TEST_CASE("exponential_fit_recovers_decay_rate") {
    const double mx = 12.0;
    const double alpha = 0.8;

    // dense samples every metre out to 4 km, with a gap that empties two bins
    covariance::Autocorrelation ac;
    for (int i = 0; i <= 4000; ++i) {
        if (i > 500 && i <= 540) continue;
        const double r = i * 0.001;
        ac.r.push_back(r);
        ac.acg.push_back(mx * std::exp(-alpha * r));
    }

    // 10 m pixels: 0.02 km bins
    const auto bins = covariance::bin_autocorrelation(ac, 10.0, 10.0);
    REQUIRE(bins.bin_width == Catch::Approx(0.02));
    REQUIRE(bins.means.size() == 200);
    REQUIRE(bins.means[0] == Catch::Approx(mx));
    REQUIRE(std::isnan(bins.means[26]));
    REQUIRE(std::isnan(bins.means[27]));

    const double alpha0 = 2.0 / (static_cast<double>(bins.means.size()) * bins.bin_width);
    const double fitted =
        covariance::fit_exponential_decay(bins.distances, bins.means, bins.means.front(), alpha0);
    // bin means average over (d - width, d], which pulls the fit slightly low
    REQUIRE(fitted == Catch::Approx(alpha).epsilon(0.015));
    REQUIRE(fitted < alpha);

    const double nan = std::numeric_limits<double>::quiet_NaN();
    REQUIRE_THROWS_AS(covariance::fit_exponential_decay({0.0, 1.0}, {nan, nan}, mx, alpha0),
                      insar_rate::CovarianceError);
}

TEST_CASE("exponential_fit_is_exact_on_model_bins") {
    std::vector<double> distances;
    std::vector<double> means;
    for (int b = 0; b < 20; ++b) {
        distances.push_back(b * 0.2);
        means.push_back(12.0 * std::exp(-0.8 * b * 0.2));
    }
    means[7] = std::numeric_limits<double>::quiet_NaN();
    REQUIRE(covariance::fit_exponential_decay(distances, means, 12.0, 0.5) ==
            Catch::Approx(0.8).epsilon(1e-4));
}

TEST_CASE("autocorrelation_zero_lag_is_mean_square_of_nonzero_phase") {
    Matrix2Df phase = noisy_phase(24, 20, 11);
    phase(3, 4) = std::numeric_limits<float>::quiet_NaN();
    phase(5, 6) = 0.0f;

    double sum_sq = 0.0;
    int nonzero = 0;
    for (int i = 0; i < phase.size(); ++i) {
        const float v = phase.data()[i];
        if (std::isfinite(v) && v != 0.0f) {
            sum_sq += static_cast<double>(v) * v;
            ++nonzero;
        }
    }

    const auto ac = covariance::autocorrelation(phase, 90.0, 90.0);
    REQUIRE_FALSE(ac.acg.empty());
    REQUIRE(ac.acg.size() == ac.r.size());

    const double maxdist = std::min(10 * 90.0, 12 * 90.0) / 1000.0;
    double zero_lag = std::numeric_limits<double>::quiet_NaN();
    for (size_t i = 0; i < ac.r.size(); ++i) {
        REQUIRE(ac.r[i] < maxdist);
        if (ac.r[i] == 0.0) {
            zero_lag = ac.acg[i];
        }
    }
    REQUIRE(zero_lag == Catch::Approx(sum_sq / nonzero).epsilon(1e-6));
    REQUIRE(*std::max_element(ac.acg.begin(), ac.acg.end()) == Catch::Approx(zero_lag));

    REQUIRE_THROWS_AS(covariance::autocorrelation(Matrix2Df::Zero(8, 8), 90.0, 90.0),
                      insar_rate::CovarianceError);
}

TEST_CASE("binning_validates_its_inputs") {
    covariance::Autocorrelation empty;
    REQUIRE_THROWS_AS(covariance::bin_autocorrelation(empty, 90.0, 90.0),
                      insar_rate::CovarianceError);

    covariance::Autocorrelation ac;
    ac.acg = {4.0, 3.0, 2.0, 1.0};
    ac.r = {0.0, 0.1, 0.2, 0.35};
    REQUIRE_THROWS_AS(covariance::bin_autocorrelation(ac, 0.0, 0.0), insar_rate::CovarianceError);

    // bin width 0.18 km: bins 0, 1, 2, 2 -> maxbin 2, bins 0 and 1 kept
    const auto bins = covariance::bin_autocorrelation(ac, 90.0, 60.0);
    REQUIRE(bins.bin_width == Catch::Approx(0.18));
    REQUIRE(bins.distances.size() == 2);
    REQUIRE(bins.means[0] == Catch::Approx(4.0));
    REQUIRE(bins.means[1] == Catch::Approx(3.0));

    covariance::Autocorrelation only_zero;
    only_zero.acg = {1.0};
    only_zero.r = {0.0};
    REQUIRE_THROWS_AS(covariance::bin_autocorrelation(only_zero, 90.0, 90.0),
                      insar_rate::CovarianceError);
}

TEST_CASE("cvd_without_write_leaves_the_file_untouched") {
    test::TempDir dir("cvd_ro");
    const auto path = test::write_ifg(dir.path(), "2020-01-01", "2020-03-01",
                                      noisy_phase(24, 20, 5));
    const auto cfg = test::test_config(dir / "tmp");
    const std::string before = insar_rate::core::sha256_file(path);

    const auto first = covariance::cvd(path, cfg, true, false, false);
    const auto second = covariance::cvd(path, cfg, true, false, false);
    REQUIRE(insar_rate::core::sha256_file(path) == before);
    REQUIRE(first.maxvar > 0.0);
    REQUIRE(first.alpha.has_value());
    REQUIRE(second.maxvar == first.maxvar);
    REQUIRE(second.alpha == first.alpha);
    REQUIRE_FALSE(fs::exists(
        covariance::cvd_data_path(dir / "tmp", ifg::Interferogram(path).basename())));
}

TEST_CASE("cvd_with_write_adds_only_maxvar_and_alpha") {
    test::TempDir dir("cvd_rw");
    const auto path = test::write_ifg(dir.path(), "2020-01-01", "2020-03-01",
                                      noisy_phase(24, 20, 6));
    const auto cfg = test::test_config(dir / "tmp");
    const auto [phase_before, header_before] = io::read_fits_float(path);

    const auto result = covariance::cvd(path, cfg, true, true, true);

    auto [phase_after, header_after] = io::read_fits_float(path);
    REQUIRE(phase_after == phase_before);
    REQUIRE(std::stod(header_after.get_string(ifg::keys::kMaxVar).value()) ==
            Catch::Approx(result.maxvar).epsilon(1e-12));
    REQUIRE(std::stod(header_after.get_string(ifg::keys::kAlpha).value()) ==
            Catch::Approx(result.alpha.value()).epsilon(1e-12));
    header_after.erase(ifg::keys::kMaxVar);
    header_after.erase(ifg::keys::kAlpha);
    REQUIRE(header_after == header_before);

    const auto acg_path = covariance::cvd_data_path(dir / "tmp", "2020-01-01-2020-03-01_unw");
    REQUIRE(fs::exists(acg_path));
    REQUIRE(io::read_fits_double(acg_path).cols() == 2);

    // same numbers from the rewritten file
    const auto again = covariance::cvd(path, cfg, true, false, false);
    REQUIRE(again.maxvar == Catch::Approx(result.maxvar).epsilon(1e-12));
}

TEST_CASE("maxvar_and_vcm_match_between_serial_and_local_ranks") {
    test::SyntheticStack stack;
    std::vector<std::vector<double>> maxvars;
    std::vector<Matrix2Dd> vcms;

    for (int ranks : {1, 3}) {
        test::TempDir dir("maxvar_" + std::to_string(ranks));
        const auto paths = test::write_synthetic_stack(dir.path(), stack);
        const auto cfg = test::test_config(dir / "tmp");

        std::vector<Matrix2Dd> per_rank(static_cast<size_t>(ranks));
        std::vector<double> leader_maxvar;
        parallel::LocalGroup group(ranks);
        group.run([&](parallel::ExecutionContext& ctx) {
            ifg::PhaseCache cache(dir / "tmp" / "cache", stack.rows, stack.cols);
            const auto registry = ifg::build_preread_registry(ctx, paths, cfg, cache);
            const auto maxvar = covariance::maxvar_alpha_calc(ctx, registry, cfg);
            per_rank[static_cast<size_t>(ctx.rank())] =
                covariance::vcm_calc(ctx, registry, maxvar);
            if (ctx.is_leader()) {
                leader_maxvar = maxvar;
            }
        });

        REQUIRE(leader_maxvar.size() == paths.size());
        for (const auto& v : per_rank) {
            REQUIRE(v == per_rank[0]);
        }
        for (const auto& p : paths) {
            ifg::Interferogram ifg(p);
            ifg.open();
            REQUIRE(ifg.metadata().contains(ifg::keys::kMaxVar));
        }
        maxvars.push_back(leader_maxvar);
        vcms.push_back(per_rank[0]);
    }

    for (size_t i = 0; i < maxvars[0].size(); ++i) {
        REQUIRE(maxvars[1][i] == Catch::Approx(maxvars[0][i]).epsilon(1e-12));
    }
    REQUIRE(vcms[1].isApprox(vcms[0], 1e-12));
}
