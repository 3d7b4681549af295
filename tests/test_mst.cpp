#include "insar_rate/algorithm/epochs.hpp"
#include "insar_rate/algorithm/mst.hpp"
#include "insar_rate/core/errors.hpp"

#include <cmath>
#include <limits>
#include <numeric>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

namespace algorithm = insar_rate::algorithm;
using insar_rate::Matrix2Df;

TEST_CASE("get_epochs_sorts_dates_and_counts_repeats") {
    const auto epochs = algorithm::get_epochs({"2020-03-01", "2020-01-01", "2020-01-01"},
                                              {"2020-05-01", "2020-03-01", "2020-05-01"});
    REQUIRE(epochs.dates == std::vector<std::string>{"2020-01-01", "2020-03-01", "2020-05-01"});
    REQUIRE(epochs.repeat == std::vector<int>{2, 2, 2});
    REQUIRE(epochs.spans[0] == 0.0);
    REQUIRE(epochs.spans[2] == Catch::Approx(121.0 / 365.25));

    const auto ids = algorithm::master_slave_ids({"2020-05-01", "2020-01-01", "2020-05-01"});
    REQUIRE(ids.size() == 2);
    REQUIRE(ids.at("2020-01-01") == 0);
    REQUIRE(ids.at("2020-05-01") == 1);
}

TEST_CASE("kruskal_prefers_light_edges_and_skips_cycles") {
    // triangle 0-1-2 plus a pendant edge 2-3
    const std::vector<algorithm::EpochEdge> edges{{0, 1}, {1, 2}, {0, 2}, {2, 3}};
    const std::vector<double> weights{0.5, 0.1, 0.2, 0.9};
    const auto sel = algorithm::kruskal(edges, algorithm::edge_order(weights), {1, 1, 1, 1}, 4);
    REQUIRE(sel == std::vector<uint8_t>{0, 1, 1, 1});

    // the heavy edge is used once a lighter one is unusable
    const auto sel2 = algorithm::kruskal(edges, algorithm::edge_order(weights), {1, 1, 0, 1}, 4);
    REQUIRE(sel2 == std::vector<uint8_t>{1, 1, 0, 1});
}

TEST_CASE("kruskal_breaks_weight_ties_by_edge_order") {
    const std::vector<algorithm::EpochEdge> edges{{0, 1}, {0, 1}, {1, 2}};
    const auto order = algorithm::edge_order({0.0, 0.0, 0.0});
    REQUIRE(order == std::vector<size_t>{0, 1, 2});
    const auto sel = algorithm::kruskal(edges, order, {1, 1, 1}, 3);
    REQUIRE(sel == std::vector<uint8_t>{1, 0, 1});

    REQUIRE_THROWS_AS(algorithm::kruskal(edges, {0, 1}, {1, 1, 1}, 3),
                      insar_rate::ValidationError);
    REQUIRE_THROWS_AS(algorithm::kruskal({{0, 5}}, {0}, {1}, 3), insar_rate::ValidationError);
}

TEST_CASE("mst_selection_routes_around_nan_pixels") {
    const std::vector<algorithm::EpochEdge> edges{{0, 1}, {1, 2}, {0, 2}};
    const std::vector<double> weights{0.0, 0.1, 0.2};
    std::vector<Matrix2Df> phases(3, Matrix2Df::Constant(1, 2, 1.0f));
    phases[0](0, 1) = std::numeric_limits<float>::quiet_NaN();

    const auto mst = algorithm::mst_selection(phases, edges, weights, 3);
    REQUIRE(mst.size() == 3);
    // pixel 0: edges 0 and 1; pixel 1: edge 0 is NaN so 1 and 2
    REQUIRE(mst[0](0, 0) == 1.0f);
    REQUIRE(mst[1](0, 0) == 1.0f);
    REQUIRE(mst[2](0, 0) == 0.0f);
    REQUIRE(mst[0](0, 1) == 0.0f);
    REQUIRE(mst[1](0, 1) == 1.0f);
    REQUIRE(mst[2](0, 1) == 1.0f);
}

TEST_CASE("mst_selection_matches_kruskal_at_every_pixel") {
    // two loops over four epochs, NaNs knocking out different edges per pixel
    const std::vector<algorithm::EpochEdge> edges{{0, 1}, {1, 2}, {0, 2}, {2, 3}, {1, 3}};
    const std::vector<double> weights{0.3, 0.1, 0.1, 0.4, 0.2};
    const float nan = std::numeric_limits<float>::quiet_NaN();
    std::vector<Matrix2Df> phases(edges.size(), Matrix2Df::Constant(2, 3, 0.5f));
    phases[1](0, 1) = nan;
    phases[2](0, 2) = nan;
    phases[4](1, 0) = nan;
    phases[3](1, 1) = nan;
    phases[0](1, 2) = nan;
    phases[1](1, 2) = nan;

    const auto mst = algorithm::mst_selection(phases, edges, weights, 4);
    const auto order = algorithm::edge_order(weights);
    for (Eigen::Index r = 0; r < 2; ++r) {
        for (Eigen::Index c = 0; c < 3; ++c) {
            std::vector<uint8_t> usable;
            for (const auto& p : phases) {
                usable.push_back(std::isfinite(p(r, c)) ? 1 : 0);
            }
            const auto expected = algorithm::kruskal(edges, order, usable, 4);
            for (size_t i = 0; i < edges.size(); ++i) {
                REQUIRE(mst[i](r, c) == static_cast<float>(expected[i]));
            }
        }
    }
    // all edges finite: 1-2 and 0-2 tie and both go in, then 1-3
    REQUIRE(mst[1](0, 0) == 1.0f);
    REQUIRE(mst[2](0, 0) == 1.0f);
    REQUIRE(mst[4](0, 0) == 1.0f);
    REQUIRE(mst[0](0, 0) == 0.0f);
    REQUIRE(mst[3](0, 0) == 0.0f);
}

TEST_CASE("mst_backend_must_be_kruskal") {
    REQUIRE_NOTHROW(algorithm::check_mst_backend("Kruskal"));
    REQUIRE_THROWS_AS(algorithm::check_mst_backend("matlab"), insar_rate::ConfigError);
    REQUIRE_THROWS_AS(algorithm::check_mst_backend("networkx"), insar_rate::ConfigError);
}
