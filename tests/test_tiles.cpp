#include "insar_rate/core/errors.hpp"
#include "insar_rate/pipeline/tiles.hpp"

#include <vector>

#include <catch2/catch_test_macros.hpp>

namespace pipeline = insar_rate::pipeline;

TEST_CASE("create_tiles_covers_every_pixel_exactly_once") {
    const int rows = 17;
    const int cols = 11;
    const auto tiles = pipeline::create_tiles(rows, cols, 3, 4);
    REQUIRE(tiles.size() == 12);

    std::vector<int> hits(static_cast<size_t>(rows * cols), 0);
    for (size_t i = 0; i < tiles.size(); ++i) {
        const auto& t = tiles[i];
        REQUIRE(t.index == static_cast<int>(i));
        REQUIRE(t.rows() > 0);
        REQUIRE(t.cols() > 0);
        for (int r = t.row_start; r < t.row_end; ++r) {
            for (int c = t.col_start; c < t.col_end; ++c) {
                ++hits[static_cast<size_t>(r * cols + c)];
            }
        }
    }
    for (int h : hits) {
        REQUIRE(h == 1);
    }
}

TEST_CASE("create_tiles_numbers_row_major_with_larger_leading_tiles") {
    const auto tiles = pipeline::create_tiles(10, 10, 3, 2);
    // rows split 4/3/3, cols 5/5
    REQUIRE(tiles[0].row_start == 0);
    REQUIRE(tiles[0].row_end == 4);
    REQUIRE(tiles[1].col_start == 5);
    REQUIRE(tiles[2].row_start == 4);
    REQUIRE(tiles[5].row_end == 10);
    REQUIRE(tiles[5].col_end == 10);
}

TEST_CASE("create_tiles_rejects_invalid_counts") {
    REQUIRE_THROWS_AS(pipeline::create_tiles(10, 10, 0, 1), insar_rate::ValidationError);
    REQUIRE_THROWS_AS(pipeline::create_tiles(10, 10, 11, 1), insar_rate::ValidationError);
    REQUIRE_THROWS_AS(pipeline::create_tiles(0, 10, 1, 1), insar_rate::ValidationError);
}
