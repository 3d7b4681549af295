#pragma once

#include "insar_rate/core/types.hpp"

#include <vector>

namespace insar_rate::pipeline {

// Splits a rows x cols raster into n_tile_rows x n_tile_cols rectangles.
// Each axis is split with parallel::split_range; tiles are numbered
// row-major from 0 and together cover the raster exactly once.
std::vector<Tile> create_tiles(int rows, int cols, int n_tile_rows, int n_tile_cols);

} // namespace insar_rate::pipeline
