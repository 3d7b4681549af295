#include "insar_rate/pipeline/tiles.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/parallel/collectives.hpp"

#include <string>

namespace insar_rate::pipeline {

std::vector<Tile> create_tiles(int rows, int cols, int n_tile_rows, int n_tile_cols) {
    if (rows < 1 || cols < 1) {
        throw ValidationError("raster must be non-empty, got " + std::to_string(rows) + "x" +
                              std::to_string(cols));
    }
    if (n_tile_rows < 1 || n_tile_cols < 1) {
        throw ValidationError("tile counts must be >= 1");
    }
    if (n_tile_rows > rows || n_tile_cols > cols) {
        throw ValidationError("tile grid " + std::to_string(n_tile_rows) + "x" +
                              std::to_string(n_tile_cols) + " exceeds raster " +
                              std::to_string(rows) + "x" + std::to_string(cols));
    }

    std::vector<Tile> tiles;
    tiles.reserve(static_cast<size_t>(n_tile_rows) * static_cast<size_t>(n_tile_cols));

    int index = 0;
    for (int ty = 0; ty < n_tile_rows; ++ty) {
        const parallel::Range r = parallel::split_range(static_cast<size_t>(rows), n_tile_rows, ty);
        for (int tx = 0; tx < n_tile_cols; ++tx) {
            const parallel::Range c =
                parallel::split_range(static_cast<size_t>(cols), n_tile_cols, tx);
            Tile t;
            t.index = index++;
            t.row_start = static_cast<int>(r.begin);
            t.row_end = static_cast<int>(r.end);
            t.col_start = static_cast<int>(c.begin);
            t.col_end = static_cast<int>(c.end);
            tiles.push_back(t);
        }
    }
    return tiles;
}

} // namespace insar_rate::pipeline
