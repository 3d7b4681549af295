#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/events.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/parallel/context.hpp"

#include <nlohmann/json.hpp>
#include <vector>

namespace insar_rate::pipeline {

struct ProcessResult {
    PixelCoord ref_pixel;
    std::vector<double> maxvar;
    Matrix2Dd vcmt;
    std::vector<Tile> tiles;
};

nlohmann::json result_to_json(const ProcessResult& result);

// Runs the whole correction and estimation chain over `sorted_paths`. Every
// rank must call it with the same arguments; every rank returns the same
// result. Artifacts are written to cfg.output.tmpdir.
ProcessResult process_ifgs(parallel::ExecutionContext& ctx,
                           const std::vector<fs::path>& sorted_paths, const config::Config& cfg,
                           int tile_rows, int tile_cols, core::EventEmitter& events);

} // namespace insar_rate::pipeline
