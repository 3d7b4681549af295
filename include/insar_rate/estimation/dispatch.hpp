#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/events.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/phase_cache.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/parallel/context.hpp"

#include <string>
#include <vector>

namespace insar_rate::estimation {

// Per-tile artifacts under the output directory. The stage functions below
// write only this rank's share; the caller synchronises ranks afterwards.
fs::path tile_artifact_path(const fs::path& tmpdir, const std::string& prefix, int tile_index);

// Saves the per-pixel MST of every tile in this rank's tile shard to
// mst_mat_<tile>.fits, one plane per interferogram.
void mst_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
              const ifg::PhaseCache& cache, const std::vector<Tile>& tiles,
              const config::Config& cfg);

// Re-caches the corrected phase of this rank's interferograms
void refresh_phase_cache(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                         ifg::PhaseCache& cache, const config::Config& cfg);

// tsincr_<tile>.fits and tscuml_<tile>.fits for this rank's tiles. Each
// finished tile is reported to `events` when given.
void timeseries_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                     const ifg::PhaseCache& cache, const std::vector<Tile>& tiles,
                     const Matrix2Dd& vcmt, const config::Config& cfg,
                     core::EventEmitter* events = nullptr);

// linrate_<tile>.fits, linerror_<tile>.fits and linsamples_<tile>.fits
void linrate_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                  const ifg::PhaseCache& cache, const std::vector<Tile>& tiles,
                  const Matrix2Dd& vcmt, const config::Config& cfg,
                  core::EventEmitter* events = nullptr);

} // namespace insar_rate::estimation
