#include "insar_rate/estimation/dispatch.hpp"
#include "insar_rate/algorithm/epochs.hpp"
#include "insar_rate/algorithm/mst.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/estimation/linrate.hpp"
#include "insar_rate/estimation/timeseries.hpp"
#include "insar_rate/ifg/ifg_part.hpp"
#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/parallel/collectives.hpp"

#include <map>

namespace insar_rate::estimation {

namespace {

Cube load_mst(const fs::path& tmpdir, const Tile& tile, size_t n_ifgs) {
    Cube mst = io::read_fits_cube(tile_artifact_path(tmpdir, "mst_mat", tile.index)).first;
    if (mst.size() != n_ifgs) {
        throw PipelineError("MST of tile " + std::to_string(tile.index) + " has " +
                            std::to_string(mst.size()) + " planes, expected " +
                            std::to_string(n_ifgs));
    }
    return mst;
}

void report_tile(core::EventEmitter* events, Stage stage, size_t done, size_t total,
                 const Tile& tile) {
    if (events) {
        events->phase_progress(stage, static_cast<int>(done), static_cast<int>(total),
                               "tile " + std::to_string(tile.index));
    }
}

} // namespace

fs::path tile_artifact_path(const fs::path& tmpdir, const std::string& prefix, int tile_index) {
    return tmpdir / (prefix + "_" + std::to_string(tile_index) + ".fits");
}

void mst_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
              const ifg::PhaseCache& cache, const std::vector<Tile>& tiles,
              const config::Config& cfg) {
    algorithm::check_mst_backend(cfg.mst.backend);

    std::vector<std::string> dates;
    for (const auto& p : registry.ordered()) {
        dates.push_back(p.master);
        dates.push_back(p.slave);
    }
    const std::map<std::string, int> ids = algorithm::master_slave_ids(dates);

    std::vector<algorithm::EpochEdge> edges;
    std::vector<double> weights;
    for (const auto& p : registry.ordered()) {
        edges.push_back({ids.at(p.master), ids.at(p.slave)});
        weights.push_back(p.nan_fraction);
    }

    for (const auto& tile : parallel::split(tiles, ctx)) {
        std::vector<Matrix2Df> phases;
        for (auto& part : ifg::make_ifg_parts(registry, cache, tile)) {
            phases.push_back(std::move(part.phase));
        }
        const Cube mst = algorithm::mst_selection(phases, edges, weights,
                                                  static_cast<int>(ids.size()));
        io::write_fits_cube(tile_artifact_path(cfg.output.tmpdir, "mst_mat", tile.index), mst);
    }
}

void refresh_phase_cache(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                         ifg::PhaseCache& cache, const config::Config& cfg) {
    for (const auto& path : parallel::split(registry.paths, ctx)) {
        ifg::Interferogram ifg(path);
        ifg.open(true);
        ifg::nan_and_mm_convert(ifg, cfg);
        cache.store(ifg.basename(), ifg.phase_data());
        ifg.close();
    }
}

void timeseries_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                     const ifg::PhaseCache& cache, const std::vector<Tile>& tiles,
                     const Matrix2Dd& vcmt, const config::Config& cfg,
                     core::EventEmitter* events) {
    const fs::path tmpdir = cfg.output.tmpdir;
    const std::vector<Tile> shard = parallel::split(tiles, ctx);
    for (size_t i = 0; i < shard.size(); ++i) {
        const Tile& tile = shard[i];
        const auto parts = ifg::make_ifg_parts(registry, cache, tile);
        const Cube mst = load_mst(tmpdir, tile, parts.size());
        const TimeseriesResult ts = time_series(parts, vcmt, mst, cfg.timeseries);

        io::FitsHeader header;
        header.set("EPOCH0", ts.epochs.empty() ? std::string() : ts.epochs.front());
        header.set("NEPOCHS", static_cast<int>(ts.epochs.size()));
        io::write_fits_cube(tile_artifact_path(tmpdir, "tsincr", tile.index), ts.tsincr, header);
        io::write_fits_cube(tile_artifact_path(tmpdir, "tscuml", tile.index), ts.tscuml, header);
        report_tile(events, Stage::TIMESERIES, i + 1, shard.size(), tile);
    }
}

void linrate_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                  const ifg::PhaseCache& cache, const std::vector<Tile>& tiles,
                  const Matrix2Dd& vcmt, const config::Config& cfg,
                  core::EventEmitter* events) {
    const fs::path tmpdir = cfg.output.tmpdir;
    const std::vector<Tile> shard = parallel::split(tiles, ctx);
    for (size_t i = 0; i < shard.size(); ++i) {
        const Tile& tile = shard[i];
        const auto parts = ifg::make_ifg_parts(registry, cache, tile);
        const Cube mst = load_mst(tmpdir, tile, parts.size());
        const LinrateResult lr = linear_rate(parts, vcmt, mst, cfg.linrate);

        io::write_fits_float(tile_artifact_path(tmpdir, "linrate", tile.index), lr.rate, {});
        io::write_fits_float(tile_artifact_path(tmpdir, "linerror", tile.index), lr.error, {});
        io::write_fits_float(tile_artifact_path(tmpdir, "linsamples", tile.index), lr.samples, {});
        report_tile(events, Stage::LINRATE, i + 1, shard.size(), tile);
    }
}

} // namespace insar_rate::estimation
