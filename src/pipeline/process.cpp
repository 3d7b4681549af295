#include "insar_rate/pipeline/process.hpp"
#include "insar_rate/correction/orbital.hpp"
#include "insar_rate/correction/ref_phase.hpp"
#include "insar_rate/correction/ref_pixel.hpp"
#include "insar_rate/covariance/vcm.hpp"
#include "insar_rate/estimation/dispatch.hpp"
#include "insar_rate/ifg/phase_cache.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/parallel/collectives.hpp"
#include "insar_rate/pipeline/tiles.hpp"

#include <iostream>
#include <tuple>

namespace insar_rate::pipeline {

using core::json;

namespace {

// Brackets one stage with events and a closing barrier. A failing stage is
// reported and rethrown.
template <typename Fn>
void run_stage(parallel::ExecutionContext& ctx, core::EventEmitter& events, Stage stage, Fn&& fn) {
    events.phase_start(stage);
    if (ctx.is_leader()) {
        std::cout << "[" << stage_to_string(stage) << "] start" << std::endl;
    }
    json extra = json::object();
    try {
        fn(extra);
    } catch (const std::exception& e) {
        events.phase_end(stage, "error", {{"error", e.what()}});
        throw;
    }
    ctx.barrier();
    events.phase_end(stage, "ok", extra);
}

void skip_stage(core::EventEmitter& events, Stage stage, const std::string& reason) {
    events.phase_start(stage);
    events.phase_end(stage, "skipped", {{"reason", reason}});
}

} // namespace

json result_to_json(const ProcessResult& result) {
    json j;
    j["ref_pixel"] = {{"x", result.ref_pixel.x}, {"y", result.ref_pixel.y}};
    j["maxvar"] = result.maxvar;
    json rows = json::array();
    for (Eigen::Index r = 0; r < result.vcmt.rows(); ++r) {
        json row = json::array();
        for (Eigen::Index c = 0; c < result.vcmt.cols(); ++c) {
            row.push_back(result.vcmt(r, c));
        }
        rows.push_back(row);
    }
    j["vcmt"] = rows;
    j["num_tiles"] = static_cast<int>(result.tiles.size());
    return j;
}

ProcessResult process_ifgs(parallel::ExecutionContext& ctx,
                           const std::vector<fs::path>& sorted_paths, const config::Config& cfg,
                           int tile_rows, int tile_cols, core::EventEmitter& events) {
    if (sorted_paths.empty()) {
        throw ValidationError("No interferograms to process");
    }
    const fs::path tmpdir = cfg.output.tmpdir;
    if (ctx.is_leader()) {
        fs::create_directories(tmpdir);
    }
    ctx.barrier();

    ProcessResult result;
    int rows = 0;
    int cols = 0;

    run_stage(ctx, events, Stage::TILES, [&](json& extra) {
        const auto shape = parallel::run_once(ctx, [&] {
            const auto dims = io::get_fits_dimensions(sorted_paths.front());
            return std::vector<double>{static_cast<double>(std::get<1>(dims)),
                                       static_cast<double>(std::get<0>(dims))};
        });
        rows = static_cast<int>(shape[0]);
        cols = static_cast<int>(shape[1]);
        result.tiles = parallel::run_once(
            ctx, [&] { return create_tiles(rows, cols, tile_rows, tile_cols); });
        extra["rows"] = rows;
        extra["cols"] = cols;
        extra["num_tiles"] = static_cast<int>(result.tiles.size());
    });
    if (result.tiles.size() < static_cast<size_t>(ctx.size())) {
        events.warning(std::to_string(result.tiles.size()) + " tiles for " +
                       std::to_string(ctx.size()) + " ranks; some ranks stay idle in the " +
                       "per-tile stages");
    }

    ifg::PhaseCache cache(tmpdir / "phase_cache", rows, cols);
    ifg::PrereadRegistry registry;

    run_stage(ctx, events, Stage::PREREAD, [&](json& extra) {
        registry = ifg::build_preread_registry(ctx, sorted_paths, cfg, cache);
        extra["num_ifgs"] = static_cast<int>(registry.size());
        extra["num_epochs"] = static_cast<int>(registry.epochlist.dates.size());
    });

    run_stage(ctx, events, Stage::MST, [&](json&) {
        estimation::mst_calc(ctx, registry, cache, result.tiles, cfg);
    });

    run_stage(ctx, events, Stage::REF_PIXEL, [&](json& extra) {
        result.ref_pixel = correction::ref_pixel_calc(ctx, registry, cache, cfg);
        extra["refx"] = result.ref_pixel.x;
        extra["refy"] = result.ref_pixel.y;
    });

    if (cfg.orbital.enabled) {
        run_stage(ctx, events, Stage::ORBITAL, [&](json& extra) {
            auto executor = correction::make_orbital_executor(cfg.orbital.method);
            executor->run(ctx, registry, cfg);
            extra["method"] = cfg.orbital.method;
        });
    } else {
        skip_stage(events, Stage::ORBITAL, "orbital.enabled = false");
    }

    run_stage(ctx, events, Stage::REF_PHASE, [&](json& extra) {
        const std::vector<double> ref_phs =
            correction::ref_phase_estimation(ctx, registry, result.ref_pixel, cfg);
        if (ctx.is_leader()) {
            extra["ref_phs"] = ref_phs;
        }
    });

    std::vector<double> maxvar;
    run_stage(ctx, events, Stage::COVARIANCE, [&](json&) {
        maxvar = covariance::maxvar_alpha_calc(ctx, registry, cfg);
    });

    run_stage(ctx, events, Stage::VCM, [&](json&) {
        result.maxvar = parallel::broadcast_value(ctx, maxvar);
        result.vcmt = covariance::vcm_calc(ctx, registry, result.maxvar);
    });

    run_stage(ctx, events, Stage::PHASE_CACHE, [&](json&) {
        estimation::refresh_phase_cache(ctx, registry, cache, cfg);
    });

    if (cfg.timeseries.enabled) {
        run_stage(ctx, events, Stage::TIMESERIES, [&](json&) {
            estimation::timeseries_calc(ctx, registry, cache, result.tiles, result.vcmt, cfg,
                                        &events);
        });
    } else {
        skip_stage(events, Stage::TIMESERIES, "timeseries.enabled = false");
    }

    run_stage(ctx, events, Stage::LINRATE, [&](json&) {
        estimation::linrate_calc(ctx, registry, cache, result.tiles, result.vcmt, cfg, &events);
    });

    // Every rank is past the LINRATE barrier; nothing reads the cache any more
    parallel::run_once(ctx, [&] {
        cache.cleanup();
        return cache.dir().string();
    });

    events.phase_start(Stage::DONE);
    events.phase_end(Stage::DONE, "ok", result_to_json(result));
    return result;
}

} // namespace insar_rate::pipeline
