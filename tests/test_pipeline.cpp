#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/events.hpp"
#include "insar_rate/correction/ref_phase.hpp"
#include "insar_rate/estimation/dispatch.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/parallel/local_context.hpp"
#include "insar_rate/pipeline/process.hpp"
#include "test_support.hpp"

#include <cmath>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

using insar_rate::Matrix2Df;
namespace fs = std::filesystem;
namespace core = insar_rate::core;
namespace estimation = insar_rate::estimation;
namespace io = insar_rate::io;
namespace parallel = insar_rate::parallel;
namespace pipeline = insar_rate::pipeline;
namespace test = insar_rate::test;

namespace {

struct PipelineRun {
    pipeline::ProcessResult result;
    std::vector<pipeline::ProcessResult> per_rank;
    std::string leader_events;
};

PipelineRun run_pipeline(const test::TempDir& dir, const insar_rate::config::Config& cfg,
                         int ranks) {
    const auto paths = test::write_synthetic_stack(dir.path(), test::SyntheticStack{});

    PipelineRun run;
    run.per_rank.resize(static_cast<size_t>(ranks));
    std::mutex mutex;
    parallel::LocalGroup group(ranks);
    group.run([&](parallel::ExecutionContext& ctx) {
        std::ostringstream log;
        core::EventEmitter events("test_run", ctx.rank(), &log);
        auto result = pipeline::process_ifgs(ctx, paths, cfg, 2, 2, events);

        std::lock_guard<std::mutex> lock(mutex);
        run.per_rank[static_cast<size_t>(ctx.rank())] = result;
        if (ctx.is_leader()) {
            run.result = result;
            run.leader_events = log.str();
        }
    });
    return run;
}

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("pipeline_results_do_not_depend_on_rank_count") {
    test::TempDir serial_dir("pipeline_serial");
    test::TempDir group_dir("pipeline_group");
    const auto serial_cfg = test::test_config(serial_dir / "out");
    const auto group_cfg = test::test_config(group_dir / "out");

    const PipelineRun serial = run_pipeline(serial_dir, serial_cfg, 1);
    const PipelineRun group = run_pipeline(group_dir, group_cfg, 3);

    // every rank returns the leader's result
    for (const auto& r : group.per_rank) {
        REQUIRE(r.ref_pixel == group.result.ref_pixel);
        REQUIRE(r.maxvar == group.result.maxvar);
        REQUIRE(r.vcmt == group.result.vcmt);
        REQUIRE(r.tiles.size() == group.result.tiles.size());
    }

    REQUIRE(serial.result.ref_pixel == group.result.ref_pixel);
    REQUIRE(serial.result.tiles.size() == 4);
    REQUIRE(serial.result.maxvar.size() == 7);
    REQUIRE(group.result.maxvar.size() == 7);
    for (size_t i = 0; i < serial.result.maxvar.size(); ++i) {
        REQUIRE(serial.result.maxvar[i] > 0.0);
        REQUIRE(group.result.maxvar[i] == Catch::Approx(serial.result.maxvar[i]).epsilon(1e-9));
    }
    REQUIRE(group.result.vcmt.isApprox(serial.result.vcmt, 1e-9));

    const fs::path serial_out = serial_dir / "out";
    const fs::path group_out = group_dir / "out";
    REQUIRE(fs::exists(serial_out / insar_rate::ifg::kPrereadFile));
    REQUIRE(fs::exists(group_out / insar_rate::correction::kRefPhaseFile));
    // the converted phase cache is gone once the last stage has run
    REQUIRE_FALSE(fs::exists(serial_out / "phase_cache"));
    REQUIRE_FALSE(fs::exists(group_out / "phase_cache"));

    for (const auto& tile : serial.result.tiles) {
        for (const char* prefix : {"mst_mat", "tsincr", "tscuml", "linrate", "linerror",
                                   "linsamples"}) {
            REQUIRE(fs::exists(estimation::tile_artifact_path(serial_out, prefix, tile.index)));
            REQUIRE(fs::exists(estimation::tile_artifact_path(group_out, prefix, tile.index)));
        }

        const Matrix2Df a =
            io::read_fits_float(estimation::tile_artifact_path(serial_out, "linrate", tile.index))
                .first;
        const Matrix2Df b =
            io::read_fits_float(estimation::tile_artifact_path(group_out, "linrate", tile.index))
                .first;
        REQUIRE(a.rows() == tile.rows());
        REQUIRE(a.cols() == tile.cols());
        REQUIRE(b.rows() == a.rows());
        int finite = 0;
        for (Eigen::Index i = 0; i < a.size(); ++i) {
            const float x = a.data()[i];
            const float y = b.data()[i];
            REQUIRE(std::isnan(x) == std::isnan(y));
            if (!std::isnan(x)) {
                REQUIRE(y == Catch::Approx(x).margin(1e-3));
                ++finite;
            }
        }
        REQUIRE(finite > 0);

        const auto [tsincr, header] =
            io::read_fits_cube(estimation::tile_artifact_path(serial_out, "tsincr", tile.index));
        REQUIRE(tsincr.size() == 4);
        REQUIRE(header.get_int("NEPOCHS").value() == 5);
        REQUIRE(header.get_string("EPOCH0").value() == "2020-01-01");
    }

    for (const char* stage : {"\"TILES\"", "\"PREREAD\"", "\"MST\"", "\"REF_PIXEL\"",
                              "\"ORBITAL\"", "\"REF_PHASE\"", "\"COVARIANCE\"", "\"VCM\"",
                              "\"PHASE_CACHE\"", "\"TIMESERIES\"", "\"LINRATE\"", "\"DONE\""}) {
        REQUIRE(contains(serial.leader_events, stage));
    }
    REQUIRE(contains(serial.leader_events, "\"phase_progress\""));
    REQUIRE_FALSE(contains(serial.leader_events, "\"error\""));
}

TEST_CASE("pipeline_skips_disabled_stages") {
    test::TempDir dir("pipeline_skip");
    auto cfg = test::test_config(dir / "out");
    cfg.orbital.enabled = false;
    cfg.timeseries.enabled = false;

    const PipelineRun run = run_pipeline(dir, cfg, 2);
    REQUIRE(contains(run.leader_events, "\"skipped\""));
    REQUIRE(contains(run.leader_events, "orbital.enabled = false"));
    for (const auto& tile : run.result.tiles) {
        REQUIRE_FALSE(fs::exists(estimation::tile_artifact_path(dir / "out", "tsincr", tile.index)));
        REQUIRE(fs::exists(estimation::tile_artifact_path(dir / "out", "linrate", tile.index)));
    }
}

TEST_CASE("pipeline_result_serialises_to_json") {
    pipeline::ProcessResult result;
    result.ref_pixel = {4, 9};
    result.maxvar = {1.5, 2.5};
    result.vcmt = insar_rate::Matrix2Dd::Identity(2, 2);
    result.tiles.resize(3);

    const auto j = pipeline::result_to_json(result);
    REQUIRE(j["ref_pixel"]["x"] == 4);
    REQUIRE(j["ref_pixel"]["y"] == 9);
    REQUIRE(j["maxvar"].size() == 2);
    REQUIRE(j["vcmt"][1][1].get<double>() == 1.0);
    REQUIRE(j["vcmt"][0][1].get<double>() == 0.0);
    REQUIRE(j["num_tiles"] == 3);
}

TEST_CASE("pipeline_rejects_an_empty_stack") {
    test::TempDir dir("pipeline_empty");
    const auto cfg = test::test_config(dir / "out");
    parallel::SerialContext ctx;
    core::EventEmitter events;
    REQUIRE_THROWS_AS(pipeline::process_ifgs(ctx, {}, cfg, 2, 2, events),
                      insar_rate::ValidationError);
}
