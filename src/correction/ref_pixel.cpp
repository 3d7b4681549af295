#include "insar_rate/correction/ref_pixel.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/parallel/collectives.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace insar_rate::parallel {

template <>
struct Codec<correction::RefPixelSetup> {
    static Bytes encode(const correction::RefPixelSetup& s) {
        nlohmann::json grid = nlohmann::json::array();
        for (const auto& p : s.grid) {
            grid.push_back({p.x, p.y});
        }
        return Codec<nlohmann::json>::encode({{"half", s.half_patch},
                                              {"chip", s.chip_size},
                                              {"thresh", s.thresh},
                                              {"grid", grid}});
    }
    static correction::RefPixelSetup decode(const Bytes& bytes) {
        const nlohmann::json j = Codec<nlohmann::json>::decode(bytes);
        correction::RefPixelSetup s;
        s.half_patch = j.at("half").get<int>();
        s.chip_size = j.at("chip").get<int>();
        s.thresh = j.at("thresh").get<double>();
        for (const auto& p : j.at("grid")) {
            s.grid.push_back(PixelCoord{p[0].get<int>(), p[1].get<int>()});
        }
        return s;
    }
};

} // namespace insar_rate::parallel

namespace insar_rate::correction {

std::vector<int> candidate_steps(int dim, int n, int radius) {
    if (n == 1) {
        return {dim / 2};
    }
    const int step = (dim - 2 * radius) / (n - 1);
    std::vector<int> steps;
    steps.reserve(static_cast<size_t>(n));
    for (int i = 0; i < n; ++i) {
        steps.push_back(radius + i * step);
    }
    return steps;
}

RefPixelSetup ref_pixel_setup(int nrows, int ncols, const config::RefPixelConfig& cfg) {
    RefPixelSetup setup;
    setup.half_patch = cfg.chip_size / 2;
    setup.chip_size = 2 * setup.half_patch + 1;

    if (setup.chip_size < 3 || setup.chip_size > std::min(nrows, ncols)) {
        throw ValidationError("refpixel.chip_size must be between 3 and " +
                              std::to_string(std::min(nrows, ncols)) + ", got " +
                              std::to_string(setup.chip_size));
    }
    if (cfg.min_frac < 0.0 || cfg.min_frac > 1.0) {
        throw ValidationError("refpixel.min_frac must be in [0,1]");
    }

    auto check_count = [&](int n, int dim, const char* name) {
        if (n < 1) {
            throw ValidationError(std::string("refpixel.") + name + " must be >= 1");
        }
        if (n > 1 && n > dim - 2 * setup.half_patch) {
            throw ValidationError(std::string("refpixel.") + name + " = " + std::to_string(n) +
                                  " candidates do not fit in " + std::to_string(dim) +
                                  " pixels with chip size " + std::to_string(setup.chip_size));
        }
    };
    check_count(cfg.refnx, ncols, "refnx");
    check_count(cfg.refny, nrows, "refny");

    setup.thresh = cfg.min_frac * setup.chip_size * setup.chip_size;

    const std::vector<int> ysteps = candidate_steps(nrows, cfg.refny, setup.half_patch);
    const std::vector<int> xsteps = candidate_steps(ncols, cfg.refnx, setup.half_patch);
    for (int y : ysteps) {
        for (int x : xsteps) {
            setup.grid.push_back(PixelCoord{x, y});
        }
    }
    return setup;
}

Matrix2Df extract_patch(const Matrix2Df& phase, const PixelCoord& c, int half) {
    const int r0 = std::max(0, c.y - half);
    const int c0 = std::max(0, c.x - half);
    const int r1 = std::min(static_cast<int>(phase.rows()), c.y + half + 1);
    const int c1 = std::min(static_cast<int>(phase.cols()), c.x + half + 1);
    if (r1 <= r0 || c1 <= c0) {
        return Matrix2Df();
    }
    return phase.block(r0, c0, r1 - r0, c1 - c0);
}

fs::path ref_patch_path(const fs::path& tmpdir, const std::string& basename, const PixelCoord& c) {
    return tmpdir / ("ref_phase_data_" + basename + "_" + std::to_string(c.y) + "_" +
                     std::to_string(c.x) + ".fits");
}

double candidate_score(const std::vector<Matrix2Df>& patches, double thresh) {
    const double nan = std::numeric_limits<double>::quiet_NaN();
    if (patches.empty()) {
        return nan;
    }

    std::vector<double> stds;
    stds.reserve(patches.size());
    for (const auto& patch : patches) {
        if (static_cast<double>(core::count_finite(patch)) <= thresh) {
            return nan;
        }
        std::vector<double> values(patch.data(), patch.data() + patch.size());
        stds.push_back(core::nan_std(values));
    }
    return core::nan_mean(stds);
}

PixelCoord filter_means(const std::vector<double>& scores, const std::vector<PixelCoord>& grid) {
    if (scores.size() != grid.size()) {
        throw ReferencePixelError("Got " + std::to_string(scores.size()) + " scores for " +
                                  std::to_string(grid.size()) + " candidates");
    }

    size_t best = scores.size();
    for (size_t i = 0; i < scores.size(); ++i) {
        if (std::isnan(scores[i])) continue;
        if (best == scores.size() || scores[i] < scores[best]) {
            best = i;
        }
    }
    if (best == scores.size()) {
        throw ReferencePixelError(
            "No reference pixel candidate has enough valid data; "
            "reduce refpixel.min_frac or change the search grid");
    }
    return grid[best];
}

void save_ref_pixel_blocks(const std::vector<PixelCoord>& grid_shard,
                           const ifg::PrereadRegistry& registry, const ifg::PhaseCache& cache,
                           int half_patch, const fs::path& tmpdir) {
    if (grid_shard.empty()) {
        return;
    }
    for (const auto& path : registry.paths) {
        const std::string base = core::file_stem(path);
        const Matrix2Df phase = cache.load(base);
        for (const auto& c : grid_shard) {
            io::write_fits_float(ref_patch_path(tmpdir, base, c),
                                 extract_patch(phase, c, half_patch), io::FitsHeader());
        }
    }
}

std::vector<double> ref_pixel_scores(const std::vector<PixelCoord>& grid_shard,
                                     const ifg::PrereadRegistry& registry, double thresh,
                                     const fs::path& tmpdir) {
    std::vector<double> scores;
    scores.reserve(grid_shard.size());
    for (const auto& c : grid_shard) {
        std::vector<Matrix2Df> patches;
        patches.reserve(registry.size());
        for (const auto& path : registry.paths) {
            patches.push_back(
                io::read_fits_float(ref_patch_path(tmpdir, core::file_stem(path), c)).first);
        }
        scores.push_back(candidate_score(patches, thresh));
    }
    return scores;
}

PixelCoord ref_pixel_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                          const ifg::PhaseCache& cache, const config::Config& cfg) {
    const auto& first = registry.at(registry.paths.front());
    const int nrows = first.nrows;
    const int ncols = first.ncols;
    const auto& rc = cfg.refpixel;

    if (rc.refx > ncols - 1) {
        throw ValidationError("refpixel.refx " + std::to_string(rc.refx) +
                              " is outside the raster (max " + std::to_string(ncols - 1) + ")");
    }
    if (rc.refy > nrows - 1) {
        throw ValidationError("refpixel.refy " + std::to_string(rc.refy) +
                              " is outside the raster (max " + std::to_string(nrows - 1) + ")");
    }
    if (rc.refx > 0 && rc.refy > 0) {
        return PixelCoord{rc.refx, rc.refy};
    }

    const RefPixelSetup setup =
        parallel::run_once(ctx, [&] { return ref_pixel_setup(nrows, ncols, rc); });

    const fs::path tmpdir(cfg.output.tmpdir);
    const std::vector<PixelCoord> shard = parallel::split(setup.grid, ctx);
    save_ref_pixel_blocks(shard, registry, cache, setup.half_patch, tmpdir);
    const std::vector<double> local_scores = ref_pixel_scores(shard, registry, setup.thresh, tmpdir);

    const std::vector<double> scores = parallel::gather_concat(ctx, local_scores);
    return parallel::run_once(ctx, [&] { return filter_means(scores, setup.grid); });
}

} // namespace insar_rate::correction
