#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/phase_cache.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/parallel/context.hpp"

#include <string>
#include <vector>

namespace insar_rate::correction {

struct RefPixelSetup {
    int half_patch = 0;
    int chip_size = 0;
    double thresh = 0.0; // minimum number of valid samples per patch
    std::vector<PixelCoord> grid;
};

// Candidate positions along one axis of length dim
std::vector<int> candidate_steps(int dim, int n, int radius);

// Validates the search parameters against the raster and builds the
// candidate grid (row steps x column steps, row-major)
RefPixelSetup ref_pixel_setup(int nrows, int ncols, const config::RefPixelConfig& cfg);

// Square patch of side 2*half+1 centred on c, clipped to the raster
Matrix2Df extract_patch(const Matrix2Df& phase, const PixelCoord& c, int half);

fs::path ref_patch_path(const fs::path& tmpdir, const std::string& basename, const PixelCoord& c);

// Mean over interferograms of the patch standard deviation, or NaN when any
// patch has thresh or fewer valid samples
double candidate_score(const std::vector<Matrix2Df>& patches, double thresh);

// Candidate with the smallest finite score; ReferencePixelError if none
PixelCoord filter_means(const std::vector<double>& scores, const std::vector<PixelCoord>& grid);

// Writes the patch of every interferogram for each candidate in grid_shard
void save_ref_pixel_blocks(const std::vector<PixelCoord>& grid_shard,
                           const ifg::PrereadRegistry& registry, const ifg::PhaseCache& cache,
                           int half_patch, const fs::path& tmpdir);

std::vector<double> ref_pixel_scores(const std::vector<PixelCoord>& grid_shard,
                                     const ifg::PrereadRegistry& registry, double thresh,
                                     const fs::path& tmpdir);

// Validates or searches the reference pixel; identical result on every rank
PixelCoord ref_pixel_calc(parallel::ExecutionContext& ctx, const ifg::PrereadRegistry& registry,
                          const ifg::PhaseCache& cache, const config::Config& cfg);

} // namespace insar_rate::correction
