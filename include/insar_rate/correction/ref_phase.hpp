#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/parallel/context.hpp"

#include <vector>

namespace insar_rate::correction {

constexpr const char* kRefPhaseFile = "ref_phs.fits";

// True when every interferogram is already corrected, false when none is;
// a mix raises ReferencePhaseError
bool ref_phase_already_removed(const ifg::PrereadRegistry& registry);

// Median of the phase outside the masked pixels (non-zero mask = excluded)
double est_ref_phase_median(const Matrix2Df& phase, const Matrix2Dd& mask);

// Median of the chip of side 2*(chip_size/2)+1 centred on the reference pixel
double est_ref_phase_chip(const Matrix2Df& phase, const PixelCoord& ref, int chip_size,
                          double min_frac);

// Sum over the interferograms of this rank's shard; NaN wherever any input is
// NaN. Zero for an empty shard.
Matrix2Dd local_phase_sum(const std::vector<std::string>& paths, const config::Config& cfg,
                          int rows, int cols);

// Mask (1 = excluded) of pixels that are NaN in at least one interferogram.
// Partial sums travel to the leader tagged with the sender rank; the leader
// adds them in ascending rank order and broadcasts the mask.
Matrix2Dd common_nan_mask(parallel::ExecutionContext& ctx, const Matrix2Dd& local_sum);

// Estimates, subtracts and records the reference phase of every
// interferogram. Returns the correction vector on the leader (empty on other
// ranks, and on every rank when the stack was already corrected).
std::vector<double> ref_phase_estimation(parallel::ExecutionContext& ctx,
                                         const ifg::PrereadRegistry& registry,
                                         const PixelCoord& ref_pixel, const config::Config& cfg);

} // namespace insar_rate::correction
