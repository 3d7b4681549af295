#pragma once

#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/phase_cache.hpp"
#include "insar_rate/ifg/preread.hpp"

#include <string>
#include <vector>

namespace insar_rate::ifg {

// Tile-scoped view of one interferogram, built from the phase cache and the
// registry without re-opening the raster
struct IfgPart {
    Tile tile;
    Matrix2Df phase;
    std::string master;
    std::string slave;
    double time_span = 0.0;
    double nan_fraction = 0.0;
};

IfgPart make_ifg_part(const PrereadIfg& entry, const PhaseCache& cache, const Tile& tile);

// One part per interferogram, in canonical order
std::vector<IfgPart> make_ifg_parts(const PrereadRegistry& registry, const PhaseCache& cache,
                                    const Tile& tile);

} // namespace insar_rate::ifg
