#include "insar_rate/ifg/ifg_part.hpp"
#include "insar_rate/core/utils.hpp"

namespace insar_rate::ifg {

IfgPart make_ifg_part(const PrereadIfg& entry, const PhaseCache& cache, const Tile& tile) {
    IfgPart part;
    part.tile = tile;
    part.phase = cache.extract_tile(core::file_stem(entry.path), tile);
    part.master = entry.master;
    part.slave = entry.slave;
    part.time_span = entry.time_span;
    part.nan_fraction = entry.nan_fraction;
    return part;
}

std::vector<IfgPart> make_ifg_parts(const PrereadRegistry& registry, const PhaseCache& cache,
                                    const Tile& tile) {
    std::vector<IfgPart> parts;
    parts.reserve(registry.size());
    for (const auto& path : registry.paths) {
        parts.push_back(make_ifg_part(registry.at(path), cache, tile));
    }
    return parts;
}

} // namespace insar_rate::ifg
