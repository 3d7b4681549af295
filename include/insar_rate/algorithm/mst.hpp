#pragma once

#include "insar_rate/core/types.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace insar_rate::algorithm {

// Interferogram as a graph edge between two epoch ids
struct EpochEdge {
    int master = 0;
    int slave = 0;
};

// Edge indices by ascending weight, ties broken by edge index
std::vector<size_t> edge_order(const std::vector<double>& weights);

// Minimum spanning forest of the edges flagged in `usable`, visiting edges
// in `order`. Returns a 0/1 flag per edge.
std::vector<uint8_t> kruskal(const std::vector<EpochEdge>& edges,
                             const std::vector<size_t>& order,
                             const std::vector<uint8_t>& usable, int n_epochs);

// Per-pixel MST over a tile. phases[i] is the tile of interferogram i; a
// pixel is usable in i when its phase is finite. Returns one plane per
// interferogram with 1 where the interferogram is selected.
Cube mst_selection(const std::vector<Matrix2Df>& phases, const std::vector<EpochEdge>& edges,
                   const std::vector<double>& weights, int n_epochs);

// Raises ConfigError for anything but the Kruskal backend
void check_mst_backend(const std::string& backend);

} // namespace insar_rate::algorithm
