#include "insar_rate/algorithm/mst.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace insar_rate::algorithm {

namespace {

class DisjointSet {
public:
    explicit DisjointSet(int n) : parent_(static_cast<size_t>(n)) {
        std::iota(parent_.begin(), parent_.end(), 0);
    }

    int find(int x) {
        while (parent_[static_cast<size_t>(x)] != x) {
            parent_[static_cast<size_t>(x)] =
                parent_[static_cast<size_t>(parent_[static_cast<size_t>(x)])];
            x = parent_[static_cast<size_t>(x)];
        }
        return x;
    }

    bool unite(int a, int b) {
        a = find(a);
        b = find(b);
        if (a == b) return false;
        parent_[static_cast<size_t>(std::max(a, b))] = std::min(a, b);
        return true;
    }

private:
    std::vector<int> parent_;
};

void validate_edges(const std::vector<EpochEdge>& edges, const std::vector<double>& weights,
                    int n_epochs) {
    if (edges.size() != weights.size()) {
        throw ValidationError("MST edges and weights differ in length");
    }
    for (const auto& e : edges) {
        if (e.master < 0 || e.slave < 0 || e.master >= n_epochs || e.slave >= n_epochs) {
            throw ValidationError("MST edge refers to an unknown epoch");
        }
    }
}

} // namespace

std::vector<size_t> edge_order(const std::vector<double>& weights) {
    std::vector<size_t> order(weights.size());
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](size_t a, size_t b) { return weights[a] < weights[b]; });
    return order;
}

std::vector<uint8_t> kruskal(const std::vector<EpochEdge>& edges,
                             const std::vector<size_t>& order,
                             const std::vector<uint8_t>& usable, int n_epochs) {
    if (order.size() != edges.size() || usable.size() != edges.size()) {
        throw ValidationError("MST order, usable mask and edges differ in length");
    }

    std::vector<uint8_t> selected(edges.size(), 0);
    DisjointSet sets(n_epochs);
    for (size_t i : order) {
        if (i >= edges.size()) {
            throw ValidationError("MST order refers to an unknown edge");
        }
        const EpochEdge& e = edges[i];
        if (e.master < 0 || e.slave < 0 || e.master >= n_epochs || e.slave >= n_epochs) {
            throw ValidationError("MST edge refers to an unknown epoch");
        }
        if (usable[i] && sets.unite(e.master, e.slave)) {
            selected[i] = 1;
        }
    }
    return selected;
}

Cube mst_selection(const std::vector<Matrix2Df>& phases, const std::vector<EpochEdge>& edges,
                   const std::vector<double>& weights, int n_epochs) {
    validate_edges(edges, weights, n_epochs);
    if (phases.size() != edges.size()) {
        throw ValidationError("MST needs one phase tile per interferogram");
    }

    Cube out;
    if (phases.empty()) {
        return out;
    }
    const Eigen::Index rows = phases.front().rows();
    const Eigen::Index cols = phases.front().cols();
    for (const auto& p : phases) {
        if (p.rows() != rows || p.cols() != cols) {
            throw ValidationError("MST phase tiles differ in shape");
        }
        out.push_back(Matrix2Df::Zero(rows, cols));
    }

    // Sort once; per pixel only the usable set changes
    const std::vector<size_t> order = edge_order(weights);
    std::vector<uint8_t> usable(edges.size());
    for (Eigen::Index r = 0; r < rows; ++r) {
        for (Eigen::Index c = 0; c < cols; ++c) {
            for (size_t i = 0; i < phases.size(); ++i) {
                usable[i] = std::isfinite(phases[i](r, c)) ? 1 : 0;
            }
            const std::vector<uint8_t> selected = kruskal(edges, order, usable, n_epochs);
            for (size_t i = 0; i < selected.size(); ++i) {
                out[i](r, c) = static_cast<float>(selected[i]);
            }
        }
    }
    return out;
}

void check_mst_backend(const std::string& backend) {
    const std::string b = core::to_lower(backend);
    if (b == "kruskal") {
        return;
    }
    if (b == "matlab") {
        throw ConfigError("Matlab MST not supported");
    }
    throw ConfigError("Only Kruskal MST is supported");
}

} // namespace insar_rate::algorithm
