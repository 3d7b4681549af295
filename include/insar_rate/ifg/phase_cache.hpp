#pragma once

#include "insar_rate/core/types.hpp"

#include <string>

namespace insar_rate::ifg {

// Disk-backed store of converted phase rasters, one raw float32 file per
// interferogram keyed by its basename. Any rank can write the entries it owns
// and read every entry; tiles are extracted through mmap without loading the
// full raster.
class PhaseCache {
public:
    PhaseCache() = default;
    PhaseCache(const fs::path& cache_dir, int rows, int cols);

    void store(const std::string& key, const Matrix2Df& phase);
    Matrix2Df load(const std::string& key) const;
    Matrix2Df extract_tile(const std::string& key, const Tile& t) const;

    int rows() const { return rows_; }
    int cols() const { return cols_; }
    const fs::path& dir() const { return cache_dir_; }

    // Removes the cache directory; call on one rank only, once no rank reads
    void cleanup();

private:
    fs::path entry_path(const std::string& key) const;

    fs::path cache_dir_;
    int rows_ = 0;
    int cols_ = 0;
    size_t entry_bytes_ = 0;
};

} // namespace insar_rate::ifg
