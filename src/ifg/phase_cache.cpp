#include "insar_rate/ifg/phase_cache.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"

#include <cerrno>
#include <cstring>
#include <system_error>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace insar_rate::ifg {

namespace {

// Read-only mapping of a whole cache entry, unmapped on scope exit
class MappedEntry {
public:
    MappedEntry(const fs::path& path, size_t bytes) : bytes_(bytes) {
        int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0) {
            throw IOError("Cannot open phase cache entry " + path.string() + ": " +
                          std::strerror(errno));
        }
        struct stat st;
        if (::fstat(fd, &st) != 0 || static_cast<size_t>(st.st_size) != bytes_) {
            ::close(fd);
            throw IOError("Phase cache entry has unexpected size: " + path.string());
        }
        ptr_ = ::mmap(nullptr, bytes_, PROT_READ, MAP_PRIVATE, fd, 0);
        ::close(fd);
        if (ptr_ == MAP_FAILED) {
            throw IOError("Cannot map phase cache entry " + path.string() + ": " +
                          std::strerror(errno));
        }
    }
    ~MappedEntry() { ::munmap(ptr_, bytes_); }

    MappedEntry(const MappedEntry&) = delete;
    MappedEntry& operator=(const MappedEntry&) = delete;

    const float* data() const { return static_cast<const float*>(ptr_); }

private:
    void* ptr_ = nullptr;
    size_t bytes_ = 0;
};

} // namespace

PhaseCache::PhaseCache(const fs::path& cache_dir, int rows, int cols)
    : cache_dir_(cache_dir), rows_(rows), cols_(cols),
      entry_bytes_(static_cast<size_t>(rows) * static_cast<size_t>(cols) * sizeof(float)) {
    // Every rank may get here at once
    std::error_code ec;
    fs::create_directories(cache_dir_, ec);
    if (!fs::is_directory(cache_dir_)) {
        throw IOError("Cannot create phase cache directory " + cache_dir_.string() + ": " +
                      ec.message());
    }
}

void PhaseCache::store(const std::string& key, const Matrix2Df& phase) {
    if (phase.rows() != rows_ || phase.cols() != cols_) {
        throw IOError("Phase for " + key + " is " + std::to_string(phase.rows()) + "x" +
                      std::to_string(phase.cols()) + ", cache holds " + std::to_string(rows_) +
                      "x" + std::to_string(cols_));
    }

    // Readers map the final name only
    core::write_atomically(entry_path(key), reinterpret_cast<const char*>(phase.data()),
                           entry_bytes_);
}

Matrix2Df PhaseCache::load(const std::string& key) const {
    MappedEntry entry(entry_path(key), entry_bytes_);
    Matrix2Df out(rows_, cols_);
    std::memcpy(out.data(), entry.data(), entry_bytes_);
    return out;
}

Matrix2Df PhaseCache::extract_tile(const std::string& key, const Tile& t) const {
    if (t.row_start < 0 || t.col_start < 0 || t.row_end > rows_ || t.col_end > cols_ ||
        t.rows() <= 0 || t.cols() <= 0) {
        throw IOError("Tile " + std::to_string(t.index) + " outside cached raster");
    }

    MappedEntry entry(entry_path(key), entry_bytes_);
    const float* src = entry.data();

    Matrix2Df tile(t.rows(), t.cols());
    for (int r = 0; r < t.rows(); ++r) {
        const float* row_src = src + static_cast<size_t>(t.row_start + r) *
                                         static_cast<size_t>(cols_) +
                               static_cast<size_t>(t.col_start);
        float* row_dst = tile.data() + static_cast<size_t>(r) * static_cast<size_t>(t.cols());
        std::memcpy(row_dst, row_src, static_cast<size_t>(t.cols()) * sizeof(float));
    }
    return tile;
}

void PhaseCache::cleanup() {
    if (!cache_dir_.empty() && fs::exists(cache_dir_)) {
        std::error_code ec;
        fs::remove_all(cache_dir_, ec);
        if (ec) {
            throw IOError("Cannot remove phase cache " + cache_dir_.string() + ": " +
                          ec.message());
        }
    }
}

fs::path PhaseCache::entry_path(const std::string& key) const {
    return cache_dir_ / (key + ".raw");
}

} // namespace insar_rate::ifg
