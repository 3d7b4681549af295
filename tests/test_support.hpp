#pragma once

#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/types.hpp"
#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/io/fits_io.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace insar_rate::test {

namespace fs = std::filesystem;

// Unique scratch directory removed at scope exit
class TempDir {
public:
    explicit TempDir(const std::string& name) {
        static std::atomic<int> counter{0};
        const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path_ = fs::temp_directory_path() /
                ("insar_rate_" + name + "_" + std::to_string(stamp) + "_" +
                 std::to_string(counter++));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

// Roughly 90 m pixels at 34 degrees south
inline io::FitsHeader ifg_header(const std::string& master, const std::string& slave) {
    io::FitsHeader h;
    h.set(ifg::keys::kMaster, master);
    h.set(ifg::keys::kSlave, slave);
    h.set(ifg::keys::kXFirst, 150.0);
    h.set(ifg::keys::kYFirst, -34.0);
    h.set(ifg::keys::kXStep, 0.000833333);
    h.set(ifg::keys::kYStep, -0.000833333);
    h.set(ifg::keys::kWavelength, 0.0562356424);
    h.set(ifg::keys::kDataUnit, ifg::kUnitRadians);
    return h;
}

inline fs::path write_ifg(const fs::path& dir, const std::string& master, const std::string& slave,
                          const Matrix2Df& phase) {
    const fs::path path = dir / (master + "-" + slave + "_unw.fits");
    io::write_fits_float(path, phase, ifg_header(master, slave));
    return path;
}

inline config::Config test_config(const fs::path& tmpdir) {
    config::Config cfg;
    cfg.output.tmpdir = tmpdir.string();
    cfg.refpixel.refnx = 3;
    cfg.refpixel.refny = 3;
    cfg.refpixel.chip_size = 5;
    cfg.refphase.chip_size = 5;
    cfg.linrate.maxsig = 1000.0;
    return cfg;
}

// Interferogram pairs of a small connected network over five epochs
struct SyntheticStack {
    std::vector<std::string> epochs{"2020-01-01", "2020-03-01", "2020-05-01", "2020-07-01",
                                    "2020-09-01"};
    std::vector<std::pair<int, int>> pairs{{0, 1}, {0, 2}, {1, 2}, {1, 3}, {2, 3}, {2, 4}, {3, 4}};
    int rows = 24;
    int cols = 20;
};

// Writes the stack to `dir`: per-pixel deformation linear in time, a planar
// ramp per interferogram, a constant offset and seeded noise, all in radians.
// Pixels listed in `holes` are set to the no-data value 0.
inline std::vector<fs::path> write_synthetic_stack(const fs::path& dir, const SyntheticStack& s,
                                                   unsigned seed = 7) {
    std::mt19937 rng(seed);
    std::normal_distribution<float> noise(0.0f, 0.3f);

    std::vector<fs::path> paths;
    for (size_t k = 0; k < s.pairs.size(); ++k) {
        const auto& [m, sl] = s.pairs[k];
        const double years = (sl - m) * (2.0 / 12.0);
        Matrix2Df phase(s.rows, s.cols);
        for (int r = 0; r < s.rows; ++r) {
            for (int c = 0; c < s.cols; ++c) {
                const double velocity = 2.0 + 0.05 * c;
                const double ramp = 0.02 * (k + 1) * c - 0.01 * r;
                phase(r, c) = static_cast<float>(velocity * years + ramp + 1.5 + noise(rng));
            }
        }
        phase(0, 0) = 0.0f;
        phase(s.rows - 1, s.cols - 1) = 0.0f;
        paths.push_back(write_ifg(dir, s.epochs[static_cast<size_t>(m)],
                                  s.epochs[static_cast<size_t>(sl)], phase));
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace insar_rate::test
