#pragma once

#include <Eigen/Dense>
#include <filesystem>
#include <string>
#include <vector>

namespace insar_rate {

namespace fs = std::filesystem;

// Matrix types (row-major, raster scan order)
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Matrix2Dd = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using VectorXf = Eigen::VectorXf;
using VectorXd = Eigen::VectorXd;
using VectorXi = Eigen::VectorXi;

// Stack of equally sized planes, e.g. one plane per interferogram or epoch
using Cube = std::vector<Matrix2Df>;

// Rectangular raster region, half-open on both axes
struct Tile {
    int index = 0;
    int row_start = 0;
    int row_end = 0;
    int col_start = 0;
    int col_end = 0;

    int rows() const { return row_end - row_start; }
    int cols() const { return col_end - col_start; }
};

inline bool operator==(const Tile& a, const Tile& b) {
    return a.index == b.index && a.row_start == b.row_start && a.row_end == b.row_end &&
           a.col_start == b.col_start && a.col_end == b.col_end;
}

// Pixel position; x is the column, y the row
struct PixelCoord {
    int x = -1;
    int y = -1;
};

inline bool operator==(const PixelCoord& a, const PixelCoord& b) {
    return a.x == b.x && a.y == b.y;
}

// Pipeline stage enumeration
enum class Stage {
    TILES = 0,
    PREREAD = 1,
    MST = 2,
    REF_PIXEL = 3,
    ORBITAL = 4,
    REF_PHASE = 5,
    COVARIANCE = 6,
    VCM = 7,
    PHASE_CACHE = 8,
    TIMESERIES = 9,
    LINRATE = 10,
    DONE = 11
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::TILES: return "TILES";
        case Stage::PREREAD: return "PREREAD";
        case Stage::MST: return "MST";
        case Stage::REF_PIXEL: return "REF_PIXEL";
        case Stage::ORBITAL: return "ORBITAL";
        case Stage::REF_PHASE: return "REF_PHASE";
        case Stage::COVARIANCE: return "COVARIANCE";
        case Stage::VCM: return "VCM";
        case Stage::PHASE_CACHE: return "PHASE_CACHE";
        case Stage::TIMESERIES: return "TIMESERIES";
        case Stage::LINRATE: return "LINRATE";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace insar_rate
