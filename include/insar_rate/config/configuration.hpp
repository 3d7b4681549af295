#pragma once

#include <filesystem>
#include <string>
#include <yaml-cpp/yaml.h>

namespace insar_rate::config {

namespace fs = std::filesystem;

struct InputConfig {
  std::string ifg_dir;
  std::string ifg_list; // one path per line; overrides ifg_dir
  std::string pattern = "*.fits";
};

struct OutputConfig {
  std::string tmpdir = "tmp";
  std::string log_file = "insar_rate_events.jsonl";
};

struct IfgConfig {
  bool nan_conversion = true;
  double no_data_value = 0.0;
  double wavelength_m = 0.0562356424; // C-band, used when WAVELEN is absent
};

struct TilesConfig {
  int rows = 2;
  int cols = 2;
};

struct MstConfig {
  std::string backend = "kruskal"; // kruskal
};

struct RefPixelConfig {
  int refx = -1; // <= 0 triggers the search
  int refy = -1;
  int refnx = 5;
  int refny = 5;
  int chip_size = 21;
  double min_frac = 0.5;
};

struct OrbitalConfig {
  bool enabled = true;
  std::string method = "independent"; // independent | network
  std::string degree = "planar";      // planar | quadratic
  int looks = 1;
};

struct RefPhaseConfig {
  int method = 1; // 1: median over the common valid area, 2: chip at the reference pixel
  int chip_size = 21;
  double min_frac = 0.5;
};

struct CovarianceConfig {
  bool save_acg = true;
};

struct LinrateConfig {
  double nsig = 3.0;
  int pthresh = 3;
  double maxsig = 2.0;
};

struct TimeseriesConfig {
  bool enabled = true;
  int pthresh = 3;
};

struct Config {
  InputConfig input;
  OutputConfig output;
  IfgConfig ifg;
  TilesConfig tiles;
  MstConfig mst;
  RefPixelConfig refpixel;
  OrbitalConfig orbital;
  RefPhaseConfig refphase;
  CovarianceConfig covariance;
  LinrateConfig linrate;
  TimeseriesConfig timeseries;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

} // namespace insar_rate::config
