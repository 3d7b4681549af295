#include "insar_rate/config/configuration.hpp"
#include "insar_rate/core/errors.hpp"

#include <fstream>

namespace insar_rate::config {

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["input"]) {
        auto i = node["input"];
        if (i["ifg_dir"]) cfg.input.ifg_dir = i["ifg_dir"].as<std::string>();
        if (i["ifg_list"]) cfg.input.ifg_list = i["ifg_list"].as<std::string>();
        if (i["pattern"]) cfg.input.pattern = i["pattern"].as<std::string>();
    }

    if (node["output"]) {
        auto o = node["output"];
        if (o["tmpdir"]) cfg.output.tmpdir = o["tmpdir"].as<std::string>();
        if (o["log_file"]) cfg.output.log_file = o["log_file"].as<std::string>();
    }

    if (node["ifg"]) {
        auto f = node["ifg"];
        if (f["nan_conversion"]) cfg.ifg.nan_conversion = f["nan_conversion"].as<bool>();
        if (f["no_data_value"]) cfg.ifg.no_data_value = f["no_data_value"].as<double>();
        if (f["wavelength_m"]) cfg.ifg.wavelength_m = f["wavelength_m"].as<double>();
    }

    if (node["tiles"]) {
        auto t = node["tiles"];
        if (t["rows"]) cfg.tiles.rows = t["rows"].as<int>();
        if (t["cols"]) cfg.tiles.cols = t["cols"].as<int>();
    }

    if (node["mst"]) {
        auto m = node["mst"];
        if (m["backend"]) cfg.mst.backend = m["backend"].as<std::string>();
    }

    if (node["refpixel"]) {
        auto r = node["refpixel"];
        if (r["refx"]) cfg.refpixel.refx = r["refx"].as<int>();
        if (r["refy"]) cfg.refpixel.refy = r["refy"].as<int>();
        if (r["refnx"]) cfg.refpixel.refnx = r["refnx"].as<int>();
        if (r["refny"]) cfg.refpixel.refny = r["refny"].as<int>();
        if (r["chip_size"]) cfg.refpixel.chip_size = r["chip_size"].as<int>();
        if (r["min_frac"]) cfg.refpixel.min_frac = r["min_frac"].as<double>();
    }

    if (node["orbital"]) {
        auto o = node["orbital"];
        if (o["enabled"]) cfg.orbital.enabled = o["enabled"].as<bool>();
        if (o["method"]) cfg.orbital.method = o["method"].as<std::string>();
        if (o["degree"]) cfg.orbital.degree = o["degree"].as<std::string>();
        if (o["looks"]) cfg.orbital.looks = o["looks"].as<int>();
    }

    if (node["refphase"]) {
        auto r = node["refphase"];
        if (r["method"]) cfg.refphase.method = r["method"].as<int>();
        if (r["chip_size"]) cfg.refphase.chip_size = r["chip_size"].as<int>();
        if (r["min_frac"]) cfg.refphase.min_frac = r["min_frac"].as<double>();
    }

    if (node["covariance"]) {
        auto c = node["covariance"];
        if (c["save_acg"]) cfg.covariance.save_acg = c["save_acg"].as<bool>();
    }

    if (node["linrate"]) {
        auto l = node["linrate"];
        if (l["nsig"]) cfg.linrate.nsig = l["nsig"].as<double>();
        if (l["pthresh"]) cfg.linrate.pthresh = l["pthresh"].as<int>();
        if (l["maxsig"]) cfg.linrate.maxsig = l["maxsig"].as<double>();
    }

    if (node["timeseries"]) {
        auto t = node["timeseries"];
        if (t["enabled"]) cfg.timeseries.enabled = t["enabled"].as<bool>();
        if (t["pthresh"]) cfg.timeseries.pthresh = t["pthresh"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["input"]["ifg_dir"] = input.ifg_dir;
    node["input"]["ifg_list"] = input.ifg_list;
    node["input"]["pattern"] = input.pattern;

    node["output"]["tmpdir"] = output.tmpdir;
    node["output"]["log_file"] = output.log_file;

    node["ifg"]["nan_conversion"] = ifg.nan_conversion;
    node["ifg"]["no_data_value"] = ifg.no_data_value;
    node["ifg"]["wavelength_m"] = ifg.wavelength_m;

    node["tiles"]["rows"] = tiles.rows;
    node["tiles"]["cols"] = tiles.cols;

    node["mst"]["backend"] = mst.backend;

    node["refpixel"]["refx"] = refpixel.refx;
    node["refpixel"]["refy"] = refpixel.refy;
    node["refpixel"]["refnx"] = refpixel.refnx;
    node["refpixel"]["refny"] = refpixel.refny;
    node["refpixel"]["chip_size"] = refpixel.chip_size;
    node["refpixel"]["min_frac"] = refpixel.min_frac;

    node["orbital"]["enabled"] = orbital.enabled;
    node["orbital"]["method"] = orbital.method;
    node["orbital"]["degree"] = orbital.degree;
    node["orbital"]["looks"] = orbital.looks;

    node["refphase"]["method"] = refphase.method;
    node["refphase"]["chip_size"] = refphase.chip_size;
    node["refphase"]["min_frac"] = refphase.min_frac;

    node["covariance"]["save_acg"] = covariance.save_acg;

    node["linrate"]["nsig"] = linrate.nsig;
    node["linrate"]["pthresh"] = linrate.pthresh;
    node["linrate"]["maxsig"] = linrate.maxsig;

    node["timeseries"]["enabled"] = timeseries.enabled;
    node["timeseries"]["pthresh"] = timeseries.pthresh;

    return node;
}

void Config::validate() const {
    if (output.tmpdir.empty()) {
        throw ValidationError("output.tmpdir must not be empty");
    }

    if (ifg.wavelength_m <= 0.0) {
        throw ValidationError("ifg.wavelength_m must be > 0");
    }

    if (tiles.rows < 1 || tiles.cols < 1) {
        throw ValidationError("tiles.rows and tiles.cols must be >= 1");
    }

    if (refpixel.refnx < 1 || refpixel.refny < 1) {
        throw ValidationError("refpixel.refnx and refpixel.refny must be >= 1");
    }
    if (refpixel.chip_size < 3) {
        throw ValidationError("refpixel.chip_size must be >= 3");
    }
    if (refpixel.min_frac < 0.0 || refpixel.min_frac > 1.0) {
        throw ValidationError("refpixel.min_frac must be in [0,1]");
    }

    if (orbital.looks < 1) {
        throw ValidationError("orbital.looks must be >= 1");
    }
    if (orbital.degree != "planar" && orbital.degree != "quadratic") {
        throw ValidationError("orbital.degree must be 'planar' or 'quadratic'");
    }

    if (refphase.chip_size < 3) {
        throw ValidationError("refphase.chip_size must be >= 3");
    }
    if (refphase.min_frac < 0.0 || refphase.min_frac > 1.0) {
        throw ValidationError("refphase.min_frac must be in [0,1]");
    }

    if (linrate.nsig <= 0.0) {
        throw ValidationError("linrate.nsig must be > 0");
    }
    if (linrate.pthresh < 1) {
        throw ValidationError("linrate.pthresh must be >= 1");
    }
    if (linrate.maxsig <= 0.0) {
        throw ValidationError("linrate.maxsig must be > 0");
    }

    if (timeseries.pthresh < 1) {
        throw ValidationError("timeseries.pthresh must be >= 1");
    }
}

} // namespace insar_rate::config
