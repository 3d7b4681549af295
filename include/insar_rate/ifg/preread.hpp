#pragma once

#include "insar_rate/algorithm/epochs.hpp"
#include "insar_rate/config/configuration.hpp"
#include "insar_rate/ifg/interferogram.hpp"
#include "insar_rate/ifg/phase_cache.hpp"
#include "insar_rate/io/fits_io.hpp"
#include "insar_rate/parallel/context.hpp"

#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace insar_rate::ifg {

using json = nlohmann::json;

constexpr const char* kPrereadFile = "preread_ifgs.json";

// Snapshot of one interferogram taken after no-data and unit conversion
struct PrereadIfg {
    std::string path;
    double nan_fraction = 0.0;
    std::string master;
    std::string slave;
    double time_span = 0.0;
    int nrows = 0;
    int ncols = 0;
    io::FitsHeader metadata;
};

// Shared, read-only view of the whole stack. Identical on every rank.
struct PrereadRegistry {
    std::vector<std::string> paths; // canonical order
    std::map<std::string, PrereadIfg> ifgs;
    algorithm::EpochList epochlist;
    GeoTransform geotransform{};
    io::FitsHeader metadata; // header of the first interferogram
    std::string wkt;

    const PrereadIfg& at(const std::string& path) const;
    // Entries in canonical order
    std::vector<PrereadIfg> ordered() const;
    size_t size() const { return paths.size(); }
};

json header_to_json(const io::FitsHeader& header);
io::FitsHeader header_from_json(const json& j);

json preread_to_json(const PrereadIfg& p);
PrereadIfg preread_from_json(const json& j);

json registry_to_json(const PrereadRegistry& registry);
PrereadRegistry registry_from_json(const json& j);

// Opens and converts every interferogram of this rank's shard, stores its
// phase in the cache and returns the registry published by the leader to
// <tmpdir>/preread_ifgs.json.
PrereadRegistry build_preread_registry(parallel::ExecutionContext& ctx,
                                       const std::vector<fs::path>& paths,
                                       const config::Config& cfg, PhaseCache& cache);

} // namespace insar_rate::ifg
