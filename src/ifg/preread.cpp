#include "insar_rate/ifg/preread.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"
#include "insar_rate/parallel/collectives.hpp"

#include <set>

namespace insar_rate::ifg {

const PrereadIfg& PrereadRegistry::at(const std::string& path) const {
    auto it = ifgs.find(path);
    if (it == ifgs.end()) {
        throw PipelineError("Interferogram not in registry: " + path);
    }
    return it->second;
}

std::vector<PrereadIfg> PrereadRegistry::ordered() const {
    std::vector<PrereadIfg> out;
    out.reserve(paths.size());
    for (const auto& p : paths) {
        out.push_back(at(p));
    }
    return out;
}

json header_to_json(const io::FitsHeader& header) {
    return {
        {"strings", header.string_values},
        {"numbers", header.numeric_values},
        {"ints", header.int_values},
        {"bools", header.bool_values}
    };
}

io::FitsHeader header_from_json(const json& j) {
    io::FitsHeader header;
    header.string_values = j.at("strings").get<std::map<std::string, std::string>>();
    header.numeric_values = j.at("numbers").get<std::map<std::string, double>>();
    header.int_values = j.at("ints").get<std::map<std::string, int>>();
    header.bool_values = j.at("bools").get<std::map<std::string, bool>>();
    return header;
}

json preread_to_json(const PrereadIfg& p) {
    return {
        {"path", p.path},
        {"nan_fraction", p.nan_fraction},
        {"master", p.master},
        {"slave", p.slave},
        {"time_span", p.time_span},
        {"nrows", p.nrows},
        {"ncols", p.ncols},
        {"metadata", header_to_json(p.metadata)}
    };
}

PrereadIfg preread_from_json(const json& j) {
    PrereadIfg p;
    p.path = j.at("path").get<std::string>();
    p.nan_fraction = j.at("nan_fraction").get<double>();
    p.master = j.at("master").get<std::string>();
    p.slave = j.at("slave").get<std::string>();
    p.time_span = j.at("time_span").get<double>();
    p.nrows = j.at("nrows").get<int>();
    p.ncols = j.at("ncols").get<int>();
    p.metadata = header_from_json(j.at("metadata"));
    return p;
}

json registry_to_json(const PrereadRegistry& registry) {
    json ifgs = json::array();
    for (const auto& path : registry.paths) {
        ifgs.push_back(preread_to_json(registry.at(path)));
    }
    return {
        {"ifgs", ifgs},
        {"epochlist", {
            {"dates", registry.epochlist.dates},
            {"repeat", registry.epochlist.repeat},
            {"spans", registry.epochlist.spans}
        }},
        {"gt", registry.geotransform},
        {"md", header_to_json(registry.metadata)},
        {"wkt", registry.wkt}
    };
}

PrereadRegistry registry_from_json(const json& j) {
    PrereadRegistry registry;
    try {
        for (const auto& entry : j.at("ifgs")) {
            PrereadIfg p = preread_from_json(entry);
            registry.paths.push_back(p.path);
            registry.ifgs[p.path] = std::move(p);
        }
        const json& epochs = j.at("epochlist");
        registry.epochlist.dates = epochs.at("dates").get<std::vector<std::string>>();
        registry.epochlist.repeat = epochs.at("repeat").get<std::vector<int>>();
        registry.epochlist.spans = epochs.at("spans").get<std::vector<double>>();
        registry.geotransform = j.at("gt").get<GeoTransform>();
        registry.metadata = header_from_json(j.at("md"));
        registry.wkt = j.at("wkt").get<std::string>();
    } catch (const json::exception& e) {
        throw PipelineError(std::string("Malformed preread registry: ") + e.what());
    }
    return registry;
}

namespace {

GeoTransform geotransform_of(const io::FitsHeader& md) {
    auto number = [&](const char* key) {
        auto v = md.get_number(key);
        if (!v) {
            throw FitsError(std::string("Missing ") + key + " keyword in first interferogram");
        }
        return *v;
    };
    return {number(keys::kXFirst), number(keys::kXStep), 0.0,
            number(keys::kYFirst), 0.0, number(keys::kYStep)};
}

} // namespace

PrereadRegistry build_preread_registry(parallel::ExecutionContext& ctx,
                                       const std::vector<fs::path>& paths,
                                       const config::Config& cfg, PhaseCache& cache) {
    if (paths.empty()) {
        throw ValidationError("No interferograms to process");
    }

    std::set<std::string> stems;
    for (const auto& p : paths) {
        if (!stems.insert(core::file_stem(p)).second) {
            throw ValidationError("Duplicate interferogram basename: " + core::file_stem(p));
        }
    }

    json local = json::object();
    for (const auto& path : parallel::split(paths, ctx)) {
        Interferogram ifg(path);
        ifg.open(true);
        nan_and_mm_convert(ifg, cfg);
        cache.store(ifg.basename(), ifg.phase_data());

        PrereadIfg p;
        p.path = path.string();
        p.nan_fraction = ifg.nan_fraction();
        p.master = ifg.master();
        p.slave = ifg.slave();
        p.time_span = ifg.time_span();
        p.nrows = ifg.nrows();
        p.ncols = ifg.ncols();
        p.metadata = ifg.metadata();
        local[p.path] = preread_to_json(p);
        ifg.close();
    }

    const std::vector<json> parts = parallel::allgather_values<json>(ctx, local);

    auto produce = [&]() {
        PrereadRegistry registry;
        for (const auto& part : parts) {
            for (const auto& [path, entry] : part.items()) {
                registry.ifgs[path] = preread_from_json(entry);
            }
        }

        std::vector<std::string> masters;
        std::vector<std::string> slaves;
        for (const auto& p : paths) {
            const PrereadIfg& entry = registry.at(p.string());
            if (entry.nrows != registry.at(paths.front().string()).nrows ||
                entry.ncols != registry.at(paths.front().string()).ncols) {
                throw ValidationError("Interferogram " + p.string() +
                                      " differs in shape from the first one");
            }
            registry.paths.push_back(p.string());
            masters.push_back(entry.master);
            slaves.push_back(entry.slave);
        }

        const PrereadIfg& first = registry.at(registry.paths.front());
        registry.epochlist = algorithm::get_epochs(masters, slaves);
        registry.metadata = first.metadata;
        registry.geotransform = geotransform_of(first.metadata);
        registry.wkt = first.metadata.get_string(keys::kWkt).value_or("");

        return registry_to_json(registry).dump(2);
    };

    const std::string text =
        parallel::publish(ctx, fs::path(cfg.output.tmpdir) / kPrereadFile, produce);
    return registry_from_json(json::parse(text));
}

} // namespace insar_rate::ifg
