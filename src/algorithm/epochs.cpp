#include "insar_rate/algorithm/epochs.hpp"
#include "insar_rate/core/errors.hpp"
#include "insar_rate/core/utils.hpp"

#include <algorithm>

namespace insar_rate::algorithm {

EpochList get_epochs(const std::vector<std::string>& masters,
                     const std::vector<std::string>& slaves) {
    if (masters.size() != slaves.size()) {
        throw ValidationError("master and slave epoch lists differ in length");
    }

    std::vector<std::string> all(masters);
    all.insert(all.end(), slaves.begin(), slaves.end());

    EpochList out;
    out.dates = all;
    std::sort(out.dates.begin(), out.dates.end());
    out.dates.erase(std::unique(out.dates.begin(), out.dates.end()), out.dates.end());

    out.repeat.reserve(out.dates.size());
    out.spans.reserve(out.dates.size());
    for (const auto& date : out.dates) {
        out.repeat.push_back(static_cast<int>(std::count(all.begin(), all.end(), date)));
        out.spans.push_back(core::years_between(out.dates.front(), date));
    }
    return out;
}

std::map<std::string, int> master_slave_ids(const std::vector<std::string>& dates) {
    std::vector<std::string> unique(dates);
    std::sort(unique.begin(), unique.end());
    unique.erase(std::unique(unique.begin(), unique.end()), unique.end());

    std::map<std::string, int> ids;
    for (size_t i = 0; i < unique.size(); ++i) {
        ids[unique[i]] = static_cast<int>(i);
    }
    return ids;
}

} // namespace insar_rate::algorithm
