#pragma once

#include <map>
#include <string>
#include <vector>

namespace insar_rate::algorithm {

// Acquisition epochs of a stack of interferograms
struct EpochList {
    std::vector<std::string> dates; // sorted, unique, YYYY-MM-DD
    std::vector<int> repeat;        // interferograms touching each date
    std::vector<double> spans;      // years since the first date
};

// masters[i] and slaves[i] are the epochs of interferogram i
EpochList get_epochs(const std::vector<std::string>& masters,
                     const std::vector<std::string>& slaves);

// Dense id per date over the sorted unique union of all dates
std::map<std::string, int> master_slave_ids(const std::vector<std::string>& dates);

} // namespace insar_rate::algorithm
