#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace insar_rate::core {

using json = nlohmann::json;

// Structured progress log: one JSON object per line.
class EventEmitter {
public:
    EventEmitter() = default;
    EventEmitter(std::string run_id, int rank, std::ostream* out);

    const std::string& run_id() const { return run_id_; }
    int rank() const { return rank_; }

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status);

    void phase_start(Stage stage);
    void phase_progress(Stage stage, int current, int total, const std::string& message);
    void phase_end(Stage stage, const std::string& status, const json& extra = json::object());

    void warning(const std::string& message);
    void error(const std::string& message);

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    int rank_ = 0;
    std::ostream* out_ = nullptr;
};

} // namespace insar_rate::core
