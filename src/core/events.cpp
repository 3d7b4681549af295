#include "insar_rate/core/events.hpp"
#include "insar_rate/core/utils.hpp"

#include <utility>

namespace insar_rate::core {

EventEmitter::EventEmitter(std::string run_id, int rank, std::ostream* out)
    : run_id_(std::move(run_id)), rank_(rank), out_(out) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"rank", rank_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    if (!out_) {
        return;
    }
    (*out_) << event.dump() << "\n";
    out_->flush();
}

void EventEmitter::run_start(const json& extra) {
    json event = base_event("run_start");
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::run_end(bool success, const std::string& status) {
    json event = base_event("run_end");
    event["success"] = success;
    event["status"] = status;
    emit(event);
}

void EventEmitter::phase_start(Stage stage) {
    json event = base_event("phase_start");
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    emit(event);
}

void EventEmitter::phase_progress(Stage stage, int current, int total,
                                  const std::string& message) {
    json event = base_event("phase_progress");
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    event["current"] = current;
    event["total"] = total;
    event["progress"] = total > 0 ? static_cast<double>(current) / total : 1.0;
    event["substep"] = message;
    emit(event);
}

void EventEmitter::phase_end(Stage stage, const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = stage_to_int(stage);
    event["phase_name"] = stage_to_string(stage);
    event["status"] = status;
    if (extra.is_object()) {
        for (auto& [key, value] : extra.items()) {
            event[key] = value;
        }
    }
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message) {
    json event = base_event("error");
    event["message"] = message;
    emit(event);
}

} // namespace insar_rate::core
