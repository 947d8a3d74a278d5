#include "particle_sizer/core/events.hpp"
#include "particle_sizer/core/utils.hpp"

#include <utility>

namespace particle_sizer::core {

EventEmitter::EventEmitter(std::string run_id, std::ostream& out, std::ofstream* log_file)
    : run_id_(std::move(run_id)), out_(out), log_file_(log_file) {}

json EventEmitter::base_event(const std::string& type) const {
    return {
        {"type", type},
        {"run_id", run_id_},
        {"ts", get_iso_timestamp()}
    };
}

void EventEmitter::emit(const json& event) {
    const std::string line = event.dump();
    out_ << line << "\n";
    out_.flush();

    if (log_file_ && log_file_->is_open()) {
        (*log_file_) << line << "\n";
        log_file_->flush();
    }
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

void EventEmitter::phase_start(Phase phase, const json& extra) {
    json event = base_event("phase_start");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::phase_progress(Phase phase, float progress, const std::string& message) {
    json event = base_event("phase_progress");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["current"] = static_cast<int>(progress * 100);
    event["total"] = 100;
    event["progress"] = progress;
    event["substep"] = message;
    emit(event);
}

void EventEmitter::phase_end(Phase phase, const std::string& status, const json& extra) {
    json event = base_event("phase_end");
    event["phase"] = phase_to_int(phase);
    event["phase_name"] = phase_to_string(phase);
    event["status"] = status;
    for (auto& [key, value] : extra.items()) {
        event[key] = value;
    }
    emit(event);
}

void EventEmitter::warning(const std::string& message) {
    json event = base_event("warning");
    event["message"] = message;
    emit(event);
}

void EventEmitter::error(const std::string& message, Phase phase) {
    json event = base_event("error");
    event["message"] = message;
    if (phase != Phase::DONE) {
        event["phase"] = phase_to_int(phase);
        event["phase_name"] = phase_to_string(phase);
    }
    emit(event);
}

} // namespace particle_sizer::core
