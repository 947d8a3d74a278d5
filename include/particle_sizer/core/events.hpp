#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <ostream>
#include <string>

namespace particle_sizer::core {

using json = nlohmann::json;

/**
 * JSON-lines event log for pipeline runs.
 * Every event goes to `out` and, when given, to the run's log file.
 */
class EventEmitter {
public:
    EventEmitter(std::string run_id, std::ostream& out, std::ofstream* log_file = nullptr);

    void run_start(const json& extra);
    void run_end(bool success, const std::string& status);

    void phase_start(Phase phase, const json& extra = json::object());
    void phase_progress(Phase phase, float progress, const std::string& message);
    void phase_end(Phase phase, const std::string& status, const json& extra = json::object());

    void warning(const std::string& message);
    void error(const std::string& message, Phase phase = Phase::DONE);

    const std::string& run_id() const { return run_id_; }

private:
    void emit(const json& event);
    json base_event(const std::string& type) const;

    std::string run_id_;
    std::ostream& out_;
    std::ofstream* log_file_;
};

} // namespace particle_sizer::core
