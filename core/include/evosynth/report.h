#pragma once

#include "evosynth/fitness.h"

#include <ostream>
#include <string>
#include <vector>

namespace evosynth {

struct TaskReport {
    std::string task;
    double fitness{0.0};
    CandidateMeta meta;
    std::string code;
};

using RunReport = std::vector<TaskReport>;

// "[name] gen 001 | best 9.512 | pass 5/5 | dur 0.0001s"
std::string format_progress_line(const std::string& task, int gen, double fitness, const CandidateMeta& meta);

// The "=== BEST PROGRAMS BY TASK ===" section: per task a header line,
// fitness/pass/duration, then the program indented by four spaces.
void print_report(std::ostream& os, const RunReport& report);

// Report as JSON (json-c), logged with the run_end event: [{"task","fitness","passed","total","duration_s","error","code"}].
std::string report_to_json(const RunReport& report);

} // namespace evosynth
