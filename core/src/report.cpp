#include "evosynth/report.h"
#include "evosynth/program.h"
#include "evosynth/serialization.h"

#include <iomanip>
#include <sstream>

namespace evosynth {

static std::string pass_ratio(const CandidateMeta& meta) {
    if (meta.has_error || !meta.evaluated) return "?/?";
    return std::to_string(meta.passed) + "/" + std::to_string(meta.total);
}

static std::string strip(const std::string& s) {
    const char* ws = " \t\n\r\f\v";
    size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

std::string format_progress_line(const std::string& task, int gen, double fitness, const CandidateMeta& meta) {
    std::ostringstream oss;
    oss << "[" << task << "] gen " << std::setw(3) << std::setfill('0') << gen << std::setfill(' ')
        << " | best " << std::fixed << std::setprecision(3) << fitness
        << " | pass " << pass_ratio(meta)
        << " | dur " << std::setprecision(4) << meta.duration_s << "s";
    return oss.str();
}

void print_report(std::ostream& os, const RunReport& report) {
    os << "\n=== BEST PROGRAMS BY TASK ===\n";
    for (const auto& r : report) {
        std::ostringstream head;
        head << std::fixed << std::setprecision(3) << "fitness=" << r.fitness
             << " | passed=" << pass_ratio(r.meta)
             << " | dur=" << std::setprecision(5) << r.meta.duration_s << "s";
        os << "\n--- " << r.task << " ---\n" << head.str() << "\n\n";
        for (const auto& ln : split_lines(strip(r.code))) {
            // textwrap.indent semantics: whitespace-only lines stay bare
            if (strip(ln).empty()) os << ln << "\n";
            else os << "    " << ln << "\n";
        }
    }
}

std::string report_to_json(const RunReport& report) {
    json_object* arr = json_object_new_array();
    JsonGuard guard(arr);
    for (const auto& r : report) {
        json_object* o = json_object_new_object();
        json_object_array_add(arr, o);
        json_object_object_add(o, "task", json_object_new_string(r.task.c_str()));
        json_object_object_add(o, "fitness", json_object_new_double(r.fitness));
        json_object_object_add(o, "passed", json_object_new_int(r.meta.passed));
        json_object_object_add(o, "total", json_object_new_int(r.meta.total));
        json_object_object_add(o, "duration_s", json_object_new_double(r.meta.duration_s));
        if (r.meta.has_error) json_object_object_add(o, "error", json_object_new_string(r.meta.error.c_str()));
        json_object_object_add(o, "code", json_object_new_string_len(r.code.data(), (int)r.code.size()));
    }
    return json_object_to_json_string_ext(arr, JSON_C_TO_STRING_PLAIN);
}

} // namespace evosynth
