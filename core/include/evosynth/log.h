#pragma once
#include <string>
#include <fstream>

namespace evosynth {

// Append-only JSONL event log. Every line is canonical JSON (sorted keys):
//   {"event":...,"payload":{...},"run_id":...,"step":N,"ts":"...Z"}
class JsonlLogger {
public:
    // Truncates `path`. Throws std::runtime_error if it cannot be opened.
    JsonlLogger(const std::string& run_id, const std::string& path);
    void event(int step, const std::string& name, const std::string& payload_json);

private:
    std::string run_id_;
    std::ofstream out_;
};

// Canonical JSON: parse then re-serialize with sorted keys.
// Returns input unchanged if parsing fails.
std::string canonicalize_json(const std::string& raw);

// Random hex run id (deterministic when EVOSYNTH_DETERMINISTIC_RUN_ID=1).
std::string gen_run_id();

} // namespace evosynth
