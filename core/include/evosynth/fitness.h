#pragma once

#include "evosynth/executor.h"
#include "evosynth/task_registry.h"

#include <chrono>
#include <limits>
#include <string>

namespace evosynth {

constexpr double kErrorFitness = -10.0;

struct CandidateMeta {
    bool evaluated{false};
    bool has_error{false};
    std::string error;      // summarized execution error
    int passed{0};
    int total{0};
    double duration_s{0.0};

    bool perfect() const { return evaluated && !has_error && passed == total; }
};

struct ScoreResult {
    double fitness{-std::numeric_limits<double>::infinity()};
    CandidateMeta meta;
};

// Output comparison: floats (either side) within rel 1e-9 / abs 1e-12,
// lists and tuples element-wise, everything else script `==`.
bool outputs_match(const Value& out, const Value& expected);

// fitness = 10*accuracy - 0.5*min(len/300, 1.5) - 0.3*min(duration/0.01, 3.0)
double compute_fitness(int passed, int total, size_t code_len, double duration_s);

class FitnessEvaluator {
public:
    FitnessEvaluator(Executor& executor, std::chrono::milliseconds timeout)
        : executor_(executor), timeout_(timeout) {}

    // Sanitize, run the task's batch and grade it. Execution errors become
    // kErrorFitness with meta.error set; never throws for candidate behavior.
    ScoreResult score(const std::string& code, const Task& task);

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    Executor& executor_;
    std::chrono::milliseconds timeout_;
};

} // namespace evosynth
