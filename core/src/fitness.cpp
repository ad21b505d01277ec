#include "evosynth/fitness.h"
#include "evosynth/program.h"

#include <algorithm>
#include <cmath>

namespace evosynth {

static bool floats_close(double a, double b) {
    if (a == b) return true;
    if (std::isnan(a) || std::isnan(b)) return false;
    if (std::isinf(a) || std::isinf(b)) return false;
    const double diff = std::fabs(a - b);
    return diff <= std::max(1e-9 * std::max(std::fabs(a), std::fabs(b)), 1e-12);
}

bool outputs_match(const Value& out, const Value& expected) {
    if (out.isNumber() && expected.isNumber() &&
        (out.kind == ValueKind::FLOAT || expected.kind == ValueKind::FLOAT)) {
        return floats_close(out.asDouble(), expected.asDouble());
    }
    if (out.isSequence() && out.kind == expected.kind) {
        const auto& a = out.items();
        const auto& b = expected.items();
        if (a.size() != b.size()) return false;
        for (size_t k = 0; k < a.size(); k++) {
            if (!outputs_match(a[k], b[k])) return false;
        }
        return true;
    }
    return values_equal(out, expected);
}

double compute_fitness(int passed, int total, size_t code_len, double duration_s) {
    const double accuracy = total > 0 ? (double)passed / (double)total : 0.0;
    const double length_penalty = std::min((double)code_len / 300.0, 1.5);
    const double time_penalty = std::min(duration_s / 0.01, 3.0);
    return accuracy * 10.0 - 0.5 * length_penalty - 0.3 * time_penalty;
}

ScoreResult FitnessEvaluator::score(const std::string& code, const Task& task) {
    ScoreResult r;
    r.meta.evaluated = true;
    r.meta.total = (int)task.tests.size();

    const std::string clean = sanitize(code);
    ExecutionResult ex = executor_.execute(clean, task.batch_inputs, timeout_);
    if (!ex.ok()) {
        r.fitness = kErrorFitness;
        r.meta.has_error = true;
        r.meta.error = ex.message.empty() ? exec_status_name(ex.status) : ex.message;
        return r;
    }

    int passed = 0;
    const size_t n = std::min(ex.outputs.size(), task.tests.size());
    for (size_t k = 0; k < n; k++) {
        if (outputs_match(ex.outputs[k], task.tests[k].expected)) passed++;
    }
    r.meta.passed = passed;
    r.meta.duration_s = ex.duration_s;
    r.fitness = compute_fitness(passed, r.meta.total, clean.size(), ex.duration_s);
    return r;
}

} // namespace evosynth
