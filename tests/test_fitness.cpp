#include "test_common.h"
#include "evosynth/fitness.h"
#include "evosynth/program.h"
#include "evosynth/script.h"

#include <chrono>
#include <string>

using namespace evosynth;

int main() {
    TaskRegistry reg = TaskRegistry::withDefaults();
    InProcessExecutor executor(Capabilities::defaults());
    FitnessEvaluator eval(executor, std::chrono::milliseconds(250));

    // Output comparison
    expect_true(outputs_match(parse_literal("(0, 1)"), parse_literal("(0, 1)")), "equal tuples");
    expect_true(!outputs_match(parse_literal("[0, 1]"), parse_literal("(0, 1)")), "list is not a tuple");
    expect_true(outputs_match(parse_literal("True"), parse_literal("1")), "True == 1");
    expect_true(outputs_match(Value::real(0.1 + 0.2), Value::real(0.3)), "float tolerance");
    expect_true(outputs_match(Value::real(3.0000000000001), Value::integer(3)), "float vs int tolerance");
    expect_true(!outputs_match(Value::real(3.001), Value::integer(3)), "outside tolerance");
    expect_true(outputs_match(Value::list({Value::real(0.1 + 0.2)}), Value::list({Value::real(0.3)})),
                "tolerance inside lists");
    expect_true(!outputs_match(Value::none(), Value::integer(0)), "None is not 0");

    // Fitness formula
    expect_near(compute_fitness(5, 5, 0, 0.0), 10.0, 1e-12, "perfect, free");
    expect_near(compute_fitness(5, 5, 150, 0.005), 10.0 - 0.25 - 0.15, 1e-12, "penalties");
    expect_near(compute_fitness(0, 4, 100000, 10.0), -0.75 - 0.9, 1e-12, "penalties are capped");

    // Scenario 1: sum_digits, a correct seed passes everything
    {
        const Task* t = reg.getTask("sum_digits");
        expect_true(t != nullptr, "sum_digits registered");
        expect_eq_ll((long long)t->tests.size(), 5, "sum_digits tests");
        expect_eq_str(repr(t->tests[2].expected), "6", "(42,) -> 6");

        const std::string code = assemble(t->seeds[0]);
        ScoreResult r = eval.score(code, *t);
        expect_true(!r.meta.has_error, "seed runs: " + r.meta.error);
        expect_eq_ll(r.meta.passed, 5, "sum_digits passed");
        expect_eq_ll(r.meta.total, 5, "sum_digits total");
        const double want = compute_fitness(5, 5, sanitize(code).size(), r.meta.duration_s);
        expect_near(r.fitness, want, 1e-12, "fitness is 10 minus penalties");
        expect_true(r.fitness > 8.0 && r.fitness <= 10.0, "perfect candidate scores high");
        expect_true(r.meta.perfect(), "perfect meta");

        // pass/total is stable across re-scoring
        ScoreResult again = eval.score(code, *t);
        expect_eq_ll(again.meta.passed, r.meta.passed, "idempotent passed");
        expect_eq_ll(again.meta.total, r.meta.total, "idempotent total");
    }

    // Scenario 2: two_sum returns index pairs
    {
        const Task* t = reg.getTask("two_sum");
        expect_eq_str(repr(Value::tuple(t->tests[0].args)), "((2, 7, 11, 15), 9)", "two_sum args");
        ScoreResult r = eval.score(assemble(t->seeds[0]), *t);
        expect_eq_ll(r.meta.passed, 3, "two_sum passes");
    }

    // Scenario 3: a truncated body is an execution error with the fixed penalty
    {
        const Task* t = reg.getTask("sum_digits");
        ScoreResult r = eval.score(assemble("def solve(n:int)->int:\n    s=0\n    while n"), *t);
        expect_near(r.fitness, -10.0, 0.0, "broken code scores exactly -10");
        expect_true(r.meta.has_error, "meta.error set");
        expect_true(r.meta.error.rfind("SyntaxError", 0) == 0, "syntax error reported: " + r.meta.error);
        expect_eq_ll(r.meta.total, 5, "total still known");
        expect_true(!r.meta.perfect(), "error is never perfect");
    }

    // Partial credit and wrong answers
    {
        const Task* t = reg.getTask("is_prime");
        ScoreResult r = eval.score(assemble("def solve(n):\n    return n % 2 == 1"), *t);
        expect_true(!r.meta.has_error, "runs");
        // 2 F(x) 3 T 4 F 17 T 21 T(x) 1 T(x) 97 T
        expect_eq_ll(r.meta.passed, 4, "odd heuristic passes 4 of 7");
        expect_true(r.fitness < 10.0 * 4.0 / 7.0, "partial fitness");
    }

    // Timeouts are penalized, not fatal
    {
        const Task* t = reg.getTask("levenshtein");
        ScoreResult r = eval.score(assemble("def solve(a, b):\n    while True:\n        pass"), *t);
        expect_near(r.fitness, -10.0, 0.0, "timeout penalty");
        expect_eq_str(r.meta.error, "Timeout", "timeout meta");
    }

    // Sanitizer runs before execution: a dunder line disappears
    {
        const Task* t = reg.getTask("sum_digits");
        ScoreResult r = eval.score(assemble("def solve(n):\n    x = ().__class__\n    return sum(int(c) for c in str(n))"), *t);
        expect_eq_ll(r.meta.passed, 5, "dunder line dropped, rest runs");
    }

    std::cerr << "test_fitness: ALL PASSED" << std::endl;
    return 0;
}
