#include "test_common.h"
#include "evosynth/trainer.h"

#include <chrono>
#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

using namespace evosynth;

// In-process execution with the duration pinned to zero, so that fitness
// depends only on the program text and the seed fixes the trajectory.
class FixedClockExecutor : public Executor {
public:
    FixedClockExecutor() : inner_(Capabilities::defaults()) {}

    ExecutionResult execute(const std::string& code, const std::vector<ArgTuple>& inputs,
                            std::chrono::milliseconds timeout) override {
        ExecutionResult r = inner_.execute(code, inputs, timeout);
        r.duration_s = 0.0;
        return r;
    }

    const char* name() const override { return "fixed-clock"; }

private:
    InProcessExecutor inner_;
};

static bool throws_invalid(const TrainerConfig& cfg) {
    try {
        cfg.validate();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

static std::vector<std::pair<int, int>> pass_sequence(const CodeTrainer& t) {
    std::vector<std::pair<int, int>> out;
    for (const auto& g : t.history()) out.emplace_back(g.meta.passed, g.meta.total);
    return out;
}

int main() {
    // Config validation
    {
        TrainerConfig ok;
        ok.validate();
        TrainerConfig c = ok;
        c.pop = 1;
        expect_true(throws_invalid(c), "pop 1 rejected");
        c = ok;
        c.elite = ok.pop + 1;
        expect_true(throws_invalid(c), "elite above pop rejected");
        c = ok;
        c.gens = 0;
        expect_true(throws_invalid(c), "zero generations rejected");
        c = ok;
        c.mutate_rate = 1.5;
        expect_true(throws_invalid(c), "mutate_rate above 1 rejected");
        c = ok;
        c.cx_rate = -0.1;
        expect_true(throws_invalid(c), "negative cx_rate rejected");
    }

    FixedClockExecutor executor;
    FitnessEvaluator eval(executor, std::chrono::milliseconds(250));
    TaskRegistry reg = TaskRegistry::withDefaults();

    // Empty task list is fatal before evolution
    {
        bool threw = false;
        try {
            CodeTrainer t({}, TrainerConfig{}, eval);
        } catch (const std::invalid_argument&) {
            threw = true;
        }
        expect_true(threw, "empty task list rejected");
    }

    // A correct seed stops at the first generation
    {
        TrainerConfig cfg;
        cfg.pop = 8;
        cfg.elite = 2;
        cfg.gens = 5;
        CodeTrainer t({*reg.getTask("sum_digits")}, cfg, eval);
        std::ostringstream progress;
        t.setProgressStream(&progress);
        Candidate best = t.evolve_for_task(*reg.getTask("sum_digits"));
        expect_eq_ll((long long)t.history().size(), 1, "early stop after a perfect generation");
        expect_eq_ll(best.meta.passed, 5, "best passes all");
        expect_eq_ll(best.meta.total, 5, "meta.total equals test count");
        expect_true(progress.str().rfind("[sum_digits] gen 001 | best ", 0) == 0, "progress line: " + progress.str());
        expect_true(progress.str().find("| pass 5/5 | dur 0.0000s") != std::string::npos, "progress tail: " + progress.str());
    }

    // Same seed, same trajectory
    {
        Task negate = Task::fromLiterals("negate", {{"(1,)", "-1"}, {"(-4,)", "4"}, {"(0,)", "0"}});
        TrainerConfig cfg;
        cfg.pop = 12;
        cfg.elite = 3;
        cfg.gens = 6;
        cfg.seed = 42;

        CodeTrainer a({negate}, cfg, eval);
        Candidate ba = a.evolve_for_task(negate);
        auto seq_a = pass_sequence(a);

        CodeTrainer b({negate}, cfg, eval);
        Candidate bb = b.evolve_for_task(negate);
        auto seq_b = pass_sequence(b);

        expect_true(!seq_a.empty(), "history recorded");
        expect_true(seq_a == seq_b, "identical pass/total sequence for the same seed");
        expect_eq_str(ba.code, bb.code, "identical best program");
        expect_eq_ll(ba.meta.total, 3, "meta.total equals test count");
        for (size_t k = 1; k < a.history().size(); k++) {
            expect_true(a.history()[k].best_fitness >= a.history()[k - 1].best_fitness,
                        "elitism keeps the generation best from regressing");
        }
    }

    // run(): one report entry per task, and the event log
    {
        char path[] = "/tmp/evosynth_trainer_log_XXXXXX";
        int fd = mkstemp(path);
        expect_true(fd >= 0, "mkstemp");
        close(fd);

        TrainerConfig cfg;
        cfg.pop = 6;
        cfg.elite = 2;
        cfg.gens = 2;
        JsonlLogger logger("run-test", path);
        CodeTrainer t({*reg.getTask("reverse_words"), *reg.getTask("two_sum")}, cfg, eval);
        t.setLogger(&logger);
        RunReport report = t.run();
        expect_eq_ll((long long)report.size(), 2, "two report entries");
        expect_eq_str(report[0].task, "reverse_words", "report order");
        expect_eq_ll(report[1].meta.total, 3, "two_sum total");

        std::ifstream in(path);
        std::string line, first, last;
        int n = 0;
        while (std::getline(in, line)) {
            if (n == 0) first = line;
            last = line;
            n++;
        }
        expect_true(n >= 4, "run_start, generations, task_done x2, run_end");
        expect_true(first.find("\"event\":\"run_start\"") != std::string::npos, "first event: " + first);
        expect_true(last.find("\"event\":\"run_end\"") != std::string::npos, "last event: " + last);
        expect_true(last.find("\"report\":[{") != std::string::npos, "run_end carries the report: " + last);
        expect_true(last.find("\"task\":\"two_sum\"") != std::string::npos, "report lists every task: " + last);
        expect_true(first.find("\"run_id\":\"run-test\"") != std::string::npos, "run id recorded");
        std::remove(path);
    }

    std::cerr << "test_trainer: ALL PASSED" << std::endl;
    return 0;
}
