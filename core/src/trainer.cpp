#include "evosynth/trainer.h"
#include "evosynth/program.h"
#include "evosynth/serialization.h"

#include <algorithm>
#include <stdexcept>

namespace evosynth {

static constexpr double kMutationIntensity = 0.25;
static constexpr int kParentPoolFloor = 10;

void TrainerConfig::validate() const {
    if (pop < 2) throw std::invalid_argument("pop must be >= 2, got " + std::to_string(pop));
    if (gens < 1) throw std::invalid_argument("gens must be >= 1, got " + std::to_string(gens));
    if (elite < 0 || elite > pop) {
        throw std::invalid_argument("elite must be in [0, pop=" + std::to_string(pop) + "], got " +
                                    std::to_string(elite));
    }
    if (!(mutate_rate >= 0.0 && mutate_rate <= 1.0)) {
        throw std::invalid_argument("mutate_rate must be in [0, 1], got " + std::to_string(mutate_rate));
    }
    if (!(cx_rate >= 0.0 && cx_rate <= 1.0)) {
        throw std::invalid_argument("cx_rate must be in [0, 1], got " + std::to_string(cx_rate));
    }
}

CodeTrainer::CodeTrainer(std::vector<Task> tasks, TrainerConfig cfg, FitnessEvaluator& evaluator)
    : tasks_(std::move(tasks)), cfg_(cfg), evaluator_(evaluator), rng_(cfg.seed) {
    cfg_.validate();
    if (tasks_.empty()) throw std::invalid_argument("no tasks to evolve");
}

void CodeTrainer::logEvent(const std::string& name, const std::string& payload_json) {
    if (!logger_) return;
    logger_->event(step_++, name, payload_json);
}

static std::string meta_payload(const std::string& task, int gen, double fitness, const CandidateMeta& meta) {
    json_object* o = json_object_new_object();
    JsonGuard guard(o);
    json_object_object_add(o, "task", json_object_new_string(task.c_str()));
    if (gen > 0) json_object_object_add(o, "gen", json_object_new_int(gen));
    json_object_object_add(o, "best_fitness", json_object_new_double(fitness));
    json_object_object_add(o, "passed", json_object_new_int(meta.passed));
    json_object_object_add(o, "total", json_object_new_int(meta.total));
    json_object_object_add(o, "duration_s", json_object_new_double(meta.duration_s));
    if (meta.has_error) json_object_object_add(o, "error", json_object_new_string(meta.error.c_str()));
    return json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN);
}

std::vector<Candidate> CodeTrainer::nextGeneration(const std::vector<Candidate>& ranked) {
    const size_t pop = (size_t)cfg_.pop;
    const size_t pool = std::min(ranked.size(), (size_t)std::max(kParentPoolFloor, cfg_.elite));

    // elitism
    std::vector<Candidate> next(ranked.begin(), ranked.begin() + (long)std::min((size_t)cfg_.elite, ranked.size()));
    next.reserve(pop);

    while (next.size() < pop) {
        std::string child;
        if (rng_.unit() < cfg_.cx_rate) {
            // two distinct parents
            size_t a = rng_.index(pool);
            size_t b = rng_.index(pool - 1);
            if (b >= a) b++;
            child = crossover(ranked[a].code, ranked[b].code, rng_);
        } else {
            child = ranked[rng_.index(pool)].code;
        }
        if (rng_.unit() < cfg_.mutate_rate) {
            child = assemble(mutate(extract_body(child), kMutationIntensity, rng_));
        }
        Candidate c;
        c.code = std::move(child);
        next.push_back(std::move(c));
    }
    return next;
}

Candidate CodeTrainer::evolve_for_task(const Task& task) {
    history_.clear();

    std::vector<Candidate> population;
    population.reserve((size_t)cfg_.pop);
    for (int k = 0; k < cfg_.pop; k++) {
        Candidate c;
        c.code = make_seed(task, rng_);
        population.push_back(std::move(c));
    }

    Candidate best;
    best.meta.total = (int)task.tests.size();

    for (int gen = 1; gen <= cfg_.gens; gen++) {
        for (auto& cand : population) {
            ScoreResult sr = evaluator_.score(cand.code, task);
            cand.fitness = sr.fitness;
            cand.meta = sr.meta;
        }
        std::stable_sort(population.begin(), population.end(),
                         [](const Candidate& x, const Candidate& y) { return x.fitness > y.fitness; });

        const Candidate& top = population.front();
        if (top.fitness > best.fitness) best = top;

        GenerationStats gs;
        gs.gen = gen;
        gs.best_fitness = top.fitness;
        gs.meta = top.meta;
        history_.push_back(gs);

        if (progress_) *progress_ << format_progress_line(task.name, gen, top.fitness, top.meta) << std::endl;
        logEvent("generation", meta_payload(task.name, gen, top.fitness, top.meta));

        if (top.meta.perfect()) break;
        if (gen == cfg_.gens) break;

        population = nextGeneration(population);
    }
    return best;
}

RunReport CodeTrainer::run() {
    {
        json_object* o = json_object_new_object();
        JsonGuard guard(o);
        json_object_object_add(o, "pop", json_object_new_int(cfg_.pop));
        json_object_object_add(o, "gens", json_object_new_int(cfg_.gens));
        json_object_object_add(o, "elite", json_object_new_int(cfg_.elite));
        json_object_object_add(o, "mutate_rate", json_object_new_double(cfg_.mutate_rate));
        json_object_object_add(o, "cx_rate", json_object_new_double(cfg_.cx_rate));
        json_object_object_add(o, "seed", json_object_new_int64((int64_t)cfg_.seed));
        json_object* names = json_object_new_array();
        json_object_object_add(o, "tasks", names);
        for (const auto& t : tasks_) json_object_array_add(names, json_object_new_string(t.name.c_str()));
        logEvent("run_start", json_object_to_json_string_ext(o, JSON_C_TO_STRING_PLAIN));
    }

    RunReport report;
    for (const auto& task : tasks_) {
        Candidate best = evolve_for_task(task);
        logEvent("task_done", meta_payload(task.name, 0, best.fitness, best.meta));

        TaskReport tr;
        tr.task = task.name;
        tr.fitness = best.fitness;
        tr.meta = best.meta;
        tr.code = best.code;
        report.push_back(std::move(tr));
    }

    logEvent("run_end", "{\"tasks\":" + std::to_string(report.size()) + ",\"report\":" + report_to_json(report) + "}");
    return report;
}

} // namespace evosynth
