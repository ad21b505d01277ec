#pragma once

#include "evosynth/fitness.h"
#include "evosynth/log.h"
#include "evosynth/report.h"
#include "evosynth/rng.h"
#include "evosynth/task_registry.h"

#include <cstdint>
#include <limits>
#include <ostream>
#include <string>
#include <vector>

namespace evosynth {

struct TrainerConfig {
    int pop{40};
    int gens{30};
    int elite{6};
    double mutate_rate{0.7};
    double cx_rate{0.5};
    uint64_t seed{0};

    // Throws std::invalid_argument: pop < 2, gens < 1, elite outside
    // [0, pop], a rate outside [0, 1].
    void validate() const;
};

struct Candidate {
    std::string code;
    double fitness{-std::numeric_limits<double>::infinity()};
    CandidateMeta meta;
};

// Generation-best record, one per evaluated generation.
struct GenerationStats {
    int gen{0};             // 1-based
    double best_fitness{0.0};
    CandidateMeta meta;
};

class CodeTrainer {
public:
    // Throws std::invalid_argument for an invalid config or an empty task list.
    CodeTrainer(std::vector<Task> tasks, TrainerConfig cfg, FitnessEvaluator& evaluator);

    // Progress lines go here when set (one per generation).
    void setProgressStream(std::ostream* os) { progress_ = os; }
    // Structured events go here when set.
    void setLogger(JsonlLogger* logger) { logger_ = logger; }

    // Evolve one task until a perfect generation leader or the budget runs
    // out. Returns the best-ever candidate.
    Candidate evolve_for_task(const Task& task);

    // evolve_for_task over every task, in order.
    RunReport run();

    // Generation records of the most recent evolve_for_task call.
    const std::vector<GenerationStats>& history() const { return history_; }

    const TrainerConfig& config() const { return cfg_; }

private:
    std::vector<Task> tasks_;
    TrainerConfig cfg_;
    FitnessEvaluator& evaluator_;
    Rng rng_;
    std::ostream* progress_{nullptr};
    JsonlLogger* logger_{nullptr};
    int step_{0};
    std::vector<GenerationStats> history_;

    void logEvent(const std::string& name, const std::string& payload_json);
    std::vector<Candidate> nextGeneration(const std::vector<Candidate>& ranked);
};

} // namespace evosynth
