#include "cmd_evolve.h"
#include "runner_utils.h"

#include "evosynth/fitness.h"
#include "evosynth/log.h"
#include "evosynth/report.h"
#include "evosynth/trainer.h"

#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <stdexcept>

using namespace evosynth;

static void evolve_usage() {
    std::cerr << "usage: evosynth_cli [evolve] [--gens N] [--pop N] [--seed N] [--elite N]\n"
              << "                    [--mutate-rate R] [--cx-rate R] [--tasks a,b] [--taskpack PATH] [--log PATH]\n"
              << "env: EVOSYNTH_PROFILE=dev|prod, EVOSYNTH_EXECUTOR=fork|inprocess, EVOSYNTH_SANDBOX_TIMEOUT_MS,\n"
              << "     EVOSYNTH_SANDBOX_MEM_MB, EVOSYNTH_SECCOMP_ENABLE, EVOSYNTH_LOG_PATH\n";
}

int cmd_evolve(int argc, char** argv, int first_arg) {
    try {
        RuntimeSettings settings = init_settings();

        TrainerConfig cfg;
        cfg.gens = 20;
        std::vector<std::string> task_names;
        std::string taskpack;
        std::string log_path = settings.log_path;

        for (int i = first_arg; i < argc; i++) {
            std::string a = argv[i];
            if (a == "-h" || a == "--help") {
                evolve_usage();
                return 0;
            }
            if (i + 1 >= argc) throw std::invalid_argument("missing value for " + a);
            std::string v = argv[++i];
            if (a == "--gens") cfg.gens = parse_int_flag(a, v);
            else if (a == "--pop") cfg.pop = parse_int_flag(a, v);
            else if (a == "--seed") cfg.seed = parse_u64_flag(a, v);
            else if (a == "--elite") cfg.elite = parse_int_flag(a, v);
            else if (a == "--mutate-rate") cfg.mutate_rate = parse_double_flag(a, v);
            else if (a == "--cx-rate") cfg.cx_rate = parse_double_flag(a, v);
            else if (a == "--tasks") task_names = split_csv(v);
            else if (a == "--taskpack") taskpack = v;
            else if (a == "--log") log_path = v;
            else throw std::invalid_argument("unknown option: " + a);
        }
        cfg.validate();

        TaskRegistry reg = build_registry(taskpack);
        std::vector<Task> tasks = select_tasks(reg, task_names);
        if (tasks.empty()) throw std::invalid_argument("no tasks selected");

        auto executor = make_executor_from_settings(settings);
        FitnessEvaluator evaluator(*executor, std::chrono::milliseconds(settings.timeout_ms));

        std::unique_ptr<JsonlLogger> logger;
        if (!log_path.empty()) logger.reset(new JsonlLogger(gen_run_id(), log_path));

        CodeTrainer trainer(std::move(tasks), cfg, evaluator);
        trainer.setProgressStream(&std::cout);
        trainer.setLogger(logger.get());

        RunReport report = trainer.run();
        print_report(std::cout, report);
        return 0;
    } catch (const std::invalid_argument& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        evolve_usage();
        return 2;
    } catch (const std::runtime_error& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}

int cmd_tasks(int argc, char** argv) {
    try {
        std::string taskpack;
        for (int i = 2; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--taskpack" && i + 1 < argc) taskpack = argv[++i];
            else throw std::invalid_argument("unknown option: " + a);
        }
        TaskRegistry reg = build_registry(taskpack);
        for (const auto& t : reg.allTasks()) {
            std::cout << t.name << "\ttests=" << t.tests.size() << "\tarity=" << t.arity()
                      << "\tseeds=" << t.seeds.size() << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}

int cmd_score(int argc, char** argv) {
    if (argc < 4) {
        std::cerr << "usage: evosynth_cli score <task> <program-file> [--taskpack PATH]\n";
        return 2;
    }
    try {
        std::string taskpack;
        for (int i = 4; i < argc; i++) {
            std::string a = argv[i];
            if (a == "--taskpack" && i + 1 < argc) taskpack = argv[++i];
            else throw std::invalid_argument("unknown option: " + a);
        }
        RuntimeSettings settings = init_settings();
        TaskRegistry reg = build_registry(taskpack);
        const Task* task = reg.getTask(argv[2]);
        if (!task) throw std::invalid_argument(std::string("unknown task: ") + argv[2]);
        std::string code = slurp(argv[3]);

        auto executor = make_executor_from_settings(settings);
        FitnessEvaluator evaluator(*executor, std::chrono::milliseconds(settings.timeout_ms));
        ScoreResult sr = evaluator.score(code, *task);

        std::cout << std::fixed << std::setprecision(3) << "fitness=" << sr.fitness;
        if (sr.meta.has_error) {
            std::cout << " | error=" << sr.meta.error << "\n";
        } else {
            std::cout << " | passed=" << sr.meta.passed << "/" << sr.meta.total
                      << " | dur=" << std::setprecision(5) << sr.meta.duration_s << "s\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 2;
    }
}
