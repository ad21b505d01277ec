#include "test_common.h"
#include "evosynth/program.h"
#include "evosynth/rng.h"
#include "evosynth/script.h"
#include "evosynth/task_registry.h"

#include <string>

using namespace evosynth;

int main() {
    // Template layout and its inverse
    {
        const std::string body = "def solve(x):\n    return x";
        const std::string code = assemble(body);
        expect_eq_str(code, "# Evolved by CodeTrainer\nfrom math import sqrt\ndef solve(x):\n    return x\n", "template");
        expect_eq_str(extract_body(code), body, "extract_body inverts assemble");
        expect_eq_str(extract_body(body), body, "bare body passes through");
        expect_eq_str(extract_body(assemble(extract_body(code))), body, "stable across reassembly");
    }

    // Sanitizer keeps the preamble and drops other imports and dunders
    {
        const std::string code =
            "# Evolved by CodeTrainer\nfrom math import sqrt\nimport os\n  from sys import path\n"
            "def solve(x):\n    y = x.__class__\n    return x\n";
        expect_eq_str(sanitize(code), "# Evolved by CodeTrainer\nfrom math import sqrt\ndef solve(x):\n    return x",
                      "sanitized program");
        expect_eq_str(sanitize(""), "", "empty program");
    }

    // Mutation never leaves an empty body and stays deterministic per seed
    {
        Rng a(7), b(7);
        std::string ma = mutate("x", 0.25, a);
        std::string mb = mutate("x", 0.25, b);
        expect_eq_str(ma, mb, "same seed, same mutation");
        expect_true(!ma.empty(), "mutated body not empty");

        Rng r(1);
        for (int k = 0; k < 200; k++) {
            expect_true(!mutate("", 0.25, r).empty(), "empty body mutates into something");
            expect_true(!mutate("p", 1.0, r).empty(), "single char body survives delete");
        }

        // edit count: max(1, int(len * intensity * 0.05)); 400 chars at 0.25 -> 5 edits
        Rng c(3);
        std::string body(400, 'a');
        std::string m = mutate(body, 0.25, c);
        int diff = (int)m.size() - 400;
        expect_true(diff >= -5 && diff <= 5 * 8, "bounded number of edits (size delta " + std::to_string(diff) + ")");
    }

    // Crossover: head of one parent, tail of the other
    {
        Rng r(11);
        for (int k = 0; k < 50; k++) {
            std::string c = crossover("a", "b", r);
            expect_true(c == "b", "single-line parents give the second parent's line: " + c);
        }
        expect_eq_str(crossover("", "x\ny", r), "", "empty first parent returned unchanged");
        expect_eq_str(crossover("keep\nme", "", r), "keep\nme", "empty second parent returns the first");

        for (int k = 0; k < 50; k++) {
            std::string c = crossover("a1\na2\na3", "b1\nb2\nb3", r);
            auto lines = split_lines(c);
            expect_true(!lines.empty(), "child has lines");
            expect_true(lines.back() == "b3", "child ends with the second parent's tail");
        }
    }

    // Seeding: every wrapper produces a program that still parses
    {
        TaskRegistry reg = TaskRegistry::withDefaults();
        Rng r(0);
        for (const auto& task : reg.allTasks()) {
            for (int k = 0; k < 12; k++) {
                std::string code = make_seed(task, r);
                expect_true(code.rfind("# Evolved by CodeTrainer\nfrom math import sqrt\n", 0) == 0, "seed template");
                try {
                    parse_program(code);
                } catch (const ScriptError& e) {
                    die(task.name + " seed does not parse: " + e.what() + "\n" + code);
                }
            }
        }

        Task bare = Task::fromLiterals("identity", {{"(1,)", "1"}});
        std::string code = make_seed(bare, r);
        expect_true(code.find("def solve(x):") != std::string::npos, "fallback seed used: " + code);
    }

    std::cerr << "test_program: ALL PASSED" << std::endl;
    return 0;
}
