#include "test_common.h"
#include "evosynth/log.h"
#include "evosynth/report.h"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using namespace evosynth;

int main() {
    // Progress line
    {
        CandidateMeta m;
        m.evaluated = true;
        m.passed = 5;
        m.total = 5;
        m.duration_s = 0.00012;
        expect_eq_str(format_progress_line("sum_digits", 1, 9.8766, m),
                      "[sum_digits] gen 001 | best 9.877 | pass 5/5 | dur 0.0001s", "progress line");

        CandidateMeta err;
        err.evaluated = true;
        err.has_error = true;
        err.error = "Timeout";
        err.total = 3;
        expect_eq_str(format_progress_line("two_sum", 12, -10.0, err),
                      "[two_sum] gen 012 | best -10.000 | pass ?/? | dur 0.0000s", "error progress line");
    }

    // Final report section
    {
        TaskReport r;
        r.task = "is_prime";
        r.fitness = 9.1234;
        r.meta.evaluated = true;
        r.meta.passed = 7;
        r.meta.total = 7;
        r.meta.duration_s = 0.000123;
        r.code = "# Evolved by CodeTrainer\nfrom math import sqrt\n\ndef solve(n):\n    return n > 1\n";
        std::ostringstream os;
        print_report(os, {r});
        const std::string want =
            "\n=== BEST PROGRAMS BY TASK ===\n"
            "\n--- is_prime ---\n"
            "fitness=9.123 | passed=7/7 | dur=0.00012s\n"
            "\n"
            "    # Evolved by CodeTrainer\n"
            "    from math import sqrt\n"
            "\n"
            "    def solve(n):\n"
            "        return n > 1\n";
        expect_eq_str(os.str(), want, "report layout");

        std::string js = report_to_json({r});
        expect_true(js.find("\"task\":\"is_prime\"") != std::string::npos, "report json: " + js);
        expect_true(js.find("\"passed\":7") != std::string::npos, "report json passed");
    }

    // Canonical JSON sorts keys at every level
    expect_eq_str(canonicalize_json("{\"b\":1,\"a\":{\"d\":[1,{\"z\":0,\"y\":1}],\"c\":\"x\"}}"),
                  "{\"a\":{\"c\":\"x\",\"d\":[1,{\"y\":1,\"z\":0}]},\"b\":1}", "canonical json");
    expect_eq_str(canonicalize_json("not json"), "not json", "unparseable input unchanged");

    // JsonlLogger writes one canonical record per event
    {
        char path[] = "/tmp/evosynth_log_XXXXXX";
        int fd = mkstemp(path);
        expect_true(fd >= 0, "mkstemp");
        close(fd);
        {
            JsonlLogger log("abc123", path);
            log.event(0, "run_start", "{\"pop\":40,\"gens\":20}");
            log.event(1, "generation", "{\"task\":\"sum_digits\",\"gen\":1}");
        }
        std::ifstream in(path);
        std::string l1, l2;
        std::getline(in, l1);
        std::getline(in, l2);
        expect_true(l1.rfind("{\"event\":\"run_start\",\"payload\":{\"gens\":20,\"pop\":40},\"run_id\":\"abc123\",\"step\":0,\"ts\":\"", 0) == 0,
                    "first record: " + l1);
        expect_true(l2.find("\"step\":1") != std::string::npos, "second record step");
        std::remove(path);
    }

    // Run ids
    {
        setenv("EVOSYNTH_DETERMINISTIC_RUN_ID", "1", 1);
        expect_eq_str(gen_run_id(), gen_run_id(), "deterministic run id");
        unsetenv("EVOSYNTH_DETERMINISTIC_RUN_ID");
        expect_true(!gen_run_id().empty(), "run id");
    }

    std::cerr << "test_report: ALL PASSED" << std::endl;
    return 0;
}
