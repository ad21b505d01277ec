#include "test_common.h"
#include "evosynth/task_registry.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>

#ifndef EVOSYNTH_SOURCE_DIR
#define EVOSYNTH_SOURCE_DIR "."
#endif

using namespace evosynth;

static std::string write_temp(const std::string& body) {
    char path[] = "/tmp/evosynth_manifest_XXXXXX";
    int fd = mkstemp(path);
    if (fd < 0) die("mkstemp failed");
    close(fd);
    std::ofstream out(path);
    out << body;
    return path;
}

template <typename Fn>
static bool throws(Fn fn) {
    try {
        fn();
    } catch (const std::exception&) {
        return true;
    }
    return false;
}

int main() {
    // Default catalog, in registration order
    TaskRegistry reg = TaskRegistry::withDefaults();
    {
        auto names = reg.names();
        expect_eq_ll((long long)names.size(), 5, "five default tasks");
        expect_eq_str(names[0], "sum_digits", "order 0");
        expect_eq_str(names[4], "levenshtein", "order 4");

        const Task* lev = reg.getTask("levenshtein");
        expect_true(lev != nullptr, "levenshtein registered");
        expect_eq_ll((long long)lev->tests.size(), 4, "levenshtein tests");
        expect_eq_ll((long long)lev->arity(), 2, "levenshtein arity");
        expect_eq_ll((long long)lev->batch_inputs.size(), 4, "batch inputs derived from tests");
        expect_eq_ll((long long)reg.getTask("is_prime")->tests.size(), 7, "is_prime tests");
        expect_eq_ll((long long)reg.getTask("reverse_words")->arity(), 1, "reverse_words arity");
        expect_true(reg.getTask("nope") == nullptr, "unknown task");
        for (const auto& t : reg.allTasks()) expect_true(!t.seeds.empty(), t.name + " has seeds");
    }

    // Single values become 1-tuples
    {
        Task t = Task::fromLiterals("square", {{"3", "9"}, {"(4,)", "16"}});
        expect_eq_ll((long long)t.tests[0].args.size(), 1, "bare value wrapped");
        expect_eq_str(repr(t.tests[0].args[0]), "3", "wrapped value");
    }

    // Invalid tasks
    expect_true(throws([] { Task::fromLiterals("", {{"1", "1"}}); }), "empty name rejected");
    expect_true(throws([] { Task::fromLiterals("t", {}); }), "no tests rejected");
    expect_true(throws([] { Task::fromLiterals("t", {{"(1, 2)", "3"}, {"(1,)", "1"}}); }), "arity mismatch rejected");
    expect_true(throws([] { Task::fromLiterals("t", {{"(len,)", "3"}}); }), "non-literal args rejected");
    expect_true(throws([&] { reg.registerTask(*reg.getTask("two_sum")); }), "duplicate rejected");

    // Bundled taskpack
    {
        TaskRegistry r = TaskRegistry::withDefaults();
        r.loadTaskPackManifest(std::string(EVOSYNTH_SOURCE_DIR) + "/taskpacks/problem_set/manifest.json");
        expect_eq_ll((long long)r.size(), 10, "five defaults plus five taskpack tasks");
        const Task* fib = r.getTask("fibonacci");
        expect_true(fib != nullptr, "fibonacci loaded");
        expect_eq_str(repr(fib->tests.back().expected), "6765", "fib(20)");
        expect_eq_ll((long long)r.getTask("is_anagram")->arity(), 2, "is_anagram arity");
        expect_eq_ll((long long)r.getTask("max_profit")->seeds.size(), 1, "max_profit seed");
    }

    // Manifest errors
    {
        std::string p = write_temp("{\"tasks\":[{\"name\":\"x\",\"tests\":[{\"args\":\"(1,)\"}]}]}");
        TaskRegistry r;
        expect_true(throws([&] { r.loadTaskPackManifest(p); }), "test without expected rejected");
        std::remove(p.c_str());

        p = write_temp("{not json");
        expect_true(throws([&] { r.loadTaskPackManifest(p); }), "invalid json rejected");
        std::remove(p.c_str());

        p = write_temp("{\"tasks\":[{\"name\":\"y\",\"tests\":[]}]}");
        expect_true(throws([&] { r.loadTaskPackManifest(p); }), "task without tests rejected");
        std::remove(p.c_str());

        expect_true(throws([&] { r.loadTaskPackManifest("/nonexistent/manifest.json"); }), "missing file rejected");
    }

    std::cerr << "test_task_registry: ALL PASSED" << std::endl;
    return 0;
}
