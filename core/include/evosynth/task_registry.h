#pragma once

#include "evosynth/executor.h"
#include "evosynth/value.h"

#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace evosynth {

struct TestCase {
    ArgTuple args;      // always a tuple of positional args
    Value expected;
};

struct Task {
    std::string name;
    std::vector<TestCase> tests;
    std::vector<ArgTuple> batch_inputs;   // args of every test, in order
    std::vector<std::string> seeds;       // program texts defining `solve`

    // Build a task from literal sources, e.g. ("(42,)", "6"). An args literal
    // that is not a tuple becomes a 1-tuple. Throws std::invalid_argument on
    // an empty name, no tests, a malformed literal or inconsistent arity.
    static Task fromLiterals(const std::string& name,
                             const std::vector<std::pair<std::string, std::string>>& tests,
                             std::vector<std::string> seeds = {});

    size_t arity() const { return tests.empty() ? 0 : tests.front().args.size(); }
};

class TaskRegistry {
public:
    // Load tasks from a taskpack manifest JSON file:
    //   {"tasks":[{"name":"...","tests":[{"args":"(1, 2)","expected":"3"}],"seeds":["..."]}]}
    // Throws std::runtime_error if the file cannot be read or parsed and
    // std::invalid_argument for an invalid task.
    void loadTaskPackManifest(const std::string& path);

    // Throws std::invalid_argument on a duplicate name.
    void registerTask(Task task);

    const Task* getTask(const std::string& name) const;

    // Registration order.
    const std::vector<Task>& allTasks() const { return tasks_; }
    std::vector<std::string> names() const;

    size_t size() const { return tasks_.size(); }

    // sum_digits, is_prime, reverse_words, two_sum, levenshtein.
    static TaskRegistry withDefaults();

private:
    std::vector<Task> tasks_;
    std::unordered_map<std::string, size_t> index_;
};

} // namespace evosynth
