#include "evosynth/task_registry.h"
#include "evosynth/script.h"
#include "evosynth/serialization.h"

#include <fstream>
#include <sstream>
#include <stdexcept>

namespace evosynth {

Task Task::fromLiterals(const std::string& name,
                        const std::vector<std::pair<std::string, std::string>>& tests,
                        std::vector<std::string> seeds) {
    if (name.empty()) throw std::invalid_argument("task: empty name");
    if (tests.empty()) throw std::invalid_argument("task " + name + ": no tests");

    Task t;
    t.name = name;
    t.seeds = std::move(seeds);
    for (size_t k = 0; k < tests.size(); k++) {
        TestCase tc;
        try {
            Value args = parse_literal(tests[k].first);
            if (args.kind == ValueKind::TUPLE) tc.args = args.items();
            else tc.args.push_back(std::move(args));
            tc.expected = parse_literal(tests[k].second);
        } catch (const ScriptError& e) {
            throw std::invalid_argument("task " + name + ": test " + std::to_string(k) + ": " + e.what());
        }
        if (!t.tests.empty() && tc.args.size() != t.tests.front().args.size()) {
            throw std::invalid_argument("task " + name + ": test " + std::to_string(k) + " has " +
                                        std::to_string(tc.args.size()) + " args, expected " +
                                        std::to_string(t.tests.front().args.size()));
        }
        t.batch_inputs.push_back(tc.args);
        t.tests.push_back(std::move(tc));
    }
    return t;
}

void TaskRegistry::registerTask(Task task) {
    if (task.name.empty()) throw std::invalid_argument("TaskRegistry: empty task name");
    if (task.tests.empty()) throw std::invalid_argument("TaskRegistry: task " + task.name + " has no tests");
    if (index_.count(task.name)) {
        throw std::invalid_argument("TaskRegistry: duplicate task: " + task.name);
    }
    index_[task.name] = tasks_.size();
    tasks_.push_back(std::move(task));
}

const Task* TaskRegistry::getTask(const std::string& name) const {
    auto it = index_.find(name);
    if (it != index_.end()) return &tasks_[it->second];
    return nullptr;
}

std::vector<std::string> TaskRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(tasks_.size());
    for (const auto& t : tasks_) out.push_back(t.name);
    return out;
}

void TaskRegistry::loadTaskPackManifest(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("TaskRegistry: cannot open " + path);
    std::ostringstream ss;
    ss << f.rdbuf();

    json_object* root = json_tokener_parse(ss.str().c_str());
    if (!root) throw std::runtime_error("TaskRegistry: invalid json in " + path);
    JsonGuard guard(root);

    json_object* tasks = nullptr;
    if (!json_object_is_type(root, json_type_object) ||
        !json_object_object_get_ex(root, "tasks", &tasks) || !json_object_is_type(tasks, json_type_array)) {
        throw std::runtime_error("TaskRegistry: " + path + ": missing \"tasks\" array");
    }

    const size_t n = json_object_array_length(tasks);
    for (size_t i = 0; i < n; i++) {
        json_object* tj = json_object_array_get_idx(tasks, i);
        std::string name;
        if (!json_get_string(tj, "name", &name)) {
            throw std::invalid_argument("TaskRegistry: " + path + ": task " + std::to_string(i) + " has no name");
        }

        std::vector<std::pair<std::string, std::string>> tests;
        json_object* tests_j = nullptr;
        if (json_object_object_get_ex(tj, "tests", &tests_j) && json_object_is_type(tests_j, json_type_array)) {
            const size_t nt = json_object_array_length(tests_j);
            for (size_t k = 0; k < nt; k++) {
                json_object* cj = json_object_array_get_idx(tests_j, k);
                std::string args, expected;
                if (!json_get_string(cj, "args", &args) || !json_get_string(cj, "expected", &expected)) {
                    throw std::invalid_argument("TaskRegistry: task " + name + ": test " + std::to_string(k) +
                                                " needs string \"args\" and \"expected\"");
                }
                tests.emplace_back(std::move(args), std::move(expected));
            }
        }

        std::vector<std::string> seeds;
        json_object* seeds_j = nullptr;
        if (json_object_object_get_ex(tj, "seeds", &seeds_j) && json_object_is_type(seeds_j, json_type_array)) {
            const size_t ns = json_object_array_length(seeds_j);
            for (size_t k = 0; k < ns; k++) {
                json_object* sj = json_object_array_get_idx(seeds_j, k);
                if (sj && json_object_is_type(sj, json_type_string)) seeds.push_back(json_object_get_string(sj));
            }
        }

        registerTask(Task::fromLiterals(name, tests, std::move(seeds)));
    }
}

TaskRegistry TaskRegistry::withDefaults() {
    TaskRegistry reg;

    reg.registerTask(Task::fromLiterals(
        "sum_digits",
        {{"(0,)", "0"}, {"(7,)", "7"}, {"(42,)", "6"}, {"(999,)", "27"}, {"(123456,)", "21"}},
        {
            "def solve(n:int)->int:\n    s=0\n    n=abs(n)\n    while n:\n        s+=n%10\n        n//=10\n    return s",
            "def solve(n:int)->int:\n    return sum(int(ch) for ch in str(abs(n)))",
        }));

    reg.registerTask(Task::fromLiterals(
        "is_prime",
        {{"(2,)", "True"}, {"(3,)", "True"}, {"(4,)", "False"}, {"(17,)", "True"},
         {"(21,)", "False"}, {"(1,)", "False"}, {"(97,)", "True"}},
        {
            "def solve(n:int)->bool:\n    if n<2: return False\n    if n%2==0: return n==2\n    i=3\n"
            "    r=int(n**0.5)\n    while i<=r:\n        if n%i==0: return False\n        i+=2\n    return True",
        }));

    reg.registerTask(Task::fromLiterals(
        "reverse_words",
        {{"(\"hello world\",)", "\"world hello\""}, {"(\"a b  c\",)", "\"c b a\""}, {"(\"Python\",)", "\"Python\""}},
        {
            "def solve(s:str)->str:\n    return ' '.join(reversed([w for w in s.split() if w]))",
        }));

    reg.registerTask(Task::fromLiterals(
        "two_sum",
        {{"((2,7,11,15),9)", "(0,1)"}, {"((3,2,4),6)", "(1,2)"}, {"((3,3),6)", "(0,1)"}},
        {
            "def solve(nums,target):\n    d={}\n    for i,x in enumerate(nums):\n        y=target-x\n"
            "        if y in d: return (d[y],i)\n        d[x]=i",
        }));

    reg.registerTask(Task::fromLiterals(
        "levenshtein",
        {{"(\"kitten\",\"sitting\")", "3"}, {"(\"flaw\",\"lawn\")", "2"}, {"(\"a\",\"\")", "1"}, {"(\"\",\"\")", "0"}},
        {
            "def solve(a:str,b:str)->int:\n"
            "    la,lb=len(a),len(b)\n"
            "    dp=[[0]*(lb+1) for _ in range(la+1)]\n"
            "    for i in range(la+1): dp[i][0]=i\n"
            "    for j in range(lb+1): dp[0][j]=j\n"
            "    for i in range(1,la+1):\n"
            "        for j in range(1,lb+1):\n"
            "            cost=0 if a[i-1]==b[j-1] else 1\n"
            "            dp[i][j]=min(dp[i-1][j]+1, dp[i][j-1]+1, dp[i-1][j-1]+cost)\n"
            "    return dp[la][lb]",
        }));

    return reg;
}

} // namespace evosynth
