#include "runner_utils.h"
#include "evosynth/sandbox.h"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace evosynth {

std::string slurp(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open: " + path);
    std::stringstream ss; ss << f.rdbuf();
    return ss.str();
}

std::vector<std::string> split_csv(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    std::istringstream iss(s);
    while (std::getline(iss, cur, ',')) {
        if (!cur.empty()) out.push_back(cur);
    }
    return out;
}

int parse_int_flag(const std::string& flag, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    long v = std::strtol(value.c_str(), &end, 10);
    if (value.empty() || *end != '\0' || errno == ERANGE || v < -2147483647L || v > 2147483647L) {
        throw std::invalid_argument(flag + ": expected an integer, got '" + value + "'");
    }
    return (int)v;
}

uint64_t parse_u64_flag(const std::string& flag, const std::string& value) {
    errno = 0;
    char* end = nullptr;
    unsigned long long v = std::strtoull(value.c_str(), &end, 10);
    if (value.empty() || value[0] == '-' || *end != '\0' || errno == ERANGE) {
        throw std::invalid_argument(flag + ": expected a non-negative integer, got '" + value + "'");
    }
    return (uint64_t)v;
}

double parse_double_flag(const std::string& flag, const std::string& value) {
    char* end = nullptr;
    double v = std::strtod(value.c_str(), &end);
    if (value.empty() || *end != '\0') {
        throw std::invalid_argument(flag + ": expected a number, got '" + value + "'");
    }
    return v;
}

RuntimeSettings init_settings() {
    apply_profile_defaults(detect_profile());
    return load_settings_from_env();
}

std::unique_ptr<Executor> make_executor_from_settings(const RuntimeSettings& s) {
    ProcLimits lim;
    lim.timeout_ms = s.timeout_ms;
    lim.rlimit_as_mb = (size_t)s.mem_mb;
    lim.enable_seccomp = s.seccomp;
    if (s.executor == "fork" && s.seccomp && !seccomp_available()) {
        std::cerr << "[WARN] EVOSYNTH_SECCOMP_ENABLE=1 but seccomp is unavailable; candidates will fail with No result\n";
    }
    return make_executor(s.executor, Capabilities::defaults(), lim);
}

TaskRegistry build_registry(const std::string& taskpack_path) {
    TaskRegistry reg = TaskRegistry::withDefaults();
    if (!taskpack_path.empty()) reg.loadTaskPackManifest(taskpack_path);
    return reg;
}

std::vector<Task> select_tasks(const TaskRegistry& reg, const std::vector<std::string>& names) {
    if (names.empty()) return reg.allTasks();
    std::vector<Task> out;
    for (const auto& n : names) {
        const Task* t = reg.getTask(n);
        if (!t) throw std::invalid_argument("unknown task: " + n);
        out.push_back(*t);
    }
    return out;
}

} // namespace evosynth
