#pragma once

#include "evosynth/config.h"
#include "evosynth/executor.h"
#include "evosynth/task_registry.h"

#include <memory>
#include <string>
#include <vector>

namespace evosynth {

std::string slurp(const std::string& path);

// "a,b,,c" -> {"a","b","c"}
std::vector<std::string> split_csv(const std::string& s);

// Strict numeric flag parsing. Throws std::invalid_argument naming the flag.
int parse_int_flag(const std::string& flag, const std::string& value);
uint64_t parse_u64_flag(const std::string& flag, const std::string& value);
double parse_double_flag(const std::string& flag, const std::string& value);

// Apply the profile defaults and read the environment.
RuntimeSettings init_settings();

// Executor described by the settings, with the default capabilities.
std::unique_ptr<Executor> make_executor_from_settings(const RuntimeSettings& s);

// Default tasks plus an optional taskpack manifest.
TaskRegistry build_registry(const std::string& taskpack_path);

// Tasks by name, in the given order; every task when names is empty.
// Throws std::invalid_argument for an unknown name.
std::vector<Task> select_tasks(const TaskRegistry& reg, const std::vector<std::string>& names);

} // namespace evosynth
