#pragma once

// Candidate program text: a fixed header line, a fixed import preamble and a
// mutable body. The genetic operators work on raw text; nothing here parses.

#include "evosynth/rng.h"
#include "evosynth/task_registry.h"

#include <string>
#include <vector>

namespace evosynth {

constexpr const char* kStubHeader = "# Evolved by CodeTrainer";
constexpr const char* kDefaultImports = "from math import sqrt";
constexpr const char* kFallbackSeed = "def solve(x):\n    return x\n";

const std::vector<std::string>& token_pool();
const std::vector<std::string>& constant_pool();

// Split on '\n'. A trailing newline does not produce an empty last line.
std::vector<std::string> split_lines(const std::string& text);
std::string join_lines(const std::vector<std::string>& lines);

// Drop every import line except the exact preamble, and every line that
// contains "__". A textual pre-filter only; the interpreter enforces the
// capability whitelist regardless.
std::string sanitize(const std::string& code);

// header + preamble + body.
std::string assemble(const std::string& body);

// Inverse of assemble(): the text after the header and preamble lines, if
// present, without the newline assemble() appended.
std::string extract_body(const std::string& code);

// Character-level edits: max(1, int(len * intensity * 0.05)) of insert-token,
// delete-char, replace-char and insert-constant. An empty body starts as
// "pass"; the result is never empty.
std::string mutate(const std::string& body, double intensity, Rng& rng);

// Head of `a` up to a random line, then the tail of `b` from a random line.
// Returns `a` unchanged when either side has no lines.
std::string crossover(const std::string& a, const std::string& b, Rng& rng);

// A task seed (or kFallbackSeed) through one of the whitespace wrappers,
// assembled into the template.
std::string make_seed(const Task& task, Rng& rng);

} // namespace evosynth
