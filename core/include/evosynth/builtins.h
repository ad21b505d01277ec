#pragma once

// Native built-in functions, container methods and modules of the script
// language. Whether a script may reach a built-in is decided by the
// interpreter's Capabilities; this table only knows what exists.

#include "evosynth/value.h"

#include <string>
#include <vector>

namespace evosynth {

// Built-in function by name, nullptr when no such built-in is implemented.
const Value* find_builtin(const std::string& name);

// Names of every implemented built-in (whitelisted or not).
std::vector<std::string> builtin_names();

// Module object by name ("math"), nullptr when unknown.
const Value* find_module(const std::string& name);

// `obj.name`: bound methods of str/list/tuple/dict/set and module attributes.
// Names beginning with '_' always raise AttributeError.
Value get_attribute(const Value& obj, const std::string& name);

} // namespace evosynth
