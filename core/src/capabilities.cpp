#include "evosynth/capabilities.h"

#include <algorithm>

namespace evosynth {

static std::vector<std::string> sorted_unique(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
    return v;
}

Capabilities::Capabilities(std::vector<std::string> builtins, std::vector<std::string> modules)
    : builtins_(sorted_unique(std::move(builtins))), modules_(sorted_unique(std::move(modules))) {}

Capabilities Capabilities::defaults() {
    return Capabilities(
        {"abs", "all", "any", "bool", "callable", "dict", "enumerate", "filter", "float",
         "int", "len", "list", "map", "max", "min", "pow", "range", "reversed", "round",
         "set", "sorted", "str", "sum", "tuple"},
        {"math"});
}

bool Capabilities::allowsBuiltin(const std::string& name) const {
    return std::binary_search(builtins_.begin(), builtins_.end(), name);
}

bool Capabilities::allowsModule(const std::string& name) const {
    return std::binary_search(modules_.begin(), modules_.end(), name);
}

Capabilities Capabilities::withBuiltin(const std::string& name) const {
    std::vector<std::string> b = builtins_;
    b.push_back(name);
    return Capabilities(std::move(b), modules_);
}

} // namespace evosynth
