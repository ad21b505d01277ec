#pragma once

#include <string>
#include <vector>

namespace evosynth {

// Immutable whitelist of the primitives a candidate may reach: built-in
// function names and importable module names. Built once and passed by value
// into every executor.
class Capabilities {
public:
    Capabilities(std::vector<std::string> builtins, std::vector<std::string> modules);

    // abs all any bool callable dict enumerate filter float int len list map
    // max min pow range reversed round set sorted str sum tuple; module math.
    static Capabilities defaults();

    bool allowsBuiltin(const std::string& name) const;
    bool allowsModule(const std::string& name) const;

    const std::vector<std::string>& builtins() const { return builtins_; }
    const std::vector<std::string>& modules() const { return modules_; }

    // Copy with one more built-in enabled.
    Capabilities withBuiltin(const std::string& name) const;

private:
    std::vector<std::string> builtins_;   // sorted
    std::vector<std::string> modules_;    // sorted
};

} // namespace evosynth
