#pragma once

#include "evosynth/executor.h"
#include "evosynth/value.h"

#include <json-c/json.h>

#include <string>

namespace evosynth {

// --- JSON helpers (json-c wrappers) ---

bool json_get_string(json_object* o, const char* k, std::string* out);
bool json_get_int64(json_object* o, const char* k, int64_t* out);

// Owns one json_object reference for the enclosing scope.
struct JsonGuard {
    json_object* o;
    explicit JsonGuard(json_object* obj) : o(obj) {}
    ~JsonGuard() {
        if (o) json_object_put(o);
    }
    JsonGuard(const JsonGuard&) = delete;
    JsonGuard& operator=(const JsonGuard&) = delete;
};

// json-c seeds its key hash on first use, possibly by reading /dev/urandom.
// Call before forking a seccomp-filtered child so the child inherits the seed
// instead of attempting a blocked open().
void prime_json_hash_seed();

// --- Script values ---
//
// Tagged encoding keeps the distinctions JSON itself loses:
//   int -> 7, bool -> true, str -> "s",
//   {"t":"none"}, {"t":"float","v":"0.5"}, {"t":"list","v":[...]},
//   {"t":"tuple","v":[...]}, {"t":"set","v":[...]},
//   {"t":"dict","v":[[k,v],...]}, {"t":"range","v":[start,stop,step]}.
// Functions and modules are not transferable (ScriptError TypeError).

json_object* value_to_json(const Value& v);
bool value_from_json(json_object* o, Value* out, std::string* err);

// --- ExecutionResult ---

std::string execution_result_to_json(const ExecutionResult& r);
bool execution_result_from_json(const std::string& text, ExecutionResult* out, std::string* err);

} // namespace evosynth
