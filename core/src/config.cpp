#include "evosynth/config.h"
#include <cstdlib>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace evosynth {

Profile detect_profile() {
    const char* env = std::getenv("EVOSYNTH_PROFILE");
    if (!env) return Profile::DEV;

    std::string val(env);
    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (val == "prod" || val == "production") return Profile::PROD;
    return Profile::DEV;
}

const char* profile_name(Profile p) {
    switch (p) {
        case Profile::PROD: return "prod";
        case Profile::DEV:  return "dev";
    }
    return "dev";
}

void apply_profile_defaults(Profile p) {
    // SAFETY: Must be called before any child is forked.
    // overwrite=0: won't override existing env vars
    constexpr int NO_OVERWRITE = 0;

    setenv("EVOSYNTH_SANDBOX_TIMEOUT_MS", "250",  NO_OVERWRITE);
    setenv("EVOSYNTH_EXECUTOR",           "fork", NO_OVERWRITE);

    switch (p) {
        case Profile::DEV:
            setenv("EVOSYNTH_SECCOMP_ENABLE",  "0",   NO_OVERWRITE);
            setenv("EVOSYNTH_SANDBOX_MEM_MB",  "256", NO_OVERWRITE);
            break;

        case Profile::PROD:
            setenv("EVOSYNTH_SECCOMP_ENABLE",  "1",   NO_OVERWRITE);
            setenv("EVOSYNTH_SANDBOX_MEM_MB",  "128", NO_OVERWRITE);
            break;
    }
}

static int env_int(const char* name, int fallback, int lo, int hi) {
    const char* env = std::getenv(name);
    if (!env || !*env) return fallback;
    char* end = nullptr;
    long v = std::strtol(env, &end, 10);
    if (*end != '\0' || v < lo || v > hi) {
        throw std::invalid_argument(std::string(name) + ": expected an integer in [" +
                                    std::to_string(lo) + ", " + std::to_string(hi) + "], got '" + env + "'");
    }
    return (int)v;
}

RuntimeSettings load_settings_from_env() {
    RuntimeSettings s;
    s.timeout_ms = env_int("EVOSYNTH_SANDBOX_TIMEOUT_MS", s.timeout_ms, 1, 600000);
    s.mem_mb = env_int("EVOSYNTH_SANDBOX_MEM_MB", s.mem_mb, 16, 65536);
    s.seccomp = env_int("EVOSYNTH_SECCOMP_ENABLE", s.seccomp ? 1 : 0, 0, 1) == 1;

    if (const char* ex = std::getenv("EVOSYNTH_EXECUTOR")) {
        if (*ex) s.executor = ex;
    }
    if (s.executor != "fork" && s.executor != "inprocess") {
        throw std::invalid_argument("EVOSYNTH_EXECUTOR: expected fork or inprocess, got '" + s.executor + "'");
    }
    if (const char* lp = std::getenv("EVOSYNTH_LOG_PATH")) s.log_path = lp;
    return s;
}

} // namespace evosynth
