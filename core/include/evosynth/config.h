#pragma once
#include <string>

namespace evosynth {

enum class Profile { DEV, PROD };

// Detect profile from EVOSYNTH_PROFILE env var. Default: DEV.
Profile detect_profile();

// Returns string name of profile.
const char* profile_name(Profile p);

// Apply profile defaults: sets env vars that are not already set.
// DEV: forked sandbox without seccomp, 256 MB address space
// PROD: forked sandbox with seccomp, 128 MB address space
void apply_profile_defaults(Profile p);

// Sandbox and logging settings read from the environment.
struct RuntimeSettings {
    int timeout_ms{250};            // EVOSYNTH_SANDBOX_TIMEOUT_MS
    std::string executor{"fork"};   // EVOSYNTH_EXECUTOR
    bool seccomp{false};            // EVOSYNTH_SECCOMP_ENABLE
    int mem_mb{256};                // EVOSYNTH_SANDBOX_MEM_MB
    std::string log_path;           // EVOSYNTH_LOG_PATH, empty = no event log
};

// Unset variables keep the struct defaults. Throws std::invalid_argument for
// a malformed or out-of-range value.
RuntimeSettings load_settings_from_env();

} // namespace evosynth
