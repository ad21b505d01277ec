#include "test_common.h"
#include "evosynth/config.h"
#include <cstdlib>
#include <stdexcept>

static void clear_env() {
    unsetenv("EVOSYNTH_PROFILE");
    unsetenv("EVOSYNTH_SANDBOX_TIMEOUT_MS");
    unsetenv("EVOSYNTH_EXECUTOR");
    unsetenv("EVOSYNTH_SECCOMP_ENABLE");
    unsetenv("EVOSYNTH_SANDBOX_MEM_MB");
    unsetenv("EVOSYNTH_LOG_PATH");
}

int main() {
    clear_env();

    // Test 1: Default profile is DEV
    auto p = evosynth::detect_profile();
    expect_true(p == evosynth::Profile::DEV, "default should be DEV");

    // Test 2: PROD detection
    setenv("EVOSYNTH_PROFILE", "prod", 1);
    p = evosynth::detect_profile();
    expect_true(p == evosynth::Profile::PROD, "should detect PROD");

    // Test 3: Case insensitive
    setenv("EVOSYNTH_PROFILE", "PRODUCTION", 1);
    p = evosynth::detect_profile();
    expect_true(p == evosynth::Profile::PROD, "should detect PROD case-insensitive");

    // Test 4: Apply defaults (won't override existing)
    setenv("EVOSYNTH_SANDBOX_MEM_MB", "512", 1);
    evosynth::apply_profile_defaults(evosynth::Profile::PROD);
    std::string val = std::getenv("EVOSYNTH_SANDBOX_MEM_MB") ? std::getenv("EVOSYNTH_SANDBOX_MEM_MB") : "";
    expect_true(val == "512", "should NOT override pre-existing env var");

    // Test 5: Apply sets missing vars
    val = std::getenv("EVOSYNTH_SECCOMP_ENABLE") ? std::getenv("EVOSYNTH_SECCOMP_ENABLE") : "";
    expect_true(val == "1", "PROD should set SECCOMP_ENABLE=1");

    // Test 6: settings reflect the environment
    auto s = evosynth::load_settings_from_env();
    expect_eq_ll(s.timeout_ms, 250, "default timeout");
    expect_eq_ll(s.mem_mb, 512, "mem from env");
    expect_true(s.seccomp, "seccomp from profile");
    expect_true(s.executor == "fork", "fork executor by default");
    expect_true(s.log_path.empty(), "no event log by default");

    // Test 7: DEV defaults
    clear_env();
    evosynth::apply_profile_defaults(evosynth::Profile::DEV);
    s = evosynth::load_settings_from_env();
    expect_true(!s.seccomp, "DEV leaves seccomp off");
    expect_eq_ll(s.mem_mb, 256, "DEV memory");

    // Test 8: malformed values are configuration errors
    setenv("EVOSYNTH_SANDBOX_TIMEOUT_MS", "fast", 1);
    bool threw = false;
    try { evosynth::load_settings_from_env(); } catch (const std::invalid_argument&) { threw = true; }
    expect_true(threw, "non-numeric timeout rejected");
    setenv("EVOSYNTH_SANDBOX_TIMEOUT_MS", "100", 1);
    setenv("EVOSYNTH_EXECUTOR", "threads", 1);
    threw = false;
    try { evosynth::load_settings_from_env(); } catch (const std::invalid_argument&) { threw = true; }
    expect_true(threw, "unknown executor rejected");

    // Test 9: Profile name
    expect_true(std::string(evosynth::profile_name(evosynth::Profile::DEV)) == "dev", "dev name");
    expect_true(std::string(evosynth::profile_name(evosynth::Profile::PROD)) == "prod", "prod name");

    clear_env();
    std::cerr << "test_config: ALL PASSED" << std::endl;
    return 0;
}
