#pragma once

// seccomp-BPF syscall allowlist for candidate child processes.
//
// Design: allowlist-only. Any syscall NOT on the list kills the process.
// Opt-in via ProcLimits.enable_seccomp or EVOSYNTH_SECCOMP_ENABLE=1.
//
// Architecture-aware: supports x86_64 and aarch64.

#include <string>

namespace evosynth {

// Install a seccomp-BPF filter that restricts the calling process to what the
// interpreter needs once the candidate is running: memory management, writing
// the result pipe, clocks, signals and exit. Must be called AFTER
// prctl(PR_SET_NO_NEW_PRIVS, 1).
//
// BLOCKED (notable): open/openat, execve, fork/clone, socket and every other
// network call, ptrace, mount, kill of other processes, mprotect with PROT_EXEC.
//
// Returns empty string on success, error message on failure. Platforms
// without seccomp always fail, so a child that asked for the filter never
// runs unfiltered.
std::string install_seccomp_filter();

// Check if seccomp is available on this system.
bool seccomp_available();

} // namespace evosynth
