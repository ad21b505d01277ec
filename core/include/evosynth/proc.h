#pragma once

#include <functional>
#include <string>

namespace evosynth {

struct ProcLimits {
    int timeout_ms{250};
    size_t output_max_bytes{8 * 1024 * 1024};

    int rlimit_cpu_sec{2};          // CPU time seconds
    size_t rlimit_as_mb{256};       // virtual memory MB
    size_t rlimit_fsize_mb{1};      // max file size MB
    int rlimit_nofile{16};          // max open fds
    int rlimit_nproc{32};           // max processes (best-effort)

    bool no_new_privs{true};

    // seccomp-BPF syscall allowlist (Linux only, requires no_new_privs).
    // Opt-in: set to true or EVOSYNTH_SECCOMP_ENABLE=1.
    bool enable_seccomp{false};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output;  // everything the child wrote to its output fd
    std::string error;   // internal runner error, not child output
};

// Fork a child that applies `lim` to itself and calls `body(out_fd)`, then
// exits with status 0 (120 if body threw). The parent collects whatever the
// child writes to out_fd, enforcing the timeout by killing the child's process
// group. Returns true if the child was started.
bool proc_run_forked(const std::function<void(int out_fd)>& body,
                     const ProcLimits& lim,
                     ProcResult* res);

// Write all of `data` to fd, retrying short writes. False on error.
bool write_all(int fd, const std::string& data);

} // namespace evosynth
