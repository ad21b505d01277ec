#include "evosynth/sandbox.h"

#if defined(__linux__)

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

#include <linux/audit.h>
#include <linux/filter.h>
#include <linux/seccomp.h>
#include <sys/mman.h>
#include <sys/prctl.h>
#include <sys/syscall.h>

// Architecture-specific audit arch constant
#if defined(__x86_64__)
  #define EVOSYNTH_AUDIT_ARCH AUDIT_ARCH_X86_64
#elif defined(__aarch64__)
  #define EVOSYNTH_AUDIT_ARCH AUDIT_ARCH_AARCH64
#else
  #define EVOSYNTH_AUDIT_ARCH 0
#endif

// BPF helpers
#define BPF_STMT_SC(code, k) { (unsigned short)(code), 0, 0, (unsigned int)(k) }
#define BPF_JUMP_SC(code, k, jt, jf) { (unsigned short)(code), (unsigned char)(jt), (unsigned char)(jf), (unsigned int)(k) }

namespace evosynth {

#if EVOSYNTH_AUDIT_ARCH != 0
static std::vector<unsigned int> interpreter_allowlist() {
    std::vector<unsigned int> nr = {
        // result pipe
        __NR_write,
        __NR_writev,
        __NR_read,
        __NR_close,
        __NR_lseek,
        __NR_fstat,
        // allocator
        __NR_mmap,
        __NR_mprotect,   // filtered separately for PROT_EXEC
        __NR_munmap,
        __NR_mremap,
        __NR_madvise,
        __NR_brk,
        // signals, abort()
        __NR_rt_sigaction,
        __NR_rt_sigprocmask,
        __NR_rt_sigreturn,
        __NR_restart_syscall,
        __NR_getpid,
        __NR_gettid,
        __NR_tgkill,
        // clocks and misc runtime
        __NR_clock_gettime,
        __NR_clock_nanosleep,
        __NR_gettimeofday,
        __NR_futex,
        __NR_sched_yield,
        __NR_getrandom,
        // exit
        __NR_exit,
        __NR_exit_group,
    };
#ifdef __NR_newfstatat
    nr.push_back(__NR_newfstatat);
#endif
#ifdef __NR_rseq
    nr.push_back(__NR_rseq);
#endif
    return nr;
}
#endif

std::string install_seccomp_filter() {
#if EVOSYNTH_AUDIT_ARCH == 0
    return "seccomp: unsupported architecture";
#else
    const std::vector<unsigned int> allowlist = interpreter_allowlist();
    const size_t n_allowed = allowlist.size();

    // Layout:
    //   [0]               load arch
    //   [1]               JEQ arch -> skip kill
    //   [2]               KILL (arch mismatch)
    //   [3]               load syscall nr
    //   [4..4+n-1]        JEQ allowed[s] -> ALLOW or MPROTECT_CHECK
    //   [4+n]             KILL (default deny)
    //   [4+n+1]           MPROTECT_CHECK: load arg2 (prot)
    //   [4+n+2]           JSET PROT_EXEC -> KILL
    //   [4+n+3]           ALLOW (mprotect without PROT_EXEC)
    //   [4+n+4]           KILL (mprotect with PROT_EXEC)
    //   [4+n+5]           ALLOW
    std::vector<struct sock_filter> filter;
    filter.reserve(4 + n_allowed + 6);

    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, arch)));
    filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, EVOSYNTH_AUDIT_ARCH, 1, 0));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));
    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS, offsetof(struct seccomp_data, nr)));

    for (size_t s = 0; s < n_allowed; s++) {
        // jt counts instructions to skip after this one.
        unsigned char jt = allowlist[s] == static_cast<unsigned int>(__NR_mprotect)
                               ? static_cast<unsigned char>(n_allowed - s)
                               : static_cast<unsigned char>(n_allowed + 4 - s);
        filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JEQ | BPF_K, allowlist[s], jt, 0));
    }

    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));

    filter.push_back(BPF_STMT_SC(BPF_LD | BPF_W | BPF_ABS,
                                 offsetof(struct seccomp_data, args) + 2 * sizeof(uint64_t)));
    filter.push_back(BPF_JUMP_SC(BPF_JMP | BPF_JSET | BPF_K, PROT_EXEC, 1, 0));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));
    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_KILL_PROCESS));

    filter.push_back(BPF_STMT_SC(BPF_RET | BPF_K, SECCOMP_RET_ALLOW));

    struct sock_fprog prog = {};
    prog.len = static_cast<unsigned short>(filter.size());
    prog.filter = filter.data();

    if (prctl(PR_SET_SECCOMP, SECCOMP_MODE_FILTER, &prog, 0, 0) != 0) {
        return std::string("seccomp install failed: ") + std::strerror(errno);
    }
    return "";
#endif
}

bool seccomp_available() {
    // 0: available but inactive, 2: filter mode active, -1/EINVAL: unsupported
    int ret = prctl(PR_GET_SECCOMP, 0, 0, 0, 0);
    return ret >= 0;
}

} // namespace evosynth

#else // !__linux__

namespace evosynth {

std::string install_seccomp_filter() {
    return "seccomp: not supported on this platform";
}

bool seccomp_available() {
    return false;
}

} // namespace evosynth

#endif
