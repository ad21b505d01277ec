#include "test_common.h"
#include "evosynth/proc.h"
#include "evosynth/sandbox.h"

#include <chrono>
#include <stdexcept>

#ifdef __linux__
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <sys/prctl.h>
#endif

int main() {
    // Test 1: seccomp_available() should return a valid boolean
    bool avail = evosynth::seccomp_available();
#ifdef __linux__
    expect_true(avail, "seccomp should be available on Linux");
#else
    expect_true(!avail, "seccomp should not be available on non-Linux");
    std::string err = evosynth::install_seccomp_filter();
    expect_true(!err.empty(), "install_seccomp_filter must report failure on non-Linux");
#endif

#ifdef __linux__
    // Test 2: with the filter installed the child can still write its result
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            std::string err = evosynth::install_seccomp_filter();
            if (!err.empty()) _exit(1);
            const char* msg = "seccomp_ok\n";
            ssize_t n = write(STDOUT_FILENO, msg, 11);
            _exit(n > 0 ? 0 : 2);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFEXITED(status) && WEXITSTATUS(status) == 0,
                    "child with seccomp should exit cleanly after write()");
    }

    // Test 3: opening a file under the filter kills the child
    {
        pid_t pid = fork();
        if (pid == 0) {
            prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            if (!evosynth::install_seccomp_filter().empty()) _exit(1);
            int fd = open("/etc/hostname", O_RDONLY);
            _exit(fd >= 0 ? 3 : 4);
        }
        int status = 0;
        waitpid(pid, &status, 0);
        expect_true(WIFSIGNALED(status) && WTERMSIG(status) == SIGSYS, "open() should be killed with SIGSYS");
    }

    // Test 4: proc_run_forked collects what the body writes
    {
        evosynth::ProcLimits lim;
        lim.timeout_ms = 2000;
        evosynth::ProcResult res;
        bool started = evosynth::proc_run_forked(
            [](int fd) { (void)evosynth::write_all(fd, "hello from child"); }, lim, &res);
        expect_true(started, "child should start: " + res.error);
        expect_eq_ll(res.exit_code, 0, "clean exit");
        expect_true(!res.timed_out, "no timeout");
        expect_eq_str(res.output, "hello from child", "output captured");
    }

    // Test 5: a body that throws exits with 120
    {
        evosynth::ProcLimits lim;
        evosynth::ProcResult res;
        expect_true(evosynth::proc_run_forked([](int) { throw std::runtime_error("boom"); }, lim, &res),
                    "child should start");
        expect_eq_ll(res.exit_code, 120, "exception exit code");
        expect_true(res.output.empty(), "no output");
    }

    // Test 6: a hung child is killed at the timeout
    {
        evosynth::ProcLimits lim;
        lim.timeout_ms = 100;
        lim.rlimit_cpu_sec = 10;
        evosynth::ProcResult res;
        auto start = std::chrono::steady_clock::now();
        expect_true(evosynth::proc_run_forked([](int) { for (;;) pause(); }, lim, &res), "child should start");
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start).count();
        expect_true(res.timed_out, "hung child should time out");
        expect_eq_ll(res.exit_code, 128 + SIGKILL, "killed by SIGKILL");
        expect_true(ms < 1500, "kill is prompt (" + std::to_string(ms) + " ms)");
    }

    // Test 7: output cap
    {
        evosynth::ProcLimits lim;
        lim.output_max_bytes = 16;
        evosynth::ProcResult res;
        evosynth::proc_run_forked([](int fd) { (void)evosynth::write_all(fd, std::string(1000, 'x')); }, lim, &res);
        expect_true(res.output_truncated, "output should be truncated");
        expect_eq_ll((long long)res.output.size(), 16, "output capped");
    }
#endif

    std::cerr << "test_sandbox: ALL PASSED" << std::endl;
    return 0;
}
