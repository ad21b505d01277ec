#include "evosynth/proc.h"
#include "evosynth/sandbox.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <exception>

#ifndef _WIN32
  #include <fcntl.h>
  #include <poll.h>
  #include <signal.h>
  #include <sys/resource.h>
  #include <sys/stat.h>
  #include <sys/types.h>
  #include <sys/wait.h>
  #include <unistd.h>
  #ifdef __linux__
    #include <sys/prctl.h>
  #endif
#endif

namespace evosynth {

#ifndef _WIN32
static void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

// Drain the non-blocking read end into out, honoring the output cap.
static void drain(int fd, const ProcLimits& lim, std::string* out, ProcResult* res) {
    char buf[4096];
    while (true) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            size_t can = lim.output_max_bytes > out->size() ? (lim.output_max_bytes - out->size()) : 0;
            size_t take = std::min(can, static_cast<size_t>(n));
            if (take < static_cast<size_t>(n)) res->output_truncated = true;
            out->append(buf, buf + take);
            continue;
        }
        if (n == -1 && errno == EINTR) continue;
        break;  // EAGAIN, EOF or error
    }
}
#endif

bool write_all(int fd, const std::string& data) {
#ifdef _WIN32
    (void)fd;
    (void)data;
    return false;
#else
    size_t off = 0;
    while (off < data.size()) {
        ssize_t n = write(fd, data.data() + off, data.size() - off);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        off += static_cast<size_t>(n);
    }
    return true;
#endif
}

bool proc_run_forked(const std::function<void(int out_fd)>& body,
                     const ProcLimits& lim,
                     ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

#ifdef _WIN32
    (void)body;
    (void)lim;
    res->error = "proc_run_forked: not supported on Windows";
    return false;
#else
    int pipefd[2];
    if (pipe(pipefd) != 0) {
        res->error = std::string("pipe failed: ") + std::strerror(errno);
        return false;
    }

    // Make read end non-blocking
    int flags = fcntl(pipefd[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(pipefd[0], F_SETFL, flags | O_NONBLOCK);

    pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]);
        close(pipefd[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        // child: the result channel becomes stdout
        (void)dup2(pipefd[1], STDOUT_FILENO);
        close(pipefd[0]);
        close(pipefd[1]);

        // isolate process group so timeout can kill the whole subtree
        (void)setpgid(0, 0);
        (void)umask(077);

        // close inherited fds beyond stdin/stdout/stderr
        long maxfd = sysconf(_SC_OPEN_MAX);
        if (maxfd < 256) maxfd = 256;
        for (int fd = 3; fd < maxfd; fd++) {
            (void)close(fd);
        }

#ifdef __linux__
        if (lim.no_new_privs) {
            (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
        }
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif

        if (lim.rlimit_cpu_sec > 0) {
            set_rlimit(RLIMIT_CPU, (rlim_t)lim.rlimit_cpu_sec, (rlim_t)lim.rlimit_cpu_sec);
        }
        if (lim.rlimit_as_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_AS, bytes, bytes);
        }
        if (lim.rlimit_fsize_mb > 0) {
            rlim_t bytes = (rlim_t)lim.rlimit_fsize_mb * 1024ULL * 1024ULL;
            set_rlimit(RLIMIT_FSIZE, bytes, bytes);
        }
        if (lim.rlimit_nofile > 0) {
            set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile, (rlim_t)lim.rlimit_nofile);
        }
#ifdef RLIMIT_NPROC
        if (lim.rlimit_nproc > 0) {
            set_rlimit(RLIMIT_NPROC, (rlim_t)lim.rlimit_nproc, (rlim_t)lim.rlimit_nproc);
        }
#endif

        // seccomp-BPF must come after no_new_privs. A child that asked for
        // seccomp and did not get it must not run the candidate.
        if (lim.enable_seccomp) {
            if (!install_seccomp_filter().empty()) _exit(121);
        }

        int code = 0;
        try {
            body(STDOUT_FILENO);
        } catch (const std::exception&) {
            code = 120;
        }
        // _exit: skip atexit handlers and stdio buffers inherited from the parent
        _exit(code);
    }

    // parent
    (void)setpgid(pid, pid);
    close(pipefd[1]);

    auto start = std::chrono::steady_clock::now();
    std::string out;
    bool child_exited = false;
    int status = 0;

    while (true) {
        drain(pipefd[0], lim, &out, res);

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }

        auto now = std::chrono::steady_clock::now();
        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();
        if (lim.timeout_ms > 0 && elapsed_ms >= lim.timeout_ms) {
            res->timed_out = true;
            // kill process group first (best-effort), then the direct pid
            (void)kill(-pid, SIGKILL);
            (void)kill(pid, SIGKILL);
            (void)waitpid(pid, &status, 0);
            child_exited = true;
            break;
        }

        // wait for more output or child exit
        struct pollfd pfd;
        pfd.fd = pipefd[0];
        pfd.events = POLLIN;
        int slice = 10;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining < slice) slice = std::max(1, remaining);
        }
        (void)poll(&pfd, 1, slice);
    }

    drain(pipefd[0], lim, &out, res);
    close(pipefd[0]);

    res->output = std::move(out);
    if (!child_exited) {
        res->exit_code = 128;
        res->error = "child did not exit";
        return true;
    }

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
#endif
}

} // namespace evosynth
