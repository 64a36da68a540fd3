#include "codeloop/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#ifdef __linux__
  #include <sys/prctl.h>
#endif

namespace codeloop {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false; // "" is a real (empty) argument

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (size_t i = 0; i < cmd.size(); i++) {
        char c = cmd[i];
        if (st == NORM) {
            if (c == ' ' || c == '\t' || c == '\n' || c == '\r') {
                flush();
                continue;
            }
            have_token = true;
            if (c == '\'') { st = SQ; continue; }
            if (c == '"') { st = DQ; esc = false; continue; }
            cur.push_back(c);
        } else if (st == SQ) {
            if (c == '\'') { st = NORM; continue; }
            cur.push_back(c);
        } else { // DQ
            if (esc) {
                cur.push_back(c);
                esc = false;
                continue;
            }
            if (c == '\\') { esc = true; continue; }
            if (c == '"') { st = NORM; continue; }
            cur.push_back(c);
        }
    }
    if (st != NORM) return {};
    flush();
    return out;
}

namespace {

void set_rlimit(int resource, rlim_t soft, rlim_t hard) {
    struct rlimit rl;
    rl.rlim_cur = soft;
    rl.rlim_max = hard;
    (void)setrlimit(resource, &rl);
}

void set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

// Runs in the forked child; never returns.
[[noreturn]] void exec_child(const std::vector<std::string>& argv,
                             const std::string& cwd,
                             const ProcLimits& lim,
                             int out_fd, int err_fd) {
    (void)dup2(out_fd, STDOUT_FILENO);
    (void)dup2(err_fd, STDERR_FILENO);

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull >= 0) {
        (void)dup2(devnull, STDIN_FILENO);
    }

    // isolate process group so timeout can kill the whole subtree
    (void)setpgid(0, 0);

    // tighten default file permissions for any files created by the child
    (void)umask(077);

    // close inherited fds beyond stdin/stdout/stderr
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = 3; fd < maxfd; fd++) {
        (void)close(fd);
    }

    if (!cwd.empty()) {
        if (chdir(cwd.c_str()) != 0) _exit(127);
    }

    // scrub dangerous loader env vars
    unsetenv("LD_PRELOAD");
    unsetenv("LD_LIBRARY_PATH");
    for (const auto& kv : lim.env_set) {
        auto eq = kv.find('=');
        if (eq == std::string::npos || eq == 0) continue;
        setenv(kv.substr(0, eq).c_str(), kv.substr(eq + 1).c_str(), 1);
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

    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    execvp(cargv[0], cargv.data());
    _exit(127);
}

constexpr std::chrono::milliseconds kPipeGrace{1000};

// One captured stream: a non-blocking pipe read end plus its buffer.
struct Stream {
    int fd{-1};
    std::string* buf{nullptr};
    bool eof{false};
};

void append_capped(std::string* buf, const char* data, size_t n, const ProcLimits& lim, ProcResult* res) {
    if (lim.stdout_max_bytes == 0) {
        buf->append(data, n);
        return;
    }
    size_t can = lim.stdout_max_bytes > buf->size() ? (lim.stdout_max_bytes - buf->size()) : 0;
    size_t take = std::min(n, can);
    if (take < n) res->output_truncated = true;
    if (take > 0) buf->append(data, take);
}

// Read whatever is available right now. Marks eof on a closed pipe.
void read_available(Stream& s, const ProcLimits& lim, ProcResult* res) {
    if (s.fd < 0 || s.eof) return;
    char buf[8192];
    while (true) {
        ssize_t n = read(s.fd, buf, sizeof(buf));
        if (n > 0) {
            append_capped(s.buf, buf, (size_t)n, lim, res);
            continue;
        }
        if (n == 0) { s.eof = true; return; }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return;
        res->io_error = true;
        res->error = std::string("read failed: ") + std::strerror(errno);
        s.eof = true;
        return;
    }
}

void kill_group(pid_t pid, int* status) {
    // kill process group first (best-effort), then the direct pid
    (void)kill(-pid, SIGKILL);
    (void)kill(pid, SIGKILL);
    (void)waitpid(pid, status, 0);
}

bool run_impl(const std::vector<std::string>& argv,
              const std::string& cwd,
              const ProcLimits& lim,
              const CancelToken* cancel,
              bool merge,
              ProcResult* res) {
    if (!res) return false;
    *res = ProcResult{};

    if (argv.empty() || argv[0].empty()) {
        res->error = "empty argv";
        return false;
    }

    int out_pipe[2];
    if (pipe(out_pipe) != 0) {
        res->error = std::string("pipe(out) failed: ") + std::strerror(errno);
        return false;
    }
    int err_pipe[2] = {-1, -1};
    if (!merge && pipe(err_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(err) failed: ") + std::strerror(errno);
        return false;
    }

    auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        if (!merge) { close(err_pipe[0]); close(err_pipe[1]); }
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        close(out_pipe[0]);
        if (!merge) close(err_pipe[0]);
        exec_child(argv, cwd, lim, out_pipe[1], merge ? out_pipe[1] : err_pipe[1]);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    if (!merge) close(err_pipe[1]);

    Stream so{out_pipe[0], &res->output};
    Stream se{merge ? -1 : err_pipe[0], &res->error_output};
    set_nonblocking(so.fd);
    if (se.fd >= 0) set_nonblocking(se.fd);
    if (se.fd < 0) se.eof = true;

    bool child_exited = false;
    int status = 0;
    auto exited_at = start;

    while (true) {
        read_available(so, lim, res);
        read_available(se, lim, res);

        auto now = std::chrono::steady_clock::now();
        if (!child_exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) {
                child_exited = true;
                exited_at = now;
            }
        }
        // done once the child is gone and both pipes hit EOF
        if (child_exited && so.eof && se.eof) break;
        if (child_exited && now - exited_at > kPipeGrace) {
            // a detached grandchild still holds the pipes open
            (void)kill(-pid, SIGKILL);
            break;
        }

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(now - start).count();

        if (cancel && cancel->cancelled()) {
            res->cancelled = true;
            if (!child_exited) kill_group(pid, &status);
            child_exited = true;
            break;
        }
        if (lim.timeout_ms > 0 && elapsed_ms > lim.timeout_ms) {
            res->timed_out = true;
            if (!child_exited) kill_group(pid, &status);
            child_exited = true;
            break;
        }

        // wait for more output or child exit
        struct pollfd pfd[2];
        nfds_t nfds = 0;
        if (!so.eof) { pfd[nfds].fd = so.fd; pfd[nfds].events = POLLIN; nfds++; }
        if (!se.eof) { pfd[nfds].fd = se.fd; pfd[nfds].events = POLLIN; nfds++; }
        int slice = 50;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining < slice) slice = std::max(1, remaining);
        }
        if (nfds > 0) (void)poll(pfd, nfds, slice);
        else (void)poll(nullptr, 0, slice);
    }

    // drain whatever is still buffered in the pipes
    read_available(so, lim, res);
    read_available(se, lim, res);
    close(out_pipe[0]);
    if (!merge) close(err_pipe[0]);

    res->duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    return true;
}

} // namespace

bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res) {
    return run_impl(argv, cwd, lim, nullptr, true, res);
}

bool proc_run_capture_split(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const ProcLimits& lim,
                            const CancelToken* cancel,
                            ProcResult* res) {
    return run_impl(argv, cwd, lim, cancel, false, res);
}

} // namespace codeloop
