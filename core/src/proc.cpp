#include "agentd/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <initializer_list>

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

extern char** environ;

namespace agentd {

const char* run_status_to_str(RunStatus s) {
    switch (s) {
        case RunStatus::OK: return "OK";
        case RunStatus::SPAWN_FAILED: return "SPAWN_FAILED";
        case RunStatus::TIMEOUT: return "TIMEOUT";
    }
    return "SPAWN_FAILED";
}

static bool is_executable_file(const std::string& p) {
    struct stat st;
    if (stat(p.c_str(), &st) != 0) return false;
    if (!S_ISREG(st.st_mode)) return false;
    return access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> resolve_executable(const std::string& name, const char* path_env) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        if (is_executable_file(name)) return name;
        return std::nullopt;
    }
    const char* path = path_env ? path_env : std::getenv("PATH");
    std::string p = path ? path : "/usr/local/bin:/usr/bin:/bin";
    size_t start = 0;
    while (start <= p.size()) {
        size_t colon = p.find(':', start);
        if (colon == std::string::npos) colon = p.size();
        std::string dir = p.substr(start, colon - start);
        if (dir.empty()) dir = ".";
        std::string cand = dir + "/" + name;
        if (is_executable_file(cand)) return cand;
        start = colon + 1;
    }
    return std::nullopt;
}

std::vector<std::string> build_child_env(bool inherit, const EnvOverlay& overlay) {
    std::vector<std::string> out;
    auto overridden = [&](const std::string& key) {
        for (const auto& kv : overlay) if (kv.first == key) return true;
        return false;
    };
    if (inherit && environ) {
        for (char** e = environ; *e; e++) {
            std::string entry = *e;
            auto eq = entry.find('=');
            if (eq == std::string::npos) continue;
            std::string key = entry.substr(0, eq);
            // scrub loader injection
            if (key == "LD_PRELOAD" || key == "LD_LIBRARY_PATH") continue;
            if (overridden(key)) continue;
            out.push_back(std::move(entry));
        }
    }
    for (const auto& kv : overlay) {
        out.push_back(kv.first + "=" + kv.second);
    }
    return out;
}

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

static void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

namespace {

// Bounded capture of one pipe.
struct Capture {
    int fd{-1};
    std::string* buf{nullptr};
    size_t max_bytes{0};
    bool* truncated{nullptr};

    // Read until EAGAIN or EOF. Returns false once the pipe is closed.
    bool pump() {
        char tmp[8192];
        while (fd >= 0) {
            ssize_t n = read(fd, tmp, sizeof(tmp));
            if (n > 0) {
                size_t can = max_bytes > buf->size() ? (max_bytes - buf->size()) : 0;
                size_t take = std::min(can, (size_t)n);
                if (take > 0) buf->append(tmp, take);
                if (take < (size_t)n) *truncated = true;
                continue;
            }
            if (n == 0) { close_fd(fd); return false; }
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
            close_fd(fd);
            return false;
        }
        return false;
    }
};

int64_t elapsed_ms_since(std::chrono::steady_clock::time_point t0) {
    return (int64_t)std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - t0).count();
}

} // namespace

RunStatus ProcessRunner::run(const RunRequest& req, ExecutionResult* res, std::string* err) const {
    ExecutionResult local;
    if (!res) res = &local;
    *res = ExecutionResult{};

    auto fail = [&](const std::string& msg) {
        if (err) *err = msg;
        return RunStatus::SPAWN_FAILED;
    };

    // Everything the child needs is built before fork(): after fork only
    // async-signal-safe calls are made.
    auto exe = resolve_executable(req.binary);
    if (!exe) return fail("executable not found: " + req.binary);

    std::vector<std::string> argv_s;
    argv_s.reserve(req.args.size() + 1);
    argv_s.push_back(req.binary);
    argv_s.insert(argv_s.end(), req.args.begin(), req.args.end());
    std::vector<char*> cargv;
    cargv.reserve(argv_s.size() + 1);
    for (auto& s : argv_s) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);

    std::vector<std::string> env_s = build_child_env(lim_.inherit_env, req.env);
    std::vector<char*> cenv;
    cenv.reserve(env_s.size() + 1);
    for (auto& s : env_s) cenv.push_back(const_cast<char*>(s.c_str()));
    cenv.push_back(nullptr);

    const char* cwd = req.cwd.empty() ? nullptr : req.cwd.c_str();
    const rlim_t fsize_bytes = (rlim_t)lim_.rlimit_fsize_mb * 1024ULL * 1024ULL;

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1}; // child reports exec/chdir errno here
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        return fail(std::string("pipe(stdout) failed: ") + std::strerror(errno));
    }
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        return fail(std::string("pipe(stderr) failed: ") + std::strerror(e));
    }
    if (pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int e = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        return fail(std::string("pipe(exec) failed: ") + std::strerror(e));
    }
    int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (devnull < 0) {
        int e = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        return fail(std::string("open /dev/null failed: ") + std::strerror(e));
    }

    const auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    if (pid < 0) {
        int e = errno;
        close_fd(out_pipe[0]); close_fd(out_pipe[1]);
        close_fd(err_pipe[0]); close_fd(err_pipe[1]);
        close_fd(exec_pipe[0]); close_fd(exec_pipe[1]);
        close_fd(devnull);
        return fail(std::string("fork failed: ") + std::strerror(e));
    }

    if (pid == 0) {
        // child: own process group so the deadline can kill the whole subtree
        (void)setpgid(0, 0);

        (void)dup2(devnull, STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(err_pipe[1], STDERR_FILENO);

        sigset_t none;
        sigemptyset(&none);
        (void)sigprocmask(SIG_SETMASK, &none, nullptr);
        (void)signal(SIGPIPE, SIG_DFL);

        // report[0]: failing stage (1 = chdir, 2 = exec), report[1]: errno
        int report[2] = {0, 0};
        if (cwd && chdir(cwd) != 0) {
            report[0] = 1;
            report[1] = errno;
        }

        if (report[0] == 0) {
            (void)umask(077);
#ifdef __linux__
            if (lim_.no_new_privs) {
                (void)prctl(PR_SET_NO_NEW_PRIVS, 1, 0, 0, 0);
            }
            (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
            if (lim_.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim_.rlimit_nofile);
            if (fsize_bytes > 0) set_rlimit(RLIMIT_FSIZE, fsize_bytes);

            // best-effort: close inherited fds beyond stdio and the exec pipe
            long maxfd = sysconf(_SC_OPEN_MAX);
            if (maxfd < 256) maxfd = 256;
            if (maxfd > 65536) maxfd = 65536;
            for (int fd = 3; fd < maxfd; fd++) {
                if (fd != exec_pipe[1]) (void)close(fd);
            }

            execve(exe->c_str(), cargv.data(), cenv.data());
            report[0] = 2;
            report[1] = errno;
        }

        ssize_t w;
        do {
            w = write(exec_pipe[1], report, sizeof(report));
        } while (w < 0 && errno == EINTR);
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);
    close_fd(devnull);

    // EOF on the exec pipe means execve succeeded (close-on-exec).
    int report[2] = {0, 0};
    ssize_t got;
    do {
        got = read(exec_pipe[0], report, sizeof(report));
    } while (got < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (got == (ssize_t)sizeof(report)) {
        int status = 0;
        while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
        close_fd(out_pipe[0]);
        close_fd(err_pipe[0]);
        std::string what = report[0] == 1 ? "chdir " + req.cwd + " failed: " : "exec " + *exe + " failed: ";
        return fail(what + std::strerror(report[1]));
    }

    for (int fd : {out_pipe[0], err_pipe[0]}) {
        int flags = fcntl(fd, F_GETFL, 0);
        if (flags >= 0) (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }

    Capture cap_out{out_pipe[0], &res->stdout_data, lim_.stdout_max_bytes, &res->stdout_truncated};
    Capture cap_err{err_pipe[0], &res->stderr_data, lim_.stderr_max_bytes, &res->stderr_truncated};

    bool exited = false;
    int status = 0;

    while (true) {
        if (!exited) {
            pid_t w = waitpid(pid, &status, WNOHANG);
            if (w == pid) exited = true;
        }
        if (exited && cap_out.fd < 0 && cap_err.fd < 0) break;

        int64_t remaining = req.deadline_ms - elapsed_ms_since(start);
        if (remaining <= 0) {
            res->timed_out = true;
            break;
        }

        struct pollfd fds[2];
        nfds_t nfds = 0;
        if (cap_out.fd >= 0) { fds[nfds].fd = cap_out.fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }
        if (cap_err.fd >= 0) { fds[nfds].fd = cap_err.fd; fds[nfds].events = POLLIN; fds[nfds].revents = 0; nfds++; }

        // short slices keep waitpid() responsive while the pipes are quiet
        int slice = (int)std::min<int64_t>(remaining, 50);
        if (nfds == 0) {
            usleep((useconds_t)slice * 1000);
            continue;
        }
        int pr = poll(fds, nfds, slice);
        if (pr < 0 && errno != EINTR) {
            usleep(1000);
            continue;
        }
        if (pr > 0) {
            (void)cap_out.pump();
            (void)cap_err.pump();
        }
    }

    if (res->timed_out) {
        // group first; fall back to the leader if the group is gone or
        // signaling it is refused
        if (kill(-pid, SIGKILL) != 0 && !exited) {
            (void)kill(pid, SIGKILL);
        }
        if (!exited) {
            while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {}
            exited = true;
        }
        (void)cap_out.pump();
        (void)cap_err.pump();
    }
    close_fd(cap_out.fd);
    close_fd(cap_err.fd);

    res->duration_ms = elapsed_ms_since(start);
    if (WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 128;

    if (res->timed_out) {
        if (err) {
            *err = req.deadline_ms % 1000 == 0
                ? "exceeded " + std::to_string(req.deadline_ms / 1000) + "s hard deadline"
                : "exceeded " + std::to_string(req.deadline_ms) + "ms hard deadline";
        }
        return RunStatus::TIMEOUT;
    }
    return RunStatus::OK;
}

} // namespace agentd
