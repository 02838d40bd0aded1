#include "hive/proc.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

#ifdef __linux__
#include <sys/prctl.h>
#endif

namespace hive {

std::vector<std::string> split_argv_quoted(const std::string& cmd) {
    std::vector<std::string> out;
    std::string cur;
    enum { NORM, SQ, DQ } st = NORM;
    bool esc = false;
    bool have_token = false;

    auto flush = [&]() {
        if (have_token) {
            out.push_back(cur);
            cur.clear();
            have_token = false;
        }
    };

    for (char c : cmd) {
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
        } else {
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

static void set_rlimit(int resource, rlim_t v) {
    struct rlimit rl;
    rl.rlim_cur = v;
    rl.rlim_max = v;
    (void)setrlimit(resource, &rl);
}

static void close_fds_from(int first) {
    long maxfd = sysconf(_SC_OPEN_MAX);
    if (maxfd < 256) maxfd = 256;
    for (int fd = first; fd < maxfd; fd++) (void)close(fd);
}

static std::vector<char*> to_cargv(const std::vector<std::string>& argv) {
    std::vector<char*> cargv;
    cargv.reserve(argv.size() + 1);
    for (const auto& s : argv) cargv.push_back(const_cast<char*>(s.c_str()));
    cargv.push_back(nullptr);
    return cargv;
}

bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
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
    int in_pipe[2];
    if (pipe(in_pipe) != 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        res->error = std::string("pipe(in) failed: ") + std::strerror(errno);
        return false;
    }

    int flags = fcntl(out_pipe[0], F_GETFL, 0);
    if (flags >= 0) (void)fcntl(out_pipe[0], F_SETFL, flags | O_NONBLOCK);

    // Built before fork: the child may only call async-signal-safe functions.
    auto cargv = to_cargv(argv);

    pid_t pid = fork();
    if (pid < 0) {
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        res->error = std::string("fork failed: ") + std::strerror(errno);
        return false;
    }

    if (pid == 0) {
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        close(out_pipe[0]); close(out_pipe[1]);
        close(in_pipe[0]); close(in_pipe[1]);
        (void)setpgid(0, 0);
        close_fds_from(3);
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) _exit(126);
#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGKILL);
#endif
        if (lim.rlimit_as_mb > 0) set_rlimit(RLIMIT_AS, (rlim_t)lim.rlimit_as_mb * 1024ULL * 1024ULL);
        if (lim.rlimit_nofile > 0) set_rlimit(RLIMIT_NOFILE, (rlim_t)lim.rlimit_nofile);
        execvp(cargv[0], cargv.data());
        _exit(127);
    }

    // parent
    (void)setpgid(pid, pid);
    close(out_pipe[1]);
    close(in_pipe[0]);

    // Interleave the stdin write with the stdout read so neither side can
    // block on a full pipe.
    int in_fd = in_pipe[1];
    if (!stdin_data.empty()) {
        int fl = fcntl(in_fd, F_GETFL, 0);
        if (fl >= 0) fcntl(in_fd, F_SETFL, fl | O_NONBLOCK);
    } else {
        close(in_fd);
        in_fd = -1;
    }
    size_t write_off = 0;

    auto start = std::chrono::steady_clock::now();
    std::string out;
    bool child_exited = false;
    int status = 0;

    auto append_stdout = [&](const char* buf, ssize_t n) {
        size_t can = lim.stdout_max_bytes > out.size() ? (lim.stdout_max_bytes - out.size()) : 0;
        size_t take = std::min(can, (size_t)n);
        if (take < (size_t)n) res->output_truncated = true;
        out.append(buf, buf + take);
    };

    while (true) {
        struct pollfd fds[2];
        int nfds = 0;
        int in_idx = -1;
        if (in_fd >= 0) {
            in_idx = nfds;
            fds[nfds].fd = in_fd;
            fds[nfds].events = POLLOUT;
            fds[nfds].revents = 0;
            nfds++;
        }
        int out_idx = nfds;
        fds[nfds].fd = out_pipe[0];
        fds[nfds].events = POLLIN;
        fds[nfds].revents = 0;
        nfds++;

        int elapsed_ms = (int)std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        int slice = 100;
        if (lim.timeout_ms > 0) {
            int remaining = lim.timeout_ms - elapsed_ms;
            if (remaining <= 0) {
                res->timed_out = true;
                (void)kill(-pid, SIGKILL);
                (void)kill(pid, SIGKILL);
                (void)waitpid(pid, &status, 0);
                child_exited = true;
                break;
            }
            slice = std::min(slice, remaining);
        }

        int pr = poll(fds, (nfds_t)nfds, slice);
        if (pr < 0 && errno == EINTR) continue;

        if (in_idx >= 0 && (fds[in_idx].revents & (POLLOUT | POLLERR | POLLHUP))) {
            while (write_off < stdin_data.size()) {
                ssize_t n = write(in_fd, stdin_data.data() + write_off, stdin_data.size() - write_off);
                if (n > 0) { write_off += (size_t)n; continue; }
                if (n == -1 && errno == EINTR) continue;
                if (n == -1 && (errno == EAGAIN || errno == EWOULDBLOCK)) break;
                write_off = stdin_data.size();  // reader went away
                break;
            }
            if (write_off >= stdin_data.size()) {
                close(in_fd);
                in_fd = -1;
            }
        }

        if (fds[out_idx].revents & (POLLIN | POLLERR | POLLHUP)) {
            char buf[4096];
            while (true) {
                ssize_t n = read(out_pipe[0], buf, sizeof(buf));
                if (n > 0) { append_stdout(buf, n); continue; }
                break;
            }
        }

        pid_t w = waitpid(pid, &status, WNOHANG);
        if (w == pid) {
            child_exited = true;
            break;
        }
    }

    if (in_fd >= 0) close(in_fd);
    while (true) {
        char buf[4096];
        ssize_t n = read(out_pipe[0], buf, sizeof(buf));
        if (n > 0) { append_stdout(buf, n); continue; }
        break;
    }
    close(out_pipe[0]);

    res->output = std::move(out);
    if (child_exited && WIFEXITED(status)) res->exit_code = WEXITSTATUS(status);
    else if (child_exited && WIFSIGNALED(status)) res->exit_code = 128 + WTERMSIG(status);
    else res->exit_code = 127;
    return true;
}

std::string proc_spawn(const std::vector<std::string>& argv,
                       const std::string& cwd,
                       const std::vector<std::string>& extra_env,
                       pid_t* out_pid) {
    if (argv.empty() || argv[0].empty()) return "empty argv";

    // argv and envp are built before fork: the child may only call
    // async-signal-safe functions.
    auto cargv = to_cargv(argv);
    std::vector<std::string> env_strs;
    for (char** e = environ; e && *e; e++) {
        std::string kv(*e);
        auto key = kv.substr(0, kv.find('=') + 1);
        bool overridden = std::any_of(extra_env.begin(), extra_env.end(),
                                      [&](const std::string& x) { return x.starts_with(key); });
        if (!overridden) env_strs.push_back(std::move(kv));
    }
    env_strs.insert(env_strs.end(), extra_env.begin(), extra_env.end());
    auto cenv = to_cargv(env_strs);

    // Exec-failure reporting: the write end closes on a successful exec.
    int err_pipe[2];
    if (pipe2(err_pipe, O_CLOEXEC) != 0) return std::string("pipe failed: ") + std::strerror(errno);

    pid_t pid = fork();
    if (pid < 0) {
        close(err_pipe[0]); close(err_pipe[1]);
        return std::string("fork failed: ") + std::strerror(errno);
    }

    if (pid == 0) {
        close(err_pipe[0]);
        (void)setpgid(0, 0);
        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            (void)dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        for (int fd = 3; fd < 1024; fd++) {
            if (fd != err_pipe[1]) (void)close(fd);
        }
#ifdef __linux__
        (void)prctl(PR_SET_PDEATHSIG, SIGTERM);
#endif
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int e = errno;
            (void)!write(err_pipe[1], &e, sizeof(e));
            _exit(126);
        }
        execvpe(cargv[0], cargv.data(), cenv.data());
        int e = errno;
        (void)!write(err_pipe[1], &e, sizeof(e));
        _exit(127);
    }

    (void)setpgid(pid, pid);
    close(err_pipe[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(err_pipe[0]);

    if (n == (ssize_t)sizeof(child_errno)) {
        (void)waitpid(pid, nullptr, 0);
        return "exec " + argv[0] + ": " + std::strerror(child_errno);
    }
    if (out_pid) *out_pid = pid;
    return "";
}

bool proc_alive(pid_t pid) {
    if (pid <= 0) return false;
    int status = 0;
    pid_t w = waitpid(pid, &status, WNOHANG);
    if (w == 0) return true;
    if (w == pid) return false;
    // Not our child (ECHILD): fall back to kill(pid, 0).
    return kill(pid, 0) == 0;
}

bool proc_signal(pid_t pid, int sig) {
    if (pid <= 0) return false;
    if (kill(-pid, sig) == 0) return true;
    return kill(pid, sig) == 0;
}

bool proc_wait_exit(pid_t pid, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (proc_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) return false;
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    return true;
}

} // namespace hive
