#pragma once

#include <string>
#include <vector>

#include <sys/types.h>

namespace hive {

struct ProcLimits {
    int timeout_ms{60000};
    size_t stdout_max_bytes{4 * 1024 * 1024};
    size_t rlimit_as_mb{0};   // 0 = unlimited
    int rlimit_nofile{256};
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool output_truncated{false};
    std::string output;  // child stdout; stderr is inherited
    std::string error;   // internal runner error, not child stderr
};

// Run argv (argv[0] resolved via PATH) with stdin_data on stdin, capture
// stdout, enforce the timeout by killing the child's process group.
// Returns true if the process started.
bool proc_run_capture_stdin(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const std::string& stdin_data,
                            const ProcLimits& lim,
                            ProcResult* res);

// Start a long-lived child in its own process group, stdin from /dev/null,
// stdout/stderr inherited, killed if the parent dies (Linux).
// `extra_env` entries are "KEY=VALUE". Returns empty string on success.
std::string proc_spawn(const std::vector<std::string>& argv,
                       const std::string& cwd,
                       const std::vector<std::string>& extra_env,
                       pid_t* out_pid);

// True while the child runs. Reaps it once it has exited.
bool proc_alive(pid_t pid);

// Sends sig to the child's process group (falls back to the pid).
bool proc_signal(pid_t pid, int sig);

// Polls until the child exits or timeout_ms passes. True if it exited.
bool proc_wait_exit(pid_t pid, int timeout_ms);

// Split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace hive
