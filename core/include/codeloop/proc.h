#pragma once

#include "types.h"

#include <cstdint>
#include <string>
#include <vector>

namespace codeloop {

struct ProcLimits {
    int timeout_ms{2000};            // 0 = no deadline
    size_t stdout_max_bytes{64 * 1024}; // per stream; 0 = unlimited

    // 0 disables the corresponding rlimit
    int rlimit_cpu_sec{2};          // CPU time seconds
    size_t rlimit_as_mb{512};       // virtual memory MB
    size_t rlimit_fsize_mb{10};     // max file size MB
    int rlimit_nofile{64};          // max open fds
    int rlimit_nproc{32};           // max processes (best-effort)

    bool no_new_privs{true};

    // "KEY=VALUE" entries exported in the child right before exec.
    std::vector<std::string> env_set;
};

struct ProcResult {
    int exit_code{127};
    bool timed_out{false};
    bool cancelled{false};
    bool output_truncated{false};
    bool io_error{false};    // a pipe read failed; captured text is incomplete
    std::string output;      // stdout (stdout+stderr when merged)
    std::string error_output; // stderr when captured separately
    std::string error;       // internal runner error, not child stderr
    int64_t duration_ms{0};
};

// Run a process (argv[0] is executable), capture stdout+stderr (merged),
// enforce timeout and rlimits (POSIX best-effort). Returns true if process started.
bool proc_run_capture_sandboxed(const std::vector<std::string>& argv,
                               const std::string& cwd,
                               const ProcLimits& lim,
                               ProcResult* res);

// Same as above but stdout and stderr land in separate buffers and the run
// can be aborted through `cancel` (nullable). On timeout or cancellation the
// whole process group is killed.
bool proc_run_capture_split(const std::vector<std::string>& argv,
                            const std::string& cwd,
                            const ProcLimits& lim,
                            const CancelToken* cancel,
                            ProcResult* res);

// Small helper: split a command string into argv tokens.
// Supports basic quotes (single/double) and backslash escaping inside double quotes.
// Returns empty vector on parse error.
std::vector<std::string> split_argv_quoted(const std::string& cmd);

} // namespace codeloop
